#include "LatestStateCache.hpp"
#include <mutex>
#include <utility>

LatestStateCache::LatestStateCache(std::size_t recentCapacity)
    : m_recentCapacity(recentCapacity == 0 ? 1 : recentCapacity)
{}

void LatestStateCache::upsertTicker(const EventHeader& header, const TickerEvent& ticker) {
    std::unique_lock<std::shared_mutex> lock(m_mxTickers);
    m_tickers[header.instrument] = TickerView{header.instrument, ticker, header.receivedAt};
}

OrderbookView LatestStateCache::applySnapshot(const EventHeader& header, const BookSnapshotEvent& snapshot) {
    std::unique_lock<std::shared_mutex> lock(m_mxBooks);

    auto [it, inserted] = m_books.try_emplace(header.instrument, header.instrument);
    OrderbookState& book = it->second;

    // Instrument may move to a new sid after a resubscribe.
    if (!inserted && book.sid() != header.sid) {
        if (auto old = m_streams.find(book.sid()); old != m_streams.end()) {
            old->second.instruments.erase(header.instrument);
            if (old->second.instruments.empty()) m_streams.erase(old);
        }
    }

    book.applySnapshot(snapshot, header.sid, header.seq);
    auto& stream = m_streams[header.sid];
    stream.instruments.insert(header.instrument);
    m_resyncPending.erase(header.instrument);

    // The snapshot consumed a sequence number on the shared stream.
    if (header.seq) {
        for (const auto& other : stream.instruments) {
            if (other == header.instrument) continue;
            if (auto b = m_books.find(other); b != m_books.end()) b->second.advanceTo(*header.seq);
        }
    }

    return *book.view();
}

LatestStateCache::DeltaOutcome LatestStateCache::applyDelta(const EventHeader& header, const BookDeltaEvent& delta) {
    std::unique_lock<std::shared_mutex> lock(m_mxBooks);
    DeltaOutcome out;

    auto [it, inserted] = m_books.try_emplace(header.instrument, header.instrument);
    OrderbookState& book = it->second;

    out.result = book.applyDelta(delta, header.sid, header.seq, header.prevSeq);
    switch (out.result) {
        case OrderbookState::DeltaResult::Applied:
            if (header.seq) {
                if (auto s = m_streams.find(header.sid); s != m_streams.end()) {
                    for (const auto& other : s->second.instruments) {
                        if (other == header.instrument) continue;
                        if (auto b = m_books.find(other); b != m_books.end()) b->second.advanceTo(*header.seq);
                    }
                }
            }
            out.view = book.view();
            break;
        case OrderbookState::DeltaResult::NotSynced:
        case OrderbookState::DeltaResult::SequenceGap:
            out.resyncInstruments = beginStaleEpisode(header.sid, header.instrument);
            break;
        case OrderbookState::DeltaResult::ForeignStream:
            break;
    }
    return out;
}

std::vector<std::string> LatestStateCache::beginStaleEpisode(uint64_t sid, const std::string& instrument) {
    std::set<std::string> affected{instrument};
    if (auto s = m_streams.find(sid); s != m_streams.end()) {
        affected.insert(s->second.instruments.begin(), s->second.instruments.end());
    }

    std::vector<std::string> newlyPending;
    for (const auto& instr : affected) {
        if (auto b = m_books.find(instr); b != m_books.end()) {
            b->second.markStale();
        }
        if (m_resyncPending.insert(instr).second) {
            newlyPending.push_back(instr);
        }
    }
    return newlyPending;
}

std::vector<std::string> LatestStateCache::markAllStale() {
    std::unique_lock<std::shared_mutex> lock(m_mxBooks);
    std::vector<std::string> invalidated;
    for (auto& [instrument, book] : m_books) {
        if (book.isSynced()) {
            book.markStale();
            invalidated.push_back(instrument);
        }
        m_resyncPending.insert(instrument);
    }
    return invalidated;
}

void LatestStateCache::addTrade(const std::string& instrument, const TradeEvent& trade) {
    std::unique_lock<std::shared_mutex> lock(m_mxRecent);
    auto it = m_trades.try_emplace(instrument, m_recentCapacity).first;
    it->second.push_back(trade);
}

void LatestStateCache::addFill(const std::string& instrument, const FillEvent& fill) {
    std::unique_lock<std::shared_mutex> lock(m_mxRecent);
    auto it = m_fills.try_emplace(instrument, m_recentCapacity).first;
    it->second.push_back(fill);
}

std::optional<TickerView> LatestStateCache::latestTicker(const std::string& instrument) const {
    std::shared_lock<std::shared_mutex> lock(m_mxTickers);
    auto it = m_tickers.find(instrument);
    if (it == m_tickers.end()) return std::nullopt;
    return it->second;
}

std::optional<OrderbookView> LatestStateCache::orderbook(const std::string& instrument) const {
    std::shared_lock<std::shared_mutex> lock(m_mxBooks);
    auto it = m_books.find(instrument);
    if (it == m_books.end()) return std::nullopt;
    return it->second.view();
}

std::optional<OrderbookState::Status> LatestStateCache::bookStatus(const std::string& instrument) const {
    std::shared_lock<std::shared_mutex> lock(m_mxBooks);
    auto it = m_books.find(instrument);
    if (it == m_books.end()) return std::nullopt;
    return it->second.status();
}

std::vector<TradeEvent> LatestStateCache::recentTrades(const std::string& instrument) const {
    std::shared_lock<std::shared_mutex> lock(m_mxRecent);
    auto it = m_trades.find(instrument);
    return it == m_trades.end() ? std::vector<TradeEvent>{} : it->second.snapshot();
}

std::vector<FillEvent> LatestStateCache::recentFills(const std::string& instrument) const {
    std::shared_lock<std::shared_mutex> lock(m_mxRecent);
    auto it = m_fills.find(instrument);
    return it == m_fills.end() ? std::vector<FillEvent>{} : it->second.snapshot();
}

bool LatestStateCache::resyncPending(const std::string& instrument) const {
    std::shared_lock<std::shared_mutex> lock(m_mxBooks);
    return m_resyncPending.count(instrument) > 0;
}
