#include "MarketDataHandlers.hpp"
#include "../dispatch/Channels.hpp"
#include "../sinks/IEventStore.hpp"
#include "../ws/ISessionControl.hpp"
#include "StreamMonitor.hpp"
#include "TaplineLogging.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <format>

std::string toJson(const OrderbookView& view) {
    auto levels = [](const std::vector<PriceLevel>& side) {
        nlohmann::json arr = nlohmann::json::array();
        for (const auto& l : side) arr.push_back({l.price, l.quantity});
        return arr;
    };
    nlohmann::json j{
        {"market_ticker", view.instrument},
        {"sid", view.sid},
        {"seq", view.sequence},
        {"yes", levels(view.yes)},
        {"no", levels(view.no)},
    };
    return j.dump();
}

MarketDataHandlers::MarketDataHandlers(IEventStore& store,
                                       StreamMonitor* monitor,
                                       std::size_t recentCapacity,
                                       std::vector<int> fatalErrorCodes)
    : m_store(store)
    , m_monitor(monitor)
    , m_cache(recentCapacity)
    , m_fatalCodes(std::move(fatalErrorCodes))
{}

MarketDataHandlers::~MarketDataHandlers() {
    detach();
}

void MarketDataHandlers::setSessionControl(ISessionControl* control) {
    m_control.store(control, std::memory_order_release);
}

void MarketDataHandlers::attach(MessageDispatcher& dispatcher) {
    std::lock_guard<std::mutex> lock(m_attachMx);
    if (m_dispatcher) {
        for (auto id : m_handlerIds) m_dispatcher->removeHandler(id);
        m_handlerIds.clear();
    }
    m_dispatcher = &dispatcher;
    m_handlerIds = {
        dispatcher.registerHandler(EventKind::Ticker,            [this](const MarketEventPtr& e) { onTicker(e); }),
        dispatcher.registerHandler(EventKind::OrderbookSnapshot, [this](const MarketEventPtr& e) { onSnapshot(e); }),
        dispatcher.registerHandler(EventKind::OrderbookDelta,    [this](const MarketEventPtr& e) { onDelta(e); }),
        dispatcher.registerHandler(EventKind::Trade,             [this](const MarketEventPtr& e) { onTrade(e); }),
        dispatcher.registerHandler(EventKind::Fill,              [this](const MarketEventPtr& e) { onFill(e); }),
        dispatcher.registerHandler(EventKind::Error,             [this](const MarketEventPtr& e) { onError(e); }),
        dispatcher.registerHandler(EventKind::Ack,               [this](const MarketEventPtr& e) { onAck(e); }),
        dispatcher.registerHandler(EventKind::Unknown,           [this](const MarketEventPtr& e) { onUnknown(e); }),
    };
}

void MarketDataHandlers::detach() {
    std::lock_guard<std::mutex> lock(m_attachMx);
    if (!m_dispatcher) return;
    for (auto id : m_handlerIds) m_dispatcher->removeHandler(id);
    m_handlerIds.clear();
    m_dispatcher = nullptr;
}

void MarketDataHandlers::onTicker(const MarketEventPtr& ev) {
    const auto& t = std::get<TickerEvent>(ev->body);
    m_cache.upsertTicker(ev->header, t);
    m_store.append(ev);
    m_store.upsertLatest(LatestRecord{LatestRecord::View::Ticker,
                                      ev->header.instrument,
                                      ev->header.seq,
                                      toMicros(ev->header.receivedAt),
                                      ev->header.payload});
}

void MarketDataHandlers::onSnapshot(const MarketEventPtr& ev) {
    const auto& snap = std::get<BookSnapshotEvent>(ev->body);
    m_store.append(ev);
    OrderbookView view;
    {
        std::lock_guard<std::mutex> lock(m_bookMx);
        view = m_cache.applySnapshot(ev->header, snap);
        upsertBook(ev->header, view);
    }

    tLog_Data(QString::fromStdString(std::format("📖 Snapshot {} sid={} seq={} levels yes={} no={}",
        view.instrument, view.sid, view.sequence, view.yes.size(), view.no.size())));
}

void MarketDataHandlers::onDelta(const MarketEventPtr& ev) {
    const auto& delta = std::get<BookDeltaEvent>(ev->body);

    // History keeps every delta, applied or not.
    m_store.append(ev);

    LatestStateCache::DeltaOutcome outcome;
    {
        std::lock_guard<std::mutex> lock(m_bookMx);
        outcome = m_cache.applyDelta(ev->header, delta);
        if (outcome.view) {
            upsertBook(ev->header, *outcome.view);
        } else if (!outcome.resyncInstruments.empty()) {
            withdrawBooks(outcome.resyncInstruments, toMicros(ev->header.receivedAt));
        }
    }

    switch (outcome.result) {
        case OrderbookState::DeltaResult::Applied:
            if (!ev->header.seq) {
                tLog_DataN(100, "Delta without sequence applied ungated for" << QString::fromStdString(ev->header.instrument));
            }
            return;
        case OrderbookState::DeltaResult::ForeignStream:
            tLog_Debug(QString::fromStdString(std::format("Ignoring delta for {} from retired sid {}",
                ev->header.instrument, ev->header.sid)));
            return;
        case OrderbookState::DeltaResult::NotSynced:
        case OrderbookState::DeltaResult::SequenceGap:
            break;
    }

    if (outcome.resyncInstruments.empty()) {
        // Already inside a stale episode
        return;
    }

    tLog_Warning(QString::fromStdString(std::format(
        "⚠️ Orderbook {} stale on sid {} (seq={} prev={}); requesting snapshot",
        ev->header.instrument, ev->header.sid,
        ev->header.seq ? std::to_string(*ev->header.seq) : "-",
        ev->header.prevSeq ? std::to_string(*ev->header.prevSeq) : "-")));

    ISessionControl* control = m_control.load(std::memory_order_acquire);
    for (const auto& instrument : outcome.resyncInstruments) {
        m_resyncs.fetch_add(1, std::memory_order_relaxed);
        if (m_monitor) m_monitor->recordResync();
        if (control) control->requestSnapshot(instrument);
    }
}

void MarketDataHandlers::onTrade(const MarketEventPtr& ev) {
    m_cache.addTrade(ev->header.instrument, std::get<TradeEvent>(ev->body));
    m_store.append(ev);
}

void MarketDataHandlers::onFill(const MarketEventPtr& ev) {
    const auto& fill = std::get<FillEvent>(ev->body);
    m_cache.addFill(ev->header.instrument, fill);
    m_store.append(ev);
    tLog_App(QString::fromStdString(std::format("💰 Fill {} {} {} x{} @ {}",
        ev->header.instrument, fill.action, side_norm::toString(fill.side), fill.count, fill.yesPrice)));
}

void MarketDataHandlers::onError(const MarketEventPtr& ev) {
    const auto& err = std::get<ProviderErrorEvent>(ev->body);
    tLog_Warning(QString::fromStdString(std::format("❌ Provider error code={} msg={}", err.code, err.message)));

    const bool fatal = std::find(m_fatalCodes.begin(), m_fatalCodes.end(), err.code) != m_fatalCodes.end();
    if (!fatal) {
        return;
    }
    if (ISessionControl* control = m_control.load(std::memory_order_acquire)) {
        control->forceDegraded(std::format("provider error {}: {}", err.code, err.message));
    }
}

void MarketDataHandlers::onAck(const MarketEventPtr& ev) {
    m_acks.fetch_add(1, std::memory_order_relaxed);
    const auto& ack = std::get<CommandAckEvent>(ev->body);
    tLog_Debug(QString::fromStdString(std::format("Ack {} channel={} sid={}", ack.ackType, ack.channel, ev->header.sid)));
}

void MarketDataHandlers::onUnknown(const MarketEventPtr& ev) {
    tLog_Debug("Unhandled message type" << QString::fromStdString(std::get<UnknownEvent>(ev->body).type));
}

void MarketDataHandlers::onSessionState(ConnectionState to) {
    if (to != ConnectionState::Degraded && to != ConnectionState::Failed && to != ConnectionState::Closed) {
        return;
    }
    std::lock_guard<std::mutex> lock(m_bookMx);
    const auto invalidated = m_cache.markAllStale();
    if (invalidated.empty()) {
        return;
    }
    withdrawBooks(invalidated, toMicros(std::chrono::system_clock::now()));
    tLog_App(QString("📕 Connection %1; withdrew %2 orderbook(s) until resnapshot")
                 .arg(toString(to)).arg(invalidated.size()));
}

void MarketDataHandlers::withdrawBooks(const std::vector<std::string>& instruments, int64_t atUs) {
    for (const auto& instrument : instruments) {
        LatestRecord rec{LatestRecord::View::Orderbook, instrument, std::nullopt, atUs, {}};
        rec.stale = true;
        m_store.upsertLatest(rec);
    }
}

void MarketDataHandlers::upsertBook(const EventHeader& header, const OrderbookView& view) {
    m_store.upsertLatest(LatestRecord{LatestRecord::View::Orderbook,
                                      view.instrument,
                                      view.sequence,
                                      toMicros(header.receivedAt),
                                      toJson(view)});
}
