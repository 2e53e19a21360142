/*
Tapline — LatestStateCache
Role: In-memory view of the latest ticker, the current orderbook and recent trades/fills per instrument.
Inputs/Outputs: Written by MarketDataHandlers; read by any consumer through copy-returning queries.
Threading: std::shared_mutex per concern, shared locks for reads and exclusive locks for writes.
Performance: Bounded memory: trades and fills live in fixed-capacity rings.
Integration: Owned by MarketDataHandlers; one instance per dispatcher, no globals.
Observability: No internal logging; the handlers log outcomes.
Related: LatestStateCache.cpp, OrderbookState.hpp, MarketDataHandlers.hpp.
Assumptions: Sequence numbers are per server subscription (sid) and shared by every instrument
             on that subscription.
*/
#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <set>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include "../model/MarketEvents.hpp"
#include "../model/OrderbookState.hpp"

// Fixed-capacity ring; snapshot() returns oldest first.
template <typename T>
class RingBuffer {
public:
    explicit RingBuffer(std::size_t capacity = 256) : m_capacity(capacity == 0 ? 1 : capacity) {}

    void push_back(T val) {
        if (m_data.size() < m_capacity) {
            m_data.emplace_back(std::move(val));
        } else {
            m_data[m_head] = std::move(val);
        }
        m_head = (m_head + 1) % m_capacity;
    }

    [[nodiscard]] std::vector<T> snapshot() const {
        if (m_data.size() < m_capacity) {
            return m_data;
        }
        std::vector<T> out;
        out.reserve(m_data.size());
        for (std::size_t i = 0; i < m_data.size(); ++i) {
            out.push_back(m_data[(m_head + i) % m_capacity]);
        }
        return out;
    }

    [[nodiscard]] std::size_t size() const noexcept { return m_data.size(); }
    [[nodiscard]] bool empty() const noexcept { return m_data.empty(); }
    [[nodiscard]] std::size_t capacity() const noexcept { return m_capacity; }

private:
    std::size_t    m_capacity;
    std::vector<T> m_data;
    std::size_t    m_head{0};
};

struct TickerView {
    std::string instrument;
    TickerEvent ticker;
    std::chrono::system_clock::time_point receivedAt;
};

class LatestStateCache {
public:
    struct DeltaOutcome {
        OrderbookState::DeltaResult  result{OrderbookState::DeltaResult::Applied};
        std::optional<OrderbookView> view;              // set when applied
        std::vector<std::string>     resyncInstruments; // instruments newly needing a snapshot
    };

    explicit LatestStateCache(std::size_t recentCapacity = 256);

    void upsertTicker(const EventHeader& header, const TickerEvent& ticker);

    OrderbookView applySnapshot(const EventHeader& header, const BookSnapshotEvent& snapshot);
    DeltaOutcome  applyDelta(const EventHeader& header, const BookDeltaEvent& delta);

    // Connection lost: every synced book goes stale and waits for the resubscribe snapshot.
    // Returns the instruments that were synced.
    std::vector<std::string> markAllStale();

    void addTrade(const std::string& instrument, const TradeEvent& trade);
    void addFill(const std::string& instrument, const FillEvent& fill);

    [[nodiscard]] std::optional<TickerView>    latestTicker(const std::string& instrument) const;
    [[nodiscard]] std::optional<OrderbookView> orderbook(const std::string& instrument) const;
    [[nodiscard]] std::optional<OrderbookState::Status> bookStatus(const std::string& instrument) const;
    [[nodiscard]] std::vector<TradeEvent>      recentTrades(const std::string& instrument) const;
    [[nodiscard]] std::vector<FillEvent>       recentFills(const std::string& instrument) const;
    [[nodiscard]] bool                         resyncPending(const std::string& instrument) const;

private:
    struct StreamCursor {
        std::set<std::string> instruments;
    };

    // Caller holds m_mxBooks exclusively.
    std::vector<std::string> beginStaleEpisode(uint64_t sid, const std::string& instrument);

    const std::size_t m_recentCapacity;

    mutable std::shared_mutex                    m_mxTickers;
    std::unordered_map<std::string, TickerView>  m_tickers;

    mutable std::shared_mutex                        m_mxBooks;
    std::unordered_map<std::string, OrderbookState>  m_books;
    std::unordered_map<uint64_t, StreamCursor>       m_streams;
    std::set<std::string>                            m_resyncPending;

    mutable std::shared_mutex                                 m_mxRecent;
    std::unordered_map<std::string, RingBuffer<TradeEvent>>   m_trades;
    std::unordered_map<std::string, RingBuffer<FillEvent>>    m_fills;
};
