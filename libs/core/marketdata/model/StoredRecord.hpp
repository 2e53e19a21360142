#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include "MarketEvents.hpp"

// Durable form of an event, as read back from the store.
struct StoredRecord {
    int64_t                 id{0};              // row id, tie-breaker within one microsecond
    EventKind               kind{EventKind::Unknown};
    std::string             instrument;
    uint64_t                sid{0};
    std::optional<uint64_t> seq;
    int64_t                 receivedAtUs{0};    // local receipt time, microseconds since epoch
    std::string             payload;            // JSON
};

// Latest-view upsert: the current ticker or the current synced book of one instrument.
// A stale record keeps the stored row for diagnostics but withdraws it from readers;
// seq and payload are ignored.
struct LatestRecord {
    enum class View { Ticker, Orderbook };

    View                    view{View::Ticker};
    std::string             instrument;
    std::optional<uint64_t> seq;
    int64_t                 receivedAtUs{0};
    std::string             payload;
    bool                    stale{false};
};

// [from, to) on receipt time.
struct TimeRange {
    std::chrono::system_clock::time_point from{};
    std::chrono::system_clock::time_point to{std::chrono::system_clock::time_point::max()};

    static TimeRange all() { return {}; }
};

inline int64_t toMicros(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::microseconds>(tp.time_since_epoch()).count();
}
