/*
Tapline — StreamMonitor
Role: Pipeline counters shared by transport, dispatcher, handlers and store.
Inputs/Outputs: record*() increments; snapshot() and statusLine() read everything at once.
Threading: Lock-free atomics with relaxed ordering; any thread may record or read.
Performance: One relaxed fetch_add per event on the hot path.
Integration: Owned by StreamClient and passed by reference; the CLI prints statusLine() on a QTimer.
Related: StreamMonitor.cpp, apps/stream_cli/stream_main.cpp.
*/
#pragma once

#include <QString>
#include <array>
#include <atomic>
#include <cstdint>
#include "marketdata/model/MarketEvents.hpp"

class StreamMonitor {
public:
    struct Snapshot {
        uint64_t frames{0};
        uint64_t malformed{0};
        uint64_t unknown{0};
        uint64_t backpressureDrops{0};
        uint64_t reconnects{0};
        uint64_t resyncs{0};
        uint64_t storeWrites{0};
        uint64_t storeRetries{0};
        uint64_t storeDrops{0};
        std::array<uint64_t, kEventKindCount> perKind{};
    };

    StreamMonitor() = default;
    StreamMonitor(const StreamMonitor&) = delete;
    StreamMonitor& operator=(const StreamMonitor&) = delete;

    // 🌐 NETWORK
    void recordFrame() noexcept            { bump(m_frames); }
    void recordMalformed() noexcept        { bump(m_malformed); }
    void recordReconnect() noexcept        { bump(m_reconnects); }

    //  DISPATCH & HANDLERS
    void recordEvent(EventKind kind) noexcept;
    void recordUnknown() noexcept          { bump(m_unknown); }
    void recordBackpressureDrop() noexcept { bump(m_backpressureDrops); }
    void recordResync() noexcept           { bump(m_resyncs); }

    // 💾 STORE
    void recordStoreWrites(uint64_t n) noexcept { m_storeWrites.fetch_add(n, std::memory_order_relaxed); }
    void recordStoreRetry() noexcept            { bump(m_storeRetries); }
    void recordStoreDrops(uint64_t n) noexcept  { m_storeDrops.fetch_add(n, std::memory_order_relaxed); }

    [[nodiscard]] Snapshot snapshot() const noexcept;
    [[nodiscard]] QString  statusLine() const;

    void reset() noexcept;

private:
    static void bump(std::atomic<uint64_t>& c) noexcept { c.fetch_add(1, std::memory_order_relaxed); }

    std::atomic<uint64_t> m_frames{0};
    std::atomic<uint64_t> m_malformed{0};
    std::atomic<uint64_t> m_unknown{0};
    std::atomic<uint64_t> m_backpressureDrops{0};
    std::atomic<uint64_t> m_reconnects{0};
    std::atomic<uint64_t> m_resyncs{0};
    std::atomic<uint64_t> m_storeWrites{0};
    std::atomic<uint64_t> m_storeRetries{0};
    std::atomic<uint64_t> m_storeDrops{0};
    std::array<std::atomic<uint64_t>, kEventKindCount> m_perKind{};
};
