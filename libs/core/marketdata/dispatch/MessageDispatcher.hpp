#pragma once
/*
Tapline — MessageDispatcher
Role: Turns raw frames into typed events and fans them out to registered handlers.
Inputs/Outputs: onFrame(raw) from the transport; handler callbacks on WorkerPool threads;
                Ack/Error events also go inline to the session's control listener.
Threading: onFrame() is called from the io strand. The handler table is copy-on-write, so
           registerHandler()/removeHandler() are safe at any time and never block dispatch.
Ordering: One task per event, partitioned by server sid (else instrument); events of one stream
          reach handlers in arrival order.
Observability: Malformed frames are counted and feed MalformedFrameBreaker; unknown types are
               counted and logged at debug.
Related: MessageParser.hpp, WorkerPool.hpp, MarketDataHandlers.hpp, SessionManager.hpp.
*/
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "../model/MarketEvents.hpp"
#include "MalformedFrameBreaker.hpp"

class WorkerPool;
class StreamMonitor;

class MessageDispatcher {
public:
    using Handler         = std::function<void(const MarketEventPtr&)>;
    using HandlerId       = uint64_t;
    using ControlListener = std::function<void(const MarketEventPtr&)>;
    using BreakerListener = std::function<void(const std::string& reason)>;

    MessageDispatcher(WorkerPool& pool,
                      StreamMonitor* monitor,
                      std::size_t malformedThreshold = 20,
                      std::chrono::milliseconds malformedWindow = std::chrono::seconds(10));

    MessageDispatcher(const MessageDispatcher&)            = delete;
    MessageDispatcher& operator=(const MessageDispatcher&) = delete;

    HandlerId registerHandler(EventKind kind, Handler handler);
    bool      removeHandler(HandlerId id);

    void setControlListener(ControlListener listener);
    void setBreakerListener(BreakerListener listener);

    void onFrame(const std::string& raw,
                 std::chrono::system_clock::time_point receivedAt = std::chrono::system_clock::now());

    /// Clears the malformed-frame window (called when a session becomes Ready).
    void resetBreaker() { m_breaker.reset(); }

    [[nodiscard]] uint64_t framesReceived() const noexcept { return m_frames.load(std::memory_order_relaxed); }
    [[nodiscard]] uint64_t malformedCount() const noexcept { return m_malformed.load(std::memory_order_relaxed); }
    [[nodiscard]] uint64_t unknownCount() const noexcept   { return m_unknown.load(std::memory_order_relaxed); }
    [[nodiscard]] std::size_t handlerCount() const;

private:
    struct Entry {
        HandlerId id;
        EventKind kind;
        Handler   fn;
    };
    using Table = std::vector<Entry>;

    [[nodiscard]] std::shared_ptr<const Table> table() const;
    void dispatchToHandlers(const MarketEventPtr& ev);

    WorkerPool&           m_pool;
    StreamMonitor*        m_monitor;
    MalformedFrameBreaker m_breaker;

    mutable std::mutex           m_tableMx;
    std::shared_ptr<const Table> m_table;
    HandlerId                    m_nextId{1};

    mutable std::mutex m_listenerMx;
    ControlListener    m_control;
    BreakerListener    m_onBreaker;

    std::atomic<uint64_t> m_frames{0};
    std::atomic<uint64_t> m_malformed{0};
    std::atomic<uint64_t> m_unknown{0};
};
