/*
Tapline — MarketDataHandlers
Role: Per-kind event handlers: keep LatestStateCache current, persist through IEventStore and
      ask the session for a fresh snapshot when a book goes stale.
Inputs/Outputs: MarketEventPtr from MessageDispatcher; writes to the store queue; control calls
                through ISessionControl.
Threading: Invoked on WorkerPool threads. Events of one stream arrive on one worker in order.
Integration: attach() registers every handler on a dispatcher; detach() removes them.
Observability: Resyncs, provider errors and unknown types are logged and counted.
Related: MarketDataHandlers.cpp, LatestStateCache.hpp, IEventStore.hpp, ISessionControl.hpp.
*/
#pragma once
#include <atomic>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>
#include "../cache/LatestStateCache.hpp"
#include "../dispatch/MessageDispatcher.hpp"
#include "../model/MarketEvents.hpp"
#include "../ws/ConnectionState.hpp"

class IEventStore;
class ISessionControl;
class StreamMonitor;

class MarketDataHandlers {
public:
    MarketDataHandlers(IEventStore& store,
                       StreamMonitor* monitor,
                       std::size_t recentCapacity = 256,
                       std::vector<int> fatalErrorCodes = {9, 17});
    ~MarketDataHandlers();

    MarketDataHandlers(const MarketDataHandlers&)            = delete;
    MarketDataHandlers& operator=(const MarketDataHandlers&) = delete;

    /// Session control may be wired after construction (the session depends on the dispatcher).
    void setSessionControl(ISessionControl* control);

    void attach(MessageDispatcher& dispatcher);
    void detach();

    void onTicker(const MarketEventPtr& ev);
    void onSnapshot(const MarketEventPtr& ev);
    void onDelta(const MarketEventPtr& ev);
    void onTrade(const MarketEventPtr& ev);
    void onFill(const MarketEventPtr& ev);
    void onError(const MarketEventPtr& ev);
    void onAck(const MarketEventPtr& ev);
    void onUnknown(const MarketEventPtr& ev);

    /// Session state hook. Leaving the connected states withdraws every book until the
    /// resubscribe snapshot arrives, since deltas sent during the outage are lost.
    void onSessionState(ConnectionState to);

    [[nodiscard]] const LatestStateCache& cache() const noexcept { return m_cache; }
    [[nodiscard]] uint64_t resyncRequests() const noexcept { return m_resyncs.load(std::memory_order_relaxed); }
    [[nodiscard]] uint64_t acksSeen() const noexcept { return m_acks.load(std::memory_order_relaxed); }

private:
    void upsertBook(const EventHeader& header, const OrderbookView& view);
    void withdrawBooks(const std::vector<std::string>& instruments, int64_t atUs);

    IEventStore&     m_store;
    StreamMonitor*   m_monitor;
    LatestStateCache m_cache;
    std::vector<int> m_fatalCodes;

    // Book mutation and its latest-view write happen together so a late worker
    // cannot republish a book the session just withdrew.
    std::mutex       m_bookMx;

    std::atomic<ISessionControl*> m_control{nullptr};

    std::mutex                                  m_attachMx;
    MessageDispatcher*                          m_dispatcher{nullptr};
    std::vector<MessageDispatcher::HandlerId>   m_handlerIds;

    std::atomic<uint64_t> m_resyncs{0};
    std::atomic<uint64_t> m_acks{0};
};

// JSON form of a book view as persisted in latest_orderbook.
std::string toJson(const OrderbookView& view);
