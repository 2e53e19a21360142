/*
Tapline — MarketDataHandlers Tests
Role: Verify cache updates, persistence calls and session control requests per event kind
Testing Strategy: Parse golden frames, call handlers directly, assert on SpyStore and a recording control
Coverage: Snapshot/delta recovery scenario, books withdrawn on connection loss, fatal vs non-fatal
          errors, ticker/trade/fill persistence, attach/detach through a live dispatcher
*/
#include <gtest/gtest.h>
#include "marketdata/dispatch/MessageDispatcher.hpp"
#include "marketdata/dispatch/MessageParser.hpp"
#include "marketdata/dispatch/WorkerPool.hpp"
#include "marketdata/handlers/MarketDataHandlers.hpp"
#include "marketdata/ws/ISessionControl.hpp"
#include "StreamMonitor.hpp"
#include "fixtures/kalshi_messages.hpp"
#include "fixtures/spy_store.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <mutex>

namespace {

class RecordingControl : public ISessionControl {
public:
    void requestSnapshot(const std::string& instrument) override {
        std::lock_guard<std::mutex> lock(mx);
        snapshots.push_back(instrument);
    }
    void forceDegraded(const std::string& reason) override {
        std::lock_guard<std::mutex> lock(mx);
        degraded.push_back(reason);
    }

    std::mutex mx;
    std::vector<std::string> snapshots;
    std::vector<std::string> degraded;
};

MarketEventPtr ev(const std::string& raw) {
    return std::make_shared<const MarketEvent>(MessageParser::parse(raw));
}

class HandlersTest : public ::testing::Test {
protected:
    void SetUp() override {
        handlers.setSessionControl(&control);
    }

    SpyStore           store;
    StreamMonitor      monitor;
    RecordingControl   control;
    MarketDataHandlers handlers{store, &monitor, 16, {9, 17}};
};

} // namespace

// =============================================================================
// Orderbook recovery
// =============================================================================

TEST_F(HandlersTest, GapAfterAppliedDeltaGoesStaleAndRequestsSnapshot) {
    handlers.onSnapshot(ev(fixtures::snapshot("KXA-1", 2, 100, {{45, 10}}, {{50, 3}})));
    handlers.onDelta(ev(fixtures::delta("KXA-1", 2, 101, "yes", 45, -4)));

    auto book = handlers.cache().orderbook("KXA-1");
    ASSERT_TRUE(book.has_value());
    EXPECT_EQ(book->yes[0], (PriceLevel{45, 6}));
    EXPECT_EQ(book->sequence, 101u);

    // prev 105 while the book is at 101
    handlers.onDelta(ev(fixtures::delta("KXA-1", 2, 106, "yes", 45, 1000, 105)));

    EXPECT_FALSE(handlers.cache().orderbook("KXA-1").has_value());
    EXPECT_EQ(*handlers.cache().bookStatus("KXA-1"), OrderbookState::Status::Stale);
    ASSERT_EQ(control.snapshots.size(), 1u);
    EXPECT_EQ(control.snapshots[0], "KXA-1");
    EXPECT_EQ(handlers.resyncRequests(), 1u);
    EXPECT_EQ(monitor.snapshot().resyncs, 1u);

    // The out-of-order delta was persisted in history; the latest view only learns the book is stale
    EXPECT_EQ(store.countOf(EventKind::OrderbookDelta), 2u);
    const auto latest = store.latest();
    ASSERT_EQ(latest.size(), 3u);
    auto lastBook = nlohmann::json::parse(latest[1].payload);
    EXPECT_EQ(lastBook["seq"], 101);
    EXPECT_EQ(lastBook["yes"][0][1], 6);
    EXPECT_TRUE(latest[2].stale);
    EXPECT_EQ(latest[2].instrument, "KXA-1");
    EXPECT_EQ(latest[2].view, LatestRecord::View::Orderbook);
}

TEST_F(HandlersTest, OneRequestPerStaleEpisode) {
    handlers.onSnapshot(ev(fixtures::snapshot("KXA-1", 2, 100, {{45, 10}}, {})));
    handlers.onDelta(ev(fixtures::delta("KXA-1", 2, 110, "yes", 45, 1, 109)));
    handlers.onDelta(ev(fixtures::delta("KXA-1", 2, 111, "yes", 45, 1)));
    handlers.onDelta(ev(fixtures::delta("KXA-1", 2, 112, "yes", 45, 1)));
    EXPECT_EQ(control.snapshots.size(), 1u);

    // Fresh snapshot on a new sid ends the episode
    handlers.onSnapshot(ev(fixtures::snapshot("KXA-1", 5, 1, {{45, 3}}, {})));
    ASSERT_TRUE(handlers.cache().orderbook("KXA-1").has_value());
    EXPECT_EQ(handlers.cache().orderbook("KXA-1")->yes[0].quantity, 3);

    handlers.onDelta(ev(fixtures::delta("KXA-1", 5, 2, "yes", 45, 1)));
    EXPECT_EQ(handlers.cache().orderbook("KXA-1")->yes[0].quantity, 4);
}

TEST_F(HandlersTest, SnapshotUpsertsLatestBook) {
    handlers.onSnapshot(ev(fixtures::snapshot("KXA-1", 2, 100, {{45, 10}, {40, 1}}, {})));
    ASSERT_EQ(store.latestCountOf(LatestRecord::View::Orderbook), 1u);
    const auto rec = store.latest().front();
    EXPECT_EQ(rec.instrument, "KXA-1");
    EXPECT_EQ(rec.seq, std::optional<uint64_t>(100));
    auto j = nlohmann::json::parse(rec.payload);
    EXPECT_EQ(j["market_ticker"], "KXA-1");
    EXPECT_EQ(j["yes"].size(), 2u);
    EXPECT_EQ(store.countOf(EventKind::OrderbookSnapshot), 1u);
}

TEST_F(HandlersTest, ConnectionLossWithdrawsBooksWithoutRequests) {
    handlers.onSnapshot(ev(fixtures::snapshot("KXA-1", 2, 100, {{45, 10}}, {})));
    handlers.onSnapshot(ev(fixtures::snapshot("KXB-2", 3, 7, {{30, 1}}, {})));
    store.clear();

    handlers.onSessionState(ConnectionState::Degraded);

    EXPECT_FALSE(handlers.cache().orderbook("KXA-1").has_value());
    EXPECT_FALSE(handlers.cache().orderbook("KXB-2").has_value());
    EXPECT_EQ(*handlers.cache().bookStatus("KXA-1"), OrderbookState::Status::Stale);
    const auto latest = store.latest();
    ASSERT_EQ(latest.size(), 2u);
    EXPECT_TRUE(std::all_of(latest.begin(), latest.end(), [](const LatestRecord& r) { return r.stale; }));

    // A late delta from the dropped connection neither revives the book nor asks for a snapshot
    handlers.onDelta(ev(fixtures::delta("KXA-1", 2, 101, "yes", 45, 1)));
    EXPECT_FALSE(handlers.cache().orderbook("KXA-1").has_value());
    EXPECT_TRUE(control.snapshots.empty());
    EXPECT_EQ(handlers.resyncRequests(), 0u);

    // The resubscribe snapshot restores it
    handlers.onSnapshot(ev(fixtures::snapshot("KXA-1", 9, 1, {{45, 4}}, {})));
    ASSERT_TRUE(handlers.cache().orderbook("KXA-1").has_value());
    EXPECT_FALSE(store.latest().back().stale);
}

TEST_F(HandlersTest, OtherTransitionsLeaveBooksAlone) {
    handlers.onSnapshot(ev(fixtures::snapshot("KXA-1", 2, 100, {{45, 10}}, {})));
    store.clear();
    handlers.onSessionState(ConnectionState::Connecting);
    handlers.onSessionState(ConnectionState::Authenticating);
    handlers.onSessionState(ConnectionState::Ready);
    EXPECT_TRUE(handlers.cache().orderbook("KXA-1").has_value());
    EXPECT_TRUE(store.latest().empty());

    handlers.onSessionState(ConnectionState::Closed);
    EXPECT_FALSE(handlers.cache().orderbook("KXA-1").has_value());
    ASSERT_EQ(store.latest().size(), 1u);

    // Already withdrawn: a second loss writes nothing
    handlers.onSessionState(ConnectionState::Failed);
    EXPECT_EQ(store.latest().size(), 1u);
}

// =============================================================================
// Other kinds
// =============================================================================

TEST_F(HandlersTest, TickerUpdatesCacheAndStore) {
    handlers.onTicker(ev(fixtures::ticker("KXA-1", 48, 47, 49)));
    ASSERT_TRUE(handlers.cache().latestTicker("KXA-1").has_value());
    EXPECT_EQ(handlers.cache().latestTicker("KXA-1")->ticker.yesAsk, 49);
    EXPECT_EQ(store.countOf(EventKind::Ticker), 1u);
    EXPECT_EQ(store.latestCountOf(LatestRecord::View::Ticker), 1u);
}

TEST_F(HandlersTest, TradesAndFillsAppendHistory) {
    handlers.onTrade(ev(fixtures::trade("KXA-1", 36, 10)));
    handlers.onTrade(ev(fixtures::trade("KXA-1", 37, 11)));
    handlers.onFill(ev(fixtures::fill("KXA-1", "no", "sell", 5, 60)));

    EXPECT_EQ(handlers.cache().recentTrades("KXA-1").size(), 2u);
    EXPECT_EQ(handlers.cache().recentFills("KXA-1").size(), 1u);
    EXPECT_EQ(store.countOf(EventKind::Trade), 2u);
    EXPECT_EQ(store.countOf(EventKind::Fill), 1u);
}

TEST_F(HandlersTest, FatalErrorCodeForcesDegraded) {
    handlers.onError(ev(fixtures::error(9, "Authentication required")));
    ASSERT_EQ(control.degraded.size(), 1u);
    EXPECT_NE(control.degraded[0].find("9"), std::string::npos);
}

TEST_F(HandlersTest, NonFatalErrorOnlyLogs) {
    handlers.onError(ev(fixtures::error(6, "Already subscribed", 3)));
    EXPECT_TRUE(control.degraded.empty());
}

TEST_F(HandlersTest, AcksAndUnknownAreNotPersisted) {
    handlers.onAck(ev(fixtures::subscribed(1, 2)));
    handlers.onUnknown(ev(fixtures::unknownType()));
    EXPECT_EQ(handlers.acksSeen(), 1u);
    EXPECT_TRUE(store.events().empty());
}

TEST_F(HandlersTest, NoControlWiredStillMarksStale) {
    handlers.setSessionControl(nullptr);
    handlers.onDelta(ev(fixtures::delta("KXA-1", 2, 5, "yes", 45, 1)));
    EXPECT_EQ(*handlers.cache().bookStatus("KXA-1"), OrderbookState::Status::Stale);
    EXPECT_TRUE(control.snapshots.empty());
    EXPECT_EQ(handlers.resyncRequests(), 1u);
}

// =============================================================================
// Dispatcher integration
// =============================================================================

TEST(MarketDataHandlersAttach, RegistersEveryKindAndDetaches) {
    SpyStore store;
    WorkerPool pool(2, 64);
    MessageDispatcher dispatcher(pool, nullptr);
    MarketDataHandlers handlers(store, nullptr);

    handlers.attach(dispatcher);
    EXPECT_EQ(dispatcher.handlerCount(), kEventKindCount);

    dispatcher.onFrame(fixtures::snapshot("KXA-1", 2, 1, {{45, 10}}, {}));
    dispatcher.onFrame(fixtures::delta("KXA-1", 2, 2, "yes", 45, 5));
    dispatcher.onFrame(fixtures::trade("KXA-1", 40, 1, "yes", "x", 2));
    pool.drain();

    ASSERT_TRUE(handlers.cache().orderbook("KXA-1").has_value());
    EXPECT_EQ(handlers.cache().orderbook("KXA-1")->yes[0].quantity, 15);
    EXPECT_EQ(store.countOf(EventKind::Trade), 1u);

    handlers.detach();
    EXPECT_EQ(dispatcher.handlerCount(), 0u);
    pool.stop();
}
