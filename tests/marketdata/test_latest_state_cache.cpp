/*
Tapline — LatestStateCache Tests
Role: Verify multi-instrument book bookkeeping on shared subscription streams
Coverage: Shared sequence advancement, stale episodes across a stream, sid migration, rings, tickers
*/
#include <gtest/gtest.h>
#include "marketdata/cache/LatestStateCache.hpp"
#include <algorithm>

namespace {

EventHeader header(const std::string& instrument, uint64_t sid, std::optional<uint64_t> seq,
                   std::optional<uint64_t> prev = std::nullopt) {
    EventHeader h;
    h.instrument = instrument;
    h.sid = sid;
    h.seq = seq;
    h.prevSeq = prev ? prev : (seq && *seq > 0 ? std::optional<uint64_t>(*seq - 1) : std::nullopt);
    h.receivedAt = std::chrono::system_clock::now();
    return h;
}

BookSnapshotEvent snap(int price, int64_t qty) {
    BookSnapshotEvent s;
    s.yes.push_back(PriceLevel{price, qty});
    return s;
}

BookDeltaEvent delta(int price, int64_t qty, BookSide side = BookSide::Yes) {
    BookDeltaEvent d;
    d.side = side;
    d.price = price;
    d.delta = qty;
    return d;
}

bool contains(const std::vector<std::string>& v, const std::string& s) {
    return std::find(v.begin(), v.end(), s) != v.end();
}

} // namespace

// =============================================================================
// RingBuffer
// =============================================================================

TEST(RingBuffer, KeepsNewestOldestFirst) {
    RingBuffer<int> ring(3);
    for (int i = 1; i <= 5; ++i) ring.push_back(i);
    EXPECT_EQ(ring.size(), 3u);
    EXPECT_EQ(ring.snapshot(), (std::vector<int>{3, 4, 5}));
}

TEST(RingBuffer, PartialFill) {
    RingBuffer<int> ring(4);
    ring.push_back(7);
    ring.push_back(8);
    EXPECT_EQ(ring.snapshot(), (std::vector<int>{7, 8}));
}

// =============================================================================
// Orderbooks
// =============================================================================

TEST(LatestStateCache, SnapshotThenDeltas) {
    LatestStateCache cache;
    auto view = cache.applySnapshot(header("KXA-1", 2, 100), snap(45, 10));
    EXPECT_EQ(view.sequence, 100u);

    auto out = cache.applyDelta(header("KXA-1", 2, 101), delta(45, 5));
    EXPECT_EQ(out.result, OrderbookState::DeltaResult::Applied);
    ASSERT_TRUE(out.view.has_value());
    EXPECT_EQ(out.view->yes[0].quantity, 15);
    EXPECT_TRUE(out.resyncInstruments.empty());

    ASSERT_TRUE(cache.orderbook("KXA-1").has_value());
    EXPECT_EQ(*cache.bookStatus("KXA-1"), OrderbookState::Status::Synced);
}

TEST(LatestStateCache, SharedStreamSequenceAdvancesEveryBook) {
    LatestStateCache cache;
    cache.applySnapshot(header("KXA-1", 2, 1), snap(45, 10));
    cache.applySnapshot(header("KXB-2", 2, 2), snap(30, 4));

    // seq 3 on A, seq 4 on B: each expects the previous stream-wide seq
    EXPECT_EQ(cache.applyDelta(header("KXA-1", 2, 3), delta(45, 1)).result, OrderbookState::DeltaResult::Applied);
    EXPECT_EQ(cache.applyDelta(header("KXB-2", 2, 4), delta(30, 1)).result, OrderbookState::DeltaResult::Applied);
    EXPECT_EQ(cache.applyDelta(header("KXA-1", 2, 5), delta(45, 1)).result, OrderbookState::DeltaResult::Applied);
}

TEST(LatestStateCache, GapStalesWholeStreamAndReportsEachInstrumentOnce) {
    LatestStateCache cache;
    cache.applySnapshot(header("KXA-1", 2, 1), snap(45, 10));
    cache.applySnapshot(header("KXB-2", 2, 2), snap(30, 4));

    auto out = cache.applyDelta(header("KXA-1", 2, 9, 8), delta(45, 1));
    EXPECT_EQ(out.result, OrderbookState::DeltaResult::SequenceGap);
    EXPECT_EQ(out.resyncInstruments.size(), 2u);
    EXPECT_TRUE(contains(out.resyncInstruments, "KXA-1"));
    EXPECT_TRUE(contains(out.resyncInstruments, "KXB-2"));

    EXPECT_FALSE(cache.orderbook("KXA-1").has_value());
    EXPECT_FALSE(cache.orderbook("KXB-2").has_value());
    EXPECT_TRUE(cache.resyncPending("KXA-1"));

    // Further deltas in the same episode do not re-request
    auto again = cache.applyDelta(header("KXB-2", 2, 10), delta(30, 1));
    EXPECT_EQ(again.result, OrderbookState::DeltaResult::NotSynced);
    EXPECT_TRUE(again.resyncInstruments.empty());
}

TEST(LatestStateCache, SnapshotEndsEpisodeAndMovesSid) {
    LatestStateCache cache;
    cache.applySnapshot(header("KXA-1", 2, 1), snap(45, 10));
    (void)cache.applyDelta(header("KXA-1", 2, 9, 8), delta(45, 1));
    ASSERT_TRUE(cache.resyncPending("KXA-1"));

    // Resubscribe produced a new sid
    auto view = cache.applySnapshot(header("KXA-1", 7, 1), snap(44, 2));
    EXPECT_EQ(view.sid, 7u);
    EXPECT_FALSE(cache.resyncPending("KXA-1"));

    // Late delta from the retired sid is ignored
    EXPECT_EQ(cache.applyDelta(header("KXA-1", 2, 10), delta(44, 100)).result, OrderbookState::DeltaResult::ForeignStream);
    EXPECT_EQ(cache.orderbook("KXA-1")->yes[0].quantity, 2);

    // A new gap after recovery is a new episode
    auto out = cache.applyDelta(header("KXA-1", 7, 5, 4), delta(44, 1));
    EXPECT_EQ(out.resyncInstruments, std::vector<std::string>{"KXA-1"});
}

TEST(LatestStateCache, DeltaBeforeAnySnapshotRequestsResync) {
    LatestStateCache cache;
    auto out = cache.applyDelta(header("KXNEW-1", 3, 1), delta(50, 1));
    EXPECT_EQ(out.result, OrderbookState::DeltaResult::NotSynced);
    EXPECT_EQ(out.resyncInstruments, std::vector<std::string>{"KXNEW-1"});
    EXPECT_EQ(*cache.bookStatus("KXNEW-1"), OrderbookState::Status::Stale);
}

TEST(LatestStateCache, UnknownInstrumentQueries) {
    LatestStateCache cache;
    EXPECT_FALSE(cache.orderbook("nope").has_value());
    EXPECT_FALSE(cache.bookStatus("nope").has_value());
    EXPECT_FALSE(cache.latestTicker("nope").has_value());
    EXPECT_TRUE(cache.recentTrades("nope").empty());
    EXPECT_TRUE(cache.recentFills("nope").empty());
}

// =============================================================================
// Tickers, trades, fills
// =============================================================================

TEST(LatestStateCache, TickerLastWriteWins) {
    LatestStateCache cache;
    TickerEvent t1; t1.price = 40;
    TickerEvent t2; t2.price = 42;
    cache.upsertTicker(header("KXA-1", 1, std::nullopt), t1);
    cache.upsertTicker(header("KXA-1", 1, std::nullopt), t2);
    ASSERT_TRUE(cache.latestTicker("KXA-1").has_value());
    EXPECT_EQ(cache.latestTicker("KXA-1")->ticker.price, 42);
}

TEST(LatestStateCache, RecentTradesBounded) {
    LatestStateCache cache(2);
    for (int i = 0; i < 5; ++i) {
        TradeEvent t;
        t.tradeId = "t" + std::to_string(i);
        cache.addTrade("KXA-1", t);
    }
    auto trades = cache.recentTrades("KXA-1");
    ASSERT_EQ(trades.size(), 2u);
    EXPECT_EQ(trades[0].tradeId, "t3");
    EXPECT_EQ(trades[1].tradeId, "t4");
}

TEST(LatestStateCache, FillsKeptPerInstrument) {
    LatestStateCache cache;
    FillEvent f;
    f.count = 3;
    cache.addFill("KXA-1", f);
    EXPECT_EQ(cache.recentFills("KXA-1").size(), 1u);
    EXPECT_TRUE(cache.recentFills("KXB-2").empty());
}
