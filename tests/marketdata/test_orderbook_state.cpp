/*
Tapline — OrderbookState Tests
Role: Verify snapshot replace, delta patching and sequence gating of a single book
Coverage: Level ordering, removal at zero, gaps leave levels untouched, foreign sids, ungated deltas
*/
#include <gtest/gtest.h>
#include "marketdata/model/OrderbookState.hpp"

namespace {

BookSnapshotEvent makeSnapshot(std::vector<PriceLevel> yes, std::vector<PriceLevel> no) {
    BookSnapshotEvent s;
    s.yes = std::move(yes);
    s.no = std::move(no);
    return s;
}

BookDeltaEvent makeDelta(BookSide side, int price, int64_t delta) {
    BookDeltaEvent d;
    d.side = side;
    d.price = price;
    d.delta = delta;
    return d;
}

} // namespace

TEST(OrderbookState, StartsStaleWithNoView) {
    OrderbookState book("KXA-1");
    EXPECT_EQ(book.status(), OrderbookState::Status::Stale);
    EXPECT_FALSE(book.view().has_value());
}

TEST(OrderbookState, SnapshotReplacesAndSortsBestFirst) {
    OrderbookState book("KXA-1");
    book.applySnapshot(makeSnapshot({{40, 5}, {45, 10}, {30, 0}}, {{50, 3}}), 2, 100);

    auto v = book.view();
    ASSERT_TRUE(v.has_value());
    EXPECT_EQ(v->sid, 2u);
    EXPECT_EQ(v->sequence, 100u);
    ASSERT_EQ(v->yes.size(), 2u);              // zero-quantity level dropped
    EXPECT_EQ(v->yes[0], (PriceLevel{45, 10}));
    EXPECT_EQ(v->yes[1], (PriceLevel{40, 5}));

    book.applySnapshot(makeSnapshot({{20, 1}}, {}), 2, 200);
    v = book.view();
    ASSERT_EQ(v->yes.size(), 1u);
    EXPECT_EQ(v->yes[0], (PriceLevel{20, 1}));
    EXPECT_TRUE(v->no.empty());
    EXPECT_EQ(v->sequence, 200u);
}

TEST(OrderbookState, DeltaAddsUpdatesAndRemoves) {
    OrderbookState book("KXA-1");
    book.applySnapshot(makeSnapshot({{45, 10}}, {}), 2, 100);

    EXPECT_EQ(book.applyDelta(makeDelta(BookSide::Yes, 45, -4), 2, 101, 100), OrderbookState::DeltaResult::Applied);
    EXPECT_EQ(book.applyDelta(makeDelta(BookSide::No, 55, 7), 2, 102, 101), OrderbookState::DeltaResult::Applied);
    EXPECT_EQ(book.applyDelta(makeDelta(BookSide::Yes, 45, -6), 2, 103, 102), OrderbookState::DeltaResult::Applied);

    auto v = book.view();
    ASSERT_TRUE(v.has_value());
    EXPECT_TRUE(v->yes.empty());               // 10 - 4 - 6 = 0 removes the level
    ASSERT_EQ(v->no.size(), 1u);
    EXPECT_EQ(v->no[0], (PriceLevel{55, 7}));
    EXPECT_EQ(v->sequence, 103u);
}

TEST(OrderbookState, NegativeDeltaOnMissingLevelIsIgnored) {
    OrderbookState book("KXA-1");
    book.applySnapshot(makeSnapshot({}, {}), 2, 1);
    EXPECT_EQ(book.applyDelta(makeDelta(BookSide::Yes, 10, -3), 2, 2, 1), OrderbookState::DeltaResult::Applied);
    EXPECT_TRUE(book.view()->yes.empty());
}

TEST(OrderbookState, GapMarksStaleWithoutApplying) {
    OrderbookState book("KXA-1");
    book.applySnapshot(makeSnapshot({{45, 10}}, {}), 2, 100);
    ASSERT_EQ(book.applyDelta(makeDelta(BookSide::Yes, 45, 1), 2, 101, 100), OrderbookState::DeltaResult::Applied);

    // prev 105 does not match cached 101
    EXPECT_EQ(book.applyDelta(makeDelta(BookSide::Yes, 45, 50), 2, 106, 105), OrderbookState::DeltaResult::SequenceGap);
    EXPECT_EQ(book.status(), OrderbookState::Status::Stale);
    EXPECT_FALSE(book.view().has_value());

    // Levels untouched by the rejected delta
    auto raw = book.levels(BookSide::Yes);
    ASSERT_EQ(raw.size(), 1u);
    EXPECT_EQ(raw[0], (PriceLevel{45, 11}));
    EXPECT_EQ(book.sequence(), 101u);
}

TEST(OrderbookState, DeltasWhileStaleAreRejected) {
    OrderbookState book("KXA-1");
    EXPECT_EQ(book.applyDelta(makeDelta(BookSide::Yes, 45, 1), 2, 1, 0), OrderbookState::DeltaResult::NotSynced);
    EXPECT_TRUE(book.levels(BookSide::Yes).empty());
}

TEST(OrderbookState, SnapshotRecoversFromStale) {
    OrderbookState book("KXA-1");
    book.applySnapshot(makeSnapshot({{45, 10}}, {}), 2, 100);
    book.markStale();
    EXPECT_FALSE(book.isSynced());

    book.applySnapshot(makeSnapshot({{44, 1}}, {}), 5, 1);
    EXPECT_TRUE(book.isSynced());
    EXPECT_EQ(book.sid(), 5u);
    EXPECT_EQ(book.applyDelta(makeDelta(BookSide::Yes, 44, 1), 5, 2, 1), OrderbookState::DeltaResult::Applied);
}

TEST(OrderbookState, ForeignSidIgnored) {
    OrderbookState book("KXA-1");
    book.applySnapshot(makeSnapshot({{45, 10}}, {}), 2, 100);
    EXPECT_EQ(book.applyDelta(makeDelta(BookSide::Yes, 45, 5), 9, 101, 100), OrderbookState::DeltaResult::ForeignStream);
    EXPECT_TRUE(book.isSynced());
    EXPECT_EQ(book.view()->yes[0].quantity, 10);
}

TEST(OrderbookState, DeltaWithoutSequenceAppliedUngated) {
    OrderbookState book("KXA-1");
    book.applySnapshot(makeSnapshot({{45, 10}}, {}), 2, 100);
    EXPECT_EQ(book.applyDelta(makeDelta(BookSide::Yes, 45, 1), 2, std::nullopt, std::nullopt),
              OrderbookState::DeltaResult::Applied);
    EXPECT_EQ(book.sequence(), 100u);
    EXPECT_EQ(book.view()->yes[0].quantity, 11);
}

TEST(OrderbookState, AdvanceToOnlyMovesForward) {
    OrderbookState book("KXA-1");
    book.applySnapshot(makeSnapshot({}, {}), 2, 100);
    book.advanceTo(105);
    EXPECT_EQ(book.sequence(), 105u);
    book.advanceTo(103);
    EXPECT_EQ(book.sequence(), 105u);
    EXPECT_EQ(book.applyDelta(makeDelta(BookSide::No, 1, 1), 2, 106, 105), OrderbookState::DeltaResult::Applied);
}

TEST(OrderbookState, StatusNames) {
    EXPECT_STREQ(toString(OrderbookState::Status::Synced), "synced");
    EXPECT_STREQ(toString(OrderbookState::Status::Stale), "stale");
}
