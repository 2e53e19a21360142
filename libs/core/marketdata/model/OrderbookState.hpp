#pragma once
/*
Tapline — OrderbookState
Role: Per-instrument book cache: price levels for both sides plus the sequence they reflect.
Inputs/Outputs: Mutated by snapshots (full replace) and deltas (sequence-checked patch); read via view().
Threading: Not synchronized; LatestStateCache serializes access and the dispatcher partitions work so
           one worker owns a given stream.
Invariant: Synced means a snapshot was applied and every later delta matched the cached sequence.
           Stale books keep their last levels for diagnostics but view() never returns them.
*/
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "MarketEvents.hpp"

struct OrderbookView {
    std::string             instrument;
    uint64_t                sid{0};
    uint64_t                sequence{0};
    std::vector<PriceLevel> yes;    // best (highest) price first
    std::vector<PriceLevel> no;
};

class OrderbookState {
public:
    enum class Status {
        Stale,      // no snapshot yet, or a gap was detected
        Synced
    };

    enum class DeltaResult {
        Applied,
        NotSynced,          // no usable snapshot; nothing mutated
        SequenceGap,        // prior sequence mismatch; book is now stale
        ForeignStream       // delta from a different sid than the snapshot; ignored
    };

    explicit OrderbookState(std::string instrument = {});

    void applySnapshot(const BookSnapshotEvent& snapshot, uint64_t sid, std::optional<uint64_t> seq);

    // Applies a delta whose expected prior sequence is prevSeq. Without a sequence (the protocol
    // did not provide one) the delta is applied ungated.
    DeltaResult applyDelta(const BookDeltaEvent& delta,
                           uint64_t sid,
                           std::optional<uint64_t> seq,
                           std::optional<uint64_t> prevSeq);

    // Another message on the same stream consumed a sequence number.
    void advanceTo(uint64_t seq);

    void markStale();

    [[nodiscard]] Status   status() const noexcept { return m_status; }
    [[nodiscard]] bool     isSynced() const noexcept { return m_status == Status::Synced; }
    [[nodiscard]] uint64_t sid() const noexcept { return m_sid; }
    [[nodiscard]] uint64_t sequence() const noexcept { return m_sequence; }
    [[nodiscard]] const std::string& instrument() const noexcept { return m_instrument; }

    // Consumer view; empty unless synced.
    [[nodiscard]] std::optional<OrderbookView> view() const;

    // Raw levels regardless of status (diagnostics and tests).
    [[nodiscard]] std::vector<PriceLevel> levels(BookSide side) const;

private:
    using LevelMap = std::map<int, int64_t, std::greater<int>>;

    LevelMap&       sideMap(BookSide side) { return side == BookSide::Yes ? m_yes : m_no; }
    const LevelMap& sideMap(BookSide side) const { return side == BookSide::Yes ? m_yes : m_no; }

    static std::vector<PriceLevel> flatten(const LevelMap& m);

    std::string m_instrument;
    Status      m_status{Status::Stale};
    uint64_t    m_sid{0};
    uint64_t    m_sequence{0};
    LevelMap    m_yes;
    LevelMap    m_no;
};

inline const char* toString(OrderbookState::Status s) {
    return s == OrderbookState::Status::Synced ? "synced" : "stale";
}
