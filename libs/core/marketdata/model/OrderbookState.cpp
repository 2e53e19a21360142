#include "OrderbookState.hpp"
#include <utility>

OrderbookState::OrderbookState(std::string instrument)
    : m_instrument(std::move(instrument))
{}

void OrderbookState::applySnapshot(const BookSnapshotEvent& snapshot, uint64_t sid, std::optional<uint64_t> seq) {
    // Full replace
    m_yes.clear();
    m_no.clear();
    for (const auto& level : snapshot.yes) {
        if (level.quantity > 0) m_yes[level.price] = level.quantity;
    }
    for (const auto& level : snapshot.no) {
        if (level.quantity > 0) m_no[level.price] = level.quantity;
    }
    m_sid = sid;
    m_sequence = seq.value_or(0);
    m_status = Status::Synced;
}

OrderbookState::DeltaResult OrderbookState::applyDelta(const BookDeltaEvent& delta,
                                                       uint64_t sid,
                                                       std::optional<uint64_t> seq,
                                                       std::optional<uint64_t> prevSeq) {
    if (m_status != Status::Synced) {
        return DeltaResult::NotSynced;
    }
    if (sid != 0 && m_sid != 0 && sid != m_sid) {
        return DeltaResult::ForeignStream;
    }
    if (seq && prevSeq && *prevSeq != m_sequence) {
        markStale();
        return DeltaResult::SequenceGap;
    }

    auto& levels = sideMap(delta.side);
    auto it = levels.find(delta.price);
    if (it == levels.end()) {
        if (delta.delta > 0) {
            levels.emplace(delta.price, delta.delta);
        }
    } else {
        it->second += delta.delta;
        if (it->second <= 0) {
            levels.erase(it);
        }
    }

    if (seq) {
        m_sequence = *seq;
    }
    return DeltaResult::Applied;
}

void OrderbookState::advanceTo(uint64_t seq) {
    if (m_status == Status::Synced && seq > m_sequence) {
        m_sequence = seq;
    }
}

void OrderbookState::markStale() {
    m_status = Status::Stale;
}

std::optional<OrderbookView> OrderbookState::view() const {
    if (m_status != Status::Synced) {
        return std::nullopt;
    }
    OrderbookView v;
    v.instrument = m_instrument;
    v.sid = m_sid;
    v.sequence = m_sequence;
    v.yes = flatten(m_yes);
    v.no = flatten(m_no);
    return v;
}

std::vector<PriceLevel> OrderbookState::levels(BookSide side) const {
    return flatten(sideMap(side));
}

std::vector<PriceLevel> OrderbookState::flatten(const LevelMap& m) {
    std::vector<PriceLevel> out;
    out.reserve(m.size());
    for (const auto& [price, qty] : m) {
        out.push_back(PriceLevel{price, qty});
    }
    return out;
}
