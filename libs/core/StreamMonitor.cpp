#include "StreamMonitor.hpp"
#include <cstddef>

void StreamMonitor::recordEvent(EventKind kind) noexcept {
    const auto idx = static_cast<std::size_t>(kind);
    if (idx < m_perKind.size()) {
        bump(m_perKind[idx]);
    }
}

StreamMonitor::Snapshot StreamMonitor::snapshot() const noexcept {
    Snapshot s;
    s.frames            = m_frames.load(std::memory_order_relaxed);
    s.malformed         = m_malformed.load(std::memory_order_relaxed);
    s.unknown           = m_unknown.load(std::memory_order_relaxed);
    s.backpressureDrops = m_backpressureDrops.load(std::memory_order_relaxed);
    s.reconnects        = m_reconnects.load(std::memory_order_relaxed);
    s.resyncs           = m_resyncs.load(std::memory_order_relaxed);
    s.storeWrites       = m_storeWrites.load(std::memory_order_relaxed);
    s.storeRetries      = m_storeRetries.load(std::memory_order_relaxed);
    s.storeDrops        = m_storeDrops.load(std::memory_order_relaxed);
    for (std::size_t i = 0; i < m_perKind.size(); ++i) {
        s.perKind[i] = m_perKind[i].load(std::memory_order_relaxed);
    }
    return s;
}

QString StreamMonitor::statusLine() const {
    const auto s = snapshot();
    auto kind = [&s](EventKind k) { return QString::number(s.perKind[static_cast<std::size_t>(k)]); };

    return QString("📊 frames=%1 malformed=%2 unknown=%3 | ticker=%4 snap=%5 delta=%6 trade=%7 fill=%8 err=%9 "
                   "| resyncs=%10 reconnects=%11 backpressure=%12 | store writes=%13 retries=%14 drops=%15")
        .arg(s.frames).arg(s.malformed).arg(s.unknown)
        .arg(kind(EventKind::Ticker), kind(EventKind::OrderbookSnapshot), kind(EventKind::OrderbookDelta),
             kind(EventKind::Trade), kind(EventKind::Fill), kind(EventKind::Error))
        .arg(s.resyncs).arg(s.reconnects).arg(s.backpressureDrops)
        .arg(s.storeWrites).arg(s.storeRetries).arg(s.storeDrops);
}

void StreamMonitor::reset() noexcept {
    for (auto* c : {&m_frames, &m_malformed, &m_unknown, &m_backpressureDrops, &m_reconnects,
                    &m_resyncs, &m_storeWrites, &m_storeRetries, &m_storeDrops}) {
        c->store(0, std::memory_order_relaxed);
    }
    for (auto& c : m_perKind) {
        c.store(0, std::memory_order_relaxed);
    }
}
