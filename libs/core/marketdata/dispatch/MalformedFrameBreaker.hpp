#pragma once
#include <chrono>
#include <cstddef>
#include <deque>
#include <mutex>

// Trips when `threshold` malformed frames arrive within a sliding `window`.
class MalformedFrameBreaker {
public:
    using Clock = std::chrono::steady_clock;

    MalformedFrameBreaker(std::size_t threshold, std::chrono::milliseconds window)
        : m_threshold(threshold == 0 ? 1 : threshold)
        , m_window(window)
    {}

    /// Records one malformed frame; true exactly when this one reaches the threshold.
    bool record(Clock::time_point now = Clock::now()) {
        std::lock_guard<std::mutex> lock(m_mx);
        while (!m_hits.empty() && now - m_hits.front() > m_window) {
            m_hits.pop_front();
        }
        m_hits.push_back(now);
        if (m_hits.size() >= m_threshold) {
            m_hits.clear();
            return true;
        }
        return false;
    }

    void reset() {
        std::lock_guard<std::mutex> lock(m_mx);
        m_hits.clear();
    }

    [[nodiscard]] std::size_t pending() const {
        std::lock_guard<std::mutex> lock(m_mx);
        return m_hits.size();
    }

private:
    const std::size_t               m_threshold;
    const std::chrono::milliseconds m_window;
    mutable std::mutex              m_mx;
    std::deque<Clock::time_point>   m_hits;
};
