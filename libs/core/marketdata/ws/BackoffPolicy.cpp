#include "BackoffPolicy.hpp"
#include <algorithm>
#include <cmath>

BackoffPolicy::BackoffPolicy(std::chrono::milliseconds base,
                             std::chrono::milliseconds max,
                             double jitterFraction,
                             uint64_t seed)
    : m_base(base.count() > 0 ? base : std::chrono::milliseconds(1))
    , m_max(std::max(max, m_base))
    , m_jitter(std::clamp(jitterFraction, 0.0, 1.0))
    , m_rng(seed)
{}

std::chrono::milliseconds BackoffPolicy::nextDelay() {
    const double maxMs = static_cast<double>(m_max.count());
    // Past ~2^40 the nominal value is far beyond any sane cap.
    const uint32_t exp = std::min<uint32_t>(m_attempt, 40);
    const double nominal = std::min(maxMs, static_cast<double>(m_base.count()) * std::ldexp(1.0, static_cast<int>(exp)));

    double jitter = 0.0;
    if (m_jitter > 0.0) {
        std::uniform_real_distribution<double> dist(0.0, nominal * m_jitter);
        jitter = dist(m_rng);
    }

    if (m_attempt < UINT32_MAX) ++m_attempt;
    return std::chrono::milliseconds(static_cast<int64_t>(std::min(maxMs, nominal + jitter)));
}
