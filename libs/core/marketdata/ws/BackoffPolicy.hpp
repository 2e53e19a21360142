#pragma once
/*
Tapline — BackoffPolicy
Role: Reconnect delay schedule: capped exponential growth plus additive jitter.
Inputs/Outputs: nextDelay() consumes one attempt; reset() after reaching Ready.
Threading: Not synchronized; owned by SessionManager and used on its strand.
*/
#include <chrono>
#include <cstdint>
#include <random>

class BackoffPolicy {
public:
    BackoffPolicy(std::chrono::milliseconds base,
                  std::chrono::milliseconds max,
                  double jitterFraction = 0.2,
                  uint64_t seed = std::random_device{}());

    /// delay = min(max, base * 2^attempt + U[0, jitter * base * 2^attempt]); then attempt++.
    [[nodiscard]] std::chrono::milliseconds nextDelay();

    void reset() noexcept { m_attempt = 0; }

    [[nodiscard]] uint32_t attempt() const noexcept { return m_attempt; }
    [[nodiscard]] std::chrono::milliseconds base() const noexcept { return m_base; }
    [[nodiscard]] std::chrono::milliseconds max() const noexcept { return m_max; }

private:
    std::chrono::milliseconds m_base;
    std::chrono::milliseconds m_max;
    double                    m_jitter;
    uint32_t                  m_attempt{0};
    std::mt19937_64           m_rng;
};
