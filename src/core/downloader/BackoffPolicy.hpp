#pragma once

/**
 * BackoffPolicy.hpp
 *
 * Exponential backoff with jitter.
 */

#include <cstdint>
#include <optional>
#include <random>

namespace docfetch::core::downloader {

/**
 * BackoffPolicy - delay before the next attempt
 *
 * nominal = min(base * 2^(attempt-1), ceiling)
 * delay   = nominal + U[0, nominal * jitterRatio], replaced by the server's
 *           suggestion when that is larger, never above the ceiling.
 *
 * One instance per run; not thread-safe (owns its random engine).
 */
class BackoffPolicy {
public:
    static constexpr double kDefaultCeilingSeconds = 120.0;
    static constexpr double kDefaultJitterRatio = 0.1;

    explicit BackoffPolicy(double ceilingSeconds = kDefaultCeilingSeconds,
                           double jitterRatio = kDefaultJitterRatio);

    BackoffPolicy(double ceilingSeconds, double jitterRatio, uint32_t seed);

    /**
     * Delay before retrying after the given attempt
     * @param attemptNumber Attempt that just failed (1-based)
     * @param baseDelaySeconds Delay after the first attempt
     * @param serverSuggestedSeconds Retry-After value, if any
     */
    double delay(int attemptNumber, double baseDelaySeconds,
                 std::optional<double> serverSuggestedSeconds = std::nullopt);

    /**
     * Delay without jitter or server suggestion
     */
    double nominalDelay(int attemptNumber, double baseDelaySeconds) const;

    double ceiling() const { return m_ceiling; }
    double jitterRatio() const { return m_jitterRatio; }

private:
    double m_ceiling;
    double m_jitterRatio;
    std::mt19937 m_random;
};

} // namespace docfetch::core::downloader
