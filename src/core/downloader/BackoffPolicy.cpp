/**
 * BackoffPolicy.cpp
 */

#include "BackoffPolicy.hpp"

#include <algorithm>
#include <cmath>

namespace docfetch::core::downloader {

BackoffPolicy::BackoffPolicy(double ceilingSeconds, double jitterRatio)
    : BackoffPolicy(ceilingSeconds, jitterRatio, std::random_device{}()) {
}

BackoffPolicy::BackoffPolicy(double ceilingSeconds, double jitterRatio, uint32_t seed)
    : m_ceiling(ceilingSeconds > 0.0 ? ceilingSeconds : kDefaultCeilingSeconds)
    , m_jitterRatio(std::clamp(jitterRatio, 0.0, 1.0))
    , m_random(seed) {
}

double BackoffPolicy::nominalDelay(int attemptNumber, double baseDelaySeconds) const {
    int exponent = std::max(attemptNumber, 1) - 1;
    double base = std::max(baseDelaySeconds, 0.0);
    return std::min(base * std::pow(2.0, exponent), m_ceiling);
}

double BackoffPolicy::delay(int attemptNumber, double baseDelaySeconds,
                            std::optional<double> serverSuggestedSeconds) {
    double nominal = nominalDelay(attemptNumber, baseDelaySeconds);

    double jitter = 0.0;
    if (nominal > 0.0 && m_jitterRatio > 0.0) {
        std::uniform_real_distribution<double> distribution(0.0, nominal * m_jitterRatio);
        jitter = distribution(m_random);
    }

    double result = nominal + jitter;
    if (serverSuggestedSeconds && *serverSuggestedSeconds > result) {
        result = *serverSuggestedSeconds;
    }
    return std::min(result, m_ceiling);
}

} // namespace docfetch::core::downloader
