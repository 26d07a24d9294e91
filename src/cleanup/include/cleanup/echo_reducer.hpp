#pragma once

#include "audio/signal_buffer.hpp"
#include "cleanup/reducer_config.hpp"
#include <cstddef>

namespace ac::cleanup {

/// Largest autocorrelation a single echo can produce (a = 1)
constexpr double kMaxSingleEchoCorrelation = 0.5;

/**
 * @brief Strongest single echo found in a channel
 */
struct EchoEstimate {
    size_t delay_samples{0};
    double correlation{0.0};    ///< Normalized autocorrelation at the delay
    double gain{0.0};           ///< Estimated echo gain a, from correlation = a / (1 + a^2)
    bool detected{false};       ///< echo_min_correlation <= correlation <= kMaxSingleEchoCorrelation
};

/**
 * @brief Find the autocorrelation peak within the configured delay window
 *
 * Only the first echo_analysis_window_s seconds are examined.
 */
EchoEstimate estimate_echo(const float* samples, size_t count, uint32_t sample_rate, const ReducerConfig& config);

/**
 * @brief Approximate single-tap echo removal
 *
 * Applies y[n] = x[n] - damping * a * y[n - L] for the estimated delay L
 * and gain a. This is a damping heuristic for one dominant reflection,
 * not a room deconvolution. Channels without a detected echo are left
 * untouched.
 *
 * @return Estimate of the strongest echo across channels (detected == false if none)
 */
EchoEstimate reduce_echo(audio::SignalBuffer& buffer, const ReducerConfig& config);

} // namespace ac::cleanup
