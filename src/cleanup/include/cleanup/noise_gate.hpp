#pragma once

#include "analysis/analyzer.hpp"
#include "audio/signal_buffer.hpp"
#include "cleanup/reducer_config.hpp"
#include <vector>

namespace ac::cleanup {

/**
 * @brief Estimate a channel's noise magnitude spectrum
 *
 * Averages the STFT magnitude of the lowest-energy frames (the
 * `noise_percentile` fraction of frames that lie fully inside the signal,
 * or of all frames for clips shorter than one transform).
 */
std::vector<double> estimate_noise_profile(const float* samples, size_t count,
                                           const ReducerConfig& config,
                                           const analysis::AnalyzerConfig& analysis);

/**
 * @brief Spectral subtraction noise gate, applied to every channel in place
 *
 * Each bin magnitude becomes max(0, |X| - over_subtraction * strength * N)
 * with the bin's phase kept. strength 0 leaves the buffer untouched.
 */
void apply_noise_gate(audio::SignalBuffer& buffer, double strength,
                      const ReducerConfig& config,
                      const analysis::AnalyzerConfig& analysis);

} // namespace ac::cleanup
