#pragma once

#include "audio/signal_buffer.hpp"
#include <cstddef>
#include <cstdint>
#include <vector>

namespace ac::dsp {

/// Samples per analysis frame for a duration in milliseconds (at least 1)
size_t frame_length(uint32_t sample_rate, double frame_ms);

/**
 * @brief RMS of consecutive non-overlapping frames, joint across channels
 *
 * The trailing partial frame is included as its own frame.
 */
std::vector<double> frame_rms(const audio::SignalBuffer& buffer, size_t frame_len);

/// Frame RMS of a single channel
std::vector<double> frame_rms(const float* samples, size_t count, size_t frame_len);

/**
 * @brief Indices of the lowest-valued `fraction` of entries
 *
 * At least one index is returned for non-empty input. Ties are broken by
 * position so the selection is deterministic.
 */
std::vector<size_t> lowest_fraction(const std::vector<double>& values, double fraction);

/**
 * @brief Power-mean of the lowest `fraction` of frame RMS values
 *
 * Approximates the level of the quietest sections of a clip without voice
 * activity detection. Returns 0 for empty input.
 */
double low_percentile_rms(const std::vector<double>& frame_levels, double fraction);

/// 20*log10(linear), never below floor_db (also for zero/negative input)
double to_db(double linear, double floor_db);

/// Inverse of to_db without flooring
double from_db(double db);

} // namespace ac::dsp
