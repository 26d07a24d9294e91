#pragma once

#include "audio/signal_buffer.hpp"
#include "cleanup/reducer_config.hpp"
#include <cstddef>

namespace ac::cleanup {

/**
 * @brief Detect and repair impulsive clicks in one channel
 *
 * A click is a run of at most max_click_ms samples entered by a jump
 * larger than the threshold and left by a jump of opposite sign. The run
 * is replaced by a cubic (Catmull-Rom) interpolation between its
 * neighbours. Step changes that never return are left alone.
 *
 * @return Number of runs repaired
 */
size_t suppress_clicks(float* samples, size_t count, uint32_t sample_rate, const ReducerConfig& config);

/// Channel-wise suppress_clicks(); returns the total number of repairs
size_t suppress_clicks(audio::SignalBuffer& buffer, const ReducerConfig& config);

} // namespace ac::cleanup
