#pragma once

#include "audio/signal_buffer.hpp"
#include "core/error.hpp"
#include <cstddef>
#include <cstdint>

namespace ac::dsp {

/// Output length for a rate change: round(frames * target / source)
size_t resampled_length(size_t frames, uint32_t source_rate, uint32_t target_rate);

/**
 * @brief Band-limited sample rate conversion (libswresample)
 *
 * Channels are converted independently and the result has exactly
 * resampled_length() frames. A matching rate returns a copy.
 *
 * @return InvalidParameter for a zero target rate
 */
Result<audio::SignalBuffer> resample(const audio::SignalBuffer& buffer, uint32_t target_rate);

} // namespace ac::dsp
