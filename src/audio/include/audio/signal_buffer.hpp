#pragma once

#include "core/error.hpp"
#include <cstddef>
#include <cstdint>
#include <vector>

namespace ac::audio {

/// Highest channel count accepted by the core (mono and stereo are the common cases)
inline constexpr uint16_t kMaxChannels = 8;

/**
 * @brief Decoded audio clip: de-interleaved float samples plus format
 *
 * Invariants held by every instance produced through create()/silence():
 * - 1..kMaxChannels channels, all of equal frame count
 * - sample rate > 0
 * - every sample finite and within [-1.0, 1.0]
 *
 * Buffers are plain values. Processing stages copy their input and return
 * a new buffer; nothing in the core mutates a caller's buffer.
 */
class SignalBuffer {
public:
    SignalBuffer() = default;

    /**
     * @brief Build a buffer from per-channel sample vectors
     *
     * @return InvalidParameter if the channel set is empty or too large,
     *         lengths differ, the rate is zero, or a sample is non-finite
     *         or outside [-1, 1]
     */
    static Result<SignalBuffer> create(std::vector<std::vector<float>> channels,
                                       uint32_t sample_rate);

    /**
     * @brief Build an all-zero buffer
     */
    static Result<SignalBuffer> silence(uint16_t channel_count, size_t frame_count,
                                        uint32_t sample_rate);

    /**
     * @brief Build from interleaved samples (frame-major), clamping to [-1, 1]
     *
     * Non-finite input samples are rejected with CorruptData.
     */
    static Result<SignalBuffer> from_interleaved(const std::vector<float>& interleaved,
                                                 uint16_t channel_count,
                                                 uint32_t sample_rate);

    uint32_t sample_rate() const { return sample_rate_; }
    uint16_t channel_count() const { return static_cast<uint16_t>(channels_.size()); }
    size_t frame_count() const { return channels_.empty() ? 0 : channels_.front().size(); }
    double duration_seconds() const;
    bool empty() const { return frame_count() == 0; }

    const float* channel_data(uint16_t channel) const { return channels_[channel].data(); }
    float* channel_data(uint16_t channel) { return channels_[channel].data(); }
    const std::vector<float>& channel(uint16_t channel) const { return channels_[channel]; }

    /// Frame-major copy (L R L R ...)
    std::vector<float> interleaved() const;

    /// Largest absolute sample over all channels
    float peak() const;

    /// True when no sample is NaN or infinite
    bool all_finite() const;

    /// Clamp every sample to [-1, 1] in place
    void clamp_to_unit();

    /// Copy of frames [first, first + count) from every channel
    SignalBuffer slice(size_t first, size_t count) const;

private:
    SignalBuffer(std::vector<std::vector<float>> channels, uint32_t sample_rate)
        : channels_(std::move(channels)), sample_rate_(sample_rate) {}

    std::vector<std::vector<float>> channels_;
    uint32_t sample_rate_ = 0;
};

} // namespace ac::audio
