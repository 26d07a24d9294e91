#include "audio/signal_buffer.hpp"
#include <algorithm>
#include <cmath>
#include <string>

namespace ac::audio {

namespace {

Result<bool> validate_layout(size_t channel_count, uint32_t sample_rate) {
    if (channel_count == 0 || channel_count > kMaxChannels) {
        return fail(ErrorKind::InvalidParameter,
                    "channel count " + std::to_string(channel_count) + " outside 1.." +
                    std::to_string(kMaxChannels));
    }
    if (sample_rate == 0) {
        return fail(ErrorKind::InvalidParameter, "sample rate must be positive");
    }
    return true;
}

} // anonymous namespace

Result<SignalBuffer> SignalBuffer::create(std::vector<std::vector<float>> channels,
                                          uint32_t sample_rate) {
    auto layout = validate_layout(channels.size(), sample_rate);
    if (!layout) {
        return make_unexpected(std::move(layout).error());
    }

    const size_t frames = channels.front().size();
    for (size_t ch = 0; ch < channels.size(); ++ch) {
        if (channels[ch].size() != frames) {
            return fail(ErrorKind::InvalidParameter,
                        "channel " + std::to_string(ch) + " has " +
                        std::to_string(channels[ch].size()) + " frames, expected " +
                        std::to_string(frames));
        }
        for (float s : channels[ch]) {
            if (!std::isfinite(s) || s < -1.0f || s > 1.0f) {
                return fail(ErrorKind::InvalidParameter,
                            "sample outside [-1, 1] or non-finite in channel " + std::to_string(ch));
            }
        }
    }

    return SignalBuffer(std::move(channels), sample_rate);
}

Result<SignalBuffer> SignalBuffer::silence(uint16_t channel_count, size_t frame_count,
                                           uint32_t sample_rate) {
    auto layout = validate_layout(channel_count, sample_rate);
    if (!layout) {
        return make_unexpected(std::move(layout).error());
    }
    return SignalBuffer(std::vector<std::vector<float>>(channel_count, std::vector<float>(frame_count, 0.0f)),
                        sample_rate);
}

Result<SignalBuffer> SignalBuffer::from_interleaved(const std::vector<float>& interleaved,
                                                    uint16_t channel_count,
                                                    uint32_t sample_rate) {
    auto layout = validate_layout(channel_count, sample_rate);
    if (!layout) {
        return make_unexpected(std::move(layout).error());
    }
    if (interleaved.size() % channel_count != 0) {
        return fail(ErrorKind::CorruptData, "interleaved sample count is not a multiple of the channel count");
    }

    const size_t frames = interleaved.size() / channel_count;
    std::vector<std::vector<float>> channels(channel_count, std::vector<float>(frames));
    for (size_t i = 0; i < frames; ++i) {
        for (uint16_t ch = 0; ch < channel_count; ++ch) {
            float s = interleaved[i * channel_count + ch];
            if (!std::isfinite(s)) {
                return fail(ErrorKind::CorruptData, "non-finite sample at frame " + std::to_string(i));
            }
            channels[ch][i] = std::clamp(s, -1.0f, 1.0f);
        }
    }
    return SignalBuffer(std::move(channels), sample_rate);
}

double SignalBuffer::duration_seconds() const {
    if (sample_rate_ == 0) return 0.0;
    return static_cast<double>(frame_count()) / static_cast<double>(sample_rate_);
}

std::vector<float> SignalBuffer::interleaved() const {
    const size_t frames = frame_count();
    const size_t channels = channels_.size();
    std::vector<float> out(frames * channels);
    for (size_t i = 0; i < frames; ++i) {
        for (size_t ch = 0; ch < channels; ++ch) {
            out[i * channels + ch] = channels_[ch][i];
        }
    }
    return out;
}

float SignalBuffer::peak() const {
    float peak = 0.0f;
    for (const auto& ch : channels_) {
        for (float s : ch) {
            peak = std::max(peak, std::abs(s));
        }
    }
    return peak;
}

bool SignalBuffer::all_finite() const {
    for (const auto& ch : channels_) {
        for (float s : ch) {
            if (!std::isfinite(s)) return false;
        }
    }
    return true;
}

void SignalBuffer::clamp_to_unit() {
    for (auto& ch : channels_) {
        for (float& s : ch) {
            s = std::clamp(s, -1.0f, 1.0f);
        }
    }
}

SignalBuffer SignalBuffer::slice(size_t first, size_t count) const {
    const size_t frames = frame_count();
    first = std::min(first, frames);
    count = std::min(count, frames - first);

    std::vector<std::vector<float>> channels;
    channels.reserve(channels_.size());
    for (const auto& ch : channels_) {
        channels.emplace_back(ch.begin() + static_cast<std::ptrdiff_t>(first),
                              ch.begin() + static_cast<std::ptrdiff_t>(first + count));
    }
    return SignalBuffer(std::move(channels), sample_rate_);
}

} // namespace ac::audio
