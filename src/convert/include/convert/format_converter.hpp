#pragma once

#include "audio/audio_format.hpp"
#include "audio/ffmpeg_audio_encoder.hpp"
#include "audio/signal_buffer.hpp"
#include "core/error.hpp"
#include <cstdint>
#include <optional>
#include <vector>

namespace ac::convert {

struct ConverterLimits {
    uint32_t min_sample_rate{8000};
    uint32_t max_sample_rate{192000};
    uint32_t default_bitrate_kbps{audio::kDefaultBitrateKbps};
};

struct ConversionOptions {
    audio::AudioFormat target_format{audio::AudioFormat::WAV};
    std::optional<uint32_t> bitrate_kbps;   ///< Lossy only; default_bitrate_kbps when unset
    std::optional<uint32_t> sample_rate;    ///< Resample when set and different
    uint32_t bit_depth{16};                 ///< Lossless only
};

/**
 * @brief Resample (if requested) and encode a buffer
 *
 * A bitrate given for a lossless target is ignored. A lossy bitrate
 * outside kLossyBitrates, or a sample rate outside the limits, fails
 * with InvalidParameter before any work is done.
 */
class FormatConverter {
public:
    explicit FormatConverter(ConverterLimits limits = {});

    Result<std::vector<uint8_t>> convert(const audio::SignalBuffer& buffer,
                                         const ConversionOptions& options) const;

    /// Encoder options derived from conversion options, after validation
    Result<audio::EncodeOptions> resolve(const ConversionOptions& options) const;

    const ConverterLimits& limits() const { return limits_; }

private:
    ConverterLimits limits_;
};

/// FormatConverter(limits).convert(buffer, options)
Result<std::vector<uint8_t>> convert(const audio::SignalBuffer& buffer, const ConversionOptions& options,
                                     const ConverterLimits& limits = {});

} // namespace ac::convert
