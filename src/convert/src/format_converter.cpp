#include "convert/format_converter.hpp"
#include "core/log.hpp"
#include "dsp/resampler.hpp"

namespace ac::convert {

FormatConverter::FormatConverter(ConverterLimits limits) : limits_(limits) {}

Result<audio::EncodeOptions> FormatConverter::resolve(const ConversionOptions& options) const {
    audio::EncodeOptions encode;
    encode.format = options.target_format;
    encode.bit_depth = options.bit_depth;

    if (options.sample_rate) {
        uint32_t rate = *options.sample_rate;
        if (rate < limits_.min_sample_rate || rate > limits_.max_sample_rate) {
            return fail(ErrorKind::InvalidParameter,
                        "sample rate " + std::to_string(rate) + " Hz outside " +
                        std::to_string(limits_.min_sample_rate) + ".." +
                        std::to_string(limits_.max_sample_rate));
        }
    }

    if (!audio::is_lossless(options.target_format)) {
        encode.bitrate_kbps = options.bitrate_kbps.value_or(limits_.default_bitrate_kbps);
        if (!audio::is_valid_lossy_bitrate(encode.bitrate_kbps)) {
            return fail(ErrorKind::InvalidParameter,
                        "bitrate " + std::to_string(encode.bitrate_kbps) + "k not one of 128k, 192k, 256k, 320k");
        }
    } else if (options.bitrate_kbps) {
        ac::log::debug("Ignoring bitrate for lossless target " + audio::format_to_string(options.target_format));
    }
    return encode;
}

Result<std::vector<uint8_t>> FormatConverter::convert(const audio::SignalBuffer& buffer,
                                                      const ConversionOptions& options) const {
    if (buffer.empty()) {
        return fail(ErrorKind::EmptyInput, "cannot convert an empty buffer");
    }
    auto encode_options = resolve(options);
    if (!encode_options) {
        return make_unexpected(std::move(encode_options).error());
    }

    if (options.sample_rate && *options.sample_rate != buffer.sample_rate()) {
        auto resampled = dsp::resample(buffer, *options.sample_rate);
        if (!resampled) {
            return make_unexpected(std::move(resampled).error());
        }
        return audio::encode(*resampled, *encode_options);
    }
    return audio::encode(buffer, *encode_options);
}

Result<std::vector<uint8_t>> convert(const audio::SignalBuffer& buffer, const ConversionOptions& options,
                                     const ConverterLimits& limits) {
    return FormatConverter(limits).convert(buffer, options);
}

} // namespace ac::convert
