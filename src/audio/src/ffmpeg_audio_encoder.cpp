/**
 * @file ffmpeg_audio_encoder.cpp
 * @brief FFmpeg audio encoder implementation (in-memory container output)
 */

#include "audio/ffmpeg_audio_encoder.hpp"
#include "core/log.hpp"
#include "audio/ffmpeg_utils.hpp"
#include "memory_io.hpp"
#include <algorithm>
#include <unordered_map>

extern "C" {
#include <libavutil/channel_layout.h>
#include <libavutil/opt.h>
}

namespace ac::audio {

namespace {

// Frames per packet for codecs without a fixed frame size (PCM)
constexpr int kVariableFrameSize = 4096;

// Fallback codec chains for broader compatibility
const std::unordered_map<AudioFormat, std::vector<std::string>> CODEC_FALLBACKS = {
    {AudioFormat::MP3, {"libmp3lame", "mp3_mf"}},
    {AudioFormat::M4A, {"aac", "libfdk_aac"}},
    {AudioFormat::FLAC, {"flac"}},
    {AudioFormat::OGG, {"libvorbis", "vorbis"}}
};

std::vector<std::string> codec_candidates(AudioFormat format, uint32_t bit_depth) {
    if (format == AudioFormat::WAV) {
        switch (bit_depth) {
            case 24: return {"pcm_s24le"};
            case 32: return {"pcm_f32le"};
            default: return {"pcm_s16le"};
        }
    }
    auto it = CODEC_FALLBACKS.find(format);
    return it != CODEC_FALLBACKS.end() ? it->second : std::vector<std::string>{};
}

const AVCodec* find_encoder(AudioFormat format, uint32_t bit_depth) {
    for (const auto& name : codec_candidates(format, bit_depth)) {
        if (const AVCodec* codec = avcodec_find_encoder_by_name(name.c_str())) {
            return codec;
        }
    }
    return nullptr;
}

Result<bool> validate_options(const EncodeOptions& options) {
    switch (options.format) {
        case AudioFormat::WAV:
            if (options.bit_depth != 16 && options.bit_depth != 24 && options.bit_depth != 32) {
                return fail(ErrorKind::InvalidParameter,
                            "WAV bit depth must be 16, 24 or 32, got " + std::to_string(options.bit_depth));
            }
            return true;
        case AudioFormat::FLAC:
            if (options.bit_depth != 16 && options.bit_depth != 24) {
                return fail(ErrorKind::InvalidParameter,
                            "FLAC bit depth must be 16 or 24, got " + std::to_string(options.bit_depth));
            }
            return true;
        case AudioFormat::MP3:
        case AudioFormat::OGG:
        case AudioFormat::M4A:
            if (!is_valid_lossy_bitrate(options.bitrate_kbps)) {
                return fail(ErrorKind::InvalidParameter,
                            "unsupported bitrate " + std::to_string(options.bitrate_kbps) +
                            "k for " + format_to_string(options.format));
            }
            return true;
    }
    return fail(ErrorKind::UnsupportedFormat, "unknown target format");
}

// Codec capability lists moved behind avcodec_get_supported_config() in libavcodec 61.
std::vector<int> supported_sample_rates(const AVCodecContext* ctx, const AVCodec* codec) {
    std::vector<int> rates;
#if LIBAVCODEC_VERSION_INT >= AV_VERSION_INT(61, 13, 100)
    const void* configs = nullptr;
    int count = 0;
    if (avcodec_get_supported_config(ctx, codec, AV_CODEC_CONFIG_SAMPLE_RATE, 0, &configs, &count) >= 0 && configs) {
        const int* list = static_cast<const int*>(configs);
        rates.assign(list, list + count);
    }
#else
    (void)ctx;
    for (const int* p = codec->supported_samplerates; p && *p; ++p) {
        rates.push_back(*p);
    }
#endif
    return rates;
}

std::vector<AVSampleFormat> supported_sample_formats(const AVCodecContext* ctx, const AVCodec* codec) {
    std::vector<AVSampleFormat> formats;
#if LIBAVCODEC_VERSION_INT >= AV_VERSION_INT(61, 13, 100)
    const void* configs = nullptr;
    int count = 0;
    if (avcodec_get_supported_config(ctx, codec, AV_CODEC_CONFIG_SAMPLE_FORMAT, 0, &configs, &count) >= 0 && configs) {
        const AVSampleFormat* list = static_cast<const AVSampleFormat*>(configs);
        formats.assign(list, list + count);
    }
#else
    (void)ctx;
    for (const AVSampleFormat* p = codec->sample_fmts; p && *p != AV_SAMPLE_FMT_NONE; ++p) {
        formats.push_back(*p);
    }
#endif
    return formats;
}

AVSampleFormat choose_sample_format(const std::vector<AVSampleFormat>& supported, AVSampleFormat preferred) {
    if (supported.empty()) {
        return preferred;
    }
    for (AVSampleFormat wanted : {preferred, AV_SAMPLE_FMT_FLTP, AV_SAMPLE_FMT_FLT}) {
        if (std::find(supported.begin(), supported.end(), wanted) != supported.end()) {
            return wanted;
        }
    }
    return supported.front();
}

AVSampleFormat preferred_sample_format(const EncodeOptions& options) {
    if (!is_lossless(options.format)) {
        return AV_SAMPLE_FMT_FLTP;
    }
    switch (options.bit_depth) {
        case 24: return AV_SAMPLE_FMT_S32;
        case 32: return AV_SAMPLE_FMT_FLT;
        default: return AV_SAMPLE_FMT_S16;
    }
}

} // anonymous namespace

FFmpegAudioEncoder::FFmpegAudioEncoder() = default;

FFmpegAudioEncoder::~FFmpegAudioEncoder() {
    cleanup();
}

Result<std::unique_ptr<FFmpegAudioEncoder>> FFmpegAudioEncoder::create(
    const EncodeOptions& options,
    uint32_t sample_rate,
    uint16_t channels) {

    auto valid = validate_options(options);
    if (!valid) {
        return make_unexpected(std::move(valid).error());
    }
    if (sample_rate == 0 || channels == 0 || channels > kMaxChannels) {
        return fail(ErrorKind::InvalidParameter, "invalid stream layout: " + std::to_string(channels) +
                    " channels at " + std::to_string(sample_rate) + " Hz");
    }

    const AVCodec* codec = find_encoder(options.format, options.bit_depth);
    if (!codec) {
        ac::log::error("No encoder available for format: " + format_to_string(options.format));
        return fail(ErrorKind::UnsupportedFormat,
                    "no encoder available for " + format_to_string(options.format));
    }

    auto encoder = std::unique_ptr<FFmpegAudioEncoder>(new FFmpegAudioEncoder());
    encoder->options_ = options;
    encoder->codec_name_ = codec->name;

    auto init = encoder->init_encoder(codec, sample_rate, channels);
    if (!init) {
        return make_unexpected(std::move(init).error());
    }
    auto output = encoder->init_output();
    if (!output) {
        return make_unexpected(std::move(output).error());
    }
    auto resampler = encoder->init_resampler();
    if (!resampler) {
        return make_unexpected(std::move(resampler).error());
    }

    ac::log::debug("Audio encoder initialized: " + encoder->codec_name_ + " @ " +
                   std::to_string(sample_rate) + " Hz, " + std::to_string(channels) + " ch");
    return std::move(encoder);
}

Result<bool> FFmpegAudioEncoder::init_encoder(const AVCodec* codec, uint32_t sample_rate, uint16_t channels) {
    codec_ctx_ = avcodec_alloc_context3(codec);
    if (!codec_ctx_) {
        return fail(ErrorKind::ProcessingError, "failed to allocate codec context");
    }

    auto rates = supported_sample_rates(codec_ctx_, codec);
    if (!rates.empty() &&
        std::find(rates.begin(), rates.end(), static_cast<int>(sample_rate)) == rates.end()) {
        return fail(ErrorKind::InvalidParameter,
                    std::string(codec->name) + " cannot encode at " + std::to_string(sample_rate) + " Hz");
    }

    codec_ctx_->sample_rate = static_cast<int>(sample_rate);
    av_channel_layout_default(&codec_ctx_->ch_layout, channels);
    codec_ctx_->sample_fmt = choose_sample_format(supported_sample_formats(codec_ctx_, codec),
                                                  preferred_sample_format(options_));
    codec_ctx_->time_base = AVRational{1, static_cast<int>(sample_rate)};

    if (is_lossless(options_.format)) {
        if (options_.format == AudioFormat::FLAC || options_.bit_depth == 24) {
            codec_ctx_->bits_per_raw_sample = static_cast<int>(options_.bit_depth);
        }
    } else {
        codec_ctx_->bit_rate = static_cast<int64_t>(options_.bitrate_kbps) * 1000;
    }
    if (codec_name_ == "vorbis") {
        codec_ctx_->strict_std_compliance = FF_COMPLIANCE_EXPERIMENTAL;
    }

    const AVOutputFormat* oformat = av_guess_format(muxer_name(options_.format), nullptr, nullptr);
    if (oformat && (oformat->flags & AVFMT_GLOBALHEADER)) {
        codec_ctx_->flags |= AV_CODEC_FLAG_GLOBAL_HEADER;
    }

    int ret = avcodec_open2(codec_ctx_, codec, nullptr);
    if (ret < 0) {
        ac::log::error("Failed to open codec " + codec_name_ + ": " + ffmpeg_error_string(ret));
        return fail(ErrorKind::InvalidParameter,
                    codec_name_ + " rejected the stream parameters: " + ffmpeg_error_string(ret));
    }

    frame_size_ = codec_ctx_->frame_size > 0 ? codec_ctx_->frame_size : kVariableFrameSize;
    pad_last_frame_ = codec_ctx_->frame_size > 0 &&
        !(codec->capabilities & (AV_CODEC_CAP_SMALL_LAST_FRAME | AV_CODEC_CAP_VARIABLE_FRAME_SIZE));

    packet_ = av_packet_alloc();
    frame_ = av_frame_alloc();
    if (!packet_ || !frame_) {
        return fail(ErrorKind::ProcessingError, "failed to allocate packet/frame");
    }
    return true;
}

Result<bool> FFmpegAudioEncoder::init_output() {
    int ret = avformat_alloc_output_context2(&format_ctx_, nullptr, muxer_name(options_.format), nullptr);
    if (ret < 0 || !format_ctx_) {
        return fail(ErrorKind::UnsupportedFormat,
                    std::string("muxer unavailable: ") + muxer_name(options_.format));
    }

    stream_ = avformat_new_stream(format_ctx_, nullptr);
    if (!stream_) {
        return fail(ErrorKind::ProcessingError, "failed to create output stream");
    }
    ret = avcodec_parameters_from_context(stream_->codecpar, codec_ctx_);
    if (ret < 0) {
        return fail(ErrorKind::ProcessingError, "failed to copy codec parameters: " + ffmpeg_error_string(ret));
    }
    stream_->time_base = codec_ctx_->time_base;

    writer_ = std::make_unique<detail::MemoryWriter>();
    avio_ctx_ = detail::open_write_context(writer_.get());
    if (!avio_ctx_) {
        return fail(ErrorKind::ProcessingError, "failed to allocate output I/O context");
    }
    format_ctx_->pb = avio_ctx_;
    format_ctx_->flags |= AVFMT_FLAG_CUSTOM_IO;

    ret = avformat_write_header(format_ctx_, nullptr);
    if (ret < 0) {
        ac::log::error("Failed to write format header: " + ffmpeg_error_string(ret));
        return fail(ErrorKind::ProcessingError, "failed to write container header");
    }
    return true;
}

Result<bool> FFmpegAudioEncoder::init_resampler() {
    AVChannelLayout layout{};
    av_channel_layout_default(&layout, codec_ctx_->ch_layout.nb_channels);

    int ret = swr_alloc_set_opts2(&swr_ctx_,
                                  &codec_ctx_->ch_layout, codec_ctx_->sample_fmt, codec_ctx_->sample_rate,
                                  &layout, AV_SAMPLE_FMT_FLTP, codec_ctx_->sample_rate,
                                  0, nullptr);
    av_channel_layout_uninit(&layout);
    if (ret < 0 || !swr_ctx_) {
        return fail(ErrorKind::ProcessingError, "failed to configure sample converter: " + ffmpeg_error_string(ret));
    }
    ret = swr_init(swr_ctx_);
    if (ret < 0) {
        return fail(ErrorKind::ProcessingError, "failed to initialize sample converter: " + ffmpeg_error_string(ret));
    }
    return true;
}

Result<bool> FFmpegAudioEncoder::send_frame(const SignalBuffer& buffer, size_t offset, size_t count) {
    int nb_samples = (pad_last_frame_ && count < static_cast<size_t>(frame_size_))
        ? frame_size_ : static_cast<int>(count);

    av_frame_unref(frame_);
    frame_->nb_samples = nb_samples;
    frame_->format = codec_ctx_->sample_fmt;
    frame_->sample_rate = codec_ctx_->sample_rate;
    int ret = av_channel_layout_copy(&frame_->ch_layout, &codec_ctx_->ch_layout);
    if (ret >= 0) {
        ret = av_frame_get_buffer(frame_, 0);
    }
    if (ret < 0) {
        return fail(ErrorKind::ProcessingError, "failed to allocate frame buffer: " + ffmpeg_error_string(ret));
    }

    // Short final chunk is zero-padded to the codec's fixed frame size.
    std::vector<std::vector<float>> padded;
    std::vector<const uint8_t*> in_ptrs(buffer.channel_count());
    if (static_cast<size_t>(nb_samples) != count) {
        padded.assign(buffer.channel_count(), std::vector<float>(static_cast<size_t>(nb_samples), 0.0f));
        for (uint16_t ch = 0; ch < buffer.channel_count(); ++ch) {
            std::copy_n(buffer.channel_data(ch) + offset, count, padded[ch].begin());
            in_ptrs[ch] = reinterpret_cast<const uint8_t*>(padded[ch].data());
        }
    } else {
        for (uint16_t ch = 0; ch < buffer.channel_count(); ++ch) {
            in_ptrs[ch] = reinterpret_cast<const uint8_t*>(buffer.channel_data(ch) + offset);
        }
    }

    int converted = swr_convert(swr_ctx_, frame_->extended_data, nb_samples, in_ptrs.data(), nb_samples);
    if (converted != nb_samples) {
        return fail(ErrorKind::ProcessingError, "sample conversion produced " + std::to_string(converted) +
                    " of " + std::to_string(nb_samples) + " samples");
    }

    frame_->pts = samples_written_;
    samples_written_ += nb_samples;

    ret = avcodec_send_frame(codec_ctx_, frame_);
    if (ret < 0) {
        ac::log::error("Failed to send frame to encoder: " + ffmpeg_error_string(ret));
        return fail(ErrorKind::ProcessingError, "encoder rejected frame: " + ffmpeg_error_string(ret));
    }
    return receive_packets();
}

Result<bool> FFmpegAudioEncoder::receive_packets() {
    while (true) {
        int ret = avcodec_receive_packet(codec_ctx_, packet_);
        if (ret == AVERROR(EAGAIN) || ret == AVERROR_EOF) {
            return true;
        }
        if (ret < 0) {
            return fail(ErrorKind::ProcessingError, "error during encoding: " + ffmpeg_error_string(ret));
        }

        packet_->stream_index = stream_->index;
        av_packet_rescale_ts(packet_, codec_ctx_->time_base, stream_->time_base);

        ret = av_interleaved_write_frame(format_ctx_, packet_);
        av_packet_unref(packet_);
        if (ret < 0) {
            return fail(ErrorKind::ProcessingError, "failed to write packet: " + ffmpeg_error_string(ret));
        }
    }
}

Result<std::vector<uint8_t>> FFmpegAudioEncoder::encode(const SignalBuffer& buffer) {
    if (finished_) {
        return fail(ErrorKind::ProcessingError, "encoder already finalized");
    }
    if (buffer.empty()) {
        return fail(ErrorKind::EmptyInput, "cannot encode an empty buffer");
    }
    if (static_cast<int>(buffer.sample_rate()) != codec_ctx_->sample_rate ||
        static_cast<int>(buffer.channel_count()) != codec_ctx_->ch_layout.nb_channels) {
        return fail(ErrorKind::InvalidParameter, "buffer layout does not match encoder configuration");
    }
    finished_ = true;

    const size_t total = buffer.frame_count();
    for (size_t offset = 0; offset < total; offset += static_cast<size_t>(frame_size_)) {
        size_t count = std::min(static_cast<size_t>(frame_size_), total - offset);
        auto sent = send_frame(buffer, offset, count);
        if (!sent) {
            return make_unexpected(std::move(sent).error());
        }
    }

    // Flush encoder
    int ret = avcodec_send_frame(codec_ctx_, nullptr);
    if (ret < 0) {
        return fail(ErrorKind::ProcessingError, "failed to flush encoder: " + ffmpeg_error_string(ret));
    }
    auto flushed = receive_packets();
    if (!flushed) {
        return make_unexpected(std::move(flushed).error());
    }

    ret = av_write_trailer(format_ctx_);
    if (ret < 0) {
        return fail(ErrorKind::ProcessingError, "failed to write trailer: " + ffmpeg_error_string(ret));
    }
    avio_flush(avio_ctx_);

    ac::log::debug("Encoded " + std::to_string(total) + " frames with " + codec_name_ + " -> " +
                   std::to_string(writer_->bytes.size()) + " bytes");
    return std::move(writer_->bytes);
}

void FFmpegAudioEncoder::cleanup() {
    if (swr_ctx_) {
        swr_free(&swr_ctx_);
    }
    if (frame_) {
        av_frame_free(&frame_);
    }
    if (packet_) {
        av_packet_free(&packet_);
    }
    if (codec_ctx_) {
        avcodec_free_context(&codec_ctx_);
    }
    if (format_ctx_) {
        avformat_free_context(format_ctx_);
        format_ctx_ = nullptr;
        stream_ = nullptr;
    }
    detail::close_context(&avio_ctx_);
}

Result<std::vector<uint8_t>> encode(const SignalBuffer& buffer, const EncodeOptions& options) {
    if (buffer.empty()) {
        return fail(ErrorKind::EmptyInput, "cannot encode an empty buffer");
    }
    auto encoder = FFmpegAudioEncoder::create(options, buffer.sample_rate(), buffer.channel_count());
    if (!encoder) {
        return make_unexpected(std::move(encoder).error());
    }
    return encoder.value()->encode(buffer);
}

bool is_format_available(AudioFormat format) {
    return find_encoder(format, 16) != nullptr;
}

} // namespace ac::audio
