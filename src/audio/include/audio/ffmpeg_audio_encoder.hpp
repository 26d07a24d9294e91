/**
 * @file ffmpeg_audio_encoder.hpp
 * @brief FFmpeg audio encoder writing complete container files into memory
 *
 * Supported targets:
 * - WAV: pcm_s16le / pcm_s24le / pcm_f32le chosen by bit depth
 * - FLAC: 16 or 24 bit lossless
 * - MP3: libmp3lame
 * - OGG: libvorbis, falling back to FFmpeg's native vorbis
 * - M4A: FFmpeg aac, falling back to libfdk_aac
 */

#pragma once

#include "audio/audio_format.hpp"
#include "audio/signal_buffer.hpp"
#include "core/error.hpp"
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/avutil.h>
#include <libswresample/swresample.h>
}

namespace ac::audio {

namespace detail {
struct MemoryWriter;
}

/**
 * @brief Encoder settings
 *
 * bitrate_kbps applies to lossy targets only and must be one of
 * kLossyBitrates. bit_depth applies to lossless targets only:
 * WAV accepts 16, 24 and 32 (IEEE float); FLAC accepts 16 and 24.
 */
struct EncodeOptions {
    AudioFormat format = AudioFormat::WAV;
    uint32_t bitrate_kbps = kDefaultBitrateKbps;
    uint32_t bit_depth = 16;
};

/**
 * @brief One-shot FFmpeg encoder for a single SignalBuffer
 *
 * create() validates options, selects the first available encoder for the
 * target and writes the container header into an in-memory sink.
 * encode() consumes the whole buffer, flushes the codec and returns the
 * finished file. An instance encodes exactly one buffer.
 */
class FFmpegAudioEncoder {
public:
    /**
     * @return InvalidParameter for a bad bitrate/bit depth or a sample rate the
     *         codec cannot encode, UnsupportedFormat if no encoder is available
     */
    static Result<std::unique_ptr<FFmpegAudioEncoder>> create(const EncodeOptions& options,
                                                              uint32_t sample_rate,
                                                              uint16_t channels);

    ~FFmpegAudioEncoder();

    FFmpegAudioEncoder(const FFmpegAudioEncoder&) = delete;
    FFmpegAudioEncoder& operator=(const FFmpegAudioEncoder&) = delete;

    /// Encode all frames of buffer; rate and channel count must match create()
    Result<std::vector<uint8_t>> encode(const SignalBuffer& buffer);

    /// Name of the selected FFmpeg encoder ("pcm_s16le", "libmp3lame", ...)
    const std::string& codec_name() const { return codec_name_; }

private:
    FFmpegAudioEncoder();

    Result<bool> init_encoder(const AVCodec* codec, uint32_t sample_rate, uint16_t channels);
    Result<bool> init_output();
    Result<bool> init_resampler();
    Result<bool> send_frame(const SignalBuffer& buffer, size_t offset, size_t count);
    Result<bool> receive_packets();
    void cleanup();

    EncodeOptions options_;
    std::string codec_name_;
    std::unique_ptr<detail::MemoryWriter> writer_;

    AVIOContext* avio_ctx_ = nullptr;
    AVFormatContext* format_ctx_ = nullptr;
    AVCodecContext* codec_ctx_ = nullptr;
    AVStream* stream_ = nullptr;
    SwrContext* swr_ctx_ = nullptr;
    AVPacket* packet_ = nullptr;
    AVFrame* frame_ = nullptr;

    int frame_size_ = 0;
    bool pad_last_frame_ = true;
    int64_t samples_written_ = 0;
    bool finished_ = false;
};

/**
 * @brief Encode a buffer into a complete file of the requested format
 * @return EmptyInput for a zero-frame buffer, otherwise as FFmpegAudioEncoder::create()
 */
Result<std::vector<uint8_t>> encode(const SignalBuffer& buffer, const EncodeOptions& options);

/// True when this FFmpeg build carries an encoder for the format
bool is_format_available(AudioFormat format);

} // namespace ac::audio
