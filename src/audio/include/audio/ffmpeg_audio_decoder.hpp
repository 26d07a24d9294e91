#pragma once

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
struct MemoryReader;
}

/**
 * @brief Container/stream description of an encoded input
 */
struct MediaInfo {
    std::string format_name;        ///< Demuxer short name ("wav", "mp3", "mov,mp4,m4a,...")
    std::string codec_name;         ///< Audio decoder name ("pcm_s16le", "flac", ...)
    double duration_seconds = 0.0;  ///< Container duration, 0 when unknown
    uint16_t channels = 0;
    uint32_t sample_rate = 0;
    uint32_t bit_depth = 0;         ///< Bits per raw sample, 0 for lossy codecs
    size_t byte_size = 0;           ///< Size of the encoded input
};

/**
 * @brief FFmpeg-based decoder over an in-memory encoded file
 *
 * Demuxes the first audio stream and converts every decoded frame to
 * planar float at the stream's native rate and channel count. The core
 * performs no resampling on ingest.
 *
 * The decoder reads directly from the caller's byte vector, which must
 * outlive the decoder instance.
 */
class FFmpegAudioDecoder {
public:
    /**
     * @brief Open the container and the audio decoder
     *
     * @param bytes Encoded file contents
     * @param format_hint Preferred demuxer ("mp3", "wav", "m4a", ...);
     *        content probing is used when empty or when the hint fails
     * @return UnsupportedFormat when no container/codec can be opened,
     *         CorruptData when the container parses but is inconsistent
     */
    static Result<std::unique_ptr<FFmpegAudioDecoder>> open(const std::vector<uint8_t>& bytes,
                                                            const std::string& format_hint);

    ~FFmpegAudioDecoder();

    FFmpegAudioDecoder(const FFmpegAudioDecoder&) = delete;
    FFmpegAudioDecoder& operator=(const FFmpegAudioDecoder&) = delete;

    const MediaInfo& info() const { return info_; }

    /**
     * @brief Decode the whole stream into a SignalBuffer
     * @return CorruptData on invalid packets, non-finite samples or zero decoded frames
     */
    Result<SignalBuffer> decode_all();

private:
    FFmpegAudioDecoder();

    Result<bool> open_input(const std::string& format_hint);
    Result<bool> open_codec();
    Result<bool> init_resampler(const AVFrame* frame);
    Result<bool> append_frame(const AVFrame* frame);
    Result<bool> drain_decoder();
    Result<bool> drain_resampler();
    void cleanup();

    std::unique_ptr<detail::MemoryReader> reader_;
    AVIOContext* avio_ctx_ = nullptr;
    AVFormatContext* format_ctx_ = nullptr;
    AVCodecContext* codec_ctx_ = nullptr;
    SwrContext* swr_ctx_ = nullptr;
    AVPacket* packet_ = nullptr;
    AVFrame* frame_ = nullptr;
    int stream_index_ = -1;

    MediaInfo info_;
    std::vector<std::vector<float>> channels_;
};

/**
 * @brief Decode an encoded file into a SignalBuffer
 *
 * Same as FFmpegAudioDecoder::open() followed by decode_all().
 * An empty byte vector fails with UnsupportedFormat.
 */
Result<SignalBuffer> decode(const std::vector<uint8_t>& bytes, const std::string& format_hint = "");

/**
 * @brief Read container/stream metadata without decoding samples
 */
Result<MediaInfo> probe(const std::vector<uint8_t>& bytes, const std::string& format_hint = "");

} // namespace ac::audio
