#include "audio/ffmpeg_audio_decoder.hpp"
#include "core/log.hpp"
#include "audio/ffmpeg_utils.hpp"
#include "memory_io.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstring>

extern "C" {
#include <libavutil/channel_layout.h>
}

namespace ac::audio {

namespace {

// Hint -> demuxer short name. Unknown hints fall through to content probing.
const char* demuxer_for_hint(const std::string& hint) {
    std::string h;
    for (char c : hint) {
        if (c == '.' && h.empty()) continue;
        h.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    if (h == "mp3") return "mp3";
    if (h == "wav" || h == "wave") return "wav";
    if (h == "ogg" || h == "oga") return "ogg";
    if (h == "flac") return "flac";
    if (h == "m4a" || h == "mp4") return "mov";
    if (h == "aac") return "aac";
    if (h == "webm") return "matroska";
    return nullptr;
}

uint32_t read_le32(const uint8_t* p) {
    return static_cast<uint32_t>(p[0]) | (static_cast<uint32_t>(p[1]) << 8) |
           (static_cast<uint32_t>(p[2]) << 16) | (static_cast<uint32_t>(p[3]) << 24);
}

// The wav demuxer tolerates a data chunk that claims more bytes than the file
// holds and silently decodes the remainder. A declared size that overruns
// the input is reported as truncation instead.
Result<bool> check_riff_data_chunk(const std::vector<uint8_t>& bytes) {
    if (bytes.size() < 12 || std::memcmp(bytes.data(), "RIFF", 4) != 0 ||
        std::memcmp(bytes.data() + 8, "WAVE", 4) != 0) {
        return true;
    }
    size_t pos = 12;
    while (pos + 8 <= bytes.size()) {
        const uint8_t* header = bytes.data() + pos;
        uint32_t chunk_size = read_le32(header + 4);
        size_t remaining = bytes.size() - pos - 8;
        if (std::memcmp(header, "data", 4) == 0) {
            if (chunk_size != 0xFFFFFFFFu && chunk_size > remaining) {
                return fail(ErrorKind::CorruptData,
                            "WAV data chunk declares " + std::to_string(chunk_size) +
                            " bytes but only " + std::to_string(remaining) + " are present");
            }
            return true;
        }
        if (chunk_size > remaining) {
            return fail(ErrorKind::CorruptData, "WAV header chunk extends past end of input");
        }
        pos += 8 + chunk_size + (chunk_size & 1u);
    }
    // No data chunk: the demuxer rejects this on its own.
    return true;
}

void normalize_layout(AVChannelLayout* layout, int channels) {
    if (layout->order == AV_CHANNEL_ORDER_UNSPEC || layout->nb_channels != channels) {
        av_channel_layout_uninit(layout);
        av_channel_layout_default(layout, channels);
    }
}

} // anonymous namespace

FFmpegAudioDecoder::FFmpegAudioDecoder() = default;

FFmpegAudioDecoder::~FFmpegAudioDecoder() {
    cleanup();
}

Result<std::unique_ptr<FFmpegAudioDecoder>> FFmpegAudioDecoder::open(
    const std::vector<uint8_t>& bytes,
    const std::string& format_hint) {

    if (bytes.empty()) {
        return fail(ErrorKind::UnsupportedFormat, "input is empty");
    }

    auto riff = check_riff_data_chunk(bytes);
    if (!riff) {
        return make_unexpected(std::move(riff).error());
    }

    auto decoder = std::unique_ptr<FFmpegAudioDecoder>(new FFmpegAudioDecoder());
    decoder->reader_ = std::make_unique<detail::MemoryReader>();
    decoder->reader_->data = bytes.data();
    decoder->reader_->size = bytes.size();
    decoder->info_.byte_size = bytes.size();

    auto opened = decoder->open_input(format_hint);
    if (!opened) {
        return make_unexpected(std::move(opened).error());
    }

    auto codec = decoder->open_codec();
    if (!codec) {
        return make_unexpected(std::move(codec).error());
    }

    return std::move(decoder);
}

Result<bool> FFmpegAudioDecoder::open_input(const std::string& format_hint) {
    // Try the hinted demuxer first, then let FFmpeg probe the content.
    const AVInputFormat* hinted = nullptr;
    if (const char* name = demuxer_for_hint(format_hint)) {
        hinted = av_find_input_format(name);
    }

    const AVInputFormat* attempts[2] = {hinted, nullptr};
    int last_error = 0;
    for (int i = hinted ? 0 : 1; i < 2; ++i) {
        reader_->pos = 0;
        detail::close_context(&avio_ctx_);
        avio_ctx_ = detail::open_read_context(reader_.get());
        format_ctx_ = avformat_alloc_context();
        if (!avio_ctx_ || !format_ctx_) {
            return fail(ErrorKind::ProcessingError, "failed to allocate demuxer context");
        }
        format_ctx_->pb = avio_ctx_;
        format_ctx_->flags |= AVFMT_FLAG_CUSTOM_IO;

        // avformat_open_input frees format_ctx_ on failure
        last_error = avformat_open_input(&format_ctx_, nullptr, attempts[i], nullptr);
        if (last_error >= 0) {
            break;
        }
        if (attempts[i]) {
            ac::log::debug("Hinted demuxer '" + format_hint + "' failed, probing content: " +
                           ffmpeg_error_string(last_error));
        }
    }

    if (!format_ctx_) {
        return fail(ErrorKind::UnsupportedFormat,
                    "unrecognized container: " + ffmpeg_error_string(last_error));
    }

    int ret = avformat_find_stream_info(format_ctx_, nullptr);
    if (ret < 0) {
        return fail(ErrorKind::CorruptData, "failed to read stream info: " + ffmpeg_error_string(ret));
    }

    info_.format_name = format_ctx_->iformat ? format_ctx_->iformat->name : "";
    return true;
}

Result<bool> FFmpegAudioDecoder::open_codec() {
    const AVCodec* codec = nullptr;
    stream_index_ = av_find_best_stream(format_ctx_, AVMEDIA_TYPE_AUDIO, -1, -1, &codec, 0);
    if (stream_index_ < 0) {
        return fail(ErrorKind::UnsupportedFormat, "no audio stream in " + info_.format_name);
    }
    if (!codec) {
        return fail(ErrorKind::UnsupportedFormat, "no decoder for audio stream");
    }

    AVStream* stream = format_ctx_->streams[stream_index_];
    const AVCodecParameters* par = stream->codecpar;
    int channels = par->ch_layout.nb_channels;
    if (channels <= 0 || channels > kMaxChannels) {
        return fail(ErrorKind::UnsupportedFormat,
                    "unsupported channel count " + std::to_string(channels));
    }
    if (par->sample_rate <= 0) {
        return fail(ErrorKind::CorruptData, "stream has no sample rate");
    }

    codec_ctx_ = avcodec_alloc_context3(codec);
    if (!codec_ctx_) {
        return fail(ErrorKind::ProcessingError, "failed to allocate decoder context");
    }
    int ret = avcodec_parameters_to_context(codec_ctx_, par);
    if (ret < 0) {
        return fail(ErrorKind::UnsupportedFormat, "bad codec parameters: " + ffmpeg_error_string(ret));
    }
    ret = avcodec_open2(codec_ctx_, codec, nullptr);
    if (ret < 0) {
        ac::log::error("Failed to open codec: " + ffmpeg_error_string(ret));
        return fail(ErrorKind::UnsupportedFormat, "failed to open decoder " + std::string(codec->name));
    }

    packet_ = av_packet_alloc();
    frame_ = av_frame_alloc();
    if (!packet_ || !frame_) {
        return fail(ErrorKind::ProcessingError, "failed to allocate packet/frame");
    }

    info_.codec_name = codec->name;
    info_.channels = static_cast<uint16_t>(channels);
    info_.sample_rate = static_cast<uint32_t>(par->sample_rate);
    if (par->bits_per_raw_sample > 0) {
        info_.bit_depth = static_cast<uint32_t>(par->bits_per_raw_sample);
    } else if (par->bits_per_coded_sample > 0) {
        info_.bit_depth = static_cast<uint32_t>(par->bits_per_coded_sample);
    }
    if (format_ctx_->duration != AV_NOPTS_VALUE && format_ctx_->duration > 0) {
        info_.duration_seconds = static_cast<double>(format_ctx_->duration) / AV_TIME_BASE;
    } else if (stream->duration != AV_NOPTS_VALUE && stream->duration > 0) {
        info_.duration_seconds = static_cast<double>(stream->duration) * av_q2d(stream->time_base);
    }

    channels_.assign(static_cast<size_t>(channels), {});
    return true;
}

Result<bool> FFmpegAudioDecoder::init_resampler(const AVFrame* frame) {
    AVChannelLayout in_layout{};
    AVChannelLayout out_layout{};
    int channels = static_cast<int>(info_.channels);
    if (av_channel_layout_copy(&in_layout, &frame->ch_layout) < 0) {
        return fail(ErrorKind::ProcessingError, "failed to copy channel layout");
    }
    normalize_layout(&in_layout, channels);
    av_channel_layout_default(&out_layout, channels);

    int ret = swr_alloc_set_opts2(&swr_ctx_,
                                  &out_layout, AV_SAMPLE_FMT_FLTP, frame->sample_rate,
                                  &in_layout, static_cast<AVSampleFormat>(frame->format), frame->sample_rate,
                                  0, nullptr);
    av_channel_layout_uninit(&in_layout);
    av_channel_layout_uninit(&out_layout);
    if (ret < 0 || !swr_ctx_) {
        return fail(ErrorKind::ProcessingError, "failed to configure resampler: " + ffmpeg_error_string(ret));
    }
    ret = swr_init(swr_ctx_);
    if (ret < 0) {
        ac::log::error("Failed to initialize resampler: " + ffmpeg_error_string(ret));
        return fail(ErrorKind::ProcessingError, "failed to initialize resampler");
    }
    return true;
}

Result<bool> FFmpegAudioDecoder::append_frame(const AVFrame* frame) {
    if (frame->ch_layout.nb_channels != static_cast<int>(info_.channels)) {
        return fail(ErrorKind::CorruptData, "channel count changed mid-stream");
    }
    if (!swr_ctx_) {
        auto init = init_resampler(frame);
        if (!init) {
            return init;
        }
    }

    int capacity = swr_get_out_samples(swr_ctx_, frame->nb_samples);
    if (capacity <= 0) {
        return true;
    }

    std::vector<std::vector<float>> scratch(info_.channels, std::vector<float>(static_cast<size_t>(capacity)));
    std::vector<uint8_t*> out_ptrs(info_.channels);
    for (size_t ch = 0; ch < scratch.size(); ++ch) {
        out_ptrs[ch] = reinterpret_cast<uint8_t*>(scratch[ch].data());
    }

    int converted = swr_convert(swr_ctx_, out_ptrs.data(), capacity,
                                const_cast<const uint8_t**>(frame->extended_data), frame->nb_samples);
    if (converted < 0) {
        ac::log::error("Resampling failed: " + ffmpeg_error_string(converted));
        return fail(ErrorKind::CorruptData, "sample conversion failed");
    }

    for (size_t ch = 0; ch < scratch.size(); ++ch) {
        auto& dst = channels_[ch];
        for (int i = 0; i < converted; ++i) {
            float s = scratch[ch][static_cast<size_t>(i)];
            if (!std::isfinite(s)) {
                return fail(ErrorKind::CorruptData, "decoded sample is not finite");
            }
            dst.push_back(std::clamp(s, -1.0f, 1.0f));
        }
    }
    return true;
}

Result<bool> FFmpegAudioDecoder::drain_decoder() {
    while (true) {
        int ret = avcodec_receive_frame(codec_ctx_, frame_);
        if (ret == AVERROR(EAGAIN) || ret == AVERROR_EOF) {
            return true;
        }
        if (ret < 0) {
            return fail(ErrorKind::CorruptData, "failed to decode audio: " + ffmpeg_error_string(ret));
        }
        auto appended = append_frame(frame_);
        av_frame_unref(frame_);
        if (!appended) {
            return appended;
        }
    }
}

Result<bool> FFmpegAudioDecoder::drain_resampler() {
    if (!swr_ctx_) {
        return true;
    }
    while (true) {
        int pending = swr_get_out_samples(swr_ctx_, 0);
        if (pending <= 0) {
            return true;
        }
        std::vector<std::vector<float>> scratch(info_.channels, std::vector<float>(static_cast<size_t>(pending)));
        std::vector<uint8_t*> out_ptrs(info_.channels);
        for (size_t ch = 0; ch < scratch.size(); ++ch) {
            out_ptrs[ch] = reinterpret_cast<uint8_t*>(scratch[ch].data());
        }
        int converted = swr_convert(swr_ctx_, out_ptrs.data(), pending, nullptr, 0);
        if (converted < 0) {
            return fail(ErrorKind::CorruptData, "resampler flush failed: " + ffmpeg_error_string(converted));
        }
        if (converted == 0) {
            return true;
        }
        for (size_t ch = 0; ch < scratch.size(); ++ch) {
            for (int i = 0; i < converted; ++i) {
                float s = scratch[ch][static_cast<size_t>(i)];
                if (!std::isfinite(s)) {
                    return fail(ErrorKind::CorruptData, "decoded sample is not finite");
                }
                channels_[ch].push_back(std::clamp(s, -1.0f, 1.0f));
            }
        }
    }
}

Result<SignalBuffer> FFmpegAudioDecoder::decode_all() {
    int ret = 0;
    while ((ret = av_read_frame(format_ctx_, packet_)) >= 0) {
        if (packet_->stream_index != stream_index_) {
            av_packet_unref(packet_);
            continue;
        }
        ret = avcodec_send_packet(codec_ctx_, packet_);
        av_packet_unref(packet_);
        if (ret < 0 && ret != AVERROR(EAGAIN)) {
            return fail(ErrorKind::CorruptData, "failed to send packet to decoder: " + ffmpeg_error_string(ret));
        }
        auto drained = drain_decoder();
        if (!drained) {
            return make_unexpected(std::move(drained).error());
        }
    }
    if (ret != AVERROR_EOF) {
        return fail(ErrorKind::CorruptData, "failed to read packet: " + ffmpeg_error_string(ret));
    }

    // Flush decoder and converter
    ret = avcodec_send_packet(codec_ctx_, nullptr);
    if (ret < 0 && ret != AVERROR_EOF) {
        return fail(ErrorKind::CorruptData, "failed to flush decoder: " + ffmpeg_error_string(ret));
    }
    auto drained = drain_decoder();
    if (!drained) {
        return make_unexpected(std::move(drained).error());
    }
    auto flushed = drain_resampler();
    if (!flushed) {
        return make_unexpected(std::move(flushed).error());
    }

    if (channels_.empty() || channels_.front().empty()) {
        return fail(ErrorKind::CorruptData, "no audio samples could be decoded");
    }

    auto buffer = SignalBuffer::create(std::move(channels_), info_.sample_rate);
    channels_.clear();
    if (!buffer) {
        return fail(ErrorKind::CorruptData, "decoded samples are inconsistent: " + buffer.error().message);
    }
    ac::log::debug("Decoded " + std::to_string(buffer->frame_count()) + " frames (" +
                   info_.codec_name + ", " + std::to_string(info_.sample_rate) + " Hz, " +
                   std::to_string(info_.channels) + " ch)");
    return buffer;
}

void FFmpegAudioDecoder::cleanup() {
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
        avformat_close_input(&format_ctx_);
    }
    detail::close_context(&avio_ctx_);
}

Result<SignalBuffer> decode(const std::vector<uint8_t>& bytes, const std::string& format_hint) {
    auto decoder = FFmpegAudioDecoder::open(bytes, format_hint);
    if (!decoder) {
        return make_unexpected(std::move(decoder).error());
    }
    return decoder.value()->decode_all();
}

Result<MediaInfo> probe(const std::vector<uint8_t>& bytes, const std::string& format_hint) {
    auto decoder = FFmpegAudioDecoder::open(bytes, format_hint);
    if (!decoder) {
        return make_unexpected(std::move(decoder).error());
    }
    return decoder.value()->info();
}

} // namespace ac::audio
