#include "dsp/resampler.hpp"
#include "audio/ffmpeg_utils.hpp"
#include "core/log.hpp"
#include <algorithm>
#include <cmath>
#include <vector>

extern "C" {
#include <libavutil/channel_layout.h>
#include <libavutil/opt.h>
#include <libswresample/swresample.h>
}

namespace ac::dsp {

namespace {

// RAII holder so every early return frees the context
struct SwrHandle {
    SwrContext* ctx = nullptr;
    ~SwrHandle() { if (ctx) swr_free(&ctx); }
};

} // anonymous namespace

size_t resampled_length(size_t frames, uint32_t source_rate, uint32_t target_rate) {
    if (source_rate == 0) {
        return 0;
    }
    unsigned long long scaled = static_cast<unsigned long long>(frames) * target_rate;
    return static_cast<size_t>((scaled + source_rate / 2) / source_rate);
}

Result<audio::SignalBuffer> resample(const audio::SignalBuffer& buffer, uint32_t target_rate) {
    if (target_rate == 0) {
        return fail(ErrorKind::InvalidParameter, "target sample rate must be positive");
    }
    if (target_rate == buffer.sample_rate() || buffer.empty()) {
        if (buffer.empty()) {
            return audio::SignalBuffer::silence(buffer.channel_count() ? buffer.channel_count() : 1, 0, target_rate);
        }
        return buffer;
    }

    const int channels = buffer.channel_count();
    const size_t in_frames = buffer.frame_count();
    const size_t wanted = resampled_length(in_frames, buffer.sample_rate(), target_rate);

    AVChannelLayout layout{};
    av_channel_layout_default(&layout, channels);
    SwrHandle swr;
    int ret = swr_alloc_set_opts2(&swr.ctx,
                                  &layout, AV_SAMPLE_FMT_FLTP, static_cast<int>(target_rate),
                                  &layout, AV_SAMPLE_FMT_FLTP, static_cast<int>(buffer.sample_rate()),
                                  0, nullptr);
    av_channel_layout_uninit(&layout);
    if (ret < 0 || !swr.ctx) {
        return fail(ErrorKind::ProcessingError, "failed to configure resampler: " + audio::ffmpeg_error_string(ret));
    }
    ret = swr_init(swr.ctx);
    if (ret < 0) {
        ac::log::error("Failed to initialize resampler: " + audio::ffmpeg_error_string(ret));
        return fail(ErrorKind::ProcessingError, "failed to initialize resampler");
    }

    int capacity = swr_get_out_samples(swr.ctx, static_cast<int>(in_frames));
    if (capacity < 0) {
        return fail(ErrorKind::ProcessingError, "resampler size query failed: " + audio::ffmpeg_error_string(capacity));
    }
    std::vector<std::vector<float>> out(static_cast<size_t>(channels),
                                        std::vector<float>(static_cast<size_t>(capacity) + wanted + 64));
    std::vector<const uint8_t*> in_ptrs(static_cast<size_t>(channels));
    std::vector<uint8_t*> out_ptrs(static_cast<size_t>(channels));
    for (int ch = 0; ch < channels; ++ch) {
        in_ptrs[ch] = reinterpret_cast<const uint8_t*>(buffer.channel_data(static_cast<uint16_t>(ch)));
    }

    size_t produced = 0;
    const uint8_t** input = in_ptrs.data();
    int input_frames = static_cast<int>(in_frames);
    // First pass converts the whole clip, following passes drain the filter tail.
    while (true) {
        size_t space = out.front().size() - produced;
        if (space == 0) break;
        for (int ch = 0; ch < channels; ++ch) {
            out_ptrs[ch] = reinterpret_cast<uint8_t*>(out[ch].data() + produced);
        }
        int converted = swr_convert(swr.ctx, out_ptrs.data(), static_cast<int>(space), input, input_frames);
        if (converted < 0) {
            return fail(ErrorKind::ProcessingError, "resampling failed: " + audio::ffmpeg_error_string(converted));
        }
        produced += static_cast<size_t>(converted);
        if (!input && converted == 0) break;
        input = nullptr;
        input_frames = 0;
    }

    std::vector<std::vector<float>> channels_out(static_cast<size_t>(channels));
    for (int ch = 0; ch < channels; ++ch) {
        auto& src = out[ch];
        src.resize(std::min(produced, src.size()));
        src.resize(wanted, 0.0f);
        for (float& s : src) {
            if (!std::isfinite(s)) {
                return fail(ErrorKind::ProcessingError, "resampler produced a non-finite sample");
            }
            s = std::clamp(s, -1.0f, 1.0f);
        }
        channels_out[ch] = std::move(src);
    }

    ac::log::debug("Resampled " + std::to_string(in_frames) + " frames " +
                   std::to_string(buffer.sample_rate()) + " -> " + std::to_string(target_rate) +
                   " Hz (" + std::to_string(wanted) + " frames)");
    return audio::SignalBuffer::create(std::move(channels_out), target_rate);
}

} // namespace ac::dsp
