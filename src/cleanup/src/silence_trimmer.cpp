#include "cleanup/silence_trimmer.hpp"
#include "core/log_config.hpp"
#include <algorithm>
#include <cmath>
#include <string>

namespace ac::cleanup {

namespace {

size_t ms_to_samples(double ms, uint32_t sample_rate) {
    return static_cast<size_t>(std::lround(std::max(0.0, ms) * sample_rate / 1000.0));
}

} // anonymous namespace

std::vector<std::pair<size_t, size_t>> find_silent_spans(const audio::SignalBuffer& buffer,
                                                         const ReducerConfig& config,
                                                         const analysis::AnalyzerConfig& analysis) {
    std::vector<std::pair<size_t, size_t>> spans;
    const size_t total = buffer.frame_count();
    if (total == 0) {
        return spans;
    }

    const auto map = analysis::detect_silence(buffer, analysis);
    if (map.silent_frames() == map.silent.size()) {
        return spans;
    }

    const size_t min_len = std::max<size_t>(1, ms_to_samples(config.min_silence_ms, buffer.sample_rate()));
    const size_t guard = ms_to_samples(config.guard_ms, buffer.sample_rate());

    size_t frame = 0;
    while (frame < map.silent.size()) {
        if (!map.silent[frame]) {
            ++frame;
            continue;
        }
        size_t run_end = frame;
        while (run_end < map.silent.size() && map.silent[run_end]) {
            ++run_end;
        }
        size_t first = frame * map.frame_length;
        size_t last = std::min(total, run_end * map.frame_length);
        frame = run_end;

        if (last - first < min_len) {
            continue;
        }
        const bool leading = first == 0;
        const bool trailing = last == total;
        if (!leading && !trailing && !config.trim_interior) {
            continue;
        }

        // Guard is kept only on sides that touch signal
        size_t cut_first = leading ? first : first + guard;
        size_t cut_last = trailing ? last : (last > guard ? last - guard : 0);
        if (cut_last > cut_first) {
            spans.emplace_back(cut_first, cut_last);
        }
    }
    return spans;
}

Result<TrimResult> trim_silence(const audio::SignalBuffer& buffer,
                                const ReducerConfig& config,
                                const analysis::AnalyzerConfig& analysis) {
    const auto spans = find_silent_spans(buffer, config, analysis);
    if (spans.empty()) {
        return TrimResult{buffer, 0.0, 0};
    }

    const size_t total = buffer.frame_count();
    const size_t fade = ms_to_samples(config.fade_ms, buffer.sample_rate());

    // Kept segments between the removed spans
    std::vector<std::pair<size_t, size_t>> kept;
    size_t cursor = 0;
    for (const auto& span : spans) {
        if (span.first > cursor) {
            kept.emplace_back(cursor, span.first);
        }
        cursor = span.second;
    }
    if (cursor < total) {
        kept.emplace_back(cursor, total);
    }

    size_t removed = 0;
    for (const auto& span : spans) {
        removed += span.second - span.first;
    }

    std::vector<std::vector<float>> channels(buffer.channel_count());
    for (uint16_t ch = 0; ch < buffer.channel_count(); ++ch) {
        const float* src = buffer.channel_data(ch);
        auto& dst = channels[ch];
        dst.reserve(total - removed);
        for (size_t seg = 0; seg < kept.size(); ++seg) {
            const size_t begin = kept[seg].first;
            const size_t end = kept[seg].second;
            const size_t length = end - begin;
            const size_t out_begin = dst.size();
            dst.insert(dst.end(), src + begin, src + end);

            // Fades only where a cut joins two kept segments
            const size_t ramp = std::min(fade, length / 2);
            if (ramp == 0) continue;
            if (seg > 0 && begin != 0) {
                for (size_t i = 0; i < ramp; ++i) {
                    dst[out_begin + i] *= static_cast<float>(i) / static_cast<float>(ramp);
                }
            }
            if (seg + 1 < kept.size()) {
                for (size_t i = 0; i < ramp; ++i) {
                    dst[out_begin + length - 1 - i] *= static_cast<float>(i) / static_cast<float>(ramp);
                }
            }
        }
    }

    auto trimmed = audio::SignalBuffer::create(std::move(channels), buffer.sample_rate());
    if (!trimmed) {
        return fail(ErrorKind::ProcessingError, "silence trim produced an invalid buffer: " + trimmed.error().message);
    }
    AC_DSP_TRACE("trim: removed " + std::to_string(removed) + " samples in " + std::to_string(spans.size()) + " spans");

    TrimResult result{std::move(trimmed).value(), static_cast<double>(removed) / buffer.sample_rate(), spans.size()};
    return result;
}

} // namespace ac::cleanup
