#include "cleanup/click_suppressor.hpp"
#include "core/log_config.hpp"
#include <algorithm>
#include <cmath>
#include <string>
#include <vector>

namespace ac::cleanup {

namespace {

float catmull_rom(float p0, float p1, float p2, float p3, float t) {
    float t2 = t * t;
    float t3 = t2 * t;
    return 0.5f * ((2.0f * p1) + (-p0 + p2) * t + (2.0f * p0 - 5.0f * p1 + 4.0f * p2 - p3) * t2 +
                   (-p0 + 3.0f * p1 - 3.0f * p2 + p3) * t3);
}

// Replace samples (left, right) exclusive with a curve through the neighbours
void repair_run(float* samples, size_t count, size_t left, size_t right) {
    float p0 = samples[left > 0 ? left - 1 : left];
    float p1 = samples[left];
    float p2 = samples[right];
    float p3 = samples[right + 1 < count ? right + 1 : right];
    const float span = static_cast<float>(right - left);
    for (size_t i = left + 1; i < right; ++i) {
        float t = static_cast<float>(i - left) / span;
        samples[i] = std::clamp(catmull_rom(p0, p1, p2, p3, t), -1.0f, 1.0f);
    }
}

} // anonymous namespace

size_t suppress_clicks(float* samples, size_t count, uint32_t sample_rate, const ReducerConfig& config) {
    if (count < 3) {
        return 0;
    }

    std::vector<float> diff(count, 0.0f);
    double mean_abs = 0.0;
    for (size_t i = 1; i < count; ++i) {
        diff[i] = samples[i] - samples[i - 1];
        mean_abs += std::fabs(diff[i]);
    }
    mean_abs /= static_cast<double>(count - 1);

    const double threshold = std::max(config.click_threshold * mean_abs, config.click_min_jump);
    const size_t max_run = std::max<size_t>(
        1, static_cast<size_t>(std::lround(config.max_click_ms * sample_rate / 1000.0)));

    size_t repaired = 0;
    size_t i = 1;
    while (i < count) {
        if (std::fabs(diff[i]) <= threshold) {
            ++i;
            continue;
        }
        // Outlier run starts at i; look for the jump back within max_run samples
        size_t end = 0;
        const size_t limit = std::min(count - 1, i + max_run);
        for (size_t j = i + 1; j <= limit; ++j) {
            if (std::fabs(diff[j]) > threshold && (diff[j] > 0.0f) != (diff[i] > 0.0f)) {
                end = j;
                break;
            }
        }
        if (end == 0) {
            ++i;
            continue;
        }
        repair_run(samples, count, i - 1, end);
        ++repaired;
        i = end + 1;
    }

    AC_DSP_TRACE("click threshold " + std::to_string(threshold) + ", repaired " + std::to_string(repaired));
    return repaired;
}

size_t suppress_clicks(audio::SignalBuffer& buffer, const ReducerConfig& config) {
    size_t total = 0;
    for (uint16_t ch = 0; ch < buffer.channel_count(); ++ch) {
        total += suppress_clicks(buffer.channel_data(ch), buffer.frame_count(), buffer.sample_rate(), config);
    }
    return total;
}

} // namespace ac::cleanup
