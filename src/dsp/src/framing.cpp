#include "dsp/framing.hpp"
#include <algorithm>
#include <cmath>
#include <numeric>

namespace ac::dsp {

size_t frame_length(uint32_t sample_rate, double frame_ms) {
    double samples = std::round(static_cast<double>(sample_rate) * frame_ms / 1000.0);
    return samples < 1.0 ? 1 : static_cast<size_t>(samples);
}

std::vector<double> frame_rms(const audio::SignalBuffer& buffer, size_t frame_len) {
    std::vector<double> levels;
    const size_t frames = buffer.frame_count();
    if (frames == 0 || frame_len == 0) {
        return levels;
    }
    levels.reserve((frames + frame_len - 1) / frame_len);

    for (size_t start = 0; start < frames; start += frame_len) {
        size_t end = std::min(frames, start + frame_len);
        double sum = 0.0;
        for (uint16_t ch = 0; ch < buffer.channel_count(); ++ch) {
            const float* data = buffer.channel_data(ch);
            for (size_t i = start; i < end; ++i) {
                sum += static_cast<double>(data[i]) * data[i];
            }
        }
        double n = static_cast<double>((end - start) * buffer.channel_count());
        levels.push_back(std::sqrt(sum / n));
    }
    return levels;
}

std::vector<double> frame_rms(const float* samples, size_t count, size_t frame_len) {
    std::vector<double> levels;
    if (count == 0 || frame_len == 0) {
        return levels;
    }
    for (size_t start = 0; start < count; start += frame_len) {
        size_t end = std::min(count, start + frame_len);
        double sum = 0.0;
        for (size_t i = start; i < end; ++i) {
            sum += static_cast<double>(samples[i]) * samples[i];
        }
        levels.push_back(std::sqrt(sum / static_cast<double>(end - start)));
    }
    return levels;
}

std::vector<size_t> lowest_fraction(const std::vector<double>& values, double fraction) {
    std::vector<size_t> order(values.size());
    std::iota(order.begin(), order.end(), size_t{0});
    if (values.empty()) {
        return order;
    }
    std::stable_sort(order.begin(), order.end(),
                     [&values](size_t a, size_t b) { return values[a] < values[b]; });

    double wanted = std::ceil(std::clamp(fraction, 0.0, 1.0) * static_cast<double>(values.size()));
    size_t keep = std::max<size_t>(1, static_cast<size_t>(wanted));
    order.resize(std::min(keep, order.size()));
    return order;
}

double low_percentile_rms(const std::vector<double>& frame_levels, double fraction) {
    if (frame_levels.empty()) {
        return 0.0;
    }
    auto lowest = lowest_fraction(frame_levels, fraction);
    double power = 0.0;
    for (size_t index : lowest) {
        power += frame_levels[index] * frame_levels[index];
    }
    return std::sqrt(power / static_cast<double>(lowest.size()));
}

double to_db(double linear, double floor_db) {
    if (!(linear > 0.0)) {
        return floor_db;
    }
    return std::max(20.0 * std::log10(linear), floor_db);
}

double from_db(double db) {
    return std::pow(10.0, db / 20.0);
}

} // namespace ac::dsp
