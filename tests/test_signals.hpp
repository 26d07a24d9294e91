#pragma once

// In-process test signal generators. Everything is seeded so tests are repeatable.

#include "audio/signal_buffer.hpp"
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <random>
#include <vector>

namespace ac::test {

constexpr double kPi = 3.14159265358979323846;

inline std::vector<float> sine(double freq_hz, double amplitude, size_t frames, uint32_t rate) {
    std::vector<float> s(frames);
    for (size_t i = 0; i < frames; ++i) {
        s[i] = static_cast<float>(amplitude * std::sin(2.0 * kPi * freq_hz * static_cast<double>(i) / rate));
    }
    return s;
}

inline std::vector<float> white_noise(double amplitude, size_t frames, uint32_t seed) {
    std::mt19937 rng(seed);
    std::uniform_real_distribution<float> dist(-1.0f, 1.0f);
    std::vector<float> s(frames);
    for (auto& v : s) {
        v = static_cast<float>(amplitude) * dist(rng);
    }
    return s;
}

inline std::vector<float> mix(std::vector<float> a, const std::vector<float>& b) {
    for (size_t i = 0; i < a.size() && i < b.size(); ++i) {
        a[i] += b[i];
    }
    return a;
}

/// x[n] + gain * x[n - delay]
inline std::vector<float> with_echo(const std::vector<float>& dry, size_t delay, float gain) {
    std::vector<float> wet(dry);
    for (size_t i = delay; i < dry.size(); ++i) {
        wet[i] += gain * dry[i - delay];
    }
    return wet;
}

inline audio::SignalBuffer mono(std::vector<float> samples, uint32_t rate) {
    return audio::SignalBuffer::create({std::move(samples)}, rate).value();
}

inline audio::SignalBuffer stereo(std::vector<float> left, std::vector<float> right, uint32_t rate) {
    return audio::SignalBuffer::create({std::move(left), std::move(right)}, rate).value();
}

inline audio::SignalBuffer sine_buffer(double freq_hz, double amplitude, double seconds, uint32_t rate) {
    return mono(sine(freq_hz, amplitude, static_cast<size_t>(seconds * rate), rate), rate);
}

/// Low noise throughout, tone only in [tone_start, tone_end) seconds
inline audio::SignalBuffer tone_in_noise(double seconds, double tone_start, double tone_end,
                                         uint32_t rate, double noise_amp = 0.01, double tone_amp = 0.5) {
    size_t frames = static_cast<size_t>(seconds * rate);
    auto samples = white_noise(noise_amp, frames, 1234);
    auto tone = sine(440.0, tone_amp, frames, rate);
    size_t a = static_cast<size_t>(tone_start * rate);
    size_t b = static_cast<size_t>(tone_end * rate);
    for (size_t i = a; i < b && i < frames; ++i) {
        samples[i] += tone[i];
    }
    return mono(std::move(samples), rate);
}

inline double rms(const std::vector<float>& s, size_t first = 0, size_t count = static_cast<size_t>(-1)) {
    size_t end = count == static_cast<size_t>(-1) ? s.size() : std::min(s.size(), first + count);
    double sum = 0.0;
    for (size_t i = first; i < end; ++i) sum += static_cast<double>(s[i]) * s[i];
    return end > first ? std::sqrt(sum / static_cast<double>(end - first)) : 0.0;
}

/// Normalized autocorrelation at one lag
inline double autocorrelation(const std::vector<float>& s, size_t lag) {
    double r0 = 0.0, rl = 0.0;
    for (size_t i = 0; i < s.size(); ++i) {
        r0 += static_cast<double>(s[i]) * s[i];
        if (i + lag < s.size()) rl += static_cast<double>(s[i]) * s[i + lag];
    }
    return r0 > 0.0 ? rl / r0 : 0.0;
}

} // namespace ac::test
