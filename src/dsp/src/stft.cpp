#include "dsp/stft.hpp"
#include "core/log_config.hpp"
#include <cmath>
#include <string>

namespace ac::dsp {

namespace {
constexpr double kPi = 3.14159265358979323846;
}

Stft::Stft(size_t fft_size, size_t hop_size)
    : fft_size_(fft_size), hop_size_(hop_size), window_(fft_size), plan_(fft_size) {
    for (size_t i = 0; i < fft_size_; ++i) {
        window_[i] = 0.5 - 0.5 * std::cos(2.0 * kPi * static_cast<double>(i) / static_cast<double>(fft_size_));
    }
}

size_t Stft::frame_count(size_t count) const {
    if (count == 0) {
        return 0;
    }
    size_t padded = count + (fft_size_ - hop_size_);
    return (padded + hop_size_ - 1) / hop_size_;
}

bool Stft::frame_is_interior(size_t frame, size_t count) const {
    const size_t pad = fft_size_ - hop_size_;
    size_t origin = frame * hop_size_;
    return origin >= pad && origin - pad + fft_size_ <= count;
}

void Stft::load_frame(const float* samples, size_t count, size_t frame) {
    const long long pad = static_cast<long long>(fft_size_ - hop_size_);
    const long long start = static_cast<long long>(frame * hop_size_) - pad;
    double* time = plan_.time();
    for (size_t i = 0; i < fft_size_; ++i) {
        long long n = start + static_cast<long long>(i);
        double value = (n >= 0 && n < static_cast<long long>(count)) ? samples[n] : 0.0;
        time[i] = value * window_[i];
    }
}

void Stft::analyze_frame(const float* samples, size_t count, size_t frame, std::vector<double>& magnitude) {
    load_frame(samples, count, frame);
    plan_.forward();
    const fftw_complex* bins = plan_.freq();
    magnitude.resize(plan_.bins());
    for (size_t k = 0; k < magnitude.size(); ++k) {
        magnitude[k] = std::hypot(bins[k][0], bins[k][1]);
    }
}

std::vector<float> Stft::transform(const float* samples, size_t count, const BinModifier& modifier) {
    std::vector<double> accum(count, 0.0);
    std::vector<double> norm(count, 0.0);
    const long long pad = static_cast<long long>(fft_size_ - hop_size_);
    const size_t frames = frame_count(count);

    for (size_t frame = 0; frame < frames; ++frame) {
        load_frame(samples, count, frame);
        plan_.forward();
        if (modifier) {
            modifier(frame, plan_.freq(), plan_.bins());
        }
        plan_.inverse();

        const long long start = static_cast<long long>(frame * hop_size_) - pad;
        const double* time = plan_.time();
        for (size_t i = 0; i < fft_size_; ++i) {
            long long n = start + static_cast<long long>(i);
            if (n < 0 || n >= static_cast<long long>(count)) continue;
            accum[static_cast<size_t>(n)] += time[i] * window_[i];
            norm[static_cast<size_t>(n)] += window_[i] * window_[i];
        }
    }
    AC_DSP_TRACE("stft: " + std::to_string(frames) + " frames of " + std::to_string(fft_size_));

    std::vector<float> out(count, 0.0f);
    for (size_t n = 0; n < count; ++n) {
        if (norm[n] > 1e-12) {
            out[n] = static_cast<float>(accum[n] / norm[n]);
        }
    }
    return out;
}

} // namespace ac::dsp
