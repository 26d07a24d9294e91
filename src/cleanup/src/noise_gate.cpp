#include "cleanup/noise_gate.hpp"
#include "core/log_config.hpp"
#include "dsp/framing.hpp"
#include "dsp/stft.hpp"
#include <algorithm>
#include <cmath>
#include <string>

namespace ac::cleanup {

std::vector<double> estimate_noise_profile(const float* samples, size_t count,
                                           const ReducerConfig& config,
                                           const analysis::AnalyzerConfig& analysis) {
    dsp::Stft stft(config.fft_size, config.hop_size);
    std::vector<double> profile(stft.bins(), 0.0);
    const size_t frames = stft.frame_count(count);
    if (frames == 0) {
        return profile;
    }

    std::vector<size_t> candidates;
    for (size_t frame = 0; frame < frames; ++frame) {
        if (stft.frame_is_interior(frame, count)) {
            candidates.push_back(frame);
        }
    }
    if (candidates.empty()) {
        for (size_t frame = 0; frame < frames; ++frame) {
            candidates.push_back(frame);
        }
    }

    // First pass: frame energies
    std::vector<double> energy;
    energy.reserve(candidates.size());
    std::vector<double> magnitude;
    for (size_t frame : candidates) {
        stft.analyze_frame(samples, count, frame, magnitude);
        double e = 0.0;
        for (double m : magnitude) {
            e += m * m;
        }
        energy.push_back(e);
    }

    // Second pass: average spectrum of the quietest frames
    auto quietest = dsp::lowest_fraction(energy, analysis.noise_percentile);
    for (size_t index : quietest) {
        stft.analyze_frame(samples, count, candidates[index], magnitude);
        for (size_t k = 0; k < profile.size(); ++k) {
            profile[k] += magnitude[k];
        }
    }
    for (double& p : profile) {
        p /= static_cast<double>(quietest.size());
    }
    AC_DSP_TRACE("noise profile from " + std::to_string(quietest.size()) + " of " +
                 std::to_string(candidates.size()) + " frames");
    return profile;
}

void apply_noise_gate(audio::SignalBuffer& buffer, double strength,
                      const ReducerConfig& config,
                      const analysis::AnalyzerConfig& analysis) {
    if (strength <= 0.0 || buffer.empty()) {
        return;
    }
    const double amount = config.over_subtraction * strength;

    dsp::Stft stft(config.fft_size, config.hop_size);
    for (uint16_t ch = 0; ch < buffer.channel_count(); ++ch) {
        float* data = buffer.channel_data(ch);
        const size_t count = buffer.frame_count();
        const auto profile = estimate_noise_profile(data, count, config, analysis);

        auto gated = stft.transform(data, count, [&](size_t, fftw_complex* bins, size_t bin_count) {
            for (size_t k = 0; k < bin_count; ++k) {
                double magnitude = std::hypot(bins[k][0], bins[k][1]);
                if (magnitude <= 0.0) continue;
                double reduced = std::max(0.0, magnitude - amount * profile[k]);
                double gain = reduced / magnitude;
                bins[k][0] *= gain;
                bins[k][1] *= gain;
            }
        });
        std::copy(gated.begin(), gated.end(), data);
    }
}

} // namespace ac::cleanup
