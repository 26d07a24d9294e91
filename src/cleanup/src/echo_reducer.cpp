#include "cleanup/echo_reducer.hpp"
#include "core/log_config.hpp"
#include "dsp/fft_plan.hpp"
#include <algorithm>
#include <cmath>
#include <string>

namespace ac::cleanup {

namespace {

size_t next_pow2(size_t n) {
    size_t p = 1;
    while (p < n) p <<= 1;
    return p;
}

size_t ms_to_samples(double ms, uint32_t sample_rate) {
    return static_cast<size_t>(std::lround(ms * sample_rate / 1000.0));
}

} // anonymous namespace

EchoEstimate estimate_echo(const float* samples, size_t count, uint32_t sample_rate, const ReducerConfig& config) {
    EchoEstimate estimate;
    const size_t window = std::min(count, static_cast<size_t>(config.echo_analysis_window_s * sample_rate));
    const size_t min_lag = std::max<size_t>(1, ms_to_samples(config.echo_min_delay_ms, sample_rate));
    if (window < 2 || min_lag >= window) {
        return estimate;
    }
    const size_t max_lag = std::min(ms_to_samples(config.echo_max_delay_ms, sample_rate), window - 1);
    if (max_lag < min_lag) {
        return estimate;
    }

    // Linear autocorrelation through a zero-padded power spectrum
    dsp::FftPlan plan(next_pow2(2 * window));
    double* time = plan.time();
    std::fill(time, time + plan.size(), 0.0);
    for (size_t i = 0; i < window; ++i) {
        time[i] = samples[i];
    }
    plan.forward();
    fftw_complex* freq = plan.freq();
    for (size_t k = 0; k < plan.bins(); ++k) {
        freq[k][0] = freq[k][0] * freq[k][0] + freq[k][1] * freq[k][1];
        freq[k][1] = 0.0;
    }
    plan.inverse();

    const double r0 = time[0];
    if (!(r0 > 0.0)) {
        return estimate;
    }

    for (size_t lag = min_lag; lag <= max_lag; ++lag) {
        double rho = time[lag] / r0;
        if (rho > estimate.correlation) {
            estimate.correlation = rho;
            estimate.delay_samples = lag;
        }
    }

    // rho = a / (1 + a^2) peaks at 0.5 for a = 1; anything above is periodic content
    estimate.detected = estimate.delay_samples != 0 &&
                        estimate.correlation >= config.echo_min_correlation &&
                        estimate.correlation <= kMaxSingleEchoCorrelation;
    if (estimate.detected) {
        const double rho = estimate.correlation;
        estimate.gain = (1.0 - std::sqrt(1.0 - 4.0 * rho * rho)) / (2.0 * rho);
    }
    AC_DSP_TRACE("echo: lag " + std::to_string(estimate.delay_samples) + " rho " +
                 std::to_string(estimate.correlation));
    return estimate;
}

EchoEstimate reduce_echo(audio::SignalBuffer& buffer, const ReducerConfig& config) {
    EchoEstimate strongest;
    for (uint16_t ch = 0; ch < buffer.channel_count(); ++ch) {
        float* data = buffer.channel_data(ch);
        const size_t count = buffer.frame_count();
        EchoEstimate estimate = estimate_echo(data, count, buffer.sample_rate(), config);
        if (!estimate.detected) {
            continue;
        }

        const double g = config.echo_damping * estimate.gain;
        const size_t lag = estimate.delay_samples;
        // In place is safe: y[n - lag] has already been overwritten with output
        for (size_t n = lag; n < count; ++n) {
            double y = static_cast<double>(data[n]) - g * static_cast<double>(data[n - lag]);
            data[n] = static_cast<float>(y);
        }

        if (!strongest.detected || estimate.correlation > strongest.correlation) {
            strongest = estimate;
        }
    }
    return strongest;
}

} // namespace ac::cleanup
