#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "cleanup/click_suppressor.hpp"
#include "cleanup/echo_reducer.hpp"
#include "cleanup/noise_gate.hpp"
#include "cleanup/normalizer.hpp"
#include "cleanup/silence_trimmer.hpp"
#include "test_signals.hpp"

using Catch::Approx;
using namespace ac::cleanup;

namespace {

// Noise bed with tone bursts in [1.0, 1.5) s and [2.5, 3.0) s of a 4 s clip
ac::audio::SignalBuffer two_bursts(uint32_t rate) {
    const size_t frames = 4 * rate;
    auto samples = ac::test::white_noise(0.001, frames, 77);
    auto tone = ac::test::sine(440.0, 0.5, frames, rate);
    for (size_t i = 0; i < frames; ++i) {
        double t = static_cast<double>(i) / rate;
        if ((t >= 1.0 && t < 1.5) || (t >= 2.5 && t < 3.0)) {
            samples[i] += tone[i];
        }
    }
    return ac::test::mono(std::move(samples), rate);
}

} // namespace

TEST_CASE("Single-sample spikes are repaired", "[cleanup][clicks]") {
    const uint32_t rate = 44100;
    auto clean = ac::test::sine(1000.0, 0.5, 4410, rate);
    auto damaged = clean;
    const std::vector<size_t> positions = {500, 1500, 2500, 3500, 4000};
    for (size_t p : positions) {
        damaged[p] = clean[p] < 0.3f ? clean[p] + 0.6f : clean[p] - 0.6f;
    }

    ReducerConfig config;
    size_t repaired = suppress_clicks(damaged.data(), damaged.size(), rate, config);
    REQUIRE(repaired == positions.size());
    for (size_t p : positions) {
        INFO("sample " << p);
        REQUIRE(damaged[p] == Approx(clean[p]).margin(0.02));
    }
}

TEST_CASE("Clean tone has no clicks", "[cleanup][clicks]") {
    auto buffer = ac::test::sine_buffer(1000.0, 0.5, 0.5, 44100);
    auto before = buffer.channel(0);
    REQUIRE(suppress_clicks(buffer, ReducerConfig{}) == 0);
    REQUIRE(buffer.channel(0) == before);
}

TEST_CASE("Step changes are not treated as clicks", "[cleanup][clicks]") {
    std::vector<float> step(2000, 0.0f);
    std::fill(step.begin() + 1000, step.end(), 0.5f);
    auto before = step;
    REQUIRE(suppress_clicks(step.data(), step.size(), 16000, ReducerConfig{}) == 0);
    REQUIRE(step == before);
}

TEST_CASE("Echo delay is estimated from autocorrelation", "[cleanup][echo]") {
    const uint32_t rate = 16000;
    auto dry = ac::test::white_noise(0.3, rate, 21);
    auto wet = ac::test::with_echo(dry, 1600, 0.5f);

    auto estimate = estimate_echo(wet.data(), wet.size(), rate, ReducerConfig{});
    REQUIRE(estimate.detected);
    REQUIRE(estimate.delay_samples == 1600);
    REQUIRE(estimate.correlation == Approx(0.37).margin(0.05));
    REQUIRE(estimate.gain > 0.3);
    REQUIRE(estimate.gain < 0.6);

    auto none = estimate_echo(dry.data(), dry.size(), rate, ReducerConfig{});
    REQUIRE_FALSE(none.detected);
}

TEST_CASE("Echo reduction lowers correlation at the echo delay", "[cleanup][echo]") {
    const uint32_t rate = 16000;
    auto wet = ac::test::with_echo(ac::test::white_noise(0.3, rate, 21), 1600, 0.5f);
    auto buffer = ac::test::mono(wet, rate);

    const double before = ac::test::autocorrelation(buffer.channel(0), 1600);
    auto estimate = reduce_echo(buffer, ReducerConfig{});
    const double after = ac::test::autocorrelation(buffer.channel(0), 1600);

    REQUIRE(estimate.detected);
    REQUIRE(before > 0.3);
    REQUIRE(after < 0.2);
}

TEST_CASE("Echo reduction leaves echo-free channels alone", "[cleanup][echo]") {
    auto buffer = ac::test::mono(ac::test::white_noise(0.3, 16000, 4), 16000);
    auto before = buffer.channel(0);
    auto estimate = reduce_echo(buffer, ReducerConfig{});
    REQUIRE_FALSE(estimate.detected);
    REQUIRE(buffer.channel(0) == before);
}

TEST_CASE("Periodic tones are not mistaken for echoes", "[cleanup][echo]") {
    const uint32_t rate = 16000;
    auto tone = ac::test::sine(440.0, 0.5, 2 * rate, rate);

    auto estimate = estimate_echo(tone.data(), tone.size(), rate, ReducerConfig{});
    REQUIRE(estimate.correlation > kMaxSingleEchoCorrelation);
    REQUIRE_FALSE(estimate.detected);

    auto buffer = ac::test::sine_buffer(440.0, 0.5, 2.0, rate);
    auto before = buffer.channel(0);
    auto reduced = reduce_echo(buffer, ReducerConfig{});
    REQUIRE_FALSE(reduced.detected);
    REQUIRE(buffer.channel(0) == before);
}

TEST_CASE("Leading and trailing silence keep a guard interval", "[cleanup][silence]") {
    auto buffer = ac::test::tone_in_noise(3.0, 1.0, 2.0, 16000, 0.001, 0.5);
    ReducerConfig config;

    auto spans = find_silent_spans(buffer, config, ac::analysis::AnalyzerConfig{});
    REQUIRE(spans.size() == 2);
    REQUIRE(spans[0] == std::make_pair(size_t{0}, size_t{15200}));
    REQUIRE(spans[1] == std::make_pair(size_t{32800}, size_t{48000}));

    auto trimmed = trim_silence(buffer, config, ac::analysis::AnalyzerConfig{});
    REQUIRE(trimmed.has_value());
    REQUIRE(trimmed->cuts == 2);
    REQUIRE(trimmed->buffer.frame_count() == 17600);
    REQUIRE(trimmed->removed_seconds == Approx(1.9));
    // Kept audio is copied verbatim when no interior cut was made
    REQUIRE(trimmed->buffer.channel(0)[0] == buffer.channel(0)[15200]);
}

TEST_CASE("Interior silence is cut with fades", "[cleanup][silence]") {
    auto buffer = two_bursts(16000);
    ReducerConfig config;

    auto trimmed = trim_silence(buffer, config, ac::analysis::AnalyzerConfig{});
    REQUIRE(trimmed.has_value());
    REQUIRE(trimmed->cuts == 3);
    REQUIRE(trimmed->buffer.frame_count() == 19200);

    // The join sits between the two kept segments; both sides fade to zero
    const auto& out = trimmed->buffer.channel(0);
    REQUIRE(out[9599] == 0.0f);
    REQUIRE(out[9600] == 0.0f);

    config.trim_interior = false;
    auto edges_only = trim_silence(buffer, config, ac::analysis::AnalyzerConfig{});
    REQUIRE(edges_only.has_value());
    REQUIRE(edges_only->cuts == 2);
    REQUIRE(edges_only->buffer.frame_count() == 33600);
}

TEST_CASE("Short pauses survive trimming", "[cleanup][silence]") {
    ReducerConfig config;
    config.min_silence_ms = 2000.0;
    auto buffer = two_bursts(16000);
    auto spans = find_silent_spans(buffer, config, ac::analysis::AnalyzerConfig{});
    REQUIRE(spans.empty());
}

TEST_CASE("All-silent and silence-free clips are not trimmed", "[cleanup][silence]") {
    ReducerConfig config;
    auto silent = ac::audio::SignalBuffer::silence(2, 32000, 16000).value();
    auto a = trim_silence(silent, config, ac::analysis::AnalyzerConfig{});
    REQUIRE(a.has_value());
    REQUIRE(a->cuts == 0);
    REQUIRE(a->buffer.frame_count() == silent.frame_count());

    auto busy = ac::test::mono(ac::test::white_noise(0.3, 32000, 8), 16000);
    auto b = trim_silence(busy, config, ac::analysis::AnalyzerConfig{});
    REQUIRE(b.has_value());
    REQUIRE(b->removed_seconds == 0.0);
    REQUIRE(b->buffer.channel(0) == busy.channel(0));
}

TEST_CASE("Peak normalization targets the ceiling", "[cleanup][normalize]") {
    auto buffer = ac::test::stereo(ac::test::sine(440.0, 0.25, 8000, 16000),
                                   ac::test::sine(440.0, 0.1, 8000, 16000), 16000);
    const double ceiling = std::pow(10.0, -1.0 / 20.0);

    double gain = normalize_peak(buffer, -1.0);
    REQUIRE(gain == Approx(ceiling / 0.25).epsilon(0.01));
    REQUIRE(buffer.peak() == Approx(ceiling).epsilon(1e-4));
    // Channel balance is kept
    REQUIRE(ac::test::rms(buffer.channel(1)) / ac::test::rms(buffer.channel(0)) == Approx(0.4).epsilon(1e-3));

    double again = normalize_peak(buffer, -1.0);
    REQUIRE(again == Approx(1.0).epsilon(1e-4));

    auto silent = ac::audio::SignalBuffer::silence(1, 100, 16000).value();
    REQUIRE(normalize_peak(silent, -1.0) == 1.0);
    REQUIRE(silent.peak() == 0.0f);
}

TEST_CASE("Noise profile follows the quiet frames", "[cleanup][gate]") {
    ReducerConfig config;
    ac::analysis::AnalyzerConfig analysis;
    auto quiet = ac::test::white_noise(0.01, 32000, 3);
    auto loud = ac::test::white_noise(0.1, 32000, 3);

    auto quiet_profile = estimate_noise_profile(quiet.data(), quiet.size(), config, analysis);
    auto loud_profile = estimate_noise_profile(loud.data(), loud.size(), config, analysis);
    REQUIRE(quiet_profile.size() == config.fft_size / 2 + 1);

    double quiet_sum = 0.0, loud_sum = 0.0;
    for (size_t k = 0; k < quiet_profile.size(); ++k) {
        quiet_sum += quiet_profile[k];
        loud_sum += loud_profile[k];
    }
    // Same seed, ten times the amplitude
    REQUIRE(loud_sum / quiet_sum == Approx(10.0).epsilon(0.01));
}

TEST_CASE("Noise gate removes stationary noise and keeps the tone", "[cleanup][gate]") {
    auto buffer = ac::test::tone_in_noise(4.0, 1.0, 3.0, 16000, 0.01, 0.5);
    auto original = buffer.channel(0);

    apply_noise_gate(buffer, 1.0, ReducerConfig{}, ac::analysis::AnalyzerConfig{});
    const auto& gated = buffer.channel(0);

    // Noise-only head, away from the tone onset
    REQUIRE(ac::test::rms(gated, 1600, 8000) < 0.5 * ac::test::rms(original, 1600, 8000));
    // Tone body
    REQUIRE(ac::test::rms(gated, 24000, 16000) == Approx(ac::test::rms(original, 24000, 16000)).epsilon(0.05));
}

TEST_CASE("Zero strength gate is a no-op", "[cleanup][gate]") {
    auto buffer = ac::test::tone_in_noise(1.0, 0.2, 0.8, 16000);
    auto original = buffer.channel(0);
    apply_noise_gate(buffer, 0.0, ReducerConfig{}, ac::analysis::AnalyzerConfig{});
    REQUIRE(buffer.channel(0) == original);
}
