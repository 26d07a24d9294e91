#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "dsp/resampler.hpp"
#include "test_signals.hpp"

using Catch::Approx;
using ac::ErrorKind;
using ac::dsp::resample;
using ac::dsp::resampled_length;

TEST_CASE("resampled_length rounds to the nearest frame", "[dsp][resample]") {
    REQUIRE(resampled_length(44100, 44100, 22050) == 22050);
    REQUIRE(resampled_length(16000, 16000, 48000) == 48000);
    REQUIRE(resampled_length(1000, 44100, 48000) == 1088);
    REQUIRE(resampled_length(0, 44100, 48000) == 0);
}

TEST_CASE("Downsampling keeps length exact and tone energy", "[dsp][resample]") {
    auto input = ac::test::sine_buffer(1000.0, 0.5, 1.0, 44100);
    auto output = resample(input, 22050);
    REQUIRE(output.has_value());
    REQUIRE(output->sample_rate() == 22050);
    REQUIRE(output->frame_count() == 22050);
    REQUIRE(ac::test::rms(output->channel(0), 1000, 20000) == Approx(0.5 / std::sqrt(2.0)).epsilon(0.05));
}

TEST_CASE("Upsampling stereo keeps both channels", "[dsp][resample]") {
    const size_t frames = 16000;
    auto input = ac::test::stereo(ac::test::sine(500.0, 0.4, frames, 16000),
                                  ac::test::sine(500.0, 0.2, frames, 16000), 16000);
    auto output = resample(input, 48000);
    REQUIRE(output.has_value());
    REQUIRE(output->channel_count() == 2);
    REQUIRE(output->frame_count() == 48000);
    REQUIRE(ac::test::rms(output->channel(0), 3000, 42000) == Approx(0.4 / std::sqrt(2.0)).epsilon(0.05));
    REQUIRE(ac::test::rms(output->channel(1), 3000, 42000) == Approx(0.2 / std::sqrt(2.0)).epsilon(0.05));
}

TEST_CASE("Matching rate returns the samples unchanged", "[dsp][resample]") {
    auto input = ac::test::sine_buffer(440.0, 0.5, 0.1, 44100);
    auto output = resample(input, 44100);
    REQUIRE(output.has_value());
    REQUIRE(output->channel(0) == input.channel(0));
}

TEST_CASE("Zero target rate is rejected", "[dsp][resample]") {
    auto input = ac::test::sine_buffer(440.0, 0.5, 0.1, 44100);
    auto output = resample(input, 0);
    REQUIRE_FALSE(output.has_value());
    REQUIRE(output.error().kind == ErrorKind::InvalidParameter);
}
