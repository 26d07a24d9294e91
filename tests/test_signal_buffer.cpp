#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "audio/signal_buffer.hpp"
#include "test_signals.hpp"
#include <limits>

using ac::ErrorKind;
using ac::audio::SignalBuffer;

TEST_CASE("SignalBuffer derives duration from frames and rate", "[signal_buffer]") {
    auto buffer = SignalBuffer::silence(2, 22050, 44100);
    REQUIRE(buffer.has_value());
    REQUIRE(buffer->channel_count() == 2);
    REQUIRE(buffer->frame_count() == 22050);
    REQUIRE(buffer->duration_seconds() == Catch::Approx(0.5));
    REQUIRE(buffer->peak() == 0.0f);
}

TEST_CASE("SignalBuffer rejects invalid layouts", "[signal_buffer]") {
    SECTION("no channels") {
        auto r = SignalBuffer::create({}, 44100);
        REQUIRE_FALSE(r.has_value());
        REQUIRE(r.error().kind == ErrorKind::InvalidParameter);
    }
    SECTION("zero sample rate") {
        auto r = SignalBuffer::create({{0.0f, 0.1f}}, 0);
        REQUIRE_FALSE(r.has_value());
        REQUIRE(r.error().kind == ErrorKind::InvalidParameter);
    }
    SECTION("unequal channel lengths") {
        auto r = SignalBuffer::create({{0.0f, 0.1f}, {0.0f}}, 8000);
        REQUIRE_FALSE(r.has_value());
        REQUIRE(r.error().kind == ErrorKind::InvalidParameter);
    }
    SECTION("non-finite sample") {
        auto r = SignalBuffer::create({{0.0f, std::numeric_limits<float>::quiet_NaN()}}, 8000);
        REQUIRE_FALSE(r.has_value());
        REQUIRE(r.error().kind == ErrorKind::InvalidParameter);
    }
    SECTION("out of range sample") {
        auto r = SignalBuffer::create({{1.5f}}, 8000);
        REQUIRE_FALSE(r.has_value());
    }
    SECTION("too many channels") {
        auto r = SignalBuffer::silence(9, 10, 8000);
        REQUIRE_FALSE(r.has_value());
    }
}

TEST_CASE("SignalBuffer interleaving round trip", "[signal_buffer]") {
    std::vector<float> interleaved{0.1f, -0.1f, 0.2f, -0.2f, 0.3f, -0.3f};
    auto buffer = SignalBuffer::from_interleaved(interleaved, 2, 48000);
    REQUIRE(buffer.has_value());
    REQUIRE(buffer->frame_count() == 3);
    REQUIRE(buffer->channel(0)[1] == 0.2f);
    REQUIRE(buffer->channel(1)[2] == -0.3f);
    REQUIRE(buffer->interleaved() == interleaved);
}

TEST_CASE("SignalBuffer from_interleaved clamps and validates", "[signal_buffer]") {
    auto clamped = SignalBuffer::from_interleaved({2.0f, -3.0f}, 1, 8000);
    REQUIRE(clamped.has_value());
    REQUIRE(clamped->channel(0)[0] == 1.0f);
    REQUIRE(clamped->channel(0)[1] == -1.0f);

    auto ragged = SignalBuffer::from_interleaved({0.0f, 0.0f, 0.0f}, 2, 8000);
    REQUIRE_FALSE(ragged.has_value());
    REQUIRE(ragged.error().kind == ErrorKind::CorruptData);

    auto nan = SignalBuffer::from_interleaved({std::numeric_limits<float>::infinity()}, 1, 8000);
    REQUIRE_FALSE(nan.has_value());
    REQUIRE(nan.error().kind == ErrorKind::CorruptData);
}

TEST_CASE("SignalBuffer slice copies a frame range", "[signal_buffer]") {
    auto buffer = ac::test::stereo({0.0f, 0.1f, 0.2f, 0.3f}, {0.0f, -0.1f, -0.2f, -0.3f}, 8000);
    auto part = buffer.slice(1, 2);
    REQUIRE(part.frame_count() == 2);
    REQUIRE(part.sample_rate() == 8000);
    REQUIRE(part.channel(0)[0] == 0.1f);
    REQUIRE(part.channel(1)[1] == -0.2f);
    REQUIRE(buffer.frame_count() == 4);
}

TEST_CASE("SignalBuffer peak and clamp", "[signal_buffer]") {
    auto buffer = ac::test::mono({0.25f, -0.75f, 0.5f}, 8000);
    REQUIRE(buffer.peak() == 0.75f);
    REQUIRE(buffer.all_finite());

    buffer.channel_data(0)[0] = 4.0f;
    buffer.clamp_to_unit();
    REQUIRE(buffer.channel(0)[0] == 1.0f);
}
