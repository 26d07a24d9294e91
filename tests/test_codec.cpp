#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "audio/ffmpeg_audio_decoder.hpp"
#include "audio/ffmpeg_audio_encoder.hpp"
#include "audio/ffmpeg_utils.hpp"
#include "test_signals.hpp"
#include <cerrno>
#include <cmath>

using ac::ErrorKind;
using ac::audio::AudioFormat;
using ac::audio::EncodeOptions;

namespace {

ac::audio::SignalBuffer stereo_tone(double seconds, uint32_t rate) {
    size_t frames = static_cast<size_t>(seconds * rate);
    return ac::test::stereo(ac::test::sine(440.0, 0.5, frames, rate),
                            ac::test::sine(660.0, 0.25, frames, rate), rate);
}

float max_abs_difference(const ac::audio::SignalBuffer& a, const ac::audio::SignalBuffer& b) {
    float worst = 0.0f;
    for (uint16_t ch = 0; ch < a.channel_count(); ++ch) {
        for (size_t i = 0; i < a.frame_count(); ++i) {
            worst = std::max(worst, std::fabs(a.channel(ch)[i] - b.channel(ch)[i]));
        }
    }
    return worst;
}

void require_lossless_round_trip(AudioFormat format, uint32_t bit_depth, float tolerance) {
    auto original = stereo_tone(0.25, 44100);
    EncodeOptions options;
    options.format = format;
    options.bit_depth = bit_depth;

    auto bytes = ac::audio::encode(original, options);
    REQUIRE(bytes.has_value());
    REQUIRE_FALSE(bytes->empty());

    auto decoded = ac::audio::decode(*bytes, ac::audio::format_to_string(format));
    REQUIRE(decoded.has_value());
    REQUIRE(decoded->sample_rate() == 44100);
    REQUIRE(decoded->channel_count() == 2);
    REQUIRE(decoded->frame_count() == original.frame_count());
    REQUIRE(max_abs_difference(original, *decoded) <= tolerance);
}

} // namespace

TEST_CASE("WAV round trip stays within quantization error", "[codec][wav]") {
    SECTION("16 bit") { require_lossless_round_trip(AudioFormat::WAV, 16, 1.0f / 32768.0f); }
    SECTION("24 bit") { require_lossless_round_trip(AudioFormat::WAV, 24, 2.0f / 8388608.0f); }
    SECTION("32 bit float") { require_lossless_round_trip(AudioFormat::WAV, 32, 0.0f); }
}

TEST_CASE("FLAC round trip stays within quantization error", "[codec][flac]") {
    if (!ac::audio::is_format_available(AudioFormat::FLAC)) {
        WARN("FLAC encoder not available in this FFmpeg build");
        return;
    }
    SECTION("16 bit") { require_lossless_round_trip(AudioFormat::FLAC, 16, 1.0f / 32768.0f); }
    SECTION("24 bit") { require_lossless_round_trip(AudioFormat::FLAC, 24, 2.0f / 8388608.0f); }
}

TEST_CASE("Lossy targets keep signal energy", "[codec][lossy]") {
    auto original = ac::test::sine_buffer(1000.0, 0.5, 1.0, 44100);
    const double original_rms = ac::test::rms(original.channel(0));

    for (AudioFormat format : {AudioFormat::MP3, AudioFormat::OGG, AudioFormat::M4A}) {
        if (!ac::audio::is_format_available(format)) {
            WARN("no encoder for " << ac::audio::format_to_string(format));
            continue;
        }
        INFO("format " << ac::audio::format_to_string(format));
        EncodeOptions options;
        options.format = format;
        options.bitrate_kbps = 192;

        auto bytes = ac::audio::encode(original, options);
        REQUIRE(bytes.has_value());

        auto decoded = ac::audio::decode(*bytes, ac::audio::format_to_string(format));
        REQUIRE(decoded.has_value());
        REQUIRE(decoded->sample_rate() == 44100);
        REQUIRE(decoded->channel_count() == 1);
        // Codec delay/padding adds a little, never drops a large share of the clip
        REQUIRE(decoded->duration_seconds() == Catch::Approx(1.0).margin(0.1));

        // Compare energy over the middle of the clip, away from codec delay
        const double decoded_rms = ac::test::rms(decoded->channel(0), 11025, 22050);
        REQUIRE(decoded_rms == Catch::Approx(original_rms).epsilon(0.15));
    }
}

TEST_CASE("Encoder validates options", "[codec]") {
    auto buffer = ac::test::sine_buffer(440.0, 0.5, 0.1, 44100);

    SECTION("unsupported WAV bit depth") {
        EncodeOptions options;
        options.bit_depth = 12;
        auto r = ac::audio::encode(buffer, options);
        REQUIRE_FALSE(r.has_value());
        REQUIRE(r.error().kind == ErrorKind::InvalidParameter);
    }
    SECTION("32 bit FLAC") {
        EncodeOptions options;
        options.format = AudioFormat::FLAC;
        options.bit_depth = 32;
        auto r = ac::audio::encode(buffer, options);
        REQUIRE_FALSE(r.has_value());
        REQUIRE(r.error().kind == ErrorKind::InvalidParameter);
    }
    SECTION("lossy bitrate outside the whitelist") {
        EncodeOptions options;
        options.format = AudioFormat::MP3;
        options.bitrate_kbps = 100;
        auto r = ac::audio::encode(buffer, options);
        REQUIRE_FALSE(r.has_value());
        REQUIRE(r.error().kind == ErrorKind::InvalidParameter);
    }
    SECTION("empty buffer") {
        auto empty = ac::audio::SignalBuffer::silence(1, 0, 44100).value();
        auto r = ac::audio::encode(empty, EncodeOptions{});
        REQUIRE_FALSE(r.has_value());
        REQUIRE(r.error().kind == ErrorKind::EmptyInput);
    }
}

TEST_CASE("Decoder rejects unparseable input", "[codec][decode]") {
    SECTION("empty") {
        auto r = ac::audio::decode({}, "wav");
        REQUIRE_FALSE(r.has_value());
        REQUIRE(r.error().kind == ErrorKind::UnsupportedFormat);
    }
    SECTION("text bytes") {
        const std::string text = "plain text, no audio in here. ";
        std::vector<uint8_t> junk;
        while (junk.size() < 4096) {
            junk.insert(junk.end(), text.begin(), text.end());
        }
        auto r = ac::audio::decode(junk, "");
        REQUIRE_FALSE(r.has_value());
        REQUIRE(ac::is_decode_error(r.error().kind));
    }
}

TEST_CASE("Truncated WAV is reported as corrupt data", "[codec][decode]") {
    auto buffer = ac::test::sine_buffer(440.0, 0.5, 1.0, 44100);
    auto bytes = ac::audio::encode(buffer, EncodeOptions{});
    REQUIRE(bytes.has_value());

    std::vector<uint8_t> truncated(bytes->begin(), bytes->begin() + static_cast<std::ptrdiff_t>(bytes->size() / 2));
    auto r = ac::audio::decode(truncated, "wav");
    REQUIRE_FALSE(r.has_value());
    REQUIRE(r.error().kind == ErrorKind::CorruptData);
}

TEST_CASE("Unknown hint falls back to content probing", "[codec][decode]") {
    auto buffer = ac::test::sine_buffer(440.0, 0.5, 0.2, 16000);
    auto bytes = ac::audio::encode(buffer, EncodeOptions{});
    REQUIRE(bytes.has_value());

    auto decoded = ac::audio::decode(*bytes, "definitely-not-a-format");
    REQUIRE(decoded.has_value());
    REQUIRE(decoded->frame_count() == buffer.frame_count());
}

TEST_CASE("Probe reports container and stream details", "[codec][probe]") {
    auto buffer = stereo_tone(0.5, 48000);
    auto bytes = ac::audio::encode(buffer, EncodeOptions{});
    REQUIRE(bytes.has_value());

    auto info = ac::audio::probe(*bytes, "wav");
    REQUIRE(info.has_value());
    REQUIRE(info->format_name == "wav");
    REQUIRE(info->codec_name == "pcm_s16le");
    REQUIRE(info->channels == 2);
    REQUIRE(info->sample_rate == 48000);
    REQUIRE(info->bit_depth == 16);
    REQUIRE(info->byte_size == bytes->size());
    REQUIRE(info->duration_seconds == Catch::Approx(0.5).margin(0.01));
}

TEST_CASE("FFmpeg return codes are described as text", "[codec][errors]") {
    REQUIRE(ac::audio::ffmpeg_error_string(AVERROR_EOF) == "End of file");
    REQUIRE(ac::audio::ffmpeg_error_string(AVERROR_INVALIDDATA).find("Invalid data") != std::string::npos);
    REQUIRE_FALSE(ac::audio::ffmpeg_error_string(AVERROR(EINVAL)).empty());
}
