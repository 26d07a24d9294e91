/**
 * @file audio_format.hpp
 * @brief Target container/codec vocabulary shared by the encoder and converter
 */

#pragma once

#include "core/error.hpp"
#include <array>
#include <cstdint>
#include <string>

namespace ac::audio {

/**
 * @brief Output container/codec targets
 */
enum class AudioFormat {
    MP3,        ///< MPEG-1 Audio Layer III
    WAV,        ///< RIFF/WAVE, linear PCM or IEEE float
    OGG,        ///< Ogg Vorbis
    FLAC,       ///< Free Lossless Audio Codec
    M4A         ///< AAC in an MP4 (ipod) container
};

/// Lossy bitrates accepted for MP3/OGG/M4A, in kbps
inline constexpr std::array<uint32_t, 4> kLossyBitrates = {128, 192, 256, 320};
inline constexpr uint32_t kDefaultBitrateKbps = 192;

/**
 * @brief Parse a format name ("mp3", "WAV", "aac" -> M4A, ...)
 * @return UnsupportedFormat for unknown names
 */
Result<AudioFormat> parse_format(const std::string& name);

/**
 * @brief Parse a bitrate string ("192k", "320K", "256")
 * @return InvalidParameter if the text is not a positive kbps value
 */
Result<uint32_t> parse_bitrate(const std::string& text);

bool is_lossless(AudioFormat format);
bool is_valid_lossy_bitrate(uint32_t kbps);

std::string format_to_string(AudioFormat format);
std::string file_extension(AudioFormat format);

/// FFmpeg muxer short name for the container ("ipod" for M4A)
const char* muxer_name(AudioFormat format);

} // namespace ac::audio
