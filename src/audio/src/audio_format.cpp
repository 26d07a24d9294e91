#include "audio/audio_format.hpp"
#include <algorithm>
#include <cctype>

namespace ac::audio {

namespace {

std::string lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

} // anonymous namespace

Result<AudioFormat> parse_format(const std::string& name) {
    std::string key = lower(name);
    if (!key.empty() && key.front() == '.') key.erase(0, 1);

    if (key == "mp3") return AudioFormat::MP3;
    if (key == "wav" || key == "wave") return AudioFormat::WAV;
    if (key == "ogg" || key == "oga") return AudioFormat::OGG;
    if (key == "flac") return AudioFormat::FLAC;
    if (key == "m4a" || key == "aac") return AudioFormat::M4A;

    return fail(ErrorKind::UnsupportedFormat, "unknown target format '" + name + "'");
}

Result<uint32_t> parse_bitrate(const std::string& text) {
    std::string key = lower(text);
    if (!key.empty() && key.back() == 'k') key.pop_back();

    if (key.empty() || key.size() > 6 ||
        !std::all_of(key.begin(), key.end(), [](unsigned char c) { return std::isdigit(c) != 0; })) {
        return fail(ErrorKind::InvalidParameter, "malformed bitrate '" + text + "'");
    }

    uint32_t kbps = static_cast<uint32_t>(std::stoul(key));
    if (kbps == 0) {
        return fail(ErrorKind::InvalidParameter, "bitrate must be positive");
    }
    return kbps;
}

bool is_lossless(AudioFormat format) {
    return format == AudioFormat::WAV || format == AudioFormat::FLAC;
}

bool is_valid_lossy_bitrate(uint32_t kbps) {
    return std::find(kLossyBitrates.begin(), kLossyBitrates.end(), kbps) != kLossyBitrates.end();
}

std::string format_to_string(AudioFormat format) {
    switch (format) {
        case AudioFormat::MP3: return "mp3";
        case AudioFormat::WAV: return "wav";
        case AudioFormat::OGG: return "ogg";
        case AudioFormat::FLAC: return "flac";
        case AudioFormat::M4A: return "m4a";
    }
    return "unknown";
}

std::string file_extension(AudioFormat format) {
    return "." + format_to_string(format);
}

const char* muxer_name(AudioFormat format) {
    switch (format) {
        case AudioFormat::MP3: return "mp3";
        case AudioFormat::WAV: return "wav";
        case AudioFormat::OGG: return "ogg";
        case AudioFormat::FLAC: return "flac";
        case AudioFormat::M4A: return "ipod";
    }
    return "";
}

} // namespace ac::audio
