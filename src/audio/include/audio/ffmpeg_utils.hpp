#pragma once

#include <string>

extern "C" {
#include <libavutil/error.h>
}

namespace ac::audio {

/// Text for an FFmpeg/libswresample return code ("Invalid argument", ...)
inline std::string ffmpeg_error_string(int error_code) {
    char error_buf[AV_ERROR_MAX_STRING_SIZE] = {0};
    av_make_error_string(error_buf, AV_ERROR_MAX_STRING_SIZE, error_code);
    return std::string(error_buf);
}

} // namespace ac::audio
