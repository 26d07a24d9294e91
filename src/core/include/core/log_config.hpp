#pragma once
#include <string>

// Compile-time switches for verbose logging.
// Define AC_DSP_DEBUG (e.g. via compiler flags) to log per-stage DSP decisions.

namespace ac { namespace log { void debug(const std::string&) noexcept; } }

#if defined(AC_DSP_DEBUG)
  #define AC_DSP_TRACE(msg) ::ac::log::debug(msg)
#else
  #define AC_DSP_TRACE(msg) do {} while(0)
#endif
