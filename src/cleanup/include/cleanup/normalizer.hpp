#pragma once

#include "audio/signal_buffer.hpp"

namespace ac::cleanup {

/**
 * @brief Scale all channels by one gain so the peak sits at ceiling_db
 *
 * A silent buffer is left unchanged.
 * @return Linear gain applied (1.0 when nothing was done)
 */
double normalize_peak(audio::SignalBuffer& buffer, double ceiling_db);

} // namespace ac::cleanup
