#include "cleanup/normalizer.hpp"
#include "dsp/framing.hpp"
#include <algorithm>

namespace ac::cleanup {

double normalize_peak(audio::SignalBuffer& buffer, double ceiling_db) {
    const float peak = buffer.peak();
    if (!(peak > 0.0f)) {
        return 1.0;
    }
    const double target = std::min(1.0, dsp::from_db(ceiling_db));
    const double gain = target / static_cast<double>(peak);
    const float limit = static_cast<float>(target);

    for (uint16_t ch = 0; ch < buffer.channel_count(); ++ch) {
        float* data = buffer.channel_data(ch);
        for (size_t i = 0; i < buffer.frame_count(); ++i) {
            data[i] = std::clamp(static_cast<float>(data[i] * gain), -limit, limit);
        }
    }
    return gain;
}

} // namespace ac::cleanup
