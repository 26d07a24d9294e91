#pragma once

#include <cstddef>

namespace ac::cleanup {

/**
 * @brief Policy constants for the reduction stages
 *
 * Defaults are tuned for speech recorded at 16-48 kHz. The silence
 * detector thresholds live in analysis::AnalyzerConfig and are shared
 * with the analyzer so both agree on what counts as silence.
 */
struct ReducerConfig {
    // Spectral noise gate
    size_t fft_size{2048};
    size_t hop_size{512};
    double over_subtraction{2.0};       ///< Profile multiple removed at strength 1

    // Click suppression
    double click_threshold{8.0};        ///< Jump threshold as a multiple of mean |x[n]-x[n-1]|
    double click_min_jump{0.05};        ///< Absolute lower bound on the jump threshold
    double max_click_ms{2.0};           ///< Longest outlier run that is repaired

    // Echo reduction
    double echo_min_delay_ms{20.0};
    double echo_max_delay_ms{500.0};
    double echo_min_correlation{0.1};   ///< Below this the stage leaves the channel alone
    double echo_damping{0.8};           ///< Fraction of the estimated echo gain removed
    double echo_analysis_window_s{30.0};

    // Silence trimming
    double min_silence_ms{300.0};
    double guard_ms{50.0};              ///< Silence kept on each side of a cut
    double fade_ms{5.0};                ///< Linear fade applied at interior cuts
    bool trim_interior{true};

    // Normalization
    double normalize_ceiling_db{-1.0};
};

} // namespace ac::cleanup
