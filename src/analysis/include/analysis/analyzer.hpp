/**
 * Clip quality analysis
 *
 * Objective level/noise/silence metrics for a whole clip plus a derived
 * quality assessment (score, rating and issue tags) computed from fixed
 * thresholds. Results are a pure function of the buffer and the config.
 */

#pragma once

#include "audio/signal_buffer.hpp"
#include "core/error.hpp"
#include <cstddef>
#include <cstdint>
#include <set>
#include <vector>

namespace ac::analysis {

enum class IssueTag {
    TooQuiet,
    Clipping,
    HighNoiseFloor,
    ExcessiveSilence,
    LowSnr
};

enum class Rating {
    Excellent,  ///< score >= 80
    Good,       ///< score >= 60
    Fair,       ///< score >= 40
    Poor
};

const char* to_string(IssueTag tag);
const char* to_string(Rating rating);

/**
 * @brief Analysis thresholds and policy constants
 */
struct AnalyzerConfig {
    double frame_ms{50.0};                  ///< Frame length for noise floor and silence
    double noise_percentile{0.10};          ///< Lowest-energy fraction of frames defining the floor
    double floor_db{-96.0};                 ///< Sentinel for silence / log of zero
    double silence_margin_db{3.0};          ///< Silent if below noise floor + margin ...
    double silence_ceiling_db{-40.0};       ///< ... and never above this absolute level
    size_t spectrum_fft_size{2048};         ///< Transform size for the spectral centroid

    // Issue thresholds
    double clipping_peak_db{-1.0};
    double too_quiet_rms_db{-30.0};
    double high_noise_floor_db{-40.0};
    double low_snr_db{15.0};
    double excessive_silence_pct{50.0};

    // Score deductions
    int clipping_deduction{20};
    int too_quiet_deduction{15};
    int high_noise_floor_deduction{20};
    int low_snr_deduction{25};
    int excessive_silence_deduction{10};
};

struct QualityAssessment {
    int score{100};
    Rating rating{Rating::Excellent};
    std::set<IssueTag> issues;

    bool has_issue(IssueTag tag) const { return issues.count(tag) != 0; }
    bool operator==(const QualityAssessment& other) const;
};

struct AnalysisResult {
    double duration_seconds{0.0};
    uint32_t sample_rate{0};
    double peak_db{0.0};
    double average_rms_db{0.0};
    double estimated_noise_floor_db{0.0};
    double estimated_snr_db{0.0};
    double silence_percentage{0.0};     ///< 0..100

    double peak_amplitude{0.0};         ///< Linear
    double average_rms{0.0};            ///< Linear
    double zero_crossing_rate{0.0};     ///< Crossings per sample, mean over channels
    double spectral_centroid_hz{0.0};

    QualityAssessment quality;

    bool operator==(const AnalysisResult& other) const;
    bool operator!=(const AnalysisResult& other) const { return !(*this == other); }
};

/**
 * @brief Frame-level silence map shared by the analyzer and the silence trimmer
 */
struct SilenceMap {
    size_t frame_length{0};             ///< Samples per frame
    std::vector<double> frame_db;       ///< Joint RMS per frame, floored
    double noise_floor_db{0.0};
    double threshold_db{0.0};
    std::vector<bool> silent;

    size_t silent_frames() const;
};

/// Classify every frame of the clip as silent or not
SilenceMap detect_silence(const audio::SignalBuffer& buffer, const AnalyzerConfig& config);

class Analyzer {
public:
    explicit Analyzer(AnalyzerConfig config = {});

    /**
     * @brief Compute all metrics and the quality assessment
     * @return EmptyInput for a zero-frame buffer
     */
    Result<AnalysisResult> analyze(const audio::SignalBuffer& buffer) const;

    /// Apply thresholds/deductions to already computed metrics
    QualityAssessment assess(const AnalysisResult& metrics) const;

    const AnalyzerConfig& config() const { return config_; }

private:
    double spectral_centroid(const audio::SignalBuffer& buffer) const;

    AnalyzerConfig config_;
};

/// Analyzer(config).analyze(buffer)
Result<AnalysisResult> analyze(const audio::SignalBuffer& buffer, const AnalyzerConfig& config = {});

} // namespace ac::analysis
