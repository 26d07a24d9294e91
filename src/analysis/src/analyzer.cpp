#include "analysis/analyzer.hpp"
#include "core/log_config.hpp"
#include "dsp/framing.hpp"
#include "dsp/stft.hpp"
#include <algorithm>
#include <cmath>
#include <string>

namespace ac::analysis {

const char* to_string(IssueTag tag) {
    switch (tag) {
        case IssueTag::TooQuiet: return "too_quiet";
        case IssueTag::Clipping: return "clipping";
        case IssueTag::HighNoiseFloor: return "high_noise_floor";
        case IssueTag::ExcessiveSilence: return "excessive_silence";
        case IssueTag::LowSnr: return "low_snr";
    }
    return "unknown";
}

const char* to_string(Rating rating) {
    switch (rating) {
        case Rating::Excellent: return "excellent";
        case Rating::Good: return "good";
        case Rating::Fair: return "fair";
        case Rating::Poor: return "poor";
    }
    return "unknown";
}

bool QualityAssessment::operator==(const QualityAssessment& other) const {
    return score == other.score && rating == other.rating && issues == other.issues;
}

bool AnalysisResult::operator==(const AnalysisResult& other) const {
    return duration_seconds == other.duration_seconds &&
           sample_rate == other.sample_rate &&
           peak_db == other.peak_db &&
           average_rms_db == other.average_rms_db &&
           estimated_noise_floor_db == other.estimated_noise_floor_db &&
           estimated_snr_db == other.estimated_snr_db &&
           silence_percentage == other.silence_percentage &&
           peak_amplitude == other.peak_amplitude &&
           average_rms == other.average_rms &&
           zero_crossing_rate == other.zero_crossing_rate &&
           spectral_centroid_hz == other.spectral_centroid_hz &&
           quality == other.quality;
}

size_t SilenceMap::silent_frames() const {
    return static_cast<size_t>(std::count(silent.begin(), silent.end(), true));
}

SilenceMap detect_silence(const audio::SignalBuffer& buffer, const AnalyzerConfig& config) {
    SilenceMap map;
    map.frame_length = dsp::frame_length(buffer.sample_rate(), config.frame_ms);

    auto levels = dsp::frame_rms(buffer, map.frame_length);
    map.noise_floor_db = dsp::to_db(dsp::low_percentile_rms(levels, config.noise_percentile), config.floor_db);
    map.threshold_db = std::min(map.noise_floor_db + config.silence_margin_db, config.silence_ceiling_db);

    map.frame_db.reserve(levels.size());
    map.silent.reserve(levels.size());
    for (double level : levels) {
        double db = dsp::to_db(level, config.floor_db);
        map.frame_db.push_back(db);
        map.silent.push_back(db < map.threshold_db);
    }
    return map;
}

namespace {

double joint_rms(const audio::SignalBuffer& buffer) {
    double sum = 0.0;
    for (uint16_t ch = 0; ch < buffer.channel_count(); ++ch) {
        for (float s : buffer.channel(ch)) {
            sum += static_cast<double>(s) * s;
        }
    }
    double n = static_cast<double>(buffer.frame_count()) * buffer.channel_count();
    return n > 0.0 ? std::sqrt(sum / n) : 0.0;
}

double zero_crossing_rate(const audio::SignalBuffer& buffer) {
    if (buffer.frame_count() < 2) {
        return 0.0;
    }
    double total = 0.0;
    for (uint16_t ch = 0; ch < buffer.channel_count(); ++ch) {
        const auto& data = buffer.channel(ch);
        size_t crossings = 0;
        for (size_t i = 1; i < data.size(); ++i) {
            if ((data[i - 1] < 0.0f) != (data[i] < 0.0f)) {
                ++crossings;
            }
        }
        total += static_cast<double>(crossings) / static_cast<double>(data.size() - 1);
    }
    return total / buffer.channel_count();
}

} // anonymous namespace

Analyzer::Analyzer(AnalyzerConfig config) : config_(config) {}

double Analyzer::spectral_centroid(const audio::SignalBuffer& buffer) const {
    size_t fft_size = std::max<size_t>(16, config_.spectrum_fft_size & ~size_t{1});

    // Mono mixdown
    std::vector<float> mono(buffer.frame_count(), 0.0f);
    const float scale = 1.0f / static_cast<float>(buffer.channel_count());
    for (uint16_t ch = 0; ch < buffer.channel_count(); ++ch) {
        const float* data = buffer.channel_data(ch);
        for (size_t i = 0; i < mono.size(); ++i) {
            mono[i] += data[i] * scale;
        }
    }

    dsp::Stft stft(fft_size, fft_size / 2);
    std::vector<double> average(stft.bins(), 0.0);
    std::vector<double> magnitude;
    const size_t frames = stft.frame_count(mono.size());
    for (size_t frame = 0; frame < frames; ++frame) {
        stft.analyze_frame(mono.data(), mono.size(), frame, magnitude);
        for (size_t k = 0; k < average.size(); ++k) {
            average[k] += magnitude[k];
        }
    }

    double weighted = 0.0;
    double total = 0.0;
    const double bin_hz = static_cast<double>(buffer.sample_rate()) / static_cast<double>(fft_size);
    for (size_t k = 0; k < average.size(); ++k) {
        weighted += average[k] * bin_hz * static_cast<double>(k);
        total += average[k];
    }
    return total > 0.0 ? weighted / total : 0.0;
}

Result<AnalysisResult> Analyzer::analyze(const audio::SignalBuffer& buffer) const {
    if (buffer.empty()) {
        return fail(ErrorKind::EmptyInput, "cannot analyze an empty buffer");
    }

    AnalysisResult result;
    result.duration_seconds = buffer.duration_seconds();
    result.sample_rate = buffer.sample_rate();

    result.peak_amplitude = buffer.peak();
    result.peak_db = dsp::to_db(result.peak_amplitude, config_.floor_db);

    result.average_rms = joint_rms(buffer);
    result.average_rms_db = dsp::to_db(result.average_rms, config_.floor_db);

    SilenceMap silence = detect_silence(buffer, config_);
    result.estimated_noise_floor_db = silence.noise_floor_db;
    result.estimated_snr_db = std::max(0.0, result.average_rms_db - result.estimated_noise_floor_db);
    result.silence_percentage = silence.silent.empty() ? 0.0
        : 100.0 * static_cast<double>(silence.silent_frames()) / static_cast<double>(silence.silent.size());

    result.zero_crossing_rate = zero_crossing_rate(buffer);
    result.spectral_centroid_hz = spectral_centroid(buffer);

    result.quality = assess(result);

    AC_DSP_TRACE("analyze: peak " + std::to_string(result.peak_db) + " dB, floor " +
                 std::to_string(result.estimated_noise_floor_db) + " dB, silence " +
                 std::to_string(result.silence_percentage) + "%");
    return result;
}

QualityAssessment Analyzer::assess(const AnalysisResult& metrics) const {
    QualityAssessment quality;
    int score = 100;

    if (metrics.peak_db > config_.clipping_peak_db) {
        score -= config_.clipping_deduction;
        quality.issues.insert(IssueTag::Clipping);
    }
    if (metrics.average_rms_db < config_.too_quiet_rms_db) {
        score -= config_.too_quiet_deduction;
        quality.issues.insert(IssueTag::TooQuiet);
    }
    if (metrics.estimated_noise_floor_db > config_.high_noise_floor_db) {
        score -= config_.high_noise_floor_deduction;
        quality.issues.insert(IssueTag::HighNoiseFloor);
    }
    if (metrics.estimated_snr_db < config_.low_snr_db) {
        score -= config_.low_snr_deduction;
        quality.issues.insert(IssueTag::LowSnr);
    }
    if (metrics.silence_percentage > config_.excessive_silence_pct) {
        score -= config_.excessive_silence_deduction;
        quality.issues.insert(IssueTag::ExcessiveSilence);
    }

    quality.score = std::clamp(score, 0, 100);
    if (quality.score >= 80) {
        quality.rating = Rating::Excellent;
    } else if (quality.score >= 60) {
        quality.rating = Rating::Good;
    } else if (quality.score >= 40) {
        quality.rating = Rating::Fair;
    } else {
        quality.rating = Rating::Poor;
    }
    return quality;
}

Result<AnalysisResult> analyze(const audio::SignalBuffer& buffer, const AnalyzerConfig& config) {
    return Analyzer(config).analyze(buffer);
}

} // namespace ac::analysis
