#include "cleanup/reducer.hpp"
#include "cleanup/click_suppressor.hpp"
#include "cleanup/echo_reducer.hpp"
#include "cleanup/noise_gate.hpp"
#include "cleanup/normalizer.hpp"
#include "cleanup/silence_trimmer.hpp"
#include "core/log.hpp"
#include <cmath>

namespace ac::cleanup {

const char* to_string(Stage stage) {
    switch (stage) {
        case Stage::NoiseGate: return "noise_gate";
        case Stage::ClickSuppression: return "click_suppression";
        case Stage::EchoReduction: return "echo_reduction";
        case Stage::SilenceTrim: return "silence_trim";
        case Stage::Normalization: return "normalization";
    }
    return "unknown";
}

Result<bool> validate(const ReductionOptions& options) {
    if (!(options.strength >= 0.0 && options.strength <= 1.0)) {
        return fail(ErrorKind::InvalidOptions,
                    "strength must be within [0, 1], got " + std::to_string(options.strength));
    }
    return true;
}

namespace {

// Every stage must hand on finite samples within [-1, 1]
Result<bool> finish_stage(audio::SignalBuffer& buffer, Stage stage) {
    if (!buffer.all_finite()) {
        ac::log::error(std::string("Stage produced non-finite samples: ") + to_string(stage));
        return fail(ErrorKind::ProcessingError,
                    std::string(to_string(stage)) + " produced non-finite samples");
    }
    buffer.clamp_to_unit();
    return true;
}

} // anonymous namespace

Reducer::Reducer(ReducerConfig config, analysis::AnalyzerConfig analysis)
    : config_(config), analysis_(analysis) {}

Result<ReductionResult> Reducer::reduce(const audio::SignalBuffer& buffer, const ReductionOptions& options) const {
    auto valid = validate(options);
    if (!valid) {
        return make_unexpected(std::move(valid).error());
    }
    if (buffer.empty()) {
        return fail(ErrorKind::EmptyInput, "cannot reduce an empty buffer");
    }
    if (config_.fft_size < 2 || config_.hop_size == 0 || config_.hop_size > config_.fft_size) {
        return fail(ErrorKind::InvalidOptions, "invalid STFT configuration");
    }

    ReductionResult result{buffer, {}};
    ReductionReport& report = result.report;
    report.original_duration_seconds = buffer.duration_seconds();
    report.sample_rate = buffer.sample_rate();

    auto run = [&](Stage stage) -> Result<bool> {
        report.stages.push_back(stage);
        return finish_stage(result.buffer, stage);
    };

    if (options.strength > 0.0) {
        apply_noise_gate(result.buffer, options.strength, config_, analysis_);
        auto ok = run(Stage::NoiseGate);
        if (!ok) return make_unexpected(std::move(ok).error());
    }

    if (options.remove_clicks) {
        report.clicks_repaired = suppress_clicks(result.buffer, config_);
        auto ok = run(Stage::ClickSuppression);
        if (!ok) return make_unexpected(std::move(ok).error());
    }

    if (options.reduce_echo) {
        EchoEstimate echo = reduce_echo(result.buffer, config_);
        if (echo.detected) {
            report.echo_delay_ms = 1000.0 * static_cast<double>(echo.delay_samples) / buffer.sample_rate();
            report.echo_gain = echo.gain;
        }
        auto ok = run(Stage::EchoReduction);
        if (!ok) return make_unexpected(std::move(ok).error());
    }

    if (options.remove_silence) {
        auto trimmed = trim_silence(result.buffer, config_, analysis_);
        if (!trimmed) {
            return make_unexpected(std::move(trimmed).error());
        }
        report.silence_removed_seconds = trimmed->removed_seconds;
        result.buffer = std::move(trimmed->buffer);
        auto ok = run(Stage::SilenceTrim);
        if (!ok) return make_unexpected(std::move(ok).error());
    }

    if (options.normalize) {
        report.normalization_gain = normalize_peak(result.buffer, config_.normalize_ceiling_db);
        auto ok = run(Stage::Normalization);
        if (!ok) return make_unexpected(std::move(ok).error());
    }

    report.processed_duration_seconds = result.buffer.duration_seconds();
    ac::log::debug("Reduction applied " + std::to_string(report.stages.size()) + " stages, " +
                   std::to_string(report.clicks_repaired) + " clicks repaired, " +
                   std::to_string(report.silence_removed_seconds) + " s silence removed");
    return result;
}

Result<ReductionResult> reduce(const audio::SignalBuffer& buffer, const ReductionOptions& options,
                               const ReducerConfig& config,
                               const analysis::AnalyzerConfig& analysis) {
    return Reducer(config, analysis).reduce(buffer, options);
}

} // namespace ac::cleanup
