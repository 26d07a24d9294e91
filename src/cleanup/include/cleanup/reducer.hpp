/**
 * Noise/artifact reduction chain
 *
 * Stages run in a fixed order, each gated by the options:
 *   1. spectral noise gate (scaled by strength, skipped at 0)
 *   2. click suppression      (remove_clicks)
 *   3. echo reduction         (reduce_echo)
 *   4. silence trimming       (remove_silence, the only length-changing stage)
 *   5. peak normalization     (normalize)
 *
 * The input buffer is never modified; the chain works on a private copy.
 * Sample rate and channel count are preserved.
 */

#pragma once

#include "analysis/analyzer.hpp"
#include "audio/signal_buffer.hpp"
#include "cleanup/reducer_config.hpp"
#include "core/error.hpp"
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace ac::cleanup {

struct ReductionOptions {
    double strength{0.75};      ///< Noise gate amount, 0..1
    bool remove_clicks{false};
    bool reduce_echo{false};
    bool remove_silence{false};
    bool normalize{false};
};

enum class Stage {
    NoiseGate,
    ClickSuppression,
    EchoReduction,
    SilenceTrim,
    Normalization
};

const char* to_string(Stage stage);

struct ReductionReport {
    double original_duration_seconds{0.0};
    double processed_duration_seconds{0.0};
    uint32_t sample_rate{0};
    size_t clicks_repaired{0};
    double echo_delay_ms{0.0};          ///< 0 when no echo was detected
    double echo_gain{0.0};
    double silence_removed_seconds{0.0};
    double normalization_gain{1.0};
    std::vector<Stage> stages;          ///< Stages that ran, in order
};

struct ReductionResult {
    audio::SignalBuffer buffer;
    ReductionReport report;
};

/// InvalidOptions unless 0 <= strength <= 1
Result<bool> validate(const ReductionOptions& options);

class Reducer {
public:
    explicit Reducer(ReducerConfig config = {}, analysis::AnalyzerConfig analysis = {});

    /**
     * @return InvalidOptions for a bad strength, EmptyInput for a zero-frame
     *         buffer, ProcessingError if a stage leaves non-finite samples
     */
    Result<ReductionResult> reduce(const audio::SignalBuffer& buffer, const ReductionOptions& options) const;

    const ReducerConfig& config() const { return config_; }

private:
    ReducerConfig config_;
    analysis::AnalyzerConfig analysis_;
};

/// Reducer(config, analysis).reduce(buffer, options)
Result<ReductionResult> reduce(const audio::SignalBuffer& buffer, const ReductionOptions& options,
                               const ReducerConfig& config = {},
                               const analysis::AnalyzerConfig& analysis = {});

} // namespace ac::cleanup
