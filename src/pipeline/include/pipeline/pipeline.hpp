/**
 * Entry points of the processing core
 *
 * Bytes in, bytes/metrics out. Every call is a pure function of its
 * arguments and the pipeline's immutable configuration, so one Pipeline
 * may be shared by any number of threads.
 */

#pragma once

#include "analysis/analyzer.hpp"
#include "audio/ffmpeg_audio_decoder.hpp"
#include "audio/signal_buffer.hpp"
#include "cleanup/reducer.hpp"
#include "convert/format_converter.hpp"
#include "core/error.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace ac::pipeline {

struct PipelineConfig {
    analysis::AnalyzerConfig analyzer;
    cleanup::ReducerConfig reducer;
    convert::ConverterLimits limits;
};

class Pipeline {
public:
    explicit Pipeline(PipelineConfig config = {});

    /// Decode an uploaded/recorded file; the hint is a container preference
    Result<audio::SignalBuffer> ingest(const std::vector<uint8_t>& bytes, const std::string& format_hint = "") const;

    Result<audio::MediaInfo> probe(const std::vector<uint8_t>& bytes, const std::string& format_hint = "") const;

    Result<analysis::AnalysisResult> analyze(const audio::SignalBuffer& buffer) const;

    Result<cleanup::ReductionResult> reduce(const audio::SignalBuffer& buffer,
                                            const cleanup::ReductionOptions& options) const;

    Result<std::vector<uint8_t>> convert(const audio::SignalBuffer& buffer,
                                         const convert::ConversionOptions& options) const;

    const PipelineConfig& config() const { return config_; }

private:
    PipelineConfig config_;
};

} // namespace ac::pipeline
