#include "pipeline/pipeline.hpp"
#include "core/log.hpp"
#include <sstream>

namespace ac::pipeline {

namespace {

std::string describe_buffer(const audio::SignalBuffer& buffer) {
    std::ostringstream oss;
    oss << buffer.duration_seconds() << " s, " << buffer.sample_rate() << " Hz, "
        << buffer.channel_count() << " ch";
    return oss.str();
}

template <class T>
void log_failure(const char* operation, const Result<T>& result) {
    if (result) {
        return;
    }
    const Error& err = result.error();
    std::string message = std::string(operation) + " failed: " + describe(err);
    if (err.kind == ErrorKind::ProcessingError) {
        ac::log::error(message);
    } else {
        ac::log::warn(message);
    }
}

} // anonymous namespace

Pipeline::Pipeline(PipelineConfig config) : config_(config) {}

Result<audio::SignalBuffer> Pipeline::ingest(const std::vector<uint8_t>& bytes, const std::string& format_hint) const {
    ac::log::info("ingest: " + std::to_string(bytes.size()) + " bytes" +
                  (format_hint.empty() ? std::string() : " (hint " + format_hint + ")"));
    auto buffer = audio::decode(bytes, format_hint);
    log_failure("ingest", buffer);
    if (buffer) {
        ac::log::info("ingest: decoded " + describe_buffer(*buffer));
    }
    return buffer;
}

Result<audio::MediaInfo> Pipeline::probe(const std::vector<uint8_t>& bytes, const std::string& format_hint) const {
    auto info = audio::probe(bytes, format_hint);
    log_failure("probe", info);
    return info;
}

Result<analysis::AnalysisResult> Pipeline::analyze(const audio::SignalBuffer& buffer) const {
    ac::log::info("analyze: " + describe_buffer(buffer));
    auto result = analysis::Analyzer(config_.analyzer).analyze(buffer);
    log_failure("analyze", result);
    if (result) {
        ac::log::info("analyze: score " + std::to_string(result->quality.score) + " (" +
                      analysis::to_string(result->quality.rating) + ")");
    }
    return result;
}

Result<cleanup::ReductionResult> Pipeline::reduce(const audio::SignalBuffer& buffer,
                                                  const cleanup::ReductionOptions& options) const {
    ac::log::info("reduce: " + describe_buffer(buffer) + ", strength " + std::to_string(options.strength));
    auto result = cleanup::Reducer(config_.reducer, config_.analyzer).reduce(buffer, options);
    log_failure("reduce", result);
    if (result) {
        std::string stages;
        for (auto stage : result->report.stages) {
            if (!stages.empty()) stages += ",";
            stages += cleanup::to_string(stage);
        }
        ac::log::info("reduce: stages [" + stages + "] -> " + describe_buffer(result->buffer));
    }
    return result;
}

Result<std::vector<uint8_t>> Pipeline::convert(const audio::SignalBuffer& buffer,
                                               const convert::ConversionOptions& options) const {
    ac::log::info("convert: " + describe_buffer(buffer) + " -> " +
                  audio::format_to_string(options.target_format));
    auto bytes = convert::FormatConverter(config_.limits).convert(buffer, options);
    log_failure("convert", bytes);
    if (bytes) {
        ac::log::info("convert: produced " + std::to_string(bytes->size()) + " bytes");
    }
    return bytes;
}

} // namespace ac::pipeline
