#include "core/log.hpp"
#include "pipeline/pipeline.hpp"
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>
#include <string>
#include <vector>

namespace {

constexpr const char* kUsage =
    "Usage: audioclean [--json] [--verbose|--quiet] <command> [options] <input> [output]\n"
    "Commands:\n"
    "  info     <input>                 container and stream details\n"
    "  analyze  <input>                 quality metrics and assessment\n"
    "  reduce   <input> <output>        cleanup chain, output format from --format or extension\n"
    "           [--strength S] [--clicks] [--echo] [--silence] [--normalize]\n"
    "  convert  <input> <output>        re-encode\n"
    "           [--format F] [--bitrate 192k] [--rate HZ] [--bit-depth 16|24|32]\n";

struct CliArgs {
    bool json = false;
    std::string command;
    std::string input;
    std::string output;
    std::string format;
    std::string bitrate;
    std::string rate;
    std::string bit_depth;
    ac::cleanup::ReductionOptions reduction;
};

std::string extension_of(const std::string& path) {
    auto dot = path.find_last_of('.');
    auto slash = path.find_last_of("/\\");
    if (dot == std::string::npos || (slash != std::string::npos && dot < slash)) {
        return {};
    }
    return path.substr(dot + 1);
}

bool read_file(const std::string& path, std::vector<uint8_t>& bytes) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return false;
    }
    bytes.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    return true;
}

bool write_file(const std::string& path, const std::vector<uint8_t>& bytes) {
    std::ofstream out(path, std::ios::binary);
    if (!out) {
        return false;
    }
    out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    return static_cast<bool>(out);
}

int report_error(const CliArgs& args, const ac::Error& error) {
    if (args.json) {
        std::cout << "{\"error\":\"" << ac::to_string(error.kind) << "\",\"message\":\""
                  << ac::log::json_escape(error.message) << "\"}" << std::endl;
    } else {
        std::cerr << "Error (" << ac::to_string(error.kind) << "): " << error.message << "\n";
    }
    return 2;
}

bool parse_args(int argc, char** argv, CliArgs& args) {
    std::vector<std::string> positional;
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        auto next = [&](std::string& dst) {
            if (i + 1 >= argc) return false;
            dst = argv[++i];
            return true;
        };
        if (a == "--json") { args.json = true; continue; }
        if (a == "--verbose") { ac::log::set_level(ac::log::Level::Debug); continue; }
        if (a == "--quiet") { ac::log::set_level(ac::log::Level::Error); continue; }
        if (a == "--clicks") { args.reduction.remove_clicks = true; continue; }
        if (a == "--echo") { args.reduction.reduce_echo = true; continue; }
        if (a == "--silence") { args.reduction.remove_silence = true; continue; }
        if (a == "--normalize") { args.reduction.normalize = true; continue; }
        if (a == "--strength") {
            std::string value;
            if (!next(value)) return false;
            char* end = nullptr;
            args.reduction.strength = std::strtod(value.c_str(), &end);
            if (end == value.c_str() || *end != '\0') return false;
            continue;
        }
        if (a == "--format") { if (!next(args.format)) return false; continue; }
        if (a == "--bitrate") { if (!next(args.bitrate)) return false; continue; }
        if (a == "--rate") { if (!next(args.rate)) return false; continue; }
        if (a == "--bit-depth") { if (!next(args.bit_depth)) return false; continue; }
        if (a.rfind("--", 0) == 0) return false;
        positional.push_back(a);
    }
    if (positional.size() < 2) return false;
    args.command = positional[0];
    args.input = positional[1];
    if (positional.size() > 2) args.output = positional[2];
    return true;
}

ac::Result<uint32_t> parse_unsigned(const std::string& text, const char* what) {
    char* end = nullptr;
    unsigned long value = std::strtoul(text.c_str(), &end, 10);
    if (text.empty() || end == text.c_str() || *end != '\0' || value == 0 || value > 0xFFFFFFFFul) {
        return ac::fail(ac::ErrorKind::InvalidParameter, std::string("invalid ") + what + " '" + text + "'");
    }
    return static_cast<uint32_t>(value);
}

ac::Result<ac::convert::ConversionOptions> conversion_options(const CliArgs& args) {
    ac::convert::ConversionOptions options;
    std::string format = args.format.empty() ? extension_of(args.output) : args.format;
    if (format.empty()) format = "wav";
    auto parsed = ac::audio::parse_format(format);
    if (!parsed) return ac::make_unexpected(std::move(parsed).error());
    options.target_format = *parsed;

    if (!args.bitrate.empty()) {
        auto kbps = ac::audio::parse_bitrate(args.bitrate);
        if (!kbps) return ac::make_unexpected(std::move(kbps).error());
        options.bitrate_kbps = *kbps;
    }
    if (!args.rate.empty()) {
        auto rate = parse_unsigned(args.rate, "sample rate");
        if (!rate) return ac::make_unexpected(std::move(rate).error());
        options.sample_rate = *rate;
    }
    if (!args.bit_depth.empty()) {
        auto depth = parse_unsigned(args.bit_depth, "bit depth");
        if (!depth) return ac::make_unexpected(std::move(depth).error());
        options.bit_depth = *depth;
    }
    return options;
}

void print_info(const CliArgs& args, const ac::audio::MediaInfo& info) {
    if (args.json) {
        std::ostringstream oss;
        oss << '{';
        oss << "\"file\":\"" << ac::log::json_escape(args.input) << "\",";
        oss << "\"format\":\"" << info.format_name << "\",";
        oss << "\"codec\":\"" << info.codec_name << "\",";
        oss << "\"size_bytes\":" << info.byte_size << ',';
        oss << "\"duration_seconds\":" << info.duration_seconds << ',';
        oss << "\"channels\":" << info.channels << ',';
        oss << "\"sample_rate\":" << info.sample_rate << ',';
        oss << "\"bit_depth\":" << info.bit_depth << '}';
        std::cout << oss.str() << std::endl;
    } else {
        std::cout << "File: " << args.input << "\n";
        std::cout << "Format: " << info.format_name << "\n";
        std::cout << "Codec: " << info.codec_name << "\n";
        std::cout << "Size: " << info.byte_size << " bytes\n";
        std::cout << "Duration: " << info.duration_seconds << " s\n";
        std::cout << "Channels: " << info.channels << "\n";
        std::cout << "Sample rate: " << info.sample_rate << " Hz\n";
        std::cout << "Bit depth: " << info.bit_depth << "\n";
    }
}

void print_analysis(const CliArgs& args, const ac::analysis::AnalysisResult& r) {
    if (args.json) {
        std::ostringstream oss;
        oss << '{';
        oss << "\"duration_seconds\":" << r.duration_seconds << ',';
        oss << "\"sample_rate\":" << r.sample_rate << ',';
        oss << "\"peak_db\":" << r.peak_db << ',';
        oss << "\"average_rms_db\":" << r.average_rms_db << ',';
        oss << "\"estimated_noise_floor_db\":" << r.estimated_noise_floor_db << ',';
        oss << "\"estimated_snr_db\":" << r.estimated_snr_db << ',';
        oss << "\"silence_percentage\":" << r.silence_percentage << ',';
        oss << "\"zero_crossing_rate\":" << r.zero_crossing_rate << ',';
        oss << "\"spectral_centroid_hz\":" << r.spectral_centroid_hz << ',';
        oss << "\"quality_assessment\":{";
        oss << "\"score\":" << r.quality.score << ',';
        oss << "\"rating\":\"" << ac::analysis::to_string(r.quality.rating) << "\",";
        oss << "\"issues\":[";
        size_t i = 0;
        for (auto tag : r.quality.issues) {
            oss << '"' << ac::analysis::to_string(tag) << '"';
            if (++i < r.quality.issues.size()) oss << ',';
        }
        oss << "]}}";
        std::cout << oss.str() << std::endl;
    } else {
        std::cout << "Duration: " << r.duration_seconds << " s @ " << r.sample_rate << " Hz\n";
        std::cout << "Peak: " << r.peak_db << " dB\n";
        std::cout << "RMS: " << r.average_rms_db << " dB\n";
        std::cout << "Noise floor: " << r.estimated_noise_floor_db << " dB\n";
        std::cout << "SNR: " << r.estimated_snr_db << " dB\n";
        std::cout << "Silence: " << r.silence_percentage << " %\n";
        std::cout << "Zero crossing rate: " << r.zero_crossing_rate << "\n";
        std::cout << "Spectral centroid: " << r.spectral_centroid_hz << " Hz\n";
        std::cout << "Score: " << r.quality.score << " (" << ac::analysis::to_string(r.quality.rating) << ")\n";
        for (auto tag : r.quality.issues) {
            std::cout << "  Issue: " << ac::analysis::to_string(tag) << "\n";
        }
    }
}

void print_reduction(const CliArgs& args, const ac::cleanup::ReductionReport& r, size_t bytes) {
    if (args.json) {
        std::ostringstream oss;
        oss << '{';
        oss << "\"original_duration_seconds\":" << r.original_duration_seconds << ',';
        oss << "\"processed_duration_seconds\":" << r.processed_duration_seconds << ',';
        oss << "\"sample_rate\":" << r.sample_rate << ',';
        oss << "\"clicks_repaired\":" << r.clicks_repaired << ',';
        oss << "\"echo_delay_ms\":" << r.echo_delay_ms << ',';
        oss << "\"echo_gain\":" << r.echo_gain << ',';
        oss << "\"silence_removed_seconds\":" << r.silence_removed_seconds << ',';
        oss << "\"output_bytes\":" << bytes << ',';
        oss << "\"stages\":[";
        for (size_t i = 0; i < r.stages.size(); ++i) {
            oss << '"' << ac::cleanup::to_string(r.stages[i]) << '"';
            if (i + 1 < r.stages.size()) oss << ',';
        }
        oss << "]}";
        std::cout << oss.str() << std::endl;
    } else {
        std::cout << "Duration: " << r.original_duration_seconds << " s -> "
                  << r.processed_duration_seconds << " s\n";
        std::cout << "Clicks repaired: " << r.clicks_repaired << "\n";
        if (r.echo_delay_ms > 0.0) {
            std::cout << "Echo: " << r.echo_delay_ms << " ms, gain " << r.echo_gain << "\n";
        }
        std::cout << "Silence removed: " << r.silence_removed_seconds << " s\n";
        std::cout << "Stages:";
        for (auto stage : r.stages) std::cout << ' ' << ac::cleanup::to_string(stage);
        std::cout << "\nWrote " << bytes << " bytes\n";
    }
}

} // anonymous namespace

int main(int argc, char** argv) {
    CliArgs args;
    if (!parse_args(argc, argv, args)) {
        std::cout << kUsage;
        return 1;
    }
    if (args.json) {
        ac::log::set_json_mode(true);
    }

    std::vector<uint8_t> bytes;
    if (!read_file(args.input, bytes)) {
        std::cerr << "Cannot read " << args.input << std::endl;
        return 1;
    }
    const std::string hint = extension_of(args.input);
    const ac::pipeline::Pipeline pipeline;

    if (args.command == "info") {
        auto info = pipeline.probe(bytes, hint);
        if (!info) return report_error(args, info.error());
        print_info(args, *info);
        return 0;
    }

    if (args.command != "analyze" && args.command != "reduce" && args.command != "convert") {
        std::cout << kUsage;
        return 1;
    }
    if (args.command != "analyze" && args.output.empty()) {
        std::cerr << "No output file provided." << std::endl;
        return 1;
    }

    auto buffer = pipeline.ingest(bytes, hint);
    if (!buffer) return report_error(args, buffer.error());

    if (args.command == "analyze") {
        auto result = pipeline.analyze(*buffer);
        if (!result) return report_error(args, result.error());
        print_analysis(args, *result);
        return 0;
    }

    auto options = conversion_options(args);
    if (!options) return report_error(args, options.error());

    if (args.command == "reduce") {
        auto reduced = pipeline.reduce(*buffer, args.reduction);
        if (!reduced) return report_error(args, reduced.error());
        auto encoded = pipeline.convert(reduced->buffer, *options);
        if (!encoded) return report_error(args, encoded.error());
        if (!write_file(args.output, *encoded)) {
            std::cerr << "Cannot write " << args.output << std::endl;
            return 1;
        }
        print_reduction(args, reduced->report, encoded->size());
        return 0;
    }

    auto encoded = pipeline.convert(*buffer, *options);
    if (!encoded) return report_error(args, encoded.error());
    if (!write_file(args.output, *encoded)) {
        std::cerr << "Cannot write " << args.output << std::endl;
        return 1;
    }
    if (args.json) {
        std::cout << "{\"output\":\"" << ac::log::json_escape(args.output) << "\",\"bytes\":" << encoded->size() << '}' << std::endl;
    } else {
        std::cout << "Wrote " << encoded->size() << " bytes to " << args.output << "\n";
    }
    return 0;
}
