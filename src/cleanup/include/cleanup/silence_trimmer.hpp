#pragma once

#include "analysis/analyzer.hpp"
#include "audio/signal_buffer.hpp"
#include "cleanup/reducer_config.hpp"
#include "core/error.hpp"
#include <cstddef>
#include <utility>
#include <vector>

namespace ac::cleanup {

struct TrimResult {
    audio::SignalBuffer buffer;
    double removed_seconds{0.0};
    size_t cuts{0};             ///< Number of spans removed
};

/**
 * @brief Sample ranges [first, last) to delete, in ascending order
 *
 * Spans come from runs of silent frames (see analysis::detect_silence)
 * lasting at least min_silence_ms; guard_ms of silence is kept against
 * any neighbouring signal. Leading and trailing runs are always
 * candidates, interior runs only with trim_interior. A clip that is
 * entirely silent yields no spans.
 */
std::vector<std::pair<size_t, size_t>> find_silent_spans(const audio::SignalBuffer& buffer,
                                                         const ReducerConfig& config,
                                                         const analysis::AnalyzerConfig& analysis);

/**
 * @brief Remove silent spans from all channels jointly
 *
 * A linear fade of fade_ms is applied on both sides of every interior cut.
 */
Result<TrimResult> trim_silence(const audio::SignalBuffer& buffer,
                                const ReducerConfig& config,
                                const analysis::AnalyzerConfig& analysis);

} // namespace ac::cleanup
