#pragma once

#include "dsp/fft_plan.hpp"
#include <cstddef>
#include <functional>
#include <vector>

namespace ac::dsp {

/**
 * @brief Streaming short-time Fourier transform with weighted overlap-add
 *
 * Frames are hop_size apart and windowed with a periodic Hann window on
 * both analysis and synthesis. The signal is virtually zero-padded by
 * fft_size - hop_size on the left so every sample is covered by the same
 * number of frames; resynthesis divides by the accumulated squared window,
 * so an unmodified spectrum reconstructs the input.
 *
 * The full spectrogram is never stored: transform() hands each frame's bins
 * to a modifier callback and overlap-adds the result immediately.
 */
class Stft {
public:
    /// Called once per frame with the frame index and its fft_size/2+1 bins
    using BinModifier = std::function<void(size_t frame, fftw_complex* bins, size_t bin_count)>;

    Stft(size_t fft_size, size_t hop_size);

    size_t fft_size() const { return fft_size_; }
    size_t hop_size() const { return hop_size_; }
    size_t bins() const { return plan_.bins(); }

    /// Number of frames transform() visits for a signal of `count` samples
    size_t frame_count(size_t count) const;

    /// True when the frame lies entirely inside the signal (no padding)
    bool frame_is_interior(size_t frame, size_t count) const;

    /// Windowed magnitude spectrum of one frame
    void analyze_frame(const float* samples, size_t count, size_t frame, std::vector<double>& magnitude);

    /// Analyze, modify and resynthesize; output has exactly `count` samples
    std::vector<float> transform(const float* samples, size_t count, const BinModifier& modifier);

private:
    void load_frame(const float* samples, size_t count, size_t frame);

    size_t fft_size_;
    size_t hop_size_;
    std::vector<double> window_;
    FftPlan plan_;
};

} // namespace ac::dsp
