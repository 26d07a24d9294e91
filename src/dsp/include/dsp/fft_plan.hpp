#pragma once

#include <cstddef>
#include <fftw3.h>

namespace ac::dsp {

/**
 * @brief Owned pair of real-to-complex / complex-to-real FFTW plans of one size
 *
 * Plans use FFTW_ESTIMATE on fftw_malloc'd buffers, so the same input always
 * produces the same output. Creating and destroying plans is serialized
 * internally (the FFTW planner is not re-entrant); executing is lock-free,
 * so independent instances may run on different threads.
 */
class FftPlan {
public:
    explicit FftPlan(size_t size);
    ~FftPlan();

    FftPlan(const FftPlan&) = delete;
    FftPlan& operator=(const FftPlan&) = delete;

    size_t size() const { return size_; }
    size_t bins() const { return size_ / 2 + 1; }

    double* time() { return time_; }
    const double* time() const { return time_; }
    fftw_complex* freq() { return freq_; }
    const fftw_complex* freq() const { return freq_; }

    /// time() -> freq()
    void forward();

    /// freq() -> time(), scaled by 1/size so forward+inverse is identity
    void inverse();

private:
    size_t size_;
    double* time_ = nullptr;
    fftw_complex* freq_ = nullptr;
    fftw_plan forward_ = nullptr;
    fftw_plan inverse_ = nullptr;
};

} // namespace ac::dsp
