#include "dsp/fft_plan.hpp"
#include <mutex>
#include <new>

namespace ac::dsp {

namespace {
std::mutex g_planner_mutex;
}

FftPlan::FftPlan(size_t size) : size_(size) {
    std::lock_guard<std::mutex> lock(g_planner_mutex);
    time_ = static_cast<double*>(fftw_malloc(sizeof(double) * size_));
    freq_ = static_cast<fftw_complex*>(fftw_malloc(sizeof(fftw_complex) * bins()));
    if (!time_ || !freq_) {
        fftw_free(time_);
        fftw_free(freq_);
        throw std::bad_alloc();
    }
    // FFTW_ESTIMATE leaves the buffers untouched during planning
    forward_ = fftw_plan_dft_r2c_1d(static_cast<int>(size_), time_, freq_, FFTW_ESTIMATE);
    inverse_ = fftw_plan_dft_c2r_1d(static_cast<int>(size_), freq_, time_, FFTW_ESTIMATE);
}

FftPlan::~FftPlan() {
    std::lock_guard<std::mutex> lock(g_planner_mutex);
    if (forward_) fftw_destroy_plan(forward_);
    if (inverse_) fftw_destroy_plan(inverse_);
    fftw_free(freq_);
    fftw_free(time_);
}

void FftPlan::forward() {
    fftw_execute(forward_);
}

void FftPlan::inverse() {
    // c2r destroys its input; callers rebuild freq() for every frame anyway
    fftw_execute(inverse_);
    const double scale = 1.0 / static_cast<double>(size_);
    for (size_t i = 0; i < size_; ++i) {
        time_[i] *= scale;
    }
}

} // namespace ac::dsp
