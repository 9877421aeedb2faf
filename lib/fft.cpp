#include "spikecorr/utils/fft.hpp"

#include <mutex>
#include <stdexcept>
#include <string_view>

#include <fftw3.h>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "spikecorr/common/types.hpp"
#include "spikecorr/exceptions.hpp"
#include "spikecorr/utils.hpp"

namespace spikecorr::utils {

namespace {

// Guards every planner call and the global FFTW thread count.
std::mutex g_planner_mutex;

// Owns one FFTW plan; destruction goes through the planner lock.
class PlanGuard {
public:
    explicit PlanGuard(fftw_plan plan) : m_plan(plan) {}
    ~PlanGuard() {
        std::lock_guard<std::mutex> lock(g_planner_mutex);
        fftw_destroy_plan(m_plan);
    }

    PlanGuard(const PlanGuard&)            = delete;
    PlanGuard& operator=(const PlanGuard&) = delete;
    PlanGuard(PlanGuard&&)                 = delete;
    PlanGuard& operator=(PlanGuard&&)      = delete;

    void execute() const { fftw_execute(m_plan); }

private:
    fftw_plan m_plan;
};

// Build a plan with `nthreads` set in the same critical section, so a
// concurrent caller cannot change the count between the two calls.
template <typename Planner>
fftw_plan plan_locked(int nthreads, Planner&& planner) {
    ensure_fftw_threading();
    std::lock_guard<std::mutex> lock(g_planner_mutex);
    fftw_plan_with_nthreads(resolve_nthreads(nthreads));
    return planner();
}

void check_batch_shape(std::string_view name,
                       SizeType real_size,
                       SizeType complex_size,
                       int batch_size,
                       int n_real) {
    error_check::check(batch_size > 0 && n_real > 0,
                       fmt::format("{}: batch_size and n_real must be positive",
                                   name));
    const auto batch = static_cast<SizeType>(batch_size);
    error_check::check_equal(
        real_size, error_check::checked_product(
                       batch, static_cast<SizeType>(n_real),
                       fmt::format("{}: real shape is too large", name)),
        fmt::format("{}: real array does not hold batch_size rows", name));
    error_check::check_equal(
        complex_size,
        error_check::checked_product(
            batch, static_cast<SizeType>((n_real / 2) + 1),
            fmt::format("{}: complex shape is too large", name)),
        fmt::format("{}: complex array does not hold batch_size rows", name));
}

} // namespace

void ensure_fftw_threading() {
    static std::once_flag init_flag;
    std::call_once(init_flag, []() {
        std::lock_guard<std::mutex> lock(g_planner_mutex);
        if (fftw_init_threads() == 0) {
            throw std::runtime_error("fftw_init_threads failed");
        }
        spdlog::debug("FFTW threading initialized");
    });
}

void rfft_batch(std::span<double> real_input,
                std::span<ComplexType> complex_output,
                int batch_size,
                int n_real,
                int nthreads) {
    check_batch_shape("rfft_batch", real_input.size(), complex_output.size(),
                      batch_size, n_real);
    const int n_complex = (n_real / 2) + 1;
    auto* in            = real_input.data();
    auto* out = reinterpret_cast<fftw_complex*>(complex_output.data());

    // Rows are contiguous: unit stride, one row length between transforms
    fftw_plan plan = plan_locked(nthreads, [&]() {
        return fftw_plan_many_dft_r2c(1, &n_real, batch_size, in, nullptr, 1,
                                      n_real, out, nullptr, 1, n_complex,
                                      FFTW_ESTIMATE);
    });
    if (plan == nullptr) {
        throw std::runtime_error(
            fmt::format("rfft_batch: no r2c plan for {} rows of length {}",
                        batch_size, n_real));
    }
    const PlanGuard guard(plan);
    guard.execute();
    spdlog::debug("rfft_batch: {} rows of length {}", batch_size, n_real);
}

void irfft_batch(std::span<ComplexType> complex_input,
                 std::span<double> real_output,
                 int batch_size,
                 int n_real,
                 int nthreads) {
    check_batch_shape("irfft_batch", real_output.size(), complex_input.size(),
                      batch_size, n_real);
    const int n_complex = (n_real / 2) + 1;
    auto* in  = reinterpret_cast<fftw_complex*>(complex_input.data());
    auto* out = real_output.data();

    fftw_plan plan = plan_locked(nthreads, [&]() {
        return fftw_plan_many_dft_c2r(1, &n_real, batch_size, in, nullptr, 1,
                                      n_complex, out, nullptr, 1, n_real,
                                      FFTW_ESTIMATE);
    });
    if (plan == nullptr) {
        throw std::runtime_error(
            fmt::format("irfft_batch: no c2r plan for {} rows of length {}",
                        batch_size, n_real));
    }
    {
        const PlanGuard guard(plan);
        guard.execute();
    }

    // c2r is unnormalized
    const auto scale = 1.0 / static_cast<double>(n_real);
    for (auto& v : real_output) {
        v *= scale;
    }
    spdlog::debug("irfft_batch: {} rows of length {}", batch_size, n_real);
}

} // namespace spikecorr::utils
