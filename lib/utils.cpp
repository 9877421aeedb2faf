#include "spikecorr/utils.hpp"

#include <algorithm>
#include <span>

#include <omp.h>

#include "spikecorr/exceptions.hpp"

namespace spikecorr::utils {

int resolve_nthreads(int nthreads) noexcept {
    const int max_threads = omp_get_max_threads();
    if (nthreads <= 0) {
        return max_threads;
    }
    return std::clamp(nthreads, 1, max_threads);
}

SizeType nextpow2(SizeType n) noexcept {
    SizeType power = 0;
    SizeType value = 1;
    while (value < n) {
        value <<= 1U;
        ++power;
    }
    return power;
}

double dot_strided(const double* __restrict__ x,
                   const double* __restrict__ y,
                   SizeType size,
                   SizeType stride) noexcept {
    double acc = 0.0;
    for (SizeType i = 0; i < size; ++i) {
        acc += x[i * stride] * y[i * stride];
    }
    return acc;
}

void detrend_mean(std::span<double> data, SizeType nrows, SizeType ncols) {
    error_check::check_equal(
        data.size(),
        error_check::checked_product(nrows, ncols,
                                     "detrend_mean: shape is too large"),
        "detrend_mean: data size does not match shape");
    if (nrows == 0) {
        return;
    }
    const auto inv_n = 1.0 / static_cast<double>(nrows);
    for (SizeType k = 0; k < ncols; ++k) {
        double sum = 0.0;
        for (SizeType t = 0; t < nrows; ++t) {
            sum += data[(t * ncols) + k];
        }
        const double mean = sum * inv_n;
        for (SizeType t = 0; t < nrows; ++t) {
            data[(t * ncols) + k] -= mean;
        }
    }
}

void detrend_linear(std::span<double> data, SizeType nrows, SizeType ncols) {
    error_check::check_equal(
        data.size(),
        error_check::checked_product(nrows, ncols,
                                     "detrend_linear: shape is too large"),
        "detrend_linear: data size does not match shape");
    if (nrows < 2) {
        detrend_mean(data, nrows, ncols);
        return;
    }
    // Centre the abscissa so the slope and intercept decouple
    const auto n      = static_cast<double>(nrows);
    const double t_mu = (n - 1.0) / 2.0;
    double sxx        = 0.0;
    for (SizeType t = 0; t < nrows; ++t) {
        const double dt = static_cast<double>(t) - t_mu;
        sxx += dt * dt;
    }
    for (SizeType k = 0; k < ncols; ++k) {
        double sy  = 0.0;
        double sxy = 0.0;
        for (SizeType t = 0; t < nrows; ++t) {
            const double y = data[(t * ncols) + k];
            sy += y;
            sxy += (static_cast<double>(t) - t_mu) * y;
        }
        const double intercept = sy / n;
        const double slope     = sxy / sxx;
        for (SizeType t = 0; t < nrows; ++t) {
            data[(t * ncols) + k] -=
                intercept + (slope * (static_cast<double>(t) - t_mu));
        }
    }
}

} // namespace spikecorr::utils
