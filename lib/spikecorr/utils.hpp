#pragma once

#include <span>

#include "spikecorr/common/types.hpp"

namespace spikecorr::utils {

/**
 * @brief Resolve a requested OpenMP thread count.
 *
 * @param nthreads  Requested number of threads. Values <= 0 select
 *                  `omp_get_max_threads()`.
 * @return Thread count clamped to [1, omp_get_max_threads()].
 */
[[nodiscard]] int resolve_nthreads(int nthreads) noexcept;

/**
 * @brief Smallest exponent @c p such that `2^p >= n`.
 *
 * @note Returns 0 for `n <= 1`.
 */
[[nodiscard]] SizeType nextpow2(SizeType n) noexcept;

// Dot product of two strided views of equal length.
[[nodiscard]] double dot_strided(const double* __restrict__ x,
                                 const double* __restrict__ y,
                                 SizeType size,
                                 SizeType stride) noexcept;

// Subtract the mean of every column of a (nrows, ncols) array in place.
void detrend_mean(std::span<double> data, SizeType nrows, SizeType ncols);

// Subtract the least-squares line from every column of a (nrows, ncols) array
// in place.
void detrend_linear(std::span<double> data, SizeType nrows, SizeType ncols);

} // namespace spikecorr::utils
