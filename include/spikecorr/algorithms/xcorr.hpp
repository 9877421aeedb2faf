#pragma once

#include <span>
#include <vector>

#include "spikecorr/common/types.hpp"

namespace spikecorr::algorithms {

/**
 * @brief Fused broadcast-multiply of blocks against their pair-groups.
 *
 * For every block i in [0, n), pair r in [0, n) and column k in [0, nx):
 *
 *     c[(i * n + r) * nx + k] = x[i * nx + k] * xc[(i * n + r) * nx + k]
 *
 * No reduction is performed. Only the block loop is parallel, each block
 * writes the disjoint rows [i * n, (i + 1) * n) of @p c, so the output does
 * not depend on @p nthreads.
 *
 * @tparam T  One of float, double, std::complex<float>, std::complex<double>.
 * @param x         Row-major (n, nx) block rows.
 * @param xc        Row-major (n * n, nx) pair-group rows.
 * @param c         Row-major (n * n, nx) output, overwritten.
 * @param n         Number of blocks.
 * @param nx        Number of columns per row.
 * @param nthreads  Number of threads; <= 0 selects the OpenMP maximum.
 *
 * @throws std::invalid_argument if a span size does not match its shape.
 */
template <SupportedCorrType T>
void cross_correlate(std::span<const T> x,
                     std::span<const T> xc,
                     std::span<T> c,
                     SizeType n,
                     SizeType nx,
                     int nthreads = 0);

/**
 * @brief Build the pair-group operand of cross_correlate() from @p x.
 *
 * Row (i * n + r) of the result is conj(x[r]) (a copy for real types), so
 * cross_correlate(x, pair_conjugates(x), c) yields x[i] * conj(x[r]) for all
 * ordered pairs.
 *
 * @return Row-major (n * n, nx) array.
 */
template <SupportedCorrType T>
[[nodiscard]] std::vector<T>
pair_conjugates(std::span<const T> x, SizeType n, SizeType nx);

} // namespace spikecorr::algorithms
