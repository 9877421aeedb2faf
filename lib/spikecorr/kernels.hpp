#pragma once

#include "spikecorr/common/types.hpp"

namespace spikecorr::kernels {

/**
 * @brief Sum spike samples into bins.
 *
 * Unchecked: every edge must lie in [0, nsamples] and the edges must be
 * non-decreasing. The output must be zero-initialized.
 *
 * @param samples    The 0/1 spike array (size: nsamples * nchannels)
 * @param bin_edges  The bin boundaries (size: nbins + 1)
 * @param out        The output array (size: nbins * nchannels)
 * @param nbins      The number of bins
 * @param nchannels  The number of channels
 * @param nthreads   The number of threads to use (bins are split across them)
 */
void bin_counts(const SampleType* __restrict__ samples,
                const IndexType* __restrict__ bin_edges,
                CountType* __restrict__ out,
                SizeType nbins,
                SizeType nchannels,
                int nthreads) noexcept;

/**
 * @brief Broadcast-multiply one row against a group of rows.
 *
 * c_group[r * nx + k] = x_row[k] * xc_group[r * nx + k] for r < nrows.
 */
template <SupportedCorrType T>
inline void broadcast_multiply(const T* __restrict__ x_row,
                               const T* __restrict__ xc_group,
                               T* __restrict__ c_group,
                               SizeType nrows,
                               SizeType nx) noexcept {
    for (SizeType r = 0; r < nrows; ++r) {
        const T* __restrict__ xc_row = xc_group + (r * nx);
        T* __restrict__ c_row        = c_group + (r * nx);
#pragma omp simd
        for (SizeType k = 0; k < nx; ++k) {
            c_row[k] = x_row[k] * xc_row[k];
        }
    }
}

/**
 * @brief Fused broadcast-multiply across all pair-groups.
 *
 * Unchecked: x holds n rows, xc and c hold n * n rows, all of nx columns.
 * Only the outer block loop is parallel; each block owns rows
 * [i * n, (i + 1) * n) of c.
 *
 * @param x         The block rows (size: n * nx)
 * @param xc        The pair-group rows (size: n * n * nx)
 * @param c         The output rows (size: n * n * nx)
 * @param n         The number of blocks
 * @param nx        The number of columns per row
 * @param nthreads  The number of threads to use
 */
template <SupportedCorrType T>
void cross_multiply(const T* __restrict__ x,
                    const T* __restrict__ xc,
                    T* __restrict__ c,
                    SizeType n,
                    SizeType nx,
                    int nthreads) noexcept;

} // namespace spikecorr::kernels
