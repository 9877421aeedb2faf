#pragma once

#include <span>
#include <vector>

#include "spikecorr/common/types.hpp"

namespace spikecorr::algorithms {

/**
 * @brief Sum 0/1 spike samples into time bins, per channel.
 *
 * result[i * nchannels + k] is the sum of samples[j * nchannels + k] for j in
 * the half-open interval [bin_edges[i], bin_edges[i + 1]). Samples outside
 * every bin are not counted, and a zero-width bin sums to 0.
 *
 * @param samples    Row-major (nsamples, nchannels) spike array.
 * @param nsamples   Number of time samples (T).
 * @param nchannels  Number of channels (N).
 * @param bin_edges  Non-decreasing bin boundaries in [0, nsamples]
 *                   (size: nbins + 1).
 * @param nthreads   Number of threads to use.
 * @return Row-major (nbins, nchannels) array of counts.
 *
 * @throws std::invalid_argument if the sample size does not match the shape,
 *         @p bin_edges is empty, an edge lies outside [0, nsamples] or the
 *         edges decrease.
 */
[[nodiscard]] std::vector<CountType>
bin_data(std::span<const SampleType> samples,
         SizeType nsamples,
         SizeType nchannels,
         std::span<const IndexType> bin_edges,
         int nthreads = 1);

/**
 * @brief Same as bin_data(), writing into a caller-provided array.
 *
 * @param out  Output array (size: (bin_edges.size() - 1) * nchannels). It is
 *             zero-filled before accumulation.
 */
void bin_data(std::span<const SampleType> samples,
              SizeType nsamples,
              SizeType nchannels,
              std::span<const IndexType> bin_edges,
              std::span<CountType> out,
              int nthreads = 1);

/**
 * @brief Edges of consecutive fixed-width bins covering [0, nsamples].
 *
 * Returns [0, bin_size, 2 * bin_size, ..., nsamples]; the last bin is shorter
 * when @p bin_size does not divide @p nsamples.
 *
 * @throws std::invalid_argument if @p bin_size is zero.
 */
[[nodiscard]] std::vector<IndexType> uniform_bin_edges(SizeType nsamples,
                                                       SizeType bin_size);

} // namespace spikecorr::algorithms
