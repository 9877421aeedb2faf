#pragma once

#include <cstdint>
#include <span>
#include <vector>

#include "spikecorr/common/types.hpp"

namespace spikecorr::detection {

/**
 * @brief Threshold raw voltage traces into a 0/1 spike array.
 *
 * If every threshold is negative a sample is a spike when it lies below its
 * channel threshold, otherwise when it lies above it.
 *
 * @param raw         Row-major (nsamples, nchannels) voltage traces.
 * @param nsamples    Number of time samples.
 * @param nchannels   Number of channels.
 * @param thresholds  One threshold shared by all channels, or one per channel.
 * @param nthreads    Number of threads to use.
 * @return Row-major (nsamples, nchannels) spike array.
 *
 * @throws std::invalid_argument if @p raw does not match the shape or the
 *         number of thresholds is neither 1 nor @p nchannels.
 */
[[nodiscard]] std::vector<SampleType>
threshold(std::span<const float> raw,
          SizeType nsamples,
          SizeType nchannels,
          std::span<const float> thresholds,
          int nthreads = 1);

/**
 * @brief Number of whole samples spanning @p ms milliseconds at rate @p fs.
 *
 * @throws std::invalid_argument if @p fs is not positive or @p ms is negative.
 */
[[nodiscard]] SizeType samples_per_ms(double fs, double ms);

/**
 * @brief Remove spikes that fall in the refractory period of an earlier spike.
 *
 * Each channel is scanned forward in time; a retained spike at sample s
 * zeroes samples s + 1 .. s + window and the scan resumes after them.
 *
 * @param spikes     Row-major (nsamples, nchannels) spike array, in place.
 * @param nsamples   Number of time samples.
 * @param nchannels  Number of channels.
 * @param window     Refractory period in samples.
 * @param nthreads   Number of threads to use (channels are split across them).
 */
void clear_refractory(std::span<SampleType> spikes,
                      SizeType nsamples,
                      SizeType nchannels,
                      SizeType window,
                      int nthreads = 1);

/**
 * @brief Surrogate spike trains: move every spike to a random sample of its
 * jitter window.
 *
 * Time is cut into consecutive windows of @p window samples (the last one
 * may be shorter). In every channel, the k spikes of a window are placed on
 * k distinct samples of that window drawn uniformly at random, so the spike
 * count per window and channel is preserved. Each channel has its own
 * generator seeded from @p seed, so the result depends on @p seed only.
 *
 * @param spikes     Row-major (nsamples, nchannels) 0/1 spike array, in place.
 * @param nsamples   Number of time samples.
 * @param nchannels  Number of channels.
 * @param window     Jitter window in samples.
 * @param seed       Base seed of the per-channel generators.
 * @param nthreads   Number of threads to use (channels are split across them).
 *
 * @throws std::invalid_argument if @p spikes does not match the shape or
 *         @p window is zero.
 */
void interval_jitter(std::span<SampleType> spikes,
                     SizeType nsamples,
                     SizeType nchannels,
                     SizeType window,
                     std::uint32_t seed,
                     int nthreads = 1);

} // namespace spikecorr::detection
