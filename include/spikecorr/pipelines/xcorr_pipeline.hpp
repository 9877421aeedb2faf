#pragma once

#include <span>
#include <vector>

#include "spikecorr/common/types.hpp"
#include "spikecorr/pipelines/configs.hpp"

namespace spikecorr::pipelines {

/**
 * @brief Lagged cross-correlations of every ordered channel pair.
 *
 * values is row-major (lags.size(), nchannels * nchannels); column
 * i * nchannels + r holds the pair (i, r), whose value at lag L is
 * sum_t x_i[t + L] * x_r[t].
 */
struct XcorrResult {
    std::vector<IndexType> lags;
    std::vector<double> values;
    SizeType nchannels{};

    [[nodiscard]] SizeType npairs() const { return nchannels * nchannels; }
    [[nodiscard]] SizeType nlags() const { return lags.size(); }

    // Value at lag for the pair (i, r). Throws std::out_of_range if the lag
    // or a channel is absent.
    [[nodiscard]] double at(IndexType lag, SizeType i, SizeType r) const;

    // All pairs at one lag (size: npairs). Throws std::out_of_range if the
    // lag is absent.
    [[nodiscard]] std::span<const double> lag_row(IndexType lag) const;
};

/**
 * @brief FFT-based cross-correlation of all columns of a matrix.
 *
 * Each channel is detrended and zero-padded to the next power of two >=
 * 2 * nsamples - 1, transformed, multiplied pairwise with
 * algorithms::cross_correlate() against the conjugated spectra and
 * transformed back. Lags 1 - maxlags .. maxlags - 1 are returned, maxlags
 * defaulting to nsamples.
 *
 * @param data       Row-major (nsamples, nchannels) array.
 * @param nsamples   Number of samples per channel.
 * @param nchannels  Number of channels.
 * @param config     Lag, detrending, scaling and threading options.
 *
 * @throws std::invalid_argument on an empty or mismatched input, or when
 *         maxlags exceeds nsamples.
 */
[[nodiscard]] XcorrResult matrix_xcorr(std::span<const double> data,
                                       SizeType nsamples,
                                       SizeType nchannels,
                                       const XcorrConfig& config);

struct SpikeXcorrResult {
    // Cross-correlation at the selected lag (size: nchannels * nchannels)
    std::vector<double> xcorr;
    // 1 for channels whose mean count per bin reached the firing threshold
    std::vector<SampleType> active;
    // Row-major (nbins, nchannels) spike counts
    std::vector<CountType> binned;
    SizeType nbins{};
    SizeType nchannels{};
};

/**
 * @brief Threshold, clear, bin and cross-correlate raw multichannel traces.
 *
 * Pairs involving a channel below the firing-rate threshold are NaN.
 *
 * @param raw         Row-major (nsamples, nchannels) voltage traces.
 * @param thresholds  One threshold for all channels or one per channel.
 */
[[nodiscard]] SpikeXcorrResult spike_xcorr(std::span<const float> raw,
                                           SizeType nsamples,
                                           SizeType nchannels,
                                           std::span<const float> thresholds,
                                           const SpikeXcorrConfig& config);

// spike_xcorr() across a sweep of threshold levels, with all-NaN rows and
// columns removed.
struct SpikeXcorrSweep {
    // Threshold levels that kept at least one finite pair
    std::vector<float> levels;
    // Pair indices i * nchannels + r that are finite at some kept level
    std::vector<SizeType> pairs;
    // Row-major (levels.size(), pairs.size())
    std::vector<double> values;
    SizeType nchannels{};

    [[nodiscard]] double at(SizeType ilevel, SizeType ipair) const {
        return values[(ilevel * pairs.size()) + ipair];
    }
};

/**
 * @brief Spike cross-correlation at several detection thresholds.
 *
 * The thresholds at level @c l are @c l times the sample standard deviation
 * of each channel of @p raw, so negative levels detect downward crossings.
 * spike_xcorr() runs once per level; rows (levels) and columns (channel
 * pairs) that are NaN everywhere are dropped from the table.
 *
 * @param raw               Row-major (nsamples, nchannels) voltage traces.
 * @param threshold_levels  Threshold multipliers of the channel deviation.
 *
 * @throws std::invalid_argument on a mismatched input, an empty sweep, or
 *         anything spike_xcorr() rejects.
 */
[[nodiscard]] SpikeXcorrSweep
spike_xcorr_sweep(std::span<const float> raw,
                  SizeType nsamples,
                  SizeType nchannels,
                  std::span<const float> threshold_levels,
                  const SpikeXcorrConfig& config);

} // namespace spikecorr::pipelines
