#include "spikecorr/pipelines/xcorr_pipeline.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <span>
#include <stdexcept>
#include <vector>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "spikecorr/algorithms/binning.hpp"
#include "spikecorr/algorithms/xcorr.hpp"
#include "spikecorr/detection/spikes.hpp"
#include "spikecorr/exceptions.hpp"
#include "spikecorr/timing.hpp"
#include "spikecorr/utils.hpp"
#include "spikecorr/utils/fft.hpp"

namespace spikecorr::pipelines {

namespace {

constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();

SizeType lag_index(const XcorrResult& result, IndexType lag) {
    if (result.lags.empty() || lag < result.lags.front() ||
        lag > result.lags.back()) {
        throw std::out_of_range(
            fmt::format("lag {} is not in the cross-correlation", lag));
    }
    return static_cast<SizeType>(lag - result.lags.front());
}

// Sample standard deviation (n - 1 denominator) of every channel.
std::vector<double> channel_deviation(std::span<const float> raw,
                                      SizeType nsamples,
                                      SizeType nchannels) {
    std::vector<double> mean(nchannels, 0.0);
    std::vector<double> sq(nchannels, 0.0);
    for (SizeType t = 0; t < nsamples; ++t) {
        for (SizeType k = 0; k < nchannels; ++k) {
            mean[k] += raw[(t * nchannels) + k];
        }
    }
    for (auto& m : mean) {
        m /= static_cast<double>(nsamples);
    }
    for (SizeType t = 0; t < nsamples; ++t) {
        for (SizeType k = 0; k < nchannels; ++k) {
            const double d = raw[(t * nchannels) + k] - mean[k];
            sq[k] += d * d;
        }
    }
    std::vector<double> deviation(nchannels);
    for (SizeType k = 0; k < nchannels; ++k) {
        deviation[k] = std::sqrt(sq[k] / static_cast<double>(nsamples - 1));
    }
    return deviation;
}

} // namespace

double XcorrResult::at(IndexType lag, SizeType i, SizeType r) const {
    if (i >= nchannels || r >= nchannels) {
        throw std::out_of_range(fmt::format(
            "channel pair ({}, {}) out of range for {} channels", i, r,
            nchannels));
    }
    return values[(lag_index(*this, lag) * npairs()) + (i * nchannels) + r];
}

std::span<const double> XcorrResult::lag_row(IndexType lag) const {
    return std::span<const double>(values).subspan(
        lag_index(*this, lag) * npairs(), npairs());
}

XcorrResult matrix_xcorr(std::span<const double> data,
                         SizeType nsamples,
                         SizeType nchannels,
                         const XcorrConfig& config) {
    error_check::check(nsamples > 0 && nchannels > 0,
                       "matrix_xcorr: input must have samples and channels");
    error_check::check_equal(
        data.size(),
        error_check::checked_product(nsamples, nchannels,
                                     "matrix_xcorr: data shape is too large"),
        "matrix_xcorr: data size does not match nsamples * nchannels");
    const SizeType maxlags = config.get_maxlags().value_or(nsamples);
    error_check::check_less_equal(
        maxlags, nsamples, "matrix_xcorr: maxlags exceeds the number of samples");
    const int nthreads = utils::resolve_nthreads(config.get_nthreads());

    std::vector<double> work(data.begin(), data.end());
    switch (config.get_detrend()) {
    case DetrendType::kMean:
        utils::detrend_mean(work, nsamples, nchannels);
        break;
    case DetrendType::kLinear:
        utils::detrend_linear(work, nsamples, nchannels);
        break;
    case DetrendType::kNone:
        break;
    }

    const SizeType nfft   = SizeType{1} << utils::nextpow2((2 * nsamples) - 1);
    const SizeType nfft_c = (nfft / 2) + 1;
    const SizeType npairs = nchannels * nchannels;
    spdlog::debug("matrix_xcorr: nsamples={}, nchannels={}, nfft={}, "
                  "maxlags={}, nthreads={}",
                  nsamples, nchannels, nfft, maxlags, nthreads);

    // Channel-major, zero-padded copy for the batched transform
    std::vector<double> padded(nchannels * nfft, 0.0);
    for (SizeType t = 0; t < nsamples; ++t) {
        for (SizeType k = 0; k < nchannels; ++k) {
            padded[(k * nfft) + t] = work[(t * nchannels) + k];
        }
    }
    std::vector<double> energies(nchannels);
    for (SizeType k = 0; k < nchannels; ++k) {
        const double* row = padded.data() + (k * nfft);
        energies[k]       = utils::dot_strided(row, row, nsamples, 1);
    }

    std::vector<ComplexType> spectra(nchannels * nfft_c);
    utils::rfft_batch(padded, spectra, static_cast<int>(nchannels),
                      static_cast<int>(nfft), nthreads);

    const auto spectra_conj = algorithms::pair_conjugates<ComplexType>(
        spectra, nchannels, nfft_c);
    std::vector<ComplexType> products(npairs * nfft_c);
    algorithms::cross_correlate<ComplexType>(spectra, spectra_conj, products,
                                             nchannels, nfft_c, nthreads);

    std::vector<double> corr(npairs * nfft);
    utils::irfft_batch(products, corr, static_cast<int>(npairs),
                       static_cast<int>(nfft), nthreads);

    XcorrResult result;
    result.nchannels    = nchannels;
    const auto max_lag  = static_cast<IndexType>(maxlags) - 1;
    const SizeType nlag = (2 * maxlags) - 1;
    result.lags.reserve(nlag);
    for (IndexType lag = -max_lag; lag <= max_lag; ++lag) {
        result.lags.push_back(lag);
    }
    result.values.resize(nlag * npairs);

    for (SizeType il = 0; il < nlag; ++il) {
        const IndexType lag = result.lags[il];
        // Negative lags wrap to the end of the circular correlation
        const auto src =
            lag >= 0 ? static_cast<SizeType>(lag)
                     : nfft - static_cast<SizeType>(-lag);
        const double unbiased =
            static_cast<double>(nsamples - static_cast<SizeType>(std::abs(lag)));
        double* out_row = result.values.data() + (il * npairs);
        for (SizeType i = 0; i < nchannels; ++i) {
            for (SizeType r = 0; r < nchannels; ++r) {
                const SizeType p = (i * nchannels) + r;
                double v         = corr[(p * nfft) + src];
                if (config.get_scale() == ScaleType::kUnbiased) {
                    v /= unbiased;
                } else if (config.get_scale() == ScaleType::kNormalize) {
                    const double denom = std::sqrt(energies[i] * energies[r]);
                    v = denom > 0.0 ? v / denom : kNaN;
                }
                out_row[p] = v;
            }
        }
    }

    if (config.get_nan_auto()) {
        const auto zero_row =
            std::span<double>(result.values)
                .subspan(lag_index(result, 0) * npairs, npairs);
        for (SizeType i = 0; i < nchannels; ++i) {
            zero_row[(i * nchannels) + i] = kNaN;
        }
    }
    return result;
}

SpikeXcorrResult spike_xcorr(std::span<const float> raw,
                             SizeType nsamples,
                             SizeType nchannels,
                             std::span<const float> thresholds,
                             const SpikeXcorrConfig& config) {
    const int nthreads = config.get_nthreads();

    std::vector<SampleType> spikes;
    {
        timing::ScopeTimer timer("spike_xcorr::detect");
        spikes = detection::threshold(raw, nsamples, nchannels, thresholds,
                                      nthreads);
        detection::clear_refractory(spikes, nsamples, nchannels,
                                    config.get_refractory_samples(), nthreads);
    }

    SpikeXcorrResult result;
    result.nchannels = nchannels;
    {
        timing::ScopeTimer timer("spike_xcorr::bin");
        const auto edges =
            algorithms::uniform_bin_edges(nsamples, config.get_bin_size());
        result.nbins  = edges.size() - 1;
        result.binned = algorithms::bin_data(spikes, nsamples, nchannels,
                                             edges, nthreads);
    }
    error_check::check(result.nbins > 0,
                       "spike_xcorr: no complete or partial bins to correlate");

    result.active.assign(nchannels, 1);
    std::vector<double> counts(result.binned.size());
    SizeType ninactive = 0;
    for (SizeType k = 0; k < nchannels; ++k) {
        CountType total = 0;
        for (SizeType b = 0; b < result.nbins; ++b) {
            total += result.binned[(b * nchannels) + k];
        }
        const double rate =
            static_cast<double>(total) / static_cast<double>(result.nbins);
        if (rate < config.get_firing_rate_threshold()) {
            result.active[k] = 0;
            ++ninactive;
            continue;
        }
        for (SizeType b = 0; b < result.nbins; ++b) {
            counts[(b * nchannels) + k] =
                static_cast<double>(result.binned[(b * nchannels) + k]);
        }
    }
    if (ninactive > 0) {
        spdlog::warn("spike_xcorr: {} of {} channels below firing rate "
                     "threshold {}",
                     ninactive, nchannels, config.get_firing_rate_threshold());
    }

    {
        timing::ScopeTimer timer("spike_xcorr::xcorr");
        const auto xc = matrix_xcorr(counts, result.nbins, nchannels,
                                     config.get_xcorr_config());
        const auto row = xc.lag_row(config.get_which_lag());
        result.xcorr.assign(row.begin(), row.end());
    }
    for (SizeType i = 0; i < nchannels; ++i) {
        for (SizeType r = 0; r < nchannels; ++r) {
            if (result.active[i] == 0 || result.active[r] == 0) {
                result.xcorr[(i * nchannels) + r] = kNaN;
            }
        }
    }
    return result;
}

SpikeXcorrSweep spike_xcorr_sweep(std::span<const float> raw,
                                  SizeType nsamples,
                                  SizeType nchannels,
                                  std::span<const float> threshold_levels,
                                  const SpikeXcorrConfig& config) {
    error_check::check_equal(
        raw.size(),
        error_check::checked_product(
            nsamples, nchannels, "spike_xcorr_sweep: raw shape is too large"),
        "spike_xcorr_sweep: raw size does not match nsamples * nchannels");
    error_check::check(!threshold_levels.empty(),
                       "spike_xcorr_sweep: no threshold levels given");
    error_check::check(nsamples > 1,
                       "spike_xcorr_sweep: need at least two samples to "
                       "estimate the channel deviation");

    const std::vector<double> deviation =
        channel_deviation(raw, nsamples, nchannels);
    const SizeType npairs = nchannels * nchannels;
    const SizeType nlevel = threshold_levels.size();

    // Full (nlevel, npairs) table before dropping the all-NaN rows and columns
    std::vector<double> table(nlevel * npairs);
    std::vector<float> thresholds(nchannels);
    for (SizeType il = 0; il < nlevel; ++il) {
        const float level = threshold_levels[il];
        for (SizeType k = 0; k < nchannels; ++k) {
            thresholds[k] = static_cast<float>(level * deviation[k]);
            // A flat channel must not flip a negative sweep to
            // upward crossings
            if (level < 0.0F) {
                thresholds[k] = std::min(thresholds[k],
                                         -std::numeric_limits<float>::min());
            }
        }
        const auto result =
            spike_xcorr(raw, nsamples, nchannels, thresholds, config);
        std::ranges::copy(result.xcorr,
                          table.begin() + static_cast<IndexType>(il * npairs));
    }

    SpikeXcorrSweep sweep;
    sweep.nchannels = nchannels;
    for (SizeType p = 0; p < npairs; ++p) {
        for (SizeType il = 0; il < nlevel; ++il) {
            if (!std::isnan(table[(il * npairs) + p])) {
                sweep.pairs.push_back(p);
                break;
            }
        }
    }
    for (SizeType il = 0; il < nlevel; ++il) {
        const double* row = table.data() + (il * npairs);
        const bool any_finite = std::ranges::any_of(
            sweep.pairs, [row](SizeType p) { return !std::isnan(row[p]); });
        if (!any_finite) {
            continue;
        }
        sweep.levels.push_back(threshold_levels[il]);
        for (const SizeType p : sweep.pairs) {
            sweep.values.push_back(row[p]);
        }
    }
    spdlog::info("spike_xcorr_sweep: kept {} of {} levels and {} of {} pairs",
                 sweep.levels.size(), nlevel, sweep.pairs.size(), npairs);
    return sweep;
}

} // namespace spikecorr::pipelines
