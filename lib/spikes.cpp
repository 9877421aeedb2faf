#include "spikecorr/detection/spikes.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <numeric>
#include <random>
#include <span>
#include <stdexcept>
#include <utility>
#include <vector>

#include <boost/random/mersenne_twister.hpp>
#include <boost/random/uniform_int_distribution.hpp>
#include <fmt/format.h>
#include <omp.h>
#include <spdlog/spdlog.h>

#include "spikecorr/exceptions.hpp"
#include "spikecorr/utils.hpp"

namespace spikecorr::detection {

std::vector<SampleType> threshold(std::span<const float> raw,
                                  SizeType nsamples,
                                  SizeType nchannels,
                                  std::span<const float> thresholds,
                                  int nthreads) {
    error_check::check_equal(
        raw.size(),
        error_check::checked_product(nsamples, nchannels,
                                     "threshold: raw shape is too large"),
        "threshold: raw size does not match nsamples * nchannels");
    if (thresholds.size() != 1 && thresholds.size() != nchannels) {
        throw std::invalid_argument(fmt::format(
            "threshold: number of threshold values must be 1 (same for all "
            "channels) or {} (one per channel), got {}",
            nchannels, thresholds.size()));
    }
    std::vector<float> thr(nchannels);
    if (thresholds.size() == 1) {
        std::ranges::fill(thr, thresholds[0]);
    } else {
        std::ranges::copy(thresholds, thr.begin());
    }
    const bool below =
        std::ranges::all_of(thresholds, [](float t) { return t < 0.0F; });

    std::vector<SampleType> spikes(raw.size(), 0);
    nthreads = utils::resolve_nthreads(nthreads);
    const float* __restrict__ raw_ptr    = raw.data();
    const float* __restrict__ thr_ptr    = thr.data();
    SampleType* __restrict__ spikes_ptr = spikes.data();

#pragma omp parallel for num_threads(nthreads) default(none)                   \
    shared(raw_ptr, thr_ptr, spikes_ptr, nsamples, nchannels, below)
    for (SizeType t = 0; t < nsamples; ++t) {
        const SizeType offset = t * nchannels;
        for (SizeType k = 0; k < nchannels; ++k) {
            const float v = raw_ptr[offset + k];
            const bool hit = below ? (v < thr_ptr[k]) : (v > thr_ptr[k]);
            spikes_ptr[offset + k] = static_cast<SampleType>(hit);
        }
    }
    spdlog::debug("threshold: nsamples={}, nchannels={}, comparison={}",
                  nsamples, nchannels, below ? "<" : ">");
    return spikes;
}

SizeType samples_per_ms(double fs, double ms) {
    if (!(fs > 0.0)) {
        throw std::invalid_argument(
            fmt::format("samples_per_ms: fs must be positive (got {})", fs));
    }
    if (!(ms >= 0.0)) {
        throw std::invalid_argument(fmt::format(
            "samples_per_ms: ms must be non-negative (got {})", ms));
    }
    return static_cast<SizeType>(std::floor(fs * ms / 1000.0));
}

void clear_refractory(std::span<SampleType> spikes,
                      SizeType nsamples,
                      SizeType nchannels,
                      SizeType window,
                      int nthreads) {
    error_check::check_equal(
        spikes.size(),
        error_check::checked_product(
            nsamples, nchannels, "clear_refractory: spike shape is too large"),
        "clear_refractory: spikes size does not match nsamples * nchannels");
    if (window == 0 || nsamples == 0) {
        return;
    }
    nthreads                             = utils::resolve_nthreads(nthreads);
    SampleType* __restrict__ spikes_ptr = spikes.data();

#pragma omp parallel for num_threads(nthreads) default(none)                   \
    shared(spikes_ptr, nsamples, nchannels, window)
    for (SizeType k = 0; k < nchannels; ++k) {
        SizeType t = 0;
        while (t < nsamples) {
            if (spikes_ptr[(t * nchannels) + k] == 0) {
                ++t;
                continue;
            }
            const SizeType stop = std::min(t + window + 1, nsamples);
            for (SizeType s = t + 1; s < stop; ++s) {
                spikes_ptr[(s * nchannels) + k] = 0;
            }
            t = stop;
        }
    }
    spdlog::debug("clear_refractory: nsamples={}, nchannels={}, window={}",
                  nsamples, nchannels, window);
}

void interval_jitter(std::span<SampleType> spikes,
                     SizeType nsamples,
                     SizeType nchannels,
                     SizeType window,
                     std::uint32_t seed,
                     int nthreads) {
    error_check::check_equal(
        spikes.size(),
        error_check::checked_product(
            nsamples, nchannels, "interval_jitter: spike shape is too large"),
        "interval_jitter: spikes size does not match nsamples * nchannels");
    error_check::check(window > 0, "interval_jitter: window must be positive");
    if (nsamples == 0 || nchannels == 0) {
        return;
    }

    // One seed per channel keeps the output independent of nthreads
    std::seed_seq seq{seed};
    std::vector<std::uint32_t> channel_seeds(nchannels);
    seq.generate(channel_seeds.begin(), channel_seeds.end());

    nthreads                            = utils::resolve_nthreads(nthreads);
    SampleType* __restrict__ spikes_ptr = spikes.data();
    const std::uint32_t* seeds_ptr      = channel_seeds.data();
    const SizeType max_width            = std::min(window, nsamples);

#pragma omp parallel num_threads(nthreads) default(none)                       \
    shared(spikes_ptr, seeds_ptr, nsamples, nchannels, window, max_width)
    {
        std::vector<SizeType> slots(max_width);
#pragma omp for
        for (SizeType k = 0; k < nchannels; ++k) {
            boost::random::mt19937 engine(seeds_ptr[k]);
            for (SizeType start = 0; start < nsamples; start += window) {
                const SizeType width = std::min(window, nsamples - start);
                SizeType count       = 0;
                for (SizeType t = start; t < start + width; ++t) {
                    count += spikes_ptr[(t * nchannels) + k] != 0 ? 1 : 0;
                    spikes_ptr[(t * nchannels) + k] = 0;
                }
                // Partial Fisher-Yates: the first `count` slots are a uniform
                // draw without replacement
                std::iota(slots.begin(),
                          slots.begin() + static_cast<IndexType>(width),
                          start);
                for (SizeType i = 0; i < count; ++i) {
                    boost::random::uniform_int_distribution<SizeType> pick(
                        i, width - 1);
                    std::swap(slots[i], slots[pick(engine)]);
                    spikes_ptr[(slots[i] * nchannels) + k] = 1;
                }
            }
        }
    }
    spdlog::debug("interval_jitter: nsamples={}, nchannels={}, window={}",
                  nsamples, nchannels, window);
}

} // namespace spikecorr::detection
