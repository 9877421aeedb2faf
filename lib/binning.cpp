#include "spikecorr/algorithms/binning.hpp"

#include <algorithm>
#include <span>
#include <vector>

#include <spdlog/spdlog.h>

#include "spikecorr/exceptions.hpp"
#include "spikecorr/kernels.hpp"
#include "spikecorr/utils.hpp"

namespace spikecorr::algorithms {

namespace {

void validate_bin_edges(std::span<const IndexType> bin_edges,
                        SizeType nsamples) {
    error_check::check(!bin_edges.empty(),
                       "bin_data: bin_edges must hold at least one edge");
    const auto upper = static_cast<IndexType>(nsamples);
    IndexType prev   = 0;
    for (SizeType i = 0; i < bin_edges.size(); ++i) {
        const IndexType edge = bin_edges[i];
        error_check::check_greater_equal(
            edge, IndexType{0}, "bin_data: bin edge must be non-negative");
        error_check::check_less_equal(
            edge, upper, "bin_data: bin edge exceeds the number of samples");
        if (i > 0) {
            error_check::check_greater_equal(
                edge, prev, "bin_data: bin edges must be non-decreasing");
        }
        prev = edge;
    }
}

} // namespace

std::vector<CountType> bin_data(std::span<const SampleType> samples,
                                SizeType nsamples,
                                SizeType nchannels,
                                std::span<const IndexType> bin_edges,
                                int nthreads) {
    const SizeType nbins = bin_edges.empty() ? 0 : bin_edges.size() - 1;
    std::vector<CountType> out(
        error_check::checked_product(nbins, nchannels,
                                     "bin_data: output shape is too large"),
        0);
    bin_data(samples, nsamples, nchannels, bin_edges, std::span(out),
             nthreads);
    return out;
}

void bin_data(std::span<const SampleType> samples,
              SizeType nsamples,
              SizeType nchannels,
              std::span<const IndexType> bin_edges,
              std::span<CountType> out,
              int nthreads) {
    error_check::check_equal(
        samples.size(),
        error_check::checked_product(nsamples, nchannels,
                                     "bin_data: sample shape is too large"),
        "bin_data: samples size does not match nsamples * nchannels");
    validate_bin_edges(bin_edges, nsamples);
    const SizeType nbins = bin_edges.size() - 1;
    error_check::check_equal(out.size(),
                             error_check::checked_product(
                                 nbins, nchannels,
                                 "bin_data: output shape is too large"),
                             "bin_data: out size does not match nbins * "
                             "nchannels");

    std::ranges::fill(out, CountType{0});
    if (nbins == 0 || nchannels == 0) {
        return;
    }
    nthreads = utils::resolve_nthreads(nthreads);
    spdlog::debug("bin_data: nsamples={}, nchannels={}, nbins={}, nthreads={}",
                  nsamples, nchannels, nbins, nthreads);
    kernels::bin_counts(samples.data(), bin_edges.data(), out.data(), nbins,
                        nchannels, nthreads);
}

std::vector<IndexType> uniform_bin_edges(SizeType nsamples, SizeType bin_size) {
    error_check::check(bin_size > 0,
                       "uniform_bin_edges: bin_size must be positive");
    std::vector<IndexType> edges;
    edges.reserve((nsamples / bin_size) + 2);
    for (SizeType edge = 0; edge < nsamples; edge += bin_size) {
        edges.push_back(static_cast<IndexType>(edge));
    }
    edges.push_back(static_cast<IndexType>(nsamples));
    return edges;
}

} // namespace spikecorr::algorithms
