#include <algorithm>
#include <cstddef>
#include <random>
#include <span>
#include <vector>

#include <benchmark/benchmark.h>

#include "spikecorr/algorithms/binning.hpp"
#include "spikecorr/algorithms/xcorr.hpp"

namespace spikecorr::algorithms {

class BinningFixture : public benchmark::Fixture {
public:
    void SetUp(const ::benchmark::State& state) override {
        nchannels = 64;
        nsamples  = state.range(0);
        bin_size  = 1000;
    }

    void TearDown(const ::benchmark::State& /*unused*/) override {}

    std::vector<SampleType> generate_spikes(std::mt19937& gen) const {
        std::vector<SampleType> vec(nsamples * nchannels);
        std::bernoulli_distribution coin(0.01);
        std::generate(vec.begin(), vec.end(),
                      [&]() { return coin(gen) ? 1 : 0; });
        return vec;
    }

    size_t nchannels{};
    size_t nsamples{};
    size_t bin_size{};
};

class XcorrFixture : public benchmark::Fixture {
public:
    void SetUp(const ::benchmark::State& state) override {
        nblocks = state.range(0);
        ncols   = 2049;
    }

    void TearDown(const ::benchmark::State& /*unused*/) override {}

    std::vector<ComplexType> generate_vector(size_t size,
                                             std::mt19937& gen) const {
        std::vector<ComplexType> vec(size);
        std::normal_distribution<double> dis(0.0, 1.0);
        std::generate(vec.begin(), vec.end(),
                      [&]() { return ComplexType(dis(gen), dis(gen)); });
        return vec;
    }

    size_t nblocks{};
    size_t ncols{};
};

BENCHMARK_DEFINE_F(BinningFixture, BM_bin_data_seq)(benchmark::State& state) {
    std::mt19937 gen(42);
    const auto spikes = generate_spikes(gen);
    const auto edges  = uniform_bin_edges(nsamples, bin_size);
    for (auto _ : state) {
        auto counts = bin_data(std::span(spikes), nsamples, nchannels,
                               std::span(edges), 1);
        benchmark::DoNotOptimize(counts.data());
    }
}

BENCHMARK_DEFINE_F(BinningFixture, BM_bin_data_par)(benchmark::State& state) {
    std::mt19937 gen(42);
    const auto spikes = generate_spikes(gen);
    const auto edges  = uniform_bin_edges(nsamples, bin_size);
    for (auto _ : state) {
        auto counts = bin_data(std::span(spikes), nsamples, nchannels,
                               std::span(edges), 8);
        benchmark::DoNotOptimize(counts.data());
    }
}

BENCHMARK_DEFINE_F(XcorrFixture,
                   BM_cross_correlate_seq)(benchmark::State& state) {
    std::mt19937 gen(42);
    const auto x  = generate_vector(nblocks * ncols, gen);
    const auto xc = pair_conjugates<ComplexType>(x, nblocks, ncols);
    std::vector<ComplexType> c(nblocks * nblocks * ncols);
    for (auto _ : state) {
        cross_correlate<ComplexType>(x, xc, c, nblocks, ncols, 1);
        benchmark::DoNotOptimize(c.data());
    }
}

BENCHMARK_DEFINE_F(XcorrFixture,
                   BM_cross_correlate_par)(benchmark::State& state) {
    std::mt19937 gen(42);
    const auto x  = generate_vector(nblocks * ncols, gen);
    const auto xc = pair_conjugates<ComplexType>(x, nblocks, ncols);
    std::vector<ComplexType> c(nblocks * nblocks * ncols);
    for (auto _ : state) {
        cross_correlate<ComplexType>(x, xc, c, nblocks, ncols, 0);
        benchmark::DoNotOptimize(c.data());
    }
}

constexpr size_t kMinNsamples = 1 << 16;
constexpr size_t kMaxNsamples = 1 << 20;
constexpr size_t kMinBlocks   = 8;
constexpr size_t kMaxBlocks   = 64;

BENCHMARK_REGISTER_F(BinningFixture, BM_bin_data_seq)
    ->RangeMultiplier(4)
    ->Range(kMinNsamples, kMaxNsamples);

BENCHMARK_REGISTER_F(BinningFixture, BM_bin_data_par)
    ->RangeMultiplier(4)
    ->Range(kMinNsamples, kMaxNsamples);

BENCHMARK_REGISTER_F(XcorrFixture, BM_cross_correlate_seq)
    ->RangeMultiplier(2)
    ->Range(kMinBlocks, kMaxBlocks);

BENCHMARK_REGISTER_F(XcorrFixture, BM_cross_correlate_par)
    ->RangeMultiplier(2)
    ->Range(kMinBlocks, kMaxBlocks);

} // namespace spikecorr::algorithms
