#include <cstddef>
#include <limits>
#include <random>
#include <span>
#include <stdexcept>
#include <vector>

#include <catch2/catch_test_macros.hpp>

#include "spikecorr/algorithms/binning.hpp"

using spikecorr::CountType;
using spikecorr::IndexType;
using spikecorr::SampleType;
using spikecorr::algorithms::bin_data;
using spikecorr::algorithms::uniform_bin_edges;

TEST_CASE("bin_data sums samples per bin", "[binning]") {
    SECTION("Two bins, one channel") {
        const std::vector<SampleType> samples = {1, 0, 1, 1};
        const std::vector<IndexType> edges    = {0, 2, 4};
        const auto result = bin_data(samples, 4, 1, edges);
        REQUIRE(result == std::vector<CountType>{1, 2});
    }
    SECTION("Several channels") {
        // (T=3, N=2) row-major
        const std::vector<SampleType> samples = {1, 0, 1, 1, 0, 1};
        const std::vector<IndexType> edges    = {0, 1, 3};
        const auto result = bin_data(samples, 3, 2, edges);
        REQUIRE(result == std::vector<CountType>{1, 0, 1, 2});
    }
    SECTION("Samples outside the bins are not counted") {
        const std::vector<SampleType> samples = {1, 1, 1, 1};
        const std::vector<IndexType> edges    = {1, 3};
        const auto result = bin_data(samples, 4, 1, edges);
        REQUIRE(result == std::vector<CountType>{2});
    }
}

TEST_CASE("bin_data edge cases", "[binning]") {
    SECTION("Zero-width bin sums to zero") {
        const std::vector<SampleType> samples = {1, 1, 1};
        const std::vector<IndexType> edges    = {0, 0, 2};
        const auto result = bin_data(samples, 3, 1, edges);
        REQUIRE(result.size() == 2);
        REQUIRE(result[0] == 0);
        REQUIRE(result[1] == 2);
    }
    SECTION("Single edge gives no bins") {
        const std::vector<SampleType> samples = {1, 0, 1, 1, 0, 1};
        const std::vector<IndexType> edges    = {0};
        const auto result = bin_data(samples, 2, 3, edges);
        REQUIRE(result.empty());
    }
    SECTION("No channels") {
        const std::vector<SampleType> samples;
        const std::vector<IndexType> edges = {0, 2, 4};
        const auto result = bin_data(samples, 4, 0, edges);
        REQUIRE(result.empty());
    }
}

TEST_CASE("bin_data is linear in its input", "[binning]") {
    constexpr std::size_t kNsamples  = 257;
    constexpr std::size_t kNchannels = 5;
    std::mt19937 gen(42);
    std::bernoulli_distribution coin(0.3);
    std::vector<SampleType> a(kNsamples * kNchannels);
    std::vector<SampleType> b(kNsamples * kNchannels);
    std::vector<SampleType> sum(kNsamples * kNchannels);
    for (std::size_t i = 0; i < a.size(); ++i) {
        a[i]   = coin(gen) ? 1 : 0;
        b[i]   = coin(gen) ? 1 : 0;
        sum[i] = static_cast<SampleType>(a[i] + b[i]);
    }
    const std::vector<IndexType> edges = {0, 13, 13, 100, 200, 257};

    const auto bin_a   = bin_data(a, kNsamples, kNchannels, edges);
    const auto bin_b   = bin_data(b, kNsamples, kNchannels, edges);
    const auto bin_sum = bin_data(sum, kNsamples, kNchannels, edges);
    REQUIRE(bin_sum.size() == bin_a.size());
    for (std::size_t i = 0; i < bin_sum.size(); ++i) {
        REQUIRE(bin_sum[i] == bin_a[i] + bin_b[i]);
    }
}

TEST_CASE("bin_data does not depend on the thread count", "[binning]") {
    constexpr std::size_t kNsamples  = 1000;
    constexpr std::size_t kNchannels = 7;
    std::mt19937 gen(7);
    std::bernoulli_distribution coin(0.1);
    std::vector<SampleType> samples(kNsamples * kNchannels);
    for (auto& s : samples) {
        s = coin(gen) ? 1 : 0;
    }
    const auto edges = uniform_bin_edges(kNsamples, 33);
    const auto ref   = bin_data(samples, kNsamples, kNchannels, edges, 1);
    REQUIRE(bin_data(samples, kNsamples, kNchannels, edges, 4) == ref);
    REQUIRE(bin_data(samples, kNsamples, kNchannels, edges, 0) == ref);
}

TEST_CASE("bin_data into a caller-provided array", "[binning]") {
    const std::vector<SampleType> samples = {1, 0, 1, 1};
    const std::vector<IndexType> edges    = {0, 2, 4};
    SECTION("Output is zero-filled first") {
        std::vector<CountType> out = {99, -5};
        bin_data(samples, 4, 1, edges, std::span<CountType>(out));
        REQUIRE(out == std::vector<CountType>{1, 2});
    }
    SECTION("Wrong output size") {
        std::vector<CountType> out(3);
        REQUIRE_THROWS_AS(
            bin_data(samples, 4, 1, edges, std::span<CountType>(out)),
            std::invalid_argument);
    }
}

TEST_CASE("bin_data rejects invalid input", "[binning]") {
    const std::vector<SampleType> samples = {1, 0, 1, 1};
    SECTION("Edge beyond the number of samples") {
        const std::vector<IndexType> edges = {0, 2, 5};
        REQUIRE_THROWS_AS(bin_data(samples, 4, 1, edges),
                          std::invalid_argument);
    }
    SECTION("Negative edge") {
        const std::vector<IndexType> edges = {-1, 2};
        REQUIRE_THROWS_AS(bin_data(samples, 4, 1, edges),
                          std::invalid_argument);
    }
    SECTION("Decreasing edges") {
        const std::vector<IndexType> edges = {0, 3, 2};
        REQUIRE_THROWS_AS(bin_data(samples, 4, 1, edges),
                          std::invalid_argument);
    }
    SECTION("No edges") {
        const std::vector<IndexType> edges;
        REQUIRE_THROWS_AS(bin_data(samples, 4, 1, edges),
                          std::invalid_argument);
    }
    SECTION("Samples do not match the shape") {
        const std::vector<IndexType> edges = {0, 2};
        REQUIRE_THROWS_AS(bin_data(samples, 3, 1, edges),
                          std::invalid_argument);
    }
    SECTION("Shape whose size wraps around") {
        // (SIZE_MAX / 4 + 1) * 4 is 0 modulo 2^64
        const std::vector<SampleType> empty;
        const std::vector<IndexType> edges = {0, 2};
        const auto nsamples =
            (std::numeric_limits<std::size_t>::max() / 4) + 1;
        REQUIRE_THROWS_AS(bin_data(empty, nsamples, 4, edges),
                          std::invalid_argument);
        std::vector<CountType> out(4);
        REQUIRE_THROWS_AS(bin_data(empty, nsamples, 4, edges, out),
                          std::invalid_argument);
    }
}

TEST_CASE("uniform_bin_edges", "[binning]") {
    SECTION("Partial last bin") {
        REQUIRE(uniform_bin_edges(10, 4) == std::vector<IndexType>{0, 4, 8, 10});
    }
    SECTION("Exact division") {
        REQUIRE(uniform_bin_edges(8, 4) == std::vector<IndexType>{0, 4, 8});
    }
    SECTION("No samples") {
        REQUIRE(uniform_bin_edges(0, 4) == std::vector<IndexType>{0});
    }
    SECTION("Zero bin size") {
        REQUIRE_THROWS_AS(uniform_bin_edges(8, 0), std::invalid_argument);
    }
}
