#include <cstddef>
#include <limits>
#include <random>
#include <stdexcept>
#include <vector>

#include <catch2/catch_test_macros.hpp>

#include "spikecorr/detection/spikes.hpp"

using spikecorr::SampleType;
using spikecorr::SizeType;
using spikecorr::detection::clear_refractory;
using spikecorr::detection::interval_jitter;
using spikecorr::detection::samples_per_ms;
using spikecorr::detection::threshold;

TEST_CASE("threshold", "[spikes]") {
    // (T=2, N=2) row-major
    const std::vector<float> raw = {0.5F, 2.0F, -3.0F, 1.5F};
    SECTION("Positive threshold shared by all channels") {
        const std::vector<float> thr = {1.0F};
        REQUIRE(threshold(raw, 2, 2, thr) ==
                std::vector<SampleType>{0, 1, 0, 1});
    }
    SECTION("Negative thresholds detect downward crossings") {
        const std::vector<float> thr = {-1.0F};
        REQUIRE(threshold(raw, 2, 2, thr) ==
                std::vector<SampleType>{0, 0, 1, 0});
    }
    SECTION("Mixed signs compare above") {
        const std::vector<float> thr = {1.0F, -5.0F};
        REQUIRE(threshold(raw, 2, 2, thr) ==
                std::vector<SampleType>{0, 1, 0, 1});
    }
    SECTION("One threshold per channel") {
        const std::vector<float> thr = {0.0F, 1.8F};
        REQUIRE(threshold(raw, 2, 2, thr) ==
                std::vector<SampleType>{1, 1, 0, 0});
    }
    SECTION("Wrong number of thresholds") {
        const std::vector<float> thr = {1.0F, 2.0F, 3.0F};
        REQUIRE_THROWS_AS(threshold(raw, 2, 2, thr), std::invalid_argument);
    }
    SECTION("Raw data does not match the shape") {
        const std::vector<float> thr = {1.0F};
        REQUIRE_THROWS_AS(threshold(raw, 3, 2, thr), std::invalid_argument);
    }
    SECTION("Shape whose size wraps around") {
        const std::vector<float> empty;
        const std::vector<float> thr = {1.0F};
        const auto nsamples =
            (std::numeric_limits<SizeType>::max() / 2) + 1;
        REQUIRE_THROWS_AS(threshold(empty, nsamples, 2, thr),
                          std::invalid_argument);
        std::vector<SampleType> spikes;
        REQUIRE_THROWS_AS(clear_refractory(spikes, nsamples, 2, 1),
                          std::invalid_argument);
    }
}

TEST_CASE("samples_per_ms", "[spikes]") {
    REQUIRE(samples_per_ms(1000.0, 2.0) == 2);
    REQUIRE(samples_per_ms(24414.0625, 2.0) == 48);
    REQUIRE(samples_per_ms(30000.0, 0.0) == 0);
    REQUIRE_THROWS_AS(samples_per_ms(0.0, 2.0), std::invalid_argument);
    REQUIRE_THROWS_AS(samples_per_ms(1000.0, -1.0), std::invalid_argument);
}

TEST_CASE("clear_refractory", "[spikes]") {
    SECTION("Spikes inside the window are removed") {
        std::vector<SampleType> spikes = {1, 1, 1, 0, 1, 1, 0, 0, 1};
        clear_refractory(spikes, 9, 1, 2);
        REQUIRE(spikes == std::vector<SampleType>{1, 0, 0, 0, 1, 0, 0, 0, 1});
    }
    SECTION("Window reaching past the end") {
        std::vector<SampleType> spikes = {0, 0, 1, 1};
        clear_refractory(spikes, 4, 1, 10);
        REQUIRE(spikes == std::vector<SampleType>{0, 0, 1, 0});
    }
    SECTION("Zero window keeps everything") {
        std::vector<SampleType> spikes = {1, 1, 1};
        clear_refractory(spikes, 3, 1, 0);
        REQUIRE(spikes == std::vector<SampleType>{1, 1, 1});
    }
    SECTION("Channels are cleared independently") {
        // (T=4, N=2): channel 0 = {1, 1, 0, 1}, channel 1 = {0, 1, 1, 1}
        std::vector<SampleType> spikes = {1, 0, 1, 1, 0, 1, 1, 1};
        clear_refractory(spikes, 4, 2, 1);
        REQUIRE(spikes == std::vector<SampleType>{1, 0, 0, 1, 0, 0, 1, 1});
    }
    SECTION("Shape mismatch") {
        std::vector<SampleType> spikes(5);
        REQUIRE_THROWS_AS(clear_refractory(spikes, 2, 2, 1),
                          std::invalid_argument);
    }
}

TEST_CASE("clear_refractory does not depend on the thread count", "[spikes]") {
    constexpr SizeType kNsamples  = 500;
    constexpr SizeType kNchannels = 9;
    std::mt19937 gen(99);
    std::bernoulli_distribution coin(0.2);
    std::vector<SampleType> spikes(kNsamples * kNchannels);
    for (auto& s : spikes) {
        s = coin(gen) ? 1 : 0;
    }
    auto ref = spikes;
    clear_refractory(ref, kNsamples, kNchannels, 3, 1);
    clear_refractory(spikes, kNsamples, kNchannels, 3, 4);
    REQUIRE(spikes == ref);
}

namespace {

std::vector<SizeType> window_counts(const std::vector<SampleType>& spikes,
                                    SizeType nsamples,
                                    SizeType nchannels,
                                    SizeType window) {
    const SizeType nwindows = (nsamples + window - 1) / window;
    std::vector<SizeType> counts(nwindows * nchannels, 0);
    for (SizeType t = 0; t < nsamples; ++t) {
        for (SizeType k = 0; k < nchannels; ++k) {
            counts[((t / window) * nchannels) + k] +=
                spikes[(t * nchannels) + k];
        }
    }
    return counts;
}

std::vector<SampleType> random_spikes(SizeType size, unsigned int seed) {
    std::mt19937 gen(seed);
    std::bernoulli_distribution coin(0.3);
    std::vector<SampleType> spikes(size);
    for (auto& s : spikes) {
        s = coin(gen) ? 1 : 0;
    }
    return spikes;
}

} // namespace

TEST_CASE("interval_jitter", "[spikes]") {
    constexpr SizeType kNsamples  = 503;
    constexpr SizeType kNchannels = 5;
    constexpr SizeType kWindow    = 20;
    const auto original = random_spikes(kNsamples * kNchannels, 7);

    SECTION("Counts per window and channel are preserved") {
        auto jittered = original;
        interval_jitter(jittered, kNsamples, kNchannels, kWindow, 42);
        for (const auto s : jittered) {
            REQUIRE(s <= 1);
        }
        REQUIRE(window_counts(jittered, kNsamples, kNchannels, kWindow) ==
                window_counts(original, kNsamples, kNchannels, kWindow));
        REQUIRE(jittered != original);
    }
    SECTION("Same seed gives the same surrogate") {
        auto first  = original;
        auto second = original;
        interval_jitter(first, kNsamples, kNchannels, kWindow, 42);
        interval_jitter(second, kNsamples, kNchannels, kWindow, 42);
        REQUIRE(first == second);
        auto other = original;
        interval_jitter(other, kNsamples, kNchannels, kWindow, 43);
        REQUIRE(other != first);
    }
    SECTION("Result does not depend on the thread count") {
        auto ref = original;
        interval_jitter(ref, kNsamples, kNchannels, kWindow, 11, 1);
        for (const int nthreads : {2, 3, 0}) {
            auto jittered = original;
            interval_jitter(jittered, kNsamples, kNchannels, kWindow, 11,
                            nthreads);
            REQUIRE(jittered == ref);
        }
    }
    SECTION("Window longer than the recording keeps the channel totals") {
        auto jittered = original;
        interval_jitter(jittered, kNsamples, kNchannels, 10000, 5);
        REQUIRE(window_counts(jittered, kNsamples, kNchannels, kNsamples) ==
                window_counts(original, kNsamples, kNchannels, kNsamples));
    }
    SECTION("Full windows stay full") {
        std::vector<SampleType> full(12, 1);
        interval_jitter(full, 6, 2, 4, 3);
        REQUIRE(full == std::vector<SampleType>(12, 1));
    }
    SECTION("Invalid arguments") {
        auto jittered = original;
        REQUIRE_THROWS_AS(
            interval_jitter(jittered, kNsamples, kNchannels, 0, 1),
            std::invalid_argument);
        REQUIRE_THROWS_AS(
            interval_jitter(jittered, kNsamples + 1, kNchannels, kWindow, 1),
            std::invalid_argument);
    }
}
