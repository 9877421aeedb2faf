#include <complex>
#include <cstddef>
#include <stdexcept>
#include <thread>
#include <vector>

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "spikecorr/utils/fft.hpp"

using Catch::Matchers::WithinAbs;
using spikecorr::ComplexType;

TEST_CASE("rfft_batch", "[fft]") {
    SECTION("Impulse has a flat spectrum") {
        std::vector<double> real = {1.0, 0.0, 0.0, 0.0, 0.0, 0.0, 0.0, 0.0};
        std::vector<ComplexType> spectrum(5);
        spikecorr::utils::rfft_batch(real, spectrum, 1, 8);
        for (const auto& v : spectrum) {
            REQUIRE_THAT(v.real(), WithinAbs(1.0, 1e-12));
            REQUIRE_THAT(v.imag(), WithinAbs(0.0, 1e-12));
        }
    }
    SECTION("Rows are transformed independently") {
        // Row 0 is constant, row 1 alternates
        std::vector<double> real = {1.0, 1.0, 1.0, 1.0, 1.0, -1.0, 1.0, -1.0};
        std::vector<ComplexType> spectrum(6);
        spikecorr::utils::rfft_batch(real, spectrum, 2, 4);
        REQUIRE_THAT(spectrum[0].real(), WithinAbs(4.0, 1e-12));
        REQUIRE_THAT(std::abs(spectrum[1]), WithinAbs(0.0, 1e-12));
        REQUIRE_THAT(std::abs(spectrum[2]), WithinAbs(0.0, 1e-12));
        REQUIRE_THAT(std::abs(spectrum[3]), WithinAbs(0.0, 1e-12));
        REQUIRE_THAT(std::abs(spectrum[4]), WithinAbs(0.0, 1e-12));
        REQUIRE_THAT(spectrum[5].real(), WithinAbs(4.0, 1e-12));
    }
    SECTION("Size mismatch") {
        std::vector<double> real(8);
        std::vector<ComplexType> spectrum(4);
        REQUIRE_THROWS_AS(spikecorr::utils::rfft_batch(real, spectrum, 1, 8),
                          std::invalid_argument);
    }
}

TEST_CASE("irfft_batch inverts rfft_batch", "[fft]") {
    const std::vector<double> signal = {0.5, -1.0, 2.0, 3.5, 0.0, 1.0,
                                        -2.0, 4.0, 1.5, 0.25};
    std::vector<double> real = signal;
    std::vector<ComplexType> spectrum(2 * 3);
    spikecorr::utils::rfft_batch(real, spectrum, 2, 5, 2);
    std::vector<double> restored(signal.size());
    spikecorr::utils::irfft_batch(spectrum, restored, 2, 5, 2);
    for (std::size_t i = 0; i < signal.size(); ++i) {
        REQUIRE_THAT(restored[i], WithinAbs(signal[i], 1e-12));
    }
}

TEST_CASE("rfft_batch plans safely from concurrent callers", "[fft]") {
    constexpr int kRows    = 4;
    constexpr int kLength  = 64;
    constexpr int kCallers = 6;
    std::vector<double> signal(kRows * kLength);
    for (std::size_t i = 0; i < signal.size(); ++i) {
        signal[i] = static_cast<double>((i * 7) % 11) - 5.0;
    }
    auto input = signal;
    std::vector<ComplexType> ref(kRows * ((kLength / 2) + 1));
    spikecorr::utils::rfft_batch(input, ref, kRows, kLength, 1);

    std::vector<std::vector<ComplexType>> outputs(
        kCallers, std::vector<ComplexType>(ref.size()));
    std::vector<std::vector<double>> inputs(kCallers, signal);
    std::vector<std::thread> callers;
    callers.reserve(kCallers);
    for (int t = 0; t < kCallers; ++t) {
        callers.emplace_back([&, t]() {
            spikecorr::utils::rfft_batch(inputs[t], outputs[t], kRows, kLength,
                                         1 + (t % 3));
        });
    }
    for (auto& caller : callers) {
        caller.join();
    }
    for (const auto& out : outputs) {
        for (std::size_t k = 0; k < ref.size(); ++k) {
            REQUIRE_THAT(out[k].real(), WithinAbs(ref[k].real(), 1e-9));
            REQUIRE_THAT(out[k].imag(), WithinAbs(ref[k].imag(), 1e-9));
        }
    }
}
