#pragma once

#include <complex>
#include <cstddef>
#include <cstdint>
#include <type_traits>

namespace spikecorr {

using SizeType     = std::size_t;
using IndexType    = std::ptrdiff_t;
using SampleType   = std::uint8_t;
using CountType    = std::int64_t;
using ComplexType  = std::complex<double>;
using ComplexTypeF = std::complex<float>;

template <typename T>
concept SupportedCorrType =
    std::is_same_v<T, float> || std::is_same_v<T, double> ||
    std::is_same_v<T, ComplexTypeF> || std::is_same_v<T, ComplexType>;

template <typename T>
concept ComplexCorrType =
    std::is_same_v<T, ComplexTypeF> || std::is_same_v<T, ComplexType>;

// Complex conjugate for complex types, identity for real types.
template <SupportedCorrType T> constexpr T conjugate(const T& value) {
    if constexpr (ComplexCorrType<T>) {
        return std::conj(value);
    } else {
        return value;
    }
}

} // namespace spikecorr
