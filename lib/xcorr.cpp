#include "spikecorr/algorithms/xcorr.hpp"

#include <algorithm>
#include <span>
#include <vector>

#include <spdlog/spdlog.h>

#include "spikecorr/exceptions.hpp"
#include "spikecorr/kernels.hpp"
#include "spikecorr/utils.hpp"

namespace spikecorr::algorithms {

template <SupportedCorrType T>
void cross_correlate(std::span<const T> x,
                     std::span<const T> xc,
                     std::span<T> c,
                     SizeType n,
                     SizeType nx,
                     int nthreads) {
    const SizeType block_size = error_check::checked_product(
        n, nx, "cross_correlate: block shape is too large");
    const SizeType group_size = error_check::checked_product(
        n, block_size, "cross_correlate: pair-group shape is too large");
    error_check::check_equal(x.size(), block_size,
                             "cross_correlate: x size does not match n * nx");
    error_check::check_equal(
        xc.size(), group_size,
        "cross_correlate: xc size does not match n * n * nx");
    error_check::check_equal(
        c.size(), group_size,
        "cross_correlate: c size does not match n * n * nx");
    if (n == 0 || nx == 0) {
        return;
    }
    nthreads = utils::resolve_nthreads(nthreads);
    spdlog::debug("cross_correlate: n={}, nx={}, nthreads={}", n, nx,
                  nthreads);
    kernels::cross_multiply(x.data(), xc.data(), c.data(), n, nx, nthreads);
}

template <SupportedCorrType T>
std::vector<T> pair_conjugates(std::span<const T> x, SizeType n, SizeType nx) {
    const SizeType block_size = error_check::checked_product(
        n, nx, "pair_conjugates: block shape is too large");
    error_check::check_equal(x.size(), block_size,
                             "pair_conjugates: x size does not match n * nx");
    std::vector<T> xc(error_check::checked_product(
        n, block_size, "pair_conjugates: pair-group shape is too large"));
    std::vector<T> x_conj(x.size());
    std::ranges::transform(x, x_conj.begin(),
                           [](const T& v) { return conjugate(v); });
    for (SizeType i = 0; i < n; ++i) {
        std::ranges::copy(x_conj,
                          xc.begin() + static_cast<IndexType>(i * block_size));
    }
    return xc;
}

template void cross_correlate<float>(std::span<const float> x,
                                     std::span<const float> xc,
                                     std::span<float> c,
                                     SizeType n,
                                     SizeType nx,
                                     int nthreads);
template void cross_correlate<double>(std::span<const double> x,
                                      std::span<const double> xc,
                                      std::span<double> c,
                                      SizeType n,
                                      SizeType nx,
                                      int nthreads);
template void cross_correlate<ComplexTypeF>(std::span<const ComplexTypeF> x,
                                            std::span<const ComplexTypeF> xc,
                                            std::span<ComplexTypeF> c,
                                            SizeType n,
                                            SizeType nx,
                                            int nthreads);
template void cross_correlate<ComplexType>(std::span<const ComplexType> x,
                                           std::span<const ComplexType> xc,
                                           std::span<ComplexType> c,
                                           SizeType n,
                                           SizeType nx,
                                           int nthreads);

template std::vector<float>
pair_conjugates<float>(std::span<const float> x, SizeType n, SizeType nx);
template std::vector<double>
pair_conjugates<double>(std::span<const double> x, SizeType n, SizeType nx);
template std::vector<ComplexTypeF> pair_conjugates<ComplexTypeF>(
    std::span<const ComplexTypeF> x, SizeType n, SizeType nx);
template std::vector<ComplexType> pair_conjugates<ComplexType>(
    std::span<const ComplexType> x, SizeType n, SizeType nx);

} // namespace spikecorr::algorithms
