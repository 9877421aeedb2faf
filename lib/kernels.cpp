#include "spikecorr/kernels.hpp"

#include <omp.h>

namespace spikecorr::kernels {

void bin_counts(const SampleType* __restrict__ samples,
                const IndexType* __restrict__ bin_edges,
                CountType* __restrict__ out,
                SizeType nbins,
                SizeType nchannels,
                int nthreads) noexcept {
    // Each bin owns one output row, the reduction over time stays in-thread
#pragma omp parallel for num_threads(nthreads) default(none)                   \
    shared(samples, bin_edges, out, nbins, nchannels)
    for (SizeType i = 0; i < nbins; ++i) {
        CountType* __restrict__ out_row = out + (i * nchannels);
        const auto j_start              = static_cast<SizeType>(bin_edges[i]);
        const auto j_end = static_cast<SizeType>(bin_edges[i + 1]);
        for (SizeType j = j_start; j < j_end; ++j) {
            const SampleType* __restrict__ row = samples + (j * nchannels);
            for (SizeType k = 0; k < nchannels; ++k) {
                out_row[k] += static_cast<CountType>(row[k]);
            }
        }
    }
}

template <SupportedCorrType T>
void cross_multiply(const T* __restrict__ x,
                    const T* __restrict__ xc,
                    T* __restrict__ c,
                    SizeType n,
                    SizeType nx,
                    int nthreads) noexcept {
    const SizeType group_stride = n * nx;

#pragma omp parallel for num_threads(nthreads) schedule(static) default(none) \
    shared(x, xc, c, n, nx, group_stride)
    for (SizeType i = 0; i < n; ++i) {
        broadcast_multiply(x + (i * nx), xc + (i * group_stride),
                           c + (i * group_stride), n, nx);
    }
}

template void cross_multiply<float>(const float* __restrict__ x,
                                    const float* __restrict__ xc,
                                    float* __restrict__ c,
                                    SizeType n,
                                    SizeType nx,
                                    int nthreads) noexcept;
template void cross_multiply<double>(const double* __restrict__ x,
                                     const double* __restrict__ xc,
                                     double* __restrict__ c,
                                     SizeType n,
                                     SizeType nx,
                                     int nthreads) noexcept;
template void cross_multiply<ComplexTypeF>(const ComplexTypeF* __restrict__ x,
                                           const ComplexTypeF* __restrict__ xc,
                                           ComplexTypeF* __restrict__ c,
                                           SizeType n,
                                           SizeType nx,
                                           int nthreads) noexcept;
template void cross_multiply<ComplexType>(const ComplexType* __restrict__ x,
                                          const ComplexType* __restrict__ xc,
                                          ComplexType* __restrict__ c,
                                          SizeType n,
                                          SizeType nx,
                                          int nthreads) noexcept;

} // namespace spikecorr::kernels
