#pragma once

#include <span>

#include "spikecorr/common/types.hpp"

namespace spikecorr::utils {

// Initialise FFTW's threading support once per process.
void ensure_fftw_threading();

/**
 * @brief Batched real-to-complex FFT of contiguous rows.
 *
 * @param real_input      Input rows (size: batch_size * n_real).
 * @param complex_output  Output rows (size: batch_size * (n_real / 2 + 1)).
 * @param batch_size      Number of transforms.
 * @param n_real          Length of each real transform.
 * @param nthreads        Number of FFTW threads; <= 0 selects the OpenMP
 *                        maximum.
 */
void rfft_batch(std::span<double> real_input,
                std::span<ComplexType> complex_output,
                int batch_size,
                int n_real,
                int nthreads = 1);

/**
 * @brief Batched complex-to-real inverse FFT of contiguous rows, normalised
 * by 1 / n_real.
 *
 * @param complex_input  Input rows (size: batch_size * (n_real / 2 + 1)).
 *                       Destroyed by the transform.
 * @param real_output    Output rows (size: batch_size * n_real).
 */
void irfft_batch(std::span<ComplexType> complex_input,
                 std::span<double> real_output,
                 int batch_size,
                 int n_real,
                 int nthreads = 1);

} // namespace spikecorr::utils
