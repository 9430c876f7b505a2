//
//  dsp.h
//  StemSep
//
//  Created by Till Toenshoff on 2026-10-03.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstddef>
#include <vector>

namespace stemsep::detail {

inline constexpr double kPi = 3.14159265358979323846;

std::vector<float> resample_linear_mono(const std::vector<float> &input,
                                        double input_rate,
                                        double target_rate);

// Periodic Hann window (DFT-even), as used for spectral analysis.
std::vector<float> make_hann_window(std::size_t size);

float hz_to_mel(float hz);

float mel_to_hz(float mel);

// Triangular HTK mel filters, row-major `mel_bins x fft_bins`.
std::vector<float> build_mel_filterbank(std::size_t mel_bins,
                                        std::size_t fft_bins,
                                        double sample_rate, float f_min,
                                        float f_max);

// Orthonormal DCT-II of `input`, first `count` coefficients.
std::vector<float> dct_ii(const std::vector<float> &input, std::size_t count);

// Median filter with an odd kernel; edges are handled by shrinking the window.
std::vector<float> median_filter(const std::vector<float> &input,
                                 std::size_t kernel);

// Percentile in [0, 100] using linear interpolation; empty input yields 0.
float percentile(std::vector<float> values, float percent);

// Frame RMS over non-overlapping blocks of `block` samples.
std::vector<float> block_rms(const std::vector<float> &samples,
                             std::size_t block);

} // namespace stemsep::detail
