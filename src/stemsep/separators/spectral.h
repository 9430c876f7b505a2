//
//  spectral.h
//  StemSep
//
//  Created by Till Toenshoff on 2026-10-06.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include "stemsep/config.h"
#include "stemsep/separator.h"
#include "stemsep/spectrogram.h"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include <Eigen/Dense>

namespace stemsep::detail {

inline constexpr float kMaskEpsilon = 1e-10f;

// `bins x frames` magnitude of a spectrogram.
Eigen::MatrixXf magnitude_matrix(const Spectrogram& spectrogram);

// Convert a `bins x frames` matrix into a mask, clamped to [0, 1].
TimeFrequencyMask mask_from_matrix(const Eigen::MatrixXf& weights);

// Each component's share of the summed components, applied to the mixture
// spectrogram. Masks sum to 1 wherever any component is non-zero.
StemMap reconstruct_soft_masks(const Spectrogram& spectrogram,
                               const std::vector<Eigen::MatrixXf>& components,
                               const std::vector<std::string>& names,
                               const Eigen::MatrixXf* envelope = nullptr);

std::vector<std::string> positional_names(std::size_t count);

struct NmfFactors {
    Eigen::MatrixXf basis;       // bins x k
    Eigen::MatrixXf activations; // k x frames
    std::size_t iterations = 0;
    double error = 0.0;
};

// Frobenius-norm NMF with multiplicative updates and seeded random init.
bool factorize_nmf(const Eigen::MatrixXf& magnitude,
                   std::size_t components,
                   std::size_t max_iterations,
                   double tolerance,
                   std::uint32_t seed,
                   NmfFactors* out,
                   std::string* error);

struct HpssMasks {
    Eigen::MatrixXf harmonic;   // bins x frames, in [0, 1]
    Eigen::MatrixXf percussive; // 1 - harmonic
};

// Median filtering along time (harmonic) and frequency (percussive), turned
// into complementary soft masks.
HpssMasks compute_hpss_masks(const Eigen::MatrixXf& magnitude, const SeparatorConfig& config);

} // namespace stemsep::detail
