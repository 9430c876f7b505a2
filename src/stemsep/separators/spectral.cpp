//
//  spectral.cpp
//  StemSep
//
//  Created by Till Toenshoff on 2026-10-06.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "separators/spectral.h"

#include "audio/dsp.h"
#include "stemsep/logging.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <random>
#include <utility>

namespace stemsep::detail {

Eigen::MatrixXf magnitude_matrix(const Spectrogram& spectrogram) {
    Eigen::MatrixXf out(static_cast<Eigen::Index>(spectrogram.bins),
                        static_cast<Eigen::Index>(spectrogram.frames));
    for (std::size_t f = 0; f < spectrogram.frames; ++f) {
        for (std::size_t b = 0; b < spectrogram.bins; ++b) {
            out(static_cast<Eigen::Index>(b), static_cast<Eigen::Index>(f)) =
                std::abs(spectrogram.values[f * spectrogram.bins + b]);
        }
    }
    return out;
}

TimeFrequencyMask mask_from_matrix(const Eigen::MatrixXf& weights) {
    TimeFrequencyMask mask;
    mask.bins = static_cast<std::size_t>(weights.rows());
    mask.frames = static_cast<std::size_t>(weights.cols());
    mask.values.resize(mask.bins * mask.frames);
    // Column-major storage matches the frame-major mask layout.
    const Eigen::MatrixXf clamped = weights.cwiseMax(0.0f).cwiseMin(1.0f);
    std::copy(clamped.data(), clamped.data() + clamped.size(), mask.values.begin());
    return mask;
}

std::vector<std::string> positional_names(std::size_t count) {
    std::vector<std::string> names;
    names.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        names.push_back(positional_stem_name(i));
    }
    return names;
}

StemMap reconstruct_soft_masks(const Spectrogram& spectrogram,
                               const std::vector<Eigen::MatrixXf>& components,
                               const std::vector<std::string>& names,
                               const Eigen::MatrixXf* envelope) {
    StemMap stems;
    if (components.empty()) {
        return stems;
    }

    Eigen::MatrixXf total = Eigen::MatrixXf::Zero(components.front().rows(),
                                                  components.front().cols());
    for (const auto& component : components) {
        total += component;
    }
    const Eigen::ArrayXXf denom = total.array() + kMaskEpsilon;

    for (std::size_t i = 0; i < components.size() && i < names.size(); ++i) {
        Eigen::MatrixXf share = (components[i].array() / denom).matrix();
        if (envelope) {
            share = share.cwiseProduct(*envelope);
        }
        stems[names[i]] = apply_mask(spectrogram, mask_from_matrix(share));
    }
    return stems;
}

bool factorize_nmf(const Eigen::MatrixXf& magnitude,
                   std::size_t components,
                   std::size_t max_iterations,
                   double tolerance,
                   std::uint32_t seed,
                   NmfFactors* out,
                   std::string* error) {
    if (!out) {
        if (error) {
            *error = "Invalid output factors.";
        }
        return false;
    }
    if (components == 0 || magnitude.size() == 0) {
        if (error) {
            *error = "Factorization needs a non-empty matrix and at least one component.";
        }
        return false;
    }
    if (!magnitude.allFinite()) {
        if (error) {
            *error = "Magnitude spectrogram contains non-finite values.";
        }
        return false;
    }

    const Eigen::Index bins = magnitude.rows();
    const Eigen::Index frames = magnitude.cols();
    const Eigen::Index k = static_cast<Eigen::Index>(components);
    const float mean = magnitude.mean();
    const float scale = std::sqrt(std::max(mean, 1e-12f) / static_cast<float>(k));

    std::mt19937 rng(seed);
    auto uniform = [&rng]() {
        return static_cast<float>(static_cast<double>(rng()) / 4294967296.0);
    };
    Eigen::MatrixXf w(bins, k);
    Eigen::MatrixXf h(k, frames);
    for (Eigen::Index j = 0; j < k; ++j) {
        for (Eigen::Index i = 0; i < bins; ++i) {
            w(i, j) = scale * (0.01f + uniform());
        }
    }
    for (Eigen::Index j = 0; j < frames; ++j) {
        for (Eigen::Index i = 0; i < k; ++i) {
            h(i, j) = scale * (0.01f + uniform());
        }
    }

    const float eps = 1e-9f;
    const double norm = std::max(1e-12, static_cast<double>(magnitude.norm()));
    double previous = std::numeric_limits<double>::max();
    std::size_t iteration = 0;
    double residual = 0.0;
    for (; iteration < max_iterations; ++iteration) {
        const Eigen::MatrixXf wt_v = w.transpose() * magnitude;
        const Eigen::MatrixXf wt_wh = (w.transpose() * w) * h;
        h = h.cwiseProduct((wt_v.array() / (wt_wh.array() + eps)).matrix());

        const Eigen::MatrixXf v_ht = magnitude * h.transpose();
        const Eigen::MatrixXf w_hht = w * (h * h.transpose());
        w = w.cwiseProduct((v_ht.array() / (w_hht.array() + eps)).matrix());

        if ((iteration + 1) % 10 == 0 || iteration + 1 == max_iterations) {
            residual = static_cast<double>((magnitude - w * h).norm()) / norm;
            STEMSEP_LOG_DEBUG("NMF: iteration " << iteration + 1 << " relative error " << residual);
            if (previous - residual < tolerance) {
                ++iteration;
                break;
            }
            previous = residual;
        }
    }

    if (!w.allFinite() || !h.allFinite()) {
        if (error) {
            *error = "Factorization diverged.";
        }
        return false;
    }

    out->basis = std::move(w);
    out->activations = std::move(h);
    out->iterations = iteration;
    out->error = residual;
    return true;
}

HpssMasks compute_hpss_masks(const Eigen::MatrixXf& magnitude, const SeparatorConfig& config) {
    const Eigen::Index bins = magnitude.rows();
    const Eigen::Index frames = magnitude.cols();
    Eigen::MatrixXf harmonic(bins, frames);
    Eigen::MatrixXf percussive(bins, frames);

    std::vector<float> line;
    line.resize(static_cast<std::size_t>(frames));
    for (Eigen::Index b = 0; b < bins; ++b) {
        for (Eigen::Index f = 0; f < frames; ++f) {
            line[static_cast<std::size_t>(f)] = magnitude(b, f);
        }
        const std::vector<float> filtered = median_filter(line, config.hpss_harmonic_kernel);
        for (Eigen::Index f = 0; f < frames; ++f) {
            harmonic(b, f) = filtered[static_cast<std::size_t>(f)];
        }
    }

    line.resize(static_cast<std::size_t>(bins));
    for (Eigen::Index f = 0; f < frames; ++f) {
        for (Eigen::Index b = 0; b < bins; ++b) {
            line[static_cast<std::size_t>(b)] = magnitude(b, f);
        }
        const std::vector<float> filtered = median_filter(line, config.hpss_percussive_kernel);
        for (Eigen::Index b = 0; b < bins; ++b) {
            percussive(b, f) = filtered[static_cast<std::size_t>(b)];
        }
    }

    const float power = config.hpss_mask_power;
    const Eigen::ArrayXXf h_pow = harmonic.array().pow(power);
    const Eigen::ArrayXXf p_pow = percussive.array().pow(power);
    const Eigen::ArrayXXf total = h_pow + p_pow;

    HpssMasks masks;
    // Where both estimates vanish the bin is split evenly.
    masks.harmonic = (total > kMaskEpsilon).select(h_pow / (total + kMaskEpsilon), 0.5f).matrix();
    masks.percussive = (1.0f - masks.harmonic.array()).matrix();
    return masks;
}

} // namespace stemsep::detail
