//
//  assessor.cpp
//  StemSep
//
//  Created by Till Toenshoff on 2026-10-09.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "stemsep/quality.h"

#include <algorithm>
#include <cmath>
#include <vector>

namespace stemsep {
namespace {

double pearson(const float* a, const float* b, std::size_t count) {
    if (count == 0) {
        return 0.0;
    }
    double mean_a = 0.0;
    double mean_b = 0.0;
    for (std::size_t i = 0; i < count; ++i) {
        mean_a += a[i];
        mean_b += b[i];
    }
    mean_a /= static_cast<double>(count);
    mean_b /= static_cast<double>(count);

    double cov = 0.0;
    double var_a = 0.0;
    double var_b = 0.0;
    for (std::size_t i = 0; i < count; ++i) {
        const double da = a[i] - mean_a;
        const double db = b[i] - mean_b;
        cov += da * db;
        var_a += da * da;
        var_b += db * db;
    }
    if (var_a <= 0.0 || var_b <= 0.0) {
        return 0.0;
    }
    return cov / std::sqrt(var_a * var_b);
}

} // namespace

double QualityAssessor::score(const AudioBuffer& stem, const AudioBuffer& original) const {
    const std::size_t count = std::min(stem.size(), original.size());
    if (count == 0) {
        return 0.0;
    }

    double stem_energy = 0.0;
    double mix_energy = 0.0;
    std::size_t clipped = 0;
    for (std::size_t i = 0; i < count; ++i) {
        const double s = stem.data()[i];
        const double m = original.data()[i];
        stem_energy += s * s;
        mix_energy += m * m;
        if (std::fabs(stem.data()[i]) >= weights_.clip_level) {
            ++clipped;
        }
    }
    if (stem_energy <= 0.0 || mix_energy <= 0.0) {
        return 0.0;
    }

    // Full marks between the minimum share and the whole mix; linear taper
    // below, decay above (a stem louder than the mix is implausible).
    const double share = stem_energy / mix_energy;
    double share_score = 1.0;
    if (share < weights_.min_energy_share) {
        share_score = share / weights_.min_energy_share;
    } else if (share > 1.0) {
        share_score = std::max(0.0, 2.0 - share);
    }

    const double correlation =
        std::min(1.0, std::fabs(pearson(stem.data(), original.data(), count)));
    const double clip_fraction = static_cast<double>(clipped) / static_cast<double>(count);
    const double clip_penalty = std::min(1.0, clip_fraction / weights_.clip_fraction_limit);

    const double raw = weights_.share_weight * share_score +
                       weights_.correlation_weight * correlation;
    const double total = weights_.share_weight + weights_.correlation_weight;
    const double value = 100.0 * (total > 0.0 ? raw / total : 0.0) * (1.0 - clip_penalty);
    return std::max(0.0, std::min(100.0, value));
}

std::map<std::string, double> QualityAssessor::assess(const StemMap& stems,
                                                      const AudioBuffer& original) const {
    std::map<std::string, double> metrics;
    double sum = 0.0;
    for (const auto& entry : stems) {
        const double value = score(entry.second, original);
        metrics[entry.first] = value;
        sum += value;
    }
    metrics["overall"] = stems.empty() ? 0.0 : sum / static_cast<double>(stems.size());
    metrics["residual_energy_ratio"] = residual_energy_ratio(stems, original);
    return metrics;
}

double residual_energy_ratio(const StemMap& stems, const AudioBuffer& original) {
    const double mix_energy = original.energy();
    if (mix_energy <= 0.0) {
        return 0.0;
    }
    std::vector<double> residual(original.samples().begin(), original.samples().end());
    for (const auto& entry : stems) {
        const std::size_t count = std::min(residual.size(), entry.second.size());
        for (std::size_t i = 0; i < count; ++i) {
            residual[i] -= entry.second.data()[i];
        }
    }
    double residual_energy = 0.0;
    for (double value : residual) {
        residual_energy += value * value;
    }
    return residual_energy / mix_energy;
}

} // namespace stemsep
