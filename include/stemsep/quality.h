//
//  quality.h
//  StemSep
//
//  Created by Till Toenshoff on 2026-10-09.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include "stemsep/audio_buffer.h"
#include "stemsep/separator.h"

#include <map>
#include <string>

namespace stemsep {

/// @brief Power-ratio heuristic for separated stems.
///
/// A stem scores high when it carries a plausible share of the mix energy,
/// correlates with the mix and does not clip. This is not a perceptual metric.
class QualityAssessor {
public:
    struct Weights {
        // Stems below this energy share of the mix are treated as near silent.
        double min_energy_share = 0.01;
        double share_weight = 0.4;
        double correlation_weight = 0.6;
        // Absolute sample level counted as clipped.
        float clip_level = 0.999f;
        // Clipped-sample fraction that zeroes the score.
        double clip_fraction_limit = 0.01;
    };

    QualityAssessor() = default;
    explicit QualityAssessor(Weights weights) : weights_(weights) {}

    /// Score in [0, 100]. Silent stems or mixes score 0.
    double score(const AudioBuffer& stem, const AudioBuffer& original) const;

    /// Per-stem scores plus `overall` (mean stem score) and
    /// `residual_energy_ratio` (energy of mix minus stem sum over mix energy).
    std::map<std::string, double> assess(const StemMap& stems, const AudioBuffer& original) const;

    const Weights& weights() const { return weights_; }

private:
    Weights weights_;
};

/// Energy of `original - sum(stems)` relative to the energy of `original`.
/// Returns 0 for a silent original.
double residual_energy_ratio(const StemMap& stems, const AudioBuffer& original);

} // namespace stemsep
