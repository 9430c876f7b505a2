//
//  balanced.cpp
//  StemSep
//
//  Created by Till Toenshoff on 2026-10-07.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "separators/spectral.h"
#include "stemsep/errors.h"
#include "stemsep/logging.hpp"
#include "stemsep/separator.h"

#include <algorithm>
#include <memory>
#include <string>

namespace stemsep {
namespace {

// Harmonic/percussive split first: the percussive part becomes drums, the
// harmonic part is factorized into the remaining stems.
class BalancedSeparator final : public Separator {
public:
    const SeparatorTraits& traits() const override {
        static const SeparatorTraits traits{"balanced", true, false, false, 3};
        return traits;
    }

    bool is_available(const SeparationConfig&) const override {
        return true;
    }

    StemMap separate(const AudioBuffer& buffer,
                     std::size_t n_components,
                     const SeparationConfig& config) const override {
        const std::size_t harmonic_components = std::max<std::size_t>(1, n_components) - 1;
        const std::size_t factors = std::max<std::size_t>(1, harmonic_components);

        const Spectrogram spec = compute_stft(buffer, config.stft);
        const Eigen::MatrixXf magnitude = detail::magnitude_matrix(spec);
        const detail::HpssMasks masks = detail::compute_hpss_masks(magnitude, config.separators);
        const Eigen::MatrixXf harmonic = magnitude.cwiseProduct(masks.harmonic);

        detail::NmfFactors nmf;
        std::string error;
        if (!detail::factorize_nmf(harmonic,
                                   factors,
                                   config.separators.nmf_max_iterations,
                                   config.separators.nmf_tolerance,
                                   config.separators.nmf_seed,
                                   &nmf,
                                   &error)) {
            throw AlgorithmFailure("balanced: " + error);
        }

        std::vector<std::string> names;
        for (const auto& name : canonical_stem_names()) {
            if (name != "drums") {
                names.push_back(name);
            }
        }
        for (std::size_t i = names.size(); i < factors; ++i) {
            names.push_back(positional_stem_name(i + 1));
        }
        names.resize(factors);

        std::vector<Eigen::MatrixXf> components;
        components.reserve(factors);
        for (Eigen::Index i = 0; i < static_cast<Eigen::Index>(factors); ++i) {
            components.push_back(nmf.basis.col(i) * nmf.activations.row(i));
        }

        StemMap stems = detail::reconstruct_soft_masks(spec, components, names, &masks.harmonic);
        stems["drums"] = apply_mask(spec, detail::mask_from_matrix(masks.percussive));

        STEMSEP_LOG_INFO("balanced: drums + " << factors << " harmonic components, "
                                              << nmf.iterations << " iterations");
        return stems;
    }
};

} // namespace

std::unique_ptr<Separator> make_balanced_separator() {
    return std::make_unique<BalancedSeparator>();
}

} // namespace stemsep
