//
//  nmf.cpp
//  StemSep
//
//  Created by Till Toenshoff on 2026-10-06.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "separators/spectral.h"
#include "stemsep/errors.h"
#include "stemsep/logging.hpp"
#include "stemsep/separator.h"

#include <chrono>
#include <memory>
#include <string>

namespace stemsep {
namespace {

class NmfSeparator final : public Separator {
public:
    const SeparatorTraits& traits() const override {
        static const SeparatorTraits traits{"nmf", false, false, false, 2};
        return traits;
    }

    bool is_available(const SeparationConfig&) const override {
        return true;
    }

    StemMap separate(const AudioBuffer& buffer,
                     std::size_t n_components,
                     const SeparationConfig& config) const override {
        if (n_components == 0) {
            throw AlgorithmFailure("nmf: at least one component is required.");
        }

        const auto start = std::chrono::steady_clock::now();
        const Spectrogram spec = compute_stft(buffer, config.stft);
        const Eigen::MatrixXf magnitude = detail::magnitude_matrix(spec);

        detail::NmfFactors factors;
        std::string error;
        if (!detail::factorize_nmf(magnitude,
                                   n_components,
                                   config.separators.nmf_max_iterations,
                                   config.separators.nmf_tolerance,
                                   config.separators.nmf_seed,
                                   &factors,
                                   &error)) {
            throw AlgorithmFailure("nmf: " + error);
        }

        std::vector<Eigen::MatrixXf> components;
        components.reserve(n_components);
        for (Eigen::Index i = 0; i < static_cast<Eigen::Index>(n_components); ++i) {
            components.push_back(factors.basis.col(i) * factors.activations.row(i));
        }
        StemMap stems =
            detail::reconstruct_soft_masks(spec, components, detail::positional_names(n_components));

        const auto end = std::chrono::steady_clock::now();
        const double elapsed_ms = std::chrono::duration<double, std::milli>(end - start).count();
        STEMSEP_LOG_INFO("nmf: " << n_components << " components, " << factors.iterations
                                 << " iterations, relative error " << factors.error << ", "
                                 << elapsed_ms << " ms");
        return stems;
    }
};

} // namespace

std::unique_ptr<Separator> make_nmf_separator() {
    return std::make_unique<NmfSeparator>();
}

} // namespace stemsep
