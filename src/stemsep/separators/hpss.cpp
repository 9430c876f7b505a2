//
//  hpss.cpp
//  StemSep
//
//  Created by Till Toenshoff on 2026-10-06.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "separators/spectral.h"
#include "stemsep/logging.hpp"
#include "stemsep/separator.h"

#include <utility>
#include <vector>

namespace stemsep {
namespace {

enum class Band {
    Bass,
    Vocal,
    Other
};

std::vector<Band> classify_bins(const Spectrogram& spec, const SeparatorConfig& config) {
    std::vector<Band> bands(spec.bins, Band::Other);
    for (std::size_t b = 0; b < spec.bins; ++b) {
        const double hz = spec.bin_frequency(b);
        if (hz < config.bass_high_hz) {
            bands[b] = Band::Bass;
        } else if (hz >= config.vocal_low_hz && hz <= config.vocal_high_hz) {
            bands[b] = Band::Vocal;
        }
    }
    return bands;
}

Eigen::MatrixXf restrict_to(const Eigen::MatrixXf& mask, const std::vector<Band>& bands, Band band) {
    Eigen::MatrixXf out = Eigen::MatrixXf::Zero(mask.rows(), mask.cols());
    for (Eigen::Index b = 0; b < mask.rows(); ++b) {
        if (bands[static_cast<std::size_t>(b)] == band) {
            out.row(b) = mask.row(b);
        }
    }
    return out;
}

// Vocal-band harmonic content against the full mix; bins below the bass
// split never count as vocals.
Eigen::MatrixXf vocal_mask(const Eigen::MatrixXf& harmonic, const std::vector<Band>& bands) {
    return restrict_to(harmonic, bands, Band::Vocal);
}

class HpssSeparator final : public Separator {
public:
    const SeparatorTraits& traits() const override {
        static const SeparatorTraits traits{"hpss", true, false, false, 1};
        return traits;
    }

    bool is_available(const SeparationConfig&) const override {
        return true;
    }

    StemMap separate(const AudioBuffer& buffer,
                     std::size_t n_components,
                     const SeparationConfig& config) const override {
        const Spectrogram spec = compute_stft(buffer, config.stft);
        const Eigen::MatrixXf magnitude = detail::magnitude_matrix(spec);
        const detail::HpssMasks masks = detail::compute_hpss_masks(magnitude, config.separators);
        const std::vector<Band> bands = classify_bins(spec, config.separators);

        StemMap stems;
        if (n_components >= 4) {
            const Eigen::MatrixXf vocals = vocal_mask(masks.harmonic, bands);
            const Eigen::MatrixXf bass = restrict_to(masks.harmonic, bands, Band::Bass);
            const Eigen::MatrixXf other = masks.harmonic - vocals - bass;
            stems["vocals"] = apply_mask(spec, detail::mask_from_matrix(vocals));
            stems["bass"] = apply_mask(spec, detail::mask_from_matrix(bass));
            stems["other"] = apply_mask(spec, detail::mask_from_matrix(other));
            stems["drums"] = apply_mask(spec, detail::mask_from_matrix(masks.percussive));
        } else {
            AudioBuffer vocals =
                apply_mask(spec, detail::mask_from_matrix(vocal_mask(masks.harmonic, bands)));
            const std::vector<float>& mix = buffer.samples();
            const std::vector<float>& voice = vocals.samples();
            std::vector<float> instrumental(mix.size(), 0.0f);
            for (std::size_t i = 0; i < mix.size(); ++i) {
                instrumental[i] = mix[i] - voice[i];
            }
            stems["vocals"] = std::move(vocals);
            stems["instrumental"] = AudioBuffer(std::move(instrumental), buffer.sample_rate());
        }

        STEMSEP_LOG_DEBUG("hpss: produced " << stems.size() << " stems");
        return stems;
    }
};

} // namespace

std::unique_ptr<Separator> make_hpss_separator() {
    return std::make_unique<HpssSeparator>();
}

} // namespace stemsep
