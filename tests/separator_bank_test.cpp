//
//  separator_bank_test.cpp
//  StemSep
//
//  Created by Till Toenshoff on 2026-10-14.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "stemsep/errors.h"
#include "stemsep/quality.h"
#include "stemsep/separator.h"
#include "stemsep/spectrogram.h"
#include "synthetic_audio_test_utils.h"

#include <cmath>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace {

using namespace stemsep::tests::synthetic_audio;

constexpr double kSampleRate = 22050.0;

class AlwaysFailing final : public stemsep::Separator {
public:
    const stemsep::SeparatorTraits& traits() const override {
        static const stemsep::SeparatorTraits traits{"nmf", false, false, false, 2};
        return traits;
    }
    bool is_available(const stemsep::SeparationConfig&) const override { return true; }
    stemsep::StemMap separate(const stemsep::AudioBuffer&,
                              std::size_t,
                              const stemsep::SeparationConfig&) const override {
        throw stemsep::AlgorithmFailure("forced failure");
    }
};

class WrongLength final : public stemsep::Separator {
public:
    const stemsep::SeparatorTraits& traits() const override {
        static const stemsep::SeparatorTraits traits{"short", false, false, false, 9};
        return traits;
    }
    bool is_available(const stemsep::SeparationConfig&) const override { return true; }
    stemsep::StemMap separate(const stemsep::AudioBuffer& buffer,
                              std::size_t,
                              const stemsep::SeparationConfig&) const override {
        stemsep::StemMap stems;
        stems["vocals"] = stemsep::AudioBuffer(std::vector<float>(buffer.size() / 2, 0.0f),
                                               buffer.sample_rate());
        return stems;
    }
};

bool test_stft_round_trip() {
    const stemsep::AudioBuffer mix = make_mix(kSampleRate, 0.8);
    const auto spec = stemsep::compute_stft(mix, stemsep::StftConfig{});
    if (spec.bins != 1025 || spec.frames != 1 + mix.size() / 512) {
        std::cerr << "Separator bank test failed: unexpected STFT shape.\n";
        return false;
    }
    const auto restored = stemsep::inverse_stft(spec);
    if (restored.size() != mix.size()) {
        std::cerr << "Separator bank test failed: inverse STFT length mismatch.\n";
        return false;
    }
    double error = 0.0;
    for (std::size_t i = 0; i < mix.size(); ++i) {
        const double d = restored.samples()[i] - mix.samples()[i];
        error += d * d;
    }
    if (error / mix.energy() > 1e-6) {
        std::cerr << "Separator bank test failed: STFT round trip error " << error / mix.energy()
                  << ".\n";
        return false;
    }
    return true;
}

bool test_default_bank_contents() {
    const auto bank = stemsep::SeparatorBank::make_default();
    for (const char* name : {"nmf", "ica", "hpss", "balanced", "torch", "demucs_external"}) {
        if (!bank.find(name)) {
            std::cerr << "Separator bank test failed: missing " << name << ".\n";
            return false;
        }
    }
    const auto external = bank.find("demucs_external");
    if (!external->traits().capability_gated || !external->traits().general_purpose ||
        bank.find("hpss")->traits().capability_gated) {
        std::cerr << "Separator bank test failed: unexpected traits.\n";
        return false;
    }
    return true;
}

bool test_spectral_variants_conserve_energy() {
    const auto bank = stemsep::SeparatorBank::make_default();
    const stemsep::AudioBuffer mix = make_mix(kSampleRate, 1.5);
    const stemsep::SeparationConfig config;

    struct Case {
        const char* name;
        std::size_t components;
        std::size_t expected_stems;
    };
    const Case cases[] = {
        {"nmf", 4, 4}, {"nmf", 2, 2}, {"ica", 3, 3}, {"hpss", 4, 4},
        {"hpss", 2, 2}, {"balanced", 4, 4},
    };

    for (const auto& c : cases) {
        const auto outcome = bank.find(c.name)->try_separate(mix, c.components, config);
        if (!outcome.ok()) {
            std::cerr << "Separator bank test failed: " << c.name << " reported "
                      << stemsep::outcome_status_name(outcome.status) << ": " << outcome.message
                      << "\n";
            return false;
        }
        if (outcome.stems.size() != c.expected_stems) {
            std::cerr << "Separator bank test failed: " << c.name << " produced "
                      << outcome.stems.size() << " stems.\n";
            return false;
        }
        for (const auto& stem : outcome.stems) {
            if (stem.second.size() != mix.size() || stem.second.sample_rate() != kSampleRate) {
                std::cerr << "Separator bank test failed: " << c.name << " stem " << stem.first
                          << " is not aligned with the input.\n";
                return false;
            }
        }
        const double residual = stemsep::residual_energy_ratio(outcome.stems, mix);
        if (!(residual < 0.05)) {
            std::cerr << "Separator bank test failed: " << c.name << " residual energy "
                      << residual << ".\n";
            return false;
        }
    }
    return true;
}

bool test_hpss_two_stem_naming() {
    const auto hpss = stemsep::make_hpss_separator();
    const auto stems = hpss->separate(make_mix(kSampleRate, 1.0), 2, stemsep::SeparationConfig{});
    if (stems.count("vocals") != 1 || stems.count("instrumental") != 1) {
        std::cerr << "Separator bank test failed: hpss should emit vocals and instrumental.\n";
        return false;
    }
    return true;
}

bool test_nmf_is_deterministic() {
    const auto nmf = stemsep::make_nmf_separator();
    const stemsep::AudioBuffer mix = make_mix(kSampleRate, 1.0);
    const auto a = nmf->separate(mix, 3, stemsep::SeparationConfig{});
    const auto b = nmf->separate(mix, 3, stemsep::SeparationConfig{});
    for (const auto& entry : a) {
        if (b.at(entry.first).samples() != entry.second.samples()) {
            std::cerr << "Separator bank test failed: nmf output differs between runs.\n";
            return false;
        }
    }
    return true;
}

bool test_try_separate_reports_status() {
    const stemsep::AudioBuffer mix = make_mix(kSampleRate, 0.5);
    stemsep::SeparationConfig config;
    config.external.command = "stemsep-no-such-tool";

    const auto external = stemsep::make_external_separator();
    const auto missing = external->try_separate(mix, 4, config);
    if (missing.status != stemsep::SeparatorOutcome::Status::CapabilityMissing) {
        std::cerr << "Separator bank test failed: missing tool not reported as capability.\n";
        return false;
    }

    const auto torch = stemsep::make_torch_separator();
    const auto unavailable = torch->try_separate(mix, 4, config);
    if (unavailable.status != stemsep::SeparatorOutcome::Status::CapabilityMissing) {
        std::cerr << "Separator bank test failed: torch without a model must be unavailable.\n";
        return false;
    }

    const auto failed = AlwaysFailing().try_separate(mix, 4, config);
    if (failed.status != stemsep::SeparatorOutcome::Status::Failed ||
        failed.message != "forced failure") {
        std::cerr << "Separator bank test failed: failure not reported.\n";
        return false;
    }

    const auto short_output = WrongLength().try_separate(mix, 4, config);
    if (short_output.ok()) {
        std::cerr << "Separator bank test failed: misaligned stems accepted.\n";
        return false;
    }
    return true;
}

bool test_bank_add_replaces_by_name() {
    auto bank = stemsep::SeparatorBank::make_default();
    const std::size_t before = bank.all().size();
    bank.add(std::make_shared<AlwaysFailing>());
    if (bank.all().size() != before ||
        !dynamic_cast<const AlwaysFailing*>(bank.find("nmf").get())) {
        std::cerr << "Separator bank test failed: add did not replace nmf.\n";
        return false;
    }
    return true;
}

} // namespace

int main() {
    if (!test_stft_round_trip()) {
        return 1;
    }
    if (!test_default_bank_contents()) {
        return 1;
    }
    if (!test_spectral_variants_conserve_energy()) {
        return 1;
    }
    if (!test_hpss_two_stem_naming()) {
        return 1;
    }
    if (!test_nmf_is_deterministic()) {
        return 1;
    }
    if (!test_try_separate_reports_status()) {
        return 1;
    }
    if (!test_bank_add_replaces_by_name()) {
        return 1;
    }

    std::cout << "Separator bank test passed.\n";
    return 0;
}
