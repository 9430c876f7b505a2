//
//  feature_extraction_test.cpp
//  StemSep
//
//  Created by Till Toenshoff on 2026-10-13.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "stemsep/errors.h"
#include "stemsep/features.h"
#include "synthetic_audio_test_utils.h"

#include <cmath>
#include <iostream>
#include <limits>
#include <vector>

namespace {

using namespace stemsep::tests::synthetic_audio;

bool test_frame_count_formula() {
    stemsep::FeatureConfig config;
    const std::size_t cases[] = {2048, 2049, 2560, 44100, 100000};
    for (std::size_t length : cases) {
        const std::size_t expected = (length - config.window_length) / config.hop_length + 1;
        const stemsep::AudioBuffer buffer(std::vector<float>(length, 0.1f), 22050.0);
        const auto features = stemsep::extract_features(buffer, config);
        if (features.frames != expected || stemsep::feature_frame_count(length, config) != expected) {
            std::cerr << "Feature extraction test failed: " << features.frames << " frames for "
                      << length << " samples, expected " << expected << ".\n";
            return false;
        }
    }
    return true;
}

bool test_short_buffer_yields_single_frame() {
    const stemsep::AudioBuffer buffer(make_sine(22050.0, 440.0, 0.02, 0.5f), 22050.0);
    for (auto type : {stemsep::FeatureType::Mfcc, stemsep::FeatureType::Spectral,
                      stemsep::FeatureType::Chroma}) {
        stemsep::FeatureConfig config;
        config.type = type;
        const auto features = stemsep::extract_features(buffer, config);
        if (features.frames != 1 || features.dims != stemsep::feature_dimensions(config)) {
            std::cerr << "Feature extraction test failed: short buffer gave " << features.frames
                      << "x" << features.dims << " for " << stemsep::feature_type_name(type)
                      << ".\n";
            return false;
        }
    }
    return true;
}

bool test_dimensions_per_family() {
    stemsep::FeatureConfig config;
    config.type = stemsep::FeatureType::Mfcc;
    if (stemsep::feature_dimensions(config) != 39) {
        std::cerr << "Feature extraction test failed: mfcc should have 39 dims.\n";
        return false;
    }
    config.type = stemsep::FeatureType::Spectral;
    if (stemsep::feature_dimensions(config) != 4) {
        std::cerr << "Feature extraction test failed: spectral should have 4 dims.\n";
        return false;
    }
    config.type = stemsep::FeatureType::Chroma;
    if (stemsep::feature_dimensions(config) != 18) {
        std::cerr << "Feature extraction test failed: chroma should have 18 dims.\n";
        return false;
    }
    return true;
}

bool test_deterministic_output() {
    const stemsep::AudioBuffer buffer = make_mix(22050.0, 1.5);
    for (auto type : {stemsep::FeatureType::Mfcc, stemsep::FeatureType::Spectral,
                      stemsep::FeatureType::Chroma}) {
        stemsep::FeatureConfig config;
        config.type = type;
        const auto a = stemsep::extract_features(buffer, config);
        const auto b = stemsep::extract_features(buffer, config);
        if (a.values != b.values || a.type != type) {
            std::cerr << "Feature extraction test failed: " << stemsep::feature_type_name(type)
                      << " output is not bit-identical.\n";
            return false;
        }
        for (float value : a.values) {
            if (!std::isfinite(value)) {
                std::cerr << "Feature extraction test failed: non-finite "
                          << stemsep::feature_type_name(type) << " value.\n";
                return false;
            }
        }
    }
    return true;
}

bool test_spectral_centroid_tracks_pitch() {
    stemsep::FeatureConfig config;
    config.type = stemsep::FeatureType::Spectral;
    const stemsep::AudioBuffer low(make_sine(22050.0, 200.0, 0.5, 0.5f), 22050.0);
    const stemsep::AudioBuffer high(make_sine(22050.0, 3000.0, 0.5, 0.5f), 22050.0);
    const auto low_features = stemsep::extract_features(low, config);
    const auto high_features = stemsep::extract_features(high, config);
    if (!(high_features.row(0)[0] > low_features.row(0)[0])) {
        std::cerr << "Feature extraction test failed: centroid did not rise with pitch.\n";
        return false;
    }
    return true;
}

bool test_invalid_input_rejected() {
    stemsep::FeatureConfig config;
    bool threw = false;
    try {
        stemsep::extract_features(stemsep::AudioBuffer({}, 22050.0), config);
    } catch (const stemsep::ExtractionError&) {
        threw = true;
    }
    if (!threw) {
        std::cerr << "Feature extraction test failed: empty buffer accepted.\n";
        return false;
    }

    threw = false;
    try {
        stemsep::extract_features(stemsep::AudioBuffer(std::vector<float>(4096, 0.0f), 0.0), config);
    } catch (const stemsep::ExtractionError&) {
        threw = true;
    }
    if (!threw) {
        std::cerr << "Feature extraction test failed: zero sample rate accepted.\n";
        return false;
    }

    threw = false;
    std::vector<float> bad(4096, 0.0f);
    bad[100] = std::numeric_limits<float>::quiet_NaN();
    try {
        stemsep::extract_features(stemsep::AudioBuffer(bad, 22050.0), config);
    } catch (const stemsep::ExtractionError&) {
        threw = true;
    }
    if (!threw) {
        std::cerr << "Feature extraction test failed: NaN samples accepted.\n";
        return false;
    }
    return true;
}

} // namespace

int main() {
    if (!test_frame_count_formula()) {
        return 1;
    }
    if (!test_short_buffer_yields_single_frame()) {
        return 1;
    }
    if (!test_dimensions_per_family()) {
        return 1;
    }
    if (!test_deterministic_output()) {
        return 1;
    }
    if (!test_spectral_centroid_tracks_pitch()) {
        return 1;
    }
    if (!test_invalid_input_rejected()) {
        return 1;
    }

    std::cout << "Feature extraction test passed.\n";
    return 0;
}
