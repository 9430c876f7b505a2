//
//  quantizer_test.cpp
//  StemSep
//
//  Created by Till Toenshoff on 2026-10-13.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "stemsep/errors.h"
#include "stemsep/quantizer.h"

#include <iostream>
#include <vector>

namespace {

// Two well separated blobs in 2-D.
stemsep::FeatureMatrix make_blobs() {
    stemsep::FeatureMatrix features;
    features.dims = 2;
    features.type = stemsep::FeatureType::Spectral;
    for (int i = 0; i < 40; ++i) {
        const float jitter = 0.01f * static_cast<float>(i % 5);
        const float base = (i % 2 == 0) ? 0.0f : 10.0f;
        features.values.push_back(base + jitter);
        features.values.push_back(base - jitter);
        ++features.frames;
    }
    return features;
}

bool test_predict_before_fit_throws() {
    stemsep::StateQuantizer quantizer;
    try {
        quantizer.predict(make_blobs());
    } catch (const stemsep::NotTrainedError&) {
        return true;
    }
    std::cerr << "Quantizer test failed: predict before fit did not throw.\n";
    return false;
}

bool test_fit_separates_clusters() {
    stemsep::QuantizerConfig config;
    config.n_states = 2;
    stemsep::StateQuantizer quantizer(config);
    const auto blobs = make_blobs();
    quantizer.fit({blobs});

    const auto states = quantizer.predict(blobs);
    if (states.size() != blobs.frames) {
        std::cerr << "Quantizer test failed: expected one state per frame.\n";
        return false;
    }
    for (std::size_t i = 2; i < states.size(); ++i) {
        if (states[i] != states[i % 2]) {
            std::cerr << "Quantizer test failed: frame " << i << " left its cluster.\n";
            return false;
        }
    }
    if (states[0] == states[1]) {
        std::cerr << "Quantizer test failed: both blobs share one state.\n";
        return false;
    }
    return true;
}

bool test_predict_is_deterministic() {
    stemsep::QuantizerConfig config;
    config.n_states = 4;
    stemsep::StateQuantizer a(config);
    stemsep::StateQuantizer b(config);
    const auto blobs = make_blobs();
    a.fit({blobs});
    b.fit({blobs});
    if (a.predict(blobs) != a.predict(blobs) || a.predict(blobs) != b.predict(blobs) ||
        a.centroids() != b.centroids()) {
        std::cerr << "Quantizer test failed: fit/predict not deterministic.\n";
        return false;
    }
    return true;
}

bool test_zero_variance_keeps_unit_scale() {
    stemsep::FeatureMatrix features = make_blobs();
    for (std::size_t f = 0; f < features.frames; ++f) {
        features.values[f * 2 + 1] = 3.0f;
    }
    stemsep::QuantizerConfig config;
    config.n_states = 2;
    stemsep::StateQuantizer quantizer(config);
    quantizer.fit({features});
    if (quantizer.scale()[1] != 1.0f) {
        std::cerr << "Quantizer test failed: constant dimension scale is "
                  << quantizer.scale()[1] << ".\n";
        return false;
    }
    return true;
}

bool test_invalid_corpus_rejected() {
    stemsep::StateQuantizer empty;
    bool threw = false;
    try {
        empty.fit({});
    } catch (const stemsep::ValidationError&) {
        threw = true;
    }
    if (!threw) {
        std::cerr << "Quantizer test failed: empty corpus accepted.\n";
        return false;
    }

    stemsep::FeatureMatrix other;
    other.frames = 1;
    other.dims = 3;
    other.values = {1.0f, 2.0f, 3.0f};
    stemsep::QuantizerConfig config;
    config.n_states = 2;
    stemsep::StateQuantizer mixed(config);
    threw = false;
    try {
        mixed.fit({make_blobs(), other});
    } catch (const stemsep::ValidationError&) {
        threw = true;
    }
    if (!threw) {
        std::cerr << "Quantizer test failed: inconsistent dimensions accepted.\n";
        return false;
    }

    stemsep::StateQuantizer twice(config);
    twice.fit({make_blobs()});
    threw = false;
    try {
        twice.fit({make_blobs()});
    } catch (const stemsep::ValidationError&) {
        threw = true;
    }
    if (!threw) {
        std::cerr << "Quantizer test failed: second fit accepted.\n";
        return false;
    }
    return true;
}

} // namespace

int main() {
    if (!test_predict_before_fit_throws()) {
        return 1;
    }
    if (!test_fit_separates_clusters()) {
        return 1;
    }
    if (!test_predict_is_deterministic()) {
        return 1;
    }
    if (!test_zero_variance_keeps_unit_scale()) {
        return 1;
    }
    if (!test_invalid_corpus_rejected()) {
        return 1;
    }

    std::cout << "Quantizer test passed.\n";
    return 0;
}
