//
//  separation_model_test.cpp
//  StemSep
//
//  Created by Till Toenshoff on 2026-10-14.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "stemsep/errors.h"
#include "stemsep/separation_model.h"
#include "stemsep/spectrogram.h"
#include "synthetic_audio_test_utils.h"

#include <chrono>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

namespace {

using namespace stemsep::tests::synthetic_audio;

constexpr double kSampleRate = 22050.0;

std::filesystem::path temp_path(const std::string& name) {
    return std::filesystem::temp_directory_path() /
           ("stemsep_model_test_" +
            std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()) + "_" +
            name);
}

stemsep::SeparationModel make_trained_model() {
    stemsep::QuantizerConfig quantizer;
    quantizer.n_states = 6;
    stemsep::SeparationModel model("vocals", stemsep::FeatureConfig{}, quantizer,
                                   stemsep::MarkovConfig{});
    std::vector<stemsep::AudioBuffer> corpus;
    corpus.emplace_back(make_tremolo_sine(kSampleRate, 440.0, 2.0, 2.0, 0.5f), kSampleRate);
    corpus.emplace_back(make_tremolo_sine(kSampleRate, 660.0, 3.0, 2.0, 0.5f), kSampleRate);
    model.train(corpus);
    return model;
}

bool test_untrained_model_rejects_queries() {
    stemsep::SeparationModel model("bass");
    const stemsep::AudioBuffer buffer(make_sine(kSampleRate, 80.0, 1.0, 0.5f), kSampleRate);
    bool threw = false;
    try {
        model.score(buffer);
    } catch (const stemsep::NotTrainedError&) {
        threw = true;
    }
    if (!threw) {
        std::cerr << "Separation model test failed: untrained score did not throw.\n";
        return false;
    }

    threw = false;
    try {
        model.save(temp_path("untrained.ssm").string());
    } catch (const stemsep::NotTrainedError&) {
        threw = true;
    }
    if (!threw) {
        std::cerr << "Separation model test failed: untrained save did not throw.\n";
        return false;
    }
    return true;
}

bool test_training_records_corpus() {
    const auto model = make_trained_model();
    if (!model.is_trained() || model.training_samples() != 2 ||
        model.transitions().order() != 2 || model.transitions().n_states() != 6) {
        std::cerr << "Separation model test failed: unexpected trained state.\n";
        return false;
    }
    const stemsep::AudioBuffer input(make_tremolo_sine(kSampleRate, 440.0, 2.0, 1.0, 0.5f),
                                      kSampleRate);
    const auto probabilities = model.frame_probabilities(input);
    for (float p : probabilities) {
        if (p < 0.0f || p > 1.0f) {
            std::cerr << "Separation model test failed: frame probability " << p << ".\n";
            return false;
        }
    }
    return true;
}

bool test_mask_matches_spectrogram_shape() {
    const auto model = make_trained_model();
    stemsep::StftConfig stft;
    const double lengths[] = {0.05, 0.7, 1.3};
    for (double seconds : lengths) {
        const stemsep::AudioBuffer input(make_mix(kSampleRate, seconds));
        const auto spec = stemsep::compute_stft(input, stft);
        const auto mask = model.generate_mask(input, 0.5f, stft);
        if (mask.bins != spec.bins || mask.frames != spec.frames ||
            mask.values.size() != spec.values.size()) {
            std::cerr << "Separation model test failed: mask " << mask.bins << "x" << mask.frames
                      << " vs spectrogram " << spec.bins << "x" << spec.frames << ".\n";
            return false;
        }
        for (float value : mask.values) {
            if (value != 0.0f && value != 1.0f) {
                std::cerr << "Separation model test failed: binarized mask holds " << value
                          << ".\n";
                return false;
            }
        }
        // Every bin of a frame carries the same weight.
        for (std::size_t f = 0; f < mask.frames; ++f) {
            if (mask.at(0, f) != mask.at(mask.bins - 1, f)) {
                std::cerr << "Separation model test failed: mask not broadcast over bins.\n";
                return false;
            }
        }
    }
    return true;
}

bool test_short_input_is_not_silenced() {
    const auto model = make_trained_model();
    // Shorter than one analysis window: a single frame without a history.
    const stemsep::AudioBuffer input(make_sine(kSampleRate, 440.0, 0.05, 0.5f), kSampleRate);
    const auto probabilities = model.frame_probabilities(input);
    if (probabilities.empty()) {
        std::cerr << "Separation model test failed: no frame probabilities.\n";
        return false;
    }
    for (float p : probabilities) {
        if (p != static_cast<float>(stemsep::kUnseenHistoryLikelihood)) {
            std::cerr << "Separation model test failed: history-less frame got " << p << ".\n";
            return false;
        }
    }

    stemsep::StftConfig stft;
    const auto mask = model.generate_mask(input, 0.5f, stft);
    for (float value : mask.values) {
        if (value != 1.0f) {
            std::cerr << "Separation model test failed: short input mask holds " << value
                      << ".\n";
            return false;
        }
    }
    return true;
}

bool test_save_load_round_trip() {
    const auto model = make_trained_model();
    const auto path = temp_path("vocals.ssm");
    model.save(path.string());
    const auto loaded = stemsep::SeparationModel::load(path.string());
    std::filesystem::remove(path);

    if (loaded.instrument() != "vocals" || loaded.training_samples() != 2 ||
        loaded.transitions().probabilities() != model.transitions().probabilities() ||
        loaded.transitions().row_totals() != model.transitions().row_totals() ||
        loaded.quantizer().centroids() != model.quantizer().centroids()) {
        std::cerr << "Separation model test failed: loaded model differs.\n";
        return false;
    }

    const stemsep::AudioBuffer held_out(make_tremolo_sine(kSampleRate, 520.0, 2.5, 1.5, 0.4f),
                                        kSampleRate);
    if (loaded.score(held_out) != model.score(held_out)) {
        std::cerr << "Separation model test failed: score changed after reload.\n";
        return false;
    }
    return true;
}

bool test_corrupt_file_rejected() {
    const auto path = temp_path("corrupt.ssm");
    {
        std::ofstream out(path, std::ios::binary);
        out << "SSMM garbage";
    }
    bool threw = false;
    try {
        stemsep::SeparationModel::load(path.string());
    } catch (const stemsep::PersistenceError&) {
        threw = true;
    }
    std::filesystem::remove(path);
    if (!threw) {
        std::cerr << "Separation model test failed: corrupt file accepted.\n";
        return false;
    }

    threw = false;
    try {
        stemsep::SeparationModel::load(temp_path("missing.ssm").string());
    } catch (const stemsep::PersistenceError&) {
        threw = true;
    }
    if (!threw) {
        std::cerr << "Separation model test failed: missing file accepted.\n";
        return false;
    }
    return true;
}

bool test_pattern_analysis() {
    const auto model = make_trained_model();
    const stemsep::AudioBuffer buffer(make_tremolo_sine(kSampleRate, 440.0, 2.0, 1.5, 0.5f),
                                      kSampleRate);
    const auto analysis = model.analyze_patterns(buffer);

    std::size_t frames = 0;
    for (const auto& entry : analysis.state_distribution) {
        frames += entry.second;
    }
    if (frames == 0 || analysis.unique_states == 0 || analysis.unique_states > 6) {
        std::cerr << "Separation model test failed: empty or oversized state distribution.\n";
        return false;
    }
    if (analysis.complexity < 0.0 || analysis.complexity > 1.0 + 1e-9 ||
        analysis.predictability < 0.0 || analysis.predictability > 1.0) {
        std::cerr << "Separation model test failed: pattern metrics out of range.\n";
        return false;
    }
    const double expected_duration =
        static_cast<double>(frames) / static_cast<double>(analysis.unique_states);
    if (std::abs(analysis.average_state_duration - expected_duration) > 1e-9) {
        std::cerr << "Separation model test failed: average state duration "
                  << analysis.average_state_duration << " != " << expected_duration << "\n";
        return false;
    }
    return true;
}

} // namespace

int main() {
    if (!test_untrained_model_rejects_queries()) {
        return 1;
    }
    if (!test_training_records_corpus()) {
        return 1;
    }
    if (!test_mask_matches_spectrogram_shape()) {
        return 1;
    }
    if (!test_short_input_is_not_silenced()) {
        return 1;
    }
    if (!test_save_load_round_trip()) {
        return 1;
    }
    if (!test_corrupt_file_rejected()) {
        return 1;
    }
    if (!test_pattern_analysis()) {
        return 1;
    }

    std::cout << "Separation model test passed.\n";
    return 0;
}
