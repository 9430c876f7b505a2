//
//  separation_model.cpp
//  StemSep
//
//  Created by Till Toenshoff on 2026-10-05.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "stemsep/separation_model.h"

#include "audio/dsp.h"
#include "model/persistence.h"
#include "stemsep/errors.h"
#include "stemsep/features.h"
#include "stemsep/logging.hpp"

#include <algorithm>
#include <fstream>
#include <numeric>
#include <utility>

namespace stemsep {
namespace {

float mean_of(const std::vector<float>& values) {
    if (values.empty()) {
        return 0.0f;
    }
    const double sum = std::accumulate(values.begin(), values.end(), 0.0);
    return static_cast<float>(sum / static_cast<double>(values.size()));
}

} // namespace

SeparationModel::SeparationModel(std::string instrument,
                                 FeatureConfig features,
                                 QuantizerConfig quantizer,
                                 MarkovConfig markov)
    : instrument_(std::move(instrument)),
      features_(features),
      markov_(markov),
      quantizer_(quantizer),
      transitions_(markov.order, quantizer.n_states) {}

void SeparationModel::require_trained(const char* operation) const {
    if (!trained_) {
        throw NotTrainedError("Model '" + instrument_ + "' must be trained before " +
                              operation + ".");
    }
}

void SeparationModel::train(const std::vector<AudioBuffer>& corpus) {
    if (trained_) {
        throw ValidationError("Model '" + instrument_ + "' is already trained.");
    }
    if (corpus.empty()) {
        throw ValidationError("Model '" + instrument_ + "' needs at least one training buffer.");
    }

    std::vector<FeatureMatrix> features;
    features.reserve(corpus.size());
    std::size_t frames = 0;
    for (const auto& buffer : corpus) {
        features.push_back(extract_features(buffer, features_));
        frames += features.back().frames;
    }

    quantizer_.fit(features);

    std::vector<StateSequence> sequences;
    sequences.reserve(features.size());
    for (const auto& matrix : features) {
        sequences.push_back(quantizer_.predict(matrix));
    }
    transitions_.train(sequences);

    trained_ = true;
    training_samples_ = corpus.size();
    STEMSEP_LOG_INFO("Model '" << instrument_ << "': trained on " << corpus.size()
                               << " buffers (" << frames << " frames).");
}

StateSequence SeparationModel::quantize(const AudioBuffer& buffer) const {
    require_trained("quantize()");
    return quantizer_.predict(extract_features(buffer, features_));
}

double SeparationModel::score(const StateSequence& states) const {
    require_trained("score()");
    return transitions_.score(states);
}

double SeparationModel::score(const AudioBuffer& buffer) const {
    return score(quantize(buffer));
}

std::vector<float> SeparationModel::frame_probabilities(const AudioBuffer& buffer) const {
    const StateSequence states = quantize(buffer);
    const std::size_t order = transitions_.order();
    const HistoryCodec& codec = transitions_.codec();

    std::vector<float> probabilities(states.size(), static_cast<float>(kUnseenHistoryLikelihood));
    if (states.size() <= order) {
        return probabilities;
    }

    std::vector<float> observed;
    observed.reserve(states.size() - order);
    for (std::size_t i = order; i < states.size(); ++i) {
        const std::size_t history = codec.encode_before(states, i);
        const float p = static_cast<float>(transitions_.relative_likelihood(history, states[i]));
        probabilities[i] = p;
        observed.push_back(p);
    }

    const float fill = mean_of(observed);
    std::fill(probabilities.begin(), probabilities.begin() + static_cast<long>(order), fill);
    return probabilities;
}

TimeFrequencyMask SeparationModel::generate_mask(const AudioBuffer& buffer,
                                                 float threshold,
                                                 std::size_t bins,
                                                 std::size_t frames) const {
    std::vector<float> probabilities = frame_probabilities(buffer);

    const float fill = probabilities.empty() ? static_cast<float>(kUnseenHistoryLikelihood)
                                             : mean_of(probabilities);
    probabilities.resize(frames, fill);

    if (markov_.binarize_mask) {
        for (float& p : probabilities) {
            p = p > threshold ? 1.0f : 0.0f;
        }
    }
    probabilities = detail::median_filter(probabilities, markov_.median_kernel);

    TimeFrequencyMask mask;
    mask.bins = bins;
    mask.frames = frames;
    mask.values.resize(bins * frames, 0.0f);
    for (std::size_t f = 0; f < frames; ++f) {
        const float value = std::min(1.0f, std::max(0.0f, probabilities[f]));
        std::fill(mask.values.begin() + static_cast<long>(f * bins),
                  mask.values.begin() + static_cast<long>((f + 1) * bins),
                  value);
    }
    return mask;
}

TimeFrequencyMask SeparationModel::generate_mask(const AudioBuffer& buffer,
                                                 float threshold,
                                                 const StftConfig& stft) const {
    if (stft.hop_length == 0 || stft.n_fft == 0) {
        throw ValidationError("Mask generation needs a non-zero FFT size and hop.");
    }
    return generate_mask(buffer, threshold, stft.n_fft / 2 + 1, 1 + buffer.size() / stft.hop_length);
}

PatternAnalysis SeparationModel::analyze_patterns(const AudioBuffer& buffer) const {
    return analyze_sequence(transitions_, quantize(buffer));
}

void SeparationModel::save(const std::string& path) const {
    require_trained("save()");

    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        throw PersistenceError("Failed to open model file for writing: " + path);
    }

    detail::BinaryWriter writer(out);
    writer.bytes(detail::kModelMagic, sizeof(detail::kModelMagic));
    writer.u32(detail::kModelFormatVersion);
    writer.string(instrument_);

    writer.u32(static_cast<std::uint32_t>(transitions_.order()));
    writer.u32(static_cast<std::uint32_t>(transitions_.n_states()));

    writer.u8(static_cast<std::uint8_t>(features_.type));
    writer.u32(static_cast<std::uint32_t>(features_.window_length));
    writer.u32(static_cast<std::uint32_t>(features_.hop_length));
    writer.u32(static_cast<std::uint32_t>(features_.mfcc_count));
    writer.u32(static_cast<std::uint32_t>(features_.mel_bands));
    writer.u32(static_cast<std::uint32_t>(features_.delta_width));
    writer.f32(features_.rolloff_percent);

    writer.f32(markov_.mask_threshold);
    writer.u8(markov_.binarize_mask ? 1 : 0);
    writer.u32(static_cast<std::uint32_t>(markov_.median_kernel));

    writer.u32(static_cast<std::uint32_t>(quantizer_.dims()));
    writer.f32_vector(quantizer_.mean());
    writer.f32_vector(quantizer_.scale());
    writer.f32_vector(quantizer_.centroids());

    writer.f64_vector(transitions_.probabilities());
    writer.f64_vector(transitions_.row_totals());

    writer.u64(training_samples_);
    writer.u8(trained_ ? 1 : 0);

    out.flush();
    if (!writer.good()) {
        throw PersistenceError("Failed to write model file: " + path);
    }
    STEMSEP_LOG_DEBUG("Model '" << instrument_ << "': saved to " << path);
}

SeparationModel SeparationModel::load(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        throw PersistenceError("Model file not found: " + path);
    }

    detail::BinaryReader reader(in, path);
    char magic[sizeof(detail::kModelMagic)];
    reader.bytes(magic, sizeof(magic));
    if (!std::equal(magic, magic + sizeof(magic), detail::kModelMagic)) {
        throw reader.error("not a StemSep model file");
    }
    const std::uint32_t version = reader.u32();
    if (version != detail::kModelFormatVersion) {
        throw reader.error("unsupported format version " + std::to_string(version));
    }

    std::string instrument = reader.string();
    const std::uint32_t order = reader.u32();
    const std::uint32_t n_states = reader.u32();

    FeatureConfig features;
    const std::uint8_t type_tag = reader.u8();
    if (type_tag > static_cast<std::uint8_t>(FeatureType::Chroma)) {
        throw reader.error("unknown feature type tag " + std::to_string(type_tag));
    }
    features.type = static_cast<FeatureType>(type_tag);
    features.window_length = reader.u32();
    features.hop_length = reader.u32();
    features.mfcc_count = reader.u32();
    features.mel_bands = reader.u32();
    features.delta_width = reader.u32();
    features.rolloff_percent = reader.f32();

    MarkovConfig markov;
    markov.order = order;
    markov.mask_threshold = reader.f32();
    markov.binarize_mask = reader.u8() != 0;
    markov.median_kernel = reader.u32();

    QuantizerConfig quantizer_config;
    quantizer_config.n_states = n_states;
    const std::uint32_t dims = reader.u32();
    std::vector<float> mean = reader.f32_vector();
    std::vector<float> scale = reader.f32_vector();
    std::vector<float> centroids = reader.f32_vector();

    std::vector<double> probabilities = reader.f64_vector();
    std::vector<double> row_totals = reader.f64_vector();

    const std::uint64_t training_samples = reader.u64();
    const bool trained = reader.u8() != 0;
    if (!trained) {
        throw reader.error("model record is not trained");
    }
    if (dims != feature_dimensions(features)) {
        throw reader.error("feature dimensionality does not match the feature configuration");
    }

    try {
        SeparationModel model(std::move(instrument), features, quantizer_config, markov);
        model.quantizer_ = StateQuantizer::restore(quantizer_config,
                                                   dims,
                                                   std::move(mean),
                                                   std::move(scale),
                                                   std::move(centroids));
        model.transitions_ = TransitionModel::restore(order,
                                                      n_states,
                                                      std::move(probabilities),
                                                      std::move(row_totals));
        model.training_samples_ = static_cast<std::size_t>(training_samples);
        model.trained_ = true;
        STEMSEP_LOG_DEBUG("Model '" << model.instrument() << "': loaded from " << path);
        return model;
    } catch (const ValidationError& err) {
        throw reader.error(err.what());
    }
}

} // namespace stemsep
