//
//  separation_model.h
//  StemSep
//
//  Created by Till Toenshoff on 2026-10-05.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include "stemsep/audio_buffer.h"
#include "stemsep/config.h"
#include "stemsep/markov.h"
#include "stemsep/quantizer.h"
#include "stemsep/spectrogram.h"

#include <cstddef>
#include <string>
#include <vector>

namespace stemsep {

/// @brief Per-instrument Markov model of timbral state transitions.
///
/// Bundles the feature configuration, a fitted StateQuantizer and a trained
/// TransitionModel. Lifecycle: untrained -> train() -> queried; or load() ->
/// queried. A trained model is never retrained in place.
class SeparationModel {
public:
    explicit SeparationModel(std::string instrument,
                             FeatureConfig features = {},
                             QuantizerConfig quantizer = {},
                             MarkovConfig markov = {});

    const std::string& instrument() const { return instrument_; }
    const FeatureConfig& feature_config() const { return features_; }
    const MarkovConfig& markov_config() const { return markov_; }
    const StateQuantizer& quantizer() const { return quantizer_; }
    const TransitionModel& transitions() const { return transitions_; }

    bool is_trained() const { return trained_; }
    std::size_t training_samples() const { return training_samples_; }

    /// @brief Fit the quantizer on all buffers and train the transitions.
    ///
    /// Throws ValidationError for an empty corpus or a second call, and
    /// ExtractionError for unusable audio.
    void train(const std::vector<AudioBuffer>& corpus);

    /// Throws NotTrainedError before training.
    StateSequence quantize(const AudioBuffer& buffer) const;

    double score(const StateSequence& states) const;
    double score(const AudioBuffer& buffer) const;

    /// @brief Per feature-frame likelihood in [0, 1].
    ///
    /// Frames without a full history receive the mean of the others, or
    /// kUnseenHistoryLikelihood when no frame has one.
    std::vector<float> frame_probabilities(const AudioBuffer& buffer) const;

    /// @brief Time-frequency mask shaped `bins x frames`.
    ///
    /// Frame probabilities are padded with their mean or truncated to
    /// `frames`, optionally binarized at `threshold`, median filtered along
    /// time and broadcast across all bins.
    TimeFrequencyMask generate_mask(const AudioBuffer& buffer,
                                    float threshold,
                                    std::size_t bins,
                                    std::size_t frames) const;

    /// @brief Mask shaped like `compute_stft(buffer, stft)`.
    TimeFrequencyMask generate_mask(const AudioBuffer& buffer,
                                    float threshold,
                                    const StftConfig& stft) const;

    PatternAnalysis analyze_patterns(const AudioBuffer& buffer) const;

    /// @brief Write the versioned binary model record.
    ///
    /// Throws NotTrainedError for an untrained model and PersistenceError on
    /// I/O failure.
    void save(const std::string& path) const;

    /// @brief Read a model record. Throws PersistenceError for missing,
    /// truncated or corrupt files.
    static SeparationModel load(const std::string& path);

private:
    void require_trained(const char* operation) const;

    std::string instrument_;
    FeatureConfig features_;
    MarkovConfig markov_;
    StateQuantizer quantizer_;
    TransitionModel transitions_;
    bool trained_ = false;
    std::size_t training_samples_ = 0;
};

} // namespace stemsep
