//
//  markov.h
//  StemSep
//
//  Created by Till Toenshoff on 2026-10-04.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include "stemsep/quantizer.h"

#include <cstddef>
#include <cstdint>
#include <map>
#include <vector>

namespace stemsep {

/// Upper bound on `n^k * n` transition entries.
inline constexpr std::size_t kMaxTransitionEntries = std::size_t(1) << 24;

/// Laplace smoothing constant applied when querying transitions.
inline constexpr double kTransitionEpsilon = 1e-10;

/// Relative likelihood of a frame with no observed history (a uniform row).
inline constexpr double kUnseenHistoryLikelihood = 1.0;

/// @brief Bijective mixed-radix mapping between a k-state history and `[0, n^k)`.
///
/// The oldest state is the most significant digit.
class HistoryCodec {
public:
    /// Throws ValidationError for `order == 0`, `n_states == 0`, or when the
    /// transition table would exceed kMaxTransitionEntries.
    HistoryCodec(std::size_t order, std::size_t n_states);

    std::size_t order() const { return order_; }
    std::size_t n_states() const { return n_states_; }
    std::size_t history_count() const { return history_count_; }

    /// Encode `history[0..order)`, oldest first.
    std::size_t encode(const std::uint32_t* history) const;

    /// Encode the `order` states of `sequence` that precede position `end`.
    std::size_t encode_before(const StateSequence& sequence, std::size_t end) const;

    std::vector<std::uint32_t> decode(std::size_t index) const;

private:
    std::size_t order_ = 0;
    std::size_t n_states_ = 0;
    std::size_t history_count_ = 0;
};

/// @brief Order-k Markov transition table over a finite state alphabet.
///
/// Counts accumulate during training; `finalize()` normalizes every observed
/// row to a probability distribution and keeps the row totals for smoothing.
class TransitionModel {
public:
    TransitionModel(std::size_t order, std::size_t n_states);

    /// @brief Count transitions of one sequence. Throws ValidationError for
    /// out-of-range states or after finalize().
    void accumulate(const StateSequence& sequence);

    /// @brief Normalize rows. Further accumulation is rejected.
    void finalize();

    /// @brief accumulate() every sequence, then finalize().
    void train(const std::vector<StateSequence>& sequences);

    bool is_trained() const { return trained_; }
    const HistoryCodec& codec() const { return codec_; }
    std::size_t order() const { return codec_.order(); }
    std::size_t n_states() const { return codec_.n_states(); }

    /// @brief Sum of smoothed log transition likelihoods.
    ///
    /// Returns 0 for sequences shorter than `order + 1`. Throws NotTrainedError
    /// before finalize().
    double score(const StateSequence& sequence) const;

    /// Smoothed `P(next | history)`; uniform for never-observed histories.
    double transition_probability(std::size_t history, std::uint32_t next) const;

    /// @brief Smoothed transition probability relative to the row's most likely
    /// transition, in (0, 1]. A history never seen in training is a uniform
    /// row and yields 1.
    double relative_likelihood(std::size_t history, std::uint32_t next) const;

    /// Row-major `history_count x n_states`.
    const std::vector<double>& probabilities() const { return probabilities_; }
    const std::vector<double>& row_totals() const { return row_totals_; }

    /// @brief Rebuild a finalized model. Throws ValidationError on size mismatch.
    static TransitionModel restore(std::size_t order,
                                   std::size_t n_states,
                                   std::vector<double> probabilities,
                                   std::vector<double> row_totals);

private:
    HistoryCodec codec_;
    bool trained_ = false;
    std::vector<double> probabilities_;
    std::vector<double> row_totals_;
};

/// @brief Descriptive statistics of a state sequence under a trained model.
struct PatternAnalysis {
    /// Shannon entropy of the state histogram, in bits.
    double entropy = 0.0;
    /// Entropy normalized by log2(n_states).
    double complexity = 0.0;
    /// `1 - transition_entropy / frames`, floored at 0.
    double predictability = 0.0;
    /// Sum of row entropies over every frame with an observed history.
    double transition_entropy = 0.0;
    std::map<std::uint32_t, std::size_t> state_distribution;
    std::size_t unique_states = 0;
    /// Frames per distinct state.
    double average_state_duration = 0.0;
};

PatternAnalysis analyze_sequence(const TransitionModel& model, const StateSequence& states);

} // namespace stemsep
