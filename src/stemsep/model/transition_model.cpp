//
//  transition_model.cpp
//  StemSep
//
//  Created by Till Toenshoff on 2026-10-04.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "stemsep/errors.h"
#include "stemsep/logging.hpp"
#include "stemsep/markov.h"

#include <algorithm>
#include <cmath>
#include <utility>

namespace stemsep {

TransitionModel::TransitionModel(std::size_t order, std::size_t n_states)
    : codec_(order, n_states),
      probabilities_(codec_.history_count() * n_states, 0.0),
      row_totals_(codec_.history_count(), 0.0) {}

void TransitionModel::accumulate(const StateSequence& sequence) {
    if (trained_) {
        throw ValidationError("Transition model is finalized; it cannot accumulate more data.");
    }
    const std::size_t n = codec_.n_states();
    for (std::uint32_t state : sequence) {
        if (state >= n) {
            throw ValidationError("State id out of range for transition model.");
        }
    }

    // Counts live in probabilities_ until finalize().
    for (std::size_t i = codec_.order(); i < sequence.size(); ++i) {
        const std::size_t history = codec_.encode_before(sequence, i);
        probabilities_[history * n + sequence[i]] += 1.0;
        row_totals_[history] += 1.0;
    }
}

void TransitionModel::finalize() {
    if (trained_) {
        return;
    }
    const std::size_t n = codec_.n_states();
    std::size_t observed_rows = 0;
    for (std::size_t row = 0; row < codec_.history_count(); ++row) {
        const double total = row_totals_[row];
        if (total <= 0.0) {
            continue;
        }
        ++observed_rows;
        double* probs = probabilities_.data() + row * n;
        for (std::size_t j = 0; j < n; ++j) {
            probs[j] /= total;
        }
    }
    trained_ = true;
    STEMSEP_LOG_DEBUG("Transition model: " << observed_rows << " of " << codec_.history_count()
                                           << " histories observed.");
}

void TransitionModel::train(const std::vector<StateSequence>& sequences) {
    for (const auto& sequence : sequences) {
        accumulate(sequence);
    }
    finalize();
}

double TransitionModel::transition_probability(std::size_t history, std::uint32_t next) const {
    const std::size_t n = codec_.n_states();
    const double total = row_totals_[history];
    const double count = probabilities_[history * n + next] * total;
    return (count + kTransitionEpsilon) / (total + kTransitionEpsilon * static_cast<double>(n));
}

double TransitionModel::relative_likelihood(std::size_t history, std::uint32_t next) const {
    const std::size_t n = codec_.n_states();
    double peak = 0.0;
    for (std::uint32_t j = 0; j < n; ++j) {
        peak = std::max(peak, transition_probability(history, j));
    }
    return std::min(1.0, transition_probability(history, next) / peak);
}

double TransitionModel::score(const StateSequence& sequence) const {
    if (!trained_) {
        throw NotTrainedError("Transition model must be trained before score().");
    }
    const std::size_t order = codec_.order();
    if (sequence.size() < order + 1) {
        return 0.0;
    }
    const std::size_t n = codec_.n_states();
    for (std::uint32_t state : sequence) {
        if (state >= n) {
            throw ValidationError("State id out of range for transition model.");
        }
    }
    double log_likelihood = 0.0;
    for (std::size_t i = order; i < sequence.size(); ++i) {
        const std::size_t history = codec_.encode_before(sequence, i);
        log_likelihood += std::log(transition_probability(history, sequence[i]));
    }
    return log_likelihood;
}

TransitionModel TransitionModel::restore(std::size_t order,
                                         std::size_t n_states,
                                         std::vector<double> probabilities,
                                         std::vector<double> row_totals) {
    TransitionModel model(order, n_states);
    if (probabilities.size() != model.probabilities_.size() ||
        row_totals.size() != model.row_totals_.size()) {
        throw ValidationError("Transition table size does not match order and state count.");
    }
    model.probabilities_ = std::move(probabilities);
    model.row_totals_ = std::move(row_totals);
    model.trained_ = true;
    return model;
}

PatternAnalysis analyze_sequence(const TransitionModel& model, const StateSequence& states) {
    if (!model.is_trained()) {
        throw NotTrainedError("Transition model must be trained before pattern analysis.");
    }

    PatternAnalysis analysis;
    if (states.empty()) {
        return analysis;
    }

    const std::size_t n = model.n_states();
    for (std::uint32_t state : states) {
        if (state >= n) {
            throw ValidationError("State id out of range for transition model.");
        }
        ++analysis.state_distribution[state];
    }
    const double length = static_cast<double>(states.size());
    for (const auto& entry : analysis.state_distribution) {
        const double p = static_cast<double>(entry.second) / length;
        analysis.entropy -= p * std::log2(p);
    }

    const HistoryCodec& codec = model.codec();
    for (std::size_t i = codec.order(); i < states.size(); ++i) {
        const std::size_t history = codec.encode_before(states, i);
        if (model.row_totals()[history] <= 0.0) {
            continue;
        }
        const double* probs = model.probabilities().data() + history * n;
        for (std::size_t j = 0; j < n; ++j) {
            if (probs[j] > 0.0) {
                analysis.transition_entropy -= probs[j] * std::log2(probs[j]);
            }
        }
    }

    analysis.complexity = n > 1 ? analysis.entropy / std::log2(static_cast<double>(n)) : 0.0;
    analysis.predictability = std::max(0.0, 1.0 - analysis.transition_entropy / length);
    analysis.unique_states = analysis.state_distribution.size();
    analysis.average_state_duration = length / static_cast<double>(analysis.unique_states);
    return analysis;
}

} // namespace stemsep
