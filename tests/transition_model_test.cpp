//
//  transition_model_test.cpp
//  StemSep
//
//  Created by Till Toenshoff on 2026-10-13.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "stemsep/errors.h"
#include "stemsep/markov.h"

#include <cmath>
#include <cstdint>
#include <iostream>
#include <vector>

namespace {

bool test_codec_is_bijective() {
    const stemsep::HistoryCodec codec(3, 4);
    if (codec.history_count() != 64) {
        std::cerr << "Transition model test failed: expected 64 histories.\n";
        return false;
    }
    for (std::size_t index = 0; index < codec.history_count(); ++index) {
        const auto digits = codec.decode(index);
        if (digits.size() != 3 || codec.encode(digits.data()) != index) {
            std::cerr << "Transition model test failed: codec round trip broke at " << index
                      << ".\n";
            return false;
        }
    }
    // Oldest state is the most significant digit.
    const std::uint32_t history[3] = {1, 0, 0};
    if (codec.encode(history) != 16) {
        std::cerr << "Transition model test failed: oldest state is not most significant.\n";
        return false;
    }
    return true;
}

bool test_oversized_table_rejected() {
    try {
        stemsep::TransitionModel model(8, 64);
    } catch (const stemsep::ValidationError&) {
        return true;
    }
    std::cerr << "Transition model test failed: oversized table accepted.\n";
    return false;
}

bool test_observed_rows_sum_to_one() {
    stemsep::TransitionModel model(2, 3);
    model.train({{0, 1, 2, 0, 1, 2, 0, 1, 1, 2}, {2, 2, 1, 0, 1}});

    const auto& probabilities = model.probabilities();
    const auto& totals = model.row_totals();
    const std::size_t n = model.n_states();
    for (std::size_t h = 0; h < model.codec().history_count(); ++h) {
        double sum = 0.0;
        for (std::size_t s = 0; s < n; ++s) {
            sum += probabilities[h * n + s];
        }
        if (totals[h] > 0.0 && std::fabs(sum - 1.0) > 1e-9) {
            std::cerr << "Transition model test failed: row " << h << " sums to " << sum << ".\n";
            return false;
        }
    }
    return true;
}

bool test_short_sequence_scores_zero() {
    stemsep::TransitionModel model(2, 3);
    model.train({{0, 1, 2, 0, 1, 2}});
    if (model.score({0, 1}) != 0.0 || model.score({}) != 0.0) {
        std::cerr << "Transition model test failed: short sequence score is not 0.\n";
        return false;
    }
    return true;
}

bool test_score_prefers_trained_pattern() {
    stemsep::TransitionModel model(1, 3);
    model.train({{0, 1, 2, 0, 1, 2, 0, 1, 2, 0, 1, 2}});
    const double familiar = model.score({0, 1, 2, 0, 1});
    const double unfamiliar = model.score({0, 2, 1, 0, 2});
    if (!(familiar > unfamiliar) || !(familiar <= 0.0)) {
        std::cerr << "Transition model test failed: familiar " << familiar << " vs unfamiliar "
                  << unfamiliar << ".\n";
        return false;
    }
    // Unseen histories are smoothed to a uniform distribution, never zero.
    stemsep::TransitionModel sparse(1, 4);
    sparse.train({{0, 1, 0, 1}});
    const double p = sparse.transition_probability(3, 2);
    if (std::fabs(p - 0.25) > 1e-6) {
        std::cerr << "Transition model test failed: unseen history probability " << p << ".\n";
        return false;
    }
    return true;
}

bool test_relative_likelihood_range() {
    stemsep::TransitionModel model(1, 3);
    model.train({{0, 1, 0, 1, 0, 2}});
    const double best = model.relative_likelihood(0, 1);
    const double weaker = model.relative_likelihood(0, 2);
    const double never = model.relative_likelihood(0, 0);
    if (std::fabs(best - 1.0) > 1e-9 || std::fabs(weaker - 0.5) > 1e-6 ||
        !(never > 0.0 && never < 1e-6)) {
        std::cerr << "Transition model test failed: relative likelihoods " << best << ", "
                  << weaker << ", " << never << ".\n";
        return false;
    }

    // History 2 never occurs: smoothing makes it a uniform row.
    for (std::uint32_t next = 0; next < 3; ++next) {
        const double unseen = model.relative_likelihood(2, next);
        if (std::fabs(unseen - 1.0) > 1e-9) {
            std::cerr << "Transition model test failed: unseen history " << next << " -> "
                      << unseen << ".\n";
            return false;
        }
    }

    stemsep::TransitionModel alternating(1, 3);
    alternating.train({{0, 1, 0, 1, 0, 1, 0, 1}});
    if (!(alternating.relative_likelihood(2, 0) > 0.0) ||
        std::fabs(alternating.transition_probability(2, 0) - 1.0 / 3.0) > 1e-9) {
        std::cerr << "Transition model test failed: unseen history collapsed to zero.\n";
        return false;
    }
    return true;
}

bool test_untrained_and_invalid_states() {
    stemsep::TransitionModel model(1, 2);
    bool threw = false;
    try {
        model.score({0, 1, 0});
    } catch (const stemsep::NotTrainedError&) {
        threw = true;
    }
    if (!threw) {
        std::cerr << "Transition model test failed: untrained score did not throw.\n";
        return false;
    }

    threw = false;
    try {
        model.accumulate({0, 5});
    } catch (const stemsep::ValidationError&) {
        threw = true;
    }
    if (!threw) {
        std::cerr << "Transition model test failed: out-of-range state accepted.\n";
        return false;
    }
    return true;
}

bool test_pattern_analysis() {
    stemsep::TransitionModel model(1, 2);
    model.train({{0, 0, 1, 1, 0, 0, 1, 1}});
    const auto analysis = stemsep::analyze_sequence(model, {0, 0, 1, 1, 0, 0, 1, 1});
    if (analysis.unique_states != 2 || std::fabs(analysis.entropy - 1.0) > 1e-9 ||
        std::fabs(analysis.complexity - 1.0) > 1e-9 ||
        std::fabs(analysis.average_state_duration - 4.0) > 1e-9) {
        std::cerr << "Transition model test failed: unexpected pattern analysis (entropy "
                  << analysis.entropy << ", duration " << analysis.average_state_duration
                  << ").\n";
        return false;
    }
    if (analysis.predictability < 0.0 || analysis.predictability > 1.0) {
        std::cerr << "Transition model test failed: predictability out of range.\n";
        return false;
    }
    return true;
}

} // namespace

int main() {
    if (!test_codec_is_bijective()) {
        return 1;
    }
    if (!test_oversized_table_rejected()) {
        return 1;
    }
    if (!test_observed_rows_sum_to_one()) {
        return 1;
    }
    if (!test_short_sequence_scores_zero()) {
        return 1;
    }
    if (!test_score_prefers_trained_pattern()) {
        return 1;
    }
    if (!test_relative_likelihood_range()) {
        return 1;
    }
    if (!test_untrained_and_invalid_states()) {
        return 1;
    }
    if (!test_pattern_analysis()) {
        return 1;
    }

    std::cout << "Transition model test passed.\n";
    return 0;
}
