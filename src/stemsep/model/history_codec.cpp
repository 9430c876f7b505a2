//
//  history_codec.cpp
//  StemSep
//
//  Created by Till Toenshoff on 2026-10-04.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "stemsep/errors.h"
#include "stemsep/markov.h"

#include <string>

namespace stemsep {

HistoryCodec::HistoryCodec(std::size_t order, std::size_t n_states)
    : order_(order),
      n_states_(n_states) {
    if (order == 0) {
        throw ValidationError("Markov order must be at least 1.");
    }
    if (n_states == 0) {
        throw ValidationError("Markov model needs at least one state.");
    }

    std::size_t count = 1;
    for (std::size_t i = 0; i < order; ++i) {
        if (count > kMaxTransitionEntries / n_states) {
            throw ValidationError("Transition table for order " + std::to_string(order) +
                                  " and " + std::to_string(n_states) +
                                  " states exceeds the entry limit.");
        }
        count *= n_states;
    }
    if (count > kMaxTransitionEntries / n_states) {
        throw ValidationError("Transition table for order " + std::to_string(order) + " and " +
                              std::to_string(n_states) + " states exceeds the entry limit.");
    }
    history_count_ = count;
}

std::size_t HistoryCodec::encode(const std::uint32_t* history) const {
    std::size_t index = 0;
    for (std::size_t i = 0; i < order_; ++i) {
        index = index * n_states_ + history[i];
    }
    return index;
}

std::size_t HistoryCodec::encode_before(const StateSequence& sequence, std::size_t end) const {
    return encode(sequence.data() + (end - order_));
}

std::vector<std::uint32_t> HistoryCodec::decode(std::size_t index) const {
    std::vector<std::uint32_t> history(order_, 0);
    for (std::size_t i = order_; i-- > 0;) {
        history[i] = static_cast<std::uint32_t>(index % n_states_);
        index /= n_states_;
    }
    return history;
}

} // namespace stemsep
