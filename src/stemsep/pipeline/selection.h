//
//  selection.h
//  StemSep
//
//  Created by Till Toenshoff on 2026-10-10.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include "stemsep/audio_buffer.h"
#include "stemsep/config.h"
#include "stemsep/orchestrator.h"
#include "stemsep/separator.h"

#include <cstddef>
#include <string>
#include <vector>

namespace stemsep::detail {

// Spread between loud (95th percentile) and quiet (10th percentile) block RMS
// in dB. Silent blocks are floored at -100 dB.
float dynamic_range_db(const AudioBuffer& audio, std::size_t block);

// Available general-purpose separators, heaviest (highest quality) first.
std::vector<std::string> neural_candidates(const SeparatorBank& bank,
                                           const SeparationConfig& config);

std::vector<std::string> auto_priority(const SeparatorBank& bank,
                                       const SeparationConfig& config,
                                       const AudioBuffer& audio);

std::vector<PlannedMethod> quality_chain(QualityHint hint,
                                         const SeparatorBank& bank,
                                         const SeparationConfig& config,
                                         const AudioBuffer& audio);

// Keeps the first occurrence of each method and drops names missing from
// the bank.
std::vector<PlannedMethod> deduplicate(const std::vector<PlannedMethod>& methods,
                                       const SeparatorBank& bank);

} // namespace stemsep::detail
