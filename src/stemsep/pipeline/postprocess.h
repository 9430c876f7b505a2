//
//  postprocess.h
//  StemSep
//
//  Created by Till Toenshoff on 2026-10-10.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include "stemsep/audio_buffer.h"
#include "stemsep/config.h"
#include "stemsep/separator.h"

#include <map>
#include <string>

namespace stemsep::detail {

struct ComponentProfile {
    double centroid_hz = 0.0;
    double zero_crossing_rate = 0.0;
};

ComponentProfile profile_component(const AudioBuffer& audio, const StftConfig& stft);

// Bright and noisy -> drums, bright -> vocals, mid -> other, else bass.
std::string classify_component(const ComponentProfile& profile);

// Assigns canonical labels by spectral heuristics, brightest component first.
// A label already taken falls back to the first free canonical label; once
// those run out the component keeps its positional name.
StemMap relabel_components(const StemMap& stems, const StftConfig& stft);

// Scale so the absolute peak equals `headroom`. Silent buffers are returned
// unchanged.
AudioBuffer normalize_peak(const AudioBuffer& audio, float headroom);

// Static compressor: magnitudes above `threshold` are reduced by `ratio`.
// Throws ValidationError for a non-positive threshold or a ratio below 1.
AudioBuffer compress_peaks(const AudioBuffer& audio, float threshold, float ratio);

// Sums stems scaled by `levels` (missing names play at 1.0). Shorter stems are
// zero padded to the longest one and the sum is scaled down when its peak
// exceeds full scale. Throws ValidationError for an empty set, mismatched
// sample rates, or negative or non-finite levels.
AudioBuffer mix_stems(const StemMap& stems, const std::map<std::string, float>& levels);

// Soft spectral gate: each bin's threshold is the larger of its 10th
// percentile magnitude over time and `floor_db` below the spectrogram peak.
// Cells below the threshold are attenuated quadratically.
AudioBuffer spectral_gate(const AudioBuffer& audio, const StftConfig& stft, float floor_db);

} // namespace stemsep::detail
