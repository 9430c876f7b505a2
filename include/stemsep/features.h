//
//  features.h
//  StemSep
//
//  Created by Till Toenshoff on 2026-10-03.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include "stemsep/audio_buffer.h"
#include "stemsep/config.h"

#include <cstddef>
#include <vector>

namespace stemsep {

/// @brief Per-frame descriptors, row-major `frames x dims`.
struct FeatureMatrix {
    std::size_t frames = 0;
    std::size_t dims = 0;
    FeatureType type = FeatureType::Mfcc;
    std::vector<float> values;

    const float* row(std::size_t frame) const { return values.data() + frame * dims; }
    bool empty() const { return frames == 0 || dims == 0; }
};

/// @brief Dimensionality produced by a feature family.
///
/// `mfcc` yields `3 * mfcc_count` (coefficients, deltas, delta-deltas),
/// `spectral` yields 4 (centroid, rolloff, bandwidth, zero-crossing rate),
/// `chroma` yields 18 (12 pitch classes plus 6 tonal centroid coordinates).
std::size_t feature_dimensions(const FeatureConfig& config);

/// @brief Number of frames for `sample_count` samples.
///
/// Frames are not centered: `floor((len - window) / hop) + 1`, or 1 when the
/// buffer is shorter than one window.
std::size_t feature_frame_count(std::size_t sample_count, const FeatureConfig& config);

/// @brief Extract per-frame features from a mono buffer.
///
/// Deterministic for identical input and config. Throws ExtractionError for an
/// empty buffer, a non-positive sample rate, non-finite samples, or a zero
/// window/hop length.
FeatureMatrix extract_features(const AudioBuffer& buffer, const FeatureConfig& config);

} // namespace stemsep
