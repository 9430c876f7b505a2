//
//  quantizer.h
//  StemSep
//
//  Created by Till Toenshoff on 2026-10-04.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include "stemsep/config.h"
#include "stemsep/features.h"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace stemsep {

/// @brief Discrete state ids, one per feature frame.
using StateSequence = std::vector<std::uint32_t>;

/// @brief Maps feature frames onto a finite state alphabet.
///
/// Dimensions are standardized with corpus-wide mean/scale, then assigned to
/// the nearest of `n_states` k-means centroids. A quantizer is fitted exactly
/// once and is read-only afterwards.
class StateQuantizer {
public:
    explicit StateQuantizer(QuantizerConfig config = {});

    /// @brief Fit normalization and centroids on every frame of `corpus`.
    ///
    /// Throws ValidationError for an empty corpus, inconsistent dimensions,
    /// fewer frames than states, or when already fitted.
    void fit(const std::vector<FeatureMatrix>& corpus);

    /// @brief Nearest-centroid state per frame. Throws NotTrainedError before fit.
    StateSequence predict(const FeatureMatrix& features) const;

    bool is_fitted() const { return fitted_; }
    std::size_t n_states() const { return config_.n_states; }
    std::size_t dims() const { return dims_; }

    const std::vector<float>& mean() const { return mean_; }
    const std::vector<float>& scale() const { return scale_; }
    /// Row-major `n_states x dims`.
    const std::vector<float>& centroids() const { return centroids_; }

    /// @brief Rebuild a fitted quantizer from stored statistics.
    ///
    /// Throws ValidationError when the vector sizes disagree with `dims`.
    static StateQuantizer restore(const QuantizerConfig& config,
                                  std::size_t dims,
                                  std::vector<float> mean,
                                  std::vector<float> scale,
                                  std::vector<float> centroids);

private:
    QuantizerConfig config_;
    std::size_t dims_ = 0;
    bool fitted_ = false;
    std::vector<float> mean_;
    std::vector<float> scale_;
    std::vector<float> centroids_;
};

} // namespace stemsep
