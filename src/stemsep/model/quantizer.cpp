//
//  quantizer.cpp
//  StemSep
//
//  Created by Till Toenshoff on 2026-10-04.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "stemsep/quantizer.h"

#include "stemsep/errors.h"
#include "stemsep/logging.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <random>
#include <string>
#include <utility>

#include <Eigen/Dense>

namespace stemsep {
namespace {

using RowMatrix = Eigen::Matrix<double, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

// Uniform double in [0, 1) drawn straight from the engine so results do not
// depend on the standard library's distribution implementation.
double next_unit(std::mt19937& rng) {
    return static_cast<double>(rng()) / 4294967296.0;
}

std::size_t nearest_centroid(const RowMatrix& centroids,
                             const Eigen::Ref<const Eigen::RowVectorXd>& point,
                             double* out_distance) {
    std::size_t best = 0;
    double best_distance = std::numeric_limits<double>::max();
    for (Eigen::Index c = 0; c < centroids.rows(); ++c) {
        const double distance = (centroids.row(c) - point).squaredNorm();
        if (distance < best_distance) {
            best_distance = distance;
            best = static_cast<std::size_t>(c);
        }
    }
    if (out_distance) {
        *out_distance = best_distance;
    }
    return best;
}

RowMatrix seed_kmeans_plus_plus(const RowMatrix& points, std::size_t k, std::mt19937& rng) {
    const Eigen::Index n = points.rows();
    RowMatrix centroids(static_cast<Eigen::Index>(k), points.cols());
    std::vector<double> distances(static_cast<std::size_t>(n),
                                  std::numeric_limits<double>::max());

    Eigen::Index chosen = static_cast<Eigen::Index>(next_unit(rng) * static_cast<double>(n));
    centroids.row(0) = points.row(chosen);

    for (std::size_t c = 1; c < k; ++c) {
        double total = 0.0;
        for (Eigen::Index i = 0; i < n; ++i) {
            const double d = (points.row(i) - centroids.row(static_cast<Eigen::Index>(c - 1)))
                                 .squaredNorm();
            double& slot = distances[static_cast<std::size_t>(i)];
            slot = std::min(slot, d);
            total += slot;
        }

        if (total <= 0.0) {
            // All remaining points coincide with a centroid.
            chosen = static_cast<Eigen::Index>(c % static_cast<std::size_t>(n));
        } else {
            const double target = next_unit(rng) * total;
            double cumulative = 0.0;
            chosen = n - 1;
            for (Eigen::Index i = 0; i < n; ++i) {
                cumulative += distances[static_cast<std::size_t>(i)];
                if (cumulative > target) {
                    chosen = i;
                    break;
                }
            }
        }
        centroids.row(static_cast<Eigen::Index>(c)) = points.row(chosen);
    }
    return centroids;
}

} // namespace

StateQuantizer::StateQuantizer(QuantizerConfig config) : config_(std::move(config)) {}

void StateQuantizer::fit(const std::vector<FeatureMatrix>& corpus) {
    if (fitted_) {
        throw ValidationError("Quantizer is already fitted.");
    }
    if (config_.n_states == 0) {
        throw ValidationError("Quantizer needs at least one state.");
    }
    if (corpus.empty()) {
        throw ValidationError("Quantizer corpus is empty.");
    }

    const std::size_t dims = corpus.front().dims;
    std::size_t total_frames = 0;
    for (const auto& matrix : corpus) {
        if (matrix.dims != dims || matrix.values.size() != matrix.frames * matrix.dims) {
            throw ValidationError("Quantizer corpus has inconsistent dimensionality.");
        }
        total_frames += matrix.frames;
    }
    if (dims == 0 || total_frames == 0) {
        throw ValidationError("Quantizer corpus contains no frames.");
    }
    if (total_frames < config_.n_states) {
        throw ValidationError("Quantizer corpus has " + std::to_string(total_frames) +
                              " frames, fewer than " + std::to_string(config_.n_states) +
                              " states.");
    }

    RowMatrix points(static_cast<Eigen::Index>(total_frames), static_cast<Eigen::Index>(dims));
    Eigen::Index row = 0;
    for (const auto& matrix : corpus) {
        for (std::size_t f = 0; f < matrix.frames; ++f, ++row) {
            const float* src = matrix.row(f);
            for (std::size_t d = 0; d < dims; ++d) {
                points(row, static_cast<Eigen::Index>(d)) = src[d];
            }
        }
    }

    const Eigen::RowVectorXd mean = points.colwise().mean();
    points.rowwise() -= mean;
    Eigen::RowVectorXd scale =
        (points.array().square().colwise().sum() / static_cast<double>(total_frames))
            .sqrt()
            .matrix();
    for (Eigen::Index d = 0; d < scale.size(); ++d) {
        if (!(scale(d) > 0.0)) {
            scale(d) = 1.0;
        }
    }
    points.array().rowwise() /= scale.array();

    std::mt19937 rng(config_.seed);
    RowMatrix centroids = seed_kmeans_plus_plus(points, config_.n_states, rng);

    const Eigen::Index k = centroids.rows();
    std::vector<std::size_t> labels(total_frames, 0);
    std::vector<double> distances(total_frames, 0.0);
    std::size_t iteration = 0;
    for (; iteration < config_.max_iterations; ++iteration) {
        for (Eigen::Index i = 0; i < points.rows(); ++i) {
            labels[static_cast<std::size_t>(i)] =
                nearest_centroid(centroids, points.row(i), &distances[static_cast<std::size_t>(i)]);
        }

        RowMatrix updated = RowMatrix::Zero(k, points.cols());
        std::vector<std::size_t> counts(static_cast<std::size_t>(k), 0);
        for (Eigen::Index i = 0; i < points.rows(); ++i) {
            const std::size_t label = labels[static_cast<std::size_t>(i)];
            updated.row(static_cast<Eigen::Index>(label)) += points.row(i);
            ++counts[label];
        }

        for (Eigen::Index c = 0; c < k; ++c) {
            const std::size_t count = counts[static_cast<std::size_t>(c)];
            if (count > 0) {
                updated.row(c) /= static_cast<double>(count);
                continue;
            }
            // Re-seed an empty cluster with the point farthest from its centroid.
            std::size_t farthest = 0;
            for (std::size_t i = 1; i < distances.size(); ++i) {
                if (distances[i] > distances[farthest]) {
                    farthest = i;
                }
            }
            updated.row(c) = points.row(static_cast<Eigen::Index>(farthest));
            distances[farthest] = 0.0;
        }

        const double shift = (updated - centroids).squaredNorm();
        centroids = std::move(updated);
        STEMSEP_LOG_DEBUG("Quantizer: iteration " << iteration << " centroid shift " << shift);
        if (shift <= config_.tolerance) {
            break;
        }
    }

    dims_ = dims;
    mean_.resize(dims);
    scale_.resize(dims);
    for (std::size_t d = 0; d < dims; ++d) {
        mean_[d] = static_cast<float>(mean(static_cast<Eigen::Index>(d)));
        scale_[d] = static_cast<float>(scale(static_cast<Eigen::Index>(d)));
    }
    centroids_.resize(config_.n_states * dims);
    for (Eigen::Index c = 0; c < k; ++c) {
        for (std::size_t d = 0; d < dims; ++d) {
            centroids_[static_cast<std::size_t>(c) * dims + d] =
                static_cast<float>(centroids(c, static_cast<Eigen::Index>(d)));
        }
    }
    fitted_ = true;

    STEMSEP_LOG_INFO("Quantizer: fitted " << config_.n_states << " states on " << total_frames
                                          << " frames in " << iteration + 1 << " iterations.");
}

StateSequence StateQuantizer::predict(const FeatureMatrix& features) const {
    if (!fitted_) {
        throw NotTrainedError("Quantizer must be fitted before predict().");
    }
    if (features.dims != dims_ || features.values.size() != features.frames * features.dims) {
        throw ValidationError("Quantizer expects " + std::to_string(dims_) +
                              "-dimensional features, got " + std::to_string(features.dims) + ".");
    }

    StateSequence states(features.frames, 0);
    std::vector<float> normalized(dims_, 0.0f);
    for (std::size_t f = 0; f < features.frames; ++f) {
        const float* src = features.row(f);
        for (std::size_t d = 0; d < dims_; ++d) {
            normalized[d] = (src[d] - mean_[d]) / scale_[d];
        }

        std::uint32_t best = 0;
        float best_distance = std::numeric_limits<float>::max();
        for (std::size_t c = 0; c < config_.n_states; ++c) {
            const float* centroid = centroids_.data() + c * dims_;
            float distance = 0.0f;
            for (std::size_t d = 0; d < dims_; ++d) {
                const float diff = normalized[d] - centroid[d];
                distance += diff * diff;
            }
            if (distance < best_distance) {
                best_distance = distance;
                best = static_cast<std::uint32_t>(c);
            }
        }
        states[f] = best;
    }
    return states;
}

StateQuantizer StateQuantizer::restore(const QuantizerConfig& config,
                                       std::size_t dims,
                                       std::vector<float> mean,
                                       std::vector<float> scale,
                                       std::vector<float> centroids) {
    if (dims == 0 || config.n_states == 0 || mean.size() != dims || scale.size() != dims ||
        centroids.size() != config.n_states * dims) {
        throw ValidationError("Quantizer statistics do not match their dimensions.");
    }
    for (float value : scale) {
        if (!(value > 0.0f)) {
            throw ValidationError("Quantizer scale must be positive.");
        }
    }

    StateQuantizer quantizer(config);
    quantizer.dims_ = dims;
    quantizer.mean_ = std::move(mean);
    quantizer.scale_ = std::move(scale);
    quantizer.centroids_ = std::move(centroids);
    quantizer.fitted_ = true;
    return quantizer;
}

} // namespace stemsep
