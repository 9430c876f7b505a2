//
//  ica.cpp
//  StemSep
//
//  Created by Till Toenshoff on 2026-10-07.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "separators/spectral.h"
#include "stemsep/errors.h"
#include "stemsep/logging.hpp"
#include "stemsep/separator.h"

#include <algorithm>
#include <cmath>
#include <memory>
#include <random>
#include <string>
#include <utility>

#include <Eigen/Eigenvalues>

namespace stemsep {
namespace {

// (W W^T)^(-1/2) W
Eigen::MatrixXd symmetric_decorrelation(const Eigen::MatrixXd& w) {
    Eigen::SelfAdjointEigenSolver<Eigen::MatrixXd> solver(w * w.transpose());
    const Eigen::VectorXd inv_sqrt =
        solver.eigenvalues().cwiseMax(1e-12).cwiseSqrt().cwiseInverse();
    return solver.eigenvectors() * inv_sqrt.asDiagonal() * solver.eigenvectors().transpose() * w;
}

struct Whitening {
    Eigen::MatrixXd signals; // k x frames, unit variance rows
    Eigen::MatrixXd mixing;  // observations x k, maps whitened signals back
};

// PCA whitening of centered observations (rows) over frames (columns). The
// Gram matrix is taken on the smaller side.
bool whiten(const Eigen::MatrixXd& centered, Eigen::Index k, Whitening* out, std::string* error) {
    const Eigen::Index rows = centered.rows();
    const Eigen::Index frames = centered.cols();
    const double sqrt_frames = std::sqrt(static_cast<double>(frames));

    Eigen::VectorXd values;
    Eigen::MatrixXd vectors;
    const bool frame_space = frames <= rows;
    if (frame_space) {
        Eigen::SelfAdjointEigenSolver<Eigen::MatrixXd> solver(centered.transpose() * centered);
        values = solver.eigenvalues();
        vectors = solver.eigenvectors();
    } else {
        Eigen::SelfAdjointEigenSolver<Eigen::MatrixXd> solver(centered * centered.transpose());
        values = solver.eigenvalues();
        vectors = solver.eigenvectors();
    }
    if (values.size() < k) {
        if (error) {
            *error = "fewer observations than components";
        }
        return false;
    }

    // Eigenvalues ascend; keep the top k.
    const double largest = values(values.size() - 1);
    const double floor = std::max(1e-12, largest * 1e-10);
    out->signals.resize(k, frames);
    out->mixing.resize(rows, k);
    for (Eigen::Index i = 0; i < k; ++i) {
        const Eigen::Index idx = values.size() - 1 - i;
        const double lambda = values(idx);
        if (!(lambda > floor)) {
            if (error) {
                *error = "observations are rank deficient";
            }
            return false;
        }
        const double singular = std::sqrt(lambda);
        if (frame_space) {
            out->signals.row(i) = sqrt_frames * vectors.col(idx).transpose();
            out->mixing.col(i) = centered * vectors.col(idx) / sqrt_frames;
        } else {
            const Eigen::VectorXd u = vectors.col(idx);
            out->signals.row(i) = sqrt_frames / singular * (u.transpose() * centered);
            out->mixing.col(i) = u * singular / sqrt_frames;
        }
    }
    return true;
}

class IcaSeparator final : public Separator {
public:
    const SeparatorTraits& traits() const override {
        static const SeparatorTraits traits{"ica", false, false, false, 4};
        return traits;
    }

    bool is_available(const SeparationConfig&) const override {
        return true;
    }

    StemMap separate(const AudioBuffer& buffer,
                     std::size_t n_components,
                     const SeparationConfig& config) const override {
        if (n_components == 0) {
            throw AlgorithmFailure("ica: at least one component is required.");
        }
        const SeparatorConfig& options = config.separators;

        // Pseudo-stereo: the second channel is a delayed copy of the input.
        const std::size_t delay = static_cast<std::size_t>(
            std::lround(options.ica_channel_delay_seconds * buffer.sample_rate()));
        std::vector<float> delayed(buffer.size(), 0.0f);
        for (std::size_t i = delay; i < buffer.size(); ++i) {
            delayed[i] = buffer.samples()[i - delay];
        }

        const Spectrogram spec = compute_stft(buffer, config.stft);
        const Spectrogram spec_delayed =
            compute_stft(AudioBuffer(std::move(delayed), buffer.sample_rate()), config.stft);
        const Eigen::MatrixXf mag = detail::magnitude_matrix(spec);
        const Eigen::MatrixXf mag_delayed = detail::magnitude_matrix(spec_delayed);

        const Eigen::Index bins = mag.rows();
        const Eigen::Index frames = mag.cols();
        const Eigen::Index k = static_cast<Eigen::Index>(n_components);

        Eigen::MatrixXd observations(2 * bins, frames);
        observations.topRows(bins) = mag.cast<double>();
        observations.bottomRows(bins) = mag_delayed.cast<double>();
        const Eigen::VectorXd row_mean = observations.rowwise().mean();
        observations.colwise() -= row_mean;

        Whitening whitening;
        std::string error;
        if (!whiten(observations, k, &whitening, &error)) {
            throw AlgorithmFailure("ica: " + error + ".");
        }

        std::mt19937 rng(options.ica_seed);
        std::normal_distribution<double> normal(0.0, 1.0);
        Eigen::MatrixXd w(k, k);
        for (Eigen::Index i = 0; i < w.size(); ++i) {
            w.data()[i] = normal(rng);
        }
        w = symmetric_decorrelation(w);

        const Eigen::MatrixXd& z = whitening.signals;
        const double n = static_cast<double>(frames);
        std::size_t iteration = 0;
        double change = 1.0;
        for (; iteration < options.ica_max_iterations; ++iteration) {
            const Eigen::ArrayXXd g = (w * z).array().tanh();
            const Eigen::VectorXd g_prime_mean = (1.0 - g.square()).rowwise().mean().matrix();
            const Eigen::MatrixXd updated = symmetric_decorrelation(
                (g.matrix() * z.transpose()) / n - g_prime_mean.asDiagonal() * w);

            change = ((updated * w.transpose()).diagonal().cwiseAbs().array() - 1.0).abs().maxCoeff();
            w = updated;
            if (change < options.ica_tolerance) {
                ++iteration;
                break;
            }
        }
        if (!w.allFinite()) {
            throw AlgorithmFailure("ica: unmixing diverged.");
        }
        if (change >= options.ica_tolerance) {
            STEMSEP_LOG_WARN("ica: did not converge after " << iteration
                                                             << " iterations (change " << change
                                                             << ").");
        }

        const Eigen::MatrixXd sources = w * z;
        const Eigen::MatrixXd mixing = whitening.mixing * w.transpose();

        std::vector<Eigen::MatrixXf> components;
        components.reserve(n_components);
        for (Eigen::Index i = 0; i < k; ++i) {
            const Eigen::VectorXd profile =
                0.5 * (mixing.col(i).head(bins).cwiseAbs() + mixing.col(i).tail(bins).cwiseAbs());
            const Eigen::RowVectorXd activation = sources.row(i).cwiseAbs();
            components.push_back((profile * activation).cast<float>());
        }

        STEMSEP_LOG_INFO("ica: " << n_components << " components after " << iteration
                                 << " iterations");
        return detail::reconstruct_soft_masks(spec, components, detail::positional_names(n_components));
    }
};

} // namespace

std::unique_ptr<Separator> make_ica_separator() {
    return std::make_unique<IcaSeparator>();
}

} // namespace stemsep
