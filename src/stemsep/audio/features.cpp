//
//  features.cpp
//  StemSep
//
//  Created by Till Toenshoff on 2026-10-03.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "stemsep/features.h"

#include "dsp.h"
#include "stemsep/errors.h"
#include "stemsep/logging.hpp"

#include <algorithm>
#include <cmath>
#include <complex>
#include <vector>

#include <unsupported/Eigen/FFT>

namespace stemsep {
namespace {

constexpr std::size_t kSpectralDims = 4;
constexpr std::size_t kChromaBins = 12;
constexpr std::size_t kTonnetzDims = 6;
constexpr float kPowerFloor = 1e-10f;

// Magnitude spectra of every (non-centered) frame, frame-major.
std::vector<float> frame_magnitudes(const std::vector<float>& samples,
                                    std::size_t window_length,
                                    std::size_t hop_length,
                                    std::size_t frames,
                                    std::size_t bins) {
    const std::vector<float> window = detail::make_hann_window(window_length);
    std::vector<float> magnitudes(frames * bins, 0.0f);
    std::vector<float> windowed(window_length, 0.0f);
    std::vector<std::complex<float>> spectrum;

    Eigen::FFT<float> fft;
    fft.SetFlag(Eigen::FFT<float>::HalfSpectrum);

    for (std::size_t frame = 0; frame < frames; ++frame) {
        const std::size_t offset = frame * hop_length;
        for (std::size_t i = 0; i < window_length; ++i) {
            const std::size_t index = offset + i;
            const float sample = index < samples.size() ? samples[index] : 0.0f;
            windowed[i] = sample * window[i];
        }
        fft.fwd(spectrum, windowed);
        float* out = magnitudes.data() + frame * bins;
        const std::size_t count = std::min(bins, spectrum.size());
        for (std::size_t k = 0; k < count; ++k) {
            out[k] = std::abs(spectrum[k]);
        }
    }
    return magnitudes;
}

// Regression deltas over +-(width/2) neighbours, edges clamped.
std::vector<float> compute_deltas(const std::vector<float>& values,
                                  std::size_t frames,
                                  std::size_t dims,
                                  std::size_t width) {
    std::vector<float> deltas(values.size(), 0.0f);
    const std::size_t half = std::max<std::size_t>(1, width / 2);
    double denom = 0.0;
    for (std::size_t n = 1; n <= half; ++n) {
        denom += 2.0 * static_cast<double>(n * n);
    }

    for (std::size_t t = 0; t < frames; ++t) {
        for (std::size_t d = 0; d < dims; ++d) {
            double sum = 0.0;
            for (std::size_t n = 1; n <= half; ++n) {
                const std::size_t ahead = std::min(frames - 1, t + n);
                const std::size_t behind = (t >= n) ? t - n : 0;
                sum += static_cast<double>(n) *
                       (values[ahead * dims + d] - values[behind * dims + d]);
            }
            deltas[t * dims + d] = static_cast<float>(sum / denom);
        }
    }
    return deltas;
}

void extract_mfcc(const std::vector<float>& magnitudes,
                  std::size_t frames,
                  std::size_t bins,
                  double sample_rate,
                  const FeatureConfig& config,
                  FeatureMatrix* out) {
    const std::size_t coeffs = config.mfcc_count;
    const std::vector<float> filters =
        detail::build_mel_filterbank(config.mel_bands, bins, sample_rate, 0.0f, 0.0f);

    std::vector<float> cepstra(frames * coeffs, 0.0f);
    std::vector<float> log_mel(config.mel_bands, 0.0f);
    for (std::size_t frame = 0; frame < frames; ++frame) {
        const float* mag = magnitudes.data() + frame * bins;
        for (std::size_t m = 0; m < config.mel_bands; ++m) {
            const float* filter = filters.data() + m * bins;
            double energy = 0.0;
            for (std::size_t k = 0; k < bins; ++k) {
                energy += static_cast<double>(filter[k]) * mag[k] * mag[k];
            }
            log_mel[m] = 10.0f * std::log10(std::max(kPowerFloor, static_cast<float>(energy)));
        }
        const std::vector<float> row = detail::dct_ii(log_mel, coeffs);
        std::copy(row.begin(), row.end(), cepstra.begin() + static_cast<long>(frame * coeffs));
    }

    const std::vector<float> delta = compute_deltas(cepstra, frames, coeffs, config.delta_width);
    const std::vector<float> delta2 = compute_deltas(delta, frames, coeffs, config.delta_width);

    out->dims = coeffs * 3;
    out->values.assign(frames * out->dims, 0.0f);
    for (std::size_t frame = 0; frame < frames; ++frame) {
        float* dst = out->values.data() + frame * out->dims;
        for (std::size_t c = 0; c < coeffs; ++c) {
            dst[c] = cepstra[frame * coeffs + c];
            dst[coeffs + c] = delta[frame * coeffs + c];
            dst[2 * coeffs + c] = delta2[frame * coeffs + c];
        }
    }
}

void extract_spectral(const std::vector<float>& samples,
                      const std::vector<float>& magnitudes,
                      std::size_t frames,
                      std::size_t bins,
                      double sample_rate,
                      const FeatureConfig& config,
                      FeatureMatrix* out) {
    const double bin_hz = sample_rate / static_cast<double>(config.window_length);
    out->dims = kSpectralDims;
    out->values.assign(frames * kSpectralDims, 0.0f);

    for (std::size_t frame = 0; frame < frames; ++frame) {
        const float* mag = magnitudes.data() + frame * bins;
        double total = 0.0;
        double weighted = 0.0;
        for (std::size_t k = 0; k < bins; ++k) {
            total += mag[k];
            weighted += static_cast<double>(k) * bin_hz * mag[k];
        }

        double centroid = 0.0;
        double bandwidth = 0.0;
        double rolloff = 0.0;
        if (total > 0.0) {
            centroid = weighted / total;
            double spread = 0.0;
            for (std::size_t k = 0; k < bins; ++k) {
                const double diff = static_cast<double>(k) * bin_hz - centroid;
                spread += mag[k] * diff * diff;
            }
            bandwidth = std::sqrt(spread / total);

            const double target = static_cast<double>(config.rolloff_percent) * total;
            double cumulative = 0.0;
            for (std::size_t k = 0; k < bins; ++k) {
                cumulative += mag[k];
                if (cumulative >= target) {
                    rolloff = static_cast<double>(k) * bin_hz;
                    break;
                }
            }
        }

        const std::size_t begin = frame * config.hop_length;
        const std::size_t end = std::min(samples.size(), begin + config.window_length);
        std::size_t crossings = 0;
        for (std::size_t i = begin + 1; i < end; ++i) {
            if ((samples[i - 1] >= 0.0f) != (samples[i] >= 0.0f)) {
                ++crossings;
            }
        }
        const double zcr =
            static_cast<double>(crossings) / static_cast<double>(config.window_length);

        float* dst = out->values.data() + frame * kSpectralDims;
        dst[0] = static_cast<float>(centroid);
        dst[1] = static_cast<float>(rolloff);
        dst[2] = static_cast<float>(bandwidth);
        dst[3] = static_cast<float>(zcr);
    }
}

void extract_chroma(const std::vector<float>& magnitudes,
                    std::size_t frames,
                    std::size_t bins,
                    double sample_rate,
                    const FeatureConfig& config,
                    FeatureMatrix* out) {
    // Pitch class of every bin, C = 0; bins below ~A0 are ignored.
    const double bin_hz = sample_rate / static_cast<double>(config.window_length);
    std::vector<int> pitch_class(bins, -1);
    for (std::size_t k = 1; k < bins; ++k) {
        const double hz = static_cast<double>(k) * bin_hz;
        if (hz < 27.5) {
            continue;
        }
        const long midi = std::lround(69.0 + 12.0 * std::log2(hz / 440.0));
        pitch_class[k] = static_cast<int>(((midi % 12) + 12) % 12);
    }

    // Tonal centroid basis: fifths, minor thirds, major thirds.
    float phi[kTonnetzDims][kChromaBins];
    for (std::size_t l = 0; l < kChromaBins; ++l) {
        const double p = static_cast<double>(l);
        phi[0][l] = static_cast<float>(std::sin(p * 7.0 * detail::kPi / 6.0));
        phi[1][l] = static_cast<float>(std::cos(p * 7.0 * detail::kPi / 6.0));
        phi[2][l] = static_cast<float>(std::sin(p * 3.0 * detail::kPi / 2.0));
        phi[3][l] = static_cast<float>(std::cos(p * 3.0 * detail::kPi / 2.0));
        phi[4][l] = static_cast<float>(0.5 * std::sin(p * 2.0 * detail::kPi / 3.0));
        phi[5][l] = static_cast<float>(0.5 * std::cos(p * 2.0 * detail::kPi / 3.0));
    }

    out->dims = kChromaBins + kTonnetzDims;
    out->values.assign(frames * out->dims, 0.0f);
    for (std::size_t frame = 0; frame < frames; ++frame) {
        const float* mag = magnitudes.data() + frame * bins;
        double chroma[kChromaBins] = {};
        for (std::size_t k = 0; k < bins; ++k) {
            if (pitch_class[k] >= 0) {
                chroma[pitch_class[k]] += static_cast<double>(mag[k]) * mag[k];
            }
        }

        double peak = 0.0;
        double sum = 0.0;
        for (double value : chroma) {
            peak = std::max(peak, value);
            sum += value;
        }

        float* dst = out->values.data() + frame * out->dims;
        for (std::size_t c = 0; c < kChromaBins; ++c) {
            dst[c] = peak > 0.0 ? static_cast<float>(chroma[c] / peak) : 0.0f;
        }
        for (std::size_t d = 0; d < kTonnetzDims; ++d) {
            double value = 0.0;
            if (sum > 0.0) {
                for (std::size_t c = 0; c < kChromaBins; ++c) {
                    value += phi[d][c] * (chroma[c] / sum);
                }
            }
            dst[kChromaBins + d] = static_cast<float>(value);
        }
    }
}

} // namespace

std::size_t feature_dimensions(const FeatureConfig& config) {
    switch (config.type) {
        case FeatureType::Mfcc:
            return config.mfcc_count * 3;
        case FeatureType::Spectral:
            return kSpectralDims;
        case FeatureType::Chroma:
            return kChromaBins + kTonnetzDims;
    }
    return 0;
}

std::size_t feature_frame_count(std::size_t sample_count, const FeatureConfig& config) {
    if (config.window_length == 0 || config.hop_length == 0 || sample_count == 0) {
        return 0;
    }
    if (sample_count < config.window_length) {
        return 1;
    }
    return (sample_count - config.window_length) / config.hop_length + 1;
}

FeatureMatrix extract_features(const AudioBuffer& buffer, const FeatureConfig& config) {
    if (buffer.empty()) {
        throw ExtractionError("Cannot extract features from an empty buffer.");
    }
    if (buffer.sample_rate() <= 0.0) {
        throw ExtractionError("Cannot extract features: invalid sample rate.");
    }
    if (config.window_length == 0 || config.hop_length == 0) {
        throw ExtractionError("Cannot extract features: window and hop must be non-zero.");
    }
    if (config.type == FeatureType::Mfcc && (config.mfcc_count == 0 || config.mel_bands == 0)) {
        throw ExtractionError("Cannot extract features: MFCC and mel band counts must be non-zero.");
    }

    const std::vector<float>& samples = buffer.samples();
    for (float sample : samples) {
        if (!std::isfinite(sample)) {
            throw ExtractionError("Cannot extract features: buffer contains non-finite samples.");
        }
    }

    const std::size_t frames = feature_frame_count(samples.size(), config);
    const std::size_t bins = config.window_length / 2 + 1;
    const std::vector<float> magnitudes =
        frame_magnitudes(samples, config.window_length, config.hop_length, frames, bins);

    FeatureMatrix out;
    out.frames = frames;
    out.type = config.type;
    switch (config.type) {
        case FeatureType::Mfcc:
            extract_mfcc(magnitudes, frames, bins, buffer.sample_rate(), config, &out);
            break;
        case FeatureType::Spectral:
            extract_spectral(samples, magnitudes, frames, bins, buffer.sample_rate(), config, &out);
            break;
        case FeatureType::Chroma:
            extract_chroma(magnitudes, frames, bins, buffer.sample_rate(), config, &out);
            break;
    }

    STEMSEP_LOG_DEBUG("Features: " << feature_type_name(config.type) << " frames=" << out.frames
                                   << " dims=" << out.dims);
    return out;
}

} // namespace stemsep
