//
//  spectrogram.h
//  StemSep
//
//  Created by Till Toenshoff on 2026-10-03.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include "stemsep/audio_buffer.h"
#include "stemsep/config.h"

#include <complex>
#include <cstddef>
#include <vector>

namespace stemsep {

/// @brief Centered short-time Fourier transform of a mono buffer.
///
/// Values are stored frame-major: `values[frame * bins + bin]`, so every
/// frame's half spectrum is contiguous. `bins = n_fft / 2 + 1` and
/// `frames = 1 + signal_length / hop_length`.
struct Spectrogram {
    std::size_t bins = 0;
    std::size_t frames = 0;
    std::size_t n_fft = 0;
    std::size_t hop_length = 0;
    std::size_t signal_length = 0;
    double sample_rate = 0.0;
    std::vector<std::complex<float>> values;

    std::vector<float> magnitude() const;
    double bin_frequency(std::size_t bin) const;
};

/// @brief Per time-frequency weighting with the layout of a Spectrogram.
struct TimeFrequencyMask {
    std::size_t bins = 0;
    std::size_t frames = 0;
    std::vector<float> values;

    float at(std::size_t bin, std::size_t frame) const {
        return values[frame * bins + bin];
    }
};

/// @brief Compute the STFT (Hann window, reflect-padded by n_fft/2).
///
/// Throws ValidationError for an empty buffer, a non-positive sample rate or
/// a zero/odd FFT size.
Spectrogram compute_stft(const AudioBuffer& buffer, const StftConfig& config);

/// @brief Weighted overlap-add inverse; output length equals signal_length.
AudioBuffer inverse_stft(const Spectrogram& spectrogram);

/// @brief Multiply a spectrogram by a mask (keeping its phase) and invert.
///
/// Throws ValidationError when the mask shape differs from the spectrogram's.
AudioBuffer apply_mask(const Spectrogram& spectrogram, const TimeFrequencyMask& mask);

} // namespace stemsep
