//
//  stft.cpp
//  StemSep
//
//  Created by Till Toenshoff on 2026-10-03.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "stemsep/spectrogram.h"

#include "dsp.h"
#include "stemsep/errors.h"

#include <algorithm>
#include <cmath>
#include <string>
#include <utility>

#include <unsupported/Eigen/FFT>

namespace stemsep {
namespace {

// Reflect an out-of-range index back into [0, size); single-sample input
// and indices beyond one reflection yield -1 (zero padding).
long reflect_index(long index, long size) {
    if (size <= 1) {
        return (index == 0 && size == 1) ? 0 : -1;
    }
    if (index < 0) {
        index = -index;
    }
    if (index >= size) {
        index = 2 * (size - 1) - index;
    }
    return (index >= 0 && index < size) ? index : -1;
}

} // namespace

std::vector<float> Spectrogram::magnitude() const {
    std::vector<float> out(values.size(), 0.0f);
    for (std::size_t i = 0; i < values.size(); ++i) {
        out[i] = std::abs(values[i]);
    }
    return out;
}

double Spectrogram::bin_frequency(std::size_t bin) const {
    if (n_fft == 0) {
        return 0.0;
    }
    return static_cast<double>(bin) * sample_rate / static_cast<double>(n_fft);
}

Spectrogram compute_stft(const AudioBuffer& buffer, const StftConfig& config) {
    if (buffer.empty()) {
        throw ValidationError("STFT: empty buffer.");
    }
    if (buffer.sample_rate() <= 0.0) {
        throw ValidationError("STFT: invalid sample rate.");
    }
    if (config.n_fft < 2 || (config.n_fft % 2) != 0 || config.hop_length == 0) {
        throw ValidationError("STFT: n_fft must be even and hop non-zero.");
    }

    const std::vector<float>& samples = buffer.samples();
    const long length = static_cast<long>(samples.size());
    const long pad = static_cast<long>(config.n_fft / 2);

    Spectrogram spec;
    spec.n_fft = config.n_fft;
    spec.hop_length = config.hop_length;
    spec.bins = config.n_fft / 2 + 1;
    spec.frames = 1 + samples.size() / config.hop_length;
    spec.signal_length = samples.size();
    spec.sample_rate = buffer.sample_rate();
    spec.values.assign(spec.bins * spec.frames, std::complex<float>(0.0f, 0.0f));

    const std::vector<float> window = detail::make_hann_window(config.n_fft);
    std::vector<float> frame(config.n_fft, 0.0f);
    std::vector<std::complex<float>> spectrum;

    Eigen::FFT<float> fft;
    fft.SetFlag(Eigen::FFT<float>::HalfSpectrum);

    for (std::size_t f = 0; f < spec.frames; ++f) {
        const long start = static_cast<long>(f * config.hop_length) - pad;
        for (std::size_t i = 0; i < config.n_fft; ++i) {
            const long index = reflect_index(start + static_cast<long>(i), length);
            frame[i] = index >= 0 ? samples[static_cast<std::size_t>(index)] * window[i] : 0.0f;
        }
        fft.fwd(spectrum, frame);
        const std::size_t count = std::min(spec.bins, spectrum.size());
        std::copy(spectrum.begin(),
                  spectrum.begin() + static_cast<long>(count),
                  spec.values.begin() + static_cast<long>(f * spec.bins));
    }

    return spec;
}

AudioBuffer inverse_stft(const Spectrogram& spectrogram) {
    if (spectrogram.n_fft == 0 || spectrogram.hop_length == 0 ||
        spectrogram.values.size() != spectrogram.bins * spectrogram.frames) {
        throw ValidationError("ISTFT: malformed spectrogram.");
    }

    const std::size_t n_fft = spectrogram.n_fft;
    const std::size_t hop = spectrogram.hop_length;
    const std::size_t pad = n_fft / 2;
    const std::size_t padded_length = n_fft + hop * (spectrogram.frames - 1);

    const std::vector<float> window = detail::make_hann_window(n_fft);
    std::vector<float> accum(padded_length, 0.0f);
    std::vector<float> norm(padded_length, 0.0f);
    std::vector<std::complex<float>> spectrum(spectrogram.bins);
    std::vector<float> frame;

    Eigen::FFT<float> fft;
    fft.SetFlag(Eigen::FFT<float>::HalfSpectrum);

    for (std::size_t f = 0; f < spectrogram.frames; ++f) {
        std::copy(spectrogram.values.begin() + static_cast<long>(f * spectrogram.bins),
                  spectrogram.values.begin() + static_cast<long>((f + 1) * spectrogram.bins),
                  spectrum.begin());
        fft.inv(frame, spectrum, static_cast<Eigen::Index>(n_fft));
        const std::size_t offset = f * hop;
        for (std::size_t i = 0; i < n_fft && i < frame.size(); ++i) {
            accum[offset + i] += frame[i] * window[i];
            norm[offset + i] += window[i] * window[i];
        }
    }

    std::vector<float> output(spectrogram.signal_length, 0.0f);
    for (std::size_t i = 0; i < output.size(); ++i) {
        const std::size_t index = i + pad;
        if (index >= padded_length) {
            break;
        }
        output[i] = norm[index] > 1e-8f ? accum[index] / norm[index] : 0.0f;
    }
    return AudioBuffer(std::move(output), spectrogram.sample_rate);
}

AudioBuffer apply_mask(const Spectrogram& spectrogram, const TimeFrequencyMask& mask) {
    if (mask.bins != spectrogram.bins || mask.frames != spectrogram.frames ||
        mask.values.size() != spectrogram.values.size()) {
        throw ValidationError("Mask shape " + std::to_string(mask.bins) + "x" +
                              std::to_string(mask.frames) + " does not match spectrogram " +
                              std::to_string(spectrogram.bins) + "x" +
                              std::to_string(spectrogram.frames) + ".");
    }

    Spectrogram masked = spectrogram;
    for (std::size_t i = 0; i < masked.values.size(); ++i) {
        masked.values[i] *= mask.values[i];
    }
    return inverse_stft(masked);
}

} // namespace stemsep
