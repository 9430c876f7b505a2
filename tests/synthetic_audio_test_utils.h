//
//  synthetic_audio_test_utils.h
//  StemSep
//
//  Created by Till Toenshoff on 2026-10-13.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include "stemsep/audio_buffer.h"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <random>
#include <utility>
#include <vector>

namespace stemsep::tests::synthetic_audio {

constexpr double kTwoPi = 6.28318530717958647692;

inline std::size_t sample_count(double sample_rate, double seconds) {
    return static_cast<std::size_t>(std::ceil(sample_rate * seconds));
}

inline std::vector<float> make_sine(double sample_rate, double hz, double seconds, float amp) {
    std::vector<float> samples(sample_count(sample_rate, seconds), 0.0f);
    for (std::size_t i = 0; i < samples.size(); ++i) {
        const double t = static_cast<double>(i) / sample_rate;
        samples[i] = amp * static_cast<float>(std::sin(kTwoPi * hz * t));
    }
    return samples;
}

// Sine carrier with a raised-sine amplitude envelope at `mod_hz`.
inline std::vector<float> make_tremolo_sine(double sample_rate,
                                            double carrier_hz,
                                            double mod_hz,
                                            double seconds,
                                            float amp) {
    std::vector<float> samples(sample_count(sample_rate, seconds), 0.0f);
    for (std::size_t i = 0; i < samples.size(); ++i) {
        const double t = static_cast<double>(i) / sample_rate;
        const double env = 0.5 * (1.0 + std::sin(kTwoPi * mod_hz * t));
        samples[i] = amp * static_cast<float>(std::sin(kTwoPi * carrier_hz * t) * env);
    }
    return samples;
}

// Decaying noise bursts on a fixed beat grid.
inline std::vector<float> make_click_track(double sample_rate,
                                           double bpm,
                                           double seconds,
                                           double pulse_ms,
                                           float amp,
                                           std::uint32_t seed) {
    std::vector<float> samples(sample_count(sample_rate, seconds), 0.0f);
    const std::size_t period =
        std::max<std::size_t>(1, static_cast<std::size_t>(std::round(sample_rate * 60.0 / bpm)));
    const std::size_t width =
        std::max<std::size_t>(1, static_cast<std::size_t>(std::round(sample_rate * pulse_ms * 0.001)));
    std::mt19937 rng(seed);
    std::uniform_real_distribution<float> noise(-1.0f, 1.0f);
    for (std::size_t i = 0; i < samples.size(); ++i) {
        const std::size_t phase = i % period;
        if (phase < width) {
            const float taper = 1.0f - static_cast<float>(phase) / static_cast<float>(width);
            samples[i] = amp * taper * noise(rng);
        }
    }
    return samples;
}

inline std::vector<float> make_noise(double sample_rate, double seconds, float amp, std::uint32_t seed) {
    std::vector<float> samples(sample_count(sample_rate, seconds), 0.0f);
    std::mt19937 rng(seed);
    std::normal_distribution<float> noise(0.0f, 1.0f);
    for (float& sample : samples) {
        sample = std::max(-1.0f, std::min(1.0f, amp * noise(rng)));
    }
    return samples;
}

inline void add_in_place(std::vector<float>* dst, const std::vector<float>& src, float gain) {
    if (!dst) {
        return;
    }
    if (dst->size() < src.size()) {
        dst->resize(src.size(), 0.0f);
    }
    for (std::size_t i = 0; i < src.size(); ++i) {
        (*dst)[i] += src[i] * gain;
    }
}

// Bass, mid tone and clicks: enough structure for every separator.
inline AudioBuffer make_mix(double sample_rate, double seconds) {
    std::vector<float> mix = make_sine(sample_rate, 110.0, seconds, 0.3f);
    add_in_place(&mix, make_tremolo_sine(sample_rate, 880.0, 2.0, seconds, 0.25f), 1.0f);
    add_in_place(&mix, make_click_track(sample_rate, 120.0, seconds, 15.0, 0.4f, 7), 1.0f);
    return AudioBuffer(std::move(mix), sample_rate);
}

inline double energy(const std::vector<float>& samples) {
    double sum = 0.0;
    for (float sample : samples) {
        sum += static_cast<double>(sample) * sample;
    }
    return sum;
}

inline void write_pcm16_wav(const std::filesystem::path& path,
                            const std::vector<float>& samples,
                            std::uint32_t sample_rate) {
    std::ofstream out(path, std::ios::binary);
    if (!out) {
        return;
    }
    auto put16 = [&out](std::uint16_t value) {
        const char bytes[2] = {static_cast<char>(value & 0xFF), static_cast<char>(value >> 8)};
        out.write(bytes, 2);
    };
    auto put32 = [&out](std::uint32_t value) {
        for (int i = 0; i < 4; ++i) {
            const char byte = static_cast<char>((value >> (8 * i)) & 0xFF);
            out.write(&byte, 1);
        }
    };

    const std::uint32_t data_size = static_cast<std::uint32_t>(samples.size() * 2);
    out.write("RIFF", 4);
    put32(36 + data_size);
    out.write("WAVEfmt ", 8);
    put32(16);
    put16(1);
    put16(1);
    put32(sample_rate);
    put32(sample_rate * 2);
    put16(2);
    put16(16);
    out.write("data", 4);
    put32(data_size);
    for (float sample : samples) {
        const float clamped = std::max(-1.0f, std::min(1.0f, sample));
        put16(static_cast<std::uint16_t>(static_cast<std::int16_t>(std::lrint(clamped * 32767.0f))));
    }
}

} // namespace stemsep::tests::synthetic_audio
