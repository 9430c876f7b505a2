//
//  postprocess.cpp
//  StemSep
//
//  Created by Till Toenshoff on 2026-10-10.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "pipeline/postprocess.h"

#include "audio/dsp.h"
#include "stemsep/errors.h"
#include "stemsep/logging.hpp"
#include "stemsep/spectrogram.h"

#include <algorithm>
#include <cmath>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace stemsep::detail {

ComponentProfile profile_component(const AudioBuffer& audio, const StftConfig& stft) {
    ComponentProfile profile;
    if (audio.empty()) {
        return profile;
    }

    const std::vector<float>& samples = audio.samples();
    std::size_t crossings = 0;
    for (std::size_t i = 1; i < samples.size(); ++i) {
        if ((samples[i - 1] >= 0.0f) != (samples[i] >= 0.0f)) {
            ++crossings;
        }
    }
    profile.zero_crossing_rate =
        samples.size() > 1 ? static_cast<double>(crossings) / static_cast<double>(samples.size() - 1)
                           : 0.0;

    const Spectrogram spec = compute_stft(audio, stft);
    std::vector<double> average(spec.bins, 0.0);
    for (std::size_t f = 0; f < spec.frames; ++f) {
        for (std::size_t b = 0; b < spec.bins; ++b) {
            average[b] += std::abs(spec.values[f * spec.bins + b]);
        }
    }
    double weighted = 0.0;
    double total = 0.0;
    for (std::size_t b = 0; b < spec.bins; ++b) {
        weighted += spec.bin_frequency(b) * average[b];
        total += average[b];
    }
    profile.centroid_hz = total > 0.0 ? weighted / total : 0.0;
    return profile;
}

std::string classify_component(const ComponentProfile& profile) {
    if (profile.centroid_hz > 3000.0 && profile.zero_crossing_rate > 0.1) {
        return "drums";
    }
    if (profile.centroid_hz > 1000.0) {
        return "vocals";
    }
    if (profile.centroid_hz > 500.0) {
        return "other";
    }
    return "bass";
}

StemMap relabel_components(const StemMap& stems, const StftConfig& stft) {
    struct Entry {
        std::string name;
        ComponentProfile profile;
    };
    std::vector<Entry> entries;
    entries.reserve(stems.size());
    for (const auto& stem : stems) {
        entries.push_back({stem.first, profile_component(stem.second, stft)});
    }
    std::stable_sort(entries.begin(), entries.end(), [](const Entry& a, const Entry& b) {
        return a.profile.centroid_hz > b.profile.centroid_hz;
    });

    std::set<std::string> taken;
    StemMap relabeled;
    for (const auto& entry : entries) {
        std::string label = classify_component(entry.profile);
        if (taken.count(label)) {
            label.clear();
            for (const auto& candidate : canonical_stem_names()) {
                if (!taken.count(candidate)) {
                    label = candidate;
                    break;
                }
            }
        }
        if (label.empty()) {
            label = entry.name;
        }
        for (std::size_t suffix = 2; relabeled.count(label); ++suffix) {
            label = entry.name + "_" + std::to_string(suffix);
        }
        taken.insert(label);
        STEMSEP_LOG_DEBUG("relabel: " << entry.name << " -> " << label << " (centroid "
                                      << entry.profile.centroid_hz << " Hz, zcr "
                                      << entry.profile.zero_crossing_rate << ")");
        relabeled.emplace(label, stems.at(entry.name));
    }
    return relabeled;
}

AudioBuffer normalize_peak(const AudioBuffer& audio, float headroom) {
    const float peak = audio.peak();
    if (!(peak > 0.0f)) {
        return audio;
    }
    const float gain = headroom / peak;
    std::vector<float> scaled(audio.samples());
    for (float& sample : scaled) {
        sample *= gain;
    }
    return AudioBuffer(std::move(scaled), audio.sample_rate());
}

AudioBuffer compress_peaks(const AudioBuffer& audio, float threshold, float ratio) {
    if (!(threshold > 0.0f) || !(ratio >= 1.0f)) {
        throw ValidationError("Compression needs a positive threshold and a ratio of at least 1.");
    }
    std::vector<float> compressed(audio.samples());
    for (float& sample : compressed) {
        const float magnitude = std::fabs(sample);
        if (magnitude > threshold) {
            sample = std::copysign(threshold + (magnitude - threshold) / ratio, sample);
        }
    }
    return AudioBuffer(std::move(compressed), audio.sample_rate());
}

AudioBuffer mix_stems(const StemMap& stems, const std::map<std::string, float>& levels) {
    if (stems.empty()) {
        throw ValidationError("No stems to mix.");
    }
    for (const auto& level : levels) {
        if (!std::isfinite(level.second) || level.second < 0.0f) {
            throw ValidationError("Invalid mix level for '" + level.first + "'.");
        }
    }

    const double sample_rate = stems.begin()->second.sample_rate();
    std::size_t length = 0;
    for (const auto& entry : stems) {
        if (entry.second.sample_rate() != sample_rate) {
            throw ValidationError("Cannot mix stems with different sample rates.");
        }
        length = std::max(length, entry.second.size());
    }

    std::vector<float> mix(length, 0.0f);
    for (const auto& entry : stems) {
        const auto level = levels.find(entry.first);
        const float gain = level == levels.end() ? 1.0f : level->second;
        const std::vector<float>& samples = entry.second.samples();
        for (std::size_t i = 0; i < samples.size(); ++i) {
            mix[i] += samples[i] * gain;
        }
    }

    float peak = 0.0f;
    for (float sample : mix) {
        peak = std::max(peak, std::fabs(sample));
    }
    if (peak > 1.0f) {
        for (float& sample : mix) {
            sample /= peak;
        }
    }
    STEMSEP_LOG_DEBUG("Mixed " << stems.size() << " stems, " << length << " samples, peak "
                               << peak);
    return AudioBuffer(std::move(mix), sample_rate);
}

AudioBuffer spectral_gate(const AudioBuffer& audio, const StftConfig& stft, float floor_db) {
    if (audio.empty()) {
        return audio;
    }
    const Spectrogram spec = compute_stft(audio, stft);
    const std::vector<float> magnitude = spec.magnitude();
    const float peak = magnitude.empty() ? 0.0f : *std::max_element(magnitude.begin(), magnitude.end());
    if (!(peak > 0.0f)) {
        return audio;
    }
    const float absolute_floor = peak * std::pow(10.0f, floor_db / 20.0f);

    TimeFrequencyMask mask;
    mask.bins = spec.bins;
    mask.frames = spec.frames;
    mask.values.assign(spec.bins * spec.frames, 1.0f);

    std::vector<float> column(spec.frames, 0.0f);
    for (std::size_t b = 0; b < spec.bins; ++b) {
        for (std::size_t f = 0; f < spec.frames; ++f) {
            column[f] = magnitude[f * spec.bins + b];
        }
        const float threshold = std::max(percentile(column, 10.0f), absolute_floor);
        if (!(threshold > 0.0f)) {
            continue;
        }
        for (std::size_t f = 0; f < spec.frames; ++f) {
            const float value = column[f];
            if (value < threshold) {
                const float ratio = value / threshold;
                mask.values[f * spec.bins + b] = ratio * ratio;
            }
        }
    }
    return apply_mask(spec, mask);
}

} // namespace stemsep::detail
