//
//  config.h
//  StemSep
//
//  Created by Till Toenshoff on 2026-10-02.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace stemsep {

enum class FeatureType : std::uint8_t {
    Mfcc = 0,
    Spectral = 1,
    Chroma = 2,
};

const char* feature_type_name(FeatureType type);

// Returns false for unknown names; `out` is left untouched in that case.
bool parse_feature_type(const std::string& name, FeatureType* out);

struct FeatureConfig {
    FeatureType type = FeatureType::Mfcc;
    std::size_t window_length = 2048;
    std::size_t hop_length = 512;
    std::size_t mfcc_count = 13;
    std::size_t mel_bands = 40;
    // Regression width for MFCC deltas (odd, >= 3).
    std::size_t delta_width = 9;
    float rolloff_percent = 0.85f;
};

struct StftConfig {
    std::size_t n_fft = 2048;
    std::size_t hop_length = 512;
};

struct QuantizerConfig {
    std::size_t n_states = 16;
    std::size_t max_iterations = 300;
    double tolerance = 1e-4;
    std::uint32_t seed = 42;
};

struct MarkovConfig {
    std::size_t order = 2;
    float mask_threshold = 0.5f;
    bool binarize_mask = true;
    std::size_t median_kernel = 5;
};

struct SeparatorConfig {
    std::size_t components = 4;
    std::size_t fast_components = 2;

    std::size_t nmf_max_iterations = 200;
    double nmf_tolerance = 1e-4;
    std::uint32_t nmf_seed = 42;

    std::size_t ica_max_iterations = 400;
    double ica_tolerance = 1e-4;
    std::uint32_t ica_seed = 42;
    double ica_channel_delay_seconds = 0.01;

    std::size_t hpss_harmonic_kernel = 17;
    std::size_t hpss_percussive_kernel = 17;
    float hpss_mask_power = 2.0f;
    float vocal_low_hz = 200.0f;
    float vocal_high_hz = 4000.0f;
    float bass_high_hz = 250.0f;
};

struct ExternalSeparatorConfig {
    std::string command = "demucs";
    // Placeholders: {input}, {output_dir}, {model}.
    std::vector<std::string> args = {"-n", "{model}", "-o", "{output_dir}", "{input}"};
    std::string model = "htdemucs";
    double timeout_seconds = 900.0;
};

struct TorchSeparatorConfig {
    std::string model_path;
    std::string device = "cpu";
    std::size_t model_sample_rate = 44100;
    std::vector<std::string> source_names = {"drums", "bass", "other", "vocals"};
};

struct OrchestratorConfig {
    double neural_min_duration_seconds = 30.0;
    float high_dynamic_range_db = 24.0f;
    float headroom = 0.95f;
    bool apply_gate = false;
    // Gate floor relative to each stem's peak, in dB.
    float gate_floor_db = -60.0f;
    bool apply_compression = false;
    float compression_threshold = 0.5f;
    float compression_ratio = 4.0f;
    double max_duration_seconds = 600.0;
    bool relabel_components = true;
    bool normalize_stems = true;
};

struct SeparationConfig {
    FeatureConfig features;
    StftConfig stft;
    QuantizerConfig quantizer;
    MarkovConfig markov;
    SeparatorConfig separators;
    ExternalSeparatorConfig external;
    TorchSeparatorConfig torch;
    OrchestratorConfig orchestrator;
    bool verbose = false;
    bool profile = false;
};

} // namespace stemsep
