//
//  external_separator_test.cpp
//  StemSep
//
//  Created by Till Toenshoff on 2026-10-15.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "audio/wav.h"
#include "runtime/subprocess.h"
#include "stemsep/separator.h"
#include "synthetic_audio_test_utils.h"

#include <chrono>
#include <cmath>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

namespace {

using namespace stemsep::tests::synthetic_audio;

constexpr double kSampleRate = 22050.0;

std::filesystem::path temp_path(const std::string& name) {
    return std::filesystem::temp_directory_path() /
           ("stemsep_external_test_" +
            std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()) + "_" +
            name);
}

bool test_wav_round_trip() {
    const auto path = temp_path("tone.wav");
    const std::vector<float> tone = make_sine(kSampleRate, 440.0, 0.25, 0.5f);
    std::string error;
    if (!stemsep::detail::write_wav_mono_16(path.string(), tone, kSampleRate, &error)) {
        std::cerr << "External separator test failed: write_wav_mono_16: " << error << "\n";
        return false;
    }
    std::vector<float> samples;
    double rate = 0.0;
    const bool ok = stemsep::detail::read_wav_mono(path.string(), &samples, &rate, &error);
    std::filesystem::remove(path);
    if (!ok || rate != kSampleRate || samples.size() != tone.size()) {
        std::cerr << "External separator test failed: read_wav_mono: " << error << "\n";
        return false;
    }
    for (std::size_t i = 0; i < tone.size(); ++i) {
        if (std::fabs(samples[i] - tone[i]) > 1e-3f) {
            std::cerr << "External separator test failed: sample " << i << " drifted.\n";
            return false;
        }
    }

    const auto other = temp_path("helper.wav");
    write_pcm16_wav(other, tone, static_cast<std::uint32_t>(kSampleRate));
    const bool helper_ok = stemsep::detail::read_wav_mono(other.string(), &samples, &rate, &error);
    std::filesystem::remove(other);
    if (!helper_ok || samples.size() != tone.size()) {
        std::cerr << "External separator test failed: helper WAV unreadable: " << error << "\n";
        return false;
    }

    if (stemsep::detail::read_wav_mono(temp_path("missing.wav").string(), &samples, &rate,
                                       &error)) {
        std::cerr << "External separator test failed: missing WAV accepted.\n";
        return false;
    }
    return true;
}

bool test_streaming_wav_size() {
    const auto path = temp_path("streaming.wav");
    const std::vector<float> tone = make_sine(kSampleRate, 330.0, 0.1, 0.5f);
    write_pcm16_wav(path, tone, static_cast<std::uint32_t>(kSampleRate));
    {
        // Streaming writers leave both RIFF and data sizes unset.
        std::fstream patch(path, std::ios::in | std::ios::out | std::ios::binary);
        const char unknown[4] = {'\xFF', '\xFF', '\xFF', '\xFF'};
        patch.seekp(4);
        patch.write(unknown, 4);
        patch.seekp(40);
        patch.write(unknown, 4);
        if (!patch.good()) {
            std::cerr << "External separator test failed: could not patch WAV header.\n";
            return false;
        }
    }

    std::vector<float> samples;
    double rate = 0.0;
    std::string error;
    const bool ok = stemsep::detail::read_wav_mono(path.string(), &samples, &rate, &error);
    std::filesystem::remove(path);
    if (!ok || samples.size() != tone.size() || rate != kSampleRate) {
        std::cerr << "External separator test failed: streaming WAV read " << samples.size()
                  << " of " << tone.size() << " samples: " << error << "\n";
        return false;
    }
    return true;
}

bool test_subprocess_exit_codes() {
    std::string shell;
    if (!stemsep::detail::resolve_executable("sh", &shell)) {
        std::cerr << "External separator test failed: sh not found on PATH.\n";
        return false;
    }
    if (stemsep::detail::resolve_executable("stemsep-no-such-tool", nullptr)) {
        std::cerr << "External separator test failed: bogus command resolved.\n";
        return false;
    }

    stemsep::detail::SubprocessResult result;
    std::string error;
    if (!stemsep::detail::run_subprocess({shell, "-c", "exit 3"}, 10.0, "", &result, &error) ||
        result.exit_code != 3 || result.timed_out) {
        std::cerr << "External separator test failed: expected exit code 3, got "
                  << result.exit_code << " " << error << "\n";
        return false;
    }
    return true;
}

bool test_tool_stems_are_read_back() {
    stemsep::SeparationConfig config;
    config.external.command = "/bin/sh";
    config.external.args = {
        "-c",
        "mkdir -p \"$1/$3/mix\" && cp \"$2\" \"$1/$3/mix/vocals.wav\" && "
        "cp \"$2\" \"$1/$3/mix/drums.wav\"",
        "stemsep-fake-tool",
        "{output_dir}",
        "{input}",
        "{model}",
    };
    config.external.timeout_seconds = 30.0;

    const stemsep::AudioBuffer mix(make_sine(kSampleRate, 330.0, 0.5, 0.4f), kSampleRate);
    const auto separator = stemsep::make_external_separator();
    if (!separator->is_available(config)) {
        std::cerr << "External separator test failed: /bin/sh reported unavailable.\n";
        return false;
    }
    const auto outcome = separator->try_separate(mix, 4, config);
    if (!outcome.ok() || outcome.stems.size() != 2 || !outcome.stems.count("vocals") ||
        !outcome.stems.count("drums")) {
        std::cerr << "External separator test failed: " << outcome.message << "\n";
        return false;
    }
    const auto& vocals = outcome.stems.at("vocals");
    if (vocals.size() != mix.size() || std::fabs(vocals.samples()[100] - mix.samples()[100]) > 1e-3f) {
        std::cerr << "External separator test failed: stem does not match the input.\n";
        return false;
    }
    return true;
}

bool test_timeout_kills_tool() {
    stemsep::SeparationConfig config;
    config.external.command = "/bin/sh";
    config.external.args = {"-c", "sleep 30"};
    config.external.timeout_seconds = 0.5;

    const stemsep::AudioBuffer mix(make_sine(kSampleRate, 330.0, 0.2, 0.4f), kSampleRate);
    const auto start = std::chrono::steady_clock::now();
    const auto outcome = stemsep::make_external_separator()->try_separate(mix, 4, config);
    const double elapsed =
        std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();

    if (outcome.status != stemsep::SeparatorOutcome::Status::Failed ||
        outcome.message.find("timed out") == std::string::npos) {
        std::cerr << "External separator test failed: expected timeout, got '" << outcome.message
                  << "'.\n";
        return false;
    }
    if (elapsed > 10.0) {
        std::cerr << "External separator test failed: tool was not killed (" << elapsed
                  << " s).\n";
        return false;
    }
    return true;
}

bool test_failing_tool_is_reported() {
    stemsep::SeparationConfig config;
    config.external.command = "/bin/sh";
    config.external.args = {"-c", "exit 2"};
    const stemsep::AudioBuffer mix(make_sine(kSampleRate, 330.0, 0.2, 0.4f), kSampleRate);
    const auto outcome = stemsep::make_external_separator()->try_separate(mix, 4, config);
    if (outcome.status != stemsep::SeparatorOutcome::Status::Failed) {
        std::cerr << "External separator test failed: non-zero exit accepted.\n";
        return false;
    }
    return true;
}

} // namespace

int main() {
    if (!test_wav_round_trip()) {
        return 1;
    }
    if (!test_streaming_wav_size()) {
        return 1;
    }
    if (!test_subprocess_exit_codes()) {
        return 1;
    }
    if (!test_tool_stems_are_read_back()) {
        return 1;
    }
    if (!test_timeout_kills_tool()) {
        return 1;
    }
    if (!test_failing_tool_is_reported()) {
        return 1;
    }

    std::cout << "External separator test passed.\n";
    return 0;
}
