//
//  external.cpp
//  StemSep
//
//  Created by Till Toenshoff on 2026-10-08.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "audio/dsp.h"
#include "audio/wav.h"
#include "runtime/subprocess.h"
#include "stemsep/errors.h"
#include "stemsep/logging.hpp"
#include "stemsep/separator.h"

#include <chrono>
#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace stemsep {
namespace {

namespace fs = std::filesystem;

// Stem names written by the tool, in its output order.
const std::vector<std::string>& external_stem_names() {
    static const std::vector<std::string> names = {"drums", "bass", "other", "vocals"};
    return names;
}

std::string substitute(std::string value, const std::string& token, const std::string& replacement) {
    std::size_t pos = 0;
    while ((pos = value.find(token, pos)) != std::string::npos) {
        value.replace(pos, token.size(), replacement);
        pos += replacement.size();
    }
    return value;
}

// Removes the scratch directory on every exit path.
class ScratchDirectory {
public:
    explicit ScratchDirectory(fs::path path) : path_(std::move(path)) {}
    ~ScratchDirectory() {
        std::error_code ec;
        fs::remove_all(path_, ec);
        if (ec) {
            STEMSEP_LOG_WARN("demucs_external: failed to remove " << path_.string() << ": "
                                                                  << ec.message());
        }
    }

    ScratchDirectory(const ScratchDirectory&) = delete;
    ScratchDirectory& operator=(const ScratchDirectory&) = delete;

    const fs::path& path() const { return path_; }

private:
    fs::path path_;
};

std::map<std::string, fs::path> find_stem_files(const fs::path& root) {
    std::map<std::string, fs::path> found;
    std::error_code ec;
    for (fs::recursive_directory_iterator it(root, ec), end; !ec && it != end; it.increment(ec)) {
        if (!it->is_regular_file(ec) || it->path().extension() != ".wav") {
            continue;
        }
        const std::string stem = it->path().stem().string();
        for (const auto& name : external_stem_names()) {
            if (stem == name && found.find(name) == found.end()) {
                found[name] = it->path();
            }
        }
    }
    return found;
}

AudioBuffer conform(std::vector<float> samples, double rate, const AudioBuffer& reference) {
    if (rate != reference.sample_rate()) {
        samples = detail::resample_linear_mono(samples, rate, reference.sample_rate());
    }
    samples.resize(reference.size(), 0.0f);
    return AudioBuffer(std::move(samples), reference.sample_rate());
}

class ExternalSeparator final : public Separator {
public:
    const SeparatorTraits& traits() const override {
        static const SeparatorTraits traits{"demucs_external", true, true, true, 6};
        return traits;
    }

    bool is_available(const SeparationConfig& config) const override {
        return detail::resolve_executable(config.external.command, nullptr);
    }

    StemMap separate(const AudioBuffer& buffer,
                     std::size_t,
                     const SeparationConfig& config) const override {
        const ExternalSeparatorConfig& options = config.external;
        std::string executable;
        if (!detail::resolve_executable(options.command, &executable)) {
            throw AlgorithmUnavailable("demucs_external: '" + options.command +
                                       "' not found.");
        }

        std::error_code ec;
        const fs::path scratch_path =
            fs::temp_directory_path(ec) /
            ("stemsep_" +
             std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()));
        if (ec || !fs::create_directories(scratch_path / "out", ec)) {
            throw AlgorithmFailure("demucs_external: cannot create scratch directory.");
        }
        const ScratchDirectory scratch(scratch_path);
        const fs::path input_path = scratch.path() / "mix.wav";
        const fs::path output_dir = scratch.path() / "out";
        const fs::path log_path = scratch.path() / "tool.log";

        std::string wav_error;
        if (!detail::write_wav_mono_16(input_path.string(), buffer.samples(),
                                       buffer.sample_rate(), &wav_error)) {
            throw AlgorithmFailure("demucs_external: " + wav_error);
        }

        std::vector<std::string> argv = {executable};
        for (const auto& arg : options.args) {
            std::string value = substitute(arg, "{input}", input_path.string());
            value = substitute(value, "{output_dir}", output_dir.string());
            value = substitute(value, "{model}", options.model);
            argv.push_back(value);
        }

        STEMSEP_LOG_INFO("demucs_external: running " << executable << " (timeout "
                                                      << options.timeout_seconds << " s)");
        detail::SubprocessResult result;
        std::string run_error;
        if (!detail::run_subprocess(argv, options.timeout_seconds, log_path.string(), &result,
                                    &run_error)) {
            throw AlgorithmFailure("demucs_external: " + run_error);
        }
        if (result.timed_out) {
            throw AlgorithmFailure("demucs_external: timed out after " +
                                   std::to_string(options.timeout_seconds) + " s.");
        }
        if (result.exit_code != 0) {
            throw AlgorithmFailure("demucs_external: tool exited with code " +
                                   std::to_string(result.exit_code) + ".");
        }

        const auto files = find_stem_files(output_dir);
        if (files.empty()) {
            throw AlgorithmFailure("demucs_external: tool produced no stems.");
        }

        StemMap stems;
        for (const auto& entry : files) {
            std::vector<float> samples;
            double rate = 0.0;
            std::string read_error;
            if (!detail::read_wav_mono(entry.second.string(), &samples, &rate, &read_error)) {
                throw AlgorithmFailure("demucs_external: " + entry.first + ": " + read_error);
            }
            stems.emplace(entry.first, conform(std::move(samples), rate, buffer));
        }

        STEMSEP_LOG_INFO("demucs_external: " << stems.size() << " stems in "
                                             << result.elapsed_seconds << " s");
        return stems;
    }
};

} // namespace

std::unique_ptr<Separator> make_external_separator() {
    return std::make_unique<ExternalSeparator>();
}

} // namespace stemsep
