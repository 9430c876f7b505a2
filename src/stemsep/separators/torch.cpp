//
//  torch.cpp
//  StemSep
//
//  Created by Till Toenshoff on 2026-10-08.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "audio/dsp.h"
#include "stemsep/errors.h"
#include "stemsep/logging.hpp"
#include "stemsep/separator.h"

#include <chrono>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include <c10/core/InferenceMode.h>
#include <torch/cuda.h>
#include <torch/script.h>

namespace stemsep {
namespace {

std::string first_line(const std::string& message) {
    const std::size_t newline = message.find('\n');
    return newline == std::string::npos ? message : message.substr(0, newline);
}

torch::Device resolve_device(const std::string& name) {
    if (name == "cuda" && torch::cuda::is_available()) {
        return torch::kCUDA;
    }
    if (name != "cpu") {
        STEMSEP_LOG_WARN("torch: device '" << name << "' unavailable, using cpu.");
    }
    return torch::kCPU;
}

// Accepts `[sources, samples]`, `[sources, channels, samples]` or a leading
// batch dimension of one. Channels are averaged.
torch::Tensor to_source_matrix(torch::Tensor output) {
    if (output.dim() == 4) {
        output = output.squeeze(0);
    }
    if (output.dim() == 3) {
        output = output.mean(1);
    }
    if (output.dim() != 2) {
        throw AlgorithmFailure("torch: unexpected output rank " + std::to_string(output.dim()) +
                               ".");
    }
    return output.to(torch::kCPU).to(torch::kFloat32).contiguous();
}

class TorchSeparator final : public Separator {
public:
    const SeparatorTraits& traits() const override {
        static const SeparatorTraits traits{"torch", true, true, true, 5};
        return traits;
    }

    bool is_available(const SeparationConfig& config) const override {
        return !config.torch.model_path.empty() &&
               std::filesystem::is_regular_file(config.torch.model_path);
    }

    StemMap separate(const AudioBuffer& buffer,
                     std::size_t,
                     const SeparationConfig& config) const override {
        const TorchSeparatorConfig& options = config.torch;
        if (!is_available(config)) {
            throw AlgorithmUnavailable("torch: no TorchScript model at '" + options.model_path +
                                       "'.");
        }

        const double model_rate = static_cast<double>(options.model_sample_rate);
        std::vector<float> input = buffer.sample_rate() == model_rate
                                       ? buffer.samples()
                                       : detail::resample_linear_mono(buffer.samples(),
                                                                      buffer.sample_rate(),
                                                                      model_rate);

        torch::Tensor sources;
        try {
            std::lock_guard<std::mutex> lock(mutex_);
            ensure_module(options);

            c10::InferenceMode inference_guard(true);
            const auto start = std::chrono::steady_clock::now();
            const auto length = static_cast<long long>(input.size());
            // Mono is presented to the model as identical stereo channels.
            torch::Tensor mono = torch::from_blob(input.data(), {1, 1, length}, torch::kFloat32);
            torch::Tensor stereo = mono.expand({1, 2, length}).contiguous().to(device_);

            std::vector<torch::IValue> inputs;
            inputs.emplace_back(stereo);
            torch::IValue output = module_.forward(inputs);
            if (output.isTuple()) {
                output = output.toTuple()->elements().at(0);
            }
            if (!output.isTensor()) {
                throw AlgorithmFailure("torch: unexpected output signature.");
            }
            sources = to_source_matrix(output.toTensor());
            const auto end = std::chrono::steady_clock::now();
            const double elapsed_ms = std::chrono::duration<double, std::milli>(end - start).count();
            STEMSEP_LOG_INFO("torch: forward " << elapsed_ms << " ms on " << device_.str());
        } catch (const c10::Error& err) {
            throw AlgorithmFailure("torch: " + first_line(err.what()));
        }

        const auto count = static_cast<std::size_t>(sources.size(0));
        if (count != options.source_names.size()) {
            STEMSEP_LOG_WARN("torch: model produced " << count << " sources, "
                                                      << options.source_names.size()
                                                      << " names configured.");
        }

        StemMap stems;
        const auto samples = static_cast<std::size_t>(sources.size(1));
        const float* data = sources.data_ptr<float>();
        for (std::size_t s = 0; s < count; ++s) {
            std::vector<float> stem(data + s * samples, data + (s + 1) * samples);
            if (model_rate != buffer.sample_rate()) {
                stem = detail::resample_linear_mono(stem, model_rate, buffer.sample_rate());
            }
            stem.resize(buffer.size(), 0.0f);
            const std::string name = s < options.source_names.size() ? options.source_names[s]
                                                                     : positional_stem_name(s);
            stems.emplace(name, AudioBuffer(std::move(stem), buffer.sample_rate()));
        }
        return stems;
    }

private:
    void ensure_module(const TorchSeparatorConfig& options) const {
        if (loaded_path_ == options.model_path) {
            return;
        }
        device_ = resolve_device(options.device);
        module_ = torch::jit::load(options.model_path, torch::kCPU);
        module_.to(torch::kFloat32);
        if (device_.type() != torch::kCPU) {
            module_.to(device_);
        }
        module_.eval();
        loaded_path_ = options.model_path;
        STEMSEP_LOG_DEBUG("torch: loaded " << loaded_path_ << " device=" << device_.str());
    }

    mutable std::mutex mutex_;
    mutable torch::jit::script::Module module_;
    mutable torch::Device device_ = torch::kCPU;
    mutable std::string loaded_path_;
};

} // namespace

std::unique_ptr<Separator> make_torch_separator() {
    return std::make_unique<TorchSeparator>();
}

} // namespace stemsep
