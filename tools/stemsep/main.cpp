//
//  main.cpp
//  StemSep
//
//  Created by Till Toenshoff on 2026-10-12.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "audio/wav.h"
#include "pipeline/postprocess.h"
#include "stemsep/errors.h"
#include "stemsep/logging.hpp"
#include "stemsep/model_store.h"
#include "stemsep/orchestrator.h"
#include "stemsep/separation_model.h"
#include "stemsep/version.h"

#include <cstdlib>
#include <exception>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <map>
#include <memory>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include <cxxopts.hpp>

namespace {

std::vector<std::string> split_list(const std::string& value) {
    std::vector<std::string> items;
    std::stringstream stream(value);
    std::string item;
    while (std::getline(stream, item, ',')) {
        if (!item.empty()) {
            items.push_back(item);
        }
    }
    return items;
}

// Parses "name=level,name=level".
bool parse_levels(const std::string& value, std::map<std::string, float>* out) {
    for (const auto& item : split_list(value)) {
        const auto eq = item.find('=');
        if (eq == std::string::npos || eq == 0) {
            std::cerr << "Malformed mix level: " << item << std::endl;
            return false;
        }
        try {
            (*out)[item.substr(0, eq)] = std::stof(item.substr(eq + 1));
        } catch (const std::exception&) {
            std::cerr << "Malformed mix level: " << item << std::endl;
            return false;
        }
    }
    return true;
}

bool load_audio(const std::string& path, stemsep::AudioBuffer* out) {
    std::vector<float> samples;
    double sample_rate = 0.0;
    std::string error;
    if (!stemsep::detail::read_wav_mono(path, &samples, &sample_rate, &error)) {
        std::cerr << "Failed to read " << path << ": " << error << std::endl;
        return false;
    }
    *out = stemsep::AudioBuffer(std::move(samples), sample_rate);
    return true;
}

void apply_verbosity(const cxxopts::ParseResult& opts, stemsep::SeparationConfig* config) {
    config->verbose = opts.count("verbose") > 0;
    config->profile = opts.count("profile") > 0;
    stemsep::set_log_verbosity_from_config(*config);
}

int run_separate(int argc, const char* argv[]) {
    cxxopts::Options options("stemsep separate", "Separate a WAV file into stems.");
    options.positional_help("<input.wav>");
    options.show_positional_help();
    options.add_options()
        ("h,help",     "Print this help message")
        ("input",      "Input WAV file", cxxopts::value<std::string>())
        ("o,out",      "Output directory", cxxopts::value<std::string>()->default_value("stems"))
        ("s,stems",    "Comma separated stem names", cxxopts::value<std::string>()->default_value(""))
        ("q,quality",  "fast, balanced, high or auto",
                       cxxopts::value<std::string>()->default_value("auto"))
        ("m,method",   "Separator to try first", cxxopts::value<std::string>()->default_value(""))
        ("models",     "Directory of trained .ssm models", cxxopts::value<std::string>())
        ("gate",       "Apply the spectral noise gate")
        ("compress",   "Apply gentle peak compression to every stem")
        ("mix",        "Also write mix.wav, a remix of the stems")
        ("levels",     "Mix levels as name=level,... (default 1.0)",
                       cxxopts::value<std::string>()->default_value(""))
        ("v,verbose",  "Debug logging")
        ("profile",    "Stage timing")
    ;
    options.parse_positional({"input"});
    auto opts = options.parse(argc, argv);

    if (opts.count("help") || !opts.count("input")) {
        std::cerr << options.help();
        return opts.count("help") ? EXIT_SUCCESS : EXIT_FAILURE;
    }

    stemsep::SeparationConfig config;
    apply_verbosity(opts, &config);
    config.orchestrator.apply_gate = opts.count("gate") > 0;
    config.orchestrator.apply_compression = opts.count("compress") > 0;

    std::map<std::string, float> levels;
    if (!parse_levels(opts["levels"].as<std::string>(), &levels)) {
        return EXIT_FAILURE;
    }

    stemsep::SeparationRequest request;
    if (!stemsep::parse_quality_hint(opts["quality"].as<std::string>(), &request.quality)) {
        std::cerr << "Unknown quality hint: " << opts["quality"].as<std::string>() << std::endl;
        return EXIT_FAILURE;
    }
    request.method = opts["method"].as<std::string>();
    request.stems = split_list(opts["stems"].as<std::string>());
    if (!load_audio(opts["input"].as<std::string>(), &request.audio)) {
        return EXIT_FAILURE;
    }

    auto models = std::make_shared<stemsep::ModelStore>();
    if (opts.count("models")) {
        models->load_directory(opts["models"].as<std::string>());
    }

    const stemsep::SeparationOrchestrator orchestrator(config, models);
    const auto progress = [](int percent, const std::string& stage) {
        std::cerr << "[" << std::setw(3) << percent << "%] " << stage << std::endl;
    };

    stemsep::SeparationResult result;
    try {
        result = orchestrator.run(request, progress);
    } catch (const stemsep::ValidationError& err) {
        std::cerr << "Invalid input: " << err.what() << std::endl;
        return EXIT_FAILURE;
    }
    for (const auto& warning : result.warnings) {
        std::cerr << "warning: " << warning << std::endl;
    }
    if (!result.success) {
        std::cerr << "Separation " << stemsep::job_stage_name(result.status) << ": "
                  << result.error << std::endl;
        return EXIT_FAILURE;
    }

    const std::filesystem::path out_dir = opts["out"].as<std::string>();
    std::error_code ec;
    std::filesystem::create_directories(out_dir, ec);
    if (ec) {
        std::cerr << "Cannot create " << out_dir.string() << ": " << ec.message() << std::endl;
        return EXIT_FAILURE;
    }

    std::cout << "method: " << result.metadata.method_used << "\n";
    std::cout << std::fixed << std::setprecision(2);
    for (const auto& stem : result.stems) {
        const std::filesystem::path path = out_dir / (stem.name + ".wav");
        std::string error;
        if (!stemsep::detail::write_wav_mono_16(path.string(), stem.audio.samples(),
                                                stem.audio.sample_rate(), &error)) {
            std::cerr << "Failed to write " << path.string() << ": " << error << std::endl;
            return EXIT_FAILURE;
        }
        std::cout << "  " << std::left << std::setw(12) << stem.name << " score "
                  << stem.quality_score << "  [" << stem.method << "]  " << path.string() << "\n";
    }
    if (opts.count("mix")) {
        stemsep::StemMap stems;
        for (const auto& stem : result.stems) {
            stems.emplace(stem.name, stem.audio);
        }
        const stemsep::AudioBuffer mix = stemsep::detail::mix_stems(stems, levels);
        const std::filesystem::path path = out_dir / "mix.wav";
        std::string error;
        if (!stemsep::detail::write_wav_mono_16(path.string(), mix.samples(), mix.sample_rate(),
                                                &error)) {
            std::cerr << "Failed to write " << path.string() << ": " << error << std::endl;
            return EXIT_FAILURE;
        }
        std::cout << "  " << std::left << std::setw(12) << "mix" << path.string() << "\n";
    }
    std::cout << "processing: " << result.metadata.processing_time_seconds << " s\n";
    return EXIT_SUCCESS;
}

int run_train(int argc, const char* argv[]) {
    cxxopts::Options options("stemsep train", "Train a Markov model for one instrument.");
    options.positional_help("<instrument> <wav...>");
    options.show_positional_help();
    options.add_options()
        ("h,help",       "Print this help message")
        ("instrument",   "Instrument name", cxxopts::value<std::string>())
        ("inputs",       "Training WAV files", cxxopts::value<std::vector<std::string>>())
        ("o,out",        "Output model file", cxxopts::value<std::string>())
        ("order",        "Markov order", cxxopts::value<std::size_t>()->default_value("2"))
        ("states",       "Quantizer state count", cxxopts::value<std::size_t>()->default_value("16"))
        ("features",     "mfcc, spectral or chroma", cxxopts::value<std::string>()->default_value("mfcc"))
        ("v,verbose",    "Debug logging")
        ("profile",      "Stage timing")
    ;
    options.parse_positional({"instrument", "inputs"});
    auto opts = options.parse(argc, argv);

    if (opts.count("help") || !opts.count("instrument") || !opts.count("inputs")) {
        std::cerr << options.help();
        return opts.count("help") ? EXIT_SUCCESS : EXIT_FAILURE;
    }

    stemsep::SeparationConfig config;
    apply_verbosity(opts, &config);
    if (!stemsep::parse_feature_type(opts["features"].as<std::string>(), &config.features.type)) {
        std::cerr << "Unknown feature type: " << opts["features"].as<std::string>() << std::endl;
        return EXIT_FAILURE;
    }
    config.markov.order = opts["order"].as<std::size_t>();
    config.quantizer.n_states = opts["states"].as<std::size_t>();

    const std::string instrument = opts["instrument"].as<std::string>();
    const std::string out_path = opts.count("out") ? opts["out"].as<std::string>()
                                                   : instrument + ".ssm";

    std::vector<stemsep::AudioBuffer> corpus;
    for (const auto& path : opts["inputs"].as<std::vector<std::string>>()) {
        stemsep::AudioBuffer buffer;
        if (!load_audio(path, &buffer)) {
            return EXIT_FAILURE;
        }
        corpus.push_back(buffer);
    }

    try {
        stemsep::SeparationModel model(instrument, config.features, config.quantizer, config.markov);
        model.train(corpus);
        model.save(out_path);
        std::cout << "trained " << instrument << " on " << model.training_samples()
                  << " files -> " << out_path << "\n";
    } catch (const stemsep::Error& err) {
        std::cerr << "Training failed: " << err.what() << std::endl;
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}

int run_inspect(int argc, const char* argv[]) {
    cxxopts::Options options("stemsep inspect", "Print a trained model and optionally score a file.");
    options.positional_help("<model.ssm> [<input.wav>]");
    options.show_positional_help();
    options.add_options()
        ("h,help",   "Print this help message")
        ("model",    "Model file", cxxopts::value<std::string>())
        ("input",    "WAV file to score", cxxopts::value<std::string>())
        ("v,verbose", "Debug logging")
    ;
    options.parse_positional({"model", "input"});
    auto opts = options.parse(argc, argv);

    if (opts.count("help") || !opts.count("model")) {
        std::cerr << options.help();
        return opts.count("help") ? EXIT_SUCCESS : EXIT_FAILURE;
    }

    stemsep::SeparationConfig config;
    config.verbose = opts.count("verbose") > 0;
    stemsep::set_log_verbosity_from_config(config);

    try {
        const auto model = stemsep::SeparationModel::load(opts["model"].as<std::string>());
        const auto& features = model.feature_config();
        std::cout << "instrument:       " << model.instrument() << "\n"
                  << "features:         " << stemsep::feature_type_name(features.type) << " (window "
                  << features.window_length << ", hop " << features.hop_length << ")\n"
                  << "order:            " << model.transitions().order() << "\n"
                  << "states:           " << model.transitions().n_states() << "\n"
                  << "training samples: " << model.training_samples() << "\n";

        if (opts.count("input")) {
            stemsep::AudioBuffer buffer;
            if (!load_audio(opts["input"].as<std::string>(), &buffer)) {
                return EXIT_FAILURE;
            }
            const auto analysis = model.analyze_patterns(buffer);
            std::cout << std::fixed << std::setprecision(4)
                      << "score:            " << model.score(buffer) << "\n"
                      << "entropy:          " << analysis.entropy << "\n"
                      << "complexity:       " << analysis.complexity << "\n"
                      << "predictability:   " << analysis.predictability << "\n"
                      << "transition entr.: " << analysis.transition_entropy << "\n"
                      << "unique states:    " << analysis.unique_states << "\n"
                      << "mean duration:    " << analysis.average_state_duration << " frames\n";
        }
    } catch (const stemsep::Error& err) {
        std::cerr << "Inspect failed: " << err.what() << std::endl;
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}

void print_usage() {
    std::cerr << "stemsep " << stemsep::version_string() << "\n"
              << "usage: stemsep <command> [options]\n\n"
              << "commands:\n"
              << "  separate   separate a WAV file into stems\n"
              << "  train      train a Markov model for an instrument\n"
              << "  inspect    print a trained model, optionally scoring a file\n";
}

int run(int argc, const char* argv[]) {
    if (argc < 2) {
        print_usage();
        return EXIT_FAILURE;
    }
    const std::string command = argv[1];
    if (command == "--version") {
        std::cout << stemsep::version_string() << "\n";
        return EXIT_SUCCESS;
    }
    if (command == "-h" || command == "--help") {
        print_usage();
        return EXIT_SUCCESS;
    }

    // Subcommands parse their own argv with the command as program name.
    if (command == "separate") {
        return run_separate(argc - 1, argv + 1);
    }
    if (command == "train") {
        return run_train(argc - 1, argv + 1);
    }
    if (command == "inspect") {
        return run_inspect(argc - 1, argv + 1);
    }
    std::cerr << "Unknown command: " << command << "\n";
    print_usage();
    return EXIT_FAILURE;
}

} // namespace

int main(int argc, const char* argv[]) {
    try {
        return run(argc, argv);
    } catch (const cxxopts::exceptions::exception& err) {
        std::cerr << err.what() << std::endl;
        return EXIT_FAILURE;
    } catch (const std::exception& err) {
        std::cerr << "stemsep: " << err.what() << std::endl;
        return EXIT_FAILURE;
    }
}
