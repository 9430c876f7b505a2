//
//  model_store_test.cpp
//  StemSep
//
//  Created by Till Toenshoff on 2026-10-14.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "stemsep/model_store.h"
#include "synthetic_audio_test_utils.h"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <thread>
#include <vector>

namespace {

using namespace stemsep::tests::synthetic_audio;

constexpr double kSampleRate = 22050.0;

std::shared_ptr<const stemsep::SeparationModel> make_model(const std::string& instrument,
                                                           double carrier_hz) {
    stemsep::QuantizerConfig quantizer;
    quantizer.n_states = 4;
    stemsep::MarkovConfig markov;
    markov.order = 1;
    auto model = std::make_shared<stemsep::SeparationModel>(instrument, stemsep::FeatureConfig{},
                                                            quantizer, markov);
    model->train({stemsep::AudioBuffer(make_tremolo_sine(kSampleRate, carrier_hz, 2.0, 1.5, 0.5f),
                                       kSampleRate)});
    return model;
}

bool test_put_find_remove() {
    stemsep::ModelStore store;
    store.put("bass", make_model("bass", 80.0));
    store.put("vocals", make_model("vocals", 440.0));
    if (store.size() != 2 || !store.contains("bass") || store.find("drums") != nullptr) {
        std::cerr << "Model store test failed: unexpected contents.\n";
        return false;
    }
    if (store.names() != std::vector<std::string>{"bass", "vocals"}) {
        std::cerr << "Model store test failed: names are not sorted.\n";
        return false;
    }
    const auto held = store.find("bass");
    if (!store.remove("bass") || store.remove("bass") || !held || !held->is_trained()) {
        std::cerr << "Model store test failed: remove did not behave.\n";
        return false;
    }
    return true;
}

bool test_load_directory_skips_corrupt_files() {
    const auto dir = std::filesystem::temp_directory_path() /
                     ("stemsep_store_test_" +
                      std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()));
    std::filesystem::create_directories(dir);
    make_model("vocals", 440.0)->save((dir / "vocals.ssm").string());
    make_model("bass", 80.0)->save((dir / "b.ssm").string());
    {
        std::ofstream out(dir / "broken.ssm", std::ios::binary);
        out << "not a model";
    }
    {
        std::ofstream out(dir / "notes.txt");
        out << "ignored";
    }

    stemsep::ModelStore store;
    const std::size_t loaded = store.load_directory(dir.string());
    std::filesystem::remove_all(dir);

    // Models are keyed by the instrument stored in the file, not the file name.
    if (loaded != 2 || !store.contains("vocals") || !store.contains("bass") || store.size() != 2) {
        std::cerr << "Model store test failed: loaded " << loaded << " models.\n";
        return false;
    }
    return true;
}

bool test_concurrent_readers() {
    auto store = std::make_shared<stemsep::ModelStore>();
    store->put("vocals", make_model("vocals", 440.0));
    const stemsep::AudioBuffer input(make_tremolo_sine(kSampleRate, 440.0, 2.0, 0.5, 0.5f),
                                      kSampleRate);
    const double expected = store->find("vocals")->score(input);

    std::atomic<int> mismatches{0};
    std::vector<std::thread> readers;
    for (int t = 0; t < 4; ++t) {
        readers.emplace_back([&]() {
            for (int i = 0; i < 5; ++i) {
                const auto model = store->find("vocals");
                if (!model || model->score(input) != expected) {
                    ++mismatches;
                }
                store->contains("bass");
                store->names();
            }
        });
    }
    // A writer replacing an unrelated entry must not disturb readers.
    store->put("bass", make_model("bass", 80.0));
    for (auto& reader : readers) {
        reader.join();
    }
    if (mismatches.load() != 0) {
        std::cerr << "Model store test failed: " << mismatches.load()
                  << " inconsistent concurrent reads.\n";
        return false;
    }
    return true;
}

} // namespace

int main() {
    if (!test_put_find_remove()) {
        return 1;
    }
    if (!test_load_directory_skips_corrupt_files()) {
        return 1;
    }
    if (!test_concurrent_readers()) {
        return 1;
    }

    std::cout << "Model store test passed.\n";
    return 0;
}
