//
//  selection.cpp
//  StemSep
//
//  Created by Till Toenshoff on 2026-10-10.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "pipeline/selection.h"

#include "audio/dsp.h"
#include "stemsep/logging.hpp"

#include <algorithm>
#include <cmath>
#include <set>

namespace stemsep::detail {
namespace {

struct RankedName {
    std::string name;
    int speed_rank = 0;
};

std::vector<RankedName> available_general_purpose(const SeparatorBank& bank,
                                                  const SeparationConfig& config) {
    std::vector<RankedName> ranked;
    for (const auto& separator : bank.all()) {
        const SeparatorTraits& traits = separator->traits();
        if (traits.general_purpose && separator->is_available(config)) {
            ranked.push_back({traits.name, traits.speed_rank});
        }
    }
    return ranked;
}

} // namespace

float dynamic_range_db(const AudioBuffer& audio, std::size_t block) {
    const std::vector<float> rms = block_rms(audio.samples(), block);
    if (rms.empty()) {
        return 0.0f;
    }
    std::vector<float> db;
    db.reserve(rms.size());
    for (float value : rms) {
        db.push_back(std::max(-100.0f, 20.0f * std::log10(std::max(value, 1e-10f))));
    }
    return percentile(db, 95.0f) - percentile(db, 10.0f);
}

std::vector<std::string> neural_candidates(const SeparatorBank& bank,
                                           const SeparationConfig& config) {
    std::vector<RankedName> ranked = available_general_purpose(bank, config);
    std::stable_sort(ranked.begin(), ranked.end(), [](const RankedName& a, const RankedName& b) {
        return a.speed_rank > b.speed_rank;
    });
    std::vector<std::string> names;
    for (const auto& entry : ranked) {
        names.push_back(entry.name);
    }
    return names;
}

std::vector<std::string> auto_priority(const SeparatorBank& bank,
                                       const SeparationConfig& config,
                                       const AudioBuffer& audio) {
    std::vector<std::string> order;

    if (audio.duration_seconds() > config.orchestrator.neural_min_duration_seconds) {
        const auto neural = neural_candidates(bank, config);
        order.insert(order.end(), neural.begin(), neural.end());
    }

    std::vector<RankedName> general = available_general_purpose(bank, config);
    if (!general.empty()) {
        const auto fastest =
            std::min_element(general.begin(), general.end(),
                             [](const RankedName& a, const RankedName& b) {
                                 return a.speed_rank < b.speed_rank;
                             });
        order.push_back(fastest->name);
    }

    const float range = dynamic_range_db(audio, config.stft.n_fft);
    STEMSEP_LOG_DEBUG("selection: dynamic range " << range << " dB");
    if (range > config.orchestrator.high_dynamic_range_db) {
        order.push_back("nmf");
    }
    order.push_back("hpss");

    std::vector<std::string> unique;
    std::set<std::string> seen;
    for (const auto& name : order) {
        if (seen.insert(name).second) {
            unique.push_back(name);
        }
    }
    return unique;
}

std::vector<PlannedMethod> quality_chain(QualityHint hint,
                                         const SeparatorBank& bank,
                                         const SeparationConfig& config,
                                         const AudioBuffer& audio) {
    const std::size_t components = config.separators.components;
    std::vector<PlannedMethod> chain;
    switch (hint) {
        case QualityHint::Fast:
            chain = {{"nmf", config.separators.fast_components}, {"hpss", components}};
            break;
        case QualityHint::Balanced:
            chain = {{"balanced", components}, {"nmf", components}, {"hpss", components}};
            break;
        case QualityHint::High:
            for (const auto& name : neural_candidates(bank, config)) {
                chain.push_back({name, components});
            }
            chain.push_back({"ica", components});
            chain.push_back({"nmf", components});
            chain.push_back({"hpss", components});
            break;
        case QualityHint::Auto:
            for (const auto& name : auto_priority(bank, config, audio)) {
                chain.push_back({name, components});
            }
            break;
    }
    return chain;
}

std::vector<PlannedMethod> deduplicate(const std::vector<PlannedMethod>& methods,
                                       const SeparatorBank& bank) {
    std::vector<PlannedMethod> unique;
    std::set<std::string> seen;
    for (const auto& planned : methods) {
        if (!bank.find(planned.method)) {
            STEMSEP_LOG_DEBUG("selection: '" << planned.method << "' not in bank, skipped.");
            continue;
        }
        if (seen.insert(planned.method).second) {
            unique.push_back(planned);
        }
    }
    return unique;
}

} // namespace stemsep::detail
