//
//  separator_base.cpp
//  StemSep
//
//  Created by Till Toenshoff on 2026-10-06.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "stemsep/separator.h"

#include "stemsep/errors.h"

#include <string>
#include <utility>

namespace stemsep {

const std::vector<std::string>& canonical_stem_names() {
    static const std::vector<std::string> names = {"vocals", "drums", "bass", "other"};
    return names;
}

std::string positional_stem_name(std::size_t index) {
    const auto& names = canonical_stem_names();
    if (index < names.size()) {
        return names[index];
    }
    return "component_" + std::to_string(index + 1);
}

const char* outcome_status_name(SeparatorOutcome::Status status) {
    switch (status) {
        case SeparatorOutcome::Status::Ok:
            return "ok";
        case SeparatorOutcome::Status::CapabilityMissing:
            return "capability_missing";
        case SeparatorOutcome::Status::Failed:
            return "failed";
    }
    return "unknown";
}

SeparatorOutcome Separator::try_separate(const AudioBuffer& buffer,
                                         std::size_t n_components,
                                         const SeparationConfig& config) const {
    SeparatorOutcome outcome;
    if (!is_available(config)) {
        outcome.status = SeparatorOutcome::Status::CapabilityMissing;
        outcome.message = name() + " is not available in this environment.";
        return outcome;
    }

    try {
        StemMap stems = separate(buffer, n_components, config);
        if (stems.empty()) {
            outcome.message = name() + " produced no stems.";
            return outcome;
        }
        for (const auto& entry : stems) {
            if (entry.second.size() != buffer.size()) {
                outcome.message = name() + " produced stem '" + entry.first + "' with " +
                                  std::to_string(entry.second.size()) + " samples, expected " +
                                  std::to_string(buffer.size()) + ".";
                return outcome;
            }
        }
        outcome.status = SeparatorOutcome::Status::Ok;
        outcome.stems = std::move(stems);
    } catch (const AlgorithmUnavailable& err) {
        outcome.status = SeparatorOutcome::Status::CapabilityMissing;
        outcome.message = err.what();
    } catch (const std::exception& err) {
        outcome.status = SeparatorOutcome::Status::Failed;
        outcome.message = err.what();
    }
    return outcome;
}

SeparatorBank SeparatorBank::make_default() {
    SeparatorBank bank;
    bank.add(make_hpss_separator());
    bank.add(make_nmf_separator());
    bank.add(make_balanced_separator());
    bank.add(make_ica_separator());
    bank.add(make_torch_separator());
    bank.add(make_external_separator());
    return bank;
}

void SeparatorBank::add(std::shared_ptr<const Separator> separator) {
    if (!separator) {
        return;
    }
    for (auto& existing : separators_) {
        if (existing->name() == separator->name()) {
            existing = std::move(separator);
            return;
        }
    }
    separators_.push_back(std::move(separator));
}

std::shared_ptr<const Separator> SeparatorBank::find(const std::string& name) const {
    for (const auto& separator : separators_) {
        if (separator->name() == name) {
            return separator;
        }
    }
    return nullptr;
}

std::vector<std::string> SeparatorBank::names() const {
    std::vector<std::string> out;
    out.reserve(separators_.size());
    for (const auto& separator : separators_) {
        out.push_back(separator->name());
    }
    return out;
}

} // namespace stemsep
