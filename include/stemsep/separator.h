//
//  separator.h
//  StemSep
//
//  Created by Till Toenshoff on 2026-10-06.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include "stemsep/audio_buffer.h"
#include "stemsep/config.h"

#include <cstddef>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace stemsep {

/// Default target stems, in positional assignment order.
const std::vector<std::string>& canonical_stem_names();

/// Stem name for component `index` of an unlabeled decomposition.
std::string positional_stem_name(std::size_t index);

using StemMap = std::map<std::string, AudioBuffer>;

struct SeparatorTraits {
    std::string name;
    /// Emits meaningful stem labels (vocals, drums, ...) rather than components.
    bool semantic_labels = false;
    /// Trained for arbitrary music; preferred by automatic selection.
    bool general_purpose = false;
    /// Depends on an optional capability (external tool, Torch build).
    bool capability_gated = false;
    /// Lower is faster.
    int speed_rank = 0;
};

struct SeparatorOutcome {
    enum class Status {
        Ok,
        CapabilityMissing,
        Failed
    };

    Status status = Status::Failed;
    StemMap stems;
    std::string message;

    bool ok() const { return status == Status::Ok; }
};

const char* outcome_status_name(SeparatorOutcome::Status status);

/// @brief One spectral or neural decomposition algorithm.
///
/// Every stem returned by `separate()` is time-aligned with and has the same
/// sample count as the input.
class Separator {
public:
    virtual ~Separator() = default;

    virtual const SeparatorTraits& traits() const = 0;

    virtual bool is_available(const SeparationConfig& config) const = 0;

    /// Throws AlgorithmUnavailable or AlgorithmFailure.
    virtual StemMap separate(const AudioBuffer& buffer,
                             std::size_t n_components,
                             const SeparationConfig& config) const = 0;

    /// @brief Non-throwing wrapper reporting capability and failure explicitly.
    SeparatorOutcome try_separate(const AudioBuffer& buffer,
                                  std::size_t n_components,
                                  const SeparationConfig& config) const;

    const std::string& name() const { return traits().name; }
};

std::unique_ptr<Separator> make_nmf_separator();
std::unique_ptr<Separator> make_ica_separator();
std::unique_ptr<Separator> make_hpss_separator();
std::unique_ptr<Separator> make_balanced_separator();
std::unique_ptr<Separator> make_external_separator();
std::unique_ptr<Separator> make_torch_separator();

/// @brief Named set of separators available to the orchestrator.
class SeparatorBank {
public:
    /// nmf, ica, hpss, balanced, demucs_external and torch.
    static SeparatorBank make_default();

    /// Adds or replaces the separator with the same name.
    void add(std::shared_ptr<const Separator> separator);

    std::shared_ptr<const Separator> find(const std::string& name) const;
    std::vector<std::shared_ptr<const Separator>> all() const { return separators_; }
    std::vector<std::string> names() const;

private:
    std::vector<std::shared_ptr<const Separator>> separators_;
};

} // namespace stemsep
