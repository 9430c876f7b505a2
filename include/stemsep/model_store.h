//
//  model_store.h
//  StemSep
//
//  Created by Till Toenshoff on 2026-10-05.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include "stemsep/separation_model.h"

#include <cstddef>
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace stemsep {

/// @brief Named pool of trained, immutable separation models.
///
/// Safe for concurrent readers; writers take an exclusive lock. Models are
/// handed out as shared read-only pointers and stay valid after replacement.
class ModelStore {
public:
    void put(const std::string& name, std::shared_ptr<const SeparationModel> model);
    std::shared_ptr<const SeparationModel> find(const std::string& name) const;
    bool contains(const std::string& name) const;
    bool remove(const std::string& name);
    std::vector<std::string> names() const;
    std::size_t size() const;

    /// @brief Load every `*.ssm` file in `directory`, keyed by instrument name.
    ///
    /// Unreadable or corrupt files are logged and skipped. Returns the number
    /// of models added.
    std::size_t load_directory(const std::string& directory);

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<const SeparationModel>> models_;
};

} // namespace stemsep
