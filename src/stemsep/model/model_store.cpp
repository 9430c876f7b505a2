//
//  model_store.cpp
//  StemSep
//
//  Created by Till Toenshoff on 2026-10-05.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "stemsep/model_store.h"

#include "model/persistence.h"
#include "stemsep/errors.h"
#include "stemsep/logging.hpp"

#include <algorithm>
#include <filesystem>
#include <mutex>
#include <system_error>
#include <utility>

namespace stemsep {

void ModelStore::put(const std::string& name, std::shared_ptr<const SeparationModel> model) {
    if (!model) {
        return;
    }
    std::unique_lock<std::shared_mutex> lock(mutex_);
    models_[name] = std::move(model);
}

std::shared_ptr<const SeparationModel> ModelStore::find(const std::string& name) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    const auto it = models_.find(name);
    return it == models_.end() ? nullptr : it->second;
}

bool ModelStore::contains(const std::string& name) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return models_.count(name) > 0;
}

bool ModelStore::remove(const std::string& name) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    return models_.erase(name) > 0;
}

std::vector<std::string> ModelStore::names() const {
    std::vector<std::string> out;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        out.reserve(models_.size());
        for (const auto& entry : models_) {
            out.push_back(entry.first);
        }
    }
    std::sort(out.begin(), out.end());
    return out;
}

std::size_t ModelStore::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return models_.size();
}

std::size_t ModelStore::load_directory(const std::string& directory) {
    namespace fs = std::filesystem;

    std::error_code ec;
    if (!fs::is_directory(directory, ec)) {
        STEMSEP_LOG_WARN("Model store: not a directory: " << directory);
        return 0;
    }

    std::vector<fs::path> files;
    for (fs::directory_iterator it(directory, ec), end; !ec && it != end; it.increment(ec)) {
        if (it->is_regular_file(ec) && it->path().extension() == detail::kModelFileExtension) {
            files.push_back(it->path());
        }
    }
    if (ec) {
        STEMSEP_LOG_WARN("Model store: failed to list " << directory << ": " << ec.message());
    }
    std::sort(files.begin(), files.end());

    std::size_t loaded = 0;
    for (const auto& file : files) {
        try {
            auto model = std::make_shared<const SeparationModel>(SeparationModel::load(file.string()));
            const std::string name = model->instrument();
            put(name, std::move(model));
            ++loaded;
            STEMSEP_LOG_INFO("Model store: loaded '" << name << "' from " << file.string());
        } catch (const PersistenceError& err) {
            STEMSEP_LOG_WARN("Model store: skipping " << file.string() << ": " << err.what());
        }
    }
    return loaded;
}

} // namespace stemsep
