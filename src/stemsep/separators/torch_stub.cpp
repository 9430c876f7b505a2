//
//  torch_stub.cpp
//  StemSep
//
//  Created by Till Toenshoff on 2026-10-08.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "stemsep/errors.h"
#include "stemsep/logging.hpp"
#include "stemsep/separator.h"

#include <memory>

namespace stemsep {
namespace {

class TorchStubSeparator final : public Separator {
public:
    const SeparatorTraits& traits() const override {
        static const SeparatorTraits traits{"torch", true, true, true, 5};
        return traits;
    }

    bool is_available(const SeparationConfig&) const override {
        return false;
    }

    StemMap separate(const AudioBuffer&, std::size_t, const SeparationConfig&) const override {
        STEMSEP_LOG_ERROR("Torch backend not enabled in this build.");
        throw AlgorithmUnavailable("Torch backend not enabled in this build.");
    }
};

} // namespace

std::unique_ptr<Separator> make_torch_separator() {
    return std::make_unique<TorchStubSeparator>();
}

} // namespace stemsep
