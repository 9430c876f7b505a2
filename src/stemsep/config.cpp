//
//  config.cpp
//  StemSep
//
//  Created by Till Toenshoff on 2026-10-02.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "stemsep/config.h"

namespace stemsep {

const char* feature_type_name(FeatureType type) {
    switch (type) {
        case FeatureType::Mfcc:
            return "mfcc";
        case FeatureType::Spectral:
            return "spectral";
        case FeatureType::Chroma:
            return "chroma";
    }
    return "unknown";
}

bool parse_feature_type(const std::string& name, FeatureType* out) {
    FeatureType parsed;
    if (name == "mfcc") {
        parsed = FeatureType::Mfcc;
    } else if (name == "spectral") {
        parsed = FeatureType::Spectral;
    } else if (name == "chroma") {
        parsed = FeatureType::Chroma;
    } else {
        return false;
    }
    if (out) {
        *out = parsed;
    }
    return true;
}

} // namespace stemsep
