//
//  version.cpp
//  StemSep
//
//  Created by Till Toenshoff on 2026-10-02.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "stemsep/version.h"
#include "stemsep_version.hpp"

namespace stemsep {

std::string version_string() {
    return STEMSEP_VERSION_DISPLAY;
}

} // namespace stemsep
