//
//  version.h
//  StemSep
//
//  Created by Till Toenshoff on 2026-10-02.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include <string>

namespace stemsep {

/// @brief Return the StemSep version display string (for example `v0.3.0`).
std::string version_string();

} // namespace stemsep
