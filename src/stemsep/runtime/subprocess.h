//
//  subprocess.h
//  StemSep
//
//  Created by Till Toenshoff on 2026-10-08.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include <string>
#include <vector>

namespace stemsep::detail {

struct SubprocessResult {
    int exit_code = -1;
    bool timed_out = false;
    double elapsed_seconds = 0.0;
};

// Absolute or relative paths are checked directly, bare names via $PATH.
bool resolve_executable(const std::string& command, std::string* resolved);

// Runs `argv` in its own process group with stdout and stderr appended to
// `log_path` (or discarded when empty). The group is killed once
// `timeout_seconds` elapses. Returns false only when the child could not be
// started; a non-zero exit is reported through `result`.
bool run_subprocess(const std::vector<std::string>& argv,
                    double timeout_seconds,
                    const std::string& log_path,
                    SubprocessResult* result,
                    std::string* error);

} // namespace stemsep::detail
