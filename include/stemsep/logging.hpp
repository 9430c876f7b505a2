//
//  logging.hpp
//  StemSep
//
//  Created by Till Toenshoff on 2026-10-02.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include <atomic>
#include <cstddef>
#include <iostream>
#include <sstream>
#include <string>
#include <string_view>

namespace stemsep {

struct SeparationConfig;

/// @brief Logging level policy for StemSep.
///
/// Usage contract:
/// - `Error`: hard failures that end a job or a requested operation.
/// - `Warn`: separator fallback, skipped refinement, unreadable model files,
///   partial results and anything else users should see in non-verbose mode.
/// - `Info`: job lifecycle and per-stage timing.
/// - `Debug`: per-iteration diagnostics (factorization residuals, cluster
///   movement, candidate plans).
///
/// `Warn` and `Error` logs must never be gated by local flags; the global
/// logger level alone controls visibility.
enum class LogVerbosity {
    /// @brief Hard failure; requested operation cannot be completed.
    Error = 0,
    /// @brief Recoverable issue, fallback, or suspicious condition.
    Warn = 1,
    /// @brief Operational summary and profiling information.
    Info = 2,
    /// @brief Detailed internal diagnostics and trace data.
    Debug = 3
};

/// @brief Set the current global StemSep log verbosity.
void set_log_verbosity(LogVerbosity level);

/// @brief Get the current global StemSep log verbosity.
LogVerbosity get_log_verbosity();

/// @brief Configure StemSep log verbosity from config flags.
void set_log_verbosity_from_config(const SeparationConfig& config);

} // namespace stemsep

inline constexpr stemsep::LogVerbosity stemsep_severity_for_tag(std::string_view tag) {
    if (tag == "error") {
        return stemsep::LogVerbosity::Error;
    }
    if (tag == "warn" || tag == "warning") {
        return stemsep::LogVerbosity::Warn;
    }
    if (tag == "info") {
        return stemsep::LogVerbosity::Info;
    }
    return stemsep::LogVerbosity::Debug;
}

inline bool stemsep_should_log(const char* level) {
    const auto current = stemsep::get_log_verbosity();
    const auto severity = stemsep_severity_for_tag(level ? level : "");
    return static_cast<int>(severity) <= static_cast<int>(current);
}

inline void stemsep_log_impl(const char* level,
                             const std::string& message,
                             const char* file,
                             int line,
                             const char* func) {
    const std::string label = level ? level : "";
    if (label == "error") {
        std::cerr << "[StemSep][" << label << "][" << file << ":" << line
                  << " " << func << "] " << message << "\n";
        return;
    }

    std::cerr << "[StemSep][" << label << "] " << message << "\n";
}

inline void stemsep_log_multiline_impl(const char* level,
                                       const std::string& message,
                                       const char* file,
                                       int line,
                                       const char* func) {
    if (message.empty()) {
        stemsep_log_impl(level, message, file, line, func);
        return;
    }

    std::size_t start = 0;
    while (start <= message.size()) {
        const std::size_t end = message.find('\n', start);
        const std::size_t len =
            (end == std::string::npos) ? (message.size() - start) : (end - start);
        const std::string line_msg = message.substr(start, len);
        if (!line_msg.empty()) {
            stemsep_log_impl(level, line_msg, file, line, func);
        }
        if (end == std::string::npos) {
            break;
        }
        start = end + 1;
    }
}

#define STEMSEP_LOG(level, message)                                              \
    do {                                                                         \
        if (stemsep_should_log(level)) {                                         \
            std::ostringstream _stemsep_log_stream;                              \
            _stemsep_log_stream << message;                                      \
            stemsep_log_multiline_impl(level,                                    \
                                       _stemsep_log_stream.str(),                \
                                       __FILE__,                                 \
                                       __LINE__,                                 \
                                       __func__);                                \
        }                                                                        \
    } while (0)

#define STEMSEP_LOG_ERROR(message) STEMSEP_LOG("error", message)
#define STEMSEP_LOG_WARN(message) STEMSEP_LOG("warn", message)
#define STEMSEP_LOG_INFO(message) STEMSEP_LOG("info", message)
#define STEMSEP_LOG_DEBUG(message) STEMSEP_LOG("debug", message)
