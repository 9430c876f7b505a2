//
//  errors.h
//  StemSep
//
//  Created by Till Toenshoff on 2026-10-02.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include <stdexcept>
#include <string>

namespace stemsep {

/// @brief Base of all StemSep errors.
class Error : public std::runtime_error {
public:
    explicit Error(const std::string& message) : std::runtime_error(message) {}
};

/// @brief Malformed, oversized or empty input. The job never starts.
class ValidationError : public Error {
public:
    using Error::Error;
};

/// @brief Feature extraction failed on malformed audio.
class ExtractionError : public Error {
public:
    using Error::Error;
};

/// @brief An optional capability (e.g. a neural separator) is missing.
class AlgorithmUnavailable : public Error {
public:
    using Error::Error;
};

/// @brief A separator failed while running.
class AlgorithmFailure : public Error {
public:
    using Error::Error;
};

/// @brief A quantizer or model was queried before training.
class NotTrainedError : public Error {
public:
    using Error::Error;
};

/// @brief A model file is missing, truncated or corrupt.
class PersistenceError : public Error {
public:
    using Error::Error;
};

} // namespace stemsep
