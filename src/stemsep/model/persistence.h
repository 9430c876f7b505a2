//
//  persistence.h
//  StemSep
//
//  Created by Till Toenshoff on 2026-10-05.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include "stemsep/errors.h"

#include <cstddef>
#include <cstdint>
#include <istream>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

namespace stemsep::detail {

inline constexpr char kModelMagic[4] = {'S', 'S', 'M', 'M'};
inline constexpr std::uint32_t kModelFormatVersion = 1;
inline constexpr const char* kModelFileExtension = ".ssm";

// Little-endian scalar and vector encoding, independent of host byte order.
class BinaryWriter {
public:
    explicit BinaryWriter(std::ostream& out) : out_(out) {}

    void bytes(const char* data, std::size_t size);
    void u8(std::uint8_t value);
    void u32(std::uint32_t value);
    void u64(std::uint64_t value);
    void f32(float value);
    void f64(double value);
    void string(const std::string& value);
    void f32_vector(const std::vector<float>& values);
    void f64_vector(const std::vector<double>& values);

    bool good() const { return out_.good(); }

private:
    std::ostream& out_;
};

// Throws PersistenceError on truncation or implausible lengths.
class BinaryReader {
public:
    BinaryReader(std::istream& in, std::string context)
        : in_(in),
          context_(std::move(context)) {}

    void bytes(char* data, std::size_t size);
    std::uint8_t u8();
    std::uint32_t u32();
    std::uint64_t u64();
    float f32();
    double f64();
    std::string string();
    std::vector<float> f32_vector();
    std::vector<double> f64_vector();

    PersistenceError error(const std::string& what) const;

private:
    std::uint64_t length(std::size_t element_size);

    std::istream& in_;
    std::string context_;
};

} // namespace stemsep::detail
