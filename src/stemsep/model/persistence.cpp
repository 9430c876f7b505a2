//
//  persistence.cpp
//  StemSep
//
//  Created by Till Toenshoff on 2026-10-05.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "persistence.h"

#include <cstring>
#include <string>

namespace stemsep::detail {
namespace {

// Sanity cap on any stored vector or string.
constexpr std::uint64_t kMaxStoredBytes = std::uint64_t(1) << 30;

} // namespace

void BinaryWriter::bytes(const char* data, std::size_t size) {
    out_.write(data, static_cast<std::streamsize>(size));
}

void BinaryWriter::u8(std::uint8_t value) {
    const char byte = static_cast<char>(value);
    out_.write(&byte, 1);
}

void BinaryWriter::u32(std::uint32_t value) {
    char buffer[4];
    for (int i = 0; i < 4; ++i) {
        buffer[i] = static_cast<char>((value >> (8 * i)) & 0xFFu);
    }
    out_.write(buffer, 4);
}

void BinaryWriter::u64(std::uint64_t value) {
    char buffer[8];
    for (int i = 0; i < 8; ++i) {
        buffer[i] = static_cast<char>((value >> (8 * i)) & 0xFFu);
    }
    out_.write(buffer, 8);
}

void BinaryWriter::f32(float value) {
    std::uint32_t bits = 0;
    std::memcpy(&bits, &value, sizeof(bits));
    u32(bits);
}

void BinaryWriter::f64(double value) {
    std::uint64_t bits = 0;
    std::memcpy(&bits, &value, sizeof(bits));
    u64(bits);
}

void BinaryWriter::string(const std::string& value) {
    u32(static_cast<std::uint32_t>(value.size()));
    bytes(value.data(), value.size());
}

void BinaryWriter::f32_vector(const std::vector<float>& values) {
    u64(values.size());
    for (float value : values) {
        f32(value);
    }
}

void BinaryWriter::f64_vector(const std::vector<double>& values) {
    u64(values.size());
    for (double value : values) {
        f64(value);
    }
}

PersistenceError BinaryReader::error(const std::string& what) const {
    return PersistenceError(context_ + ": " + what);
}

void BinaryReader::bytes(char* data, std::size_t size) {
    in_.read(data, static_cast<std::streamsize>(size));
    if (static_cast<std::size_t>(in_.gcount()) != size) {
        throw error("unexpected end of file");
    }
}

std::uint8_t BinaryReader::u8() {
    char byte = 0;
    bytes(&byte, 1);
    return static_cast<std::uint8_t>(byte);
}

std::uint32_t BinaryReader::u32() {
    unsigned char buffer[4];
    bytes(reinterpret_cast<char*>(buffer), 4);
    std::uint32_t value = 0;
    for (int i = 0; i < 4; ++i) {
        value |= static_cast<std::uint32_t>(buffer[i]) << (8 * i);
    }
    return value;
}

std::uint64_t BinaryReader::u64() {
    unsigned char buffer[8];
    bytes(reinterpret_cast<char*>(buffer), 8);
    std::uint64_t value = 0;
    for (int i = 0; i < 8; ++i) {
        value |= static_cast<std::uint64_t>(buffer[i]) << (8 * i);
    }
    return value;
}

float BinaryReader::f32() {
    const std::uint32_t bits = u32();
    float value = 0.0f;
    std::memcpy(&value, &bits, sizeof(value));
    return value;
}

double BinaryReader::f64() {
    const std::uint64_t bits = u64();
    double value = 0.0;
    std::memcpy(&value, &bits, sizeof(value));
    return value;
}

std::uint64_t BinaryReader::length(std::size_t element_size) {
    const std::uint64_t count = u64();
    if (count > kMaxStoredBytes / element_size) {
        throw error("implausible element count " + std::to_string(count));
    }
    return count;
}

std::string BinaryReader::string() {
    const std::uint32_t size = u32();
    if (size > kMaxStoredBytes) {
        throw error("implausible string length");
    }
    std::string value(size, '\0');
    if (size > 0) {
        bytes(&value[0], size);
    }
    return value;
}

std::vector<float> BinaryReader::f32_vector() {
    const std::uint64_t count = length(sizeof(float));
    std::vector<float> values;
    for (std::uint64_t i = 0; i < count; ++i) {
        values.push_back(f32());
    }
    return values;
}

std::vector<double> BinaryReader::f64_vector() {
    const std::uint64_t count = length(sizeof(double));
    std::vector<double> values;
    for (std::uint64_t i = 0; i < count; ++i) {
        values.push_back(f64());
    }
    return values;
}

} // namespace stemsep::detail
