//
//  wav.cpp
//  StemSep
//
//  Created by Till Toenshoff on 2026-10-07.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "wav.h"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <cstring>
#include <fstream>

namespace stemsep::detail {
namespace {

void write_u16(std::ofstream& out, std::uint16_t value) {
    const char bytes[2] = {static_cast<char>(value & 0xFF), static_cast<char>((value >> 8) & 0xFF)};
    out.write(bytes, 2);
}

void write_u32(std::ofstream& out, std::uint32_t value) {
    const char bytes[4] = {static_cast<char>(value & 0xFF),
                           static_cast<char>((value >> 8) & 0xFF),
                           static_cast<char>((value >> 16) & 0xFF),
                           static_cast<char>((value >> 24) & 0xFF)};
    out.write(bytes, 4);
}

std::uint16_t read_u16(const unsigned char* data) {
    return static_cast<std::uint16_t>(data[0] | (data[1] << 8));
}

std::uint32_t read_u32(const unsigned char* data) {
    return static_cast<std::uint32_t>(data[0]) | (static_cast<std::uint32_t>(data[1]) << 8) |
           (static_cast<std::uint32_t>(data[2]) << 16) | (static_cast<std::uint32_t>(data[3]) << 24);
}

bool fail(std::string* error, const char* message) {
    if (error) {
        *error = message;
    }
    return false;
}

float decode_sample(const unsigned char* data, std::uint16_t format, std::uint16_t bits) {
    if (format == 3) {
        if (bits == 32) {
            float value = 0.0f;
            const std::uint32_t raw = read_u32(data);
            std::memcpy(&value, &raw, sizeof(value));
            return value;
        }
        std::uint64_t raw = 0;
        for (int i = 0; i < 8; ++i) {
            raw |= static_cast<std::uint64_t>(data[i]) << (8 * i);
        }
        double value = 0.0;
        std::memcpy(&value, &raw, sizeof(value));
        return static_cast<float>(value);
    }

    switch (bits) {
        case 8:
            return (static_cast<float>(data[0]) - 128.0f) / 128.0f;
        case 16:
            return static_cast<float>(static_cast<std::int16_t>(read_u16(data))) / 32768.0f;
        case 24: {
            std::int32_t value = data[0] | (data[1] << 8) | (data[2] << 16);
            if (value & 0x800000) {
                value |= ~0xFFFFFF;
            }
            return static_cast<float>(value) / 8388608.0f;
        }
        case 32:
            return static_cast<float>(static_cast<std::int32_t>(read_u32(data))) / 2147483648.0f;
        default:
            return 0.0f;
    }
}

} // namespace

bool write_wav_mono_16(const std::string& path,
                       const std::vector<float>& samples,
                       double sample_rate,
                       std::string* error) {
    if (samples.empty() || sample_rate <= 0.0) {
        return fail(error, "Empty samples or invalid sample rate.");
    }

    std::ofstream out(path, std::ios::binary);
    if (!out.is_open()) {
        return fail(error, "Failed to open WAV output.");
    }

    const std::uint16_t channels = 1;
    const std::uint16_t bits_per_sample = 16;
    const std::uint32_t sample_rate_u = static_cast<std::uint32_t>(std::lround(sample_rate));
    const std::uint32_t byte_rate = sample_rate_u * channels * (bits_per_sample / 8);
    const std::uint16_t block_align = channels * (bits_per_sample / 8);
    const std::uint32_t data_size =
        static_cast<std::uint32_t>(samples.size() * sizeof(std::int16_t));

    out.write("RIFF", 4);
    write_u32(out, 36 + data_size);
    out.write("WAVE", 4);

    out.write("fmt ", 4);
    write_u32(out, 16);
    write_u16(out, 1);
    write_u16(out, channels);
    write_u32(out, sample_rate_u);
    write_u32(out, byte_rate);
    write_u16(out, block_align);
    write_u16(out, bits_per_sample);

    out.write("data", 4);
    write_u32(out, data_size);

    for (float sample : samples) {
        const float clamped = std::max(-1.0f, std::min(1.0f, sample));
        const std::int16_t value = static_cast<std::int16_t>(std::lround(clamped * 32767.0f));
        write_u16(out, static_cast<std::uint16_t>(value));
    }

    if (!out.good()) {
        return fail(error, "Failed to write WAV data.");
    }

    return true;
}

bool read_wav_mono(const std::string& path,
                   std::vector<float>* samples,
                   double* sample_rate,
                   std::string* error) {
    if (!samples || !sample_rate) {
        return fail(error, "Invalid output buffers.");
    }

    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return fail(error, "Failed to open WAV input.");
    }

    in.seekg(0, std::ios::end);
    const std::streamoff file_size = in.tellg();
    in.seekg(0, std::ios::beg);
    if (file_size < 0) {
        return fail(error, "Failed to determine WAV input size.");
    }

    unsigned char header[12];
    if (!in.read(reinterpret_cast<char*>(header), sizeof(header)) ||
        std::memcmp(header, "RIFF", 4) != 0 || std::memcmp(header + 8, "WAVE", 4) != 0) {
        return fail(error, "Not a RIFF/WAVE file.");
    }

    std::uint16_t format = 0;
    std::uint16_t channels = 0;
    std::uint32_t rate = 0;
    std::uint16_t bits = 0;
    bool have_format = false;

    unsigned char chunk[8];
    while (in.read(reinterpret_cast<char*>(chunk), sizeof(chunk))) {
        const std::uint32_t chunk_size = read_u32(chunk + 4);
        const std::uint64_t padded_size = static_cast<std::uint64_t>(chunk_size) + (chunk_size & 1u);
        const std::streamoff position = in.tellg();
        const std::uint64_t remaining =
            position < file_size ? static_cast<std::uint64_t>(file_size - position) : 0;

        if (std::memcmp(chunk, "fmt ", 4) == 0) {
            if (chunk_size < 16) {
                return fail(error, "Malformed fmt chunk.");
            }
            if (padded_size > remaining) {
                return fail(error, "Truncated fmt chunk.");
            }
            std::vector<unsigned char> fmt(static_cast<std::size_t>(padded_size));
            if (!in.read(reinterpret_cast<char*>(fmt.data()), static_cast<std::streamsize>(padded_size))) {
                return fail(error, "Truncated fmt chunk.");
            }
            format = read_u16(fmt.data());
            channels = read_u16(fmt.data() + 2);
            rate = read_u32(fmt.data() + 4);
            bits = read_u16(fmt.data() + 14);
            if (format == 0xFFFE && chunk_size >= 26) {
                // WAVE_FORMAT_EXTENSIBLE: the sub-format GUID starts with the format tag.
                format = read_u16(fmt.data() + 24);
            }
            have_format = true;
            continue;
        }

        if (std::memcmp(chunk, "data", 4) == 0) {
            if (!have_format) {
                return fail(error, "WAV data chunk precedes fmt chunk.");
            }
            const bool pcm = format == 1 && (bits == 8 || bits == 16 || bits == 24 || bits == 32);
            const bool ieee = format == 3 && (bits == 32 || bits == 64);
            if (!pcm && !ieee) {
                return fail(error, "Unsupported WAV sample format.");
            }
            if (channels == 0 || rate == 0) {
                return fail(error, "Invalid WAV channel count or sample rate.");
            }

            const std::size_t frame_bytes = static_cast<std::size_t>(channels) * (bits / 8);
            // Streaming writers leave the size at 0xFFFFFFFF; read to the end of the file.
            const std::uint64_t wanted = std::min<std::uint64_t>(chunk_size, remaining);
            std::vector<unsigned char> data(static_cast<std::size_t>(wanted));
            in.read(reinterpret_cast<char*>(data.data()), static_cast<std::streamsize>(wanted));
            const std::size_t available = static_cast<std::size_t>(in.gcount());
            const std::size_t frames = available / frame_bytes;

            samples->assign(frames, 0.0f);
            for (std::size_t f = 0; f < frames; ++f) {
                const unsigned char* frame = data.data() + f * frame_bytes;
                float sum = 0.0f;
                for (std::uint16_t c = 0; c < channels; ++c) {
                    sum += decode_sample(frame + c * (bits / 8), format, bits);
                }
                (*samples)[f] = sum / static_cast<float>(channels);
            }
            *sample_rate = static_cast<double>(rate);
            return true;
        }

        if (padded_size >= remaining) {
            break;
        }
        in.seekg(static_cast<std::streamoff>(padded_size), std::ios::cur);
    }

    return fail(error, "WAV file has no data chunk.");
}

} // namespace stemsep::detail
