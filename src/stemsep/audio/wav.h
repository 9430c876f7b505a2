//
//  wav.h
//  StemSep
//
//  Created by Till Toenshoff on 2026-10-07.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include <string>
#include <vector>

namespace stemsep::detail {

bool write_wav_mono_16(const std::string& path,
                       const std::vector<float>& samples,
                       double sample_rate,
                       std::string* error);

// Reads PCM 8/16/24/32-bit or IEEE float 32/64-bit RIFF files; multiple
// channels are averaged down to mono.
bool read_wav_mono(const std::string& path,
                   std::vector<float>* samples,
                   double* sample_rate,
                   std::string* error);

} // namespace stemsep::detail
