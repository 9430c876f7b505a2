//
//  audio_buffer.cpp
//  StemSep
//
//  Created by Till Toenshoff on 2026-10-02.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "stemsep/audio_buffer.h"

#include <algorithm>
#include <cmath>
#include <utility>

namespace stemsep {

AudioBuffer::AudioBuffer()
    : samples_(std::make_shared<const std::vector<float>>()) {}

AudioBuffer::AudioBuffer(std::vector<float> samples, double sample_rate)
    : samples_(std::make_shared<const std::vector<float>>(std::move(samples))),
      sample_rate_(sample_rate) {}

double AudioBuffer::duration_seconds() const {
    if (sample_rate_ <= 0.0) {
        return 0.0;
    }
    return static_cast<double>(samples_->size()) / sample_rate_;
}

float AudioBuffer::peak() const {
    float peak = 0.0f;
    for (float sample : *samples_) {
        peak = std::max(peak, std::abs(sample));
    }
    return peak;
}

double AudioBuffer::energy() const {
    double sum = 0.0;
    for (float sample : *samples_) {
        sum += static_cast<double>(sample) * static_cast<double>(sample);
    }
    return sum;
}

} // namespace stemsep
