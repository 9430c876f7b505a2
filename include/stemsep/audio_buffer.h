//
//  audio_buffer.h
//  StemSep
//
//  Created by Till Toenshoff on 2026-10-02.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstddef>
#include <memory>
#include <vector>

namespace stemsep {

/// @brief Immutable mono sample buffer with its sample rate.
///
/// Copies share the sample storage. Processing stages never mutate a buffer;
/// they return a new one.
class AudioBuffer {
public:
    AudioBuffer();
    AudioBuffer(std::vector<float> samples, double sample_rate);

    const std::vector<float>& samples() const { return *samples_; }
    const float* data() const { return samples_->data(); }
    std::size_t size() const { return samples_->size(); }
    bool empty() const { return samples_->empty(); }
    double sample_rate() const { return sample_rate_; }
    double duration_seconds() const;

    float peak() const;
    double energy() const;

private:
    std::shared_ptr<const std::vector<float>> samples_;
    double sample_rate_ = 0.0;
};

} // namespace stemsep
