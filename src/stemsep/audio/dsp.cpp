//
//  dsp.cpp
//  StemSep
//
//  Created by Till Toenshoff on 2026-10-03.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "dsp.h"

#include <algorithm>
#include <cmath>

namespace stemsep::detail {

std::vector<float> resample_linear_mono(const std::vector<float> &input,
                                        double input_rate,
                                        double target_rate) {
  if (input_rate <= 0.0 || target_rate <= 0.0 || input.empty()) {
    return {};
  }
  if (std::lround(input_rate) == std::lround(target_rate)) {
    return input;
  }

  const double ratio = target_rate / input_rate;
  const std::size_t output_size = std::max<std::size_t>(
      1, static_cast<std::size_t>(std::lround(input.size() * ratio)));
  std::vector<float> output(output_size, 0.0f);

  for (std::size_t i = 0; i < output_size; ++i) {
    const double position = static_cast<double>(i) / ratio;
    const std::size_t index = static_cast<std::size_t>(position);
    const double frac = position - static_cast<double>(index);
    if (index + 1 < input.size()) {
      const float a = input[index];
      const float b = input[index + 1];
      output[i] = static_cast<float>((1.0 - frac) * a + frac * b);
    } else {
      output[i] = input.back();
    }
  }

  return output;
}

std::vector<float> make_hann_window(std::size_t size) {
  std::vector<float> window(size, 0.0f);
  if (size == 0) {
    return window;
  }
  if (size == 1) {
    window[0] = 1.0f;
    return window;
  }

  const double denom = static_cast<double>(size);
  for (std::size_t i = 0; i < size; ++i) {
    window[i] = static_cast<float>(
        0.5 * (1.0 - std::cos(2.0 * kPi * static_cast<double>(i) / denom)));
  }
  return window;
}

float hz_to_mel(float hz) { return 2595.0f * std::log10(1.0f + hz / 700.0f); }

float mel_to_hz(float mel) {
  return 700.0f * (std::pow(10.0f, mel / 2595.0f) - 1.0f);
}

std::vector<float> build_mel_filterbank(std::size_t mel_bins,
                                        std::size_t fft_bins,
                                        double sample_rate, float f_min,
                                        float f_max) {
  std::vector<float> filters(mel_bins * fft_bins, 0.0f);
  if (mel_bins == 0 || fft_bins < 2 || sample_rate <= 0.0) {
    return filters;
  }

  const float nyquist = static_cast<float>(sample_rate / 2.0);
  const float clamped_min = std::max(0.0f, f_min);
  const float clamped_max =
      (f_max <= 0.0f || f_max > nyquist) ? nyquist : f_max;

  const float mel_min = hz_to_mel(clamped_min);
  const float mel_max = hz_to_mel(clamped_max);
  std::vector<float> hz_points(mel_bins + 2);
  for (std::size_t i = 0; i < hz_points.size(); ++i) {
    const float t = static_cast<float>(i) / static_cast<float>(mel_bins + 1);
    hz_points[i] = mel_to_hz(mel_min + t * (mel_max - mel_min));
  }

  // fft_bins spans [0, nyquist] inclusive.
  const float bin_hz = nyquist / static_cast<float>(fft_bins - 1);
  for (std::size_t m = 0; m < mel_bins; ++m) {
    const float left = hz_points[m];
    const float center = hz_points[m + 1];
    const float right = hz_points[m + 2];
    for (std::size_t k = 0; k < fft_bins; ++k) {
      const float hz = static_cast<float>(k) * bin_hz;
      float weight = 0.0f;
      if (hz > left && hz < center) {
        weight = (hz - left) / std::max(center - left, 1e-6f);
      } else if (hz >= center && hz < right) {
        weight = (right - hz) / std::max(right - center, 1e-6f);
      }
      filters[m * fft_bins + k] = weight;
    }
  }

  return filters;
}

std::vector<float> dct_ii(const std::vector<float> &input, std::size_t count) {
  const std::size_t n = input.size();
  std::vector<float> output(count, 0.0f);
  if (n == 0) {
    return output;
  }

  const double scale0 = std::sqrt(1.0 / static_cast<double>(n));
  const double scale = std::sqrt(2.0 / static_cast<double>(n));
  for (std::size_t k = 0; k < count; ++k) {
    double sum = 0.0;
    for (std::size_t i = 0; i < n; ++i) {
      sum += input[i] * std::cos(kPi * static_cast<double>(k) *
                                 (2.0 * static_cast<double>(i) + 1.0) /
                                 (2.0 * static_cast<double>(n)));
    }
    output[k] = static_cast<float>(sum * (k == 0 ? scale0 : scale));
  }
  return output;
}

std::vector<float> median_filter(const std::vector<float> &input,
                                 std::size_t kernel) {
  if (input.empty() || kernel <= 1) {
    return input;
  }

  const std::size_t half = kernel / 2;
  std::vector<float> output(input.size(), 0.0f);
  std::vector<float> window;
  window.reserve(kernel);
  for (std::size_t i = 0; i < input.size(); ++i) {
    const std::size_t begin = (i > half) ? i - half : 0;
    const std::size_t end = std::min(input.size(), i + half + 1);
    window.assign(input.begin() + static_cast<long>(begin),
                  input.begin() + static_cast<long>(end));
    const std::size_t mid = window.size() / 2;
    std::nth_element(window.begin(), window.begin() + static_cast<long>(mid),
                     window.end());
    output[i] = window[mid];
  }
  return output;
}

float percentile(std::vector<float> values, float percent) {
  if (values.empty()) {
    return 0.0f;
  }
  std::sort(values.begin(), values.end());
  const float clamped = std::min(100.0f, std::max(0.0f, percent));
  const double position =
      static_cast<double>(clamped) / 100.0 * static_cast<double>(values.size() - 1);
  const std::size_t lower = static_cast<std::size_t>(std::floor(position));
  const std::size_t upper = std::min(values.size() - 1, lower + 1);
  const double frac = position - static_cast<double>(lower);
  return static_cast<float>((1.0 - frac) * values[lower] + frac * values[upper]);
}

std::vector<float> block_rms(const std::vector<float> &samples,
                             std::size_t block) {
  std::vector<float> rms;
  if (samples.empty() || block == 0) {
    return rms;
  }
  rms.reserve(samples.size() / block + 1);
  for (std::size_t start = 0; start < samples.size(); start += block) {
    const std::size_t end = std::min(samples.size(), start + block);
    double sum_sq = 0.0;
    for (std::size_t i = start; i < end; ++i) {
      sum_sq += static_cast<double>(samples[i]) * samples[i];
    }
    rms.push_back(static_cast<float>(
        std::sqrt(sum_sq / static_cast<double>(end - start))));
  }
  return rms;
}

} // namespace stemsep::detail
