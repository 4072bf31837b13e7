//
//  dsp.cpp
//  StutterScan
//
//  Created by the StutterScan Authors on 2026-02-22.
//  Copyright © 2026 StutterScan Authors. All rights reserved.
//

#include "dsp.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <sstream>

namespace stutterscan::detail {
namespace {

constexpr float kSlaneyMinLogHz = 1000.0f;
constexpr float kSlaneyHzPerMel = 200.0f / 3.0f;
constexpr float kSlaneyMinLogMel = kSlaneyMinLogHz / kSlaneyHzPerMel;

float slaney_log_step() {
  return std::log(6.4f) / 27.0f;
}

// Linear sample position for output index `i` of an `out`-long axis that
// maps corner to corner onto an `in`-long axis.
double corner_aligned_position(std::size_t i, std::size_t in, std::size_t out) {
  if (out <= 1 || in <= 1) {
    return 0.0;
  }
  return static_cast<double>(i) * static_cast<double>(in - 1) /
         static_cast<double>(out - 1);
}

} // namespace

std::vector<float> resample_linear_mono(const std::vector<float> &input,
                                        double input_rate,
                                        std::size_t target_rate) {
  if (input_rate <= 0.0 || target_rate == 0 || input.empty()) {
    return {};
  }
  if (static_cast<std::size_t>(std::lround(input_rate)) == target_rate) {
    return input;
  }

  const double ratio = static_cast<double>(target_rate) / input_rate;
  const std::size_t output_size =
      static_cast<std::size_t>(std::lround(input.size() * ratio));
  std::vector<float> output(output_size, 0.0f);

  for (std::size_t i = 0; i < output_size; ++i) {
    const double position = static_cast<double>(i) / ratio;
    const std::size_t index = static_cast<std::size_t>(position);
    const double frac = position - static_cast<double>(index);
    if (index + 1 < input.size()) {
      const float a = input[index];
      const float b = input[index + 1];
      output[i] = static_cast<float>((1.0 - frac) * a + frac * b);
    } else if (index < input.size()) {
      output[i] = input[index];
    }
  }

  return output;
}

float hz_to_mel(float hz, FeatureConfig::MelScale scale) {
  if (scale == FeatureConfig::MelScale::Htk) {
    return 2595.0f * std::log10(1.0f + hz / 700.0f);
  }
  if (hz < kSlaneyMinLogHz) {
    return hz / kSlaneyHzPerMel;
  }
  return kSlaneyMinLogMel + std::log(hz / kSlaneyMinLogHz) / slaney_log_step();
}

float mel_to_hz(float mel, FeatureConfig::MelScale scale) {
  if (scale == FeatureConfig::MelScale::Htk) {
    return 700.0f * (std::pow(10.0f, mel / 2595.0f) - 1.0f);
  }
  if (mel < kSlaneyMinLogMel) {
    return mel * kSlaneyHzPerMel;
  }
  return kSlaneyMinLogHz * std::exp(slaney_log_step() * (mel - kSlaneyMinLogMel));
}

std::vector<float> build_mel_filterbank(std::size_t mel_bins,
                                        std::size_t fft_bins,
                                        double sample_rate, float f_min,
                                        float f_max,
                                        FeatureConfig::MelScale scale) {
  std::vector<float> filters(mel_bins * fft_bins, 0.0f);
  if (mel_bins == 0 || fft_bins < 2 || sample_rate <= 0.0) {
    return filters;
  }

  const float nyquist = static_cast<float>(sample_rate / 2.0);
  const float clamped_min = std::max(0.0f, f_min);
  const float clamped_max =
      (f_max <= 0.0f || f_max > nyquist) ? nyquist : f_max;
  if (clamped_max <= clamped_min) {
    return filters;
  }

  const float mel_min = hz_to_mel(clamped_min, scale);
  const float mel_max = hz_to_mel(clamped_max, scale);
  std::vector<float> hz_points(mel_bins + 2);
  for (std::size_t i = 0; i < hz_points.size(); ++i) {
    const float t = static_cast<float>(i) / static_cast<float>(mel_bins + 1);
    hz_points[i] = mel_to_hz(mel_min + t * (mel_max - mel_min), scale);
  }

  // fft_bins spans 0 .. nyquist inclusive.
  const float bin_hz = nyquist / static_cast<float>(fft_bins - 1);

  for (std::size_t m = 0; m < mel_bins; ++m) {
    const float left = hz_points[m];
    const float center = hz_points[m + 1];
    const float right = hz_points[m + 2];
    const float norm = (scale == FeatureConfig::MelScale::Slaney)
                           ? 2.0f / (right - left)
                           : 1.0f;
    for (std::size_t k = 0; k < fft_bins; ++k) {
      const float hz = static_cast<float>(k) * bin_hz;
      float weight = 0.0f;
      if (hz > left && hz <= center && center > left) {
        weight = (hz - left) / (center - left);
      } else if (hz > center && hz < right && right > center) {
        weight = (right - hz) / (right - center);
      }
      filters[m * fft_bins + k] = weight * norm;
    }
  }

  return filters;
}

bool apply_preemphasis(std::vector<float> *samples, float coef,
                       std::string *error) {
  if (!samples || samples->size() < 2) {
    if (error) {
      *error = "pre-emphasis needs at least two samples";
    }
    return false;
  }
  if (!std::isfinite(coef)) {
    if (error) {
      *error = "pre-emphasis coefficient is not finite";
    }
    return false;
  }

  std::vector<float> &x = *samples;
  const float initial = 2.0f * x[0] - x[1];
  float previous = x[0];
  x[0] = x[0] - coef * initial;
  for (std::size_t i = 1; i < x.size(); ++i) {
    const float current = x[i];
    x[i] = current - coef * previous;
    previous = current;
  }
  return true;
}

void power_to_db(std::vector<float> *values, float top_db) {
  if (!values || values->empty()) {
    return;
  }
  constexpr float kAmin = 1e-10f;
  const float peak = std::max(kAmin, *std::max_element(values->begin(), values->end()));
  const float ref_db = 10.0f * std::log10(peak);
  float max_db = -std::numeric_limits<float>::infinity();
  for (float &value : *values) {
    value = 10.0f * std::log10(std::max(kAmin, value)) - ref_db;
    max_db = std::max(max_db, value);
  }
  const float floor_db = max_db - top_db;
  for (float &value : *values) {
    value = std::max(value, floor_db);
  }
}

bool resize_bilinear(const std::vector<float> &input, std::size_t height,
                     std::size_t width, std::size_t target_height,
                     std::size_t target_width, std::vector<float> *output,
                     std::string *error) {
  if (!output) {
    return false;
  }
  output->clear();
  if (height == 0 || width == 0 || input.size() != height * width) {
    if (error) {
      std::ostringstream msg;
      msg << "Invalid spectrogram dimensions: " << height << "x" << width;
      *error = msg.str();
    }
    return false;
  }

  const double height_scale =
      static_cast<double>(target_height) / static_cast<double>(height);
  const double width_scale =
      static_cast<double>(target_width) / static_cast<double>(width);
  if (!(height_scale > 0.0) || !(width_scale > 0.0)) {
    if (error) {
      std::ostringstream msg;
      msg << "Invalid scaling factors: height=" << height_scale
          << ", width=" << width_scale;
      *error = msg.str();
    }
    return false;
  }

  // Zoomed size, never smaller than the target so the crop below is exact.
  const std::size_t zoom_height = std::max(
      target_height,
      static_cast<std::size_t>(std::llround(height * height_scale)));
  const std::size_t zoom_width = std::max(
      target_width,
      static_cast<std::size_t>(std::llround(width * width_scale)));

  output->assign(target_height * target_width, 0.0f);
  for (std::size_t y = 0; y < target_height; ++y) {
    const double sy = corner_aligned_position(y, height, zoom_height);
    const std::size_t y0 = std::min(static_cast<std::size_t>(sy), height - 1);
    const std::size_t y1 = std::min(y0 + 1, height - 1);
    const double fy = sy - static_cast<double>(y0);
    for (std::size_t x = 0; x < target_width; ++x) {
      const double sx = corner_aligned_position(x, width, zoom_width);
      const std::size_t x0 = std::min(static_cast<std::size_t>(sx), width - 1);
      const std::size_t x1 = std::min(x0 + 1, width - 1);
      const double fx = sx - static_cast<double>(x0);

      const double top = (1.0 - fx) * input[y0 * width + x0] +
                         fx * input[y0 * width + x1];
      const double bottom = (1.0 - fx) * input[y1 * width + x0] +
                            fx * input[y1 * width + x1];
      (*output)[y * target_width + x] =
          static_cast<float>((1.0 - fy) * top + fy * bottom);
    }
  }
  return true;
}

} // namespace stutterscan::detail
