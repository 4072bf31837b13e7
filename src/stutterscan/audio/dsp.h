//
//  dsp.h
//  StutterScan
//
//  Created by the StutterScan Authors on 2026-02-22.
//  Copyright © 2026 StutterScan Authors. All rights reserved.
//

#pragma once

#include "stutterscan/config.h"

#include <cstddef>
#include <string>
#include <vector>

namespace stutterscan::detail {

std::vector<float> resample_linear_mono(const std::vector<float> &input,
                                        double input_rate,
                                        std::size_t target_rate);

float hz_to_mel(float hz, FeatureConfig::MelScale scale);

float mel_to_hz(float mel, FeatureConfig::MelScale scale);

// Row-major [mel_bins x fft_bins] triangular filters. Slaney scale filters
// are area normalized.
std::vector<float> build_mel_filterbank(std::size_t mel_bins,
                                        std::size_t fft_bins,
                                        double sample_rate, float f_min,
                                        float f_max,
                                        FeatureConfig::MelScale scale);

// y[0] = x[0] - coef * (2 x[0] - x[1]), y[n] = x[n] - coef * x[n - 1].
bool apply_preemphasis(std::vector<float> *samples, float coef,
                       std::string *error);

// In-place 10 * log10(power / max), floored at -top_db.
void power_to_db(std::vector<float> *values, float top_db);

// Order-1 zoom of a row-major [height x width] grid to exactly
// [target_height x target_width].
bool resize_bilinear(const std::vector<float> &input, std::size_t height,
                     std::size_t width, std::size_t target_height,
                     std::size_t target_width, std::vector<float> *output,
                     std::string *error);

} // namespace stutterscan::detail
