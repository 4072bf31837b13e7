//
//  mel_torch.h
//  StutterScan
//
//  Created by the StutterScan Authors on 2026-01-23.
//  Copyright © 2026 StutterScan Authors. All rights reserved.
//

#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include <torch/torch.h>

#include "stutterscan/config.h"

namespace stutterscan::detail {

/// @brief Mel power spectrogram of `samples`, already at `config.sample_rate`.
///
/// Output is row-major [mel_bins x frames]. With `center_frames` the signal
/// is zero padded by half a frame on both sides before framing.
std::vector<float> compute_mel_power_torch(const std::vector<float>& samples,
                                           const FeatureConfig& config,
                                           const torch::Device& device,
                                           std::size_t* out_frames,
                                           std::string* error);

} // namespace stutterscan::detail
