//
//  features.h
//  StutterScan
//
//  Created by the StutterScan Authors on 2026-03-03.
//  Copyright © 2026 StutterScan Authors. All rights reserved.
//

#pragma once

#include "stutterscan/config.h"
#include "stutterscan/errors.h"

#include <cstddef>
#include <vector>

namespace stutterscan {

/// @brief Normalized time-frequency image, row-major [height x width].
///
/// Rows are mel bands (lowest first), columns are frames. Values are in
/// [0, 1].
struct Spectrogram {
    std::size_t height = 0;
    std::size_t width = 0;
    std::vector<float> data;

    bool empty() const { return data.empty(); }
    float at(std::size_t row, std::size_t column) const { return data[row * width + column]; }
};

/// @brief Turns one window of audio into a fixed-size Spectrogram.
///
/// Pipeline: resample to the analysis rate, clip to `max_duration_ms`,
/// pre-emphasis, mel power spectrogram, dB conversion, bilinear resize to
/// the target size, normalization to [0, 1].
class FeatureExtractor {
public:
    FeatureExtractor(const FeatureConfig& config, std::size_t max_duration_ms);

    const FeatureConfig& config() const { return config_; }

    bool extract(const std::vector<float>& samples,
                 double sample_rate,
                 Spectrogram* out,
                 Error* error) const;

private:
    FeatureConfig config_;
    std::size_t max_duration_ms_ = 0;
};

} // namespace stutterscan
