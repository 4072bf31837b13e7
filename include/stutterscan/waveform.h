//
//  waveform.h
//  StutterScan
//
//  Created by the StutterScan Authors on 2026-03-02.
//  Copyright © 2026 StutterScan Authors. All rights reserved.
//

#pragma once

#include "stutterscan/errors.h"

#include <cstddef>
#include <string>
#include <vector>

namespace stutterscan {

/// @brief Mono recording at its native sample rate.
struct Waveform {
    std::vector<float> samples;
    double sample_rate = 0.0;

    bool empty() const { return samples.empty() || sample_rate <= 0.0; }

    /// @brief Duration rounded to whole milliseconds.
    std::size_t duration_ms() const;
};

/// @brief Convert a millisecond offset to a sample index at `sample_rate`.
std::size_t ms_to_samples(std::size_t ms, double sample_rate);

/// @brief Load a RIFF/WAVE file and downmix it to mono.
///
/// Reports `NotFound`, `Permission`, `Decode` or `EmptyInput`.
bool load_waveform(const std::string& path, Waveform* out, Error* error);

} // namespace stutterscan
