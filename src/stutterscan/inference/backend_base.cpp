//
//  backend_base.cpp
//  StutterScan
//
//  Created by the StutterScan Authors on 2026-02-22.
//  Copyright © 2026 StutterScan Authors. All rights reserved.
//

#include "backend.h"

#include <algorithm>
#include <cmath>

namespace stutterscan {
namespace detail {

void pack_classifier_input(const Spectrogram& spectrogram,
                           const ClassifierConfig& config,
                           std::vector<float>* data,
                           std::vector<int64_t>* shape) {
    if (!data || !shape) {
        return;
    }
    const std::size_t channels = std::max<std::size_t>(1, config.input_channels);
    const std::size_t height = spectrogram.height;
    const std::size_t width = spectrogram.width;
    const std::size_t plane = height * width;

    data->assign(channels * plane, 0.0f);
    if (config.input_layout == ClassifierConfig::InputLayout::NCHW) {
        for (std::size_t c = 0; c < channels; ++c) {
            std::copy(spectrogram.data.begin(), spectrogram.data.end(),
                      data->begin() + static_cast<long>(c * plane));
        }
        *shape = {1, static_cast<int64_t>(channels), static_cast<int64_t>(height),
                  static_cast<int64_t>(width)};
        return;
    }

    for (std::size_t i = 0; i < plane; ++i) {
        for (std::size_t c = 0; c < channels; ++c) {
            (*data)[i * channels + c] = spectrogram.data[i];
        }
    }
    *shape = {1, static_cast<int64_t>(height), static_cast<int64_t>(width),
              static_cast<int64_t>(channels)};
}

void softmax_in_place(std::vector<float>* values) {
    if (!values || values->empty()) {
        return;
    }
    const float peak = *std::max_element(values->begin(), values->end());
    double sum = 0.0;
    for (float& value : *values) {
        value = std::exp(value - peak);
        sum += value;
    }
    if (sum <= 0.0) {
        return;
    }
    for (float& value : *values) {
        value = static_cast<float>(value / sum);
    }
}

} // namespace detail
} // namespace stutterscan
