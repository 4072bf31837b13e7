//
//  backend.h
//  StutterScan
//
//  Created by the StutterScan Authors on 2026-02-22.
//  Copyright © 2026 StutterScan Authors. All rights reserved.
//

#pragma once

#include "stutterscan/classifier.h"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace stutterscan {
namespace detail {

/// @brief Lay a spectrogram out as the model input tensor.
///
/// Channels replicate the single spectrogram plane. The shape is
/// {1, C, H, W} for NCHW and {1, H, W, C} for NHWC.
void pack_classifier_input(const Spectrogram& spectrogram,
                           const ClassifierConfig& config,
                           std::vector<float>* data,
                           std::vector<int64_t>* shape);

void softmax_in_place(std::vector<float>* values);

std::unique_ptr<Classifier> make_torch_classifier(const ClassifierConfig& config,
                                                  std::vector<std::string> class_names,
                                                  Error* error);

/// @brief Fails with `Classifier` unless the ONNX output element type is float32.
bool check_onnx_output_type(int element_type, Error* error);

std::unique_ptr<Classifier> make_onnx_classifier(const ClassifierConfig& config,
                                                 std::vector<std::string> class_names,
                                                 Error* error);

} // namespace detail
} // namespace stutterscan
