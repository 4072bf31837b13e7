//
//  config.cpp
//  StutterScan
//
//  Created by the StutterScan Authors on 2026-03-02.
//  Copyright © 2026 StutterScan Authors. All rights reserved.
//

#include "stutterscan/config.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <filesystem>
#include <sstream>

namespace stutterscan {
namespace {

std::string lower_extension(const std::string& path) {
    std::string ext = std::filesystem::path(path).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return ext;
}

} // namespace

const std::vector<std::string>& default_class_names() {
    static const std::vector<std::string> names{"blocks", "prolongations", "repetitions"};
    return names;
}

std::size_t segment_step_ms(const SegmenterConfig& config) {
    // Ratios like 0.1 or 0.3 are not exact in binary; the epsilon keeps
    // 3000 * (1 - 0.1) at 2700 instead of 2699.
    const double step = static_cast<double>(config.segment_ms) * (1.0 - config.overlap_ratio);
    return static_cast<std::size_t>(std::floor(std::max(0.0, step) + 1e-9));
}

bool validate_config(const DetectorConfig& config, Error* error) {
    const SegmenterConfig& seg = config.segmenter;
    if (seg.segment_ms == 0) {
        return fail(error, ErrorCode::Validation, "segment duration must be positive");
    }
    if (!(seg.overlap_ratio >= 0.0 && seg.overlap_ratio < 1.0)) {
        std::ostringstream msg;
        msg << "overlap_ratio must be in [0, 1), got " << seg.overlap_ratio;
        return fail(error, ErrorCode::Validation, msg.str());
    }
    if (seg.min_segment_ms == 0) {
        return fail(error, ErrorCode::Validation, "min segment duration must be positive");
    }
    if (seg.min_segment_ms > seg.segment_ms) {
        std::ostringstream msg;
        msg << "min segment duration (" << seg.min_segment_ms
            << "ms) cannot exceed segment duration (" << seg.segment_ms << "ms)";
        return fail(error, ErrorCode::Validation, msg.str());
    }
    if (segment_step_ms(seg) == 0) {
        return fail(error, ErrorCode::Validation, "segment step rounds to 0ms");
    }
    if (!(seg.pad_to_full_ratio > 0.0 && seg.pad_to_full_ratio <= 1.0)) {
        return fail(error, ErrorCode::Validation, "pad_to_full_ratio must be in (0, 1]");
    }

    const FeatureConfig& feat = config.features;
    if (feat.sample_rate == 0 || feat.frame_size == 0 || feat.hop_size == 0 || feat.mel_bins == 0) {
        return fail(error, ErrorCode::Validation, "feature config missing mel parameters");
    }
    if (feat.target_height == 0 || feat.target_width == 0) {
        return fail(error, ErrorCode::Validation, "target size values must be positive");
    }
    if (feat.top_db <= 0.0f) {
        return fail(error, ErrorCode::Validation, "top_db must be positive");
    }
    const float nyquist = static_cast<float>(feat.sample_rate) / 2.0f;
    const float f_max = feat.f_max > 0.0f ? feat.f_max : nyquist;
    if (feat.f_min < 0.0f || f_max <= feat.f_min) {
        return fail(error, ErrorCode::Validation, "mel frequency range is empty");
    }

    const ClassifierConfig& cls = config.classifier;
    if (cls.input_channels != 1 && cls.input_channels != 3) {
        return fail(error, ErrorCode::Validation, "input_channels must be 1 or 3");
    }

    const AggregatorConfig& agg = config.aggregator;
    if (!(agg.confidence_threshold >= 0.0f && agg.confidence_threshold <= 1.0f)) {
        return fail(error, ErrorCode::Validation, "confidence threshold must be in [0, 1]");
    }

    if (config.runtime.worker_count == 0) {
        return fail(error, ErrorCode::Validation, "worker_count must be at least 1");
    }
    return true;
}

ClassifierConfig::Backend resolve_backend(const ClassifierConfig& config) {
    if (config.backend != ClassifierConfig::Backend::Auto) {
        return config.backend;
    }
    const std::string ext = lower_extension(config.model_path);
    if (ext == ".onnx" || ext == ".ort") {
        return ClassifierConfig::Backend::Onnx;
    }
    return ClassifierConfig::Backend::TorchScript;
}

const char* backend_name(ClassifierConfig::Backend backend) {
    switch (backend) {
        case ClassifierConfig::Backend::Auto:
            return "auto";
        case ClassifierConfig::Backend::TorchScript:
            return "torchscript";
        case ClassifierConfig::Backend::Onnx:
            return "onnx";
    }
    return "auto";
}

} // namespace stutterscan
