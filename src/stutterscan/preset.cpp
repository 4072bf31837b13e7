//
//  preset.cpp
//  StutterScan
//
//  Created by the StutterScan Authors on 2026-01-17.
//  Copyright © 2026 StutterScan Authors. All rights reserved.
//

#include "stutterscan/preset.h"

#include <algorithm>
#include <cctype>

namespace stutterscan {
namespace {

// Values the shipped classifiers were trained against.
class StandardPreset : public DetectorPreset {
public:
    const char* name() const override {
        return "standard";
    }

    void apply(DetectorConfig& config) const override {
        config.segmenter.segment_ms = 3000;
        config.segmenter.overlap_ratio = 0.5;
        config.segmenter.min_segment_ms = 1000;
        config.features.sample_rate = 22050;
        config.features.frame_size = 2048;
        config.features.hop_size = 512;
        config.features.mel_bins = 128;
        config.features.f_min = 50.0f;
        config.features.f_max = 0.0f;
        config.features.top_db = 80.0f;
        config.features.mel_scale = FeatureConfig::MelScale::Slaney;
        config.features.target_height = 128;
        config.features.target_width = 128;
    }
};

class PerformancePreset : public DetectorPreset {
public:
    const char* name() const override {
        return "performance";
    }

    void apply(DetectorConfig& config) const override {
        StandardPreset().apply(config);
        config.features.frame_size = 1536;
        config.features.hop_size = 256;
        config.features.mel_bins = 96;
        config.features.f_max = 8000.0f;
        config.runtime.worker_count = 4;
    }
};

class HighQualityPreset : public DetectorPreset {
public:
    const char* name() const override {
        return "high_quality";
    }

    void apply(DetectorConfig& config) const override {
        StandardPreset().apply(config);
        config.features.frame_size = 2048;
        config.features.hop_size = 128;
        config.features.mel_bins = 160;
        config.segmenter.overlap_ratio = 0.75;
    }
};

std::string to_lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

} // namespace

std::unique_ptr<DetectorPreset> make_detector_preset(const std::string& name) {
    const std::string key = to_lower(name);
    if (key == "standard" || key == "balanced") {
        return std::make_unique<StandardPreset>();
    }
    if (key == "performance") {
        return std::make_unique<PerformancePreset>();
    }
    if (key == "high_quality") {
        return std::make_unique<HighQualityPreset>();
    }
    return nullptr;
}

std::vector<std::string> detector_preset_names() {
    return {"standard", "performance", "high_quality"};
}

} // namespace stutterscan
