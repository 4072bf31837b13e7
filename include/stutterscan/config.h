//
//  config.h
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

struct SegmenterConfig {
    std::size_t segment_ms = 3000;
    double overlap_ratio = 0.5;
    std::size_t min_segment_ms = 1000;
    // Windows at least this fraction of segment_ms long are padded up to it.
    double pad_to_full_ratio = 0.8;
};

struct FeatureConfig {
    std::size_t sample_rate = 22050;
    std::size_t frame_size = 2048;
    std::size_t hop_size = 512;
    std::size_t mel_bins = 128;
    float f_min = 50.0f;
    // 0 selects the Nyquist frequency of the analysis rate.
    float f_max = 0.0f;
    float preemphasis = 0.97f;
    float top_db = 80.0f;
    bool center_frames = true;
    enum class MelScale {
        Htk,
        Slaney,
    };
    MelScale mel_scale = MelScale::Slaney;
    std::size_t target_height = 128;
    std::size_t target_width = 128;
};

struct ClassifierConfig {
    enum class Backend {
        Auto,
        TorchScript,
        Onnx,
    };
    Backend backend = Backend::Auto;
    std::string model_path;
    // Empty: read class_names.txt beside the model, else the defaults.
    std::vector<std::string> class_names;
    enum class InputLayout {
        NCHW,
        NHWC,
    };
    InputLayout input_layout = InputLayout::NHWC;
    // Image-trained models expect the spectrogram replicated over 3 channels.
    std::size_t input_channels = 1;
    bool apply_softmax = false;
    std::string torch_device = "cpu";
    int onnx_intra_op_threads = 1;
};

struct AggregatorConfig {
    enum class Mode {
        Coarse,
        Precise,
    };
    Mode mode = Mode::Coarse;
    float confidence_threshold = 0.3f;
    std::string source = "cnn_model";
    std::string precise_source = "cnn_model_precise";
    // Empty: derived from the classifier backend.
    std::string model_version;
};

enum class WindowErrorPolicy {
    Skip,
    Abort,
};

struct RuntimeConfig {
    WindowErrorPolicy on_window_error = WindowErrorPolicy::Skip;
    std::size_t worker_count = 1;
    // Non-empty enables the debug sink (window WAVs + spectrogram PGMs).
    std::string debug_output_dir;
    bool verbose = false;
    bool profile = false;
};

struct DetectorConfig {
    SegmenterConfig segmenter;
    FeatureConfig features;
    ClassifierConfig classifier;
    AggregatorConfig aggregator;
    RuntimeConfig runtime;
};

const std::vector<std::string>& default_class_names();

/// @brief Check every invariant the pipeline relies on before a run.
bool validate_config(const DetectorConfig& config, Error* error);

/// @brief Resolve `Backend::Auto` from the model path extension.
ClassifierConfig::Backend resolve_backend(const ClassifierConfig& config);

const char* backend_name(ClassifierConfig::Backend backend);

/// @brief Segment step in milliseconds, `floor(segment_ms * (1 - overlap))`.
std::size_t segment_step_ms(const SegmenterConfig& config);

} // namespace stutterscan
