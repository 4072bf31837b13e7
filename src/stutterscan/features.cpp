//
//  features.cpp
//  StutterScan
//
//  Created by the StutterScan Authors on 2026-03-03.
//  Copyright © 2026 StutterScan Authors. All rights reserved.
//

#include "stutterscan/features.h"

#include "audio/dsp.h"
#include "audio/mel_torch.h"
#include "stutterscan/logging.hpp"
#include "stutterscan/waveform.h"

#include <algorithm>
#include <cmath>
#include <exception>
#include <new>
#include <utility>

#include <torch/torch.h>

namespace stutterscan {

FeatureExtractor::FeatureExtractor(const FeatureConfig& config, std::size_t max_duration_ms)
    : config_(config), max_duration_ms_(max_duration_ms) {}

bool FeatureExtractor::extract(const std::vector<float>& samples,
                               double sample_rate,
                               Spectrogram* out,
                               Error* error) const {
    if (!out) {
        return fail(error, ErrorCode::Feature, "missing spectrogram output");
    }
    *out = Spectrogram{};
    if (samples.empty() || sample_rate <= 0.0) {
        return fail(error, ErrorCode::Feature, "empty window or invalid sample rate");
    }
    if (config_.target_height == 0 || config_.target_width == 0) {
        return fail(error, ErrorCode::Feature, "target spectrogram size is zero");
    }

    std::vector<float> audio =
        detail::resample_linear_mono(samples, sample_rate, config_.sample_rate);
    if (max_duration_ms_ > 0) {
        const std::size_t max_samples = ms_to_samples(max_duration_ms_, static_cast<double>(config_.sample_rate));
        if (audio.size() > max_samples) {
            audio.resize(max_samples);
        }
    }
    if (audio.empty()) {
        return fail(error, ErrorCode::Feature, "window is empty after resampling");
    }

    std::vector<float> emphasized = audio;
    std::string preemphasis_error;
    if (detail::apply_preemphasis(&emphasized, config_.preemphasis, &preemphasis_error)) {
        audio.swap(emphasized);
    } else {
        STUTTERSCAN_LOG_WARN("Pre-emphasis skipped: " << preemphasis_error);
    }

    std::size_t frames = 0;
    std::string mel_error;
    std::vector<float> mel;
    try {
        mel = detail::compute_mel_power_torch(audio, config_, torch::Device(torch::kCPU),
                                              &frames, &mel_error);
    } catch (const std::bad_alloc&) {
        throw;
    } catch (const std::exception& ex) {
        return fail(error, ErrorCode::Feature, std::string("mel computation failed: ") + ex.what());
    }
    if (mel.empty() || frames == 0) {
        return fail(error, ErrorCode::Feature, "mel computation failed: " + mel_error);
    }

    detail::power_to_db(&mel, config_.top_db);

    std::vector<float> resized;
    std::string resize_error;
    if (!detail::resize_bilinear(mel, config_.mel_bins, frames,
                                 config_.target_height, config_.target_width,
                                 &resized, &resize_error)) {
        return fail(error, ErrorCode::Feature, resize_error);
    }

    const float top_db = config_.top_db;
    for (float& value : resized) {
        value = std::clamp((value + top_db) / top_db, 0.0f, 1.0f);
    }

    STUTTERSCAN_LOG_DEBUG("Spectrogram " << config_.mel_bins << "x" << frames << " -> "
                                         << config_.target_height << "x" << config_.target_width);

    out->height = config_.target_height;
    out->width = config_.target_width;
    out->data = std::move(resized);
    return true;
}

} // namespace stutterscan
