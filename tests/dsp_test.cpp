//
//  dsp_test.cpp
//  StutterScan
//
//  Created by the StutterScan Authors on 2026-03-03.
//  Copyright © 2026 StutterScan Authors. All rights reserved.
//

#include "audio/dsp.h"

#include <cmath>
#include <iostream>
#include <random>
#include <string>
#include <vector>

namespace {

bool near(float a, float b, float tolerance) {
    return std::fabs(a - b) <= tolerance;
}

bool test_resize_is_identity_at_target_size() {
    std::mt19937 rng(7);
    std::uniform_real_distribution<float> dist(-80.0f, 0.0f);
    std::vector<float> input(128 * 128);
    for (float& value : input) {
        value = dist(rng);
    }

    std::vector<float> output;
    std::string error;
    if (!stutterscan::detail::resize_bilinear(input, 128, 128, 128, 128, &output, &error)) {
        std::cerr << "DSP test failed: resize rejected valid input: " << error << "\n";
        return false;
    }
    if (output != input) {
        std::cerr << "DSP test failed: resize at target size changed values.\n";
        return false;
    }
    return true;
}

bool test_resize_produces_target_shape_and_keeps_corners() {
    const std::size_t height = 96;
    const std::size_t width = 44;
    std::vector<float> input(height * width);
    for (std::size_t y = 0; y < height; ++y) {
        for (std::size_t x = 0; x < width; ++x) {
            input[y * width + x] = static_cast<float>(y) + 0.01f * static_cast<float>(x);
        }
    }

    std::vector<float> output;
    std::string error;
    if (!stutterscan::detail::resize_bilinear(input, height, width, 128, 128, &output, &error)) {
        std::cerr << "DSP test failed: resize rejected valid input: " << error << "\n";
        return false;
    }
    if (output.size() != 128 * 128) {
        std::cerr << "DSP test failed: resize produced " << output.size() << " values.\n";
        return false;
    }
    if (!near(output.front(), input.front(), 1e-5f) ||
        !near(output.back(), input.back(), 1e-4f)) {
        std::cerr << "DSP test failed: resize moved the corners.\n";
        return false;
    }
    // Linear ramp along both axes stays linear.
    const float mid = output[64 * 128 + 64];
    const float expected = 64.0f * 95.0f / 127.0f + 0.01f * (64.0f * 43.0f / 127.0f);
    if (!near(mid, expected, 1e-3f)) {
        std::cerr << "DSP test failed: interpolated value " << mid << " expected " << expected
                  << ".\n";
        return false;
    }
    return true;
}

bool test_resize_rejects_empty_source() {
    std::vector<float> output;
    std::string error;
    if (stutterscan::detail::resize_bilinear({}, 0, 10, 128, 128, &output, &error)) {
        std::cerr << "DSP test failed: resize accepted empty source.\n";
        return false;
    }
    if (error.empty()) {
        std::cerr << "DSP test failed: resize failure has no message.\n";
        return false;
    }
    return true;
}

bool test_preemphasis_uses_reflected_initial_condition() {
    std::vector<float> samples{1.0f, 2.0f, 3.0f};
    std::string error;
    if (!stutterscan::detail::apply_preemphasis(&samples, 0.97f, &error)) {
        std::cerr << "DSP test failed: pre-emphasis rejected input: " << error << "\n";
        return false;
    }
    if (!near(samples[0], 1.0f, 1e-6f) || !near(samples[1], 1.03f, 1e-6f) ||
        !near(samples[2], 1.06f, 1e-6f)) {
        std::cerr << "DSP test failed: unexpected pre-emphasis output.\n";
        return false;
    }

    std::vector<float> single{0.5f};
    if (stutterscan::detail::apply_preemphasis(&single, 0.97f, &error)) {
        std::cerr << "DSP test failed: pre-emphasis accepted one sample.\n";
        return false;
    }
    if (single[0] != 0.5f) {
        std::cerr << "DSP test failed: failed pre-emphasis modified input.\n";
        return false;
    }
    return true;
}

bool test_power_to_db_is_relative_to_peak_and_floored() {
    std::vector<float> values{1.0f, 0.1f, 1e-12f, 0.0f};
    stutterscan::detail::power_to_db(&values, 80.0f);
    if (!near(values[0], 0.0f, 1e-5f) || !near(values[1], -10.0f, 1e-4f) ||
        !near(values[2], -80.0f, 1e-4f) || !near(values[3], -80.0f, 1e-4f)) {
        std::cerr << "DSP test failed: unexpected dB values.\n";
        return false;
    }
    return true;
}

bool test_slaney_mel_scale_round_trips() {
    using Scale = stutterscan::FeatureConfig::MelScale;
    if (!near(stutterscan::detail::hz_to_mel(1000.0f, Scale::Slaney), 15.0f, 1e-4f)) {
        std::cerr << "DSP test failed: 1 kHz should be 15 Slaney mels.\n";
        return false;
    }
    for (float hz : {50.0f, 440.0f, 1000.0f, 4000.0f, 11025.0f}) {
        for (Scale scale : {Scale::Slaney, Scale::Htk}) {
            const float back = stutterscan::detail::mel_to_hz(
                stutterscan::detail::hz_to_mel(hz, scale), scale);
            if (!near(back, hz, hz * 1e-4f)) {
                std::cerr << "DSP test failed: mel round trip drifted at " << hz << " Hz.\n";
                return false;
            }
        }
    }
    return true;
}

bool test_mel_filterbank_covers_band() {
    const std::size_t mel_bins = 128;
    const std::size_t fft_bins = 1025;
    const auto filters = stutterscan::detail::build_mel_filterbank(
        mel_bins, fft_bins, 22050.0, 50.0f, 0.0f, stutterscan::FeatureConfig::MelScale::Slaney);
    if (filters.size() != mel_bins * fft_bins) {
        std::cerr << "DSP test failed: filterbank has wrong size.\n";
        return false;
    }
    for (std::size_t m = 0; m < mel_bins; ++m) {
        float sum = 0.0f;
        for (std::size_t k = 0; k < fft_bins; ++k) {
            const float weight = filters[m * fft_bins + k];
            if (weight < 0.0f) {
                std::cerr << "DSP test failed: negative filter weight.\n";
                return false;
            }
            sum += weight;
        }
        if (sum <= 0.0f) {
            std::cerr << "DSP test failed: mel band " << m << " is empty.\n";
            return false;
        }
    }
    // Nothing below f_min.
    if (filters[0] != 0.0f || filters[1] != 0.0f) {
        std::cerr << "DSP test failed: filterbank leaks below f_min.\n";
        return false;
    }
    return true;
}

bool test_resample_changes_length_by_rate_ratio() {
    std::vector<float> input(44100, 0.5f);
    const auto output = stutterscan::detail::resample_linear_mono(input, 44100.0, 22050);
    if (output.size() != 22050) {
        std::cerr << "DSP test failed: resample produced " << output.size() << " samples.\n";
        return false;
    }
    if (!near(output[1000], 0.5f, 1e-6f)) {
        std::cerr << "DSP test failed: resample changed a constant signal.\n";
        return false;
    }
    return true;
}

} // namespace

int main() {
    if (!test_resize_is_identity_at_target_size()) {
        return 1;
    }
    if (!test_resize_produces_target_shape_and_keeps_corners()) {
        return 1;
    }
    if (!test_resize_rejects_empty_source()) {
        return 1;
    }
    if (!test_preemphasis_uses_reflected_initial_condition()) {
        return 1;
    }
    if (!test_power_to_db_is_relative_to_peak_and_floored()) {
        return 1;
    }
    if (!test_slaney_mel_scale_round_trips()) {
        return 1;
    }
    if (!test_mel_filterbank_covers_band()) {
        return 1;
    }
    if (!test_resample_changes_length_by_rate_ratio()) {
        return 1;
    }

    std::cout << "DSP test passed.\n";
    return 0;
}
