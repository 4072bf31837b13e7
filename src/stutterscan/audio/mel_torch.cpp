//
//  mel_torch.cpp
//  StutterScan
//
//  Created by the StutterScan Authors on 2026-01-23.
//  Copyright © 2026 StutterScan Authors. All rights reserved.
//

#include "mel_torch.h"

#include "dsp.h"

#include <cstring>

namespace stutterscan::detail {

std::vector<float> compute_mel_power_torch(const std::vector<float>& samples,
                                           const FeatureConfig& config,
                                           const torch::Device& device,
                                           std::size_t* out_frames,
                                           std::string* error) {
    if (out_frames) {
        *out_frames = 0;
    }
    if (samples.empty()) {
        if (error) {
            *error = "No samples to analyse.";
        }
        return {};
    }
    if (config.sample_rate == 0 || config.frame_size == 0 || config.hop_size == 0 ||
        config.mel_bins == 0) {
        if (error) {
            *error = "Config missing mel parameters.";
        }
        return {};
    }

    const int64_t frame_size = static_cast<int64_t>(config.frame_size);
    const int64_t hop_size = static_cast<int64_t>(config.hop_size);

    const auto options = torch::TensorOptions().dtype(torch::kFloat32).device(device);
    torch::Tensor audio =
        torch::from_blob(const_cast<float*>(samples.data()),
                         {static_cast<long long>(samples.size())},
                         torch::kFloat32)
            .to(options)
            .clone();

    if (config.center_frames) {
        audio = torch::constant_pad_nd(audio, {frame_size / 2, frame_size / 2}, 0.0);
    }
    if (audio.size(0) < frame_size) {
        if (error) {
            *error = "Audio shorter than frame size.";
        }
        return {};
    }

    torch::Tensor window = torch::hann_window(frame_size, options);
    torch::Tensor framed = audio.unfold(0, frame_size, hop_size) * window;
    const std::size_t frames = static_cast<std::size_t>(framed.size(0));

    torch::Tensor spectrum = torch::fft::rfft(framed, frame_size);
    torch::Tensor power = torch::abs(spectrum).pow(2.0f);

    const std::size_t fft_bins = config.frame_size / 2 + 1;
    std::vector<float> mel_filters =
        build_mel_filterbank(config.mel_bins,
                             fft_bins,
                             static_cast<double>(config.sample_rate),
                             config.f_min,
                             config.f_max,
                             config.mel_scale);
    torch::Tensor mel_filter =
        torch::from_blob(mel_filters.data(),
                         {static_cast<long long>(config.mel_bins),
                          static_cast<long long>(fft_bins)},
                         torch::kFloat32)
            .to(options)
            .clone();

    // [mel_bins x fft_bins] @ [fft_bins x frames]
    torch::Tensor mel = torch::matmul(mel_filter, power.transpose(0, 1));

    torch::Tensor mel_cpu = mel.to(torch::kCPU).contiguous();
    std::vector<float> output(static_cast<std::size_t>(mel_cpu.numel()));
    std::memcpy(output.data(), mel_cpu.data_ptr<float>(), output.size() * sizeof(float));

    if (out_frames) {
        *out_frames = frames;
    }
    return output;
}

} // namespace stutterscan::detail
