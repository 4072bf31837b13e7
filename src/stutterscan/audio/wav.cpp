//
//  wav.cpp
//  StutterScan
//
//  Created by the StutterScan Authors on 2026-02-22.
//  Copyright © 2026 StutterScan Authors. All rights reserved.
//

#include "wav.h"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <fstream>
#include <limits>

#define DR_WAV_IMPLEMENTATION
#include <dr_wav.h>

namespace stutterscan::detail {
namespace {

constexpr std::uint16_t kFormatPcm = 1;

bool set_error(std::string* error, const char* message) {
    if (error) {
        *error = message;
    }
    return false;
}

} // namespace

bool write_wav_mono_16(const std::string& path,
                       const std::vector<float>& samples,
                       double sample_rate,
                       std::string* error) {
    if (samples.empty() || sample_rate <= 0.0) {
        return set_error(error, "Empty samples or invalid sample rate.");
    }

    std::ofstream out(path, std::ios::binary);
    if (!out.is_open()) {
        return set_error(error, "Failed to open WAV output.");
    }

    const std::uint16_t channels = 1;
    const std::uint16_t bits_per_sample = 16;
    const std::uint32_t sample_rate_u = static_cast<std::uint32_t>(std::lround(sample_rate));
    const std::uint32_t byte_rate = sample_rate_u * channels * (bits_per_sample / 8);
    const std::uint16_t block_align = channels * (bits_per_sample / 8);
    const std::uint32_t data_size =
        static_cast<std::uint32_t>(samples.size() * sizeof(std::int16_t));
    const std::uint32_t riff_size = 36 + data_size;

    out.write("RIFF", 4);
    out.write(reinterpret_cast<const char*>(&riff_size), sizeof(riff_size));
    out.write("WAVE", 4);

    out.write("fmt ", 4);
    const std::uint32_t fmt_size = 16;
    const std::uint16_t audio_format = kFormatPcm;
    out.write(reinterpret_cast<const char*>(&fmt_size), sizeof(fmt_size));
    out.write(reinterpret_cast<const char*>(&audio_format), sizeof(audio_format));
    out.write(reinterpret_cast<const char*>(&channels), sizeof(channels));
    out.write(reinterpret_cast<const char*>(&sample_rate_u), sizeof(sample_rate_u));
    out.write(reinterpret_cast<const char*>(&byte_rate), sizeof(byte_rate));
    out.write(reinterpret_cast<const char*>(&block_align), sizeof(block_align));
    out.write(reinterpret_cast<const char*>(&bits_per_sample), sizeof(bits_per_sample));

    out.write("data", 4);
    out.write(reinterpret_cast<const char*>(&data_size), sizeof(data_size));

    for (float sample : samples) {
        const float clamped = std::max(-1.0f, std::min(1.0f, sample));
        const std::int16_t value = static_cast<std::int16_t>(std::lround(clamped * 32767.0f));
        out.write(reinterpret_cast<const char*>(&value), sizeof(value));
    }

    if (!out.good()) {
        return set_error(error, "Failed to write WAV data.");
    }

    return true;
}

bool read_wav_mono(const std::string& path,
                   std::vector<float>* samples,
                   double* sample_rate,
                   std::string* error) {
    if (!samples || !sample_rate) {
        return set_error(error, "Missing output buffers.");
    }
    samples->clear();
    *sample_rate = 0.0;

    drwav wav;
    if (!drwav_init_file(&wav, path.c_str(), nullptr)) {
        return set_error(error, "Not a readable WAV file.");
    }
    const std::size_t channels = wav.channels;
    const drwav_uint64 frames = wav.totalPCMFrameCount;
    if (channels == 0 || wav.sampleRate == 0) {
        drwav_uninit(&wav);
        return set_error(error, "Invalid channel count or sample rate.");
    }
    if (frames > std::numeric_limits<std::size_t>::max() / channels) {
        drwav_uninit(&wav);
        return set_error(error, "WAV data too large.");
    }

    // dr_wav converts every PCM and IEEE float layout to interleaved float.
    std::vector<float> interleaved(static_cast<std::size_t>(frames) * channels);
    const drwav_uint64 frames_read =
        frames > 0 ? drwav_read_pcm_frames_f32(&wav, frames, interleaved.data()) : 0;
    *sample_rate = static_cast<double>(wav.sampleRate);
    drwav_uninit(&wav);
    if (frames_read < frames) {
        return set_error(error, "Truncated WAV data.");
    }

    samples->assign(static_cast<std::size_t>(frames_read), 0.0f);
    for (std::size_t i = 0; i < samples->size(); ++i) {
        const float* frame = interleaved.data() + i * channels;
        float sum = 0.0f;
        for (std::size_t c = 0; c < channels; ++c) {
            sum += frame[c];
        }
        (*samples)[i] = sum / static_cast<float>(channels);
    }
    return true;
}

} // namespace stutterscan::detail
