//
//  wav_test.cpp
//  StutterScan
//
//  Created by the StutterScan Authors on 2026-02-20.
//  Copyright © 2026 StutterScan Authors. All rights reserved.
//

#include "stutterscan/waveform.h"
#include "audio/wav.h"
#include "synthetic_audio_test_utils.h"

#include <cmath>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

namespace {

namespace synthetic = stutterscan::tests::synthetic_audio;

bool test_pcm16_mono_load() {
    const std::string path = synthetic::temp_path("wav_mono.wav").string();
    const std::vector<float> sine = synthetic::make_sine(16000.0, 440.0, 1.5, 0.5f);
    synthetic::write_pcm16_wav(path, sine, 16000);

    stutterscan::Waveform waveform;
    stutterscan::Error error;
    const bool ok = stutterscan::load_waveform(path, &waveform, &error);
    std::remove(path.c_str());
    if (!ok) {
        std::cerr << "WAV test failed: " << stutterscan::describe(error) << "\n";
        return false;
    }
    if (waveform.sample_rate != 16000.0 || waveform.samples.size() != sine.size() ||
        waveform.duration_ms() != 1500) {
        std::cerr << "WAV test failed: unexpected mono layout.\n";
        return false;
    }
    for (std::size_t i = 0; i < sine.size(); ++i) {
        if (std::fabs(waveform.samples[i] - sine[i]) > 1e-3f) {
            std::cerr << "WAV test failed: sample " << i << " off by "
                      << std::fabs(waveform.samples[i] - sine[i]) << ".\n";
            return false;
        }
    }
    return true;
}

bool test_stereo_is_averaged() {
    const std::string path = synthetic::temp_path("wav_stereo.wav").string();
    std::vector<float> interleaved;
    for (int i = 0; i < 800; ++i) {
        interleaved.push_back(0.5f);
        interleaved.push_back(-0.25f);
    }
    synthetic::write_pcm16_wav(path, interleaved, 8000, 2);

    stutterscan::Waveform waveform;
    stutterscan::Error error;
    const bool ok = stutterscan::load_waveform(path, &waveform, &error);
    std::remove(path.c_str());
    if (!ok || waveform.samples.size() != 800) {
        std::cerr << "WAV test failed: stereo file not downmixed to 800 frames.\n";
        return false;
    }
    if (std::fabs(waveform.samples[10] - 0.125f) > 1e-3f) {
        std::cerr << "WAV test failed: stereo frames not averaged.\n";
        return false;
    }
    return true;
}

bool test_float32_stereo_load() {
    const std::string path = synthetic::temp_path("wav_float_stereo.wav").string();
    std::vector<float> interleaved;
    for (std::size_t i = 0; i < 480; ++i) {
        interleaved.push_back(0.8f);
        interleaved.push_back(-0.2f);
    }
    synthetic::write_float32_wav(path, interleaved, 48000, 2);

    stutterscan::Waveform waveform;
    stutterscan::Error error;
    const bool ok = stutterscan::load_waveform(path, &waveform, &error);
    std::remove(path.c_str());
    if (!ok) {
        std::cerr << "WAV test failed: float file: " << stutterscan::describe(error) << "\n";
        return false;
    }
    if (waveform.samples.size() != 480 || waveform.sample_rate != 48000.0 ||
        waveform.duration_ms() != 10) {
        std::cerr << "WAV test failed: float file has wrong length or rate.\n";
        return false;
    }
    if (std::fabs(waveform.samples[0] - 0.3f) > 1e-6f ||
        std::fabs(waveform.samples[479] - 0.3f) > 1e-6f) {
        std::cerr << "WAV test failed: float frames not averaged.\n";
        return false;
    }
    return true;
}

bool test_writer_round_trip() {
    const std::string path = synthetic::temp_path("wav_writer.wav").string();
    const std::vector<float> samples{0.0f, 0.25f, -0.25f, 0.75f, -1.0f};
    std::string wav_error;
    if (!stutterscan::detail::write_wav_mono_16(path, samples, 22050.0, &wav_error)) {
        std::cerr << "WAV test failed: writer: " << wav_error << "\n";
        return false;
    }

    std::vector<float> decoded;
    double sample_rate = 0.0;
    const bool ok = stutterscan::detail::read_wav_mono(path, &decoded, &sample_rate, &wav_error);
    std::remove(path.c_str());
    if (!ok || sample_rate != 22050.0 || decoded.size() != samples.size()) {
        std::cerr << "WAV test failed: written file does not read back.\n";
        return false;
    }
    for (std::size_t i = 0; i < samples.size(); ++i) {
        if (std::fabs(decoded[i] - samples[i]) > 1e-3f) {
            std::cerr << "WAV test failed: written sample " << i << " differs.\n";
            return false;
        }
    }
    return true;
}

bool test_load_errors() {
    stutterscan::Waveform waveform;
    stutterscan::Error error;
    if (stutterscan::load_waveform("/nonexistent/input.wav", &waveform, &error) ||
        error.code != stutterscan::ErrorCode::NotFound) {
        std::cerr << "WAV test failed: missing file should be NotFoundError.\n";
        return false;
    }

    const std::string garbage = synthetic::temp_path("wav_garbage.wav").string();
    {
        std::ofstream out(garbage, std::ios::binary);
        out << "definitely not audio";
    }
    const bool garbage_ok = stutterscan::load_waveform(garbage, &waveform, &error);
    std::remove(garbage.c_str());
    if (garbage_ok || error.code != stutterscan::ErrorCode::Decode) {
        std::cerr << "WAV test failed: garbage file should be DecodeError.\n";
        return false;
    }

    const std::string empty = synthetic::temp_path("wav_empty.wav").string();
    synthetic::write_pcm16_wav(empty, {}, 16000);
    const bool empty_ok = stutterscan::load_waveform(empty, &waveform, &error);
    std::remove(empty.c_str());
    if (empty_ok || error.code != stutterscan::ErrorCode::EmptyInput || !waveform.empty()) {
        std::cerr << "WAV test failed: zero-length file should be EmptyInputError.\n";
        return false;
    }
    return true;
}

bool test_ms_to_samples() {
    if (stutterscan::ms_to_samples(1500, 22050.0) != 33075 ||
        stutterscan::ms_to_samples(0, 44100.0) != 0) {
        std::cerr << "WAV test failed: ms_to_samples conversion.\n";
        return false;
    }
    return true;
}

} // namespace

int main() {
    if (!test_pcm16_mono_load()) {
        return 1;
    }
    if (!test_stereo_is_averaged()) {
        return 1;
    }
    if (!test_float32_stereo_load()) {
        return 1;
    }
    if (!test_writer_round_trip()) {
        return 1;
    }
    if (!test_load_errors()) {
        return 1;
    }
    if (!test_ms_to_samples()) {
        return 1;
    }

    std::cout << "WAV test passed.\n";
    return 0;
}
