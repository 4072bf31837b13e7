//
//  waveform.cpp
//  StutterScan
//
//  Created by the StutterScan Authors on 2026-03-02.
//  Copyright © 2026 StutterScan Authors. All rights reserved.
//

#include "stutterscan/waveform.h"

#include "stutterscan/logging.hpp"
#include "wav.h"

#include <cmath>
#include <filesystem>
#include <system_error>

#include <unistd.h>

namespace stutterscan {

std::size_t Waveform::duration_ms() const {
    if (sample_rate <= 0.0) {
        return 0;
    }
    return static_cast<std::size_t>(
        std::llround(static_cast<double>(samples.size()) * 1000.0 / sample_rate));
}

std::size_t ms_to_samples(std::size_t ms, double sample_rate) {
    if (sample_rate <= 0.0) {
        return 0;
    }
    return static_cast<std::size_t>(
        std::llround(static_cast<double>(ms) * sample_rate / 1000.0));
}

bool load_waveform(const std::string& path, Waveform* out, Error* error) {
    if (!out) {
        return fail(error, ErrorCode::Validation, "missing waveform output");
    }
    *out = Waveform{};
    if (path.empty()) {
        return fail(error, ErrorCode::Validation, "invalid input path");
    }

    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return fail(error, ErrorCode::NotFound, "Audio file not found: " + path);
    }
    if (::access(path.c_str(), R_OK) != 0) {
        return fail(error, ErrorCode::Permission, "Cannot read audio file: " + path);
    }

    std::string wav_error;
    if (!detail::read_wav_mono(path, &out->samples, &out->sample_rate, &wav_error)) {
        STUTTERSCAN_LOG_ERROR("Failed to load audio file " << path << ": " << wav_error);
        return fail(error, ErrorCode::Decode, path + ": " + wav_error);
    }
    if (out->samples.empty()) {
        return fail(error, ErrorCode::EmptyInput, "Audio file is empty: " + path);
    }

    STUTTERSCAN_LOG_INFO("Audio duration: " << out->duration_ms() / 1000.0 << " seconds ("
                                            << out->sample_rate << " Hz)");
    return true;
}

} // namespace stutterscan
