//
//  debug_sink.cpp
//  StutterScan
//
//  Created by the StutterScan Authors on 2026-03-06.
//  Copyright © 2026 StutterScan Authors. All rights reserved.
//

#include "debug_sink.h"

#include "audio/wav.h"

#include <algorithm>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <system_error>
#include <utility>
#include <vector>

namespace stutterscan::detail {

DebugSink::DebugSink(std::string directory) : directory_(std::move(directory)) {}

bool DebugSink::prepare(std::string* error) const {
    std::error_code ec;
    std::filesystem::create_directories(directory_, ec);
    if (ec) {
        if (error) {
            *error = "cannot create " + directory_ + ": " + ec.message();
        }
        return false;
    }
    return true;
}

std::string DebugSink::path_for(std::size_t index, const char* suffix) const {
    std::ostringstream name;
    name << "segment_" << std::setw(3) << std::setfill('0') << index << suffix;
    return (std::filesystem::path(directory_) / name.str()).string();
}

bool DebugSink::write_window(const Window& window, double sample_rate, std::string* error) const {
    return write_wav_mono_16(path_for(window.index, ".wav"), window.samples, sample_rate, error);
}

bool DebugSink::write_spectrogram(std::size_t index,
                                  const Spectrogram& spectrogram,
                                  std::string* error) const {
    if (spectrogram.empty()) {
        if (error) {
            *error = "empty spectrogram";
        }
        return false;
    }

    const std::string path = path_for(index, "_spectrogram.pgm");
    std::ofstream out(path, std::ios::binary);
    if (!out) {
        if (error) {
            *error = "cannot open " + path;
        }
        return false;
    }

    out << "P5\n" << spectrogram.width << " " << spectrogram.height << "\n255\n";
    std::vector<unsigned char> row(spectrogram.width);
    for (std::size_t y = 0; y < spectrogram.height; ++y) {
        const std::size_t band = spectrogram.height - 1 - y;
        for (std::size_t x = 0; x < spectrogram.width; ++x) {
            const float value = std::clamp(spectrogram.at(band, x), 0.0f, 1.0f);
            row[x] = static_cast<unsigned char>(std::lround(value * 255.0f));
        }
        out.write(reinterpret_cast<const char*>(row.data()), static_cast<std::streamsize>(row.size()));
    }
    if (!out.good()) {
        if (error) {
            *error = "failed writing " + path;
        }
        return false;
    }
    return true;
}

} // namespace stutterscan::detail
