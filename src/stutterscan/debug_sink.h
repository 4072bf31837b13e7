//
//  debug_sink.h
//  StutterScan
//
//  Created by the StutterScan Authors on 2026-03-06.
//  Copyright © 2026 StutterScan Authors. All rights reserved.
//

#pragma once

#include "stutterscan/features.h"
#include "stutterscan/segmenter.h"

#include <string>

namespace stutterscan::detail {

/// @brief Dumps intermediate window data for inspection.
///
/// Writes `segment_<index>.wav` (mono 16-bit) and
/// `segment_<index>_spectrogram.pgm` (8-bit greyscale, lowest mel band at
/// the bottom) into the output directory. Failures are returned but never
/// affect the analysis.
class DebugSink {
public:
    explicit DebugSink(std::string directory);

    const std::string& directory() const { return directory_; }

    bool prepare(std::string* error) const;

    bool write_window(const Window& window, double sample_rate, std::string* error) const;

    bool write_spectrogram(std::size_t index,
                           const Spectrogram& spectrogram,
                           std::string* error) const;

private:
    std::string path_for(std::size_t index, const char* suffix) const;

    std::string directory_;
};

} // namespace stutterscan::detail
