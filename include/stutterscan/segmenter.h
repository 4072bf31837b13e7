//
//  segmenter.h
//  StutterScan
//
//  Created by the StutterScan Authors on 2026-03-02.
//  Copyright © 2026 StutterScan Authors. All rights reserved.
//

#pragma once

#include "stutterscan/config.h"
#include "stutterscan/errors.h"
#include "stutterscan/waveform.h"

#include <cstddef>
#include <vector>

namespace stutterscan {

/// @brief Time span of one analysis window, before any samples are cut.
struct WindowSpan {
    std::size_t index = 0;
    std::size_t start_ms = 0;
    // Unpadded end on the (minimum-length) timeline.
    std::size_t natural_end_ms = 0;
    // End of the recorded audio inside this window.
    std::size_t audio_end_ms = 0;
    // End after the per-window padding decision.
    std::size_t end_ms = 0;

    std::size_t natural_ms() const { return natural_end_ms - start_ms; }
    std::size_t duration_ms() const { return end_ms - start_ms; }
    std::size_t padding_ms() const { return end_ms > audio_end_ms ? end_ms - audio_end_ms : 0; }
};

struct Window {
    std::size_t index = 0;
    std::size_t start_ms = 0;
    std::size_t end_ms = 0;
    std::size_t padding_ms = 0;
    std::vector<float> samples;

    std::size_t duration_ms() const { return end_ms - start_ms; }
};

/// @brief Lay out windows for a recording of `duration_ms`.
///
/// Recordings shorter than the minimum duration are treated as if padded
/// with trailing silence up to it. Longer recordings get
/// `max(1, floor((D - S) / step) + 1)` windows of nominal length `S`.
/// Each window shorter than the minimum is padded to it; one of at least
/// `pad_to_full_ratio * S` is padded to `S`; anything in between stays short.
std::vector<WindowSpan> plan_windows(std::size_t duration_ms, const SegmenterConfig& config);

/// @brief Copy the samples of `span` out of `waveform`, zero-filling padding.
Window cut_window(const Waveform& waveform, const WindowSpan& span);

/// @brief Plan the windows of `waveform` without copying any samples.
///
/// Callers cut each span with `cut_window` when they process it, so only
/// the windows in flight hold sample buffers. Fails with `EmptyInput` on a
/// zero-length waveform and `Validation` on an unusable configuration.
bool segment_waveform(const Waveform& waveform,
                      const SegmenterConfig& config,
                      std::vector<WindowSpan>* spans,
                      Error* error);

} // namespace stutterscan
