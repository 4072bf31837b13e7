//
//  segmenter.cpp
//  StutterScan
//
//  Created by the StutterScan Authors on 2026-03-02.
//  Copyright © 2026 StutterScan Authors. All rights reserved.
//

#include "stutterscan/segmenter.h"

#include "stutterscan/logging.hpp"

#include <algorithm>

namespace stutterscan {
namespace {

std::size_t padded_end_ms(const WindowSpan& span, const SegmenterConfig& config) {
    const std::size_t natural = span.natural_ms();
    if (natural < config.min_segment_ms) {
        return span.start_ms + config.min_segment_ms;
    }
    // Compared unrounded: with S = 2999 the threshold is 2399.2 and 2399 stays short.
    const double full_threshold = static_cast<double>(config.segment_ms) * config.pad_to_full_ratio;
    if (natural < config.segment_ms && static_cast<double>(natural) + 1e-9 >= full_threshold) {
        return span.start_ms + config.segment_ms;
    }
    return span.natural_end_ms;
}

} // namespace

std::vector<WindowSpan> plan_windows(std::size_t duration_ms, const SegmenterConfig& config) {
    std::vector<WindowSpan> spans;
    if (config.segment_ms == 0) {
        return spans;
    }

    std::size_t total_ms = duration_ms;
    if (total_ms < config.min_segment_ms) {
        STUTTERSCAN_LOG_INFO("Audio too short (" << total_ms << "ms), padding to "
                                                 << config.min_segment_ms << "ms");
        total_ms = config.min_segment_ms;
    }

    if (total_ms <= config.segment_ms) {
        WindowSpan span;
        span.index = 0;
        span.start_ms = 0;
        span.natural_end_ms = total_ms;
        span.audio_end_ms = std::min(total_ms, duration_ms);
        span.end_ms = padded_end_ms(span, config);
        spans.push_back(span);
        return spans;
    }

    const std::size_t step = segment_step_ms(config);
    if (step == 0) {
        return spans;
    }
    const std::size_t count = std::max<std::size_t>(1, (total_ms - config.segment_ms) / step + 1);
    spans.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        WindowSpan span;
        span.index = i;
        span.start_ms = i * step;
        span.natural_end_ms = std::min(span.start_ms + config.segment_ms, total_ms);
        span.audio_end_ms = std::min(span.natural_end_ms, duration_ms);
        span.end_ms = padded_end_ms(span, config);
        spans.push_back(span);
    }

    STUTTERSCAN_LOG_DEBUG("Planned " << count << " windows of " << config.segment_ms
                                     << "ms, step " << step << "ms");
    return spans;
}

Window cut_window(const Waveform& waveform, const WindowSpan& span) {
    Window window;
    window.index = span.index;
    window.start_ms = span.start_ms;
    window.end_ms = span.end_ms;
    window.padding_ms = span.padding_ms();

    const std::size_t begin = ms_to_samples(span.start_ms, waveform.sample_rate);
    const std::size_t natural_end =
        std::min(ms_to_samples(span.audio_end_ms, waveform.sample_rate), waveform.samples.size());
    const std::size_t length = ms_to_samples(span.end_ms, waveform.sample_rate) - begin;

    window.samples.assign(length, 0.0f);
    if (begin < natural_end) {
        const std::size_t copy = std::min(natural_end - begin, length);
        std::copy(waveform.samples.begin() + static_cast<long>(begin),
                  waveform.samples.begin() + static_cast<long>(begin + copy),
                  window.samples.begin());
    }
    return window;
}

bool segment_waveform(const Waveform& waveform,
                      const SegmenterConfig& config,
                      std::vector<WindowSpan>* spans,
                      Error* error) {
    if (!spans) {
        return fail(error, ErrorCode::Validation, "missing window output");
    }
    spans->clear();
    if (waveform.empty()) {
        return fail(error, ErrorCode::EmptyInput, "waveform has zero duration");
    }
    if (config.segment_ms == 0 || config.min_segment_ms == 0 ||
        config.min_segment_ms > config.segment_ms || segment_step_ms(config) == 0) {
        return fail(error, ErrorCode::Validation, "invalid segmenter configuration");
    }

    *spans = plan_windows(waveform.duration_ms(), config);
    return true;
}

} // namespace stutterscan
