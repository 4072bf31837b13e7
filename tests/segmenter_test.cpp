//
//  segmenter_test.cpp
//  StutterScan
//
//  Created by the StutterScan Authors on 2026-03-02.
//  Copyright © 2026 StutterScan Authors. All rights reserved.
//

#include "stutterscan/segmenter.h"

#include <iostream>
#include <vector>

namespace {

stutterscan::SegmenterConfig default_config() {
    return stutterscan::SegmenterConfig{};
}

bool expect_span(const stutterscan::WindowSpan& span,
                 std::size_t start_ms,
                 std::size_t end_ms,
                 const char* label) {
    if (span.start_ms != start_ms || span.end_ms != end_ms) {
        std::cerr << "Segmenter test failed: " << label << " expected [" << start_ms << ", "
                  << end_ms << ") got [" << span.start_ms << ", " << span.end_ms << ").\n";
        return false;
    }
    return true;
}

bool test_seven_second_clip_yields_three_overlapping_windows() {
    const auto spans = stutterscan::plan_windows(7000, default_config());
    if (spans.size() != 3) {
        std::cerr << "Segmenter test failed: expected 3 windows for 7000ms, got "
                  << spans.size() << ".\n";
        return false;
    }
    return expect_span(spans[0], 0, 3000, "window 0") &&
           expect_span(spans[1], 1500, 4500, "window 1") &&
           expect_span(spans[2], 3000, 6000, "window 2");
}

bool test_short_clip_is_padded_to_minimum() {
    const auto spans = stutterscan::plan_windows(500, default_config());
    if (spans.size() != 1) {
        std::cerr << "Segmenter test failed: expected 1 window for 500ms.\n";
        return false;
    }
    if (!expect_span(spans[0], 0, 1000, "short clip")) {
        return false;
    }
    if (spans[0].padding_ms() != 500) {
        std::cerr << "Segmenter test failed: expected 500ms padding on short clip.\n";
        return false;
    }
    return true;
}

bool test_window_count_formula_and_bounds() {
    const stutterscan::SegmenterConfig config = default_config();
    const std::size_t step = stutterscan::segment_step_ms(config);
    for (std::size_t duration = 3001; duration <= 20000; duration += 777) {
        const auto spans = stutterscan::plan_windows(duration, config);
        const std::size_t expected = (duration - config.segment_ms) / step + 1;
        if (spans.size() != expected) {
            std::cerr << "Segmenter test failed: " << duration << "ms expected " << expected
                      << " windows, got " << spans.size() << ".\n";
            return false;
        }
        for (std::size_t i = 0; i < spans.size(); ++i) {
            if (spans[i].index != i || spans[i].start_ms != i * step) {
                std::cerr << "Segmenter test failed: window " << i << " misplaced.\n";
                return false;
            }
            if (spans[i].natural_end_ms > duration) {
                std::cerr << "Segmenter test failed: window " << i << " exceeds duration.\n";
                return false;
            }
            if (i > 0 && spans[i].start_ms <= spans[i - 1].start_ms) {
                std::cerr << "Segmenter test failed: windows not ordered.\n";
                return false;
            }
        }
    }
    return true;
}

bool test_single_window_padding_rules() {
    const stutterscan::SegmenterConfig config = default_config();

    // At least 80% of the segment length: padded to the full segment.
    auto spans = stutterscan::plan_windows(2500, config);
    if (spans.size() != 1 || !expect_span(spans[0], 0, 3000, "2500ms clip")) {
        return false;
    }

    // Exactly the 80% boundary also pads.
    spans = stutterscan::plan_windows(2400, config);
    if (spans.size() != 1 || !expect_span(spans[0], 0, 3000, "2400ms clip")) {
        return false;
    }

    // Between the minimum and 80%: kept short.
    spans = stutterscan::plan_windows(2000, config);
    if (spans.size() != 1 || !expect_span(spans[0], 0, 2000, "2000ms clip")) {
        return false;
    }
    if (spans[0].padding_ms() != 0) {
        std::cerr << "Segmenter test failed: 2000ms clip should not be padded.\n";
        return false;
    }

    spans = stutterscan::plan_windows(3000, config);
    if (spans.size() != 1 || !expect_span(spans[0], 0, 3000, "3000ms clip")) {
        return false;
    }
    return true;
}

bool test_cut_window_zero_fills_padding() {
    stutterscan::Waveform waveform;
    waveform.sample_rate = 1000.0;
    waveform.samples.assign(500, 0.25f);

    std::vector<stutterscan::WindowSpan> spans;
    stutterscan::Error error;
    if (!stutterscan::segment_waveform(waveform, default_config(), &spans, &error)) {
        std::cerr << "Segmenter test failed: " << stutterscan::describe(error) << "\n";
        return false;
    }
    if (spans.size() != 1) {
        std::cerr << "Segmenter test failed: expected one window span.\n";
        return false;
    }
    const stutterscan::Window window = stutterscan::cut_window(waveform, spans[0]);
    if (window.samples.size() != 1000) {
        std::cerr << "Segmenter test failed: expected one 1000-sample window.\n";
        return false;
    }
    if (window.samples[499] != 0.25f || window.samples[500] != 0.0f ||
        window.samples[999] != 0.0f) {
        std::cerr << "Segmenter test failed: padding not zero filled.\n";
        return false;
    }
    if (window.padding_ms != 500) {
        std::cerr << "Segmenter test failed: window padding not recorded.\n";
        return false;
    }
    return true;
}

bool test_overlapping_windows_share_samples() {
    stutterscan::Waveform waveform;
    waveform.sample_rate = 1000.0;
    waveform.samples.resize(7000);
    for (std::size_t i = 0; i < waveform.samples.size(); ++i) {
        waveform.samples[i] = static_cast<float>(i);
    }

    std::vector<stutterscan::WindowSpan> spans;
    stutterscan::Error error;
    if (!stutterscan::segment_waveform(waveform, default_config(), &spans, &error)) {
        std::cerr << "Segmenter test failed: " << stutterscan::describe(error) << "\n";
        return false;
    }
    if (spans.size() != 3) {
        std::cerr << "Segmenter test failed: expected 3 spans, got " << spans.size() << ".\n";
        return false;
    }
    const stutterscan::Window middle = stutterscan::cut_window(waveform, spans[1]);
    const stutterscan::Window last = stutterscan::cut_window(waveform, spans[2]);
    if (middle.samples.size() != 3000 || middle.samples.front() != 1500.0f ||
        last.samples.back() != 5999.0f || last.index != 2) {
        std::cerr << "Segmenter test failed: unexpected window samples.\n";
        return false;
    }
    return true;
}

bool test_empty_waveform_is_rejected() {
    stutterscan::Waveform waveform;
    waveform.sample_rate = 22050.0;
    std::vector<stutterscan::WindowSpan> spans;
    stutterscan::Error error;
    if (stutterscan::segment_waveform(waveform, default_config(), &spans, &error)) {
        std::cerr << "Segmenter test failed: empty waveform accepted.\n";
        return false;
    }
    if (error.code != stutterscan::ErrorCode::EmptyInput) {
        std::cerr << "Segmenter test failed: expected EmptyInput, got "
                  << stutterscan::describe(error) << "\n";
        return false;
    }
    return true;
}

bool expect_starts(double overlap_ratio,
                   std::size_t expected_step,
                   const std::vector<std::size_t>& expected_starts) {
    stutterscan::SegmenterConfig config = default_config();
    config.overlap_ratio = overlap_ratio;
    const std::size_t step = stutterscan::segment_step_ms(config);
    if (step != expected_step) {
        std::cerr << "Segmenter test failed: overlap " << overlap_ratio << " expected step "
                  << expected_step << "ms, got " << step << "ms.\n";
        return false;
    }
    const auto spans = stutterscan::plan_windows(10000, config);
    if (spans.size() != expected_starts.size()) {
        std::cerr << "Segmenter test failed: overlap " << overlap_ratio << " expected "
                  << expected_starts.size() << " windows, got " << spans.size() << ".\n";
        return false;
    }
    for (std::size_t i = 0; i < spans.size(); ++i) {
        if (spans[i].start_ms != expected_starts[i]) {
            std::cerr << "Segmenter test failed: overlap " << overlap_ratio << " window " << i
                      << " expected start " << expected_starts[i] << "ms, got "
                      << spans[i].start_ms << "ms.\n";
            return false;
        }
    }
    return true;
}

bool test_step_is_exact_for_decimal_overlaps() {
    // 10000ms recording, 3000ms windows.
    return expect_starts(0.1, 2700, {0, 2700, 5400}) &&
           expect_starts(0.3, 2100, {0, 2100, 4200, 6300}) &&
           expect_starts(0.25, 2250, {0, 2250, 4500, 6750}) &&
           expect_starts(0.0, 3000, {0, 3000, 6000});
}

bool test_full_padding_threshold_is_not_rounded() {
    stutterscan::SegmenterConfig config = default_config();
    config.segment_ms = 2999;

    // 0.8 * 2999 = 2399.2, so a 2399ms window is below the threshold.
    auto spans = stutterscan::plan_windows(2399, config);
    if (spans.size() != 1 || !expect_span(spans[0], 0, 2399, "2399ms clip, 2999ms segment")) {
        return false;
    }
    if (spans[0].padding_ms() != 0) {
        std::cerr << "Segmenter test failed: 2399ms clip padded below the threshold.\n";
        return false;
    }

    spans = stutterscan::plan_windows(2400, config);
    if (spans.size() != 1 || !expect_span(spans[0], 0, 2999, "2400ms clip, 2999ms segment")) {
        return false;
    }
    return true;
}

} // namespace

int main() {
    if (!test_seven_second_clip_yields_three_overlapping_windows()) {
        return 1;
    }
    if (!test_short_clip_is_padded_to_minimum()) {
        return 1;
    }
    if (!test_window_count_formula_and_bounds()) {
        return 1;
    }
    if (!test_single_window_padding_rules()) {
        return 1;
    }
    if (!test_cut_window_zero_fills_padding()) {
        return 1;
    }
    if (!test_overlapping_windows_share_samples()) {
        return 1;
    }
    if (!test_empty_waveform_is_rejected()) {
        return 1;
    }
    if (!test_step_is_exact_for_decimal_overlaps()) {
        return 1;
    }
    if (!test_full_padding_threshold_is_not_rounded()) {
        return 1;
    }

    std::cout << "Segmenter test passed.\n";
    return 0;
}
