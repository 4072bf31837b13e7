//
//  events.h
//  StutterScan
//
//  Created by the StutterScan Authors on 2026-03-05.
//  Copyright © 2026 StutterScan Authors. All rights reserved.
//

#pragma once

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace stutterscan {

/// @brief Class name to score, in the classifier's class order.
using ClassProbabilities = std::vector<std::pair<std::string, float>>;

enum class Severity {
    VeryLow,
    Low,
    Medium,
    High,
};

/// @brief very_low < 0.4 <= low < 0.6 <= medium < 0.8 <= high.
Severity severity_for_confidence(float confidence);

const char* severity_name(Severity severity);

/// @brief Disfluency located inside one window, times relative to its start.
struct SubEvent {
    std::string type;
    float confidence = 0.0f;
    std::size_t start_ms = 0;
    std::size_t end_ms = 0;
    Severity severity = Severity::VeryLow;

    std::size_t duration_ms() const { return end_ms > start_ms ? end_ms - start_ms : 0; }
};

/// @brief Disfluency on the recording's timeline.
struct Event {
    std::string type;
    float confidence = 0.0f;
    std::size_t start_ms = 0;
    std::size_t end_ms = 0;
    Severity severity = Severity::VeryLow;
    std::string source;
    std::string model_version;

    std::size_t window_index = 0;
    std::size_t sub_index = 0;

    // Set for events produced by the sub-event localizer.
    bool precise = false;
    std::size_t segment_start_ms = 0;
    std::size_t relative_start_ms = 0;
    std::size_t relative_end_ms = 0;

    std::size_t duration_ms() const { return end_ms > start_ms ? end_ms - start_ms : 0; }
};

} // namespace stutterscan
