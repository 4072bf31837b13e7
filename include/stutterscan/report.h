//
//  report.h
//  StutterScan
//
//  Created by the StutterScan Authors on 2026-03-06.
//  Copyright © 2026 StutterScan Authors. All rights reserved.
//

#pragma once

#include "stutterscan/aggregator.h"
#include "stutterscan/config.h"
#include "stutterscan/errors.h"
#include "stutterscan/events.h"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace stutterscan {

struct ProcessingInfo {
    std::string model_path;
    std::string input_file;
    std::string model_type;
    AggregatorConfig::Mode mode = AggregatorConfig::Mode::Coarse;
    std::size_t segment_ms = 0;
    double overlap_ratio = 0.0;
    std::size_t audio_duration_ms = 0;
    double processing_time_s = 0.0;
};

struct AnalysisReport {
    // Ordered by start, then window, then sub-event.
    std::vector<Event> events;
    Summary summary;
    // Stage failures in the order they were recorded.
    std::vector<StageError> errors;
    ProcessingInfo processing_info;
    // Set when the run stopped before producing a full result.
    std::optional<Error> fatal_error;

    bool completed() const { return !fatal_error.has_value(); }
};

/// @brief `trunc(confidence * 100)`, 0 for non-finite values.
int confidence_to_probability(float confidence);

nlohmann::ordered_json event_to_json(const Event& event);

nlohmann::ordered_json summary_to_json(const AnalysisReport& report);

nlohmann::ordered_json report_to_json(const AnalysisReport& report);

bool write_report_json(const AnalysisReport& report, const std::string& path, Error* error);

} // namespace stutterscan
