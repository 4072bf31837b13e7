//
//  report.cpp
//  StutterScan
//
//  Created by the StutterScan Authors on 2026-03-06.
//  Copyright © 2026 StutterScan Authors. All rights reserved.
//

#include "stutterscan/report.h"

#include <cmath>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace stutterscan {
namespace {

double ms_to_seconds(std::size_t ms) {
    return static_cast<double>(ms) / 1000.0;
}

std::string seconds_label(std::size_t ms) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(1) << ms_to_seconds(ms) << " seconds";
    return out.str();
}

std::string percent_label(double ratio) {
    std::ostringstream out;
    out << std::lround(ratio * 100.0) << "%";
    return out.str();
}

} // namespace

int confidence_to_probability(float confidence) {
    if (!std::isfinite(confidence)) {
        return 0;
    }
    return static_cast<int>(std::trunc(static_cast<double>(confidence) * 100.0));
}

nlohmann::ordered_json event_to_json(const Event& event) {
    nlohmann::ordered_json json;
    json["type"] = event.type;
    json["confidence"] = event.confidence;
    json["probability"] = confidence_to_probability(event.confidence);
    json["seconds"] = event.start_ms / 1000;
    json["t0"] = event.start_ms;
    json["t1"] = event.end_ms;
    json["source"] = event.source;
    json["model_version"] = event.model_version;
    json["severity"] = severity_name(event.severity);
    if (event.precise) {
        json["duration"] = ms_to_seconds(event.duration_ms());
        json["segment_start"] = ms_to_seconds(event.segment_start_ms);
        json["relative_start"] = ms_to_seconds(event.relative_start_ms);
        json["relative_end"] = ms_to_seconds(event.relative_end_ms);
    }
    return json;
}

nlohmann::ordered_json summary_to_json(const AnalysisReport& report) {
    const Summary& summary = report.summary;
    const ProcessingInfo& info = report.processing_info;
    const bool precise = info.mode == AggregatorConfig::Mode::Precise;

    nlohmann::ordered_json distribution = nlohmann::ordered_json::object();
    for (const auto& entry : summary.class_distribution) {
        distribution[entry.first] = entry.second;
    }

    nlohmann::ordered_json details;
    details["segmentDuration"] = seconds_label(info.segment_ms);
    details["overlapRatio"] = percent_label(info.overlap_ratio);
    details["modelType"] = precise ? info.model_type + " with Precise Detection" : info.model_type;
    if (precise) {
        details["segmentsAnalyzed"] = summary.total_segments;
        details["preciseEventsFound"] = report.events.size();
    } else {
        details["segmentsAnalyzed"] = summary.successful_predictions;
        details["disfluencySegments"] = report.events.size();
    }

    nlohmann::ordered_json json;
    json["segmentCount"] = precise ? summary.total_segments : report.events.size();
    json["totalSegments"] = summary.total_segments;
    json["successfulPredictions"] = summary.successful_predictions;
    if (precise) {
        json["preciseEventsDetected"] = report.events.size();
    }
    json["averageConfidence"] = summary.average_confidence;
    json["dominantType"] = summary.dominant_class;
    json["classDistribution"] = distribution;
    json["hasEvents"] = !report.events.empty();
    json["processingDetails"] = details;
    if (summary.error) {
        json["error"] = describe(*summary.error);
    }
    return json;
}

nlohmann::ordered_json report_to_json(const AnalysisReport& report) {
    nlohmann::ordered_json events = nlohmann::ordered_json::array();
    for (const Event& event : report.events) {
        events.push_back(event_to_json(event));
    }

    nlohmann::ordered_json errors = nlohmann::ordered_json::array();
    for (const StageError& entry : report.errors) {
        errors.push_back(entry.to_string());
    }

    const ProcessingInfo& info = report.processing_info;
    nlohmann::ordered_json processing;
    processing["model_path"] = info.model_path;
    processing["input_file"] = info.input_file;
    processing["processing_time"] = info.processing_time_s;
    processing["audio_duration"] = ms_to_seconds(info.audio_duration_ms);
    processing["errors"] = errors;

    nlohmann::ordered_json json;
    json["events"] = events;
    json["summary"] = summary_to_json(report);
    json["processing_info"] = processing;
    if (report.fatal_error) {
        json["error"] = describe(*report.fatal_error);
    }
    return json;
}

bool write_report_json(const AnalysisReport& report, const std::string& path, Error* error) {
    if (path.empty()) {
        return fail(error, ErrorCode::Validation, "report path is empty");
    }
    std::ofstream file(path, std::ios::out | std::ios::trunc);
    if (!file) {
        return fail(error, ErrorCode::Permission, "Could not open report for writing: " + path);
    }
    file << report_to_json(report).dump(2) << std::endl;
    if (!file.good()) {
        return fail(error, ErrorCode::Permission, "Failed writing report: " + path);
    }
    return true;
}

} // namespace stutterscan
