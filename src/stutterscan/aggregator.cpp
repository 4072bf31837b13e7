//
//  aggregator.cpp
//  StutterScan
//
//  Created by the StutterScan Authors on 2026-03-05.
//  Copyright © 2026 StutterScan Authors. All rights reserved.
//

#include "stutterscan/aggregator.h"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace stutterscan {
namespace {

float clamp_confidence(float confidence) {
    if (!std::isfinite(confidence)) {
        return confidence;
    }
    return std::clamp(confidence, 0.0f, 1.0f);
}

bool event_before(const Event& a, const Event& b) {
    if (a.start_ms != b.start_ms) {
        return a.start_ms < b.start_ms;
    }
    if (a.window_index != b.window_index) {
        return a.window_index < b.window_index;
    }
    return a.sub_index < b.sub_index;
}

} // namespace

const char* stage_name(PipelineStage stage) {
    switch (stage) {
        case PipelineStage::Loading:
            return "loading";
        case PipelineStage::Segmenting:
            return "segmenting";
        case PipelineStage::Extracting:
            return "extracting";
        case PipelineStage::Classifying:
            return "classifying";
        case PipelineStage::Localizing:
            return "localizing";
        case PipelineStage::Aggregating:
            return "aggregating";
    }
    return "unknown";
}

std::string StageError::to_string() const {
    std::ostringstream out;
    if (window_index) {
        out << "Segment " << *window_index << " (" << stage_name(stage) << "): ";
    }
    out << describe(error);
    return out.str();
}

PredictionSuccess reconcile_prediction(const std::vector<float>& scores,
                                       const std::vector<std::string>& class_names,
                                       const Logger* logger) {
    if (scores.size() != class_names.size() && logger) {
        std::ostringstream msg;
        msg << "Classifier returned " << scores.size() << " scores for "
            << class_names.size() << " classes; "
            << (scores.size() < class_names.size() ? "padding missing classes with 0"
                                                   : "ignoring extra scores");
        logger->warn(msg.str());
    }

    PredictionSuccess success;
    success.class_probabilities.reserve(class_names.size());
    for (std::size_t i = 0; i < class_names.size(); ++i) {
        const float score = i < scores.size() ? scores[i] : 0.0f;
        success.class_probabilities.emplace_back(class_names[i], score);
    }

    bool first = true;
    for (const auto& entry : success.class_probabilities) {
        if (first || entry.second > success.confidence) {
            success.predicted_class = entry.first;
            success.confidence = entry.second;
            first = false;
        }
    }
    return success;
}

bool compute_summary(const std::vector<Event>& events,
                     std::size_t total_segments,
                     std::size_t successful_predictions,
                     Summary* summary,
                     Error* error) {
    if (!summary) {
        return fail(error, ErrorCode::Aggregation, "missing summary output");
    }
    *summary = Summary{};
    summary->total_segments = total_segments;
    summary->successful_predictions = successful_predictions;

    double confidence_sum = 0.0;
    std::vector<std::pair<std::string, std::size_t>> distribution;
    for (const Event& event : events) {
        if (!std::isfinite(event.confidence)) {
            std::ostringstream msg;
            msg << "non-finite confidence in " << event.type << " event at "
                << event.start_ms << "ms";
            return fail(error, ErrorCode::Aggregation, msg.str());
        }
        confidence_sum += event.confidence;
        auto it = std::find_if(distribution.begin(), distribution.end(),
                               [&](const auto& entry) { return entry.first == event.type; });
        if (it == distribution.end()) {
            distribution.emplace_back(event.type, 1);
        } else {
            ++it->second;
        }
    }

    summary->event_count = events.size();
    summary->class_distribution = std::move(distribution);
    if (!events.empty()) {
        summary->average_confidence = confidence_sum / static_cast<double>(events.size());
    }

    std::size_t best = 0;
    for (const auto& entry : summary->class_distribution) {
        if (entry.second > best) {
            best = entry.second;
            summary->dominant_class = entry.first;
        }
    }
    return true;
}

Aggregator::Aggregator(const AggregatorConfig& config,
                       Logger logger,
                       std::shared_ptr<SubEventLocalizer> localizer)
    : config_(config), logger_(std::move(logger)), localizer_(std::move(localizer)) {}

void Aggregator::emit_coarse(const PredictionResult& result, std::vector<Event>* events) const {
    const PredictionSuccess* success = result.success();
    const float confidence = clamp_confidence(success->confidence);
    if (!(confidence >= config_.confidence_threshold)) {
        return;
    }
    Event event;
    event.type = success->predicted_class;
    event.confidence = confidence;
    event.start_ms = result.start_ms;
    event.end_ms = result.end_ms;
    event.severity = severity_for_confidence(confidence);
    event.source = config_.source;
    event.model_version = config_.model_version;
    event.window_index = result.window_index;
    events->push_back(event);
}

bool Aggregator::emit_precise(const PredictionResult& result,
                              const Waveform* waveform,
                              const std::vector<WindowSpan>* spans,
                              std::vector<Event>* events,
                              Error* error) const {
    if (!localizer_) {
        return fail(error, ErrorCode::Validation, "precise mode needs a sub-event localizer");
    }
    if (!waveform || !spans || result.window_index >= spans->size()) {
        return fail(error, ErrorCode::Validation, "window samples unavailable for localization");
    }

    const Window window = cut_window(*waveform, (*spans)[result.window_index]);
    std::vector<SubEvent> sub_events;
    if (!localizer_->localize(window.samples, waveform->sample_rate,
                              result.success()->class_probabilities, &sub_events, error)) {
        return false;
    }

    const std::string model_version =
        config_.model_version.empty() ? std::string() : config_.model_version + "_precise";
    for (std::size_t i = 0; i < sub_events.size(); ++i) {
        const SubEvent& sub = sub_events[i];
        Event event;
        event.type = sub.type;
        event.confidence = sub.confidence;
        event.start_ms = result.start_ms + sub.start_ms;
        event.end_ms = result.start_ms + sub.end_ms;
        event.severity = sub.severity;
        event.source = config_.precise_source;
        event.model_version = model_version;
        event.window_index = result.window_index;
        event.sub_index = i;
        event.precise = true;
        event.segment_start_ms = result.start_ms;
        event.relative_start_ms = sub.start_ms;
        event.relative_end_ms = sub.end_ms;
        events->push_back(event);
    }
    return true;
}

AggregationResult Aggregator::aggregate(std::vector<PredictionResult> results,
                                        std::size_t total_segments,
                                        const Waveform* waveform,
                                        const std::vector<WindowSpan>* spans) const {
    std::stable_sort(results.begin(), results.end(),
                     [](const PredictionResult& a, const PredictionResult& b) {
                         return a.window_index < b.window_index;
                     });

    AggregationResult aggregation;
    std::size_t successful = 0;
    const bool precise = config_.mode == AggregatorConfig::Mode::Precise;

    for (const PredictionResult& result : results) {
        if (!result.succeeded()) {
            continue;
        }
        ++successful;
        if (!precise) {
            emit_coarse(result, &aggregation.events);
            continue;
        }

        Error error;
        if (!emit_precise(result, waveform, spans, &aggregation.events, &error)) {
            std::ostringstream msg;
            msg << "Precise detection failed for segment " << result.window_index << ": "
                << describe(error);
            logger_.warn(msg.str());
            aggregation.errors.push_back(
                StageError{PipelineStage::Localizing, result.window_index, error});
        }
    }

    std::stable_sort(aggregation.events.begin(), aggregation.events.end(), event_before);

    Error summary_error;
    if (!compute_summary(aggregation.events, total_segments, successful,
                         &aggregation.summary, &summary_error)) {
        logger_.error("Error calculating summary statistics: " + describe(summary_error));
        aggregation.summary.error = summary_error;
        aggregation.errors.push_back(
            StageError{PipelineStage::Aggregating, std::nullopt, summary_error});
    }

    std::ostringstream msg;
    msg << "Aggregated " << successful << "/" << total_segments << " windows into "
        << aggregation.events.size() << " events";
    logger_.debug(msg.str());
    return aggregation;
}

} // namespace stutterscan
