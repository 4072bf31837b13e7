//
//  aggregator.h
//  StutterScan
//
//  Created by the StutterScan Authors on 2026-03-05.
//  Copyright © 2026 StutterScan Authors. All rights reserved.
//

#pragma once

#include "stutterscan/config.h"
#include "stutterscan/errors.h"
#include "stutterscan/events.h"
#include "stutterscan/localizer.h"
#include "stutterscan/logging.hpp"
#include "stutterscan/segmenter.h"

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace stutterscan {

enum class PipelineStage {
    Loading,
    Segmenting,
    Extracting,
    Classifying,
    Localizing,
    Aggregating,
};

const char* stage_name(PipelineStage stage);

struct PredictionSuccess {
    ClassProbabilities class_probabilities;
    std::string predicted_class;
    float confidence = 0.0f;
};

struct PredictionFailure {
    PipelineStage stage = PipelineStage::Classifying;
    Error error;
};

/// @brief Outcome of one window, tagged by its index.
struct PredictionResult {
    std::size_t window_index = 0;
    std::size_t start_ms = 0;
    std::size_t end_ms = 0;
    std::variant<PredictionSuccess, PredictionFailure> outcome;

    bool succeeded() const { return std::holds_alternative<PredictionSuccess>(outcome); }
    const PredictionSuccess* success() const { return std::get_if<PredictionSuccess>(&outcome); }
    const PredictionFailure* failure() const { return std::get_if<PredictionFailure>(&outcome); }
};

/// @brief Map raw classifier scores onto `class_names`.
///
/// Missing scores are padded with 0, surplus scores dropped; either case is
/// logged as a warning. The predicted class is the first highest score.
PredictionSuccess reconcile_prediction(const std::vector<float>& scores,
                                       const std::vector<std::string>& class_names,
                                       const Logger* logger = nullptr);

/// @brief One entry of a report's error log.
struct StageError {
    PipelineStage stage = PipelineStage::Classifying;
    std::optional<std::size_t> window_index;
    Error error;

    std::string to_string() const;
};

struct Summary {
    std::size_t total_segments = 0;
    std::size_t successful_predictions = 0;
    std::size_t event_count = 0;
    // Events per type, in first-seen order.
    std::vector<std::pair<std::string, std::size_t>> class_distribution;
    double average_confidence = 0.0;
    std::string dominant_class = "none";
    // Set when statistics could not be computed.
    std::optional<Error> error;
};

/// @brief Statistics over the emitted events.
///
/// Fails with `Aggregation` on a non-finite confidence; `summary` then keeps
/// only the window counts.
bool compute_summary(const std::vector<Event>& events,
                     std::size_t total_segments,
                     std::size_t successful_predictions,
                     Summary* summary,
                     Error* error);

struct AggregationResult {
    std::vector<Event> events;
    Summary summary;
    std::vector<StageError> errors;
};

/// @brief Fuses per-window predictions into one event timeline.
///
/// Coarse mode emits one event per window whose top score reaches the
/// confidence threshold. Precise mode asks the localizer for sub-events of
/// every successful window and shifts them onto the recording timeline.
class Aggregator {
public:
    Aggregator(const AggregatorConfig& config,
               Logger logger = Logger(),
               std::shared_ptr<SubEventLocalizer> localizer = nullptr);

    const AggregatorConfig& config() const { return config_; }

    /// @param results Per-window outcomes in any order.
    /// @param total_segments Windows attempted, the summary denominator.
    /// @param waveform Source recording, needed in precise mode.
    /// @param spans Window spans by index; precise mode re-cuts each
    ///        successful window from `waveform` as it localizes it.
    AggregationResult aggregate(std::vector<PredictionResult> results,
                                std::size_t total_segments,
                                const Waveform* waveform = nullptr,
                                const std::vector<WindowSpan>* spans = nullptr) const;

private:
    void emit_coarse(const PredictionResult& result, std::vector<Event>* events) const;
    bool emit_precise(const PredictionResult& result,
                      const Waveform* waveform,
                      const std::vector<WindowSpan>* spans,
                      std::vector<Event>* events,
                      Error* error) const;

    AggregatorConfig config_;
    Logger logger_;
    std::shared_ptr<SubEventLocalizer> localizer_;
};

} // namespace stutterscan
