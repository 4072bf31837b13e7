//
//  orchestrator.h
//  StutterScan
//
//  Created by the StutterScan Authors on 2026-03-07.
//  Copyright © 2026 StutterScan Authors. All rights reserved.
//

#pragma once

#include "stutterscan/aggregator.h"
#include "stutterscan/classifier.h"
#include "stutterscan/config.h"
#include "stutterscan/features.h"
#include "stutterscan/localizer.h"
#include "stutterscan/logging.hpp"
#include "stutterscan/report.h"
#include "stutterscan/waveform.h"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace stutterscan {
namespace detail {
class DebugSink;
}

enum class OrchestratorState {
    Idle,
    Segmenting,
    ExtractingClassifying,
    Aggregating,
    Done,
    Aborted,
};

const char* orchestrator_state_name(OrchestratorState state);

/// @brief Cooperative stop flag shared between a run and its host.
class CancellationToken {
public:
    void cancel() { cancelled_.store(true, std::memory_order_relaxed); }
    bool cancelled() const { return cancelled_.load(std::memory_order_relaxed); }
    void reset() { cancelled_.store(false, std::memory_order_relaxed); }

private:
    std::atomic<bool> cancelled_{false};
};

/// @brief Base of the failures that abort a run and propagate to the caller.
class RunAbortedError : public std::runtime_error {
public:
    RunAbortedError(const std::string& message, AnalysisReport partial_report)
        : std::runtime_error(message), partial_report_(std::move(partial_report)) {}

    const AnalysisReport& partial_report() const { return partial_report_; }

private:
    AnalysisReport partial_report_;
};

class CancellationError : public RunAbortedError {
public:
    using RunAbortedError::RunAbortedError;
};

class ResourceExhaustedError : public RunAbortedError {
public:
    using RunAbortedError::RunAbortedError;
};

/// @brief Drives segmentation, feature extraction, classification and
/// aggregation for one recording at a time.
///
/// Per-window failures are recorded and skipped (or stop scheduling under
/// `WindowErrorPolicy::Abort`). Fatal setup failures return a report with
/// `fatal_error` set. Only cancellation and resource exhaustion throw.
class Orchestrator {
public:
    Orchestrator(const DetectorConfig& config,
                 std::unique_ptr<Classifier> classifier = nullptr,
                 Logger logger = Logger(),
                 std::shared_ptr<SubEventLocalizer> localizer = nullptr);
    ~Orchestrator();

    Orchestrator(const Orchestrator&) = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;

    /// @brief Load, validate and analyse a WAV file.
    AnalysisReport run(const std::string& audio_path);

    /// @brief Analyse an already decoded recording.
    AnalysisReport run(const Waveform& waveform);

    OrchestratorState state() const { return state_.load(); }

    /// @brief Token observed between windows; cancel it from any thread.
    CancellationToken& cancellation_token() { return *cancel_token_; }
    void set_cancellation_token(std::shared_ptr<CancellationToken> token);

    const DetectorConfig& config() const { return config_; }

private:
    struct PerfStats {
        double segment_ms = 0.0;
        double extract_ms = 0.0;
        double classify_ms = 0.0;
        double aggregate_ms = 0.0;
        std::size_t window_count = 0;
    };

    bool ensure_classifier(Error* error);
    AnalysisReport analyse(const Waveform& waveform, const std::string& input_file);
    PredictionResult process_window(const Waveform& waveform,
                                    const WindowSpan& span,
                                    const FeatureExtractor& extractor,
                                    const detail::DebugSink* debug_sink);
    AnalysisReport abort_report(PipelineStage stage,
                                const Error& error,
                                const std::string& input_file);
    void fill_processing_info(AnalysisReport* report, const std::string& input_file) const;
    void log_perf() const;

    DetectorConfig config_;
    std::unique_ptr<Classifier> classifier_;
    Logger logger_;
    std::shared_ptr<SubEventLocalizer> localizer_;
    std::shared_ptr<CancellationToken> cancel_token_;
    std::atomic<OrchestratorState> state_{OrchestratorState::Idle};
    std::mutex classifier_mutex_;
    std::mutex perf_mutex_;
    PerfStats perf_;
    std::size_t audio_duration_ms_ = 0;
    std::chrono::steady_clock::time_point run_start_;
};

} // namespace stutterscan
