//
//  orchestrator.cpp
//  StutterScan
//
//  Created by the StutterScan Authors on 2026-03-07.
//  Copyright © 2026 StutterScan Authors. All rights reserved.
//

#include "stutterscan/orchestrator.h"

#include "debug_sink.h"
#include "stutterscan/segmenter.h"

#include <algorithm>
#include <exception>
#include <new>
#include <optional>
#include <sstream>
#include <thread>

namespace stutterscan {
namespace {

double elapsed_ms(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start)
        .count();
}

std::string model_type_for(const char* backend) {
    const std::string name = backend ? backend : "";
    if (name == "torch") {
        return "TorchScript CNN";
    }
    if (name == "onnx") {
        return "ONNX CNN";
    }
    return name + " CNN";
}

} // namespace

const char* orchestrator_state_name(OrchestratorState state) {
    switch (state) {
        case OrchestratorState::Idle:
            return "idle";
        case OrchestratorState::Segmenting:
            return "segmenting";
        case OrchestratorState::ExtractingClassifying:
            return "extracting_classifying";
        case OrchestratorState::Aggregating:
            return "aggregating";
        case OrchestratorState::Done:
            return "done";
        case OrchestratorState::Aborted:
            return "aborted";
    }
    return "idle";
}

Orchestrator::Orchestrator(const DetectorConfig& config,
                           std::unique_ptr<Classifier> classifier,
                           Logger logger,
                           std::shared_ptr<SubEventLocalizer> localizer)
    : config_(config),
      classifier_(std::move(classifier)),
      logger_(std::move(logger)),
      localizer_(std::move(localizer)),
      cancel_token_(std::make_shared<CancellationToken>()) {}

Orchestrator::~Orchestrator() = default;

void Orchestrator::set_cancellation_token(std::shared_ptr<CancellationToken> token) {
    cancel_token_ = token ? std::move(token) : std::make_shared<CancellationToken>();
}

bool Orchestrator::ensure_classifier(Error* error) {
    if (classifier_) {
        return true;
    }
    classifier_ = make_classifier(config_.classifier, error);
    return classifier_ != nullptr;
}

AnalysisReport Orchestrator::run(const std::string& audio_path) {
    run_start_ = std::chrono::steady_clock::now();
    perf_ = PerfStats{};
    audio_duration_ms_ = 0;
    state_ = OrchestratorState::Idle;

    Error error;
    if (!validate_config(config_, &error)) {
        return abort_report(PipelineStage::Loading, error, audio_path);
    }

    Waveform waveform;
    if (!load_waveform(audio_path, &waveform, &error)) {
        return abort_report(PipelineStage::Loading, error, audio_path);
    }
    if (!ensure_classifier(&error)) {
        return abort_report(PipelineStage::Loading, error, audio_path);
    }
    return analyse(waveform, audio_path);
}

AnalysisReport Orchestrator::run(const Waveform& waveform) {
    run_start_ = std::chrono::steady_clock::now();
    perf_ = PerfStats{};
    audio_duration_ms_ = 0;
    state_ = OrchestratorState::Idle;
    return analyse(waveform, std::string());
}

void Orchestrator::fill_processing_info(AnalysisReport* report,
                                        const std::string& input_file) const {
    ProcessingInfo& info = report->processing_info;
    info.model_path = config_.classifier.model_path;
    info.input_file = input_file;
    info.model_type = model_type_for(classifier_ ? classifier_->backend_name()
                                                 : backend_name(resolve_backend(config_.classifier)));
    info.mode = config_.aggregator.mode;
    info.segment_ms = config_.segmenter.segment_ms;
    info.overlap_ratio = config_.segmenter.overlap_ratio;
    info.audio_duration_ms = audio_duration_ms_;
    info.processing_time_s = elapsed_ms(run_start_) / 1000.0;
}

AnalysisReport Orchestrator::abort_report(PipelineStage stage,
                                          const Error& error,
                                          const std::string& input_file) {
    logger_.error(std::string("Analysis aborted while ") + stage_name(stage) + ": " +
                  describe(error));
    AnalysisReport report;
    report.errors.push_back(StageError{stage, std::nullopt, error});
    report.fatal_error = error;
    fill_processing_info(&report, input_file);
    state_ = OrchestratorState::Aborted;
    return report;
}

PredictionResult Orchestrator::process_window(const Waveform& waveform,
                                              const WindowSpan& span,
                                              const FeatureExtractor& extractor,
                                              const detail::DebugSink* debug_sink) {
    PredictionResult result;
    result.window_index = span.index;
    result.start_ms = span.start_ms;
    result.end_ms = span.end_ms;

    const double sample_rate = waveform.sample_rate;
    const Window window = cut_window(waveform, span);

    if (debug_sink) {
        std::string sink_error;
        if (!debug_sink->write_window(window, sample_rate, &sink_error)) {
            logger_.warn("Debug sink: " + sink_error);
        }
    }

    const auto extract_start = std::chrono::steady_clock::now();
    Spectrogram spectrogram;
    Error error;
    if (!extractor.extract(window.samples, sample_rate, &spectrogram, &error)) {
        std::ostringstream msg;
        msg << "Segment " << window.index << ": feature extraction failed: " << describe(error);
        logger_.warn(msg.str());
        result.outcome = PredictionFailure{PipelineStage::Extracting, error};
        return result;
    }
    const double extract_time = elapsed_ms(extract_start);

    if (debug_sink) {
        std::string sink_error;
        if (!debug_sink->write_spectrogram(window.index, spectrogram, &sink_error)) {
            logger_.warn("Debug sink: " + sink_error);
        }
    }

    const auto classify_start = std::chrono::steady_clock::now();
    std::vector<float> scores;
    bool classified = false;
    try {
        if (classifier_->is_reentrant()) {
            classified = classifier_->classify(spectrogram, &scores, &error);
        } else {
            std::lock_guard<std::mutex> lock(classifier_mutex_);
            classified = classifier_->classify(spectrogram, &scores, &error);
        }
    } catch (const std::bad_alloc&) {
        throw;
    } catch (const std::exception& ex) {
        classified = fail(&error, ErrorCode::Classifier, ex.what());
    }
    const double classify_time = elapsed_ms(classify_start);

    {
        std::lock_guard<std::mutex> lock(perf_mutex_);
        perf_.extract_ms += extract_time;
        perf_.classify_ms += classify_time;
        ++perf_.window_count;
    }

    if (!classified) {
        if (error.ok()) {
            error = Error{ErrorCode::Classifier, "classifier reported failure"};
        }
        std::ostringstream msg;
        msg << "Segment " << window.index << ": classification failed: " << describe(error);
        logger_.warn(msg.str());
        result.outcome = PredictionFailure{PipelineStage::Classifying, error};
        return result;
    }

    PredictionSuccess success = reconcile_prediction(scores, classifier_->class_names(), &logger_);
    std::ostringstream msg;
    msg << "Segment " << window.index << " [" << window.start_ms << "ms, " << window.end_ms
        << "ms): " << success.predicted_class << " " << success.confidence;
    logger_.debug(msg.str());
    result.outcome = std::move(success);
    return result;
}

AnalysisReport Orchestrator::analyse(const Waveform& waveform, const std::string& input_file) {
    Error error;
    state_ = OrchestratorState::Segmenting;
    if (!validate_config(config_, &error)) {
        return abort_report(PipelineStage::Segmenting, error, input_file);
    }
    if (!ensure_classifier(&error)) {
        return abort_report(PipelineStage::Loading, error, input_file);
    }
    audio_duration_ms_ = waveform.duration_ms();

    const auto segment_start = std::chrono::steady_clock::now();
    std::vector<WindowSpan> spans;
    if (!segment_waveform(waveform, config_.segmenter, &spans, &error)) {
        return abort_report(PipelineStage::Segmenting, error, input_file);
    }
    perf_.segment_ms = elapsed_ms(segment_start);
    {
        std::ostringstream msg;
        msg << "Created " << spans.size() << " segments";
        logger_.info(msg.str());
    }

    std::optional<detail::DebugSink> debug_sink;
    if (!config_.runtime.debug_output_dir.empty()) {
        debug_sink.emplace(config_.runtime.debug_output_dir);
        std::string sink_error;
        if (!debug_sink->prepare(&sink_error)) {
            logger_.warn("Debug sink disabled: " + sink_error);
            debug_sink.reset();
        }
    }

    state_ = OrchestratorState::ExtractingClassifying;
    const FeatureExtractor extractor(config_.features, config_.segmenter.segment_ms);
    const std::size_t count = spans.size();
    const bool abort_on_error = config_.runtime.on_window_error == WindowErrorPolicy::Abort;

    std::vector<std::optional<PredictionResult>> slots(count);
    std::atomic<std::size_t> next{0};
    std::atomic<bool> stop{false};
    std::mutex failure_mutex;
    std::exception_ptr resource_failure;

    auto worker = [&]() {
        for (;;) {
            if (stop.load() || cancel_token_->cancelled()) {
                return;
            }
            const std::size_t i = next.fetch_add(1);
            if (i >= count) {
                return;
            }
            try {
                slots[i] = process_window(waveform, spans[i], extractor,
                                          debug_sink ? &*debug_sink : nullptr);
                if (abort_on_error && !slots[i]->succeeded()) {
                    stop.store(true);
                }
            } catch (const std::bad_alloc&) {
                std::lock_guard<std::mutex> lock(failure_mutex);
                if (!resource_failure) {
                    resource_failure = std::current_exception();
                }
                stop.store(true);
            } catch (const std::exception& ex) {
                PredictionResult failed;
                failed.window_index = spans[i].index;
                failed.start_ms = spans[i].start_ms;
                failed.end_ms = spans[i].end_ms;
                failed.outcome =
                    PredictionFailure{PipelineStage::Extracting, Error{ErrorCode::Feature, ex.what()}};
                logger_.warn("Segment " + std::to_string(i) + ": " + ex.what());
                slots[i] = std::move(failed);
                if (abort_on_error) {
                    stop.store(true);
                }
            }
        }
    };

    const std::size_t worker_count = std::min(std::max<std::size_t>(1, config_.runtime.worker_count),
                                              std::max<std::size_t>(1, count));
    if (worker_count == 1) {
        worker();
    } else {
        std::vector<std::thread> threads;
        threads.reserve(worker_count);
        for (std::size_t t = 0; t < worker_count; ++t) {
            threads.emplace_back(worker);
        }
        for (std::thread& thread : threads) {
            thread.join();
        }
    }

    std::vector<PredictionResult> results;
    std::vector<StageError> window_errors;
    std::optional<Error> first_window_error;
    results.reserve(count);
    for (std::optional<PredictionResult>& slot : slots) {
        if (!slot) {
            continue;
        }
        if (const PredictionFailure* failure = slot->failure()) {
            window_errors.push_back(StageError{failure->stage, slot->window_index, failure->error});
            if (!first_window_error) {
                first_window_error = failure->error;
            }
        }
        results.push_back(std::move(*slot));
    }
    const std::size_t attempted = results.size();

    state_ = OrchestratorState::Aggregating;
    const auto aggregate_start = std::chrono::steady_clock::now();
    AggregatorConfig aggregator_config = config_.aggregator;
    if (aggregator_config.model_version.empty()) {
        aggregator_config.model_version = std::string(classifier_->backend_name()) + "_v1";
    }
    std::shared_ptr<SubEventLocalizer> localizer = localizer_;
    if (aggregator_config.mode == AggregatorConfig::Mode::Precise && !localizer) {
        localizer = std::make_shared<EnergyLocalizer>();
    }
    const Aggregator aggregator(aggregator_config, logger_, localizer);
    AggregationResult aggregation =
        aggregator.aggregate(std::move(results), attempted, &waveform, &spans);
    perf_.aggregate_ms = elapsed_ms(aggregate_start);

    AnalysisReport report;
    report.events = std::move(aggregation.events);
    report.summary = std::move(aggregation.summary);
    report.errors = std::move(window_errors);
    report.errors.insert(report.errors.end(), aggregation.errors.begin(), aggregation.errors.end());

    if (report.summary.successful_predictions == 0) {
        logger_.warn("No successful predictions");
        report.errors.push_back(StageError{PipelineStage::Aggregating, std::nullopt,
                                           Error{ErrorCode::Classifier, "No successful predictions"}});
    }
    fill_processing_info(&report, input_file);

    if (resource_failure) {
        std::string what = "out of memory";
        try {
            std::rethrow_exception(resource_failure);
        } catch (const std::exception& ex) {
            what = ex.what();
        }
        const Error exhausted{ErrorCode::ResourceExhausted, what};
        report.errors.push_back(StageError{PipelineStage::Extracting, std::nullopt, exhausted});
        report.fatal_error = exhausted;
        logger_.error(describe(exhausted));
        state_ = OrchestratorState::Aborted;
        throw ResourceExhaustedError(describe(exhausted), std::move(report));
    }

    if (cancel_token_->cancelled()) {
        std::ostringstream msg;
        msg << "run cancelled after " << attempted << " of " << count << " segments";
        const Error cancelled{ErrorCode::Cancelled, msg.str()};
        report.errors.push_back(StageError{PipelineStage::Extracting, std::nullopt, cancelled});
        report.fatal_error = cancelled;
        logger_.warn(describe(cancelled));
        state_ = OrchestratorState::Aborted;
        throw CancellationError(describe(cancelled), std::move(report));
    }

    if (abort_on_error && first_window_error) {
        report.fatal_error = *first_window_error;
        logger_.error("Stopping after window failure: " + describe(*first_window_error));
        state_ = OrchestratorState::Aborted;
        log_perf();
        return report;
    }

    state_ = OrchestratorState::Done;
    {
        std::ostringstream msg;
        msg << "Analysis complete: " << report.events.size() << " events from "
            << report.summary.successful_predictions << "/" << report.summary.total_segments
            << " segments";
        logger_.info(msg.str());
    }
    log_perf();
    return report;
}

void Orchestrator::log_perf() const {
    if (!config_.runtime.profile) {
        return;
    }
    std::ostringstream msg;
    msg << "Timing: segment=" << perf_.segment_ms << "ms"
        << " extract=" << perf_.extract_ms << "ms"
        << " classify=" << perf_.classify_ms << "ms"
        << " aggregate=" << perf_.aggregate_ms << "ms"
        << " windows=" << perf_.window_count;
    logger_.info(msg.str());
}

} // namespace stutterscan
