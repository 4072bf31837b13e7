//
//  aggregator_test.cpp
//  StutterScan
//
//  Created by the StutterScan Authors on 2026-03-05.
//  Copyright © 2026 StutterScan Authors. All rights reserved.
//

#include "stutterscan/aggregator.h"
#include "fake_pipeline_test_utils.h"

#include <cmath>
#include <iostream>
#include <limits>
#include <memory>
#include <utility>
#include <vector>

namespace {

using stutterscan::tests::CapturedLog;
using stutterscan::tests::FakeLocalizer;
using stutterscan::tests::make_failure;
using stutterscan::tests::make_success;

stutterscan::Aggregator coarse_aggregator(stutterscan::Logger logger = stutterscan::Logger()) {
    stutterscan::AggregatorConfig config;
    config.model_version = "fake_v1";
    return stutterscan::Aggregator(config, std::move(logger));
}

bool test_threshold_drops_low_confidence_windows() {
    std::vector<stutterscan::PredictionResult> results;
    results.push_back(make_success(0, 0, 3000, {0.29f, 0.2f, 0.1f}));
    results.push_back(make_success(1, 1500, 4500, {0.1f, 0.3f, 0.2f}));
    results.push_back(make_success(2, 3000, 6000, {0.05f, 0.1f, 0.85f}));

    const auto aggregation = coarse_aggregator().aggregate(results, 3);
    if (aggregation.events.size() != 2) {
        std::cerr << "Aggregator test failed: expected 2 events above 0.3, got "
                  << aggregation.events.size() << ".\n";
        return false;
    }
    const auto& first = aggregation.events[0];
    if (first.type != "prolongations" || first.start_ms != 1500 || first.end_ms != 4500 ||
        first.source != "cnn_model" || first.model_version != "fake_v1") {
        std::cerr << "Aggregator test failed: unexpected first event.\n";
        return false;
    }
    if (aggregation.events[1].severity != stutterscan::Severity::High) {
        std::cerr << "Aggregator test failed: 0.85 should be high severity.\n";
        return false;
    }
    if (aggregation.summary.successful_predictions != 3 ||
        aggregation.summary.total_segments != 3) {
        std::cerr << "Aggregator test failed: unexpected summary counts.\n";
        return false;
    }
    const double expected_average = (0.3 + 0.85) / 2.0;
    if (std::fabs(aggregation.summary.average_confidence - expected_average) > 1e-6) {
        std::cerr << "Aggregator test failed: average confidence "
                  << aggregation.summary.average_confidence << ".\n";
        return false;
    }
    return true;
}

bool test_partial_failure_keeps_denominators() {
    std::vector<stutterscan::PredictionResult> results;
    results.push_back(make_success(0, 0, 3000, {0.9f, 0.05f, 0.05f}));
    results.push_back(make_failure(1, 1500, 4500));
    results.push_back(make_success(2, 3000, 6000, {0.1f, 0.1f, 0.8f}));

    const auto aggregation = coarse_aggregator().aggregate(results, 3);
    if (aggregation.events.size() != 2 || aggregation.events[0].window_index != 0 ||
        aggregation.events[1].window_index != 2) {
        std::cerr << "Aggregator test failed: expected events for windows 0 and 2.\n";
        return false;
    }
    if (aggregation.summary.successful_predictions != 2 ||
        aggregation.summary.total_segments != 3) {
        std::cerr << "Aggregator test failed: partial failure summary counts wrong.\n";
        return false;
    }
    return true;
}

bool test_dominant_class_tie_prefers_first_seen() {
    std::vector<stutterscan::PredictionResult> results;
    results.push_back(make_success(0, 0, 3000, {0.1f, 0.1f, 0.9f}));
    results.push_back(make_success(1, 1500, 4500, {0.9f, 0.1f, 0.1f}));
    results.push_back(make_success(2, 3000, 6000, {0.9f, 0.1f, 0.1f}));
    results.push_back(make_success(3, 4500, 7500, {0.1f, 0.1f, 0.9f}));

    const auto aggregation = coarse_aggregator().aggregate(results, 4);
    const auto& distribution = aggregation.summary.class_distribution;
    if (distribution.size() != 2 || distribution[0].first != "repetitions" ||
        distribution[0].second != 2 || distribution[1].first != "blocks") {
        std::cerr << "Aggregator test failed: class distribution not in first-seen order.\n";
        return false;
    }
    if (aggregation.summary.dominant_class != "repetitions") {
        std::cerr << "Aggregator test failed: tie resolved to "
                  << aggregation.summary.dominant_class << ".\n";
        return false;
    }
    return true;
}

bool test_no_events_reports_none() {
    std::vector<stutterscan::PredictionResult> results;
    results.push_back(make_success(0, 0, 3000, {0.1f, 0.1f, 0.1f}));
    const auto aggregation = coarse_aggregator().aggregate(results, 1);
    if (!aggregation.events.empty() || aggregation.summary.dominant_class != "none" ||
        aggregation.summary.average_confidence != 0.0) {
        std::cerr << "Aggregator test failed: empty event list summary wrong.\n";
        return false;
    }
    return true;
}

bool test_score_count_mismatch_is_reconciled() {
    CapturedLog log;
    const stutterscan::Logger logger = log.logger();
    const std::vector<std::string> names{"blocks", "prolongations", "repetitions"};

    const auto padded = stutterscan::reconcile_prediction({0.2f, 0.7f}, names, &logger);
    if (padded.class_probabilities.size() != 3 || padded.class_probabilities[2].second != 0.0f ||
        padded.predicted_class != "prolongations") {
        std::cerr << "Aggregator test failed: short score vector not padded.\n";
        return false;
    }
    const auto truncated =
        stutterscan::reconcile_prediction({0.2f, 0.1f, 0.3f, 0.95f}, names, &logger);
    if (truncated.class_probabilities.size() != 3 || truncated.predicted_class != "repetitions" ||
        std::fabs(truncated.confidence - 0.3f) > 1e-6f) {
        std::cerr << "Aggregator test failed: extra scores not ignored.\n";
        return false;
    }
    if (!log.contains(stutterscan::LogVerbosity::Warn, "padding") ||
        !log.contains(stutterscan::LogVerbosity::Warn, "ignoring")) {
        std::cerr << "Aggregator test failed: mismatch not logged.\n";
        return false;
    }
    return true;
}

bool test_events_sorted_by_start_then_window() {
    std::vector<stutterscan::PredictionResult> results;
    results.push_back(make_success(2, 3000, 6000, {0.9f, 0.0f, 0.0f}));
    results.push_back(make_success(0, 0, 3000, {0.9f, 0.0f, 0.0f}));
    results.push_back(make_success(1, 1500, 4500, {0.9f, 0.0f, 0.0f}));

    const auto aggregation = coarse_aggregator().aggregate(results, 3);
    for (std::size_t i = 0; i < aggregation.events.size(); ++i) {
        if (aggregation.events[i].window_index != i) {
            std::cerr << "Aggregator test failed: events not ordered by start.\n";
            return false;
        }
    }
    return aggregation.events.size() == 3;
}

bool test_precise_mode_shifts_sub_events() {
    stutterscan::SubEvent early;
    early.type = "blocks";
    early.confidence = 0.7f;
    early.start_ms = 100;
    early.end_ms = 400;
    early.severity = stutterscan::Severity::Medium;
    stutterscan::SubEvent late = early;
    late.start_ms = 2000;
    late.end_ms = 2600;

    auto localizer = std::make_shared<FakeLocalizer>(std::vector<stutterscan::SubEvent>{early, late});
    stutterscan::AggregatorConfig config;
    config.mode = stutterscan::AggregatorConfig::Mode::Precise;
    config.model_version = "fake_v1";
    const stutterscan::Aggregator aggregator(config, stutterscan::Logger(), localizer);

    stutterscan::Waveform waveform;
    waveform.sample_rate = 1000.0;
    waveform.samples.resize(4500);
    for (std::size_t i = 0; i < waveform.samples.size(); ++i) {
        waveform.samples[i] = static_cast<float>(i);
    }
    const auto spans = stutterscan::plan_windows(4500, stutterscan::SegmenterConfig{});

    std::vector<stutterscan::PredictionResult> results;
    results.push_back(make_success(0, 0, 3000, {0.7f, 0.1f, 0.1f}));
    results.push_back(make_success(1, 1500, 4500, {0.7f, 0.1f, 0.1f}));

    const auto aggregation = aggregator.aggregate(results, 2, &waveform, &spans);
    if (localizer->first_samples.size() != 2 || localizer->first_samples[0] != 0.0f ||
        localizer->first_samples[1] != 1500.0f || localizer->sample_counts[1] != 3000) {
        std::cerr << "Aggregator test failed: localizer did not get windows cut from the waveform.\n";
        return false;
    }
    if (aggregation.events.size() != 4) {
        std::cerr << "Aggregator test failed: expected 4 precise events, got "
                  << aggregation.events.size() << ".\n";
        return false;
    }
    // 100 (w0), 1600 (w1), 2000 (w0), 3500 (w1)
    const std::size_t expected_starts[] = {100, 1600, 2000, 3500};
    for (std::size_t i = 0; i < 4; ++i) {
        if (aggregation.events[i].start_ms != expected_starts[i]) {
            std::cerr << "Aggregator test failed: precise event " << i << " starts at "
                      << aggregation.events[i].start_ms << ".\n";
            return false;
        }
    }
    const auto& shifted = aggregation.events[1];
    if (shifted.end_ms != 1900 || shifted.segment_start_ms != 1500 ||
        shifted.relative_start_ms != 100 || shifted.source != "cnn_model_precise" ||
        shifted.model_version != "fake_v1_precise" || !shifted.precise ||
        shifted.severity != stutterscan::Severity::Medium) {
        std::cerr << "Aggregator test failed: precise event fields not carried through.\n";
        return false;
    }
    return true;
}

bool test_precise_mode_skips_failed_localization() {
    auto localizer = std::make_shared<FakeLocalizer>(std::vector<stutterscan::SubEvent>{}, true);
    stutterscan::AggregatorConfig config;
    config.mode = stutterscan::AggregatorConfig::Mode::Precise;
    const stutterscan::Aggregator aggregator(config, stutterscan::Logger(), localizer);

    stutterscan::Waveform waveform;
    waveform.sample_rate = 1000.0;
    waveform.samples.assign(3000, 0.1f);
    const auto spans = stutterscan::plan_windows(3000, stutterscan::SegmenterConfig{});
    std::vector<stutterscan::PredictionResult> results;
    results.push_back(make_success(0, 0, 3000, {0.7f, 0.1f, 0.1f}));

    const auto aggregation = aggregator.aggregate(results, 1, &waveform, &spans);
    if (!aggregation.events.empty() || aggregation.errors.size() != 1 ||
        !aggregation.errors[0].window_index || *aggregation.errors[0].window_index != 0) {
        std::cerr << "Aggregator test failed: localization failure not recorded.\n";
        return false;
    }
    if (aggregation.summary.successful_predictions != 1 ||
        aggregation.summary.total_segments != 1) {
        std::cerr << "Aggregator test failed: localization failure changed denominators.\n";
        return false;
    }
    return true;
}

bool test_non_finite_confidence_flags_summary() {
    stutterscan::SubEvent broken;
    broken.type = "blocks";
    broken.confidence = std::numeric_limits<float>::quiet_NaN();
    broken.start_ms = 0;
    broken.end_ms = 200;
    auto localizer = std::make_shared<FakeLocalizer>(std::vector<stutterscan::SubEvent>{broken});
    stutterscan::AggregatorConfig config;
    config.mode = stutterscan::AggregatorConfig::Mode::Precise;
    const stutterscan::Aggregator aggregator(config, stutterscan::Logger(), localizer);

    stutterscan::Waveform waveform;
    waveform.sample_rate = 1000.0;
    waveform.samples.assign(3000, 0.1f);
    const auto spans = stutterscan::plan_windows(3000, stutterscan::SegmenterConfig{});
    std::vector<stutterscan::PredictionResult> results;
    results.push_back(make_success(0, 0, 3000, {0.7f, 0.1f, 0.1f}));

    const auto aggregation = aggregator.aggregate(results, 1, &waveform, &spans);
    if (aggregation.events.size() != 1) {
        std::cerr << "Aggregator test failed: raw events not preserved on summary failure.\n";
        return false;
    }
    if (!aggregation.summary.error ||
        aggregation.summary.error->code != stutterscan::ErrorCode::Aggregation) {
        std::cerr << "Aggregator test failed: summary not flagged with AggregationError.\n";
        return false;
    }
    if (aggregation.summary.total_segments != 1 || aggregation.summary.dominant_class != "none") {
        std::cerr << "Aggregator test failed: flagged summary not reset.\n";
        return false;
    }
    return true;
}

bool test_severity_tiers() {
    using stutterscan::Severity;
    using stutterscan::severity_for_confidence;
    if (severity_for_confidence(0.39f) != Severity::VeryLow ||
        severity_for_confidence(0.4f) != Severity::Low ||
        severity_for_confidence(0.6f) != Severity::Medium ||
        severity_for_confidence(0.8f) != Severity::High) {
        std::cerr << "Aggregator test failed: severity tiers wrong.\n";
        return false;
    }
    return true;
}

} // namespace

int main() {
    if (!test_threshold_drops_low_confidence_windows()) {
        return 1;
    }
    if (!test_partial_failure_keeps_denominators()) {
        return 1;
    }
    if (!test_dominant_class_tie_prefers_first_seen()) {
        return 1;
    }
    if (!test_no_events_reports_none()) {
        return 1;
    }
    if (!test_score_count_mismatch_is_reconciled()) {
        return 1;
    }
    if (!test_events_sorted_by_start_then_window()) {
        return 1;
    }
    if (!test_precise_mode_shifts_sub_events()) {
        return 1;
    }
    if (!test_precise_mode_skips_failed_localization()) {
        return 1;
    }
    if (!test_non_finite_confidence_flags_summary()) {
        return 1;
    }
    if (!test_severity_tiers()) {
        return 1;
    }

    std::cout << "Aggregator test passed.\n";
    return 0;
}
