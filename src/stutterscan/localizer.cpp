//
//  localizer.cpp
//  StutterScan
//
//  Created by the StutterScan Authors on 2026-03-05.
//  Copyright © 2026 StutterScan Authors. All rights reserved.
//

#include "stutterscan/localizer.h"

#include "stutterscan/logging.hpp"
#include "stutterscan/waveform.h"

#include <algorithm>
#include <cmath>

namespace stutterscan {
namespace {

struct Run {
    std::size_t start_ms = 0;
    std::size_t end_ms = 0;
};

std::vector<float> frame_levels_db(const std::vector<float>& samples,
                                   std::size_t frame,
                                   std::size_t hop) {
    std::vector<float> levels;
    if (samples.empty() || frame == 0 || hop == 0) {
        return levels;
    }
    const std::size_t count =
        samples.size() <= frame ? 1 : 1 + (samples.size() - frame) / hop;
    levels.reserve(count);
    for (std::size_t f = 0; f < count; ++f) {
        const std::size_t begin = f * hop;
        const std::size_t end = std::min(begin + frame, samples.size());
        double energy = 0.0;
        for (std::size_t i = begin; i < end; ++i) {
            energy += static_cast<double>(samples[i]) * samples[i];
        }
        const double rms = std::sqrt(energy / static_cast<double>(std::max<std::size_t>(1, end - begin)));
        levels.push_back(static_cast<float>(20.0 * std::log10(std::max(rms, 1e-10))));
    }
    return levels;
}

} // namespace

EnergyLocalizer::EnergyLocalizer() = default;

EnergyLocalizer::EnergyLocalizer(const Config& config) : config_(config) {}

bool EnergyLocalizer::localize(const std::vector<float>& samples,
                               double sample_rate,
                               const ClassProbabilities& probabilities,
                               std::vector<SubEvent>* events,
                               Error* error) {
    if (!events) {
        return fail(error, ErrorCode::Validation, "missing sub-event output");
    }
    events->clear();
    if (sample_rate <= 0.0) {
        return fail(error, ErrorCode::Validation, "invalid sample rate");
    }
    if (probabilities.empty()) {
        return fail(error, ErrorCode::Validation, "no class scores to localize");
    }
    if (config_.frame_ms == 0 || config_.hop_ms == 0) {
        return fail(error, ErrorCode::Validation, "localizer frame and hop must be positive");
    }

    const auto top = std::max_element(
        probabilities.begin(), probabilities.end(),
        [](const auto& a, const auto& b) { return a.second < b.second; });
    if (!(top->second >= config_.min_confidence)) {
        return true;
    }

    const std::size_t frame = ms_to_samples(config_.frame_ms, sample_rate);
    const std::size_t hop = ms_to_samples(config_.hop_ms, sample_rate);
    const std::vector<float> levels = frame_levels_db(samples, frame, hop);
    if (levels.empty()) {
        return true;
    }
    const float peak = *std::max_element(levels.begin(), levels.end());
    // All-silent window.
    if (peak <= -180.0f) {
        return true;
    }

    const std::size_t window_ms = static_cast<std::size_t>(
        std::llround(static_cast<double>(samples.size()) * 1000.0 / sample_rate));
    const float gate = peak + config_.energy_threshold_db;

    std::vector<Run> runs;
    bool active = false;
    Run current;
    for (std::size_t f = 0; f < levels.size(); ++f) {
        if (levels[f] >= gate) {
            const std::size_t frame_start = f * config_.hop_ms;
            const std::size_t frame_end = std::min(frame_start + config_.frame_ms, window_ms);
            if (!active) {
                current.start_ms = frame_start;
                active = true;
            }
            current.end_ms = std::max(current.end_ms, frame_end);
        } else if (active) {
            runs.push_back(current);
            current = Run{};
            active = false;
        }
    }
    if (active) {
        runs.push_back(current);
    }

    std::vector<Run> merged;
    for (const Run& run : runs) {
        if (!merged.empty() && run.start_ms <= merged.back().end_ms + config_.merge_gap_ms) {
            merged.back().end_ms = std::max(merged.back().end_ms, run.end_ms);
        } else {
            merged.push_back(run);
        }
    }

    for (const Run& run : merged) {
        if (run.end_ms - run.start_ms < config_.min_event_ms) {
            continue;
        }
        SubEvent event;
        event.type = top->first;
        event.confidence = top->second;
        event.start_ms = run.start_ms;
        event.end_ms = run.end_ms;
        event.severity = severity_for_confidence(top->second);
        events->push_back(event);
    }

    STUTTERSCAN_LOG_DEBUG("Energy localizer: " << runs.size() << " active runs, "
                                               << events->size() << " sub-events");
    return true;
}

} // namespace stutterscan
