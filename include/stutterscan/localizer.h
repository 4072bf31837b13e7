//
//  localizer.h
//  StutterScan
//
//  Created by the StutterScan Authors on 2026-03-05.
//  Copyright © 2026 StutterScan Authors. All rights reserved.
//

#pragma once

#include "stutterscan/errors.h"
#include "stutterscan/events.h"

#include <cstddef>
#include <vector>

namespace stutterscan {

/// @brief Finds where inside a window the detected disfluencies sit.
///
/// Receives the window's samples and its coarse class scores; returns
/// sub-events ordered by start, relative to the window start.
class SubEventLocalizer {
public:
    virtual ~SubEventLocalizer() = default;

    virtual bool localize(const std::vector<float>& samples,
                          double sample_rate,
                          const ClassProbabilities& probabilities,
                          std::vector<SubEvent>* events,
                          Error* error) = 0;
};

/// @brief Reference localizer: voiced regions from short-time energy.
///
/// Frames whose RMS level is within `energy_threshold_db` of the window
/// peak are active. Active runs separated by less than `merge_gap_ms` are
/// merged, runs shorter than `min_event_ms` dropped. Each remaining run is
/// reported as the window's top class with its coarse confidence, provided
/// that confidence reaches `min_confidence`.
class EnergyLocalizer final : public SubEventLocalizer {
public:
    struct Config {
        std::size_t frame_ms = 25;
        std::size_t hop_ms = 10;
        float energy_threshold_db = -30.0f;
        std::size_t merge_gap_ms = 150;
        std::size_t min_event_ms = 100;
        float min_confidence = 0.3f;
    };

    EnergyLocalizer();
    explicit EnergyLocalizer(const Config& config);

    bool localize(const std::vector<float>& samples,
                  double sample_rate,
                  const ClassProbabilities& probabilities,
                  std::vector<SubEvent>* events,
                  Error* error) override;

private:
    Config config_;
};

} // namespace stutterscan
