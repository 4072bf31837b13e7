//
//  preset.h
//  StutterScan
//
//  Created by the StutterScan Authors on 2026-01-17.
//  Copyright © 2026 StutterScan Authors. All rights reserved.
//

#pragma once

#include "stutterscan/config.h"

#include <memory>
#include <string>
#include <vector>

namespace stutterscan {

class DetectorPreset {
public:
    virtual ~DetectorPreset() = default;
    virtual const char* name() const = 0;
    virtual void apply(DetectorConfig& config) const = 0;
};

std::unique_ptr<DetectorPreset> make_detector_preset(const std::string& name);
std::vector<std::string> detector_preset_names();

} // namespace stutterscan
