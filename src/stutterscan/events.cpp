//
//  events.cpp
//  StutterScan
//
//  Created by the StutterScan Authors on 2026-03-05.
//  Copyright © 2026 StutterScan Authors. All rights reserved.
//

#include "stutterscan/events.h"

namespace stutterscan {

Severity severity_for_confidence(float confidence) {
    if (confidence >= 0.8f) {
        return Severity::High;
    }
    if (confidence >= 0.6f) {
        return Severity::Medium;
    }
    if (confidence >= 0.4f) {
        return Severity::Low;
    }
    return Severity::VeryLow;
}

const char* severity_name(Severity severity) {
    switch (severity) {
        case Severity::VeryLow:
            return "very_low";
        case Severity::Low:
            return "low";
        case Severity::Medium:
            return "medium";
        case Severity::High:
            return "high";
    }
    return "very_low";
}

} // namespace stutterscan
