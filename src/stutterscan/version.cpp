//
//  version.cpp
//  StutterScan
//
//  Created by the StutterScan Authors on 2026-02-22.
//  Copyright © 2026 StutterScan Authors. All rights reserved.
//

#include "stutterscan/version.h"

#include "stutterscan_version.hpp"

namespace stutterscan {

std::string version_string() {
    return STUTTERSCAN_VERSION_DISPLAY;
}

} // namespace stutterscan
