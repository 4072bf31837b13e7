//
//  version.h
//  StutterScan
//
//  Created by the StutterScan Authors on 2026-02-22.
//  Copyright © 2026 StutterScan Authors. All rights reserved.
//

#pragma once

#include <string>

namespace stutterscan {

/// @brief Return the StutterScan version display string.
///
/// Mirrors CLI version output (for example: `v0.3.0` or `v0.3.0+abcd123`).
std::string version_string();

} // namespace stutterscan
