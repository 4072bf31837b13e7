//
//  wav.h
//  StutterScan
//
//  Created by the StutterScan Authors on 2026-02-22.
//  Copyright © 2026 StutterScan Authors. All rights reserved.
//

#pragma once

#include <string>
#include <vector>

namespace stutterscan::detail {

bool write_wav_mono_16(const std::string& path,
                       const std::vector<float>& samples,
                       double sample_rate,
                       std::string* error);

// Decodes through dr_wav (PCM, IEEE float, A-law and mu-law), averaging all
// channels into one.
bool read_wav_mono(const std::string& path,
                   std::vector<float>* samples,
                   double* sample_rate,
                   std::string* error);

} // namespace stutterscan::detail
