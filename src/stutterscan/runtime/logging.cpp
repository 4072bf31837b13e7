//
//  logging.cpp
//  StutterScan
//
//  Created by the StutterScan Authors on 2026-02-22.
//  Copyright © 2026 StutterScan Authors. All rights reserved.
//

#include "stutterscan/logging.hpp"

#include "stutterscan/config.h"

#include <atomic>
#include <mutex>
#include <utility>

namespace stutterscan {

namespace {

std::atomic<int> g_log_level{static_cast<int>(LogVerbosity::Warn)};
// Sinks are called from pipeline workers.
std::mutex g_sink_mutex;

} // namespace

void set_log_verbosity(LogVerbosity level) {
    g_log_level.store(static_cast<int>(level), std::memory_order_relaxed);
}

LogVerbosity get_log_verbosity() {
    return static_cast<LogVerbosity>(g_log_level.load(std::memory_order_relaxed));
}

void set_log_verbosity_from_config(const RuntimeConfig& config) {
    if (config.verbose) {
        set_log_verbosity(LogVerbosity::Debug);
        return;
    }
    if (config.profile) {
        set_log_verbosity(LogVerbosity::Info);
        return;
    }
    set_log_verbosity(LogVerbosity::Warn);
}

const char* log_verbosity_tag(LogVerbosity level) {
    switch (level) {
        case LogVerbosity::Error:
            return "error";
        case LogVerbosity::Warn:
            return "warn";
        case LogVerbosity::Info:
            return "info";
        case LogVerbosity::Debug:
            return "debug";
    }
    return "debug";
}

Logger::Logger()
    : sink_([](LogVerbosity level, const std::string& message) {
          std::cerr << "[StutterScan][" << log_verbosity_tag(level) << "] " << message << "\n";
      }),
      level_(get_log_verbosity()) {}

Logger::Logger(Sink sink, LogVerbosity level)
    : sink_(std::move(sink)),
      level_(level) {}

void Logger::log(LogVerbosity level, const std::string& message) const {
    if (!sink_ || !enabled(level)) {
        return;
    }
    std::lock_guard<std::mutex> lock(g_sink_mutex);
    sink_(level, message);
}

} // namespace stutterscan
