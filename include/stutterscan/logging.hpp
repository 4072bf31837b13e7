//
//  logging.hpp
//  StutterScan
//
//  Created by the StutterScan Authors on 2026-02-22.
//  Copyright © 2026 StutterScan Authors. All rights reserved.
//

#pragma once

#include <functional>
#include <iostream>
#include <sstream>
#include <string>
#include <string_view>

namespace stutterscan {

struct RuntimeConfig;

/// @brief Logging level policy for StutterScan.
///
/// Usage contract:
/// - `Error`: hard failures that prevent the requested operation.
/// - `Warn`: degraded behavior, fallback, skipped windows, or any suspicious
///   condition users should see in non-verbose mode.
/// - `Info`: high-level lifecycle/profiling summaries (e.g. timing lines).
/// - `Debug`: per-window diagnostics and internal traces.
///
/// Important:
/// - `Warn` and `Error` logs must never be additionally gated by local flags;
///   the logger level controls visibility.
enum class LogVerbosity {
    /// @brief Hard failure; requested operation cannot be completed.
    Error = 0,
    /// @brief Recoverable issue, fallback, or suspicious condition.
    Warn = 1,
    /// @brief Operational summary and profiling information.
    Info = 2,
    /// @brief Detailed internal diagnostics and trace data.
    Debug = 3
};

/// @brief Set the verbosity used by the STUTTERSCAN_LOG_* macros.
void set_log_verbosity(LogVerbosity level);

/// @brief Get the verbosity used by the STUTTERSCAN_LOG_* macros.
LogVerbosity get_log_verbosity();

/// @brief Configure macro log verbosity from runtime flags.
void set_log_verbosity_from_config(const RuntimeConfig& config);

const char* log_verbosity_tag(LogVerbosity level);

/// @brief Logger handed to pipeline objects at construction.
///
/// The default instance writes to stderr in the same format as the macros.
/// Tests and hosts pass their own sink to capture stage failures.
class Logger {
public:
    using Sink = std::function<void(LogVerbosity level, const std::string& message)>;

    Logger();
    explicit Logger(Sink sink, LogVerbosity level = LogVerbosity::Debug);

    bool enabled(LogVerbosity level) const {
        return static_cast<int>(level) <= static_cast<int>(level_);
    }

    void set_level(LogVerbosity level) { level_ = level; }
    LogVerbosity level() const { return level_; }

    void log(LogVerbosity level, const std::string& message) const;

    void error(const std::string& message) const { log(LogVerbosity::Error, message); }
    void warn(const std::string& message) const { log(LogVerbosity::Warn, message); }
    void info(const std::string& message) const { log(LogVerbosity::Info, message); }
    void debug(const std::string& message) const { log(LogVerbosity::Debug, message); }

private:
    Sink sink_;
    LogVerbosity level_ = LogVerbosity::Warn;
};

} // namespace stutterscan

inline constexpr stutterscan::LogVerbosity stutterscan_severity_for_tag(std::string_view tag) {
    if (tag == "error") {
        return stutterscan::LogVerbosity::Error;
    }
    if (tag == "warn" || tag == "warning") {
        return stutterscan::LogVerbosity::Warn;
    }
    if (tag == "info") {
        return stutterscan::LogVerbosity::Info;
    }
    return stutterscan::LogVerbosity::Debug;
}

inline bool stutterscan_should_log(const char* level) {
    const auto current = stutterscan::get_log_verbosity();
    const auto severity = stutterscan_severity_for_tag(level ? level : "");
    return static_cast<int>(severity) <= static_cast<int>(current);
}

inline void stutterscan_log_impl(const char* level,
                                 const std::string& message,
                                 const char* file,
                                 int line,
                                 const char* func) {
    const std::string label = level ? level : "";
    if (label == "error") {
        std::cerr << "[StutterScan][" << label << "][" << file << ":" << line
                  << " " << func << "] " << message << "\n";
        return;
    }

    std::cerr << "[StutterScan][" << label << "] " << message << "\n";
}

#define STUTTERSCAN_LOG(level, message)                                          \
    do {                                                                         \
        if (stutterscan_should_log(level)) {                                     \
            std::ostringstream _stutterscan_log_stream;                          \
            _stutterscan_log_stream << message;                                  \
            stutterscan_log_impl(level,                                          \
                                 _stutterscan_log_stream.str(),                  \
                                 __FILE__,                                       \
                                 __LINE__,                                       \
                                 __func__);                                      \
        }                                                                        \
    } while (0)

#define STUTTERSCAN_LOG_ERROR(message) STUTTERSCAN_LOG("error", message)
#define STUTTERSCAN_LOG_WARN(message) STUTTERSCAN_LOG("warn", message)
#define STUTTERSCAN_LOG_INFO(message) STUTTERSCAN_LOG("info", message)
#define STUTTERSCAN_LOG_DEBUG(message) STUTTERSCAN_LOG("debug", message)
