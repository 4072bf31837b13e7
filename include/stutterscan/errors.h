//
//  errors.h
//  StutterScan
//
//  Created by the StutterScan Authors on 2026-03-02.
//  Copyright © 2026 StutterScan Authors. All rights reserved.
//

#pragma once

#include <string>
#include <utility>

namespace stutterscan {

/// @brief Failure taxonomy shared by every pipeline stage.
enum class ErrorCode {
    None = 0,
    /// @brief Bad configuration or call parameters.
    Validation,
    /// @brief Missing input or model file.
    NotFound,
    /// @brief Unreadable or unwritable path.
    Permission,
    /// @brief Waveform could not be decoded.
    Decode,
    /// @brief Zero-duration audio.
    EmptyInput,
    /// @brief Invalid spectrogram dimensions or scale.
    Feature,
    /// @brief Model load or inference failure.
    Classifier,
    /// @brief Statistics or event fusion failure.
    Aggregation,
    /// @brief Run cancelled by the user or host.
    Cancelled,
    /// @brief Out of memory or similar resource failure.
    ResourceExhausted,
};

struct Error {
    ErrorCode code = ErrorCode::None;
    std::string message;

    bool ok() const { return code == ErrorCode::None; }
};

const char* error_code_name(ErrorCode code);

/// @brief Human-readable `"<Kind>: <message>"` rendering used in reports.
std::string describe(const Error& error);

/// @brief Fill `error` (when non-null) and return false; keeps call sites short.
inline bool fail(Error* error, ErrorCode code, std::string message) {
    if (error) {
        error->code = code;
        error->message = std::move(message);
    }
    return false;
}

} // namespace stutterscan
