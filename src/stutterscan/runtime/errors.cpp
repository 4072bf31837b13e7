//
//  errors.cpp
//  StutterScan
//
//  Created by the StutterScan Authors on 2026-03-02.
//  Copyright © 2026 StutterScan Authors. All rights reserved.
//

#include "stutterscan/errors.h"

namespace stutterscan {

const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::None:
            return "None";
        case ErrorCode::Validation:
            return "ValidationError";
        case ErrorCode::NotFound:
            return "NotFoundError";
        case ErrorCode::Permission:
            return "PermissionError";
        case ErrorCode::Decode:
            return "DecodeError";
        case ErrorCode::EmptyInput:
            return "EmptyInputError";
        case ErrorCode::Feature:
            return "FeatureError";
        case ErrorCode::Classifier:
            return "ClassifierError";
        case ErrorCode::Aggregation:
            return "AggregationError";
        case ErrorCode::Cancelled:
            return "CancellationError";
        case ErrorCode::ResourceExhausted:
            return "ResourceExhaustedError";
    }
    return "UnknownError";
}

std::string describe(const Error& error) {
    if (error.ok()) {
        return {};
    }
    std::string text = error_code_name(error.code);
    if (!error.message.empty()) {
        text += ": ";
        text += error.message;
    }
    return text;
}

} // namespace stutterscan
