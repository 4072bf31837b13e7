//
//  classifier.h
//  StutterScan
//
//  Created by the StutterScan Authors on 2026-03-04.
//  Copyright © 2026 StutterScan Authors. All rights reserved.
//

#pragma once

#include "stutterscan/config.h"
#include "stutterscan/errors.h"
#include "stutterscan/features.h"

#include <memory>
#include <string>
#include <vector>

namespace stutterscan {

/// @brief Per-window disfluency classifier.
///
/// `classify` returns one score per entry of `class_names()`, in that order.
/// Scores are not assumed to sum to one, and a backend may return more or
/// fewer scores than there are class names; the aggregator reconciles that.
class Classifier {
public:
    virtual ~Classifier() = default;

    virtual bool classify(const Spectrogram& spectrogram,
                          std::vector<float>* probabilities,
                          Error* error) = 0;

    virtual const std::vector<std::string>& class_names() const = 0;

    /// @brief True if `classify` may be called from several threads at once.
    virtual bool is_reentrant() const = 0;

    virtual const char* backend_name() const = 0;
};

/// @brief Load the model named by `config` with the backend it resolves to.
///
/// Fails with `NotFound` or `Permission` for an unusable model path and
/// `Classifier` when the backend cannot load it.
std::unique_ptr<Classifier> make_classifier(const ClassifierConfig& config, Error* error);

/// @brief Read `class_names.txt` beside `model_path`, one name per line.
///
/// Returns false if the file is missing or lists no names.
bool load_class_names(const std::string& model_path, std::vector<std::string>* names);

/// @brief Explicit names from `config`, else the model's list, else the defaults.
std::vector<std::string> resolve_class_names(const ClassifierConfig& config);

} // namespace stutterscan
