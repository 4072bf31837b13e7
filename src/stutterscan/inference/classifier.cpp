//
//  classifier.cpp
//  StutterScan
//
//  Created by the StutterScan Authors on 2026-03-04.
//  Copyright © 2026 StutterScan Authors. All rights reserved.
//

#include "stutterscan/classifier.h"

#include "backend.h"
#include "stutterscan/logging.hpp"

#include <filesystem>
#include <fstream>
#include <system_error>
#include <utility>

#include <unistd.h>

namespace stutterscan {
namespace {

std::string trim(const std::string& text) {
    const std::size_t begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return {};
    }
    const std::size_t end = text.find_last_not_of(" \t\r\n");
    return text.substr(begin, end - begin + 1);
}

} // namespace

bool load_class_names(const std::string& model_path, std::vector<std::string>* names) {
    if (!names || model_path.empty()) {
        return false;
    }
    const std::filesystem::path path =
        std::filesystem::path(model_path).parent_path() / "class_names.txt";
    std::ifstream file(path);
    if (!file) {
        return false;
    }

    std::vector<std::string> loaded;
    std::string line;
    while (std::getline(file, line)) {
        line = trim(line);
        if (!line.empty()) {
            loaded.push_back(line);
        }
    }
    if (loaded.empty()) {
        return false;
    }
    STUTTERSCAN_LOG_DEBUG("Loaded " << loaded.size() << " class names from " << path.string());
    *names = std::move(loaded);
    return true;
}

std::vector<std::string> resolve_class_names(const ClassifierConfig& config) {
    if (!config.class_names.empty()) {
        return config.class_names;
    }
    std::vector<std::string> names;
    if (load_class_names(config.model_path, &names)) {
        return names;
    }
    return default_class_names();
}

std::unique_ptr<Classifier> make_classifier(const ClassifierConfig& config, Error* error) {
    if (config.model_path.empty()) {
        fail(error, ErrorCode::Validation, "model path is empty");
        return nullptr;
    }
    std::error_code ec;
    if (!std::filesystem::exists(config.model_path, ec)) {
        fail(error, ErrorCode::NotFound, "Model file not found: " + config.model_path);
        return nullptr;
    }
    if (::access(config.model_path.c_str(), R_OK) != 0) {
        fail(error, ErrorCode::Permission, "Cannot read model file: " + config.model_path);
        return nullptr;
    }

    std::vector<std::string> names = resolve_class_names(config);
    const ClassifierConfig::Backend backend = resolve_backend(config);
    STUTTERSCAN_LOG_INFO("Loading " << backend_name(backend) << " model " << config.model_path);

    switch (backend) {
        case ClassifierConfig::Backend::Onnx:
            return detail::make_onnx_classifier(config, std::move(names), error);
        case ClassifierConfig::Backend::TorchScript:
        case ClassifierConfig::Backend::Auto:
            break;
    }
    return detail::make_torch_classifier(config, std::move(names), error);
}

} // namespace stutterscan
