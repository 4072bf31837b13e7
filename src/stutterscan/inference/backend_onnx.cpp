//
//  backend_onnx.cpp
//  StutterScan
//
//  Created by the StutterScan Authors on 2026-03-04.
//  Copyright © 2026 StutterScan Authors. All rights reserved.
//

#include "backend.h"

#include "stutterscan/logging.hpp"

#include <algorithm>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include <onnxruntime_cxx_api.h>

namespace stutterscan {
namespace detail {

bool check_onnx_output_type(int element_type, Error* error) {
    if (element_type == static_cast<int>(ONNX_TENSOR_ELEMENT_DATA_TYPE_FLOAT)) {
        return true;
    }
    std::ostringstream msg;
    msg << "model output must be float32, got ONNX element type " << element_type;
    return fail(error, ErrorCode::Classifier, msg.str());
}

namespace {

class OnnxClassifier final : public Classifier {
public:
    OnnxClassifier(const ClassifierConfig& config, std::vector<std::string> class_names)
        : config_(config), class_names_(std::move(class_names)) {}

    OnnxClassifier(const OnnxClassifier&) = delete;
    OnnxClassifier& operator=(const OnnxClassifier&) = delete;

    bool load(Error* error) {
        try {
            env_ = std::make_unique<Ort::Env>(ORT_LOGGING_LEVEL_WARNING, "StutterScan");

            Ort::SessionOptions options;
            options.SetIntraOpNumThreads(std::max(1, config_.onnx_intra_op_threads));
            options.SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_ALL);
            session_ = std::make_unique<Ort::Session>(*env_, config_.model_path.c_str(), options);

            Ort::AllocatorWithDefaultOptions allocator;
            if (session_->GetInputCount() == 0 || session_->GetOutputCount() == 0) {
                return fail(error, ErrorCode::Classifier,
                            "ONNX model has no inputs or outputs: " + config_.model_path);
            }
            Ort::AllocatedStringPtr input_name = session_->GetInputNameAllocated(0, allocator);
            Ort::AllocatedStringPtr output_name = session_->GetOutputNameAllocated(0, allocator);
            input_name_ = input_name.get();
            output_name_ = output_name.get();

            memory_info_ = std::make_unique<Ort::MemoryInfo>(
                Ort::MemoryInfo::CreateCpu(OrtArenaAllocator, OrtMemTypeDefault));
        } catch (const Ort::Exception& err) {
            STUTTERSCAN_LOG_ERROR("ONNX backend: failed to load model: " << err.what());
            return fail(error, ErrorCode::Classifier,
                        "failed to load ONNX model " + config_.model_path + ": " + err.what());
        }

        STUTTERSCAN_LOG_DEBUG("ONNX backend: input=" << input_name_ << " output=" << output_name_);
        return true;
    }

    bool classify(const Spectrogram& spectrogram,
                  std::vector<float>* probabilities,
                  Error* error) override {
        if (!probabilities) {
            return fail(error, ErrorCode::Classifier, "missing probability output");
        }
        probabilities->clear();
        if (spectrogram.empty()) {
            return fail(error, ErrorCode::Classifier, "empty spectrogram");
        }

        std::vector<float> data;
        std::vector<int64_t> shape;
        pack_classifier_input(spectrogram, config_, &data, &shape);

        try {
            Ort::Value input = Ort::Value::CreateTensor<float>(
                *memory_info_, data.data(), data.size(), shape.data(), shape.size());

            const char* input_names[] = {input_name_.c_str()};
            const char* output_names[] = {output_name_.c_str()};
            auto outputs = session_->Run(Ort::RunOptions{nullptr},
                                         input_names, &input, 1,
                                         output_names, 1);
            if (outputs.empty() || !outputs.front().IsTensor()) {
                return fail(error, ErrorCode::Classifier, "unexpected model output signature");
            }

            const auto info = outputs.front().GetTensorTypeAndShapeInfo();
            if (!check_onnx_output_type(static_cast<int>(info.GetElementType()), error)) {
                return false;
            }
            const std::size_t count = info.GetElementCount();
            const float* values = outputs.front().GetTensorData<float>();
            probabilities->assign(values, values + count);
        } catch (const Ort::Exception& err) {
            return fail(error, ErrorCode::Classifier, std::string("inference failed: ") + err.what());
        }

        if (probabilities->empty()) {
            return fail(error, ErrorCode::Classifier, "model returned no scores");
        }
        if (config_.apply_softmax) {
            softmax_in_place(probabilities);
        }
        return true;
    }

    const std::vector<std::string>& class_names() const override { return class_names_; }

    // Ort::Session::Run is safe to call concurrently.
    bool is_reentrant() const override { return true; }

    const char* backend_name() const override { return "onnx"; }

private:
    ClassifierConfig config_;
    std::vector<std::string> class_names_;

    std::unique_ptr<Ort::Env> env_;
    std::unique_ptr<Ort::Session> session_;
    std::unique_ptr<Ort::MemoryInfo> memory_info_;
    std::string input_name_;
    std::string output_name_;
};

} // namespace

std::unique_ptr<Classifier> make_onnx_classifier(const ClassifierConfig& config,
                                                 std::vector<std::string> class_names,
                                                 Error* error) {
    auto classifier = std::make_unique<OnnxClassifier>(config, std::move(class_names));
    if (!classifier->load(error)) {
        return nullptr;
    }
    return classifier;
}

} // namespace detail
} // namespace stutterscan
