//
//  backend_torch.cpp
//  StutterScan
//
//  Created by the StutterScan Authors on 2026-02-22.
//  Copyright © 2026 StutterScan Authors. All rights reserved.
//

#include "backend.h"

#include "stutterscan/logging.hpp"

#include <exception>
#include <utility>
#include <vector>

#include <c10/core/InferenceMode.h>
#include <torch/script.h>
#include <torch/torch.h>

namespace stutterscan {
namespace detail {
namespace {

std::string first_line(const std::string& message) {
    const std::size_t newline = message.find('\n');
    return newline == std::string::npos ? message : message.substr(0, newline);
}

// Models return a bare tensor, a tuple whose first element is the logits,
// or a dict; the first tensor found wins.
torch::Tensor extract_output_tensor(const torch::IValue& output) {
    if (output.isTensor()) {
        return output.toTensor();
    }
    if (output.isTuple()) {
        for (const auto& element : output.toTuple()->elements()) {
            if (element.isTensor()) {
                return element.toTensor();
            }
        }
    } else if (output.isTensorList()) {
        const auto list = output.toTensorVector();
        if (!list.empty()) {
            return list.front();
        }
    } else if (output.isGenericDict()) {
        for (const auto& entry : output.toGenericDict()) {
            if (entry.value().isTensor()) {
                return entry.value().toTensor();
            }
        }
    }
    return torch::Tensor();
}

class TorchClassifier final : public Classifier {
public:
    TorchClassifier(const ClassifierConfig& config, std::vector<std::string> class_names)
        : config_(config), class_names_(std::move(class_names)) {}

    bool load(Error* error) {
        device_ = torch::kCPU;
        if (config_.torch_device == "cuda") {
            if (torch::cuda::is_available()) {
                device_ = torch::Device(torch::kCUDA);
            } else {
                STUTTERSCAN_LOG_WARN("Torch backend: CUDA unavailable, falling back to cpu.");
            }
        } else if (config_.torch_device != "cpu") {
            STUTTERSCAN_LOG_WARN("Torch backend: unknown device '" << config_.torch_device
                                                                   << "', using cpu.");
        }

        try {
            module_ = torch::jit::load(config_.model_path, torch::kCPU);
            module_.to(torch::kFloat32);
            module_.eval();
            if (device_.type() != torch::kCPU) {
                try {
                    module_.to(device_);
                } catch (const c10::Error& err) {
                    STUTTERSCAN_LOG_WARN("Torch backend: device move failed, falling back to cpu: "
                                         << first_line(err.what()));
                    device_ = torch::kCPU;
                }
            }
        } catch (const c10::Error& err) {
            STUTTERSCAN_LOG_ERROR("Torch backend: failed to load model: " << first_line(err.what()));
            return fail(error, ErrorCode::Classifier,
                        "failed to load TorchScript model " + config_.model_path + ": " +
                            first_line(err.what()));
        } catch (const std::exception& err) {
            return fail(error, ErrorCode::Classifier,
                        "failed to load TorchScript model " + config_.model_path + ": " + err.what());
        }
        STUTTERSCAN_LOG_DEBUG("Torch backend: resolved device=" << device_.str());
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
            c10::InferenceMode inference_guard(true);
            const auto options = torch::TensorOptions().dtype(torch::kFloat32).device(device_);
            torch::Tensor input =
                torch::from_blob(data.data(), shape, torch::kFloat32).to(options).clone();

            std::vector<torch::IValue> inputs;
            inputs.reserve(1);
            inputs.emplace_back(input);
            const torch::IValue output = module_.forward(inputs);

            torch::Tensor logits = extract_output_tensor(output);
            if (!logits.defined() || logits.numel() == 0) {
                return fail(error, ErrorCode::Classifier, "unexpected model output signature");
            }
            logits = logits.to(torch::kCPU).to(torch::kFloat32).flatten().contiguous();
            const float* values = logits.data_ptr<float>();
            probabilities->assign(values, values + logits.numel());
        } catch (const c10::Error& err) {
            return fail(error, ErrorCode::Classifier,
                        std::string("forward failed: ") + first_line(err.what()));
        } catch (const std::exception& err) {
            return fail(error, ErrorCode::Classifier, std::string("forward failed: ") + err.what());
        }

        if (config_.apply_softmax) {
            softmax_in_place(probabilities);
        }
        return true;
    }

    const std::vector<std::string>& class_names() const override { return class_names_; }

    bool is_reentrant() const override { return true; }

    const char* backend_name() const override { return "torch"; }

private:
    ClassifierConfig config_;
    std::vector<std::string> class_names_;
    torch::jit::script::Module module_;
    torch::Device device_ = torch::kCPU;
};

} // namespace

std::unique_ptr<Classifier> make_torch_classifier(const ClassifierConfig& config,
                                                  std::vector<std::string> class_names,
                                                  Error* error) {
    auto classifier = std::make_unique<TorchClassifier>(config, std::move(class_names));
    if (!classifier->load(error)) {
        return nullptr;
    }
    return classifier;
}

} // namespace detail
} // namespace stutterscan
