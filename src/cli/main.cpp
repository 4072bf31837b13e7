//
//  main.cpp
//  StutterScan
//
//  Created by the StutterScan Authors on 2026-03-08.
//  Copyright © 2026 StutterScan Authors. All rights reserved.
//

#include "stutterscan/config.h"
#include "stutterscan/logging.hpp"
#include "stutterscan/orchestrator.h"
#include "stutterscan/preset.h"
#include "stutterscan/report.h"
#include "stutterscan/version.h"

#include <csignal>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitInterrupted = 130;

stutterscan::CancellationToken* g_cancel_token = nullptr;

extern "C" void handle_sigint(int) {
    if (g_cancel_token) {
        g_cancel_token->cancel();
    }
}

struct CliOptions {
    std::string input_path;
    std::string model_path;
    std::string output_dir;
    std::string output_json;
    std::string preset = "standard";
    std::string backend = "auto";
    std::string class_names;
    std::size_t workers = 0;
    float threshold = -1.0f;
    bool precise = false;
    bool abort_on_window_error = false;
    bool verbose = false;
    bool profile = false;
    bool show_version = false;
    bool show_help = false;
};

void print_usage(std::ostream& out) {
    out << "Usage: stutterscan <input.wav> <model> [options]\n"
        << "\n"
        << "Options:\n"
        << "  --output-dir DIR          write per-segment WAV and spectrogram files\n"
        << "  --output-json PATH        write the JSON report to PATH\n"
        << "  --precise                 localize events inside each segment\n"
        << "  --backend auto|torch|onnx model backend (default: from file extension)\n"
        << "  --preset NAME             analysis preset (";
    const std::vector<std::string> names = stutterscan::detector_preset_names();
    for (std::size_t i = 0; i < names.size(); ++i) {
        out << (i ? ", " : "") << names[i];
    }
    out << ")\n"
        << "  --workers N               segments analysed in parallel\n"
        << "  --threshold X             minimum confidence for coarse events\n"
        << "  --class-names a,b,c       class names in model output order\n"
        << "  --abort-on-window-error   stop at the first failed segment\n"
        << "  --verbose                 debug logging\n"
        << "  --profile                 timing summary\n"
        << "  --version                 print version and exit\n";
}

std::vector<std::string> split_list(const std::string& text) {
    std::vector<std::string> items;
    std::stringstream stream(text);
    std::string item;
    while (std::getline(stream, item, ',')) {
        if (!item.empty()) {
            items.push_back(item);
        }
    }
    return items;
}

bool parse_args(int argc, char** argv, CliOptions* options, std::string* error) {
    std::vector<std::string> positional;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        auto value = [&](std::string* out) {
            if (i + 1 >= argc) {
                *error = "missing value for " + arg;
                return false;
            }
            *out = argv[++i];
            return true;
        };

        std::string text;
        if (arg == "--help" || arg == "-h") {
            options->show_help = true;
        } else if (arg == "--version") {
            options->show_version = true;
        } else if (arg == "--precise") {
            options->precise = true;
        } else if (arg == "--abort-on-window-error") {
            options->abort_on_window_error = true;
        } else if (arg == "--verbose") {
            options->verbose = true;
        } else if (arg == "--profile") {
            options->profile = true;
        } else if (arg == "--output-dir") {
            if (!value(&options->output_dir)) {
                return false;
            }
        } else if (arg == "--output-json") {
            if (!value(&options->output_json)) {
                return false;
            }
        } else if (arg == "--preset") {
            if (!value(&options->preset)) {
                return false;
            }
        } else if (arg == "--backend") {
            if (!value(&options->backend)) {
                return false;
            }
        } else if (arg == "--class-names") {
            if (!value(&options->class_names)) {
                return false;
            }
        } else if (arg == "--workers") {
            if (!value(&text)) {
                return false;
            }
            char* end = nullptr;
            const long workers = std::strtol(text.c_str(), &end, 10);
            if (!end || *end != '\0' || workers < 1) {
                *error = "invalid --workers value: " + text;
                return false;
            }
            options->workers = static_cast<std::size_t>(workers);
        } else if (arg == "--threshold") {
            if (!value(&text)) {
                return false;
            }
            char* end = nullptr;
            options->threshold = std::strtof(text.c_str(), &end);
            if (!end || *end != '\0') {
                *error = "invalid --threshold value: " + text;
                return false;
            }
        } else if (!arg.empty() && arg[0] == '-') {
            *error = "unknown option: " + arg;
            return false;
        } else {
            positional.push_back(arg);
        }
    }

    if (options->show_help || options->show_version) {
        return true;
    }
    if (positional.size() != 2) {
        *error = "expected <input.wav> and <model>";
        return false;
    }
    options->input_path = positional[0];
    options->model_path = positional[1];
    return true;
}

bool build_config(const CliOptions& options, stutterscan::DetectorConfig* config, std::string* error) {
    auto preset = stutterscan::make_detector_preset(options.preset);
    if (!preset) {
        *error = "unknown preset: " + options.preset;
        return false;
    }
    preset->apply(*config);

    config->classifier.model_path = options.model_path;
    if (options.backend == "auto") {
        config->classifier.backend = stutterscan::ClassifierConfig::Backend::Auto;
    } else if (options.backend == "torch") {
        config->classifier.backend = stutterscan::ClassifierConfig::Backend::TorchScript;
    } else if (options.backend == "onnx") {
        config->classifier.backend = stutterscan::ClassifierConfig::Backend::Onnx;
    } else {
        *error = "unknown backend: " + options.backend;
        return false;
    }
    if (!options.class_names.empty()) {
        config->classifier.class_names = split_list(options.class_names);
    }

    if (options.precise) {
        config->aggregator.mode = stutterscan::AggregatorConfig::Mode::Precise;
    }
    if (options.threshold >= 0.0f) {
        config->aggregator.confidence_threshold = options.threshold;
    }

    if (options.workers > 0) {
        config->runtime.worker_count = options.workers;
    }
    if (options.abort_on_window_error) {
        config->runtime.on_window_error = stutterscan::WindowErrorPolicy::Abort;
    }
    config->runtime.debug_output_dir = options.output_dir;
    config->runtime.verbose = options.verbose;
    config->runtime.profile = options.profile;
    return true;
}

int emit_report(const stutterscan::AnalysisReport& report, const CliOptions& options) {
    std::cout << stutterscan::report_to_json(report).dump(2) << std::endl;
    if (!options.output_json.empty()) {
        stutterscan::Error error;
        if (!stutterscan::write_report_json(report, options.output_json, &error)) {
            STUTTERSCAN_LOG_ERROR(stutterscan::describe(error));
            return kExitFailure;
        }
        STUTTERSCAN_LOG_INFO("Results saved to: " << options.output_json);
    }
    return kExitOk;
}

} // namespace

int main(int argc, char** argv) {
    CliOptions options;
    std::string error;
    if (!parse_args(argc, argv, &options, &error)) {
        std::cerr << "stutterscan: " << error << "\n\n";
        print_usage(std::cerr);
        return kExitFailure;
    }
    if (options.show_help) {
        print_usage(std::cout);
        return kExitOk;
    }
    if (options.show_version) {
        std::cout << "stutterscan " << stutterscan::version_string() << "\n";
        return kExitOk;
    }

    stutterscan::DetectorConfig config;
    if (!build_config(options, &config, &error)) {
        std::cerr << "stutterscan: " << error << "\n";
        return kExitFailure;
    }
    stutterscan::set_log_verbosity_from_config(config.runtime);

    stutterscan::Orchestrator orchestrator(config);
    g_cancel_token = &orchestrator.cancellation_token();
    std::signal(SIGINT, handle_sigint);

    try {
        const stutterscan::AnalysisReport report = orchestrator.run(options.input_path);
        g_cancel_token = nullptr;
        const int status = emit_report(report, options);
        if (!report.completed()) {
            return kExitFailure;
        }
        return status;
    } catch (const stutterscan::CancellationError& ex) {
        g_cancel_token = nullptr;
        STUTTERSCAN_LOG_WARN("Interrupted: " << ex.what());
        emit_report(ex.partial_report(), options);
        return kExitInterrupted;
    } catch (const stutterscan::ResourceExhaustedError& ex) {
        g_cancel_token = nullptr;
        STUTTERSCAN_LOG_ERROR(ex.what());
        emit_report(ex.partial_report(), options);
        return kExitFailure;
    }
}
