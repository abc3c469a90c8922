#include <chrono>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "config/config_loader.hpp"
#include "runner/execution_runner.hpp"
#include "runner/report.hpp"
#include "runner/source_catalog.hpp"
#include "utils/logging.hpp"

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFailed = 1;
constexpr int kExitUsage = 2;

struct RunArgs {
    std::string file;
    std::optional<double> time_limit_s;
    std::optional<std::string> input;
    std::optional<std::string> input_file;
    bool json = false;
};

void PrintUsage() {
    std::cout << "Usage:\n"
              << "  coderun run <file> [--time-limit <seconds>] [--input <text>] [--input-file <path>] [--json]\n"
              << "  coderun list <folder>\n"
              << "  coderun --help\n";
}

// The prompt-style input accepts "\n" escapes for multi-line stdin.
std::string ExpandNewlines(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '\\' && i + 1 < text.size() && text[i + 1] == 'n') {
            out.push_back('\n');
            ++i;
            continue;
        }
        out.push_back(text[i]);
    }
    return out;
}

std::optional<RunArgs> ParseRunArgs(int argc, char** argv) {
    RunArgs args;
    for (int i = 2; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--json") {
            args.json = true;
            continue;
        }
        if (arg == "--time-limit" && i + 1 < argc) {
            try {
                args.time_limit_s = std::stod(argv[++i]);
            } catch (const std::exception&) {
                std::cerr << "Invalid --time-limit value: " << argv[i] << std::endl;
                return std::nullopt;
            }
            if (!coderun::config::IsValidTimeLimit(*args.time_limit_s)) {
                std::cerr << "--time-limit must be a positive number of seconds, at most "
                          << coderun::config::kMaxTimeLimitS << std::endl;
                return std::nullopt;
            }
            continue;
        }
        if (arg == "--input" && i + 1 < argc) {
            args.input = ExpandNewlines(argv[++i]);
            continue;
        }
        if (arg == "--input-file" && i + 1 < argc) {
            args.input_file = argv[++i];
            continue;
        }
        if (!arg.empty() && arg[0] != '-' && args.file.empty()) {
            args.file = arg;
            continue;
        }
        std::cerr << "Unexpected argument: " << arg << std::endl;
        return std::nullopt;
    }
    if (args.file.empty()) {
        std::cerr << "Missing source file." << std::endl;
        return std::nullopt;
    }
    if (args.input && args.input_file) {
        std::cerr << "Use either --input or --input-file, not both." << std::endl;
        return std::nullopt;
    }
    return args;
}

int RunFile(const RunArgs& args, const coderun::config::Config& config) {
    coderun::runner::ExecutionRequest request;
    request.source_path = args.file;
    const double limit_s = args.time_limit_s.value_or(config.runner.time_limit_s);
    request.time_limit = std::chrono::milliseconds(static_cast<long long>(std::llround(limit_s * 1000.0)));
    if (request.time_limit.count() <= 0) {
        request.time_limit = std::chrono::milliseconds(1);
    }
    if (args.input) {
        request.input_data = *args.input;
    } else if (args.input_file) {
        std::ifstream input(*args.input_file, std::ios::binary);
        if (!input.is_open()) {
            std::cerr << "Cannot read input file: " << *args.input_file << std::endl;
            return kExitUsage;
        }
        std::ostringstream buffer;
        buffer << input.rdbuf();
        request.input_data = buffer.str();
    }

    coderun::runner::ExecutionRunner runner(config.runner);
    const auto result = runner.Execute(request);
    if (args.json) {
        std::cout << coderun::runner::ToJson(result).dump(2) << std::endl;
    } else {
        std::cout << "--- Running '" << std::filesystem::path(args.file).filename().string() << "' ---\n";
        std::cout << coderun::runner::FormatReport(result) << std::flush;
    }
    return result.status == coderun::runner::ExecutionStatus::kSuccess ? kExitOk : kExitFailed;
}

int ListFolder(const std::string& folder) {
    const auto files = coderun::runner::ListSupportedFiles(folder);
    if (files.empty()) {
        std::cout << "No supported code files found in '" << folder << "'." << std::endl;
        return kExitFailed;
    }
    std::cout << "Found the following code files in '" << folder << "':" << std::endl;
    for (std::size_t i = 0; i < files.size(); ++i) {
        std::cout << "  " << (i + 1) << ". " << files[i] << std::endl;
    }
    return kExitOk;
}

}  // namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        PrintUsage();
        return kExitUsage;
    }
    const std::string command = argv[1];
    if (command == "--help" || command == "-h" || command == "help") {
        PrintUsage();
        return kExitOk;
    }

    const auto config = coderun::config::LoadConfig();
    coderun::utils::LogConfig log_config{};
    if (const auto level = coderun::utils::ParseLogLevel(config.logging.level)) {
        log_config.min_level = *level;
    }
    coderun::utils::SetLogConfig(log_config);

    if (command == "run") {
        const auto args = ParseRunArgs(argc, argv);
        if (!args) {
            PrintUsage();
            return kExitUsage;
        }
        return RunFile(*args, config);
    }

    if (command == "list") {
        if (argc != 3) {
            PrintUsage();
            return kExitUsage;
        }
        return ListFolder(argv[2]);
    }

    std::cerr << "Unknown command: " << command << std::endl;
    PrintUsage();
    return kExitUsage;
}
