#pragma once

#include <chrono>
#include <optional>
#include <string>

#include "runner/language.hpp"

namespace coderun::runner {

enum class ExecutionStatus {
    kSuccess,
    kFileError,
    kLanguageError,
    kCompilationError,
    kRuntimeError,
    kTimeLimitExceeded,
    kInternalError
};

inline const char* ToString(ExecutionStatus status) {
    switch (status) {
        case ExecutionStatus::kSuccess: return "Success";
        case ExecutionStatus::kFileError: return "File Error";
        case ExecutionStatus::kLanguageError: return "Language Error";
        case ExecutionStatus::kCompilationError: return "Compilation Error";
        case ExecutionStatus::kRuntimeError: return "Runtime Error";
        case ExecutionStatus::kTimeLimitExceeded: return "Time Limit Exceeded";
        case ExecutionStatus::kInternalError: return "Internal Error";
    }
    return "Internal Error";
}

struct ExecutionRequest {
    std::string source_path;
    // Applied separately to the compile step and to the run.
    std::chrono::milliseconds time_limit{10000};
    std::optional<std::string> input_data;
};

struct ExecutionResult {
    ExecutionStatus status = ExecutionStatus::kInternalError;
    // Run phase only; stays 0.0 when nothing was spawned.
    double runtime_ms = 0.0;
    std::string stdout_text;
    std::string stderr_text;
    std::string language = kUnknownLanguage;
};

}  // namespace coderun::runner
