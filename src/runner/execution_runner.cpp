#include "runner/execution_runner.hpp"

#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <utility>

#include "runner/artifact_workspace.hpp"
#include "runner/interpreter_lookup.hpp"
#include "sandbox/sandbox_executor.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace coderun::runner {
namespace fs = std::filesystem;

namespace {

ExecutionResult Fail(ExecutionResult result, ExecutionStatus status, std::string error) {
    result.status = status;
    result.runtime_ms = 0.0;
    result.stdout_text.clear();
    result.stderr_text = std::move(error);
    return result;
}

std::string MissingToolMessage(const std::string& language) {
    return "Error: Interpreter/compiler not found for " + language + ". Make sure it's in your PATH.";
}

std::string SupportedList() {
    return utils::Join(SupportedExtensions(), ", ");
}

bool ReadSource(const fs::path& path, std::string& content, std::string& error) {
    std::ifstream input(path, std::ios::in | std::ios::binary);
    if (!input.is_open()) {
        error = "Error reading file: cannot open '" + path.string() + "'";
        return false;
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    if (input.bad()) {
        error = "Error reading file: read failed for '" + path.string() + "'";
        return false;
    }
    content = buffer.str();
    if (content.find('\0') != std::string::npos) {
        error = "Error reading file: '" + path.string() + "' is not a text file";
        return false;
    }
    return true;
}

}  // namespace

std::string FormatSeconds(std::chrono::milliseconds duration) {
    const auto count = duration.count();
    if (count % 1000 == 0) {
        return std::to_string(count / 1000);
    }
    std::ostringstream oss;
    oss << std::setprecision(6) << static_cast<double>(count) / 1000.0;
    return oss.str();
}

ExecutionRunner::ExecutionRunner(config::RunnerConfig config)
    : config_(std::move(config)) {}

ExecutionResult ExecutionRunner::Execute(const ExecutionRequest& request) const {
    try {
        return ExecuteUnchecked(request);
    } catch (const std::exception& ex) {
        utils::Log(utils::LogLevel::kError, "runner", "unexpected failure", {{"error", ex.what()}});
        ExecutionResult result{};
        const auto language = DetectLanguage(request.source_path);
        if (language) {
            result.language = ToString(*language);
        }
        return Fail(std::move(result), ExecutionStatus::kInternalError,
                    std::string("An unexpected error occurred during execution: ") + ex.what());
    }
}

ExecutionResult ExecutionRunner::ExecuteUnchecked(const ExecutionRequest& request) const {
    ExecutionResult result{};
    const fs::path source = fs::absolute(fs::path(request.source_path));

    std::error_code ec;
    if (!fs::exists(source, ec) || fs::is_directory(source, ec)) {
        return Fail(std::move(result), ExecutionStatus::kFileError,
                    "Error: File not found at '" + request.source_path + "'.");
    }

    const auto language = DetectLanguage(source);
    if (!language) {
        return Fail(std::move(result), ExecutionStatus::kLanguageError,
                    "Error: Unsupported file extension '" + utils::ToLower(source.extension().string()) +
                        "'. Supported: " + SupportedList());
    }
    result.language = ToString(*language);
    utils::Log(utils::LogLevel::kDebug, "runner", "language detected",
               {{"file", source.filename().string()}, {"language", result.language}});

    std::string content;
    std::string read_error;
    if (!ReadSource(source, content, read_error)) {
        return Fail(std::move(result), ExecutionStatus::kFileError, read_error);
    }
    if (utils::Trim(content).empty()) {
        return Fail(std::move(result), ExecutionStatus::kFileError,
                    "Error: The provided file is empty or contains only whitespace.");
    }

    const auto source_dir = source.parent_path();
    ArtifactWorkspace workspace(source_dir / config_.temp_dir_name);
    Toolchain toolchain = MakeToolchain(*language, config_);

    if (auto* python = std::get_if<PythonToolchain>(&toolchain)) {
        auto interpreter = FindInterpreter(python->candidates, request.time_limit);
        if (!interpreter) {
            return Fail(std::move(result), ExecutionStatus::kRuntimeError,
                        DescribeMissingInterpreters(python->candidates));
        }
        python->interpreter = *interpreter;
    }

    fs::path artifact;
    switch (ArtifactFor(toolchain)) {
        case ArtifactKind::kBinary:
            artifact = workspace.NewBinaryPath();
            break;
        case ArtifactKind::kClassDirectory:
            artifact = workspace.NewClassDirectory();
            break;
        case ArtifactKind::kNone:
            break;
    }

    const auto compile_command = CompileCommand(toolchain, source, artifact);
    if (!compile_command.empty()) {
        sandbox::ExecRequest compile{};
        compile.argv = compile_command;
        compile.working_dir = source_dir.string();
        compile.timeout = request.time_limit;
        const auto compiled = sandbox::SandboxExecutor::Run(compile);
        if (compiled.launch_failed) {
            workspace.Discard(artifact);
            if (compiled.not_found) {
                auto message = MissingToolMessage(result.language);
                return Fail(std::move(result), ExecutionStatus::kRuntimeError, std::move(message));
            }
            return Fail(std::move(result), ExecutionStatus::kInternalError,
                        "An unexpected error occurred during compilation: " + compiled.error);
        }
        if (compiled.timed_out) {
            workspace.Discard(artifact);
            return Fail(std::move(result), ExecutionStatus::kCompilationError,
                        "Compilation exceeded time limit of " + FormatSeconds(request.time_limit) + " seconds.");
        }
        if (compiled.exit_code != 0) {
            workspace.Discard(artifact);
            utils::Log(utils::LogLevel::kInfo, "runner", "compilation failed",
                       {{"file", source.filename().string()}, {"code", std::to_string(compiled.exit_code)}});
            return Fail(std::move(result), ExecutionStatus::kCompilationError, compiled.error);
        }
    }

    sandbox::ExecRequest run{};
    run.argv = RunCommand(toolchain, source, artifact);
    run.working_dir = source_dir.string();
    run.stdin_data = request.input_data;
    run.timeout = request.time_limit;
    const auto executed = sandbox::SandboxExecutor::Run(run);

    if (executed.launch_failed) {
        if (executed.not_found) {
            auto message = MissingToolMessage(result.language);
            return Fail(std::move(result), ExecutionStatus::kRuntimeError, std::move(message));
        }
        return Fail(std::move(result), ExecutionStatus::kInternalError,
                    "An unexpected error occurred during execution: " + executed.error);
    }

    result.runtime_ms = executed.elapsed.count();
    if (executed.timed_out) {
        result.status = ExecutionStatus::kTimeLimitExceeded;
        result.stderr_text = "Execution exceeded time limit of " + FormatSeconds(request.time_limit) + " seconds.";
    } else {
        result.stdout_text = utils::Trim(executed.output);
        result.stderr_text = utils::Trim(executed.error);
        if (executed.exit_code == 0) {
            result.status = ExecutionStatus::kSuccess;
        } else {
            result.status = ExecutionStatus::kRuntimeError;
            if (result.stderr_text.empty()) {
                result.stderr_text = "Process exited with non-zero status code: " +
                                     std::to_string(executed.exit_code);
            }
        }
    }

    utils::Log(utils::LogLevel::kInfo, "runner", "run finished",
               {{"file", source.filename().string()},
                {"status", ToString(result.status)},
                {"runtime_ms", std::to_string(result.runtime_ms)}});
    return result;
}

}  // namespace coderun::runner
