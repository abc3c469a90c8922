#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace coderun::sandbox {

struct ExecRequest {
    // argv[0] is looked up on PATH unless it already contains a '/'.
    std::vector<std::string> argv;
    std::string working_dir;
    // std::nullopt connects the child's stdin to /dev/null.
    std::optional<std::string> stdin_data;
    std::chrono::milliseconds timeout{10000};
};

struct ExecResult {
    int exit_code = -1;
    bool timed_out = false;
    bool launch_failed = false;
    bool not_found = false;
    std::string output;
    std::string error;
    std::chrono::duration<double, std::milli> elapsed{0.0};
};

class SandboxExecutor {
public:
    static ExecResult Run(const ExecRequest& request);

    // Empty string when the executable cannot be found.
    static std::string ResolveExecutable(const std::string& name);
};

}  // namespace coderun::sandbox
