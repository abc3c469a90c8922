#pragma once

#include "config/config_schema.hpp"
#include "runner/execution_types.hpp"

namespace coderun::runner {

class ExecutionRunner {
public:
    explicit ExecutionRunner(config::RunnerConfig config);

    // Never throws. Every failure is reported through ExecutionResult::status.
    ExecutionResult Execute(const ExecutionRequest& request) const;

private:
    ExecutionResult ExecuteUnchecked(const ExecutionRequest& request) const;

    config::RunnerConfig config_;
};

// "10" for whole seconds, "2.5" otherwise.
std::string FormatSeconds(std::chrono::milliseconds duration);

}  // namespace coderun::runner
