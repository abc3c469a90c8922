#pragma once

#include <string>

#include "nlohmann/json.hpp"
#include "runner/execution_types.hpp"

namespace coderun::runner {

nlohmann::json ToJson(const ExecutionResult& result);

// Status, language, runtime in milliseconds, output, and the error block when present.
std::string FormatReport(const ExecutionResult& result);

}  // namespace coderun::runner
