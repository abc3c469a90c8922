#include "runner/report.hpp"

#include <iomanip>
#include <sstream>

namespace coderun::runner {

nlohmann::json ToJson(const ExecutionResult& result) {
    return {
        {"status", ToString(result.status)},
        {"language", result.language},
        {"runtime_ms", result.runtime_ms},
        {"stdout", result.stdout_text},
        {"stderr", result.stderr_text}
    };
}

std::string FormatReport(const ExecutionResult& result) {
    std::ostringstream oss;
    oss << "Status: " << ToString(result.status) << "\n";
    oss << "Language: " << result.language << "\n";
    oss << "Runtime: " << std::fixed << std::setprecision(2) << result.runtime_ms << " MS\n";
    oss << "Output:\n" << result.stdout_text << "\n";
    if (!result.stderr_text.empty()) {
        oss << "Error:\n" << result.stderr_text << "\n";
    }
    return oss.str();
}

}  // namespace coderun::runner
