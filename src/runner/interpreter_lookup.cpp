#include "runner/interpreter_lookup.hpp"

#include <sstream>

#include "sandbox/sandbox_executor.hpp"
#include "utils/logging.hpp"

namespace coderun::runner {

std::optional<std::string> FindInterpreter(const std::vector<std::string>& candidates,
                                            std::chrono::milliseconds timeout) {
    for (const auto& candidate : candidates) {
        sandbox::ExecRequest request;
        request.argv = {candidate, "--version"};
        request.timeout = timeout;
        const auto result = sandbox::SandboxExecutor::Run(request);
        if (!result.launch_failed && !result.timed_out && result.exit_code == 0) {
            utils::Log(utils::LogLevel::kDebug, "interp", "interpreter found", {{"name", candidate}});
            return candidate;
        }
        utils::Log(utils::LogLevel::kDebug, "interp", "interpreter unavailable", {{"name", candidate}});
    }
    return std::nullopt;
}

std::string DescribeMissingInterpreters(const std::vector<std::string>& candidates) {
    std::ostringstream oss;
    oss << "Error: ";
    if (candidates.size() == 2) {
        oss << "Neither '" << candidates[0] << "' nor '" << candidates[1] << "' command found.";
    } else if (candidates.size() == 1) {
        oss << "'" << candidates[0] << "' command not found.";
    } else {
        oss << "None of ";
        for (std::size_t i = 0; i < candidates.size(); ++i) {
            oss << (i > 0 ? ", '" : "'") << candidates[i] << "'";
        }
        oss << " commands found.";
    }
    oss << " Please ensure Python is installed and in your system's PATH.";
    return oss.str();
}

}  // namespace coderun::runner
