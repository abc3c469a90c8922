#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace coderun::runner {

// Runs "<candidate> --version" for each candidate in order and returns the
// first one that launches and exits with status 0.
std::optional<std::string> FindInterpreter(const std::vector<std::string>& candidates,
                                            std::chrono::milliseconds timeout);

std::string DescribeMissingInterpreters(const std::vector<std::string>& candidates);

}  // namespace coderun::runner
