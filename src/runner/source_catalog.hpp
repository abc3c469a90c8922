#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace coderun::runner {

// File names of the runnable sources directly inside folder, sorted.
std::vector<std::string> ListSupportedFiles(const std::filesystem::path& folder);

}  // namespace coderun::runner
