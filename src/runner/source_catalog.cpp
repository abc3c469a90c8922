#include "runner/source_catalog.hpp"

#include <algorithm>

#include "runner/language.hpp"

namespace coderun::runner {

std::vector<std::string> ListSupportedFiles(const std::filesystem::path& folder) {
    std::vector<std::string> files;
    std::error_code ec;
    if (!std::filesystem::is_directory(folder, ec)) {
        return files;
    }
    for (const auto& entry : std::filesystem::directory_iterator(folder, ec)) {
        std::error_code entry_ec;
        if (!entry.is_regular_file(entry_ec)) {
            continue;
        }
        if (DetectLanguage(entry.path())) {
            files.push_back(entry.path().filename().string());
        }
    }
    std::sort(files.begin(), files.end());
    return files;
}

}  // namespace coderun::runner
