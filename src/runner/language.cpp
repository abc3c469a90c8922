#include "runner/language.hpp"

#include <type_traits>
#include <utility>

#include "utils/common.hpp"

namespace coderun::runner {
namespace {

const std::vector<std::pair<std::string, Language>>& ExtensionTable() {
    static const std::vector<std::pair<std::string, Language>> kTable = {
        {".py", Language::kPython},
        {".c", Language::kC},
        {".cpp", Language::kCpp},
        {".cxx", Language::kCpp},
        {".cc", Language::kCpp},
        {".java", Language::kJava}
    };
    return kTable;
}

}  // namespace

const char* ToString(Language language) {
    switch (language) {
        case Language::kPython: return "python";
        case Language::kC: return "c";
        case Language::kCpp: return "cpp";
        case Language::kJava: return "java";
    }
    return kUnknownLanguage;
}

std::optional<Language> DetectLanguage(const std::filesystem::path& source) {
    const auto extension = utils::ToLower(source.extension().string());
    for (const auto& [key, language] : ExtensionTable()) {
        if (key == extension) {
            return language;
        }
    }
    return std::nullopt;
}

const std::vector<std::string>& SupportedExtensions() {
    static const std::vector<std::string> kExtensions = [] {
        std::vector<std::string> extensions;
        for (const auto& entry : ExtensionTable()) {
            extensions.push_back(entry.first);
        }
        return extensions;
    }();
    return kExtensions;
}

Toolchain MakeToolchain(Language language, const config::RunnerConfig& config) {
    switch (language) {
        case Language::kPython:
            return PythonToolchain{config.python_candidates, {}};
        case Language::kC:
            return CToolchain{config.c_compiler};
        case Language::kCpp:
            return CppToolchain{config.cpp_compiler};
        case Language::kJava:
            return JavaToolchain{config.java_compiler, config.java_launcher};
    }
    return PythonToolchain{config.python_candidates, {}};
}

ArtifactKind ArtifactFor(const Toolchain& toolchain) {
    return std::visit([](const auto& chain) {
        using T = std::decay_t<decltype(chain)>;
        if constexpr (std::is_same_v<T, PythonToolchain>) {
            return ArtifactKind::kNone;
        } else if constexpr (std::is_same_v<T, JavaToolchain>) {
            return ArtifactKind::kClassDirectory;
        } else {
            return ArtifactKind::kBinary;
        }
    }, toolchain);
}

Command CompileCommand(const Toolchain& toolchain,
                       const std::filesystem::path& source,
                       const std::filesystem::path& artifact) {
    return std::visit([&](const auto& chain) { return chain.CompileCommand(source, artifact); }, toolchain);
}

Command RunCommand(const Toolchain& toolchain,
                   const std::filesystem::path& source,
                   const std::filesystem::path& artifact) {
    return std::visit([&](const auto& chain) { return chain.RunCommand(source, artifact); }, toolchain);
}

}  // namespace coderun::runner
