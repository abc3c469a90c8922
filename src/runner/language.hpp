#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "config/config_schema.hpp"

namespace coderun::runner {

enum class Language {
    kPython,
    kC,
    kCpp,
    kJava
};

constexpr const char* kUnknownLanguage = "Unknown";

const char* ToString(Language language);

// Case-insensitive lookup of the file extension.
std::optional<Language> DetectLanguage(const std::filesystem::path& source);

// ".py", ".c", ".cpp", ".cxx", ".cc", ".java"
const std::vector<std::string>& SupportedExtensions();

using Command = std::vector<std::string>;

struct PythonToolchain {
    std::vector<std::string> candidates;
    // Filled in by the interpreter lookup before RunCommand is used.
    std::string interpreter;

    Command CompileCommand(const std::filesystem::path&, const std::filesystem::path&) const { return {}; }
    Command RunCommand(const std::filesystem::path& source, const std::filesystem::path&) const {
        return {interpreter, source.string()};
    }
};

struct CToolchain {
    std::string compiler;

    Command CompileCommand(const std::filesystem::path& source, const std::filesystem::path& binary) const {
        return {compiler, source.string(), "-o", binary.string()};
    }
    Command RunCommand(const std::filesystem::path&, const std::filesystem::path& binary) const {
        return {binary.string()};
    }
};

struct CppToolchain {
    std::string compiler;

    Command CompileCommand(const std::filesystem::path& source, const std::filesystem::path& binary) const {
        return {compiler, source.string(), "-o", binary.string()};
    }
    Command RunCommand(const std::filesystem::path&, const std::filesystem::path& binary) const {
        return {binary.string()};
    }
};

// The public class must be named after the file, so the entry point is the source stem.
struct JavaToolchain {
    std::string compiler;
    std::string launcher;

    Command CompileCommand(const std::filesystem::path& source, const std::filesystem::path& class_dir) const {
        return {compiler, "-d", class_dir.string(), source.string()};
    }
    Command RunCommand(const std::filesystem::path& source, const std::filesystem::path& class_dir) const {
        return {launcher, "-cp", class_dir.string(), source.stem().string()};
    }
};

using Toolchain = std::variant<PythonToolchain, CToolchain, CppToolchain, JavaToolchain>;

enum class ArtifactKind {
    kNone,
    kBinary,
    kClassDirectory
};

Toolchain MakeToolchain(Language language, const config::RunnerConfig& config);

ArtifactKind ArtifactFor(const Toolchain& toolchain);

Command CompileCommand(const Toolchain& toolchain,
                       const std::filesystem::path& source,
                       const std::filesystem::path& artifact);

Command RunCommand(const Toolchain& toolchain,
                   const std::filesystem::path& source,
                   const std::filesystem::path& artifact);

}  // namespace coderun::runner
