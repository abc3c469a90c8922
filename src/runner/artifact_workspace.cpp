#include "runner/artifact_workspace.hpp"

#include <algorithm>
#include <iomanip>
#include <random>
#include <sstream>
#include <utility>

#include "utils/logging.hpp"

namespace coderun::runner {
namespace {

std::string RandomToken() {
    static thread_local std::mt19937_64 engine{std::random_device{}()};
    std::ostringstream oss;
    oss << std::hex << std::setw(16) << std::setfill('0') << engine();
    return oss.str();
}

void RemoveQuietly(const std::filesystem::path& path) {
    std::error_code ec;
    std::filesystem::remove_all(path, ec);
    if (ec) {
        utils::Log(utils::LogLevel::kWarn, "workspace", "failed to remove artifact",
                   {{"path", path.string()}, {"error", ec.message()}});
    }
}

}  // namespace

ArtifactWorkspace::ArtifactWorkspace(std::filesystem::path root)
    : root_(std::move(root)) {}

ArtifactWorkspace::~ArtifactWorkspace() {
    for (const auto& artifact : artifacts_) {
        RemoveQuietly(artifact);
    }
    if (!touched_) {
        return;
    }
    std::error_code ec;
    if (std::filesystem::is_directory(root_, ec) && std::filesystem::is_empty(root_, ec)) {
        std::filesystem::remove(root_, ec);
        if (ec) {
            utils::Log(utils::LogLevel::kWarn, "workspace", "failed to remove temp directory",
                       {{"path", root_.string()}, {"error", ec.message()}});
        }
    }
}

void ArtifactWorkspace::EnsureRoot() {
    touched_ = true;
    std::filesystem::create_directories(root_);
}

std::filesystem::path ArtifactWorkspace::UniquePath(const std::string& suffix) const {
    std::filesystem::path candidate;
    std::error_code ec;
    do {
        candidate = root_ / ("tmp" + RandomToken() + suffix);
    } while (std::filesystem::exists(candidate, ec));
    return candidate;
}

std::filesystem::path ArtifactWorkspace::NewBinaryPath() {
    EnsureRoot();
    auto path = UniquePath(".out");
    artifacts_.push_back(path);
    return path;
}

std::filesystem::path ArtifactWorkspace::NewClassDirectory() {
    EnsureRoot();
    auto path = UniquePath("");
    artifacts_.push_back(path);
    std::filesystem::create_directory(path);
    return path;
}

void ArtifactWorkspace::Discard(const std::filesystem::path& artifact) {
    RemoveQuietly(artifact);
    artifacts_.erase(std::remove(artifacts_.begin(), artifacts_.end(), artifact), artifacts_.end());
}

}  // namespace coderun::runner
