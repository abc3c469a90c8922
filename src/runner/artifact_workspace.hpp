#pragma once

#include <filesystem>
#include <vector>

namespace coderun::runner {

// Owns the temporary directory next to a source file for one run. Every
// artifact handed out is deleted when the workspace goes out of scope, and
// the directory itself is removed once it is empty.
class ArtifactWorkspace {
public:
    explicit ArtifactWorkspace(std::filesystem::path root);
    ~ArtifactWorkspace();

    ArtifactWorkspace(const ArtifactWorkspace&) = delete;
    ArtifactWorkspace& operator=(const ArtifactWorkspace&) = delete;

    // Throws std::filesystem::filesystem_error if the directory cannot be created.
    std::filesystem::path NewBinaryPath();
    std::filesystem::path NewClassDirectory();

    // Deletes one artifact early. Safe to call twice.
    void Discard(const std::filesystem::path& artifact);

    const std::filesystem::path& Root() const { return root_; }

private:
    void EnsureRoot();
    std::filesystem::path UniquePath(const std::string& suffix) const;

    std::filesystem::path root_;
    std::vector<std::filesystem::path> artifacts_;
    bool touched_ = false;
};

}  // namespace coderun::runner
