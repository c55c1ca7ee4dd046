#pragma once
#include <filesystem>
#include <string>
#include <utility>
#include <variant>

// Canonical absolute path proven to lie inside the sandbox root.
// Only PathGuard can construct one; it is meant to live for a single operation.
class ValidatedPath {
public:
    const std::filesystem::path& path() const { return path_; }
    std::string string() const { return path_.string(); }

private:
    friend class PathGuard;
    explicit ValidatedPath(std::filesystem::path path) : path_(std::move(path)) {}

    std::filesystem::path path_;
};

struct PathEscapeError {
    std::string requestedPath;

    std::string message() const;
};

using PathResolution = std::variant<ValidatedPath, PathEscapeError>;

class PathGuard {
public:
    // Joins relativePath onto sandboxRoot, resolves '.', '..' and symlinks, and checks
    // that the result is the root or below it. sandboxRoot must already be canonical.
    // Paths that do not exist yet are resolved up to their deepest existing ancestor
    // and the missing tail is appended as-is.
    static PathResolution resolve(const std::filesystem::path& sandboxRoot, const std::string& relativePath);

    // Segment-wise ancestor test: "/sandbox-evil" is not within "/sandbox".
    static bool isWithin(const std::filesystem::path& root, const std::filesystem::path& candidate);
};
