#include "PathGuard.hpp"
#include <system_error>

namespace fs = std::filesystem;

namespace {

// Walks the path one segment at a time. Existing segments are followed through
// symlinks; once a segment is missing the remainder is appended literally, so a
// later '..' can only pop segments that were already resolved.
// Returns false when a symlink cannot be resolved (dangling or looping).
bool canonicalizeWeakly(const fs::path& joined, fs::path& out) {
    fs::path current = joined.root_path();
    for (const auto& part : joined.relative_path()) {
        if (part.empty() || part == ".") {
            continue;
        }
        if (part == "..") {
            current = current.parent_path();
            continue;
        }
        fs::path next = current / part;
        std::error_code ec;
        fs::file_status st = fs::symlink_status(next, ec);
        if (st.type() == fs::file_type::not_found) {
            current = next;
            continue;
        }
        if (ec) {
            throw fs::filesystem_error("cannot stat path segment", next, ec);
        }
        if (fs::is_symlink(st)) {
            fs::path target = fs::canonical(next, ec);
            if (ec) {
                return false;
            }
            current = target;
        } else {
            current = next;
        }
    }
    out = current;
    return true;
}

} // namespace

std::string PathEscapeError::message() const {
    return "Path '" + requestedPath + "' is outside the sandbox directory";
}

bool PathGuard::isWithin(const fs::path& root, const fs::path& candidate) {
    auto c = candidate.begin();
    for (auto r = root.begin(); r != root.end(); ++r) {
        if (r->empty()) {
            continue; // trailing separator on the root
        }
        if (c == candidate.end() || *r != *c) {
            return false;
        }
        ++c;
    }
    return true;
}

PathResolution PathGuard::resolve(const fs::path& sandboxRoot, const std::string& relativePath) {
    if (relativePath.find('\0') != std::string::npos) {
        return PathEscapeError{relativePath};
    }

    // An absolute relativePath replaces the root here and is judged by containment below.
    fs::path joined = sandboxRoot / relativePath;

    fs::path resolved;
    if (!canonicalizeWeakly(joined, resolved)) {
        return PathEscapeError{relativePath};
    }
    if (!isWithin(sandboxRoot, resolved)) {
        return PathEscapeError{relativePath};
    }
    return ValidatedPath(resolved);
}
