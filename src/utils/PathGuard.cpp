#include "utils/PathGuard.h"
#include <system_error>

PathGuard::PathGuard(const std::string& rootPathStr) {
    std::error_code ec;
    fs::path root = fs::canonical(fs::u8path(rootPathStr), ec);
    if (ec) {
        throw std::runtime_error("Working directory does not exist: " + rootPathStr);
    }
    if (!fs::is_directory(root, ec)) {
        throw std::runtime_error("Working directory is not a directory: " + rootPathStr);
    }
    rootPath = root;
}

fs::path PathGuard::resolve(const std::string& candidate) const {
    fs::path input = fs::u8path(candidate);
    fs::path joined = input.is_absolute() ? input : rootPath / input;

    std::error_code ec;
    fs::path resolved = fs::weakly_canonical(joined, ec);
    if (ec) {
        throw PathAccessDenied("Path access denied: '" + candidate + "' could not be resolved (" + ec.message() + ").");
    }
    if (!contains(resolved)) {
        throw PathAccessDenied("Path access denied: '" + candidate + "' is outside the project directory.");
    }
    rejectDanglingLinks(resolved, candidate);
    return resolved;
}

fs::path PathGuard::resolveParent(const std::string& candidate) const {
    std::string trimmed = candidate;
    while (trimmed.size() > 1 && (trimmed.back() == '/' || trimmed.back() == '\\')) {
        trimmed.pop_back();
    }

    fs::path input = fs::u8path(trimmed);
    fs::path name = input.filename();
    if (name.empty() || name == "." || name == "..") {
        throw PathAccessDenied("Path access denied: '" + candidate + "' does not name an entry inside the project directory.");
    }

    fs::path parent = resolve(input.parent_path().u8string());
    return parent / name;
}

bool PathGuard::contains(const fs::path& absolutePath) const {
    auto pathIt = absolutePath.begin();
    for (auto rootIt = rootPath.begin(); rootIt != rootPath.end(); ++rootIt, ++pathIt) {
        if (pathIt == absolutePath.end() || *pathIt != *rootIt) {
            return false;
        }
    }
    // Anything left over must be real components, not a ".." that
    // weakly_canonical kept because the prefix did not exist.
    for (; pathIt != absolutePath.end(); ++pathIt) {
        if (*pathIt == "..") return false;
    }
    return true;
}

std::string PathGuard::relative(const fs::path& absolutePath) const {
    fs::path rel = absolutePath.lexically_relative(rootPath);
    if (rel.empty() || rel == ".") return ".";
    return rel.generic_u8string();
}

// weakly_canonical resolves links only while the prefix exists. A dangling
// link is the first component that stops existing, and writing through it
// would create its target wherever it points.
void PathGuard::rejectDanglingLinks(const fs::path& resolved, const std::string& candidate) const {
    fs::path current = rootPath;
    fs::path rel = resolved.lexically_relative(rootPath);
    for (const auto& part : rel) {
        if (part.empty() || part == ".") continue;
        current /= part;
        std::error_code ec;
        auto status = fs::symlink_status(current, ec);
        if (ec || !fs::exists(status)) {
            return;
        }
        if (fs::is_symlink(status)) {
            throw PathAccessDenied("Path access denied: '" + candidate + "' passes through a dangling symbolic link.");
        }
    }
}
