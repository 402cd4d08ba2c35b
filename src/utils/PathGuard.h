#pragma once
#include <filesystem>
#include <stdexcept>
#include <string>

namespace fs = std::filesystem;

/**
 * @brief Raised when a path resolves outside the working root.
 */
class PathAccessDenied : public std::runtime_error {
public:
    explicit PathAccessDenied(const std::string& message) : std::runtime_error(message) {}
};

/**
 * @brief Confines caller-supplied paths to one directory.
 *
 * Every candidate is joined against the root, then `.`/`..` segments and
 * symbolic links of the existing prefix are resolved before the containment
 * check. The check compares path components, never string prefixes, so a
 * sibling such as "/tmp/proj2" is not considered inside "/tmp/proj".
 */
class PathGuard {
public:
    // Throws std::runtime_error when rootPath is not an existing directory.
    explicit PathGuard(const std::string& rootPath);

    const fs::path& root() const { return rootPath; }

    /**
     * @brief Resolve a relative or absolute candidate under the root.
     * @param candidate Path as supplied by the caller; empty means the root.
     * @return Normalized absolute path, equal to or below the root.
     * @throws PathAccessDenied if the path escapes the root.
     */
    fs::path resolve(const std::string& candidate) const;

    /**
     * @brief Resolve only the parent directory of a candidate.
     *
     * The final name is re-appended unresolved, so a destination leaf that
     * does not exist yet (or is itself a link) is not followed.
     * @throws PathAccessDenied if the parent escapes or the name is "." / "..".
     */
    fs::path resolveParent(const std::string& candidate) const;

    bool contains(const fs::path& absolutePath) const;

    // Root-relative rendering of a confined path ("." for the root itself).
    std::string relative(const fs::path& absolutePath) const;

private:
    fs::path rootPath;

    void rejectDanglingLinks(const fs::path& resolved, const std::string& candidate) const;
};
