#pragma once

#include "Result.hpp"

#include <string>
#include <vector>

// Confines file-system paths to a set of allowed base directories.
class PathValidator {
public:
    // Returns the resolved absolute path, or Path.Unsafe / Path.NotAllowed.
    Result<std::string> ValidatePath(const std::string& path, const std::vector<std::string>& allowedBasePaths) const;

    // Rejects unsafe characters, ".." sequences, NUL and control characters other than tab.
    static bool IsSafePath(const std::string& path);

    // Unifies separators, collapses duplicates and trims a trailing separator except at the root.
    static std::string NormalizePath(const std::string& path);
};
