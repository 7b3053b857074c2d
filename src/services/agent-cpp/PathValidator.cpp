#include "PathValidator.hpp"

#include "ErrorCodes.hpp"

#include <algorithm>
#include <cctype>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <system_error>

namespace fs = std::filesystem;

namespace {
#ifdef _WIN32
constexpr char kSeparator = '\\';
constexpr char kAltSeparator = '/';
#else
constexpr char kSeparator = '/';
// Backslashes never name a directory here, but a path written for another platform is treated
// as if they did so that it cannot smuggle a traversal.
constexpr char kAltSeparator = '\\';
#endif

constexpr const char* kUnsafeCharacters = "<>:\"|?*";

bool IsBlank(const std::string& value) {
    return std::all_of(value.begin(), value.end(), [](unsigned char ch) { return std::isspace(ch); });
}

std::string ToComparable(std::string value) {
#ifdef _WIN32
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
#endif
    return value;
}

bool Resolve(const std::string& path, std::string& out) {
    std::error_code error;
    const fs::path absolute = fs::absolute(fs::path(path), error);
    if (error) {
        return false;
    }
    const fs::path resolved = fs::weakly_canonical(absolute, error);
    if (error) {
        return false;
    }
    out = resolved.lexically_normal().string();
    if (out.size() > 1 && out.back() == kSeparator) {
        out.pop_back();
    }
    return true;
}
} // namespace

Result<std::string> PathValidator::ValidatePath(
    const std::string& path,
    const std::vector<std::string>& allowedBasePaths) const {
    if (path.empty() || IsBlank(path)) {
        std::cerr << "[PathValidator] [WARN] Path validation failed: empty path" << std::endl;
        return Result<std::string>::Failure(ErrorCodes::kPathUnsafe, "Path is empty");
    }

    const std::string normalized = NormalizePath(path);
    if (!IsSafePath(normalized)) {
        std::cerr << "[PathValidator] [WARN] Path validation failed: unsafe characters or traversal" << std::endl;
        return Result<std::string>::Failure(
            ErrorCodes::kPathUnsafe,
            "Path contains unsafe characters or traversal patterns");
    }

    std::string fullPath;
    if (!Resolve(normalized, fullPath)) {
        return Result<std::string>::Failure(ErrorCodes::kPathUnsafe, "Path could not be resolved");
    }
    const std::string comparablePath = ToComparable(fullPath);

    for (const auto& basePath : allowedBasePaths) {
        if (basePath.empty() || IsBlank(basePath)) {
            continue;
        }

        std::string resolvedBase;
        if (!Resolve(NormalizePath(basePath), resolvedBase)) {
            continue;
        }

        const std::string comparableBase = ToComparable(resolvedBase);
        if (comparablePath == comparableBase) {
            return Result<std::string>::Success(fullPath);
        }

        // The separator keeps "/allowed/path" from accepting "/allowed/pathological".
        const std::string prefix = comparableBase.back() == kSeparator ? comparableBase : comparableBase + kSeparator;
        if (comparablePath.compare(0, prefix.size(), prefix) == 0) {
            return Result<std::string>::Success(fullPath);
        }
    }

    std::cerr << "[PathValidator] [WARN] Path validation failed: outside allowed directories" << std::endl;
    return Result<std::string>::Failure(ErrorCodes::kPathNotAllowed, "Path is not within allowed directories");
}

bool PathValidator::IsSafePath(const std::string& path) {
    if (path.empty() || IsBlank(path)) {
        return false;
    }

    size_t start = 0;
#ifdef _WIN32
    if (path.size() >= 2 && std::isalpha(static_cast<unsigned char>(path[0])) && path[1] == ':') {
        start = 2;
    }
#endif
    for (size_t i = start; i < path.size(); ++i) {
        if (path[i] == '\0' || std::strchr(kUnsafeCharacters, path[i]) != nullptr) {
            return false;
        }
    }

    if (path.find("..") != std::string::npos) {
        return false;
    }

    for (const char ch : path) {
        const auto byte = static_cast<unsigned char>(ch);
        if ((byte < 0x20 || byte == 0x7f) && ch != '\t') {
            return false;
        }
    }

    return true;
}

std::string PathValidator::NormalizePath(const std::string& path) {
    std::string normalized = path;
    std::replace(normalized.begin(), normalized.end(), kAltSeparator, kSeparator);

    std::string collapsed;
    collapsed.reserve(normalized.size());
    for (const char ch : normalized) {
        if (ch == kSeparator && !collapsed.empty() && collapsed.back() == kSeparator) {
            continue;
        }
        collapsed.push_back(ch);
    }

    while (collapsed.size() > 1 && collapsed.back() == kSeparator) {
        collapsed.pop_back();
    }
    return collapsed;
}
