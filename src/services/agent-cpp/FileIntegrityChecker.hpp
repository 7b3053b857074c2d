#pragma once

#include "CancellationToken.hpp"
#include "Result.hpp"

#include <cstddef>
#include <string>

// SHA-256 file digests, streamed through OpenSSL EVP.
class FileIntegrityChecker {
public:
    static constexpr std::size_t kBufferSize = 81920;

    // Lowercase hex digest. Throws std::filesystem::filesystem_error when the file is missing,
    // std::runtime_error on read or digest failures, and OperationCancelledError when cancelled.
    std::string ComputeHash(const std::string& path, const CancellationToken& token = CancellationToken()) const;

    // Compares hex digests case-insensitively. Mismatches and missing files are returned as
    // failures; cancellation still throws.
    Result<bool> VerifyHash(
        const std::string& path,
        const std::string& expectedHash,
        const CancellationToken& token = CancellationToken()) const;
};
