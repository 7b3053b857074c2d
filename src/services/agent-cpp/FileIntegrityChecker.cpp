#include "FileIntegrityChecker.hpp"

#include "ErrorCodes.hpp"

#include <openssl/evp.h>

#include <cctype>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <system_error>
#include <vector>

namespace {
struct EvpMdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

std::string ToHex(const unsigned char* digest, unsigned int length) {
    static constexpr char kDigits[] = "0123456789abcdef";
    std::string hex;
    hex.reserve(length * 2);
    for (unsigned int i = 0; i < length; ++i) {
        hex.push_back(kDigits[digest[i] >> 4]);
        hex.push_back(kDigits[digest[i] & 0x0f]);
    }
    return hex;
}

// Case-insensitive and independent of where the first difference is.
bool HexEquals(const std::string& left, const std::string& right) {
    if (left.size() != right.size()) {
        return false;
    }
    unsigned char difference = 0;
    for (size_t i = 0; i < left.size(); ++i) {
        difference |= static_cast<unsigned char>(
            std::tolower(static_cast<unsigned char>(left[i])) ^ std::tolower(static_cast<unsigned char>(right[i])));
    }
    return difference == 0;
}
} // namespace

std::string FileIntegrityChecker::ComputeHash(const std::string& path, const CancellationToken& token) const {
    if (!std::filesystem::exists(path)) {
        throw std::filesystem::filesystem_error(
            "File not found",
            std::make_error_code(std::errc::no_such_file_or_directory));
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw std::runtime_error("Unable to open file for hashing");
    }

    std::unique_ptr<EVP_MD_CTX, EvpMdCtxDeleter> ctx(EVP_MD_CTX_new());
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("Unable to initialize SHA-256 digest");
    }

    std::vector<char> buffer(kBufferSize);
    while (file) {
        token.ThrowIfCancelled();
        file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        const std::streamsize bytesRead = file.gcount();
        if (bytesRead > 0 && EVP_DigestUpdate(ctx.get(), buffer.data(), static_cast<size_t>(bytesRead)) != 1) {
            throw std::runtime_error("Unable to update SHA-256 digest");
        }
    }
    if (file.bad()) {
        throw std::runtime_error("Error reading file for hashing");
    }

    unsigned char digest[EVP_MAX_MD_SIZE] = {};
    unsigned int length = 0;
    if (EVP_DigestFinal_ex(ctx.get(), digest, &length) != 1) {
        throw std::runtime_error("Unable to finalize SHA-256 digest");
    }
    return ToHex(digest, length);
}

Result<bool> FileIntegrityChecker::VerifyHash(
    const std::string& path,
    const std::string& expectedHash,
    const CancellationToken& token) const {
    std::string actual;
    try {
        actual = ComputeHash(path, token);
    } catch (const std::filesystem::filesystem_error&) {
        return Result<bool>::Failure(ErrorCodes::kFileNotFound, "File not found");
    } catch (const OperationCancelledError&) {
        throw;
    } catch (const OperationTimedOutError&) {
        throw;
    } catch (const std::runtime_error& ex) {
        std::cerr << "[Integrity] Hash computation failed: " << ex.what() << std::endl;
        return Result<bool>::Failure(ErrorCodes::kFileIoError, "File could not be read");
    }

    if (!HexEquals(actual, expectedHash)) {
        std::cerr << "[Integrity] [WARN] Hash mismatch for " << std::filesystem::path(path).filename().string()
                  << std::endl;
        return Result<bool>::Failure(
            ErrorCodes::kFileHashMismatch,
            "Hash mismatch: expected " + expectedHash + ", actual " + actual);
    }
    return Result<bool>::Success(true);
}
