#include "CancellationToken.hpp"
#include "ErrorCodes.hpp"
#include "FileIntegrityChecker.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <system_error>
#include <unistd.h>

namespace {
int Fail(const std::string& message) {
    std::cerr << message << std::endl;
    return 1;
}

constexpr const char* kAbcSha256 = "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad";
constexpr const char* kEmptySha256 = "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855";
} // namespace

int main() {
    const auto root = std::filesystem::temp_directory_path()
        / ("fleetlink-integrity-tests-" + std::to_string(::getpid()));
    std::filesystem::create_directories(root);
    const std::string abcPath = (root / "abc.txt").string();
    const std::string emptyPath = (root / "empty.txt").string();
    const std::string largePath = (root / "large.bin").string();
    {
        std::ofstream(abcPath, std::ios::binary) << "abc";
        std::ofstream empty(emptyPath, std::ios::binary);
        std::ofstream large(largePath, std::ios::binary);
        const std::string block(FileIntegrityChecker::kBufferSize + 17, 'x');
        large << block << block;
    }

    FileIntegrityChecker checker;
    if (checker.ComputeHash(abcPath) != kAbcSha256) {
        return Fail("Unexpected digest for 'abc'.");
    }
    if (checker.ComputeHash(emptyPath) != kEmptySha256) {
        return Fail("Unexpected digest for an empty file.");
    }

    bool threw = false;
    try {
        checker.ComputeHash((root / "missing.txt").string());
    } catch (const std::filesystem::filesystem_error&) {
        threw = true;
    }
    if (!threw) {
        return Fail("Missing file should throw filesystem_error.");
    }

    auto upper = checker.VerifyHash(abcPath, "BA7816BF8F01CFEA414140DE5DAE2223B00361A396177A9CB410FF61F20015AD");
    if (!upper.IsSuccess() || !upper.Value()) {
        return Fail("Hash comparison must ignore case.");
    }

    auto mismatch = checker.VerifyHash(abcPath, kEmptySha256);
    if (mismatch.IsSuccess() || mismatch.GetError().code != ErrorCodes::kFileHashMismatch) {
        return Fail("Mismatch must return File.HashMismatch.");
    }
    if (mismatch.GetError().message.find(kAbcSha256) == std::string::npos
        || mismatch.GetError().message.find(kEmptySha256) == std::string::npos) {
        return Fail("Mismatch message should name both digests: " + mismatch.GetError().message);
    }

    auto missing = checker.VerifyHash((root / "missing.txt").string(), kAbcSha256);
    if (missing.IsSuccess() || missing.GetError().code != ErrorCodes::kFileNotFound) {
        return Fail("Missing file must return File.NotFound.");
    }

    CancellationSource cancelled;
    cancelled.Cancel();
    threw = false;
    try {
        checker.VerifyHash(largePath, kAbcSha256, cancelled.Token());
    } catch (const OperationCancelledError&) {
        threw = true;
    }
    if (!threw) {
        return Fail("Cancellation must propagate out of VerifyHash.");
    }

    std::error_code cleanup;
    std::filesystem::remove_all(root, cleanup);
    return 0;
}
