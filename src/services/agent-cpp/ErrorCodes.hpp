#pragma once

// Machine-readable failure codes returned to callers. Messages paired with these codes never
// carry file-system paths or exception text.
namespace ErrorCodes {
inline constexpr const char* kPathUnsafe = "Path.Unsafe";
inline constexpr const char* kPathNotAllowed = "Path.NotAllowed";

inline constexpr const char* kTransferLimitReached = "Transfer.LimitReached";
inline constexpr const char* kTransferDuplicate = "Transfer.Duplicate";
inline constexpr const char* kTransferCancelled = "Transfer.Cancelled";
inline constexpr const char* kTransferFailed = "Transfer.Failed";
inline constexpr const char* kTransferInsecureTransport = "Transfer.InsecureTransport";
inline constexpr const char* kTransferInvalidRequest = "Transfer.InvalidRequest";

inline constexpr const char* kFileNotFound = "File.NotFound";
inline constexpr const char* kFileTooLarge = "File.TooLarge";
inline constexpr const char* kFileHashMismatch = "File.HashMismatch";
inline constexpr const char* kFileIoError = "File.IOError";
} // namespace ErrorCodes
