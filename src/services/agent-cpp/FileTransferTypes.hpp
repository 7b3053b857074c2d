#pragma once

#include "Uuid.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

enum class FileTransferDirection {
    Download,
    Upload
};

// Ordered: a transfer only ever moves to a later value. Cancelled and Failed are both terminal.
enum class FileTransferState {
    Pending,
    Connecting,
    Transferring,
    Verifying,
    Completed,
    Cancelled,
    Failed
};

const char* ToString(FileTransferDirection direction);
const char* ToString(FileTransferState state);
bool IsTerminal(FileTransferState state);
bool CanAdvance(FileTransferState from, FileTransferState to);

struct FileDownloadRequest {
    Uuid transferId = Uuid::Generate();
    // Absolute https URL, or a path relative to the HTTP client's base address.
    std::string sourceUrl;
    std::string destinationPath;
    std::optional<std::string> expectedHash;
    std::optional<uint64_t> expectedSizeBytes;
    bool allowPeerToPeer = true;
};

struct FileUploadRequest {
    Uuid transferId = Uuid::Generate();
    std::string sourcePath;
    std::optional<std::string> destinationId;
    bool allowPeerToPeer = true;
};

struct FileTransferProgress {
    Uuid transferId;
    uint64_t bytesTransferred = 0;
    uint64_t totalBytes = 0;
    uint64_t bytesPerSecond = 0;

    double PercentComplete() const {
        return totalBytes > 0 ? 100.0 * static_cast<double>(bytesTransferred) / static_cast<double>(totalBytes) : 0.0;
    }
};

struct FileTransferResult {
    Uuid transferId;
    std::optional<std::string> localPath;
    std::optional<std::string> remoteId;
    std::string fileHash;
    uint64_t fileSizeBytes = 0;
    std::chrono::milliseconds duration{0};
    // Peer-to-peer transfer is not implemented.
    bool usedPeerToPeer = false;
};

struct FileTransferStatus {
    Uuid transferId;
    FileTransferDirection direction = FileTransferDirection::Download;
    FileTransferState state = FileTransferState::Pending;
    std::optional<FileTransferProgress> progress;
    std::optional<std::string> errorMessage;
    std::chrono::system_clock::time_point startedAt;
    bool usingPeerToPeer = false;
};

using ProgressSink = std::function<void(const FileTransferProgress&)>;
