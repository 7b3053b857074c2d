#pragma once

#include "AgentMetrics.hpp"
#include "AgentOptions.hpp"
#include "CancellationToken.hpp"
#include "FileHttpClient.hpp"
#include "FileIntegrityChecker.hpp"
#include "FileTransferTypes.hpp"
#include "PathValidator.hpp"
#include "Result.hpp"
#include "TransferRegistry.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

// Concurrency-limited file downloads and uploads over the HTTP client profile
// "ControlPlaneMtls". Local paths are confined to the temp directory and the server base path.
// Failures come back as Result codes; messages never carry paths or exception text.
class FileTransferService {
public:
    static constexpr const char* kHttpClientProfile = "ControlPlaneMtls";
    static constexpr const char* kUploadPath = "/files/upload";

    FileTransferService(FileOptions fileOptions, ProcessOptions processOptions, FileHttpClientFactory httpClientFactory, AgentMetrics& metrics);

    FileTransferService(const FileTransferService&) = delete;
    FileTransferService& operator=(const FileTransferService&) = delete;

    Result<FileTransferResult> Download(
        const FileDownloadRequest& request,
        const ProgressSink& progress = ProgressSink(),
        const CancellationToken& token = CancellationToken());

    Result<FileTransferResult> Upload(
        const FileUploadRequest& request,
        const ProgressSink& progress = ProgressSink(),
        const CancellationToken& token = CancellationToken());

    std::optional<FileTransferStatus> GetTransferStatus(const Uuid& transferId) const;
    std::vector<FileTransferStatus> GetActiveTransfers() const;
    // Returns false when the transfer is no longer active.
    bool CancelTransfer(const Uuid& transferId);

private:
    std::vector<std::string> AllowedBasePaths() const;
    std::optional<Error> Admit(const std::shared_ptr<TransferRecord>& record);

    Result<FileTransferResult> RunDownload(const FileDownloadRequest& request, TransferRecord& record, const ProgressSink& progress);
    Result<FileTransferResult> RunUpload(const FileUploadRequest& request, TransferRecord& record, const ProgressSink& progress);

    // Maps cancellation, timeout and unexpected exceptions onto sanitized results.
    template <typename Operation>
    Result<FileTransferResult> Guarded(const char* operationName, TransferRecord& record, Operation&& operation);

    FileOptions fileOptions_;
    ProcessOptions processOptions_;
    FileHttpClientFactory httpClientFactory_;
    AgentMetrics& metrics_;
    PathValidator pathValidator_;
    FileIntegrityChecker integrityChecker_;
    TransferRegistry registry_;
};
