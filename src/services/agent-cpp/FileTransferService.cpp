#include "FileTransferService.hpp"

#include "ErrorCodes.hpp"
#include "JsonUtils.hpp"
#include "Tracing.hpp"

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <map>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace {
namespace fs = std::filesystem;

constexpr const char* kCancelledMessage = "File transfer was cancelled";
constexpr const char* kTimedOutMessage = "File transfer timed out";
constexpr const char* kFailedMessage = "File transfer failed";

bool StartsWithIgnoreCase(const std::string& text, const std::string& prefix) {
    if (text.size() < prefix.size()) {
        return false;
    }
    for (std::size_t i = 0; i < prefix.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(text[i])) != std::tolower(static_cast<unsigned char>(prefix[i]))) {
            return false;
        }
    }
    return true;
}

bool IsHttpsUrl(const std::string& url) {
    return StartsWithIgnoreCase(url, "https://");
}

bool IsAbsoluteUrl(const std::string& url) {
    return url.find("://") != std::string::npos;
}

bool IsSuccessStatus(long statusCode) {
    return statusCode >= 200 && statusCode < 300;
}

std::string FileNameOf(const std::string& path) {
    return fs::path(path).filename().string();
}

std::string TooLargeMessage(uint64_t maxBytes) {
    return "File exceeds the maximum size of " + std::to_string(maxBytes) + " bytes";
}

// Write handle holding an exclusive advisory lock for its lifetime.
class ExclusiveFile {
public:
    ExclusiveFile() = default;
    ~ExclusiveFile() {
        Close();
    }

    ExclusiveFile(const ExclusiveFile&) = delete;
    ExclusiveFile& operator=(const ExclusiveFile&) = delete;

    // Truncates only once the lock is held, so a file another writer owns is left untouched.
    bool Open(const std::string& path) {
        fd_ = ::open(path.c_str(), O_WRONLY | O_CREAT | O_CLOEXEC, 0640);
        if (fd_ < 0) {
            return false;
        }
        if (::flock(fd_, LOCK_EX | LOCK_NB) != 0 || ::ftruncate(fd_, 0) != 0) {
            Close();
            return false;
        }
        return true;
    }

    bool Write(const char* data, std::size_t size) {
        while (size > 0) {
            const ssize_t written = ::write(fd_, data, size);
            if (written < 0) {
                if (errno == EINTR) {
                    continue;
                }
                return false;
            }
            data += written;
            size -= static_cast<std::size_t>(written);
        }
        return true;
    }

    bool Sync() {
        return fd_ >= 0 && ::fsync(fd_) == 0;
    }

    bool Close() {
        if (fd_ < 0) {
            return true;
        }
        const int result = ::close(fd_);
        fd_ = -1;
        return result == 0;
    }

private:
    int fd_ = -1;
};

// Deletes the destination on scope exit unless Keep() ran.
class PartialFileGuard {
public:
    PartialFileGuard() = default;
    ~PartialFileGuard() {
        if (path_.empty()) {
            return;
        }
        std::error_code ec;
        fs::remove(path_, ec);
        if (ec) {
            std::cerr << "[Transfer] [WARN] Partial file " << FileNameOf(path_) << " could not be removed: "
                      << ec.message() << std::endl;
        }
    }

    PartialFileGuard(const PartialFileGuard&) = delete;
    PartialFileGuard& operator=(const PartialFileGuard&) = delete;

    void Arm(std::string path) {
        path_ = std::move(path);
    }

    void Keep() {
        path_.clear();
    }

private:
    std::string path_;
};

class RegistrationGuard {
public:
    RegistrationGuard(TransferRegistry& registry, Uuid transferId)
        : registry_(registry), transferId_(std::move(transferId)) {}
    ~RegistrationGuard() {
        registry_.Remove(transferId_);
    }

    RegistrationGuard(const RegistrationGuard&) = delete;
    RegistrationGuard& operator=(const RegistrationGuard&) = delete;

private:
    TransferRegistry& registry_;
    Uuid transferId_;
};

class ProgressMeter {
public:
    ProgressMeter(TransferRecord& record, const ProgressSink& sink)
        : record_(record), sink_(sink), started_(std::chrono::steady_clock::now()) {}

    void SetTotal(uint64_t totalBytes) {
        totalBytes_ = totalBytes;
    }

    void Report(uint64_t bytesTransferred) {
        const std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - started_;
        FileTransferProgress progress;
        progress.transferId = record_.TransferId();
        progress.bytesTransferred = bytesTransferred;
        progress.totalBytes = totalBytes_;
        progress.bytesPerSecond = elapsed.count() > 0.0
            ? static_cast<uint64_t>(static_cast<double>(bytesTransferred) / elapsed.count())
            : 0;

        record_.UpdateProgress(progress);
        if (sink_) {
            sink_(progress);
        }
    }

private:
    TransferRecord& record_;
    const ProgressSink& sink_;
    const std::chrono::steady_clock::time_point started_;
    uint64_t totalBytes_ = 0;
};

std::chrono::milliseconds ElapsedSince(std::chrono::steady_clock::time_point started) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);
}

std::optional<std::string> RemoteIdFromResponse(const std::string& body) {
    const nlohmann::json json = ParseJsonWithDepthLimit(body);
    if (json.is_discarded() || !json.is_object()) {
        return std::nullopt;
    }
    if (auto fileId = GetStringIgnoreCase(json, "fileId")) {
        return fileId;
    }
    return GetStringIgnoreCase(json, "id");
}
} // namespace

FileTransferService::FileTransferService(
    FileOptions fileOptions,
    ProcessOptions processOptions,
    FileHttpClientFactory httpClientFactory,
    AgentMetrics& metrics)
    : fileOptions_(std::move(fileOptions)),
      processOptions_(std::move(processOptions)),
      httpClientFactory_(std::move(httpClientFactory)),
      metrics_(metrics) {}

std::vector<std::string> FileTransferService::AllowedBasePaths() const {
    std::vector<std::string> basePaths;
    if (!fileOptions_.tempDirectory.empty()) {
        basePaths.push_back(fileOptions_.tempDirectory);
    }
    if (!processOptions_.serverBasePath.empty()) {
        basePaths.push_back(processOptions_.serverBasePath);
    }
    return basePaths;
}

std::optional<Error> FileTransferService::Admit(const std::shared_ptr<TransferRecord>& record) {
    switch (registry_.TryAdmit(record, fileOptions_.maxConcurrentTransfers)) {
    case TransferRegistry::Admission::Admitted:
        return std::nullopt;
    case TransferRegistry::Admission::LimitReached:
        std::cerr << "[Transfer] [WARN] Concurrent transfer limit of " << fileOptions_.maxConcurrentTransfers
                  << " reached; rejecting " << record->TransferId().ToString() << std::endl;
        return Error{
            ErrorCodes::kTransferLimitReached,
            "Maximum concurrent transfers (" + std::to_string(fileOptions_.maxConcurrentTransfers) + ") reached"};
    case TransferRegistry::Admission::Duplicate:
        std::cerr << "[Transfer] [WARN] Transfer " << record->TransferId().ToString() << " is already active" << std::endl;
        return Error{ErrorCodes::kTransferDuplicate, "A transfer with this id is already active"};
    }
    return Error{ErrorCodes::kTransferFailed, kFailedMessage};
}

template <typename Operation>
Result<FileTransferResult> FileTransferService::Guarded(
    const char* operationName,
    TransferRecord& record,
    Operation&& operation) {
    const std::string transferId = record.TransferId().ToString();
    try {
        Result<FileTransferResult> result = operation();
        if (!result.IsSuccess()) {
            record.Fail(FileTransferState::Failed, result.GetError().message);
        }
        return result;
    } catch (const OperationTimedOutError&) {
        std::cerr << "[Transfer] " << operationName << " " << transferId << " timed out" << std::endl;
        record.Fail(FileTransferState::Cancelled, kTimedOutMessage);
        return Result<FileTransferResult>::Failure(ErrorCodes::kTransferCancelled, kTimedOutMessage);
    } catch (const OperationCancelledError&) {
        std::cout << "[Transfer] " << operationName << " " << transferId << " cancelled" << std::endl;
        record.Fail(FileTransferState::Cancelled, kCancelledMessage);
        return Result<FileTransferResult>::Failure(ErrorCodes::kTransferCancelled, kCancelledMessage);
    } catch (const std::exception& ex) {
        std::cerr << "[Transfer] " << operationName << " " << transferId << " failed: " << ex.what() << std::endl;
        record.Fail(FileTransferState::Failed, kFailedMessage);
        return Result<FileTransferResult>::Failure(ErrorCodes::kTransferFailed, kFailedMessage);
    }
}

Result<FileTransferResult> FileTransferService::Download(
    const FileDownloadRequest& request,
    const ProgressSink& progress,
    const CancellationToken& token) {
    if (request.transferId.IsNil() || request.sourceUrl.empty() || request.destinationPath.empty()) {
        return Result<FileTransferResult>::Failure(
            ErrorCodes::kTransferInvalidRequest, "Download request needs a transfer id, source URL and destination");
    }

    auto record = std::make_shared<TransferRecord>(request.transferId, FileTransferDirection::Download, token);
    if (auto rejection = Admit(record)) {
        return Result<FileTransferResult>::Failure(*rejection);
    }
    RegistrationGuard registration(registry_, request.transferId);

    return Guarded("Download", *record, [&] { return RunDownload(request, *record, progress); });
}

Result<FileTransferResult> FileTransferService::RunDownload(
    const FileDownloadRequest& request,
    TransferRecord& record,
    const ProgressSink& progress) {
    using R = Result<FileTransferResult>;
    const auto started = std::chrono::steady_clock::now();
    const CancellationToken token = record.Token();
    const uint64_t maxBytes = fileOptions_.maxFileSizeBytes;

    auto validated = pathValidator_.ValidatePath(request.destinationPath, AllowedBasePaths());
    if (!validated.IsSuccess()) {
        return R::Failure(validated.GetError());
    }
    const std::string destination = validated.Value();
    const std::string fileName = FileNameOf(destination);

    std::error_code ec;
    const fs::path parent = fs::path(destination).parent_path();
    if (!parent.empty()) {
        fs::create_directories(parent, ec);
        if (ec) {
            std::cerr << "[Transfer] [WARN] Destination directory for " << fileName << " could not be created: "
                      << ec.message() << std::endl;
            return R::Failure(ErrorCodes::kFileIoError, "Destination directory could not be created");
        }
    }

    if (request.expectedSizeBytes && *request.expectedSizeBytes > maxBytes) {
        return R::Failure(ErrorCodes::kFileTooLarge, TooLargeMessage(maxBytes));
    }

    record.Advance(FileTransferState::Connecting);
    auto client = httpClientFactory_(kHttpClientProfile);
    if (!client) {
        throw std::runtime_error(std::string("No HTTP client registered for profile ") + kHttpClientProfile);
    }

    const std::string baseAddress = client->BaseAddress();
    if (!baseAddress.empty() && !IsHttpsUrl(baseAddress)) {
        return R::Failure(ErrorCodes::kTransferInsecureTransport, "File transfers require an https endpoint");
    }
    const bool absolute = IsAbsoluteUrl(request.sourceUrl);
    if (!absolute && baseAddress.empty()) {
        return R::Failure(ErrorCodes::kTransferInvalidRequest, "Source URL must be absolute");
    }
    if (absolute && !IsHttpsUrl(request.sourceUrl)) {
        return R::Failure(ErrorCodes::kTransferInsecureTransport, "Source URL must use https");
    }

    ScopedSpan span("agent.file.download");
    span.SetAttribute("transfer.id", request.transferId.ToString());
    const std::map<std::string, std::string> headers{{"traceparent", span.TraceParent()}};

    PartialFileGuard partial;
    ExclusiveFile file;
    if (!file.Open(destination)) {
        std::cerr << "[Transfer] [WARN] Destination " << fileName << " could not be opened for exclusive write" << std::endl;
        return R::Failure(ErrorCodes::kFileIoError, "Destination file could not be opened");
    }
    partial.Arm(destination);

    enum class StopReason { None, BadStatus, TooLarge, WriteFailed, Cancelled };
    StopReason stop = StopReason::None;
    bool headSeen = false;
    long statusCode = 0;
    uint64_t received = 0;
    uint64_t written = 0;
    const std::size_t chunkSize = std::max<std::size_t>(fileOptions_.transferChunkSizeBytes, 1);
    std::vector<char> chunk;
    chunk.reserve(chunkSize);
    ProgressMeter meter(record, progress);

    auto flushChunk = [&]() -> bool {
        if (chunk.empty()) {
            return true;
        }
        if (!file.Write(chunk.data(), chunk.size())) {
            stop = StopReason::WriteFailed;
            return false;
        }
        written += chunk.size();
        chunk.clear();
        meter.Report(written);
        return true;
    };

    auto onHead = [&](const HttpResponseHead& head) -> bool {
        headSeen = true;
        statusCode = head.statusCode;
        if (!IsSuccessStatus(head.statusCode)) {
            stop = StopReason::BadStatus;
            return false;
        }
        if (head.contentLength && *head.contentLength > maxBytes) {
            stop = StopReason::TooLarge;
            return false;
        }
        meter.SetTotal(head.contentLength.value_or(request.expectedSizeBytes.value_or(0)));
        record.Advance(FileTransferState::Transferring);
        return true;
    };

    auto onBody = [&](const char* data, std::size_t size) -> bool {
        if (token.IsCancellationRequested()) {
            stop = StopReason::Cancelled;
            return false;
        }
        if (received + size > maxBytes) {
            stop = StopReason::TooLarge;
            return false;
        }
        received += size;
        while (size > 0) {
            const std::size_t take = std::min(size, chunkSize - chunk.size());
            chunk.insert(chunk.end(), data, data + take);
            data += take;
            size -= take;
            if (chunk.size() == chunkSize && !flushChunk()) {
                return false;
            }
        }
        return true;
    };

    const HttpStreamOutcome outcome = client->GetStreaming(request.sourceUrl, headers, onHead, onBody, token);
    span.SetAttribute("http.status_code", static_cast<int64_t>(statusCode));
    if (stop == StopReason::None && !outcome.aborted && outcome.error.empty()) {
        flushChunk();
    }

    token.ThrowIfCancelled();
    switch (stop) {
    case StopReason::TooLarge:
        std::cerr << "[Transfer] [WARN] Download of " << fileName << " exceeded " << maxBytes
                  << " bytes; partial file removed" << std::endl;
        return R::Failure(ErrorCodes::kFileTooLarge, TooLargeMessage(maxBytes));
    case StopReason::BadStatus:
        throw std::runtime_error("download returned HTTP " + std::to_string(statusCode));
    case StopReason::WriteFailed:
        throw std::runtime_error("write to " + fileName + " failed");
    case StopReason::Cancelled:
        throw OperationCancelledError();
    case StopReason::None:
        break;
    }
    if (!outcome.error.empty()) {
        throw std::runtime_error("download request failed: " + outcome.error);
    }
    if (!headSeen || outcome.aborted) {
        throw std::runtime_error("download ended without a complete response");
    }
    if (!file.Sync() || !file.Close()) {
        throw std::runtime_error("flushing " + fileName + " failed");
    }

    record.Advance(FileTransferState::Verifying);
    if (request.expectedHash && !request.expectedHash->empty()) {
        const auto verified = integrityChecker_.VerifyHash(destination, *request.expectedHash, token);
        if (!verified.IsSuccess()) {
            std::cerr << "[Transfer] [WARN] Integrity check failed for " << fileName << "; partial file removed" << std::endl;
            return R::Failure(verified.GetError());
        }
    }
    std::string fileHash = integrityChecker_.ComputeHash(destination, token);

    record.Advance(FileTransferState::Completed);
    partial.Keep();
    metrics_.RecordFileTransfer(written, false);

    FileTransferResult result;
    result.transferId = request.transferId;
    result.localPath = destination;
    result.fileHash = std::move(fileHash);
    result.fileSizeBytes = written;
    result.duration = ElapsedSince(started);

    span.SetAttribute("file.size_bytes", static_cast<int64_t>(written));
    span.MarkSucceeded();
    std::cout << "[Transfer] Downloaded " << fileName << " (" << written << " bytes) in "
              << result.duration.count() << "ms" << std::endl;
    return R::Success(std::move(result));
}

Result<FileTransferResult> FileTransferService::Upload(
    const FileUploadRequest& request,
    const ProgressSink& progress,
    const CancellationToken& token) {
    if (request.transferId.IsNil() || request.sourcePath.empty()) {
        return Result<FileTransferResult>::Failure(
            ErrorCodes::kTransferInvalidRequest, "Upload request needs a transfer id and source path");
    }

    auto record = std::make_shared<TransferRecord>(request.transferId, FileTransferDirection::Upload, token);
    if (auto rejection = Admit(record)) {
        return Result<FileTransferResult>::Failure(*rejection);
    }
    RegistrationGuard registration(registry_, request.transferId);

    return Guarded("Upload", *record, [&] { return RunUpload(request, *record, progress); });
}

Result<FileTransferResult> FileTransferService::RunUpload(
    const FileUploadRequest& request,
    TransferRecord& record,
    const ProgressSink& progress) {
    using R = Result<FileTransferResult>;
    const auto started = std::chrono::steady_clock::now();
    const CancellationToken token = record.Token();
    const uint64_t maxBytes = fileOptions_.maxFileSizeBytes;

    auto validated = pathValidator_.ValidatePath(request.sourcePath, AllowedBasePaths());
    if (!validated.IsSuccess()) {
        return R::Failure(validated.GetError());
    }
    const std::string source = validated.Value();
    const std::string fileName = FileNameOf(source);

    std::error_code ec;
    if (!fs::is_regular_file(source, ec)) {
        return R::Failure(ErrorCodes::kFileNotFound, "Source file not found");
    }
    const uint64_t fileSize = fs::file_size(source, ec);
    if (ec) {
        return R::Failure(ErrorCodes::kFileIoError, "Source file size could not be read");
    }
    if (fileSize > maxBytes) {
        return R::Failure(ErrorCodes::kFileTooLarge, TooLargeMessage(maxBytes));
    }

    record.Advance(FileTransferState::Connecting);
    auto client = httpClientFactory_(kHttpClientProfile);
    if (!client) {
        throw std::runtime_error(std::string("No HTTP client registered for profile ") + kHttpClientProfile);
    }
    const std::string baseAddress = client->BaseAddress();
    if (baseAddress.empty()) {
        return R::Failure(ErrorCodes::kTransferInvalidRequest, "Uploads require a configured base address");
    }
    if (!IsHttpsUrl(baseAddress)) {
        return R::Failure(ErrorCodes::kTransferInsecureTransport, "File transfers require an https endpoint");
    }

    std::string fileHash = integrityChecker_.ComputeHash(source, token);

    std::ifstream input(source, std::ios::binary);
    if (!input) {
        return R::Failure(ErrorCodes::kFileIoError, "Source file could not be opened");
    }

    ScopedSpan span("agent.file.upload");
    span.SetAttribute("transfer.id", request.transferId.ToString());
    const std::map<std::string, std::string> headers{{"traceparent", span.TraceParent()}};
    std::map<std::string, std::string> query;
    if (request.destinationId && !request.destinationId->empty()) {
        query["destinationId"] = *request.destinationId;
    }

    record.Advance(FileTransferState::Transferring);
    const std::size_t chunkSize = std::max<std::size_t>(fileOptions_.transferChunkSizeBytes, 1);
    uint64_t sent = 0;
    bool readFailed = false;
    ProgressMeter meter(record, progress);
    meter.SetTotal(fileSize);

    auto bodySource = [&](char* buffer, std::size_t capacity, std::size_t& produced) -> bool {
        produced = 0;
        if (token.IsCancellationRequested()) {
            return false;
        }
        const uint64_t remaining = fileSize - sent;
        if (remaining == 0) {
            return true;
        }
        const std::size_t wanted = static_cast<std::size_t>(
            std::min<uint64_t>({remaining, static_cast<uint64_t>(capacity), static_cast<uint64_t>(chunkSize)}));
        input.read(buffer, static_cast<std::streamsize>(wanted));
        const std::streamsize got = input.gcount();
        if (got <= 0) {
            readFailed = true;
            return false;
        }
        produced = static_cast<std::size_t>(got);
        sent += produced;
        meter.Report(sent);
        return true;
    };

    const HttpResponse response = client->PostStreaming(kUploadPath, query, headers, fileSize, bodySource, token);
    span.SetAttribute("http.status_code", static_cast<int64_t>(response.statusCode));

    token.ThrowIfCancelled();
    if (readFailed) {
        throw std::runtime_error("reading " + fileName + " failed");
    }
    if (!response.error.empty()) {
        throw std::runtime_error("upload request failed: " + response.error);
    }
    if (response.aborted || sent != fileSize) {
        throw std::runtime_error("upload of " + fileName + " ended early");
    }
    if (!IsSuccessStatus(response.statusCode)) {
        throw std::runtime_error("upload returned HTTP " + std::to_string(response.statusCode));
    }

    record.Advance(FileTransferState::Completed);
    metrics_.RecordFileTransfer(fileSize, true);

    FileTransferResult result;
    result.transferId = request.transferId;
    result.remoteId = RemoteIdFromResponse(response.body);
    if (!result.remoteId) {
        result.remoteId = request.destinationId;
    }
    result.fileHash = std::move(fileHash);
    result.fileSizeBytes = fileSize;
    result.duration = ElapsedSince(started);

    span.SetAttribute("file.size_bytes", static_cast<int64_t>(fileSize));
    span.MarkSucceeded();
    std::cout << "[Transfer] Uploaded " << fileName << " (" << fileSize << " bytes) in "
              << result.duration.count() << "ms" << std::endl;
    return R::Success(std::move(result));
}

std::optional<FileTransferStatus> FileTransferService::GetTransferStatus(const Uuid& transferId) const {
    const auto record = registry_.Find(transferId);
    if (!record) {
        return std::nullopt;
    }
    return record->Snapshot();
}

std::vector<FileTransferStatus> FileTransferService::GetActiveTransfers() const {
    std::vector<FileTransferStatus> statuses;
    for (const auto& record : registry_.Active()) {
        statuses.push_back(record->Snapshot());
    }
    return statuses;
}

bool FileTransferService::CancelTransfer(const Uuid& transferId) {
    const auto record = registry_.Find(transferId);
    if (!record) {
        return false;
    }
    record->Cancel();
    std::cout << "[Transfer] Cancellation requested for " << transferId.ToString() << std::endl;
    return true;
}
