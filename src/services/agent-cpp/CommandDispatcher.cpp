#include "CommandDispatcher.hpp"

#include "AgentOptions.hpp"
#include "CommandValidator.hpp"
#include "ErrorCodes.hpp"
#include "JsonUtils.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <iostream>
#include <nlohmann/json.hpp>
#include <utility>

namespace {
std::string ToLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return value;
}

nlohmann::json ParsePayload(const std::string& payloadJson) {
    if (payloadJson.empty()) {
        return nlohmann::json::object();
    }

    nlohmann::json parsed = ParseJsonWithDepthLimit(payloadJson);
    if (parsed.is_discarded() || !parsed.is_object()) {
        return nlohmann::json(nlohmann::json::value_t::discarded);
    }
    return parsed;
}

// Absent means "use the command id"; present but malformed yields nullopt.
std::optional<Uuid> TransferIdFrom(const nlohmann::json& payload, const Uuid& commandId) {
    const nlohmann::json* member = FindMemberIgnoreCase(payload, "transferId");
    if (member == nullptr || member->is_null()) {
        return commandId;
    }
    if (!member->is_string()) {
        return std::nullopt;
    }
    auto parsed = Uuid::Parse(member->get<std::string>());
    if (!parsed || parsed->IsNil()) {
        return std::nullopt;
    }
    return parsed;
}

std::optional<uint64_t> UnsignedFrom(const nlohmann::json& payload, const std::string& name) {
    const nlohmann::json* member = FindMemberIgnoreCase(payload, name);
    if (member == nullptr || !member->is_number_integer() || member->get<int64_t>() < 0) {
        return std::nullopt;
    }
    return member->get<uint64_t>();
}

CommandResult InvalidPayload(
    const CommandEnvelope& command,
    const Uuid& nodeId,
    std::chrono::system_clock::time_point startedAt,
    const std::string& message) {
    return CommandResult::Failure(
        command.commandId, nodeId, startedAt, message, CommandDispatcher::kInvalidPayloadCode, command.correlationId);
}

CommandResult FromTransferOutcome(
    const CommandEnvelope& command,
    const Uuid& nodeId,
    std::chrono::system_clock::time_point startedAt,
    const Result<FileTransferResult>& outcome) {
    if (!outcome.IsSuccess()) {
        const Error& error = outcome.GetError();
        CommandResult result = CommandResult::Failure(
            command.commandId, nodeId, startedAt, error.message, error.code, command.correlationId);
        if (error.code == ErrorCodes::kTransferCancelled) {
            result.status = CommandResultStatus::Cancelled;
        }
        return result;
    }

    const FileTransferResult& transfer = outcome.Value();
    nlohmann::json body = {
        {"transferId", transfer.transferId.ToString()},
        {"fileHash", transfer.fileHash},
        {"fileSizeBytes", transfer.fileSizeBytes},
        {"durationMs", transfer.duration.count()},
        {"usedPeerToPeer", transfer.usedPeerToPeer}
    };
    if (transfer.remoteId) {
        body["remoteId"] = *transfer.remoteId;
    }
    return CommandResult::Success(command.commandId, nodeId, startedAt, body.dump(), command.correlationId);
}

ProgressSink DebugProgressLogger() {
    if (!DebugLoggingEnabled()) {
        return ProgressSink();
    }
    return [](const FileTransferProgress& progress) {
        std::cout << "[Transfer] [DEBUG] " << progress.transferId.ToString() << ": " << progress.bytesTransferred
                  << "/" << progress.totalBytes << " bytes, " << progress.bytesPerSecond << " B/s" << std::endl;
    };
}
} // namespace

CommandDispatcher::CommandDispatcher(FileTransferService& transfers, ResultSink reportResult, std::optional<Uuid> nodeId)
    : transfers_(transfers),
      reportResult_(std::move(reportResult)),
      nodeId_(std::move(nodeId)) {}

CommandDispatcher::~CommandDispatcher() {
    Shutdown();
}

void CommandDispatcher::Dispatch(const CommandEnvelope& command) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stopping_) {
        std::cerr << "[Agent] [WARN] Shutting down; command " << command.commandId.ToString() << " not started" << std::endl;
        return;
    }
    if (command.commandId.IsNil() || ResultNodeId(command).IsNil()) {
        std::cerr << "[Agent] [WARN] Command " << command.commandId.ToString()
                  << " has no node id to report against; not started" << std::endl;
        return;
    }
    if (!RememberCommand(command.commandId)) {
        std::cerr << "[Agent] [WARN] Duplicate command " << command.commandId.ToString() << " ignored" << std::endl;
        return;
    }
    ReapFinishedWorkers();

    auto worker = std::make_unique<Worker>();
    Worker* raw = worker.get();
    const CancellationToken token = shutdown_.Token();
    worker->thread = std::thread([this, command, token, raw] {
        try {
            Report(Execute(command, token));
        } catch (const std::exception& ex) {
            std::cerr << "[Agent] Command " << command.commandId.ToString() << " could not be completed: "
                      << ex.what() << std::endl;
        }
        raw->finished = true;
    });
    workers_.push_back(std::move(worker));
}

void CommandDispatcher::Shutdown() {
    std::list<std::unique_ptr<Worker>> workers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
        workers.swap(workers_);
    }

    shutdown_.Cancel();
    for (auto& worker : workers) {
        if (worker->thread.joinable()) {
            worker->thread.join();
        }
    }
}

CommandResult CommandDispatcher::Execute(const CommandEnvelope& command, const CancellationToken& token) {
    const std::string type = ToLower(command.commandType);
    if (type == "file.download") {
        return RunDownload(command, token);
    }
    if (type == "file.upload") {
        return RunUpload(command, token);
    }
    if (type == "file.cancel") {
        return RunCancel(command);
    }

    std::cerr << "[Agent] [WARN] Unsupported command " << SanitizeCommandType(command.commandType) << " ("
              << command.commandId.ToString() << ")" << std::endl;
    return CommandResult::Rejected(
        command.commandId,
        ResultNodeId(command),
        "Command type is not supported by this agent",
        kUnsupportedCommandCode,
        command.correlationId);
}

CommandResult CommandDispatcher::RunDownload(const CommandEnvelope& command, const CancellationToken& token) {
    const auto startedAt = std::chrono::system_clock::now();
    const Uuid nodeId = ResultNodeId(command);
    const nlohmann::json payload = ParsePayload(command.payloadJson);
    if (payload.is_discarded()) {
        return InvalidPayload(command, nodeId, startedAt, "Payload is not a JSON object");
    }

    const auto transferId = TransferIdFrom(payload, command.commandId);
    auto sourceUrl = GetStringIgnoreCase(payload, "sourceUrl");
    if (!sourceUrl) {
        sourceUrl = GetStringIgnoreCase(payload, "url");
    }
    const auto destinationPath = GetStringIgnoreCase(payload, "destinationPath");
    if (!transferId || !sourceUrl || !destinationPath) {
        return InvalidPayload(command, nodeId, startedAt, "Download needs transferId, sourceUrl and destinationPath");
    }

    FileDownloadRequest request;
    request.transferId = *transferId;
    request.sourceUrl = *sourceUrl;
    request.destinationPath = *destinationPath;
    request.expectedHash = GetStringIgnoreCase(payload, "expectedHash");
    request.expectedSizeBytes = UnsignedFrom(payload, "expectedSizeBytes");

    return FromTransferOutcome(command, nodeId, startedAt, transfers_.Download(request, DebugProgressLogger(), token));
}

CommandResult CommandDispatcher::RunUpload(const CommandEnvelope& command, const CancellationToken& token) {
    const auto startedAt = std::chrono::system_clock::now();
    const Uuid nodeId = ResultNodeId(command);
    const nlohmann::json payload = ParsePayload(command.payloadJson);
    if (payload.is_discarded()) {
        return InvalidPayload(command, nodeId, startedAt, "Payload is not a JSON object");
    }

    const auto transferId = TransferIdFrom(payload, command.commandId);
    const auto sourcePath = GetStringIgnoreCase(payload, "sourcePath");
    if (!transferId || !sourcePath) {
        return InvalidPayload(command, nodeId, startedAt, "Upload needs transferId and sourcePath");
    }

    FileUploadRequest request;
    request.transferId = *transferId;
    request.sourcePath = *sourcePath;
    request.destinationId = GetStringIgnoreCase(payload, "destinationId");

    return FromTransferOutcome(command, nodeId, startedAt, transfers_.Upload(request, DebugProgressLogger(), token));
}

CommandResult CommandDispatcher::RunCancel(const CommandEnvelope& command) {
    const auto startedAt = std::chrono::system_clock::now();
    const Uuid nodeId = ResultNodeId(command);
    const nlohmann::json payload = ParsePayload(command.payloadJson);
    const nlohmann::json* member = payload.is_discarded() ? nullptr : FindMemberIgnoreCase(payload, "transferId");
    const auto transferId = (member != nullptr && member->is_string())
        ? Uuid::Parse(member->get<std::string>())
        : std::optional<Uuid>();
    if (!transferId) {
        return InvalidPayload(command, nodeId, startedAt, "Cancel needs a transferId");
    }

    const bool signalled = transfers_.CancelTransfer(*transferId);
    const nlohmann::json body = {
        {"transferId", transferId->ToString()},
        {"cancelled", signalled}
    };
    return CommandResult::Success(command.commandId, nodeId, startedAt, body.dump(), command.correlationId);
}

void CommandDispatcher::Report(const CommandResult& result) {
    if (!reportResult_) {
        return;
    }
    if (!reportResult_(result)) {
        std::cerr << "[Agent] Failed to report result for command " << result.commandId.ToString() << std::endl;
    }
}

bool CommandDispatcher::RememberCommand(const Uuid& commandId) {
    if (!seenCommands_.insert(commandId).second) {
        return false;
    }
    seenOrder_.push_back(commandId);
    if (seenOrder_.size() > kRememberedCommandIds) {
        seenCommands_.erase(seenOrder_.front());
        seenOrder_.pop_front();
    }
    return true;
}

void CommandDispatcher::ReapFinishedWorkers() {
    for (auto it = workers_.begin(); it != workers_.end();) {
        if ((*it)->finished) {
            if ((*it)->thread.joinable()) {
                (*it)->thread.join();
            }
            it = workers_.erase(it);
        } else {
            ++it;
        }
    }
}

Uuid CommandDispatcher::ResultNodeId(const CommandEnvelope& command) const {
    if (nodeId_ && !nodeId_->IsNil()) {
        return *nodeId_;
    }
    return command.nodeId;
}
