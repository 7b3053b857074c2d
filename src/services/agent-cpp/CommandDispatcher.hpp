#pragma once

#include "CancellationToken.hpp"
#include "CommandEnvelope.hpp"
#include "ControlPlaneMessages.hpp"
#include "FileTransferService.hpp"
#include "Uuid.hpp"

#include <atomic>
#include <deque>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>

// Runs accepted commands off the connection thread and reports one CommandResult per command.
// Only the file.* commands are executed here; every other type is answered with Rejected.
class CommandDispatcher {
public:
    // Returns false when the result could not be delivered.
    using ResultSink = std::function<bool(const CommandResult&)>;

    static constexpr const char* kUnsupportedCommandCode = "UnsupportedCommand";
    static constexpr const char* kInvalidPayloadCode = "InvalidPayload";
    static constexpr std::size_t kRememberedCommandIds = 1024;

    CommandDispatcher(FileTransferService& transfers, ResultSink reportResult, std::optional<Uuid> nodeId);
    ~CommandDispatcher();

    CommandDispatcher(const CommandDispatcher&) = delete;
    CommandDispatcher& operator=(const CommandDispatcher&) = delete;

    // Queues the command on a worker thread. Repeated command ids are ignored.
    void Dispatch(const CommandEnvelope& command);
    // Cancels running commands and joins their workers.
    void Shutdown();

    CommandResult Execute(const CommandEnvelope& command, const CancellationToken& token);

private:
    struct Worker {
        std::thread thread;
        std::atomic<bool> finished{false};
    };

    CommandResult RunDownload(const CommandEnvelope& command, const CancellationToken& token);
    CommandResult RunUpload(const CommandEnvelope& command, const CancellationToken& token);
    CommandResult RunCancel(const CommandEnvelope& command);

    void Report(const CommandResult& result);
    bool RememberCommand(const Uuid& commandId);
    void ReapFinishedWorkers();
    Uuid ResultNodeId(const CommandEnvelope& command) const;

    FileTransferService& transfers_;
    ResultSink reportResult_;
    std::optional<Uuid> nodeId_;
    CancellationSource shutdown_;

    std::mutex mutex_;
    bool stopping_ = false;
    std::list<std::unique_ptr<Worker>> workers_;
    std::set<Uuid> seenCommands_;
    std::deque<Uuid> seenOrder_;
};
