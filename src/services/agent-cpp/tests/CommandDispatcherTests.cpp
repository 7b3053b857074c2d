#include "CommandDispatcher.hpp"
#include "ErrorCodes.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <future>
#include <iostream>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <system_error>
#include <thread>
#include <unistd.h>
#include <vector>

namespace {
namespace fs = std::filesystem;

int Fail(const std::string& message) {
    std::cerr << message << std::endl;
    return 1;
}

const Uuid kNode = *Uuid::Parse("6f1c2a4e-9b3d-4c1a-8f5e-2d7b9a0c1e34");

// Serves "abc", or holds the request open until cancelled when `hold` is set.
class StubHttpClient : public FileHttpClient {
public:
    StubHttpClient(bool hold, std::promise<void>* entered)
        : hold_(hold), entered_(entered) {}

    std::string BaseAddress() const override { return "https://files.example"; }

    HttpStreamOutcome GetStreaming(
        const std::string&,
        const std::map<std::string, std::string>&,
        HeadHandler onHead,
        BodyHandler onBody,
        const CancellationToken& token) override {
        HttpStreamOutcome outcome;
        outcome.statusCode = 200;
        onHead(HttpResponseHead{200, std::optional<uint64_t>(3)});
        if (hold_) {
            entered_->set_value();
            token.WaitFor(std::chrono::seconds(10));
            outcome.aborted = true;
            return outcome;
        }
        outcome.aborted = !onBody("abc", 3);
        return outcome;
    }

    HttpResponse PostStreaming(
        const std::string&,
        const std::map<std::string, std::string>&,
        const std::map<std::string, std::string>&,
        uint64_t,
        BodySource,
        const CancellationToken&) override {
        HttpResponse response;
        response.statusCode = 500;
        return response;
    }

private:
    bool hold_;
    std::promise<void>* entered_;
};

class ResultCollector {
public:
    bool Add(const CommandResult& result) {
        std::lock_guard<std::mutex> lock(mutex_);
        results_.push_back(result);
        changed_.notify_all();
        return true;
    }

    bool WaitForCount(std::size_t count) {
        std::unique_lock<std::mutex> lock(mutex_);
        return changed_.wait_for(lock, std::chrono::seconds(10), [&] { return results_.size() >= count; });
    }

    std::vector<CommandResult> Results() {
        std::lock_guard<std::mutex> lock(mutex_);
        return results_;
    }

private:
    std::mutex mutex_;
    std::condition_variable changed_;
    std::vector<CommandResult> results_;
};

CommandEnvelope Command(const std::string& type, const nlohmann::json& payload) {
    CommandEnvelope command;
    command.commandId = Uuid::Generate();
    command.commandType = type;
    command.nodeId = kNode;
    command.payloadJson = payload.dump();
    command.correlationId = "corr-1";
    return command;
}
} // namespace

int main() {
    const fs::path root = fs::temp_directory_path() / ("fleetlink-dispatcher-tests-" + std::to_string(::getpid()));
    fs::create_directories(root);

    FileOptions files;
    files.tempDirectory = root.string();
    ProcessOptions process;
    process.serverBasePath = (root / "servers").string();

    bool hold = false;
    std::promise<void> entered;
    AgentMetrics metrics;
    FileTransferService transfers(
        files,
        process,
        [&](const std::string&) -> std::unique_ptr<FileHttpClient> {
            return std::make_unique<StubHttpClient>(hold, &entered);
        },
        metrics);

    ResultCollector collector;
    CommandDispatcher dispatcher(
        transfers, [&collector](const CommandResult& result) { return collector.Add(result); }, std::nullopt);
    const CancellationToken none;

    const auto unsupported = dispatcher.Execute(Command("server.start", nlohmann::json::object()), none);
    if (unsupported.status != CommandResultStatus::Rejected
        || unsupported.errorCode != std::optional<std::string>(CommandDispatcher::kUnsupportedCommandCode)
        || unsupported.nodeId != kNode || unsupported.correlationId != std::optional<std::string>("corr-1")) {
        return Fail("Unsupported commands must be rejected with the envelope's node and correlation id.");
    }

    const auto invalid = dispatcher.Execute(Command("file.download", {{"sourceUrl", "https://files.example/a"}}), none);
    if (invalid.status != CommandResultStatus::Failed
        || invalid.errorCode != std::optional<std::string>(CommandDispatcher::kInvalidPayloadCode)) {
        return Fail("A download without a destination is an invalid payload.");
    }
    CommandEnvelope notJson = Command("file.upload", nlohmann::json::object());
    notJson.payloadJson = "[1,2";
    if (dispatcher.Execute(notJson, none).errorCode != std::optional<std::string>(CommandDispatcher::kInvalidPayloadCode)) {
        return Fail("Unparseable payloads are invalid.");
    }

    CommandEnvelope download = Command(
        "File.Download", {{"url", "https://files.example/a"}, {"destinationPath", (root / "a.bin").string()}});
    const auto downloaded = dispatcher.Execute(download, none);
    if (downloaded.status != CommandResultStatus::Succeeded || !downloaded.resultJson) {
        return Fail("Download command failed: " + downloaded.errorMessage.value_or(""));
    }
    const auto body = nlohmann::json::parse(*downloaded.resultJson);
    if (body["transferId"] != download.commandId.ToString() || body["fileSizeBytes"] != 3
        || body["fileHash"] != "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad") {
        return Fail("Unexpected download result: " + *downloaded.resultJson);
    }

    const auto escaped = dispatcher.Execute(
        Command("file.download", {{"url", "https://files.example/a"}, {"destinationPath", "/etc/passwd"}}), none);
    if (escaped.status != CommandResultStatus::Failed || escaped.errorCode != std::optional<std::string>(ErrorCodes::kPathNotAllowed)) {
        return Fail("Transfer errors must surface their code.");
    }

    const Uuid unknown = Uuid::Generate();
    const auto cancelUnknown = dispatcher.Execute(Command("file.cancel", {{"transferId", unknown.ToString()}}), none);
    if (cancelUnknown.status != CommandResultStatus::Succeeded
        || nlohmann::json::parse(*cancelUnknown.resultJson)["cancelled"] != false) {
        return Fail("Cancelling an unknown transfer reports cancelled=false.");
    }
    if (dispatcher.Execute(Command("file.cancel", nlohmann::json::object()), none).errorCode
        != std::optional<std::string>(CommandDispatcher::kInvalidPayloadCode)) {
        return Fail("Cancel without a transferId is invalid.");
    }

    CommandEnvelope queued = Command(
        "file.download", {{"sourceUrl", "https://files.example/b"}, {"destinationPath", (root / "b.bin").string()}});
    dispatcher.Dispatch(queued);
    dispatcher.Dispatch(queued);
    if (!collector.WaitForCount(1)) {
        return Fail("Dispatched command never reported.");
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    if (collector.Results().size() != 1 || collector.Results()[0].commandId != queued.commandId) {
        return Fail("A repeated command id must run once.");
    }

    CommandEnvelope anonymous = Command(
        "file.download", {{"sourceUrl", "https://files.example/d"}, {"destinationPath", (root / "d.bin").string()}});
    anonymous.nodeId = Uuid();
    dispatcher.Dispatch(anonymous);
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    if (collector.Results().size() != 1 || fs::exists(root / "d.bin")) {
        return Fail("A command with no node id to report against must not run.");
    }

    hold = true;
    CommandEnvelope held = Command(
        "file.download", {{"sourceUrl", "https://files.example/c"}, {"destinationPath", (root / "c.bin").string()}});
    dispatcher.Dispatch(held);
    if (entered.get_future().wait_for(std::chrono::seconds(10)) != std::future_status::ready) {
        return Fail("Held download never started.");
    }
    dispatcher.Shutdown();
    const auto results = collector.Results();
    if (results.size() != 2 || results[1].status != CommandResultStatus::Cancelled) {
        return Fail("Shutdown must cancel running commands and report them as Cancelled.");
    }
    if (fs::exists(root / "c.bin")) {
        return Fail("A cancelled download must not leave a partial file.");
    }

    std::error_code cleanup;
    fs::remove_all(root, cleanup);
    return 0;
}
