#include "ErrorCodes.hpp"
#include "FileTransferService.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <future>
#include <iostream>
#include <iterator>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <system_error>
#include <thread>
#include <unistd.h>
#include <utility>
#include <vector>

namespace {
namespace fs = std::filesystem;

int Fail(const std::string& message) {
    std::cerr << message << std::endl;
    return 1;
}

const std::string kAbcSha256 = "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad";

// Behavior shared by every client the factory creates.
struct Script {
    std::string baseAddress = "https://files.example";
    std::function<HttpStreamOutcome(
        const std::string&, FileHttpClient::HeadHandler, FileHttpClient::BodyHandler, const CancellationToken&)> get;
    std::function<HttpResponse(const std::map<std::string, std::string>&, uint64_t, FileHttpClient::BodySource)> post;
    std::string lastUrl;
    std::string lastPostPath;
    std::map<std::string, std::string> lastHeaders;
    std::string uploadedBody;
};

class FakeHttpClient : public FileHttpClient {
public:
    explicit FakeHttpClient(Script& script)
        : script_(script) {}

    std::string BaseAddress() const override { return script_.baseAddress; }

    HttpStreamOutcome GetStreaming(
        const std::string& url,
        const std::map<std::string, std::string>& headers,
        HeadHandler onHead,
        BodyHandler onBody,
        const CancellationToken& token) override {
        script_.lastUrl = url;
        script_.lastHeaders = headers;
        return script_.get(url, std::move(onHead), std::move(onBody), token);
    }

    HttpResponse PostStreaming(
        const std::string& relativeUrl,
        const std::map<std::string, std::string>& query,
        const std::map<std::string, std::string>& headers,
        uint64_t contentLength,
        BodySource source,
        const CancellationToken&) override {
        script_.lastPostPath = relativeUrl;
        script_.lastHeaders = headers;
        return script_.post(query, contentLength, std::move(source));
    }

private:
    Script& script_;
};

FileHttpClientFactory FactoryFor(Script& script) {
    return [&script](const std::string& profile) -> std::unique_ptr<FileHttpClient> {
        if (profile != FileTransferService::kHttpClientProfile) {
            return nullptr;
        }
        return std::make_unique<FakeHttpClient>(script);
    };
}

// Serves `body` in two slices after a 200 head.
void ServeBody(Script& script, std::string body, std::optional<uint64_t> contentLength = std::nullopt) {
    script.get = [body = std::move(body), contentLength](
                     const std::string&, FileHttpClient::HeadHandler onHead, FileHttpClient::BodyHandler onBody,
                     const CancellationToken&) {
        HttpStreamOutcome outcome;
        outcome.statusCode = 200;
        if (!onHead(HttpResponseHead{200, contentLength ? contentLength : std::optional<uint64_t>(body.size())})) {
            outcome.aborted = true;
            return outcome;
        }
        const std::size_t half = body.size() / 2;
        if (!onBody(body.data(), half) || !onBody(body.data() + half, body.size() - half)) {
            outcome.aborted = true;
        }
        return outcome;
    };
}

// Sends the head, then holds the request open until the transfer is cancelled.
void HoldOpen(Script& script, std::promise<void>& entered) {
    script.get = [&entered](const std::string&, FileHttpClient::HeadHandler onHead, FileHttpClient::BodyHandler onBody,
                      const CancellationToken& token) {
        HttpStreamOutcome outcome;
        outcome.statusCode = 200;
        onHead(HttpResponseHead{200, std::optional<uint64_t>(6)});
        onBody("abc", 3);
        entered.set_value();
        token.WaitFor(std::chrono::seconds(10));
        outcome.aborted = true;
        return outcome;
    };
}

struct Fixture {
    explicit Fixture(const std::string& name, std::size_t maxConcurrent = 4) {
        root = fs::temp_directory_path() / ("fleetlink-transfer-tests-" + std::to_string(::getpid()) + "-" + name);
        fs::create_directories(root / "tmp");
        fs::create_directories(root / "servers");
        files.tempDirectory = (root / "tmp").string();
        files.transferChunkSizeBytes = 2;
        files.maxFileSizeBytes = 16;
        files.maxConcurrentTransfers = maxConcurrent;
        process.serverBasePath = (root / "servers").string();
        service = std::make_unique<FileTransferService>(files, process, FactoryFor(script), metrics);
    }

    ~Fixture() {
        service.reset();
        std::error_code ec;
        fs::remove_all(root, ec);
    }

    std::string Path(const std::string& relative) const {
        return (root / relative).string();
    }

    fs::path root;
    FileOptions files;
    ProcessOptions process;
    Script script;
    AgentMetrics metrics;
    std::unique_ptr<FileTransferService> service;
};

FileDownloadRequest DownloadTo(const std::string& destination) {
    FileDownloadRequest request;
    request.sourceUrl = "https://files.example/blob";
    request.destinationPath = destination;
    return request;
}
} // namespace

int main() {
    {
        Fixture fixture("download");
        ServeBody(fixture.script, "abc");
        std::vector<uint64_t> reported;
        FileDownloadRequest request = DownloadTo(fixture.Path("servers/world/data.bin"));
        request.expectedHash = "BA7816BF8F01CFEA414140DE5DAE2223B00361A396177A9CB410FF61F20015AD";

        const auto result = fixture.service->Download(request, [&reported](const FileTransferProgress& progress) {
            reported.push_back(progress.bytesTransferred);
        });
        if (!result.IsSuccess()) {
            return Fail("Download failed: " + result.GetError().ToString());
        }
        if (result.Value().fileHash != kAbcSha256 || result.Value().fileSizeBytes != 3 || result.Value().usedPeerToPeer) {
            return Fail("Unexpected download result.");
        }
        if (reported != std::vector<uint64_t>{2, 3}) {
            return Fail("Progress must be reported once per written chunk.");
        }
        if (fixture.script.lastHeaders.count("traceparent") == 0) {
            return Fail("Downloads must carry a traceparent header.");
        }
        std::ifstream written(fixture.Path("servers/world/data.bin"));
        const std::string content((std::istreambuf_iterator<char>(written)), std::istreambuf_iterator<char>());
        if (content != "abc") {
            return Fail("Downloaded content differs: " + content);
        }
        if (fixture.metrics.FilesTransferred("download") != 1 || fixture.metrics.BytesTransferred("download") != 3) {
            return Fail("Download metrics not recorded.");
        }
        if (fixture.service->GetTransferStatus(request.transferId) || !fixture.service->GetActiveTransfers().empty()) {
            return Fail("Finished transfers must leave the registry.");
        }
    }

    {
        Fixture fixture("mismatch");
        ServeBody(fixture.script, "abc");
        FileDownloadRequest request = DownloadTo(fixture.Path("tmp/data.bin"));
        request.expectedHash = std::string(64, '0');
        const auto result = fixture.service->Download(request);
        if (result.IsSuccess() || result.GetError().code != ErrorCodes::kFileHashMismatch) {
            return Fail("A hash mismatch must fail with File.HashMismatch.");
        }
        if (fs::exists(fixture.Path("tmp/data.bin"))) {
            return Fail("A file that failed verification must be removed.");
        }
    }

    {
        Fixture fixture("toolarge");
        fixture.script.get = [](const std::string&, FileHttpClient::HeadHandler onHead, FileHttpClient::BodyHandler onBody,
                                 const CancellationToken&) {
            HttpStreamOutcome outcome;
            outcome.statusCode = 200;
            onHead(HttpResponseHead{200, std::nullopt});
            const std::string slice(10, 'x');
            outcome.aborted = !onBody(slice.data(), slice.size()) || !onBody(slice.data(), slice.size());
            return outcome;
        };
        const auto result = fixture.service->Download(DownloadTo(fixture.Path("tmp/big.bin")));
        if (result.IsSuccess() || result.GetError().code != ErrorCodes::kFileTooLarge) {
            return Fail("A body beyond the size limit must fail with File.TooLarge.");
        }
        if (fs::exists(fixture.Path("tmp/big.bin"))) {
            return Fail("An oversized download must not leave a partial file.");
        }

        ServeBody(fixture.script, "abc", std::optional<uint64_t>(1000));
        const auto declared = fixture.service->Download(DownloadTo(fixture.Path("tmp/declared.bin")));
        if (declared.IsSuccess() || declared.GetError().code != ErrorCodes::kFileTooLarge) {
            return Fail("A declared length beyond the limit must fail before the body is read.");
        }

        FileDownloadRequest expected = DownloadTo(fixture.Path("tmp/expected.bin"));
        expected.expectedSizeBytes = 17;
        if (fixture.service->Download(expected).GetError().code != ErrorCodes::kFileTooLarge) {
            return Fail("An expected size beyond the limit must be refused up front.");
        }
    }

    {
        Fixture fixture("validation");
        ServeBody(fixture.script, "abc");
        FileDownloadRequest plain = DownloadTo(fixture.Path("tmp/a.bin"));
        plain.sourceUrl = "http://files.example/blob";
        if (fixture.service->Download(plain).GetError().code != ErrorCodes::kTransferInsecureTransport) {
            return Fail("Plain http sources must be refused.");
        }

        fixture.script.baseAddress = "";
        FileDownloadRequest relative = DownloadTo(fixture.Path("tmp/a.bin"));
        relative.sourceUrl = "/files/blob";
        if (fixture.service->Download(relative).GetError().code != ErrorCodes::kTransferInvalidRequest) {
            return Fail("A relative source needs a base address.");
        }
        fixture.script.baseAddress = "https://files.example";

        const auto escaped = fixture.service->Download(DownloadTo(fixture.Path("tmp/../../escape.bin")));
        if (escaped.GetError().code != ErrorCodes::kPathUnsafe) {
            return Fail("Traversal in the destination must be refused: " + escaped.GetError().ToString());
        }
        if (fixture.service->Download(DownloadTo("/etc/fleetlink.bin")).GetError().code != ErrorCodes::kPathNotAllowed) {
            return Fail("Destinations outside the allowed roots must be refused.");
        }

        FileDownloadRequest empty;
        if (fixture.service->Download(empty).GetError().code != ErrorCodes::kTransferInvalidRequest) {
            return Fail("An empty request must be refused.");
        }

        fixture.script.get = [](const std::string&, FileHttpClient::HeadHandler onHead, FileHttpClient::BodyHandler,
                                 const CancellationToken&) {
            HttpStreamOutcome outcome;
            outcome.statusCode = 404;
            outcome.aborted = !onHead(HttpResponseHead{404, std::nullopt});
            return outcome;
        };
        const auto notFound = fixture.service->Download(DownloadTo(fixture.Path("tmp/missing.bin")));
        if (notFound.GetError().code != ErrorCodes::kTransferFailed || notFound.GetError().message.find("404") != std::string::npos) {
            return Fail("HTTP failures map to a sanitized Transfer.Failed.");
        }
        if (fs::exists(fixture.Path("tmp/missing.bin"))) {
            return Fail("A failed download must not leave a file behind.");
        }
    }

    {
        Fixture fixture("limit", 1);
        std::promise<void> entered;
        HoldOpen(fixture.script, entered);
        FileDownloadRequest first = DownloadTo(fixture.Path("tmp/held.bin"));
        auto pending = std::async(std::launch::async, [&] { return fixture.service->Download(first); });
        if (entered.get_future().wait_for(std::chrono::seconds(10)) != std::future_status::ready) {
            return Fail("The held download never started.");
        }

        const auto status = fixture.service->GetTransferStatus(first.transferId);
        if (!status || status->state != FileTransferState::Transferring || !status->progress
            || status->progress->bytesTransferred != 2) {
            return Fail("An active download must report Transferring with progress.");
        }
        if (fixture.service->GetActiveTransfers().size() != 1) {
            return Fail("Exactly one transfer is active.");
        }

        const auto rejected = fixture.service->Download(DownloadTo(fixture.Path("tmp/second.bin")));
        if (rejected.GetError().code != ErrorCodes::kTransferLimitReached) {
            return Fail("A download over the limit must be refused: " + rejected.GetError().ToString());
        }
        if (fs::exists(fixture.Path("tmp/second.bin"))) {
            return Fail("A refused download must not touch the destination.");
        }
        if (fixture.service->GetActiveTransfers().size() != 1 || !fixture.service->GetTransferStatus(first.transferId)) {
            return Fail("A refused download must leave the active set unchanged.");
        }

        if (!fixture.service->CancelTransfer(first.transferId)) {
            return Fail("Cancelling an active transfer must succeed.");
        }
        const auto cancelled = pending.get();
        if (cancelled.GetError().code != ErrorCodes::kTransferCancelled) {
            return Fail("A cancelled download must report Transfer.Cancelled: " + cancelled.GetError().ToString());
        }
        if (fs::exists(fixture.Path("tmp/held.bin"))) {
            return Fail("A cancelled download must not leave a partial file.");
        }
        if (fixture.service->CancelTransfer(first.transferId)) {
            return Fail("A finished transfer can no longer be cancelled.");
        }
    }

    {
        Fixture fixture("duplicate", 2);
        std::promise<void> entered;
        HoldOpen(fixture.script, entered);
        FileDownloadRequest first = DownloadTo(fixture.Path("tmp/held.bin"));
        CancellationSource caller;
        auto pending = std::async(std::launch::async, [&] {
            return fixture.service->Download(first, ProgressSink(), caller.Token());
        });
        if (entered.get_future().wait_for(std::chrono::seconds(10)) != std::future_status::ready) {
            return Fail("The held download never started.");
        }

        FileDownloadRequest again = DownloadTo(fixture.Path("tmp/other.bin"));
        again.transferId = first.transferId;
        if (fixture.service->Download(again).GetError().code != ErrorCodes::kTransferDuplicate) {
            return Fail("A second transfer with an active id must be refused.");
        }

        caller.Cancel();
        if (pending.get().GetError().code != ErrorCodes::kTransferCancelled) {
            return Fail("The caller's token must cancel the transfer.");
        }
    }

    {
        Fixture fixture("race");
        std::promise<void> entered;
        HoldOpen(fixture.script, entered);
        const Uuid sharedId = Uuid::Generate();
        std::promise<void> start;
        std::shared_future<void> go = start.get_future().share();
        auto launch = [&](const std::string& destination) {
            return std::async(std::launch::async, [&fixture, go, sharedId, destination] {
                FileDownloadRequest request = DownloadTo(destination);
                request.transferId = sharedId;
                go.wait();
                return fixture.service->Download(request);
            });
        };
        auto left = launch(fixture.Path("tmp/left.bin"));
        auto right = launch(fixture.Path("tmp/right.bin"));
        start.set_value();

        if (entered.get_future().wait_for(std::chrono::seconds(10)) != std::future_status::ready) {
            return Fail("Neither racing download was admitted.");
        }
        const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
        while (left.wait_for(std::chrono::milliseconds(10)) != std::future_status::ready
               && right.wait_for(std::chrono::milliseconds(10)) != std::future_status::ready) {
            if (std::chrono::steady_clock::now() > deadline) {
                return Fail("The losing download was never refused.");
            }
        }
        if (fixture.service->GetActiveTransfers().size() != 1) {
            return Fail("Only one of two racing downloads may be active.");
        }

        if (!fixture.service->CancelTransfer(sharedId)) {
            return Fail("The admitted download must be cancellable.");
        }
        const auto leftResult = left.get();
        const auto rightResult = right.get();
        const int duplicates = (leftResult.GetError().code == ErrorCodes::kTransferDuplicate ? 1 : 0)
            + (rightResult.GetError().code == ErrorCodes::kTransferDuplicate ? 1 : 0);
        const int cancelled = (leftResult.GetError().code == ErrorCodes::kTransferCancelled ? 1 : 0)
            + (rightResult.GetError().code == ErrorCodes::kTransferCancelled ? 1 : 0);
        if (duplicates != 1 || cancelled != 1) {
            return Fail("Exactly one of two racing downloads with the same id must be admitted.");
        }
    }

    {
        Fixture fixture("upload");
        {
            std::ofstream source(fixture.Path("servers/world.zip"), std::ios::binary);
            source << "abc";
        }
        std::map<std::string, std::string> sentQuery;
        fixture.script.post = [&fixture, &sentQuery](const std::map<std::string, std::string>& query, uint64_t length,
                                  FileHttpClient::BodySource source) {
            sentQuery = query;
            char buffer[8];
            std::size_t produced = 0;
            while (source(buffer, sizeof(buffer), produced) && produced > 0) {
                fixture.script.uploadedBody.append(buffer, produced);
            }
            HttpResponse response;
            response.statusCode = fixture.script.uploadedBody.size() == length ? 201 : 400;
            response.body = R"({"fileId":"remote-7"})";
            return response;
        };

        FileUploadRequest request;
        request.sourcePath = fixture.Path("servers/world.zip");
        request.destinationId = "backups";
        std::vector<uint64_t> reported;
        const auto result = fixture.service->Upload(request, [&reported](const FileTransferProgress& progress) {
            reported.push_back(progress.bytesTransferred);
        });
        if (!result.IsSuccess()) {
            return Fail("Upload failed: " + result.GetError().ToString());
        }
        if (fixture.script.uploadedBody != "abc" || fixture.script.lastPostPath != FileTransferService::kUploadPath
            || sentQuery["destinationId"] != "backups") {
            return Fail("Upload request not formed as expected.");
        }
        if (result.Value().remoteId != std::optional<std::string>("remote-7") || result.Value().fileHash != kAbcSha256) {
            return Fail("Upload result must carry the remote id and hash.");
        }
        if (reported != std::vector<uint64_t>{2, 3}) {
            return Fail("Upload progress must follow the chunk size.");
        }
        if (fixture.metrics.BytesTransferred("upload") != 3) {
            return Fail("Upload metrics not recorded.");
        }

        FileUploadRequest missing;
        missing.sourcePath = fixture.Path("servers/absent.zip");
        if (fixture.service->Upload(missing).GetError().code != ErrorCodes::kFileNotFound) {
            return Fail("A missing source must fail with File.NotFound.");
        }

        fixture.script.baseAddress = "";
        FileUploadRequest noBase;
        noBase.sourcePath = fixture.Path("servers/world.zip");
        if (fixture.service->Upload(noBase).GetError().code != ErrorCodes::kTransferInvalidRequest) {
            return Fail("Uploads need a base address.");
        }
        fixture.script.baseAddress = "http://files.example";
        if (fixture.service->Upload(noBase).GetError().code != ErrorCodes::kTransferInsecureTransport) {
            return Fail("Uploads need an https base address.");
        }
    }

    return 0;
}
