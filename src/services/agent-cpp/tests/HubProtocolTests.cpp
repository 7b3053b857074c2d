#include "HubProtocol.hpp"

#include <iostream>
#include <stdexcept>
#include <string>

namespace {
int Fail(const std::string& message) {
    std::cerr << message << std::endl;
    return 1;
}

std::string Framed(const std::string& json) {
    return json + kRecordSeparator;
}
} // namespace

int main() {
    const std::string handshake = EncodeHandshakeRequest();
    if (handshake.back() != kRecordSeparator
        || nlohmann::json::parse(handshake.substr(0, handshake.size() - 1))
            != nlohmann::json({{"protocol", "json"}, {"version", 1}})) {
        return Fail("Unexpected handshake request: " + handshake);
    }

    if (ParseHandshakeResponse(Framed("{}"))) {
        return Fail("Empty handshake response means accepted.");
    }
    const auto refused = ParseHandshakeResponse(Framed(R"({"error":"Unsupported protocol"})"));
    if (!refused || *refused != "Unsupported protocol") {
        return Fail("Handshake error not surfaced.");
    }
    bool threw = false;
    try {
        ParseHandshakeResponse("{}");
    } catch (const std::runtime_error&) {
        threw = true;
    }
    if (!threw) {
        return Fail("Unterminated handshake response must throw.");
    }

    const std::string invocation = EncodeInvocation("7", "Heartbeat", nlohmann::json("{\"a\":1}"));
    const auto invocationJson = nlohmann::json::parse(invocation.substr(0, invocation.size() - 1));
    if (invocationJson["type"] != 1 || invocationJson["invocationId"] != "7" || invocationJson["target"] != "Heartbeat"
        || invocationJson["arguments"] != nlohmann::json::array({"{\"a\":1}"})) {
        return Fail("Unexpected invocation: " + invocation);
    }
    const std::string fireAndForget = EncodeInvocation("", "Telemetry", nlohmann::json::array());
    if (fireAndForget.find("invocationId") != std::string::npos) {
        return Fail("Empty invocation id must be omitted.");
    }

    const std::string frame =
        Framed(R"({"type":1,"target":"ReceiveCommand","arguments":["{}"]})")
        + Framed(R"({"type":3,"invocationId":"7","error":"denied"})")
        + Framed(R"({"type":6})")
        + Framed(R"({"type":2,"invocationId":"1","item":1})")
        + Framed(R"({"type":1,"target":42})")
        + Framed("not json")
        + Framed(R"({"type":7,"error":"shutting down","allowReconnect":true})")
        + R"({"type":6)";

    int skipped = 0;
    const auto messages = DecodeMessages(frame, &skipped);
    if (messages.size() != 4) {
        return Fail("Expected four decoded messages, got " + std::to_string(messages.size()));
    }
    if (skipped != 4) {
        return Fail("Expected four skipped entries, got " + std::to_string(skipped));
    }
    if (messages[0].type != HubMessageType::Invocation || messages[0].target != "ReceiveCommand"
        || messages[0].arguments.size() != 1) {
        return Fail("Invocation decoded incorrectly.");
    }
    if (messages[1].type != HubMessageType::Completion || messages[1].invocationId != "7"
        || messages[1].error != std::optional<std::string>("denied")) {
        return Fail("Completion decoded incorrectly.");
    }
    if (messages[2].type != HubMessageType::Ping) {
        return Fail("Ping decoded incorrectly.");
    }
    if (messages[3].type != HubMessageType::Close || !messages[3].allowReconnect
        || messages[3].error != std::optional<std::string>("shutting down")) {
        return Fail("Close decoded incorrectly.");
    }

    const std::string close = EncodeClose(std::string("bye"));
    const auto closeJson = nlohmann::json::parse(close.substr(0, close.size() - 1));
    if (closeJson["type"] != 7 || closeJson["error"] != "bye") {
        return Fail("Unexpected close message: " + close);
    }

    return 0;
}
