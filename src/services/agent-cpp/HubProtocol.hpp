#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

// JSON hub protocol: every message is a JSON object terminated by the ASCII record separator.
constexpr char kRecordSeparator = '\x1e';

enum class HubMessageType {
    Invocation = 1,
    StreamItem = 2,
    Completion = 3,
    StreamInvocation = 4,
    CancelInvocation = 5,
    Ping = 6,
    Close = 7
};

struct HubMessage {
    HubMessageType type = HubMessageType::Ping;
    std::string invocationId;
    std::string target;
    nlohmann::json arguments = nlohmann::json::array();
    nlohmann::json result;
    std::optional<std::string> error;
    bool allowReconnect = false;
};

std::string EncodeHandshakeRequest();
// Returns the server's error text, or nullopt when the handshake was accepted.
// Throws std::runtime_error when the response is not a handshake response at all.
std::optional<std::string> ParseHandshakeResponse(const std::string& frame);

std::string EncodeInvocation(const std::string& invocationId, const std::string& target, const nlohmann::json& arguments);
std::string EncodePing();
std::string EncodeClose(const std::optional<std::string>& error = std::nullopt);

// Splits a received frame into messages. Malformed or unknown entries are skipped and counted
// in `skipped` when provided.
std::vector<HubMessage> DecodeMessages(const std::string& frame, int* skipped = nullptr);
