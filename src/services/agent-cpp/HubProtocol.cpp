#include "HubProtocol.hpp"

#include "JsonUtils.hpp"

#include <stdexcept>

namespace {
std::string Frame(const nlohmann::json& message) {
    std::string text = message.dump();
    text.push_back(kRecordSeparator);
    return text;
}

// Missing members and members of the wrong type both read as empty.
std::string StringMember(const nlohmann::json& object, const char* name) {
    const auto it = object.find(name);
    return it != object.end() && it->is_string() ? it->get<std::string>() : std::string();
}

std::optional<HubMessage> DecodeOne(const std::string& text) {
    const nlohmann::json parsed = ParseJsonWithDepthLimit(text);
    if (parsed.is_discarded() || !parsed.is_object()) {
        return std::nullopt;
    }

    const auto typeIt = parsed.find("type");
    if (typeIt == parsed.end() || !typeIt->is_number_integer()) {
        return std::nullopt;
    }

    HubMessage message;
    const int type = typeIt->get<int>();
    switch (type) {
    case 1: {
        message.type = HubMessageType::Invocation;
        message.target = StringMember(parsed, "target");
        if (message.target.empty()) {
            return std::nullopt;
        }
        message.invocationId = StringMember(parsed, "invocationId");
        const auto args = parsed.find("arguments");
        if (args != parsed.end() && args->is_array()) {
            message.arguments = *args;
        }
        return message;
    }
    case 3: {
        message.type = HubMessageType::Completion;
        message.invocationId = StringMember(parsed, "invocationId");
        if (message.invocationId.empty()) {
            return std::nullopt;
        }
        const auto error = parsed.find("error");
        if (error != parsed.end() && error->is_string()) {
            message.error = error->get<std::string>();
        }
        const auto result = parsed.find("result");
        if (result != parsed.end()) {
            message.result = *result;
        }
        return message;
    }
    case 6:
        message.type = HubMessageType::Ping;
        return message;
    case 7: {
        message.type = HubMessageType::Close;
        const auto error = parsed.find("error");
        if (error != parsed.end() && error->is_string()) {
            message.error = error->get<std::string>();
        }
        const auto allowReconnect = parsed.find("allowReconnect");
        message.allowReconnect = allowReconnect != parsed.end() && allowReconnect->is_boolean() && allowReconnect->get<bool>();
        return message;
    }
    default:
        // Streaming messages are never requested by the agent.
        return std::nullopt;
    }
}
} // namespace

std::string EncodeHandshakeRequest() {
    return Frame({{"protocol", "json"}, {"version", 1}});
}

std::optional<std::string> ParseHandshakeResponse(const std::string& frame) {
    const auto end = frame.find(kRecordSeparator);
    if (end == std::string::npos) {
        throw std::runtime_error("Handshake response is not terminated");
    }

    const nlohmann::json parsed = ParseJsonWithDepthLimit(frame.substr(0, end));
    if (parsed.is_discarded() || !parsed.is_object()) {
        throw std::runtime_error("Handshake response is not a JSON object");
    }

    const auto error = parsed.find("error");
    if (error != parsed.end() && error->is_string()) {
        return error->get<std::string>();
    }
    return std::nullopt;
}

std::string EncodeInvocation(const std::string& invocationId, const std::string& target, const nlohmann::json& arguments) {
    nlohmann::json message = {
        {"type", static_cast<int>(HubMessageType::Invocation)},
        {"target", target},
        {"arguments", arguments.is_array() ? arguments : nlohmann::json::array({arguments})}
    };
    if (!invocationId.empty()) {
        message["invocationId"] = invocationId;
    }
    return Frame(message);
}

std::string EncodePing() {
    return Frame({{"type", static_cast<int>(HubMessageType::Ping)}});
}

std::string EncodeClose(const std::optional<std::string>& error) {
    nlohmann::json message = {{"type", static_cast<int>(HubMessageType::Close)}};
    if (error) {
        message["error"] = *error;
    }
    return Frame(message);
}

std::vector<HubMessage> DecodeMessages(const std::string& frame, int* skipped) {
    std::vector<HubMessage> messages;
    int dropped = 0;

    size_t start = 0;
    while (start < frame.size()) {
        const auto end = frame.find(kRecordSeparator, start);
        if (end == std::string::npos) {
            // A trailing fragment without a separator is incomplete.
            ++dropped;
            break;
        }

        if (end > start) {
            auto message = DecodeOne(frame.substr(start, end - start));
            if (message) {
                messages.push_back(std::move(*message));
            } else {
                ++dropped;
            }
        }
        start = end + 1;
    }

    if (skipped != nullptr) {
        *skipped = dropped;
    }
    return messages;
}
