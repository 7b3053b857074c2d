#include "CommandEnvelope.hpp"

#include "JsonUtils.hpp"
#include "TimeUtils.hpp"

#include <algorithm>
#include <cctype>

namespace {
std::string ToLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return value;
}

// Absent and null are both "not set"; anything else must be a well-formed UUID string.
bool ReadOptionalUuid(const nlohmann::json& object, const std::string& name, std::optional<Uuid>& out) {
    const nlohmann::json* member = FindMemberIgnoreCase(object, name);
    if (member == nullptr || member->is_null()) {
        out.reset();
        return true;
    }
    if (!member->is_string()) {
        return false;
    }
    out = Uuid::Parse(member->get<std::string>());
    return out.has_value();
}

bool ReadOptionalTimestamp(
    const nlohmann::json& object,
    const std::string& name,
    std::optional<std::chrono::system_clock::time_point>& out) {
    const nlohmann::json* member = FindMemberIgnoreCase(object, name);
    if (member == nullptr || member->is_null()) {
        out.reset();
        return true;
    }
    if (!member->is_string()) {
        return false;
    }
    out = ParseIso8601(member->get<std::string>());
    return out.has_value();
}

bool ReadOptionalBoundedString(
    const nlohmann::json& object,
    const std::string& name,
    std::size_t maxLength,
    std::optional<std::string>& out) {
    const nlohmann::json* member = FindMemberIgnoreCase(object, name);
    if (member == nullptr || member->is_null()) {
        out.reset();
        return true;
    }
    if (!member->is_string()) {
        return false;
    }
    std::string value = member->get<std::string>();
    if (value.size() > maxLength) {
        return false;
    }
    out = std::move(value);
    return true;
}

bool ReadPriority(const nlohmann::json& object, CommandPriority& out) {
    const nlohmann::json* member = FindMemberIgnoreCase(object, "priority");
    if (member == nullptr || member->is_null()) {
        out = CommandPriority::Normal;
        return true;
    }

    if (member->is_number_integer()) {
        const auto value = member->get<long long>();
        if (value < 0 || value > 3) {
            return false;
        }
        out = static_cast<CommandPriority>(value);
        return true;
    }

    if (member->is_string()) {
        const std::string value = ToLower(member->get<std::string>());
        if (value == "low") {
            out = CommandPriority::Low;
        } else if (value == "normal") {
            out = CommandPriority::Normal;
        } else if (value == "high") {
            out = CommandPriority::High;
        } else if (value == "critical") {
            out = CommandPriority::Critical;
        } else {
            return false;
        }
        return true;
    }

    return false;
}
} // namespace

const char* ToString(CommandPriority priority) {
    switch (priority) {
    case CommandPriority::Low:
        return "Low";
    case CommandPriority::Normal:
        return "Normal";
    case CommandPriority::High:
        return "High";
    case CommandPriority::Critical:
        return "Critical";
    }
    return "Normal";
}

std::optional<CommandEnvelope> ParseCommandEnvelope(const std::string& json) {
    const nlohmann::json parsed = ParseJsonWithDepthLimit(json);
    if (parsed.is_discarded() || !parsed.is_object()) {
        return std::nullopt;
    }

    CommandEnvelope envelope;

    std::optional<Uuid> commandId;
    if (!ReadOptionalUuid(parsed, "commandId", commandId) || !commandId || commandId->IsNil()) {
        return std::nullopt;
    }
    envelope.commandId = *commandId;

    const auto commandType = GetStringIgnoreCase(parsed, "commandType");
    if (!commandType || commandType->empty() || commandType->size() > CommandEnvelope::kMaxCommandTypeLength) {
        return std::nullopt;
    }
    envelope.commandType = *commandType;

    // Results are addressed by node id, so it is required. A missing tenant parses as nil so the
    // organization check rejects it instead of skipping.
    std::optional<Uuid> nodeId;
    std::optional<Uuid> organizationId;
    if (!ReadOptionalUuid(parsed, "nodeId", nodeId) || !nodeId || nodeId->IsNil()
        || !ReadOptionalUuid(parsed, "organizationId", organizationId)) {
        return std::nullopt;
    }
    envelope.nodeId = *nodeId;
    envelope.organizationId = organizationId.value_or(Uuid());

    if (!ReadOptionalUuid(parsed, "initiatedByUserId", envelope.initiatedByUserId)
        || !ReadOptionalTimestamp(parsed, "issuedAt", envelope.issuedAt)
        || !ReadOptionalTimestamp(parsed, "expiresAt", envelope.expiresAt)
        || !ReadOptionalBoundedString(parsed, "signature", CommandEnvelope::kMaxSignatureLength, envelope.signature)
        || !ReadOptionalBoundedString(
            parsed, "correlationId", CommandEnvelope::kMaxCorrelationIdLength, envelope.correlationId)
        || !ReadPriority(parsed, envelope.priority)) {
        return std::nullopt;
    }

    const nlohmann::json* payload = FindMemberIgnoreCase(parsed, "payloadJson");
    if (payload == nullptr) {
        payload = FindMemberIgnoreCase(parsed, "payload");
    }
    if (payload != nullptr && !payload->is_null()) {
        envelope.payloadJson = payload->is_string() ? payload->get<std::string>() : payload->dump();
    }

    return envelope;
}
