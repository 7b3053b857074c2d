#include "CommandValidator.hpp"

#include <array>
#include <utility>

namespace {
constexpr const char* kUnknownCommandType = "Unknown";

constexpr std::array<const char*, 14> kKnownCommandTypes = {
    "file.download",
    "file.upload",
    "file.cancel",
    "process.start",
    "process.stop",
    "process.restart",
    "process.kill",
    "server.install",
    "server.update",
    "server.backup",
    "config.update",
    "agent.update",
    "agent.restart",
    "diagnostics.collect",
};

CommandValidationOutcome Reject(CommandRejection rejection) {
    CommandValidationOutcome outcome;
    outcome.rejection = rejection;
    return outcome;
}
} // namespace

const char* ToString(CommandRejection rejection) {
    switch (rejection) {
    case CommandRejection::None:
        return "None";
    case CommandRejection::PayloadTooLarge:
        return "PayloadTooLarge";
    case CommandRejection::Malformed:
        return "Malformed";
    case CommandRejection::NodeMismatch:
        return "NodeMismatch";
    case CommandRejection::OrganizationMissing:
        return "OrganizationMissing";
    case CommandRejection::OrganizationMismatch:
        return "OrganizationMismatch";
    case CommandRejection::Expired:
        return "Expired";
    }
    return "Unknown";
}

CommandValidator::CommandValidator(std::optional<Uuid> nodeId, std::optional<Uuid> organizationId, Clock clock)
    : nodeId_(std::move(nodeId)),
      organizationId_(std::move(organizationId)),
      clock_(clock ? std::move(clock) : Clock([] { return std::chrono::system_clock::now(); })) {}

CommandValidationOutcome CommandValidator::Validate(const std::string& rawMessage) const {
    // std::string holds the UTF-8 encoding, so size() is already a byte count.
    if (rawMessage.size() > CommandEnvelope::kMaxPayloadBytes) {
        return Reject(CommandRejection::PayloadTooLarge);
    }

    auto envelope = ParseCommandEnvelope(rawMessage);
    if (!envelope) {
        return Reject(CommandRejection::Malformed);
    }

    if (nodeId_ && envelope->nodeId != *nodeId_) {
        return Reject(CommandRejection::NodeMismatch);
    }

    if (organizationId_) {
        if (envelope->organizationId.IsNil()) {
            return Reject(CommandRejection::OrganizationMissing);
        }
        if (envelope->organizationId != *organizationId_) {
            return Reject(CommandRejection::OrganizationMismatch);
        }
    }

    if (envelope->expiresAt && *envelope->expiresAt < clock_()) {
        return Reject(CommandRejection::Expired);
    }

    CommandValidationOutcome outcome;
    outcome.envelope = std::move(envelope);
    return outcome;
}

std::string SanitizeCommandType(const std::string& commandType) {
    if (commandType.empty() || commandType.size() > CommandValidator::kMaxCommandTypeMetricLength) {
        return kUnknownCommandType;
    }

    for (const char* known : kKnownCommandTypes) {
        if (commandType == known) {
            return commandType;
        }
    }
    return kUnknownCommandType;
}
