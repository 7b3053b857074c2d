#pragma once

#include "CommandEnvelope.hpp"
#include "Uuid.hpp"

#include <chrono>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>

enum class CommandRejection {
    None,
    PayloadTooLarge,
    Malformed,
    NodeMismatch,
    OrganizationMissing,
    OrganizationMismatch,
    Expired
};

struct CommandValidationOutcome {
    CommandRejection rejection = CommandRejection::None;
    std::optional<CommandEnvelope> envelope;

    bool Accepted() const { return rejection == CommandRejection::None && envelope.has_value(); }
};

const char* ToString(CommandRejection rejection);

// Gatekeeper for raw inbound command messages. Nothing here throws; every rejection is reported
// through the outcome so the caller can log and drop it.
class CommandValidator {
public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    static constexpr std::size_t kMaxCommandTypeMetricLength = 64;

    CommandValidator(std::optional<Uuid> nodeId, std::optional<Uuid> organizationId, Clock clock = Clock());

    CommandValidationOutcome Validate(const std::string& rawMessage) const;

private:
    std::optional<Uuid> nodeId_;
    std::optional<Uuid> organizationId_;
    Clock clock_;
};

// Maps a command type onto the fixed set of known types; anything else becomes "Unknown".
std::string SanitizeCommandType(const std::string& commandType);
