#pragma once

#include "Uuid.hpp"

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>

enum class CommandPriority {
    Low = 0,
    Normal = 1,
    High = 2,
    Critical = 3
};

struct CommandEnvelope {
    static constexpr std::size_t kMaxPayloadBytes = 256 * 1024;
    static constexpr std::size_t kMaxCommandTypeLength = 128;
    static constexpr std::size_t kMaxSignatureLength = 2048;
    static constexpr std::size_t kMaxCorrelationIdLength = 128;

    Uuid commandId;
    std::string commandType;
    Uuid nodeId;
    Uuid organizationId;
    std::optional<Uuid> initiatedByUserId;
    std::optional<std::chrono::system_clock::time_point> issuedAt;
    std::optional<std::chrono::system_clock::time_point> expiresAt;
    // Command-specific arguments, kept as JSON text and interpreted by the handler.
    std::string payloadJson;
    std::optional<std::string> signature;
    CommandPriority priority = CommandPriority::Normal;
    std::optional<std::string> correlationId;
};

struct CommandReceivedEvent {
    CommandEnvelope command;
    std::chrono::system_clock::time_point receivedAt;
};

const char* ToString(CommandPriority priority);

// Field names match case-insensitively. Returns nullopt for anything malformed: bad JSON, excess
// nesting, a missing or invalid commandId, a missing commandType, or oversized optional fields.
std::optional<CommandEnvelope> ParseCommandEnvelope(const std::string& json);
