#pragma once

#include "Uuid.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

struct ControlPlaneOptions {
    std::string endpoint = "https://localhost:5001";
    std::string hubPath = "/hubs/agent";
    std::chrono::seconds connectionTimeout{30};
    std::chrono::seconds callTimeout{15};
    std::chrono::seconds reconnectBaseDelay{1};
    std::chrono::seconds maxReconnectDelay{30};
    std::chrono::seconds keepAliveInterval{15};
    std::chrono::seconds serverTimeout{30};
};

struct SecurityOptions {
    std::string certificatePath;
    std::string privateKeyPath;
    std::string caCertificatePath;
    bool verifyHost = true;
    int certificateRenewalThresholdDays = 14;
};

struct FileOptions {
    std::string tempDirectory;
    std::size_t transferChunkSizeBytes = 81920;
    uint64_t maxFileSizeBytes = 10ULL * 1024 * 1024 * 1024;
    std::size_t maxConcurrentTransfers = 4;
};

struct ProcessOptions {
    std::string serverBasePath = "/var/lib/fleetlink/servers";
};

struct TracingOptions {
    bool enabled = false;
    std::string endpoint;
    std::string serviceName = "fleetlink-agent";
};

struct AgentOptions {
    std::optional<Uuid> nodeId;
    std::optional<Uuid> organizationId;
    std::string agentVersion = "1.0.0";
    std::chrono::seconds heartbeatInterval{30};
    ControlPlaneOptions controlPlane;
    SecurityOptions security;
    FileOptions files;
    ProcessOptions process;
    TracingOptions tracing;
};

std::string GetEnvOrDefault(const char* name, const std::string& defaultValue);
bool GetEnvBool(const char* name, bool defaultValue);
long long GetEnvInt(const char* name, long long defaultValue);

// Unparseable identifiers are left unset and reported through `problems`.
AgentOptions LoadAgentOptionsFromEnvironment(std::vector<std::string>* problems = nullptr);

// Returns one line per problem; empty means the options are usable.
std::vector<std::string> ValidateAgentOptions(const AgentOptions& options);

bool IsEncryptedUrl(const std::string& url);

// FLEETLINK_DEBUG_LOG=1 enables [DEBUG] lines. Read once.
bool DebugLoggingEnabled();
