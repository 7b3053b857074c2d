#include "AgentOptions.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <stdexcept>

namespace {
std::string ToLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return value;
}

std::string DefaultTempDirectory() {
    std::error_code error;
    const auto base = std::filesystem::temp_directory_path(error);
    if (error) {
        return "/tmp/fleetlink";
    }
    return (base / "fleetlink").string();
}

std::optional<Uuid> GetEnvUuid(const char* name, std::vector<std::string>* problems) {
    const std::string value = GetEnvOrDefault(name, "");
    if (value.empty()) {
        return std::nullopt;
    }

    auto parsed = Uuid::Parse(value);
    if (!parsed && problems != nullptr) {
        problems->push_back(std::string(name) + " is not a valid UUID");
    }
    return parsed;
}
} // namespace

std::string GetEnvOrDefault(const char* name, const std::string& defaultValue) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : defaultValue;
}

bool GetEnvBool(const char* name, bool defaultValue) {
    const char* value = std::getenv(name);
    if (!value) {
        return defaultValue;
    }

    const std::string normalized = ToLower(value);
    if (normalized == "1" || normalized == "true" || normalized == "yes") {
        return true;
    }
    if (normalized == "0" || normalized == "false" || normalized == "no") {
        return false;
    }

    return defaultValue;
}

long long GetEnvInt(const char* name, long long defaultValue) {
    const char* value = std::getenv(name);
    if (!value || *value == '\0') {
        return defaultValue;
    }

    try {
        size_t index = 0;
        const long long parsed = std::stoll(value, &index);
        if (index == std::char_traits<char>::length(value)) {
            return parsed;
        }
    } catch (const std::exception&) {
    }

    std::cerr << "[Agent] [WARN] Ignoring non-numeric " << name << "; using " << defaultValue << std::endl;
    return defaultValue;
}

AgentOptions LoadAgentOptionsFromEnvironment(std::vector<std::string>* problems) {
    AgentOptions options;

    options.nodeId = GetEnvUuid("FLEETLINK_NODE_ID", problems);
    options.organizationId = GetEnvUuid("FLEETLINK_ORGANIZATION_ID", problems);
    options.agentVersion = GetEnvOrDefault("FLEETLINK_AGENT_VERSION", options.agentVersion);
    options.heartbeatInterval = std::chrono::seconds(
        GetEnvInt("FLEETLINK_HEARTBEAT_SECONDS", options.heartbeatInterval.count()));

    auto& controlPlane = options.controlPlane;
    controlPlane.endpoint = GetEnvOrDefault("FLEETLINK_CONTROL_PLANE_URL", controlPlane.endpoint);
    controlPlane.hubPath = GetEnvOrDefault("FLEETLINK_HUB_PATH", controlPlane.hubPath);
    controlPlane.connectionTimeout = std::chrono::seconds(
        GetEnvInt("FLEETLINK_CONNECT_TIMEOUT_SECONDS", controlPlane.connectionTimeout.count()));
    controlPlane.callTimeout = std::chrono::seconds(
        GetEnvInt("FLEETLINK_CALL_TIMEOUT_SECONDS", controlPlane.callTimeout.count()));
    controlPlane.reconnectBaseDelay = std::chrono::seconds(
        GetEnvInt("FLEETLINK_RECONNECT_DELAY_SECONDS", controlPlane.reconnectBaseDelay.count()));
    controlPlane.maxReconnectDelay = std::chrono::seconds(
        GetEnvInt("FLEETLINK_MAX_RECONNECT_DELAY_SECONDS", controlPlane.maxReconnectDelay.count()));
    controlPlane.keepAliveInterval = std::chrono::seconds(
        GetEnvInt("FLEETLINK_KEEPALIVE_SECONDS", controlPlane.keepAliveInterval.count()));
    controlPlane.serverTimeout = std::chrono::seconds(
        GetEnvInt("FLEETLINK_SERVER_TIMEOUT_SECONDS", controlPlane.serverTimeout.count()));

    auto& security = options.security;
    security.certificatePath = GetEnvOrDefault("FLEETLINK_CERT_PATH", "");
    security.privateKeyPath = GetEnvOrDefault("FLEETLINK_KEY_PATH", "");
    security.caCertificatePath = GetEnvOrDefault("FLEETLINK_CA_PATH", "");
    security.verifyHost = GetEnvBool("FLEETLINK_VERIFY_HOST", true);

    auto& files = options.files;
    files.tempDirectory = GetEnvOrDefault("FLEETLINK_TEMP_DIR", DefaultTempDirectory());
    files.transferChunkSizeBytes = static_cast<std::size_t>(std::max<long long>(
        0, GetEnvInt("FLEETLINK_CHUNK_SIZE_BYTES", static_cast<long long>(files.transferChunkSizeBytes))));
    files.maxFileSizeBytes = static_cast<uint64_t>(std::max<long long>(
        0, GetEnvInt("FLEETLINK_MAX_FILE_SIZE_BYTES", static_cast<long long>(files.maxFileSizeBytes))));
    files.maxConcurrentTransfers = static_cast<std::size_t>(std::max<long long>(
        0, GetEnvInt("FLEETLINK_MAX_CONCURRENT_TRANSFERS", static_cast<long long>(files.maxConcurrentTransfers))));

    options.process.serverBasePath = GetEnvOrDefault("FLEETLINK_SERVER_BASE_PATH", options.process.serverBasePath);

    options.tracing.enabled = GetEnvBool("FLEETLINK_ENABLE_OTEL", false);
    options.tracing.endpoint = GetEnvOrDefault("FLEETLINK_OTEL_ENDPOINT", "");

    return options;
}

std::vector<std::string> ValidateAgentOptions(const AgentOptions& options) {
    std::vector<std::string> problems;

    const auto& controlPlane = options.controlPlane;
    if (controlPlane.endpoint.empty()) {
        problems.emplace_back("Control plane endpoint is required");
    } else if (!IsEncryptedUrl(controlPlane.endpoint)) {
        problems.emplace_back("Control plane endpoint must use https");
    }
    if (controlPlane.hubPath.empty() || controlPlane.hubPath.front() != '/') {
        problems.emplace_back("Hub path must start with '/'");
    }
    if (controlPlane.connectionTimeout.count() <= 0 || controlPlane.callTimeout.count() <= 0) {
        problems.emplace_back("Connection and call timeouts must be positive");
    }
    if (controlPlane.reconnectBaseDelay.count() <= 0) {
        problems.emplace_back("Reconnect delay must be positive");
    }
    if (controlPlane.maxReconnectDelay < controlPlane.reconnectBaseDelay) {
        problems.emplace_back("Max reconnect delay must not be below the reconnect delay");
    }
    if (controlPlane.keepAliveInterval.count() <= 0
        || controlPlane.serverTimeout <= controlPlane.keepAliveInterval) {
        problems.emplace_back("Server timeout must exceed a positive keep-alive interval");
    }
    if (options.heartbeatInterval.count() <= 0) {
        problems.emplace_back("Heartbeat interval must be positive");
    }

    const auto& security = options.security;
    if (security.certificatePath.empty() != security.privateKeyPath.empty()) {
        problems.emplace_back("Certificate path and private key path must be set together");
    }

    const auto& files = options.files;
    if (files.tempDirectory.empty()) {
        problems.emplace_back("Temp directory is required");
    }
    if (files.transferChunkSizeBytes == 0) {
        problems.emplace_back("Transfer chunk size must be positive");
    }
    if (files.maxFileSizeBytes == 0) {
        problems.emplace_back("Max file size must be positive");
    }
    if (files.maxConcurrentTransfers == 0) {
        problems.emplace_back("Max concurrent transfers must be positive");
    }

    return problems;
}

bool IsEncryptedUrl(const std::string& url) {
    const std::string lowered = ToLower(url.substr(0, 8));
    return lowered.rfind("https://", 0) == 0 || lowered.rfind("wss://", 0) == 0;
}

bool DebugLoggingEnabled() {
    static const bool enabled = GetEnvBool("FLEETLINK_DEBUG_LOG", false);
    return enabled;
}
