#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>

enum class ConnectionState {
    Disconnected,
    Connecting,
    Connected,
    Reconnecting,
    Failed
};

// The single cause behind every state change.
enum class ConnectionTrigger {
    Connect,
    ConnectSucceeded,
    TransportReconnecting,
    TransportReconnected,
    TransportClosed,
    Disconnect,
    FatalError
};

struct ConnectionStateChangedEvent {
    ConnectionState previous = ConnectionState::Disconnected;
    ConnectionState current = ConnectionState::Disconnected;
    std::optional<std::string> error;
    std::chrono::system_clock::time_point timestamp;
};

const char* ToString(ConnectionState state);
const char* ToString(ConnectionTrigger trigger);

// Returns the target state, or nullopt when the trigger is not valid from `from`.
std::optional<ConnectionState> NextConnectionState(ConnectionState from, ConnectionTrigger trigger);

class ConnectionStateMachine {
public:
    using Handler = std::function<void(const ConnectionStateChangedEvent&)>;
    using SubscriptionId = uint64_t;

    ConnectionState Current() const;

    // Applies the trigger and notifies subscribers outside the lock. Invalid triggers are ignored
    // and return nullopt.
    std::optional<ConnectionStateChangedEvent> Apply(
        ConnectionTrigger trigger,
        std::optional<std::string> error = std::nullopt);

    SubscriptionId Subscribe(Handler handler);
    void Unsubscribe(SubscriptionId id);

private:
    mutable std::mutex mutex_;
    // Serializes Apply so subscribers observe transitions in the order they happened. Recursive
    // because a subscriber may apply a trigger of its own.
    std::recursive_mutex notifyMutex_;
    ConnectionState state_ = ConnectionState::Disconnected;
    std::map<SubscriptionId, Handler> handlers_;
    SubscriptionId nextId_ = 1;
};
