#include "ConnectionState.hpp"

#include <exception>
#include <iostream>
#include <utility>
#include <vector>

const char* ToString(ConnectionState state) {
    switch (state) {
    case ConnectionState::Disconnected:
        return "Disconnected";
    case ConnectionState::Connecting:
        return "Connecting";
    case ConnectionState::Connected:
        return "Connected";
    case ConnectionState::Reconnecting:
        return "Reconnecting";
    case ConnectionState::Failed:
        return "Failed";
    }
    return "Unknown";
}

const char* ToString(ConnectionTrigger trigger) {
    switch (trigger) {
    case ConnectionTrigger::Connect:
        return "Connect";
    case ConnectionTrigger::ConnectSucceeded:
        return "ConnectSucceeded";
    case ConnectionTrigger::TransportReconnecting:
        return "TransportReconnecting";
    case ConnectionTrigger::TransportReconnected:
        return "TransportReconnected";
    case ConnectionTrigger::TransportClosed:
        return "TransportClosed";
    case ConnectionTrigger::Disconnect:
        return "Disconnect";
    case ConnectionTrigger::FatalError:
        return "FatalError";
    }
    return "Unknown";
}

std::optional<ConnectionState> NextConnectionState(ConnectionState from, ConnectionTrigger trigger) {
    switch (trigger) {
    case ConnectionTrigger::Connect:
        if (from == ConnectionState::Disconnected
            || from == ConnectionState::Failed
            || from == ConnectionState::Reconnecting) {
            return ConnectionState::Connecting;
        }
        return std::nullopt;
    case ConnectionTrigger::ConnectSucceeded:
        if (from == ConnectionState::Connecting) {
            return ConnectionState::Connected;
        }
        return std::nullopt;
    case ConnectionTrigger::TransportReconnecting:
        if (from == ConnectionState::Connected) {
            return ConnectionState::Reconnecting;
        }
        return std::nullopt;
    case ConnectionTrigger::TransportReconnected:
        if (from == ConnectionState::Reconnecting) {
            return ConnectionState::Connected;
        }
        return std::nullopt;
    case ConnectionTrigger::TransportClosed:
        if (from == ConnectionState::Connected || from == ConnectionState::Reconnecting) {
            return ConnectionState::Disconnected;
        }
        return std::nullopt;
    case ConnectionTrigger::Disconnect:
        if (from != ConnectionState::Disconnected) {
            return ConnectionState::Disconnected;
        }
        return std::nullopt;
    case ConnectionTrigger::FatalError:
        return ConnectionState::Failed;
    }
    return std::nullopt;
}

ConnectionState ConnectionStateMachine::Current() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

std::optional<ConnectionStateChangedEvent> ConnectionStateMachine::Apply(
    ConnectionTrigger trigger,
    std::optional<std::string> error) {
    std::lock_guard<std::recursive_mutex> notifyLock(notifyMutex_);

    ConnectionStateChangedEvent event;
    std::vector<Handler> handlers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto next = NextConnectionState(state_, trigger);
        if (!next.has_value()) {
            return std::nullopt;
        }

        event.previous = state_;
        event.current = *next;
        event.error = std::move(error);
        event.timestamp = std::chrono::system_clock::now();
        state_ = *next;

        handlers.reserve(handlers_.size());
        for (const auto& entry : handlers_) {
            handlers.push_back(entry.second);
        }
    }

    for (const auto& handler : handlers) {
        try {
            handler(event);
        } catch (const std::exception& ex) {
            std::cerr << "[ControlPlane] State change subscriber threw: " << ex.what() << std::endl;
        }
    }

    return event;
}

ConnectionStateMachine::SubscriptionId ConnectionStateMachine::Subscribe(Handler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    const SubscriptionId id = nextId_++;
    handlers_.emplace(id, std::move(handler));
    return id;
}

void ConnectionStateMachine::Unsubscribe(SubscriptionId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    handlers_.erase(id);
}
