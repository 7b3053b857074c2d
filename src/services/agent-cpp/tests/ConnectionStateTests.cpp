#include "ConnectionState.hpp"

#include <iostream>
#include <string>
#include <vector>

namespace {
int Fail(const std::string& message) {
    std::cerr << message << std::endl;
    return 1;
}
} // namespace

int main() {
    if (NextConnectionState(ConnectionState::Connected, ConnectionTrigger::Connect)) {
        return Fail("Connect is not valid while connected.");
    }
    if (NextConnectionState(ConnectionState::Disconnected, ConnectionTrigger::TransportReconnecting)) {
        return Fail("A disconnected client cannot start reconnecting.");
    }
    if (NextConnectionState(ConnectionState::Failed, ConnectionTrigger::FatalError) != ConnectionState::Failed) {
        return Fail("FatalError always lands in Failed.");
    }

    ConnectionStateMachine machine;
    std::vector<ConnectionStateChangedEvent> events;
    const auto id = machine.Subscribe([&events](const ConnectionStateChangedEvent& event) {
        events.push_back(event);
    });

    machine.Apply(ConnectionTrigger::Connect);
    machine.Apply(ConnectionTrigger::ConnectSucceeded);
    machine.Apply(ConnectionTrigger::TransportReconnecting, std::string("socket reset"));
    machine.Apply(ConnectionTrigger::TransportReconnected);

    if (machine.Current() != ConnectionState::Connected) {
        return Fail("Expected Connected after reconnecting.");
    }
    if (events.size() != 4) {
        return Fail("Expected four transitions, got " + std::to_string(events.size()));
    }
    if (events[2].previous != ConnectionState::Connected
        || events[2].current != ConnectionState::Reconnecting
        || events[2].error != std::optional<std::string>("socket reset")) {
        return Fail("Reconnecting event is wrong.");
    }

    if (machine.Apply(ConnectionTrigger::ConnectSucceeded)) {
        return Fail("ConnectSucceeded while connected must be ignored.");
    }
    if (events.size() != 4) {
        return Fail("Ignored triggers must not notify.");
    }

    machine.Apply(ConnectionTrigger::TransportClosed);
    if (machine.Current() != ConnectionState::Disconnected) {
        return Fail("TransportClosed should disconnect.");
    }

    machine.Unsubscribe(id);
    machine.Apply(ConnectionTrigger::Connect);
    machine.Apply(ConnectionTrigger::FatalError, std::string("bad certificate"));
    if (machine.Current() != ConnectionState::Failed) {
        return Fail("Expected Failed after FatalError.");
    }
    if (events.size() != 5) {
        return Fail("Unsubscribed handler still notified.");
    }

    ConnectionStateMachine throwing;
    int notified = 0;
    throwing.Subscribe([](const ConnectionStateChangedEvent&) { throw std::runtime_error("subscriber bug"); });
    throwing.Subscribe([&notified](const ConnectionStateChangedEvent&) { ++notified; });
    throwing.Apply(ConnectionTrigger::Connect);
    if (notified != 1 || throwing.Current() != ConnectionState::Connecting) {
        return Fail("A throwing subscriber must not block other subscribers.");
    }

    ConnectionStateMachine nested;
    std::vector<ConnectionState> seen;
    nested.Subscribe([&nested, &seen](const ConnectionStateChangedEvent& event) {
        seen.push_back(event.current);
        if (event.current == ConnectionState::Connecting) {
            nested.Apply(ConnectionTrigger::Disconnect);
        }
    });
    nested.Apply(ConnectionTrigger::Connect);
    if (nested.Current() != ConnectionState::Disconnected
        || seen != std::vector<ConnectionState>{ConnectionState::Connecting, ConnectionState::Disconnected}) {
        return Fail("A subscriber must be able to apply a trigger from inside a notification.");
    }

    return 0;
}
