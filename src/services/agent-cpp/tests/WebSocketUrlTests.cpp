#include "WebSocketConnection.hpp"

#include <iostream>
#include <string>

namespace {
int Fail(const std::string& message) {
    std::cerr << message << std::endl;
    return 1;
}
} // namespace

int main() {
    const auto plain = ParseWebSocketUrl("wss://control.example/hubs/agent");
    if (!plain || plain->host != "control.example" || plain->port != "443" || plain->target != "/hubs/agent") {
        return Fail("Default port or target not applied.");
    }

    const auto withPort = ParseWebSocketUrl("WSS://control.example:5001");
    if (!withPort || withPort->port != "5001" || withPort->target != "/") {
        return Fail("Explicit port or upper-case scheme not handled.");
    }

    const auto ipv6 = ParseWebSocketUrl("wss://[::1]:8443/hubs/agent?x=1");
    if (!ipv6 || ipv6->host != "::1" || ipv6->port != "8443" || ipv6->target != "/hubs/agent?x=1") {
        return Fail("Bracketed IPv6 host not parsed.");
    }

    for (const std::string& bad : {
             std::string("ws://control.example/hubs/agent"),
             std::string("https://control.example"),
             std::string("wss:///hubs/agent"),
             std::string("wss://user@control.example/"),
             std::string("wss://control.example:/"),
             std::string("wss://control.example:https/"),
             std::string("wss://[::1/"),
             std::string("wss://[::1]x/")}) {
        if (ParseWebSocketUrl(bad)) {
            return Fail("Accepted invalid URL: " + bad);
        }
    }

    DuplexConnectionOptions options;
    options.url = "ws://control.example/hubs/agent";
    bool threw = false;
    try {
        WebSocketConnection connection(options);
    } catch (const TransportError&) {
        threw = true;
    }
    if (!threw) {
        return Fail("A plaintext hub URL must be refused.");
    }

    options.url = "wss://control.example/hubs/agent";
    WebSocketConnection idle(options);
    if (idle.State() != DuplexConnectionState::Disconnected) {
        return Fail("A new connection starts Disconnected.");
    }

    return 0;
}
