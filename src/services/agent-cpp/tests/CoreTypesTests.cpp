#include "CancellationToken.hpp"
#include "ControlPlaneMessages.hpp"
#include "TimeUtils.hpp"
#include "Tracing.hpp"
#include "Uuid.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <iostream>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>

namespace {
int Fail(const std::string& message) {
    std::cerr << message << std::endl;
    return 1;
}
} // namespace

int main() {
    using namespace std::chrono;

    const auto parsed = Uuid::Parse("{A3F1E2D4-5B6C-4D7E-8F90-1A2B3C4D5E6F}");
    if (!parsed || parsed->ToString() != "a3f1e2d4-5b6c-4d7e-8f90-1a2b3c4d5e6f") {
        return Fail("Braced upper-case UUID not parsed.");
    }
    if (Uuid::Parse("a3f1e2d4-5b6c-4d7e-8f90-1a2b3c4d5e6") || Uuid::Parse("a3f1e2d45b6c4d7e8f901a2b3c4d5e6f")) {
        return Fail("Malformed UUIDs must not parse.");
    }
    if (!Uuid().IsNil()) {
        return Fail("Default UUID is nil.");
    }
    std::set<std::string> generated;
    for (int i = 0; i < 64; ++i) {
        const std::string text = Uuid::Generate().ToString();
        if (text[14] != '4') {
            return Fail("Generated UUID is not version 4: " + text);
        }
        generated.insert(text);
    }
    if (generated.size() != 64) {
        return Fail("Generated UUIDs collided.");
    }

    const auto utc = ParseIso8601("2026-03-01T12:00:00Z");
    const auto offset = ParseIso8601("2026-03-01T14:00:00+02:00");
    if (!utc || !offset || *utc != *offset) {
        return Fail("Offsets must normalize to UTC.");
    }
    const auto fractional = ParseIso8601("2026-03-01T12:00:00.250Z");
    if (!fractional || *fractional - *utc != milliseconds(250)) {
        return Fail("Fractional seconds lost.");
    }
    if (FormatIso8601(*fractional) != "2026-03-01T12:00:00.250Z") {
        return Fail("Unexpected format: " + FormatIso8601(*fractional));
    }
    if (ParseIso8601("2026-03-01") || ParseIso8601("2026-03-01T12:00:00Q")) {
        return Fail("Incomplete timestamps must not parse.");
    }

    CancellationSource parent;
    CancellationSource child = CancellationSource::CreateLinked(parent.Token());
    if (child.IsCancellationRequested()) {
        return Fail("Fresh source already cancelled.");
    }
    parent.Cancel();
    if (child.Token().Reason() != CancellationReason::Requested) {
        return Fail("Parent cancellation must reach linked sources.");
    }

    CancellationSource deadline;
    deadline.CancelAfter(milliseconds(20));
    CancellationSource linkedToDeadline = CancellationSource::CreateLinked(deadline.Token());
    if (!linkedToDeadline.Token().WaitFor(seconds(2))) {
        return Fail("Deadline on the parent never observed.");
    }
    bool timedOut = false;
    try {
        linkedToDeadline.Token().ThrowIfCancelled();
    } catch (const OperationTimedOutError&) {
        timedOut = true;
    } catch (const OperationCancelledError&) {
        return Fail("A deadline must surface as a timeout, not a cancellation.");
    }
    if (!timedOut) {
        return Fail("Expected OperationTimedOutError.");
    }

    if (CancellationToken().IsCancellationRequested() || CancellationToken().CanBeCancelled()) {
        return Fail("Default token never cancels.");
    }

    const Uuid commandId = Uuid::Generate();
    const Uuid nodeId = Uuid::Generate();
    const auto startedAt = system_clock::now();
    bool rejectedNil = false;
    try {
        CommandResult::Success(Uuid(), nodeId, startedAt);
    } catch (const std::invalid_argument&) {
        rejectedNil = true;
    }
    if (!rejectedNil) {
        return Fail("Nil command id must be refused.");
    }

    const CommandResult failure = CommandResult::Failure(commandId, nodeId, startedAt + hours(1), "boom", std::string("E1"));
    if (failure.completedAt < failure.startedAt) {
        return Fail("completedAt must never precede startedAt.");
    }
    const nlohmann::json failureJson = failure;
    if (failureJson["status"] != "Failed" || failureJson["errorMessage"] != "boom" || failureJson["errorCode"] != "E1") {
        return Fail("Unexpected command result JSON: " + failureJson.dump());
    }

    SystemMetrics metrics;
    metrics.totalMemoryBytes = 1000;
    metrics.availableMemoryBytes = 250;
    if (metrics.UsedMemoryBytes() != 750 || metrics.MemoryUsagePercent() != 75.0) {
        return Fail("Memory arithmetic is wrong.");
    }
    HeartbeatPayload heartbeat;
    heartbeat.nodeId = nodeId;
    heartbeat.agentVersion = "1.2.3";
    heartbeat.metrics = metrics;
    const nlohmann::json heartbeatJson = heartbeat;
    if (heartbeatJson["agentVersion"] != "1.2.3" || heartbeatJson["status"] != "Online"
        || heartbeatJson["metrics"]["memoryUsagePercent"] != 75.0) {
        return Fail("Unexpected heartbeat JSON: " + heartbeatJson.dump());
    }

    {
        ScopedSpan first("test.span");
        ScopedSpan second("test.span");
        const std::string& traceparent = first.TraceParent();
        if (traceparent.size() != 55 || traceparent.compare(0, 3, "00-") != 0 || traceparent[35] != '-'
            || traceparent.compare(52, 3, "-01") != 0) {
            return Fail("Unexpected traceparent: " + traceparent);
        }
        if (traceparent.find_first_not_of("0123456789abcdef-") != std::string::npos
            || traceparent == second.TraceParent()) {
            return Fail("traceparent must be lower-case hex and unique per span.");
        }
    }

    return 0;
}
