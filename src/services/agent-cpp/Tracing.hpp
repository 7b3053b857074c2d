#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>

#if FLEETLINK_ENABLE_OTEL
#include <opentelemetry/nostd/shared_ptr.h>
#include <opentelemetry/sdk/trace/tracer_provider.h>
#include <opentelemetry/trace/tracer.h>
#endif

struct TraceConfig {
    bool enabled = false;
    // OTLP/HTTP collector URL; the exporter default is used when empty.
    std::string endpoint;
    std::string serviceName;
    std::string serviceVersion;
};

struct SpanHandle {
    // W3C trace context header value, present even when export is disabled.
    std::string traceparent;
    bool open = false;
#if FLEETLINK_ENABLE_OTEL
    opentelemetry::nostd::shared_ptr<opentelemetry::trace::Span> span;
#endif
};

// Process-wide tracer. Configure() and Shutdown() are called from main; spans may be started
// from any thread.
class Tracer {
public:
    static Tracer& Instance();

    void Configure(const TraceConfig& config);
    bool Enabled() const;

    SpanHandle StartSpan(const std::string& name);
    void SetAttribute(SpanHandle& handle, const std::string& key, const std::string& value);
    void SetAttribute(SpanHandle& handle, const std::string& key, int64_t value);
    void EndSpan(SpanHandle& handle, bool success, const std::string& error = {});
    // Flushes pending spans and stops exporting.
    void Shutdown();

private:
    Tracer() = default;

    std::atomic<bool> enabled_{false};
#if FLEETLINK_ENABLE_OTEL
    std::shared_ptr<opentelemetry::sdk::trace::TracerProvider> provider_;
    opentelemetry::nostd::shared_ptr<opentelemetry::trace::Tracer> tracer_;
#endif
};

// Ends the span when it leaves scope; it is reported as failed unless MarkSucceeded() ran.
class ScopedSpan {
public:
    explicit ScopedSpan(const std::string& name);
    ~ScopedSpan();

    ScopedSpan(const ScopedSpan&) = delete;
    ScopedSpan& operator=(const ScopedSpan&) = delete;

    void SetAttribute(const std::string& key, const std::string& value);
    void SetAttribute(const std::string& key, int64_t value);
    void MarkSucceeded();
    void MarkFailed(const std::string& error);
    const std::string& TraceParent() const { return handle_.traceparent; }

private:
    SpanHandle handle_;
    bool succeeded_ = false;
    std::string error_;
};
