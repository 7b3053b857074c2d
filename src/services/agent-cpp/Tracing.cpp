#include "Tracing.hpp"

#include <openssl/rand.h>

#include <array>
#include <chrono>
#include <iostream>
#include <stdexcept>

#if FLEETLINK_ENABLE_OTEL
#include <opentelemetry/exporters/otlp/otlp_http_exporter.h>
#include <opentelemetry/sdk/resource/resource.h>
#include <opentelemetry/sdk/trace/batch_span_processor.h>
#include <opentelemetry/trace/provider.h>
#include <opentelemetry/trace/span_context.h>
#include <opentelemetry/trace/status_code.h>
#endif

namespace {
constexpr const char* kInstrumentationName = "fleetlink.agent";
constexpr const char* kDefaultServiceName = "fleetlink-agent";
constexpr auto kShutdownTimeout = std::chrono::seconds(5);

template <std::size_t Bytes>
std::string RandomHexId() {
    static constexpr char kDigits[] = "0123456789abcdef";
    std::array<unsigned char, Bytes> raw{};
    if (RAND_bytes(raw.data(), static_cast<int>(raw.size())) != 1) {
        throw std::runtime_error("OpenSSL could not generate a trace identifier");
    }
    std::string hex;
    hex.reserve(Bytes * 2);
    for (unsigned char byte : raw) {
        hex.push_back(kDigits[byte >> 4]);
        hex.push_back(kDigits[byte & 0x0F]);
    }
    return hex;
}

std::string FormatTraceParent(const std::string& traceId, const std::string& spanId, bool sampled) {
    return "00-" + traceId + "-" + spanId + (sampled ? "-01" : "-00");
}

std::string DetachedTraceParent() {
    return FormatTraceParent(RandomHexId<16>(), RandomHexId<8>(), true);
}

#if FLEETLINK_ENABLE_OTEL
std::string TraceParentOf(const opentelemetry::trace::SpanContext& context) {
    if (!context.IsValid()) {
        return DetachedTraceParent();
    }
    char traceId[32];
    char spanId[16];
    context.trace_id().ToLowerBase16(traceId);
    context.span_id().ToLowerBase16(spanId);
    return FormatTraceParent(
        std::string(traceId, sizeof(traceId)), std::string(spanId, sizeof(spanId)), context.trace_flags().IsSampled());
}
#endif
} // namespace

Tracer& Tracer::Instance() {
    static Tracer instance;
    return instance;
}

void Tracer::Configure(const TraceConfig& config) {
    enabled_ = false;
    if (!config.enabled) {
        return;
    }

#if FLEETLINK_ENABLE_OTEL
    namespace otlp = opentelemetry::exporter::otlp;
    namespace sdktrace = opentelemetry::sdk::trace;

    otlp::OtlpHttpExporterOptions exporterOptions;
    if (!config.endpoint.empty()) {
        exporterOptions.url = config.endpoint;
    }

    opentelemetry::sdk::resource::ResourceAttributes attributes{
        {"service.name", config.serviceName.empty() ? std::string(kDefaultServiceName) : config.serviceName}};
    if (!config.serviceVersion.empty()) {
        attributes.SetAttribute("service.version", opentelemetry::nostd::string_view(config.serviceVersion));
    }

    auto processor = std::make_unique<sdktrace::BatchSpanProcessor>(
        std::make_unique<otlp::OtlpHttpExporter>(exporterOptions), sdktrace::BatchSpanProcessorOptions{});
    provider_ = std::make_shared<sdktrace::TracerProvider>(
        std::move(processor), opentelemetry::sdk::resource::Resource::Create(attributes));

    opentelemetry::trace::Provider::SetTracerProvider(
        opentelemetry::nostd::shared_ptr<opentelemetry::trace::TracerProvider>(provider_));
    tracer_ = provider_->GetTracer(kInstrumentationName, config.serviceVersion);
    enabled_ = true;
    std::cout << "[Agent] Trace export enabled"
              << (config.endpoint.empty() ? std::string() : " to " + config.endpoint) << std::endl;
#else
    static_cast<void>(kInstrumentationName);
    static_cast<void>(kDefaultServiceName);
    std::cerr << "[Agent] [WARN] Tracing requested but this build has no OpenTelemetry support" << std::endl;
#endif
}

bool Tracer::Enabled() const {
    return enabled_;
}

SpanHandle Tracer::StartSpan(const std::string& name) {
    SpanHandle handle;
    handle.open = true;
#if FLEETLINK_ENABLE_OTEL
    if (enabled_ && tracer_) {
        handle.span = tracer_->StartSpan(name);
        handle.traceparent = TraceParentOf(handle.span->GetContext());
        return handle;
    }
#endif
    static_cast<void>(name);
    handle.traceparent = DetachedTraceParent();
    return handle;
}

void Tracer::SetAttribute(SpanHandle& handle, const std::string& key, const std::string& value) {
#if FLEETLINK_ENABLE_OTEL
    if (handle.span) {
        handle.span->SetAttribute(key, value);
    }
#else
    static_cast<void>(handle);
    static_cast<void>(key);
    static_cast<void>(value);
#endif
}

void Tracer::SetAttribute(SpanHandle& handle, const std::string& key, int64_t value) {
#if FLEETLINK_ENABLE_OTEL
    if (handle.span) {
        handle.span->SetAttribute(key, value);
    }
#else
    static_cast<void>(handle);
    static_cast<void>(key);
    static_cast<void>(value);
#endif
}

void Tracer::EndSpan(SpanHandle& handle, bool success, const std::string& error) {
    if (!handle.open) {
        return;
    }
    handle.open = false;
#if FLEETLINK_ENABLE_OTEL
    if (handle.span) {
        handle.span->SetStatus(
            success ? opentelemetry::trace::StatusCode::kOk : opentelemetry::trace::StatusCode::kError,
            success ? std::string() : error);
        handle.span->End();
    }
#else
    static_cast<void>(success);
    static_cast<void>(error);
#endif
}

void Tracer::Shutdown() {
    enabled_ = false;
#if FLEETLINK_ENABLE_OTEL
    if (provider_) {
        provider_->ForceFlush(kShutdownTimeout);
        provider_->Shutdown();
    }
#else
    static_cast<void>(kShutdownTimeout);
#endif
}

ScopedSpan::ScopedSpan(const std::string& name)
    : handle_(Tracer::Instance().StartSpan(name)) {}

ScopedSpan::~ScopedSpan() {
    Tracer::Instance().EndSpan(handle_, succeeded_, error_);
}

void ScopedSpan::SetAttribute(const std::string& key, const std::string& value) {
    Tracer::Instance().SetAttribute(handle_, key, value);
}

void ScopedSpan::SetAttribute(const std::string& key, int64_t value) {
    Tracer::Instance().SetAttribute(handle_, key, value);
}

void ScopedSpan::MarkSucceeded() {
    succeeded_ = true;
    error_.clear();
}

void ScopedSpan::MarkFailed(const std::string& error) {
    succeeded_ = false;
    error_ = error;
}
