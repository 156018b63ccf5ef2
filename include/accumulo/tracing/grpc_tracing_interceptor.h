// Copyright 2025 CppGrpcAccumulo Project
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <utility>

#include <grpcpp/grpcpp.h>
#include <grpcpp/support/client_interceptor.h>

#include "opentelemetry/nostd/shared_ptr.h"
#include "opentelemetry/nostd/unique_ptr.h"
#include "opentelemetry/trace/scope.h"
#include "opentelemetry/trace/span.h"
#include "opentelemetry/trace/tracer.h"

namespace accumulo::tracing {

inline constexpr const char* kInstrumentationScope = "accumulo.proxy.client";
inline constexpr const char* kTraceparentHeader = "traceparent";
inline constexpr const char* kProxySubjectAttribute = "accumulo.proxy.subject";
inline constexpr const char* kScanExhaustedAttribute = "accumulo.scan.exhausted";

/**
 * @brief Splits a full gRPC method path into service and method
 *
 * "/accumulo.proxy.AccumuloProxy/NextEntry" -> {"accumulo.proxy.AccumuloProxy", "NextEntry"}
 * A path without the expected shape is returned whole as the method.
 */
std::pair<std::string, std::string> SplitMethodPath(const std::string& full_method);

// What a proxy method addresses: "table", "resource" (scanner/writer id) or "user".
// Empty for anything that is not an AccumuloProxy method.
std::string_view ProxyCallSubject(std::string_view method);

/**
 * @brief Builds a W3C traceparent header value: 00-{trace_id}-{span_id}-{flags}
 */
std::string FormatTraceparent(const opentelemetry::trace::SpanContext& span_context);

/**
 * @brief Client-side gRPC interceptor for proxy calls
 *
 * Starts one client span per outgoing RPC under the "accumulo.proxy.client"
 * scope of the globally registered tracer provider. Spans carry the rpc.*
 * attributes plus accumulo.proxy.subject, and a traceparent header is added
 * to the outgoing metadata. OUT_OF_RANGE from NextEntry marks the scan as
 * exhausted and leaves the span status ok. Without a registered provider
 * the spans are no-ops.
 */
class ClientTracingInterceptor : public grpc::experimental::Interceptor {
public:
    explicit ClientTracingInterceptor(grpc::experimental::ClientRpcInfo* info);

    void Intercept(grpc::experimental::InterceptorBatchMethods* methods) override;

private:
    void OnSendInitialMetadata(grpc::experimental::InterceptorBatchMethods* methods);
    void OnReceiveStatus(const grpc::Status& status);

    grpc::experimental::ClientRpcInfo* rpc_info_;
    std::string method_;
    opentelemetry::nostd::shared_ptr<opentelemetry::trace::Span> span_;
    opentelemetry::nostd::unique_ptr<opentelemetry::trace::Scope> scope_;
};

class ClientTracingInterceptorFactory
    : public grpc::experimental::ClientInterceptorFactoryInterface {
public:
    grpc::experimental::Interceptor* CreateClientInterceptor(
        grpc::experimental::ClientRpcInfo* info) override {
        return new ClientTracingInterceptor(info);
    }
};

/**
 * @brief Creates a channel with the tracing interceptor installed
 *
 * @param target Proxy address (e.g., "127.0.0.1:42424")
 * @param credentials Channel credentials (e.g., grpc::InsecureChannelCredentials())
 */
std::shared_ptr<grpc::Channel> CreateTracedChannel(
    const std::string& target,
    const std::shared_ptr<grpc::ChannelCredentials>& credentials
);

}  // namespace accumulo::tracing
