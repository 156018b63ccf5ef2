// Copyright 2025 CppGrpcAccumulo Project
// SPDX-License-Identifier: Apache-2.0

#include "accumulo/tracing/grpc_tracing_interceptor.h"

#include <array>

#include "opentelemetry/semconv/incubating/rpc_attributes.h"
#include "opentelemetry/trace/provider.h"
#include "opentelemetry/trace/span_context.h"
#include "opentelemetry/trace/span_startoptions.h"

#include <spdlog/spdlog.h>

namespace accumulo::tracing {

namespace trace_api = opentelemetry::trace;
namespace semconv_rpc = opentelemetry::semconv::rpc;

namespace {

struct MethodSubject {
    std::string_view method;
    std::string_view subject;
};

constexpr std::array<MethodSubject, 11> kMethodSubjects{{
    {"CreateScanner", "table"},
    {"CreateBatchScanner", "table"},
    {"CreateWriter", "table"},
    {"CreateTable", "table"},
    {"TableExists", "table"},
    {"NextEntry", "resource"},
    {"CloseScanner", "resource"},
    {"CloseWriter", "resource"},
    {"Update", "resource"},
    {"ChangeUserAuthorizations", "user"},
    {"GetUserAuthorizations", "user"},
}};

}  // namespace

std::pair<std::string, std::string> SplitMethodPath(const std::string& full_method) {
    // "/package.Service/Method"
    if (full_method.empty() || full_method[0] != '/') {
        return {"", full_method};
    }
    auto last_slash = full_method.find_last_of('/');
    if (last_slash <= 1 || last_slash + 1 >= full_method.size()) {
        return {"", full_method};
    }
    return {full_method.substr(1, last_slash - 1), full_method.substr(last_slash + 1)};
}

std::string_view ProxyCallSubject(std::string_view method) {
    for (const auto& entry : kMethodSubjects) {
        if (entry.method == method) {
            return entry.subject;
        }
    }
    return {};
}

std::string FormatTraceparent(const trace_api::SpanContext& span_context) {
    char trace_id[32];
    char span_id[16];
    span_context.trace_id().ToLowerBase16(trace_id);
    span_context.span_id().ToLowerBase16(span_id);

    std::string traceparent = "00-";
    traceparent.append(trace_id, 32);
    traceparent.append("-");
    traceparent.append(span_id, 16);
    traceparent.append(span_context.trace_flags().IsSampled() ? "-01" : "-00");
    return traceparent;
}

ClientTracingInterceptor::ClientTracingInterceptor(grpc::experimental::ClientRpcInfo* info)
    : rpc_info_(info) {}

void ClientTracingInterceptor::Intercept(grpc::experimental::InterceptorBatchMethods* methods) {
    using grpc::experimental::InterceptionHookPoints;

    if (methods->QueryInterceptionHookPoint(InterceptionHookPoints::PRE_SEND_INITIAL_METADATA)) {
        OnSendInitialMetadata(methods);
    }
    if (methods->QueryInterceptionHookPoint(InterceptionHookPoints::POST_RECV_STATUS)) {
        if (const grpc::Status* status = methods->GetRecvStatus(); status && span_) {
            OnReceiveStatus(*status);
        }
    }
    methods->Proceed();
}

void ClientTracingInterceptor::OnSendInitialMetadata(grpc::experimental::InterceptorBatchMethods* methods) {
    auto [service, method] = SplitMethodPath(rpc_info_->method());
    method_ = method;

    auto tracer = trace_api::Provider::GetTracerProvider()->GetTracer(kInstrumentationScope);
    trace_api::StartSpanOptions options;
    options.kind = trace_api::SpanKind::kClient;
    span_ = tracer->StartSpan(service.empty() ? method : service + "/" + method, options);

    span_->SetAttribute(semconv_rpc::kRpcSystem, "grpc");
    span_->SetAttribute(semconv_rpc::kRpcService, service);
    span_->SetAttribute(semconv_rpc::kRpcMethod, method);
    if (auto subject = ProxyCallSubject(method); !subject.empty()) {
        span_->SetAttribute(kProxySubjectAttribute,
                            opentelemetry::nostd::string_view(subject.data(), subject.size()));
    }
    scope_.reset(new trace_api::Scope(span_));

    auto context = span_->GetContext();
    if (!context.IsValid()) {
        // No tracer provider registered
        return;
    }
    auto traceparent = FormatTraceparent(context);
    if (auto* metadata = methods->GetSendInitialMetadata()) {
        metadata->insert(std::make_pair(std::string(kTraceparentHeader), traceparent));
    }
    spdlog::debug("Proxy call {} traced as {}", method_, traceparent);
}

void ClientTracingInterceptor::OnReceiveStatus(const grpc::Status& status) {
    span_->SetAttribute("rpc.grpc.status_code", static_cast<int>(status.error_code()));

    // A drained scanner answers NextEntry with OUT_OF_RANGE; that ends a scan, it is not a failure.
    const bool exhausted = method_ == "NextEntry" && status.error_code() == grpc::StatusCode::OUT_OF_RANGE;
    if (exhausted) {
        span_->SetAttribute(kScanExhaustedAttribute, true);
    }
    if (status.ok() || exhausted) {
        span_->SetStatus(trace_api::StatusCode::kOk);
    } else {
        span_->SetStatus(trace_api::StatusCode::kError, status.error_message());
    }
    span_->End();
    scope_.reset();
}

std::shared_ptr<grpc::Channel> CreateTracedChannel(
    const std::string& target,
    const std::shared_ptr<grpc::ChannelCredentials>& credentials) {
    std::vector<std::unique_ptr<grpc::experimental::ClientInterceptorFactoryInterface>> factories;
    factories.push_back(std::make_unique<ClientTracingInterceptorFactory>());
    return grpc::experimental::CreateCustomChannelWithInterceptors(
        target, credentials, grpc::ChannelArguments(), std::move(factories));
}

}  // namespace accumulo::tracing
