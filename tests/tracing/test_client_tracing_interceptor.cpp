/**
 * Tracing Tests: ClientTracingInterceptor over a real channel
 *
 * These tests verify:
 * - one client span per proxy call, named service/method, in the accumulo.proxy.client scope
 * - rpc.* and accumulo.proxy.subject attributes plus the received status code
 * - the traceparent header the proxy receives names the recorded span
 * - an exhausted scan is ok while other failures mark the span as an error
 * - an active span in the caller becomes the parent of the call span
 */

#include <gtest/gtest.h>
#include <grpcpp/grpcpp.h>

#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "accumulo/error.h"
#include "accumulo/grpc_proxy_client.h"
#include "accumulo/tracing/grpc_tracing_interceptor.h"
#include "accumulo_proxy.grpc.pb.h"

#include "opentelemetry/sdk/trace/exporter.h"
#include "opentelemetry/sdk/trace/simple_processor.h"
#include "opentelemetry/sdk/trace/span_data.h"
#include "opentelemetry/sdk/trace/tracer_provider.h"
#include "opentelemetry/trace/noop.h"
#include "opentelemetry/trace/provider.h"
#include "opentelemetry/trace/scope.h"

using namespace std::chrono_literals;
using grpc::ServerContext;
using grpc::Status;
using grpc::StatusCode;

namespace proxy = accumulo::proxy;
namespace nostd = opentelemetry::nostd;
namespace sdktrace = opentelemetry::sdk::trace;
namespace trace_api = opentelemetry::trace;

namespace {

struct RecordedSpans {
    std::mutex mutex;
    std::vector<std::unique_ptr<sdktrace::SpanData>> spans;
};

// Keeps every finished span in memory.
class RecordingExporter final : public sdktrace::SpanExporter {
public:
    explicit RecordingExporter(std::shared_ptr<RecordedSpans> store) : store_(std::move(store)) {}

    std::unique_ptr<sdktrace::Recordable> MakeRecordable() noexcept override {
        return std::unique_ptr<sdktrace::Recordable>(new sdktrace::SpanData);
    }

    opentelemetry::sdk::common::ExportResult Export(
        const nostd::span<std::unique_ptr<sdktrace::Recordable>>& spans) noexcept override {
        std::lock_guard<std::mutex> lock(store_->mutex);
        for (auto& recordable : spans) {
            store_->spans.emplace_back(static_cast<sdktrace::SpanData*>(recordable.release()));
        }
        return opentelemetry::sdk::common::ExportResult::kSuccess;
    }

    bool ForceFlush(std::chrono::microseconds) noexcept override { return true; }

    bool Shutdown(std::chrono::microseconds) noexcept override { return true; }

private:
    std::shared_ptr<RecordedSpans> store_;
};

// Remembers the traceparent of each call; NextEntry and GetUserAuthorizations answer with set statuses.
class HeaderRecordingProxy final : public proxy::AccumuloProxy::Service {
public:
    Status TableExists(ServerContext* context, const proxy::TableExistsRequest*,
                       proxy::TableExistsReply* reply) override {
        remember(context);
        reply->set_exists(true);
        return Status::OK;
    }

    Status NextEntry(ServerContext* context, const proxy::ResourceId*, proxy::KeyValueAndPeek*) override {
        remember(context);
        return Status(StatusCode::OUT_OF_RANGE, "no more entries");
    }

    Status GetUserAuthorizations(ServerContext* context, const proxy::GetUserAuthorizationsRequest*,
                                 proxy::AuthorizationsReply*) override {
        remember(context);
        return Status(StatusCode::NOT_FOUND, "user root");
    }

    std::vector<std::string> traceparents() {
        std::lock_guard<std::mutex> lock(mutex_);
        return traceparents_;
    }

private:
    void remember(ServerContext* context) {
        const auto& metadata = context->client_metadata();
        auto it = metadata.find(accumulo::tracing::kTraceparentHeader);
        std::lock_guard<std::mutex> lock(mutex_);
        traceparents_.push_back(it == metadata.end() ? std::string()
                                                     : std::string(it->second.data(), it->second.size()));
    }

    std::mutex mutex_;
    std::vector<std::string> traceparents_;
};

std::string StringAttribute(const sdktrace::SpanData& span, const std::string& key) {
    const auto& attributes = span.GetAttributes();
    auto it = attributes.find(key);
    if (it == attributes.end()) return "<missing>";
    return nostd::get<std::string>(it->second);
}

std::string Hex(const trace_api::TraceId& id) {
    char buffer[32];
    id.ToLowerBase16(buffer);
    return std::string(buffer, 32);
}

std::string Hex(const trace_api::SpanId& id) {
    char buffer[16];
    id.ToLowerBase16(buffer);
    return std::string(buffer, 16);
}

class ClientTracingInterceptorTest : public ::testing::Test {
protected:
    void SetUp() override {
        recorded_ = std::make_shared<RecordedSpans>();
        auto processor = std::unique_ptr<sdktrace::SpanProcessor>(
            new sdktrace::SimpleSpanProcessor(std::make_unique<RecordingExporter>(recorded_)));
        trace_api::Provider::SetTracerProvider(
            nostd::shared_ptr<trace_api::TracerProvider>(new sdktrace::TracerProvider(std::move(processor))));

        grpc::ServerBuilder builder;
        builder.AddListeningPort("127.0.0.1:0", grpc::InsecureServerCredentials(), &port_);
        builder.RegisterService(&service_);
        server_ = builder.BuildAndStart();
        ASSERT_NE(server_, nullptr);

        client_ = std::make_unique<accumulo::GrpcProxyClient>(
            accumulo::tracing::CreateTracedChannel("127.0.0.1:" + std::to_string(port_),
                                                   grpc::InsecureChannelCredentials()),
            5000ms);
    }

    void TearDown() override {
        client_.reset();
        if (server_) server_->Shutdown();
        trace_api::Provider::SetTracerProvider(
            nostd::shared_ptr<trace_api::TracerProvider>(new trace_api::NoopTracerProvider()));
    }

    std::vector<const sdktrace::SpanData*> client_spans() {
        std::vector<const sdktrace::SpanData*> found;
        std::lock_guard<std::mutex> lock(recorded_->mutex);
        for (const auto& span : recorded_->spans) {
            if (span->GetSpanKind() == trace_api::SpanKind::kClient) found.push_back(span.get());
        }
        return found;
    }

    std::shared_ptr<RecordedSpans> recorded_;
    HeaderRecordingProxy service_;
    std::unique_ptr<grpc::Server> server_;
    int port_ = 0;
    std::unique_ptr<accumulo::GrpcProxyClient> client_;
};

TEST_F(ClientTracingInterceptorTest, OneSpanPerCallWithProxyAttributes) {
    EXPECT_TRUE(client_->table_exists("token", "events"));
    EXPECT_TRUE(client_->table_exists("token", "events"));

    auto spans = client_spans();
    ASSERT_EQ(spans.size(), 2u);
    const auto& span = *spans[0];
    EXPECT_EQ(std::string(span.GetName()), "accumulo.proxy.AccumuloProxy/TableExists");
    EXPECT_EQ(std::string(span.GetInstrumentationScope().GetName()), accumulo::tracing::kInstrumentationScope);
    EXPECT_EQ(StringAttribute(span, "rpc.system"), "grpc");
    EXPECT_EQ(StringAttribute(span, "rpc.service"), "accumulo.proxy.AccumuloProxy");
    EXPECT_EQ(StringAttribute(span, "rpc.method"), "TableExists");
    EXPECT_EQ(StringAttribute(span, accumulo::tracing::kProxySubjectAttribute), "table");
    EXPECT_EQ(nostd::get<int32_t>(span.GetAttributes().at("rpc.grpc.status_code")), 0);
    EXPECT_EQ(span.GetStatus(), trace_api::StatusCode::kOk);
    EXPECT_NE(Hex(spans[0]->GetSpanId()), Hex(spans[1]->GetSpanId()));
}

TEST_F(ClientTracingInterceptorTest, ProxyReceivesTheSpanAsTraceparent) {
    client_->table_exists("token", "events");

    auto spans = client_spans();
    ASSERT_EQ(spans.size(), 1u);
    auto headers = service_.traceparents();
    ASSERT_EQ(headers.size(), 1u);
    EXPECT_EQ(headers[0], "00-" + Hex(spans[0]->GetTraceId()) + "-" + Hex(spans[0]->GetSpanId()) + "-01");
}

TEST_F(ClientTracingInterceptorTest, ExhaustedScanIsNotAnError) {
    EXPECT_THROW(client_->next_entry("s1"), accumulo::NoMoreEntriesError);

    auto spans = client_spans();
    ASSERT_EQ(spans.size(), 1u);
    const auto& span = *spans[0];
    EXPECT_EQ(StringAttribute(span, accumulo::tracing::kProxySubjectAttribute), "resource");
    EXPECT_EQ(nostd::get<int32_t>(span.GetAttributes().at("rpc.grpc.status_code")),
              static_cast<int32_t>(StatusCode::OUT_OF_RANGE));
    EXPECT_TRUE(nostd::get<bool>(span.GetAttributes().at(accumulo::tracing::kScanExhaustedAttribute)));
    EXPECT_EQ(span.GetStatus(), trace_api::StatusCode::kOk);
}

TEST_F(ClientTracingInterceptorTest, FailedCallMarksTheSpanAsError) {
    EXPECT_THROW(client_->get_user_authorizations("token", "root"), accumulo::SecurityError);

    auto spans = client_spans();
    ASSERT_EQ(spans.size(), 1u);
    const auto& span = *spans[0];
    EXPECT_EQ(StringAttribute(span, accumulo::tracing::kProxySubjectAttribute), "user");
    EXPECT_EQ(nostd::get<int32_t>(span.GetAttributes().at("rpc.grpc.status_code")),
              static_cast<int32_t>(StatusCode::NOT_FOUND));
    EXPECT_EQ(span.GetStatus(), trace_api::StatusCode::kError);
    EXPECT_EQ(std::string(span.GetDescription()), "user root");
    EXPECT_EQ(span.GetAttributes().count(accumulo::tracing::kScanExhaustedAttribute), 0u);
}

TEST_F(ClientTracingInterceptorTest, ActiveSpanBecomesTheParent) {
    auto tracer = trace_api::Provider::GetTracerProvider()->GetTracer("caller");
    auto outer = tracer->StartSpan("load-events");
    {
        trace_api::Scope scope(outer);
        client_->table_exists("token", "events");
    }
    outer->End();

    auto spans = client_spans();
    ASSERT_EQ(spans.size(), 1u);
    EXPECT_EQ(Hex(spans[0]->GetTraceId()), Hex(outer->GetContext().trace_id()));
    EXPECT_EQ(Hex(spans[0]->GetParentSpanId()), Hex(outer->GetContext().span_id()));
}

TEST(ClientTracingWithoutProviderTest, NoTraceparentIsSent) {
    trace_api::Provider::SetTracerProvider(
        nostd::shared_ptr<trace_api::TracerProvider>(new trace_api::NoopTracerProvider()));
    HeaderRecordingProxy service;
    int port = 0;
    grpc::ServerBuilder builder;
    builder.AddListeningPort("127.0.0.1:0", grpc::InsecureServerCredentials(), &port);
    builder.RegisterService(&service);
    auto server = builder.BuildAndStart();
    ASSERT_NE(server, nullptr);

    accumulo::GrpcProxyClient client(accumulo::tracing::CreateTracedChannel(
        "127.0.0.1:" + std::to_string(port), grpc::InsecureChannelCredentials()));
    EXPECT_TRUE(client.table_exists("token", "events"));

    auto headers = service.traceparents();
    ASSERT_EQ(headers.size(), 1u);
    EXPECT_EQ(headers[0], "");
    server->Shutdown();
}

}  // namespace
