// Copyright 2025 CppGrpcAccumulo Project
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <memory>
#include <string>

#include <spdlog/pattern_formatter.h>
#include <spdlog/spdlog.h>
#include <opentelemetry/trace/span.h>
#include <opentelemetry/trace/span_context.h>
#include <opentelemetry/trace/tracer.h>

namespace accumulo::tracing {

/**
 * @brief spdlog formatter that appends the active span's ids
 *
 * Output: "<pattern output> [trace_id=<32 hex>] [span_id=<16 hex>]". Lines
 * logged outside a valid span are left as the pattern produced them.
 */
class TraceLogFormatter : public spdlog::formatter {
public:
    explicit TraceLogFormatter(const std::string& pattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v")
        : pattern_(pattern), base_formatter_(std::make_unique<spdlog::pattern_formatter>(pattern)) {}

    void format(const spdlog::details::log_msg& msg, spdlog::memory_buf_t& dest) override {
        spdlog::memory_buf_t base;
        base_formatter_->format(msg, base);

        const std::string suffix = trace_suffix();
        std::size_t end = base.size();
        const bool has_newline = end > 0 && base.data()[end - 1] == '\n';
        if (has_newline) {
            --end;
        }
        dest.append(base.data(), base.data() + end);
        dest.append(suffix.data(), suffix.data() + suffix.size());
        if (has_newline) {
            dest.push_back('\n');
        }
    }

    std::unique_ptr<spdlog::formatter> clone() const override {
        return std::make_unique<TraceLogFormatter>(pattern_);
    }

private:
    static std::string trace_suffix() {
        auto context = opentelemetry::trace::Tracer::GetCurrentSpan()->GetContext();
        if (!context.IsValid()) {
            return {};
        }
        char trace_id[32];
        char span_id[16];
        context.trace_id().ToLowerBase16(trace_id);
        context.span_id().ToLowerBase16(span_id);
        return " [trace_id=" + std::string(trace_id, 32) + "] [span_id=" + std::string(span_id, 16) + "]";
    }

    std::string pattern_;
    std::unique_ptr<spdlog::formatter> base_formatter_;
};

inline void SetTraceLogging() {
    spdlog::set_formatter(std::make_unique<TraceLogFormatter>());
}

}  // namespace accumulo::tracing
