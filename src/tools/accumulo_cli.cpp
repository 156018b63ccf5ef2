#include <cstdint>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/use_future.hpp>

#include "absl/flags/flag.h"
#include "absl/flags/parse.h"
#include "absl/flags/usage.h"
#include "absl/strings/str_split.h"
#include "spdlog/spdlog.h"

#include "accumulo/accumulo.h"
#include "accumulo/tracing/trace_log_formatter.h"

ABSL_FLAG(std::string, host, "127.0.0.1", "Proxy host");
ABSL_FLAG(uint16_t, port, 42424, "Proxy port");
ABSL_FLAG(std::string, secret, "", "Shared secret presented on every call");
ABSL_FLAG(std::string, action, "exists", "One of: exists, create, scan, write, auths");
ABSL_FLAG(std::string, table, "", "Table to operate on");
ABSL_FLAG(std::string, user, "root", "User for the auths action");
ABSL_FLAG(std::string, row_prefix, "", "Restrict scan to rows with this prefix");
ABSL_FLAG(std::vector<std::string>, mutations, {},
          "Mutations for the write action, each row:cf:cq:value");
ABSL_FLAG(uint32_t, connections, 1, "Connection limit of the pool");
ABSL_FLAG(uint32_t, threads, 0, "Worker threads (0 = same as connections)");
ABSL_FLAG(std::string, log_level, "info", "spdlog level");
ABSL_FLAG(bool, tracing, false, "Trace proxy calls and tag log lines with span ids");

namespace {

using accumulo::AsyncConnector;
using boost::asio::awaitable;

awaitable<int> scan(AsyncConnector& connector, const std::string& table, const std::string& prefix) {
    accumulo::ScanOptions options;
    if (!prefix.empty()) {
        options.range = accumulo::Range::prefix(prefix);
    }
    auto scanner = co_await connector.create_scanner(table, options);
    std::size_t count = 0;
    co_await accumulo::scoped(scanner, [&count](accumulo::AsyncScanner& s) -> awaitable<void> {
        while (auto kv = co_await s.next()) {
            std::cout << *kv << "\n";
            ++count;
        }
    });
    spdlog::info("Scanned {} entries from {}", count, table);
    co_return 0;
}

awaitable<int> write(AsyncConnector& connector, const std::string& table, const std::vector<std::string>& specs) {
    std::vector<accumulo::Mutation> mutations;
    for (const auto& spec : specs) {
        std::vector<std::string> parts = absl::StrSplit(spec, absl::MaxSplits(':', 3));
        if (parts.size() != 4) {
            spdlog::error("Bad mutation '{}', expected row:cf:cq:value", spec);
            co_return 2;
        }
        mutations.push_back(accumulo::Mutation{
            .row = parts[0], .cf = parts[1], .cq = parts[2], .value = parts[3]});
    }
    auto writer = co_await connector.create_writer(table);
    co_await accumulo::scoped(writer, [&mutations](accumulo::AsyncWriter& w) -> awaitable<void> {
        co_await w.add_mutations(mutations);
    });
    spdlog::info("Wrote {} mutations to {}", mutations.size(), table);
    co_return 0;
}

awaitable<int> run_action(accumulo::PoolExecutor& executor) {
    AsyncConnector connector(executor, absl::GetFlag(FLAGS_secret));
    const std::string action = absl::GetFlag(FLAGS_action);
    const std::string table = absl::GetFlag(FLAGS_table);

    int rc = 0;
    if (action == "exists") {
        bool exists = co_await connector.table_exists(table);
        std::cout << table << (exists ? " exists" : " does not exist") << "\n";
    } else if (action == "create") {
        co_await connector.create_table(table);
        spdlog::info("Created table {}", table);
    } else if (action == "scan") {
        rc = co_await scan(connector, table, absl::GetFlag(FLAGS_row_prefix));
    } else if (action == "write") {
        rc = co_await write(connector, table, absl::GetFlag(FLAGS_mutations));
    } else if (action == "auths") {
        for (const auto& auth : co_await connector.get_user_authorizations(absl::GetFlag(FLAGS_user))) {
            std::cout << auth << "\n";
        }
    } else {
        spdlog::error("Unknown action '{}'", action);
        rc = 2;
    }
    executor.close();
    co_return rc;
}

}  // namespace

int main(int argc, char** argv) {
    absl::SetProgramUsageMessage("Runs one operation against an Accumulo proxy");
    absl::ParseCommandLine(argc, argv);

    spdlog::set_level(spdlog::level::from_str(absl::GetFlag(FLAGS_log_level)));
    if (absl::GetFlag(FLAGS_tracing)) {
        accumulo::tracing::SetTraceLogging();
    }

    accumulo::ConnectionParams params;
    params.hostname = absl::GetFlag(FLAGS_host);
    params.port = absl::GetFlag(FLAGS_port);
    params.enable_tracing = absl::GetFlag(FLAGS_tracing);

    if (absl::GetFlag(FLAGS_connections) == 0) {
        spdlog::error("--connections must be at least 1");
        return 2;
    }

    std::optional<accumulo::PoolExecutor> executor;
    try {
        executor.emplace(accumulo::PoolExecutorOptions{
            .connection_limit = absl::GetFlag(FLAGS_connections),
            .max_threads = absl::GetFlag(FLAGS_threads),
            .connection_factory = accumulo::make_connection_factory(params),
            .metrics_registry = nullptr,
            .name = "accumulo-cli"
        });
    } catch (const std::invalid_argument& e) {
        spdlog::error("Bad pool settings: {}", e.what());
        return 2;
    }

    boost::asio::io_context io;
    auto result = boost::asio::co_spawn(io, run_action(*executor), boost::asio::use_future);
    io.run();
    try {
        return result.get();
    } catch (const accumulo::AccumuloError& e) {
        spdlog::error("{} failed: {}", absl::GetFlag(FLAGS_action), e.what());
        return 1;
    }
}
