// Unit tests for the coroutine client: AsyncConnector, AsyncScanner, AsyncWriter

#include <gtest/gtest.h>

#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <boost/asio/io_context.hpp>

#include "accumulo/client_async.h"
#include "accumulo/error.h"
#include "fake_proxy_client.h"
#include "test_util.h"

using accumulo::AsyncConnectionContext;
using accumulo::AsyncConnector;
using accumulo::AsyncScanner;
using accumulo::AsyncWriter;
using accumulo::KeyValue;
using accumulo::Mutation;
using accumulo::PoolExecutor;
using accumulo::UsageError;
using accumulo::testing::fake_factory;
using accumulo::testing::FakeProxyState;
using accumulo::testing::run_sync;
using boost::asio::awaitable;

namespace {

constexpr const char* kSecret = "s3cr3t";

class AsyncClientTest : public ::testing::Test {
protected:
    void SetUp() override {
        state_->add_entry("events", "r1", "cf", "a", "v1");
        state_->add_entry("events", "r2", "cf", "b", "v2");
        state_->tables["empty"];
        executor_ = std::make_shared<PoolExecutor>(accumulo::PoolExecutorOptions{
            .connection_limit = 2, .connection_factory = fake_factory(state_)});
    }

    // Collects a scan to its end.
    awaitable<std::vector<KeyValue>> drain(AsyncScanner& scanner) {
        std::vector<KeyValue> out;
        while (auto kv = co_await scanner.next()) {
            out.push_back(std::move(*kv));
        }
        co_return out;
    }

    std::shared_ptr<FakeProxyState> state_ = std::make_shared<FakeProxyState>();
    boost::asio::io_context io_;
    std::shared_ptr<PoolExecutor> executor_;
};

}  // namespace

TEST_F(AsyncClientTest, ScannerYieldsEntriesThenEndsOnce) {
    AsyncConnector connector(*executor_, kSecret);
    auto task = [&]() -> awaitable<void> {
        auto scanner = co_await connector.create_scanner("events");
        EXPECT_TRUE(scanner.is_open());

        auto entries = co_await drain(scanner);
        ASSERT_EQ(entries.size(), 2u);
        EXPECT_EQ(entries[0].row(), "r1");
        EXPECT_EQ(entries[0].cq(), "a");
        EXPECT_EQ(entries[0].value(), "v1");
        EXPECT_EQ(entries[1].row(), "r2");
        EXPECT_TRUE(scanner.is_exhausted());

        // exhaustion is reported once; asking again is misuse
        bool rejected = false;
        try {
            co_await scanner.next();
        } catch (const UsageError&) {
            rejected = true;
        }
        EXPECT_TRUE(rejected);

        co_await scanner.close();
        EXPECT_FALSE(scanner.is_open());
    };
    run_sync(io_, task());
    EXPECT_TRUE(state_->scanners.empty());
}

TEST_F(AsyncClientTest, EmptyTableEndsImmediately) {
    AsyncConnector connector(*executor_, kSecret);
    auto task = [&]() -> awaitable<std::optional<KeyValue>> {
        auto scanner = co_await connector.create_batch_scanner("empty");
        auto first = co_await scanner.next();
        co_await scanner.close();
        co_return first;
    };
    EXPECT_FALSE(run_sync(io_, task()).has_value());
}

TEST_F(AsyncClientTest, ClosingTwiceIsMisuse) {
    AsyncConnector connector(*executor_, kSecret);
    auto task = [&]() -> awaitable<void> {
        auto scanner = co_await connector.create_scanner("events");
        co_await scanner.close();
        co_await scanner.close();
    };
    EXPECT_THROW(run_sync(io_, task()), UsageError);
    EXPECT_EQ(state_->calls.load(), 2);
}

TEST_F(AsyncClientTest, NextAfterCloseIsMisuse) {
    AsyncConnector connector(*executor_, kSecret);
    auto task = [&]() -> awaitable<void> {
        auto scanner = co_await connector.create_scanner("events");
        co_await scanner.close();
        co_await scanner.next();
    };
    EXPECT_THROW(run_sync(io_, task()), UsageError);
}

TEST_F(AsyncClientTest, ScannerOnMissingTableRaisesNotFound) {
    AsyncConnector connector(*executor_, kSecret);
    auto task = [&]() -> awaitable<void> {
        auto scanner = co_await connector.create_scanner("nope");
    };
    EXPECT_THROW(run_sync(io_, task()), accumulo::TableNotFoundError);
}

TEST_F(AsyncClientTest, RemoteErrorOtherThanExhaustionPropagatesFromNext) {
    AsyncConnector connector(*executor_, kSecret);
    auto task = [&]() -> awaitable<void> {
        auto scanner = co_await connector.create_scanner("events");
        state_->scanners.clear();  // the proxy forgot the scanner
        co_await accumulo::scoped(scanner, [](AsyncScanner& s) -> awaitable<void> {
            co_await s.next();
        });
    };
    EXPECT_THROW(run_sync(io_, task()), accumulo::UnknownResourceError);
}

TEST_F(AsyncClientTest, WriterGroupsMutationsByRowInFirstAppearanceOrder) {
    AsyncConnector connector(*executor_, kSecret);
    auto task = [&]() -> awaitable<void> {
        auto writer = co_await connector.create_writer("events");
        co_await writer.add_mutations({
            Mutation{.row = "r1", .cf = "a"},
            Mutation{.row = "r2", .cf = "c"},
            Mutation{.row = "r1", .cf = "b"},
        });
        co_await writer.close();
    };
    run_sync(io_, task());

    ASSERT_EQ(state_->updates.size(), 1u);
    const auto& cells = state_->updates[0];
    ASSERT_EQ(cells.size(), 2u);
    EXPECT_EQ(cells[0].row(), "r1");
    ASSERT_EQ(cells[0].updates_size(), 2);
    EXPECT_EQ(cells[0].updates(0).col_family(), "a");
    EXPECT_EQ(cells[0].updates(1).col_family(), "b");
    EXPECT_EQ(cells[1].row(), "r2");
    ASSERT_EQ(cells[1].updates_size(), 1);
    EXPECT_EQ(cells[1].updates(0).col_family(), "c");
    EXPECT_TRUE(state_->writers.empty());
}

TEST_F(AsyncClientTest, WriterAfterCloseIsMisuse) {
    AsyncConnector connector(*executor_, kSecret);
    auto task = [&]() -> awaitable<void> {
        auto writer = co_await connector.create_writer("events");
        co_await writer.close();
        co_await writer.add_mutations({Mutation{.row = "r9"}});
    };
    EXPECT_THROW(run_sync(io_, task()), UsageError);
    EXPECT_TRUE(state_->updates.empty());
}

TEST_F(AsyncClientTest, MetadataCallsPassTheSecretAndReturnRemoteValues) {
    AsyncConnector connector(*executor_, kSecret);
    auto task = [&]() -> awaitable<void> {
        EXPECT_TRUE(co_await connector.table_exists("events"));
        EXPECT_FALSE(co_await connector.table_exists("other"));
        co_await connector.create_table("other");
        EXPECT_TRUE(co_await connector.table_exists("other"));
        co_await connector.change_user_authorizations("alice", {"public", "private"});
        auto auths = co_await connector.get_user_authorizations("alice");
        EXPECT_EQ(auths, (accumulo::AuthorizationSet{"private", "public"}));
    };
    run_sync(io_, task());

    ASSERT_EQ(state_->logins.size(), 6u);
    for (const auto& login : state_->logins) {
        EXPECT_EQ(login, kSecret);
    }
    ASSERT_EQ(state_->created_tables.size(), 1u);
    EXPECT_TRUE(state_->created_tables[0].first);
    EXPECT_EQ(state_->created_tables[0].second, accumulo::proxy::MILLIS);
}

TEST_F(AsyncClientTest, CreateTableForwardsLogicalTimeAndNoVersionIterator) {
    AsyncConnector connector(*executor_, kSecret);
    run_sync(io_, connector.create_table("logical", false, accumulo::TimeType::Logical));
    ASSERT_EQ(state_->created_tables.size(), 1u);
    EXPECT_FALSE(state_->created_tables[0].first);
    EXPECT_EQ(state_->created_tables[0].second, accumulo::proxy::LOGICAL);
    EXPECT_THROW(run_sync(io_, connector.create_table("logical")), accumulo::TableExistsError);
}

TEST_F(AsyncClientTest, ScanOptionsReachTheProxyInWireForm) {
    AsyncConnector connector(*executor_, kSecret);
    accumulo::ScanOptions options;
    options.range = accumulo::Range::exact("r1");
    options.authorizations = accumulo::AuthorizationSet{"public"};
    options.buffer_size = 10;
    auto task = [&]() -> awaitable<void> {
        auto scanner = co_await connector.create_scanner("events", options);
        co_await scanner.close();
    };
    run_sync(io_, task());

    ASSERT_EQ(state_->scan_options.size(), 1u);
    const auto& wire = state_->scan_options[0];
    EXPECT_EQ(wire.range().start().row(), "r1");
    EXPECT_EQ(wire.range().stop().row(), std::string("r1\0", 3));
    EXPECT_FALSE(wire.range().stop_inclusive());
    ASSERT_TRUE(wire.has_authorizations());
    EXPECT_EQ(wire.authorizations().values(0), "public");
    EXPECT_EQ(wire.buffer_size(), 10);
}

TEST_F(AsyncClientTest, ScopedClosesResourceOnSuccessAndFailure) {
    AsyncConnector connector(*executor_, kSecret);
    auto ok = [&]() -> awaitable<void> {
        auto scanner = co_await connector.create_scanner("events");
        co_await accumulo::scoped(scanner, [](AsyncScanner& s) -> awaitable<void> {
            co_await s.next();
        });
        EXPECT_FALSE(scanner.is_open());
    };
    run_sync(io_, ok());
    EXPECT_TRUE(state_->scanners.empty());

    auto failing = [&]() -> awaitable<void> {
        auto writer = co_await connector.create_writer("events");
        co_await accumulo::scoped(writer, [](AsyncWriter&) -> awaitable<void> {
            throw std::runtime_error("caller failed");
            co_return;
        });
    };
    EXPECT_THROW(run_sync(io_, failing()), std::runtime_error);
    EXPECT_TRUE(state_->writers.empty());
}

TEST_F(AsyncClientTest, ContextCreatesConnectorsOnItsExecutor) {
    AsyncConnectionContext context(executor_);
    EXPECT_EQ(&context.executor(), executor_.get());
    auto connector = context.create_connector(kSecret);
    EXPECT_TRUE(run_sync(io_, connector.table_exists("events")));
    EXPECT_EQ(state_->logins.back(), kSecret);
}
