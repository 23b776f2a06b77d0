#include "hostwatch/server/server.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "hostwatch/storage/sqlite_store.hpp"
#include "support/memory_store.hpp"
#include "support/socket_client.hpp"

namespace hostwatch::server::test {

using hostwatch::test::SocketClient;
using proto::CollectorId;
using proto::Response;
using proto::TaskType;

namespace {

proto::SubmitData submit(uint64_t id, uint64_t used) {
    return proto::SubmitData{CollectorId::from_u64(id), 16000, used, 10.0f};
}

proto::RequestWork request(uint64_t id) {
    return proto::RequestWork{CollectorId::from_u64(id)};
}

}  // namespace

class ServerTest : public ::testing::Test {
   protected:
    void SetUp() override {
        ServerOptions opts;
        opts.port = 0;  // let the kernel pick, read back with port()
        opts.client_timeout_seconds = 5;
        server_ = std::make_unique<Server>(store_, commands_, opts);
        server_->start();
    }

    void TearDown() override {
        if (server_) {
            server_->stop();
        }
    }

    hostwatch::test::MemoryMetricsStore store_;
    CommandStore commands_;
    std::unique_ptr<Server> server_;
};

TEST_F(ServerTest, BindsEphemeralPort) {
    EXPECT_TRUE(server_->running());
    EXPECT_NE(server_->port(), 0);
}

TEST_F(ServerTest, SubmitDataIsAcked) {
    SocketClient client(server_->port());
    ASSERT_TRUE(client.connected());

    auto response = client.round_trip(submit(1, 500));
    ASSERT_TRUE(response.has_value());
    EXPECT_EQ(*response, Response::ack());
    EXPECT_EQ(store_.size(), 1u);
}

TEST_F(ServerTest, ShutdownScenario) {
    SocketClient agent(server_->port());
    ASSERT_TRUE(agent.connected());

    const proto::SubmitData sample{CollectorId::from_u64(42), 16000000000, 8000000000, 37.5f};
    EXPECT_EQ(agent.round_trip(sample), Response::ack());

    auto rows = store_.for_collector(CollectorId::from_u64(42));
    ASSERT_EQ(rows.size(), 1u);
    EXPECT_EQ(rows[0].collector_id, CollectorId::from_u64(42));
    EXPECT_EQ(rows[0].total_memory, 16000000000u);
    EXPECT_EQ(rows[0].used_memory, 8000000000u);
    EXPECT_FLOAT_EQ(rows[0].average_cpu, 37.5f);
    EXPECT_GT(rows[0].received, 0);

    EXPECT_EQ(agent.round_trip(request(42)), Response::no_work());

    {
        SocketClient admin(server_->port());
        ASSERT_TRUE(admin.connected());
        ASSERT_TRUE(admin.send_text("SHUTDOWN 00000000-0000-0000-0000-00000000002a\n"));
        EXPECT_EQ(admin.read_line(), std::optional<std::string>("OK"));
    }

    EXPECT_EQ(agent.round_trip(request(42)), Response::make_task(TaskType::Shutdown));
    EXPECT_EQ(agent.round_trip(request(42)), Response::no_work());
}

TEST_F(ServerTest, CommandIsScopedToItsCollector) {
    commands_.set(CollectorId::from_u64(2), TaskType::Shutdown);

    SocketClient one(server_->port());
    SocketClient two(server_->port());
    EXPECT_EQ(one.round_trip(request(1)), Response::no_work());
    EXPECT_EQ(two.round_trip(request(2)), Response::make_task(TaskType::Shutdown));
}

TEST_F(ServerTest, ConcurrentCollectorsAreIndependent) {
    constexpr int kFrames = 50;

    auto run = [this](uint64_t id) {
        SocketClient client(server_->port());
        ASSERT_TRUE(client.connected());
        for (int i = 0; i < kFrames; ++i) {
            auto response = client.round_trip(submit(id, static_cast<uint64_t>(i)));
            ASSERT_TRUE(response.has_value());
            ASSERT_EQ(*response, Response::ack());
        }
    };

    std::thread a(run, 1);
    std::thread b(run, 2);
    a.join();
    b.join();

    auto rows_a = store_.for_collector(CollectorId::from_u64(1));
    auto rows_b = store_.for_collector(CollectorId::from_u64(2));
    ASSERT_EQ(rows_a.size(), static_cast<std::size_t>(kFrames));
    ASSERT_EQ(rows_b.size(), static_cast<std::size_t>(kFrames));
    // each connection's rows arrive whole and in the order it sent them
    for (int i = 0; i < kFrames; ++i) {
        EXPECT_EQ(rows_a[i].collector_id, CollectorId::from_u64(1));
        EXPECT_EQ(rows_a[i].used_memory, static_cast<uint64_t>(i));
        EXPECT_EQ(rows_b[i].collector_id, CollectorId::from_u64(2));
        EXPECT_EQ(rows_b[i].used_memory, static_cast<uint64_t>(i));
    }
}

TEST_F(ServerTest, CorruptFrameClosesOnlyThatConnection) {
    SocketClient good(server_->port());
    SocketClient bad(server_->port());
    ASSERT_TRUE(good.connected());
    ASSERT_TRUE(bad.connected());

    EXPECT_EQ(good.round_trip(submit(1, 1)), Response::ack());

    auto frame = proto::WireCodec::encode(submit(2, 2));
    frame[proto::WireCodec::kHeaderSize + 3] ^= 0x40;
    ASSERT_TRUE(bad.send_bytes(frame));
    EXPECT_TRUE(bad.wait_for_close());

    EXPECT_EQ(good.round_trip(submit(1, 2)), Response::ack());
    EXPECT_EQ(store_.size(), 2u);
}

TEST_F(ServerTest, PersistFailureSendsNothing) {
    store_.fail_inserts = true;
    SocketClient client(server_->port());
    ASSERT_TRUE(client.send_bytes(proto::WireCodec::encode(submit(1, 1))));

    // the next response on the stream belongs to the second frame
    EXPECT_EQ(client.round_trip(request(1)), Response::no_work());
    EXPECT_EQ(store_.size(), 0u);
}

TEST_F(ServerTest, AdminSessionMultipleCommands) {
    SocketClient admin(server_->port());
    ASSERT_TRUE(admin.send_text("PING\r\nCOLLECTORS\nQUIT\n"));

    EXPECT_EQ(admin.read_line(), std::optional<std::string>("OK PONG"));
    EXPECT_EQ(admin.read_line(), std::optional<std::string>("OK 0"));
    EXPECT_EQ(admin.read_line(), std::optional<std::string>("BYE"));
    EXPECT_TRUE(admin.wait_for_close());
}

TEST_F(ServerTest, StopDisconnectsIdleClients) {
    SocketClient client(server_->port());
    EXPECT_EQ(client.round_trip(request(1)), Response::no_work());

    server_->stop();
    EXPECT_FALSE(server_->running());
    EXPECT_TRUE(client.wait_for_close());
}

TEST(ServerOptionsTest, AdminDisabledTreatsTextAsBadFrame) {
    hostwatch::test::MemoryMetricsStore store;
    CommandStore commands;
    ServerOptions opts;
    opts.port = 0;
    opts.admin_enabled = false;
    Server server(store, commands, opts);
    server.start();

    SocketClient client(server.port());
    ASSERT_TRUE(client.send_text("SHUTDOWN 42\nPING\n"));
    EXPECT_TRUE(client.wait_for_close());
    EXPECT_EQ(commands.size(), 0u);

    server.stop();
}

TEST(ServerOptionsTest, BindFailureThrows) {
    hostwatch::test::MemoryMetricsStore store;
    CommandStore commands;
    ServerOptions opts;
    opts.host = "not-an-address";
    Server server(store, commands, opts);
    EXPECT_THROW(server.start(), std::runtime_error);
    EXPECT_FALSE(server.running());
}

// whole server path down to sqlite
TEST(ServerSqliteTest, SubmitDataLandsInDatabase) {
    auto dir = std::filesystem::temp_directory_path() / "hostwatch_server_sqlite_test";
    std::filesystem::remove_all(dir);
    {
        storage::SqliteMetricsStore store({dir / "telemetry.db", 2});
        CommandStore commands;
        ServerOptions opts;
        opts.port = 0;
        Server server(store, commands, opts);
        server.start();

        SocketClient client(server.port());
        auto frame = proto::WireCodec::encode(submit(42, 777), 1700000042);
        ASSERT_TRUE(client.send_bytes(frame));
        EXPECT_EQ(client.read_response(), Response::ack());

        server.stop();

        auto rows = store.for_collector(CollectorId::from_u64(42));
        ASSERT_EQ(rows.size(), 1u);
        EXPECT_EQ(rows[0].received, 1700000042);
        EXPECT_EQ(rows[0].used_memory, 777u);
    }
    std::filesystem::remove_all(dir);
}

}  // namespace hostwatch::server::test
