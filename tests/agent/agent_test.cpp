#include "hostwatch/agent/agent.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <thread>

#include "hostwatch/server/server.hpp"
#include "support/fake_probe.hpp"
#include "support/memory_store.hpp"

namespace hostwatch::agent::test {

using namespace std::chrono_literals;

class AgentTest : public ::testing::Test {
protected:
    void SetUp() override {
        server::ServerOptions opts;
        opts.port = 0;
        server_ = std::make_unique<server::Server>(store_, commands_, opts);
        server_->start();

        options_.transport.port = server_->port();
        options_.transport.response_timeout_seconds = 5;
        options_.sampler.period = 30ms;
    }

    void TearDown() override {
        server_->stop();
    }

    // runs the agent, forcing a stop if it has not returned within the deadline
    StopReason run_with_deadline(Agent& agent, std::chrono::seconds deadline) {
        std::atomic<bool> done{false};
        std::thread watchdog([&] {
            auto until = std::chrono::steady_clock::now() + deadline;
            while (!done && std::chrono::steady_clock::now() < until) {
                std::this_thread::sleep_for(10ms);
            }
            agent.request_stop();
        });
        StopReason reason = agent.run();
        done = true;
        watchdog.join();
        return reason;
    }

    const proto::CollectorId id_ = proto::CollectorId::from_u64(42);
    hostwatch::test::MemoryMetricsStore store_;
    server::CommandStore commands_;
    std::unique_ptr<server::Server> server_;
    hostwatch::test::FakeProbe probe_;
    AgentOptions options_;
};

TEST_F(AgentTest, PendingShutdownStopsAgent) {
    commands_.set(id_, proto::TaskType::Shutdown);

    Agent agent(options_, id_, probe_);
    EXPECT_EQ(run_with_deadline(agent, 10s), StopReason::ShutdownTask);

    // the sample that triggered the cycle was delivered first
    auto rows = store_.for_collector(id_);
    ASSERT_EQ(rows.size(), 1u);
    EXPECT_EQ(rows[0].total_memory, probe_.total);
    EXPECT_EQ(rows[0].used_memory, probe_.used);
    EXPECT_FLOAT_EQ(rows[0].average_cpu, 15.0f);
    EXPECT_EQ(commands_.size(), 0u);
}

TEST_F(AgentTest, ShutdownIssuedWhileRunning) {
    Agent agent(options_, id_, probe_);

    std::thread operator_thread([this] {
        auto until = std::chrono::steady_clock::now() + 5s;
        while (store_.size() < 3 && std::chrono::steady_clock::now() < until) {
            std::this_thread::sleep_for(5ms);
        }
        commands_.set(id_, proto::TaskType::Shutdown);
    });

    EXPECT_EQ(run_with_deadline(agent, 10s), StopReason::ShutdownTask);
    operator_thread.join();

    EXPECT_GE(store_.size(), 3u);
    EXPECT_EQ(agent.frames_pending(), 0u);
}

TEST_F(AgentTest, RequestStop) {
    Agent agent(options_, id_, probe_);

    std::thread stopper([&agent] {
        std::this_thread::sleep_for(150ms);
        agent.request_stop();
    });

    EXPECT_EQ(agent.run(), StopReason::StopRequested);
    stopper.join();
}

TEST_F(AgentTest, UnreachableServerKeepsFrames) {
    server_->stop();

    Agent agent(options_, id_, probe_);
    std::thread stopper([&agent] {
        auto until = std::chrono::steady_clock::now() + 5s;
        while (agent.frames_pending() < 3 && std::chrono::steady_clock::now() < until) {
            std::this_thread::sleep_for(5ms);
        }
        agent.request_stop();
    });

    EXPECT_EQ(run_with_deadline(agent, 10s), StopReason::StopRequested);
    stopper.join();
    EXPECT_GE(agent.frames_pending(), 3u);
    EXPECT_EQ(store_.size(), 0u);
}

TEST_F(AgentTest, QueueCapBoundsBacklog) {
    server_->stop();
    options_.max_queued_frames = 2;

    Agent agent(options_, id_, probe_);
    std::thread stopper([&agent] {
        std::this_thread::sleep_for(400ms);
        agent.request_stop();
    });

    EXPECT_EQ(agent.run(), StopReason::StopRequested);
    stopper.join();
    EXPECT_LE(agent.frames_pending(), 2u);
}

}  // namespace hostwatch::agent::test
