#include <gtest/gtest.h>
#include <thread>
#include "../../src/engine/politeness/politeness_gate.hpp"
#include "fake_http_client.hpp"

using namespace Spoor::Engine::Politeness;
using namespace Spoor::Testing;
using namespace std::chrono_literals;

class PolitenessGateTest : public ::testing::Test {
protected:
    std::shared_ptr<FakeWeb> web = std::make_shared<FakeWeb>();
    FakeHttpClient           client{web};
};

TEST_F(PolitenessGateTest, FetchesRobotsOncePerHost) {
    web->route("http://a.test/robots.txt", html_response("User-agent: *\nDisallow:\n"));
    PolitenessGate gate("Spoor/0.1", 0ms);

    auto first  = run_sync(gate.authorize("http://a.test/one", client));
    auto second = run_sync(gate.authorize("http://a.test/two", client));

    EXPECT_TRUE(first.allow);
    EXPECT_TRUE(second.allow);
    EXPECT_EQ(web->hits("http://a.test/robots.txt"), 1u);
    EXPECT_TRUE(gate.has_robots("http://a.test/anything"));
}

TEST_F(PolitenessGateTest, DisallowedPathIsRefused) {
    web->route("http://a.test/robots.txt", html_response("User-agent: *\nDisallow: /private\n"));
    PolitenessGate gate("Spoor/0.1", 0ms);

    EXPECT_FALSE(run_sync(gate.authorize("http://a.test/private/x", client)).allow);
    EXPECT_TRUE(run_sync(gate.authorize("http://a.test/public", client)).allow);
}

TEST_F(PolitenessGateTest, QueryStringIsMatched) {
    web->route("http://a.test/robots.txt", html_response("User-agent: *\nDisallow: /*?sort=\n"));
    PolitenessGate gate("Spoor/0.1", 0ms);

    EXPECT_FALSE(run_sync(gate.authorize("http://a.test/list?sort=asc", client)).allow);
    EXPECT_TRUE(run_sync(gate.authorize("http://a.test/list", client)).allow);
}

TEST_F(PolitenessGateTest, MissingRobotsFailsOpen) {
    PolitenessGate gate("Spoor/0.1", 0ms);
    EXPECT_TRUE(run_sync(gate.authorize("http://b.test/x", client)).allow);

    web->route("http://c.test/robots.txt", network_error());
    EXPECT_TRUE(run_sync(gate.authorize("http://c.test/x", client)).allow);

    web->route("http://d.test/robots.txt", status_response(500));
    EXPECT_TRUE(run_sync(gate.authorize("http://d.test/x", client)).allow);
}

TEST_F(PolitenessGateTest, RobotsCanBeDisabled) {
    web->route("http://a.test/robots.txt", html_response("User-agent: *\nDisallow: /\n"));
    PolitenessGate gate("Spoor/0.1", 0ms, false);

    EXPECT_TRUE(run_sync(gate.authorize("http://a.test/x", client)).allow);
    EXPECT_EQ(web->total_hits(), 0u);
}

TEST_F(PolitenessGateTest, WaitIsChargedOnlyOnCommit) {
    PolitenessGate gate("Spoor/0.1", 10s, false);

    auto auth = run_sync(gate.authorize("http://a.test/1", client));
    EXPECT_EQ(auth.wait.count(), 0);

    // Authorizing again without a commit costs nothing.
    EXPECT_EQ(run_sync(gate.authorize("http://a.test/2", client)).wait.count(), 0);

    EXPECT_EQ(gate.commit("http://a.test/1").count(), 0);
    auto after = run_sync(gate.authorize("http://a.test/2", client));
    EXPECT_GT(after.wait.count(), 9000);
    EXPECT_LE(after.wait.count(), 10000);

    // Other hosts are independent.
    EXPECT_EQ(run_sync(gate.authorize("http://b.test/1", client)).wait.count(), 0);
}

TEST_F(PolitenessGateTest, CommitSerializesRacingWorkers) {
    PolitenessGate gate("Spoor/0.1", 10s, false);

    std::atomic<int>         committed{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&]() {
            if (gate.commit("http://a.test/x").count() == 0)
                committed++;
        });
    }
    for (auto& t : threads)
        t.join();
    EXPECT_EQ(committed.load(), 1);
}

TEST_F(PolitenessGateTest, CrawlDelayRaisesInterval) {
    web->route("http://a.test/robots.txt", html_response("User-agent: *\nCrawl-delay: 5\n"));
    PolitenessGate gate("Spoor/0.1", 1ms);

    run_sync(gate.authorize("http://a.test/x", client));
    EXPECT_EQ(gate.commit("http://a.test/x").count(), 0);
    EXPECT_GT(gate.commit("http://a.test/y").count(), 4000);
}

TEST_F(PolitenessGateTest, TracksConsecutiveFailures) {
    PolitenessGate gate("Spoor/0.1", 0ms);
    gate.record_result("http://a.test/1", false);
    gate.record_result("http://a.test/2", false);
    EXPECT_EQ(gate.consecutive_failures("http://a.test/"), 2u);

    gate.record_result("http://a.test/3", true);
    EXPECT_EQ(gate.consecutive_failures("http://a.test/"), 0u);
    EXPECT_EQ(gate.consecutive_failures("http://unknown.test/"), 0u);
}

TEST_F(PolitenessGateTest, HostsAreCaseInsensitive) {
    PolitenessGate gate("Spoor/0.1", 10s, false);
    EXPECT_EQ(gate.commit("http://A.Test/x").count(), 0);
    EXPECT_GT(gate.commit("http://a.test/y").count(), 0);
    EXPECT_EQ(gate.host_count(), 1u);
}
