#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <atomic>
#include <map>
#include <mutex>
#include <set>
#include <thread>
#include "engine/crawler/crawler.hpp"
#include "core/logger/logger.hpp"
#include "sources/link_list_source.hpp"
#include "sources/search_pages_source.hpp"
#include "storage/json_file_sink.hpp"

namespace fs = std::filesystem;

using namespace Spoor::Engine;
using namespace Spoor::Sources;

class TestServer {
public:
    TestServer() {
    }

    void set_route(const std::string& path,
                   const std::string& content,
                   const std::string& type = "text/html") {
        server_.Get(path, [this, path, content, type](const httplib::Request&, httplib::Response& res) {
            count(path);
            res.set_content(content, type.c_str());
        });
    }

    void set_status(const std::string& path, int status) {
        server_.Get(path, [this, path, status](const httplib::Request&, httplib::Response& res) {
            count(path);
            res.status = status;
            res.set_content("status " + std::to_string(status), "text/plain");
        });
    }

    void set_handler(const std::string& path, httplib::Server::Handler handler) {
        server_.Get(path, [this, path, handler](const httplib::Request& req, httplib::Response& res) {
            count(path);
            handler(req, res);
        });
    }

    void start(int port, const std::string& host = "127.0.0.1") {
        port_   = port;
        host_   = host;
        thread_ = std::thread([this, host, port]() { server_.listen(host.c_str(), port); });
        std::this_thread::sleep_for(std::chrono::milliseconds(500));
    }

    void stop() {
        server_.stop();
        if (thread_.joinable())
            thread_.join();
    }

    std::string url() const {
        return "http://" + host_ + ":" + std::to_string(port_);
    }

    int hits(const std::string& path) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = hits_.find(path);
        return it == hits_.end() ? 0 : it->second;
    }

private:
    httplib::Server            server_;
    std::thread                thread_;
    int                        port_ = 0;
    std::string                host_ = "127.0.0.1";
    std::mutex                 mutex_;
    std::map<std::string, int> hits_;

    void count(const std::string& path) {
        std::lock_guard<std::mutex> lock(mutex_);
        ++hits_[path];
    }
};

class IntegrationTest : public ::testing::Test {
protected:
    void SetUp() override {
        Spoor::Core::Logger::set_level(Spoor::Core::LOG_ERROR | Spoor::Core::LOG_WARN);
        if (fs::exists("test_output"))
            fs::remove_all("test_output");
        fs::create_directory("test_output");
    }

    void TearDown() override {
        if (fs::exists("test_output"))
            fs::remove_all("test_output");
        Spoor::Core::Logger::set_level(Spoor::Core::LOG_ALL);
    }

    CrawlerConfig get_default_config() {
        CrawlerConfig config;
        config.threads           = 2;
        config.workers           = 4;
        config.min_host_interval = std::chrono::milliseconds(0);
        config.backoff.base      = std::chrono::milliseconds(10);
        config.backoff.jitter    = 0.0;
        config.connect_timeout   = std::chrono::milliseconds(2000);
        config.request_timeout   = std::chrono::milliseconds(5000);
        return config;
    }

    static std::set<std::string> keys(const RunResult& result) {
        std::set<std::string> out;
        for (const auto& entity : result.entities)
            out.insert(entity.key);
        return out;
    }
};

TEST_F(IntegrationTest, NextLinkPaginationDiscoversHosts) {
    TestServer server;
    server.set_route("/p1",
                     "<html><body><p>Visit alpha.myshopify.com</p>"
                     "<a rel='next' href='/p2'>Next</a></body></html>");
    server.set_route("/p2",
                     "<html><body><a href='https://beta.myshopify.com/collections'>Beta</a>"
                     "<a href='/p3'>Page suivante</a></body></html>");
    server.set_route("/p3", "<html><body>The end</body></html>");
    server.start(18081);

    Crawler crawler(get_default_config());
    crawler.add_source(std::make_shared<LinkListSource>(
        "list", std::vector<std::string>{server.url() + "/p1"}, Pagination::NextLink));
    auto result = crawler.run();

    server.stop();

    EXPECT_EQ(result.state, RunState::Exhausted);
    EXPECT_EQ(keys(result), (std::set<std::string>{"alpha", "beta"}));
    EXPECT_EQ(result.stats.processed, 3u);
    EXPECT_EQ(server.hits("/p3"), 1);

    Spoor::Storage::JsonFileSink sink("test_output/hosts.json");
    ASSERT_TRUE(sink.write(result.entities));

    std::ifstream in("test_output/hosts.json");
    auto          data = nlohmann::json::parse(in);
    EXPECT_EQ(data["total_sites"], 2);
    EXPECT_EQ(data["sites"][0]["url"], "https://alpha.myshopify.com");
}

TEST_F(IntegrationTest, RobotsTxtEnforcement) {
    TestServer server;
    server.set_route("/robots.txt", "User-agent: *\nDisallow: /private\nAllow: /public\n", "text/plain");
    server.set_route("/public", "<html><body>public.myshopify.com</body></html>");
    server.set_route("/private", "<html><body>secret.myshopify.com</body></html>");
    server.start(18082);

    Crawler crawler(get_default_config());
    crawler.add_source(std::make_shared<LinkListSource>(
        "list",
        std::vector<std::string>{server.url() + "/public", server.url() + "/private"},
        Pagination::None));
    auto result = crawler.run();

    server.stop();

    EXPECT_EQ(keys(result), (std::set<std::string>{"public"}));
    EXPECT_EQ(result.stats.disallowed, 1u);
    EXPECT_EQ(server.hits("/private"), 0);
    EXPECT_GE(server.hits("/robots.txt"), 1);
}

TEST_F(IntegrationTest, BlockedAndRetriedPages) {
    TestServer       server;
    std::atomic<int> flaky_calls{0};
    server.set_status("/forbidden", 403);
    server.set_handler("/flaky", [&flaky_calls](const httplib::Request&, httplib::Response& res) {
        if (flaky_calls++ == 0) {
            res.status = 503;
            return;
        }
        res.set_content("<html><body>flaky.myshopify.com</body></html>", "text/html");
    });
    server.start(18083);

    auto config           = get_default_config();
    config.attempt_budget = 3;
    Crawler crawler(config);
    crawler.add_source(std::make_shared<LinkListSource>(
        "list",
        std::vector<std::string>{server.url() + "/forbidden", server.url() + "/flaky"},
        Pagination::None));
    auto result = crawler.run();

    server.stop();

    EXPECT_EQ(result.state, RunState::Exhausted);
    EXPECT_EQ(result.stats.blocked, 1u);
    EXPECT_EQ(server.hits("/forbidden"), 1);
    EXPECT_EQ(server.hits("/flaky"), 2);
    EXPECT_EQ(keys(result), (std::set<std::string>{"flaky"}));
}

TEST_F(IntegrationTest, SearchPagesStopOnEmptyPage) {
    TestServer server;
    server.set_handler("/search", [](const httplib::Request& req, httplib::Response& res) {
        std::string q    = req.get_param_value("q");
        int         page = std::stoi(req.get_param_value("p"));
        std::string body = "<html><body>";
        if (page <= 2)
            body += "<p>" + q + std::to_string(page) + ".myshopify.com</p>";
        res.set_content(body + "</body></html>", "text/html");
    });
    server.start(18084);

    auto config                      = get_default_config();
    config.frontier.empty_page_limit = 1;
    Crawler crawler(config);
    crawler.add_source(std::make_shared<SearchPagesSource>(
        "engine",
        server.url() + "/search?q={query}&p={page}",
        std::vector<std::string>{"shop", "brand"}));
    auto result = crawler.run();

    server.stop();

    EXPECT_EQ(result.state, RunState::Exhausted);
    EXPECT_EQ(keys(result), (std::set<std::string>{"shop1", "shop2", "brand1", "brand2"}));
    // Two queries, two productive pages and one empty page each.
    EXPECT_EQ(server.hits("/search"), 6);
}

TEST_F(IntegrationTest, CancelStopsEndlessCrawl) {
    TestServer       server;
    std::atomic<int> counter{0};
    server.set_handler("/page", [&counter](const httplib::Request&, httplib::Response& res) {
        int n = ++counter;
        res.set_content("<html><body><p>host" + std::to_string(n) + ".myshopify.com</p>"
                            "<a rel='next' href='/page?n=" + std::to_string(n) + "'>Next</a></body></html>",
                        "text/html");
    });
    server.start(18085);

    auto config                         = get_default_config();
    config.min_host_interval            = std::chrono::milliseconds(100);
    config.frontier.max_depth           = 100000;
    config.frontier.max_pages_per_query = 100000;
    Crawler crawler(config);
    crawler.add_source(std::make_shared<LinkListSource>(
        "list", std::vector<std::string>{server.url() + "/page"}, Pagination::NextLink));

    std::thread canceller([&crawler]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(600));
        crawler.cancel();
    });
    auto result = crawler.run();
    canceller.join();

    server.stop();

    EXPECT_EQ(result.state, RunState::Aborted);
    EXPECT_GT(result.entities.size(), 0u);
    EXPECT_LT(result.entities.size(), 100u);
}
