#include <gtest/gtest.h>
#include "../../src/core/logger/logger.hpp"
#include "../../src/engine/crawler/crawler.hpp"
#include "../../src/sources/link_list_source.hpp"
#include "../../src/sources/search_pages_source.hpp"
#include "fake_http_client.hpp"

using namespace Spoor::Engine;
using namespace Spoor::Sources;
using namespace Spoor::Testing;

class CrawlerTest : public ::testing::Test {
protected:
    std::shared_ptr<FakeWeb> web = std::make_shared<FakeWeb>();

    void SetUp() override {
        Spoor::Core::Logger::set_level(Spoor::Core::LOG_ERROR);
    }
    void TearDown() override {
        Spoor::Core::Logger::set_level(Spoor::Core::LOG_ALL);
    }

    CrawlerConfig get_default_config() {
        CrawlerConfig cfg;
        cfg.threads           = 2;
        cfg.workers           = 4;
        cfg.min_host_interval = std::chrono::milliseconds(0);
        cfg.backoff.base      = std::chrono::milliseconds(1);
        cfg.backoff.jitter    = 0.0;
        return cfg;
    }

    ClientFactory factory() {
        auto shared = web;
        return [shared](boost::asio::io_context&) { return std::make_unique<FakeHttpClient>(shared); };
    }
};

TEST_F(CrawlerTest, EmptyPageThresholdEndsPagination) {
    const std::string page1 = "http://search.test/?q=a&p=1";
    const std::string page2 = "http://search.test/?q=a&p=2";
    const std::string page3 = "http://search.test/?q=a&p=3";
    web->route(page1,
               html_response("<p>foo.fingerprint.com</p><p>WWW.fingerprint.com</p>"
                             "<a href='https://FOO.fingerprint.com/cart'>store</a>"));
    web->route(page2, html_response("<p>nothing</p>"));
    web->route(page3, html_response("<p>late.fingerprint.com</p>"));

    auto cfg                        = get_default_config();
    cfg.rules.fingerprint.suffix    = "fingerprint.com";
    cfg.frontier.empty_page_limit   = 1;
    Crawler crawler(cfg, factory());
    crawler.add_source(std::make_shared<SearchPagesSource>(
        "search", "http://search.test/?q={query}&p={page}", std::vector<std::string>{"a"}));

    auto result = crawler.run();

    EXPECT_EQ(result.state, RunState::Exhausted);
    ASSERT_EQ(result.entities.size(), 1u);
    EXPECT_EQ(result.entities[0].key, "foo");
    EXPECT_EQ(result.entities[0].uri, "https://foo.fingerprint.com");
    EXPECT_EQ(web->hits(page2), 1u);
    EXPECT_EQ(web->hits(page3), 0u);
    EXPECT_EQ(result.stats.processed, 2u);
}

TEST_F(CrawlerTest, BlockedItemIsDroppedAndRunContinues) {
    web->route("http://list.test/blocked", status_response(403));
    web->route("http://list.test/ok", html_response("<a href='https://bar.myshopify.com'>bar</a>"));

    Crawler crawler(get_default_config(), factory());
    crawler.add_source(std::make_shared<LinkListSource>(
        "list",
        std::vector<std::string>{"http://list.test/blocked", "http://list.test/ok"},
        Pagination::None));

    auto result = crawler.run();

    EXPECT_EQ(result.state, RunState::Exhausted);
    EXPECT_EQ(web->hits("http://list.test/blocked"), 1u);
    EXPECT_EQ(result.stats.blocked, 1u);
    EXPECT_EQ(result.stats.processed, 2u);
    EXPECT_EQ(result.stats.requests, 2u);
    ASSERT_EQ(result.entities.size(), 1u);
    EXPECT_EQ(result.entities[0].key, "bar");
}

TEST_F(CrawlerTest, CyclicLinksAreFetchedOnce) {
    web->route("http://site.test/a",
               html_response("<a href='/b'>b</a><a href='/c'>c</a> one.myshopify.com"));
    web->route("http://site.test/b",
               html_response("<a href='/a'>a</a><a href='/c#top'>c</a> two.myshopify.com"));
    web->route("http://site.test/c",
               html_response("<a href='/a'>a</a><a href='/b'>b</a> three.myshopify.com"));

    auto cfg                      = get_default_config();
    cfg.frontier.empty_page_limit = 0;
    Crawler crawler(cfg, factory());
    crawler.add_source(std::make_shared<LinkListSource>(
        "site", std::vector<std::string>{"http://site.test/a"}, Pagination::SameHost));

    auto result = crawler.run();

    EXPECT_EQ(web->hits("http://site.test/a"), 1u);
    EXPECT_EQ(web->hits("http://site.test/b"), 1u);
    EXPECT_EQ(web->hits("http://site.test/c"), 1u);
    EXPECT_EQ(result.entities.size(), 3u);
}

TEST_F(CrawlerTest, RobotsDisallowedItemsAreNotFetched) {
    web->route("http://site.test/robots.txt", html_response("User-agent: *\nDisallow: /secret\n"));
    web->route("http://site.test/open", html_response("ok.myshopify.com"));
    web->route("http://site.test/secret", html_response("hidden.myshopify.com"));

    Crawler crawler(get_default_config(), factory());
    crawler.add_source(std::make_shared<LinkListSource>(
        "site",
        std::vector<std::string>{"http://site.test/open", "http://site.test/secret"},
        Pagination::None));

    auto result = crawler.run();

    EXPECT_EQ(web->hits("http://site.test/secret"), 0u);
    EXPECT_EQ(result.stats.disallowed, 1u);
    ASSERT_EQ(result.entities.size(), 1u);
    EXPECT_EQ(result.entities[0].key, "ok");
}

TEST_F(CrawlerTest, DepthLimitBoundsNextLinkPagination) {
    for (int i = 1; i <= 10; ++i) {
        web->route("http://dir.test/p" + std::to_string(i),
                   html_response("shop" + std::to_string(i) + ".myshopify.com <a rel='next' href='/p"
                                 + std::to_string(i + 1) + "'>Next</a>"));
    }

    auto cfg               = get_default_config();
    cfg.frontier.max_depth = 3;
    Crawler crawler(cfg, factory());
    crawler.add_source(std::make_shared<LinkListSource>(
        "dir", std::vector<std::string>{"http://dir.test/p1"}, Pagination::NextLink));

    auto result = crawler.run();

    EXPECT_EQ(result.entities.size(), 3u);
    EXPECT_EQ(web->hits("http://dir.test/p4"), 0u);
    EXPECT_GE(result.stats.dropped, 1u);
}

TEST_F(CrawlerTest, CancelBeforeRunAborts) {
    web->route("http://list.test/x", html_response("x1.myshopify.com"));
    Crawler crawler(get_default_config(), factory());
    crawler.add_source(std::make_shared<LinkListSource>(
        "list", std::vector<std::string>{"http://list.test/x"}, Pagination::None));

    crawler.cancel();
    auto result = crawler.run();

    EXPECT_EQ(result.state, RunState::Aborted);
    EXPECT_EQ(web->total_hits(), 0u);
    EXPECT_TRUE(result.entities.empty());
}

TEST_F(CrawlerTest, NothingToCrawlIsExhausted) {
    Crawler crawler(get_default_config(), factory());
    auto    result = crawler.run();
    EXPECT_EQ(result.state, RunState::Exhausted);
    EXPECT_EQ(result.stats.processed, 0u);
}

TEST_F(CrawlerTest, RunsOnlyOnce) {
    Crawler crawler(get_default_config(), factory());
    crawler.run();
    EXPECT_THROW(crawler.run(), std::logic_error);
}

TEST_F(CrawlerTest, DuplicateSourceTagIsRejected) {
    Crawler crawler(get_default_config(), factory());
    crawler.add_source(std::make_shared<LinkListSource>("x", std::vector<std::string>{}, Pagination::None));
    EXPECT_THROW(
        crawler.add_source(std::make_shared<LinkListSource>("x", std::vector<std::string>{}, Pagination::None)),
        std::logic_error);
}
