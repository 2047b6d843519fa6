#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <sstream>
#include "../../src/core/logger/logger.hpp"
#include "../../src/storage/csv_file_sink.hpp"
#include "../../src/storage/json_file_sink.hpp"

using namespace Spoor::Storage;
namespace fs = std::filesystem;

class SinkTest : public ::testing::Test {
protected:
    fs::path dir_;

    void SetUp() override {
        Spoor::Core::Logger::set_level(Spoor::Core::LOG_ERROR);
        dir_ = fs::temp_directory_path()
               / ("spoor_sink_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        fs::remove_all(dir_);
    }

    void TearDown() override {
        fs::remove_all(dir_);
        Spoor::Core::Logger::set_level(Spoor::Core::LOG_ALL);
    }

    static std::string read_all(const fs::path& path) {
        std::ifstream      file(path);
        std::ostringstream ss;
        ss << file.rdbuf();
        return ss.str();
    }
};

TEST_F(SinkTest, JsonStructure) {
    auto         path = dir_ / "nested" / "hosts.json";
    JsonFileSink sink(path.string());
    ASSERT_TRUE(sink.write({{"zeta", "https://zeta.myshopify.com"},
                            {"alpha", "https://alpha.myshopify.com"},
                            {"alpha", "https://alpha.myshopify.com"}}));

    auto data = nlohmann::json::parse(read_all(path));
    ASSERT_TRUE(data.contains("date_export"));
    EXPECT_TRUE(data["date_export"].is_string());
    EXPECT_EQ(data["total_sites"], 2);
    ASSERT_EQ(data["sites"].size(), 2u);
    EXPECT_EQ(data["sites"][0]["key"], "alpha");
    EXPECT_EQ(data["sites"][0]["url"], "https://alpha.myshopify.com");
    EXPECT_EQ(data["sites"][1]["key"], "zeta");
}

TEST_F(SinkTest, JsonOverwritesWithoutMerge) {
    auto path = (dir_ / "hosts.json").string();
    ASSERT_TRUE(JsonFileSink(path).write({{"old", "https://old.myshopify.com"}}));
    ASSERT_TRUE(JsonFileSink(path).write({{"new", "https://new.myshopify.com"}}));

    auto store = JsonFileSink::load(path);
    EXPECT_EQ(store.size(), 1u);
    EXPECT_TRUE(store.contains("new"));
}

TEST_F(SinkTest, JsonMergeExisting) {
    auto path = (dir_ / "hosts.json").string();
    ASSERT_TRUE(JsonFileSink(path).write({{"old", "https://old.myshopify.com"},
                                          {"both", "http://both.myshopify.com"}}));

    JsonFileSink merging(path, true);
    ASSERT_TRUE(merging.write({{"new", "https://new.myshopify.com"},
                               {"both", "https://both.myshopify.com"}}));

    auto store = JsonFileSink::load(path);
    EXPECT_EQ(store.size(), 3u);
    EXPECT_TRUE(store.contains("old"));
    EXPECT_TRUE(store.contains("new"));
    ASSERT_TRUE(store.find("both").has_value());
    EXPECT_EQ(store.find("both")->uri, "https://both.myshopify.com");
}

TEST_F(SinkTest, LoadIgnoresMissingOrGarbage) {
    EXPECT_TRUE(JsonFileSink::load((dir_ / "missing.json").string()).empty());

    fs::create_directories(dir_);
    auto garbage = dir_ / "garbage.json";
    {
        std::ofstream ofs(garbage);
        ofs << "{not json";
    }
    EXPECT_TRUE(JsonFileSink::load(garbage.string()).empty());

    // A garbage file is replaced, not merged.
    JsonFileSink sink(garbage.string(), true);
    ASSERT_TRUE(sink.write({{"fresh", "https://fresh.myshopify.com"}}));
    EXPECT_EQ(JsonFileSink::load(garbage.string()).size(), 1u);
}

TEST_F(SinkTest, CsvHeaderAndRows) {
    auto        path = dir_ / "hosts.csv";
    CsvFileSink sink(path.string());
    ASSERT_TRUE(sink.write({{"beta", "https://beta.myshopify.com"},
                            {"alpha", "https://alpha.myshopify.com"}}));

    EXPECT_EQ(read_all(path),
              "key,url\n"
              "alpha,https://alpha.myshopify.com\n"
              "beta,https://beta.myshopify.com\n");
}

TEST_F(SinkTest, CsvQuotesSpecialFields) {
    auto        path = dir_ / "hosts.csv";
    CsvFileSink sink(path.string());
    ASSERT_TRUE(sink.write({{"odd", "https://odd.test/?a=1,b=\"2\""}}));

    EXPECT_EQ(read_all(path), "key,url\nodd,\"https://odd.test/?a=1,b=\"\"2\"\"\"\n");
}

TEST_F(SinkTest, WriteFailsWhenParentIsAFile) {
    fs::create_directories(dir_);
    auto blocker = dir_ / "blocker";
    {
        std::ofstream ofs(blocker);
        ofs << "x";
    }
    auto target = (blocker / "hosts.json").string();
    EXPECT_FALSE(JsonFileSink(target).write({{"a", "https://a.myshopify.com"}}));
    EXPECT_FALSE(CsvFileSink((blocker / "hosts.csv").string()).write({}));
}
