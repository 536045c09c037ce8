#include <gtest/gtest.h>
#include <httpdiff/record.hpp>
#include <httpdiff/session.hpp>
#include <cstdio>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>
#include <unistd.h>

using namespace httpdiff;

class IntegrationTest : public ::testing::Test {
protected:
    void SetUp() override {
        std::string prefix = "/tmp/httpdiff_it_" + std::to_string(getpid());
        before_path_ = prefix + "_before.json";
        after_path_ = prefix + "_after.json";

        write_file(before_path_, R"([
            {
                "version": "HTTP/1.1",
                "request": {
                    "method": "GET",
                    "url": "https://api.example.com/v1/users?page=1&limit=20",
                    "headers": [
                        {"name": "Accept", "value": "application/json"},
                        {"name": "User-Agent", "value": "curl/8.4.0"}
                    ],
                    "body": null
                },
                "response": {
                    "status_code": 200,
                    "headers": [{"name": "Content-Type", "value": "application/json"}],
                    "body": "{\"users\": [1], \"total\": 1, \"page\": {\"number\": 1, \"size\": 20}}"
                }
            }
        ])");

        write_file(after_path_, R"([
            {
                "version": "HTTP/1.1",
                "request": {
                    "method": "GET",
                    "url": "https://api.example.com/v1/users?limit=50&page=1",
                    "headers": [
                        {"name": "User-Agent", "value": "curl/8.4.0"},
                        {"name": "Accept", "value": "application/json"}
                    ],
                    "body": null
                },
                "response": {
                    "status_code": 200,
                    "headers": [{"name": "Content-Type", "value": "application/json"}],
                    "body": "{\"total\": 1, \"users\": [1], \"page\": {\"number\": 1, \"size\": 50}}"
                }
            }
        ])");
    }

    void TearDown() override {
        std::remove(before_path_.c_str());
        std::remove(after_path_.c_str());
    }

    static void write_file(const std::string& path, const std::string& contents) {
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        out << contents;
    }

    Session load_session(const Config& config) {
        std::vector<Value> before;
        std::vector<Value> after;
        std::string error;
        EXPECT_TRUE(load_records(before_path_, before, error)) << error;
        EXPECT_TRUE(load_records(after_path_, after, error)) << error;
        return Session(std::move(before), std::move(after), config);
    }

    std::string before_path_;
    std::string after_path_;
};

TEST_F(IntegrationTest, TextReport) {
    Config config;
    config.color = false;
    Session session = load_session(config);
    ASSERT_EQ(session.first().size(), 1u);
    ASSERT_EQ(session.second().size(), 1u);

    std::ostringstream out;
    ASSERT_TRUE(session.compare(0, 0, out));

    EXPECT_EQ(out.str(),
              "----- QUERY PARAMETERS -----\n"
              "UPDATES\n"
              "limit:\n- 20\n+ 50\n\n"
              "----- REQUEST HEADERS -----\n"
              "REORDERS\n"
              "[0] -> [1] Accept: ...\n\n"
              "[1] -> [0] User-Agent: ...\n\n"
              "----- RESPONSE BODY -----\n"
              "REORDERS\n"
              "[1] -> [0] total: ...\n\n"
              "[0] -> [1] users: ...\n\n"
              "UPDATES\n"
              "page.size:\n- 20\n+ 50\n\n"
              "------  END ------\n");
}

TEST_F(IntegrationTest, JsonReport) {
    Config config;
    config.format = OutputFormat::Json;
    Session session = load_session(config);

    std::ostringstream out;
    ASSERT_TRUE(session.compare(0, 0, out));

    Json doc = Json::parse(out.str());
    ASSERT_EQ(doc["sections"].size(), 3u);
    EXPECT_EQ(doc["sections"][0]["title"], "QUERY PARAMETERS");
    EXPECT_EQ(doc["sections"][1]["title"], "REQUEST HEADERS");
    EXPECT_EQ(doc["sections"][2]["title"], "RESPONSE BODY");
    EXPECT_EQ(doc["sections"][2]["updates"][0]["path"], Json::array({"page", "size"}));
}

TEST_F(IntegrationTest, InteractiveRound) {
    Config config;
    config.color = false;
    Session session = load_session(config);

    std::istringstream in("0\n0\n");
    std::ostringstream out;
    EXPECT_EQ(session.run(in, out), 1u);

    const std::string text = out.str();
    EXPECT_EQ(text.rfind("[0] GET https://api.example.com/v1/users\n\n", 0), 0u);
    EXPECT_NE(text.find("First Choice => Second Choice => ----- QUERY PARAMETERS -----"), std::string::npos);
}

TEST_F(IntegrationTest, SameRecordIsEmpty) {
    Config config;
    config.color = false;
    Session loaded = load_session(config);
    Session session(loaded.first(), loaded.first(), config);

    std::ostringstream out;
    ASSERT_TRUE(session.compare(0, 0, out));
    EXPECT_EQ(out.str(), "------  END ------\n");
}
