#include <gtest/gtest.h>
#include <httpdiff/diff.hpp>
#include <httpdiff/json.hpp>
#include <httpdiff/record.hpp>
#include <atomic>
#include <string>
#include <thread>
#include <vector>

using namespace httpdiff;

class ConcurrencyTest : public ::testing::Test {
protected:
    void SetUp() override {
        std::vector<Tree::Entry> wide_a;
        std::vector<Tree::Entry> wide_b;
        for (int i = 0; i < 200; ++i) {
            std::string key = "k" + std::to_string(i);
            wide_a.emplace_back(key, Tree{{"v", i}, {"w", i * 2}});
        }
        // Reverse order and change every tenth value
        for (int i = 199; i >= 0; --i) {
            std::string key = "k" + std::to_string(i);
            int v = (i % 10 == 0) ? -i - 1 : i;
            wide_b.emplace_back(key, Tree{{"v", v}, {"w", i * 2}});
        }
        a_ = Value(Tree(std::move(wide_a)));
        b_ = Value(Tree(std::move(wide_b)));
    }

    void TearDown() override {}

    Value a_;
    Value b_;
};

// Values are immutable and share subtrees, so concurrent diffs need no locking
TEST_F(ConcurrencyTest, ParallelDiffsAgree) {
    const PatchSet expected = diff(a_, b_);
    ASSERT_EQ(expected.updates.size(), 20u);
    // An even number of keys reversed leaves no key in place
    ASSERT_EQ(expected.reorders.size(), 200u);

    constexpr int NUM_THREADS = 8;
    constexpr int ITERATIONS = 20;
    std::atomic<int> mismatches{0};

    std::vector<std::thread> threads;
    for (int t = 0; t < NUM_THREADS; ++t) {
        threads.emplace_back([&]() {
            for (int i = 0; i < ITERATIONS; ++i) {
                if (!(diff(a_, b_) == expected)) {
                    mismatches++;
                }
            }
        });
    }

    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(mismatches.load(), 0);
}

TEST_F(ConcurrencyTest, SharedRecordsAcrossThreads) {
    Value first = *parse_json(R"({"version": "HTTP/1.1", "request": {"method": "GET", "url": "http://h/a?x=1"}})");
    Value second = *parse_json(R"({"version": "HTTP/2", "request": {"method": "GET", "url": "http://h/a?x=2"}})");

    constexpr int NUM_THREADS = 4;
    std::atomic<int> sections_with_patches{0};

    std::vector<std::thread> threads;
    for (int t = 0; t < NUM_THREADS; ++t) {
        threads.emplace_back([&]() {
            for (const auto& section : diff_records(first, second)) {
                if (!section.patches.empty()) {
                    sections_with_patches++;
                }
            }
        });
    }

    for (auto& t : threads) {
        t.join();
    }

    // HTTP VERSION and QUERY PARAMETERS differ in every run
    EXPECT_EQ(sections_with_patches.load(), NUM_THREADS * 2);
}
