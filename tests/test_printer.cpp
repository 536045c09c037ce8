#include <gtest/gtest.h>
#include <httpdiff/diff.hpp>
#include <httpdiff/printer.hpp>
#include <sstream>
#include <string>
#include <vector>

using namespace httpdiff;

class PrinterTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.color = false;

        patches_.add(PatchKind::Delete, {"b"}, 2, Value{});
        patches_.add(PatchKind::Insert, {"c"}, Value{}, 3);
        patches_.add(PatchKind::Update, {"info", "d"}, 1, "two");
        patches_.add(PatchKind::Reorder, {"a"}, 0, 1);
    }

    void TearDown() override {}

    Config config_;
    PatchSet patches_;
    std::ostringstream out_;
};

TEST_F(PrinterTest, Insert) {
    Printer printer(out_, config_);
    printer.print_patch(Patch{PatchKind::Insert, {"user", "name"}, Value{}, "ada"});
    EXPECT_EQ(out_.str(), "+ user.name: ada\n\n");
}

TEST_F(PrinterTest, Delete) {
    Printer printer(out_, config_);
    printer.print_patch(Patch{PatchKind::Delete, {"age"}, 36, Value{}});
    EXPECT_EQ(out_.str(), "- age: 36\n\n");
}

TEST_F(PrinterTest, Update) {
    Printer printer(out_, config_);
    printer.print_patch(Patch{PatchKind::Update, {"a", "b"}, true, Value{}});
    EXPECT_EQ(out_.str(), "a.b:\n- true\n+ null\n\n");
}

TEST_F(PrinterTest, RootUpdate) {
    Printer printer(out_, config_);
    printer.print_patch(Patch{PatchKind::Update, {}, 5, 7});
    EXPECT_EQ(out_.str(), "\n- 5\n+ 7\n\n");
}

TEST_F(PrinterTest, Reorder) {
    Printer printer(out_, config_);
    printer.print_patch(Patch{PatchKind::Reorder, {"Accept"}, 2, 0});
    EXPECT_EQ(out_.str(), "[2] -> [0] Accept: ...\n\n");
}

TEST_F(PrinterTest, TreeValuesAreIndented) {
    Printer printer(out_, config_);
    printer.print_patch(Patch{PatchKind::Insert, {"s"}, Value{}, Tree{{"x", 1}}});
    EXPECT_EQ(out_.str(), "+ s: {\n  \"x\": 1\n}\n\n");
}

TEST_F(PrinterTest, Colored) {
    config_.color = true;
    Printer printer(out_, config_);

    printer.print_patch(Patch{PatchKind::Insert, {"k"}, Value{}, 1});
    printer.print_patch(Patch{PatchKind::Reorder, {"k"}, 0, 1});

    EXPECT_EQ(out_.str(),
              "\033[32m+ k: 1\033[0m\n\n"
              "\033[31m[0]\033[0m -> \033[32m[1] \033[0mk: ...\n\n");
}

TEST_F(PrinterTest, SectionOrder) {
    Printer printer(out_, config_);
    printer.print_patches(patches_, "BODY");

    EXPECT_EQ(out_.str(),
              "----- BODY -----\n"
              "DELETES\n"
              "- b: 2\n\n"
              "INSERTS\n"
              "+ c: 3\n\n"
              "REORDERS\n"
              "[0] -> [1] a: ...\n\n"
              "UPDATES\n"
              "info.d:\n- 1\n+ two\n\n");
}

TEST_F(PrinterTest, EmptyKindsAndSectionsSkipped) {
    Printer printer(out_, config_);
    printer.print_patches(PatchSet{}, "NOTHING");
    EXPECT_TRUE(out_.str().empty());

    PatchSet only_updates;
    only_updates.add(PatchKind::Update, {}, "GET", "POST");
    printer.print_patches(only_updates, "METHOD");
    EXPECT_EQ(out_.str(), "----- METHOD -----\nUPDATES\n\n- GET\n+ POST\n\n");
}

TEST_F(PrinterTest, SectionsEndWithMarker) {
    std::vector<Section> sections = {
        {"HTTP VERSION", PatchSet{}},
        {"METHOD", diff(Value("GET"), Value("PUT"))},
    };

    Printer printer(out_, config_);
    printer.print_sections(sections);

    EXPECT_EQ(out_.str(),
              "----- METHOD -----\nUPDATES\n\n- GET\n+ PUT\n\n"
              "------  END ------\n");
}

TEST_F(PrinterTest, NoDifferencesStillEnds) {
    Printer printer(out_, config_);
    printer.print_sections({});
    EXPECT_EQ(out_.str(), "------  END ------\n");
}

TEST_F(PrinterTest, PatchJson) {
    Json j = patch_to_json(Patch{PatchKind::Reorder, {"b", "c"}, 0, 2});
    EXPECT_EQ(j.dump(), R"({"type":"reorder","path":["b","c"],"old_value":0,"new_value":2})");

    Json insert = patch_to_json(Patch{PatchKind::Insert, {"k"}, Value{}, Tree{{"x", "y"}}});
    EXPECT_EQ(insert.dump(), R"({"type":"insert","path":["k"],"old_value":null,"new_value":{"x":"y"}})");
}

TEST_F(PrinterTest, PatchSetJson) {
    Json j = patch_set_to_json(patches_);

    std::vector<std::string> keys;
    for (const auto& [key, value] : j.items()) {
        keys.push_back(key);
    }
    EXPECT_EQ(keys, (std::vector<std::string>{"deletes", "inserts", "reorders", "updates"}));
    EXPECT_EQ(j["updates"].size(), 1u);
    EXPECT_EQ(j["updates"][0]["new_value"], "two");
}

TEST_F(PrinterTest, JsonFormat) {
    config_.format = OutputFormat::Json;
    std::vector<Section> sections = {
        {"HTTP VERSION", PatchSet{}},
        {"RESPONSE STATUS", diff(Value(200), Value(500))},
    };

    Printer printer(out_, config_);
    printer.print_sections(sections);

    Json doc = Json::parse(out_.str());
    ASSERT_EQ(doc["sections"].size(), 1u);
    EXPECT_EQ(doc["sections"][0]["title"], "RESPONSE STATUS");
    EXPECT_EQ(doc["sections"][0]["updates"][0]["old_value"], 200);
    EXPECT_EQ(doc["sections"][0]["updates"][0]["new_value"], 500);
    // One line, no escapes
    EXPECT_EQ(out_.str().find('\n'), out_.str().size() - 1);
    EXPECT_EQ(out_.str().find('\033'), std::string::npos);
}

TEST_F(PrinterTest, JsonPrettyFormat) {
    config_.format = OutputFormat::JsonPretty;
    Printer printer(out_, config_);
    printer.print_sections({});
    EXPECT_EQ(out_.str(), "{\n  \"sections\": []\n}\n");
}
