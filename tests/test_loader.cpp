/**
 * @file test_loader.cpp
 * @brief Tests for JSON/TOML file loading using Google Test
 */

#include <gtest/gtest.h>
#include "patchmaker/Errors.hpp"
#include "patchmaker/Loader.hpp"
#include "TestHelpers.hpp"

using namespace patchmaker;
using patchmaker_test::TempFile;

// ============================================================================
// JSON
// ============================================================================

TEST(LoadJsonFile, ParsesDocument) {
    TempFile file("patchmaker_loader_doc.json", R"({"spec": {"replicas": 3}, "tags": ["a"]})");
    Value doc = load_json_file(file.path());
    EXPECT_EQ(doc["spec"]["replicas"], 3);
    EXPECT_EQ(doc["tags"][0], "a");
}

TEST(LoadJsonFile, MissingFile) {
    EXPECT_THROW(load_json_file("/nonexistent/patchmaker/doc.json"), FileNotFoundError);
}

TEST(LoadJsonFile, SyntaxErrorNamesFile) {
    TempFile file("patchmaker_loader_bad.json", R"({"a": )");
    try {
        load_json_file(file.path());
        FAIL() << "expected ConfigParseError";
    } catch (const ConfigParseError& e) {
        EXPECT_EQ(e.file(), file.path());
        EXPECT_FALSE(e.details().empty());
    }
}

// ============================================================================
// TOML
// ============================================================================

TEST(LoadTomlFile, TablesBecomeObjects) {
    TempFile file("patchmaker_loader_doc.toml",
                  "name = \"web\"\n"
                  "[spec]\n"
                  "replicas = 3\n"
                  "ratio = 0.5\n"
                  "enabled = true\n"
                  "ports = [80, 443]\n");
    Value doc = load_toml_file(file.path());

    EXPECT_EQ(doc["name"], "web");
    EXPECT_EQ(doc["spec"]["replicas"], 3);
    EXPECT_DOUBLE_EQ(doc["spec"]["ratio"].get<double>(), 0.5);
    EXPECT_EQ(doc["spec"]["enabled"], true);
    EXPECT_EQ(doc["spec"]["ports"], Value({80, 443}));
}

TEST(LoadTomlFile, DatesBecomeStrings) {
    TempFile file("patchmaker_loader_date.toml", "created = 2024-05-01\n");
    Value doc = load_toml_file(file.path());
    ASSERT_TRUE(doc["created"].is_string());
    EXPECT_EQ(doc["created"], "2024-05-01");
}

TEST(LoadTomlFile, SyntaxError) {
    TempFile file("patchmaker_loader_bad.toml", "key = = 1\n");
    EXPECT_THROW(load_toml_file(file.path()), ConfigParseError);
}

// ============================================================================
// load_document
// ============================================================================

TEST(LoadDocument, DetectsFormatByExtension) {
    TempFile json("patchmaker_loader_detect.JSON", R"({"a": 1})");
    TempFile toml("patchmaker_loader_detect.toml", "a = 1\n");
    EXPECT_EQ(load_document(json.path()), load_document(toml.path()));
}

TEST(LoadDocument, UnsupportedExtension) {
    TempFile file("patchmaker_loader_doc.yaml", "a: 1\n");
    EXPECT_THROW(load_document(file.path()), ConfigError);
}

TEST(LoadDocument, MissingFile) {
    EXPECT_THROW(load_document("/nonexistent/patchmaker/doc.toml"), FileNotFoundError);
    EXPECT_THROW(load_document("/nonexistent/patchmaker/doc.json"), FileNotFoundError);
}

TEST(GetFileExtension, Lowercased) {
    EXPECT_EQ(get_file_extension("/tmp/Doc.JSON"), ".json");
    EXPECT_EQ(get_file_extension("noext"), "");
}
