/**
 * @file test_rule_loader.cpp
 * @brief Tests for rule file decoding and mtime-gated loading.
 *
 * Validates:
 *  - Field names are case-insensitive; unknown fields are ignored
 *  - Inert records keep their position
 *  - Empty, null, non-array and non-object documents are Malformed
 *  - Only strict JSON with string-valued fields is accepted
 *  - Missing files are NotFound
 *  - A file whose mtime is not after the previous table's is skipped
 */

#include <gtest/gtest.h>
#include <filesystem>
#include <variant>

#include "test_util.hpp"
#include "webfront/config/rule_loader.hpp"

using webfront::config::LoadErrc;
using webfront::config::RuleLoader;
using webfront::routing::ForwardHandler;
using webfront::routing::StaticHandler;
using webfront::test::TempDir;
using webfront::test::rewrite_newer;
using webfront::test::write_file;

// --------------------------- Decoding --------------------------------------

/**
 * @test Parse_Records_In_Order
 */
TEST(RuleLoader, Parse_Records_In_Order) {
  auto rules = RuleLoader::parse(R"([
    {"Host": "example.com", "Forward": "127.0.0.1:9000"},
    {"Host": "static.example.org", "Serve": "/srv/www"}
  ])");
  ASSERT_TRUE(rules.has_value()) << rules.error().describe();
  ASSERT_EQ(rules->size(), 2u);

  EXPECT_EQ((*rules)[0].host, "example.com");
  ASSERT_TRUE((*rules)[0].handler);
  EXPECT_TRUE(std::holds_alternative<ForwardHandler>(*(*rules)[0].handler));

  EXPECT_EQ((*rules)[1].serve, "/srv/www");
  ASSERT_TRUE((*rules)[1].handler);
  EXPECT_TRUE(std::holds_alternative<StaticHandler>(*(*rules)[1].handler));
}

/**
 * @test Parse_Keys_Case_Insensitive
 * @brief "host", "HOST" and "Host" all name the same field.
 */
TEST(RuleLoader, Parse_Keys_Case_Insensitive) {
  auto rules = RuleLoader::parse(R"([{"host": "a.example", "FORWARD": "10.0.0.1:80"}])");
  ASSERT_TRUE(rules.has_value());
  ASSERT_EQ(rules->size(), 1u);
  EXPECT_EQ((*rules)[0].host, "a.example");
  EXPECT_EQ((*rules)[0].forward, "10.0.0.1:80");
  EXPECT_FALSE((*rules)[0].inert());
}

/**
 * @test Parse_Unknown_Keys_Ignored
 */
TEST(RuleLoader, Parse_Unknown_Keys_Ignored) {
  auto rules = RuleLoader::parse(R"([{"Host": "a.example", "Serve": "/srv", "Comment": "x"}])");
  ASSERT_TRUE(rules.has_value());
  ASSERT_EQ(rules->size(), 1u);
  EXPECT_EQ((*rules)[0].serve, "/srv");
}

/**
 * @test Parse_Keeps_Inert_Records
 * @brief Records without a target (or without Host) stay in place, handler-less.
 */
TEST(RuleLoader, Parse_Keeps_Inert_Records) {
  auto rules = RuleLoader::parse(R"([
    {"Host": "a.example"},
    {"Forward": "10.0.0.1:80"},
    {"Host": "b.example", "Forward": null},
    {"Host": "c.example", "Forward": "10.0.0.3:80"}
  ])");
  ASSERT_TRUE(rules.has_value());
  ASSERT_EQ(rules->size(), 4u);
  EXPECT_TRUE((*rules)[0].inert());
  EXPECT_TRUE((*rules)[1].inert());
  EXPECT_TRUE((*rules)[2].inert());
  EXPECT_FALSE((*rules)[3].inert());
}

/**
 * @test Parse_Empty_Array_Is_Valid
 */
TEST(RuleLoader, Parse_Empty_Array_Is_Valid) {
  auto rules = RuleLoader::parse("[]");
  ASSERT_TRUE(rules.has_value());
  EXPECT_TRUE(rules->empty());
}

/**
 * @test Parse_Rejects_Malformed_Documents
 */
TEST(RuleLoader, Parse_Rejects_Malformed_Documents) {
  for (const char* doc : {
         "",
         "null",
         R"({"Host": "a.example"})",
         R"(["a.example"])",
         R"([{"Host": ["a", "b"]}])",
         R"([{"Host": "a.example", "Forward": "10.0.0.1:80")",
       }) {
    auto rules = RuleLoader::parse(doc);
    ASSERT_FALSE(rules.has_value()) << "accepted: " << doc;
    EXPECT_EQ(rules.error().code, LoadErrc::Malformed) << doc;
  }
}

/**
 * @test Parse_Rejects_Lenient_Syntax
 * @brief Trailing commas, comments, single quotes and YAML block style are
 *        not JSON.
 */
TEST(RuleLoader, Parse_Rejects_Lenient_Syntax) {
  for (const char* doc : {
         R"([{"Host": "example.com", "Forward": "127.0.0.1:9999",}])",
         R"([{"Host": "example.com", "Forward": "127.0.0.1:9999"},])",
         "[{\"Host\": \"example.com\"} // parked\n]",
         R"([{'Host': 'example.com'}])",
         R"([{Host: example.com, Forward: 127.0.0.1:9999}])",
         "- Host: example.com\n  Forward: 127.0.0.1:9999\n",
       }) {
    auto rules = RuleLoader::parse(doc);
    ASSERT_FALSE(rules.has_value()) << "accepted: " << doc;
    EXPECT_EQ(rules.error().code, LoadErrc::Malformed) << doc;
  }
}

/**
 * @test Parse_Rejects_Non_String_Fields
 * @brief Numbers, booleans and objects are not coerced to strings.
 */
TEST(RuleLoader, Parse_Rejects_Non_String_Fields) {
  for (const char* doc : {
         R"([{"Host": 42, "Forward": "127.0.0.1:9000"}])",
         R"([{"Host": "example.com", "Forward": 9000}])",
         R"([{"Host": "example.com", "Serve": true}])",
         R"([{"Host": "example.com", "Serve": {"dir": "/srv"}}])",
       }) {
    auto rules = RuleLoader::parse(doc);
    ASSERT_FALSE(rules.has_value()) << "accepted: " << doc;
    EXPECT_EQ(rules.error().code, LoadErrc::Malformed) << doc;
    EXPECT_NE(rules.error().message.find("must be a string"), std::string::npos) << rules.error().message;
  }

  // Unknown keys are not decoded, so their type does not matter.
  auto rules = RuleLoader::parse(R"([{"Host": "example.com", "Serve": "/srv", "Weight": 3}])");
  ASSERT_TRUE(rules.has_value()) << rules.error().describe();
  EXPECT_EQ((*rules)[0].serve, "/srv");
}

/**
 * @test Parse_Later_Duplicate_Wins
 */
TEST(RuleLoader, Parse_Later_Duplicate_Wins) {
  auto rules = RuleLoader::parse(R"([{"Host": "a.example", "forward": "10.0.0.1:80", "Forward": "10.0.0.2:80"}])");
  ASSERT_TRUE(rules.has_value());
  EXPECT_EQ((*rules)[0].forward, "10.0.0.2:80");
}

// --------------------------- Loading ---------------------------------------

/**
 * @test Load_Missing_File_Is_NotFound
 */
TEST(RuleLoader, Load_Missing_File_Is_NotFound) {
  TempDir dir;
  const auto path = (dir / "absent.json").string();

  auto table = RuleLoader::load(path, nullptr);
  ASSERT_FALSE(table.has_value());
  EXPECT_EQ(table.error().code, LoadErrc::NotFound);
  EXPECT_EQ(table.error().path, path);
}

/**
 * @test Load_Records_Mtime
 */
TEST(RuleLoader, Load_Records_Mtime) {
  TempDir dir;
  const auto path = dir / "rules.json";
  write_file(path, R"([{"Host": "example.com", "Forward": "127.0.0.1:9000"}])");

  auto table = RuleLoader::load(path.string(), nullptr);
  ASSERT_TRUE(table.has_value()) << table.error().describe();
  ASSERT_TRUE(*table);
  EXPECT_EQ((*table)->size(), 1u);
  EXPECT_EQ((*table)->mtime(), std::filesystem::last_write_time(path));
}

/**
 * @test Load_Skips_Unchanged_File
 * @brief Same mtime as the previous table means "nothing to do", even if
 *        the content was rewritten in place.
 */
TEST(RuleLoader, Load_Skips_Unchanged_File) {
  TempDir dir;
  const auto path = dir / "rules.json";
  write_file(path, R"([{"Host": "example.com", "Forward": "127.0.0.1:9000"}])");

  auto first = RuleLoader::load(path.string(), nullptr);
  ASSERT_TRUE(first.has_value());
  const auto stamp = (*first)->mtime();

  write_file(path, "this is not json");
  std::filesystem::last_write_time(path, stamp);

  auto again = RuleLoader::load(path.string(), first->get());
  ASSERT_TRUE(again.has_value());
  EXPECT_EQ(*again, nullptr);
}

/**
 * @test Load_Newer_File_Builds_New_Table
 */
TEST(RuleLoader, Load_Newer_File_Builds_New_Table) {
  TempDir dir;
  const auto path = dir / "rules.json";
  write_file(path, R"([{"Host": "example.com", "Forward": "127.0.0.1:9000"}])");

  auto first = RuleLoader::load(path.string(), nullptr);
  ASSERT_TRUE(first.has_value());

  rewrite_newer(path, R"([
    {"Host": "example.com", "Forward": "127.0.0.1:9000"},
    {"Host": "example.net", "Forward": "127.0.0.1:9001"}
  ])");
  auto second = RuleLoader::load(path.string(), first->get());
  ASSERT_TRUE(second.has_value());
  ASSERT_TRUE(*second);
  EXPECT_EQ((*second)->size(), 2u);
  EXPECT_GT((*second)->mtime(), (*first)->mtime());
}

/**
 * @test Load_Newer_Malformed_File_Fails
 * @brief A changed but invalid file reports Malformed with the path attached.
 */
TEST(RuleLoader, Load_Newer_Malformed_File_Fails) {
  TempDir dir;
  const auto path = dir / "rules.json";
  write_file(path, "[]");

  auto first = RuleLoader::load(path.string(), nullptr);
  ASSERT_TRUE(first.has_value());

  rewrite_newer(path, "[{");
  auto second = RuleLoader::load(path.string(), first->get());
  ASSERT_FALSE(second.has_value());
  EXPECT_EQ(second.error().code, LoadErrc::Malformed);
  EXPECT_EQ(second.error().path, path.string());
  EXPECT_NE(second.error().describe().find("malformed"), std::string::npos);
}
