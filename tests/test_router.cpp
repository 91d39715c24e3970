/**
 * @file test_router.cpp
 * @brief Tests for Router startup, reload and RCU publication.
 *
 * Validates:
 *  - Startup requires a valid rule file
 *  - Routing follows the published table; reloads add and replace rules
 *  - A failed reload keeps the previous table and counts the failure
 *  - An unchanged file publishes nothing
 *  - No torn reads under 1 writer / many readers
 */

#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <string>
#include <thread>
#include <variant>
#include <vector>

#include "test_util.hpp"
#include "webfront/routing/router.hpp"

using namespace std::chrono_literals;
using webfront::config::LoadErrc;
using webfront::routing::ForwardHandler;
using webfront::routing::ReloadOutcome;
using webfront::routing::Router;
using webfront::routing::RouterConfig;
using webfront::test::TempDir;
using webfront::test::rewrite_newer;
using webfront::test::rule_json;
using webfront::test::write_file;

namespace {

std::string upstream_of(const Router::HandlerPtr& h) {
  if (!h) return {};
  const auto* f = std::get_if<ForwardHandler>(h.get());
  return f ? f->upstream : std::string{};
}

std::unique_ptr<Router> make_router(const TempDir& dir, std::string_view contents) {
  const auto path = dir / "rules.json";
  write_file(path, contents);
  auto r = Router::create(RouterConfig{path.string(), 0ms});
  EXPECT_TRUE(r.has_value()) << r.error().describe();
  return r ? std::move(*r) : nullptr;
}

}  // namespace

// --------------------------- Startup ---------------------------------------

/**
 * @test Create_Fails_Without_Rule_File
 */
TEST(Router, Create_Fails_Without_Rule_File) {
  TempDir dir;
  auto r = Router::create(RouterConfig{(dir / "missing.json").string(), 0ms});
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error().code, LoadErrc::NotFound);
}

/**
 * @test Create_Fails_On_Malformed_File
 */
TEST(Router, Create_Fails_On_Malformed_File) {
  TempDir dir;
  write_file(dir / "rules.json", "{not json");
  auto r = Router::create(RouterConfig{(dir / "rules.json").string(), 0ms});
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error().code, LoadErrc::Malformed);
}

// --------------------------- Routing ---------------------------------------

/**
 * @test Route_Forward_Subdomain
 * @brief foo.example.com reaches the example.com upstream; example.net does not;
 *        example.org resolves to its static root.
 */
TEST(Router, Route_Forward_Subdomain) {
  TempDir dir;
  auto router = make_router(dir, "[" + rule_json("example.com", "127.0.0.1:9000") + ", " +
                                      rule_json("example.org", "", "testdata") + "]");
  ASSERT_TRUE(router);

  EXPECT_EQ(upstream_of(router->route("foo.example.com")), "127.0.0.1:9000");
  EXPECT_EQ(upstream_of(router->route("example.com:80")), "127.0.0.1:9000");
  EXPECT_EQ(router->route("example.net"), nullptr);
  EXPECT_EQ(router->route("fooexample.com"), nullptr);

  const auto org = router->route("example.org");
  ASSERT_TRUE(org);
  EXPECT_EQ(std::get<webfront::routing::StaticHandler>(*org).root, "testdata");

  const auto s = router->stats();
  EXPECT_EQ(s.routed, 3u);
  EXPECT_EQ(s.not_found, 2u);
}

// --------------------------- Reload ----------------------------------------

/**
 * @test Reload_Adds_Rule
 * @brief A host unknown before the reload routes after it.
 */
TEST(Router, Reload_Adds_Rule) {
  TempDir dir;
  auto router = make_router(dir, "[" + rule_json("example.com", "127.0.0.1:9000") + "]");
  ASSERT_TRUE(router);
  EXPECT_EQ(router->route("example.net"), nullptr);

  rewrite_newer(dir / "rules.json", "[" + rule_json("example.com", "127.0.0.1:9000") + ", " +
                                        rule_json("example.net", "127.0.0.1:9001") + "]");
  auto outcome = router->reload();
  ASSERT_TRUE(outcome.has_value());
  EXPECT_EQ(*outcome, ReloadOutcome::Published);

  EXPECT_EQ(upstream_of(router->route("example.net")), "127.0.0.1:9001");
  EXPECT_EQ(upstream_of(router->route("example.com")), "127.0.0.1:9000");
  EXPECT_EQ(router->stats().publishes, 1u);
}

/**
 * @test Reload_Failure_Keeps_Previous_Table
 */
TEST(Router, Reload_Failure_Keeps_Previous_Table) {
  TempDir dir;
  auto router = make_router(dir, "[" + rule_json("example.com", "127.0.0.1:9000") + "]");
  ASSERT_TRUE(router);
  const auto before = router->snapshot();

  rewrite_newer(dir / "rules.json", "[{\"Host\": ");
  auto outcome = router->reload();
  ASSERT_FALSE(outcome.has_value());
  EXPECT_EQ(outcome.error().code, LoadErrc::Malformed);

  EXPECT_EQ(router->snapshot(), before);
  EXPECT_EQ(upstream_of(router->route("example.com")), "127.0.0.1:9000");
  EXPECT_EQ(router->stats().failed_reloads, 1u);
  EXPECT_EQ(router->stats().publishes, 0u);
}

/**
 * @test Reload_Invalid_Json_Keeps_Previous_Table
 * @brief A trailing comma or a numeric Host fails the reload; nothing from
 *        the broken file becomes routable.
 */
TEST(Router, Reload_Invalid_Json_Keeps_Previous_Table) {
  TempDir dir;
  auto router = make_router(dir, "[" + rule_json("example.com", "127.0.0.1:9000") + "]");
  ASSERT_TRUE(router);

  rewrite_newer(dir / "rules.json", R"([{"Host": "example.com", "Forward": "127.0.0.1:9999",}])");
  auto trailing = router->reload();
  ASSERT_FALSE(trailing.has_value());
  EXPECT_EQ(trailing.error().code, LoadErrc::Malformed);
  EXPECT_EQ(upstream_of(router->route("example.com")), "127.0.0.1:9000");

  rewrite_newer(dir / "rules.json", R"([{"Host": 42, "Forward": "127.0.0.1:9999"}])");
  auto numeric = router->reload();
  ASSERT_FALSE(numeric.has_value());
  EXPECT_EQ(numeric.error().code, LoadErrc::Malformed);
  EXPECT_EQ(router->route("42"), nullptr);
  EXPECT_EQ(upstream_of(router->route("example.com")), "127.0.0.1:9000");

  EXPECT_EQ(router->stats().failed_reloads, 2u);
  EXPECT_EQ(router->stats().publishes, 0u);
}

/**
 * @test Reload_Missing_File_Keeps_Previous_Table
 */
TEST(Router, Reload_Missing_File_Keeps_Previous_Table) {
  TempDir dir;
  auto router = make_router(dir, "[" + rule_json("example.com", "127.0.0.1:9000") + "]");
  ASSERT_TRUE(router);

  std::filesystem::remove(dir / "rules.json");
  auto outcome = router->reload();
  ASSERT_FALSE(outcome.has_value());
  EXPECT_EQ(outcome.error().code, LoadErrc::NotFound);
  EXPECT_EQ(upstream_of(router->route("example.com")), "127.0.0.1:9000");
}

/**
 * @test Reload_Unchanged_Is_Idempotent
 * @brief Reloading an untouched file keeps the very same snapshot.
 */
TEST(Router, Reload_Unchanged_Is_Idempotent) {
  TempDir dir;
  auto router = make_router(dir, "[" + rule_json("example.com", "127.0.0.1:9000") + "]");
  ASSERT_TRUE(router);
  const auto before = router->snapshot();

  for (int i = 0; i < 3; ++i) {
    auto outcome = router->reload();
    ASSERT_TRUE(outcome.has_value());
    EXPECT_EQ(*outcome, ReloadOutcome::Unchanged);
  }
  EXPECT_EQ(router->snapshot(), before);
  EXPECT_EQ(router->stats().unchanged_polls, 3u);
}

/**
 * @test Handler_Outlives_Replaced_Table
 * @brief A handler obtained before a publish stays valid after it.
 */
TEST(Router, Handler_Outlives_Replaced_Table) {
  TempDir dir;
  auto router = make_router(dir, "[" + rule_json("example.com", "127.0.0.1:9000") + "]");
  ASSERT_TRUE(router);

  const auto held = router->route("example.com");
  rewrite_newer(dir / "rules.json", "[" + rule_json("example.com", "127.0.0.1:9100") + "]");
  ASSERT_TRUE(router->reload().has_value());

  EXPECT_EQ(upstream_of(held), "127.0.0.1:9000");
  EXPECT_EQ(upstream_of(router->route("example.com")), "127.0.0.1:9100");
}

// --------------------------- Concurrency sanity ----------------------------

/**
 * @test Concurrency_1W_MR_NoTornReads
 * @brief Readers always see one of the two complete tables while a writer
 *        alternates good and broken files.
 */
TEST(Router, Concurrency_1W_MR_NoTornReads) {
  TempDir dir;
  const std::string table_a = "[" + rule_json("example.com", "10.0.0.1:80") + ", " +
                              rule_json("example.org", "10.0.0.1:81") + "]";
  const std::string table_b = "[" + rule_json("example.com", "10.0.0.2:80") + ", " +
                              rule_json("example.org", "10.0.0.2:81") + "]";
  auto router = make_router(dir, table_a);
  ASSERT_TRUE(router);

  std::atomic<bool> stop{false};
  std::atomic<int> torn{0}, misses{0};

  auto reader = [&] {
    while (!stop.load(std::memory_order_relaxed)) {
      const auto snap = router->snapshot();
      const auto com = upstream_of(snap->route("www.example.com"));
      const auto org = upstream_of(snap->route("example.org"));
      if (com.empty() || org.empty()) {
        misses.fetch_add(1, std::memory_order_relaxed);
      } else if (com.substr(0, 8) != org.substr(0, 8)) {
        torn.fetch_add(1, std::memory_order_relaxed);
      }
    }
  };

  std::vector<std::thread> readers;
  for (int i = 0; i < 4; ++i) readers.emplace_back(reader);

  for (int i = 0; i < 40; ++i) {
    rewrite_newer(dir / "rules.json", (i % 2 == 0) ? table_b : table_a);
    (void)router->reload();
    rewrite_newer(dir / "rules.json", "[{");
    (void)router->reload();
    std::this_thread::sleep_for(1ms);
  }

  stop.store(true, std::memory_order_relaxed);
  for (auto& t : readers) t.join();

  EXPECT_EQ(torn.load(), 0);
  EXPECT_EQ(misses.load(), 0);
  EXPECT_EQ(router->stats().publishes, 40u);
  EXPECT_EQ(router->stats().failed_reloads, 40u);
}
