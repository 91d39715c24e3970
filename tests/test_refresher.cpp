/**
 * @file test_refresher.cpp
 * @brief Tests for the background poll loop and router polling.
 */

#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <thread>
#include <variant>

#include "test_util.hpp"
#include "webfront/routing/refresher.hpp"
#include "webfront/routing/router.hpp"

using namespace std::chrono_literals;
using webfront::routing::ForwardHandler;
using webfront::routing::Refresher;
using webfront::routing::Router;
using webfront::routing::RouterConfig;
using webfront::test::TempDir;
using webfront::test::rewrite_newer;
using webfront::test::rule_json;
using webfront::test::write_file;

namespace {

// Poll `pred` until it holds or `budget` runs out.
template <class Pred>
bool eventually(Pred pred, std::chrono::milliseconds budget = 5s) {
  const auto deadline = std::chrono::steady_clock::now() + budget;
  while (std::chrono::steady_clock::now() < deadline) {
    if (pred()) return true;
    std::this_thread::sleep_for(5ms);
  }
  return pred();
}

}  // namespace

/**
 * @test Refresher_Ticks_Periodically
 */
TEST(Refresher, Refresher_Ticks_Periodically) {
  std::atomic<int> calls{0};
  Refresher r(10ms, [&] { calls.fetch_add(1); });

  EXPECT_TRUE(r.running());
  EXPECT_TRUE(eventually([&] { return calls.load() >= 3; }));
  r.stop();
  EXPECT_GE(r.ticks(), 3u);
}

/**
 * @test Refresher_Stop_Interrupts_Sleep
 * @brief stop() returns promptly even with a very long interval.
 */
TEST(Refresher, Refresher_Stop_Interrupts_Sleep) {
  std::atomic<int> calls{0};
  Refresher r(1h, [&] { calls.fetch_add(1); });

  const auto t0 = std::chrono::steady_clock::now();
  r.stop();
  const auto elapsed = std::chrono::steady_clock::now() - t0;

  EXPECT_LT(elapsed, 1s);
  EXPECT_EQ(calls.load(), 0);
  EXPECT_FALSE(r.running());
}

/**
 * @test Refresher_Stop_Idempotent
 */
TEST(Refresher, Refresher_Stop_Idempotent) {
  Refresher r(10ms, [] {});
  r.stop();
  r.stop();
  EXPECT_FALSE(r.running());
}

/**
 * @test Router_Polling_Publishes_Changes
 * @brief With a short interval, an edited rule file goes live without an
 *        explicit reload.
 */
TEST(Refresher, Router_Polling_Publishes_Changes) {
  TempDir dir;
  write_file(dir / "rules.json", "[" + rule_json("example.com", "127.0.0.1:9000") + "]");
  auto router = Router::create(RouterConfig{(dir / "rules.json").string(), 20ms});
  ASSERT_TRUE(router.has_value());
  EXPECT_EQ((*router)->route("example.net"), nullptr);

  rewrite_newer(dir / "rules.json", "[" + rule_json("example.net", "127.0.0.1:9001") + "]");

  EXPECT_TRUE(eventually([&] {
    const auto h = (*router)->route("example.net");
    return h && std::get<ForwardHandler>(*h).upstream == "127.0.0.1:9001";
  }));
  (*router)->stop();
  EXPECT_GE((*router)->stats().publishes, 1u);
}

/**
 * @test New_Host_Waits_For_Next_Poll
 * @brief A host added to the file stays not-found until a poll (or reload)
 *        picks the file up.
 */
TEST(Refresher, New_Host_Waits_For_Next_Poll) {
  TempDir dir;
  write_file(dir / "rules.json", "[" + rule_json("example.org", "127.0.0.1:9000") + "]");
  auto router = Router::create(RouterConfig{(dir / "rules.json").string(), 1h});
  ASSERT_TRUE(router.has_value());

  rewrite_newer(dir / "rules.json", "[" + rule_json("example.org", "127.0.0.1:9000") + ", " +
                                        rule_json("new.example.com", "127.0.0.1:9002") + "]");
  std::this_thread::sleep_for(50ms);
  EXPECT_EQ((*router)->route("new.example.com"), nullptr);
  EXPECT_EQ((*router)->stats().publishes, 0u);

  ASSERT_TRUE((*router)->reload().has_value());
  const auto h = (*router)->route("new.example.com");
  ASSERT_TRUE(h);
  EXPECT_EQ(std::get<ForwardHandler>(*h).upstream, "127.0.0.1:9002");
  (*router)->stop();
}

/**
 * @test Polling_Survives_Malformed_File
 * @brief A broken edit is retried on every tick without replacing the table;
 *        the next valid edit goes live.
 */
TEST(Refresher, Polling_Survives_Malformed_File) {
  TempDir dir;
  write_file(dir / "rules.json", "[" + rule_json("example.com", "127.0.0.1:9000") + "]");
  auto router = Router::create(RouterConfig{(dir / "rules.json").string(), 20ms});
  ASSERT_TRUE(router.has_value());
  const auto original = (*router)->snapshot();

  rewrite_newer(dir / "rules.json", R"([{"Host": "example.com", "Forward": "127.0.0.1:9999",}])");
  EXPECT_TRUE(eventually([&] { return (*router)->stats().failed_reloads >= 1; }));
  EXPECT_EQ((*router)->snapshot(), original);
  EXPECT_EQ(std::get<ForwardHandler>(*(*router)->route("example.com")).upstream, "127.0.0.1:9000");

  rewrite_newer(dir / "rules.json", "[" + rule_json("example.com", "127.0.0.1:9001") + "]");
  EXPECT_TRUE(eventually([&] {
    const auto h = (*router)->route("example.com");
    return h && std::get<ForwardHandler>(*h).upstream == "127.0.0.1:9001";
  }));
  (*router)->stop();
  EXPECT_EQ((*router)->stats().publishes, 1u);
}
