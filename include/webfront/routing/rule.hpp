/**
 * @file rule.hpp
 * @brief Routing directive shared by the loader, the rule table and the router.
 *
 * A Rule is decoded from one record of the rule file. Its handler is resolved
 * once by the loader before the rule is placed in a RuleTable; after that the
 * rule is only ever observed through `const RuleTable`.
 */
#pragma once

#include <memory>
#include <string>
#include <vector>

#include "webfront/routing/handler.hpp"

namespace webfront::routing {

/**
 * @brief Host-to-target routing directive.
 *
 * @note Exactly one of `forward` / `serve` is expected to be set. `forward`
 *       wins when both are. A rule with neither (or with an empty `host`)
 *       is inert: `handler` stays null and the rule never routes anything,
 *       but it keeps its position in the table.
 */
struct Rule final {
  /// Domain the rule applies to, e.g. "example.com". No port.
  std::string host;

  /// Upstream authority ("host:port") to forward to. Empty if unused.
  std::string forward;

  /// Directory to serve files from. Empty if unused.
  std::string serve;

  /// Handler resolved at load time; null for inert rules.
  std::shared_ptr<const Handler> handler;

  /// True when the rule can never produce a handler.
  [[nodiscard]] bool inert() const noexcept { return handler == nullptr; }

  /// Structural equality on the declared fields (handlers are derived state).
  bool operator==(const Rule& o) const noexcept {
    return host == o.host && forward == o.forward && serve == o.serve;
  }
};

/**
 * @brief Convenience alias for an ordered list of rules.
 */
using RuleList = std::vector<Rule>;

} // namespace webfront::routing
