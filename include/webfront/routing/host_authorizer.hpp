#pragma once
/**
 * @file host_authorizer.hpp
 * @brief "Is this hostname ours?" predicate for certificate policy.
 * @details Reads the same RCU snapshot as the Router, so a decision is always
 *          made against one complete table.
 */

#include <string>
#include <string_view>

#include "webfront/compat/expected.hpp"
#include "webfront/routing/router.hpp"

namespace webfront::routing {

/** @struct AuthzError
 *  @brief Denial with the hostname and a reason.
 */
struct AuthzError {
    std::string host;
    std::string reason;
};

using AuthzResult = webfront_detail::expected<void, AuthzError>;

/// Decide against a given table: allowed if `hostname` (port stripped) equals a
/// rule host or "www." + a rule host.
[[nodiscard]] AuthzResult authorize_host(const RuleTable& table, std::string_view hostname);

/** @class HostAuthorizer
 *  @brief Binds authorize_host() to a router's current table.
 */
class HostAuthorizer {
public:
    explicit HostAuthorizer(const Router& router) noexcept : router_(router) {}

    [[nodiscard]] AuthzResult authorize(std::string_view hostname) const;

    /// Convenience for callbacks that only need a yes/no.
    [[nodiscard]] bool allowed(std::string_view hostname) const { return authorize(hostname).has_value(); }

private:
    const Router& router_;
};

} // namespace webfront::routing
