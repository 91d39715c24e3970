/**
 * @file host_authorizer.cpp
 * @brief Host authorization against a rule table snapshot.
 */
#include "webfront/routing/host_authorizer.hpp"
#include "webfront/config/constants.hpp"

namespace webfront::routing {

using namespace webfront::config::constants;

AuthzResult authorize_host(const RuleTable& table, std::string_view hostname) {
    const auto host = normalize_host(hostname);
    if (!host.empty()) {
        if (table.has_host(host)) return {};
        if (host.starts_with(WWW_ALIAS_PREFIX) && table.has_host(host.substr(WWW_ALIAS_PREFIX.size()))) {
            return {};
        }
    }
    return webfront_detail::unexpected<AuthzError>(
        AuthzError{std::string(hostname), std::string(UNRECOGNIZED_HOST_REASON)});
}

AuthzResult HostAuthorizer::authorize(std::string_view hostname) const {
    const auto snap = router_.snapshot();
    return authorize_host(*snap, hostname);
}

} // namespace webfront::routing
