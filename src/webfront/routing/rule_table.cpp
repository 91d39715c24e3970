// RuleTable — matching notes
// A table is immutable once built, so every function here is a pure read and
// safe to call from any number of threads holding the same snapshot.

#include "webfront/routing/rule_table.hpp"
#include "webfront/config/constants.hpp"

#include <algorithm>

namespace webfront::routing {

using webfront::config::constants::HOST_PORT_DELIMITER;

std::string_view normalize_host(std::string_view host_header) noexcept {
    const auto i = host_header.find(HOST_PORT_DELIMITER);
    return (i == std::string_view::npos) ? host_header : host_header.substr(0, i);
}

bool host_matches(std::string_view host, std::string_view pattern) noexcept {
    if (pattern.empty()) return false;
    if (host == pattern) return true;
    // Subdomain: host = <something non-empty> "." pattern
    if (host.size() <= pattern.size() + 1) return false;
    if (!host.ends_with(pattern)) return false;
    return host[host.size() - pattern.size() - 1] == '.';
}

std::size_t RuleTable::inert_count() const noexcept {
    return static_cast<std::size_t>(
        std::count_if(rules_.begin(), rules_.end(), [](const Rule& r) { return r.inert(); }));
}

const Rule* RuleTable::match(std::string_view host) const noexcept {
    for (const auto& r : rules_) {
        if (host_matches(host, r.host)) return &r;
    }
    return nullptr;
}

std::shared_ptr<const Handler> RuleTable::route(std::string_view host_header) const noexcept {
    const Rule* r = match(normalize_host(host_header));
    return r ? r->handler : nullptr;
}

bool RuleTable::has_host(std::string_view host) const noexcept {
    return std::any_of(rules_.begin(), rules_.end(), [&](const Rule& r) { return r.host == host; });
}

} // namespace webfront::routing
