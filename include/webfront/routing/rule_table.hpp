#pragma once
// webfront — RuleTable
// Immutable, ordered snapshot of resolved rules plus the modification time of
// the file it was parsed from.
//   • Built once by the loader, then only ever shared as shared_ptr<const RuleTable>.
//   • Order is part of the contract: the first matching rule wins.
//   • No mutation after construction; a reload builds and publishes a new table.

#include <cstddef>
#include <filesystem>
#include <memory>
#include <string_view>

#include "webfront/routing/rule.hpp"

namespace webfront::routing {

/// Strip the port (everything from the first ':') from a Host header value.
[[nodiscard]] std::string_view normalize_host(std::string_view host_header) noexcept;

/// True if `host` equals `pattern` or is a dot-delimited subdomain of it.
/// "foo.example.com" matches "example.com"; "fooexample.com" does not.
[[nodiscard]] bool host_matches(std::string_view host, std::string_view pattern) noexcept;

class RuleTable final {
public:
    using Clock     = std::filesystem::file_time_type::clock;
    using TimePoint = std::filesystem::file_time_type;

    RuleTable() = default;
    RuleTable(RuleList rules, TimePoint mtime) noexcept
        : rules_(std::move(rules)), mtime_(mtime) {}

    RuleTable(const RuleTable&) = delete;
    RuleTable& operator=(const RuleTable&) = delete;

    /// Rules in file order.
    [[nodiscard]] const RuleList& rules() const noexcept { return rules_; }
    [[nodiscard]] std::size_t size() const noexcept { return rules_.size(); }
    [[nodiscard]] bool empty() const noexcept { return rules_.empty(); }

    /// Modification time of the source file at load.
    [[nodiscard]] TimePoint mtime() const noexcept { return mtime_; }

    /// Number of rules that resolved to nothing.
    [[nodiscard]] std::size_t inert_count() const noexcept;

    /// First rule whose host pattern matches `host` (already normalized), or nullptr.
    [[nodiscard]] const Rule* match(std::string_view host) const noexcept;

    /// Handler of the first matching rule for a raw Host header value.
    /// Null if nothing matches or the first match is inert (no fall-through).
    [[nodiscard]] std::shared_ptr<const Handler> route(std::string_view host_header) const noexcept;

    /// True if some rule's host equals `host` exactly.
    [[nodiscard]] bool has_host(std::string_view host) const noexcept;

private:
    RuleList  rules_;
    TimePoint mtime_{};
};

} // namespace webfront::routing
