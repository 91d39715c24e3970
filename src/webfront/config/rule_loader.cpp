/**
 * @file rule_loader.cpp
 * @brief Rule file decoding (nlohmann::json) and table construction.
 */
#include "webfront/config/rule_loader.hpp"
#include "webfront/obs/log.hpp"

#include <algorithm>
#include <cerrno>
#include <fstream>
#include <sstream>
#include <system_error>

#include <nlohmann/json.hpp>
#include <spdlog/fmt/fmt.h>

namespace {

// Object members in document order, so a later duplicate key wins.
using Json = nlohmann::ordered_json;

constexpr std::string_view KEY_HOST    = "host";
constexpr std::string_view KEY_FORWARD = "forward";
constexpr std::string_view KEY_SERVE   = "serve";

bool iequals(std::string_view a, std::string_view b) noexcept {
    return std::equal(a.begin(), a.end(), b.begin(), b.end(), [](char x, char y) {
        auto lower = [](char c) { return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c; };
        return lower(x) == lower(y);
    });
}

} // namespace

namespace webfront::config {

using routing::Rule;
using routing::RuleList;
using routing::RuleTable;

std::string_view to_string(LoadErrc c) noexcept {
    switch (c) {
        case LoadErrc::NotFound:   return "not found";
        case LoadErrc::Unreadable: return "unreadable";
        case LoadErrc::Malformed:  return "malformed";
    }
    return "unknown";
}

std::string LoadError::describe() const {
    std::string out;
    if (!path.empty()) out.append(path).append(": ");
    out.append(to_string(code));
    if (!message.empty()) out.append(": ").append(message);
    return out;
}

static LoadError io_error(const std::string& path, const std::error_code& ec) {
    const auto code = (ec == std::errc::no_such_file_or_directory) ? LoadErrc::NotFound
                                                                   : LoadErrc::Unreadable;
    return LoadError{code, path, ec.message()};
}

// Resolve handlers in place. Inert rules keep their slot so table order and
// size always mirror the file.
static void resolve_all(RuleList& rules) {
    for (std::size_t i = 0; i < rules.size(); ++i) {
        Rule& r = rules[i];
        if (r.host.empty()) {
            log::warn("rule {}: missing Host; rule is inert", i);
            continue;
        }
        r.handler = routing::resolve_handler(r);
        if (!r.handler) {
            log::warn("rule {} ({}): neither Forward nor Serve set; rule is inert", i, r.host);
        } else if (!r.forward.empty() && !r.serve.empty()) {
            log::warn("rule {} ({}): both Forward and Serve set; forwarding to {}", i, r.host, r.forward);
        }
    }
}

// Field names are matched case-insensitively ("host" == "Host").
// Later duplicates overwrite earlier ones. null leaves a field unset.
static webfront_detail::expected<Rule, LoadError> decode_rule(const Json& node, std::size_t index) {
    using Unexpected = webfront_detail::unexpected<LoadError>;
    if (!node.is_object()) {
        return Unexpected(LoadError{LoadErrc::Malformed, {},
                                    fmt::format("rule {}: expected an object, got {}", index, node.type_name())});
    }
    Rule rule;
    for (const auto& [key, value] : node.items()) {
        std::string* field = nullptr;
        if (iequals(key, KEY_HOST)) {
            field = &rule.host;
        } else if (iequals(key, KEY_FORWARD)) {
            field = &rule.forward;
        } else if (iequals(key, KEY_SERVE)) {
            field = &rule.serve;
        } else {
            log::warn("rule {}: unsupported key '{}' ignored", index, key);
            continue;
        }
        if (value.is_null()) continue;
        if (!value.is_string()) {
            return Unexpected(LoadError{LoadErrc::Malformed, {},
                                        fmt::format("rule {}: field \"{}\" must be a string, got {}",
                                                    index, key, value.type_name())});
        }
        *field = value.get<std::string>();
    }
    return rule;
}

webfront_detail::expected<RuleList, LoadError> RuleLoader::parse(std::string_view document) {
    using Unexpected = webfront_detail::unexpected<LoadError>;
    Json root;
    try {
        root = Json::parse(document.begin(), document.end());
    } catch (const Json::exception& ex) {
        return Unexpected(LoadError{LoadErrc::Malformed, {}, ex.what()});
    }
    if (root.is_null()) {
        return Unexpected(LoadError{LoadErrc::Malformed, {}, "empty rule file"});
    }
    if (!root.is_array()) {
        return Unexpected(LoadError{LoadErrc::Malformed, {}, "expected an array of rules"});
    }

    RuleList rules;
    rules.reserve(root.size());
    for (std::size_t i = 0; i < root.size(); ++i) {
        auto rule = decode_rule(root[i], i);
        if (!rule) return Unexpected(std::move(rule.error()));
        rules.push_back(std::move(*rule));
    }
    resolve_all(rules);
    return rules;
}

LoadResult RuleLoader::load(const std::string& path, const RuleTable* previous) {
    using Unexpected = webfront_detail::unexpected<LoadError>;

    std::error_code ec;
    const auto mtime = std::filesystem::last_write_time(path, ec);
    if (ec) return Unexpected(io_error(path, ec));

    // Equal-or-earlier stamps are skipped so identical precision never re-parses.
    if (previous && !(mtime > previous->mtime())) {
        return TablePtr{};
    }

    std::ifstream in(path, std::ios::binary);
    if (!in) {
        const std::error_code open_ec(errno, std::generic_category());
        return Unexpected(io_error(path, open_ec));
    }
    std::ostringstream buf;
    buf << in.rdbuf();
    if (in.bad()) {
        return Unexpected(LoadError{LoadErrc::Unreadable, path, "read failed"});
    }

    auto rules = parse(buf.str());
    if (!rules) {
        LoadError err = std::move(rules.error());
        err.path = path;
        return Unexpected(std::move(err));
    }
    return std::make_shared<const RuleTable>(std::move(*rules), mtime);
}

} // namespace webfront::config
