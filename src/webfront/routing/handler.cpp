/**
 * @file handler.cpp
 * @brief Handler resolution and forwarding authority helpers.
 */
#include "webfront/routing/handler.hpp"
#include "webfront/routing/rule.hpp"
#include "webfront/config/constants.hpp"

namespace webfront::routing {

using namespace webfront::config::constants;

namespace {

// Split "host[:port]" / "[v6]:port". Returns the index of the port colon or npos.
std::string_view::size_type port_colon(std::string_view authority) noexcept {
    if (!authority.empty() && authority.front() == '[') {
        const auto close = authority.find(']');
        if (close == std::string_view::npos) return std::string_view::npos;
        return (close + 1 < authority.size() && authority[close + 1] == ':') ? close + 1
                                                                             : std::string_view::npos;
    }
    const auto colon = authority.rfind(':');
    // Bare IPv6 literal without brackets has several colons and no port.
    if (colon != std::string_view::npos && authority.find(':') != colon) return std::string_view::npos;
    return colon;
}

} // namespace

std::string ForwardHandler::host() const {
    std::string_view a{upstream};
    const auto colon = port_colon(a);
    auto h = (colon == std::string_view::npos) ? a : a.substr(0, colon);
    if (h.size() >= 2 && h.front() == '[' && h.back() == ']') h = h.substr(1, h.size() - 2);
    return std::string(h);
}

std::string ForwardHandler::port() const {
    std::string_view a{upstream};
    const auto colon = port_colon(a);
    if (colon == std::string_view::npos || colon + 1 == a.size()) return std::string(FORWARD_DEFAULT_PORT);
    return std::string(a.substr(colon + 1));
}

OutboundTarget ForwardHandler::rewrite(std::string_view target) const {
    // Absolute-form: drop the client's scheme and authority.
    if (const auto sep = target.find("://"); sep != std::string_view::npos && target.front() != '/') {
        const auto path = target.find_first_of("/?", sep + 3);
        target = (path == std::string_view::npos) ? std::string_view{} : target.substr(path);
    }
    OutboundTarget out{.scheme = scheme, .host = host(), .port = port(), .target = {}};
    if (target.empty() || target.front() != '/') out.target.push_back('/');
    out.target.append(target);
    return out;
}

std::string OutboundTarget::url() const {
    const bool v6 = host.find(':') != std::string::npos;
    std::string u;
    u.reserve(scheme.size() + host.size() + port.size() + target.size() + 8);
    u.append(scheme).append("://");
    if (v6) u.push_back('[');
    u.append(host);
    if (v6) u.push_back(']');
    u.append(":").append(port).append(target);
    return u;
}

std::shared_ptr<const Handler> resolve_handler(const Rule& rule) {
    // Forward takes precedence over Serve.
    if (!rule.forward.empty()) {
        return std::make_shared<const Handler>(
            ForwardHandler{.upstream = rule.forward, .scheme = std::string(FORWARD_SCHEME)});
    }
    if (!rule.serve.empty()) {
        return std::make_shared<const Handler>(StaticHandler{.root = rule.serve});
    }
    return nullptr;
}

std::string describe(const Handler& h) {
    struct Visitor {
        std::string operator()(const ForwardHandler& f) const { return "forward " + f.upstream; }
        std::string operator()(const StaticHandler& s) const { return "serve " + s.root; }
    };
    return std::visit(Visitor{}, h);
}

} // namespace webfront::routing
