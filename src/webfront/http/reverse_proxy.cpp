/**
 * @file reverse_proxy.cpp
 * @brief Synchronous single-request reverse proxy over Beast.
 */
#include "webfront/http/reverse_proxy.hpp"
#include "webfront/config/constants.hpp"
#include "webfront/obs/log.hpp"
#include "webfront/routing/rule_table.hpp"

#include <algorithm>
#include <array>
#include <exception>
#include <string>
#include <vector>

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/address.hpp>
#include <boost/asio/ip/tcp.hpp>

namespace webfront::http {

namespace net = boost::asio;
using tcp = net::ip::tcp;
using namespace webfront::config::constants;

namespace {

// RFC 7230 §6.1 plus the de-facto Proxy-Connection / Keep-Alive.
constexpr std::array<std::string_view, 9> kHopByHop = {
    "connection", "proxy-connection", "keep-alive", "proxy-authenticate",
    "proxy-authorization", "te", "trailer", "transfer-encoding", "upgrade",
};

bool iequals(std::string_view a, std::string_view b) noexcept {
    return std::equal(a.begin(), a.end(), b.begin(), b.end(), [](char x, char y) {
        auto lower = [](char c) { return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c; };
        return lower(x) == lower(y);
    });
}

// Drop hop-by-hop fields, including any listed in the Connection header.
template <class Fields>
void strip_hop_by_hop(Fields& fields) {
    std::vector<std::string> named;
    const auto range = fields.equal_range(bhttp::field::connection);
    for (auto it = range.first; it != range.second; ++it) {
        std::string_view v = it->value();
        while (!v.empty()) {
            const auto comma = v.find(',');
            auto tok = v.substr(0, comma);
            while (!tok.empty() && (tok.front() == ' ' || tok.front() == '\t')) tok.remove_prefix(1);
            while (!tok.empty() && (tok.back() == ' ' || tok.back() == '\t')) tok.remove_suffix(1);
            if (!tok.empty()) named.emplace_back(tok);
            if (comma == std::string_view::npos) break;
            v.remove_prefix(comma + 1);
        }
    }
    for (const auto& n : named) fields.erase(n);
    for (const auto n : kHopByHop) fields.erase(n);
}

std::string to_lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(), [](char c) {
        return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
    });
    return out;
}

bool is_private_v4(const net::ip::address_v4& a) noexcept {
    const auto b = a.to_bytes();
    return a.is_loopback() || b[0] == 10 || (b[0] == 172 && (b[1] & 0xF0) == 16) ||
           (b[0] == 192 && b[1] == 168) || (b[0] == 169 && b[1] == 254);
}

bool is_private_address(std::string_view host) {
    beast::error_code ec;
    const auto addr = net::ip::make_address(std::string(host), ec);
    if (ec) return false;
    if (addr.is_v4()) return is_private_v4(addr.to_v4());
    const auto v6 = addr.to_v6();
    if (v6.is_v4_mapped()) return is_private_v4(net::ip::make_address_v4(net::ip::v4_mapped, v6));
    // fc00::/7 is unique-local.
    return v6.is_loopback() || v6.is_link_local() || v6.is_site_local() || (v6.to_bytes()[0] & 0xFE) == 0xFC;
}

bool has_local_label(std::string_view host) noexcept {
    while (!host.empty()) {
        const auto dot = host.find('.');
        const auto label = host.substr(0, dot);
        if (std::find(LOCAL_HOST_LABELS.begin(), LOCAL_HOST_LABELS.end(), label) != LOCAL_HOST_LABELS.end()) {
            return true;
        }
        if (dot == std::string_view::npos) break;
        host.remove_prefix(dot + 1);
    }
    return false;
}

// Host of an authority, without userinfo, port or IPv6 brackets.
std::string_view authority_host(std::string_view authority) noexcept {
    if (const auto at = authority.rfind('@'); at != std::string_view::npos) authority.remove_prefix(at + 1);
    if (!authority.empty() && authority.front() == '[') {
        const auto close = authority.find(']');
        return close == std::string_view::npos ? authority.substr(1) : authority.substr(1, close - 1);
    }
    const auto colon = authority.find(':');
    return colon == std::string_view::npos ? authority : authority.substr(0, colon);
}

TextResponse bad_gateway(const Request& req, const routing::ForwardHandler& target,
                         std::string_view what, std::string_view why) {
    log::error("forward {} {} to {}: {}: {}", req.method_string(), req.target(), target.upstream, what, why);
    return make_text_response(bhttp::status::bad_gateway, req, BAD_GATEWAY_BODY);
}

} // namespace

bool is_hop_by_hop(std::string_view field_name) noexcept {
    return std::any_of(kHopByHop.begin(), kHopByHop.end(),
                       [&](std::string_view h) { return iequals(h, field_name); });
}

std::optional<std::string> rewrite_redirect(std::string_view location, std::string_view request_host,
                                            const routing::ForwardHandler& target) {
    constexpr std::string_view http_prefix = "http://";
    if (location.size() < http_prefix.size() || to_lower(location.substr(0, http_prefix.size())) != http_prefix) {
        return std::nullopt;
    }
    const std::string public_host = to_lower(routing::normalize_host(request_host));
    if (public_host.empty()) return std::nullopt;

    std::string_view rest = location.substr(http_prefix.size());
    const auto path = rest.find_first_of("/?#");
    const std::string_view authority = rest.substr(0, path);
    const std::string_view tail = (path == std::string_view::npos) ? std::string_view{} : rest.substr(path);

    const std::string host = to_lower(authority_host(authority));
    if (host.empty() || routing::host_matches(host, public_host)) return std::nullopt;

    const bool local = host == to_lower(target.host()) || is_private_address(host) ||
                       host.find('.') == std::string::npos || has_local_label(host);
    if (!local) return std::nullopt;

    std::string out = "https://";
    out.append(public_host).append(":").append(REDIRECT_HTTPS_PORT).append(tail);
    return out;
}

Request make_upstream_request(const Request& req, const RequestContext& ctx, const routing::OutboundTarget& dest) {
    Request out = req;
    out.target(dest.target);
    strip_hop_by_hop(out.base());
    if (!ctx.remote_ip.empty()) {
        const std::string_view prior = out["X-Forwarded-For"];
        out.set("X-Forwarded-For",
                prior.empty() ? ctx.remote_ip : std::string(prior) + ", " + ctx.remote_ip);
    }
    // One request per upstream connection.
    out.keep_alive(false);
    out.prepare_payload();
    return out;
}

TextResponse forward(const routing::ForwardHandler& target, const Request& req, const RequestContext& ctx) {
    const auto dest = target.rewrite(req.target());
    log::debug("forward {} {} to {}", req.method_string(), req.target(), dest.url());
    try {
        net::io_context ioc;
        tcp::resolver resolver(ioc);
        tcp::socket socket(ioc);
        beast::error_code ec;

        const auto endpoints = resolver.resolve(dest.host, dest.port, ec);
        if (ec) return bad_gateway(req, target, "resolve", ec.message());

        net::connect(socket, endpoints, ec);
        if (ec) return bad_gateway(req, target, "connect", ec.message());

        auto upstream_req = make_upstream_request(req, ctx, dest);
        bhttp::write(socket, upstream_req, ec);
        if (ec) return bad_gateway(req, target, "write", ec.message());

        beast::flat_buffer buffer;
        bhttp::response_parser<bhttp::string_body> parser;
        parser.body_limit(UPSTREAM_BODY_LIMIT);
        if (req.method() == bhttp::verb::head) parser.skip(true);
        bhttp::read(socket, buffer, parser, ec);
        if (ec) return bad_gateway(req, target, "read", ec.message());

        socket.shutdown(tcp::socket::shutdown_both, ec);   // best effort; the response is complete

        TextResponse res = parser.release();
        strip_hop_by_hop(res.base());
        if (bhttp::to_status_class(res.result()) == bhttp::status_class::redirection) {
            const std::string_view location = res[bhttp::field::location];
            if (auto public_location = rewrite_redirect(location, req[bhttp::field::host], target)) {
                log::debug("redirect {} rewritten to {}", location, *public_location);
                res.set(bhttp::field::location, *public_location);
            }
        }
        res.version(req.version());
        res.keep_alive(req.keep_alive());
        if (req.method() != bhttp::verb::head) res.prepare_payload();
        return res;
    } catch (const std::exception& ex) {
        return bad_gateway(req, target, "exception", ex.what());
    }
}

} // namespace webfront::http
