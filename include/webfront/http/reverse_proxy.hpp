#pragma once
/**
 * @file reverse_proxy.hpp
 * @brief Forwarding collaborator: relay a request to a rule's upstream.
 * @details One upstream connection per request. Hop-by-hop headers are dropped
 *          in both directions, X-Forwarded-For is appended, and the client's
 *          Host header is passed through unchanged. Any upstream failure turns
 *          into 502 Bad Gateway. Redirects the upstream aims at its own private
 *          network are turned back to the public host over HTTPS.
 */

#include <optional>
#include <string>
#include <string_view>

#include "webfront/http/message.hpp"
#include "webfront/routing/handler.hpp"

namespace webfront::http {

/// Forward `req` to `target.upstream` and return the upstream's response.
TextResponse forward(const routing::ForwardHandler& target, const Request& req, const RequestContext& ctx);

/// True for headers that only describe a single transport hop.
[[nodiscard]] bool is_hop_by_hop(std::string_view field_name) noexcept;

/// Request as it will be sent upstream (headers rewritten, not yet connected).
[[nodiscard]] Request make_upstream_request(const Request& req, const RequestContext& ctx,
                                            const routing::OutboundTarget& dest);

/**
 * @brief Public replacement for an upstream redirect Location, if it needs one.
 * @details A plain-http Location whose host is the upstream itself, a loopback
 *          or private address, a single-label name, or a name carrying a
 *          LOCAL_HOST_LABELS label becomes "https://<request host>:443<path>".
 *          Relative, https and public locations, including the request host
 *          and its subdomains, are left alone (std::nullopt).
 * @param location Location header from the upstream response.
 * @param request_host Client Host header (port ignored).
 */
[[nodiscard]] std::optional<std::string> rewrite_redirect(std::string_view location,
                                                          std::string_view request_host,
                                                          const routing::ForwardHandler& target);

} // namespace webfront::http
