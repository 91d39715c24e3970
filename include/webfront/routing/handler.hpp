#pragma once
/**
 * @file handler.hpp
 * @brief Handler capabilities a rule resolves to, selected once at load time.
 * @note The core only describes *where* a request goes. Forwarding and file
 *       serving are carried out by the HTTP front (webfront::http), which
 *       dispatches over the variant with std::visit.
 */

#include <memory>
#include <string>
#include <string_view>
#include <variant>

namespace webfront::routing {

struct Rule;

/** @struct OutboundTarget
 *  @brief Where a forwarded request is sent and the request-target it carries.
 */
struct OutboundTarget {
    std::string scheme;
    std::string host;     ///< Dial host, IPv6 literals without brackets
    std::string port;
    std::string target;   ///< Origin-form path and query, always starting with '/'

    /// "scheme://host:port/target", brackets restored around IPv6 literals.
    [[nodiscard]] std::string url() const;
};

/** @struct ForwardHandler
 *  @brief Hands the request to the reverse proxy with the upstream authority.
 */
struct ForwardHandler final {
    std::string upstream;   ///< Authority as written in the rule, "host[:port]"
    std::string scheme;     ///< Outbound scheme ("http")

    /// Host part of the authority (brackets kept off IPv6 literals).
    [[nodiscard]] std::string host() const;
    /// Port part of the authority, FORWARD_DEFAULT_PORT when absent.
    [[nodiscard]] std::string port() const;
    /**
     * @brief Point a client request-target at the upstream.
     * @param target Origin-form ("/a?b") or absolute-form ("http://h/a?b");
     *        the client's scheme and authority are replaced by the rule's.
     */
    [[nodiscard]] OutboundTarget rewrite(std::string_view target) const;

    bool operator==(const ForwardHandler&) const = default;
};

/** @struct StaticHandler
 *  @brief Serves files below a root directory.
 */
struct StaticHandler final {
    std::string root;       ///< Directory as written in the rule

    bool operator==(const StaticHandler&) const = default;
};

/// Tagged handler: one alternative per capability.
using Handler = std::variant<ForwardHandler, StaticHandler>;

/**
 * @brief Build the handler for a rule.
 * @return Forward handler if `forward` is set, else static handler if `serve`
 *         is set, else null (inert rule).
 */
[[nodiscard]] std::shared_ptr<const Handler> resolve_handler(const Rule& rule);

/// Short human label for logs, e.g. "forward 127.0.0.1:9000".
[[nodiscard]] std::string describe(const Handler& h);

} // namespace webfront::routing
