#pragma once
/**
 * @file message.hpp
 * @brief Beast message types shared by the HTTP front.
 */

#include <string>
#include <string_view>
#include <variant>

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

namespace webfront::http {

namespace beast = boost::beast;
namespace bhttp = boost::beast::http;

using Request       = bhttp::request<bhttp::string_body>;
using TextResponse  = bhttp::response<bhttp::string_body>;
using FileResponse  = bhttp::response<bhttp::file_body>;
using EmptyResponse = bhttp::response<bhttp::empty_body>;

/// One reply per request; the session writes whichever alternative it gets.
using Reply = std::variant<TextResponse, FileResponse, EmptyResponse>;

/** @struct RequestContext
 *  @brief Connection facts a handler may need.
 */
struct RequestContext {
    std::string remote_ip;   ///< Peer address, for X-Forwarded-For
    bool        tls{false};  ///< Arrived on the HTTPS listener
};

/// Plain-text response with the Server and nosniff headers set.
TextResponse make_text_response(bhttp::status status, const Request& req, std::string_view body);

/// Status code of any reply alternative.
[[nodiscard]] bhttp::status status_of(const Reply& reply) noexcept;

} // namespace webfront::http
