#pragma once
/**
 * @file file_server.hpp
 * @brief Static-file collaborator: serve request paths below a rule's directory.
 */

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include "webfront/http/message.hpp"
#include "webfront/routing/handler.hpp"

namespace webfront::http {

/// Serve GET/HEAD for `req` from `target.root`.
Reply serve_file(const routing::StaticHandler& target, const Request& req);

/// Percent-decode a URL path. std::nullopt on a malformed escape or an escaped NUL.
[[nodiscard]] std::optional<std::string> url_decode(std::string_view in);

/// Lexically clean an absolute URL path: collapse "//", drop ".", resolve ".."
/// without ever climbing above "/". Keeps a trailing slash.
[[nodiscard]] std::string clean_path(std::string_view path);

/// Content-Type for a file name, by extension.
[[nodiscard]] std::string_view mime_type(std::string_view path);

} // namespace webfront::http
