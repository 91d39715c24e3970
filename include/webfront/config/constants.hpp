#pragma once
/**
 * @file constants.hpp
 * @brief Centralized named defaults for the router core and the HTTP front.
 * @details These values eliminate magic numbers from the codebase. Override the
 *          user-facing ones via command-line flags (see server_config.hpp).
 */

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace webfront::config::constants {

// =====================
// Command-line defaults
// =====================
/// HTTP listen address (all interfaces, port 80).
inline constexpr std::string_view DEFAULT_HTTP_ADDR = ":80";
/// Rule file poll interval.
inline constexpr std::chrono::milliseconds DEFAULT_POLL_INTERVAL{std::chrono::seconds{10}};
/// Log level name understood by spdlog.
inline constexpr std::string_view DEFAULT_LOG_LEVEL = "info";

// =====================
// Inherited listeners (socket activation by a supervisor)
// =====================
inline constexpr const char* ENV_PORTFD_HTTP  = "RUNSIT_PORTFD_http";
inline constexpr const char* ENV_PORTFD_HTTPS = "RUNSIT_PORTFD_https";
/// Descriptors below this are stdin/stdout/stderr and never a listener.
inline constexpr int MIN_INHERITED_FD = 3;

// =====================
// Routing
// =====================
/// Port delimiter stripped from the Host header before matching.
inline constexpr char HOST_PORT_DELIMITER = ':';
/// Alias accepted by the host authorizer in front of every rule host.
inline constexpr std::string_view WWW_ALIAS_PREFIX = "www.";
/// Body of the response sent when no rule (or an inert rule) matches.
inline constexpr std::string_view NOT_FOUND_BODY = "Not found.\n";
/// Body of the response sent when a served directory has no such file.
inline constexpr std::string_view FILE_NOT_FOUND_BODY = "404 page not found\n";
/// Body of the response sent when the upstream cannot be reached.
inline constexpr std::string_view BAD_GATEWAY_BODY = "Bad Gateway\n";
/// Reason given when a hostname is not covered by the current table.
inline constexpr std::string_view UNRECOGNIZED_HOST_REASON = "unrecognized host";

// =====================
// Forwarding
// =====================
/// Scheme used to reach upstreams.
inline constexpr std::string_view FORWARD_SCHEME = "http";
/// Port used when a Forward authority omits one.
inline constexpr std::string_view FORWARD_DEFAULT_PORT = "80";
/// Port written into upstream redirects that are turned back to the public host.
inline constexpr std::string_view REDIRECT_HTTPS_PORT = "443";
/// DNS labels that mark a redirect host as private to the upstream network.
inline constexpr std::array<std::string_view, 3> LOCAL_HOST_LABELS = {"local", "localhost", "internal"};
/// Upper bound on a buffered upstream response body.
inline constexpr std::uint64_t UPSTREAM_BODY_LIMIT = 64ULL * 1024 * 1024;
/// Upper bound on a buffered inbound request body.
inline constexpr std::uint64_t REQUEST_BODY_LIMIT = 16ULL * 1024 * 1024;

// =====================
// Static files
// =====================
/// File served for a directory request when present.
inline constexpr std::string_view INDEX_FILE = "index.html";

} // namespace webfront::config::constants
