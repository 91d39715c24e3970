#pragma once
/**
 * @file server_config.hpp
 * @brief Process configuration: command-line flags and inherited listeners.
 */

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

#include "webfront/compat/expected.hpp"
#include "webfront/config/constants.hpp"
#include "webfront/routing/router.hpp"

namespace webfront::config {

    /** @struct ServerConfig
     *  @brief Everything the application needs to start.
     */
    struct ServerConfig {
        std::string http_addr{constants::DEFAULT_HTTP_ADDR};   ///< HTTP listen address
        std::string https_addr;                                 ///< HTTPS listen address (empty disables)
        std::string cert_file;                                  ///< HTTPS certificate (PEM)
        std::string key_file;                                   ///< HTTPS private key (PEM)
        std::string rules_path;                                 ///< Rule definition file
        std::chrono::milliseconds poll_interval{constants::DEFAULT_POLL_INTERVAL}; ///< Rule file poll interval
        std::string log_level{constants::DEFAULT_LOG_LEVEL};   ///< spdlog level name
        int http_fd{-1};                                        ///< Inherited HTTP listener, -1 if none
        int https_fd{-1};                                       ///< Inherited HTTPS listener, -1 if none

        /// HTTPS is served when an address is given or a listener is inherited.
        [[nodiscard]] bool https_enabled() const noexcept {
            return !https_addr.empty() || https_fd >= constants::MIN_INHERITED_FD;
        }

        /// Router part of the configuration.
        [[nodiscard]] routing::RouterConfig router() const {
            return routing::RouterConfig{rules_path, poll_interval};
        }
    };

    /** @struct ConfigError
     *  @brief Invalid flag or value. `help` is set when -help was requested.
     */
    struct ConfigError {
        std::string message;
        bool        help{false};
    };

    /** @struct ListenAddress
     *  @brief Parsed "[host]:port"; an empty host means all interfaces.
     */
    struct ListenAddress {
        std::string   host;
        std::uint16_t port{0};
    };

    /**
     * @brief Parse flags (`-flag=value`, `-flag value`, `--flag=value`) and the
     *        RUNSIT_PORTFD_* environment.
     * @return Validated configuration or a ConfigError to print with usage().
     */
    webfront_detail::expected<ServerConfig, ConfigError> parse_command_line(int argc, char* const argv[]);

    /// Parse a duration such as "10s", "500ms", "1m30s", "1.5h" or "0".
    webfront_detail::expected<std::chrono::milliseconds, ConfigError> parse_duration(std::string_view text);

    /// Parse "[host]:port", "host:port" or ":port".
    webfront_detail::expected<ListenAddress, ConfigError> parse_listen_address(std::string_view text);

    /// Descriptor named by an environment variable, or -1 if unset/invalid.
    int inherited_fd(const char* env_name) noexcept;

    /// Usage text listing every flag and its default.
    std::string usage(std::string_view program);

} // namespace webfront::config
