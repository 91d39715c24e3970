/**
 * @file server_config.cpp
 * @brief getopt-based flag parsing and value validation.
 */
#include "webfront/config/server_config.hpp"
#include "webfront/obs/log.hpp"

#include <charconv>
#include <cstdlib>
#include <getopt.h>
#include <sstream>

namespace webfront::config {

    using namespace webfront::config::constants;
    using Unexpected = webfront_detail::unexpected<ConfigError>;

    namespace {

        enum Opt : int {
            OPT_HTTP = 1000,
            OPT_HTTPS,
            OPT_HTTPS_CERT,
            OPT_HTTPS_KEY,
            OPT_RULES,
            OPT_POLL,
            OPT_LOG_LEVEL,
            OPT_HELP
        };

        const option kLongOptions[] = {
            {"http",       required_argument, nullptr, OPT_HTTP},
            {"https",      required_argument, nullptr, OPT_HTTPS},
            {"https_cert", required_argument, nullptr, OPT_HTTPS_CERT},
            {"https_key",  required_argument, nullptr, OPT_HTTPS_KEY},
            {"rules",      required_argument, nullptr, OPT_RULES},
            {"poll",       required_argument, nullptr, OPT_POLL},
            {"log_level",  required_argument, nullptr, OPT_LOG_LEVEL},
            {"help",       no_argument,       nullptr, OPT_HELP},
            {nullptr,      0,                 nullptr, 0}
        };

        // Nanoseconds per unit, longest suffixes first so "ms" wins over "m".
        struct Unit { std::string_view suffix; double ns; };
        constexpr Unit kUnits[] = {
            {"ns", 1.0},
            {"us", 1e3},
            {"\xC2\xB5s", 1e3},   // "µs"
            {"ms", 1e6},
            {"s",  1e9},
            {"m",  60e9},
            {"h",  3600e9},
        };

        ConfigError bad_duration(std::string_view text, std::string_view why) {
            return ConfigError{"invalid duration \"" + std::string(text) + "\": " + std::string(why)};
        }

    } // namespace

    webfront_detail::expected<std::chrono::milliseconds, ConfigError> parse_duration(std::string_view text) {
        if (text == "0") return std::chrono::milliseconds{0};
        if (text.empty()) return Unexpected(bad_duration(text, "empty"));

        double total_ns = 0.0;
        std::string_view rest = text;
        while (!rest.empty()) {
            double value = 0.0;
            const auto [ptr, ec] = std::from_chars(rest.data(), rest.data() + rest.size(), value,
                                                   std::chars_format::fixed);
            if (ec != std::errc{} || value < 0.0) return Unexpected(bad_duration(text, "expected a number"));
            rest.remove_prefix(static_cast<std::size_t>(ptr - rest.data()));

            const Unit* unit = nullptr;
            for (const auto& u : kUnits) {
                if (rest.starts_with(u.suffix) && (!unit || u.suffix.size() > unit->suffix.size())) unit = &u;
            }
            if (!unit) return Unexpected(bad_duration(text, "missing or unknown unit"));
            rest.remove_prefix(unit->suffix.size());
            total_ns += value * unit->ns;
        }
        return std::chrono::milliseconds{static_cast<std::chrono::milliseconds::rep>(total_ns / 1e6)};
    }

    webfront_detail::expected<ListenAddress, ConfigError> parse_listen_address(std::string_view text) {
        const auto bad = [&](std::string_view why) {
            return Unexpected(ConfigError{"invalid listen address \"" + std::string(text) + "\": " + std::string(why)});
        };
        ListenAddress out;
        std::string_view port;
        if (!text.empty() && text.front() == '[') {
            const auto close = text.find(']');
            if (close == std::string_view::npos || close + 1 >= text.size() || text[close + 1] != ':') {
                return bad("expected [host]:port");
            }
            out.host = std::string(text.substr(1, close - 1));
            port = text.substr(close + 2);
        } else {
            const auto colon = text.rfind(':');
            if (colon == std::string_view::npos) return bad("missing port");
            out.host = std::string(text.substr(0, colon));
            port = text.substr(colon + 1);
        }
        unsigned value = 0;
        const auto [ptr, ec] = std::from_chars(port.data(), port.data() + port.size(), value);
        if (port.empty() || ec != std::errc{} || ptr != port.data() + port.size() || value > 65535) {
            return bad("bad port");
        }
        out.port = static_cast<std::uint16_t>(value);
        return out;
    }

    int inherited_fd(const char* env_name) noexcept {
        const char* v = std::getenv(env_name);
        if (!v || !*v) return -1;
        int fd = -1;
        const std::string_view s{v};
        const auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), fd);
        if (ec != std::errc{} || ptr != s.data() + s.size() || fd < MIN_INHERITED_FD) return -1;
        return fd;
    }

    webfront_detail::expected<ServerConfig, ConfigError> parse_command_line(int argc, char* const argv[]) {
        ServerConfig cfg;

        // Reset getopt so repeated calls (tests) rescan from the start.
        optind = 0;
        opterr = 0;
        int ch;
        while ((ch = getopt_long_only(argc, argv, ":", kLongOptions, nullptr)) != -1) {
            switch (ch) {
                case OPT_HTTP:       cfg.http_addr  = optarg; break;
                case OPT_HTTPS:      cfg.https_addr = optarg; break;
                case OPT_HTTPS_CERT: cfg.cert_file  = optarg; break;
                case OPT_HTTPS_KEY:  cfg.key_file   = optarg; break;
                case OPT_RULES:      cfg.rules_path = optarg; break;
                case OPT_LOG_LEVEL:  cfg.log_level  = optarg; break;
                case OPT_POLL: {
                    auto d = parse_duration(optarg);
                    if (!d) return Unexpected(std::move(d.error()));
                    cfg.poll_interval = *d;
                    break;
                }
                case OPT_HELP:
                    return Unexpected(ConfigError{{}, true});
                case ':':
                    return Unexpected(ConfigError{std::string("flag needs an argument: ") + argv[optind - 1]});
                case '?':
                default:
                    return Unexpected(ConfigError{std::string("flag provided but not defined: ") + argv[optind - 1]});
            }
        }
        if (optind < argc) {
            return Unexpected(ConfigError{std::string("unexpected argument: ") + argv[optind]});
        }

        cfg.http_fd  = inherited_fd(ENV_PORTFD_HTTP);
        cfg.https_fd = inherited_fd(ENV_PORTFD_HTTPS);

        if (cfg.rules_path.empty()) {
            return Unexpected(ConfigError{"-rules is required"});
        }
        if (!obs::parse_level(cfg.log_level)) {
            return Unexpected(ConfigError{"unknown log level \"" + cfg.log_level + "\""});
        }
        if (cfg.http_fd < MIN_INHERITED_FD) {
            auto a = parse_listen_address(cfg.http_addr);
            if (!a) return Unexpected(std::move(a.error()));
        }
        if (cfg.https_enabled()) {
            if (cfg.https_fd < MIN_INHERITED_FD) {
                auto a = parse_listen_address(cfg.https_addr);
                if (!a) return Unexpected(std::move(a.error()));
            }
            if (cfg.cert_file.empty() || cfg.key_file.empty()) {
                return Unexpected(ConfigError{"-https requires -https_cert and -https_key"});
            }
        }
        return cfg;
    }

    std::string usage(std::string_view program) {
        std::ostringstream os;
        os << "Usage of " << program << ":\n"
           << "  -http=\"" << DEFAULT_HTTP_ADDR << "\": HTTP listen address\n"
           << "  -https=\"\": HTTPS listen address (leave empty to disable)\n"
           << "  -https_cert=\"\": HTTPS certificate file\n"
           << "  -https_key=\"\": HTTPS key file\n"
           << "  -log_level=\"" << DEFAULT_LOG_LEVEL << "\": trace, debug, info, warn, error, critical or off\n"
           << "  -poll=" << std::chrono::duration_cast<std::chrono::seconds>(DEFAULT_POLL_INTERVAL).count()
           << "s: file poll interval (0 disables polling)\n"
           << "  -rules=\"\": rule definition file\n";
        return os.str();
    }

} // namespace webfront::config
