#pragma once
/**
 * @file log.hpp
 * @brief Logging facade: webfront::log is spdlog.
 * @details Call sites write `log::info("...{}...", x)`; the sink and format are
 *          spdlog's default logger, configured once by the application.
 */

#include <optional>
#include <string>
#include <string_view>

#include <spdlog/common.h>
#include <spdlog/spdlog.h>

namespace webfront {

namespace log = spdlog;

namespace obs {

    /// Map a level name ("trace" .. "critical", "off") to an spdlog level.
    /// @return std::nullopt for unknown names.
    inline std::optional<log::level::level_enum> parse_level(std::string_view name) {
        const auto lvl = log::level::from_str(std::string(name));
        // from_str() falls back to "off" for unknown names.
        if (lvl == log::level::off && name != "off") return std::nullopt;
        return lvl;
    }

} // namespace obs

} // namespace webfront
