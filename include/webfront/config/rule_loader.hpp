#pragma once
/**
 * @file rule_loader.hpp
 * @brief Rule file loader: stat, decode, resolve handlers, build a RuleTable.
 * @details The rule file is a JSON array of {"Host","Forward","Serve"} records.
 *          It is decoded as strict JSON: trailing commas, comments and bare
 *          scalars are rejected, and every field value must be a string or null.
 */

#include <memory>
#include <string>
#include <string_view>

#include "webfront/compat/expected.hpp"
#include "webfront/routing/rule_table.hpp"

namespace webfront::config {

/// Result codes for a failed load. The previous table stays authoritative.
enum class LoadErrc {
    NotFound,    ///< The rule file does not exist.
    Unreadable,  ///< stat/open/read failed for another reason.
    Malformed    ///< The document is not an array of string-valued records.
};

/// Human-readable name of a LoadErrc ("not found", ...).
[[nodiscard]] std::string_view to_string(LoadErrc c) noexcept;

/** @struct LoadError
 *  @brief Failure to produce a table, with context for the log line.
 */
struct LoadError {
    LoadErrc    code{LoadErrc::Malformed};
    std::string path;      ///< File that was being loaded
    std::string message;   ///< Underlying cause (errno text, parser message)

    /// "<path>: <code>: <message>"
    [[nodiscard]] std::string describe() const;
};

/// A fresh table, or nullptr when the file has not changed since `previous`.
using TablePtr   = std::shared_ptr<const routing::RuleTable>;
using LoadResult = webfront_detail::expected<TablePtr, LoadError>;

/** @class RuleLoader
 *  @brief Stateless loader; all state lives in the table passed as `previous`.
 */
class RuleLoader {
public:
    /**
     * @brief Load `path` unless it is not newer than `previous`.
     * @param path Rule file.
     * @param previous Currently published table, or nullptr on first load.
     * @return New table; nullptr if unchanged (mtime not after previous->mtime());
     *         LoadError if the file is missing, unreadable or malformed.
     */
    static LoadResult load(const std::string& path, const routing::RuleTable* previous);

    /**
     * @brief Decode rule records from an in-memory document.
     * @details Handlers are resolved; inert rules are kept in place and logged.
     * @return Rules in document order, or a Malformed LoadError (path left empty).
     */
    static webfront_detail::expected<routing::RuleList, LoadError> parse(std::string_view document);
};

} // namespace webfront::config
