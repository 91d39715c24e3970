#pragma once
// webfront — Router
// Concurrency Model: RCU (Read-Copy-Update) via atomic shared_ptr snapshot swap.
//   • Requests take a snapshot (shared_ptr copy) with ACQUIRE semantics and match
//     against that one table for the whole scan.
//   • Reloads build a complete new RuleTable and swap it in with RELEASE semantics.
//   • Readers never block the refresher; the refresher never blocks readers.
//   • A returned handler keeps its table alive, so handlers run with no lock held
//     and a concurrent publish cannot invalidate them.
// Startup policy: the first load is mandatory; create() fails if it does.

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

#include "webfront/compat/expected.hpp"
#include "webfront/config/constants.hpp"
#include "webfront/config/rule_loader.hpp"
#include "webfront/routing/refresher.hpp"
#include "webfront/routing/rule_table.hpp"

namespace webfront::routing {

/** @struct RouterConfig
 *  @brief Explicit router configuration (no process-wide flags).
 */
struct RouterConfig {
    std::string               rules_path;   ///< Rule file to load and poll
    std::chrono::milliseconds poll_interval{webfront::config::constants::DEFAULT_POLL_INTERVAL}; ///< 0 disables polling
};

/// What a successful reload did.
enum class ReloadOutcome {
    Published,  ///< A new table replaced the current one.
    Unchanged   ///< The file was not newer; nothing published.
};

class Router final {
public:
    using TablePtr = std::shared_ptr<const RuleTable>;
    using HandlerPtr = std::shared_ptr<const Handler>;

    /**
     * @brief Load the rule file and start the refresher.
     * @return Ready router, or the first load's error (startup must abort).
     */
    static webfront_detail::expected<std::unique_ptr<Router>, config::LoadError>
    create(RouterConfig cfg);

    ~Router();

    Router(const Router&) = delete;
    Router& operator=(const Router&) = delete;

    // --------------------------- Read side -----------------------------------
    /// Current table. Callers may hold it as long as they like.
    [[nodiscard]] TablePtr snapshot() const noexcept;

    /// Handler for a Host header value; null means "respond not found".
    [[nodiscard]] HandlerPtr route(std::string_view host_header) const noexcept;

    // --------------------------- Write side ----------------------------------
    /// One loader pass against the current table; publishes on change.
    /// Errors are logged and returned; the current table stays in force.
    webfront_detail::expected<ReloadOutcome, config::LoadError> reload();

    /// Stop the background refresher (idempotent). Routing keeps working.
    void stop();

    [[nodiscard]] const RouterConfig& config() const noexcept { return cfg_; }

    // --------------------------- Observability -------------------------------
    /// Counters (relaxed, cumulative since start).
    struct Stats {
        uint64_t routed{0}, not_found{0}, publishes{0}, failed_reloads{0}, unchanged_polls{0};
    };
    [[nodiscard]] Stats stats() const noexcept;

private:
    Router(RouterConfig cfg, TablePtr initial) noexcept;

    void publish(TablePtr next) noexcept;

    RouterConfig cfg_;
    TablePtr     table_;          // accessed only through atomic_load/atomic_store
    std::mutex   reload_mu_;      // serializes writers (refresher, SIGHUP, tests)

    mutable std::atomic<uint64_t> routed_{0}, not_found_{0};
    std::atomic<uint64_t> publishes_{0}, failed_reloads_{0}, unchanged_polls_{0};

    std::unique_ptr<Refresher> refresher_;
};

} // namespace webfront::routing
