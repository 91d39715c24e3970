// Router — RCU Implementation Notes
//   • Readers: atomic_load (ACQUIRE) → non-blocking, consistent table.
//   • Writer: build a whole RuleTable off to the side, atomic_store (RELEASE).
// Superseded tables are reclaimed by shared_ptr refcounts once the last
// in-flight request drops its snapshot (or the handler it returned).

#include "webfront/routing/router.hpp"
#include "webfront/obs/log.hpp"

#include <memory>   // atomic_load/atomic_store for shared_ptr

namespace webfront::routing {

using config::LoadError;
using config::RuleLoader;

webfront_detail::expected<std::unique_ptr<Router>, LoadError>
Router::create(RouterConfig cfg) {
    auto first = RuleLoader::load(cfg.rules_path, nullptr);
    if (!first) {
        return webfront_detail::unexpected<LoadError>(std::move(first.error()));
    }
    const auto& table = **first;
    log::info("loaded {} rules ({} inert) from {}", table.size(), table.inert_count(), cfg.rules_path);

    std::unique_ptr<Router> router(new Router(std::move(cfg), std::move(*first)));
    const auto interval = router->cfg_.poll_interval;
    if (interval.count() > 0) {
        Router* self = router.get();
        router->refresher_ = std::make_unique<Refresher>(interval, [self] { (void)self->reload(); });
        log::info("polling {} every {}ms", router->cfg_.rules_path, interval.count());
    } else {
        log::info("polling disabled for {}", router->cfg_.rules_path);
    }
    return router;
}

Router::Router(RouterConfig cfg, TablePtr initial) noexcept
    : cfg_(std::move(cfg)), table_(std::move(initial)) {}

Router::~Router() { stop(); }

void Router::stop() {
    if (refresher_) refresher_->stop();
}

Router::TablePtr Router::snapshot() const noexcept {
    // RCU read: acquire pairs with the release in publish(), so a reader that
    // sees the new pointer also sees the fully constructed table behind it.
    return std::atomic_load_explicit(&table_, std::memory_order_acquire);
}

Router::HandlerPtr Router::route(std::string_view host_header) const noexcept {
    const auto snap = snapshot();   // one snapshot for the whole scan
    auto h = snap->route(host_header);
    if (h) routed_.fetch_add(1, std::memory_order_relaxed);
    else   not_found_.fetch_add(1, std::memory_order_relaxed);
    return h;
}

void Router::publish(TablePtr next) noexcept {
    std::atomic_store_explicit(&table_, std::move(next), std::memory_order_release);
    publishes_.fetch_add(1, std::memory_order_relaxed);
}

webfront_detail::expected<ReloadOutcome, LoadError> Router::reload() {
    std::lock_guard<std::mutex> lk(reload_mu_);
    const auto current = snapshot();
    auto next = RuleLoader::load(cfg_.rules_path, current.get());
    if (!next) {
        failed_reloads_.fetch_add(1, std::memory_order_relaxed);
        log::error("reloading rules failed, keeping {} rules: {}", current->size(), next.error().describe());
        return webfront_detail::unexpected<LoadError>(std::move(next.error()));
    }
    if (!*next) {
        unchanged_polls_.fetch_add(1, std::memory_order_relaxed);
        log::debug("{} unchanged", cfg_.rules_path);
        return ReloadOutcome::Unchanged;
    }
    log::info("loaded {} rules ({} inert) from {}", (*next)->size(), (*next)->inert_count(), cfg_.rules_path);
    publish(std::move(*next));
    return ReloadOutcome::Published;
}

Router::Stats Router::stats() const noexcept {
    Stats s;
    s.routed          = routed_.load(std::memory_order_relaxed);
    s.not_found       = not_found_.load(std::memory_order_relaxed);
    s.publishes       = publishes_.load(std::memory_order_relaxed);
    s.failed_reloads  = failed_reloads_.load(std::memory_order_relaxed);
    s.unchanged_polls = unchanged_polls_.load(std::memory_order_relaxed);
    return s;
}

} // namespace webfront::routing
