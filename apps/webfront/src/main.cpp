/**
 * @file main.cpp
 * @brief webfront: host-based HTTP front server.
 * **Bootstrap**
 * - Parse flags and RUNSIT_PORTFD_* ; set the log level.
 * - Load the rule file (mandatory) and start polling it.
 * - Open the HTTP listener and, when configured, the HTTPS listener whose SNI
 *   callback consults the HostAuthorizer.
 *
 * **Lifecycle**
 * - SIGHUP: reload the rule file now.
 * - SIGINT / SIGTERM: stop listeners (draining sessions), stop the refresher,
 *   log counters, exit 0.
 *
 * **Exit codes**
 * - 0 clean shutdown or -help, 1 startup failure, 2 bad flags.
 */

#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <functional>
#include <memory>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include "webfront/config/server_config.hpp"
#include "webfront/http/listener.hpp"
#include "webfront/obs/log.hpp"
#include "webfront/routing/host_authorizer.hpp"
#include "webfront/routing/router.hpp"
#include "webfront/version.hpp"

using namespace webfront;

namespace {

namespace net = boost::asio;

void wait_for_signals(routing::Router& router) {
  net::io_context ioc{1};
  net::signal_set signals(ioc, SIGINT, SIGTERM, SIGHUP);

  std::function<void(const boost::system::error_code&, int)> on_signal;
  on_signal = [&](const boost::system::error_code& ec, int sig) {
    if (ec) return;
    if (sig == SIGHUP) {
      log::info("SIGHUP: reloading {}", router.config().rules_path);
      (void)router.reload();   // outcome and errors are logged by the router
      signals.async_wait(on_signal);
      return;
    }
    log::info("signal {}: shutting down", sig);
    ioc.stop();
  };
  signals.async_wait(on_signal);
  ioc.run();
}

}  // namespace

int main(int argc, char* argv[]) {
  const char* program = argc > 0 ? argv[0] : "webfront";

  auto cfg = config::parse_command_line(argc, argv);
  if (!cfg) {
    if (cfg.error().help) {
      std::fputs(config::usage(program).c_str(), stdout);
      return EXIT_SUCCESS;
    }
    std::fprintf(stderr, "%s\n%s", cfg.error().message.c_str(), config::usage(program).c_str());
    return 2;
  }

  // parse_command_line() already validated the name.
  log::set_level(obs::parse_level(cfg->log_level).value_or(log::level::info));
  log::info("webfront {} starting (rules {}, poll {}ms)", version_string, cfg->rules_path, cfg->poll_interval.count());

  // --------------------------- Router ---------------------------------------
  auto router = routing::Router::create(cfg->router());
  if (!router) {
    log::critical("{}", router.error().describe());
    return EXIT_FAILURE;
  }
  routing::HostAuthorizer authorizer(**router);

  // --------------------------- Listeners ------------------------------------
  std::vector<std::unique_ptr<http::Listener>> listeners;
  {
    http::Listener::Options opts;
    opts.name = "http";
    opts.inherited_fd = cfg->http_fd;
    if (cfg->http_fd < config::constants::MIN_INHERITED_FD) {
      opts.address = *config::parse_listen_address(cfg->http_addr);   // validated
    }
    auto l = http::Listener::open(**router, std::move(opts));
    if (!l) {
      log::critical("http: {}", l.error().describe());
      return EXIT_FAILURE;
    }
    listeners.push_back(std::move(*l));
  }

  std::shared_ptr<http::ssl::context> tls;
  if (cfg->https_enabled()) {
    auto ctx = http::make_tls_context(cfg->cert_file, cfg->key_file, authorizer);
    if (!ctx) {
      log::critical("https: {}", ctx.error().describe());
      return EXIT_FAILURE;
    }
    tls = std::move(*ctx);

    http::Listener::Options opts;
    opts.name = "https";
    opts.inherited_fd = cfg->https_fd;
    opts.tls = tls;
    if (cfg->https_fd < config::constants::MIN_INHERITED_FD) {
      opts.address = *config::parse_listen_address(cfg->https_addr);   // validated
    }
    auto l = http::Listener::open(**router, std::move(opts));
    if (!l) {
      log::critical("https: {}", l.error().describe());
      return EXIT_FAILURE;
    }
    listeners.push_back(std::move(*l));
  }

  for (auto& l : listeners) l->start();

  wait_for_signals(**router);

  // --------------------------- Shutdown -------------------------------------
  for (auto& l : listeners) {
    l->stop();
    log::info("{}: {} connections, {} requests", l->name(), l->connections(), l->requests());
  }
  (*router)->stop();

  const auto s = (*router)->stats();
  log::info("router: routed={} not_found={} publishes={} failed_reloads={} unchanged_polls={}",
            s.routed, s.not_found, s.publishes, s.failed_reloads, s.unchanged_polls);
  return EXIT_SUCCESS;
}
