#pragma once
/**
 * @file listener.hpp
 * @brief Accepting socket plus thread-per-connection HTTP/1.1 sessions.
 * @details
 *  - The acceptor runs on its own io_context and thread; every accepted
 *    connection is served synchronously on a detached worker.
 *  - stop() closes the acceptor, shuts down every open connection and waits
 *    until all workers are gone, so the Router passed to open() only has to
 *    outlive stop().
 *  - With a TLS context the same sessions run over an SSL stream.
 */

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_set>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/context.hpp>

#include "webfront/compat/expected.hpp"
#include "webfront/config/server_config.hpp"
#include "webfront/http/message.hpp"
#include "webfront/routing/host_authorizer.hpp"
#include "webfront/routing/router.hpp"

namespace webfront::http {

namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
using tcp = net::ip::tcp;

/** @struct ListenError
 *  @brief Failed step ("resolve", "bind", "use_certificate", ...) and the reason.
 */
struct ListenError {
    std::string what;
    std::string message;

    [[nodiscard]] std::string describe() const { return what + ": " + message; }
};

/**
 * @brief Server TLS context with the certificate chain and key loaded.
 * @details The SNI callback refuses any server name `authorizer` does not
 *          allow. `authorizer` must outlive the returned context.
 */
webfront_detail::expected<std::shared_ptr<ssl::context>, ListenError>
make_tls_context(const std::string& cert_file, const std::string& key_file,
                 const routing::HostAuthorizer& authorizer);

class Listener final {
public:
    struct Options {
        std::string                   name{"http"};   ///< For logs and the thread name
        config::ListenAddress         address;        ///< Ignored when inherited_fd is set
        int                           inherited_fd{-1};
        std::shared_ptr<ssl::context> tls;            ///< Null for plain HTTP
    };

    /// Bind (or adopt) the socket. Nothing is accepted until start().
    static webfront_detail::expected<std::unique_ptr<Listener>, ListenError>
    open(const routing::Router& router, Options opts);

    ~Listener();

    Listener(const Listener&) = delete;
    Listener& operator=(const Listener&) = delete;

    void start();

    /// Close the acceptor and drain sessions (idempotent).
    void stop();

    [[nodiscard]] const tcp::endpoint& local_endpoint() const noexcept { return endpoint_; }
    [[nodiscard]] const std::string& name() const noexcept { return opts_.name; }
    [[nodiscard]] uint64_t connections() const noexcept { return accepted_.load(std::memory_order_relaxed); }
    [[nodiscard]] uint64_t requests() const noexcept { return requests_.load(std::memory_order_relaxed); }

private:
    Listener(const routing::Router& router, Options opts);

    void do_accept();
    void spawn(tcp::socket socket);
    void session(std::unique_ptr<tcp::socket> socket);

    template <class Stream>
    void serve_requests(Stream& stream, const RequestContext& ctx);

    const routing::Router& router_;
    Options                opts_;
    net::io_context        ioc_{1};
    tcp::acceptor          acceptor_{ioc_};
    tcp::endpoint          endpoint_;
    std::thread            accept_thread_;

    std::mutex              mu_;          // guards open_, active_, stopping_
    std::condition_variable idle_cv_;
    std::unordered_set<tcp::socket::native_handle_type> open_;
    std::size_t             active_{0};
    bool                    stopping_{false};

    std::atomic<uint64_t> accepted_{0}, requests_{0};
};

} // namespace webfront::http
