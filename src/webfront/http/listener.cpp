/**
 * @file listener.cpp
 * @brief Acceptor thread, synchronous sessions, TLS context with an SNI gate.
 */
#include "webfront/http/listener.hpp"
#include "webfront/http/dispatch.hpp"
#include "webfront/config/constants.hpp"
#include "webfront/obs/log.hpp"

#include <cerrno>
#include <exception>
#include <system_error>
#include <string_view>
#include <utility>

#include <pthread.h>
#include <sys/socket.h>

#include <boost/asio/post.hpp>
#include <boost/asio/ssl/error.hpp>
#include <boost/asio/ssl/stream.hpp>
#include <openssl/ssl.h>

namespace webfront::http {

using namespace webfront::config::constants;
using Unexpected = webfront_detail::unexpected<ListenError>;

namespace {

// Per-connection failures are routine (clients vanish); keep them at debug.
void fail(beast::error_code ec, std::string_view what) {
    // A peer that closes without close_notify is harmless for HTTP, which
    // delimits its own messages.
    if (ec == ssl::error::stream_truncated) return;
    log::debug("{}: {}", what, ec.message());
}

int sni_gate(SSL* ssl, int* alert, void* arg) {
    const auto* authorizer = static_cast<const routing::HostAuthorizer*>(arg);
    const char* servername = SSL_get_servername(ssl, TLSEXT_NAMETYPE_host_name);
    if (servername == nullptr || servername[0] == '\0') {
        return SSL_TLSEXT_ERR_OK;
    }
    if (auto ok = authorizer->authorize(servername); !ok) {
        log::warn("tls: refusing {}: {}", ok.error().host, ok.error().reason);
        *alert = SSL_AD_UNRECOGNIZED_NAME;
        return SSL_TLSEXT_ERR_ALERT_FATAL;
    }
    return SSL_TLSEXT_ERR_OK;
}

webfront_detail::expected<tcp::endpoint, ListenError> resolve_bind_endpoint(const config::ListenAddress& a) {
    beast::error_code ec;
    if (a.host.empty()) return tcp::endpoint{tcp::v4(), a.port};
    const auto addr = net::ip::make_address(a.host, ec);
    if (!ec) return tcp::endpoint{addr, a.port};

    net::io_context ioc;
    tcp::resolver resolver(ioc);
    const auto results = resolver.resolve(a.host, std::to_string(a.port), ec);
    if (ec) return Unexpected(ListenError{"resolve " + a.host, ec.message()});
    if (results.empty()) return Unexpected(ListenError{"resolve " + a.host, "no addresses"});
    return results.begin()->endpoint();
}

} // namespace

webfront_detail::expected<std::shared_ptr<ssl::context>, ListenError>
make_tls_context(const std::string& cert_file, const std::string& key_file,
                 const routing::HostAuthorizer& authorizer) {
    auto ctx = std::make_shared<ssl::context>(ssl::context::tls_server);
    ctx->set_options(ssl::context::default_workarounds | ssl::context::no_sslv2 | ssl::context::no_sslv3 |
                     ssl::context::no_tlsv1 | ssl::context::no_tlsv1_1 | ssl::context::single_dh_use);

    beast::error_code ec;
    ctx->use_certificate_chain_file(cert_file, ec);
    if (ec) return Unexpected(ListenError{"use_certificate_chain_file " + cert_file, ec.message()});
    ctx->use_private_key_file(key_file, ssl::context::pem, ec);
    if (ec) return Unexpected(ListenError{"use_private_key_file " + key_file, ec.message()});

    SSL_CTX_set_tlsext_servername_callback(ctx->native_handle(), sni_gate);
    SSL_CTX_set_tlsext_servername_arg(ctx->native_handle(),
                                      const_cast<routing::HostAuthorizer*>(&authorizer));
    return ctx;
}

// ============================================================================
// Listener
// ============================================================================

Listener::Listener(const routing::Router& router, Options opts)
    : router_(router), opts_(std::move(opts)) {}

Listener::~Listener() { stop(); }

webfront_detail::expected<std::unique_ptr<Listener>, ListenError>
Listener::open(const routing::Router& router, Options opts) {
    std::unique_ptr<Listener> l(new Listener(router, std::move(opts)));
    beast::error_code ec;

    if (l->opts_.inherited_fd >= MIN_INHERITED_FD) {
        const int fd = l->opts_.inherited_fd;
        sockaddr_storage ss{};
        socklen_t len = sizeof(ss);
        if (::getsockname(fd, reinterpret_cast<sockaddr*>(&ss), &len) != 0) {
            return Unexpected(ListenError{"getsockname fd " + std::to_string(fd),
                                          beast::error_code(errno, beast::system_category()).message()});
        }
        const tcp protocol = (ss.ss_family == AF_INET6) ? tcp::v6() : tcp::v4();
        l->acceptor_.assign(protocol, fd, ec);
        if (ec) return Unexpected(ListenError{"assign fd " + std::to_string(fd), ec.message()});
        log::info("{}: using inherited listener fd {}", l->opts_.name, fd);
    } else {
        auto ep = resolve_bind_endpoint(l->opts_.address);
        if (!ep) return Unexpected(std::move(ep.error()));

        l->acceptor_.open(ep->protocol(), ec);
        if (ec) return Unexpected(ListenError{"open", ec.message()});
        l->acceptor_.set_option(net::socket_base::reuse_address(true), ec);
        if (ec) return Unexpected(ListenError{"set_option", ec.message()});
        l->acceptor_.bind(*ep, ec);
        if (ec) return Unexpected(ListenError{"bind " + ep->address().to_string() + ":" + std::to_string(ep->port()),
                                              ec.message()});
        l->acceptor_.listen(net::socket_base::max_listen_connections, ec);
        if (ec) return Unexpected(ListenError{"listen", ec.message()});
    }

    l->endpoint_ = l->acceptor_.local_endpoint(ec);
    if (ec) return Unexpected(ListenError{"local_endpoint", ec.message()});
    return l;
}

void Listener::start() {
    if (accept_thread_.joinable()) return;
    log::info("{}: listening on {}:{}{}", opts_.name, endpoint_.address().to_string(), endpoint_.port(),
              opts_.tls ? " (tls)" : "");
    accept_thread_ = std::thread([this] {
        const std::string thread_name = ("wf-" + opts_.name).substr(0, 15);
        (void)pthread_setname_np(pthread_self(), thread_name.c_str());
        do_accept();
        ioc_.run();
    });
}

void Listener::stop() {
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (!stopping_) {
            stopping_ = true;
            for (const auto fd : open_) (void)::shutdown(fd, SHUT_RDWR);
        }
    }
    if (accept_thread_.joinable()) {
        net::post(ioc_, [this] {
            beast::error_code ec;
            acceptor_.close(ec);
        });
        accept_thread_.join();
    } else {
        beast::error_code ec;
        acceptor_.close(ec);
    }

    std::unique_lock<std::mutex> lk(mu_);
    idle_cv_.wait(lk, [this] { return active_ == 0; });
}

void Listener::do_accept() {
    acceptor_.async_accept([this](beast::error_code ec, tcp::socket socket) {
        if (ec == net::error::operation_aborted || !acceptor_.is_open()) return;
        if (ec) {
            log::warn("{}: accept: {}", opts_.name, ec.message());
        } else {
            spawn(std::move(socket));
        }
        do_accept();
    });
}

void Listener::spawn(tcp::socket socket) {
    const auto fd = socket.native_handle();
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (stopping_) return;   // socket closes on scope exit
        open_.insert(fd);
        ++active_;
    }
    accepted_.fetch_add(1, std::memory_order_relaxed);
    auto owned = std::make_unique<tcp::socket>(std::move(socket));
    try {
        std::thread([this, s = std::move(owned)]() mutable { session(std::move(s)); }).detach();
    } catch (const std::system_error& ex) {
        log::error("{}: cannot start session: {}", opts_.name, ex.what());
        std::lock_guard<std::mutex> lk(mu_);
        open_.erase(fd);
        --active_;
        idle_cv_.notify_all();
    }
}

void Listener::session(std::unique_ptr<tcp::socket> socket) {
    const auto fd = socket->native_handle();
    try {
        RequestContext ctx;
        ctx.tls = opts_.tls != nullptr;
        beast::error_code ec;
        const auto peer = socket->remote_endpoint(ec);
        if (!ec) ctx.remote_ip = peer.address().to_string();

        if (opts_.tls) {
            ssl::stream<tcp::socket&> stream{*socket, *opts_.tls};
            stream.handshake(ssl::stream_base::server, ec);
            if (ec) {
                fail(ec, "handshake");
            } else {
                serve_requests(stream, ctx);
                stream.shutdown(ec);
                if (ec) fail(ec, "shutdown");
            }
        } else {
            serve_requests(*socket, ctx);
            socket->shutdown(tcp::socket::shutdown_send, ec);
        }
    } catch (const std::exception& ex) {
        log::error("{}: session: {}", opts_.name, ex.what());
    }

    // Close under the lock: stop() never shuts down a reused descriptor, and
    // the socket is gone before stop() can return and destroy the io_context.
    std::lock_guard<std::mutex> lk(mu_);
    open_.erase(fd);
    socket.reset();
    --active_;
    idle_cv_.notify_all();
}

template <class Stream>
void Listener::serve_requests(Stream& stream, const RequestContext& ctx) {
    beast::flat_buffer buffer;
    for (;;) {
        bhttp::request_parser<bhttp::string_body> parser;
        parser.body_limit(REQUEST_BODY_LIMIT);

        beast::error_code ec;
        bhttp::read(stream, buffer, parser, ec);
        if (ec == bhttp::error::end_of_stream) return;
        if (ec) {
            fail(ec, "read");
            return;
        }
        requests_.fetch_add(1, std::memory_order_relaxed);

        Reply reply = handle_request(router_, parser.release(), ctx);
        const bool close = std::visit(
            [&](auto& res) {
                bhttp::write(stream, res, ec);
                return res.need_eof();
            },
            reply);
        if (ec) {
            fail(ec, "write");
            return;
        }
        if (close) return;
    }
}

} // namespace webfront::http
