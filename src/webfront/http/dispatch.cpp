/**
 * @file dispatch.cpp
 * @brief Request dispatch over the tagged handler.
 */
#include "webfront/http/dispatch.hpp"
#include "webfront/http/file_server.hpp"
#include "webfront/http/reverse_proxy.hpp"
#include "webfront/config/constants.hpp"
#include "webfront/obs/log.hpp"
#include "webfront/version.hpp"

namespace webfront::http {

using namespace webfront::config::constants;

TextResponse make_text_response(bhttp::status status, const Request& req, std::string_view body) {
    TextResponse res{status, req.version()};
    res.set(bhttp::field::server, server_token);
    res.set(bhttp::field::content_type, "text/plain; charset=utf-8");
    res.set("X-Content-Type-Options", "nosniff");
    res.keep_alive(req.keep_alive());
    if (req.method() != bhttp::verb::head) res.body() = std::string(body);
    res.prepare_payload();
    if (req.method() == bhttp::verb::head) res.content_length(body.size());
    return res;
}

bhttp::status status_of(const Reply& reply) noexcept {
    return std::visit([](const auto& res) { return res.result(); }, reply);
}

TextResponse not_found(const Request& req) {
    return make_text_response(bhttp::status::not_found, req, NOT_FOUND_BODY);
}

Reply handle_request(const routing::Router& router, Request&& req, const RequestContext& ctx) {
    const std::string_view host = req[bhttp::field::host];
    // The handler pointer is all that survives the routing call.
    const auto handler = router.route(host);
    if (!handler) {
        log::debug("{} {} host={}: no rule", req.method_string(), req.target(), host);
        return not_found(req);
    }

    struct Visitor {
        const Request&        req;
        const RequestContext& ctx;
        Reply operator()(const routing::ForwardHandler& f) const { return forward(f, req, ctx); }
        Reply operator()(const routing::StaticHandler& s) const { return serve_file(s, req); }
    };
    log::debug("{} {} host={}: {}", req.method_string(), req.target(), host, routing::describe(*handler));
    return std::visit(Visitor{req, ctx}, *handler);
}

} // namespace webfront::http
