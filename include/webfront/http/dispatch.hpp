#pragma once
/**
 * @file dispatch.hpp
 * @brief Per-request entry point: Host header → router → handler → reply.
 * @details The handler returned by the router is invoked here, after the
 *          router call has returned, so forwarding and file I/O never hold
 *          any routing state other than their own reference to the handler.
 */

#include "webfront/http/message.hpp"
#include "webfront/routing/router.hpp"

namespace webfront::http {

/// Route and execute one request. Never throws for routing misses (404).
Reply handle_request(const routing::Router& router, Request&& req, const RequestContext& ctx);

/// The 404 sent when no rule, or an inert rule, matches.
TextResponse not_found(const Request& req);

} // namespace webfront::http
