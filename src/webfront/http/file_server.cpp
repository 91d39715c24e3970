/**
 * @file file_server.cpp
 * @brief Directory-rooted file serving: path cleaning, index files, listings.
 */
#include "webfront/http/file_server.hpp"
#include "webfront/config/constants.hpp"
#include "webfront/obs/log.hpp"
#include "webfront/version.hpp"

#include <algorithm>
#include <system_error>
#include <vector>

namespace webfront::http {

namespace fs = std::filesystem;
using namespace webfront::config::constants;

namespace {

int hex_value(char c) noexcept {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::string html_escape(std::string_view in) {
    std::string out;
    out.reserve(in.size());
    for (char c : in) {
        switch (c) {
            case '&':  out += "&amp;";  break;
            case '<':  out += "&lt;";   break;
            case '>':  out += "&gt;";   break;
            case '"':  out += "&#34;";  break;
            case '\'': out += "&#39;";  break;
            default:   out += c;
        }
    }
    return out;
}

std::string url_escape_segment(std::string_view in) {
    static constexpr char kHex[] = "0123456789ABCDEF";
    std::string out;
    for (unsigned char c : in) {
        const bool plain = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') ||
                           c == '-' || c == '_' || c == '.' || c == '~' || c == '/';
        if (plain) {
            out += static_cast<char>(c);
        } else {
            out += '%';
            out += kHex[c >> 4];
            out += kHex[c & 0xF];
        }
    }
    return out;
}

TextResponse file_not_found(const Request& req) {
    return make_text_response(bhttp::status::not_found, req, FILE_NOT_FOUND_BODY);
}

TextResponse redirect(const Request& req, std::string location) {
    TextResponse res = make_text_response(bhttp::status::moved_permanently, req, {});
    res.set(bhttp::field::location, std::move(location));
    return res;
}

TextResponse directory_listing(const Request& req, const fs::path& dir) {
    std::error_code ec;
    std::vector<std::string> names;
    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        auto name = it->path().filename().string();
        std::error_code type_ec;
        if (it->is_directory(type_ec)) name += '/';
        names.push_back(std::move(name));
    }
    if (ec) {
        log::error("listing {}: {}", dir.string(), ec.message());
        return make_text_response(bhttp::status::internal_server_error, req, "Error reading directory\n");
    }
    std::sort(names.begin(), names.end());

    std::string body = "<pre>\n";
    for (const auto& n : names) {
        body.append("<a href=\"").append(url_escape_segment(n)).append("\">")
            .append(html_escape(n)).append("</a>\n");
    }
    body += "</pre>\n";

    TextResponse res{bhttp::status::ok, req.version()};
    res.set(bhttp::field::server, server_token);
    res.set(bhttp::field::content_type, "text/html; charset=utf-8");
    res.keep_alive(req.keep_alive());
    const auto size = body.size();
    if (req.method() != bhttp::verb::head) res.body() = std::move(body);
    res.prepare_payload();
    if (req.method() == bhttp::verb::head) res.content_length(size);
    return res;
}

Reply regular_file(const Request& req, const fs::path& path) {
    beast::error_code ec;
    bhttp::file_body::value_type body;
    body.open(path.c_str(), beast::file_mode::scan, ec);
    if (ec) {
        log::debug("open {}: {}", path.string(), ec.message());
        return file_not_found(req);
    }
    const auto size = body.size();
    const auto type = mime_type(path.filename().string());

    if (req.method() == bhttp::verb::head) {
        EmptyResponse res{bhttp::status::ok, req.version()};
        res.set(bhttp::field::server, server_token);
        res.set(bhttp::field::content_type, type);
        res.content_length(size);
        res.keep_alive(req.keep_alive());
        return res;
    }

    FileResponse res{std::piecewise_construct, std::make_tuple(std::move(body)),
                     std::make_tuple(bhttp::status::ok, req.version())};
    res.set(bhttp::field::server, server_token);
    res.set(bhttp::field::content_type, type);
    res.content_length(size);
    res.keep_alive(req.keep_alive());
    return res;
}

} // namespace

std::optional<std::string> url_decode(std::string_view in) {
    std::string out;
    out.reserve(in.size());
    for (std::size_t i = 0; i < in.size(); ++i) {
        if (in[i] != '%') {
            out += in[i];
            continue;
        }
        if (i + 2 >= in.size()) return std::nullopt;
        const int hi = hex_value(in[i + 1]);
        const int lo = hex_value(in[i + 2]);
        if (hi < 0 || lo < 0) return std::nullopt;
        // A NUL would end the path early once it reaches open(2).
        if (hi == 0 && lo == 0) return std::nullopt;
        out += static_cast<char>((hi << 4) | lo);
        i += 2;
    }
    return out;
}

std::string clean_path(std::string_view path) {
    const bool trailing = !path.empty() && path.back() == '/';
    std::vector<std::string_view> segments;
    while (!path.empty()) {
        const auto slash = path.find('/');
        const auto seg = path.substr(0, slash);
        if (seg == "..") {
            if (!segments.empty()) segments.pop_back();
        } else if (!seg.empty() && seg != ".") {
            segments.push_back(seg);
        }
        if (slash == std::string_view::npos) break;
        path.remove_prefix(slash + 1);
    }
    std::string out = "/";
    for (std::size_t i = 0; i < segments.size(); ++i) {
        if (i) out += '/';
        out.append(segments[i]);
    }
    if (trailing && out.size() > 1) out += '/';
    return out;
}

std::string_view mime_type(std::string_view path) {
    const auto dot = path.rfind('.');
    if (dot == std::string_view::npos) return "application/octet-stream";
    std::string ext;
    for (char c : path.substr(dot)) ext += static_cast<char>((c >= 'A' && c <= 'Z') ? c - 'A' + 'a' : c);
    if (ext == ".htm" || ext == ".html") return "text/html; charset=utf-8";
    if (ext == ".css")  return "text/css; charset=utf-8";
    if (ext == ".txt")  return "text/plain; charset=utf-8";
    if (ext == ".js" || ext == ".mjs") return "text/javascript; charset=utf-8";
    if (ext == ".json") return "application/json";
    if (ext == ".xml")  return "text/xml; charset=utf-8";
    if (ext == ".png")  return "image/png";
    if (ext == ".jpe" || ext == ".jpeg" || ext == ".jpg") return "image/jpeg";
    if (ext == ".gif")  return "image/gif";
    if (ext == ".webp") return "image/webp";
    if (ext == ".ico")  return "image/vnd.microsoft.icon";
    if (ext == ".svg" || ext == ".svgz") return "image/svg+xml";
    if (ext == ".pdf")  return "application/pdf";
    if (ext == ".wasm") return "application/wasm";
    if (ext == ".woff2") return "font/woff2";
    return "application/octet-stream";
}

Reply serve_file(const routing::StaticHandler& target, const Request& req) {
    if (req.method() != bhttp::verb::get && req.method() != bhttp::verb::head) {
        auto res = make_text_response(bhttp::status::method_not_allowed, req, "Method Not Allowed\n");
        res.set(bhttp::field::allow, "GET, HEAD");
        return res;
    }

    std::string_view raw = req.target();
    std::string_view query;
    if (const auto q = raw.find('?'); q != std::string_view::npos) {
        query = raw.substr(q);
        raw = raw.substr(0, q);
    }
    const auto decoded = url_decode(raw);
    if (!decoded) {
        return make_text_response(bhttp::status::bad_request, req, "Bad Request\n");
    }
    const std::string url_path = clean_path(*decoded);

    const fs::path root{target.root};
    const fs::path local = (url_path == "/") ? root : root / fs::path(url_path.substr(1));

    std::error_code ec;
    const auto st = fs::status(local, ec);
    if (ec || !fs::exists(st)) return file_not_found(req);

    if (fs::is_directory(st)) {
        if (url_path.back() != '/') {
            return redirect(req, url_path + "/" + std::string(query));
        }
        const auto index = local / INDEX_FILE;
        std::error_code index_ec;
        if (fs::is_regular_file(fs::status(index, index_ec)) && !index_ec) {
            return regular_file(req, index);
        }
        return directory_listing(req, local);
    }
    if (url_path.size() > 1 && url_path.back() == '/') {
        // "/file.txt/" names a directory that does not exist.
        return file_not_found(req);
    }
    return regular_file(req, local);
}

} // namespace webfront::http
