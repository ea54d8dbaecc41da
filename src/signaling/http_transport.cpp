#include <rtvoice/signaling/http.hpp>
#include <rtvoice/core/logger.hpp>

#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/error.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/asio/ssl/stream.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>

#include <openssl/err.h>
#include <openssl/ssl.h>

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
using tcp = net::ip::tcp;

namespace rtvoice::signaling {

Url Url::parse(const std::string& url) {
    Url result;

    auto scheme_end = url.find("://");
    if (scheme_end == std::string::npos) {
        core::throw_error(core::ErrorCode::InvalidAddress, "URL has no scheme: " + url);
    }
    result.scheme = url.substr(0, scheme_end);
    if (result.scheme != "http" && result.scheme != "https") {
        core::throw_error(core::ErrorCode::InvalidAddress, "Unsupported URL scheme: " + result.scheme);
    }

    auto authority_start = scheme_end + 3;
    auto path_start = url.find('/', authority_start);
    std::string authority = url.substr(authority_start,
        path_start == std::string::npos ? std::string::npos : path_start - authority_start);
    result.target = path_start == std::string::npos ? "/" : url.substr(path_start);

    // IPv6 literal: [::1]:8000
    if (!authority.empty() && authority.front() == '[') {
        auto close = authority.find(']');
        if (close == std::string::npos) {
            core::throw_error(core::ErrorCode::InvalidAddress, "Malformed IPv6 host in URL: " + url);
        }
        result.host = authority.substr(1, close - 1);
        if (close + 1 < authority.size() && authority[close + 1] == ':') {
            result.port = authority.substr(close + 2);
        }
    } else {
        auto colon = authority.rfind(':');
        if (colon != std::string::npos) {
            result.host = authority.substr(0, colon);
            result.port = authority.substr(colon + 1);
        } else {
            result.host = authority;
        }
    }

    if (result.host.empty()) {
        core::throw_error(core::ErrorCode::InvalidAddress, "URL has no host: " + url);
    }
    if (result.port.empty()) {
        result.port = result.secure() ? "443" : "80";
    }
    return result;
}

BeastHttpTransport::BeastHttpTransport(HttpOptions options)
    : options_(std::move(options)) {}

namespace {

http::request<http::string_body> buildRequest(const HttpRequest& request, const Url& url,
                                              const HttpOptions& options) {
    http::request<http::string_body> req;
    req.method_string(request.method);
    req.target(url.target);
    req.version(11);
    req.set(http::field::host, url.host);
    req.set(http::field::user_agent, options.user_agent);
    for (const auto& [name, value] : request.headers) {
        req.set(name, value);
    }
    req.body() = request.body;
    req.prepare_payload();
    return req;
}

HttpResponse toResponse(http::response<http::string_body>& res) {
    HttpResponse response;
    response.status = static_cast<int>(res.result_int());
    response.body = std::move(res.body());
    for (const auto& field : res) {
        response.headers[std::string(field.name_string())] = std::string(field.value());
    }
    return response;
}

template<typename Stream>
HttpResponse exchange(Stream& stream, http::request<http::string_body>& req) {
    http::write(stream, req);

    beast::flat_buffer buffer;
    http::response<http::string_body> res;
    http::read(stream, buffer, res);
    return toResponse(res);
}

} // namespace

HttpResponse BeastHttpTransport::send(const HttpRequest& request) {
    const Url url = Url::parse(request.url);
    core::Logger::debug("HTTP {} {}://{}:{}{}", request.method, url.scheme, url.host, url.port, url.target);

    try {
        net::io_context ioc;
        tcp::resolver resolver(ioc);
        auto endpoints = resolver.resolve(url.host, url.port);
        auto req = buildRequest(request, url, options_);

        if (!url.secure()) {
            beast::tcp_stream stream(ioc);
            stream.expires_after(options_.timeout);
            stream.connect(endpoints);

            auto response = exchange(stream, req);

            beast::error_code ec;
            stream.socket().shutdown(tcp::socket::shutdown_both, ec);
            return response;
        }

        ssl::context ctx(ssl::context::tls_client);
        ctx.set_default_verify_paths();
        ctx.set_verify_mode(options_.verify_peer ? ssl::verify_peer : ssl::verify_none);

        beast::ssl_stream<beast::tcp_stream> stream(ioc, ctx);
        // SNI
        if (!SSL_set_tlsext_host_name(stream.native_handle(), url.host.c_str())) {
            beast::error_code ec{static_cast<int>(::ERR_get_error()), net::error::get_ssl_category()};
            throw beast::system_error{ec};
        }
        if (options_.verify_peer) {
            stream.set_verify_callback(ssl::host_name_verification(url.host));
        }

        beast::get_lowest_layer(stream).expires_after(options_.timeout);
        beast::get_lowest_layer(stream).connect(endpoints);
        stream.handshake(ssl::stream_base::client);

        auto response = exchange(stream, req);

        beast::error_code ec;
        stream.shutdown(ec);
        // Banyak server menutup koneksi tanpa close_notify
        if (ec && ec != net::error::eof && ec != ssl::error::stream_truncated) {
            core::Logger::debug("TLS shutdown: {}", ec.message());
        }
        return response;
    }
    catch (const beast::system_error& e) {
        const auto code = e.code() == beast::error::timeout ? core::ErrorCode::ConnectionTimeout
                                                             : core::ErrorCode::NetworkError;
        throw core::Error(code, "HTTP " + request.method + " " + request.url + " failed: " + e.code().message());
    }
}

} // namespace rtvoice::signaling
