#pragma once

#include <chrono>
#include <map>
#include <memory>
#include <string>

#include <rtvoice/core/error.hpp>

namespace rtvoice::signaling {

struct HttpRequest {
    std::string method = "POST";
    std::string url;
    std::map<std::string, std::string> headers;
    std::string body;
};

struct HttpResponse {
    int status = 0;
    std::string body;
    std::map<std::string, std::string> headers;
};

// Generic blocking request/response capability.
// Transport failures (DNS, TCP, TLS, timeout) throw core::Error with a
// network error code; any HTTP status is returned, not thrown.
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    virtual HttpResponse send(const HttpRequest& request) = 0;
};

struct Url {
    std::string scheme;
    std::string host;
    std::string port;
    std::string target;

    bool secure() const { return scheme == "https"; }

    // Throws core::Error(InvalidAddress) for anything but http(s)://host[:port][/path]
    static Url parse(const std::string& url);
};

struct HttpOptions {
    std::chrono::milliseconds timeout{15000};
    std::string user_agent = "rtvoice/1.0";
    bool verify_peer = true;
};

// Boost.Beast implementation over plain TCP or TLS
class BeastHttpTransport : public HttpTransport {
public:
    explicit BeastHttpTransport(HttpOptions options = {});

    HttpResponse send(const HttpRequest& request) override;

private:
    HttpOptions options_;
};

} // namespace rtvoice::signaling
