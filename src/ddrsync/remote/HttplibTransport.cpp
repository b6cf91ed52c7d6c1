#ifndef CPPHTTPLIB_NO_EXCEPTIONS
#define CPPHTTPLIB_NO_EXCEPTIONS
#endif
#ifndef CPPHTTPLIB_OPENSSL_SUPPORT
#define CPPHTTPLIB_OPENSSL_SUPPORT
#endif

#include <httplib.h>

#include <ddrsync/remote/HttpTransport.hpp>

#include "log/TaggedLogger.hpp"

#include <cctype>
#include <charconv>
#include <memory>
#include <string>

namespace DS::Remote {

namespace {

std::unique_ptr<httplib::ClientImpl> make_http_client(UrlView const& url, std::chrono::milliseconds timeout) {
    std::unique_ptr<httplib::ClientImpl> client;
    if (url.tls) {
#ifdef CPPHTTPLIB_OPENSSL_SUPPORT
        auto ssl_client = std::make_unique<httplib::SSLClient>(url.host, url.port);
        ssl_client->enable_server_certificate_verification(true);
        client = std::unique_ptr<httplib::ClientImpl>(std::move(ssl_client));
#else
        return nullptr;
#endif
    } else {
        client = std::make_unique<httplib::ClientImpl>(url.host, url.port);
    }
    if (timeout <= std::chrono::milliseconds::zero()) {
        timeout = std::chrono::seconds{10};
    }
    auto const seconds = static_cast<time_t>(timeout.count() / 1000);
    auto const micros  = static_cast<time_t>((timeout.count() % 1000) * 1000);
    client->set_connection_timeout(seconds, micros);
    client->set_read_timeout(seconds, micros);
    client->set_write_timeout(seconds, micros);
    client->set_follow_location(false);
    client->set_keep_alive(false);
    return client;
}

auto unavailable(HttpRequest const& request, std::string reason) -> DS::Error {
    std::string message{to_string(request.method)};
    message.push_back(' ');
    message.append(request.url);
    message.append(" failed: ");
    message.append(reason);
    return DS::Error{DS::Error::Code::RemoteUnavailable, std::move(message)};
}

} // namespace

auto to_string(HttpMethod method) -> std::string_view {
    switch (method) {
    case HttpMethod::Get:
        return "GET";
    case HttpMethod::Post:
        return "POST";
    case HttpMethod::Patch:
        return "PATCH";
    }
    return "GET";
}

auto parse_url(std::string_view url) -> std::optional<UrlView> {
    auto scheme_end = url.find("://");
    if (scheme_end == std::string_view::npos) {
        return std::nullopt;
    }
    auto scheme = url.substr(0, scheme_end);
    bool tls    = false;
    if (scheme == "https") {
        tls = true;
    } else if (scheme == "http") {
        tls = false;
    } else {
        return std::nullopt;
    }

    auto remainder = url.substr(scheme_end + 3);
    auto slash     = remainder.find('/');
    std::string_view authority;
    std::string      path;
    if (slash == std::string_view::npos) {
        authority = remainder;
        path      = "/";
    } else {
        authority = remainder.substr(0, slash);
        path      = std::string{remainder.substr(slash)};
    }
    if (authority.empty()) {
        return std::nullopt;
    }

    std::string host;
    int         port  = tls ? 443 : 80;
    auto        colon = authority.rfind(':');
    if (colon != std::string_view::npos) {
        host           = std::string{authority.substr(0, colon)};
        auto port_view = authority.substr(colon + 1);
        if (port_view.empty()) {
            return std::nullopt;
        }
        int  parsed_port = 0;
        auto result      = std::from_chars(port_view.data(), port_view.data() + port_view.size(), parsed_port);
        if (result.ec != std::errc{} || result.ptr != port_view.data() + port_view.size() || parsed_port <= 0
            || parsed_port > 65535) {
            return std::nullopt;
        }
        port = parsed_port;
    } else {
        host = std::string{authority};
    }

    if (host.empty()) {
        return std::nullopt;
    }

    return UrlView{std::string{scheme}, std::move(host), std::move(path), port, tls};
}

auto percent_encode(std::string_view value) -> std::string {
    static constexpr char kHexDigits[] = "0123456789ABCDEF";
    std::string           encoded;
    encoded.reserve(value.size() * 2);
    for (unsigned char ch : value) {
        if ((std::isalnum(ch) != 0) || ch == '-' || ch == '_' || ch == '.' || ch == '~') {
            encoded.push_back(static_cast<char>(ch));
        } else {
            encoded.push_back('%');
            encoded.push_back(kHexDigits[(ch >> 4) & 0x0F]);
            encoded.push_back(kHexDigits[ch & 0x0F]);
        }
    }
    return encoded;
}

auto HttplibTransport::send(HttpRequest const& request) -> DS::Expected<HttpResponse> {
    auto url = parse_url(request.url);
    if (!url) {
        return std::unexpected(DS::Error{DS::Error::Code::InvalidArgument, "invalid url: " + request.url});
    }
    auto client = make_http_client(*url, request.timeout);
    if (!client) {
        return std::unexpected(unavailable(request, "http client unavailable"));
    }
    if (request.basic_auth) {
        client->set_basic_auth(request.basic_auth->user, request.basic_auth->password);
    }

    httplib::Headers headers;
    for (auto const& [name, value] : request.headers) {
        headers.emplace(name, value);
    }

    ds_log(std::string{to_string(request.method)} + " " + request.url, "Transport");

    httplib::Result response;
    switch (request.method) {
    case HttpMethod::Get:
        response = client->Get(url->path, headers);
        break;
    case HttpMethod::Post:
        response = client->Post(url->path, headers, request.body, request.content_type);
        break;
    case HttpMethod::Patch:
        response = client->Patch(url->path, headers, request.body, request.content_type);
        break;
    }

    if (!response) {
        return std::unexpected(unavailable(request, httplib::to_string(response.error())));
    }
    return HttpResponse{response->status, response->body};
}

} // namespace DS::Remote
