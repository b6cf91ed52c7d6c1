#pragma once

#include <ddrsync/core/Error.hpp>

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace DS::Remote {

enum class HttpMethod {
    Get,
    Post,
    Patch,
};

auto to_string(HttpMethod method) -> std::string_view;

struct BasicAuth {
    std::string user;
    std::string password;
};

struct HttpRequest {
    HttpMethod                                       method{HttpMethod::Get};
    std::string                                      url;
    std::vector<std::pair<std::string, std::string>> headers;
    std::string                                      body;
    std::string                                      content_type;
    std::optional<BasicAuth>                         basic_auth;
    std::chrono::milliseconds                        timeout{std::chrono::seconds{10}};
};

struct HttpResponse {
    int         status{0};
    std::string body;

    auto ok() const -> bool { return status >= 200 && status < 300; }
};

// A transport failure (refused connection, DNS, timeout) comes back as
// Error::Code::RemoteUnavailable. Status codes are left to the caller.
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    virtual auto send(HttpRequest const& request) -> DS::Expected<HttpResponse> = 0;
};

struct UrlView {
    std::string scheme;
    std::string host;
    std::string path;
    int         port{0};
    bool        tls{false};
};

auto parse_url(std::string_view url) -> std::optional<UrlView>;
auto percent_encode(std::string_view value) -> std::string;

class HttplibTransport final : public HttpTransport {
public:
    auto send(HttpRequest const& request) -> DS::Expected<HttpResponse> override;
};

} // namespace DS::Remote
