#ifndef CPPHTTPLIB_NO_EXCEPTIONS
#define CPPHTTPLIB_NO_EXCEPTIONS
#endif
#ifndef CPPHTTPLIB_OPENSSL_SUPPORT
#define CPPHTTPLIB_OPENSSL_SUPPORT
#endif

#include <httplib.h>

#include <ddrsync/web/HttpHelpers.hpp>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <iterator>

namespace DS::Web {

namespace {

auto trim_view(std::string_view value) -> std::string_view {
    while (!value.empty() && std::isspace(static_cast<unsigned char>(value.front())) != 0) {
        value.remove_prefix(1);
    }
    while (!value.empty() && std::isspace(static_cast<unsigned char>(value.back())) != 0) {
        value.remove_suffix(1);
    }
    return value;
}

} // namespace

auto status_for_error(DS::Error::Code code) -> int {
    switch (code) {
    case DS::Error::Code::NotConfigured:
    case DS::Error::Code::InvalidArgument:
        return 400;
    case DS::Error::Code::NotFound:
        return 404;
    case DS::Error::Code::FieldNotResolved:
        return 409;
    case DS::Error::Code::ParseFailure:
        return 502;
    case DS::Error::Code::RemoteUnavailable:
        return 503;
    case DS::Error::Code::IoFailure:
    case DS::Error::Code::UnknownError:
        return 500;
    }
    return 500;
}

auto error_text(DS::Error const& error) -> std::string {
    if (error.message && !error.message->empty()) {
        return *error.message;
    }
    return std::string{DS::errorCodeToString(error.code)};
}

void write_json_response(httplib::Response& res, nlohmann::json const& payload, int status, bool no_store) {
    res.status = status;
    res.set_content(payload.dump(), "application/json; charset=utf-8");
    if (no_store) {
        res.set_header("Cache-Control", "no-store");
    }
}

void respond_error(httplib::Response& res, DS::Error const& error) {
    write_json_response(res,
                        nlohmann::json{{"error", DS::errorCodeToString(error.code)}, {"message", error_text(error)}},
                        status_for_error(error.code),
                        true);
}

void respond_bad_request(httplib::Response& res, std::string_view message) {
    write_json_response(res, nlohmann::json{{"error", "bad_request"}, {"message", message}}, 400, true);
}

void respond_not_found(httplib::Response& res, std::string_view message) {
    write_json_response(res, nlohmann::json{{"error", "not_found"}, {"message", message}}, 404, true);
}

void respond_payload_too_large(httplib::Response& res) {
    write_json_response(res,
                        nlohmann::json{{"error", "payload_too_large"}, {"message", "Request body exceeds 1 MiB limit"}},
                        413,
                        true);
}

auto query_value(httplib::Request const& req, std::string const& name) -> std::optional<std::string> {
    if (!req.has_param(name)) {
        return std::nullopt;
    }
    return req.get_param_value(name);
}

auto parse_bool_value(std::string_view text) -> std::optional<bool> {
    text = trim_view(text);
    if (text.empty()) {
        return std::nullopt;
    }
    std::string normalized;
    normalized.reserve(text.size());
    std::transform(text.begin(), text.end(), std::back_inserter(normalized), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    if (normalized == "1" || normalized == "true" || normalized == "yes" || normalized == "on") {
        return true;
    }
    if (normalized == "0" || normalized == "false" || normalized == "no" || normalized == "off") {
        return false;
    }
    return std::nullopt;
}

auto parse_int_value(std::string_view text) -> std::optional<int> {
    text = trim_view(text);
    int  value{};
    auto result = std::from_chars(text.data(), text.data() + text.size(), value);
    if (text.empty() || result.ec != std::errc{} || result.ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

auto parse_double_value(std::string_view text) -> std::optional<double> {
    text = trim_view(text);
    double value{};
    auto   result = std::from_chars(text.data(), text.data() + text.size(), value);
    if (text.empty() || result.ec != std::errc{} || result.ptr != text.data() + text.size() || !std::isfinite(value)) {
        return std::nullopt;
    }
    return value;
}

auto read_json_object(httplib::Request const& req, httplib::Response& res) -> std::optional<nlohmann::json> {
    if (req.body.size() > kMaxApiPayloadBytes) {
        respond_payload_too_large(res);
        return std::nullopt;
    }
    if (req.body.empty()) {
        respond_bad_request(res, "body must not be empty");
        return std::nullopt;
    }
    auto payload = nlohmann::json::parse(req.body, nullptr, false);
    if (payload.is_discarded() || !payload.is_object()) {
        respond_bad_request(res, "body must be a JSON object");
        return std::nullopt;
    }
    return payload;
}

} // namespace DS::Web
