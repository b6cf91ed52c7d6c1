#pragma once

#include <ddrsync/core/Error.hpp>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace httplib {
class Request;
class Response;
}

namespace DS::Web {

inline constexpr std::size_t kMaxApiPayloadBytes = 1024 * 1024;

// NotConfigured/InvalidArgument 400, NotFound 404, FieldNotResolved 409,
// ParseFailure 502, RemoteUnavailable 503, everything else 500.
auto status_for_error(DS::Error::Code code) -> int;

// The message, or the code name when there is none.
auto error_text(DS::Error const& error) -> std::string;

void write_json_response(httplib::Response& res, nlohmann::json const& payload, int status, bool no_store = false);

void respond_error(httplib::Response& res, DS::Error const& error);
void respond_bad_request(httplib::Response& res, std::string_view message);
void respond_not_found(httplib::Response& res, std::string_view message);
void respond_payload_too_large(httplib::Response& res);

auto query_value(httplib::Request const& req, std::string const& name) -> std::optional<std::string>;

auto parse_bool_value(std::string_view text) -> std::optional<bool>;
auto parse_int_value(std::string_view text) -> std::optional<int>;
auto parse_double_value(std::string_view text) -> std::optional<double>;

// Parses the request body as a JSON object; writes a 400/413 and returns
// nullopt otherwise.
auto read_json_object(httplib::Request const& req, httplib::Response& res) -> std::optional<nlohmann::json>;

} // namespace DS::Web
