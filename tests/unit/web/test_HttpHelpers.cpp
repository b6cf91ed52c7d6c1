#include <ddrsync/remote/HttpTransport.hpp>
#include <ddrsync/web/HttpHelpers.hpp>

#include <doctest/doctest.h>

using DS::Error;

TEST_SUITE("web.helpers") {

TEST_CASE("Error codes map to HTTP statuses") {
    CHECK(DS::Web::status_for_error(Error::Code::NotConfigured) == 400);
    CHECK(DS::Web::status_for_error(Error::Code::InvalidArgument) == 400);
    CHECK(DS::Web::status_for_error(Error::Code::NotFound) == 404);
    CHECK(DS::Web::status_for_error(Error::Code::FieldNotResolved) == 409);
    CHECK(DS::Web::status_for_error(Error::Code::ParseFailure) == 502);
    CHECK(DS::Web::status_for_error(Error::Code::RemoteUnavailable) == 503);
    CHECK(DS::Web::status_for_error(Error::Code::IoFailure) == 500);

    CHECK(DS::Web::error_text(Error{Error::Code::NotFound, "gone"}) == "gone");
    CHECK(DS::Web::error_text(Error{Error::Code::NotFound, {}}) == "not_found");
}

TEST_CASE("Query values parse strictly") {
    CHECK(DS::Web::parse_bool_value("1") == true);
    CHECK(DS::Web::parse_bool_value(" Yes ") == true);
    CHECK(DS::Web::parse_bool_value("off") == false);
    CHECK_FALSE(DS::Web::parse_bool_value("maybe").has_value());

    CHECK(DS::Web::parse_int_value("42") == 42);
    CHECK(DS::Web::parse_int_value(" -7 ") == -7);
    CHECK_FALSE(DS::Web::parse_int_value("4.2").has_value());
    CHECK_FALSE(DS::Web::parse_int_value("").has_value());

    CHECK(DS::Web::parse_double_value("1700000000000.5").value_or(0.0) == doctest::Approx(1700000000000.5));
    CHECK_FALSE(DS::Web::parse_double_value("inf").has_value());
    CHECK_FALSE(DS::Web::parse_double_value("12ms").has_value());
}

} // TEST_SUITE

TEST_SUITE("remote.url") {

TEST_CASE("URLs split into scheme, host, port and path") {
    auto https = DS::Remote::parse_url("https://app.singular.live/apiv2/controlapps/x/model");
    REQUIRE(https.has_value());
    CHECK(https->tls);
    CHECK(https->host == "app.singular.live");
    CHECK(https->port == 443);
    CHECK(https->path == "/apiv2/controlapps/x/model");

    auto device = DS::Remote::parse_url("http://10.0.0.5:8080");
    REQUIRE(device.has_value());
    CHECK_FALSE(device->tls);
    CHECK(device->port == 8080);
    CHECK(device->path == "/");

    CHECK_FALSE(DS::Remote::parse_url("ftp://host/x").has_value());
    CHECK_FALSE(DS::Remote::parse_url("http://").has_value());
    CHECK_FALSE(DS::Remote::parse_url("http://host:99999/").has_value());
    CHECK_FALSE(DS::Remote::parse_url("http://host:80x/").has_value());
    CHECK_FALSE(DS::Remote::parse_url("no-scheme").has_value());
}

TEST_CASE("Percent encoding keeps unreserved characters") {
    CHECK(DS::Remote::percent_encode("abc-_.~123") == "abc-_.~123");
    CHECK(DS::Remote::percent_encode("a b/c") == "a%20b%2Fc");
}

} // TEST_SUITE
