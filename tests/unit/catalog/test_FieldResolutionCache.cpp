#include <doctest/doctest.h>

#include <ddrsync/catalog/FieldResolutionCache.hpp>
#include <ddrsync/remote/ControlAppClient.hpp>

#include "../FakeHttpTransport.hpp"

#include <set>
#include <string>

using DS::Catalog::FieldOwnerMap;
using DS::Catalog::FieldResolutionCache;
using DS::Remote::ControlAppClient;
using DS::Remote::HttpMethod;
using DS::Testing::FakeHttpTransport;

namespace {

constexpr char kModelUrl[]   = "https://api.test/controlapps/tok/model";
constexpr char kOtherUrl[]   = "https://api.test/controlapps/other/model";
constexpr char kTimerModel[] = R"([
  {"id": "top", "name": "Top", "model": [{"id": "m1"}], "subcompositions": [
    {"id": "inner", "name": "Inner", "model": [{"id": "s1"}, {"id": "tc1"}]}
  ]}
])";

} // namespace

TEST_SUITE("catalog.fieldcache") {

TEST_CASE("Field owners come from every depth of the model") {
    FakeHttpTransport transport;
    transport.respond_ok(HttpMethod::Get, kModelUrl, kTimerModel);
    ControlAppClient     client{transport, "https://api.test"};
    FieldResolutionCache cache{client};

    auto owners = cache.resolve_fields("tok", {"m1", "s1", "ghost"});
    REQUIRE(owners.has_value());
    CHECK(*owners == FieldOwnerMap{{"m1", "top"}, {"s1", "inner"}});
}

TEST_CASE("The same id set in any order is fetched once") {
    FakeHttpTransport transport;
    transport.respond_ok(HttpMethod::Get, kModelUrl, kTimerModel);
    ControlAppClient     client{transport, "https://api.test"};
    FieldResolutionCache cache{client};

    std::set<std::string> const first{"m1", "s1"};
    std::set<std::string> const second{"s1", "m1"};
    REQUIRE(cache.resolve_fields("tok", first).has_value());
    REQUIRE(cache.resolve_fields("tok", second).has_value());
    CHECK(transport.count(HttpMethod::Get, kModelUrl) == 1);
    CHECK(cache.size() == 1);

    REQUIRE(cache.resolve_fields("tok", {"tc1"}).has_value());
    CHECK(transport.count(HttpMethod::Get, kModelUrl) == 2);
    CHECK(cache.size() == 2);
}

TEST_CASE("Failed fetches are returned and not cached") {
    FakeHttpTransport transport;
    transport.respond_ok(HttpMethod::Get, kModelUrl, "oops", 500);
    transport.respond_ok(HttpMethod::Get, kModelUrl, kTimerModel);
    ControlAppClient     client{transport, "https://api.test"};
    FieldResolutionCache cache{client};

    auto failed = cache.resolve_fields("tok", {"m1"});
    REQUIRE_FALSE(failed.has_value());
    CHECK(failed.error().code == DS::Error::Code::RemoteUnavailable);
    CHECK(cache.size() == 0);

    auto retried = cache.resolve_fields("tok", {"m1"});
    REQUIRE(retried.has_value());
    CHECK(retried->at("m1") == "top");
    CHECK(cache.size() == 1);
}

TEST_CASE("Invalidation clears one token or everything") {
    FakeHttpTransport transport;
    transport.respond_ok(HttpMethod::Get, kModelUrl, kTimerModel);
    transport.respond_ok(HttpMethod::Get, kOtherUrl, kTimerModel);
    ControlAppClient     client{transport, "https://api.test"};
    FieldResolutionCache cache{client};

    REQUIRE(cache.resolve_fields("tok", {"m1"}).has_value());
    REQUIRE(cache.resolve_fields("other", {"m1"}).has_value());
    CHECK(cache.size() == 2);

    cache.invalidate("tok");
    CHECK(cache.size() == 1);
    REQUIRE(cache.resolve_fields("tok", {"m1"}).has_value());
    CHECK(transport.count(HttpMethod::Get, kModelUrl) == 2);
    CHECK(transport.count(HttpMethod::Get, kOtherUrl) == 1);

    cache.invalidate();
    CHECK(cache.size() == 0);
}

} // TEST_SUITE
