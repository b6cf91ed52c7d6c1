#include <doctest/doctest.h>

#include <ddrsync/remote/PlaybackDeviceClient.hpp>

#include "../FakeHttpTransport.hpp"

#include <map>
#include <string>

using DS::Remote::DeviceEndpoint;
using DS::Remote::HttpMethod;
using DS::Remote::PlaybackDeviceClient;
using DS::Remote::XmlDocument;
using DS::Testing::FakeHttpTransport;

namespace {

constexpr char kTimecodeUrl[] = "http://10.0.0.5/v1/dictionary?key=ddr_timecode";
constexpr char kFallbackUrl[] = "http://10.0.0.5/v1/dictionary?key=timecode";

auto endpoint() -> DeviceEndpoint {
    return DeviceEndpoint{true, "10.0.0.5", "admin", "secret"};
}

auto parse(std::string const& xml) -> XmlDocument {
    auto document = XmlDocument::parse(xml);
    REQUIRE(document.has_value());
    return *document;
}

} // namespace

TEST_SUITE("remote.device") {

TEST_CASE("Indexed slot elements carry the duration") {
    auto document = parse(R"(<state><ddr index="2" file_duration="00:02:05.50" clip_framerate="25"/></state>)");
    auto duration = DS::Remote::extract_slot_duration(document, 2);
    REQUIRE(duration.has_value());
    CHECK(duration->seconds == doctest::Approx(125.5));
    REQUIRE(duration->framerate.has_value());
    CHECK(*duration->framerate == doctest::Approx(25.0));
    CHECK_FALSE(DS::Remote::extract_slot_duration(document, 1).has_value());
}

TEST_CASE("Named slot elements fall back to duration and then elapsed plus remaining") {
    auto named = parse(R"(<state><ddr1 duration="42.5"/></state>)");
    auto direct = DS::Remote::extract_slot_duration(named, 1);
    REQUIRE(direct.has_value());
    CHECK(direct->seconds == doctest::Approx(42.5));
    CHECK_FALSE(direct->framerate.has_value());

    auto split = parse(R"(<state><ddr3 clip_seconds_elapsed="12.25" clip_seconds_remaining="47.75" clip_framerate="29.97"/></state>)");
    auto summed = DS::Remote::extract_slot_duration(split, 3);
    REQUIRE(summed.has_value());
    CHECK(summed->seconds == doctest::Approx(60.0));
    CHECK(summed->framerate.value_or(0.0) == doctest::Approx(29.97));

    auto partial = parse(R"(<state><ddr4 clip_seconds_elapsed="3"/></state>)");
    CHECK_FALSE(DS::Remote::extract_slot_duration(partial, 4).has_value());
}

TEST_CASE("The indexed shape wins over the named shape") {
    auto document = parse(R"(<state><ddr1 file_duration="10"/><ddr index="1" file_duration="20"/></state>)");
    auto duration = DS::Remote::extract_slot_duration(document, 1);
    REQUIRE(duration.has_value());
    CHECK(duration->seconds == doctest::Approx(20.0));
}

TEST_CASE("An indexed element without a duration defers to the named shape") {
    auto document = parse(R"(<state><ddr index="1" playing="true"/><ddr1 file_duration="15"/></state>)");
    auto duration = DS::Remote::extract_slot_duration(document, 1);
    REQUIRE(duration.has_value());
    CHECK(duration->seconds == doctest::Approx(15.0));
}

TEST_CASE("Slot durations are looked up under each status key in order") {
    FakeHttpTransport transport;
    transport.respond_ok(HttpMethod::Get, kTimecodeUrl, "<ddr_timecode><ddr2 file_duration='5'/></ddr_timecode>");
    transport.respond_ok(HttpMethod::Get, kFallbackUrl, "<timecode><ddr1 file_duration='00:00:30'/></timecode>");

    PlaybackDeviceClient client{transport, endpoint()};
    auto                 duration = client.fetch_slot_duration(1);
    REQUIRE(duration.has_value());
    CHECK(duration->seconds == doctest::Approx(30.0));

    auto requests = transport.requests();
    REQUIRE(requests.size() == 2);
    CHECK(requests[0].url == kTimecodeUrl);
    CHECK(requests[1].url == kFallbackUrl);
}

TEST_CASE("A slot missing from every document is NotFound") {
    FakeHttpTransport transport;
    transport.respond_ok(HttpMethod::Get, kTimecodeUrl, "<ddr_timecode/>");
    transport.fail(HttpMethod::Get, kFallbackUrl);

    PlaybackDeviceClient client{transport, endpoint()};
    auto                 duration = client.fetch_slot_duration(3);
    REQUIRE_FALSE(duration.has_value());
    CHECK(duration.error().code == DS::Error::Code::NotFound);
}

TEST_CASE("NotFound keeps the failure of an unreadable dictionary visible") {
    FakeHttpTransport transport;
    transport.fail(HttpMethod::Get, kTimecodeUrl, "timed out");
    transport.respond_ok(HttpMethod::Get, kFallbackUrl, "<timecode><ddr1 file_duration='12'/></timecode>");

    PlaybackDeviceClient client{transport, endpoint()};
    auto                 duration = client.fetch_slot_duration(4);
    REQUIRE_FALSE(duration.has_value());
    CHECK(duration.error().code == DS::Error::Code::NotFound);
    auto const message = duration.error().message.value_or("");
    CHECK(message.find("DDR 4") != std::string::npos);
    CHECK(message.find("ddr_timecode unavailable") != std::string::npos);
    CHECK(message.find("remote_unavailable") != std::string::npos);
    CHECK(message.find("timed out") != std::string::npos);
}

TEST_CASE("NotFound without transport failures names only the slot") {
    FakeHttpTransport transport;
    transport.respond_ok(HttpMethod::Get, kTimecodeUrl, "<ddr_timecode/>");
    transport.respond_ok(HttpMethod::Get, kFallbackUrl, "<timecode/>");

    PlaybackDeviceClient client{transport, endpoint()};
    auto                 duration = client.fetch_slot_duration(2);
    REQUIRE_FALSE(duration.has_value());
    CHECK(duration.error().code == DS::Error::Code::NotFound);
    CHECK(duration.error().message.value_or("").find("unavailable") == std::string::npos);
}

TEST_CASE("Transport failures surface when no document was readable") {
    FakeHttpTransport transport;
    transport.fail(HttpMethod::Get, "http://10.0.0.5/");

    PlaybackDeviceClient client{transport, endpoint()};
    auto                 duration = client.fetch_slot_duration(1);
    REQUIRE_FALSE(duration.has_value());
    CHECK(duration.error().code == DS::Error::Code::RemoteUnavailable);
}

TEST_CASE("Unreachable configuration fails before any request") {
    FakeHttpTransport transport;

    DeviceEndpoint disabled = endpoint();
    disabled.enabled        = false;
    auto off                = PlaybackDeviceClient{transport, disabled}.fetch_slot_duration(1);
    REQUIRE_FALSE(off.has_value());
    CHECK(off.error().code == DS::Error::Code::NotConfigured);

    DeviceEndpoint hostless = endpoint();
    hostless.host.clear();
    auto missing = PlaybackDeviceClient{transport, hostless}.test_connection();
    REQUIRE_FALSE(missing.has_value());
    CHECK(missing.error().code == DS::Error::Code::NotConfigured);

    CHECK(transport.requests().empty());
}

TEST_CASE("Requests carry basic auth only when a password is set") {
    FakeHttpTransport transport;
    transport.respond_ok(HttpMethod::Get, "http://10.0.0.5/v1/version", "<version>8.1</version>");

    PlaybackDeviceClient with_password{transport, endpoint()};
    REQUIRE(with_password.test_connection().has_value());

    DeviceEndpoint open = endpoint();
    open.password.clear();
    PlaybackDeviceClient without_password{transport, open};
    REQUIRE(without_password.test_connection().has_value());

    auto requests = transport.requests();
    REQUIRE(requests.size() == 2);
    REQUIRE(requests[0].basic_auth.has_value());
    CHECK(requests[0].basic_auth->user == "admin");
    CHECK(requests[0].basic_auth->password == "secret");
    CHECK_FALSE(requests[1].basic_auth.has_value());
}

TEST_CASE("Non-2xx device replies are RemoteUnavailable") {
    FakeHttpTransport transport;
    transport.respond_ok(HttpMethod::Get, "http://10.0.0.5/v1/version", "denied", 401);

    PlaybackDeviceClient client{transport, endpoint()};
    auto                 version = client.test_connection();
    REQUIRE_FALSE(version.has_value());
    CHECK(version.error().code == DS::Error::Code::RemoteUnavailable);
    CHECK(version.error().message.value_or("").find("401") != std::string::npos);
}

TEST_CASE("Shortcut bodies are XML with escaped values") {
    auto xml = DS::Remote::build_shortcut_xml("ddr1_play", {{"value", "a'b<c&d"}});
    CHECK(xml == "<shortcut name='ddr1_play'><entry key='value' value='a&apos;b&lt;c&amp;d'/></shortcut>");
    CHECK(DS::Remote::build_shortcut_xml("main_take", {}) == "<shortcut name='main_take'></shortcut>");

    FakeHttpTransport transport;
    transport.respond_ok(HttpMethod::Post, "http://10.0.0.5/v1/shortcut", "");
    PlaybackDeviceClient client{transport, endpoint()};
    REQUIRE(client.send_shortcut("ddr2_reset").has_value());

    auto posts = transport.requests_matching(HttpMethod::Post);
    REQUIRE(posts.size() == 1);
    CHECK(posts[0].body == "<shortcut name='ddr2_reset'></shortcut>");
    CHECK(posts[0].content_type == "text/xml");

    auto empty = client.send_shortcut("");
    REQUIRE_FALSE(empty.has_value());
    CHECK(empty.error().code == DS::Error::Code::InvalidArgument);
}

TEST_CASE("Slot info and tally are read from their dictionaries") {
    FakeHttpTransport transport;
    transport.respond_ok(HttpMethod::Get,
                         kTimecodeUrl,
                         R"(<ddr_timecode>
  <ddr1 file_duration="00:00:20" clip_seconds_elapsed="4" clip_seconds_remaining="16" playing="true" filename="intro.mov"/>
  <ddr3 duration="9" clip_name="bumper"/>
</ddr_timecode>)");
    transport.respond_ok(HttpMethod::Get,
                         "http://10.0.0.5/v1/dictionary?key=tally",
                         R"(<tally><input1 on_pgm="true"/><input2 on_pvw="true"/><ddr1 program="true" preview="true"/></tally>)");

    PlaybackDeviceClient client{transport, endpoint()};
    auto                 slots = client.slot_info();
    REQUIRE(slots.has_value());
    REQUIRE(slots->size() == 2);
    CHECK((*slots)[0].slot == 1);
    CHECK((*slots)[0].playing);
    CHECK((*slots)[0].duration == "00:00:20");
    CHECK((*slots)[0].filename == "intro.mov");
    CHECK((*slots)[1].slot == 3);
    CHECK_FALSE((*slots)[1].playing);
    CHECK((*slots)[1].filename == "bumper");

    auto tally = client.tally();
    REQUIRE(tally.has_value());
    CHECK(tally->program == std::vector<std::string>{"input1", "ddr1"});
    CHECK(tally->preview == std::vector<std::string>{"input2", "ddr1"});
}

TEST_CASE("Dictionary documents that are not XML report ParseFailure") {
    FakeHttpTransport transport;
    transport.respond_ok(HttpMethod::Get, kTimecodeUrl, "<broken");

    PlaybackDeviceClient client{transport, endpoint()};
    auto                 slots = client.slot_info();
    REQUIRE_FALSE(slots.has_value());
    CHECK(slots.error().code == DS::Error::Code::ParseFailure);
}

} // TEST_SUITE
