#include <doctest/doctest.h>

#include <ddrsync/remote/XmlDocument.hpp>

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

using DS::Remote::XmlDocument;
using DS::Remote::XmlElement;

TEST_SUITE("remote.xml") {

TEST_CASE("Elements, attributes and nesting are read") {
    auto document = XmlDocument::parse(R"(<?xml version="1.0"?>
<!-- device state -->
<ddr_timecode>
    <ddr1 file_duration="00:01:30.00" playing='true'/>
    <ddr2 clip_seconds_elapsed="5" clip_seconds_remaining="10"></ddr2>
</ddr_timecode>
)");
    REQUIRE(document.has_value());

    auto const& root = document->root();
    CHECK(root.name == "ddr_timecode");
    REQUIRE(root.children.size() == 2);
    CHECK(root.children[0].name == "ddr1");
    CHECK(root.children[0].attribute("file_duration") == "00:01:30.00");
    CHECK(root.children[0].attribute("playing") == "true");
    CHECK_FALSE(root.children[0].attribute("missing").has_value());
    CHECK(root.children[1].attribute("clip_seconds_remaining") == "10");
}

TEST_CASE("Entities and CDATA decode into text") {
    auto document = XmlDocument::parse(
            "<item label=\"a &amp; b &lt;c&gt; &quot;q&quot; &apos;s&apos;\">x &#65;&#x42; <![CDATA[<raw & kept>]]></item>");
    REQUIRE(document.has_value());
    CHECK(document->root().attribute("label") == "a & b <c> \"q\" 's'");
    CHECK(document->root().text == "x AB <raw & kept>");
}

TEST_CASE("Numeric references above ASCII encode as UTF-8") {
    auto document = XmlDocument::parse("<t>&#233;</t>");
    REQUIRE(document.has_value());
    CHECK(document->root().text == "\xC3\xA9");
}

TEST_CASE("DOCTYPE and comments around the root are skipped") {
    auto document = XmlDocument::parse("<!DOCTYPE data [<!ENTITY x \"y\">]><data/><!-- trailing -->");
    REQUIRE(document.has_value());
    CHECK(document->root().name == "data");
}

TEST_CASE("Malformed input is a parse failure") {
    std::vector<std::string> const inputs{
            "",
            "plain text",
            "<a>",
            "<a></b>",
            "<a x=1/>",
            "<a x=\"1/>",
            "<a>&bogus;</a>",
            "<a>&amp</a>",
            "<a/><b/>",
            "<a><![CDATA[open</a>",
            "<a>&#xZZ;</a>",
    };
    for (auto const& input : inputs) {
        CAPTURE(input);
        auto document = XmlDocument::parse(input);
        REQUIRE_FALSE(document.has_value());
        CHECK(document.error().code == DS::Error::Code::ParseFailure);
    }
}

TEST_CASE("find_first searches pre-order including the root") {
    auto document = XmlDocument::parse("<root id=\"r\"><a id=\"1\"><b id=\"2\"/></a><b id=\"3\"/></root>");
    REQUIRE(document.has_value());

    auto const* root = document->find_first([](XmlElement const& e) { return e.name == "root"; });
    REQUIRE(root != nullptr);
    CHECK(root->attribute("id") == "r");

    auto const* first_b = document->find_first([](XmlElement const& e) { return e.name == "b"; });
    REQUIRE(first_b != nullptr);
    CHECK(first_b->attribute("id") == "2");

    CHECK(document->find_first([](XmlElement const& e) { return e.name == "zzz"; }) == nullptr);

    std::vector<std::string> order;
    document->for_each([&](XmlElement const& e) { order.push_back(e.name); });
    CHECK(order == std::vector<std::string>{"root", "a", "b", "b"});
}

TEST_CASE("Deeply nested documents parse and release without recursion limits") {
    constexpr std::size_t kDepth = 300000;
    std::string           text;
    text.reserve(kDepth * 7);
    for (std::size_t i = 0; i < kDepth; ++i) {
        text += "<a>";
    }
    for (std::size_t i = 0; i < kDepth; ++i) {
        text += "</a>";
    }

    {
        auto document = XmlDocument::parse(text);
        REQUIRE(document.has_value());

        std::size_t       depth   = 1;
        XmlElement const* element = &document->root();
        while (!element->children.empty()) {
            element = &element->children.front();
            ++depth;
        }
        CHECK(depth == kDepth);

        std::size_t visited = 0;
        document->for_each([&](XmlElement const&) { ++visited; });
        CHECK(visited == kDepth);
    }

    auto truncated = XmlDocument::parse(std::string_view{text}.substr(0, kDepth * 3));
    REQUIRE_FALSE(truncated.has_value());
    CHECK(truncated.error().code == DS::Error::Code::ParseFailure);
}

} // TEST_SUITE
