#include <ddrsync/remote/PlaybackDeviceClient.hpp>
#include <ddrsync/timecode/DurationCodec.hpp>

#include "log/TaggedLogger.hpp"

#include <charconv>
#include <cmath>
#include <string>
#include <string_view>
#include <utility>

namespace DS::Remote {

namespace {

constexpr std::size_t kVersionExcerptLength = 200;

auto parse_number(std::optional<std::string> const& text) -> std::optional<double> {
    if (!text) {
        return std::nullopt;
    }
    std::string_view view{*text};
    while (!view.empty() && (view.front() == ' ' || view.front() == '\t')) {
        view.remove_prefix(1);
    }
    while (!view.empty() && (view.back() == ' ' || view.back() == '\t')) {
        view.remove_suffix(1);
    }
    if (view.empty()) {
        return std::nullopt;
    }
    double value  = 0.0;
    auto   result = std::from_chars(view.data(), view.data() + view.size(), value);
    if (result.ec != std::errc{} || result.ptr != view.data() + view.size() || !std::isfinite(value)) {
        return std::nullopt;
    }
    return value;
}

auto first_present(XmlElement const& element, std::string_view primary, std::string_view fallback)
        -> std::optional<std::string> {
    if (auto value = element.attribute(primary); value && !value->empty()) {
        return value;
    }
    if (auto value = element.attribute(fallback); value && !value->empty()) {
        return value;
    }
    return std::nullopt;
}

auto find_indexed_slot(XmlDocument const& document, int slot) -> XmlElement const* {
    auto index = std::to_string(slot);
    return document.find_first([&](XmlElement const& element) {
        return element.name == "ddr" && element.attribute("index") == index;
    });
}

auto find_named_slot(XmlDocument const& document, int slot) -> XmlElement const* {
    auto name = "ddr" + std::to_string(slot);
    return document.find_first([&](XmlElement const& element) { return element.name == name; });
}

auto duration_attribute(XmlElement const& element) -> std::optional<double> {
    auto text = first_present(element, "file_duration", "duration");
    if (!text) {
        return std::nullopt;
    }
    return DS::Timecode::parse_timecode(*text);
}

auto escape_attribute(std::string const& value) -> std::string {
    std::string escaped;
    escaped.reserve(value.size());
    for (char ch : value) {
        switch (ch) {
        case '&':
            escaped.append("&amp;");
            break;
        case '<':
            escaped.append("&lt;");
            break;
        case '\'':
            escaped.append("&apos;");
            break;
        default:
            escaped.push_back(ch);
        }
    }
    return escaped;
}

bool attribute_is_true(XmlElement const& element, std::string_view key) {
    return element.attribute(key) == "true";
}

} // namespace

auto extract_slot_duration(XmlDocument const& document, int slot) -> std::optional<SlotDuration> {
    if (auto const* indexed = find_indexed_slot(document, slot)) {
        if (auto seconds = duration_attribute(*indexed)) {
            return SlotDuration{*seconds, parse_number(indexed->attribute("clip_framerate"))};
        }
    }
    if (auto const* named = find_named_slot(document, slot)) {
        auto seconds = duration_attribute(*named);
        if (!seconds) {
            auto elapsed   = parse_number(named->attribute("clip_seconds_elapsed"));
            auto remaining = parse_number(named->attribute("clip_seconds_remaining"));
            if (elapsed && remaining) {
                seconds = *elapsed + *remaining;
            }
        }
        if (seconds) {
            return SlotDuration{*seconds, parse_number(named->attribute("clip_framerate"))};
        }
    }
    return std::nullopt;
}

auto extract_slot_info(XmlDocument const& document, int slot) -> std::optional<SlotInfo> {
    auto const* element = find_indexed_slot(document, slot);
    if (element == nullptr) {
        element = find_named_slot(document, slot);
    }
    if (element == nullptr) {
        return std::nullopt;
    }
    SlotInfo info;
    info.slot      = slot;
    info.duration  = first_present(*element, "file_duration", "duration");
    info.elapsed   = element->attribute("clip_seconds_elapsed");
    info.remaining = element->attribute("clip_seconds_remaining");
    info.framerate = element->attribute("clip_framerate");
    info.playing   = attribute_is_true(*element, "playing");
    info.filename  = first_present(*element, "filename", "clip_name");
    return info;
}

auto extract_tally(XmlDocument const& document) -> TallyState {
    TallyState tally;
    document.for_each([&](XmlElement const& element) {
        if (attribute_is_true(element, "on_pgm") || attribute_is_true(element, "program")) {
            tally.program.push_back(element.name);
        }
        if (attribute_is_true(element, "on_pvw") || attribute_is_true(element, "preview")) {
            tally.preview.push_back(element.name);
        }
    });
    return tally;
}

auto build_shortcut_xml(std::string const& name, std::map<std::string, std::string> const& params) -> std::string {
    std::string xml{"<shortcut name='"};
    xml.append(escape_attribute(name));
    xml.append("'>");
    for (auto const& [key, value] : params) {
        xml.append("<entry key='");
        xml.append(escape_attribute(key));
        xml.append("' value='");
        xml.append(escape_attribute(value));
        xml.append("'/>");
    }
    xml.append("</shortcut>");
    return xml;
}

PlaybackDeviceClient::PlaybackDeviceClient(HttpTransport& transport, DeviceEndpoint endpoint)
    : transport_(transport)
    , endpoint_(std::move(endpoint)) {}

auto PlaybackDeviceClient::check_configured() const -> DS::Expected<void> {
    if (!endpoint_.enabled) {
        return std::unexpected(DS::Error{DS::Error::Code::NotConfigured, "tricaster module is disabled"});
    }
    if (endpoint_.host.empty()) {
        return std::unexpected(DS::Error{DS::Error::Code::NotConfigured, "tricaster host not configured"});
    }
    return {};
}

auto PlaybackDeviceClient::request(HttpMethod method, std::string const& endpoint, std::string body) const
        -> DS::Expected<std::string> {
    if (auto configured = check_configured(); !configured) {
        return std::unexpected(configured.error());
    }

    HttpRequest request;
    request.method  = method;
    request.url     = "http://" + endpoint_.host + endpoint;
    request.headers = {{"Connection", "close"}, {"Accept", "application/xml"}};
    request.timeout = kDeviceRequestTimeout;
    if (!endpoint_.user.empty() && !endpoint_.password.empty()) {
        request.basic_auth = BasicAuth{endpoint_.user, endpoint_.password};
    }
    if (method == HttpMethod::Post && !body.empty()) {
        request.content_type = "text/xml";
    }
    request.body = std::move(body);

    auto response = transport_.send(request);
    if (!response) {
        ds_log("Request failed: " + DS::describeError(response.error()), "Tricaster", "ERROR");
        return std::unexpected(DS::Error{response.error().code,
                                         std::string{kDeviceRemoteName} + ": "
                                                 + response.error().message.value_or("request failed")});
    }
    if (!response->ok()) {
        ds_log(endpoint + " returned status " + std::to_string(response->status), "Tricaster", "ERROR");
        return std::unexpected(DS::Error{DS::Error::Code::RemoteUnavailable,
                                         std::string{kDeviceRemoteName} + ": " + endpoint + " returned status "
                                                 + std::to_string(response->status)});
    }
    return std::move(response->body);
}

auto PlaybackDeviceClient::fetch_dictionary_raw(std::string const& key) const -> DS::Expected<std::string> {
    return request(HttpMethod::Get, "/v1/dictionary?key=" + percent_encode(key));
}

auto PlaybackDeviceClient::fetch_playback_status(std::string const& key) const -> DS::Expected<XmlDocument> {
    auto body = fetch_dictionary_raw(key);
    if (!body) {
        return std::unexpected(body.error());
    }
    auto document = XmlDocument::parse(*body);
    if (!document) {
        return std::unexpected(DS::Error{DS::Error::Code::ParseFailure,
                                         std::string{kDeviceRemoteName} + ": dictionary '" + key + "' "
                                                 + document.error().message.value_or("is not XML")});
    }
    return document;
}

auto PlaybackDeviceClient::fetch_slot_duration(int slot) const -> DS::Expected<SlotDuration> {
    if (auto configured = check_configured(); !configured) {
        return std::unexpected(configured.error());
    }

    std::optional<DS::Error> first_failure;
    std::string_view         failed_key;
    bool                     any_document = false;
    for (auto key : kSlotStatusKeys) {
        auto document = fetch_playback_status(std::string{key});
        if (!document) {
            if (!first_failure) {
                first_failure = document.error();
                failed_key    = key;
            }
            continue;
        }
        any_document = true;
        if (auto duration = extract_slot_duration(*document, slot)) {
            ds_log("DDR " + std::to_string(slot) + " duration " + std::to_string(duration->seconds) + " via "
                           + std::string{key},
                   "Tricaster");
            return *duration;
        }
    }
    if (!any_document && first_failure) {
        return std::unexpected(*first_failure);
    }
    std::string message = "DDR " + std::to_string(slot) + " duration not found in tricaster data";
    if (first_failure) {
        // The unreadable dictionary may have held the slot, keep its failure visible.
        message += " (" + std::string{failed_key} + " unavailable: " + DS::describeError(*first_failure) + ")";
    }
    return std::unexpected(DS::Error{DS::Error::Code::NotFound, std::move(message)});
}

auto PlaybackDeviceClient::send_shortcut(std::string const& name, std::map<std::string, std::string> const& params) const
        -> DS::Expected<void> {
    if (name.empty()) {
        return std::unexpected(DS::Error{DS::Error::Code::InvalidArgument, "shortcut name is empty"});
    }
    auto body = request(HttpMethod::Post, "/v1/shortcut", build_shortcut_xml(name, params));
    if (!body) {
        return std::unexpected(body.error());
    }
    ds_log("Shortcut " + name, "Tricaster");
    return {};
}

auto PlaybackDeviceClient::test_connection() const -> DS::Expected<std::string> {
    auto body = request(HttpMethod::Get, "/v1/version");
    if (!body) {
        return std::unexpected(body.error());
    }
    if (body->size() > kVersionExcerptLength) {
        body->resize(kVersionExcerptLength);
    }
    return body;
}

auto PlaybackDeviceClient::slot_info() const -> DS::Expected<std::vector<SlotInfo>> {
    auto document = fetch_playback_status(std::string{kSlotStatusKeys.front()});
    if (!document) {
        return std::unexpected(document.error());
    }
    std::vector<SlotInfo> slots;
    for (int slot = 1; slot <= kDeviceSlotCount; ++slot) {
        if (auto info = extract_slot_info(*document, slot)) {
            slots.push_back(std::move(*info));
        }
    }
    return slots;
}

auto PlaybackDeviceClient::tally() const -> DS::Expected<TallyState> {
    auto document = fetch_playback_status("tally");
    if (!document) {
        return std::unexpected(document.error());
    }
    return extract_tally(*document);
}

} // namespace DS::Remote
