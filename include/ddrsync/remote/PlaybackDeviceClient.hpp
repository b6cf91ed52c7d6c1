#pragma once

#include <ddrsync/core/Error.hpp>
#include <ddrsync/remote/HttpTransport.hpp>
#include <ddrsync/remote/XmlDocument.hpp>

#include <array>
#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace DS::Remote {

inline constexpr std::string_view kDeviceRemoteName{"tricaster"};
inline constexpr std::chrono::seconds kDeviceRequestTimeout{6};
// Dictionary keys that may carry per-slot clip data, in lookup order.
inline constexpr std::array<std::string_view, 2> kSlotStatusKeys{"ddr_timecode", "timecode"};
inline constexpr int kDeviceSlotCount = 4;

struct DeviceEndpoint {
    bool        enabled{false};
    std::string host;
    std::string user{"admin"};
    std::string password;
};

struct SlotDuration {
    double                seconds{0.0};
    std::optional<double> framerate;
};

struct SlotInfo {
    int                        slot{0};
    std::optional<std::string> duration;
    std::optional<std::string> elapsed;
    std::optional<std::string> remaining;
    std::optional<std::string> framerate;
    bool                       playing{false};
    std::optional<std::string> filename;
};

struct TallyState {
    std::vector<std::string> program;
    std::vector<std::string> preview;
};

// Reads one slot's clip duration out of a dictionary document. Shapes are
// tried in order and the first one yielding a duration wins:
//   <ddr index="N" file_duration|duration=...>
//   <ddrN file_duration|duration=...>
//   <ddrN clip_seconds_elapsed=... clip_seconds_remaining=...>
[[nodiscard]] auto extract_slot_duration(XmlDocument const& document, int slot) -> std::optional<SlotDuration>;

[[nodiscard]] auto extract_slot_info(XmlDocument const& document, int slot) -> std::optional<SlotInfo>;

[[nodiscard]] auto extract_tally(XmlDocument const& document) -> TallyState;

class PlaybackDeviceClient {
public:
    PlaybackDeviceClient(HttpTransport& transport, DeviceEndpoint endpoint);

    auto fetch_dictionary_raw(std::string const& key) const -> DS::Expected<std::string>;
    auto fetch_playback_status(std::string const& key) const -> DS::Expected<XmlDocument>;

    // Tries every status key; NotFound only after all of them came back
    // without a usable shape.
    auto fetch_slot_duration(int slot) const -> DS::Expected<SlotDuration>;

    auto send_shortcut(std::string const& name, std::map<std::string, std::string> const& params = {}) const
            -> DS::Expected<void>;

    // Returns the first part of the version document.
    auto test_connection() const -> DS::Expected<std::string>;

    auto slot_info() const -> DS::Expected<std::vector<SlotInfo>>;
    auto tally() const -> DS::Expected<TallyState>;

    auto endpoint() const -> DeviceEndpoint const& { return endpoint_; }

private:
    auto check_configured() const -> DS::Expected<void>;
    auto request(HttpMethod method, std::string const& endpoint, std::string body = {}) const
            -> DS::Expected<std::string>;

    HttpTransport& transport_;
    DeviceEndpoint endpoint_;
};

[[nodiscard]] auto build_shortcut_xml(std::string const& name, std::map<std::string, std::string> const& params)
        -> std::string;

} // namespace DS::Remote
