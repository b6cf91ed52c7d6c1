#pragma once

#include <ddrsync/core/Error.hpp>
#include <ddrsync/remote/ControlModel.hpp>
#include <ddrsync/remote/HttpTransport.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <string>
#include <string_view>
#include <vector>

namespace DS::Remote {

inline constexpr std::string_view kDefaultControlApiBase{"https://app.singular.live/apiv2"};
inline constexpr std::string_view kControlRemoteName{"singular"};
inline constexpr std::chrono::seconds kControlRequestTimeout{10};

struct PatchResponse {
    int         status{0};
    std::string body;
};

// Talks to the graphics control application: one model endpoint for
// discovery, one control endpoint for PATCH updates. No retries here.
class ControlAppClient {
public:
    explicit ControlAppClient(HttpTransport& transport, std::string api_base = std::string{kDefaultControlApiBase});

    auto fetch_control_model(std::string const& token) const -> DS::Expected<std::vector<ModelNode>>;

    // items: JSON array of {subCompositionId, state?, payload?}.
    auto patch_control(std::string const& token, nlohmann::json const& items) const -> DS::Expected<PatchResponse>;

    auto model_url(std::string const& token) const -> std::string;
    auto control_url(std::string const& token) const -> std::string;
    auto api_base() const -> std::string const& { return api_base_; }

private:
    HttpTransport& transport_;
    std::string    api_base_;
};

} // namespace DS::Remote
