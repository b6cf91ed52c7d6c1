#include <ddrsync/remote/ControlAppClient.hpp>

#include "log/TaggedLogger.hpp"

#include <utility>

namespace DS::Remote {

namespace {

using json = nlohmann::json;

auto remote_error(DS::Error const& cause) -> DS::Error {
    std::string message{kControlRemoteName};
    message.append(": ");
    message.append(cause.message.value_or("request failed"));
    return DS::Error{cause.code, std::move(message)};
}

auto status_error(std::string_view what, int status) -> DS::Error {
    std::string message{kControlRemoteName};
    message.append(": ");
    message.append(what);
    message.append(" returned status ");
    message.append(std::to_string(status));
    return DS::Error{DS::Error::Code::RemoteUnavailable, std::move(message)};
}

} // namespace

ControlAppClient::ControlAppClient(HttpTransport& transport, std::string api_base)
    : transport_(transport)
    , api_base_(std::move(api_base)) {
    while (!api_base_.empty() && api_base_.back() == '/') {
        api_base_.pop_back();
    }
}

auto ControlAppClient::model_url(std::string const& token) const -> std::string {
    return api_base_ + "/controlapps/" + percent_encode(token) + "/model";
}

auto ControlAppClient::control_url(std::string const& token) const -> std::string {
    return api_base_ + "/controlapps/" + percent_encode(token) + "/control";
}

auto ControlAppClient::fetch_control_model(std::string const& token) const -> DS::Expected<std::vector<ModelNode>> {
    if (token.empty()) {
        return std::unexpected(DS::Error{DS::Error::Code::NotConfigured, "no control app token provided"});
    }
    HttpRequest request;
    request.method  = HttpMethod::Get;
    request.url     = model_url(token);
    request.headers = {{"Accept", "application/json"}};
    request.timeout = kControlRequestTimeout;

    auto response = transport_.send(request);
    if (!response) {
        ds_log("Model fetch failed: " + DS::describeError(response.error()), "Singular", "ERROR");
        return std::unexpected(remote_error(response.error()));
    }
    if (!response->ok()) {
        ds_log("Model fetch returned status " + std::to_string(response->status), "Singular", "ERROR");
        return std::unexpected(status_error("model fetch", response->status));
    }

    auto document = json::parse(response->body, nullptr, false);
    if (document.is_discarded()) {
        return std::unexpected(DS::Error{DS::Error::Code::ParseFailure,
                                         std::string{kControlRemoteName} + ": model response is not JSON"});
    }
    auto tree = parse_control_model(document);
    if (!tree) {
        return std::unexpected(remote_error(tree.error()));
    }
    return tree;
}

auto ControlAppClient::patch_control(std::string const& token, json const& items) const -> DS::Expected<PatchResponse> {
    if (token.empty()) {
        return std::unexpected(DS::Error{DS::Error::Code::NotConfigured, "no control app token provided"});
    }
    HttpRequest request;
    request.method       = HttpMethod::Patch;
    request.url          = control_url(token);
    request.headers      = {{"Accept", "application/json"}};
    request.body         = items.dump();
    request.content_type = "application/json";
    request.timeout      = kControlRequestTimeout;

    auto response = transport_.send(request);
    if (!response) {
        ds_log("Control PATCH failed: " + DS::describeError(response.error()), "Singular", "ERROR");
        return std::unexpected(remote_error(response.error()));
    }
    if (!response->ok()) {
        ds_log("Control PATCH returned status " + std::to_string(response->status), "Singular", "ERROR");
        return std::unexpected(status_error("control PATCH", response->status));
    }
    ds_log("Control PATCH items=" + std::to_string(items.size()), "Singular");
    return PatchResponse{response->status, response->body};
}

} // namespace DS::Remote
