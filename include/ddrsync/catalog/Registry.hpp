#pragma once

#include <ddrsync/core/Error.hpp>
#include <ddrsync/remote/ControlAppClient.hpp>
#include <ddrsync/remote/ControlModel.hpp>

#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace DS::Catalog {

// Lowercase, runs of anything outside [a-z0-9] become one '-', trimmed.
// An empty result becomes "item".
[[nodiscard]] auto slugify(std::string_view name) -> std::string;

struct RegistryEntry {
    std::string                              id;
    std::string                              name;
    std::map<std::string, Remote::FieldMeta> fields;
    std::string                              app_name;
    std::string                              token;
};

struct ResolvedKey {
    std::string app_name;
    std::string key;

    auto operator==(ResolvedKey const&) const -> bool = default;
};

struct FieldCatalogEntry {
    std::string id;
    std::string title;
    std::string subcomposition;
    std::string type;
};

struct AppRebuildResult {
    std::string              app_name;
    std::size_t              entries{0};
    std::optional<DS::Error> error;
};

struct RebuildReport {
    std::vector<AppRebuildResult> apps;

    auto total_entries() const -> std::size_t;
    auto ok() const -> bool;
};

/**
 * Name-addressable index of every subcomposition across the configured
 * control apps.
 *
 * Each app owns one immutable table (slug -> entry plus id -> slug). A rebuild
 * computes a fresh table off-lock and swaps the pointer under the mutex, so a
 * reader holding a table never sees a half-built app. Different apps are
 * replaced independently.
 */
class Registry {
public:
    explicit Registry(Remote::ControlAppClient const& client);

    Registry(Registry const&)            = delete;
    Registry& operator=(Registry const&) = delete;

    // Apps missing from `applications` are dropped. A failed fetch leaves that
    // app with an empty table and is reported, the other apps carry on.
    auto rebuild_all(std::map<std::string, std::string> const& applications) -> RebuildReport;
    auto rebuild_app(std::string const& app_name, std::string const& token) -> AppRebuildResult;
    void remove_app(std::string const& app_name);

    // Slug first, then remote id. With a hint only that app is searched.
    auto resolve(std::string_view name_or_id, std::optional<std::string_view> app_hint = std::nullopt) const
            -> DS::Expected<ResolvedKey>;
    auto lookup(std::string_view name_or_id, std::optional<std::string_view> app_hint = std::nullopt) const
            -> DS::Expected<RegistryEntry>;
    auto find(std::string_view app_name, std::string_view key) const -> std::optional<RegistryEntry>;

    auto field_catalog(std::string_view app_name) const -> DS::Expected<std::vector<FieldCatalogEntry>>;

    // Every entry as (app/key, entry), ordered by app then key.
    auto snapshot() const -> std::vector<std::pair<ResolvedKey, RegistryEntry>>;
    auto app_names() const -> std::vector<std::string>;
    auto contains(std::string_view app_name) const -> bool;
    auto size(std::string_view app_name) const -> std::size_t;
    auto size() const -> std::size_t;

private:
    struct AppTable {
        std::map<std::string, RegistryEntry, std::less<>> entries;
        std::map<std::string, std::string, std::less<>>   id_to_key;
    };
    using TablePtr = std::shared_ptr<AppTable const>;

    static auto build_table(std::string const&                     app_name,
                            std::string const&                     token,
                            std::vector<Remote::RemoteNode> const& nodes) -> TablePtr;

    auto table(std::string_view app_name) const -> TablePtr;
    auto tables() const -> std::map<std::string, TablePtr, std::less<>>;
    void install(std::string const& app_name, TablePtr table);

    Remote::ControlAppClient const&              client_;
    mutable std::mutex                           mutex_;
    std::map<std::string, TablePtr, std::less<>> apps_;
};

} // namespace DS::Catalog
