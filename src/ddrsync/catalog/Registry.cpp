#include <ddrsync/catalog/Registry.hpp>

#include "log/TaggedLogger.hpp"

#include <algorithm>
#include <cctype>
#include <tuple>

namespace DS::Catalog {

namespace {

auto not_found(std::string_view name_or_id, std::optional<std::string_view> app_hint) -> DS::Error {
    std::string message{"subcomposition not found: "};
    message.append(name_or_id);
    if (app_hint) {
        message.append(" in app ");
        message.append(*app_hint);
    }
    return DS::Error{DS::Error::Code::NotFound, std::move(message)};
}

} // namespace

auto slugify(std::string_view name) -> std::string {
    std::string slug;
    slug.reserve(name.size());
    bool pending_dash = false;
    for (unsigned char raw : name) {
        auto ch = static_cast<char>(std::tolower(raw));
        bool keep = (ch >= 'a' && ch <= 'z') || (ch >= '0' && ch <= '9');
        if (!keep) {
            pending_dash = true;
            continue;
        }
        if (pending_dash && !slug.empty()) {
            slug.push_back('-');
        }
        pending_dash = false;
        slug.push_back(ch);
    }
    if (slug.empty()) {
        return "item";
    }
    return slug;
}

auto RebuildReport::total_entries() const -> std::size_t {
    std::size_t total = 0;
    for (auto const& app : apps) {
        total += app.entries;
    }
    return total;
}

auto RebuildReport::ok() const -> bool {
    return std::none_of(apps.begin(), apps.end(), [](AppRebuildResult const& app) { return app.error.has_value(); });
}

Registry::Registry(Remote::ControlAppClient const& client)
    : client_(client) {}

auto Registry::build_table(std::string const&                     app_name,
                           std::string const&                     token,
                           std::vector<Remote::RemoteNode> const& nodes) -> TablePtr {
    auto table = std::make_shared<AppTable>();
    for (auto const& node : nodes) {
        auto const base   = slugify(node.display_name);
        auto       key    = base;
        int        suffix = 2;
        // Collisions are numbered in first-seen order; the same id keeps its slug.
        for (auto it = table->entries.find(key); it != table->entries.end() && it->second.id != node.id;
             it      = table->entries.find(key)) {
            key = base + "-" + std::to_string(suffix++);
        }
        table->entries.insert_or_assign(key, RegistryEntry{node.id, node.display_name, node.fields, app_name, token});
        table->id_to_key.insert_or_assign(node.id, key);
    }
    return table;
}

void Registry::install(std::string const& app_name, TablePtr table) {
    std::lock_guard const lock{mutex_};
    apps_.insert_or_assign(app_name, std::move(table));
}

auto Registry::table(std::string_view app_name) const -> TablePtr {
    std::lock_guard const lock{mutex_};
    auto                  it = apps_.find(app_name);
    if (it == apps_.end()) {
        return nullptr;
    }
    return it->second;
}

auto Registry::tables() const -> std::map<std::string, TablePtr, std::less<>> {
    std::lock_guard const lock{mutex_};
    return apps_;
}

auto Registry::rebuild_app(std::string const& app_name, std::string const& token) -> AppRebuildResult {
    AppRebuildResult result;
    result.app_name = app_name;

    auto model = client_.fetch_control_model(token);
    if (!model) {
        ds_log("App '" + app_name + "' rebuild failed: " + DS::describeError(model.error()), "Registry", "ERROR");
        install(app_name, std::make_shared<AppTable>());
        result.error = model.error();
        return result;
    }

    auto table     = build_table(app_name, token, Remote::flatten(*model));
    result.entries = table->entries.size();
    install(app_name, std::move(table));
    ds_log("App '" + app_name + "': " + std::to_string(result.entries) + " subcompositions", "Registry");
    return result;
}

auto Registry::rebuild_all(std::map<std::string, std::string> const& applications) -> RebuildReport {
    RebuildReport report;
    for (auto const& [app_name, token] : applications) {
        report.apps.push_back(rebuild_app(app_name, token));
    }
    {
        std::lock_guard const lock{mutex_};
        std::erase_if(apps_, [&](auto const& item) { return !applications.contains(item.first); });
    }
    ds_log("Total: " + std::to_string(report.total_entries()) + " subcompositions from "
                   + std::to_string(applications.size()) + " app(s)",
           "Registry");
    return report;
}

void Registry::remove_app(std::string const& app_name) {
    std::lock_guard const lock{mutex_};
    apps_.erase(app_name);
}

auto Registry::resolve(std::string_view name_or_id, std::optional<std::string_view> app_hint) const
        -> DS::Expected<ResolvedKey> {
    if (app_hint) {
        auto app = table(*app_hint);
        if (app) {
            if (app->entries.contains(name_or_id)) {
                return ResolvedKey{std::string{*app_hint}, std::string{name_or_id}};
            }
            if (auto it = app->id_to_key.find(name_or_id); it != app->id_to_key.end()) {
                return ResolvedKey{std::string{*app_hint}, it->second};
            }
        }
        return std::unexpected(not_found(name_or_id, app_hint));
    }

    auto all = tables();
    for (auto const& [app_name, app] : all) {
        if (app->entries.contains(name_or_id)) {
            return ResolvedKey{app_name, std::string{name_or_id}};
        }
    }
    for (auto const& [app_name, app] : all) {
        if (auto it = app->id_to_key.find(name_or_id); it != app->id_to_key.end()) {
            return ResolvedKey{app_name, it->second};
        }
    }
    return std::unexpected(not_found(name_or_id, std::nullopt));
}

auto Registry::find(std::string_view app_name, std::string_view key) const -> std::optional<RegistryEntry> {
    auto app = table(app_name);
    if (!app) {
        return std::nullopt;
    }
    auto it = app->entries.find(key);
    if (it == app->entries.end()) {
        return std::nullopt;
    }
    return it->second;
}

auto Registry::lookup(std::string_view name_or_id, std::optional<std::string_view> app_hint) const
        -> DS::Expected<RegistryEntry> {
    auto resolved = resolve(name_or_id, app_hint);
    if (!resolved) {
        return std::unexpected(resolved.error());
    }
    // A rebuild may land between resolve and find.
    auto entry = find(resolved->app_name, resolved->key);
    if (!entry) {
        return std::unexpected(not_found(name_or_id, app_hint));
    }
    return std::move(*entry);
}

auto Registry::field_catalog(std::string_view app_name) const -> DS::Expected<std::vector<FieldCatalogEntry>> {
    auto app = table(app_name);
    if (!app) {
        return std::unexpected(DS::Error{DS::Error::Code::NotFound, "app '" + std::string{app_name} + "' not found"});
    }
    std::vector<FieldCatalogEntry> catalog;
    for (auto const& [key, entry] : app->entries) {
        for (auto const& [field_id, field] : entry.fields) {
            if (field_id.empty()) {
                continue;
            }
            catalog.push_back(FieldCatalogEntry{field_id,
                                                field.title.empty() ? field_id : field.title,
                                                entry.name,
                                                field.type.empty() ? std::string{"unknown"} : field.type});
        }
    }
    std::stable_sort(catalog.begin(), catalog.end(), [](FieldCatalogEntry const& lhs, FieldCatalogEntry const& rhs) {
        return std::tie(lhs.subcomposition, lhs.title) < std::tie(rhs.subcomposition, rhs.title);
    });
    return catalog;
}

auto Registry::snapshot() const -> std::vector<std::pair<ResolvedKey, RegistryEntry>> {
    std::vector<std::pair<ResolvedKey, RegistryEntry>> entries;
    for (auto const& [app_name, app] : tables()) {
        for (auto const& [key, entry] : app->entries) {
            entries.emplace_back(ResolvedKey{app_name, key}, entry);
        }
    }
    return entries;
}

auto Registry::app_names() const -> std::vector<std::string> {
    std::vector<std::string> names;
    std::lock_guard const    lock{mutex_};
    names.reserve(apps_.size());
    for (auto const& [app_name, app] : apps_) {
        names.push_back(app_name);
    }
    return names;
}

auto Registry::contains(std::string_view app_name) const -> bool {
    return table(app_name) != nullptr;
}

auto Registry::size(std::string_view app_name) const -> std::size_t {
    auto app = table(app_name);
    return app ? app->entries.size() : 0;
}

auto Registry::size() const -> std::size_t {
    std::size_t total = 0;
    for (auto const& [app_name, app] : tables()) {
        total += app->entries.size();
    }
    return total;
}

} // namespace DS::Catalog
