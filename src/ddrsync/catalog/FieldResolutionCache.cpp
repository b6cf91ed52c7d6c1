#include <ddrsync/catalog/FieldResolutionCache.hpp>

#include "log/TaggedLogger.hpp"

namespace DS::Catalog {

FieldResolutionCache::FieldResolutionCache(Remote::ControlAppClient const& client)
    : client_(client) {}

auto FieldResolutionCache::resolve_fields(std::string const& token, std::set<std::string> const& field_ids)
        -> DS::Expected<FieldOwnerMap> {
    Key key{token, field_ids};
    {
        std::lock_guard const lock{mutex_};
        if (auto it = entries_.find(key); it != entries_.end()) {
            return *it->second;
        }
    }

    // Two callers missing on the same key may both fetch; the later insert wins.
    auto model = client_.fetch_control_model(token);
    if (!model) {
        ds_log("Field map fetch failed: " + DS::describeError(model.error()), "FieldCache", "ERROR");
        return std::unexpected(model.error());
    }

    auto owners = std::make_shared<FieldOwnerMap>();
    Remote::visit_preorder(*model, [&](Remote::ModelNode const& node) {
        if (!node.id || node.id->empty() || !node.fields) {
            return;
        }
        for (auto const& field : *node.fields) {
            if (field_ids.contains(field.id)) {
                (*owners)[field.id] = *node.id;
            }
        }
    });
    ds_log("Resolved " + std::to_string(owners->size()) + "/" + std::to_string(field_ids.size()) + " fields",
           "FieldCache");

    FieldOwnerMap result = *owners;
    {
        std::lock_guard const lock{mutex_};
        entries_.insert_or_assign(std::move(key), std::move(owners));
    }
    return result;
}

void FieldResolutionCache::invalidate() {
    std::lock_guard const lock{mutex_};
    entries_.clear();
}

void FieldResolutionCache::invalidate(std::string const& token) {
    std::lock_guard const lock{mutex_};
    std::erase_if(entries_, [&](auto const& item) { return item.first.first == token; });
}

auto FieldResolutionCache::size() const -> std::size_t {
    std::lock_guard const lock{mutex_};
    return entries_.size();
}

} // namespace DS::Catalog
