#pragma once

#include <ddrsync/core/Error.hpp>
#include <ddrsync/remote/ControlAppClient.hpp>

#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <utility>

namespace DS::Catalog {

// field id -> id of the composition that owns it
using FieldOwnerMap = std::map<std::string, std::string>;

// Memoizes field ownership per (token, field-id set). The control endpoint
// groups payloads by composition, so every timer PATCH needs this mapping.
// Entries are replaced whole and never mutated; they live until invalidated.
class FieldResolutionCache {
public:
    explicit FieldResolutionCache(Remote::ControlAppClient const& client);

    FieldResolutionCache(FieldResolutionCache const&)            = delete;
    FieldResolutionCache& operator=(FieldResolutionCache const&) = delete;

    // Ids not present anywhere in the model are left out of the result.
    // A failed fetch is returned and nothing is cached.
    auto resolve_fields(std::string const& token, std::set<std::string> const& field_ids) -> DS::Expected<FieldOwnerMap>;

    void invalidate();
    void invalidate(std::string const& token);

    auto size() const -> std::size_t;

private:
    using Key = std::pair<std::string, std::set<std::string>>;

    Remote::ControlAppClient const&                     client_;
    mutable std::mutex                                  mutex_;
    std::map<Key, std::shared_ptr<FieldOwnerMap const>> entries_;
};

} // namespace DS::Catalog
