#pragma once

#include <ddrsync/core/Error.hpp>

#include <nlohmann/json.hpp>

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace DS::Remote {

struct FieldMeta {
    std::string id;
    std::string title;
    std::string type;
};

// One composition of the control app document. Children hang off the
// "subcompositions" relationship and may nest to any depth.
struct ModelNode {
    ModelNode() = default;
    ModelNode(ModelNode const&);
    ModelNode(ModelNode&&) noexcept;
    auto operator=(ModelNode const&) -> ModelNode&;
    auto operator=(ModelNode&&) noexcept -> ModelNode&;
    // Releases descendants without recursing, so nesting depth is unbounded.
    ~ModelNode();

    std::optional<std::string>            id;
    std::optional<std::string>            name;
    std::optional<std::vector<FieldMeta>> fields;
    std::vector<ModelNode>                children;
};

struct RemoteNode {
    std::string                      id;
    std::string                      display_name;
    std::map<std::string, FieldMeta> fields;
};

// Builds the tree from the model endpoint payload (an array of compositions
// or a single composition object).
auto parse_control_model(nlohmann::json const& document) -> DS::Expected<std::vector<ModelNode>>;

// Pre-order visit of every node at every depth, without recursion.
void visit_preorder(std::vector<ModelNode> const& roots, std::function<void(ModelNode const&)> const& visitor);

// Nodes lacking an id, a name or a field list are skipped; their children are not.
auto flatten(std::vector<ModelNode> const& roots) -> std::vector<RemoteNode>;

} // namespace DS::Remote
