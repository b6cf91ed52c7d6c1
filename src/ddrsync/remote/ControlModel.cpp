#include <ddrsync/remote/ControlModel.hpp>

#include <string_view>
#include <utility>

namespace DS::Remote {

namespace {

using json = nlohmann::json;

constexpr std::string_view kChildKeys[] = {"subcompositions", "Subcompositions"};

auto string_member(json const& object, char const* key) -> std::optional<std::string> {
    auto it = object.find(key);
    if (it == object.end() || !it->is_string()) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

auto parse_field(json const& entry) -> std::optional<FieldMeta> {
    if (!entry.is_object()) {
        return std::nullopt;
    }
    FieldMeta field;
    field.id   = string_member(entry, "id").value_or("");
    field.type = string_member(entry, "type").value_or("");
    if (auto title = string_member(entry, "title"); title && !title->empty()) {
        field.title = std::move(*title);
    } else if (auto name = string_member(entry, "name"); name && !name->empty()) {
        field.title = std::move(*name);
    } else {
        field.title = field.id;
    }
    return field;
}

void fill_node(json const& source, ModelNode& node) {
    node.id   = string_member(source, "id");
    node.name = string_member(source, "name");
    if (auto model = source.find("model"); model != source.end() && model->is_array()) {
        std::vector<FieldMeta> fields;
        fields.reserve(model->size());
        for (auto const& entry : *model) {
            if (auto field = parse_field(entry)) {
                fields.push_back(std::move(*field));
            }
        }
        node.fields = std::move(fields);
    }
}

auto child_arrays(json const& source) -> std::vector<json const*> {
    std::vector<json const*> arrays;
    for (auto key : kChildKeys) {
        auto it = source.find(std::string{key});
        if (it != source.end() && it->is_array()) {
            arrays.push_back(&*it);
        }
    }
    return arrays;
}

} // namespace

ModelNode::ModelNode(ModelNode const&)                        = default;
ModelNode::ModelNode(ModelNode&&) noexcept                    = default;
auto ModelNode::operator=(ModelNode const&) -> ModelNode&     = default;
auto ModelNode::operator=(ModelNode&&) noexcept -> ModelNode& = default;

ModelNode::~ModelNode() {
    if (children.empty()) {
        return;
    }
    std::vector<ModelNode> pending = std::move(children);
    while (!pending.empty()) {
        ModelNode node = std::move(pending.back());
        pending.pop_back();
        for (auto& child : node.children) {
            pending.push_back(std::move(child));
        }
        node.children.clear();
    }
}

auto parse_control_model(json const& document) -> DS::Expected<std::vector<ModelNode>> {
    std::vector<json const*> top_level;
    if (document.is_array()) {
        for (auto const& entry : document) {
            if (entry.is_object()) {
                top_level.push_back(&entry);
            }
        }
    } else if (document.is_object()) {
        top_level.push_back(&document);
    } else {
        return std::unexpected(DS::Error{DS::Error::Code::ParseFailure,
                                         "control app model is neither an array nor an object"});
    }

    std::vector<ModelNode> roots(top_level.size());
    // Children vectors are sized before their addresses are taken, so the
    // pending pointers stay valid while the tree grows.
    std::vector<std::pair<json const*, ModelNode*>> pending;
    for (std::size_t i = 0; i < top_level.size(); ++i) {
        pending.emplace_back(top_level[i], &roots[i]);
    }
    while (!pending.empty()) {
        auto [source, node] = pending.back();
        pending.pop_back();
        fill_node(*source, *node);

        std::vector<json const*> children;
        for (auto const* array : child_arrays(*source)) {
            for (auto const& child : *array) {
                if (child.is_object()) {
                    children.push_back(&child);
                }
            }
        }
        node->children.resize(children.size());
        for (std::size_t i = 0; i < children.size(); ++i) {
            pending.emplace_back(children[i], &node->children[i]);
        }
    }
    return roots;
}

void visit_preorder(std::vector<ModelNode> const& roots, std::function<void(ModelNode const&)> const& visitor) {
    std::vector<ModelNode const*> stack;
    stack.reserve(roots.size());
    for (auto it = roots.rbegin(); it != roots.rend(); ++it) {
        stack.push_back(&*it);
    }
    while (!stack.empty()) {
        auto const* node = stack.back();
        stack.pop_back();
        visitor(*node);
        for (auto it = node->children.rbegin(); it != node->children.rend(); ++it) {
            stack.push_back(&*it);
        }
    }
}

auto flatten(std::vector<ModelNode> const& roots) -> std::vector<RemoteNode> {
    std::vector<RemoteNode> flat;
    visit_preorder(roots, [&](ModelNode const& node) {
        if (!node.id || node.id->empty() || !node.name || !node.fields) {
            return;
        }
        RemoteNode remote;
        remote.id           = *node.id;
        remote.display_name = *node.name;
        for (auto const& field : *node.fields) {
            remote.fields[field.id] = field;
        }
        flat.push_back(std::move(remote));
    });
    return flat;
}

} // namespace DS::Remote
