/// @file document.cpp
/// @brief Declaration document tree implementation

#include <coframe/plugin/document.hpp>

namespace coframe_plugin {

const char* node_kind_name(NodeKind kind) noexcept {
    switch (kind) {
        case NodeKind::Map: return "map";
        case NodeKind::List: return "list";
        case NodeKind::Scalar: return "scalar";
        default: return "unknown";
    }
}

// =============================================================================
// MapNode
// =============================================================================

const Node* MapNode::find(std::string_view key) const {
    for (std::size_t i = 0; i < keys.size(); ++i) {
        if (keys[i] == key) {
            return &values[i];
        }
    }
    return nullptr;
}

Node* MapNode::find(std::string_view key) {
    for (std::size_t i = 0; i < keys.size(); ++i) {
        if (keys[i] == key) {
            return &values[i];
        }
    }
    return nullptr;
}

Node& MapNode::insert(std::string key, Node value) {
    keys.push_back(std::move(key));
    values.push_back(std::move(value));
    return values.back();
}

std::string MapNode::get_string(std::string_view key) const {
    const Node* node = find(key);
    if (!node) {
        return {};
    }
    const ScalarNode* scalar = node->as_scalar();
    if (!scalar || !scalar->value.is_string()) {
        return {};
    }
    return scalar->value.get<std::string>();
}

// =============================================================================
// Node
// =============================================================================

const std::string& Node::provenance() const {
    static const std::string empty;
    if (const MapNode* map = as_map()) {
        return map->plugin;
    }
    return empty;
}

void Node::set_provenance(const std::string& plugin) {
    if (MapNode* map = as_map()) {
        map->plugin = plugin;
    }
}

void Node::tag_untagged(const std::string& plugin) {
    if (MapNode* map = as_map()) {
        if (map->plugin.empty()) {
            map->plugin = plugin;
        }
        for (auto& value : map->values) {
            value.tag_untagged(plugin);
        }
    } else if (ListNode* list = as_list()) {
        for (auto& item : list->items) {
            item.tag_untagged(plugin);
        }
    }
}

bool Node::structurally_equal(const Node& other) const {
    if (kind() != other.kind()) {
        return false;
    }

    switch (kind()) {
        case NodeKind::Map: {
            const MapNode& a = *as_map();
            const MapNode& b = *other.as_map();
            if (a.size() != b.size()) {
                return false;
            }
            for (std::size_t i = 0; i < a.size(); ++i) {
                const Node* match = b.find(a.keys[i]);
                if (!match || !a.values[i].structurally_equal(*match)) {
                    return false;
                }
            }
            return true;
        }
        case NodeKind::List: {
            const auto& a = as_list()->items;
            const auto& b = other.as_list()->items;
            if (a.size() != b.size()) {
                return false;
            }
            for (std::size_t i = 0; i < a.size(); ++i) {
                if (!a[i].structurally_equal(b[i])) {
                    return false;
                }
            }
            return true;
        }
        case NodeKind::Scalar:
            return as_scalar()->value == other.as_scalar()->value;
    }
    return false;
}

Node Node::from_json(const Json& j) {
    if (j.is_object()) {
        MapNode map;
        for (auto it = j.begin(); it != j.end(); ++it) {
            if (it.key() == kProvenanceKey && it.value().is_string()) {
                map.plugin = it.value().get<std::string>();
                continue;
            }
            map.insert(it.key(), from_json(it.value()));
        }
        return Node(std::move(map));
    }

    if (j.is_array()) {
        ListNode list;
        list.items.reserve(j.size());
        for (const auto& item : j) {
            list.items.push_back(from_json(item));
        }
        return Node(std::move(list));
    }

    return Node(ScalarNode{j});
}

Json Node::to_json(bool with_provenance) const {
    return std::visit([with_provenance](const auto& node) -> Json {
        using T = std::decay_t<decltype(node)>;
        if constexpr (std::is_same_v<T, MapNode>) {
            Json j = Json::object();
            for (std::size_t i = 0; i < node.keys.size(); ++i) {
                j[node.keys[i]] = node.values[i].to_json(with_provenance);
            }
            if (with_provenance && !node.plugin.empty()) {
                j[kProvenanceKey] = node.plugin;
            }
            return j;
        } else if constexpr (std::is_same_v<T, ListNode>) {
            Json j = Json::array();
            for (const auto& item : node.items) {
                j.push_back(item.to_json(with_provenance));
            }
            return j;
        } else {
            return node.value;
        }
    }, m_value);
}

std::string scalar_to_string(const ScalarNode& scalar) {
    if (scalar.value.is_string()) {
        return scalar.value.get<std::string>();
    }
    return scalar.value.dump();
}

} // namespace coframe_plugin
