#pragma once

/// @file document.hpp
/// @brief Declaration document tree with provenance
///
/// A Node is a tagged variant over {Map, List, Scalar}. Maps keep their keys
/// in declaration order and carry the name of the plugin that defined them,
/// which is how the composed document remembers where every table, type and
/// column came from. Scalars hold a JSON leaf (null, boolean, number, string).

#include "fwd.hpp"

#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace coframe_plugin {

/// Serialized key holding a map's provenance
inline constexpr const char* kProvenanceKey = "_plugin";

// =============================================================================
// NodeKind
// =============================================================================

enum class NodeKind : std::uint8_t {
    Map,
    List,
    Scalar
};

[[nodiscard]] const char* node_kind_name(NodeKind kind) noexcept;

// =============================================================================
// Node Alternatives
// =============================================================================

/// Ordered map node
struct MapNode {
    std::vector<std::string> keys;
    std::vector<Node> values;
    std::string plugin;  ///< Plugin that defined (or last overrode) this map

    [[nodiscard]] const Node* find(std::string_view key) const;
    [[nodiscard]] Node* find(std::string_view key);

    /// Append a key (caller guarantees the key is not present)
    Node& insert(std::string key, Node value);

    [[nodiscard]] std::size_t size() const noexcept { return keys.size(); }
    [[nodiscard]] bool empty() const noexcept { return keys.empty(); }

    /// String value of a scalar entry, or empty
    [[nodiscard]] std::string get_string(std::string_view key) const;
};

/// List node
struct ListNode {
    std::vector<Node> items;
};

/// Leaf node
struct ScalarNode {
    Json value;
};

// =============================================================================
// Node
// =============================================================================

class Node {
public:
    using Variant = std::variant<MapNode, ListNode, ScalarNode>;

    Node() : m_value(ScalarNode{}) {}
    Node(MapNode map) : m_value(std::move(map)) {}
    Node(ListNode list) : m_value(std::move(list)) {}
    Node(ScalarNode scalar) : m_value(std::move(scalar)) {}

    [[nodiscard]] NodeKind kind() const noexcept {
        return static_cast<NodeKind>(m_value.index());
    }

    [[nodiscard]] bool is_map() const noexcept { return kind() == NodeKind::Map; }
    [[nodiscard]] bool is_list() const noexcept { return kind() == NodeKind::List; }
    [[nodiscard]] bool is_scalar() const noexcept { return kind() == NodeKind::Scalar; }

    [[nodiscard]] const MapNode* as_map() const { return std::get_if<MapNode>(&m_value); }
    [[nodiscard]] MapNode* as_map() { return std::get_if<MapNode>(&m_value); }
    [[nodiscard]] const ListNode* as_list() const { return std::get_if<ListNode>(&m_value); }
    [[nodiscard]] ListNode* as_list() { return std::get_if<ListNode>(&m_value); }
    [[nodiscard]] const ScalarNode* as_scalar() const { return std::get_if<ScalarNode>(&m_value); }
    [[nodiscard]] ScalarNode* as_scalar() { return std::get_if<ScalarNode>(&m_value); }

    [[nodiscard]] const Variant& variant() const noexcept { return m_value; }
    [[nodiscard]] Variant& variant() noexcept { return m_value; }

    /// Provenance of a map node (empty for lists, scalars and untagged maps)
    [[nodiscard]] const std::string& provenance() const;

    /// Set the provenance of a map node; no-op for other kinds
    void set_provenance(const std::string& plugin);

    /// Tag this node and every nested map that has no provenance yet
    void tag_untagged(const std::string& plugin);

    /// Structural equality, provenance ignored
    [[nodiscard]] bool structurally_equal(const Node& other) const;

    // =========================================================================
    // JSON Conversion
    // =========================================================================

    /// Build a node tree; a "_plugin" string key becomes the map provenance
    [[nodiscard]] static Node from_json(const Json& j);

    /// Convert back to JSON, optionally emitting "_plugin" keys
    [[nodiscard]] Json to_json(bool with_provenance = false) const;

private:
    Variant m_value;
};

/// Human readable rendering of a scalar for log messages
[[nodiscard]] std::string scalar_to_string(const ScalarNode& scalar);

} // namespace coframe_plugin
