#pragma once

/// @file merge.hpp
/// @brief Recursive merge of plugin declarations into one composed document
///
/// Merge rules for `existing` and `incoming` at a dotted key path:
/// - map/map: key by key; new keys are tagged with the contributing plugin
/// - list/list: a registered handler matching the path, else append the
///   incoming items that are not structurally present yet
/// - scalar/scalar: incoming wins with a warning (an error in strict mode)
/// - anything else: TypeConflictError
///
/// Column lists (`tables.*.columns`, `types.*.columns`) are merged by column
/// name so that a plugin can extend a column another plugin declared.

#include "fwd.hpp"
#include "document.hpp"
#include <coframe/core/error.hpp>

#include <functional>
#include <string>
#include <utility>
#include <vector>

namespace coframe_plugin {

class MergeEngine;

/// Custom list merge. Mutates `existing` in place.
using ListMergeHandler = std::function<coframe_core::Result<void>(
    ListNode& existing,
    const ListNode& incoming,
    const std::string& plugin,
    const std::string& path,
    MergeEngine& engine)>;

/// Glob match where `*` spans any run of characters (dots included) and `?`
/// matches exactly one
[[nodiscard]] bool glob_match(const std::string& pattern, const std::string& text);

// =============================================================================
// MergeOptions
// =============================================================================

struct MergeOptions {
    bool strict = false;  ///< Scalar overrides become ValueOverride errors
};

// =============================================================================
// ComposedDocument
// =============================================================================

/// Result of merging every plugin. Read-only once produced.
class ComposedDocument {
public:
    ComposedDocument() : m_root(MapNode{}) {}
    ComposedDocument(Node root, MergeHistory history)
        : m_root(std::move(root)), m_history(std::move(history)) {}

    [[nodiscard]] const Node& root() const noexcept { return m_root; }

    /// Top-level map section such as "tables" or "types"; null when absent
    [[nodiscard]] const MapNode* section(const std::string& key) const;

    /// Key path -> plugins that touched it, in merge order
    [[nodiscard]] const MergeHistory& history() const noexcept { return m_history; }

    /// Distinct plugins that touched `path`, first contribution first
    [[nodiscard]] std::vector<std::string> contributors(const std::string& path) const;

    /// One line per key path, sorted by path
    [[nodiscard]] std::string format_history() const;

    [[nodiscard]] Json to_json(bool with_provenance = true) const {
        return m_root.to_json(with_provenance);
    }

private:
    Node m_root;
    MergeHistory m_history;
};

// =============================================================================
// MergeEngine
// =============================================================================

/// Folds declaration documents into a ComposedDocument
///
/// Single writer; feed plugins in dependency order, then call finish().
class MergeEngine {
public:
    explicit MergeEngine(MergeOptions options = {});

    // Non-copyable, movable
    MergeEngine(const MergeEngine&) = delete;
    MergeEngine& operator=(const MergeEngine&) = delete;
    MergeEngine(MergeEngine&&) = default;
    MergeEngine& operator=(MergeEngine&&) = default;

    // =========================================================================
    // Handlers
    // =========================================================================

    /// Register a list handler for an exact path or a glob pattern
    void register_handler(const std::string& pattern, ListMergeHandler handler);

    /// Handler for a path: exact registration first, then the first matching glob
    [[nodiscard]] const ListMergeHandler* find_handler(const std::string& path) const;

    // =========================================================================
    // Merging
    // =========================================================================

    /// Merge every declaration of a plugin, document by document
    [[nodiscard]] coframe_core::Result<void> merge_plugin(const Plugin& plugin);

    /// Merge one declaration document (must be a map)
    [[nodiscard]] coframe_core::Result<void> merge_document(const Node& document,
                                                           const std::string& plugin);

    /// Merge `incoming` into `existing` at `path`
    [[nodiscard]] coframe_core::Result<void> merge_value(Node& existing,
                                                        const Node& incoming,
                                                        const std::string& plugin,
                                                        const std::string& path);

    [[nodiscard]] coframe_core::Result<void> merge_map(MapNode& existing,
                                                      const MapNode& incoming,
                                                      const std::string& plugin,
                                                      const std::string& path);

    /// Append incoming items not structurally present in `existing`
    void merge_list_default(ListNode& existing,
                            const ListNode& incoming,
                            const std::string& plugin,
                            const std::string& path);

    /// Append `plugin` to the history of `path`
    void record_history(const std::string& path, const std::string& plugin);

    /// History entries for everything nested under a newly added value:
    /// map keys, and named list items as `path[name]`
    void record_added(const Node& value, const std::string& path, const std::string& plugin);

    // =========================================================================
    // State
    // =========================================================================

    [[nodiscard]] const Node& document() const noexcept { return m_root; }
    [[nodiscard]] const MergeHistory& history() const noexcept { return m_history; }
    [[nodiscard]] const MergeOptions& options() const noexcept { return m_options; }

    /// Hand over the composed document; the engine is empty afterwards
    [[nodiscard]] ComposedDocument finish() &&;

private:
    /// Last plugin that touched `path`, else its provenance, else the nearest enclosing path's
    [[nodiscard]] std::string previous_contributor(const Node& existing, const std::string& path) const;

    MergeOptions m_options;
    Node m_root;
    MergeHistory m_history;
    std::vector<std::pair<std::string, ListMergeHandler>> m_handlers;
};

/// Built-in handler merging column lists by column `name`
[[nodiscard]] coframe_core::Result<void> merge_columns_by_name(ListNode& existing,
                                                              const ListNode& incoming,
                                                              const std::string& plugin,
                                                              const std::string& path,
                                                              MergeEngine& engine);

/// Build the composed document for plugins already in dependency order
[[nodiscard]] coframe_core::Result<ComposedDocument> compose_plugins(
    const std::vector<Plugin>& plugins,
    MergeOptions options = {});

} // namespace coframe_plugin
