/// @file merge.cpp
/// @brief Merge engine implementation

#include <coframe/plugin/merge.hpp>
#include <coframe/plugin/loader.hpp>
#include <coframe/core/log.hpp>

#include <algorithm>
#include <optional>
#include <sstream>

namespace coframe_plugin {

namespace {

std::string child_path(const std::string& parent, const std::string& key) {
    return parent.empty() ? key : parent + "." + key;
}

/// Index of a map item named `name` among the first `limit` list items
std::optional<std::size_t> find_named_item(const ListNode& list, std::size_t limit, const std::string& name) {
    for (std::size_t i = 0; i < limit; ++i) {
        const MapNode* map = list.items[i].as_map();
        if (map && map->get_string("name") == name) {
            return i;
        }
    }
    return std::nullopt;
}

bool contains_structurally(const ListNode& list, std::size_t limit, const Node& item) {
    for (std::size_t i = 0; i < limit; ++i) {
        if (list.items[i].structurally_equal(item)) {
            return true;
        }
    }
    return false;
}

} // anonymous namespace

// =============================================================================
// Glob Matching
// =============================================================================

bool glob_match(const std::string& pattern, const std::string& text) {
    std::size_t p = 0;
    std::size_t t = 0;
    std::size_t star = std::string::npos;
    std::size_t resume = 0;

    while (t < text.size()) {
        if (p < pattern.size() && (pattern[p] == '?' || pattern[p] == text[t])) {
            ++p;
            ++t;
        } else if (p < pattern.size() && pattern[p] == '*') {
            star = p++;
            resume = t;
        } else if (star != std::string::npos) {
            p = star + 1;
            t = ++resume;
        } else {
            return false;
        }
    }

    while (p < pattern.size() && pattern[p] == '*') {
        ++p;
    }
    return p == pattern.size();
}

// =============================================================================
// ComposedDocument
// =============================================================================

const MapNode* ComposedDocument::section(const std::string& key) const {
    const MapNode* root = m_root.as_map();
    if (!root) {
        return nullptr;
    }
    const Node* node = root->find(key);
    return node ? node->as_map() : nullptr;
}

std::vector<std::string> ComposedDocument::contributors(const std::string& path) const {
    std::vector<std::string> result;
    auto it = m_history.find(path);
    if (it == m_history.end()) {
        return result;
    }
    for (const auto& plugin : it->second) {
        if (std::find(result.begin(), result.end(), plugin) == result.end()) {
            result.push_back(plugin);
        }
    }
    return result;
}

std::string ComposedDocument::format_history() const {
    std::ostringstream oss;
    oss << "Definition History:\n";
    for (const auto& [path, plugins] : m_history) {
        std::vector<std::string> sorted = plugins;
        std::sort(sorted.begin(), sorted.end());

        oss << path << ": defined in [";
        for (std::size_t i = 0; i < sorted.size(); ++i) {
            if (i > 0) oss << ", ";
            oss << sorted[i];
        }
        oss << "]\n";
    }
    return oss.str();
}

// =============================================================================
// MergeEngine
// =============================================================================

MergeEngine::MergeEngine(MergeOptions options)
    : m_options(options)
    , m_root(MapNode{})
{
    register_handler("tables.*.columns", merge_columns_by_name);
    register_handler("types.*.columns", merge_columns_by_name);
}

void MergeEngine::register_handler(const std::string& pattern, ListMergeHandler handler) {
    for (auto& [existing, fn] : m_handlers) {
        if (existing == pattern) {
            fn = std::move(handler);
            return;
        }
    }
    m_handlers.emplace_back(pattern, std::move(handler));
}

const ListMergeHandler* MergeEngine::find_handler(const std::string& path) const {
    for (const auto& [pattern, fn] : m_handlers) {
        if (pattern == path) {
            return &fn;
        }
    }
    for (const auto& [pattern, fn] : m_handlers) {
        if (glob_match(pattern, path)) {
            return &fn;
        }
    }
    return nullptr;
}

coframe_core::Result<void> MergeEngine::merge_plugin(const Plugin& plugin) {
    coframe_core::merge_logger()->info("Merging plugin '{}' ({} document(s))",
        plugin.name(), plugin.declarations.size());

    for (std::size_t i = 0; i < plugin.declarations.size(); ++i) {
        auto result = merge_document(plugin.declarations[i], plugin.name());
        if (!result) {
            if (i < plugin.declaration_files.size()) {
                result.error().with_context("file", plugin.declaration_files[i].string());
            }
            return result;
        }
    }
    return coframe_core::Ok();
}

coframe_core::Result<void> MergeEngine::merge_document(const Node& document, const std::string& plugin) {
    const MapNode* incoming = document.as_map();
    if (!incoming) {
        return coframe_core::Err(
            coframe_core::Error(coframe_core::ErrorCode::InvalidArgument,
                "Declaration document of plugin '" + plugin + "' is not a map")
                .with_context("plugin", plugin));
    }
    return merge_map(*m_root.as_map(), *incoming, plugin, "");
}

coframe_core::Result<void> MergeEngine::merge_map(MapNode& existing,
                                                  const MapNode& incoming,
                                                  const std::string& plugin,
                                                  const std::string& path) {
    for (std::size_t i = 0; i < incoming.size(); ++i) {
        const std::string& key = incoming.keys[i];
        const Node& value = incoming.values[i];
        const std::string key_path = child_path(path, key);

        if (Node* current = existing.find(key)) {
            auto result = merge_value(*current, value, plugin, key_path);
            if (!result) {
                return result;
            }
        } else {
            coframe_core::merge_logger()->debug("[{}] Adding new key '{}'", plugin, key_path);
            Node added = value;
            added.tag_untagged(plugin);
            existing.insert(key, std::move(added));
            record_added(value, key_path, plugin);
        }

        record_history(key_path, plugin);
    }
    return coframe_core::Ok();
}

coframe_core::Result<void> MergeEngine::merge_value(Node& existing,
                                                    const Node& incoming,
                                                    const std::string& plugin,
                                                    const std::string& path) {
    if (existing.kind() != incoming.kind()) {
        std::string shapes = std::string(node_kind_name(existing.kind())) + " vs " +
                             node_kind_name(incoming.kind());
        coframe_core::Error error(coframe_core::MergeError::type_conflict(
            path, previous_contributor(existing, path), plugin, shapes));
        error.with_context("path", path).with_context("plugin", plugin);
        return coframe_core::Err(std::move(error));
    }

    switch (existing.kind()) {
        case NodeKind::Map: {
            coframe_core::merge_logger()->debug("[{}] Merging map at key '{}'", plugin, path);
            return merge_map(*existing.as_map(), *incoming.as_map(), plugin, path);
        }

        case NodeKind::List: {
            if (const ListMergeHandler* handler = find_handler(path)) {
                coframe_core::merge_logger()->debug("[{}] Merging list at key '{}' using custom handler",
                    plugin, path);
                return (*handler)(*existing.as_list(), *incoming.as_list(), plugin, path, *this);
            }
            coframe_core::merge_logger()->debug("[{}] Extending list at key '{}'", plugin, path);
            merge_list_default(*existing.as_list(), *incoming.as_list(), plugin, path);
            return coframe_core::Ok();
        }

        case NodeKind::Scalar: {
            ScalarNode& current = *existing.as_scalar();
            const ScalarNode& next = *incoming.as_scalar();
            if (current.value == next.value) {
                return coframe_core::Ok();
            }

            if (m_options.strict) {
                coframe_core::Error error(coframe_core::MergeError::value_override(
                    path, previous_contributor(existing, path), plugin));
                error.with_context("path", path).with_context("plugin", plugin);
                return coframe_core::Err(std::move(error));
            }

            coframe_core::merge_logger()->warn("[{}] Overlapping value for key '{}': {} -> {}",
                plugin, path, scalar_to_string(current), scalar_to_string(next));
            current.value = next.value;
            return coframe_core::Ok();
        }
    }

    return coframe_core::Ok();
}

void MergeEngine::merge_list_default(ListNode& existing,
                                     const ListNode& incoming,
                                     const std::string& plugin,
                                     const std::string& path) {
    const std::size_t original = existing.items.size();
    for (const auto& item : incoming.items) {
        if (contains_structurally(existing, original, item)) {
            continue;
        }
        Node added = item;
        added.tag_untagged(plugin);
        existing.items.push_back(std::move(added));
    }
    coframe_core::merge_logger()->trace("[{}] '{}' now holds {} item(s)", plugin, path, existing.items.size());
}

void MergeEngine::record_history(const std::string& path, const std::string& plugin) {
    m_history[path].push_back(plugin);
}

std::string MergeEngine::previous_contributor(const Node& existing, const std::string& path) const {
    auto it = m_history.find(path);
    if (it != m_history.end() && !it->second.empty()) {
        return it->second.back();
    }
    if (!existing.provenance().empty()) {
        return existing.provenance();
    }

    // "tables.User.columns[id].type" -> "tables.User.columns[id]" -> ...
    std::string enclosing = path;
    for (auto cut = enclosing.find_last_of(".["); cut != std::string::npos;
         cut = enclosing.find_last_of(".[")) {
        enclosing.erase(cut);
        auto parent = m_history.find(enclosing);
        if (parent != m_history.end() && !parent->second.empty()) {
            return parent->second.back();
        }
    }
    return "unknown";
}

void MergeEngine::record_added(const Node& value, const std::string& path, const std::string& plugin) {
    if (const ListNode* list = value.as_list()) {
        for (const auto& item : list->items) {
            const MapNode* map = item.as_map();
            const std::string name = map ? map->get_string("name") : std::string();
            if (name.empty()) {
                continue;
            }
            const std::string item_path = path + "[" + name + "]";
            record_added(item, item_path, plugin);
            record_history(item_path, plugin);
        }
        return;
    }

    const MapNode* map = value.as_map();
    if (!map) {
        return;
    }
    for (std::size_t i = 0; i < map->size(); ++i) {
        const std::string nested = child_path(path, map->keys[i]);
        record_added(map->values[i], nested, plugin);
        record_history(nested, plugin);
    }
}

ComposedDocument MergeEngine::finish() && {
    ComposedDocument composed(std::move(m_root), std::move(m_history));
    m_root = Node(MapNode{});
    m_history.clear();
    return composed;
}

// =============================================================================
// Column Merge Handler
// =============================================================================

coframe_core::Result<void> merge_columns_by_name(ListNode& existing,
                                                 const ListNode& incoming,
                                                 const std::string& plugin,
                                                 const std::string& path,
                                                 MergeEngine& engine) {
    // Only columns present before this merge are candidates, so two same-name
    // columns in one incoming list are both kept
    const std::size_t original = existing.items.size();

    for (const auto& item : incoming.items) {
        const MapNode* column = item.as_map();
        const std::string name = column ? column->get_string("name") : std::string();

        if (name.empty()) {
            if (!contains_structurally(existing, original, item)) {
                Node added = item;
                added.tag_untagged(plugin);
                existing.items.push_back(std::move(added));
            }
            continue;
        }

        const std::string item_path = path + "[" + name + "]";
        auto index = find_named_item(existing, original, name);
        if (!index) {
            Node added = item;
            added.tag_untagged(plugin);
            existing.items.push_back(std::move(added));
            engine.record_added(item, item_path, plugin);
            engine.record_history(item_path, plugin);
            continue;
        }

        Node& target = existing.items[*index];
        auto result = engine.merge_map(*target.as_map(), *column, plugin, item_path);
        if (!result) {
            return result;
        }
        target.set_provenance(plugin);
        engine.record_history(item_path, plugin);

        coframe_core::merge_logger()->debug("[{}] Extended column '{}'", plugin, item_path);
    }

    return coframe_core::Ok();
}

// =============================================================================
// Composition
// =============================================================================

coframe_core::Result<ComposedDocument> compose_plugins(const std::vector<Plugin>& plugins,
                                                       MergeOptions options) {
    MergeEngine engine(options);
    for (const auto& plugin : plugins) {
        auto result = engine.merge_plugin(plugin);
        if (!result) {
            return coframe_core::Err<ComposedDocument>(result.error());
        }
    }
    return coframe_core::Ok(std::move(engine).finish());
}

} // namespace coframe_plugin
