#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for coframe_plugin module

#include <nlohmann/json.hpp>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace coframe_plugin {

/// JSON flavour used for every document; keeps declaration order of keys
using Json = nlohmann::ordered_json;

// =============================================================================
// Document Types
// =============================================================================

enum class NodeKind : std::uint8_t;
class Node;
struct MapNode;
struct ListNode;
struct ScalarNode;

// =============================================================================
// Plugin Types
// =============================================================================

struct PluginManifest;
struct Plugin;
class PluginLoader;
class DependencySorter;

// =============================================================================
// Merge Types
// =============================================================================

/// Key path -> plugins that touched it, in merge order
using MergeHistory = std::map<std::string, std::vector<std::string>>;

struct MergeOptions;
class MergeEngine;
class ComposedDocument;

// =============================================================================
// Configuration
// =============================================================================

struct ProjectConfig;

} // namespace coframe_plugin
