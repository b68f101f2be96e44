#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for coframe_schema module

#include <nlohmann/json.hpp>

namespace coframe_schema {

/// Attribute maps keep declaration order
using Json = nlohmann::ordered_json;

/// Raw column declaration as written in a declaration document
using ColumnSpec = Json;

// =============================================================================
// Types
// =============================================================================

struct BuiltinType;
struct TypeDef;
class TypeCatalog;

// =============================================================================
// Tables
// =============================================================================

struct ForeignKeyRef;
struct ColumnDef;
struct ManyToManyTarget;
struct ManyToManyDef;
struct TableDef;
class TableResolver;

// =============================================================================
// Pipeline
// =============================================================================

class Schema;

} // namespace coframe_schema
