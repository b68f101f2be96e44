/// @file error.cpp
/// @brief Error handling implementation for coframe_core
///
/// The error system is primarily template-based and header-only.
/// This file provides:
/// - Error message formatting with context
/// - Explicit template instantiations for common Result types

#include <coframe/core/error.hpp>
#include <sstream>
#include <vector>

namespace coframe_core {

// =============================================================================
// Error Message Formatting
// =============================================================================

namespace detail {

const char* plugin_kind_name(PluginError::Kind kind) {
    switch (kind) {
        case PluginError::Kind::Duplicate: return "DuplicatePluginError";
        case PluginError::Kind::UnknownDependency: return "UnknownDependencyError";
        case PluginError::Kind::CircularDependency: return "CircularDependencyError";
        case PluginError::Kind::InvalidManifest: return "InvalidManifestError";
        default: return "PluginError";
    }
}

const char* merge_kind_name(MergeError::Kind kind) {
    switch (kind) {
        case MergeError::Kind::TypeConflict: return "TypeConflictError";
        case MergeError::Kind::ValueOverride: return "ValueOverrideError";
        default: return "MergeError";
    }
}

const char* schema_kind_name(SchemaError::Kind kind) {
    switch (kind) {
        case SchemaError::Kind::DuplicateType: return "DuplicateTypeError";
        case SchemaError::Kind::UnknownBaseType: return "UnknownBaseTypeError";
        case SchemaError::Kind::InheritanceCycle: return "InheritanceCycleError";
        case SchemaError::Kind::InvalidType: return "InvalidTypeError";
        case SchemaError::Kind::UnknownType: return "UnknownTypeError";
        case SchemaError::Kind::DuplicateColumn: return "DuplicateColumnError";
        case SchemaError::Kind::UnknownForeignTable: return "UnknownForeignTableError";
        case SchemaError::Kind::InvalidForeignReference: return "InvalidForeignReferenceError";
        case SchemaError::Kind::InvalidManyToMany: return "InvalidManyToManyError";
        default: return "SchemaError";
    }
}

/// Format plugin error with full context
std::string format_plugin_error(const PluginError& err) {
    std::ostringstream oss;
    oss << "[" << plugin_kind_name(err.kind) << "] " << err.message;
    return oss.str();
}

/// Format merge error with both plugins
std::string format_merge_error(const MergeError& err) {
    std::ostringstream oss;
    oss << "[" << merge_kind_name(err.kind) << "] " << err.message;
    return oss.str();
}

/// Format schema error
std::string format_schema_error(const SchemaError& err) {
    std::ostringstream oss;
    oss << "[" << schema_kind_name(err.kind) << "] " << err.message;
    if (!err.plugin.empty()) {
        oss << " (plugin: " << err.plugin << ")";
    }
    return oss.str();
}

} // namespace detail

// =============================================================================
// Error Chain Support
// =============================================================================

std::string build_error_chain(const Error& error) {
    std::ostringstream oss;

    oss << "[" << error_code_name(error.code()) << "] ";

    std::visit([&oss](const auto& err) {
        using T = std::decay_t<decltype(err)>;
        if constexpr (std::is_same_v<T, std::string>) {
            oss << err;
        } else if constexpr (std::is_same_v<T, PluginError>) {
            oss << detail::format_plugin_error(err);
        } else if constexpr (std::is_same_v<T, MergeError>) {
            oss << detail::format_merge_error(err);
        } else if constexpr (std::is_same_v<T, SchemaError>) {
            oss << detail::format_schema_error(err);
        }
    }, error.variant());

    if (!error.context().empty()) {
        oss << " {";
        bool first = true;
        for (const auto& [key, value] : error.context()) {
            if (!first) oss << ", ";
            oss << key << "=\"" << value << "\"";
            first = false;
        }
        oss << "}";
    }

    return oss.str();
}

// =============================================================================
// Explicit Template Instantiations
// =============================================================================

template class Result<void, Error>;
template class Result<bool, Error>;
template class Result<std::vector<std::string>, Error>;

} // namespace coframe_core
