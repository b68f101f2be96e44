#pragma once

/// @file error.hpp
/// @brief Error handling types for coframe_core
///
/// Every stage of the composition pipeline reports failures through
/// Result<T>. Errors are fatal to the pass; the context map carries the
/// plugin/table/column/type/path that makes a failure actionable.

#include "fwd.hpp"
#include <cstdint>
#include <string>
#include <variant>
#include <optional>
#include <utility>
#include <map>
#include <stdexcept>

namespace coframe_core {

// =============================================================================
// ErrorCode
// =============================================================================

/// General error code for categorizing errors
enum class ErrorCode : std::uint8_t {
    Unknown = 0,
    NotFound,
    AlreadyExists,
    InvalidArgument,
    InvalidState,
    IOError,
    ParseError,
    ValidationError,
    DependencyMissing,
    DependencyCycle,
    Conflict,
};

/// Get error code name
[[nodiscard]] inline const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::Unknown: return "Unknown";
        case ErrorCode::NotFound: return "NotFound";
        case ErrorCode::AlreadyExists: return "AlreadyExists";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::InvalidState: return "InvalidState";
        case ErrorCode::IOError: return "IOError";
        case ErrorCode::ParseError: return "ParseError";
        case ErrorCode::ValidationError: return "ValidationError";
        case ErrorCode::DependencyMissing: return "DependencyMissing";
        case ErrorCode::DependencyCycle: return "DependencyCycle";
        case ErrorCode::Conflict: return "Conflict";
        default: return "Unknown";
    }
}

// =============================================================================
// Error Kinds
// =============================================================================

/// Plugin discovery and ordering errors
struct PluginError {
    enum class Kind : std::uint8_t {
        Duplicate,           // Two plugins share a name
        UnknownDependency,   // depends_on names a plugin that does not exist
        CircularDependency,  // Dependency graph has a cycle
        InvalidManifest,     // plugin.json is malformed
    };

    Kind kind;
    std::string message;
    std::string plugin;
    std::string detail;  // Missing names, cycle members, ...

    [[nodiscard]] static PluginError duplicate(const std::string& name, const std::string& dir) {
        return PluginError{Kind::Duplicate,
            "Duplicate plugin name: " + name + " (in " + dir + ")", name, dir};
    }

    [[nodiscard]] static PluginError unknown_dependency(const std::string& plugin, const std::string& missing) {
        return PluginError{Kind::UnknownDependency,
            "Plugin '" + plugin + "' depends on unknown plugin(s): " + missing, plugin, missing};
    }

    [[nodiscard]] static PluginError circular_dependency(const std::string& members) {
        return PluginError{Kind::CircularDependency,
            "Circular dependency found between: " + members, {}, members};
    }

    [[nodiscard]] static PluginError invalid_manifest(const std::string& plugin, const std::string& reason) {
        return PluginError{Kind::InvalidManifest,
            "Invalid manifest for plugin '" + plugin + "': " + reason, plugin, reason};
    }
};

/// Document merge errors
struct MergeError {
    enum class Kind : std::uint8_t {
        TypeConflict,   // Map vs list vs scalar at the same path
        ValueOverride,  // Scalar changed by a later plugin (strict mode only)
    };

    Kind kind;
    std::string message;
    std::string path;
    std::string existing_plugin;
    std::string incoming_plugin;

    [[nodiscard]] static MergeError type_conflict(const std::string& path,
                                                  const std::string& existing_plugin,
                                                  const std::string& incoming_plugin,
                                                  const std::string& shapes) {
        return MergeError{Kind::TypeConflict,
            "Incompatible types for key '" + path + "' between '" + existing_plugin +
            "' and '" + incoming_plugin + "': " + shapes,
            path, existing_plugin, incoming_plugin};
    }

    [[nodiscard]] static MergeError value_override(const std::string& path,
                                                   const std::string& existing_plugin,
                                                   const std::string& incoming_plugin) {
        return MergeError{Kind::ValueOverride,
            "Plugin '" + incoming_plugin + "' overrides value of '" + path +
            "' defined by '" + existing_plugin + "'",
            path, existing_plugin, incoming_plugin};
    }
};

/// Type, table and column resolution errors
struct SchemaError {
    enum class Kind : std::uint8_t {
        DuplicateType,
        UnknownBaseType,
        InheritanceCycle,
        InvalidType,
        UnknownType,
        DuplicateColumn,
        UnknownForeignTable,
        InvalidForeignReference,
        InvalidManyToMany,
    };

    Kind kind;
    std::string message;
    std::string subject;  // Type or table name
    std::string plugin;   // Declaring plugin, when known

    [[nodiscard]] static SchemaError duplicate_type(const std::string& type, const std::string& plugins) {
        return SchemaError{Kind::DuplicateType,
            "Type already defined: " + type + " (declared by " + plugins + ")", type, plugins};
    }

    [[nodiscard]] static SchemaError unknown_base_type(const std::string& type,
                                                       const std::string& base,
                                                       const std::string& plugin) {
        return SchemaError{Kind::UnknownBaseType,
            "Type \"" + type + "\" declared in \"" + plugin + "\" inherits unknown type \"" + base + "\"",
            type, plugin};
    }

    [[nodiscard]] static SchemaError inheritance_cycle(const std::string& type, const std::string& chain) {
        return SchemaError{Kind::InheritanceCycle,
            "Inheritance cycle for type \"" + type + "\": " + chain, type, {}};
    }

    [[nodiscard]] static SchemaError invalid_type(const std::string& type,
                                                  const std::string& plugin,
                                                  const std::string& reason) {
        return SchemaError{Kind::InvalidType,
            "Type \"" + type + "\" declared in \"" + plugin + "\" is invalid: " + reason, type, plugin};
    }

    [[nodiscard]] static SchemaError unknown_type(const std::string& column,
                                                  const std::string& caller,
                                                  const std::string& type) {
        return SchemaError{Kind::UnknownType,
            "Column: " + column + " in " + caller + " has wrong type '" + type + "'", caller, {}};
    }

    [[nodiscard]] static SchemaError duplicate_column(const std::string& column,
                                                      const std::string& table,
                                                      const std::string& plugin) {
        return SchemaError{Kind::DuplicateColumn,
            "Duplicated column \"" + column + "\" in table \"" + table + "\"", table, plugin};
    }

    [[nodiscard]] static SchemaError unknown_foreign_table(const std::string& column,
                                                           const std::string& table,
                                                           const std::string& target) {
        return SchemaError{Kind::UnknownForeignTable,
            "Foreign key for column: " + column + " in table: " + table +
            " references unknown table '" + target + "'", table, {}};
    }

    [[nodiscard]] static SchemaError invalid_foreign_reference(const std::string& column,
                                                               const std::string& table,
                                                               const std::string& target) {
        return SchemaError{Kind::InvalidForeignReference,
            "Column: " + column + " in table: " + table +
            " has invalid foreign reference '" + target + "'", table, {}};
    }

    [[nodiscard]] static SchemaError invalid_many_to_many(const std::string& table, const std::string& reason) {
        return SchemaError{Kind::InvalidManyToMany,
            "Many to Many error for table: " + table + " (" + reason + ")", table, {}};
    }
};

// =============================================================================
// Error
// =============================================================================

/// Main error type (variant of all error kinds)
class Error {
public:
    using Variant = std::variant<
        PluginError,
        MergeError,
        SchemaError,
        std::string  // Generic message
    >;

    Error() : m_code(ErrorCode::Unknown), m_error("Unknown error") {}
    Error(PluginError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
    Error(MergeError err) : m_code(ErrorCode::Conflict), m_error(std::move(err)) {}
    Error(SchemaError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
    Error(const std::string& msg) : m_code(ErrorCode::Unknown), m_error(msg) {}
    Error(const char* msg) : m_code(ErrorCode::Unknown), m_error(std::string(msg)) {}

    /// Construct with error code and message
    Error(ErrorCode code, const std::string& msg) : m_code(code), m_error(msg) {}

    [[nodiscard]] ErrorCode code() const noexcept { return m_code; }

    /// Get error message
    [[nodiscard]] std::string message() const {
        return std::visit([](const auto& err) -> std::string {
            using T = std::decay_t<decltype(err)>;
            if constexpr (std::is_same_v<T, std::string>) {
                return err;
            } else {
                return err.message;
            }
        }, m_error);
    }

    template<typename T>
    [[nodiscard]] bool is() const {
        return std::holds_alternative<T>(m_error);
    }

    template<typename T>
    [[nodiscard]] const T* as() const {
        return std::get_if<T>(&m_error);
    }

    [[nodiscard]] const Variant& variant() const noexcept { return m_error; }

    /// Add context information
    Error& with_context(const std::string& key, const std::string& value) {
        m_context[key] = value;
        return *this;
    }

    [[nodiscard]] const std::string* get_context(const std::string& key) const {
        auto it = m_context.find(key);
        return it != m_context.end() ? &it->second : nullptr;
    }

    [[nodiscard]] const std::map<std::string, std::string>& context() const noexcept {
        return m_context;
    }

private:
    static ErrorCode to_error_code(PluginError::Kind kind) {
        switch (kind) {
            case PluginError::Kind::Duplicate: return ErrorCode::AlreadyExists;
            case PluginError::Kind::UnknownDependency: return ErrorCode::DependencyMissing;
            case PluginError::Kind::CircularDependency: return ErrorCode::DependencyCycle;
            case PluginError::Kind::InvalidManifest: return ErrorCode::ParseError;
            default: return ErrorCode::Unknown;
        }
    }

    static ErrorCode to_error_code(SchemaError::Kind kind) {
        switch (kind) {
            case SchemaError::Kind::DuplicateType: return ErrorCode::AlreadyExists;
            case SchemaError::Kind::DuplicateColumn: return ErrorCode::AlreadyExists;
            case SchemaError::Kind::UnknownBaseType: return ErrorCode::NotFound;
            case SchemaError::Kind::UnknownType: return ErrorCode::NotFound;
            case SchemaError::Kind::UnknownForeignTable: return ErrorCode::NotFound;
            case SchemaError::Kind::InheritanceCycle: return ErrorCode::DependencyCycle;
            default: return ErrorCode::ValidationError;
        }
    }

    ErrorCode m_code;
    Variant m_error;
    std::map<std::string, std::string> m_context;
};

// =============================================================================
// Result<T, E>
// =============================================================================

/// Result type (value or error)
/// @tparam T Value type
/// @tparam E Error type (defaults to Error)
template<typename T, typename E>
class Result {
public:
    using value_type = T;
    using error_type = E;

    /// Success constructor
    Result(T value) : m_value(std::move(value)) {}

    /// Error constructor
    Result(E error) : m_error(std::move(error)) {}

    [[nodiscard]] bool is_ok() const noexcept { return m_value.has_value(); }
    [[nodiscard]] bool is_err() const noexcept { return !m_value.has_value(); }

    /// Get value (undefined if error)
    [[nodiscard]] T& value() & { return *m_value; }
    [[nodiscard]] const T& value() const& { return *m_value; }
    [[nodiscard]] T&& value() && { return std::move(*m_value); }

    /// Get error (undefined if ok)
    [[nodiscard]] E& error() & { return m_error; }
    [[nodiscard]] const E& error() const& { return m_error; }

    explicit operator bool() const noexcept { return m_value.has_value(); }

    [[nodiscard]] T& operator*() & { return *m_value; }
    [[nodiscard]] const T& operator*() const& { return *m_value; }
    [[nodiscard]] T&& operator*() && { return std::move(*m_value); }

    [[nodiscard]] T* operator->() { return &(*m_value); }
    [[nodiscard]] const T* operator->() const { return &(*m_value); }

    /// Unwrap (throws if error)
    [[nodiscard]] T& unwrap() & {
        if (!m_value.has_value()) {
            throw std::runtime_error("Result contains error: " + m_error.message());
        }
        return *m_value;
    }

    [[nodiscard]] T&& unwrap() && {
        if (!m_value.has_value()) {
            throw std::runtime_error("Result contains error: " + m_error.message());
        }
        return std::move(*m_value);
    }

private:
    std::optional<T> m_value;
    E m_error;
};

/// Partial specialization for void result
template<typename E>
class Result<void, E> {
public:
    using value_type = void;
    using error_type = E;

    Result() : m_has_value(true) {}
    Result(E error) : m_error(std::move(error)), m_has_value(false) {}

    [[nodiscard]] static Result ok() { return Result(); }

    [[nodiscard]] bool is_ok() const noexcept { return m_has_value; }
    [[nodiscard]] bool is_err() const noexcept { return !m_has_value; }

    [[nodiscard]] E& error() & { return m_error; }
    [[nodiscard]] const E& error() const& { return m_error; }

    explicit operator bool() const noexcept { return m_has_value; }

    void unwrap() const {
        if (!m_has_value) {
            throw std::runtime_error("Result contains error: " + m_error.message());
        }
    }

private:
    E m_error;
    bool m_has_value;
};

/// Helper for creating Ok result
template<typename T>
Result<T> Ok(T value) {
    return Result<T>(std::move(value));
}

/// Helper for creating Ok void result
inline Result<void> Ok() {
    return Result<void>();
}

/// Helper for creating Err result
template<typename T = void>
Result<T> Err(Error error) {
    return Result<T>(std::move(error));
}

template<typename T = void>
Result<T> Err(const std::string& message) {
    return Result<T>(Error(message));
}

// =============================================================================
// Error Utilities (Implemented in error.cpp)
// =============================================================================

/// Build a full error message with kind tag and context
std::string build_error_chain(const Error& error);

} // namespace coframe_core
