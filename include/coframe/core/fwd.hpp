#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for coframe_core module

#include <cstdint>

namespace coframe_core {

// =============================================================================
// Error Types
// =============================================================================

enum class ErrorCode : std::uint8_t;
struct PluginError;
struct MergeError;
struct SchemaError;
class Error;

template<typename T, typename E = Error>
class Result;

// =============================================================================
// Logging
// =============================================================================

struct LogConfig;
class LogScope;

} // namespace coframe_core
