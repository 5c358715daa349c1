#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for stock_core module

#include <cstdint>

namespace stock_core {

// =============================================================================
// Error Types
// =============================================================================

enum class ErrorCode : std::uint8_t;
struct DefinitionError;
struct ConfigError;
class Error;

template<typename T, typename E = Error>
class Result;

// =============================================================================
// Logging
// =============================================================================

struct LogConfig;
class LogScope;

} // namespace stock_core
