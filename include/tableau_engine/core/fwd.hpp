#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for tableau_core module

#include <cstdint>

namespace tableau_core {

// =============================================================================
// Error Types
// =============================================================================

enum class ErrorCode : std::uint8_t;
struct SceneError;
struct LayerError;
struct ConfigError;
class Error;

template<typename T, typename E = Error>
class Result;

// =============================================================================
// Logging
// =============================================================================

struct LogConfig;

} // namespace tableau_core
