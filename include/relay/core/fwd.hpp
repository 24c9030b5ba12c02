#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for relay_core module

#include <cstdint>

namespace relay_core {

// =============================================================================
// Error Types
// =============================================================================

enum class ErrorCode : std::uint8_t;
struct KernelError;
class Error;

template<typename T, typename E = Error>
class Result;

// =============================================================================
// Logging
// =============================================================================

struct LogConfig;

} // namespace relay_core
