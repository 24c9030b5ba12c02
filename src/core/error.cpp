/// @file error.cpp
/// @brief Error formatting for relay_core
///
/// The error system is primarily template-based and header-only.
/// This file provides:
/// - Explicit template instantiations for common Result types
/// - Error formatting utilities

#include <relay/core/error.hpp>
#include <sstream>
#include <vector>

namespace relay_core {

// =============================================================================
// Error Message Formatting
// =============================================================================

namespace detail {

/// Format kernel error with full context
std::string format_kernel_error(const KernelError& err) {
    std::ostringstream oss;
    oss << "[" << kernel_error_kind_name(err.kind) << "] " << err.message;

    if (!err.plugin.empty()) {
        oss << " (plugin: " << err.plugin << ")";
    }

    return oss.str();
}

} // namespace detail

// =============================================================================
// Error Chain Support
// =============================================================================

/// Build a full error message with context chain
std::string build_error_chain(const Error& error) {
    std::ostringstream oss;

    oss << "[" << error_code_name(error.code()) << "] ";

    std::visit([&oss](const auto& err) {
        using T = std::decay_t<decltype(err)>;
        if constexpr (std::is_same_v<T, std::string>) {
            oss << err;
        } else if constexpr (std::is_same_v<T, KernelError>) {
            oss << detail::format_kernel_error(err);
        }
    }, error.variant());

    for (const auto& [key, value] : error.context()) {
        oss << " " << key << "=" << value;
    }

    return oss.str();
}

// =============================================================================
// Explicit Template Instantiations
// =============================================================================

template class Result<void, Error>;
template class Result<bool, Error>;
template class Result<std::size_t, Error>;
template class Result<std::string, Error>;
template class Result<std::vector<std::string>, Error>;

} // namespace relay_core
