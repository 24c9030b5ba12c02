#pragma once

/// @file dynamic_library.hpp
/// @brief Shared-library loading with RAII
///
/// Thin wrapper over the platform loader:
/// - Windows: LoadLibrary/GetProcAddress/FreeLibrary
/// - Linux/macOS: dlopen/dlsym/dlclose
///
/// The kernel uses it to load plugin implementations built as shared
/// libraries inside a plugin directory.

#include "fwd.hpp"
#include <relay/core/error.hpp>

#include <filesystem>
#include <optional>
#include <string>
#include <type_traits>
#include <vector>

#ifdef _WIN32
#define NOMINMAX
#define WIN32_LEAN_AND_MEAN
#include <windows.h>
#else
#include <dlfcn.h>
#endif

namespace relay_kernel {

#ifdef _WIN32
using NativeLibraryHandle = HMODULE;
#else
using NativeLibraryHandle = void*;
#endif

// =============================================================================
// DynamicLibrary
// =============================================================================

/// RAII handle to a loaded shared library; unloads on destruction
class DynamicLibrary {
public:
    DynamicLibrary() = default;
    ~DynamicLibrary();

    // Non-copyable
    DynamicLibrary(const DynamicLibrary&) = delete;
    DynamicLibrary& operator=(const DynamicLibrary&) = delete;

    // Movable
    DynamicLibrary(DynamicLibrary&& other) noexcept;
    DynamicLibrary& operator=(DynamicLibrary&& other) noexcept;

    /// Load a shared library
    [[nodiscard]] static relay_core::Result<DynamicLibrary> load(const std::filesystem::path& path);

    [[nodiscard]] bool is_loaded() const noexcept { return m_handle != nullptr; }
    [[nodiscard]] explicit operator bool() const noexcept { return is_loaded(); }

    /// Unload the library
    void unload() noexcept;

    /// Get a symbol (nullptr if not found)
    [[nodiscard]] void* get_symbol(const char* name) const noexcept;

    /// Get a typed function pointer
    template<typename F>
    [[nodiscard]] relay_core::Result<F> get_function(const char* name) const {
        static_assert(std::is_pointer_v<F> && std::is_function_v<std::remove_pointer_t<F>>,
            "F must be a function pointer type");

        void* sym = get_symbol(name);
        if (!sym) {
            return relay_core::Error(relay_core::ErrorCode::NotFound,
                "Symbol not found: " + std::string(name));
        }

        return reinterpret_cast<F>(sym);
    }

    [[nodiscard]] bool has_symbol(const char* name) const noexcept {
        return get_symbol(name) != nullptr;
    }

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return m_path; }

    /// Last error message reported by the platform loader
    [[nodiscard]] static std::string get_last_error();

private:
    DynamicLibrary(NativeLibraryHandle handle, std::filesystem::path path);

    NativeLibraryHandle m_handle = nullptr;
    std::filesystem::path m_path;
};

// =============================================================================
// Utility Functions
// =============================================================================

/// Platform shared-library suffix
[[nodiscard]] constexpr const char* library_extension() noexcept {
#ifdef _WIN32
    return ".dll";
#elif defined(__APPLE__)
    return ".dylib";
#else
    return ".so";
#endif
}

/// Check if a path ends in the platform shared-library suffix
[[nodiscard]] bool has_library_extension(const std::filesystem::path& path);

/// Locate a plugin's implementation library inside its directory.
/// Prefers lib<name><ext>, then <name><ext>, then the first other library
/// file in sorted order. Returns nullopt if the directory holds none.
[[nodiscard]] std::optional<std::filesystem::path> find_plugin_library(
    const std::filesystem::path& dir,
    const std::string& plugin_name);

} // namespace relay_kernel
