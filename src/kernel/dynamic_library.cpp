/// @file dynamic_library.cpp
/// @brief Shared-library loading implementation

#include <relay/kernel/dynamic_library.hpp>

#include <algorithm>
#include <cctype>

namespace relay_kernel {

DynamicLibrary::~DynamicLibrary() {
    unload();
}

DynamicLibrary::DynamicLibrary(DynamicLibrary&& other) noexcept
    : m_handle(other.m_handle)
    , m_path(std::move(other.m_path))
{
    other.m_handle = nullptr;
}

DynamicLibrary& DynamicLibrary::operator=(DynamicLibrary&& other) noexcept {
    if (this != &other) {
        unload();
        m_handle = other.m_handle;
        m_path = std::move(other.m_path);
        other.m_handle = nullptr;
    }
    return *this;
}

DynamicLibrary::DynamicLibrary(NativeLibraryHandle handle, std::filesystem::path path)
    : m_handle(handle)
    , m_path(std::move(path))
{}

#ifdef _WIN32

relay_core::Result<DynamicLibrary> DynamicLibrary::load(const std::filesystem::path& path) {
    HMODULE handle = LoadLibraryW(path.wstring().c_str());
    if (!handle) {
        return relay_core::Error(relay_core::ErrorCode::LoadFailed,
            "Failed to load library '" + path.string() + "': " + get_last_error());
    }
    return DynamicLibrary(handle, path);
}

void DynamicLibrary::unload() noexcept {
    if (m_handle) {
        FreeLibrary(m_handle);
        m_handle = nullptr;
    }
    m_path.clear();
}

void* DynamicLibrary::get_symbol(const char* name) const noexcept {
    if (!m_handle) {
        return nullptr;
    }
    return reinterpret_cast<void*>(GetProcAddress(m_handle, name));
}

std::string DynamicLibrary::get_last_error() {
    DWORD error_code = GetLastError();
    if (error_code == 0) {
        return "No error";
    }
    return "Error code: " + std::to_string(error_code);
}

#else // Unix (Linux, macOS)

relay_core::Result<DynamicLibrary> DynamicLibrary::load(const std::filesystem::path& path) {
    dlerror();

    void* handle = dlopen(path.c_str(), RTLD_NOW | RTLD_LOCAL);
    if (!handle) {
        return relay_core::Error(relay_core::ErrorCode::LoadFailed,
            "Failed to load library '" + path.string() + "': " + get_last_error());
    }

    return DynamicLibrary(handle, path);
}

void DynamicLibrary::unload() noexcept {
    if (m_handle) {
        dlclose(m_handle);
        m_handle = nullptr;
    }
    m_path.clear();
}

void* DynamicLibrary::get_symbol(const char* name) const noexcept {
    if (!m_handle) {
        return nullptr;
    }
    dlerror();
    return dlsym(m_handle, name);
}

std::string DynamicLibrary::get_last_error() {
    const char* error = dlerror();
    return error ? std::string(error) : "No error";
}

#endif

// =============================================================================
// Utility Functions
// =============================================================================

bool has_library_extension(const std::filesystem::path& path) {
    std::string ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext == library_extension();
}

std::optional<std::filesystem::path> find_plugin_library(
    const std::filesystem::path& dir,
    const std::string& plugin_name) {

    std::error_code ec;
    const std::filesystem::path preferred[] = {
        dir / ("lib" + plugin_name + library_extension()),
        dir / (plugin_name + library_extension()),
    };
    for (const auto& candidate : preferred) {
        if (std::filesystem::is_regular_file(candidate, ec)) {
            return candidate;
        }
    }

    std::vector<std::filesystem::path> others;
    for (const auto& entry : std::filesystem::directory_iterator(dir, ec)) {
        std::error_code entry_ec;
        if (entry.is_regular_file(entry_ec) && has_library_extension(entry.path())) {
            others.push_back(entry.path());
        }
    }

    if (others.empty()) {
        return std::nullopt;
    }

    std::sort(others.begin(), others.end());
    return others.front();
}

} // namespace relay_kernel
