/// @file discovery.cpp
/// @brief Plugin tree scanning and dependency graph implementation

#include <relay/plugin/discovery.hpp>
#include <relay/core/log.hpp>

#include <algorithm>
#include <sstream>

namespace relay_plugin {

using relay_core::Err;
using relay_core::Error;
using relay_core::ErrorCode;
using relay_core::KernelError;
using relay_core::Ok;
using relay_core::Result;

namespace fs = std::filesystem;

namespace {

/// Subdirectories of a directory, sorted by name; hidden entries and
/// symlinked directories skipped
std::vector<fs::path> sorted_subdirectories(const fs::path& dir) {
    std::vector<fs::path> dirs;
    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    const fs::directory_iterator end;

    for (; !ec && it != end; it.increment(ec)) {
        const auto& entry = *it;
        std::error_code entry_ec;
        if (entry.is_symlink(entry_ec) || !entry.is_directory(entry_ec)) {
            continue;
        }
        auto name = entry.path().filename().string();
        if (name.empty() || name[0] == '.') {
            continue;
        }
        dirs.push_back(entry.path());
    }
    if (ec) {
        relay_core::plugin_logger()->warn("Failed to list directory {}: {}", dir.string(), ec.message());
    }
    std::sort(dirs.begin(), dirs.end());
    return dirs;
}

} // anonymous namespace

std::string format_cycle_path(const std::vector<std::string>& path) {
    std::ostringstream oss;
    for (std::size_t i = 0; i < path.size(); ++i) {
        if (i > 0) oss << " -> ";
        oss << path[i];
    }
    return oss.str();
}

// =============================================================================
// Scanning
// =============================================================================

Result<std::size_t> PluginDiscovery::discover(const fs::path& root) {
    auto logger = relay_core::plugin_logger();

    clear();
    m_root = root;

    std::error_code ec;
    if (!fs::exists(root, ec) || !fs::is_directory(root, ec)) {
        logger->warn("Plugin root not found: {}", root.string());
        return Ok(std::size_t{0});
    }

    std::size_t count = 0;

    // Utilities first so a name clash keeps the utility
    const fs::path utilities_dir = root / "utilities";
    const fs::path services_dir = root / "services";

    if (fs::is_directory(utilities_dir, ec)) {
        scan_tree(utilities_dir, PluginKind::Utility, count);
    }
    if (fs::is_directory(services_dir, ec)) {
        scan_tree(services_dir, PluginKind::Service, count);
    }

    if (fs::exists(root / k_descriptor_file_name, ec)) {
        register_leaf(root / k_descriptor_file_name, std::nullopt, count);
    } else {
        for (const auto& dir : sorted_subdirectories(root)) {
            if (dir == utilities_dir || dir == services_dir) {
                continue;
            }
            scan_tree(dir, std::nullopt, count);
        }
    }

    logger->info("Discovered {} plugins ({} utilities, {} services) in {}",
        count,
        plugins_of_kind(PluginKind::Utility).size(),
        plugins_of_kind(PluginKind::Service).size(),
        root.string());

    build_graph();

    auto cycles = detect_cycles();
    if (!cycles) {
        logger->critical("{}", cycles.error().message());
        return Err<std::size_t>(cycles.error());
    }

    return Ok(count);
}

Result<std::size_t> PluginDiscovery::reload() {
    if (m_root.empty()) {
        return Err<std::size_t>(Error(ErrorCode::InvalidState,
            "reload() called before discover()"));
    }
    relay_core::plugin_logger()->info("Reloading plugins from {}", m_root.string());
    fs::path root = m_root;
    return discover(root);
}

Result<void> PluginDiscovery::register_descriptor(PluginDescriptor descriptor) {
    if (descriptor.name.empty()) {
        return Err(Error(ErrorCode::InvalidArgument, "Descriptor has no name"));
    }
    if (m_descriptors.count(descriptor.name)) {
        return Err(Error(ErrorCode::AlreadyExists,
            "Plugin already registered: " + descriptor.name));
    }
    std::string name = descriptor.name;
    m_descriptors.emplace(std::move(name), std::move(descriptor));
    return Ok();
}

void PluginDiscovery::clear() {
    m_descriptors.clear();
    m_graph.clear();
}

void PluginDiscovery::scan_tree(
    const fs::path& dir,
    std::optional<PluginKind> kind,
    std::size_t& count) {

    std::error_code ec;
    const fs::path descriptor_path = dir / k_descriptor_file_name;

    // A directory with a descriptor is a leaf
    if (fs::exists(descriptor_path, ec)) {
        register_leaf(descriptor_path, kind, count);
        return;
    }

    for (const auto& sub : sorted_subdirectories(dir)) {
        scan_tree(sub, kind, count);
    }
}

void PluginDiscovery::register_leaf(
    const fs::path& descriptor_path,
    std::optional<PluginKind> kind,
    std::size_t& count) {

    auto logger = relay_core::plugin_logger();

    auto result = PluginDescriptor::load(descriptor_path, kind);
    if (!result) {
        logger->error("Skipping plugin at {}: {}",
            descriptor_path.parent_path().string(), result.error().message());
        return;
    }

    PluginDescriptor desc = std::move(result).value();

    if (!desc.enabled) {
        logger->debug("Plugin '{}' is disabled in its descriptor, skipping", desc.name);
        return;
    }

    auto existing = m_descriptors.find(desc.name);
    if (existing != m_descriptors.end()) {
        logger->warn("Duplicate plugin name '{}' at {} (keeping {})",
            desc.name, desc.path.string(), existing->second.path.string());
        return;
    }

    logger->debug("Found {} '{}' at {}", plugin_kind_name(desc.kind), desc.name, desc.path.string());
    std::string name = desc.name;
    m_descriptors.emplace(std::move(name), std::move(desc));
    ++count;
}

// =============================================================================
// Graph
// =============================================================================

void PluginDiscovery::build_graph() {
    auto logger = relay_core::plugin_logger();
    m_graph.clear();

    for (const auto& [name, desc] : m_descriptors) {
        auto& edges = m_graph[name];
        for (const auto& dep : desc.dependencies) {
            if (is_utility(dep)) {
                edges.insert(dep);
            } else if (is_service(dep)) {
                logger->warn("{} '{}' depends on service '{}'; only utilities can be dependencies",
                    plugin_kind_name(desc.kind), name, dep);
            } else {
                logger->warn("{} '{}' depends on non-existent utility: {}",
                    plugin_kind_name(desc.kind), name, dep);
            }
        }
    }
}

Result<void> PluginDiscovery::detect_cycles() const {
    std::set<std::string> visited;
    std::set<std::string> in_stack;
    std::vector<std::string> current_path;

    for (const auto& [name, _] : m_graph) {
        if (!visited.count(name)) {
            auto result = cycle_visit(name, visited, in_stack, current_path);
            if (!result) {
                return result;
            }
        }
    }

    return Ok();
}

Result<void> PluginDiscovery::cycle_visit(
    const std::string& name,
    std::set<std::string>& visited,
    std::set<std::string>& in_stack,
    std::vector<std::string>& current_path) const {

    if (in_stack.count(name)) {
        // Report only the cycle, not the path that led into it
        auto start = std::find(current_path.begin(), current_path.end(), name);
        std::vector<std::string> cycle(start, current_path.end());
        cycle.push_back(name);
        return Err(Error(KernelError::graph_cycle(format_cycle_path(cycle))));
    }

    if (visited.count(name)) {
        return Ok();
    }

    in_stack.insert(name);
    current_path.push_back(name);

    auto it = m_graph.find(name);
    if (it != m_graph.end()) {
        for (const auto& dep : it->second) {
            auto result = cycle_visit(dep, visited, in_stack, current_path);
            if (!result) {
                return result;
            }
        }
    }

    in_stack.erase(name);
    current_path.pop_back();
    visited.insert(name);

    return Ok();
}

TopologicalOrder PluginDiscovery::topological_order(const std::set<std::string>& subset) const {
    TopologicalOrder result;
    std::set<std::string> visited;
    std::vector<std::string> current_path;

    for (const auto& name : subset) {
        if (!m_graph.count(name)) {
            continue;
        }
        order_visit(name, subset, result, visited, current_path);
    }

    if (result.has_residual()) {
        auto& order = result.order;
        order.erase(std::remove_if(order.begin(), order.end(),
            [&result](const std::string& n) { return result.residual.count(n) > 0; }),
            order.end());
    }

    return result;
}

void PluginDiscovery::order_visit(
    const std::string& name,
    const std::set<std::string>& subset,
    TopologicalOrder& result,
    std::set<std::string>& visited,
    std::vector<std::string>& current_path) const {

    if (visited.count(name)) {
        return;
    }

    auto on_path = std::find(current_path.begin(), current_path.end(), name);
    if (on_path != current_path.end()) {
        result.residual.insert(on_path, current_path.end());
        return;
    }

    current_path.push_back(name);

    auto it = m_graph.find(name);
    if (it != m_graph.end()) {
        for (const auto& dep : it->second) {
            if (subset.count(dep)) {
                order_visit(dep, subset, result, visited, current_path);
            }
        }
    }

    current_path.pop_back();
    visited.insert(name);
    result.order.push_back(name);
}

// =============================================================================
// Queries
// =============================================================================

const PluginDescriptor* PluginDiscovery::get(const std::string& name) const {
    auto it = m_descriptors.find(name);
    return it != m_descriptors.end() ? &it->second : nullptr;
}

bool PluginDiscovery::contains(const std::string& name) const {
    return m_descriptors.count(name) > 0;
}

std::optional<PluginKind> PluginDiscovery::kind_of(const std::string& name) const {
    const auto* desc = get(name);
    if (!desc) {
        return std::nullopt;
    }
    return desc->kind;
}

bool PluginDiscovery::is_utility(const std::string& name) const {
    auto kind = kind_of(name);
    return kind && *kind == PluginKind::Utility;
}

bool PluginDiscovery::is_service(const std::string& name) const {
    auto kind = kind_of(name);
    return kind && *kind == PluginKind::Service;
}

std::vector<std::string> PluginDiscovery::plugins_of_kind(PluginKind kind) const {
    std::vector<std::string> names;
    for (const auto& [name, desc] : m_descriptors) {
        if (desc.kind == kind) {
            names.push_back(name);
        }
    }
    return names;
}

std::vector<std::string> PluginDiscovery::dependencies_of(const std::string& name) const {
    const auto* desc = get(name);
    if (!desc) {
        return {};
    }
    return desc->dependencies;
}

} // namespace relay_plugin
