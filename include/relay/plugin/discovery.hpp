#pragma once

/// @file discovery.hpp
/// @brief Plugin tree scanning and dependency graph
///
/// PluginDiscovery performs:
/// - Recursive scanning of a plugin tree for plugin.json descriptors
/// - Dependency graph construction (edges only to known utilities)
/// - Fatal cycle detection over the whole graph
/// - Subset-restricted topological ordering

#include "fwd.hpp"
#include "descriptor.hpp"
#include <relay/core/error.hpp>

#include <filesystem>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace relay_plugin {

/// Adjacency map: plugin name -> names of the utilities it depends on
using DependencyGraph = std::map<std::string, std::set<std::string>>;

// =============================================================================
// TopologicalOrder
// =============================================================================

/// Result of a subset-restricted topological sort
struct TopologicalOrder {
    std::vector<std::string> order;    ///< Dependencies precede dependents
    std::set<std::string> residual;    ///< Cycle members left out of `order`

    [[nodiscard]] bool has_residual() const noexcept { return !residual.empty(); }
};

/// Format a cycle path as "a -> b -> a"
[[nodiscard]] std::string format_cycle_path(const std::vector<std::string>& path);

// =============================================================================
// PluginDiscovery
// =============================================================================

/// Discovers plugins below a root directory and owns their descriptors
class PluginDiscovery {
public:
    PluginDiscovery() = default;

    // =========================================================================
    // Scanning
    // =========================================================================

    /// Scan `root` and replace all known descriptors.
    /// Utilities are scanned before services. A missing root yields zero
    /// plugins. Returns a GraphCycle error if the resulting graph is cyclic.
    [[nodiscard]] relay_core::Result<std::size_t> discover(const std::filesystem::path& root);

    /// Re-scan the last root passed to discover()
    [[nodiscard]] relay_core::Result<std::size_t> reload();

    /// Register a descriptor directly (no filesystem access).
    /// Call build_graph() afterwards to refresh edges.
    [[nodiscard]] relay_core::Result<void> register_descriptor(PluginDescriptor descriptor);

    /// Remove every descriptor and edge
    void clear();

    // =========================================================================
    // Graph
    // =========================================================================

    /// Rebuild the dependency graph from the current descriptors
    void build_graph();

    /// Full-graph DFS; any back-edge yields a GraphCycle error naming the path
    [[nodiscard]] relay_core::Result<void> detect_cycles() const;

    /// Topological sort restricted to `subset` and the edges inside it.
    /// Names outside the graph are ignored.
    [[nodiscard]] TopologicalOrder topological_order(const std::set<std::string>& subset) const;

    // =========================================================================
    // Queries
    // =========================================================================

    [[nodiscard]] const PluginDescriptor* get(const std::string& name) const;
    [[nodiscard]] bool contains(const std::string& name) const;
    [[nodiscard]] std::optional<PluginKind> kind_of(const std::string& name) const;
    [[nodiscard]] bool is_utility(const std::string& name) const;
    [[nodiscard]] bool is_service(const std::string& name) const;

    /// Names of every plugin of a kind, sorted
    [[nodiscard]] std::vector<std::string> plugins_of_kind(PluginKind kind) const;

    /// Raw declared dependency list (empty for unknown names)
    [[nodiscard]] std::vector<std::string> dependencies_of(const std::string& name) const;

    [[nodiscard]] const DependencyGraph& graph() const noexcept { return m_graph; }
    [[nodiscard]] const std::map<std::string, PluginDescriptor>& descriptors() const noexcept {
        return m_descriptors;
    }
    [[nodiscard]] const std::filesystem::path& root() const noexcept { return m_root; }
    [[nodiscard]] std::size_t size() const noexcept { return m_descriptors.size(); }

private:
    void scan_tree(const std::filesystem::path& dir,
                   std::optional<PluginKind> kind,
                   std::size_t& count);

    void register_leaf(const std::filesystem::path& descriptor_path,
                       std::optional<PluginKind> kind,
                       std::size_t& count);

    relay_core::Result<void> cycle_visit(
        const std::string& name,
        std::set<std::string>& visited,
        std::set<std::string>& in_stack,
        std::vector<std::string>& current_path) const;

    void order_visit(
        const std::string& name,
        const std::set<std::string>& subset,
        TopologicalOrder& result,
        std::set<std::string>& visited,
        std::vector<std::string>& current_path) const;

    std::filesystem::path m_root;
    std::map<std::string, PluginDescriptor> m_descriptors;
    DependencyGraph m_graph;
};

} // namespace relay_plugin
