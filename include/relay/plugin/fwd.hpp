#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for relay_plugin module

#include <cstdint>

namespace relay_plugin {

// Descriptors
enum class PluginKind : std::uint8_t;
struct PluginDescriptor;

// Discovery
struct TopologicalOrder;
class PluginDiscovery;

// Policy and settings
struct KindPolicy;
struct EnablementPolicy;
struct ShutdownSettings;
struct AppSettings;

// Planning
struct StartupPlan;
class StartupPlanner;

} // namespace relay_plugin
