#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for relay_kernel module

#include <cstdint>

namespace relay_kernel {

// Component contract
class Component;
class ShutdownHook;
class Runnable;
class StopToken;
class Dependencies;

template<typename T>
class HostComponent;

// Loading
class ComponentRegistry;
class DynamicLibrary;

// Kernel
class InstanceKernel;

// Lifecycle
class BackgroundTask;
enum class LifecycleState : std::uint8_t;
class LifecycleController;

} // namespace relay_kernel
