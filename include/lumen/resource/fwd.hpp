#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for lumen_resource module

#include <cstdint>

namespace lumen_resource {

enum class ObjectKind : std::uint8_t;
enum class LifecycleState : std::uint8_t;
enum class MemoryCategory : std::uint8_t;
enum class GcReason : std::uint8_t;

struct ObjectRecord;
struct ObjectRef;
struct TextureConfig;
struct FramebufferConfig;
struct BufferConfig;
struct MemoryBudget;
struct MemoryUsage;
struct GcConfig;
struct GcReport;
struct ResourceManagerConfig;
struct ResourceStats;

class ObjectStore;
class RefCounter;
class ResourceManager;

} // namespace lumen_resource
