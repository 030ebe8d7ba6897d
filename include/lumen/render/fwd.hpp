#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for lumen_render

namespace lumen_render {

struct PooledBuffer;
struct BufferPoolStats;
class BufferPool;

struct DeviceState;
struct StateCacheStats;
class StateCache;

struct DrawCall;
struct RenderBatch;
struct BatchStats;
class BatchOptimizer;

struct FrameOrchestratorConfig;
struct RenderConfig;
struct RenderStats;
struct DetailedStats;
class FrameOrchestrator;

} // namespace lumen_render
