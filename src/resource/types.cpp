/// @file types.cpp
/// @brief Name functions for lumen_resource enums

#include <lumen/resource/types.hpp>

namespace lumen_resource {

const char* object_kind_name(ObjectKind kind) {
    switch (kind) {
        case ObjectKind::Texture: return "texture";
        case ObjectKind::Framebuffer: return "framebuffer";
        case ObjectKind::Buffer: return "buffer";
        case ObjectKind::Shader: return "shader";
        case ObjectKind::Program: return "program";
    }
    return "unknown";
}

const char* lifecycle_state_name(LifecycleState state) {
    switch (state) {
        case LifecycleState::Creating: return "CREATING";
        case LifecycleState::Ready: return "READY";
        case LifecycleState::Disposing: return "DISPOSING";
        case LifecycleState::Disposed: return "DISPOSED";
        case LifecycleState::Error: return "ERROR";
    }
    return "UNKNOWN";
}

const char* memory_category_name(MemoryCategory category) {
    switch (category) {
        case MemoryCategory::Textures: return "textures";
        case MemoryCategory::Buffers: return "buffers";
        case MemoryCategory::Other: return "other";
    }
    return "unknown";
}

const char* gc_reason_name(GcReason reason) {
    switch (reason) {
        case GcReason::Scheduled: return "scheduled";
        case GcReason::MemoryPressure: return "memory_pressure";
        case GcReason::Manual: return "manual";
    }
    return "unknown";
}

} // namespace lumen_resource
