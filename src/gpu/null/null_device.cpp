/// @file null_device.cpp
/// @brief Null graphics device implementation

#include <lumen/gpu/null_device.hpp>

#include <cstring>
#include <regex>
#include <sstream>

namespace lumen_gpu {

using lumen_core::Err;
using lumen_core::Ok;
using lumen_core::Result;

// =============================================================================
// Factory Function
// =============================================================================

std::unique_ptr<IGraphicsDevice> create_null_device() {
    return std::make_unique<NullDevice>();
}

// =============================================================================
// Source scanning
// =============================================================================

namespace {

/// Find the first `#error` directive and format it like a driver log
std::optional<std::string> find_error_directive(const std::string& source) {
    static const std::regex error_regex(R"(^\s*#\s*error\b(.*)$)");

    std::istringstream stream(source);
    std::string line;
    int line_number = 0;
    while (std::getline(stream, line)) {
        ++line_number;
        std::smatch match;
        if (std::regex_search(line, match, error_regex)) {
            std::ostringstream log;
            log << "ERROR: 0:" << line_number << ": '#error' :" << match[1].str();
            return log.str();
        }
    }
    return std::nullopt;
}

void collect_declarations(const std::string& source, const std::regex& pattern,
                          std::map<std::string, std::int32_t>& out) {
    std::istringstream stream(source);
    std::string line;
    while (std::getline(stream, line)) {
        std::smatch match;
        if (std::regex_search(line, match, pattern)) {
            auto name = match[1].str();
            if (out.find(name) == out.end()) {
                out[name] = static_cast<std::int32_t>(out.size());
            }
        }
    }
}

ProgramReflection reflect_sources(const std::string& vertex, const std::string& fragment) {
    static const std::regex attribute_regex(
        R"(^\s*(?:layout\s*\([^)]*\)\s*)?(?:attribute|in)\s+(?:(?:lowp|mediump|highp)\s+)?\w+\s+(\w+)\s*;)");
    static const std::regex uniform_regex(
        R"(^\s*uniform\s+(?:(?:lowp|mediump|highp)\s+)?\w+\s+(\w+)\s*(?:\[\s*\d+\s*\])?\s*;)");

    ProgramReflection reflection;
    collect_declarations(vertex, attribute_regex, reflection.attributes);
    collect_declarations(vertex, uniform_regex, reflection.uniforms);
    collect_declarations(fragment, uniform_regex, reflection.uniforms);
    return reflection;
}

} // anonymous namespace

// =============================================================================
// NullDevice Implementation
// =============================================================================

NullDevice::NullDevice() = default;

NullDevice::NullDevice(const DeviceLimits& limits)
    : m_limits(limits) {}

bool NullDevice::consume_allocation_failure() noexcept {
    bool fail = m_fail_next_allocation;
    m_fail_next_allocation = false;
    return fail;
}

Result<TextureHandle> NullDevice::create_texture(const TextureDesc& desc, const void* data) {
    record(DeviceCall::CreateTexture);

    if (consume_allocation_failure()) {
        return Err<TextureHandle>(lumen_core::DeviceError::creation_failed("texture", "injected failure"));
    }
    if (desc.width == 0 || desc.height == 0) {
        return Err<TextureHandle>(lumen_core::DeviceError::creation_failed("texture", "zero extent"));
    }
    if (desc.width > m_limits.max_texture_size || desc.height > m_limits.max_texture_size) {
        return Err<TextureHandle>(lumen_core::DeviceError::creation_failed(
            "texture", "extent exceeds max texture size " + std::to_string(m_limits.max_texture_size)));
    }

    TextureRecord rec;
    rec.desc = desc;
    rec.pixels.resize(texture_size_bytes(desc));
    if (data) {
        std::size_t base = static_cast<std::size_t>(desc.width) * desc.height * bytes_per_pixel(desc.format);
        std::memcpy(rec.pixels.data(), data, base);
    }

    TextureHandle handle{m_next_handle++};
    m_textures.emplace(handle.id, std::move(rec));
    return Ok(handle);
}

Result<void> NullDevice::update_texture(TextureHandle handle, const TextureRegion& region, const void* data) {
    record(DeviceCall::UpdateTexture);

    auto it = m_textures.find(handle.id);
    if (it == m_textures.end()) {
        return Err(lumen_core::DeviceError::invalid_handle("texture"));
    }

    const auto& desc = it->second.desc;
    if (!region_fits(region, desc)) {
        return Err(lumen_core::Error(lumen_core::ErrorCode::InvalidArgument, "Texture region out of bounds"));
    }

    if (data) {
        std::uint32_t bpp = bytes_per_pixel(desc.format);
        const auto* src = static_cast<const std::uint8_t*>(data);
        for (std::uint32_t row = 0; row < region.height; ++row) {
            std::size_t dst_offset = (static_cast<std::size_t>(region.y + row) * desc.width + region.x) * bpp;
            std::memcpy(it->second.pixels.data() + dst_offset,
                        src + static_cast<std::size_t>(row) * region.width * bpp,
                        static_cast<std::size_t>(region.width) * bpp);
        }
    }
    return Ok();
}

void NullDevice::destroy_texture(TextureHandle handle) {
    record(DeviceCall::DestroyTexture);
    m_textures.erase(handle.id);
}

Result<FramebufferHandle> NullDevice::create_framebuffer(const FramebufferDesc& desc) {
    record(DeviceCall::CreateFramebuffer);

    if (consume_allocation_failure()) {
        return Err<FramebufferHandle>(lumen_core::DeviceError::creation_failed("framebuffer", "injected failure"));
    }
    if (desc.color_attachments.size() > m_limits.max_color_attachments) {
        return Err<FramebufferHandle>(lumen_core::DeviceError::unsupported(
            std::to_string(desc.color_attachments.size()) + " color attachments"));
    }
    for (const auto& attachment : desc.color_attachments) {
        if (m_textures.find(attachment.id) == m_textures.end()) {
            return Err<FramebufferHandle>(lumen_core::DeviceError::invalid_handle("color attachment"));
        }
    }
    if (desc.depth_attachment.is_valid() && m_textures.find(desc.depth_attachment.id) == m_textures.end()) {
        return Err<FramebufferHandle>(lumen_core::DeviceError::invalid_handle("depth attachment"));
    }

    FramebufferHandle handle{m_next_handle++};
    m_framebuffers.emplace(handle.id, desc);
    return Ok(handle);
}

void NullDevice::destroy_framebuffer(FramebufferHandle handle) {
    record(DeviceCall::DestroyFramebuffer);
    m_framebuffers.erase(handle.id);
}

Result<BufferHandle> NullDevice::create_buffer(const BufferDesc& desc, const void* data) {
    record(DeviceCall::CreateBuffer);

    if (consume_allocation_failure()) {
        return Err<BufferHandle>(lumen_core::DeviceError::creation_failed("buffer", "injected failure"));
    }
    if (desc.size == 0) {
        return Err<BufferHandle>(lumen_core::DeviceError::creation_failed("buffer", "zero size"));
    }

    BufferRecord rec;
    rec.desc = desc;
    rec.data.resize(desc.size);
    if (data) {
        std::memcpy(rec.data.data(), data, desc.size);
    }

    BufferHandle handle{m_next_handle++};
    m_buffers.emplace(handle.id, std::move(rec));
    return Ok(handle);
}

Result<void> NullDevice::write_buffer(BufferHandle handle, std::size_t offset, const void* data, std::size_t size) {
    record(DeviceCall::WriteBuffer);

    auto it = m_buffers.find(handle.id);
    if (it == m_buffers.end() || it->second.lost) {
        return Err(lumen_core::DeviceError::invalid_handle("buffer"));
    }
    if (offset + size > it->second.data.size()) {
        return Err(lumen_core::Error(lumen_core::ErrorCode::InvalidArgument, "Buffer write out of bounds"));
    }
    if (data && size > 0) {
        std::memcpy(it->second.data.data() + offset, data, size);
    }
    return Ok();
}

void NullDevice::destroy_buffer(BufferHandle handle) {
    record(DeviceCall::DestroyBuffer);
    m_buffers.erase(handle.id);
}

bool NullDevice::is_buffer_valid(BufferHandle handle) const {
    auto it = m_buffers.find(handle.id);
    return it != m_buffers.end() && !it->second.lost;
}

void NullDevice::lose_buffer(BufferHandle handle) {
    auto it = m_buffers.find(handle.id);
    if (it != m_buffers.end()) {
        it->second.lost = true;
    }
}

Result<VertexArrayHandle> NullDevice::create_vertex_array() {
    record(DeviceCall::CreateVertexArray);

    if (consume_allocation_failure()) {
        return Err<VertexArrayHandle>(lumen_core::DeviceError::creation_failed("vertex array", "injected failure"));
    }

    VertexArrayHandle handle{m_next_handle++};
    m_vertex_arrays.emplace(handle.id, true);
    return Ok(handle);
}

void NullDevice::destroy_vertex_array(VertexArrayHandle handle) {
    record(DeviceCall::DestroyVertexArray);
    m_vertex_arrays.erase(handle.id);
}

Result<ShaderStageHandle> NullDevice::compile_shader_stage(ShaderStage stage, const std::string& source) {
    record(DeviceCall::CompileShader);
    m_last_source[static_cast<std::size_t>(stage)] = source;

    if (auto log = find_error_directive(source)) {
        return Err<ShaderStageHandle>(
            lumen_core::ShaderError::compile_failed(shader_stage_name(stage), source, *log));
    }

    ShaderStageHandle handle{m_next_handle++};
    m_stages.emplace(handle.id, StageRecord{stage, source});
    return Ok(handle);
}

void NullDevice::destroy_shader_stage(ShaderStageHandle handle) {
    record(DeviceCall::DestroyShader);
    m_stages.erase(handle.id);
}

Result<ProgramHandle> NullDevice::link_program(ShaderStageHandle vertex, ShaderStageHandle fragment) {
    record(DeviceCall::LinkProgram);

    auto vs = m_stages.find(vertex.id);
    auto fs = m_stages.find(fragment.id);
    if (vs == m_stages.end() || fs == m_stages.end()) {
        return Err<ProgramHandle>(lumen_core::ShaderError::link_failed("unknown shader stage handle"));
    }
    if (vs->second.stage != ShaderStage::Vertex || fs->second.stage != ShaderStage::Fragment) {
        return Err<ProgramHandle>(lumen_core::ShaderError::link_failed("stage type mismatch"));
    }
    if (vs->second.source.find("LINK_FAIL") != std::string::npos ||
        fs->second.source.find("LINK_FAIL") != std::string::npos) {
        return Err<ProgramHandle>(lumen_core::ShaderError::link_failed(
            "error: linking with uncompiled/unspecialized shader"));
    }

    ProgramHandle handle{m_next_handle++};
    m_programs.emplace(handle.id, reflect_sources(vs->second.source, fs->second.source));
    return Ok(handle);
}

void NullDevice::destroy_program(ProgramHandle handle) {
    record(DeviceCall::DestroyProgram);
    m_programs.erase(handle.id);
    if (m_current_program == handle) {
        m_current_program = ProgramHandle::invalid();
    }
}

ProgramReflection NullDevice::reflect_program(ProgramHandle handle) const {
    auto it = m_programs.find(handle.id);
    return it != m_programs.end() ? it->second : ProgramReflection{};
}

void NullDevice::use_program(ProgramHandle handle) {
    record(DeviceCall::UseProgram);
    m_current_program = handle;
}

void NullDevice::bind_buffer(BufferType /*target*/, BufferHandle /*handle*/) {
    record(DeviceCall::BindBuffer);
}

void NullDevice::bind_vertex_array(VertexArrayHandle /*handle*/) {
    record(DeviceCall::BindVertexArray);
}

void NullDevice::active_texture(std::uint32_t unit) {
    record(DeviceCall::ActiveTexture);
    m_active_unit = unit;
}

void NullDevice::bind_texture(TextureHandle /*handle*/) {
    record(DeviceCall::BindTexture);
}

void NullDevice::set_viewport(const Viewport& viewport) {
    record(DeviceCall::SetViewport);
    m_viewport = viewport;
}

void NullDevice::set_capability(Capability cap, bool enabled) {
    record(DeviceCall::SetCapability);
    m_capabilities[cap] = enabled;
}

bool NullDevice::capability_enabled(Capability cap) const {
    auto it = m_capabilities.find(cap);
    return it != m_capabilities.end() && it->second;
}

void NullDevice::set_uniform(std::int32_t location, const UniformValue& value) {
    record(DeviceCall::SetUniform);
    if (location >= 0) {
        m_uniforms[location] = value;
    }
}

std::optional<UniformValue> NullDevice::uniform_value(std::int32_t location) const {
    auto it = m_uniforms.find(location);
    if (it == m_uniforms.end()) {
        return std::nullopt;
    }
    return it->second;
}

void NullDevice::draw(const DrawCommand& command) {
    record(DeviceCall::Draw);
    m_draws.push_back(command);
}

std::size_t NullDevice::allocated_bytes() const noexcept {
    std::size_t total = 0;
    for (const auto& [id, rec] : m_textures) {
        total += rec.pixels.size();
    }
    for (const auto& [id, rec] : m_buffers) {
        total += rec.data.size();
    }
    return total;
}

} // namespace lumen_gpu
