/// @file opengl_device.cpp
/// @brief OpenGL graphics device implementation

#include "opengl_device.hpp"

#include <lumen/core/log.hpp>

#include <cstdint>
#include <type_traits>
#include <vector>

namespace lumen_gpu {

using lumen_core::Err;
using lumen_core::Ok;
using lumen_core::Result;

// =============================================================================
// Factory Function
// =============================================================================

Result<std::unique_ptr<IGraphicsDevice>> create_opengl_device() {
    auto device = std::make_unique<backends::OpenGLDevice>();
    auto init = device->init();
    if (!init) {
        return Err<std::unique_ptr<IGraphicsDevice>>(init.error());
    }
    return Result<std::unique_ptr<IGraphicsDevice>>(std::unique_ptr<IGraphicsDevice>(std::move(device)));
}

namespace backends {

namespace {

/// Restores a GL_*_BINDING after a creation path rebinds it
class ScopedBinding {
public:
    ScopedBinding(GLenum query, GLenum target, PFNGLBINDBUFFERPROC bind)
        : m_target(target), m_bind_buffer(bind) {
        glGetIntegerv(query, &m_previous);
    }

    ~ScopedBinding() {
        if (m_bind_buffer) {
            m_bind_buffer(m_target, static_cast<GLuint>(m_previous));
        }
    }

    ScopedBinding(const ScopedBinding&) = delete;
    ScopedBinding& operator=(const ScopedBinding&) = delete;

private:
    GLenum m_target;
    PFNGLBINDBUFFERPROC m_bind_buffer;
    GLint m_previous = 0;
};

/// Restores the 2D texture bound on the active unit
class ScopedTextureBinding {
public:
    ScopedTextureBinding() { glGetIntegerv(GL_TEXTURE_BINDING_2D, &m_previous); }
    ~ScopedTextureBinding() { glBindTexture(GL_TEXTURE_2D, static_cast<GLuint>(m_previous)); }

    ScopedTextureBinding(const ScopedTextureBinding&) = delete;
    ScopedTextureBinding& operator=(const ScopedTextureBinding&) = delete;

private:
    GLint m_previous = 0;
};

std::string strip_array_suffix(std::string name) {
    auto bracket = name.find('[');
    if (bracket != std::string::npos) {
        name.erase(bracket);
    }
    return name;
}

} // anonymous namespace

// =============================================================================
// Lifecycle
// =============================================================================

OpenGLDevice::~OpenGLDevice() {
    release_all();
}

Result<void> OpenGLDevice::init() {
    if (m_initialized) {
        return Ok();
    }
    if (!glXGetCurrentContext()) {
        return Err(lumen_core::DeviceError::unsupported("OpenGL device without a current context"));
    }
    if (!load_gl_functions()) {
        return Err(lumen_core::DeviceError::unsupported("OpenGL 3.3 entry points"));
    }

    query_limits();
    m_initialized = true;

    const auto* version = reinterpret_cast<const char*>(glGetString(GL_VERSION));
    const auto* renderer = reinterpret_cast<const char*>(glGetString(GL_RENDERER));
    lumen_core::gpu_logger()->info("OpenGL device ready: {} ({}), max texture {}",
        version ? version : "?", renderer ? renderer : "?", m_limits.max_texture_size);
    return Ok();
}

bool OpenGLDevice::load_gl_functions() {
    #define LOAD_GL(name) name##_ptr = (decltype(name##_ptr))glXGetProcAddress((const GLubyte*)#name)

    LOAD_GL(glGenBuffers);
    LOAD_GL(glBindBuffer);
    LOAD_GL(glBufferData);
    LOAD_GL(glBufferSubData);
    LOAD_GL(glDeleteBuffers);
    LOAD_GL(glIsBuffer);
    LOAD_GL(glGenVertexArrays);
    LOAD_GL(glBindVertexArray);
    LOAD_GL(glDeleteVertexArrays);
    LOAD_GL(glGenFramebuffers);
    LOAD_GL(glBindFramebuffer);
    LOAD_GL(glFramebufferTexture2D);
    LOAD_GL(glCheckFramebufferStatus);
    LOAD_GL(glDeleteFramebuffers);
    LOAD_GL(glDrawBuffers);
    LOAD_GL(glCreateShader);
    LOAD_GL(glShaderSource);
    LOAD_GL(glCompileShader);
    LOAD_GL(glGetShaderiv);
    LOAD_GL(glGetShaderInfoLog);
    LOAD_GL(glDeleteShader);
    LOAD_GL(glCreateProgram);
    LOAD_GL(glAttachShader);
    LOAD_GL(glDetachShader);
    LOAD_GL(glLinkProgram);
    LOAD_GL(glGetProgramiv);
    LOAD_GL(glGetProgramInfoLog);
    LOAD_GL(glDeleteProgram);
    LOAD_GL(glUseProgram);
    LOAD_GL(glGetActiveAttrib);
    LOAD_GL(glGetAttribLocation);
    LOAD_GL(glGetActiveUniform);
    LOAD_GL(glGetUniformLocation);
    LOAD_GL(glUniform1f);
    LOAD_GL(glUniform1i);
    LOAD_GL(glUniform2fv);
    LOAD_GL(glUniform3fv);
    LOAD_GL(glUniform4fv);
    LOAD_GL(glUniformMatrix3fv);
    LOAD_GL(glUniformMatrix4fv);
    LOAD_GL(glActiveTexture);
    LOAD_GL(glGenerateMipmap);
    LOAD_GL(glDrawArraysInstanced);
    LOAD_GL(glDrawElementsInstanced);

#undef LOAD_GL

    return glGenBuffers_ptr && glGenVertexArrays_ptr && glGenFramebuffers_ptr
        && glCreateShader_ptr && glCreateProgram_ptr && glUseProgram_ptr
        && glActiveTexture_ptr && glDrawArraysInstanced_ptr;
}

void OpenGLDevice::query_limits() {
    GLint value = 0;

    glGetIntegerv(GL_MAX_TEXTURE_SIZE, &value);
    m_limits.max_texture_size = static_cast<std::uint32_t>(value);

    glGetIntegerv(GL_MAX_COMBINED_TEXTURE_IMAGE_UNITS, &value);
    m_limits.max_texture_units = static_cast<std::uint32_t>(value);

    glGetIntegerv(GL_MAX_VERTEX_ATTRIBS, &value);
    m_limits.max_vertex_attributes = static_cast<std::uint32_t>(value);

    glGetIntegerv(GL_MAX_COLOR_ATTACHMENTS, &value);
    m_limits.max_color_attachments = static_cast<std::uint32_t>(value);

    GLint dims[2] = {0, 0};
    glGetIntegerv(GL_MAX_VIEWPORT_DIMS, dims);
    m_limits.max_viewport_width = static_cast<std::uint32_t>(dims[0]);
    m_limits.max_viewport_height = static_cast<std::uint32_t>(dims[1]);
}

void OpenGLDevice::release_all() {
    if (!m_initialized) return;

    for (auto& [id, fbo] : m_framebuffers) {
        glDeleteFramebuffers_ptr(1, &fbo);
    }
    for (auto& [id, tex] : m_textures) {
        glDeleteTextures(1, &tex.name);
    }
    for (auto& [id, buf] : m_buffers) {
        glDeleteBuffers_ptr(1, &buf.name);
    }
    for (auto& [id, vao] : m_vertex_arrays) {
        glDeleteVertexArrays_ptr(1, &vao);
    }
    for (auto& [id, shader] : m_stages) {
        glDeleteShader_ptr(shader);
    }
    for (auto& [id, program] : m_programs) {
        glDeleteProgram_ptr(program);
    }

    m_framebuffers.clear();
    m_textures.clear();
    m_buffers.clear();
    m_vertex_arrays.clear();
    m_stages.clear();
    m_programs.clear();
    m_initialized = false;
}

// =============================================================================
// Textures
// =============================================================================

Result<TextureHandle> OpenGLDevice::create_texture(const TextureDesc& desc, const void* data) {
    if (desc.width == 0 || desc.height == 0) {
        return Err<TextureHandle>(lumen_core::DeviceError::creation_failed("texture", "zero extent"));
    }
    if (desc.width > m_limits.max_texture_size || desc.height > m_limits.max_texture_size) {
        return Err<TextureHandle>(lumen_core::DeviceError::creation_failed(
            "texture", "extent exceeds max texture size " + std::to_string(m_limits.max_texture_size)));
    }

    ScopedTextureBinding restore;

    GLuint texture = 0;
    glGenTextures(1, &texture);
    if (texture == 0) {
        return Err<TextureHandle>(lumen_core::DeviceError::creation_failed("texture", "glGenTextures returned 0"));
    }

    glBindTexture(GL_TEXTURE_2D, texture);
    glPixelStorei(GL_UNPACK_ALIGNMENT, 1);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MIN_FILTER, texture_filter(desc.min_filter, desc.generate_mipmaps));
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MAG_FILTER, texture_filter(desc.mag_filter, false));
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_S, texture_wrap(desc.wrap_s));
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_T, texture_wrap(desc.wrap_t));

    while (glGetError() != GL_NO_ERROR) {}
    glTexImage2D(GL_TEXTURE_2D, 0, texture_internal_format(desc.format),
                 static_cast<GLsizei>(desc.width), static_cast<GLsizei>(desc.height), 0,
                 texture_pixel_format(desc.format), texture_pixel_type(desc.format), data);

    GLenum error = glGetError();
    if (error != GL_NO_ERROR) {
        glDeleteTextures(1, &texture);
        return Err<TextureHandle>(lumen_core::DeviceError::creation_failed(
            "texture", "glTexImage2D error 0x" + std::to_string(error)));
    }

    if (desc.generate_mipmaps && glGenerateMipmap_ptr) {
        glGenerateMipmap_ptr(GL_TEXTURE_2D);
    }

    TextureHandle handle{next_handle()};
    m_textures.emplace(handle.id, GlTexture{texture, desc});
    return Ok(handle);
}

Result<void> OpenGLDevice::update_texture(TextureHandle handle, const TextureRegion& region, const void* data) {
    auto it = m_textures.find(handle.id);
    if (it == m_textures.end()) {
        return Err(lumen_core::DeviceError::invalid_handle("texture"));
    }

    const auto& tex = it->second;
    if (!region_fits(region, tex.desc)) {
        return Err(lumen_core::Error(lumen_core::ErrorCode::InvalidArgument, "Texture region out of bounds"));
    }

    ScopedTextureBinding restore;
    glBindTexture(GL_TEXTURE_2D, tex.name);
    glPixelStorei(GL_UNPACK_ALIGNMENT, 1);
    glTexSubImage2D(GL_TEXTURE_2D, 0,
                    static_cast<GLint>(region.x), static_cast<GLint>(region.y),
                    static_cast<GLsizei>(region.width), static_cast<GLsizei>(region.height),
                    texture_pixel_format(tex.desc.format), texture_pixel_type(tex.desc.format), data);

    if (tex.desc.generate_mipmaps && glGenerateMipmap_ptr) {
        glGenerateMipmap_ptr(GL_TEXTURE_2D);
    }
    return Ok();
}

void OpenGLDevice::destroy_texture(TextureHandle handle) {
    auto it = m_textures.find(handle.id);
    if (it != m_textures.end()) {
        glDeleteTextures(1, &it->second.name);
        m_textures.erase(it);
    }
}

// =============================================================================
// Framebuffers
// =============================================================================

Result<FramebufferHandle> OpenGLDevice::create_framebuffer(const FramebufferDesc& desc) {
    if (desc.color_attachments.size() > m_limits.max_color_attachments) {
        return Err<FramebufferHandle>(lumen_core::DeviceError::unsupported(
            std::to_string(desc.color_attachments.size()) + " color attachments"));
    }

    GLint previous = 0;
    glGetIntegerv(GL_FRAMEBUFFER_BINDING, &previous);

    GLuint fbo = 0;
    glGenFramebuffers_ptr(1, &fbo);
    glBindFramebuffer_ptr(GL_FRAMEBUFFER, fbo);

    std::vector<GLenum> draw_buffers;
    for (std::size_t i = 0; i < desc.color_attachments.size(); ++i) {
        auto it = m_textures.find(desc.color_attachments[i].id);
        if (it == m_textures.end()) {
            glBindFramebuffer_ptr(GL_FRAMEBUFFER, static_cast<GLuint>(previous));
            glDeleteFramebuffers_ptr(1, &fbo);
            return Err<FramebufferHandle>(lumen_core::DeviceError::invalid_handle("color attachment"));
        }
        GLenum attachment = GL_COLOR_ATTACHMENT0 + static_cast<GLenum>(i);
        glFramebufferTexture2D_ptr(GL_FRAMEBUFFER, attachment, GL_TEXTURE_2D, it->second.name, 0);
        draw_buffers.push_back(attachment);
    }

    if (desc.depth_attachment.is_valid()) {
        auto it = m_textures.find(desc.depth_attachment.id);
        if (it == m_textures.end()) {
            glBindFramebuffer_ptr(GL_FRAMEBUFFER, static_cast<GLuint>(previous));
            glDeleteFramebuffers_ptr(1, &fbo);
            return Err<FramebufferHandle>(lumen_core::DeviceError::invalid_handle("depth attachment"));
        }
        GLenum attachment = it->second.desc.format == TextureFormat::Depth24Stencil8
            ? GL_DEPTH_STENCIL_ATTACHMENT : GL_DEPTH_ATTACHMENT;
        glFramebufferTexture2D_ptr(GL_FRAMEBUFFER, attachment, GL_TEXTURE_2D, it->second.name, 0);
    }

    if (draw_buffers.empty()) {
        glDrawBuffer(GL_NONE);
    } else {
        glDrawBuffers_ptr(static_cast<GLsizei>(draw_buffers.size()), draw_buffers.data());
    }

    GLenum status = glCheckFramebufferStatus_ptr(GL_FRAMEBUFFER);
    glBindFramebuffer_ptr(GL_FRAMEBUFFER, static_cast<GLuint>(previous));

    if (status != GL_FRAMEBUFFER_COMPLETE) {
        glDeleteFramebuffers_ptr(1, &fbo);
        return Err<FramebufferHandle>(lumen_core::DeviceError::creation_failed(
            "framebuffer", "incomplete (status 0x" + std::to_string(status) + ")"));
    }

    FramebufferHandle handle{next_handle()};
    m_framebuffers.emplace(handle.id, fbo);
    return Ok(handle);
}

void OpenGLDevice::destroy_framebuffer(FramebufferHandle handle) {
    auto it = m_framebuffers.find(handle.id);
    if (it != m_framebuffers.end()) {
        glDeleteFramebuffers_ptr(1, &it->second);
        m_framebuffers.erase(it);
    }
}

// =============================================================================
// Buffers
// =============================================================================

Result<BufferHandle> OpenGLDevice::create_buffer(const BufferDesc& desc, const void* data) {
    if (desc.size == 0) {
        return Err<BufferHandle>(lumen_core::DeviceError::creation_failed("buffer", "zero size"));
    }

    GLenum target = buffer_target(desc.type);
    ScopedBinding restore(buffer_binding_query(desc.type), target, glBindBuffer_ptr);

    GLuint buffer = 0;
    glGenBuffers_ptr(1, &buffer);
    if (buffer == 0) {
        return Err<BufferHandle>(lumen_core::DeviceError::creation_failed("buffer", "glGenBuffers returned 0"));
    }

    while (glGetError() != GL_NO_ERROR) {}
    glBindBuffer_ptr(target, buffer);
    glBufferData_ptr(target, static_cast<GLsizeiptr>(desc.size), data, buffer_usage(desc.usage));

    GLenum error = glGetError();
    if (error != GL_NO_ERROR) {
        glDeleteBuffers_ptr(1, &buffer);
        return Err<BufferHandle>(lumen_core::DeviceError::creation_failed(
            "buffer", "glBufferData error 0x" + std::to_string(error)));
    }

    BufferHandle handle{next_handle()};
    m_buffers.emplace(handle.id, GlBuffer{buffer, desc.type, desc.size});
    return Ok(handle);
}

Result<void> OpenGLDevice::write_buffer(BufferHandle handle, std::size_t offset, const void* data, std::size_t size) {
    auto it = m_buffers.find(handle.id);
    if (it == m_buffers.end()) {
        return Err(lumen_core::DeviceError::invalid_handle("buffer"));
    }
    if (offset + size > it->second.size) {
        return Err(lumen_core::Error(lumen_core::ErrorCode::InvalidArgument, "Buffer write out of bounds"));
    }

    GLenum target = buffer_target(it->second.type);
    ScopedBinding restore(buffer_binding_query(it->second.type), target, glBindBuffer_ptr);
    glBindBuffer_ptr(target, it->second.name);
    glBufferSubData_ptr(target, static_cast<GLintptr>(offset), static_cast<GLsizeiptr>(size), data);
    return Ok();
}

void OpenGLDevice::destroy_buffer(BufferHandle handle) {
    auto it = m_buffers.find(handle.id);
    if (it != m_buffers.end()) {
        glDeleteBuffers_ptr(1, &it->second.name);
        m_buffers.erase(it);
    }
}

bool OpenGLDevice::is_buffer_valid(BufferHandle handle) const {
    auto it = m_buffers.find(handle.id);
    return it != m_buffers.end() && glIsBuffer_ptr && glIsBuffer_ptr(it->second.name) == GL_TRUE;
}

// =============================================================================
// Vertex arrays
// =============================================================================

Result<VertexArrayHandle> OpenGLDevice::create_vertex_array() {
    GLuint vao = 0;
    glGenVertexArrays_ptr(1, &vao);
    if (vao == 0) {
        return Err<VertexArrayHandle>(lumen_core::DeviceError::creation_failed(
            "vertex array", "glGenVertexArrays returned 0"));
    }

    VertexArrayHandle handle{next_handle()};
    m_vertex_arrays.emplace(handle.id, vao);
    return Ok(handle);
}

void OpenGLDevice::destroy_vertex_array(VertexArrayHandle handle) {
    auto it = m_vertex_arrays.find(handle.id);
    if (it != m_vertex_arrays.end()) {
        glDeleteVertexArrays_ptr(1, &it->second);
        m_vertex_arrays.erase(it);
    }
}

// =============================================================================
// Shaders and programs
// =============================================================================

Result<ShaderStageHandle> OpenGLDevice::compile_shader_stage(ShaderStage stage, const std::string& source) {
    GLenum type = stage == ShaderStage::Vertex ? GL_VERTEX_SHADER : GL_FRAGMENT_SHADER;
    GLuint shader = glCreateShader_ptr(type);
    if (shader == 0) {
        return Err<ShaderStageHandle>(lumen_core::ShaderError::compile_failed(
            shader_stage_name(stage), source, "glCreateShader returned 0"));
    }

    const GLchar* text = source.c_str();
    glShaderSource_ptr(shader, 1, &text, nullptr);
    glCompileShader_ptr(shader);

    GLint status = GL_FALSE;
    glGetShaderiv_ptr(shader, GL_COMPILE_STATUS, &status);
    if (status != GL_TRUE) {
        GLint length = 0;
        glGetShaderiv_ptr(shader, GL_INFO_LOG_LENGTH, &length);
        std::string log(static_cast<std::size_t>(length > 0 ? length : 1), '\0');
        glGetShaderInfoLog_ptr(shader, static_cast<GLsizei>(log.size()), nullptr, log.data());
        glDeleteShader_ptr(shader);
        log.resize(log.find('\0') == std::string::npos ? log.size() : log.find('\0'));
        return Err<ShaderStageHandle>(lumen_core::ShaderError::compile_failed(
            shader_stage_name(stage), source, log));
    }

    ShaderStageHandle handle{next_handle()};
    m_stages.emplace(handle.id, shader);
    return Ok(handle);
}

void OpenGLDevice::destroy_shader_stage(ShaderStageHandle handle) {
    auto it = m_stages.find(handle.id);
    if (it != m_stages.end()) {
        glDeleteShader_ptr(it->second);
        m_stages.erase(it);
    }
}

Result<ProgramHandle> OpenGLDevice::link_program(ShaderStageHandle vertex, ShaderStageHandle fragment) {
    auto vs = m_stages.find(vertex.id);
    auto fs = m_stages.find(fragment.id);
    if (vs == m_stages.end() || fs == m_stages.end()) {
        return Err<ProgramHandle>(lumen_core::ShaderError::link_failed("unknown shader stage handle"));
    }

    GLuint program = glCreateProgram_ptr();
    if (program == 0) {
        return Err<ProgramHandle>(lumen_core::ShaderError::link_failed("glCreateProgram returned 0"));
    }

    glAttachShader_ptr(program, vs->second);
    glAttachShader_ptr(program, fs->second);
    glLinkProgram_ptr(program);
    glDetachShader_ptr(program, vs->second);
    glDetachShader_ptr(program, fs->second);

    GLint status = GL_FALSE;
    glGetProgramiv_ptr(program, GL_LINK_STATUS, &status);
    if (status != GL_TRUE) {
        GLint length = 0;
        glGetProgramiv_ptr(program, GL_INFO_LOG_LENGTH, &length);
        std::string log(static_cast<std::size_t>(length > 0 ? length : 1), '\0');
        glGetProgramInfoLog_ptr(program, static_cast<GLsizei>(log.size()), nullptr, log.data());
        glDeleteProgram_ptr(program);
        log.resize(log.find('\0') == std::string::npos ? log.size() : log.find('\0'));
        return Err<ProgramHandle>(lumen_core::ShaderError::link_failed(log));
    }

    ProgramHandle handle{next_handle()};
    m_programs.emplace(handle.id, program);
    return Ok(handle);
}

void OpenGLDevice::destroy_program(ProgramHandle handle) {
    auto it = m_programs.find(handle.id);
    if (it != m_programs.end()) {
        glDeleteProgram_ptr(it->second);
        m_programs.erase(it);
    }
}

ProgramReflection OpenGLDevice::reflect_program(ProgramHandle handle) const {
    ProgramReflection reflection;

    auto it = m_programs.find(handle.id);
    if (it == m_programs.end()) {
        return reflection;
    }
    GLuint program = it->second;

    GLchar name[256];
    GLsizei length = 0;
    GLint size = 0;
    GLenum type = 0;

    GLint count = 0;
    glGetProgramiv_ptr(program, GL_ACTIVE_ATTRIBUTES, &count);
    for (GLint i = 0; i < count; ++i) {
        glGetActiveAttrib_ptr(program, static_cast<GLuint>(i), sizeof(name), &length, &size, &type, name);
        std::string attr(name, static_cast<std::size_t>(length));
        reflection.attributes[attr] = glGetAttribLocation_ptr(program, attr.c_str());
    }

    glGetProgramiv_ptr(program, GL_ACTIVE_UNIFORMS, &count);
    for (GLint i = 0; i < count; ++i) {
        glGetActiveUniform_ptr(program, static_cast<GLuint>(i), sizeof(name), &length, &size, &type, name);
        std::string uniform(name, static_cast<std::size_t>(length));
        GLint location = glGetUniformLocation_ptr(program, uniform.c_str());
        reflection.uniforms[strip_array_suffix(uniform)] = location;
    }

    return reflection;
}

// =============================================================================
// Binding and state
// =============================================================================

void OpenGLDevice::use_program(ProgramHandle handle) {
    auto it = m_programs.find(handle.id);
    glUseProgram_ptr(it != m_programs.end() ? it->second : 0);
}

void OpenGLDevice::bind_buffer(BufferType target, BufferHandle handle) {
    auto it = m_buffers.find(handle.id);
    glBindBuffer_ptr(buffer_target(target), it != m_buffers.end() ? it->second.name : 0);
}

void OpenGLDevice::bind_vertex_array(VertexArrayHandle handle) {
    auto it = m_vertex_arrays.find(handle.id);
    glBindVertexArray_ptr(it != m_vertex_arrays.end() ? it->second : 0);
}

void OpenGLDevice::active_texture(std::uint32_t unit) {
    glActiveTexture_ptr(GL_TEXTURE0 + unit);
}

void OpenGLDevice::bind_texture(TextureHandle handle) {
    auto it = m_textures.find(handle.id);
    glBindTexture(GL_TEXTURE_2D, it != m_textures.end() ? it->second.name : 0);
}

void OpenGLDevice::set_viewport(const Viewport& viewport) {
    glViewport(viewport.x, viewport.y, viewport.width, viewport.height);
}

void OpenGLDevice::set_capability(Capability cap, bool enabled) {
    if (enabled) {
        glEnable(capability(cap));
    } else {
        glDisable(capability(cap));
    }
}

void OpenGLDevice::set_uniform(std::int32_t location, const UniformValue& value) {
    if (location < 0) return;

    std::visit([this, location](const auto& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, float>) {
            glUniform1f_ptr(location, v);
        } else if constexpr (std::is_same_v<T, std::int32_t>) {
            glUniform1i_ptr(location, v);
        } else if constexpr (std::is_same_v<T, Vec2>) {
            glUniform2fv_ptr(location, 1, v.data());
        } else if constexpr (std::is_same_v<T, Vec3>) {
            glUniform3fv_ptr(location, 1, v.data());
        } else if constexpr (std::is_same_v<T, Vec4>) {
            glUniform4fv_ptr(location, 1, v.data());
        } else if constexpr (std::is_same_v<T, Mat3>) {
            glUniformMatrix3fv_ptr(location, 1, GL_FALSE, v.data());
        } else if constexpr (std::is_same_v<T, Mat4>) {
            glUniformMatrix4fv_ptr(location, 1, GL_FALSE, v.data());
        } else if constexpr (std::is_same_v<T, SamplerUnit>) {
            glUniform1i_ptr(location, v.unit);
        }
    }, value);
}

// =============================================================================
// Drawing
// =============================================================================

void OpenGLDevice::draw(const DrawCommand& command) {
    GLenum mode = primitive_mode(command.mode);

    if (command.indexed) {
        GLenum type = command.index_format == IndexFormat::Uint32 ? GL_UNSIGNED_INT : GL_UNSIGNED_SHORT;
        std::size_t stride = command.index_format == IndexFormat::Uint32 ? 4 : 2;
        const void* offset = reinterpret_cast<const void*>(static_cast<std::uintptr_t>(command.offset) * stride);
        if (command.instances > 1) {
            glDrawElementsInstanced_ptr(mode, command.count, type, offset,
                                        static_cast<GLsizei>(command.instances));
        } else {
            glDrawElements(mode, command.count, type, offset);
        }
        return;
    }

    if (command.instances > 1) {
        glDrawArraysInstanced_ptr(mode, command.offset, command.count, static_cast<GLsizei>(command.instances));
    } else {
        glDrawArrays(mode, command.offset, command.count);
    }
}

// =============================================================================
// Enum translation
// =============================================================================

GLenum OpenGLDevice::buffer_target(BufferType type) {
    switch (type) {
        case BufferType::Vertex: return GL_ARRAY_BUFFER;
        case BufferType::Index: return GL_ELEMENT_ARRAY_BUFFER;
        case BufferType::Uniform: return GL_UNIFORM_BUFFER;
    }
    return GL_ARRAY_BUFFER;
}

GLenum OpenGLDevice::buffer_binding_query(BufferType type) {
    switch (type) {
        case BufferType::Vertex: return GL_ARRAY_BUFFER_BINDING;
        case BufferType::Index: return GL_ELEMENT_ARRAY_BUFFER_BINDING;
        case BufferType::Uniform: return GL_UNIFORM_BUFFER_BINDING;
    }
    return GL_ARRAY_BUFFER_BINDING;
}

GLenum OpenGLDevice::buffer_usage(BufferUsage usage) {
    switch (usage) {
        case BufferUsage::Static: return GL_STATIC_DRAW;
        case BufferUsage::Dynamic: return GL_DYNAMIC_DRAW;
        case BufferUsage::Stream: return GL_STREAM_DRAW;
    }
    return GL_STATIC_DRAW;
}

GLenum OpenGLDevice::primitive_mode(PrimitiveMode mode) {
    switch (mode) {
        case PrimitiveMode::Points: return GL_POINTS;
        case PrimitiveMode::Lines: return GL_LINES;
        case PrimitiveMode::LineStrip: return GL_LINE_STRIP;
        case PrimitiveMode::LineLoop: return GL_LINE_LOOP;
        case PrimitiveMode::Triangles: return GL_TRIANGLES;
        case PrimitiveMode::TriangleStrip: return GL_TRIANGLE_STRIP;
        case PrimitiveMode::TriangleFan: return GL_TRIANGLE_FAN;
    }
    return GL_TRIANGLES;
}

GLenum OpenGLDevice::capability(Capability cap) {
    switch (cap) {
        case Capability::Blend: return GL_BLEND;
        case Capability::DepthTest: return GL_DEPTH_TEST;
        case Capability::CullFace: return GL_CULL_FACE;
        case Capability::ScissorTest: return GL_SCISSOR_TEST;
    }
    return GL_BLEND;
}

GLint OpenGLDevice::texture_filter(TextureFilter filter, bool mipmapped) {
    if (mipmapped) {
        return filter == TextureFilter::Nearest ? GL_NEAREST_MIPMAP_NEAREST : GL_LINEAR_MIPMAP_LINEAR;
    }
    return filter == TextureFilter::Nearest ? GL_NEAREST : GL_LINEAR;
}

GLint OpenGLDevice::texture_wrap(TextureWrap wrap) {
    switch (wrap) {
        case TextureWrap::ClampToEdge: return GL_CLAMP_TO_EDGE;
        case TextureWrap::Repeat: return GL_REPEAT;
        case TextureWrap::MirroredRepeat: return GL_MIRRORED_REPEAT;
    }
    return GL_CLAMP_TO_EDGE;
}

GLint OpenGLDevice::texture_internal_format(TextureFormat format) {
    switch (format) {
        case TextureFormat::R8: return GL_R8;
        case TextureFormat::Rg8: return GL_RG8;
        case TextureFormat::Rgb8: return GL_RGB8;
        case TextureFormat::Rgba8: return GL_RGBA8;
        case TextureFormat::Rgba4: return GL_RGBA4;
        case TextureFormat::Rgb565: return GL_RGB565;
        case TextureFormat::Rgba16F: return GL_RGBA16F;
        case TextureFormat::Rgba32F: return GL_RGBA32F;
        case TextureFormat::Depth16: return GL_DEPTH_COMPONENT16;
        case TextureFormat::Depth24: return GL_DEPTH_COMPONENT24;
        case TextureFormat::Depth24Stencil8: return GL_DEPTH24_STENCIL8;
        case TextureFormat::Depth32F: return GL_DEPTH_COMPONENT32F;
    }
    return GL_RGBA8;
}

GLenum OpenGLDevice::texture_pixel_format(TextureFormat format) {
    switch (format) {
        case TextureFormat::R8: return GL_RED;
        case TextureFormat::Rg8: return GL_RG;
        case TextureFormat::Rgb8:
        case TextureFormat::Rgb565: return GL_RGB;
        case TextureFormat::Rgba8:
        case TextureFormat::Rgba4:
        case TextureFormat::Rgba16F:
        case TextureFormat::Rgba32F: return GL_RGBA;
        case TextureFormat::Depth16:
        case TextureFormat::Depth24:
        case TextureFormat::Depth32F: return GL_DEPTH_COMPONENT;
        case TextureFormat::Depth24Stencil8: return GL_DEPTH_STENCIL;
    }
    return GL_RGBA;
}

GLenum OpenGLDevice::texture_pixel_type(TextureFormat format) {
    switch (format) {
        case TextureFormat::Rgba4: return GL_UNSIGNED_SHORT_4_4_4_4;
        case TextureFormat::Rgb565: return GL_UNSIGNED_SHORT_5_6_5;
        case TextureFormat::Rgba16F: return GL_HALF_FLOAT;
        case TextureFormat::Rgba32F:
        case TextureFormat::Depth32F: return GL_FLOAT;
        case TextureFormat::Depth16: return GL_UNSIGNED_SHORT;
        case TextureFormat::Depth24: return GL_UNSIGNED_INT;
        case TextureFormat::Depth24Stencil8: return GL_UNSIGNED_INT_24_8;
        default: return GL_UNSIGNED_BYTE;
    }
}

} // namespace backends
} // namespace lumen_gpu
