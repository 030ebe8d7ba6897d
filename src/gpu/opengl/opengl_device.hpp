/// @file opengl_device.hpp
/// @brief OpenGL 3.3 core graphics device
///
/// - GL entry points above 1.1 loaded through glXGetProcAddress
/// - Assumes the caller created a context and made it current
/// - Creation paths save and restore the bindings they touch
#pragma once

#include <lumen/gpu/device.hpp>

#include <unordered_map>

#include <GL/gl.h>
#include <GL/glext.h>
#include <GL/glx.h>

namespace lumen_gpu {
namespace backends {

class OpenGLDevice : public IGraphicsDevice {
public:
    OpenGLDevice() = default;
    ~OpenGLDevice() override;

    OpenGLDevice(const OpenGLDevice&) = delete;
    OpenGLDevice& operator=(const OpenGLDevice&) = delete;

    /// Load entry points and query limits
    [[nodiscard]] lumen_core::Result<void> init();

    // IGraphicsDevice interface
    [[nodiscard]] const char* name() const override { return "opengl"; }
    [[nodiscard]] const DeviceLimits& limits() const override { return m_limits; }

    lumen_core::Result<TextureHandle> create_texture(const TextureDesc& desc, const void* data) override;
    lumen_core::Result<void> update_texture(TextureHandle handle, const TextureRegion& region,
                                            const void* data) override;
    void destroy_texture(TextureHandle handle) override;

    lumen_core::Result<FramebufferHandle> create_framebuffer(const FramebufferDesc& desc) override;
    void destroy_framebuffer(FramebufferHandle handle) override;

    lumen_core::Result<BufferHandle> create_buffer(const BufferDesc& desc, const void* data) override;
    lumen_core::Result<void> write_buffer(BufferHandle handle, std::size_t offset,
                                          const void* data, std::size_t size) override;
    void destroy_buffer(BufferHandle handle) override;
    [[nodiscard]] bool is_buffer_valid(BufferHandle handle) const override;

    lumen_core::Result<VertexArrayHandle> create_vertex_array() override;
    void destroy_vertex_array(VertexArrayHandle handle) override;

    lumen_core::Result<ShaderStageHandle> compile_shader_stage(ShaderStage stage,
                                                               const std::string& source) override;
    void destroy_shader_stage(ShaderStageHandle handle) override;
    lumen_core::Result<ProgramHandle> link_program(ShaderStageHandle vertex,
                                                   ShaderStageHandle fragment) override;
    void destroy_program(ProgramHandle handle) override;
    [[nodiscard]] ProgramReflection reflect_program(ProgramHandle handle) const override;

    void use_program(ProgramHandle handle) override;
    void bind_buffer(BufferType target, BufferHandle handle) override;
    void bind_vertex_array(VertexArrayHandle handle) override;
    void active_texture(std::uint32_t unit) override;
    void bind_texture(TextureHandle handle) override;
    void set_viewport(const Viewport& viewport) override;
    void set_capability(Capability cap, bool enabled) override;
    void set_uniform(std::int32_t location, const UniformValue& value) override;

    void draw(const DrawCommand& command) override;

private:
    struct GlBuffer {
        GLuint name = 0;
        BufferType type = BufferType::Vertex;
        std::size_t size = 0;
    };

    struct GlTexture {
        GLuint name = 0;
        TextureDesc desc;
    };

    bool load_gl_functions();
    void query_limits();
    void release_all();

    [[nodiscard]] std::uint64_t next_handle() noexcept { return m_next_handle++; }

    static GLenum buffer_target(BufferType type);
    static GLenum buffer_binding_query(BufferType type);
    static GLenum buffer_usage(BufferUsage usage);
    static GLenum primitive_mode(PrimitiveMode mode);
    static GLenum capability(Capability cap);
    static GLint texture_filter(TextureFilter filter, bool mipmapped);
    static GLint texture_wrap(TextureWrap wrap);
    static GLint texture_internal_format(TextureFormat format);
    static GLenum texture_pixel_format(TextureFormat format);
    static GLenum texture_pixel_type(TextureFormat format);

    bool m_initialized = false;
    DeviceLimits m_limits;
    std::uint64_t m_next_handle = 1;

    std::unordered_map<std::uint64_t, GlTexture> m_textures;
    std::unordered_map<std::uint64_t, GLuint> m_framebuffers;
    std::unordered_map<std::uint64_t, GlBuffer> m_buffers;
    std::unordered_map<std::uint64_t, GLuint> m_vertex_arrays;
    std::unordered_map<std::uint64_t, GLuint> m_stages;
    std::unordered_map<std::uint64_t, GLuint> m_programs;

    // GL function pointers
    PFNGLGENBUFFERSPROC glGenBuffers_ptr = nullptr;
    PFNGLBINDBUFFERPROC glBindBuffer_ptr = nullptr;
    PFNGLBUFFERDATAPROC glBufferData_ptr = nullptr;
    PFNGLBUFFERSUBDATAPROC glBufferSubData_ptr = nullptr;
    PFNGLDELETEBUFFERSPROC glDeleteBuffers_ptr = nullptr;
    PFNGLISBUFFERPROC glIsBuffer_ptr = nullptr;
    PFNGLGENVERTEXARRAYSPROC glGenVertexArrays_ptr = nullptr;
    PFNGLBINDVERTEXARRAYPROC glBindVertexArray_ptr = nullptr;
    PFNGLDELETEVERTEXARRAYSPROC glDeleteVertexArrays_ptr = nullptr;
    PFNGLGENFRAMEBUFFERSPROC glGenFramebuffers_ptr = nullptr;
    PFNGLBINDFRAMEBUFFERPROC glBindFramebuffer_ptr = nullptr;
    PFNGLFRAMEBUFFERTEXTURE2DPROC glFramebufferTexture2D_ptr = nullptr;
    PFNGLCHECKFRAMEBUFFERSTATUSPROC glCheckFramebufferStatus_ptr = nullptr;
    PFNGLDELETEFRAMEBUFFERSPROC glDeleteFramebuffers_ptr = nullptr;
    PFNGLDRAWBUFFERSPROC glDrawBuffers_ptr = nullptr;
    PFNGLCREATESHADERPROC glCreateShader_ptr = nullptr;
    PFNGLSHADERSOURCEPROC glShaderSource_ptr = nullptr;
    PFNGLCOMPILESHADERPROC glCompileShader_ptr = nullptr;
    PFNGLGETSHADERIVPROC glGetShaderiv_ptr = nullptr;
    PFNGLGETSHADERINFOLOGPROC glGetShaderInfoLog_ptr = nullptr;
    PFNGLDELETESHADERPROC glDeleteShader_ptr = nullptr;
    PFNGLCREATEPROGRAMPROC glCreateProgram_ptr = nullptr;
    PFNGLATTACHSHADERPROC glAttachShader_ptr = nullptr;
    PFNGLDETACHSHADERPROC glDetachShader_ptr = nullptr;
    PFNGLLINKPROGRAMPROC glLinkProgram_ptr = nullptr;
    PFNGLGETPROGRAMIVPROC glGetProgramiv_ptr = nullptr;
    PFNGLGETPROGRAMINFOLOGPROC glGetProgramInfoLog_ptr = nullptr;
    PFNGLDELETEPROGRAMPROC glDeleteProgram_ptr = nullptr;
    PFNGLUSEPROGRAMPROC glUseProgram_ptr = nullptr;
    PFNGLGETACTIVEATTRIBPROC glGetActiveAttrib_ptr = nullptr;
    PFNGLGETATTRIBLOCATIONPROC glGetAttribLocation_ptr = nullptr;
    PFNGLGETACTIVEUNIFORMPROC glGetActiveUniform_ptr = nullptr;
    PFNGLGETUNIFORMLOCATIONPROC glGetUniformLocation_ptr = nullptr;
    PFNGLUNIFORM1FPROC glUniform1f_ptr = nullptr;
    PFNGLUNIFORM1IPROC glUniform1i_ptr = nullptr;
    PFNGLUNIFORM2FVPROC glUniform2fv_ptr = nullptr;
    PFNGLUNIFORM3FVPROC glUniform3fv_ptr = nullptr;
    PFNGLUNIFORM4FVPROC glUniform4fv_ptr = nullptr;
    PFNGLUNIFORMMATRIX3FVPROC glUniformMatrix3fv_ptr = nullptr;
    PFNGLUNIFORMMATRIX4FVPROC glUniformMatrix4fv_ptr = nullptr;
    PFNGLACTIVETEXTUREPROC glActiveTexture_ptr = nullptr;
    PFNGLGENERATEMIPMAPPROC glGenerateMipmap_ptr = nullptr;
    PFNGLDRAWARRAYSINSTANCEDPROC glDrawArraysInstanced_ptr = nullptr;
    PFNGLDRAWELEMENTSINSTANCEDPROC glDrawElementsInstanced_ptr = nullptr;
};

} // namespace backends
} // namespace lumen_gpu
