/**
 * @file opengl_render_device.cpp
 * @brief OpenGL 后端实现
 *
 * 使用 OpenGL 3.3 core 路径（GLSL 源码 + VAO）；Swapchain 即默认帧缓冲。
 * 通过 SDL_GL_GetProcAddress 加载 GL 函数（gl.h 仅提供 1.1）。
 */

#include <blaze_device/opengl_render_device.hpp>

#include <SDL3/SDL.h>
#include <SDL3/SDL_video.h>

#include <GL/gl.h>
#ifndef GL_COPY_WRITE_BUFFER
#define GL_COPY_WRITE_BUFFER 0x8F37
#endif

#include <cstdint>
#include <string>

// 加载 OpenGL 3.x 函数（gl.h 仅 1.1）
namespace {
#define GL_PFN(ret, name, args) typedef ret (GLAPIENTRY *PFN_##name) args; static PFN_##name pfn_##name;
GL_PFN(void, GenVertexArrays, (GLsizei n, GLuint* arrays))
GL_PFN(void, BindVertexArray, (GLuint array))
GL_PFN(void, DeleteVertexArrays, (GLsizei n, const GLuint* arrays))
GL_PFN(void, GenBuffers, (GLsizei n, GLuint* buffers))
GL_PFN(void, BindBuffer, (GLenum target, GLuint buffer))
GL_PFN(void, BufferData, (GLenum target, GLsizeiptr size, const void* data, GLenum usage))
GL_PFN(void, DeleteBuffers, (GLsizei n, const GLuint* buffers))
GL_PFN(void, EnableVertexAttribArray, (GLuint index))
GL_PFN(void, VertexAttribPointer, (GLuint index, GLint size, GLenum type, GLboolean normalized, GLsizei stride, const void* pointer))
GL_PFN(GLuint, CreateProgram, (void))
GL_PFN(GLuint, CreateShader, (GLenum type))
GL_PFN(void, ShaderSource, (GLuint shader, GLsizei count, const GLchar* const* string, const GLint* length))
GL_PFN(void, CompileShader, (GLuint shader))
GL_PFN(void, GetShaderiv, (GLuint shader, GLenum pname, GLint* params))
GL_PFN(void, GetShaderInfoLog, (GLuint shader, GLsizei maxLength, GLsizei* length, GLchar* infoLog))
GL_PFN(void, DeleteShader, (GLuint shader))
GL_PFN(void, AttachShader, (GLuint program, GLuint shader))
GL_PFN(void, LinkProgram, (GLuint program))
GL_PFN(void, GetProgramiv, (GLuint program, GLenum pname, GLint* params))
GL_PFN(void, GetProgramInfoLog, (GLuint program, GLsizei maxLength, GLsizei* length, GLchar* infoLog))
GL_PFN(void, DeleteProgram, (GLuint program))
GL_PFN(void, UseProgram, (GLuint program))
GL_PFN(GLint, GetUniformLocation, (GLuint program, const GLchar* name))
GL_PFN(void, UniformMatrix4fv, (GLint location, GLsizei count, GLboolean transpose, const GLfloat* value))
GL_PFN(void, Uniform4fv, (GLint location, GLsizei count, const GLfloat* value))

bool LoadGLFunctions() {
#define LOAD(name) do { pfn_##name = (PFN_##name)SDL_GL_GetProcAddress("gl" #name); if (!pfn_##name) return false; } while(0)
    LOAD(GenVertexArrays);
    LOAD(BindVertexArray);
    LOAD(DeleteVertexArrays);
    LOAD(GenBuffers);
    LOAD(BindBuffer);
    LOAD(BufferData);
    LOAD(DeleteBuffers);
    LOAD(EnableVertexAttribArray);
    LOAD(VertexAttribPointer);
    LOAD(CreateProgram);
    LOAD(CreateShader);
    LOAD(ShaderSource);
    LOAD(CompileShader);
    LOAD(GetShaderiv);
    LOAD(GetShaderInfoLog);
    LOAD(DeleteShader);
    LOAD(AttachShader);
    LOAD(LinkProgram);
    LOAD(GetProgramiv);
    LOAD(GetProgramInfoLog);
    LOAD(DeleteProgram);
    LOAD(UseProgram);
    LOAD(GetUniformLocation);
    LOAD(UniformMatrix4fv);
    LOAD(Uniform4fv);
#undef LOAD
    return true;
}
#undef GL_PFN
}  // namespace

namespace blaze_device {

// =============================================================================
// 常量与辅助
// =============================================================================

static GLenum ToGLTarget(BufferUsage usage) {
    return usage == BufferUsage::Index ? GL_ELEMENT_ARRAY_BUFFER : GL_ARRAY_BUFFER;
}

static GLenum ToGLTopology(PrimitiveTopology topology) {
    switch (topology) {
        case PrimitiveTopology::TriangleList:  return GL_TRIANGLES;
        case PrimitiveTopology::TriangleStrip: return GL_TRIANGLE_STRIP;
        case PrimitiveTopology::LineList:      return GL_LINES;
        case PrimitiveTopology::PointList:     return GL_POINTS;
    }
    return GL_TRIANGLES;
}

static GLenum ToGLIndexType(IndexType type) {
    switch (type) {
        case IndexType::UInt8:  return GL_UNSIGNED_BYTE;
        case IndexType::UInt16: return GL_UNSIGNED_SHORT;
        case IndexType::UInt32: return GL_UNSIGNED_INT;
    }
    return GL_UNSIGNED_INT;
}

// =============================================================================
// OpenGLRenderDevice
// =============================================================================

OpenGLRenderDevice::~OpenGLRenderDevice() {
    Shutdown();
}

bool OpenGLRenderDevice::MakeCurrent() {
    if (!window_ || !glContext_) return false;
    return SDL_GL_MakeCurrent(static_cast<SDL_Window*>(window_), static_cast<SDL_GLContext>(glContext_));
}

void OpenGLRenderDevice::EnsureContext() {
    MakeCurrent();
}

void OpenGLRenderDevice::ApplyVertexArray(unsigned int vertexArray) {
    if (glStateCache_.boundVertexArray == vertexArray) return;
    glStateCache_.boundVertexArray = vertexArray;
    // 元素缓冲绑定属于 VAO 状态，切换后缓存失效
    glStateCache_.boundElementArrayBuffer = GLStateCache::kUnknown;
    pfn_BindVertexArray(static_cast<GLuint>(vertexArray));
}

void OpenGLRenderDevice::ApplyBuffer(unsigned int target, unsigned int buffer) {
    if (target == GL_ARRAY_BUFFER) {
        if (glStateCache_.boundArrayBuffer == buffer) return;
        glStateCache_.boundArrayBuffer = buffer;
    } else if (target == GL_ELEMENT_ARRAY_BUFFER) {
        if (glStateCache_.boundElementArrayBuffer == buffer) return;
        glStateCache_.boundElementArrayBuffer = buffer;
    }
    pfn_BindBuffer(static_cast<GLenum>(target), static_cast<GLuint>(buffer));
}

void OpenGLRenderDevice::ApplyProgram(unsigned int program) {
    if (glStateCache_.boundProgram == program) return;
    glStateCache_.boundProgram = program;
    pfn_UseProgram(static_cast<GLuint>(program));
}

bool OpenGLRenderDevice::Initialize(const DeviceConfig& config) {
    if (!config.windowHandle || config.width == 0 || config.height == 0) {
        lastError_ = "OpenGL: invalid config (window or size)";
        return false;
    }
    window_ = config.windowHandle;
    width_ = config.width;
    height_ = config.height;

    SDL_GL_SetAttribute(SDL_GL_DOUBLEBUFFER, 1);
    SDL_GL_SetAttribute(SDL_GL_DEPTH_SIZE, 24);
    SDL_GL_SetAttribute(SDL_GL_CONTEXT_MAJOR_VERSION, config.glMajorVersion);
    SDL_GL_SetAttribute(SDL_GL_CONTEXT_MINOR_VERSION, config.glMinorVersion);
    SDL_GL_SetAttribute(SDL_GL_CONTEXT_PROFILE_MASK, SDL_GL_CONTEXT_PROFILE_CORE);

    SDL_GLContext ctx = SDL_GL_CreateContext(static_cast<SDL_Window*>(window_));
    if (!ctx) {
        lastError_ = std::string("SDL_GL_CreateContext: ") + SDL_GetError();
        window_ = nullptr;
        return false;
    }
    glContext_ = ctx;
    if (!MakeCurrent()) {
        lastError_ = std::string("SDL_GL_MakeCurrent: ") + SDL_GetError();
        SDL_GL_DestroyContext(static_cast<SDL_GLContext>(glContext_));
        glContext_ = nullptr;
        window_ = nullptr;
        return false;
    }
    if (!LoadGLFunctions()) {
        lastError_ = "OpenGL: failed to load GL functions (need 3.3+)";
        SDL_GL_DestroyContext(static_cast<SDL_GLContext>(glContext_));
        glContext_ = nullptr;
        window_ = nullptr;
        return false;
    }
    SDL_GL_SetSwapInterval(config.vsync ? 1 : 0);

    glViewport(0, 0, static_cast<GLsizei>(width_), static_cast<GLsizei>(height_));
    glEnable(GL_DEPTH_TEST);
    glStateCache_ = GLStateCache{};
    lastError_.clear();
    return true;
}

void OpenGLRenderDevice::Shutdown() {
    if (!glContext_) return;
    EnsureContext();
    for (auto& [id, glArray] : vertexArrays_) {
        if (glArray) pfn_DeleteVertexArrays(1, &glArray);
    }
    vertexArrays_.clear();
    for (auto& [id, glBuffer] : buffers_) {
        if (glBuffer) pfn_DeleteBuffers(1, &glBuffer);
    }
    buffers_.clear();
    for (auto& [id, glShader] : shaders_) {
        if (glShader) pfn_DeleteShader(glShader);
    }
    shaders_.clear();
    for (auto& [id, glProgram] : pipelines_) {
        if (glProgram) pfn_DeleteProgram(glProgram);
    }
    pipelines_.clear();

    SDL_GL_DestroyContext(static_cast<SDL_GLContext>(glContext_));
    glContext_ = nullptr;
    window_ = nullptr;
    glStateCache_ = GLStateCache{};
    lastError_.clear();
}

const std::string& OpenGLRenderDevice::GetLastError() const {
    return lastError_;
}

VertexArrayHandle OpenGLRenderDevice::CreateVertexArray() {
    if (!glContext_) {
        lastError_ = "CreateVertexArray: device not initialized";
        return VertexArrayHandle{};
    }
    EnsureContext();
    GLuint glArray = 0;
    pfn_GenVertexArrays(1, &glArray);
    if (!glArray) {
        lastError_ = "glGenVertexArrays failed";
        return VertexArrayHandle{};
    }
    std::uint64_t id = NextId();
    vertexArrays_[id] = glArray;
    VertexArrayHandle h;
    h.id = id;
    return h;
}

BufferHandle OpenGLRenderDevice::CreateBuffer(const BufferDesc& desc, const void* data) {
    if (desc.size == 0) {
        lastError_ = "CreateBuffer: size is 0";
        return BufferHandle{};
    }
    if (!glContext_) {
        lastError_ = "CreateBuffer: device not initialized";
        return BufferHandle{};
    }
    EnsureContext();
    GLuint glBuf = 0;
    pfn_GenBuffers(1, &glBuf);
    if (!glBuf) {
        lastError_ = "glGenBuffers failed";
        return BufferHandle{};
    }
    // 经 COPY_WRITE 目标上传，不改动 ARRAY/ELEMENT_ARRAY 与当前 VAO 的绑定
    pfn_BindBuffer(GL_COPY_WRITE_BUFFER, glBuf);
    pfn_BufferData(GL_COPY_WRITE_BUFFER, static_cast<GLsizeiptr>(desc.size), data, GL_STATIC_DRAW);
    pfn_BindBuffer(GL_COPY_WRITE_BUFFER, 0);

    std::uint64_t id = NextId();
    buffers_[id] = glBuf;
    BufferHandle h;
    h.id = id;
    return h;
}

ShaderHandle OpenGLRenderDevice::CreateShader(const ShaderDesc& desc) {
    if (desc.code.empty()) {
        lastError_ = "CreateShader: empty source";
        return ShaderHandle{};
    }
    if (!glContext_) {
        lastError_ = "CreateShader: device not initialized";
        return ShaderHandle{};
    }
    EnsureContext();
    GLenum glStage = desc.stage == ShaderStage::Fragment ? GL_FRAGMENT_SHADER : GL_VERTEX_SHADER;

    std::string src(desc.code.begin(), desc.code.end());
    const char* srcPtr = src.c_str();
    GLint len = static_cast<GLint>(src.size());

    GLuint sh = pfn_CreateShader(glStage);
    if (!sh) {
        lastError_ = "glCreateShader failed";
        return ShaderHandle{};
    }
    pfn_ShaderSource(sh, 1, &srcPtr, &len);
    pfn_CompileShader(sh);
    GLint ok = 0;
    pfn_GetShaderiv(sh, GL_COMPILE_STATUS, &ok);
    if (!ok) {
        char log[1024] = {};
        pfn_GetShaderInfoLog(sh, sizeof(log), nullptr, log);
        lastError_ = std::string("glCompileShader: ") + log;
        pfn_DeleteShader(sh);
        return ShaderHandle{};
    }

    std::uint64_t id = NextId();
    shaders_[id] = sh;
    ShaderHandle h;
    h.id = id;
    return h;
}

PipelineHandle OpenGLRenderDevice::CreatePipeline(const PipelineDesc& desc) {
    if (desc.shaders.empty()) {
        lastError_ = "CreatePipeline: no shaders";
        return PipelineHandle{};
    }
    if (!glContext_) {
        lastError_ = "CreatePipeline: device not initialized";
        return PipelineHandle{};
    }
    EnsureContext();
    GLuint prog = pfn_CreateProgram();
    if (!prog) {
        lastError_ = "glCreateProgram failed";
        return PipelineHandle{};
    }
    for (const auto& shH : desc.shaders) {
        if (!shH.IsValid()) continue;
        auto it = shaders_.find(shH.id);
        if (it != shaders_.end())
            pfn_AttachShader(prog, it->second);
    }
    pfn_LinkProgram(prog);
    GLint ok = 0;
    pfn_GetProgramiv(prog, GL_LINK_STATUS, &ok);
    if (!ok) {
        char log[1024] = {};
        pfn_GetProgramInfoLog(prog, sizeof(log), nullptr, log);
        lastError_ = std::string("glLinkProgram: ") + log;
        pfn_DeleteProgram(prog);
        return PipelineHandle{};
    }

    std::uint64_t id = NextId();
    pipelines_[id] = prog;
    PipelineHandle h;
    h.id = id;
    return h;
}

void OpenGLRenderDevice::DestroyVertexArray(VertexArrayHandle handle) {
    if (!handle.IsValid()) return;
    auto it = vertexArrays_.find(handle.id);
    if (it == vertexArrays_.end()) return;
    EnsureContext();
    if (it->second) {
        if (glStateCache_.boundVertexArray == it->second) {
            glStateCache_.boundVertexArray = 0;
            glStateCache_.boundElementArrayBuffer = GLStateCache::kUnknown;
        }
        pfn_DeleteVertexArrays(1, &it->second);
    }
    vertexArrays_.erase(it);
}

void OpenGLRenderDevice::DestroyBuffer(BufferHandle handle) {
    if (!handle.IsValid()) return;
    auto it = buffers_.find(handle.id);
    if (it == buffers_.end()) return;
    EnsureContext();
    if (it->second) {
        if (glStateCache_.boundArrayBuffer == it->second) glStateCache_.boundArrayBuffer = 0;
        if (glStateCache_.boundElementArrayBuffer == it->second)
            glStateCache_.boundElementArrayBuffer = GLStateCache::kUnknown;
        pfn_DeleteBuffers(1, &it->second);
    }
    buffers_.erase(it);
}

void OpenGLRenderDevice::DestroyShader(ShaderHandle handle) {
    if (!handle.IsValid()) return;
    auto it = shaders_.find(handle.id);
    if (it == shaders_.end()) return;
    EnsureContext();
    if (it->second) pfn_DeleteShader(it->second);
    shaders_.erase(it);
}

void OpenGLRenderDevice::DestroyPipeline(PipelineHandle handle) {
    if (!handle.IsValid()) return;
    auto it = pipelines_.find(handle.id);
    if (it == pipelines_.end()) return;
    EnsureContext();
    if (it->second) {
        if (glStateCache_.boundProgram == it->second) glStateCache_.boundProgram = 0;
        pfn_DeleteProgram(it->second);
    }
    pipelines_.erase(it);
}

void OpenGLRenderDevice::BindVertexArray(VertexArrayHandle handle) {
    if (!glContext_) return;
    unsigned int glArray = 0;
    if (handle.IsValid()) {
        auto it = vertexArrays_.find(handle.id);
        if (it == vertexArrays_.end()) return;
        glArray = it->second;
    }
    ApplyVertexArray(glArray);
}

void OpenGLRenderDevice::BindBuffer(BufferUsage target, BufferHandle handle) {
    if (!glContext_) return;
    unsigned int glBuf = 0;
    if (handle.IsValid()) {
        auto it = buffers_.find(handle.id);
        if (it == buffers_.end()) return;
        glBuf = it->second;
    }
    ApplyBuffer(ToGLTarget(target), glBuf);
}

void OpenGLRenderDevice::SetVertexAttribute(const VertexAttributeDesc& attribute) {
    if (!glContext_) return;
    const std::uint32_t components = FormatComponentCount(attribute.format);
    if (components == 0) return;
    pfn_EnableVertexAttribArray(static_cast<GLuint>(attribute.location));
    pfn_VertexAttribPointer(static_cast<GLuint>(attribute.location), static_cast<GLint>(components),
                            GL_FLOAT, GL_FALSE, static_cast<GLsizei>(attribute.stride),
                            reinterpret_cast<const void*>(static_cast<std::uintptr_t>(attribute.offset)));
}

void OpenGLRenderDevice::BindPipeline(PipelineHandle pipeline) {
    if (!glContext_) return;
    unsigned int prog = 0;
    if (pipeline.IsValid()) {
        auto it = pipelines_.find(pipeline.id);
        if (it == pipelines_.end()) return;
        prog = it->second;
    }
    ApplyProgram(prog);
}

int OpenGLRenderDevice::GetUniformLocation(const std::string& name) {
    if (!glContext_ || glStateCache_.boundProgram == 0) return -1;
    return pfn_GetUniformLocation(static_cast<GLuint>(glStateCache_.boundProgram), name.c_str());
}

void OpenGLRenderDevice::SetUniformMat4(const std::string& name, const float* value) {
    if (!value) return;
    GLint loc = GetUniformLocation(name);
    if (loc < 0) return;
    pfn_UniformMatrix4fv(loc, 1, GL_FALSE, value);
}

void OpenGLRenderDevice::SetUniformVec4(const std::string& name, const float* value) {
    if (!value) return;
    GLint loc = GetUniformLocation(name);
    if (loc < 0) return;
    pfn_Uniform4fv(loc, 1, value);
}

void OpenGLRenderDevice::DrawIndexed(VertexArrayHandle vertexArray, PrimitiveTopology topology,
                                     IndexType indexType, std::uint32_t indexCount) {
    if (!glContext_ || !vertexArray.IsValid() || indexCount == 0) return;
    auto it = vertexArrays_.find(vertexArray.id);
    if (it == vertexArrays_.end()) return;
    ApplyVertexArray(it->second);
    glDrawElements(ToGLTopology(topology), static_cast<GLsizei>(indexCount),
                   ToGLIndexType(indexType), nullptr);
}

void OpenGLRenderDevice::Clear(const float color[4]) {
    if (!glContext_ || !color) return;
    glClearColor(color[0], color[1], color[2], color[3]);
    glClear(GL_COLOR_BUFFER_BIT | GL_DEPTH_BUFFER_BIT);
}

void OpenGLRenderDevice::Present() {
    if (window_)
        SDL_GL_SwapWindow(static_cast<SDL_Window*>(window_));
}

}  // namespace blaze_device
