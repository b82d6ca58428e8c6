/**
 * @file opengl_render_device.hpp
 * @brief OpenGL 3.3 core 后端 IRenderDevice 实现
 *
 * 使用 SDL_GL_CreateContext 创建 GL 上下文；句柄 id 映射到 GL 对象名，
 * 销毁时从映射中移除，因此重复销毁同一句柄只会生效一次。
 */

#pragma once

#include <blaze_device/rdi_types.hpp>
#include <blaze_device/render_device.hpp>

#include <cstdint>
#include <string>
#include <unordered_map>

namespace blaze_device {

/** OpenGL 后端渲染设备 */
class OpenGLRenderDevice : public IRenderDevice {
public:
    OpenGLRenderDevice() = default;
    ~OpenGLRenderDevice() override;

    OpenGLRenderDevice(const OpenGLRenderDevice&) = delete;
    OpenGLRenderDevice& operator=(const OpenGLRenderDevice&) = delete;

    bool Initialize(const DeviceConfig& config) override;
    void Shutdown() override;
    const std::string& GetLastError() const override;

    VertexArrayHandle CreateVertexArray() override;
    BufferHandle CreateBuffer(const BufferDesc& desc, const void* data = nullptr) override;
    ShaderHandle CreateShader(const ShaderDesc& desc) override;
    PipelineHandle CreatePipeline(const PipelineDesc& desc) override;

    void DestroyVertexArray(VertexArrayHandle handle) override;
    void DestroyBuffer(BufferHandle handle) override;
    void DestroyShader(ShaderHandle handle) override;
    void DestroyPipeline(PipelineHandle handle) override;

    void BindVertexArray(VertexArrayHandle handle) override;
    void BindBuffer(BufferUsage target, BufferHandle handle) override;
    void SetVertexAttribute(const VertexAttributeDesc& attribute) override;

    void BindPipeline(PipelineHandle pipeline) override;
    void SetUniformMat4(const std::string& name, const float* value) override;
    void SetUniformVec4(const std::string& name, const float* value) override;
    void DrawIndexed(VertexArrayHandle vertexArray, PrimitiveTopology topology,
                     IndexType indexType, std::uint32_t indexCount) override;
    void Clear(const float color[4]) override;
    void Present() override;

    std::size_t GetLiveVertexArrayCount() const override { return vertexArrays_.size(); }
    std::size_t GetLiveBufferCount() const override { return buffers_.size(); }

private:
    /** 已绑定 GL 对象缓存，跳过冗余绑定；kUnknown 表示需重新下发 */
    struct GLStateCache {
        static constexpr unsigned int kUnknown = 0xFFFFFFFFu;
        unsigned int boundVertexArray = 0;
        unsigned int boundArrayBuffer = 0;
        unsigned int boundElementArrayBuffer = 0;
        unsigned int boundProgram = 0;
    };

    std::uint64_t NextId() { return nextId_++; }
    bool MakeCurrent();
    void EnsureContext();

    void ApplyVertexArray(unsigned int vertexArray);
    void ApplyBuffer(unsigned int target, unsigned int buffer);
    void ApplyProgram(unsigned int program);
    int GetUniformLocation(const std::string& name);

    void* window_ = nullptr;
    void* glContext_ = nullptr;
    std::uint32_t width_ = 0;
    std::uint32_t height_ = 0;
    std::uint64_t nextId_ = 1;
    std::string lastError_;
    GLStateCache glStateCache_;

    std::unordered_map<std::uint64_t, unsigned int> vertexArrays_;
    std::unordered_map<std::uint64_t, unsigned int> buffers_;
    std::unordered_map<std::uint64_t, unsigned int> shaders_;
    std::unordered_map<std::uint64_t, unsigned int> pipelines_;
};

}  // namespace blaze_device
