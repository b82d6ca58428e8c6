/**
 * @file render_device.hpp
 * @brief IRenderDevice 渲染设备抽象接口
 *
 * 设备抽象层核心：顶点数组/缓冲/着色器/管线的创建与销毁、绑定状态、顶点属性配置与绘制。
 * 所有调用须在持有 GPU 上下文的线程上同步执行；资源只在创建时可能失败。
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#include <blaze_device/rdi_types.hpp>

namespace blaze_device {

// =============================================================================
// 设备配置
// =============================================================================

/** 渲染设备初始化配置 */
struct DeviceConfig {
    void* windowHandle = nullptr;
    std::uint32_t width = 0;
    std::uint32_t height = 0;
    bool vsync = true;
    int glMajorVersion = 3;
    int glMinorVersion = 3;
};

// =============================================================================
// 渲染设备接口
// =============================================================================

/**
 * 渲染设备抽象接口。
 * 创建失败时返回无效句柄（id == 0），原因由 GetLastError() 给出。
 * 销毁无效或未知句柄为空操作。
 */
class IRenderDevice {
public:
    virtual ~IRenderDevice() = default;

    // --- 设备管理 ---
    virtual bool Initialize(const DeviceConfig& config) = 0;
    virtual void Shutdown() = 0;

    /** 最近一次失败的详细错误信息 */
    virtual const std::string& GetLastError() const = 0;

    // --- 资源创建 ---
    virtual VertexArrayHandle CreateVertexArray() = 0;

    /** 分配缓冲并原样上传 desc.size 字节（data 为空时仅分配） */
    virtual BufferHandle CreateBuffer(const BufferDesc& desc, const void* data = nullptr) = 0;
    virtual ShaderHandle CreateShader(const ShaderDesc& desc) = 0;
    virtual PipelineHandle CreatePipeline(const PipelineDesc& desc) = 0;

    // --- 资源销毁 ---
    virtual void DestroyVertexArray(VertexArrayHandle handle) = 0;
    virtual void DestroyBuffer(BufferHandle handle) = 0;
    virtual void DestroyShader(ShaderHandle handle) = 0;
    virtual void DestroyPipeline(PipelineHandle handle) = 0;

    // --- 绑定与顶点属性 ---
    /** 传入无效句柄表示解绑 */
    virtual void BindVertexArray(VertexArrayHandle handle) = 0;
    virtual void BindBuffer(BufferUsage target, BufferHandle handle) = 0;

    /** 在当前绑定的 VertexArray 上启用并配置一个浮点属性，数据来源为当前 Vertex Buffer */
    virtual void SetVertexAttribute(const VertexAttributeDesc& attribute) = 0;

    // --- 绘制 ---
    virtual void BindPipeline(PipelineHandle pipeline) = 0;
    virtual void SetUniformMat4(const std::string& name, const float* value) = 0;
    virtual void SetUniformVec4(const std::string& name, const float* value) = 0;
    virtual void DrawIndexed(VertexArrayHandle vertexArray, PrimitiveTopology topology,
                             IndexType indexType, std::uint32_t indexCount) = 0;
    virtual void Clear(const float color[4]) = 0;
    virtual void Present() = 0;

    // --- 查询 ---
    /** 当前存活（已创建未销毁）的资源数，用于泄漏检查 */
    virtual std::size_t GetLiveVertexArrayCount() const = 0;
    virtual std::size_t GetLiveBufferCount() const = 0;
};

}  // namespace blaze_device
