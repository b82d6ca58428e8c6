/**
 * @file render_object.hpp
 * @brief 可渲染对象：着色程序引用 + 独占的几何缓冲 + 绘制参数 + ObjectData
 *
 * GPU 上下文的生命周期长于对象，缓冲不会在析构时自动回收，
 * 必须由持有者（ObjectRegistry 或从注册表取出对象的调用方）显式 ReleaseBuffers。
 * RenderObject 只可移动：移动后源对象的缓冲句柄全部失效，同一组缓冲不会被两个存活对象持有。
 */

#pragma once

#include <blaze_device/rdi_types.hpp>
#include <blaze_device/render_device.hpp>
#include <blaze_scene/object_data.hpp>
#include <blaze_scene/object_id.hpp>
#include <blaze_scene/shader_program.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <type_traits>
#include <utility>

#include <glm/glm.hpp>

namespace blaze::scene {

/**
 * 一个对象的顶点数组、顶点缓冲、索引缓冲三元组。
 * 三个句柄同时创建、同时释放；任一句柄失效即整体无效。
 */
class GeometryBuffers {
public:
    GeometryBuffers() = default;
    GeometryBuffers(blaze_device::VertexArrayHandle vertexArray,
                    blaze_device::BufferHandle vertexBuffer,
                    blaze_device::BufferHandle indexBuffer)
        : vertexArray_(vertexArray), vertexBuffer_(vertexBuffer), indexBuffer_(indexBuffer) {}

    blaze_device::VertexArrayHandle GetVertexArray() const { return vertexArray_; }
    blaze_device::BufferHandle GetVertexBuffer() const { return vertexBuffer_; }
    blaze_device::BufferHandle GetIndexBuffer() const { return indexBuffer_; }

    bool IsValid() const {
        return vertexArray_.IsValid() && vertexBuffer_.IsValid() && indexBuffer_.IsValid();
    }

    /** 把三个句柄交还设备并置为无效；已无效的句柄跳过 */
    void Release(blaze_device::IRenderDevice& device);

private:
    blaze_device::VertexArrayHandle vertexArray_{};
    blaze_device::BufferHandle vertexBuffer_{};
    blaze_device::BufferHandle indexBuffer_{};
};

class RenderObject {
public:
    RenderObject(const RenderObject&) = delete;
    RenderObject& operator=(const RenderObject&) = delete;
    RenderObject(RenderObject&& other) noexcept;
    RenderObject& operator=(RenderObject&&) = delete;
    ~RenderObject() = default;

    /** 平面立方体（8 顶点，14 索引，三角带），负载按 kind 构造 */
    static std::optional<RenderObject> CreateFlatCube(blaze_device::IRenderDevice& device,
                                                      const ShaderProgram& program,
                                                      const glm::vec3& pos, const glm::vec3& dim,
                                                      const glm::vec4& color, ObjectId id,
                                                      ObjectKind kind);
    static std::optional<RenderObject> CreateFlatCubeWith(blaze_device::IRenderDevice& device,
                                                          const ShaderProgram& program,
                                                          ObjectData data);

    /** 按 program.style 选择平面立方体（Simple）或着色立方体（Normal） */
    static std::optional<RenderObject> CreateCube(blaze_device::IRenderDevice& device,
                                                  const ShaderProgram& program,
                                                  const glm::vec3& pos, const glm::vec3& dim,
                                                  const glm::vec4& color, ObjectId id,
                                                  ObjectKind kind);

    /** 着色立方体（24 顶点，36 索引，三角形列表，带法线） */
    static std::optional<RenderObject> CreateCubeWith(blaze_device::IRenderDevice& device,
                                                      const ShaderProgram& program,
                                                      ObjectData data);

    /**
     * 通用上传：创建 1 个顶点数组与 2 个缓冲，原样上传顶点/索引字节，
     * 配置属性 0（位置，3 float）及 hasNormals 时的属性 1（法线，偏移 3 float），随后解绑全部状态。
     * 调用方保证顶点布局与 hasNormals 一致。
     * 返回前对 data 调用一次 UpdateModel()；索引数 = indexCount。
     * 任一创建失败时释放本次已分配的句柄并返回 std::nullopt，原因见 device.GetLastError()。
     */
    template <typename V, typename I>
    static std::optional<RenderObject> FromRaw(blaze_device::IRenderDevice& device,
                                               const ShaderProgram& program,
                                               const V* vertices, std::size_t vertexCount,
                                               const I* indices, std::size_t indexCount,
                                               blaze_device::PrimitiveTopology topology,
                                               blaze_device::IndexType indexType,
                                               ObjectData data, bool hasNormals) {
        static_assert(std::is_trivially_copyable_v<V>, "vertex type must be trivially copyable");
        static_assert(std::is_trivially_copyable_v<I>, "index type must be trivially copyable");
        return Upload(device, program, vertices, vertexCount * sizeof(V), indices,
                      indexCount * sizeof(I), indexCount, topology, indexType,
                      std::move(data), hasNormals);
    }

    const ShaderProgram& GetProgram() const { return program_; }
    const GeometryBuffers& GetBuffers() const { return buffers_; }
    blaze_device::VertexArrayHandle GetVertexArray() const { return buffers_.GetVertexArray(); }
    blaze_device::BufferHandle GetVertexBuffer() const { return buffers_.GetVertexBuffer(); }
    blaze_device::BufferHandle GetIndexBuffer() const { return buffers_.GetIndexBuffer(); }

    const ObjectData& GetData() const { return data_; }
    ObjectData& GetMutData() { return data_; }

    blaze_device::PrimitiveTopology GetTopology() const { return topology_; }
    blaze_device::IndexType GetIndexType() const { return indexType_; }
    std::uint32_t GetIndexCount() const { return indexCount_; }

    // ObjectData 转发
    ObjectId GetId() const { return data_.GetId(); }
    const glm::vec4& GetColor() const { return data_.GetColor(); }
    void SetColor(const glm::vec4& color) { data_.SetColor(color); }
    ObjectKind GetKind() const { return data_.GetKind(); }
    bool IsLight() const { return data_.IsLight(); }
    const ObjectPayload& GetPayload() const { return data_.GetPayload(); }
    glm::vec3 GetPosition() const { return data_.GetPosition(); }
    void SetPosition(const glm::vec3& position) { data_.SetPosition(position); }
    glm::vec3 GetDimension() const { return data_.GetDimension(); }
    bool SetDimension(const glm::vec3& dimension) { return data_.SetDimension(dimension); }
    void UpdateModel() { data_.UpdateModel(); }
    const glm::mat4& GetModel() const { return data_.GetModel(); }

    /** 释放几何缓冲；第二次调用为空操作 */
    void ReleaseBuffers(blaze_device::IRenderDevice& device) { buffers_.Release(device); }

private:
    RenderObject(const ShaderProgram& program, const GeometryBuffers& buffers,
                 blaze_device::PrimitiveTopology topology, blaze_device::IndexType indexType,
                 std::uint32_t indexCount, ObjectData data);

    static std::optional<RenderObject> Upload(blaze_device::IRenderDevice& device,
                                              const ShaderProgram& program,
                                              const void* vertexData, std::size_t vertexBytes,
                                              const void* indexData, std::size_t indexBytes,
                                              std::size_t indexCount,
                                              blaze_device::PrimitiveTopology topology,
                                              blaze_device::IndexType indexType,
                                              ObjectData data, bool hasNormals);

    ShaderProgram program_;
    GeometryBuffers buffers_;
    ObjectData data_;
    blaze_device::PrimitiveTopology topology_ = blaze_device::PrimitiveTopology::TriangleList;
    blaze_device::IndexType indexType_ = blaze_device::IndexType::UInt8;
    std::uint32_t indexCount_ = 0;
};

}  // namespace blaze::scene
