/**
 * @file render_object.cpp
 * @brief RenderObject 实现：库存立方体构造、通用上传与缓冲释放
 */

#include <blaze_scene/render_object.hpp>
#include <blaze_scene/cube_geometry.hpp>

#include <utility>

namespace blaze::scene {

using blaze_device::BufferDesc;
using blaze_device::BufferHandle;
using blaze_device::BufferUsage;
using blaze_device::Format;
using blaze_device::IndexType;
using blaze_device::IRenderDevice;
using blaze_device::PrimitiveTopology;
using blaze_device::VertexArrayHandle;
using blaze_device::VertexAttributeDesc;

namespace {

constexpr std::uint32_t kPositionLocation = 0;
constexpr std::uint32_t kNormalLocation = 1;
constexpr std::uint32_t kComponentsPerAttribute = 3;

}  // namespace

// =============================================================================
// GeometryBuffers
// =============================================================================

void GeometryBuffers::Release(IRenderDevice& device) {
    if (vertexArray_.IsValid()) device.DestroyVertexArray(vertexArray_);
    if (vertexBuffer_.IsValid()) device.DestroyBuffer(vertexBuffer_);
    if (indexBuffer_.IsValid()) device.DestroyBuffer(indexBuffer_);
    vertexArray_ = {};
    vertexBuffer_ = {};
    indexBuffer_ = {};
}

// =============================================================================
// RenderObject
// =============================================================================

RenderObject::RenderObject(const ShaderProgram& program, const GeometryBuffers& buffers,
                           PrimitiveTopology topology, IndexType indexType,
                           std::uint32_t indexCount, ObjectData data)
    : program_(program),
      buffers_(buffers),
      data_(std::move(data)),
      topology_(topology),
      indexType_(indexType),
      indexCount_(indexCount) {}

RenderObject::RenderObject(RenderObject&& other) noexcept
    : program_(other.program_),
      buffers_(std::exchange(other.buffers_, GeometryBuffers{})),
      data_(std::move(other.data_)),
      topology_(other.topology_),
      indexType_(other.indexType_),
      indexCount_(std::exchange(other.indexCount_, 0u)) {}

std::optional<RenderObject> RenderObject::CreateFlatCube(IRenderDevice& device,
                                                         const ShaderProgram& program,
                                                         const glm::vec3& pos, const glm::vec3& dim,
                                                         const glm::vec4& color, ObjectId id,
                                                         ObjectKind kind) {
    return CreateFlatCubeWith(device, program, ObjectData(id, color, MakePayload(kind, pos, dim)));
}

std::optional<RenderObject> RenderObject::CreateFlatCubeWith(IRenderDevice& device,
                                                             const ShaderProgram& program,
                                                             ObjectData data) {
    return FromRaw(device, program,
                   kFlatCubeVertices.data(), kFlatCubeVertices.size(),
                   kFlatCubeIndices.data(), kFlatCubeIndices.size(),
                   PrimitiveTopology::TriangleStrip, IndexType::UInt8,
                   std::move(data), false);
}

std::optional<RenderObject> RenderObject::CreateCube(IRenderDevice& device,
                                                     const ShaderProgram& program,
                                                     const glm::vec3& pos, const glm::vec3& dim,
                                                     const glm::vec4& color, ObjectId id,
                                                     ObjectKind kind) {
    ObjectData data(id, color, MakePayload(kind, pos, dim));
    switch (program.style) {
        case ProgramStyle::Simple:
            return CreateFlatCubeWith(device, program, std::move(data));
        case ProgramStyle::Normal:
            return CreateCubeWith(device, program, std::move(data));
    }
    return CreateCubeWith(device, program, std::move(data));
}

std::optional<RenderObject> RenderObject::CreateCubeWith(IRenderDevice& device,
                                                         const ShaderProgram& program,
                                                         ObjectData data) {
    return FromRaw(device, program,
                   kCubeVertices.data(), kCubeVertices.size(),
                   kCubeIndices.data(), kCubeIndices.size(),
                   PrimitiveTopology::TriangleList, IndexType::UInt8,
                   std::move(data), true);
}

std::optional<RenderObject> RenderObject::Upload(IRenderDevice& device,
                                                 const ShaderProgram& program,
                                                 const void* vertexData, std::size_t vertexBytes,
                                                 const void* indexData, std::size_t indexBytes,
                                                 std::size_t indexCount,
                                                 PrimitiveTopology topology, IndexType indexType,
                                                 ObjectData data, bool hasNormals) {
    VertexArrayHandle vao = device.CreateVertexArray();
    if (!vao.IsValid())
        return std::nullopt;

    BufferDesc vertexDesc;
    vertexDesc.size = vertexBytes;
    vertexDesc.usage = BufferUsage::Vertex;
    BufferHandle vbo = device.CreateBuffer(vertexDesc, vertexData);
    if (!vbo.IsValid()) {
        device.DestroyVertexArray(vao);
        return std::nullopt;
    }

    BufferDesc indexDesc;
    indexDesc.size = indexBytes;
    indexDesc.usage = BufferUsage::Index;
    BufferHandle ebo = device.CreateBuffer(indexDesc, indexData);
    if (!ebo.IsValid()) {
        device.DestroyBuffer(vbo);
        device.DestroyVertexArray(vao);
        return std::nullopt;
    }

    const std::uint32_t floatsPerVertex = hasNormals ? 2 * kComponentsPerAttribute : kComponentsPerAttribute;
    const std::uint32_t stride = floatsPerVertex * static_cast<std::uint32_t>(sizeof(float));

    device.BindVertexArray(vao);
    device.BindBuffer(BufferUsage::Vertex, vbo);
    device.BindBuffer(BufferUsage::Index, ebo);

    VertexAttributeDesc position;
    position.location = kPositionLocation;
    position.format = Format::RGB32F;
    position.stride = stride;
    position.offset = 0;
    device.SetVertexAttribute(position);

    if (hasNormals) {
        VertexAttributeDesc normal;
        normal.location = kNormalLocation;
        normal.format = Format::RGB32F;
        normal.stride = stride;
        normal.offset = kComponentsPerAttribute * static_cast<std::uint32_t>(sizeof(float));
        device.SetVertexAttribute(normal);
    }

    // 先解绑 VAO，索引缓冲绑定保留在 VAO 内
    device.BindVertexArray(VertexArrayHandle{});
    device.BindBuffer(BufferUsage::Vertex, BufferHandle{});
    device.BindBuffer(BufferUsage::Index, BufferHandle{});

    data.UpdateModel();

    return RenderObject(program, GeometryBuffers(vao, vbo, ebo), topology, indexType,
                        static_cast<std::uint32_t>(indexCount), std::move(data));
}

}  // namespace blaze::scene
