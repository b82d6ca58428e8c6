/**
 * @file rdi_types.hpp
 * @brief RDI (Rendering Device Interface) 资源句柄与描述符类型定义
 *
 * 设备抽象层类型：Handle<T>、缓冲/着色器/管线描述、顶点属性、图元拓扑与索引类型。
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace blaze_device {

// =============================================================================
// 资源句柄
// =============================================================================

/** 类型安全资源句柄，id=0 表示无效 */
template <typename Tag>
struct Handle {
    std::uint64_t id = 0;

    bool IsValid() const { return id != 0; }
    bool operator==(const Handle& other) const { return id == other.id; }
    bool operator!=(const Handle& other) const { return id != other.id; }
};

struct VertexArray_Tag {};
struct Buffer_Tag {};
struct Shader_Tag {};
struct Pipeline_Tag {};

using VertexArrayHandle = Handle<VertexArray_Tag>;
using BufferHandle      = Handle<Buffer_Tag>;
using ShaderHandle      = Handle<Shader_Tag>;
using PipelineHandle    = Handle<Pipeline_Tag>;

// =============================================================================
// 格式与用途枚举
// =============================================================================

/** 顶点属性格式（仅浮点分量） */
enum class Format {
    Undefined,
    R32F,
    RG32F,
    RGB32F,
    RGBA32F,
};

/** 格式对应的 float 分量数，Undefined 返回 0 */
inline std::uint32_t FormatComponentCount(Format fmt) {
    switch (fmt) {
        case Format::R32F:    return 1;
        case Format::RG32F:   return 2;
        case Format::RGB32F:  return 3;
        case Format::RGBA32F: return 4;
        default:              return 0;
    }
}

/** 缓冲用途，同时作为 BindBuffer 的绑定目标 */
enum class BufferUsage {
    Vertex,
    Index,
};

enum class PrimitiveTopology {
    TriangleList,
    TriangleStrip,
    LineList,
    PointList,
};

/** 索引元素类型 */
enum class IndexType {
    UInt8,
    UInt16,
    UInt32,
};

// =============================================================================
// 资源描述符结构
// =============================================================================

struct BufferDesc {
    std::size_t size = 0;
    BufferUsage usage = BufferUsage::Vertex;
};

enum class ShaderStage {
    Vertex,
    Fragment,
};

struct ShaderDesc {
    ShaderStage stage = ShaderStage::Vertex;
    std::vector<std::uint8_t> code;  // GLSL 源码
};

struct PipelineDesc {
    std::vector<ShaderHandle> shaders;
};

// =============================================================================
// 顶点输入
// =============================================================================

/**
 * 单个顶点属性：作用于当前绑定的 VertexArray 与 Vertex Buffer。
 * stride / offset 以字节计。
 */
struct VertexAttributeDesc {
    std::uint32_t location = 0;
    Format format = Format::RGB32F;
    std::uint32_t stride = 0;
    std::uint32_t offset = 0;
};

}  // namespace blaze_device
