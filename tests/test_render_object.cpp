/**
 * @file test_render_object.cpp
 * @brief RenderObject 几何上传单元测试
 *
 * 使用记录型 Mock 设备，不依赖 GPU。覆盖：
 * - 平面立方体 / 着色立方体的索引数、拓扑、上传字节与属性配置；
 * - 上传结束时顶点数组与缓冲均已解绑；
 * - CreateCube 按程序风格分派；
 * - FromRaw 自定义数据与 UpdateModel 调用；
 * - 创建失败时已分配句柄全部回收；
 * - 移动后源对象句柄失效，ReleaseBuffers 幂等。
 */

#include <blaze_device/render_device.hpp>
#include <blaze_device/rdi_types.hpp>
#include <blaze_scene/cube_geometry.hpp>
#include <blaze_scene/object_data.hpp>
#include <blaze_scene/render_object.hpp>
#include <blaze_scene/shader_program.hpp>

#include <glm/glm.hpp>

#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#define TEST_CHECK(cond)                                               \
    do {                                                               \
        if (!(cond)) {                                                 \
            std::cerr << "FAIL: " << __FILE__ << ":" << __LINE__        \
                      << " " << #cond << std::endl;                    \
            std::exit(1);                                              \
        }                                                              \
    } while (0)

namespace {

using namespace blaze_device;
using namespace blaze::scene;

/** 记录创建/销毁/属性调用的 Mock 设备；可注入顶点数组或第 N 个缓冲创建失败 */
class MockRenderDevice : public IRenderDevice {
public:
    struct Upload {
        BufferUsage usage = BufferUsage::Vertex;
        std::vector<std::uint8_t> bytes;
    };

    bool Initialize(const DeviceConfig&) override { return true; }
    void Shutdown() override {}
    const std::string& GetLastError() const override { return lastError_; }

    VertexArrayHandle CreateVertexArray() override {
        if (failVertexArray) {
            lastError_ = "mock: vertex array refused";
            return {};
        }
        VertexArrayHandle h{nextId_++};
        liveVertexArrays_.insert(h.id);
        return h;
    }

    BufferHandle CreateBuffer(const BufferDesc& desc, const void* data) override {
        if (failBufferAfter >= 0 && buffersCreated >= failBufferAfter) {
            lastError_ = "mock: buffer refused";
            return {};
        }
        if (desc.size == 0) {
            lastError_ = "CreateBuffer: size must be > 0";
            return {};
        }
        ++buffersCreated;
        Upload up;
        up.usage = desc.usage;
        if (data) {
            const auto* p = static_cast<const std::uint8_t*>(data);
            up.bytes.assign(p, p + desc.size);
        }
        uploads.push_back(std::move(up));
        BufferHandle h{nextId_++};
        liveBuffers_.insert(h.id);
        return h;
    }

    ShaderHandle CreateShader(const ShaderDesc&) override { return ShaderHandle{nextId_++}; }
    PipelineHandle CreatePipeline(const PipelineDesc&) override { return PipelineHandle{nextId_++}; }

    void DestroyVertexArray(VertexArrayHandle handle) override {
        if (liveVertexArrays_.erase(handle.id) == 0)
            ++unknownDestroys;
    }
    void DestroyBuffer(BufferHandle handle) override {
        if (liveBuffers_.erase(handle.id) == 0)
            ++unknownDestroys;
    }
    void DestroyShader(ShaderHandle) override {}
    void DestroyPipeline(PipelineHandle) override {}

    void BindVertexArray(VertexArrayHandle handle) override { boundVertexArray = handle.id; }
    void BindBuffer(BufferUsage target, BufferHandle handle) override {
        if (target == BufferUsage::Index)
            boundIndexBuffer = handle.id;
        else
            boundVertexBuffer = handle.id;
    }
    void SetVertexAttribute(const VertexAttributeDesc& attribute) override {
        attributes.push_back(attribute);
        attributeVertexArrays.push_back(boundVertexArray);
    }

    void BindPipeline(PipelineHandle) override {}
    void SetUniformMat4(const std::string&, const float*) override {}
    void SetUniformVec4(const std::string&, const float*) override {}
    void DrawIndexed(VertexArrayHandle, PrimitiveTopology, IndexType, std::uint32_t) override {}
    void Clear(const float[4]) override {}
    void Present() override {}

    std::size_t GetLiveVertexArrayCount() const override { return liveVertexArrays_.size(); }
    std::size_t GetLiveBufferCount() const override { return liveBuffers_.size(); }

    bool failVertexArray = false;
    int failBufferAfter = -1;
    int buffersCreated = 0;
    int unknownDestroys = 0;
    std::uint64_t boundVertexArray = 0;
    std::uint64_t boundVertexBuffer = 0;
    std::uint64_t boundIndexBuffer = 0;
    std::vector<Upload> uploads;
    std::vector<VertexAttributeDesc> attributes;
    std::vector<std::uint64_t> attributeVertexArrays;

private:
    std::uint64_t nextId_ = 1;
    std::set<std::uint64_t> liveVertexArrays_;
    std::set<std::uint64_t> liveBuffers_;
    std::string lastError_;
};

ShaderProgram MakeProgram(ProgramStyle style) {
    ShaderProgram program;
    program.pipeline = PipelineHandle{100};
    program.style = style;
    return program;
}

bool Near(const glm::vec3& a, const glm::vec3& b) {
    return std::abs(a.x - b.x) < 1e-5f && std::abs(a.y - b.y) < 1e-5f && std::abs(a.z - b.z) < 1e-5f;
}

void test_flat_cube_upload() {
    MockRenderDevice dev;
    ShaderProgram program = MakeProgram(ProgramStyle::Simple);
    auto obj = RenderObject::CreateFlatCube(dev, program, glm::vec3(1.f, 2.f, 3.f), glm::vec3(2.f),
                                            glm::vec4(1.f, 0.f, 0.f, 1.f), ObjectId{1}, ObjectKind::Basic);
    TEST_CHECK(obj.has_value());
    TEST_CHECK(obj->GetBuffers().IsValid());
    TEST_CHECK(obj->GetIndexCount() == 14u);
    TEST_CHECK(obj->GetTopology() == PrimitiveTopology::TriangleStrip);
    TEST_CHECK(obj->GetIndexType() == IndexType::UInt8);
    TEST_CHECK(obj->GetProgram().pipeline == program.pipeline);

    TEST_CHECK(dev.GetLiveVertexArrayCount() == 1u);
    TEST_CHECK(dev.GetLiveBufferCount() == 2u);

    // 字节原样上传
    TEST_CHECK(dev.uploads.size() == 2u);
    TEST_CHECK(dev.uploads[0].usage == BufferUsage::Vertex);
    TEST_CHECK(dev.uploads[0].bytes.size() == sizeof(float) * 24);
    TEST_CHECK(std::memcmp(dev.uploads[0].bytes.data(), kFlatCubeVertices.data(), sizeof(float) * 24) == 0);
    TEST_CHECK(dev.uploads[1].usage == BufferUsage::Index);
    TEST_CHECK(dev.uploads[1].bytes.size() == 14u);
    TEST_CHECK(std::memcmp(dev.uploads[1].bytes.data(), kFlatCubeIndices.data(), 14) == 0);

    // 仅位置属性，步长 3 float
    TEST_CHECK(dev.attributes.size() == 1u);
    TEST_CHECK(dev.attributes[0].location == 0u);
    TEST_CHECK(dev.attributes[0].format == Format::RGB32F);
    TEST_CHECK(dev.attributes[0].stride == 12u);
    TEST_CHECK(dev.attributes[0].offset == 0u);
    TEST_CHECK(dev.attributeVertexArrays[0] == obj->GetVertexArray().id);

    // 结束时全部解绑
    TEST_CHECK(dev.boundVertexArray == 0u);
    TEST_CHECK(dev.boundVertexBuffer == 0u);
    TEST_CHECK(dev.boundIndexBuffer == 0u);

    // 负载经 RenderObject 转发
    TEST_CHECK(std::holds_alternative<BasicData>(obj->GetPayload()));
    TEST_CHECK(Near(std::get<BasicData>(obj->GetPayload()).dimension, glm::vec3(2.f)));
    TEST_CHECK(Near(std::get<BasicData>(obj->GetPayload()).position, glm::vec3(1.f, 2.f, 3.f)));

    // 返回前已计算模型矩阵
    glm::vec4 corner = obj->GetModel() * glm::vec4(1.f, 1.f, 1.f, 1.f);
    TEST_CHECK(Near(glm::vec3(corner), glm::vec3(2.f, 3.f, 4.f)));

    obj->ReleaseBuffers(dev);
    TEST_CHECK(dev.GetLiveVertexArrayCount() == 0u);
    TEST_CHECK(dev.GetLiveBufferCount() == 0u);
}

void test_shaded_cube_upload() {
    MockRenderDevice dev;
    ShaderProgram program = MakeProgram(ProgramStyle::Normal);
    ObjectData data(ObjectId{2}, glm::vec4(0.f, 1.f, 0.f, 1.f), PlayerData(glm::vec3(0.f, 5.f, 0.f)));
    auto obj = RenderObject::CreateCubeWith(dev, program, std::move(data));
    TEST_CHECK(obj.has_value());
    TEST_CHECK(obj->GetIndexCount() == 36u);
    TEST_CHECK(obj->GetTopology() == PrimitiveTopology::TriangleList);
    TEST_CHECK(obj->GetIndexType() == IndexType::UInt8);
    TEST_CHECK(obj->GetKind() == ObjectKind::Player);
    TEST_CHECK(std::holds_alternative<PlayerData>(obj->GetPayload()));

    TEST_CHECK(dev.uploads.size() == 2u);
    TEST_CHECK(dev.uploads[0].bytes.size() == sizeof(float) * 24 * 6);
    TEST_CHECK(std::memcmp(dev.uploads[0].bytes.data(), kCubeVertices.data(), sizeof(float) * 144) == 0);
    TEST_CHECK(dev.uploads[1].bytes.size() == 36u);

    // 位置 + 法线，步长 6 float，法线偏移 3 float
    TEST_CHECK(dev.attributes.size() == 2u);
    TEST_CHECK(dev.attributes[0].location == 0u);
    TEST_CHECK(dev.attributes[0].stride == 24u);
    TEST_CHECK(dev.attributes[0].offset == 0u);
    TEST_CHECK(dev.attributes[1].location == 1u);
    TEST_CHECK(dev.attributes[1].format == Format::RGB32F);
    TEST_CHECK(dev.attributes[1].stride == 24u);
    TEST_CHECK(dev.attributes[1].offset == 12u);

    TEST_CHECK(dev.boundVertexArray == 0u);
    TEST_CHECK(dev.boundVertexBuffer == 0u);
    TEST_CHECK(dev.boundIndexBuffer == 0u);

    glm::vec4 origin = obj->GetModel() * glm::vec4(0.f, 0.f, 0.f, 1.f);
    TEST_CHECK(Near(glm::vec3(origin), glm::vec3(0.f, 5.f, 0.f)));

    obj->ReleaseBuffers(dev);
}

void test_create_cube_dispatch() {
    MockRenderDevice dev;
    auto flat = RenderObject::CreateCube(dev, MakeProgram(ProgramStyle::Simple), glm::vec3(0.f), glm::vec3(1.f),
                                         glm::vec4(1.f), ObjectId{1}, ObjectKind::Basic);
    auto shaded = RenderObject::CreateCube(dev, MakeProgram(ProgramStyle::Normal), glm::vec3(0.f), glm::vec3(1.f),
                                           glm::vec4(1.f), ObjectId{2}, ObjectKind::Basic);
    TEST_CHECK(flat && shaded);
    TEST_CHECK(flat->GetIndexCount() == 14u);
    TEST_CHECK(flat->GetTopology() == PrimitiveTopology::TriangleStrip);
    TEST_CHECK(shaded->GetIndexCount() == 36u);
    TEST_CHECK(shaded->GetTopology() == PrimitiveTopology::TriangleList);
    TEST_CHECK(dev.GetLiveVertexArrayCount() == 2u);
    TEST_CHECK(dev.GetLiveBufferCount() == 4u);
    flat->ReleaseBuffers(dev);
    shaded->ReleaseBuffers(dev);
    TEST_CHECK(dev.GetLiveBufferCount() == 0u);
}

void test_from_raw_custom_data() {
    struct Vertex {
        float x, y, z;
    };
    const Vertex vertices[] = {{0.f, 0.f, 0.f}, {1.f, 0.f, 0.f}, {0.f, 1.f, 0.f}};
    const std::uint16_t indices[] = {0, 1, 2};

    MockRenderDevice dev;
    ObjectData data(ObjectId{9}, glm::vec4(1.f), BasicData(glm::vec3(3.f, 0.f, 0.f), glm::vec3(2.f)));
    auto obj = RenderObject::FromRaw(dev, MakeProgram(ProgramStyle::Simple), vertices, 3, indices, 3,
                                     PrimitiveTopology::TriangleList, IndexType::UInt16,
                                     std::move(data), false);
    TEST_CHECK(obj.has_value());
    TEST_CHECK(obj->GetIndexCount() == 3u);
    TEST_CHECK(obj->GetIndexType() == IndexType::UInt16);
    TEST_CHECK(dev.uploads[0].bytes.size() == sizeof(vertices));
    TEST_CHECK(dev.uploads[1].bytes.size() == sizeof(indices));
    TEST_CHECK(std::memcmp(dev.uploads[1].bytes.data(), indices, sizeof(indices)) == 0);

    // UpdateModel 已调用：原点平移到 position
    glm::vec4 origin = obj->GetModel() * glm::vec4(0.f, 0.f, 0.f, 1.f);
    TEST_CHECK(Near(glm::vec3(origin), glm::vec3(3.f, 0.f, 0.f)));
    obj->ReleaseBuffers(dev);
}

void test_creation_failure_cleanup() {
    ShaderProgram program = MakeProgram(ProgramStyle::Normal);

    {
        MockRenderDevice dev;
        dev.failVertexArray = true;
        auto obj = RenderObject::CreateCube(dev, program, glm::vec3(0.f), glm::vec3(1.f), glm::vec4(1.f),
                                            ObjectId{1}, ObjectKind::Basic);
        TEST_CHECK(!obj.has_value());
        TEST_CHECK(!dev.GetLastError().empty());
        TEST_CHECK(dev.GetLiveVertexArrayCount() == 0u);
        TEST_CHECK(dev.GetLiveBufferCount() == 0u);
    }
    {
        // 顶点缓冲失败：顶点数组须回收
        MockRenderDevice dev;
        dev.failBufferAfter = 0;
        auto obj = RenderObject::CreateCube(dev, program, glm::vec3(0.f), glm::vec3(1.f), glm::vec4(1.f),
                                            ObjectId{1}, ObjectKind::Basic);
        TEST_CHECK(!obj.has_value());
        TEST_CHECK(dev.GetLiveVertexArrayCount() == 0u);
        TEST_CHECK(dev.GetLiveBufferCount() == 0u);
        TEST_CHECK(dev.unknownDestroys == 0);
    }
    {
        // 索引缓冲失败：顶点缓冲与顶点数组须回收
        MockRenderDevice dev;
        dev.failBufferAfter = 1;
        auto obj = RenderObject::CreateCube(dev, program, glm::vec3(0.f), glm::vec3(1.f), glm::vec4(1.f),
                                            ObjectId{1}, ObjectKind::Basic);
        TEST_CHECK(!obj.has_value());
        TEST_CHECK(dev.buffersCreated == 1);
        TEST_CHECK(dev.GetLiveVertexArrayCount() == 0u);
        TEST_CHECK(dev.GetLiveBufferCount() == 0u);
        TEST_CHECK(dev.unknownDestroys == 0);
        // 失败前未配置任何属性
        TEST_CHECK(dev.attributes.empty());
    }
    {
        // 空索引数据：设备拒绝零字节缓冲
        const float vertices[] = {0.f, 0.f, 0.f};
        const std::uint8_t* noIndices = nullptr;
        MockRenderDevice dev;
        ObjectData data(ObjectId{1}, glm::vec4(1.f), PlayerData(glm::vec3(0.f)));
        auto obj = RenderObject::FromRaw(dev, program, vertices, 3, noIndices, 0,
                                         PrimitiveTopology::PointList, IndexType::UInt8,
                                         std::move(data), false);
        TEST_CHECK(!obj.has_value());
        TEST_CHECK(dev.GetLiveVertexArrayCount() == 0u);
        TEST_CHECK(dev.GetLiveBufferCount() == 0u);
    }
}

void test_move_and_release() {
    MockRenderDevice dev;
    auto obj = RenderObject::CreateCube(dev, MakeProgram(ProgramStyle::Simple), glm::vec3(0.f), glm::vec3(1.f),
                                        glm::vec4(1.f), ObjectId{5}, ObjectKind::Basic);
    TEST_CHECK(obj.has_value());
    const VertexArrayHandle vao = obj->GetVertexArray();

    RenderObject moved(std::move(*obj));
    TEST_CHECK(moved.GetVertexArray() == vao);
    TEST_CHECK(moved.GetBuffers().IsValid());
    TEST_CHECK(moved.GetId() == ObjectId{5});
    TEST_CHECK(!obj->GetBuffers().IsValid());
    TEST_CHECK(!obj->GetVertexBuffer().IsValid());
    TEST_CHECK(obj->GetIndexCount() == 0u);

    // 源对象释放为空操作，不会触及移动后的缓冲
    obj->ReleaseBuffers(dev);
    TEST_CHECK(dev.GetLiveVertexArrayCount() == 1u);
    TEST_CHECK(dev.GetLiveBufferCount() == 2u);

    moved.ReleaseBuffers(dev);
    TEST_CHECK(!moved.GetBuffers().IsValid());
    TEST_CHECK(dev.GetLiveVertexArrayCount() == 0u);
    TEST_CHECK(dev.GetLiveBufferCount() == 0u);

    moved.ReleaseBuffers(dev);
    TEST_CHECK(dev.unknownDestroys == 0);
}

}  // namespace

int main() {
    test_flat_cube_upload();
    test_shaded_cube_upload();
    test_create_cube_dispatch();
    test_from_raw_custom_data();
    test_creation_failure_cleanup();
    test_move_and_release();
    std::cout << "test_render_object: all passed" << std::endl;
    return 0;
}
