/**
 * Cube Scene - 立方体场景示例
 *
 * 展示 Blaze 场景层完整流程：
 * - WindowSystem + OpenGLRenderDevice 初始化
 * - 编译 Simple / Normal 两套着色程序
 * - ObjectRegistry 创建玩家立方体、若干 Basic 立方体与一个光源标记
 * - 方向键移动玩家（GetMutData + UpdateModel），R 清除全部 Basic，ESC 退出
 * - 退出前 Clear 并检查设备存活句柄归零
 */

#include <blaze_device/opengl_render_device.hpp>
#include <blaze_device/rdi_types.hpp>
#include <blaze_device/render_device.hpp>
#include <blaze_device/window_system.hpp>
#include <blaze_scene/object_data.hpp>
#include <blaze_scene/object_id.hpp>
#include <blaze_scene/object_registry.hpp>
#include <blaze_scene/render_object.hpp>
#include <blaze_scene/shader_program.hpp>

#include <glm/glm.hpp>
#include <glm/gtc/matrix_transform.hpp>
#include <glm/gtc/type_ptr.hpp>

#include <SDL3/SDL_timer.h>

#include <cstdint>
#include <iostream>
#include <string>

namespace {

const char* kSimpleVertexShader = R"(#version 330 core
layout(location = 0) in vec3 aPos;
uniform mat4 uModel;
uniform mat4 uViewProj;
void main() {
    gl_Position = uViewProj * uModel * vec4(aPos, 1.0);
}
)";

const char* kSimpleFragmentShader = R"(#version 330 core
uniform vec4 uColor;
out vec4 FragColor;
void main() {
    FragColor = uColor;
}
)";

const char* kNormalVertexShader = R"(#version 330 core
layout(location = 0) in vec3 aPos;
layout(location = 1) in vec3 aNormal;
uniform mat4 uModel;
uniform mat4 uViewProj;
out vec3 vWorldPos;
out vec3 vNormal;
void main() {
    vec4 world = uModel * vec4(aPos, 1.0);
    vWorldPos = world.xyz;
    vNormal = mat3(transpose(inverse(uModel))) * aNormal;
    gl_Position = uViewProj * world;
}
)";

const char* kNormalFragmentShader = R"(#version 330 core
in vec3 vWorldPos;
in vec3 vNormal;
uniform vec4 uColor;
uniform vec4 uLightPos;
out vec4 FragColor;
void main() {
    vec3 n = normalize(vNormal);
    vec3 l = normalize(uLightPos.xyz - vWorldPos);
    float diffuse = max(dot(n, l), 0.0);
    FragColor = vec4(uColor.rgb * (0.2 + 0.8 * diffuse), uColor.a);
}
)";

constexpr float kPlayerSpeed = 3.f;  // 单位/秒

blaze_device::ShaderHandle CompileShader(blaze_device::IRenderDevice& device,
                                         blaze_device::ShaderStage stage, const char* source) {
    const std::string text(source);
    blaze_device::ShaderDesc desc;
    desc.stage = stage;
    desc.code.assign(text.begin(), text.end());
    return device.CreateShader(desc);
}

/** 编译并链接一套着色程序；着色器对象在链接后即销毁 */
bool CreateProgram(blaze_device::IRenderDevice& device, const char* vsSource, const char* fsSource,
                   blaze::scene::ProgramStyle style, blaze::scene::ShaderProgram& out) {
    blaze_device::ShaderHandle vs = CompileShader(device, blaze_device::ShaderStage::Vertex, vsSource);
    blaze_device::ShaderHandle fs = CompileShader(device, blaze_device::ShaderStage::Fragment, fsSource);
    if (!vs.IsValid() || !fs.IsValid()) {
        device.DestroyShader(vs);
        device.DestroyShader(fs);
        return false;
    }
    blaze_device::PipelineDesc pd;
    pd.shaders = {vs, fs};
    out.pipeline = device.CreatePipeline(pd);
    out.style = style;
    device.DestroyShader(vs);
    device.DestroyShader(fs);
    return out.IsValid();
}

bool PopulateScene(blaze_device::IRenderDevice& device, blaze::scene::ObjectRegistry& registry,
                   const blaze::scene::ShaderProgram& simple, const blaze::scene::ShaderProgram& shaded,
                   blaze::scene::ObjectId playerId) {
    using blaze::scene::ObjectId;
    using blaze::scene::ObjectKind;

    bool ok = registry.CreateCube(device, playerId, shaded, glm::vec3(0.f, 0.5f, 0.f), glm::vec3(1.f),
                                  glm::vec4(0.2f, 0.6f, 1.f, 1.f), ObjectKind::Player);

    // 地面与障碍物
    ok = ok && registry.CreateCube(device, ObjectId{2}, shaded, glm::vec3(0.f, -1.5f, 0.f),
                                   glm::vec3(12.f, 1.f, 12.f), glm::vec4(0.5f, 0.5f, 0.5f, 1.f),
                                   ObjectKind::Basic);
    ok = ok && registry.CreateCube(device, ObjectId{3}, shaded, glm::vec3(3.f, 0.f, -2.f),
                                   glm::vec3(1.f, 2.f, 1.f), glm::vec4(0.9f, 0.3f, 0.2f, 1.f),
                                   ObjectKind::Basic);
    ok = ok && registry.CreateCube(device, ObjectId{4}, shaded, glm::vec3(-3.f, -0.5f, 2.f),
                                   glm::vec3(2.f, 1.f, 2.f), glm::vec4(0.3f, 0.9f, 0.3f, 1.f),
                                   ObjectKind::Basic);

    ok = ok && registry.CreateLight(device, ObjectId::Light(0), simple, glm::vec3(2.f, 4.f, 2.f),
                                    glm::vec3(0.3f), glm::vec4(1.f, 1.f, 0.8f, 1.f));
    if (!ok)
        std::cerr << "Failed to populate scene: " << registry.GetLastError() << std::endl;
    return ok;
}

void DrawScene(blaze_device::IRenderDevice& device, const blaze::scene::ObjectRegistry& registry,
               const glm::mat4& viewProj) {
    glm::vec4 lightPos(0.f, 10.f, 0.f, 1.f);
    for (const blaze::scene::RenderObject& light : registry.Lights()) {
        lightPos = glm::vec4(light.GetPosition(), 1.f);
        break;
    }

    for (const blaze::scene::RenderObject& obj : registry.Objects()) {
        device.BindPipeline(obj.GetProgram().pipeline);
        device.SetUniformMat4("uViewProj", glm::value_ptr(viewProj));
        device.SetUniformMat4("uModel", glm::value_ptr(obj.GetModel()));
        device.SetUniformVec4("uColor", glm::value_ptr(obj.GetColor()));
        if (obj.GetProgram().style == blaze::scene::ProgramStyle::Normal)
            device.SetUniformVec4("uLightPos", glm::value_ptr(lightPos));
        device.DrawIndexed(obj.GetVertexArray(), obj.GetTopology(), obj.GetIndexType(), obj.GetIndexCount());
    }
}

}  // namespace

int main() {
    blaze_device::WindowSystem window;
    blaze_device::WindowConfig wc;
    wc.width = 1280;
    wc.height = 720;
    wc.title = "Blaze Cube Scene";
    if (!window.Create(wc)) {
        std::cerr << "Failed to create window: " << window.GetLastError() << std::endl;
        return 1;
    }

    blaze_device::OpenGLRenderDevice device;
    blaze_device::DeviceConfig config;
    config.windowHandle = window.GetNativeHandle();
    config.width = window.GetWidth();
    config.height = window.GetHeight();
    config.vsync = true;
    if (!device.Initialize(config)) {
        std::cerr << "Failed to initialize render device: " << device.GetLastError() << std::endl;
        window.Destroy();
        return 1;
    }

    blaze::scene::ShaderProgram simple;
    blaze::scene::ShaderProgram shaded;
    if (!CreateProgram(device, kSimpleVertexShader, kSimpleFragmentShader, blaze::scene::ProgramStyle::Simple, simple) ||
        !CreateProgram(device, kNormalVertexShader, kNormalFragmentShader, blaze::scene::ProgramStyle::Normal, shaded)) {
        std::cerr << "Failed to create shader programs: " << device.GetLastError() << std::endl;
        device.DestroyPipeline(simple.pipeline);
        device.DestroyPipeline(shaded.pipeline);
        device.Shutdown();
        window.Destroy();
        return 1;
    }

    const blaze::scene::ObjectId playerId{1};
    blaze::scene::ObjectRegistry registry;
    if (!PopulateScene(device, registry, simple, shaded, playerId)) {
        registry.Clear(device);
        device.DestroyPipeline(simple.pipeline);
        device.DestroyPipeline(shaded.pipeline);
        device.Shutdown();
        window.Destroy();
        return 1;
    }

    std::cout << "Cube scene: " << registry.Size() << " objects, " << registry.Lights().size()
              << " light(s). Arrows move, R clears Basic cubes, ESC quits." << std::endl;

    const float aspect = static_cast<float>(window.GetWidth()) / static_cast<float>(window.GetHeight());
    const glm::mat4 proj = glm::perspective(glm::radians(60.f), aspect, 0.1f, 100.f);
    const glm::mat4 view = glm::lookAt(glm::vec3(0.f, 6.f, 10.f), glm::vec3(0.f), glm::vec3(0.f, 1.f, 0.f));
    const glm::mat4 viewProj = proj * view;
    const float clearColor[4] = {0.1f, 0.1f, 0.15f, 1.f};

    bool resetHeld = false;
    std::uint64_t lastTicks = SDL_GetTicks();
    while (window.PollEvents()) {
        if (window.IsKeyDown(SDL_SCANCODE_ESCAPE))
            break;

        const std::uint64_t now = SDL_GetTicks();
        const float dt = static_cast<float>(now - lastTicks) / 1000.f;
        lastTicks = now;

        glm::vec3 move(0.f);
        if (window.IsKeyDown(SDL_SCANCODE_LEFT)) move.x -= 1.f;
        if (window.IsKeyDown(SDL_SCANCODE_RIGHT)) move.x += 1.f;
        if (window.IsKeyDown(SDL_SCANCODE_UP)) move.z -= 1.f;
        if (window.IsKeyDown(SDL_SCANCODE_DOWN)) move.z += 1.f;
        if (move != glm::vec3(0.f)) {
            if (blaze::scene::ObjectData* player = registry.GetMutData(playerId)) {
                player->SetPosition(player->GetPosition() + glm::normalize(move) * kPlayerSpeed * dt);
                player->UpdateModel();
            }
        }

        // R 边沿触发
        const bool resetDown = window.IsKeyDown(SDL_SCANCODE_R);
        if (resetDown && !resetHeld) {
            std::size_t removed = registry.DestroyKind(device, blaze::scene::ObjectKind::Basic);
            std::cout << "Removed " << removed << " basic object(s)" << std::endl;
        }
        resetHeld = resetDown;

        device.Clear(clearColor);
        DrawScene(device, registry, viewProj);
        device.Present();
    }

    registry.Clear(device);
    device.DestroyPipeline(simple.pipeline);
    device.DestroyPipeline(shaded.pipeline);
    if (device.GetLiveVertexArrayCount() != 0 || device.GetLiveBufferCount() != 0) {
        std::cerr << "Leaked GPU resources: " << device.GetLiveVertexArrayCount() << " vertex array(s), "
                  << device.GetLiveBufferCount() << " buffer(s)" << std::endl;
    }

    device.Shutdown();
    window.Destroy();
    return 0;
}
