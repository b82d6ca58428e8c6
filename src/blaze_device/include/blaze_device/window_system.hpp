/**
 * @file window_system.hpp
 * @brief SDL3 OpenGL 窗口：创建/销毁、事件轮询与键盘状态
 *
 * 单窗口场景使用。窗口以 SDL_WINDOW_OPENGL 创建，原生句柄交给 OpenGLRenderDevice 建立上下文；
 * 设备须先于窗口 Shutdown。
 */

#pragma once

#include <cstdint>
#include <string>

#include <SDL3/SDL_scancode.h>
#include <SDL3/SDL_video.h>  // SDL_Window

namespace blaze_device {

/// 窗口配置
struct WindowConfig {
    uint32_t width = 1280;
    uint32_t height = 720;
    std::string title = "Blaze";
    bool fullscreen = false;
    bool resizable = false;
    bool hidden = false;  // 测试用，不显示窗口
};

class WindowSystem {
public:
    WindowSystem() = default;
    ~WindowSystem();

    WindowSystem(const WindowSystem&) = delete;
    WindowSystem& operator=(const WindowSystem&) = delete;

    /// 按 config 创建 OpenGL 窗口；重复调用直接返回 true
    /// \return 失败时 false，GetLastError() 给出 SDL 错误
    bool Create(const WindowConfig& config);

    /// 销毁窗口，并退出由 Create 启动的 SDL 子系统
    void Destroy();

    /// SDL_Window*，作为 DeviceConfig::windowHandle
    void* GetNativeHandle() const;

    uint32_t GetWidth() const;
    uint32_t GetHeight() const;

    /// 处理本帧事件
    /// \return 收到退出或本窗口关闭请求后返回 false
    bool PollEvents();

    bool ShouldClose() const { return shouldClose_; }

    bool IsKeyDown(SDL_Scancode key) const;

    const std::string& GetLastError() const { return lastError_; }

private:
    bool AcquireSDL();
    void ReleaseSDL();
    bool QuerySize(int& width, int& height) const;

    SDL_Window* window_ = nullptr;
    bool shouldClose_ = false;
    bool ownsSDL_ = false;
    std::string lastError_;
};

}  // namespace blaze_device
