/**
 * @file window_system.cpp
 * @brief WindowSystem 实现
 */

#include <blaze_device/window_system.hpp>

#include <SDL3/SDL_error.h>
#include <SDL3/SDL_events.h>
#include <SDL3/SDL_init.h>
#include <SDL3/SDL_keyboard.h>
#include <SDL3/SDL_video.h>

namespace blaze_device {

namespace {

constexpr SDL_InitFlags kRequiredSubsystems = SDL_INIT_VIDEO | SDL_INIT_EVENTS;

SDL_WindowFlags ToWindowFlags(const WindowConfig& config) {
    SDL_WindowFlags flags = SDL_WINDOW_OPENGL;
    if (config.resizable) flags |= SDL_WINDOW_RESIZABLE;
    if (config.fullscreen) flags |= SDL_WINDOW_FULLSCREEN;
    if (config.hidden) flags |= SDL_WINDOW_HIDDEN;
    return flags;
}

}  // namespace

WindowSystem::~WindowSystem() {
    Destroy();
}

bool WindowSystem::AcquireSDL() {
    if ((SDL_WasInit(kRequiredSubsystems) & kRequiredSubsystems) == kRequiredSubsystems)
        return true;
    if (!SDL_InitSubSystem(kRequiredSubsystems)) {
        lastError_ = std::string("SDL_InitSubSystem: ") + SDL_GetError();
        return false;
    }
    ownsSDL_ = true;
    return true;
}

void WindowSystem::ReleaseSDL() {
    if (!ownsSDL_) return;
    SDL_QuitSubSystem(kRequiredSubsystems);
    ownsSDL_ = false;
}

bool WindowSystem::Create(const WindowConfig& config) {
    if (window_) return true;
    if (!AcquireSDL()) return false;

    window_ = SDL_CreateWindow(config.title.c_str(), static_cast<int>(config.width),
                               static_cast<int>(config.height), ToWindowFlags(config));
    if (!window_) {
        lastError_ = std::string("SDL_CreateWindow: ") + SDL_GetError();
        ReleaseSDL();
        return false;
    }
    shouldClose_ = false;
    lastError_.clear();
    return true;
}

void WindowSystem::Destroy() {
    if (window_) {
        SDL_DestroyWindow(window_);
        window_ = nullptr;
    }
    shouldClose_ = false;
    ReleaseSDL();
}

void* WindowSystem::GetNativeHandle() const {
    return window_;
}

bool WindowSystem::QuerySize(int& width, int& height) const {
    width = 0;
    height = 0;
    return window_ && SDL_GetWindowSize(window_, &width, &height);
}

uint32_t WindowSystem::GetWidth() const {
    int w = 0, h = 0;
    if (!QuerySize(w, h) || w < 0) return 0;
    return static_cast<uint32_t>(w);
}

uint32_t WindowSystem::GetHeight() const {
    int w = 0, h = 0;
    if (!QuerySize(w, h) || h < 0) return 0;
    return static_cast<uint32_t>(h);
}

bool WindowSystem::PollEvents() {
    SDL_Event event;
    while (SDL_PollEvent(&event)) {
        switch (event.type) {
            case SDL_EVENT_QUIT:
                shouldClose_ = true;
                break;
            case SDL_EVENT_WINDOW_CLOSE_REQUESTED:
                if (window_ && event.window.windowID == SDL_GetWindowID(window_))
                    shouldClose_ = true;
                break;
            default:
                break;
        }
    }
    return !shouldClose_;
}

bool WindowSystem::IsKeyDown(SDL_Scancode key) const {
    int numKeys = 0;
    const bool* state = SDL_GetKeyboardState(&numKeys);
    if (!state || static_cast<int>(key) < 0 || static_cast<int>(key) >= numKeys) return false;
    return state[key];
}

}  // namespace blaze_device
