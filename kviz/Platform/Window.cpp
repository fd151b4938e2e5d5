#include "Window.hpp"

#include "kviz/Bindings/Gl.hpp"
#include "kviz/Bindings/Sdl2Bindings.hpp"
#include "kviz/Graphics/Color.hpp"
#include "kviz/Graphics/Image.hpp"
#include "kviz/Graphics/SceneRenderer.hpp"
#include "kviz/Maths/PolarPerspectiveCamera.hpp"
#include "kviz/Platform/AppContext.hpp"
#include "kviz/Platform/Config.hpp"
#include "kviz/Platform/FrameRecorder.hpp"
#include "kviz/Platform/Log.hpp"
#include "kviz/Scene/Scene.hpp"

#include <glm/vec2.hpp>

#include <cstdint>
#include <exception>
#include <filesystem>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

// handy macro for calling SDL_GL_SetAttribute with error checking
#define KVIZ_SDL_GL_SetAttribute_CHECK(attr, value)                                                                    \
    {                                                                                                                  \
        int rv = SDL_GL_SetAttribute((attr), (value));                                                                 \
        if (rv != 0) {                                                                                                 \
            throw std::runtime_error{std::string{"SDL_GL_SetAttribute failed when setting " #attr " = " #value " : "} +            \
                                     SDL_GetError()};                                                                  \
        }                                                                                                              \
    }

namespace
{
    sdl::Window CreateMainWindow(kviz::WindowParams const& params)
    {
        kviz::log::info("initializing window (OpenGL 3.3, %dx%d)", params.width, params.height);

        KVIZ_SDL_GL_SetAttribute_CHECK(SDL_GL_CONTEXT_PROFILE_MASK, SDL_GL_CONTEXT_PROFILE_CORE);
        KVIZ_SDL_GL_SetAttribute_CHECK(SDL_GL_CONTEXT_MAJOR_VERSION, 3);
        KVIZ_SDL_GL_SetAttribute_CHECK(SDL_GL_CONTEXT_MINOR_VERSION, 3);
        KVIZ_SDL_GL_SetAttribute_CHECK(SDL_GL_DEPTH_SIZE, 24);
        KVIZ_SDL_GL_SetAttribute_CHECK(SDL_GL_DOUBLEBUFFER, 1);

        constexpr int x = SDL_WINDOWPOS_CENTERED;
        constexpr int y = SDL_WINDOWPOS_CENTERED;
        constexpr Uint32 flags = SDL_WINDOW_OPENGL | SDL_WINDOW_SHOWN | SDL_WINDOW_RESIZABLE;

        return sdl::CreateWindoww(params.title.c_str(), x, y, params.width, params.height, flags);
    }

    // create an OpenGL context for a window
    sdl::GLContext CreateOpenGLContext(SDL_Window* window)
    {
        kviz::log::info("initializing OpenGL context");

        sdl::GLContext ctx = sdl::GL_CreateContext(window);

        // enable the context
        if (SDL_GL_MakeCurrent(window, ctx) != 0)
        {
            throw std::runtime_error{std::string{"SDL_GL_MakeCurrent failed: "} + SDL_GetError()};
        }

        // enable vsync by default
        if (SDL_GL_SetSwapInterval(-1) != 0)
        {
            SDL_GL_SetSwapInterval(1);
        }

        // initialize GLEW
        //
        // effectively, enables the OpenGL API used by this application
        glewExperimental = GL_TRUE;
        if (auto const err = glewInit(); err != GLEW_OK)
        {
            std::stringstream ss;
            ss << "glewInit() failed: ";
            ss << glewGetErrorString(err);
            throw std::runtime_error{ss.str()};
        }

        kviz::log::info(
            "OpenGL initialized: info: %s, %s, (%s), GLSL %s",
            glGetString(GL_VENDOR),
            glGetString(GL_RENDERER),
            glGetString(GL_VERSION),
            glGetString(GL_SHADING_LANGUAGE_VERSION)
        );

        return ctx;
    }
}

class kviz::Window::Impl final {
public:
    explicit Impl(WindowParams const& params) :
        m_SDLWindow{CreateMainWindow(params)},
        m_GLContext{CreateOpenGLContext(m_SDLWindow)}
    {
        m_Scene.setBackgroundColor(params.background);
    }

    Impl(Impl const&) = delete;
    Impl(Impl&&) noexcept = delete;
    Impl& operator=(Impl const&) = delete;
    Impl& operator=(Impl&&) noexcept = delete;

    ~Impl() noexcept
    {
        if (m_Recorder.isRecording())
        {
            log::warn("window destroyed while recording: ending the recording");
            m_Recorder.end();
        }
    }

    Scene const& getScene() const
    {
        return m_Scene;
    }

    Scene& updScene()
    {
        return m_Scene;
    }

    bool isOpen() const
    {
        return m_IsOpen;
    }

    void repaint()
    {
        if (!m_IsOpen)
        {
            return;
        }

        pumpEvents();

        if (!m_IsOpen)
        {
            return;
        }

        render();
        SDL_GL_SwapWindow(m_SDLWindow);
    }

    void setBackground(Color const& color)
    {
        m_Scene.setBackgroundColor(color);
    }

    glm::ivec2 getDimensions() const
    {
        auto [w, h] = sdl::GetWindowSize(m_SDLWindow);
        return glm::ivec2{w, h};
    }

    void beginRecording(std::filesystem::path const& directory)
    {
        m_Recorder.begin(directory);
        m_WasResizableBeforeRecording = (SDL_GetWindowFlags(m_SDLWindow) & SDL_WINDOW_RESIZABLE) != 0;
        SDL_SetWindowResizable(m_SDLWindow, SDL_FALSE);
    }

    bool isRecording() const
    {
        return m_Recorder.isRecording();
    }

    void captureFrame()
    {
        if (!m_Recorder.isRecording())
        {
            throw std::runtime_error{"cannot capture a frame: the window is not recording"};
        }

        // render into the back buffer and read it back before it is presented
        render();

        auto [w, h] = sdl::GL_GetDrawableSize(m_SDLWindow);
        std::vector<uint8_t> pixels(static_cast<size_t>(w) * static_cast<size_t>(h) * 4);
        glPixelStorei(GL_PACK_ALIGNMENT, 1);
        glReadBuffer(GL_BACK);
        glReadPixels(0, 0, w, h, GL_RGBA, GL_UNSIGNED_BYTE, pixels.data());

        m_Recorder.capture(Image{glm::ivec2{w, h}, pixels, 4});
    }

    void endRecording()
    {
        m_Recorder.end();
        SDL_SetWindowResizable(m_SDLWindow, m_WasResizableBeforeRecording ? SDL_TRUE : SDL_FALSE);
    }

private:
    void render()
    {
        SDL_GL_MakeCurrent(m_SDLWindow, m_GLContext);

        m_Scene.applyPendingCameraReset();

        auto [w, h] = sdl::GL_GetDrawableSize(m_SDLWindow);
        m_Renderer.draw(m_Scene, glm::ivec2{w, h});
    }

    void pumpEvents()
    {
        sdl::Event e{};
        while (SDL_PollEvent(&e))
        {
            if (e.type == SDL_QUIT)
            {
                m_IsOpen = false;
            }
            else if (e.type == SDL_WINDOWEVENT && e.window.event == SDL_WINDOWEVENT_CLOSE)
            {
                m_IsOpen = false;
            }
            else if (e.type == SDL_MOUSEMOTION)
            {
                onMouseMotion(e.motion);
            }
            else if (e.type == SDL_MOUSEWHEEL)
            {
                if (e.wheel.y > 0)
                {
                    ZoomIn(m_Scene.updCamera());
                }
                else if (e.wheel.y < 0)
                {
                    ZoomOut(m_Scene.updCamera());
                }
            }
        }
    }

    void onMouseMotion(SDL_MouseMotionEvent const& motion)
    {
        glm::vec2 const dims{getDimensions()};
        if (dims.x <= 0.0f || dims.y <= 0.0f)
        {
            return;
        }

        glm::vec2 const delta = glm::vec2{static_cast<float>(motion.xrel), static_cast<float>(motion.yrel)} / dims;
        PolarPerspectiveCamera& camera = m_Scene.updCamera();

        if (motion.state & SDL_BUTTON_LMASK)
        {
            camera.drag(delta);
        }
        else if (motion.state & SDL_BUTTON_RMASK)
        {
            camera.pan(dims.x / dims.y, delta);
        }
    }

    sdl::Window m_SDLWindow;
    sdl::GLContext m_GLContext;
    SceneRenderer m_Renderer;
    Scene m_Scene;
    FrameRecorder m_Recorder;
    bool m_IsOpen = true;
    bool m_WasResizableBeforeRecording = true;
};

kviz::Window::Window(AppContext&, WindowParams const& params) :
    m_Impl{new Impl{params}}
{
}

kviz::Window::Window(Window&& tmp) noexcept :
    m_Impl{std::exchange(tmp.m_Impl, nullptr)}
{
}

kviz::Window& kviz::Window::operator=(Window&& tmp) noexcept
{
    std::swap(m_Impl, tmp.m_Impl);
    return *this;
}

kviz::Window::~Window() noexcept
{
    delete m_Impl;
}

kviz::Scene const& kviz::Window::getScene() const
{
    return m_Impl->getScene();
}

kviz::Scene& kviz::Window::updScene()
{
    return m_Impl->updScene();
}

bool kviz::Window::isOpen() const
{
    return m_Impl->isOpen();
}

void kviz::Window::repaint()
{
    m_Impl->repaint();
}

void kviz::Window::setBackground(Color const& color)
{
    m_Impl->setBackground(color);
}

glm::ivec2 kviz::Window::getDimensions() const
{
    return m_Impl->getDimensions();
}

void kviz::Window::beginRecording(std::filesystem::path const& directory)
{
    m_Impl->beginRecording(directory);
}

bool kviz::Window::isRecording() const
{
    return m_Impl->isRecording();
}

void kviz::Window::captureFrame()
{
    m_Impl->captureFrame();
}

void kviz::Window::endRecording()
{
    m_Impl->endRecording();
}
