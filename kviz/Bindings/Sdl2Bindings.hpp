#pragma once

#include <SDL.h>
#undef main
#include <glm/vec2.hpp>

#include <stdexcept>
#include <string>

// sdl wrapper: thin C++ wrappers around SDL
//
// Code in here should:
//
//   - Roughly map 1:1 with SDL
//   - Add RAII to types that have destruction methods
//     (e.g. `SDL_DestroyWindow`)
//   - Use exceptions to enforce basic invariants (e.g. CreateWindow should
//     work or throw)

namespace sdl
{
    // RAII wrapper for SDL_Init and SDL_Quit
    //     https://wiki.libsdl.org/SDL_Quit
    class Context final {
    public:
        explicit Context(Uint32 flags)
        {
            if (SDL_Init(flags) != 0)
            {
                throw std::runtime_error{std::string{"SDL_Init: failed: "} + SDL_GetError()};
            }
        }
        Context(Context const&) = delete;
        Context(Context&&) = delete;
        Context& operator=(Context const&) = delete;
        Context& operator=(Context&&) = delete;
        ~Context() noexcept
        {
            SDL_Quit();
        }
    };

    // RAII wrapper around SDL_Window that calls SDL_DestroyWindow on dtor
    //     https://wiki.libsdl.org/SDL_CreateWindow
    //     https://wiki.libsdl.org/SDL_DestroyWindow
    class Window final {
    public:
        Window(Window const&) = delete;
        Window(Window&& tmp) noexcept : m_WindowHandle{tmp.m_WindowHandle}
        {
            tmp.m_WindowHandle = nullptr;
        }
        Window& operator=(Window const&) = delete;
        Window& operator=(Window&&) = delete;
        ~Window() noexcept
        {
            if (m_WindowHandle)
            {
                SDL_DestroyWindow(m_WindowHandle);
            }
        }
        operator SDL_Window*() const noexcept
        {
            return m_WindowHandle;
        }

    private:
        friend Window CreateWindoww(const char* title, int x, int y, int w, int h, Uint32 flags);
        explicit Window(SDL_Window* ptr) : m_WindowHandle{ptr}
        {
        }

        SDL_Window* m_WindowHandle;
    };

    // RAII'ed version of SDL_CreateWindow
    //     https://wiki.libsdl.org/SDL_CreateWindow
    //
    // CreateWindoww is a typo because `CreateWindow` is defined in the
    // preprocessor
    inline Window CreateWindoww(const char* title, int x, int y, int w, int h, Uint32 flags)
    {
        SDL_Window* win = SDL_CreateWindow(title, x, y, w, h, flags);

        if (win == nullptr)
        {
            throw std::runtime_error{std::string{"SDL_CreateWindow failed: "} + SDL_GetError()};
        }

        return Window{win};
    }

    // RAII wrapper around SDL_GLContext that calls SDL_GL_DeleteContext on dtor
    //     https://wiki.libsdl.org/SDL_GL_DeleteContext
    class GLContext final {
    public:
        GLContext(GLContext const&) = delete;
        GLContext(GLContext&& tmp) noexcept : m_ContextHandle{tmp.m_ContextHandle}
        {
            tmp.m_ContextHandle = nullptr;
        }
        GLContext& operator=(GLContext const&) = delete;
        GLContext& operator=(GLContext&&) = delete;
        ~GLContext() noexcept
        {
            if (m_ContextHandle)
            {
                SDL_GL_DeleteContext(m_ContextHandle);
            }
        }

        operator SDL_GLContext() noexcept
        {
            return m_ContextHandle;
        }
    private:
        friend GLContext GL_CreateContext(SDL_Window* w);
        explicit GLContext(SDL_GLContext ctx) : m_ContextHandle{ctx}
        {
        }

        SDL_GLContext m_ContextHandle;
    };

    // https://wiki.libsdl.org/SDL_GL_CreateContext
    inline GLContext GL_CreateContext(SDL_Window* w)
    {
        SDL_GLContext ctx = SDL_GL_CreateContext(w);

        if (ctx == nullptr)
        {
            throw std::runtime_error{std::string{"SDL_GL_CreateContext failed: "} + SDL_GetError()};
        }

        return GLContext{ctx};
    }

    struct WindowDimensions {
        int w;
        int h;

        operator glm::vec2() const noexcept
        {
            return {w, h};
        }
    };

    inline bool operator==(WindowDimensions const& a, WindowDimensions const& b) noexcept
    {
        return a.w == b.w && a.h == b.h;
    }

    inline bool operator!=(WindowDimensions const& a, WindowDimensions const& b) noexcept
    {
        return !(a == b);
    }

    // https://wiki.libsdl.org/SDL_GetWindowSize
    inline WindowDimensions GetWindowSize(SDL_Window* window)
    {
        WindowDimensions d;
        SDL_GetWindowSize(window, &d.w, &d.h);
        return d;
    }

    // https://wiki.libsdl.org/SDL_GL_GetDrawableSize
    inline WindowDimensions GL_GetDrawableSize(SDL_Window* window)
    {
        WindowDimensions d;
        SDL_GL_GetDrawableSize(window, &d.w, &d.h);
        return d;
    }

    using Event = SDL_Event;
}
