#pragma once

#include "kviz/Graphics/Color.hpp"
#include "kviz/Platform/Config.hpp"

#include <glm/vec2.hpp>

#include <filesystem>

namespace kviz { class AppContext; }
namespace kviz { class Scene; }

namespace kviz
{
    // a desktop window that shows (and can record) a scene
    //
    // the window owns an OpenGL 3.3 context, the scene it draws, and a frame recorder.
    // Nothing happens in the background: the caller drives the window by calling
    // `repaint`, which pumps pending events (mouse camera controls, close requests)
    // and redraws the scene once
    //
    // the `AppContext` must outlive the window
    class Window final {
    public:
        explicit Window(AppContext&, WindowParams const& = {});
        Window(Window const&) = delete;
        Window(Window&&) noexcept;
        Window& operator=(Window const&) = delete;
        Window& operator=(Window&&) noexcept;
        ~Window() noexcept;

        Scene const& getScene() const;
        Scene& updScene();

        // false once the user has closed the window
        bool isOpen() const;

        // pump pending events, then redraw + present the scene (no-op if closed)
        void repaint();

        void setBackground(Color const&);

        glm::ivec2 getDimensions() const;

        // starts writing captured frames into the directory
        //
        // the window can't be resized while recording, so every frame has the same dimensions
        void beginRecording(std::filesystem::path const& directory);
        bool isRecording() const;

        // renders the scene and writes it as the next frame of the recording
        void captureFrame();

        // stops the recording and restores the window's resizability
        void endRecording();

        class Impl;
    private:
        Impl* m_Impl;
    };
}
