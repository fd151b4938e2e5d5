#pragma once

#include <glm/vec2.hpp>

#include <memory>

namespace kviz { class Scene; }

namespace kviz
{
    // draws a scene's actors into the currently-bound framebuffer
    //
    // must be constructed, used, and destroyed while an OpenGL (3.3 core) context is current.
    // GPU-side copies of actor meshes are cached and re-uploaded only when a mesh's
    // version changes
    class SceneRenderer final {
    public:
        SceneRenderer();
        SceneRenderer(SceneRenderer const&) = delete;
        SceneRenderer(SceneRenderer&&) noexcept;
        SceneRenderer& operator=(SceneRenderer const&) = delete;
        SceneRenderer& operator=(SceneRenderer&&) noexcept;
        ~SceneRenderer() noexcept;

        void draw(Scene const&, glm::ivec2 viewportDimensions);

        class Impl;
    private:
        std::unique_ptr<Impl> m_Impl;
    };
}
