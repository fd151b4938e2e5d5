#pragma once

#include "kviz/Graphics/Color.hpp"
#include "kviz/Graphics/Mesh.hpp"
#include "kviz/Utils/UID.hpp"

#include <string>

namespace kviz
{
    // a renderable scene object
    //
    // actors are identity-bearing (each has its own ID), so they are not copyable and
    // are usually shared between their owner and the scene via `std::shared_ptr`
    class Actor final {
    public:
        Actor() = default;
        explicit Actor(std::string label);
        Actor(Actor const&) = delete;
        Actor(Actor&&) noexcept = delete;
        Actor& operator=(Actor const&) = delete;
        Actor& operator=(Actor&&) noexcept = delete;
        ~Actor() noexcept = default;

        UID getID() const { return m_ID; }

        std::string const& getLabel() const { return m_Label; }
        void setLabel(std::string);

        Mesh const& getMesh() const { return m_Mesh; }
        Mesh& updMesh() { return m_Mesh; }
        void setMesh(Mesh);

        // color of the actor, where alpha is the actor's opacity
        Color const& getColor() const { return m_Color; }
        void setColor(Color const&);

        float getOpacity() const { return m_Color.a; }
        void setOpacity(float);

        float getLineWidth() const { return m_LineWidth; }
        void setLineWidth(float);

    private:
        UID m_ID;
        std::string m_Label;
        Mesh m_Mesh;
        Color m_Color = Color::white();
        float m_LineWidth = 1.0f;
    };
}
