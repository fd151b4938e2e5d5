#include "Actor.hpp"

#include <string>
#include <utility>

kviz::Actor::Actor(std::string label) :
    m_Label{std::move(label)}
{
}

void kviz::Actor::setLabel(std::string label)
{
    m_Label = std::move(label);
}

void kviz::Actor::setMesh(Mesh mesh)
{
    m_Mesh = std::move(mesh);
}

void kviz::Actor::setColor(Color const& color)
{
    m_Color = color;
}

void kviz::Actor::setOpacity(float opacity)
{
    m_Color.a = opacity;
}

void kviz::Actor::setLineWidth(float width)
{
    m_LineWidth = width;
}
