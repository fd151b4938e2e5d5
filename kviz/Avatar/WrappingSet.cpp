#include "WrappingSet.hpp"

#include "kviz/Avatar/AvatarStyle.hpp"
#include "kviz/Avatar/FrameData.hpp"
#include "kviz/Avatar/RenderablePolicies.hpp"
#include "kviz/Graphics/Color.hpp"
#include "kviz/Platform/Log.hpp"
#include "kviz/Scene/Scene.hpp"
#include "kviz/Utils/Assertions.hpp"

#include <cstddef>
#include <memory>
#include <string>
#include <utility>
#include <vector>

kviz::WrappingSet::WrappingSet(Scene& scene, std::string label, CategoryStyle const& style) :
    m_Scene{scene},
    m_Label{std::move(label)},
    m_Style{style}
{
    KVIZ_THROWING_ASSERT(IsValid(m_Style));
}

kviz::WrappingSet::~WrappingSet() noexcept = default;

void kviz::WrappingSet::update(std::vector<std::vector<MeshFrame>> perSegment)
{
    OutlinePolicy const validator{};
    for (auto const& wrappings : perSegment)
    {
        validator.validate(wrappings);
    }

    if (perSegment.size() != m_Segments.size())
    {
        log::debug("%s: number of segments changed from %zu to %zu", m_Label.c_str(), m_Segments.size(), perSegment.size());
    }

    // dropped segments take their actors with them
    if (perSegment.size() < m_Segments.size())
    {
        m_Segments.resize(perSegment.size());
    }
    while (m_Segments.size() < perSegment.size())
    {
        std::string segmentLabel = m_Label + "/segment" + std::to_string(m_Segments.size());
        m_Segments.push_back(std::make_unique<OutlineSet>(m_Scene.get(), std::move(segmentLabel), m_Style));
    }

    for (size_t seg = 0; seg < perSegment.size(); ++seg)
    {
        m_Segments[seg]->update(std::move(perSegment[seg]));
    }
}

kviz::CategoryStyle const& kviz::WrappingSet::getStyle() const
{
    return m_Style;
}

void kviz::WrappingSet::setColor(glm::vec3 const& color)
{
    KVIZ_THROWING_ASSERT(IsNormalizedRGB(color));
    m_Style.color = color;
    for (auto const& segment : m_Segments)
    {
        segment->setColor(color);
    }
}

void kviz::WrappingSet::setOpacity(float opacity)
{
    KVIZ_THROWING_ASSERT(0.0f <= opacity && opacity <= 1.0f);
    m_Style.opacity = opacity;
    for (auto const& segment : m_Segments)
    {
        segment->setOpacity(opacity);
    }
}

void kviz::WrappingSet::setLineWidth(float width)
{
    KVIZ_THROWING_ASSERT(width > 0.0f);
    m_Style.lineWidth = width;
    for (auto const& segment : m_Segments)
    {
        segment->setLineWidth(width);
    }
}

size_t kviz::WrappingSet::getNumSegments() const
{
    return m_Segments.size();
}

kviz::OutlineSet const& kviz::WrappingSet::getSegment(size_t i) const
{
    return *m_Segments.at(i);
}

size_t kviz::WrappingSet::getNumActors() const
{
    size_t rv = 0;
    for (auto const& segment : m_Segments)
    {
        rv += segment->getNumActors();
    }
    return rv;
}
