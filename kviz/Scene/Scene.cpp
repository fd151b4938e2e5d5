#include "Scene.hpp"

#include "kviz/Maths/AABB.hpp"
#include "kviz/Maths/Constants.hpp"
#include "kviz/Maths/PolarPerspectiveCamera.hpp"
#include "kviz/Scene/Actor.hpp"
#include "kviz/Utils/Assertions.hpp"

#include <nonstd/span.hpp>

#include <algorithm>
#include <memory>
#include <optional>
#include <string_view>
#include <utility>

kviz::Scene::Scene()
{
    m_Camera.theta = fpi4;
    m_Camera.phi = fpi4;
}

void kviz::Scene::addActor(std::shared_ptr<Actor> actor)
{
    KVIZ_THROWING_ASSERT(actor != nullptr);
    KVIZ_THROWING_ASSERT(!containsActor(*actor));

    m_Actors.push_back(std::move(actor));
}

bool kviz::Scene::removeActor(Actor const& actor)
{
    auto const it = std::find_if(m_Actors.begin(), m_Actors.end(), [id = actor.getID()](auto const& a)
    {
        return a->getID() == id;
    });

    if (it == m_Actors.end())
    {
        return false;
    }

    m_Actors.erase(it);
    return true;
}

bool kviz::Scene::containsActor(Actor const& actor) const
{
    return std::any_of(m_Actors.begin(), m_Actors.end(), [id = actor.getID()](auto const& a)
    {
        return a->getID() == id;
    });
}

size_t kviz::Scene::getNumActors() const
{
    return m_Actors.size();
}

nonstd::span<std::shared_ptr<kviz::Actor> const> kviz::Scene::getActors() const
{
    return m_Actors;
}

std::shared_ptr<kviz::Actor> kviz::Scene::findActorByLabel(std::string_view label) const
{
    auto const it = std::find_if(m_Actors.begin(), m_Actors.end(), [label](auto const& a)
    {
        return a->getLabel() == label;
    });
    return it != m_Actors.end() ? *it : nullptr;
}

void kviz::Scene::requestCameraReset()
{
    m_CameraResetPending = true;
    ++m_NumCameraResetRequests;
}

bool kviz::Scene::isCameraResetPending() const
{
    return m_CameraResetPending;
}

size_t kviz::Scene::getNumCameraResetRequests() const
{
    return m_NumCameraResetRequests;
}

void kviz::Scene::applyPendingCameraReset()
{
    if (!m_CameraResetPending)
    {
        return;
    }

    if (std::optional<AABB> const bounds = getBounds())
    {
        AutoFocus(m_Camera, *bounds);
    }
    m_CameraResetPending = false;
}

std::optional<kviz::AABB> kviz::Scene::getBounds() const
{
    std::optional<AABB> rv;
    for (auto const& actor : m_Actors)
    {
        if (std::optional<AABB> const actorBounds = actor->getMesh().getBounds())
        {
            rv = rv ? Union(*rv, *actorBounds) : *actorBounds;
        }
    }
    return rv;
}

kviz::PolarPerspectiveCamera const& kviz::Scene::getCamera() const
{
    return m_Camera;
}

kviz::PolarPerspectiveCamera& kviz::Scene::updCamera()
{
    return m_Camera;
}

kviz::Color const& kviz::Scene::getBackgroundColor() const
{
    return m_BackgroundColor;
}

void kviz::Scene::setBackgroundColor(Color const& color)
{
    m_BackgroundColor = color;
}

bool kviz::Scene::hasGlobalReferenceFrame() const
{
    return m_HasGlobalReferenceFrame;
}

void kviz::Scene::markGlobalReferenceFrameCreated()
{
    KVIZ_THROWING_ASSERT(!m_HasGlobalReferenceFrame);
    m_HasGlobalReferenceFrame = true;
}
