#pragma once

#include "kviz/Graphics/Color.hpp"
#include "kviz/Maths/AABB.hpp"
#include "kviz/Maths/PolarPerspectiveCamera.hpp"

#include <nonstd/span.hpp>

#include <cstddef>
#include <memory>
#include <optional>
#include <string_view>
#include <vector>

namespace kviz { class Actor; }

namespace kviz
{
    // the collection of actors that a window draws, plus the camera that views them
    //
    // the scene shares ownership of its actors with whatever created them (usually a
    // renderable set). Camera resets are *requested* by callers and applied lazily
    // (usually by the window, just before drawing), so that many requests in one
    // frame only fit the camera once
    class Scene final {
    public:
        Scene();

        // throws if the actor is null or already in the scene
        void addActor(std::shared_ptr<Actor>);

        // returns false if the actor wasn't in the scene
        bool removeActor(Actor const&);

        bool containsActor(Actor const&) const;
        size_t getNumActors() const;
        nonstd::span<std::shared_ptr<Actor> const> getActors() const;

        // returns the first actor with the given label, or nullptr
        std::shared_ptr<Actor> findActorByLabel(std::string_view) const;

        void requestCameraReset();
        bool isCameraResetPending() const;

        // monotonically increasing count of all camera reset requests (handy for tests/diagnostics)
        size_t getNumCameraResetRequests() const;

        // if a reset is pending, focuses the camera on the bounds of all actors and clears the request
        void applyPendingCameraReset();

        // union of the bounds of every actor's mesh, if any actor has vertices
        std::optional<AABB> getBounds() const;

        PolarPerspectiveCamera const& getCamera() const;
        PolarPerspectiveCamera& updCamera();

        Color const& getBackgroundColor() const;
        void setBackgroundColor(Color const&);

        // a scene gets at most one global reference frame in its lifetime, even if the
        // frame's actor is later removed
        bool hasGlobalReferenceFrame() const;

        // throws if the scene already had a global reference frame
        void markGlobalReferenceFrameCreated();

    private:
        std::vector<std::shared_ptr<Actor>> m_Actors;
        PolarPerspectiveCamera m_Camera;
        Color m_BackgroundColor = Color::black();
        bool m_CameraResetPending = false;
        size_t m_NumCameraResetRequests = 0;
        bool m_HasGlobalReferenceFrame = false;
    };
}
