#pragma once

#include "kviz/Avatar/AvatarStyle.hpp"
#include "kviz/Avatar/FrameData.hpp"
#include "kviz/Avatar/RenderableSet.hpp"
#include "kviz/Graphics/Mesh.hpp"

#include <glm/mat4x4.hpp>
#include <glm/vec3.hpp>
#include <nonstd/span.hpp>

#include <cstddef>
#include <cstdint>
#include <vector>

namespace kviz { class Actor; }

// category plugins for `RenderableSet`

namespace kviz
{
    // one sphere (radius = style size) per point
    class PointSpherePolicy final {
    public:
        using Frame = PointSet;
        static constexpr bool restyleOnUpdate = true;

        PointSpherePolicy();

        void validate(Frame const&) const;
        std::vector<size_t> arity(Frame const&) const;
        size_t numActors(Frame const&) const;
        void initActor(Actor&, Frame const&, size_t, CategoryStyle&) const;
        void updateActor(Actor&, Frame const&, size_t, CategoryStyle const&) const;
        void applyStyle(Actor&, CategoryStyle const&) const;

    private:
        Mesh m_UnitSphere;
    };

    // one red/green/blue axis star per rigid transform (axis length = style size)
    class RigidFramePolicy final {
    public:
        using Frame = RigidTransformSet;
        static constexpr bool restyleOnUpdate = false;

        void validate(Frame const&) const;
        std::vector<size_t> arity(Frame const&) const;
        size_t numActors(Frame const&) const;
        void initActor(Actor&, Frame const&, size_t, CategoryStyle&) const;
        void updateActor(Actor&, Frame const&, size_t, CategoryStyle const&) const;
        void applyStyle(Actor&, CategoryStyle const&) const;
    };

    // one actor per mesh part: a triangulated surface, or a black outline if the
    // part's triangle table describes an outline (see `IsOutlineTopology`)
    class SurfaceMeshPolicy final {
    public:
        using Frame = std::vector<MeshFrame>;
        static constexpr bool restyleOnUpdate = false;

        explicit SurfaceMeshPolicy(glm::vec3 const& outlineColor = {0.0f, 0.0f, 0.0f});

        void validate(Frame const&) const;
        std::vector<size_t> arity(Frame const&) const;
        size_t numActors(Frame const&) const;
        void initActor(Actor&, Frame const&, size_t, CategoryStyle&) const;
        void updateActor(Actor&, Frame const&, size_t, CategoryStyle const&) const;
        void applyStyle(Actor&, CategoryStyle const&) const;

    private:
        glm::vec3 m_OutlineColor;
    };

    // one closed-loop polyline actor per sub-entity (muscles, wrapping surfaces)
    class OutlinePolicy final {
    public:
        using Frame = std::vector<MeshFrame>;
        static constexpr bool restyleOnUpdate = false;

        void validate(Frame const&) const;
        std::vector<size_t> arity(Frame const&) const;
        size_t numActors(Frame const&) const;
        void initActor(Actor&, Frame const&, size_t, CategoryStyle&) const;
        void updateActor(Actor&, Frame const&, size_t, CategoryStyle const&) const;
        void applyStyle(Actor&, CategoryStyle const&) const;
    };

    using PointSphereSet = RenderableSet<PointSpherePolicy>;
    using RigidFrameSet = RenderableSet<RigidFramePolicy>;
    using SurfaceMeshSet = RenderableSet<SurfaceMeshPolicy>;
    using OutlineSet = RenderableSet<OutlinePolicy>;

    // returns line-segment indices that draw one closed loop per triangle row
    //
    // if there are no triangles, returns a single closed loop through all vertices, in order
    std::vector<uint32_t> OutlineIndices(nonstd::span<Triangle const>, size_t numVerts);

    // returns triangle indices for the given triangle table
    std::vector<uint32_t> SurfaceIndices(nonstd::span<Triangle const>);

    // vertices of a rigid-frame star: origin, then the X, Y and Z axis tips
    std::vector<glm::vec3> RigidFrameVerts(glm::mat4 const&, float axisLength);
}
