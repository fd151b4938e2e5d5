#include "RenderablePolicies.hpp"

#include "kviz/Avatar/AvatarStyle.hpp"
#include "kviz/Avatar/FrameData.hpp"
#include "kviz/Graphics/Color.hpp"
#include "kviz/Graphics/Mesh.hpp"
#include "kviz/Graphics/MeshGen.hpp"
#include "kviz/Graphics/MeshTopology.hpp"
#include "kviz/Scene/Actor.hpp"

#include <glm/mat4x4.hpp>
#include <glm/vec3.hpp>
#include <nonstd/span.hpp>

#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace
{
    constexpr size_t c_SphereSectors = 12;
    constexpr size_t c_SphereStacks = 12;

    constexpr std::array<uint32_t, 6> c_RigidFrameIndices = {0, 1, 0, 2, 0, 3};
    constexpr std::array<kviz::Color, 3> c_RigidFrameAxisColors = {kviz::Color::red(), kviz::Color::green(), kviz::Color::blue()};

    std::vector<size_t> VertexCounts(std::vector<kviz::MeshFrame> const& frames)
    {
        std::vector<size_t> rv;
        rv.reserve(frames.size());
        for (kviz::MeshFrame const& frame : frames)
        {
            rv.push_back(frame.vertices.getNumChannels());
        }
        return rv;
    }

    void ValidateMeshFrames(std::vector<kviz::MeshFrame> const& frames, char const* what)
    {
        for (kviz::MeshFrame const& frame : frames)
        {
            kviz::ValidateMeshFrame(frame, what);
        }
    }

    void SetOutlineTopology(kviz::Actor& actor, kviz::MeshFrame const& frame)
    {
        kviz::Mesh& mesh = actor.updMesh();
        mesh.clear();
        std::vector<glm::vec3> const verts(frame.vertices.getNumChannels(), glm::vec3{});
        std::vector<uint32_t> const indices = kviz::OutlineIndices(frame.triangles, verts.size());

        mesh.setTopology(kviz::MeshTopology::Lines);
        mesh.setVerts(verts);
        mesh.setIndices(indices);
    }
}

std::vector<uint32_t> kviz::OutlineIndices(nonstd::span<Triangle const> triangles, size_t numVerts)
{
    std::vector<uint32_t> rv;

    if (triangles.empty())
    {
        if (numVerts < 2)
        {
            return rv;
        }

        for (size_t i = 0; i < numVerts-1; ++i)
        {
            rv.push_back(static_cast<uint32_t>(i));
            rv.push_back(static_cast<uint32_t>(i+1));
        }
        if (numVerts > 2)
        {
            rv.push_back(static_cast<uint32_t>(numVerts-1));
            rv.push_back(0);
        }
        return rv;
    }

    rv.reserve(6 * triangles.size());
    for (Triangle const& t : triangles)
    {
        rv.push_back(t[0]);
        rv.push_back(t[1]);
        rv.push_back(t[1]);
        rv.push_back(t[2]);
        rv.push_back(t[2]);
        rv.push_back(t[0]);
    }
    return rv;
}

std::vector<uint32_t> kviz::SurfaceIndices(nonstd::span<Triangle const> triangles)
{
    std::vector<uint32_t> rv;
    rv.reserve(3 * triangles.size());
    for (Triangle const& t : triangles)
    {
        rv.insert(rv.end(), t.begin(), t.end());
    }
    return rv;
}

std::vector<glm::vec3> kviz::RigidFrameVerts(glm::mat4 const& m, float axisLength)
{
    glm::vec3 const origin{m[3]};
    return
    {
        origin,
        origin + axisLength * glm::vec3{m[0]},
        origin + axisLength * glm::vec3{m[1]},
        origin + axisLength * glm::vec3{m[2]},
    };
}

// PointSpherePolicy

kviz::PointSpherePolicy::PointSpherePolicy() :
    m_UnitSphere{GenUntexturedUVSphere(c_SphereSectors, c_SphereStacks)}
{
}

void kviz::PointSpherePolicy::validate(Frame const& frame) const
{
    ValidateSingleFrame(frame, "points");
}

std::vector<size_t> kviz::PointSpherePolicy::arity(Frame const& frame) const
{
    return {frame.getNumChannels()};
}

size_t kviz::PointSpherePolicy::numActors(Frame const& frame) const
{
    return frame.getNumChannels();
}

void kviz::PointSpherePolicy::initActor(Actor& actor, Frame const&, size_t, CategoryStyle&) const
{
    actor.setMesh(m_UnitSphere);
}

void kviz::PointSpherePolicy::updateActor(Actor& actor, Frame const& frame, size_t i, CategoryStyle const& style) const
{
    glm::vec3 const center = frame.at(i);
    nonstd::span<glm::vec3 const> const unitVerts = m_UnitSphere.getVerts();

    actor.updMesh().transformVerts([&](nonstd::span<glm::vec3> verts)
    {
        for (size_t v = 0; v < verts.size(); ++v)
        {
            verts[v] = center + style.size * unitVerts[v];
        }
    });
}

void kviz::PointSpherePolicy::applyStyle(Actor& actor, CategoryStyle const& style) const
{
    actor.setColor(Color{style.color, style.opacity});
}

// RigidFramePolicy

void kviz::RigidFramePolicy::validate(Frame const& frame) const
{
    ValidateSingleFrame(frame, "rt");
}

std::vector<size_t> kviz::RigidFramePolicy::arity(Frame const& frame) const
{
    return {frame.getNumChannels()};
}

size_t kviz::RigidFramePolicy::numActors(Frame const& frame) const
{
    return frame.getNumChannels();
}

void kviz::RigidFramePolicy::initActor(Actor& actor, Frame const&, size_t, CategoryStyle&) const
{
    Mesh& mesh = actor.updMesh();
    mesh.clear();
    std::vector<glm::vec3> const verts(4, glm::vec3{});

    mesh.setTopology(MeshTopology::Lines);
    mesh.setVerts(verts);
    mesh.setIndices(c_RigidFrameIndices);
    mesh.setCellColors(c_RigidFrameAxisColors);
}

void kviz::RigidFramePolicy::updateActor(Actor& actor, Frame const& frame, size_t i, CategoryStyle const& style) const
{
    std::vector<glm::vec3> const verts = RigidFrameVerts(frame.at(i), style.size);
    actor.updMesh().setVerts(verts);
}

void kviz::RigidFramePolicy::applyStyle(Actor& actor, CategoryStyle const& style) const
{
    actor.setOpacity(style.opacity);
    actor.setLineWidth(style.lineWidth);
}

// SurfaceMeshPolicy

kviz::SurfaceMeshPolicy::SurfaceMeshPolicy(glm::vec3 const& outlineColor) :
    m_OutlineColor{outlineColor}
{
}

void kviz::SurfaceMeshPolicy::validate(Frame const& frames) const
{
    ValidateMeshFrames(frames, "mesh");
}

std::vector<size_t> kviz::SurfaceMeshPolicy::arity(Frame const& frames) const
{
    return VertexCounts(frames);
}

size_t kviz::SurfaceMeshPolicy::numActors(Frame const& frames) const
{
    return frames.size();
}

void kviz::SurfaceMeshPolicy::initActor(Actor& actor, Frame const& frames, size_t i, CategoryStyle& style) const
{
    MeshFrame const& frame = frames[i];

    if (IsOutlineTopology(frame.triangles))
    {
        SetOutlineTopology(actor, frame);
        style.color = m_OutlineColor;
    }
    else
    {
        Mesh& mesh = actor.updMesh();
        mesh.clear();
        std::vector<glm::vec3> const verts(frame.vertices.getNumChannels(), glm::vec3{});
        std::vector<uint32_t> const indices = SurfaceIndices(frame.triangles);

        mesh.setTopology(MeshTopology::Triangles);
        mesh.setVerts(verts);
        mesh.setIndices(indices);
    }
}

void kviz::SurfaceMeshPolicy::updateActor(Actor& actor, Frame const& frames, size_t i, CategoryStyle const&) const
{
    actor.updMesh().setVerts(frames[i].vertices.getSample(0));
}

void kviz::SurfaceMeshPolicy::applyStyle(Actor& actor, CategoryStyle const& style) const
{
    actor.setColor(Color{style.color, style.opacity});
    actor.setLineWidth(style.lineWidth);
}

// OutlinePolicy

void kviz::OutlinePolicy::validate(Frame const& frames) const
{
    ValidateMeshFrames(frames, "outline");
}

std::vector<size_t> kviz::OutlinePolicy::arity(Frame const& frames) const
{
    return VertexCounts(frames);
}

size_t kviz::OutlinePolicy::numActors(Frame const& frames) const
{
    return frames.size();
}

void kviz::OutlinePolicy::initActor(Actor& actor, Frame const& frames, size_t i, CategoryStyle&) const
{
    SetOutlineTopology(actor, frames[i]);
}

void kviz::OutlinePolicy::updateActor(Actor& actor, Frame const& frames, size_t i, CategoryStyle const&) const
{
    actor.updMesh().setVerts(frames[i].vertices.getSample(0));
}

void kviz::OutlinePolicy::applyStyle(Actor& actor, CategoryStyle const& style) const
{
    actor.setColor(Color{style.color, style.opacity});
    actor.setLineWidth(style.lineWidth);
}
