#include "Mesh.hpp"

#include "kviz/Maths/AABB.hpp"

#include <glm/vec3.hpp>
#include <nonstd/span.hpp>

#include <iostream>
#include <optional>

std::ostream& kviz::operator<<(std::ostream& o, MeshTopology t)
{
    switch (t)
    {
    case MeshTopology::Triangles:
        return o << "Triangles";
    case MeshTopology::Lines:
        return o << "Lines";
    default:
        return o << "Unknown";
    }
}

kviz::MeshTopology kviz::Mesh::getTopology() const
{
    return m_Topology;
}

void kviz::Mesh::setTopology(MeshTopology t)
{
    m_Topology = t;
    m_Version.reset();
}

nonstd::span<glm::vec3 const> kviz::Mesh::getVerts() const
{
    return m_Verts;
}

void kviz::Mesh::setVerts(nonstd::span<glm::vec3 const> vs)
{
    m_Verts.assign(vs.begin(), vs.end());
    m_Version.reset();
}

void kviz::Mesh::transformVerts(std::function<void(nonstd::span<glm::vec3>)> const& f)
{
    f(m_Verts);
    m_Version.reset();
}

nonstd::span<uint32_t const> kviz::Mesh::getIndices() const
{
    return m_Indices;
}

void kviz::Mesh::setIndices(nonstd::span<uint32_t const> indices)
{
    m_Indices.assign(indices.begin(), indices.end());
    m_Version.reset();
}

nonstd::span<kviz::Color const> kviz::Mesh::getCellColors() const
{
    return m_CellColors;
}

void kviz::Mesh::setCellColors(nonstd::span<Color const> colors)
{
    m_CellColors.assign(colors.begin(), colors.end());
    m_Version.reset();
}

size_t kviz::Mesh::getNumPrimitives() const
{
    return m_Indices.size() / NumIndicesPerPrimitive(m_Topology);
}

std::optional<kviz::AABB> kviz::Mesh::getBounds() const
{
    return MaybeAABBFromVerts(m_Verts);
}

kviz::UID kviz::Mesh::getVersion() const
{
    return m_Version;
}

void kviz::Mesh::clear()
{
    m_Topology = MeshTopology::Triangles;
    m_Verts.clear();
    m_Indices.clear();
    m_CellColors.clear();
    m_Version.reset();
}

bool kviz::operator==(Mesh const& a, Mesh const& b) noexcept
{
    return
        a.m_Topology == b.m_Topology &&
        a.m_Verts == b.m_Verts &&
        a.m_Indices == b.m_Indices &&
        a.m_CellColors == b.m_CellColors;
}

bool kviz::operator!=(Mesh const& a, Mesh const& b) noexcept
{
    return !(a == b);
}

std::ostream& kviz::operator<<(std::ostream& o, Mesh const& m)
{
    return o << "Mesh(topology = " << m.getTopology() << ", nverts = " << m.getVerts().size() << ", nprimitives = " << m.getNumPrimitives() << ')';
}
