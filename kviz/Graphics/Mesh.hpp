#pragma once

#include "kviz/Graphics/Color.hpp"
#include "kviz/Graphics/MeshTopology.hpp"
#include "kviz/Maths/AABB.hpp"
#include "kviz/Utils/UID.hpp"

#include <glm/vec3.hpp>
#include <nonstd/span.hpp>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <iosfwd>
#include <optional>
#include <vector>

namespace kviz
{
    // mesh
    //
    // CPU-side indexed geometry (worldspace vertices + primitive indices) that an
    // actor hands to the renderer. Every mutation bumps the mesh's version, which
    // is how the renderer knows that it has to re-upload the data
    class Mesh final {
    public:
        Mesh() = default;

        MeshTopology getTopology() const;
        void setTopology(MeshTopology);

        nonstd::span<glm::vec3 const> getVerts() const;
        void setVerts(nonstd::span<glm::vec3 const>);
        void transformVerts(std::function<void(nonstd::span<glm::vec3>)> const&);

        nonstd::span<uint32_t const> getIndices() const;
        void setIndices(nonstd::span<uint32_t const>);

        // optional per-primitive colors (e.g. one color per line segment)
        //
        // if empty, the mesh is drawn with its actor's color
        nonstd::span<Color const> getCellColors() const;
        void setCellColors(nonstd::span<Color const>);

        // number of primitives (triangles or lines) described by the indices
        size_t getNumPrimitives() const;

        // worldspace bounds of the vertices, if there are any
        std::optional<AABB> getBounds() const;

        UID getVersion() const;

        void clear();

        friend bool operator==(Mesh const&, Mesh const&) noexcept;
        friend bool operator!=(Mesh const&, Mesh const&) noexcept;

    private:
        MeshTopology m_Topology = MeshTopology::Triangles;
        std::vector<glm::vec3> m_Verts;
        std::vector<uint32_t> m_Indices;
        std::vector<Color> m_CellColors;
        UID m_Version;
    };

    std::ostream& operator<<(std::ostream&, Mesh const&);
}
