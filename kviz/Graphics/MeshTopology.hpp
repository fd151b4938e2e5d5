#pragma once

#include <cstddef>
#include <cstdint>
#include <iosfwd>

namespace kviz
{
    // which primitive geometry the mesh data represents
    enum class MeshTopology : int32_t {
        Triangles = 0,
        Lines,
        TOTAL,
    };

    // number of indices that make up one primitive of the topology
    constexpr size_t NumIndicesPerPrimitive(MeshTopology t) noexcept
    {
        return t == MeshTopology::Lines ? 2 : 3;
    }

    std::ostream& operator<<(std::ostream&, MeshTopology);
}
