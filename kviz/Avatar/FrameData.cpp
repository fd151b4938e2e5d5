#include "FrameData.hpp"

#include "kviz/Avatar/Errors.hpp"

#include <nonstd/span.hpp>

#include <algorithm>
#include <sstream>
#include <utility>

void kviz::ValidateMeshFrame(MeshFrame const& frame, char const* what)
{
    ValidateSingleFrame(frame.vertices, what);

    size_t const numVerts = frame.vertices.getNumChannels();
    for (size_t i = 0; i < frame.triangles.size(); ++i)
    {
        for (uint32_t idx : frame.triangles[i])
        {
            if (idx >= numVerts)
            {
                std::stringstream ss;
                ss << what << ": triangle " << i << " references vertex " << idx << ", but there are only " << numVerts << " vertices";
                throw TypeInputError{std::move(ss).str()};
            }
        }
    }
}

bool kviz::IsOutlineTopology(nonstd::span<Triangle const> triangles)
{
    if (triangles.empty())
    {
        return true;
    }

    uint32_t const first = triangles.front()[0];
    return std::all_of(triangles.begin(), triangles.end(), [first](Triangle const& t)
    {
        return t[0] == first;
    });
}
