#include "MeshGen.hpp"

#include "kviz/Graphics/Mesh.hpp"
#include "kviz/Graphics/MeshTopology.hpp"
#include "kviz/Maths/Constants.hpp"
#include "kviz/Utils/Assertions.hpp"

#include <glm/vec3.hpp>

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <vector>

kviz::Mesh kviz::GenUntexturedUVSphere(size_t sectors, size_t stacks)
{
    KVIZ_THROWING_ASSERT(sectors >= 3 && stacks >= 2);

    // polar coords, with [0, 0, -1] pointing towards the screen with polar
    // coords theta = 0, phi = 0. The coordinate [0, 1, 0] is theta = (any)
    // phi = PI/2. The coordinate [1, 0, 0] is theta = PI/2, phi = 0
    //
    // adapted from:
    //    http://www.songho.ca/opengl/gl_sphere.html#example_cubesphere
    std::vector<glm::vec3> points;
    points.reserve((stacks + 1) * (sectors + 1));

    float const thetaStep = 2.0f * fpi / static_cast<float>(sectors);
    float const phiStep = fpi / static_cast<float>(stacks);

    for (size_t stack = 0; stack <= stacks; ++stack)
    {
        float const phi = fpi2 - static_cast<float>(stack) * phiStep;
        float const y = std::sin(phi);

        for (size_t sector = 0; sector <= sectors; ++sector)
        {
            float const theta = static_cast<float>(sector) * thetaStep;
            float const x = std::sin(theta) * std::cos(phi);
            float const z = -std::cos(theta) * std::cos(phi);
            points.emplace_back(x, y, z);
        }
    }

    // the points are not triangles. They are *points of a triangle*, so the
    // points must be triangulated

    std::vector<uint32_t> indices;
    indices.reserve(6 * stacks * sectors);

    for (size_t stack = 0; stack < stacks; ++stack)
    {
        auto k1 = static_cast<uint32_t>(stack * (sectors + 1));
        auto k2 = static_cast<uint32_t>(k1 + sectors + 1);

        for (size_t sector = 0; sector < sectors; ++sector, ++k1, ++k2)
        {
            // 2 triangles per sector - excluding the first and last stacks
            // (which contain one triangle, at the poles)

            if (stack != 0)
            {
                indices.insert(indices.end(), {k1, k1 + 1, k2});
            }

            if (stack != (stacks - 1))
            {
                indices.insert(indices.end(), {k1 + 1, k2 + 1, k2});
            }
        }
    }

    Mesh rv;
    rv.setTopology(MeshTopology::Triangles);
    rv.setVerts(points);
    rv.setIndices(indices);
    return rv;
}
