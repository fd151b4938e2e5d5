#include "kviz/Graphics/MeshGen.hpp"

#include "kviz/Graphics/Mesh.hpp"
#include "kviz/Graphics/MeshTopology.hpp"
#include "kviz/Maths/AABB.hpp"

#include <gtest/gtest.h>
#include <glm/vec3.hpp>
#include <glm/geometric.hpp>

#include <cstdint>

TEST(GenUntexturedUVSphere, ProducesUnitSphereVertices)
{
    kviz::Mesh const sphere = kviz::GenUntexturedUVSphere(12, 12);

    ASSERT_EQ(sphere.getVerts().size(), 13 * 13);
    for (glm::vec3 const& v : sphere.getVerts())
    {
        ASSERT_NEAR(glm::length(v), 1.0f, 1e-5f);
    }
}

TEST(GenUntexturedUVSphere, IsCenteredOnTheOrigin)
{
    kviz::Mesh const sphere = kviz::GenUntexturedUVSphere(12, 12);
    glm::vec3 const mid = kviz::Midpoint(*sphere.getBounds());

    ASSERT_NEAR(mid.x, 0.0f, 1e-5f);
    ASSERT_NEAR(mid.y, 0.0f, 1e-5f);
    ASSERT_NEAR(mid.z, 0.0f, 1e-5f);
}

TEST(GenUntexturedUVSphere, PolesHaveOneTriangleAndOtherStacksHaveTwoPerSector)
{
    kviz::Mesh const sphere = kviz::GenUntexturedUVSphere(8, 4);

    ASSERT_EQ(sphere.getTopology(), kviz::MeshTopology::Triangles);
    ASSERT_EQ(sphere.getNumPrimitives(), 8 * (2 * 4 - 2));
    for (uint32_t idx : sphere.getIndices())
    {
        ASSERT_LT(idx, sphere.getVerts().size());
    }
}

TEST(GenUntexturedUVSphere, ThrowsForDegenerateResolution)
{
    ASSERT_ANY_THROW({ kviz::GenUntexturedUVSphere(2, 12); });
    ASSERT_ANY_THROW({ kviz::GenUntexturedUVSphere(12, 1); });
}
