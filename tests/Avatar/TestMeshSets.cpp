#include "kviz/Avatar/RenderablePolicies.hpp"

#include "kviz/Avatar/AvatarStyle.hpp"
#include "kviz/Avatar/Errors.hpp"
#include "kviz/Avatar/FrameData.hpp"
#include "kviz/Graphics/Color.hpp"
#include "kviz/Graphics/Mesh.hpp"
#include "kviz/Graphics/MeshTopology.hpp"
#include "kviz/Scene/Actor.hpp"
#include "kviz/Scene/Scene.hpp"
#include "kviz/Utils/UID.hpp"

#include <gtest/gtest.h>
#include <glm/vec3.hpp>
#include <nonstd/span.hpp>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <utility>
#include <vector>

namespace
{
    kviz::CategoryStyle const c_MeshStyle{1.0f, {0.89f, 0.855f, 0.788f}, 0.8f, 1.0f};
    kviz::CategoryStyle const c_MuscleStyle{1.0f, {150.0f/255.0f, 15.0f/255.0f, 15.0f/255.0f}, 1.0f, 5.0f};

    kviz::PointSet Ring(size_t n, float z = 0.0f)
    {
        std::vector<glm::vec3> pts;
        for (size_t i = 0; i < n; ++i)
        {
            pts.emplace_back(static_cast<float>(i), static_cast<float>(i % 2), z);
        }
        return kviz::PointSet{std::move(pts)};
    }

    // a triangulated tetrahedron
    kviz::MeshFrame Tetrahedron(float z = 0.0f)
    {
        return kviz::MeshFrame
        {
            kviz::PointSet{std::vector<glm::vec3>{{0.0f, 0.0f, z}, {1.0f, 0.0f, z}, {0.0f, 1.0f, z}, {0.0f, 0.0f, z + 1.0f}}},
            {{0, 1, 2}, {0, 1, 3}, {1, 2, 3}, {0, 2, 3}},
        };
    }

    // a fan (every row starts at vertex 0), which is drawn as an outline
    kviz::MeshFrame Fan(size_t numVerts, float z = 0.0f)
    {
        kviz::MeshFrame rv{Ring(numVerts, z), {}};
        for (uint32_t i = 1; i + 1 < numVerts; ++i)
        {
            rv.triangles.push_back({0, i, i + 1});
        }
        return rv;
    }

    std::vector<kviz::UID> ActorIDs(nonstd::span<std::shared_ptr<kviz::Actor> const> actors)
    {
        std::vector<kviz::UID> rv;
        for (auto const& actor : actors)
        {
            rv.push_back(actor->getID());
        }
        return rv;
    }
}

TEST(SurfaceMeshSet, TriangulatedPartBecomesATriangleMeshActor)
{
    kviz::Scene scene;
    kviz::SurfaceMeshSet set{scene, "mesh", c_MeshStyle};

    set.update({Tetrahedron()});

    ASSERT_EQ(set.getNumActors(), 1);
    kviz::Mesh const& mesh = set.getActors()[0]->getMesh();
    ASSERT_EQ(mesh.getTopology(), kviz::MeshTopology::Triangles);
    ASSERT_EQ(mesh.getVerts().size(), 4);
    ASSERT_EQ(mesh.getNumPrimitives(), 4);
    ASSERT_EQ(mesh.getVerts()[3], glm::vec3(0.0f, 0.0f, 1.0f));
}

TEST(SurfaceMeshSet, TriangulatedPartUsesCategoryColorAndOpacity)
{
    kviz::Scene scene;
    kviz::SurfaceMeshSet set{scene, "mesh", c_MeshStyle};

    set.update({Tetrahedron()});

    ASSERT_EQ(set.getActors()[0]->getColor(), (kviz::Color{c_MeshStyle.color, c_MeshStyle.opacity}));
    ASSERT_EQ(set.getStyle(), c_MeshStyle);
}

TEST(SurfaceMeshSet, SingleTrianglePartIsDrawnAsAnOutline)
{
    kviz::Scene scene;
    glm::vec3 const outline = {0.0f, 0.0f, 0.0f};
    kviz::SurfaceMeshSet set{scene, "mesh", c_MeshStyle, kviz::SurfaceMeshPolicy{outline}};

    set.update({kviz::MeshFrame{Ring(4), {{0, 1, 2}}}});

    kviz::Mesh const& mesh = set.getActors()[0]->getMesh();
    ASSERT_EQ(mesh.getTopology(), kviz::MeshTopology::Lines);
    ASSERT_EQ(mesh.getNumPrimitives(), 3);
    ASSERT_EQ(kviz::ToRGB(set.getActors()[0]->getColor()), outline);
}

TEST(SurfaceMeshSet, FanPartBecomesAClosedOutlinePerRow)
{
    kviz::Scene scene;
    kviz::SurfaceMeshSet set{scene, "mesh", c_MeshStyle};

    set.update({Fan(5)});

    kviz::Mesh const& mesh = set.getActors()[0]->getMesh();
    ASSERT_EQ(mesh.getTopology(), kviz::MeshTopology::Lines);
    ASSERT_EQ(mesh.getNumPrimitives(), 3 * 3);
}

TEST(SurfaceMeshSet, PartWithoutTrianglesBecomesALoopThroughAllVertices)
{
    kviz::Scene scene;
    kviz::SurfaceMeshSet set{scene, "mesh", c_MeshStyle};

    set.update({kviz::MeshFrame{Ring(6), {}}});

    kviz::Mesh const& mesh = set.getActors()[0]->getMesh();
    ASSERT_EQ(mesh.getTopology(), kviz::MeshTopology::Lines);
    ASSERT_EQ(mesh.getNumPrimitives(), 6);
}

TEST(SurfaceMeshSet, OutlinePartForcesCategoryColorToOutlineColor)
{
    kviz::Scene scene;
    glm::vec3 const outline = {0.0f, 0.0f, 0.0f};
    kviz::SurfaceMeshSet set{scene, "mesh", c_MeshStyle, kviz::SurfaceMeshPolicy{outline}};

    set.update({Fan(4)});

    ASSERT_EQ(set.getStyle().color, outline);
    ASSERT_EQ(kviz::ToRGB(set.getActors()[0]->getColor()), outline);
}

TEST(SurfaceMeshSet, OutlinePartRecolorsEveryPartOfTheCategory)
{
    kviz::Scene scene;
    glm::vec3 const outline = {0.0f, 0.0f, 0.0f};
    kviz::SurfaceMeshSet set{scene, "mesh", c_MeshStyle, kviz::SurfaceMeshPolicy{outline}};

    set.update({Tetrahedron(), Fan(4)});

    ASSERT_EQ(set.getActors()[0]->getMesh().getTopology(), kviz::MeshTopology::Triangles);
    ASSERT_EQ(set.getActors()[1]->getMesh().getTopology(), kviz::MeshTopology::Lines);
    ASSERT_EQ(kviz::ToRGB(set.getActors()[0]->getColor()), outline);
    ASSERT_EQ(kviz::ToRGB(set.getActors()[1]->getColor()), outline);
}

TEST(SurfaceMeshSet, OneActorPerPart)
{
    kviz::Scene scene;
    kviz::SurfaceMeshSet set{scene, "mesh", c_MeshStyle};

    set.update({Tetrahedron(), Tetrahedron(2.0f), Tetrahedron(4.0f)});

    ASSERT_EQ(set.getNumActors(), 3);
    ASSERT_EQ(scene.getNumActors(), 3);
}

TEST(SurfaceMeshSet, SameVertexCountsUpdateVerticesInPlace)
{
    kviz::Scene scene;
    kviz::SurfaceMeshSet set{scene, "mesh", c_MeshStyle};

    set.update({Tetrahedron()});
    std::vector<kviz::UID> const ids = ActorIDs(set.getActors());
    std::vector<uint32_t> const indicesBefore(set.getActors()[0]->getMesh().getIndices().begin(), set.getActors()[0]->getMesh().getIndices().end());

    set.update({Tetrahedron(5.0f)});

    ASSERT_EQ(ActorIDs(set.getActors()), ids);
    ASSERT_EQ(set.getNumRebuilds(), 1);
    kviz::Mesh const& mesh = set.getActors()[0]->getMesh();
    ASSERT_EQ(mesh.getVerts()[0], glm::vec3(0.0f, 0.0f, 5.0f));
    ASSERT_EQ(std::vector<uint32_t>(mesh.getIndices().begin(), mesh.getIndices().end()), indicesBefore);
}

TEST(SurfaceMeshSet, TopologyIsNotRecomputedOnTheFastPath)
{
    kviz::Scene scene;
    kviz::SurfaceMeshSet set{scene, "mesh", c_MeshStyle};

    set.update({Tetrahedron()});

    // same vertex count, but a different triangle table
    set.update({kviz::MeshFrame{Tetrahedron().vertices, {{0, 1, 2}}}});

    kviz::Mesh const& mesh = set.getActors()[0]->getMesh();
    ASSERT_EQ(mesh.getNumPrimitives(), 4);
    ASSERT_EQ(set.getNumRebuilds(), 1);
}

TEST(SurfaceMeshSet, FastPathDoesNotReapplyStyle)
{
    kviz::Scene scene;
    kviz::SurfaceMeshSet set{scene, "mesh", c_MeshStyle};
    set.update({Tetrahedron()});

    set.getActors()[0]->setColor(kviz::Color::red());
    set.update({Tetrahedron(1.0f)});

    ASSERT_EQ(set.getActors()[0]->getColor(), kviz::Color::red());
}

TEST(SurfaceMeshSet, SetColorReappliesStyle)
{
    kviz::Scene scene;
    kviz::SurfaceMeshSet set{scene, "mesh", c_MeshStyle};
    set.update({Tetrahedron()});

    set.setColor({0.0f, 1.0f, 0.0f});

    ASSERT_EQ(set.getActors()[0]->getColor(), (kviz::Color{0.0f, 1.0f, 0.0f, c_MeshStyle.opacity}));
}

TEST(SurfaceMeshSet, ChangingAnyPartsVertexCountRebuildsEveryPart)
{
    kviz::Scene scene;
    kviz::SurfaceMeshSet set{scene, "mesh", c_MeshStyle};

    set.update({Tetrahedron(), Fan(5)});
    std::vector<kviz::UID> const ids = ActorIDs(set.getActors());

    set.update({Tetrahedron(), Fan(6)});

    ASSERT_EQ(set.getNumRebuilds(), 2);
    ASSERT_EQ(set.getNumActors(), 2);
    for (kviz::UID const& id : ActorIDs(set.getActors()))
    {
        for (kviz::UID const& old : ids)
        {
            ASSERT_NE(id, old);
        }
    }
}

TEST(SurfaceMeshSet, ChangingNumberOfPartsRebuilds)
{
    kviz::Scene scene;
    kviz::SurfaceMeshSet set{scene, "mesh", c_MeshStyle};

    set.update({Tetrahedron(), Tetrahedron(1.0f), Tetrahedron(2.0f)});
    set.update({Tetrahedron()});

    ASSERT_EQ(set.getNumRebuilds(), 2);
    ASSERT_EQ(set.getNumActors(), 1);
    ASSERT_EQ(scene.getNumActors(), 1);
}

TEST(SurfaceMeshSet, OutOfRangeTriangleIndexThrowsTypeInputError)
{
    kviz::Scene scene;
    kviz::SurfaceMeshSet set{scene, "mesh", c_MeshStyle};

    kviz::MeshFrame bad{Ring(3), {{0, 1, 3}}};

    ASSERT_THROW({ set.update({bad}); }, kviz::TypeInputError);
    ASSERT_EQ(set.getNumActors(), 0);
    ASSERT_EQ(scene.getNumActors(), 0);
}

TEST(SurfaceMeshSet, OneBadPartMeansNoPartIsApplied)
{
    kviz::Scene scene;
    kviz::SurfaceMeshSet set{scene, "mesh", c_MeshStyle};
    set.update({Tetrahedron(), Tetrahedron(1.0f)});

    kviz::MeshFrame bad = Tetrahedron(9.0f);
    bad.triangles.push_back({0, 1, 7});

    ASSERT_THROW({ set.update({Tetrahedron(9.0f), bad}); }, kviz::TypeInputError);
    ASSERT_EQ(set.getActors()[0]->getMesh().getVerts()[0], glm::vec3(0.0f, 0.0f, 0.0f));
    ASSERT_EQ(set.getActors()[1]->getMesh().getVerts()[0], glm::vec3(0.0f, 0.0f, 1.0f));
}

TEST(SurfaceMeshSet, MultiSamplePartThrowsInvalidFrameError)
{
    kviz::Scene scene;
    kviz::SurfaceMeshSet set{scene, "mesh", c_MeshStyle};

    kviz::MeshFrame multi{kviz::PointSet{3, 2, std::vector<glm::vec3>(6)}, {}};

    ASSERT_THROW({ set.update({multi}); }, kviz::InvalidFrameError);
}

TEST(OutlineSet, MuscleBecomesAClosedPolyline)
{
    kviz::Scene scene;
    kviz::OutlineSet set{scene, "muscle", c_MuscleStyle};

    set.update({kviz::MeshFrame{Ring(4), {}}});

    kviz::Actor const& actor = *set.getActors()[0];
    ASSERT_EQ(actor.getMesh().getTopology(), kviz::MeshTopology::Lines);
    ASSERT_EQ(actor.getMesh().getNumPrimitives(), 4);
    ASSERT_EQ(actor.getLineWidth(), 5.0f);
    ASSERT_EQ(kviz::ToRGB(actor.getColor()), c_MuscleStyle.color);
}

TEST(OutlineSet, TriangulatedInputIsStillDrawnAsOutline)
{
    kviz::Scene scene;
    kviz::OutlineSet set{scene, "muscle", c_MuscleStyle};

    set.update({Tetrahedron()});

    ASSERT_EQ(set.getActors()[0]->getMesh().getTopology(), kviz::MeshTopology::Lines);
    ASSERT_EQ(set.getActors()[0]->getMesh().getNumPrimitives(), 4 * 3);
}

TEST(OutlineSet, OutlineKeepsCategoryColor)
{
    kviz::Scene scene;
    kviz::OutlineSet set{scene, "muscle", c_MuscleStyle};

    set.update({Fan(5)});

    ASSERT_EQ(set.getStyle().color, c_MuscleStyle.color);
}

TEST(OutlineSet, SetLineWidthAppliesToEveryActor)
{
    kviz::Scene scene;
    kviz::OutlineSet set{scene, "muscle", c_MuscleStyle};
    set.update({kviz::MeshFrame{Ring(4), {}}, kviz::MeshFrame{Ring(3), {}}});

    set.setLineWidth(2.5f);

    for (auto const& actor : set.getActors())
    {
        ASSERT_EQ(actor->getLineWidth(), 2.5f);
    }
}

TEST(OutlineIndices, ProducesThreeSegmentsPerTriangle)
{
    std::vector<kviz::Triangle> const triangles = {{0, 1, 2}, {0, 2, 3}};
    std::vector<uint32_t> const expected = {0, 1, 1, 2, 2, 0, 0, 2, 2, 3, 3, 0};

    ASSERT_EQ(kviz::OutlineIndices(triangles, 4), expected);
}

TEST(OutlineIndices, ProducesClosedLoopWhenThereAreNoTriangles)
{
    std::vector<uint32_t> const expected = {0, 1, 1, 2, 2, 0};

    ASSERT_EQ(kviz::OutlineIndices({}, 3), expected);
}

TEST(OutlineIndices, ProducesOneSegmentForTwoVertices)
{
    std::vector<uint32_t> const expected = {0, 1};

    ASSERT_EQ(kviz::OutlineIndices({}, 2), expected);
}

TEST(OutlineIndices, ProducesNothingForFewerThanTwoVertices)
{
    ASSERT_TRUE(kviz::OutlineIndices({}, 1).empty());
    ASSERT_TRUE(kviz::OutlineIndices({}, 0).empty());
}

TEST(SurfaceIndices, FlattensTriangleTable)
{
    std::vector<kviz::Triangle> const triangles = {{0, 1, 2}, {2, 1, 3}};
    std::vector<uint32_t> const expected = {0, 1, 2, 2, 1, 3};

    ASSERT_EQ(kviz::SurfaceIndices(triangles), expected);
}
