#include "kviz/Avatar/RenderablePolicies.hpp"

#include "kviz/Avatar/AvatarModel.hpp"
#include "kviz/Avatar/AvatarStyle.hpp"
#include "kviz/Avatar/Errors.hpp"
#include "kviz/Avatar/FrameData.hpp"
#include "kviz/Graphics/Color.hpp"
#include "kviz/Graphics/Mesh.hpp"
#include "kviz/Graphics/MeshTopology.hpp"
#include "kviz/Scene/Actor.hpp"
#include "kviz/Scene/Scene.hpp"

#include <gtest/gtest.h>
#include <glm/mat4x4.hpp>
#include <glm/vec3.hpp>
#include <glm/geometric.hpp>
#include <glm/gtc/matrix_transform.hpp>

#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace
{
    kviz::CategoryStyle const c_RigidTransformStyle{0.1f, {1.0f, 1.0f, 1.0f}, 1.0f, 2.0f};

    bool IsNear(glm::vec3 const& a, glm::vec3 const& b, float eps = 1e-5f)
    {
        return glm::length(a - b) < eps;
    }

    kviz::RigidTransformSet Translations(std::vector<glm::vec3> const& origins)
    {
        std::vector<glm::mat4> transforms;
        for (glm::vec3 const& origin : origins)
        {
            transforms.push_back(glm::translate(glm::mat4{1.0f}, origin));
        }
        return kviz::RigidTransformSet{std::move(transforms)};
    }
}

TEST(RigidFrameSet, EachTransformBecomesAThreeAxisStar)
{
    kviz::Scene scene;
    kviz::RigidFrameSet set{scene, "rt", c_RigidTransformStyle};

    set.update(Translations({{0.0f, 0.0f, 0.0f}, {1.0f, 0.0f, 0.0f}}));

    ASSERT_EQ(set.getNumActors(), 2);
    for (auto const& actor : set.getActors())
    {
        kviz::Mesh const& mesh = actor->getMesh();
        ASSERT_EQ(mesh.getTopology(), kviz::MeshTopology::Lines);
        ASSERT_EQ(mesh.getVerts().size(), 4);
        ASSERT_EQ(mesh.getNumPrimitives(), 3);
        ASSERT_EQ(mesh.getCellColors().size(), 3);
        ASSERT_EQ(mesh.getCellColors()[0], kviz::Color::red());
        ASSERT_EQ(mesh.getCellColors()[1], kviz::Color::green());
        ASSERT_EQ(mesh.getCellColors()[2], kviz::Color::blue());
    }
}

TEST(RigidFrameSet, AxesStartAtTranslationAndHaveStyleLength)
{
    kviz::Scene scene;
    kviz::RigidFrameSet set{scene, "rt", c_RigidTransformStyle};

    set.update(Translations({{1.0f, 2.0f, 3.0f}}));

    auto const verts = set.getActors()[0]->getMesh().getVerts();
    ASSERT_TRUE(IsNear(verts[0], {1.0f, 2.0f, 3.0f}));
    ASSERT_TRUE(IsNear(verts[1], {1.1f, 2.0f, 3.0f}));
    ASSERT_TRUE(IsNear(verts[2], {1.0f, 2.1f, 3.0f}));
    ASSERT_TRUE(IsNear(verts[3], {1.0f, 2.0f, 3.1f}));
}

TEST(RigidFrameSet, AxesFollowTheRotationalPartOfTheTransform)
{
    kviz::Scene scene;
    kviz::RigidFrameSet set{scene, "rt", c_RigidTransformStyle};

    // 90 degrees about Z: X axis -> +Y, Y axis -> -X
    glm::mat4 const m = glm::rotate(glm::mat4{1.0f}, glm::radians(90.0f), glm::vec3{0.0f, 0.0f, 1.0f});
    set.update(kviz::RigidTransformSet{std::vector<glm::mat4>{m}});

    auto const verts = set.getActors()[0]->getMesh().getVerts();
    ASSERT_TRUE(IsNear(verts[1], {0.0f, 0.1f, 0.0f}));
    ASSERT_TRUE(IsNear(verts[2], {-0.1f, 0.0f, 0.0f}));
    ASSERT_TRUE(IsNear(verts[3], {0.0f, 0.0f, 0.1f}));
}

TEST(RigidFrameSet, SameCountUpdateMovesExistingActors)
{
    kviz::Scene scene;
    kviz::RigidFrameSet set{scene, "rt", c_RigidTransformStyle};

    set.update(Translations({{0.0f, 0.0f, 0.0f}}));
    auto const id = set.getActors()[0]->getID();

    set.update(Translations({{0.0f, 5.0f, 0.0f}}));

    ASSERT_EQ(set.getActors()[0]->getID(), id);
    ASSERT_EQ(set.getNumRebuilds(), 1);
    ASSERT_TRUE(IsNear(set.getActors()[0]->getMesh().getVerts()[0], {0.0f, 5.0f, 0.0f}));
}

TEST(RigidFrameSet, SetSizeChangesAxisLengthButNotTopology)
{
    kviz::Scene scene;
    kviz::RigidFrameSet set{scene, "rt", c_RigidTransformStyle};
    set.update(Translations({{0.0f, 0.0f, 0.0f}}));

    set.setSize(0.5f);

    kviz::Mesh const& mesh = set.getActors()[0]->getMesh();
    ASSERT_TRUE(IsNear(mesh.getVerts()[1], {0.5f, 0.0f, 0.0f}));
    ASSERT_EQ(mesh.getNumPrimitives(), 3);
    ASSERT_EQ(set.getNumRebuilds(), 1);
}

TEST(RigidFrameSet, AppliesLineWidthAndOpacity)
{
    kviz::Scene scene;
    kviz::RigidFrameSet set{scene, "rt", c_RigidTransformStyle};
    set.update(Translations({{0.0f, 0.0f, 0.0f}}));

    ASSERT_EQ(set.getActors()[0]->getLineWidth(), 2.0f);

    set.setOpacity(0.5f);
    ASSERT_EQ(set.getActors()[0]->getOpacity(), 0.5f);
}

TEST(RigidFrameSet, ChangingNumberOfTransformsRebuilds)
{
    kviz::Scene scene;
    kviz::RigidFrameSet set{scene, "rt", c_RigidTransformStyle};

    set.update(Translations({{0.0f, 0.0f, 0.0f}}));
    set.update(Translations({{0.0f, 0.0f, 0.0f}, {1.0f, 1.0f, 1.0f}, {2.0f, 2.0f, 2.0f}}));

    ASSERT_EQ(set.getNumActors(), 3);
    ASSERT_EQ(scene.getNumActors(), 3);
    ASSERT_EQ(set.getNumRebuilds(), 2);
}

TEST(RigidFrameSet, MultiSampleTransformsThrowInvalidFrameError)
{
    kviz::Scene scene;
    kviz::RigidFrameSet set{scene, "rt", c_RigidTransformStyle};

    kviz::RigidTransformSet const multi{1, 3, std::vector<glm::mat4>(3, glm::mat4{1.0f})};

    ASSERT_THROW({ set.update(multi); }, kviz::InvalidFrameError);
    ASSERT_EQ(scene.getNumActors(), 0);
}

TEST(CreateGlobalReferenceFrame, AddsAStarAtTheOrigin)
{
    kviz::Scene scene;
    kviz::CategoryStyle const style{0.15f, {1.0f, 1.0f, 1.0f}, 1.0f, 5.0f};

    std::shared_ptr<kviz::Actor> const actor = kviz::CreateGlobalReferenceFrame(scene, style);

    ASSERT_TRUE(scene.containsActor(*actor));
    ASSERT_EQ(actor->getLabel(), std::string{kviz::c_GlobalReferenceFrameLabel});
    ASSERT_EQ(actor->getLineWidth(), 5.0f);
    ASSERT_EQ(actor->getMesh().getNumPrimitives(), 3);
    ASSERT_TRUE(IsNear(actor->getMesh().getVerts()[0], {0.0f, 0.0f, 0.0f}));
    ASSERT_TRUE(IsNear(actor->getMesh().getVerts()[3], {0.0f, 0.0f, 0.15f}));
    ASSERT_EQ(scene.getNumCameraResetRequests(), 1);
}

TEST(CreateGlobalReferenceFrame, SecondCreationThrowsDuplicateInitError)
{
    kviz::Scene scene;
    kviz::CategoryStyle const style{0.15f, {1.0f, 1.0f, 1.0f}, 1.0f, 5.0f};

    ASSERT_NO_THROW({ kviz::CreateGlobalReferenceFrame(scene, style); });
    ASSERT_THROW({ kviz::CreateGlobalReferenceFrame(scene, style); }, kviz::DuplicateInitError);
    ASSERT_EQ(scene.getNumActors(), 1);
}

TEST(CreateGlobalReferenceFrame, CanBeCreatedOncePerScene)
{
    kviz::Scene first;
    kviz::Scene second;
    kviz::CategoryStyle const style{0.15f, {1.0f, 1.0f, 1.0f}, 1.0f, 5.0f};

    ASSERT_NO_THROW({ kviz::CreateGlobalReferenceFrame(first, style); });
    ASSERT_NO_THROW({ kviz::CreateGlobalReferenceFrame(second, style); });
}

TEST(CreateGlobalReferenceFrame, RemovingTheActorDoesNotAllowASecondCreation)
{
    kviz::Scene scene;
    kviz::CategoryStyle const style{0.15f, {1.0f, 1.0f, 1.0f}, 1.0f, 5.0f};

    std::shared_ptr<kviz::Actor> const actor = kviz::CreateGlobalReferenceFrame(scene, style);
    ASSERT_TRUE(scene.removeActor(*actor));

    ASSERT_TRUE(scene.hasGlobalReferenceFrame());
    ASSERT_THROW({ kviz::CreateGlobalReferenceFrame(scene, style); }, kviz::DuplicateInitError);
    ASSERT_EQ(scene.getNumActors(), 0);
}

TEST(CreateGlobalReferenceFrame, UnrelatedActorWithTheSameLabelDoesNotBlockCreation)
{
    kviz::Scene scene;
    kviz::CategoryStyle const style{0.15f, {1.0f, 1.0f, 1.0f}, 1.0f, 5.0f};
    scene.addActor(std::make_shared<kviz::Actor>(std::string{kviz::c_GlobalReferenceFrameLabel}));

    ASSERT_NO_THROW({ kviz::CreateGlobalReferenceFrame(scene, style); });
    ASSERT_EQ(scene.getNumActors(), 2);
}

TEST(RigidFrameVerts, ReturnsOriginThenAxisTips)
{
    std::vector<glm::vec3> const verts = kviz::RigidFrameVerts(glm::mat4{1.0f}, 2.0f);

    ASSERT_EQ(verts.size(), 4);
    ASSERT_EQ(verts[0], glm::vec3(0.0f, 0.0f, 0.0f));
    ASSERT_EQ(verts[1], glm::vec3(2.0f, 0.0f, 0.0f));
    ASSERT_EQ(verts[2], glm::vec3(0.0f, 2.0f, 0.0f));
    ASSERT_EQ(verts[3], glm::vec3(0.0f, 0.0f, 2.0f));
}
