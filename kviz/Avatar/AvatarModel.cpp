#include "AvatarModel.hpp"

#include "kviz/Avatar/AvatarStyle.hpp"
#include "kviz/Avatar/Errors.hpp"
#include "kviz/Avatar/FrameData.hpp"
#include "kviz/Avatar/RenderablePolicies.hpp"
#include "kviz/Graphics/Color.hpp"
#include "kviz/Graphics/Mesh.hpp"
#include "kviz/Graphics/MeshTopology.hpp"
#include "kviz/Platform/Log.hpp"
#include "kviz/Scene/Actor.hpp"
#include "kviz/Scene/Scene.hpp"
#include "kviz/Utils/Assertions.hpp"

#include <glm/mat4x4.hpp>
#include <glm/vec3.hpp>

#include <array>
#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

std::shared_ptr<kviz::Actor> kviz::CreateGlobalReferenceFrame(Scene& scene, CategoryStyle const& style)
{
    KVIZ_THROWING_ASSERT(IsValid(style));

    if (scene.hasGlobalReferenceFrame())
    {
        throw DuplicateInitError{"the global reference frame has already been created for this scene"};
    }

    std::array<uint32_t, 6> const indices = {0, 1, 0, 2, 0, 3};
    std::array<Color, 3> const colors = {Color::red(), Color::green(), Color::blue()};
    std::vector<glm::vec3> const verts = RigidFrameVerts(glm::mat4{1.0f}, style.size);

    auto actor = std::make_shared<Actor>(std::string{c_GlobalReferenceFrameLabel});
    Mesh& mesh = actor->updMesh();
    mesh.setTopology(MeshTopology::Lines);
    mesh.setVerts(verts);
    mesh.setIndices(indices);
    mesh.setCellColors(colors);
    actor->setOpacity(style.opacity);
    actor->setLineWidth(style.lineWidth);

    scene.addActor(actor);
    scene.markGlobalReferenceFrameCreated();
    scene.requestCameraReset();

    log::info("created global reference frame (axis length = %f)", static_cast<double>(style.size));

    return actor;
}

kviz::AvatarModel::AvatarModel(Scene& scene, AvatarStyle const& style) :
    m_Scene{scene},
    m_Style{style},
    m_Markers{scene, "markers", style.markers},
    m_Contacts{scene, "contacts", style.contacts},
    m_GlobalCenterOfMass{scene, "global_center_of_mass", style.globalCenterOfMass},
    m_SegmentsCenterOfMass{scene, "segments_center_of_mass", style.segmentsCenterOfMass},
    m_Meshes{scene, "mesh", style.mesh, SurfaceMeshPolicy{style.outlineColor}},
    m_Muscles{scene, "muscle", style.muscle},
    m_Wrappings{scene, "wrapping", style.wrapping},
    m_RigidTransforms{scene, "rt", style.rigidTransforms}
{
    scene.requestCameraReset();
}

kviz::AvatarModel::~AvatarModel() noexcept = default;

void kviz::AvatarModel::updateMarkers(PointSet points)
{
    m_Markers.update(std::move(points));
}

void kviz::AvatarModel::updateContacts(PointSet points)
{
    m_Contacts.update(std::move(points));
}

void kviz::AvatarModel::updateGlobalCenterOfMass(PointSet points)
{
    m_GlobalCenterOfMass.update(std::move(points));
}

void kviz::AvatarModel::updateSegmentsCenterOfMass(PointSet points)
{
    m_SegmentsCenterOfMass.update(std::move(points));
}

void kviz::AvatarModel::updateMeshes(std::vector<MeshFrame> meshes)
{
    m_Meshes.update(std::move(meshes));
}

void kviz::AvatarModel::updateMuscles(std::vector<MeshFrame> muscles)
{
    m_Muscles.update(std::move(muscles));
}

void kviz::AvatarModel::updateWrappings(std::vector<std::vector<MeshFrame>> perSegment)
{
    m_Wrappings.update(std::move(perSegment));
}

void kviz::AvatarModel::updateRigidTransforms(RigidTransformSet transforms)
{
    m_RigidTransforms.update(std::move(transforms));
}

void kviz::AvatarModel::createGlobalReferenceFrame()
{
    CreateGlobalReferenceFrame(m_Scene.get(), m_Style.globalReferenceFrame);
}

bool kviz::AvatarModel::hasGlobalReferenceFrame() const
{
    return m_Scene.get().hasGlobalReferenceFrame();
}
