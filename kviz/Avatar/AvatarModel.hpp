#pragma once

#include "kviz/Avatar/AvatarStyle.hpp"
#include "kviz/Avatar/FrameData.hpp"
#include "kviz/Avatar/RenderablePolicies.hpp"
#include "kviz/Avatar/WrappingSet.hpp"

#include <functional>
#include <memory>
#include <string_view>
#include <vector>

namespace kviz { class Actor; }
namespace kviz { class Scene; }

namespace kviz
{
    // label of the (one-per-scene) global reference frame actor
    inline constexpr std::string_view c_GlobalReferenceFrameLabel = "global_reference_frame";

    // adds a static global reference frame (an axis star at the origin) to the scene
    //
    // throws a `DuplicateInitError` if one was already created for the scene, even if
    // its actor has since been removed
    std::shared_ptr<Actor> CreateGlobalReferenceFrame(Scene&, CategoryStyle const&);

    // every visual category of a biomechanical avatar, kept in sync with one scene
    //
    // the scene must outlive the model
    class AvatarModel final {
    public:
        explicit AvatarModel(Scene&, AvatarStyle const& = {});
        AvatarModel(AvatarModel const&) = delete;
        AvatarModel(AvatarModel&&) noexcept = delete;
        AvatarModel& operator=(AvatarModel const&) = delete;
        AvatarModel& operator=(AvatarModel&&) noexcept = delete;
        ~AvatarModel() noexcept;

        void updateMarkers(PointSet);
        void updateContacts(PointSet);
        void updateGlobalCenterOfMass(PointSet);
        void updateSegmentsCenterOfMass(PointSet);
        void updateMeshes(std::vector<MeshFrame>);
        void updateMuscles(std::vector<MeshFrame>);
        void updateWrappings(std::vector<std::vector<MeshFrame>>);
        void updateRigidTransforms(RigidTransformSet);

        // the global reference frame lives as long as the scene does
        void createGlobalReferenceFrame();
        bool hasGlobalReferenceFrame() const;

        PointSphereSet& updMarkers() { return m_Markers; }
        PointSphereSet& updContacts() { return m_Contacts; }
        PointSphereSet& updGlobalCenterOfMass() { return m_GlobalCenterOfMass; }
        PointSphereSet& updSegmentsCenterOfMass() { return m_SegmentsCenterOfMass; }
        SurfaceMeshSet& updMeshes() { return m_Meshes; }
        OutlineSet& updMuscles() { return m_Muscles; }
        WrappingSet& updWrappings() { return m_Wrappings; }
        RigidFrameSet& updRigidTransforms() { return m_RigidTransforms; }

        PointSphereSet const& getMarkers() const { return m_Markers; }
        PointSphereSet const& getContacts() const { return m_Contacts; }
        PointSphereSet const& getGlobalCenterOfMass() const { return m_GlobalCenterOfMass; }
        PointSphereSet const& getSegmentsCenterOfMass() const { return m_SegmentsCenterOfMass; }
        SurfaceMeshSet const& getMeshes() const { return m_Meshes; }
        OutlineSet const& getMuscles() const { return m_Muscles; }
        WrappingSet const& getWrappings() const { return m_Wrappings; }
        RigidFrameSet const& getRigidTransforms() const { return m_RigidTransforms; }

    private:
        std::reference_wrapper<Scene> m_Scene;
        AvatarStyle m_Style;
        PointSphereSet m_Markers;
        PointSphereSet m_Contacts;
        PointSphereSet m_GlobalCenterOfMass;
        PointSphereSet m_SegmentsCenterOfMass;
        SurfaceMeshSet m_Meshes;
        OutlineSet m_Muscles;
        WrappingSet m_Wrappings;
        RigidFrameSet m_RigidTransforms;
    };
}
