#pragma once

#include <glm/vec3.hpp>

#include <iosfwd>

namespace kviz
{
    // per-category appearance
    struct CategoryStyle final {
        float size = 0.01f;  // sphere radius, or axis length for rigid frames
        glm::vec3 color = {1.0f, 1.0f, 1.0f};
        float opacity = 1.0f;
        float lineWidth = 1.0f;
    };

    bool operator==(CategoryStyle const&, CategoryStyle const&) noexcept;
    bool operator!=(CategoryStyle const&, CategoryStyle const&) noexcept;
    std::ostream& operator<<(std::ostream&, CategoryStyle const&);

    // returns true if every field of the style is within its valid range
    bool IsValid(CategoryStyle const&) noexcept;

    // the appearance of every category of an avatar
    struct AvatarStyle final {
        CategoryStyle markers{0.010f, {1.0f, 1.0f, 1.0f}, 1.0f, 1.0f};
        CategoryStyle contacts{0.01f, {0.0f, 1.0f, 0.0f}, 1.0f, 1.0f};
        CategoryStyle globalCenterOfMass{0.0075f, {0.0f, 0.0f, 0.0f}, 1.0f, 1.0f};
        CategoryStyle segmentsCenterOfMass{0.005f, {0.0f, 0.0f, 0.0f}, 1.0f, 1.0f};
        CategoryStyle mesh{1.0f, {0.89f, 0.855f, 0.788f}, 0.8f, 1.0f};
        CategoryStyle muscle{1.0f, {150.0f/255.0f, 15.0f/255.0f, 15.0f/255.0f}, 1.0f, 5.0f};
        CategoryStyle wrapping{1.0f, {0.0f, 0.0f, 1.0f}, 1.0f, 1.0f};
        CategoryStyle rigidTransforms{0.1f, {1.0f, 1.0f, 1.0f}, 1.0f, 2.0f};
        CategoryStyle globalReferenceFrame{0.15f, {1.0f, 1.0f, 1.0f}, 1.0f, 5.0f};

        // color that outline (non-triangulated) meshes are forced to when they are built
        glm::vec3 outlineColor = {0.0f, 0.0f, 0.0f};
    };
}
