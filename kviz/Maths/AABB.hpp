#pragma once

#include <glm/vec3.hpp>
#include <nonstd/span.hpp>

#include <iosfwd>
#include <optional>

namespace kviz
{
    struct AABB final {
        glm::vec3 min;
        glm::vec3 max;
    };

    bool operator==(AABB const&, AABB const&) noexcept;
    bool operator!=(AABB const&, AABB const&) noexcept;
    std::ostream& operator<<(std::ostream&, AABB const&);

    glm::vec3 Midpoint(AABB const&) noexcept;
    glm::vec3 Dimensions(AABB const&) noexcept;
    float LongestDim(AABB const&) noexcept;
    AABB Union(AABB const&, AABB const&) noexcept;

    // returns an AABB that tightly bounds the provided points, or `std::nullopt` if there are none
    std::optional<AABB> MaybeAABBFromVerts(nonstd::span<glm::vec3 const>) noexcept;
}
