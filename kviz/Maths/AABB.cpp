#include "AABB.hpp"

#include <glm/common.hpp>
#include <glm/vec3.hpp>
#include <nonstd/span.hpp>

#include <algorithm>
#include <iostream>
#include <optional>

bool kviz::operator==(AABB const& a, AABB const& b) noexcept
{
    return a.min == b.min && a.max == b.max;
}

bool kviz::operator!=(AABB const& a, AABB const& b) noexcept
{
    return !(a == b);
}

std::ostream& kviz::operator<<(std::ostream& o, AABB const& aabb)
{
    return o << "AABB(min = (" << aabb.min.x << ", " << aabb.min.y << ", " << aabb.min.z
             << "), max = (" << aabb.max.x << ", " << aabb.max.y << ", " << aabb.max.z << "))";
}

glm::vec3 kviz::Midpoint(AABB const& a) noexcept
{
    return (a.min + a.max)/2.0f;
}

glm::vec3 kviz::Dimensions(AABB const& a) noexcept
{
    return a.max - a.min;
}

float kviz::LongestDim(AABB const& a) noexcept
{
    glm::vec3 const dims = Dimensions(a);
    return std::max({dims.x, dims.y, dims.z});
}

kviz::AABB kviz::Union(AABB const& a, AABB const& b) noexcept
{
    return AABB
    {
        glm::min(a.min, b.min),
        glm::max(a.max, b.max)
    };
}

std::optional<kviz::AABB> kviz::MaybeAABBFromVerts(nonstd::span<glm::vec3 const> vs) noexcept
{
    if (vs.empty())
    {
        return std::nullopt;
    }

    AABB rv{vs[0], vs[0]};
    for (glm::vec3 const& v : vs)
    {
        rv.min = glm::min(rv.min, v);
        rv.max = glm::max(rv.max, v);
    }
    return rv;
}
