#include "Color.hpp"

#include <glm/vec3.hpp>

#include <ostream>

std::ostream& kviz::operator<<(std::ostream& o, Color const& c)
{
    return o << "Color(r = " << c.r << ", g = " << c.g << ", b = " << c.b << ", a = " << c.a << ')';
}

bool kviz::IsNormalizedRGB(glm::vec3 const& rgb) noexcept
{
    for (int i = 0; i < 3; ++i)
    {
        if (!(0.0f <= rgb[i] && rgb[i] <= 1.0f))
        {
            return false;
        }
    }
    return true;
}
