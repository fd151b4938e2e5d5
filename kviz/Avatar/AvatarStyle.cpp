#include "AvatarStyle.hpp"

#include "kviz/Graphics/Color.hpp"

#include <iostream>

bool kviz::operator==(CategoryStyle const& a, CategoryStyle const& b) noexcept
{
    return
        a.size == b.size &&
        a.color == b.color &&
        a.opacity == b.opacity &&
        a.lineWidth == b.lineWidth;
}

bool kviz::operator!=(CategoryStyle const& a, CategoryStyle const& b) noexcept
{
    return !(a == b);
}

std::ostream& kviz::operator<<(std::ostream& o, CategoryStyle const& s)
{
    return o << "CategoryStyle(size = " << s.size
             << ", color = (" << s.color.x << ", " << s.color.y << ", " << s.color.z << ')'
             << ", opacity = " << s.opacity
             << ", lineWidth = " << s.lineWidth << ')';
}

bool kviz::IsValid(CategoryStyle const& s) noexcept
{
    return
        s.size > 0.0f &&
        IsNormalizedRGB(s.color) &&
        0.0f <= s.opacity && s.opacity <= 1.0f &&
        s.lineWidth > 0.0f;
}
