#pragma once

#include <glm/vec3.hpp>
#include <glm/vec4.hpp>

#include <iosfwd>

namespace kviz
{
    // representation of RGBA, usually in sRGB color space, with a range of 0 to 1
    struct Color final {

        explicit constexpr Color(glm::vec4 const& v) :
            r{v.x}, g{v.y}, b{v.z}, a{v.w}
        {
        }

        constexpr Color(glm::vec3 const& rgb, float a_) :
            r{rgb.x}, g{rgb.y}, b{rgb.z}, a{a_}
        {
        }

        constexpr Color(float r_, float g_, float b_, float a_ = 1.0f) :
            r{r_}, g{g_}, b{b_}, a{a_}
        {
        }

        constexpr operator glm::vec4 () const noexcept
        {
            return glm::vec4{r, g, b, a};
        }

        static constexpr Color black()
        {
            return {0.0f, 0.0f, 0.0f, 1.0f};
        }

        static constexpr Color white()
        {
            return {1.0f, 1.0f, 1.0f, 1.0f};
        }

        static constexpr Color red()
        {
            return {1.0f, 0.0f, 0.0f, 1.0f};
        }

        static constexpr Color green()
        {
            return {0.0f, 1.0f, 0.0f, 1.0f};
        }

        static constexpr Color blue()
        {
            return {0.0f, 0.0f, 1.0f, 1.0f};
        }

        float r;
        float g;
        float b;
        float a;
    };

    constexpr bool operator==(Color const& a, Color const& b) noexcept
    {
        return
            a.r == b.r &&
            a.g == b.g &&
            a.b == b.b &&
            a.a == b.a;
    }

    constexpr bool operator!=(Color const& a, Color const& b) noexcept
    {
        return !(a == b);
    }

    std::ostream& operator<<(std::ostream&, Color const&);

    // returns the RGB part of the color
    constexpr glm::vec3 ToRGB(Color const& c) noexcept
    {
        return {c.r, c.g, c.b};
    }

    // returns a copy of the color with its alpha replaced
    constexpr Color WithAlpha(Color const& c, float a) noexcept
    {
        return {c.r, c.g, c.b, a};
    }

    // returns true if every channel of the RGB triplet is within [0, 1]
    bool IsNormalizedRGB(glm::vec3 const&) noexcept;

    // returns a pointer to the first float element in the color (used by OpenGL etc.)
    constexpr float const* ValuePtr(Color const& color)
    {
        return &color.r;
    }
}
