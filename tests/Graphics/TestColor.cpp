#include "kviz/Graphics/Color.hpp"

#include <gtest/gtest.h>
#include <glm/vec3.hpp>
#include <glm/vec4.hpp>

TEST(Color, CanConstructFromRGBAFloats)
{
    kviz::Color const color{1.0f, 0.0f, 0.0f, 0.0f};

    ASSERT_EQ(color.r, 1.0f);
    ASSERT_EQ(color.a, 0.0f);
}

TEST(Color, RGBAFloatConstructorIsConstexpr)
{
    // must compile
    kviz::Color constexpr color{0.0f, 0.0f, 0.0f, 0.0f};
    static_assert(color.a == 0.0f);
}

TEST(Color, AlphaDefaultsToOpaque)
{
    kviz::Color const color{0.5f, 0.5f, 0.5f};

    ASSERT_EQ(color.a, 1.0f);
}

TEST(Color, CanBeConstructedFromRGBAndAlpha)
{
    kviz::Color const color{glm::vec3{0.1f, 0.2f, 0.3f}, 0.4f};

    ASSERT_EQ(color, (kviz::Color{0.1f, 0.2f, 0.3f, 0.4f}));
}

TEST(Color, CanBeImplicitlyConvertedToVec4)
{
    glm::vec4 constexpr v = kviz::Color{0.0f, 0.0f, 1.0f, 0.0f};

    ASSERT_EQ(v, glm::vec4(0.0f, 0.0f, 1.0f, 0.0f));
}

TEST(Color, EqualityReturnsTrueForEquivalentColors)
{
    kviz::Color const a = {1.0f, 0.0f, 1.0f, 0.5f};
    kviz::Color const b = {1.0f, 0.0f, 1.0f, 0.5f};

    ASSERT_TRUE(a == b);
}

TEST(Color, InequalityReturnsTrueForInequivalentColors)
{
    kviz::Color const a = {0.0f, 0.0f, 1.0f, 0.5f};
    kviz::Color const b = {1.0f, 0.0f, 1.0f, 0.5f};

    ASSERT_TRUE(a != b);
}

TEST(Color, ToRGBDropsAlpha)
{
    ASSERT_EQ(kviz::ToRGB(kviz::Color{0.1f, 0.2f, 0.3f, 0.4f}), glm::vec3(0.1f, 0.2f, 0.3f));
}

TEST(Color, WithAlphaOnlyReplacesAlpha)
{
    ASSERT_EQ(kviz::WithAlpha(kviz::Color::green(), 0.5f), (kviz::Color{0.0f, 1.0f, 0.0f, 0.5f}));
}

TEST(Color, IsNormalizedRGBChecksEveryChannel)
{
    ASSERT_TRUE(kviz::IsNormalizedRGB({0.0f, 0.5f, 1.0f}));
    ASSERT_FALSE(kviz::IsNormalizedRGB({-0.1f, 0.5f, 1.0f}));
    ASSERT_FALSE(kviz::IsNormalizedRGB({0.0f, 1.5f, 1.0f}));
    ASSERT_FALSE(kviz::IsNormalizedRGB({0.0f, 0.5f, 255.0f}));
}

TEST(Color, ValuePtrPointsAtRedChannel)
{
    kviz::Color const color = kviz::Color::blue();

    ASSERT_EQ(kviz::ValuePtr(color)[0], 0.0f);
    ASSERT_EQ(kviz::ValuePtr(color)[2], 1.0f);
}
