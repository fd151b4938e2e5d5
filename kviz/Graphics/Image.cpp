#include "Image.hpp"

#include "kviz/Utils/Assertions.hpp"

#include <glm/vec2.hpp>
#include <nonstd/span.hpp>
#define STB_IMAGE_IMPLEMENTATION
#include <stb_image.h>
#define STB_IMAGE_WRITE_IMPLEMENTATION
#include <stb_image_write.h>

#include <cstdint>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <stdexcept>
#include <utility>

// this mutex is required because stbi has global methods (e.g. stbi_set_flip_vertically_on_load)
static std::mutex g_StbiMutex;

kviz::Image::Image() :
    m_Dimensions{0, 0},
    m_NumChannels{4}
{
}

kviz::Image::Image(
    glm::ivec2 dimensions,
    nonstd::span<uint8_t const> channelsRowByRow,
    int32_t numChannels) :

    m_Dimensions{dimensions},
    m_NumChannels{numChannels},
    m_Pixels(channelsRowByRow.begin(), channelsRowByRow.end())
{
    KVIZ_THROWING_ASSERT(m_Dimensions.x >= 0 && m_Dimensions.y >= 0);
    KVIZ_THROWING_ASSERT(1 <= m_NumChannels && m_NumChannels <= 4);
    KVIZ_THROWING_ASSERT(m_Pixels.size() == static_cast<size_t>(m_Dimensions.x * m_Dimensions.y * m_NumChannels));
}

glm::ivec2 kviz::Image::getDimensions() const
{
    return m_Dimensions;
}

int32_t kviz::Image::getNumChannels() const
{
    return m_NumChannels;
}

nonstd::span<uint8_t const> kviz::Image::getPixelData() const
{
    return m_Pixels;
}

kviz::Image kviz::LoadImageFromFile(std::filesystem::path const& p)
{
    std::lock_guard stbiGuard{g_StbiMutex};

    stbi_set_flip_vertically_on_load(true);

    glm::ivec2 dims = {0, 0};
    int32_t channels = 0;
    std::unique_ptr<stbi_uc, decltype(&stbi_image_free)> pixels =
    {
        stbi_load(p.string().c_str(), &dims.x, &dims.y, &channels, 0),
        stbi_image_free,
    };

    stbi_set_flip_vertically_on_load(false);

    if (!pixels)
    {
        std::stringstream ss;
        ss << p << ": error loading image path: " << stbi_failure_reason();
        throw std::runtime_error{std::move(ss).str()};
    }

    nonstd::span<uint8_t const> dataSpan{pixels.get(), static_cast<size_t>(dims.x * dims.y * channels)};

    return Image{dims, dataSpan, channels};
}

void kviz::WriteImageToPNGFile(Image const& image, std::filesystem::path const& outpath)
{
    std::string const pathStr = outpath.string();
    int32_t const w = image.getDimensions().x;
    int32_t const h = image.getDimensions().y;
    int32_t const strideBetweenRows = w * image.getNumChannels();

    std::lock_guard stbiGuard{g_StbiMutex};
    stbi_flip_vertically_on_write(true);
    auto const rv = stbi_write_png(pathStr.c_str(), w, h, image.getNumChannels(), image.getPixelData().data(), strideBetweenRows);
    stbi_flip_vertically_on_write(false);

    if (rv == 0)
    {
        std::stringstream ss;
        ss << outpath << ": error writing PNG file";
        throw std::runtime_error{std::move(ss).str()};
    }
}
