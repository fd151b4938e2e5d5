#pragma once

#include <glm/vec2.hpp>
#include <nonstd/span.hpp>

#include <cstdint>
#include <filesystem>
#include <vector>

namespace kviz
{
    // an 8-bit-per-channel image whose rows are stored bottom-to-top (OpenGL's convention)
    class Image final {
    public:
        Image();
        Image(
            glm::ivec2 dimensions,
            nonstd::span<uint8_t const> channelsRowByRow,
            int32_t numChannels
        );

        glm::ivec2 getDimensions() const;
        int32_t getNumChannels() const;
        nonstd::span<uint8_t const> getPixelData() const;

    private:
        glm::ivec2 m_Dimensions;
        int32_t m_NumChannels;
        std::vector<uint8_t> m_Pixels;
    };

    // loads an image file, flipping it so that its rows are bottom-to-top
    Image LoadImageFromFile(std::filesystem::path const&);

    // writes the image as a (top-to-bottom) PNG file; throws on failure
    void WriteImageToPNGFile(Image const&, std::filesystem::path const&);
}
