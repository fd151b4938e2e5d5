#include "FrameRecorder.hpp"

#include "kviz/Graphics/Image.hpp"
#include "kviz/Platform/Log.hpp"

#include <glm/vec2.hpp>

#include <cstdio>
#include <filesystem>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace
{
    std::filesystem::path FrameFilename(size_t i)
    {
        char buf[32];
        std::snprintf(buf, sizeof(buf), "frame_%06zu.png", i);
        return std::filesystem::path{buf};
    }
}

void kviz::FrameRecorder::begin(std::filesystem::path const& directory)
{
    if (m_IsRecording)
    {
        std::stringstream ss;
        ss << "cannot begin recording into " << directory << ": already recording into " << m_Directory;
        throw std::runtime_error{std::move(ss).str()};
    }

    std::error_code ec;
    std::filesystem::create_directories(directory, ec);
    if (ec)
    {
        std::stringstream ss;
        ss << directory << ": cannot create recording directory: " << ec.message();
        throw std::runtime_error{std::move(ss).str()};
    }

    m_IsRecording = true;
    m_Directory = directory;
    m_NumFramesCaptured = 0;
    m_FrameDimensions.reset();

    log::info("recording frames into %s", m_Directory.string().c_str());
}

bool kviz::FrameRecorder::isRecording() const
{
    return m_IsRecording;
}

std::filesystem::path kviz::FrameRecorder::capture(Image const& image)
{
    if (!m_IsRecording)
    {
        throw std::runtime_error{"cannot capture a frame: not recording"};
    }

    glm::ivec2 const dims = image.getDimensions();
    if (!m_FrameDimensions)
    {
        m_FrameDimensions = dims;
    }
    else if (*m_FrameDimensions != dims)
    {
        std::stringstream ss;
        ss << "cannot capture a " << dims.x << "x" << dims.y << " frame into a " << m_FrameDimensions->x << "x" << m_FrameDimensions->y << " recording";
        throw std::runtime_error{std::move(ss).str()};
    }

    std::filesystem::path p = m_Directory / FrameFilename(m_NumFramesCaptured);
    WriteImageToPNGFile(image, p);
    ++m_NumFramesCaptured;

    return p;
}

void kviz::FrameRecorder::end()
{
    if (!m_IsRecording)
    {
        throw std::runtime_error{"cannot end recording: not recording"};
    }

    m_IsRecording = false;
    log::info("recorded %zu frames into %s", m_NumFramesCaptured, m_Directory.string().c_str());
}

std::filesystem::path const& kviz::FrameRecorder::getDirectory() const
{
    return m_Directory;
}

size_t kviz::FrameRecorder::getNumFramesCaptured() const
{
    return m_NumFramesCaptured;
}
