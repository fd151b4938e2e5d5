#pragma once

#include <glm/vec2.hpp>

#include <cstddef>
#include <filesystem>
#include <optional>

namespace kviz { class Image; }

namespace kviz
{
    // writes a sequence of captured frames into a directory as `frame_000000.png`, `frame_000001.png`, ...
    //
    // every frame of one recording must have the same dimensions
    class FrameRecorder final {
    public:
        FrameRecorder() = default;

        // creates the directory (if necessary) and starts a new recording; throws if already recording
        void begin(std::filesystem::path const& directory);

        bool isRecording() const;

        // writes the image as the next frame and returns the path it was written to
        //
        // throws if not recording, or if the image's dimensions differ from the first frame's
        std::filesystem::path capture(Image const&);

        // stops the recording; throws if not recording
        void end();

        std::filesystem::path const& getDirectory() const;
        size_t getNumFramesCaptured() const;

    private:
        bool m_IsRecording = false;
        std::filesystem::path m_Directory;
        size_t m_NumFramesCaptured = 0;
        std::optional<glm::ivec2> m_FrameDimensions;
    };
}
