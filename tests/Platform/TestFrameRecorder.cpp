#include "kviz/Platform/FrameRecorder.hpp"

#include "kviz/Graphics/Image.hpp"

#include <gtest/gtest.h>
#include <glm/vec2.hpp>

#include <cstdint>
#include <filesystem>
#include <string>
#include <system_error>
#include <vector>

namespace
{
    // a fresh, empty, directory path for the currently-running test
    std::filesystem::path FreshRecordingDir()
    {
        std::string name = "kviz_TestFrameRecorder_";
        name += ::testing::UnitTest::GetInstance()->current_test_info()->name();

        std::filesystem::path const p = std::filesystem::temp_directory_path() / name;
        std::error_code ec;
        std::filesystem::remove_all(p, ec);
        return p;
    }

    kviz::Image BlankImage(int w, int h)
    {
        std::vector<uint8_t> const pixels(static_cast<size_t>(w * h * 4), 0x7f);
        return kviz::Image{{w, h}, pixels, 4};
    }
}

TEST(FrameRecorder, IsNotRecordingWhenConstructed)
{
    kviz::FrameRecorder const recorder;

    ASSERT_FALSE(recorder.isRecording());
    ASSERT_EQ(recorder.getNumFramesCaptured(), 0);
}

TEST(FrameRecorder, BeginCreatesTheDirectory)
{
    std::filesystem::path const dir = FreshRecordingDir() / "nested";
    kviz::FrameRecorder recorder;

    recorder.begin(dir);

    ASSERT_TRUE(recorder.isRecording());
    ASSERT_TRUE(std::filesystem::is_directory(dir));
    ASSERT_TRUE(recorder.getDirectory() == dir);
}

TEST(FrameRecorder, CaptureWritesSequentiallyNumberedPNGs)
{
    std::filesystem::path const dir = FreshRecordingDir();
    kviz::FrameRecorder recorder;
    recorder.begin(dir);

    std::filesystem::path const first = recorder.capture(BlankImage(4, 2));
    std::filesystem::path const second = recorder.capture(BlankImage(4, 2));
    recorder.end();

    ASSERT_TRUE(first == dir / "frame_000000.png");
    ASSERT_TRUE(second == dir / "frame_000001.png");
    ASSERT_TRUE(std::filesystem::exists(first));
    ASSERT_TRUE(std::filesystem::exists(second));
    ASSERT_EQ(recorder.getNumFramesCaptured(), 2);
    ASSERT_FALSE(recorder.isRecording());
}

TEST(FrameRecorder, CapturedFrameHasTheImagesDimensions)
{
    kviz::FrameRecorder recorder;
    recorder.begin(FreshRecordingDir());

    std::filesystem::path const p = recorder.capture(BlankImage(3, 5));

    ASSERT_EQ(kviz::LoadImageFromFile(p).getDimensions(), glm::ivec2(3, 5));
}

TEST(FrameRecorder, CaptureWithDifferentDimensionsThrows)
{
    kviz::FrameRecorder recorder;
    recorder.begin(FreshRecordingDir());
    recorder.capture(BlankImage(4, 4));

    ASSERT_ANY_THROW({ recorder.capture(BlankImage(8, 4)); });
    ASSERT_EQ(recorder.getNumFramesCaptured(), 1);
}

TEST(FrameRecorder, CaptureWhenNotRecordingThrows)
{
    kviz::FrameRecorder recorder;

    ASSERT_ANY_THROW({ recorder.capture(BlankImage(1, 1)); });
}

TEST(FrameRecorder, EndWhenNotRecordingThrows)
{
    kviz::FrameRecorder recorder;

    ASSERT_ANY_THROW({ recorder.end(); });
}

TEST(FrameRecorder, BeginWhileRecordingThrows)
{
    std::filesystem::path const dir = FreshRecordingDir();
    kviz::FrameRecorder recorder;
    recorder.begin(dir);

    ASSERT_ANY_THROW({ recorder.begin(dir / "other"); });
    ASSERT_TRUE(recorder.getDirectory() == dir);
    ASSERT_TRUE(recorder.isRecording());
}

TEST(FrameRecorder, NewRecordingRestartsFrameNumbering)
{
    std::filesystem::path const dir = FreshRecordingDir();
    kviz::FrameRecorder recorder;
    recorder.begin(dir / "a");
    recorder.capture(BlankImage(2, 2));
    recorder.end();

    recorder.begin(dir / "b");
    std::filesystem::path const p = recorder.capture(BlankImage(6, 6));

    ASSERT_TRUE(p == dir / "b" / "frame_000000.png");
}
