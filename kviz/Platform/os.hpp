#pragma once

#include <filesystem>

// os: where all the icky OS/distro/filesystem-specific stuff is hidden
namespace kviz
{
    // returns the full path to the directory of the currently-executing application
    std::filesystem::path const& CurrentExeDir();
}
