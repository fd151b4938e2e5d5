#pragma once

#include "kviz/Avatar/AvatarStyle.hpp"
#include "kviz/Graphics/Color.hpp"

#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace kviz
{
    // parameters used when creating a window
    struct WindowParams final {
        int width = 800;
        int height = 600;
        std::string title = "kviz";
        Color background = Color::black();
    };

    // runtime configuration, optionally loaded from a `kviz.toml` file
    //
    // missing files, unparseable files, and invalid individual values are logged and
    // then ignored: loading a config never throws
    class Config final {
    public:
        // try to load the config from disk (searches upwards from the executable's directory for `kviz.toml`)
        static std::unique_ptr<Config> load();

        // try to load the config from a specific file
        static std::unique_ptr<Config> loadFile(std::filesystem::path const&);

        class Impl;
    public:
        explicit Config(Impl*);  // you should use Config::load
        Config(Config const&) = delete;
        Config(Config&&) noexcept;
        Config& operator=(Config const&) = delete;
        Config& operator=(Config&&) noexcept;
        ~Config() noexcept;

        // path of the file the config was loaded from, if one was found and parsed
        std::optional<std::filesystem::path> const& getSourcePath() const;

        WindowParams const& getWindowParams() const;
        AvatarStyle const& getAvatarStyle() const;

        // directory frames are written to when recording (relative paths are relative to the config file)
        std::filesystem::path const& getRecordingDirectory() const;

        // true if every run should record into `getRecordingDirectory()`
        bool isRecordingEnabled() const;

    private:
        Impl* m_Impl;
    };
}
