#include "Config.hpp"

#include "kviz/Avatar/AvatarStyle.hpp"
#include "kviz/Graphics/Color.hpp"
#include "kviz/Platform/Log.hpp"
#include "kviz/Platform/os.hpp"
#include "kviz_config.hpp"

#include <glm/vec3.hpp>
#include <toml.hpp>

#include <cstdint>
#include <exception>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <utility>

namespace fs = std::filesystem;

static std::optional<fs::path> TryGetConfigLocation()
{
    fs::path p = kviz::CurrentExeDir();

    while (p.has_filename())
    {
        fs::path maybeConfig = p / "kviz.toml";
        if (fs::exists(maybeConfig))
        {
            return maybeConfig;
        }
        p = p.parent_path();
    }

    return std::nullopt;
}

class kviz::Config::Impl final {
public:
    std::optional<fs::path> sourcePath;
    WindowParams window;
    AvatarStyle avatarStyle;
    fs::path recordingDirectory = KVIZ_DEFAULT_RECORDING_DIR;
    bool recordingEnabled = false;
};

static std::optional<glm::vec3> TryReadRGB(toml::node_view<toml::node> node, char const* key)
{
    toml::array const* arr = node.as_array();
    if (!arr || arr->size() != 3)
    {
        kviz::log::warn("%s: should be an array of three numbers: ignoring", key);
        return std::nullopt;
    }

    glm::vec3 rv;
    for (size_t i = 0; i < 3; ++i)
    {
        std::optional<double> v = (*arr)[i].value<double>();
        if (!v)
        {
            kviz::log::warn("%s: element %zu is not a number: ignoring", key, i);
            return std::nullopt;
        }
        rv[static_cast<glm::length_t>(i)] = static_cast<float>(*v);
    }

    if (!kviz::IsNormalizedRGB(rv))
    {
        kviz::log::warn("%s: color components should be within [0, 1]: ignoring", key);
        return std::nullopt;
    }

    return rv;
}

static void TryUpdateCategoryStyle(toml::table& config, char const* name, kviz::CategoryStyle& style)
{
    toml::node_view<toml::node> tbl = config[name];
    if (!tbl)
    {
        return;
    }

    if (auto size = tbl["size"].value<double>(); size)
    {
        if (*size > 0.0)
        {
            style.size = static_cast<float>(*size);
        }
        else
        {
            kviz::log::warn("%s.size: should be greater than zero: ignoring", name);
        }
    }

    if (auto color = tbl["color"]; color)
    {
        std::string key = std::string{name} + ".color";
        if (std::optional<glm::vec3> rgb = TryReadRGB(color, key.c_str()))
        {
            style.color = *rgb;
        }
    }

    if (auto opacity = tbl["opacity"].value<double>(); opacity)
    {
        if (0.0 <= *opacity && *opacity <= 1.0)
        {
            style.opacity = static_cast<float>(*opacity);
        }
        else
        {
            kviz::log::warn("%s.opacity: should be within [0, 1]: ignoring", name);
        }
    }

    if (auto width = tbl["line_width"].value<double>(); width)
    {
        if (*width > 0.0)
        {
            style.lineWidth = static_cast<float>(*width);
        }
        else
        {
            kviz::log::warn("%s.line_width: should be greater than zero: ignoring", name);
        }
    }
}

static void TryUpdateConfigFromConfigFile(kviz::Config::Impl& cfg, fs::path const& configPath)
{
    toml::table config;
    try
    {
        config = toml::parse_file(configPath.string());
    }
    catch (std::exception const& ex)
    {
        kviz::log::error("error parsing config toml: %s", ex.what());
        kviz::log::error("kviz will continue to boot with default settings, but you might need to fix your config file (%s)", configPath.string().c_str());
        return;
    }

    // config file parsed as TOML just fine

    cfg.sourcePath = configPath;

    // [window]
    if (auto width = config["window"]["width"].value<int64_t>(); width)
    {
        if (*width > 0)
        {
            cfg.window.width = static_cast<int>(*width);
        }
        else
        {
            kviz::log::warn("window.width: should be greater than zero: ignoring");
        }
    }
    if (auto height = config["window"]["height"].value<int64_t>(); height)
    {
        if (*height > 0)
        {
            cfg.window.height = static_cast<int>(*height);
        }
        else
        {
            kviz::log::warn("window.height: should be greater than zero: ignoring");
        }
    }
    if (auto title = config["window"]["title"].value<std::string>(); title)
    {
        cfg.window.title = std::move(*title);
    }
    if (auto background = config["window"]["background"]; background)
    {
        if (std::optional<glm::vec3> rgb = TryReadRGB(background, "window.background"))
        {
            cfg.window.background = kviz::Color{*rgb, 1.0f};
        }
    }

    // [recording]: directory is relative *to the configuration file*
    if (auto dir = config["recording"]["directory"].value<std::string>(); dir)
    {
        cfg.recordingDirectory = configPath.parent_path() / *dir;
    }
    if (auto enabled = config["recording"]["enabled"]; enabled)
    {
        if (std::optional<bool> v = enabled.value<bool>())
        {
            cfg.recordingEnabled = *v;
        }
        else
        {
            kviz::log::warn("recording.enabled: should be a boolean: ignoring");
        }
    }

    // per-category tables
    kviz::AvatarStyle& s = cfg.avatarStyle;
    TryUpdateCategoryStyle(config, "markers", s.markers);
    TryUpdateCategoryStyle(config, "contacts", s.contacts);
    TryUpdateCategoryStyle(config, "global_center_of_mass", s.globalCenterOfMass);
    TryUpdateCategoryStyle(config, "segments_center_of_mass", s.segmentsCenterOfMass);
    TryUpdateCategoryStyle(config, "mesh", s.mesh);
    TryUpdateCategoryStyle(config, "muscle", s.muscle);
    TryUpdateCategoryStyle(config, "wrapping", s.wrapping);
    TryUpdateCategoryStyle(config, "rt", s.rigidTransforms);
    TryUpdateCategoryStyle(config, "global_ref_frame", s.globalReferenceFrame);

    kviz::log::info("loaded config from %s", configPath.string().c_str());
}

// public API

std::unique_ptr<kviz::Config> kviz::Config::load()
{
    auto rv = std::make_unique<Config::Impl>();

    std::optional<fs::path> maybeConfigPath = TryGetConfigLocation();

    // can't find underlying config file: note it but escape early
    if (!maybeConfigPath)
    {
        log::info("could not find a kviz.toml configuration file: kviz will still work, but with default settings");
        return std::make_unique<Config>(rv.release());
    }

    TryUpdateConfigFromConfigFile(*rv, *maybeConfigPath);

    return std::make_unique<Config>(rv.release());
}

std::unique_ptr<kviz::Config> kviz::Config::loadFile(fs::path const& p)
{
    auto rv = std::make_unique<Config::Impl>();

    if (!fs::exists(p))
    {
        log::error("%s: config file does not exist: using default settings", p.string().c_str());
        return std::make_unique<Config>(rv.release());
    }

    TryUpdateConfigFromConfigFile(*rv, p);

    return std::make_unique<Config>(rv.release());
}

kviz::Config::Config(Impl* impl) :
    m_Impl{std::move(impl)}
{
}

kviz::Config::Config(Config&& tmp) noexcept :
    m_Impl{std::exchange(tmp.m_Impl, nullptr)}
{
}

kviz::Config& kviz::Config::operator=(Config&& tmp) noexcept
{
    std::swap(m_Impl, tmp.m_Impl);
    return *this;
}

kviz::Config::~Config() noexcept
{
    delete m_Impl;
}

std::optional<fs::path> const& kviz::Config::getSourcePath() const
{
    return m_Impl->sourcePath;
}

kviz::WindowParams const& kviz::Config::getWindowParams() const
{
    return m_Impl->window;
}

kviz::AvatarStyle const& kviz::Config::getAvatarStyle() const
{
    return m_Impl->avatarStyle;
}

fs::path const& kviz::Config::getRecordingDirectory() const
{
    return m_Impl->recordingDirectory;
}

bool kviz::Config::isRecordingEnabled() const
{
    return m_Impl->recordingEnabled;
}
