#include "kviz/Avatar/AvatarModel.hpp"
#include "kviz/Avatar/FrameData.hpp"
#include "kviz/Maths/Constants.hpp"
#include "kviz/Platform/AppContext.hpp"
#include "kviz/Platform/Config.hpp"
#include "kviz/Platform/Log.hpp"
#include "kviz/Platform/Window.hpp"

#include <glm/gtc/matrix_transform.hpp>
#include <glm/mat4x4.hpp>
#include <glm/vec3.hpp>

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <initializer_list>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

static char const c_Usage[] = R"(usage: kviz [--help] [--config FILE] [--record [DIR]] [--frames N]
)";

static char const c_Help[] = R"(OPTIONS
    --help
        Show this help
    --config FILE
        Load settings from FILE, rather than searching for a kviz.toml
    --record [DIR]
        Write every shown frame into DIR as a PNG sequence (default: the
        configured recording directory)
    --frames N
        Stop after N frames (default: run until the window is closed)
)";

namespace
{
    bool SkipPrefix(char const* prefix, char const* s, char const** out)
    {
        do
        {
            if (*prefix == '\0' && (*s == '\0' || *s == '='))
            {
                *out = s;
                return true;
            }
        }
        while (*prefix++ == *s++);

        return false;
    }

    // reads the value of a `--flag=value` or `--flag value` argument
    std::optional<std::string> ReadFlagValue(char const* rest, int& argc, char**& argv)
    {
        if (*rest == '=')
        {
            return std::string{rest + 1};
        }
        if (argc < 2)
        {
            return std::nullopt;
        }
        --argc;
        ++argv;
        return std::string{*argv};
    }

    // reads the value of a `--flag=value` or `--flag value` argument, where the value may be omitted
    std::optional<std::string> ReadOptionalFlagValue(char const* rest, int& argc, char**& argv)
    {
        if (*rest == '=')
        {
            return std::string{rest + 1};
        }
        if (argc < 2 || *argv[1] == '-')
        {
            return std::nullopt;
        }
        --argc;
        ++argv;
        return std::string{*argv};
    }

    // a procedurally-animated avatar that exercises every renderable category
    class SyntheticAvatar final {
    public:
        explicit SyntheticAvatar(float t) : m_Sway{0.05f * std::sin(t)}, m_T{t}
        {
        }

        kviz::PointSet markers() const
        {
            // switch between 8 and 10 markers every few seconds, which forces a rebuild
            size_t const n = (static_cast<int>(m_T / 4.0f) % 2 == 0) ? 8 : 10;
            std::vector<glm::vec3> pts;
            for (size_t i = 0; i < n; ++i)
            {
                float const a = 2.0f * kviz::fpi * static_cast<float>(i) / static_cast<float>(n);
                pts.emplace_back(0.15f * std::cos(a) + m_Sway, 0.9f + 0.1f * std::sin(3.0f * a), 0.15f * std::sin(a));
            }
            return kviz::PointSet{std::move(pts)};
        }

        kviz::PointSet contacts() const
        {
            return kviz::PointSet{{{-0.1f, 0.0f, 0.0f}, {0.1f, 0.0f, 0.0f}}};
        }

        kviz::PointSet globalCenterOfMass() const
        {
            return kviz::PointSet{{{m_Sway, 0.9f, 0.0f}}};
        }

        kviz::PointSet segmentsCenterOfMass() const
        {
            return kviz::PointSet{{{m_Sway, 1.2f, 0.0f}, {m_Sway, 0.9f, 0.0f}, {0.5f * m_Sway, 0.45f, 0.0f}}};
        }

        std::vector<kviz::MeshFrame> meshes() const
        {
            std::vector<kviz::MeshFrame> rv;

            // a tetrahedral "trunk" (triangulated surface)
            rv.push_back(kviz::MeshFrame{
                kviz::PointSet{{
                    {m_Sway - 0.1f, 0.8f, -0.05f},
                    {m_Sway + 0.1f, 0.8f, -0.05f},
                    {m_Sway, 0.8f, 0.1f},
                    {m_Sway, 1.3f, 0.0f},
                }},
                {{0, 2, 1}, {0, 1, 3}, {1, 2, 3}, {2, 0, 3}},
            });

            // a pelvis outline (every row starts at the same vertex)
            rv.push_back(kviz::MeshFrame{
                kviz::PointSet{{
                    {0.0f, 0.7f, 0.0f},
                    {-0.12f, 0.65f, 0.05f},
                    {0.12f, 0.65f, 0.05f},
                    {0.0f, 0.6f, -0.08f},
                }},
                {{0, 1, 2}, {0, 2, 3}, {0, 3, 1}},
            });

            return rv;
        }

        std::vector<kviz::MeshFrame> muscles() const
        {
            std::vector<kviz::MeshFrame> rv;
            for (float side : {-1.0f, 1.0f})
            {
                rv.push_back(kviz::MeshFrame{
                    kviz::PointSet{{
                        {side * 0.08f, 0.7f, 0.0f},
                        {side * 0.1f + m_Sway, 0.45f, 0.03f},
                        {side * 0.1f, 0.05f, 0.0f},
                    }},
                    {{0, 1, 2}},
                });
            }
            return rv;
        }

        std::vector<std::vector<kviz::MeshFrame>> wrappings() const
        {
            // segment 0 has a ring-shaped wrapping surface, segment 1 has none
            std::vector<glm::vec3> ring;
            for (size_t i = 0; i < 16; ++i)
            {
                float const a = 2.0f * kviz::fpi * static_cast<float>(i) / 16.0f;
                ring.emplace_back(0.04f * std::cos(a) + 0.1f, 0.45f, 0.04f * std::sin(a));
            }

            std::vector<std::vector<kviz::MeshFrame>> rv(2);
            rv[0].push_back(kviz::MeshFrame{kviz::PointSet{std::move(ring)}, {}});
            return rv;
        }

        kviz::RigidTransformSet rigidTransforms() const
        {
            std::vector<glm::mat4> transforms;
            for (float y : {0.45f, 0.9f, 1.2f})
            {
                glm::mat4 m = glm::translate(glm::mat4{1.0f}, glm::vec3{m_Sway, y, 0.0f});
                m = glm::rotate(m, 0.5f * std::sin(m_T + y), glm::vec3{0.0f, 1.0f, 0.0f});
                transforms.push_back(m);
            }
            return kviz::RigidTransformSet{std::move(transforms)};
        }

    private:
        float m_Sway;
        float m_T;
    };
}

int main(int argc, char** argv)
{
    std::optional<std::filesystem::path> maybeConfigPath;
    std::optional<std::filesystem::path> maybeRecordingDir;
    bool record = false;
    std::optional<int64_t> maybeNumFrames;

    // skip application name
    --argc;
    ++argv;

    // handle named flag args (e.g. --help)
    while (argc)
    {
        char const* arg = *argv;

        if (*arg != '-')
        {
            break;
        }

        if (SkipPrefix("--help", arg, &arg))
        {
            std::cout << c_Usage << '\n' << c_Help << '\n';
            return EXIT_SUCCESS;
        }
        else if (SkipPrefix("--config", arg, &arg))
        {
            std::optional<std::string> v = ReadFlagValue(arg, argc, argv);
            if (!v)
            {
                std::cerr << "kviz: --config: missing FILE\n" << c_Usage;
                return EXIT_FAILURE;
            }
            maybeConfigPath = *v;
        }
        else if (SkipPrefix("--record", arg, &arg))
        {
            if (std::optional<std::string> v = ReadOptionalFlagValue(arg, argc, argv))
            {
                maybeRecordingDir = *v;
            }
            record = true;
        }
        else if (SkipPrefix("--frames", arg, &arg))
        {
            std::optional<std::string> v = ReadFlagValue(arg, argc, argv);
            char* end = nullptr;
            long long n = v ? std::strtoll(v->c_str(), &end, 10) : 0;
            if (!v || end == v->c_str() || *end != '\0' || n <= 0)
            {
                std::cerr << "kviz: --frames: expected a positive integer\n" << c_Usage;
                return EXIT_FAILURE;
            }
            maybeNumFrames = static_cast<int64_t>(n);
        }
        else
        {
            std::cerr << "kviz: " << arg << ": unknown option\n" << c_Usage;
            return EXIT_FAILURE;
        }

        ++argv;
        --argc;
    }

    try
    {
        std::unique_ptr<kviz::Config> config = maybeConfigPath ?
            kviz::Config::loadFile(*maybeConfigPath) :
            kviz::Config::load();

        kviz::AppContext context;
        kviz::Window window{context, config->getWindowParams()};
        kviz::AvatarModel avatar{window.updScene(), config->getAvatarStyle()};
        avatar.createGlobalReferenceFrame();

        if (record || config->isRecordingEnabled())
        {
            window.beginRecording(maybeRecordingDir ? *maybeRecordingDir : config->getRecordingDirectory());
        }

        for (int64_t frame = 0; window.isOpen() && (!maybeNumFrames || frame < *maybeNumFrames); ++frame)
        {
            SyntheticAvatar const synth{static_cast<float>(frame) / 60.0f};

            avatar.updateMarkers(synth.markers());
            avatar.updateContacts(synth.contacts());
            avatar.updateGlobalCenterOfMass(synth.globalCenterOfMass());
            avatar.updateSegmentsCenterOfMass(synth.segmentsCenterOfMass());
            avatar.updateMeshes(synth.meshes());
            avatar.updateMuscles(synth.muscles());
            avatar.updateWrappings(synth.wrappings());
            avatar.updateRigidTransforms(synth.rigidTransforms());

            window.repaint();

            if (window.isRecording() && window.isOpen())
            {
                window.captureFrame();
            }
        }

        if (window.isRecording())
        {
            window.endRecording();
        }
    }
    catch (std::exception const& ex)
    {
        kviz::log::critical("kviz: fatal error: %s", ex.what());
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
