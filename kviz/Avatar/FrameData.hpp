#pragma once

#include "kviz/Avatar/Errors.hpp"

#include <glm/mat4x4.hpp>
#include <glm/vec3.hpp>
#include <nonstd/span.hpp>

#include <array>
#include <cstddef>
#include <cstdint>
#include <sstream>
#include <utility>
#include <vector>

namespace kviz
{
    // a (channels x samples) block of per-channel values produced by an external kinematics pipeline
    //
    // values are stored sample-major, so each sample (time point) is a contiguous span of channels.
    // Renderable sets only accept blocks that contain exactly one sample (i.e. one frame)
    template<typename T>
    class FrameData final {
    public:
        FrameData() = default;

        // a single-sample block with one value per channel
        explicit FrameData(std::vector<T> channels) :
            m_NumChannels{channels.size()},
            m_NumSamples{1},
            m_Values{std::move(channels)}
        {
        }

        // throws a `TypeInputError` if `values.size() != numChannels * numSamples`
        FrameData(size_t numChannels, size_t numSamples, std::vector<T> values) :
            m_NumChannels{numChannels},
            m_NumSamples{numSamples},
            m_Values{std::move(values)}
        {
            if (m_Values.size() != m_NumChannels * m_NumSamples)
            {
                std::stringstream ss;
                ss << "frame data has " << m_Values.size() << " values, but " << m_NumChannels << " channels x " << m_NumSamples << " samples were declared";
                throw TypeInputError{std::move(ss).str()};
            }
        }

        size_t getNumChannels() const { return m_NumChannels; }
        size_t getNumSamples() const { return m_NumSamples; }

        nonstd::span<T const> getSample(size_t sample) const
        {
            return nonstd::span<T const>{m_Values}.subspan(sample * m_NumChannels, m_NumChannels);
        }

        T const& at(size_t channel, size_t sample = 0) const
        {
            return m_Values.at(sample * m_NumChannels + channel);
        }

    private:
        size_t m_NumChannels = 0;
        size_t m_NumSamples = 1;
        std::vector<T> m_Values;
    };

    // one 3D point per channel (markers, contacts, centers of mass, mesh vertices)
    using PointSet = FrameData<glm::vec3>;

    // one rigid transform per channel (segment frames)
    //
    // each transform's first three columns are the (orthonormal) basis and the
    // fourth column is the translation
    using RigidTransformSet = FrameData<glm::mat4>;

    // one vertex index triple per row
    using Triangle = std::array<uint32_t, 3>;

    // a single sub-entity of a mesh-like category (one mesh part, one muscle, one wrapping surface)
    struct MeshFrame final {
        PointSet vertices;
        std::vector<Triangle> triangles;
    };

    // throws an `InvalidFrameError` if the data does not contain exactly one sample
    template<typename T>
    void ValidateSingleFrame(FrameData<T> const& data, char const* what)
    {
        if (data.getNumSamples() != 1)
        {
            std::stringstream ss;
            ss << what << ": should be from one frame only (got " << data.getNumSamples() << " samples)";
            throw InvalidFrameError{std::move(ss).str()};
        }
    }

    // throws if the mesh frame is not a single frame, or if any triangle references a missing vertex
    void ValidateMeshFrame(MeshFrame const&, char const* what);

    // returns true if the triangle table describes an ordered outline rather than a triangulated surface
    //
    // that is: there are no triangles, or every triangle starts at the same vertex
    // (so a table with one triangle is an outline)
    bool IsOutlineTopology(nonstd::span<Triangle const>);
}
