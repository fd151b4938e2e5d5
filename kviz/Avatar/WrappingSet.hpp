#pragma once

#include "kviz/Avatar/AvatarStyle.hpp"
#include "kviz/Avatar/FrameData.hpp"
#include "kviz/Avatar/RenderablePolicies.hpp"

#include <glm/vec3.hpp>

#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace kviz { class Scene; }

namespace kviz
{
    // wrapping surfaces, indexed by the segment that owns them
    //
    // each segment owns an independent `OutlineSet`, so a change in one segment's
    // wrapping surfaces only rebuilds that segment's actors
    class WrappingSet final {
    public:
        WrappingSet(Scene&, std::string label, CategoryStyle const&);
        WrappingSet(WrappingSet const&) = delete;
        WrappingSet(WrappingSet&&) noexcept = delete;
        WrappingSet& operator=(WrappingSet const&) = delete;
        WrappingSet& operator=(WrappingSet&&) noexcept = delete;
        ~WrappingSet() noexcept;

        // `perSegment[i]` holds the wrapping surfaces of segment `i`
        //
        // every surface of every segment is validated before anything is updated
        void update(std::vector<std::vector<MeshFrame>> perSegment);

        CategoryStyle const& getStyle() const;
        void setColor(glm::vec3 const&);
        void setOpacity(float);
        void setLineWidth(float);

        size_t getNumSegments() const;
        OutlineSet const& getSegment(size_t) const;

        // total number of actors across all segments
        size_t getNumActors() const;

    private:
        std::reference_wrapper<Scene> m_Scene;
        std::string m_Label;
        CategoryStyle m_Style;
        std::vector<std::unique_ptr<OutlineSet>> m_Segments;
    };
}
