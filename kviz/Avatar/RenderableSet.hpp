#pragma once

#include "kviz/Avatar/AvatarStyle.hpp"
#include "kviz/Graphics/Color.hpp"
#include "kviz/Platform/Log.hpp"
#include "kviz/Scene/Actor.hpp"
#include "kviz/Scene/Scene.hpp"
#include "kviz/Utils/Assertions.hpp"

#include <glm/vec3.hpp>
#include <nonstd/span.hpp>

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace kviz
{
    // a set of scene actors that is kept in sync with a stream of frames
    //
    // each call to `update` either takes the "fast path" (the incoming frame has the
    // same arity as the previous one, so the existing actors are updated in-place) or
    // rebuilds the set (every actor is removed from the scene and replaced by a new
    // generation of actors, followed by one camera reset request)
    //
    // what a frame is, how arity is measured, and how actors are built/updated/styled
    // is decided by the policy, which must provide:
    //
    //     using Frame = ...;
    //     static constexpr bool restyleOnUpdate = ...;
    //     void validate(Frame const&) const;                                      // throws on bad input
    //     std::vector<size_t> arity(Frame const&) const;                          // rebuild when this changes
    //     size_t numActors(Frame const&) const;
    //     void initActor(Actor&, Frame const&, size_t, CategoryStyle&) const;     // topology (rebuild only)
    //     void updateActor(Actor&, Frame const&, size_t, CategoryStyle const&) const;  // geometry
    //     void applyStyle(Actor&, CategoryStyle const&) const;
    //
    // the scene must outlive the set
    template<typename TPolicy>
    class RenderableSet final {
    public:
        using Frame = typename TPolicy::Frame;

        RenderableSet(Scene& scene, std::string label, CategoryStyle const& style, TPolicy policy = TPolicy{}) :
            m_Scene{scene},
            m_Label{std::move(label)},
            m_Style{style},
            m_Policy{std::move(policy)}
        {
            KVIZ_THROWING_ASSERT(IsValid(m_Style));
        }

        RenderableSet(RenderableSet const&) = delete;
        RenderableSet(RenderableSet&&) noexcept = delete;
        RenderableSet& operator=(RenderableSet const&) = delete;
        RenderableSet& operator=(RenderableSet&&) noexcept = delete;

        ~RenderableSet() noexcept
        {
            clear();
        }

        // push one frame into the set
        //
        // the whole frame is validated before any actor is touched
        void update(Frame frame)
        {
            m_Policy.validate(frame);

            std::vector<size_t> arity = m_Policy.arity(frame);
            if (!m_LastFrame || arity != m_Arity)
            {
                rebuild(std::move(frame), std::move(arity));
                return;
            }

            m_LastFrame = std::move(frame);
            updateActors();
            if constexpr (TPolicy::restyleOnUpdate)
            {
                applyStyle();
            }
        }

        CategoryStyle const& getStyle() const
        {
            return m_Style;
        }

        void setSize(float size)
        {
            KVIZ_THROWING_ASSERT(size > 0.0f);
            m_Style.size = size;
            restyle();
        }

        void setColor(glm::vec3 const& color)
        {
            KVIZ_THROWING_ASSERT(IsNormalizedRGB(color));
            m_Style.color = color;
            restyle();
        }

        void setOpacity(float opacity)
        {
            KVIZ_THROWING_ASSERT(0.0f <= opacity && opacity <= 1.0f);
            m_Style.opacity = opacity;
            restyle();
        }

        void setLineWidth(float width)
        {
            KVIZ_THROWING_ASSERT(width > 0.0f);
            m_Style.lineWidth = width;
            restyle();
        }

        std::string const& getLabel() const
        {
            return m_Label;
        }

        nonstd::span<std::shared_ptr<Actor> const> getActors() const
        {
            return m_Actors;
        }

        size_t getNumActors() const
        {
            return m_Actors.size();
        }

        // the most recently pushed frame, if any
        std::optional<Frame> const& getLastFrame() const
        {
            return m_LastFrame;
        }

        // number of times the set has been rebuilt (i.e. number of actor generations)
        size_t getNumRebuilds() const
        {
            return m_NumRebuilds;
        }

        // removes every actor from the scene and forgets the last frame
        void clear() noexcept
        {
            for (auto const& actor : m_Actors)
            {
                m_Scene.get().removeActor(*actor);
            }
            m_Actors.clear();
            m_LastFrame.reset();
            m_Arity.clear();
        }

    private:
        void rebuild(Frame frame, std::vector<size_t> arity)
        {
            for (auto const& actor : m_Actors)
            {
                m_Scene.get().removeActor(*actor);
            }
            m_Actors.clear();

            m_LastFrame = std::move(frame);
            m_Arity = std::move(arity);

            size_t const n = m_Policy.numActors(*m_LastFrame);
            m_Actors.reserve(n);
            for (size_t i = 0; i < n; ++i)
            {
                auto actor = std::make_shared<Actor>(m_Label + '/' + std::to_string(i));
                m_Policy.initActor(*actor, *m_LastFrame, i, m_Style);
                m_Scene.get().addActor(actor);
                m_Actors.push_back(std::move(actor));
            }
            m_Scene.get().requestCameraReset();
            ++m_NumRebuilds;

            updateActors();
            applyStyle();

            log::debug("%s: rebuilt with %zu actors", m_Label.c_str(), n);
        }

        void updateActors()
        {
            for (size_t i = 0; i < m_Actors.size(); ++i)
            {
                m_Policy.updateActor(*m_Actors[i], *m_LastFrame, i, m_Style);
            }
        }

        void applyStyle()
        {
            for (auto const& actor : m_Actors)
            {
                m_Policy.applyStyle(*actor, m_Style);
            }
        }

        // style changes only become visible by going through the update pathway
        void restyle()
        {
            applyStyle();
            if (m_LastFrame)
            {
                updateActors();
            }
        }

        std::reference_wrapper<Scene> m_Scene;
        std::string m_Label;
        CategoryStyle m_Style;
        TPolicy m_Policy;
        std::vector<std::shared_ptr<Actor>> m_Actors;
        std::optional<Frame> m_LastFrame;
        std::vector<size_t> m_Arity;
        size_t m_NumRebuilds = 0;
    };
}
