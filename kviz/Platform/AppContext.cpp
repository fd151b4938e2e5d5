#include "AppContext.hpp"

#include "kviz/Bindings/Sdl2Bindings.hpp"
#include "kviz/Platform/Log.hpp"
#include "kviz_config.hpp"

#include <memory>

class kviz::AppContext::Impl final {
public:
    Impl()
    {
        log::info("initializing kviz v%s (SDL video subsystem)", KVIZ_VERSION_STRING);
    }

    ~Impl() noexcept
    {
        log::info("shutting down SDL");
    }

private:
    sdl::Context m_SDLContext{SDL_INIT_VIDEO};
};

kviz::AppContext::AppContext() :
    m_Impl{std::make_unique<Impl>()}
{
}

kviz::AppContext::~AppContext() noexcept = default;
