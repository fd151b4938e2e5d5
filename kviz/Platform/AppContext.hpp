#pragma once

#include <memory>

namespace kviz
{
    // explicitly-owned application context
    //
    // initializes the windowing/event backend (SDL) on construction and tears it down on
    // destruction. Anything that opens a window requires a reference to one of these, so
    // callers decide when the backend lives and dies
    class AppContext final {
    public:
        AppContext();
        AppContext(AppContext const&) = delete;
        AppContext(AppContext&&) noexcept = delete;
        AppContext& operator=(AppContext const&) = delete;
        AppContext& operator=(AppContext&&) noexcept = delete;
        ~AppContext() noexcept;

        class Impl;
    private:
        std::unique_ptr<Impl> m_Impl;
    };
}
