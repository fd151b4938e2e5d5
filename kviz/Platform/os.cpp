#include "os.hpp"

#include <SDL_error.h>
#include <SDL_filesystem.h>
#include <SDL_stdinc.h>

#include <cstring>
#include <filesystem>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

static std::filesystem::path convertSDLPathToStdpath(char const* methodname, char* p)
{
    if (p == nullptr)
    {
        std::stringstream ss;
        ss << methodname << ": returned null: " << SDL_GetError();
        throw std::runtime_error{std::move(ss).str()};
    }

    size_t len = std::strlen(p);

    if (len == 0)
    {
        std::stringstream ss;
        ss << methodname << ": returned an empty string";
        throw std::runtime_error{std::move(ss).str()};
    }

    // remove trailing slash: it interferes with std::filesystem::path
    p[len - 1] = '\0';

    return std::filesystem::path{p};
}

static std::filesystem::path getCurrentExeDir()
{
    std::unique_ptr<char, decltype(&SDL_free)> p{SDL_GetBasePath(), SDL_free};

    return convertSDLPathToStdpath("SDL_GetBasePath", p.get());
}

std::filesystem::path const& kviz::CurrentExeDir()
{
    // can be expensive to compute: cache after first retrieval
    static std::filesystem::path const d = getCurrentExeDir();

    return d;
}
