#include "Assertions.hpp"

#include "kviz/Platform/Log.hpp"

#include <array>
#include <cstdio>
#include <exception>
#include <mutex>
#include <stdexcept>

namespace
{
    // assertion messages are formatted into a static buffer, so that a failing
    // assertion doesn't have to allocate
    std::mutex g_AssertionBufferMutex;
    std::array<char, 2048> g_AssertionBuffer{};
}

void kviz::OnAssertionFailure(
    char const* failingCode,
    char const* func,
    char const* file,
    unsigned int line) noexcept
{
    std::lock_guard lock{g_AssertionBufferMutex};

    std::snprintf(g_AssertionBuffer.data(), g_AssertionBuffer.size(), "%s:%s:%u: assert(%s): failed", file, func, line, failingCode);
    log::error("%s", g_AssertionBuffer.data());
    std::terminate();
}

void kviz::OnThrowingAssertionFailure(
    char const* failingCode,
    char const* func,
    char const* file,
    unsigned int line)
{
    std::lock_guard lock{g_AssertionBufferMutex};

    std::snprintf(g_AssertionBuffer.data(), g_AssertionBuffer.size(), "%s:%s:%u: throw_if_not(%s): failed", file, func, line, failingCode);
    log::error("%s", g_AssertionBuffer.data());
    throw std::runtime_error{g_AssertionBuffer.data()};
}
