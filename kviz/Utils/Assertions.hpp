#pragma once

#include "kviz/Utils/Macros.hpp"

namespace kviz
{
    // calls into (hidden) assertion-handling implementation
    [[noreturn]] void OnAssertionFailure(char const* failingCode,
                                         char const* func,
                                         char const* file,
                                         unsigned int line) noexcept;

    // calls into (hidden) throwing-assertion implementation
    [[noreturn]] void OnThrowingAssertionFailure(char const* failingCode,
        char const* func,
        char const* file,
        unsigned int line);
}

// check a precondition: logs and throws a `std::runtime_error` if it doesn't hold
#define KVIZ_THROWING_ASSERT(expr) \
    (static_cast<bool>(expr) ? (void)0 : kviz::OnThrowingAssertionFailure(#expr, __func__, KVIZ_FILENAME, __LINE__))

// always execute this assertion - even if in release mode /w debug flags disabled
#define KVIZ_ASSERT_ALWAYS(expr) \
    (static_cast<bool>(expr) ? (void)0 : kviz::OnAssertionFailure(#expr, __func__, KVIZ_FILENAME, __LINE__))

#ifdef KVIZ_FORCE_ASSERTS_ENABLED
#define KVIZ_ASSERT(expr) KVIZ_ASSERT_ALWAYS(expr)
#elif !defined(NDEBUG)
#define KVIZ_ASSERT(expr) KVIZ_ASSERT_ALWAYS(expr)
#else
#define KVIZ_ASSERT(expr)
#endif
