#pragma once

#include <stdexcept>

namespace kviz
{
    // thrown when a per-frame payload does not contain exactly one time sample
    class InvalidFrameError final : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    // thrown when a payload is structurally malformed (bad value count, out-of-range indices, etc.)
    class TypeInputError final : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    // thrown when something that may only be created once per scene is created again
    class DuplicateInitError final : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };
}
