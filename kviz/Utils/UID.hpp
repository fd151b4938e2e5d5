#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <iosfwd>
#include <utility>

namespace kviz
{
    // a process-unique ID
    //
    // default construction fetches a new ID, copies share the ID
    class UID {
    public:
        static constexpr UID invalid() noexcept
        {
            return UID{-1};
        }

        static constexpr UID empty() noexcept
        {
            return UID{0};
        }

        UID() noexcept : m_Value{GetNextID()}
        {
        }
        constexpr UID(UID const&) = default;
        constexpr UID(UID&&) noexcept = default;
        constexpr UID& operator=(UID const&) = default;
        constexpr UID& operator=(UID&&) noexcept = default;
        ~UID() noexcept = default;

        void reset() noexcept
        {
            m_Value = GetNextID();
        }

        constexpr int64_t get() const noexcept
        {
            return m_Value;
        }

        explicit constexpr operator bool() const noexcept
        {
            return m_Value > 0;
        }

    private:
        static int64_t GetNextID() noexcept;

        constexpr UID(int64_t value) noexcept : m_Value{std::move(value)}
        {
        }

        int64_t m_Value;
    };

    std::ostream& operator<<(std::ostream& o, UID const& id);

    constexpr bool operator==(UID const& lhs, UID const& rhs) noexcept
    {
        return lhs.get() == rhs.get();
    }

    constexpr bool operator!=(UID const& lhs, UID const& rhs) noexcept
    {
        return lhs.get() != rhs.get();
    }

    constexpr bool operator<(UID const& lhs, UID const& rhs) noexcept
    {
        return lhs.get() < rhs.get();
    }
}

// hashing support for UIDs
//
// lets them be used as associative lookup keys (e.g. GPU-side caches)
namespace std
{
    template<>
    struct hash<kviz::UID> {
        size_t operator()(kviz::UID const& id) const
        {
            return static_cast<size_t>(id.get());
        }
    };
}
