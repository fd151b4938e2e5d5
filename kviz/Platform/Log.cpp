#include "Log.hpp"

#include <array>
#include <iostream>
#include <memory>
#include <mutex>

namespace
{
    class StderrSink final : public kviz::log::Sink {
        std::mutex mutex;

        void log(kviz::log::LogMessage const& msg) override
        {
            std::lock_guard g{mutex};
            std::cerr << '[' << msg.loggerName << "] [" << kviz::log::toStringView(msg.level) << "] " << msg.payload << std::endl;
        }
    };

    struct GlobalSinks final {
        GlobalSinks() :
            stderrSink{std::make_shared<StderrSink>()},
            defaultLogger{std::make_shared<kviz::log::Logger>("kviz", stderrSink)}
        {
        }

        std::shared_ptr<StderrSink> stderrSink;
        std::shared_ptr<kviz::log::Logger> defaultLogger;
    };

    GlobalSinks& GetGlobalSinks()
    {
        static GlobalSinks s_GlobalSinks;
        return s_GlobalSinks;
    }

    constexpr std::array<std::string_view, kviz::log::level::NUM_LEVELS> c_LogLevelStrings =
    {
        "trace",
        "debug",
        "info",
        "warning",
        "error",
        "critical",
        "off",
    };
}

// public API

std::string_view kviz::log::toStringView(level::LevelEnum level)
{
    return c_LogLevelStrings[level];
}

char const* kviz::log::toCStr(level::LevelEnum level)
{
    // all entries are string literals, so they are nul-terminated
    return c_LogLevelStrings[level].data();
}

std::shared_ptr<kviz::log::Logger> kviz::log::defaultLogger() noexcept
{
    return GetGlobalSinks().defaultLogger;
}

kviz::log::Logger* kviz::log::defaultLoggerRaw() noexcept
{
    return GetGlobalSinks().defaultLogger.get();
}

void kviz::log::setStderrLevel(level::LevelEnum lvl)
{
    GetGlobalSinks().stderrSink->set_level(lvl);
}
