#pragma once

#include <algorithm>
#include <chrono>
#include <cstdarg>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

// log: logging implementation
//
// this implementation takes heavy inspiration from `spdlog`

namespace kviz::log
{
    namespace level
    {
        enum LevelEnum : int32_t {
            trace = 0,
            debug,
            info,
            warn,
            err,
            critical,
            off,
            NUM_LEVELS
        };
    }

    std::string_view toStringView(level::LevelEnum);
    char const* toCStr(level::LevelEnum);

    // a log message
    //
    // to prevent needless runtime allocs, this does not own its data. See below if you need an
    // owning version
    struct LogMessage final {
        std::string_view loggerName;
        std::chrono::system_clock::time_point time;
        std::string_view payload;
        level::LevelEnum level;

        LogMessage() = default;

        LogMessage(std::string_view loggerName_,
                   std::string_view payload_,
                   level::LevelEnum level_) :
            loggerName{loggerName_},
            time{std::chrono::system_clock::now()},
            payload{payload_},
            level{level_}
        {
        }
    };

    // a log message that owns all its data
    //
    // useful if you need to persist a log message somewhere
    struct OwnedLogMessage final {
        std::string loggerName;
        std::chrono::system_clock::time_point time;
        std::string payload;
        level::LevelEnum level;

        OwnedLogMessage() = default;

        OwnedLogMessage(LogMessage const& msg) :
            loggerName{msg.loggerName},
            time{msg.time},
            payload{msg.payload},
            level{msg.level}
        {
        }
    };

    class Sink {
        level::LevelEnum m_SinkLevel{level::info};

    public:
        Sink() = default;
        Sink(Sink const&) = delete;
        Sink(Sink&&) noexcept = delete;
        Sink& operator=(Sink const&) = delete;
        Sink& operator=(Sink&&) noexcept = delete;
        virtual ~Sink() noexcept = default;

        virtual void log(LogMessage const&) = 0;

        void set_level(level::LevelEnum level) noexcept
        {
            m_SinkLevel = level;
        }

        [[nodiscard]] level::LevelEnum level() const noexcept
        {
            return m_SinkLevel;
        }

        [[nodiscard]] bool should_log(level::LevelEnum level) const noexcept
        {
            return level >= m_SinkLevel;
        }
    };

    class Logger final {
    public:
        explicit Logger(std::string name_) :
            m_Name{std::move(name_)}
        {
        }

        Logger(std::string name_, std::shared_ptr<Sink> sink_) :
            m_Name{std::move(name_)},
            m_Sinks{std::move(sink_)}
        {
        }

        void log(level::LevelEnum msgLvl, char const* fmt, ...)
        {
            if (msgLvl < m_Level)
            {
                return;
            }

            std::lock_guard lock{m_Mutex};

            // create the log message
            size_t n = 0;
            {
                va_list args;
                va_start(args, fmt);
                int rv = std::vsnprintf(m_Buf.data(), m_Buf.size(), fmt, args);
                va_end(args);

                if (rv <= 0)
                {
                    return;
                }

                n = std::min(static_cast<size_t>(rv), m_Buf.size()-1);
            }
            LogMessage msg{m_Name, std::string_view{m_Buf.data(), n}, msgLvl};

            // sink it
            for (auto& sink : m_Sinks)
            {
                if (sink->should_log(msg.level))
                {
                    sink->log(msg);
                }
            }
        }

        template<typename... Args>
        void trace(char const* fmt, Args const&... args)
        {
            log(level::trace, fmt, args...);
        }

        template<typename... Args>
        void debug(char const* fmt, Args const&... args)
        {
            log(level::debug, fmt, args...);
        }

        template<typename... Args>
        void info(char const* fmt, Args const&... args)
        {
            log(level::info, fmt, args...);
        }

        template<typename... Args>
        void warn(char const* fmt, Args const&... args)
        {
            log(level::warn, fmt, args...);
        }

        template<typename... Args>
        void error(char const* fmt, Args const&... args)
        {
            log(level::err, fmt, args...);
        }

        template<typename... Args>
        void critical(char const* fmt, Args const&... args)
        {
            log(level::critical, fmt, args...);
        }

        void addSink(std::shared_ptr<Sink> sink)
        {
            std::lock_guard lock{m_Mutex};
            m_Sinks.push_back(std::move(sink));
        }

        void removeSink(Sink const& sink)
        {
            std::lock_guard lock{m_Mutex};
            m_Sinks.erase(std::remove_if(m_Sinks.begin(), m_Sinks.end(), [&sink](auto const& s) { return s.get() == &sink; }), m_Sinks.end());
        }

        [[nodiscard]] level::LevelEnum getLevel() const noexcept
        {
            return m_Level;
        }

        void setLevel(level::LevelEnum lvl) noexcept
        {
            m_Level = lvl;
        }

    private:
        std::string m_Name;
        std::vector<std::shared_ptr<Sink>> m_Sinks;
        level::LevelEnum m_Level{level::trace};
        std::mutex m_Mutex;
        std::vector<char> m_Buf = std::vector<char>(2048);
    };

    // global logging API
    std::shared_ptr<Logger> defaultLogger() noexcept;
    Logger* defaultLoggerRaw() noexcept;

    template<typename... Args>
    inline void log(level::LevelEnum level, char const* fmt, Args const&... args)
    {
        defaultLoggerRaw()->log(level, fmt, args...);
    }

    template<typename... Args>
    inline void trace(char const* fmt, Args const&... args)
    {
        defaultLoggerRaw()->trace(fmt, args...);
    }

    template<typename... Args>
    inline void debug(char const* fmt, Args const&... args)
    {
        defaultLoggerRaw()->debug(fmt, args...);
    }

    template<typename... Args>
    void info(char const* fmt, Args const&... args)
    {
        defaultLoggerRaw()->info(fmt, args...);
    }

    template<typename... Args>
    void warn(char const* fmt, Args const&... args)
    {
        defaultLoggerRaw()->warn(fmt, args...);
    }

    template<typename... Args>
    void error(char const* fmt, Args const&... args)
    {
        defaultLoggerRaw()->error(fmt, args...);
    }

    template<typename... Args>
    void critical(char const* fmt, Args const&... args)
    {
        defaultLoggerRaw()->critical(fmt, args...);
    }

    // sets the level of the default (stderr) sink
    void setStderrLevel(level::LevelEnum);
}
