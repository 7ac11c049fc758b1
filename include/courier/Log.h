#pragma once

#include <courier/Project.h>

#include <courier/Utility.h>

#include <algorithm>
#include <array>
#include <cstdio>
#include <functional>
#include <iostream>
#include <mutex>
#include <string>


namespace COURIER_API {

namespace clients {

    /**
     * Callback type for logging, i.e. `(level, filename, lineno, msg)`.
     */
    using LogCallback = std::function<void(int, const char*, int, const char* msg)>;

} // end of clients


/**
 * Log levels, the same as syslog(3), which are also what librdkafka uses.
 */
struct Log
{
    enum Level
    {
        Emerg   = 0,
        Alert   = 1,
        Crit    = 2,
        Err     = 3,
        Warning = 4,
        Notice  = 5,
        Info    = 6,
        Debug   = 7
    };

    static const char* levelString(int level)
    {
        static const std::array<const char*, 8> names = {"EMERG", "ALERT", "CRIT", "ERR", "WARNING", "NOTICE", "INFO", "DEBUG"};

        return (level >= Emerg && level <= Debug) ? names[static_cast<std::size_t>(level)] : "INVALID";
    }
};


/**
 * Fixed-size buffer for printf-style formatting. Output beyond the capacity is truncated.
 */
template <std::size_t MAX_CAPACITY>
class LogBuffer
{
    static_assert(MAX_CAPACITY > 1, "The buffer must hold at least one character");

public:
    LogBuffer() { clear(); }

    LogBuffer& clear()
    {
        _buf[0] = 0;
        _len    = 0;
        return *this;
    }

    /**
     * Append the formatted text.
     */
    template<class ...Args>
    LogBuffer& print(const char* format, Args... args)
    {
        const int written = std::snprintf(_buf.data() + _len, capacity(), format, args...);
        if (written > 0)
        {
            _len = (std::min)(_len + static_cast<std::size_t>(written), MAX_CAPACITY - 1);
        }
        return *this;
    }
    LogBuffer& print(const char* text) { return print("%s", text); }

    // Room left (including the terminating '\0')
    std::size_t capacity() const { return MAX_CAPACITY - _len; }

    // For a C API to write into, from the very beginning
    char* str() { clear(); return _buf.data(); }

    const char* c_str() const { return _buf.data(); }

private:
    std::array<char, MAX_CAPACITY> _buf;
    std::size_t                    _len = 0;
};


inline void DefaultLogger(int level, const char* /*filename*/, int /*lineno*/, const char* msg)
{
    std::cout << "[" << utility::getCurrentTime() << "]" << Log::levelString(level) << " " << msg << std::endl;
}

inline void NullLogger(int /*level*/, const char* /*filename*/, int /*lineno*/, const char* /*msg*/)
{
}


/**
 * The logger shared by the library code which runs outside of any broker client, e.g. `Producer::close`.
 * It could be replaced at any time, even while other threads are logging with it.
 */
class GlobalLogger
{
public:
    static const constexpr std::size_t LOG_BUFFER_SIZE = 1024;

    static void set(clients::LogCallback cb)
    {
        const std::lock_guard<std::mutex> lock(_mutex);
        _logCb = std::move(cb);
    }

    template<class ...Args>
    static void doLog(int level, const char* filename, int lineno, const char* format, Args... args)
    {
        LogBuffer<LOG_BUFFER_SIZE> logBuffer;
        logBuffer.print(format, args...);

        const std::lock_guard<std::mutex> lock(_mutex);
        if (_logCb) _logCb(level, filename, lineno, logBuffer.c_str());
    }

private:
    static inline std::mutex           _mutex;
    static inline clients::LogCallback _logCb = DefaultLogger;
};

/**
 * Replace the global logger (`DefaultLogger` at start). Broker clients are not affected, since they log with their own `log_cb`.
 */
inline void setGlobalLogger(clients::LogCallback cb)
{
    GlobalLogger::set(std::move(cb));
}

/**
 * Log with the global logger.
 *
 * E.g,
 *     COURIER_API_LOG(Log::Level::Err, "%s failed to close! error[%s]", name.c_str(), e.what());
 */
#define COURIER_API_LOG(level, ...) COURIER_API::GlobalLogger::doLog(level, __FILE__, __LINE__, ##__VA_ARGS__)

} // end of COURIER_API

