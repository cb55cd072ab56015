#ifndef STBGEOM_LOGGER_H
#define STBGEOM_LOGGER_H

#include "engine/engine_export.h"

#include <fmt/core.h>
#include <atomic>
#include <cstdio>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>

namespace StbGeom::Engine {

    enum class LogLevel {
        Info,
        Warning,
        Error
    };

    // Sink for diagnostics. Lines read "Component: message".
    class STBGEOM_ENGINE_API ILogger {
    public:
        virtual ~ILogger() = default;

        virtual void log(LogLevel level, std::string_view component, std::string_view message) = 0;

        template <typename... Args>
        void info(std::string_view component, fmt::format_string<Args...> format, Args&&... args) {
            log(LogLevel::Info, component, fmt::format(format, std::forward<Args>(args)...));
        }

        template <typename... Args>
        void warn(std::string_view component, fmt::format_string<Args...> format, Args&&... args) {
            log(LogLevel::Warning, component, fmt::format(format, std::forward<Args>(args)...));
        }

        template <typename... Args>
        void error(std::string_view component, fmt::format_string<Args...> format, Args&&... args) {
            log(LogLevel::Error, component, fmt::format(format, std::forward<Args>(args)...));
        }
    };

    // Info to stdout, warnings and errors to stderr. Safe to share between the
    // workers of one batch.
    class STBGEOM_ENGINE_API StreamLogger : public ILogger {
    public:
        explicit StreamLogger(LogLevel minimumLevel = LogLevel::Info);

        void log(LogLevel level, std::string_view component, std::string_view message) override;

        void setMinimumLevel(LogLevel level) { minimumLevel_.store(level); }
        LogLevel minimumLevel() const { return minimumLevel_.load(); }

    private:
        std::mutex mutex_;
        std::atomic<LogLevel> minimumLevel_;
    };

    class STBGEOM_ENGINE_API NullLogger : public ILogger {
    public:
        void log(LogLevel, std::string_view, std::string_view) override {}
    };

} // namespace StbGeom::Engine

#endif // STBGEOM_LOGGER_H
