#include "engine/Logger.h"

namespace StbGeom::Engine {

    StreamLogger::StreamLogger(LogLevel minimumLevel)
        : minimumLevel_(minimumLevel)
    {
    }

    void StreamLogger::log(LogLevel level, std::string_view component, std::string_view message) {
        if (static_cast<int>(level) < static_cast<int>(minimumLevel_.load())) {
            return;
        }
        std::lock_guard<std::mutex> lock(mutex_);
        switch (level) {
            case LogLevel::Info:
                fmt::print("{}: {}\n", component, message);
                break;
            case LogLevel::Warning:
                fmt::print(stderr, "{} Warning: {}\n", component, message);
                break;
            case LogLevel::Error:
                fmt::print(stderr, "{} Error: {}\n", component, message);
                break;
        }
    }

} // namespace StbGeom::Engine
