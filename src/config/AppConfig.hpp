#ifndef APPCONFIG_HPP
#define APPCONFIG_HPP

#include <chrono>
#include <cstddef>
#include <iostream>
#include <sstream>
#include <string>

namespace LogUtils {
    enum LogLevel {
        DEBUG = 0,
        INFO = 1,
        WARN = 2,
        CERROR = 3,
        SETUP = 4
    };

    static std::string DEBUG_LOG_PREFIX = "[Debug] ";
    static std::string INFO_LOG_PREFIX = "[Info] ";
    static std::string WARN_LOG_PREFIX = "[Warning] ";
    static std::string CERROR_LOG_PREFIX = "[Error] ";
    static std::string SETUP_LOG_PREFIX = "[Setup] ";
}

namespace CacheDefaults {
    static constexpr int CAPACITY = 3;
    static constexpr std::chrono::milliseconds REAPER_INTERVAL{1000};
    // 0 sweeps the whole cache under a single lock acquisition
    static constexpr std::size_t SWEEP_BATCH_SIZE = 0;
    static constexpr std::chrono::milliseconds DEMO_TTL{2000};
}

// --- Configuration Struct ---
class AppConfig {
public:
    // Cache configuration
    int capacity;
    int reaper_interval_in_millis;
    int sweep_batch_size;

    // Demo configuration
    int default_ttl_in_millis;

    // Logging Level
    LogUtils::LogLevel log_level;

    AppConfig() {
        capacity = CacheDefaults::CAPACITY;
        reaper_interval_in_millis = static_cast<int>(CacheDefaults::REAPER_INTERVAL.count());
        sweep_batch_size = static_cast<int>(CacheDefaults::SWEEP_BATCH_SIZE);
        default_ttl_in_millis = static_cast<int>(CacheDefaults::DEMO_TTL.count());
        log_level = LogUtils::LogLevel::CERROR;
    }

    std::string to_string() const {
        std::stringstream ss;
        ss << "// --- Configuration Params Start --- //" << std::endl
            << "// --- Cache Configuration --- //" << std::endl
            << "capacity: " << capacity << std::endl
            << "reaper_interval_in_millis: " << reaper_interval_in_millis << std::endl
            << "sweep_batch_size: " << sweep_batch_size << std::endl
            << "default_ttl_in_millis: " << default_ttl_in_millis << std::endl
            << "// --- Logging --- //" << std::endl
            << "log_level: " << static_cast<int>(log_level) << std::endl
            << "// --- Configuration Params End --- //" << std::endl;
        return ss.str();
    }
};

#endif // APPCONFIG_HPP
