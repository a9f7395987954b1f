#pragma once

#include <memory>
#include <mutex>

#include "../interfaces/ILogger.hpp"

// Discards everything. Used when a cache is built without a logger.
class NullLogger : public ILogger {
public:
    static std::shared_ptr<NullLogger> getInstance();
    ~NullLogger() override = default;

    void info(const std::string& message) override;
    void debug(const std::string& message) override;
    void warn(const std::string& message) override;
    void error(const std::string& message) override;
    void setup(const std::string& message) override;
    int getLogLevel() override;

private:
    NullLogger() = default;

    static std::shared_ptr<NullLogger> instance;
    static std::once_flag init_flag;

    NullLogger(const NullLogger&) = delete;
    NullLogger& operator=(const NullLogger&) = delete;
    NullLogger(NullLogger&&) = delete;
    NullLogger& operator=(NullLogger&&) = delete;
};
