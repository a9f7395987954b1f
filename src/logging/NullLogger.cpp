#include "NullLogger.hpp"

#include "../config/AppConfig.hpp"

std::shared_ptr<NullLogger> NullLogger::instance = nullptr;
std::once_flag NullLogger::init_flag;

std::shared_ptr<NullLogger> NullLogger::getInstance() {
    std::call_once(init_flag, []() {
        instance = std::shared_ptr<NullLogger>(new NullLogger());
    });
    return instance;
}

void NullLogger::info(const std::string& /* message */) {
    // No-op implementation
}

void NullLogger::debug(const std::string& /* message */) {
    // No-op implementation
}

void NullLogger::warn(const std::string& /* message */) {
    // No-op implementation
}

void NullLogger::error(const std::string& /* message */) {
    // No-op implementation
}

void NullLogger::setup(const std::string& /* message */) {
    // No-op implementation
}

int NullLogger::getLogLevel() {
    // Above every real level, so callers guarding expensive messages skip them
    return LogUtils::LogLevel::SETUP + 1;
}
