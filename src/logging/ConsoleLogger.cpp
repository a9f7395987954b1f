#include <iostream>
#include <mutex>
#include <string>

#include "ConsoleLogger.hpp"

std::shared_ptr<ConsoleLogger> ConsoleLogger::instance = nullptr;
std::once_flag ConsoleLogger::init_flag;

std::shared_ptr<ConsoleLogger> ConsoleLogger::getInstance(LogUtils::LogLevel logLevel) {
    std::call_once(init_flag, [logLevel]() {
        instance.reset(new ConsoleLogger(logLevel));
    });
    return instance;
}

void ConsoleLogger::info(const std::string& message) {
    if (logLevel <= LogUtils::LogLevel::INFO) {
        std::lock_guard<std::mutex> lock(cout_mutex_);
        std::cout << LogUtils::INFO_LOG_PREFIX << message << std::endl;
    }
}

void ConsoleLogger::debug(const std::string& message) {
    if (logLevel <= LogUtils::LogLevel::DEBUG) {
        std::lock_guard<std::mutex> lock(cout_mutex_);
        std::cout << LogUtils::DEBUG_LOG_PREFIX << message << std::endl;
    }
}

void ConsoleLogger::warn(const std::string& message) {
    if (logLevel <= LogUtils::LogLevel::WARN) {
        std::lock_guard<std::mutex> lock(cout_mutex_);
        std::cout << LogUtils::WARN_LOG_PREFIX << message << std::endl;
    }
}

void ConsoleLogger::error(const std::string& message) {
    if (logLevel <= LogUtils::LogLevel::CERROR) {
        // Errors go to stderr
        std::lock_guard<std::mutex> lock(cout_mutex_);
        std::cerr << LogUtils::CERROR_LOG_PREFIX << message << std::endl;
    }
}

void ConsoleLogger::setup(const std::string& message) {
    std::lock_guard<std::mutex> lock(cout_mutex_);
    std::cout << LogUtils::SETUP_LOG_PREFIX << message << std::endl;
}
