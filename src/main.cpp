#include <algorithm>
#include <chrono>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

#include "cache/InMemoryCache.hpp"
#include "config/AppConfig.hpp"
#include "logging/ConsoleLogger.hpp"
#include "utils/Utils.hpp"

using json = nlohmann::json;
using namespace std;

// Prints one lookup as a JSON line
static void printLookup(const std::string& key, const std::optional<int>& value) {
    json line = {
        {"op", "get"},
        {"key", key},
        {"found", value.has_value()}
    };
    if (value) {
        line["value"] = *value;
    }
    std::cout << line.dump() << std::endl;
}

int main(int argc, char** argv) {
    try {
        vector<string> args_vec;
        for (int i = 1; i < argc; ++i) {
            args_vec.push_back(argv[i]);
        }

        optional<map<string, string>> parsedArgsOpt = Utils::parseArguments(args_vec);
        if (!parsedArgsOpt) {
            ConsoleLogger::getInstance(LogUtils::LogLevel::CERROR)->error("Failed to parse command-line arguments. Exiting.");
            return 1;
        }

        AppConfig config_ = Utils::loadConfiguration(parsedArgsOpt.value());

        std::shared_ptr<ILogger> logger_ = ConsoleLogger::getInstance(config_.log_level);
        logger_->setup("Configuration loaded.");
        logger_->setup(config_.to_string());

        InMemoryCache<std::string, int> cache(
            config_.capacity,
            logger_,
            std::chrono::milliseconds(config_.reaper_interval_in_millis),
            static_cast<std::size_t>(std::max(config_.sweep_batch_size, 0)));

        cache.add("a", 1);
        cache.add("b", 2);
        cache.add("c", 3);

        printLookup("a", cache.get("a"));
        printLookup("b", cache.get("b"));

        cache.remove("a");
        printLookup("a", cache.get("a"));

        const std::chrono::milliseconds ttl(config_.default_ttl_in_millis);
        cache.addWithTTL("d", 4, ttl);
        printLookup("d", cache.get("d"));

        std::this_thread::sleep_for(ttl + std::chrono::milliseconds(config_.reaper_interval_in_millis));
        printLookup("d", cache.get("d"));

        cache.stop();
        logger_->setup("Cache stopped. Exiting.");
        return 0;
    } catch (const InvalidCapacity& e) {
        ConsoleLogger::getInstance(LogUtils::LogLevel::CERROR)->error("Cannot create cache: " + std::string(e.what()));
        return 1;
    } catch (const std::exception& e) {
        ConsoleLogger::getInstance(LogUtils::LogLevel::CERROR)->error("Unhandled exception: " + std::string(e.what()));
        return 1;
    }
}
