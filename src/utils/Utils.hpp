#ifndef UTILS_HPP
#define UTILS_HPP

#include <fstream>
#include <iostream>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "../config/AppConfig.hpp"

using namespace std;

class Utils {
public:
    // Converts a string to a LogLevel enum
    static LogUtils::LogLevel stringToLogLevel(const std::string& level) {
        if (level == "DEBUG") return LogUtils::LogLevel::DEBUG;
        if (level == "INFO") return LogUtils::LogLevel::INFO;
        if (level == "WARNING") return LogUtils::LogLevel::WARN;
        if (level == "CERROR") return LogUtils::LogLevel::CERROR;
        throw std::invalid_argument("Invalid log level: " + level);
    }

    // Helper to parse integer safely
    static optional<int> stringToInt(const std::string& str) {
        try {
            size_t pos;
            int val = std::stoi(str, &pos);
            // Check if the entire string was consumed
            if (pos == str.length()) {
                return val;
            }
        } catch (const std::invalid_argument&) {
            // Not an integer
        } catch (const std::out_of_range&) {
            // Integer out of range
        }
        return std::nullopt;
    }

    // Helper to trim whitespace from start and end of string
    static std::string trim(const std::string& str) {
        size_t first = str.find_first_not_of(" \t\n\r");
        if (string::npos == first) return "";
        size_t last = str.find_last_not_of(" \t\n\r");
        return str.substr(first, (last - first + 1));
    }

    // Parses key=value pairs; nullopt if any argument is malformed
    static optional<map<string, string>> parseArguments(const vector<string>& args) {
        map<string, string> argMap;
        for (const string& arg : args) {
            size_t delimiterPos = arg.find('=');
            if (delimiterPos != string::npos && delimiterPos > 0) { // Ensure key is not empty
                string key = arg.substr(0, delimiterPos);
                string value = arg.substr(delimiterPos + 1);
                argMap[key] = value;
            } else {
                cerr << "Error: Invalid argument format: '" << arg << "'. Expected non-empty key=value format." << endl;
                return nullopt;
            }
        }
        return argMap;
    }

    // Applies one setting to the config. Unknown keys are ignored,
    // unparsable integers keep the current value.
    static void applySetting(AppConfig& config, const string& key, const string& value) {
        if (key == "log_level") {
            config.log_level = stringToLogLevel(value);
            return;
        }

        int* target = nullptr;
        if (key == "capacity") {
            target = &config.capacity;
        } else if (key == "reaper_interval_in_millis") {
            target = &config.reaper_interval_in_millis;
        } else if (key == "sweep_batch_size") {
            target = &config.sweep_batch_size;
        } else if (key == "default_ttl_in_millis") {
            target = &config.default_ttl_in_millis;
        }
        if (target == nullptr) {
            return;
        }

        if (auto val = stringToInt(value)) {
            *target = *val;
        } else {
            cerr << "Warning: Invalid integer for " << key << ": " << value << endl;
        }
    }

    // Reads "key = value" lines; blank lines and '#' comments are skipped
    static void loadConfigFile(std::istream& configFile, AppConfig& config) {
        std::string line;
        while (getline(configFile, line)) {
            line = trim(line);
            if (line.empty() || line[0] == '#') {
                continue;
            }
            size_t delimiterPos = line.find('=');
            if (delimiterPos != string::npos && delimiterPos > 0) {
                string key = trim(line.substr(0, delimiterPos));
                string value = trim(line.substr(delimiterPos + 1));
                applySetting(config, key, value);
            }
        }
    }

    // Defaults, then the first config file found, then command-line arguments
    static AppConfig loadConfiguration(const map<string, string>& startupArguments) {
        AppConfig config;

        std::vector<std::string> config_paths = {
            "lrucache.config",                // Current directory
            "../lrucache.config",             // Parent directory
            "/etc/lrucache/lrucache.config"   // System-wide
        };

        bool config_found = false;
        for (const auto& config_path : config_paths) {
            std::ifstream configFile(config_path);
            if (configFile.is_open()) {
                cout << "Reading configuration from " << config_path << "..." << endl;
                config_found = true;
                loadConfigFile(configFile, config);
                break;
            }
        }

        if (!config_found) {
            cerr << "Warning: Configuration file not found in any standard location. Using defaults and command-line arguments." << endl;
        }

        for (const auto& pair : startupArguments) {
            applySetting(config, pair.first, pair.second);
        }

        return config;
    }
};

#endif // UTILS_HPP
