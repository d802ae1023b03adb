#pragma once

#include <string>
#include <cstddef>
#include <functional>
#include <utility>
#include <nlohmann/json.hpp>

namespace reeldrop {

struct WatchTarget {
    std::string directory = "./videos";
    std::string suffix = ".mp4";
};

/**
 * Process-wide settings. Built once at startup and passed around by const reference.
 */
struct Config {
    using EnvLookup = std::function<const char*(const char*)>;

    std::string token;
    std::string authHeader = "Flic-Token";
    std::string apiBaseUrl = "https://api.socialverseapp.com";
    WatchTarget watch;
    int categoryId = 25;
    bool publicFeed = true;

    long requestTimeoutSeconds = 30;
    long transferTimeoutSeconds = 3600;
    std::size_t maxConcurrent = 0;   // 0 = as many as there are workers
    std::size_t workerThreads = 4;
    int transferRetries = 1;
    long settleMillis = 0;
    long shutdownGraceSeconds = 30;

    // Overlay keys present in the JSON object onto base
    static Config fromJson(const nlohmann::json& json, Config base);
    static Config fromJson(const nlohmann::json& json);

    // Overlay REELDROP_* variables onto base
    static Config fromEnvironment(Config base, const EnvLookup& lookup);
    static Config fromEnvironment(Config base);
    static Config fromEnvironment();

    // Defaults, then the optional JSON file, then the environment; validated
    static Config load(const std::string& configFile = "");

    // Throws std::invalid_argument describing the first bad setting
    void validate() const;

    // Jobs allowed to run at once. Never above the worker count, so every
    // file that is not running yet waits in the supervisor's queue.
    std::size_t concurrencyLimit() const;
};

// Default arguments of type Config cannot be spelled inside Config itself
// (its member initializers are not yet usable there), so the defaulted
// forms are provided as overloads.
inline Config Config::fromJson(const nlohmann::json& json) {
    return fromJson(json, Config());
}

inline Config Config::fromEnvironment(Config base) {
    return fromEnvironment(std::move(base), EnvLookup());
}

inline Config Config::fromEnvironment() {
    return fromEnvironment(Config(), EnvLookup());
}

} // namespace reeldrop
