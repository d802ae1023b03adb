#include "core/Config.hpp"
#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <string>

namespace reeldrop {

namespace {
    long parseLong(const char* name, const std::string& value) {
        try {
            size_t consumed = 0;
            long result = std::stol(value, &consumed);
            if (consumed != value.size()) {
                throw std::invalid_argument(value);
            }
            return result;
        } catch (const std::exception&) {
            throw std::invalid_argument(std::string(name) + ": expected an integer, got '" + value + "'");
        }
    }

    std::size_t parseCount(const char* name, const std::string& value) {
        long result = parseLong(name, value);
        if (result < 0) {
            throw std::invalid_argument(std::string(name) + ": must not be negative");
        }
        return static_cast<std::size_t>(result);
    }

    bool parseBool(const char* name, const std::string& value) {
        if (value == "1" || value == "true" || value == "yes" || value == "on") return true;
        if (value == "0" || value == "false" || value == "no" || value == "off") return false;
        throw std::invalid_argument(std::string(name) + ": expected a boolean, got '" + value + "'");
    }

    constexpr std::size_t kMaxWorkerThreads = 64;

    template <typename T>
    void readKey(const nlohmann::json& json, const char* key, T& target) {
        auto it = json.find(key);
        if (it == json.end() || it->is_null()) {
            return;
        }
        try {
            target = it->get<T>();
        } catch (const nlohmann::json::exception& e) {
            throw std::invalid_argument(std::string("config key '") + key + "': " + e.what());
        }
    }

    // nlohmann wraps a negative number read as std::size_t, so go through long
    void readCount(const nlohmann::json& json, const char* key, std::size_t& target) {
        auto it = json.find(key);
        if (it == json.end() || it->is_null()) {
            return;
        }
        if (!it->is_number_integer()) {
            throw std::invalid_argument(std::string("config key '") + key + "': expected an integer, got " +
                                        it->dump());
        }
        long value = it->get<long>();
        if (value < 0) {
            throw std::invalid_argument(std::string("config key '") + key + "': must not be negative");
        }
        target = static_cast<std::size_t>(value);
    }
}

Config Config::fromJson(const nlohmann::json& json, Config base) {
    if (!json.is_object()) {
        throw std::invalid_argument("config file must contain a JSON object");
    }

    readKey(json, "token", base.token);
    readKey(json, "auth_header", base.authHeader);
    readKey(json, "api_base_url", base.apiBaseUrl);
    readKey(json, "watch_dir", base.watch.directory);
    readKey(json, "suffix", base.watch.suffix);
    readKey(json, "category_id", base.categoryId);
    readKey(json, "public_feed", base.publicFeed);
    readKey(json, "request_timeout", base.requestTimeoutSeconds);
    readKey(json, "transfer_timeout", base.transferTimeoutSeconds);
    readCount(json, "max_concurrent", base.maxConcurrent);
    readCount(json, "workers", base.workerThreads);
    readKey(json, "transfer_retries", base.transferRetries);
    readKey(json, "settle_ms", base.settleMillis);
    readKey(json, "shutdown_grace", base.shutdownGraceSeconds);

    return base;
}

Config Config::fromEnvironment(Config base, const EnvLookup& lookup) {
    auto get = [&lookup](const char* name) -> const char* {
        const char* value = lookup ? lookup(name) : std::getenv(name);
        return (value && *value) ? value : nullptr;
    };

    if (const char* v = get("REELDROP_TOKEN")) base.token = v;
    if (const char* v = get("REELDROP_AUTH_HEADER")) base.authHeader = v;
    if (const char* v = get("REELDROP_API_BASE_URL")) base.apiBaseUrl = v;
    if (const char* v = get("REELDROP_WATCH_DIR")) base.watch.directory = v;
    if (const char* v = get("REELDROP_SUFFIX")) base.watch.suffix = v;
    if (const char* v = get("REELDROP_CATEGORY_ID")) {
        base.categoryId = static_cast<int>(parseLong("REELDROP_CATEGORY_ID", v));
    }
    if (const char* v = get("REELDROP_PUBLIC_FEED")) base.publicFeed = parseBool("REELDROP_PUBLIC_FEED", v);
    if (const char* v = get("REELDROP_REQUEST_TIMEOUT")) {
        base.requestTimeoutSeconds = parseLong("REELDROP_REQUEST_TIMEOUT", v);
    }
    if (const char* v = get("REELDROP_TRANSFER_TIMEOUT")) {
        base.transferTimeoutSeconds = parseLong("REELDROP_TRANSFER_TIMEOUT", v);
    }
    if (const char* v = get("REELDROP_MAX_CONCURRENT")) {
        base.maxConcurrent = parseCount("REELDROP_MAX_CONCURRENT", v);
    }
    if (const char* v = get("REELDROP_WORKERS")) base.workerThreads = parseCount("REELDROP_WORKERS", v);
    if (const char* v = get("REELDROP_TRANSFER_RETRIES")) {
        base.transferRetries = static_cast<int>(parseLong("REELDROP_TRANSFER_RETRIES", v));
    }
    if (const char* v = get("REELDROP_SETTLE_MS")) base.settleMillis = parseLong("REELDROP_SETTLE_MS", v);
    if (const char* v = get("REELDROP_SHUTDOWN_GRACE")) {
        base.shutdownGraceSeconds = parseLong("REELDROP_SHUTDOWN_GRACE", v);
    }

    return base;
}

Config Config::load(const std::string& configFile) {
    Config config;

    if (!configFile.empty()) {
        std::ifstream in(configFile);
        if (!in) {
            throw std::invalid_argument("Cannot open config file: " + configFile);
        }
        nlohmann::json json;
        try {
            json = nlohmann::json::parse(in);
        } catch (const nlohmann::json::parse_error& e) {
            throw std::invalid_argument("Invalid JSON in " + configFile + ": " + e.what());
        }
        config = fromJson(json, config);
    }

    config = fromEnvironment(config);
    config.validate();
    return config;
}

void Config::validate() const {
    if (token.empty()) {
        throw std::invalid_argument("token is required (set REELDROP_TOKEN)");
    }
    if (authHeader.empty() || authHeader.find(':') != std::string::npos) {
        throw std::invalid_argument("auth_header must be a bare header name");
    }
    if (apiBaseUrl.empty()) {
        throw std::invalid_argument("api_base_url must not be empty");
    }
    if (watch.directory.empty()) {
        throw std::invalid_argument("watch_dir must not be empty");
    }
    if (watch.suffix.empty()) {
        throw std::invalid_argument("suffix must not be empty");
    }
    if (requestTimeoutSeconds <= 0 || transferTimeoutSeconds <= 0) {
        throw std::invalid_argument("timeouts must be positive");
    }
    if (workerThreads == 0 || workerThreads > kMaxWorkerThreads) {
        throw std::invalid_argument("workers must be between 1 and " + std::to_string(kMaxWorkerThreads));
    }
    if (transferRetries < 0 || transferRetries > 1) {
        throw std::invalid_argument("transfer_retries must be 0 or 1");
    }
    if (settleMillis < 0 || shutdownGraceSeconds < 0) {
        throw std::invalid_argument("settle_ms and shutdown_grace must not be negative");
    }
}

std::size_t Config::concurrencyLimit() const {
    if (maxConcurrent == 0 || maxConcurrent > workerThreads) {
        return workerThreads;
    }
    return maxConcurrent;
}

} // namespace reeldrop
