#include <boost/test/unit_test.hpp>
#include <map>
#include <stdexcept>
#include <string>
#include "core/Config.hpp"

using reeldrop::Config;

namespace {
    Config::EnvLookup fakeEnvironment(const std::map<std::string, std::string>& values) {
        return [values](const char* name) -> const char* {
            auto it = values.find(name);
            return it != values.end() ? it->second.c_str() : nullptr;
        };
    }
}

BOOST_AUTO_TEST_SUITE(config_test_suite)

BOOST_AUTO_TEST_CASE(test_defaults_match_posts_api) {
    Config config;
    BOOST_CHECK_EQUAL(config.watch.directory, "./videos");
    BOOST_CHECK_EQUAL(config.watch.suffix, ".mp4");
    BOOST_CHECK_EQUAL(config.categoryId, 25);
    BOOST_CHECK_EQUAL(config.authHeader, "Flic-Token");
    BOOST_CHECK_EQUAL(config.maxConcurrent, 0u);
    BOOST_CHECK_EQUAL(config.transferRetries, 1);
    BOOST_CHECK(config.publicFeed);
}

BOOST_AUTO_TEST_CASE(test_json_overrides_defaults) {
    auto json = nlohmann::json::parse(R"({
        "token": "from-file",
        "watch_dir": "/srv/incoming",
        "suffix": ".mov",
        "category_id": 7,
        "max_concurrent": 2,
        "public_feed": false
    })");

    Config config = Config::fromJson(json);
    BOOST_CHECK_EQUAL(config.token, "from-file");
    BOOST_CHECK_EQUAL(config.watch.directory, "/srv/incoming");
    BOOST_CHECK_EQUAL(config.watch.suffix, ".mov");
    BOOST_CHECK_EQUAL(config.categoryId, 7);
    BOOST_CHECK_EQUAL(config.maxConcurrent, 2u);
    BOOST_CHECK(!config.publicFeed);
    // untouched keys keep their defaults
    BOOST_CHECK_EQUAL(config.requestTimeoutSeconds, 30);
}

BOOST_AUTO_TEST_CASE(test_environment_overrides_file) {
    Config fromFile = Config::fromJson(nlohmann::json::parse(R"({"token": "from-file", "category_id": 7})"));

    Config config = Config::fromEnvironment(fromFile, fakeEnvironment({
        {"REELDROP_TOKEN", "from-env"},
        {"REELDROP_MAX_CONCURRENT", "3"},
        {"REELDROP_PUBLIC_FEED", "no"},
    }));

    BOOST_CHECK_EQUAL(config.token, "from-env");
    BOOST_CHECK_EQUAL(config.categoryId, 7);
    BOOST_CHECK_EQUAL(config.maxConcurrent, 3u);
    BOOST_CHECK(!config.publicFeed);
}

BOOST_AUTO_TEST_CASE(test_empty_environment_value_is_ignored) {
    Config base;
    base.token = "kept";
    Config config = Config::fromEnvironment(base, fakeEnvironment({{"REELDROP_TOKEN", ""}}));
    BOOST_CHECK_EQUAL(config.token, "kept");
}

BOOST_AUTO_TEST_CASE(test_malformed_values_are_rejected) {
    BOOST_CHECK_THROW(Config::fromEnvironment(Config(), fakeEnvironment({{"REELDROP_CATEGORY_ID", "abc"}})),
                      std::invalid_argument);
    BOOST_CHECK_THROW(Config::fromEnvironment(Config(), fakeEnvironment({{"REELDROP_WORKERS", "-1"}})),
                      std::invalid_argument);
    BOOST_CHECK_THROW(Config::fromEnvironment(Config(), fakeEnvironment({{"REELDROP_PUBLIC_FEED", "maybe"}})),
                      std::invalid_argument);
    BOOST_CHECK_THROW(Config::fromJson(nlohmann::json::parse(R"({"category_id": "seven"})")),
                      std::invalid_argument);
    BOOST_CHECK_THROW(Config::fromJson(nlohmann::json::array()), std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(test_negative_json_counts_are_rejected) {
    BOOST_CHECK_THROW(Config::fromJson(nlohmann::json::parse(R"({"workers": -1})")), std::invalid_argument);
    BOOST_CHECK_THROW(Config::fromJson(nlohmann::json::parse(R"({"max_concurrent": -3})")), std::invalid_argument);
    BOOST_CHECK_THROW(Config::fromJson(nlohmann::json::parse(R"({"workers": 2.5})")), std::invalid_argument);

    Config config = Config::fromJson(nlohmann::json::parse(R"({"workers": 8, "max_concurrent": 0})"));
    BOOST_CHECK_EQUAL(config.workerThreads, 8u);
    BOOST_CHECK_EQUAL(config.maxConcurrent, 0u);
}

BOOST_AUTO_TEST_CASE(test_oversized_worker_pool_is_rejected) {
    Config config = Config::fromJson(nlohmann::json::parse(R"({"token": "secret", "workers": 1000000})"));
    BOOST_CHECK_THROW(config.validate(), std::invalid_argument);

    config.workerThreads = 64;
    BOOST_CHECK_NO_THROW(config.validate());
}

BOOST_AUTO_TEST_CASE(test_concurrency_limit_never_exceeds_workers) {
    Config config;
    config.workerThreads = 4;

    config.maxConcurrent = 0;
    BOOST_CHECK_EQUAL(config.concurrencyLimit(), 4u);
    config.maxConcurrent = 2;
    BOOST_CHECK_EQUAL(config.concurrencyLimit(), 2u);
    config.maxConcurrent = 10;
    BOOST_CHECK_EQUAL(config.concurrencyLimit(), 4u);
}

BOOST_AUTO_TEST_CASE(test_validate) {
    Config config;
    BOOST_CHECK_THROW(config.validate(), std::invalid_argument);

    config.token = "secret";
    BOOST_CHECK_NO_THROW(config.validate());

    config.transferRetries = 2;
    BOOST_CHECK_THROW(config.validate(), std::invalid_argument);
    config.transferRetries = 1;

    config.watch.suffix = "";
    BOOST_CHECK_THROW(config.validate(), std::invalid_argument);
    config.watch.suffix = ".mp4";

    config.workerThreads = 0;
    BOOST_CHECK_THROW(config.validate(), std::invalid_argument);
}

BOOST_AUTO_TEST_SUITE_END()
