// Copyright (c) 2025 The Lanpeer Developers
// Distributed under the MIT software license

#include <catch2/catch_test_macros.hpp>

#include "app/config.hpp"

#include <climits>
#include <filesystem>
#include <fstream>
#include <vector>

using namespace lanpeer::app;

namespace {

ParseResult Parse(std::vector<const char*> args, AppConfig& config, std::string& error) {
    args.insert(args.begin(), "lanpeerd");
    return ParseCommandLine(static_cast<int>(args.size()), args.data(), config, error);
}

std::string WriteTempFile(const std::string& name, const std::string& content) {
    auto path = std::filesystem::temp_directory_path() / name;
    std::ofstream out(path);
    out << content;
    return path.string();
}

}  // namespace

TEST_CASE("Config: defaults", "[app][config]") {
    AppConfig config;
    std::string error;
    REQUIRE(Parse({}, config, error) == ParseResult::OK);
    REQUIRE(config.listen_v4 == ":21027");
    REQUIRE(config.listen_v6 == "[ff12::8384]:21027");
    REQUIRE(config.ipv4);
    REQUIRE(config.ipv6);
    REQUIRE(config.addresses == std::vector<std::string>{"tcp://0.0.0.0:22000"});
    REQUIRE(config.broadcast_interval_sec == 30);
    REQUIRE(config.status_interval_sec == 0);
    REQUIRE(config.device_id.empty());
}

TEST_CASE("Config: command line flags", "[app][config]") {
    AppConfig config;
    std::string error;

    SECTION("Values") {
        REQUIRE(Parse({"--listen-v4=:21028", "--noipv6", "--address=tcp://192.0.2.1:22000",
                       "--address=quic://0.0.0.0:22000", "--relay=relay://192.0.2.9:22067/?id=X,25",
                       "--relay=relay://192.0.2.10:22067", "--broadcast-interval=5", "--loglevel=debug"},
                      config, error) == ParseResult::OK);
        REQUIRE(config.listen_v4 == ":21028");
        REQUIRE_FALSE(config.ipv6);
        REQUIRE(config.addresses ==
                std::vector<std::string>{"tcp://192.0.2.1:22000", "quic://0.0.0.0:22000"});
        REQUIRE(config.relays.size() == 2);
        REQUIRE(config.relays[0].url == "relay://192.0.2.9:22067/?id=X");
        REQUIRE(config.relays[0].latency_ms == 25);
        REQUIRE(config.relays[1].url == "relay://192.0.2.10:22067");
        REQUIRE_FALSE(config.relays[1].latency_ms.has_value());
        REQUIRE(config.broadcast_interval_sec == 5);
        REQUIRE(config.loglevel == "debug");
    }

    SECTION("Help") {
        REQUIRE(Parse({"--help"}, config, error) == ParseResult::HELP);
        REQUIRE(UsageString("lanpeerd").find("--listen-v6") != std::string::npos);
    }

    SECTION("Errors") {
        REQUIRE(Parse({"--bogus"}, config, error) == ParseResult::ERROR);
        REQUIRE(error.find("--bogus") != std::string::npos);
        REQUIRE(Parse({"--broadcast-interval=0"}, config, error) == ParseResult::ERROR);
        REQUIRE(Parse({"--broadcast-interval=abc"}, config, error) == ParseResult::ERROR);
        REQUIRE(Parse({"--status-interval=-1"}, config, error) == ParseResult::ERROR);
        REQUIRE(Parse({"--relay="}, config, error) == ParseResult::ERROR);
    }

    SECTION("Relay latency must fit the announcement") {
        REQUIRE(Parse({"--relay=relay://192.0.2.9:22067,-5"}, config, error) == ParseResult::ERROR);
        REQUIRE(error.find("relay://192.0.2.9:22067,-5") != std::string::npos);
        REQUIRE(Parse({"--relay=relay://192.0.2.9:22067,3000000000"}, config, error) == ParseResult::ERROR);
        REQUIRE(Parse({"--relay=relay://192.0.2.9:22067,fast"}, config, error) == ParseResult::ERROR);
        REQUIRE(Parse({"--relay=relay://192.0.2.9:22067,"}, config, error) == ParseResult::ERROR);
        REQUIRE(Parse({"--relay=relay://192.0.2.9:22067,2147483647"}, config, error) == ParseResult::OK);
        REQUIRE(config.relays.back().latency_ms == INT32_MAX);
    }

    SECTION("Both families disabled") {
        REQUIRE(Parse({"--noipv4", "--noipv6"}, config, error) == ParseResult::ERROR);
    }
}

TEST_CASE("Config: JSON file", "[app][config]") {
    auto path = WriteTempFile("lanpeer_config_test.json", R"({
        "device_id": "AAAAAAA-AAAAAAA-AAAAAAA-AAAAAAA-AAAAAAA-AAAAAAA-AAAAAAA-AAAAAAA",
        "listen_v6": "[ff12::1234]:21027",
        "addresses": ["tcp://0.0.0.0:23000"],
        "relays": [{"url": "relay://192.0.2.9:22067", "latency_ms": 40}, {"url": "relay://192.0.2.10:22067"}],
        "broadcast_interval_sec": 10,
        "status_interval_sec": 60
    })");

    SECTION("File values loaded") {
        AppConfig config;
        std::string error;
        REQUIRE(LoadConfigFile(path, config, error));
        REQUIRE(config.listen_v6 == "[ff12::1234]:21027");
        REQUIRE(config.listen_v4 == ":21027");
        REQUIRE(config.addresses == std::vector<std::string>{"tcp://0.0.0.0:23000"});
        REQUIRE(config.relays.size() == 2);
        REQUIRE(config.relays[0].latency_ms == 40);
        REQUIRE_FALSE(config.relays[1].latency_ms.has_value());
        REQUIRE(config.broadcast_interval_sec == 10);
        REQUIRE(config.status_interval_sec == 60);
    }

    SECTION("Flags override the file") {
        AppConfig config;
        std::string error;
        std::string conf = "--conf=" + path;
        REQUIRE(Parse({"--broadcast-interval=3", conf.c_str()}, config, error) == ParseResult::OK);
        REQUIRE(config.broadcast_interval_sec == 3);
        REQUIRE(config.status_interval_sec == 60);
    }

    std::filesystem::remove(path);
}

TEST_CASE("Config: bad JSON files", "[app][config]") {
    AppConfig config;
    std::string error;

    SECTION("Missing file") {
        REQUIRE_FALSE(LoadConfigFile("/nonexistent/lanpeer.json", config, error));
        REQUIRE_FALSE(error.empty());
    }

    SECTION("Syntax error") {
        auto path = WriteTempFile("lanpeer_bad_syntax.json", "{ \"ipv4\": ");
        REQUIRE_FALSE(LoadConfigFile(path, config, error));
        std::filesystem::remove(path);
    }

    SECTION("Relay latency out of range") {
        auto negative = WriteTempFile("lanpeer_bad_latency_neg.json",
                                      R"({"relays": [{"url": "relay://192.0.2.9:22067", "latency_ms": -5}]})");
        REQUIRE_FALSE(LoadConfigFile(negative, config, error));
        REQUIRE(error.find("latency_ms") != std::string::npos);
        std::filesystem::remove(negative);

        auto huge = WriteTempFile("lanpeer_bad_latency_big.json",
                                  R"({"relays": [{"url": "relay://192.0.2.9:22067", "latency_ms": 3000000000}]})");
        REQUIRE_FALSE(LoadConfigFile(huge, config, error));
        std::filesystem::remove(huge);
    }

    SECTION("Wrong type") {
        auto path = WriteTempFile("lanpeer_bad_type.json", R"({"addresses": "tcp://0.0.0.0:22000"})");
        REQUIRE_FALSE(LoadConfigFile(path, config, error));
        std::filesystem::remove(path);
    }

    SECTION("Out of range interval") {
        auto path = WriteTempFile("lanpeer_bad_interval.json", R"({"broadcast_interval_sec": 0})");
        REQUIRE_FALSE(LoadConfigFile(path, config, error));
        std::filesystem::remove(path);
    }
}
