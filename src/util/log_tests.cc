#include "util/log.hpp"

#include <doctest.h>

#include <string>
#include <utility>
#include <vector>

using namespace fuzzpatch;

TEST_CASE("log") {
    std::vector<std::pair<LogLevel, std::string>> captured;
    auto previous_level = log_get_level();
    log_set_sink([&](LogLevel level, const std::string& message) { captured.emplace_back(level, message); });

    SUBCASE("level filter") {
        log_set_level(LogLevel::kWarning);
        log_debug("hidden {}", 1);
        log_info("hidden {}", 2);
        log_warning("shown {}", 3);
        log_error("shown {}", "four");

        REQUIRE(captured.size() == 2);
        REQUIRE(captured[0].first == LogLevel::kWarning);
        REQUIRE(captured[0].second == "shown 3");
        REQUIRE(captured[1].first == LogLevel::kError);
        REQUIRE(captured[1].second == "shown four");
    }

    SUBCASE("quiet drops everything") {
        log_set_level(LogLevel::kQuiet);
        log_error("nothing");
        REQUIRE(captured.empty());
    }

    SUBCASE("level names") {
        REQUIRE(log_level_from_string("debug") == LogLevel::kDebug);
        REQUIRE(log_level_from_string("warn") == LogLevel::kWarning);
        REQUIRE(log_level_from_string("none") == LogLevel::kQuiet);
        REQUIRE_FALSE(log_level_from_string("loud").has_value());
        REQUIRE(to_string(LogLevel::kError) == "error");
    }

    log_set_sink({});
    log_set_level(previous_level);
}
