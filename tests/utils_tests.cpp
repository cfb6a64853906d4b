#include "test_common.hpp"

TEST_CASE("parse_size_t enforces range") {
    bool ok = false;
    REQUIRE(parse_size_t("4", 1, 256, ok) == 4);
    REQUIRE(ok);
    parse_size_t("0", 1, 256, ok);
    REQUIRE_FALSE(ok);
    parse_size_t("257", 1, 256, ok);
    REQUIRE_FALSE(ok);
    parse_size_t("-1", 0, 10, ok);
    REQUIRE_FALSE(ok);
    parse_size_t("abc", 0, 10, ok);
    REQUIRE_FALSE(ok);
    parse_size_t("99999999999999999999999", 0, SIZE_MAX, ok);
    REQUIRE_FALSE(ok);
}

TEST_CASE("parse_bytes understands suffixes") {
    bool ok = false;
    REQUIRE(parse_bytes("512", 0, SIZE_MAX, ok) == 512);
    REQUIRE(ok);
    REQUIRE(parse_bytes("2KB", 0, SIZE_MAX, ok) == 2048);
    REQUIRE(ok);
    REQUIRE(parse_bytes("1mb", 0, SIZE_MAX, ok) == 1024 * 1024);
    REQUIRE(ok);
    parse_bytes("1xb", 0, SIZE_MAX, ok);
    REQUIRE_FALSE(ok);
}

TEST_CASE("parse_duration units") {
    bool ok = false;
    REQUIRE(parse_duration("30", ok) == std::chrono::seconds(30));
    REQUIRE(ok);
    REQUIRE(parse_duration("2m", ok) == std::chrono::seconds(120));
    REQUIRE(ok);
    REQUIRE(parse_duration("1h", ok) == std::chrono::seconds(3600));
    REQUIRE(ok);
    parse_duration("5x", ok);
    REQUIRE_FALSE(ok);
    parse_duration("", ok);
    REQUIRE_FALSE(ok);
}

TEST_CASE("parse_time_ms units") {
    bool ok = false;
    REQUIRE(parse_time_ms("250ms", ok) == std::chrono::milliseconds(250));
    REQUIRE(ok);
    REQUIRE(parse_time_ms("2s", ok) == std::chrono::milliseconds(2000));
    REQUIRE(ok);
    REQUIRE(parse_time_ms("100", ok) == std::chrono::milliseconds(100));
    REQUIRE(ok);
    parse_time_ms("fast", ok);
    REQUIRE_FALSE(ok);
}

TEST_CASE("parse_bool accepts common spellings") {
    bool ok = false;
    REQUIRE(parse_bool("yes", ok));
    REQUIRE(ok);
    REQUIRE(parse_bool("", ok));
    REQUIRE(ok);
    REQUIRE_FALSE(parse_bool("Off", ok));
    REQUIRE(ok);
    parse_bool("maybe", ok);
    REQUIRE_FALSE(ok);
}

TEST_CASE("format_elapsed") {
    REQUIRE(format_elapsed(std::chrono::milliseconds(2350)) == "2.35s");
    REQUIRE(format_elapsed(std::chrono::milliseconds(64200)) == "1m4.20s");
    REQUIRE(format_elapsed(std::chrono::milliseconds(-5)) == "0.00s");
}

TEST_CASE("compact_timestamp has no spaces") {
    std::string ts = compact_timestamp();
    REQUIRE(ts.size() == 15);
    REQUIRE(ts.find(' ') == std::string::npos);
    REQUIRE(ts[8] == '-');
}
