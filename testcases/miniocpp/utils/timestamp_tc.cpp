#include "miniocpp/utils/timestamp.hpp"

#include <catch2/catch.hpp>

namespace miniocpp::tests {

// ------------------------------------------------------------------- TEST_CASE
//
CATCH_TEST_CASE("Timestamp", "[timestamp]") {
  CATCH_SECTION("is_leap_year") {
    CATCH_REQUIRE(is_leap_year(1900) == false);
    CATCH_REQUIRE(is_leap_year(2000) == true);
    CATCH_REQUIRE(is_leap_year(2300) == false);
    CATCH_REQUIRE(is_leap_year(2400) == true);
    CATCH_REQUIRE(is_leap_year(2004) == true);
    CATCH_REQUIRE(is_leap_year(2005) == false);
  }

  CATCH_SECTION("day_of_year") {
    CATCH_REQUIRE(day_of_year(2022, 1, 1) == 0);
    CATCH_REQUIRE(day_of_year(2022, 2, 1) == 31);
    CATCH_REQUIRE(day_of_year(2022, 12, 31) == 364);
    CATCH_REQUIRE(day_of_year(2024, 12, 31) == 365);
  }

  CATCH_SECTION("is_valid_date") {
    CATCH_REQUIRE(is_valid_date(1904, 1, 1) == true);
    CATCH_REQUIRE(is_valid_date(1904, 4, 30) == true);
    CATCH_REQUIRE(is_valid_date(1904, 4, 31) == false);
    CATCH_REQUIRE(is_valid_date(1904, 5, 31) == true);
    CATCH_REQUIRE(is_valid_date(2000, 2, 29) == true);
    CATCH_REQUIRE(is_valid_date(2000, 2, 30) == false);
    CATCH_REQUIRE(is_valid_date(2001, 2, 29) == false);
  }

  CATCH_SECTION("datetime_to_seconds") {
    CATCH_REQUIRE(datetime_to_seconds(1970, 1, 1, 0, 0, 0) == 0);
    CATCH_REQUIRE(datetime_to_seconds(1970, 1, 1, 0, 0, 1) == 1);
    CATCH_REQUIRE(datetime_to_seconds(1970, 1, 2, 0, 0, 0) == 86400);
    CATCH_REQUIRE(datetime_to_seconds(1970, 2, 1, 0, 0, 0) == 2678400);
    CATCH_REQUIRE(datetime_to_seconds(2022, 3, 4, 23, 22, 21) == 1646436141);
    CATCH_REQUIRE(datetime_to_seconds(2021, 12, 4, 23, 22, 21) == 1638660141);
    CATCH_REQUIRE(datetime_to_seconds(1961, 12, 4, 23, 22, 21) == -254795859);
  }

  CATCH_SECTION("to_string") {
    CATCH_REQUIRE(Timestamp{}.to_string() == "1970-01-01T00:00:00.000000Z");

    const auto t = Timestamp{1646436141LL * 1000000 + 123456};
    CATCH_REQUIRE(t.to_string() == "2022-03-04T23:22:21.123456Z");
    CATCH_REQUIRE(str(t) == "2022-03-04T23:22:21.123456Z");
    CATCH_REQUIRE(t.micros() == 123456);
    CATCH_REQUIRE(t.seconds_from_epoch() == 1646436141);
  }

  CATCH_SECTION("parse") {
    {
      const auto t = Timestamp::parse("2022-03-04T23:22:21.123456Z");
      CATCH_REQUIRE(t.has_value());
      CATCH_REQUIRE(t->value() == 1646436141LL * 1000000 + 123456);
    }

    {
      const auto t = Timestamp::parse("2022-03-04T23:22:21.1");
      CATCH_REQUIRE(t.has_value());
      CATCH_REQUIRE(t->micros() == 100000);
    }

    {
      const auto t = Timestamp::parse("2022-03-04");
      CATCH_REQUIRE(t.has_value());
      CATCH_REQUIRE(t->seconds_from_epoch() == datetime_to_seconds(2022, 3, 4, 0, 0, 0));
    }

    // length
    CATCH_REQUIRE_FALSE(Timestamp::parse("").has_value());
    CATCH_REQUIRE_FALSE(Timestamp::parse("2022-03-0").has_value());
    CATCH_REQUIRE_FALSE(Timestamp::parse("2022-03-04T23:22").has_value());
    CATCH_REQUIRE_FALSE(Timestamp::parse("2022-03-04T23:22:21.1234567").has_value());

    // delimiters and digits
    CATCH_REQUIRE_FALSE(Timestamp::parse("2022-03:04").has_value());
    CATCH_REQUIRE_FALSE(Timestamp::parse("2022-03-04T23.22.21").has_value());
    CATCH_REQUIRE_FALSE(Timestamp::parse("2x22-03-04T23:22:21").has_value());
    CATCH_REQUIRE_FALSE(Timestamp::parse("2022-03-04T23:22:21+01:00").has_value());

    // Invalid date/time
    CATCH_REQUIRE_FALSE(Timestamp::parse("2022-02-30T09:14:22").has_value());
    CATCH_REQUIRE_FALSE(Timestamp::parse("2022-04-30T24:14:22").has_value());
  }

  CATCH_SECTION("now") {
    const auto t0 = Timestamp::now();
    const auto t1 = Timestamp::parse(t0.to_string());
    CATCH_REQUIRE(t1.has_value());
    CATCH_REQUIRE(*t1 == t0);
    CATCH_REQUIRE(Timestamp::now() >= t0);
  }
}

} // namespace miniocpp::tests
