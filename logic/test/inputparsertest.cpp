#include "shipem/inputparsers.h"
#include "infra/exception.h"

#include "testconfig.h"

#include <doctest/doctest.h>

namespace shipem::test {

using namespace inf;
using namespace doctest;
using namespace date;
using namespace std::chrono_literals;

TEST_CASE("Parse timestamp")
{
    const Timestamp expected = sys_days(2023_y / May / 1) + 10h;

    CHECK(parse_timestamp("1682935200") == expected);
    CHECK(parse_timestamp(" 1682935200 ") == expected);
    CHECK(parse_timestamp("0") == Timestamp(0s));
    CHECK(parse_timestamp("2023-05-01T10:00:00Z") == expected);
    CHECK(parse_timestamp("2023-05-01T10:00:00") == expected);
    CHECK(parse_timestamp("2023-05-01T10:00:30Z") == expected + 30s);

    CHECK_THROWS_AS(parse_timestamp(""), RuntimeError);
    CHECK_THROWS_AS(parse_timestamp("yesterday"), RuntimeError);
    CHECK_THROWS_AS(parse_timestamp("2023-05-01"), RuntimeError);
    CHECK_THROWS_AS(parse_timestamp("2023-05-01T10:00:00+02:00"), RuntimeError);
}

TEST_CASE("Parse positions")
{
    const auto dataPath = fs::u8path(TEST_DATA_DIR);
    const Timestamp start = sys_days(2023_y / May / 1) + 10h;

    SUBCASE("without tide columns")
    {
        const auto positions = parse_positions(dataPath / "positions.csv");
        REQUIRE(positions.size() == 2);

        CHECK(positions[0].ts == start);
        CHECK(positions[0].lon == 4.0);
        CHECK(positions[0].lat == 51.0);
        CHECK(positions[0].sog == 20.0);
        CHECK(positions[0].cog == 0.0);
        CHECK(positions[0].heading == 0.0);
        CHECK_FALSE(positions[0].tideFlow.has_value());
        CHECK_FALSE(positions[0].tideBearing.has_value());

        CHECK(positions[1].ts == start + 2h);
        CHECK(positions[1].lat == Approx(51.0 + (40.0 / 60.0)));
        CHECK_FALSE(positions[1].heading.has_value());
    }

    SUBCASE("missing values and tide")
    {
        const auto positions = parse_positions(dataPath / "harbour.csv");
        REQUIRE(positions.size() == 3);

        CHECK(positions[0].ts == start);
        CHECK_FALSE(positions[0].sog.has_value());
        CHECK_FALSE(positions[0].cog.has_value());
        CHECK_FALSE(positions[0].heading.has_value());
        CHECK(positions[0].tideFlow == 1.5);
        CHECK(positions[0].tideBearing == 90.0);

        CHECK(positions[1].ts == start + 5min);
        CHECK(positions[1].lon == Approx(4.002));
        CHECK(positions[1].sog == 4.5);
        CHECK(positions[1].cog == 45.0);
        CHECK(positions[1].heading == 40.0);

        CHECK(positions[2].ts == start + 10min);
        CHECK(positions[2].sog == 6.0);
        CHECK_FALSE(positions[2].cog.has_value());
        CHECK_FALSE(positions[2].tideFlow.has_value());
        CHECK_FALSE(positions[2].tideBearing.has_value());
    }

    SUBCASE("invalid input")
    {
        CHECK_THROWS_AS(parse_positions(dataPath / "invalid_positions.csv"), RuntimeError);
        CHECK_THROWS_AS(parse_positions(dataPath / "missing_column.csv"), RuntimeError);
        CHECK_THROWS_AS(parse_positions(dataPath / "does_not_exist.csv"), RuntimeError);
    }
}

}
