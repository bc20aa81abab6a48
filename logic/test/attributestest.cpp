#include "shipem/attributes.h"

#include <doctest/doctest.h>

namespace shipem::test {

using namespace doctest;

TEST_CASE("Attribute values")
{
    SUBCASE("numbers compare numerically")
    {
        CHECK(attribute_equals(AttributeValue(1.0), AttributeValue(1.0)));
        CHECK_FALSE(attribute_equals(AttributeValue(1.0), AttributeValue(1.5)));
    }

    SUBCASE("text compares exactly")
    {
        CHECK(attribute_equals(AttributeValue(std::string("tug")), AttributeValue(std::string("tug"))));
        CHECK_FALSE(attribute_equals(AttributeValue(std::string("tug")), AttributeValue(std::string("Tug"))));
    }

    SUBCASE("a number never equals text")
    {
        CHECK_FALSE(attribute_equals(AttributeValue(1.0), AttributeValue(std::string("1"))));
        CHECK_FALSE(attribute_equals(AttributeValue(std::string("1")), AttributeValue(1.0)));
    }

    SUBCASE("typed access")
    {
        const AttributeValue number(3.0);
        const AttributeValue text(std::string("c3"));

        CHECK(is_number(number));
        CHECK_FALSE(is_text(number));
        CHECK(as_number(number) == 3.0);
        CHECK_FALSE(as_text(number).has_value());

        CHECK(is_text(text));
        CHECK(as_text(text) == "c3");
        CHECK_FALSE(as_number(text).has_value());
    }
}

TEST_CASE("Attribute maps")
{
    const Attributes attrs{
        {"ship_type", std::string("tug")},
        {"size", 0.0},
    };

    CHECK(find_text(attrs, "ship_type") == "tug");
    CHECK_FALSE(find_text(attrs, "size").has_value());
    CHECK(find_number(attrs, "size") == 0.0);
    CHECK_FALSE(find_number(attrs, "engine_kw").has_value());

    SUBCASE("merge keeps the values of the left hand side")
    {
        const Attributes other{
            {"size", 100.0},
            {"engine_kw", 500.0},
        };

        const auto merged = merged_attributes(attrs, other);
        CHECK(merged.size() == 3);
        CHECK(find_number(merged, "size") == 0.0);
        CHECK(find_number(merged, "engine_kw") == 500.0);
    }

    SUBCASE("to string")
    {
        CHECK(to_string(attrs) == "{ship_type: 'tug', size: 0}");
        CHECK(to_string(Attributes()) == "{}");
    }
}

}
