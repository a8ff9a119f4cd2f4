#include <clinpatch/core/dynamic.hpp>

#include <clinpatch/core/testing.hpp>
#include <clinpatch/core/utilities.hpp>

using namespace clinpatch;

TEST_CASE("value_type streaming", "[core][dynamic]")
{
    REQUIRE(lexical_cast<string>(value_type::NIL) == "nil");
    REQUIRE(lexical_cast<string>(value_type::BOOLEAN) == "boolean");
    REQUIRE(lexical_cast<string>(value_type::INTEGER) == "integer");
    REQUIRE(lexical_cast<string>(value_type::FLOAT) == "float");
    REQUIRE(lexical_cast<string>(value_type::STRING) == "string");
    REQUIRE(lexical_cast<string>(value_type::ARRAY) == "array");
    REQUIRE(lexical_cast<string>(value_type::MAP) == "map");
    REQUIRE_THROWS_AS(
        lexical_cast<string>(value_type(-1)), invalid_enum_value);
}

TEST_CASE("dynamic type checking", "[core][dynamic]")
{
    try
    {
        check_type(value_type::NIL, value_type::BOOLEAN);
        FAIL("no exception thrown");
    }
    catch (dynamic_type_mismatch& e)
    {
        REQUIRE(
            get_required_error_info<expected_value_type_info>(e)
            == value_type::NIL);
        REQUIRE(
            get_required_error_info<actual_value_type_info>(e)
            == value_type::BOOLEAN);
    }

    REQUIRE_NOTHROW(check_type(value_type::NIL, value_type::NIL));

    REQUIRE_THROWS_AS(cast<string>(dynamic(integer(1))), dynamic_type_mismatch);
    REQUIRE(cast<integer>(dynamic(integer(1))) == 1);
}

TEST_CASE("dynamic initializer lists", "[core][dynamic]")
{
    // Test a simple initializer list.
    REQUIRE(
        (dynamic{0., 1., 2.})
        == dynamic(dynamic_array{dynamic(0.), dynamic(1.), dynamic(2.)}));

    // Test that lists that look like maps are interpretted as maps.
    REQUIRE(
        (dynamic{{"foo", 0.}, {"bar", 1.}})
        == dynamic(dynamic_map{
            {dynamic("foo"), dynamic(0.)}, {dynamic("bar"), dynamic(1.)}}));

    // Test that the conversion to map only happens with string keys.
    REQUIRE(
        (dynamic{{"foo", 0.}, {0., 1.}})
        == dynamic(dynamic_array{
            dynamic(dynamic_array{dynamic("foo"), dynamic(0.)}),
            dynamic(dynamic_array{dynamic(0.), dynamic(1.)})}));
}

TEST_CASE("dynamic type interface", "[core][dynamic]")
{
    test_regular_value_pair(dynamic(false), dynamic(true));

    test_regular_value_pair(dynamic(integer(0)), dynamic(integer(1)));

    test_regular_value_pair(dynamic(0.), dynamic(1.));

    test_regular_value_pair(dynamic(string("bar")), dynamic(string("foo")));

    test_regular_value_pair(
        dynamic(dynamic_array({dynamic(0.), dynamic(1.)})),
        dynamic(dynamic_array({dynamic(1.), dynamic(2.)})));

    test_regular_value_pair(
        dynamic(dynamic_map({{dynamic(0.), dynamic(1.)}})),
        dynamic(dynamic_map({{dynamic(1.), dynamic(2.)}})));
}

TEST_CASE("get_field", "[core][dynamic]")
{
    auto map = dynamic_map({{"a", 12.}, {"b", false}});

    // Try getting both fields.
    REQUIRE(get_field(map, "a") == dynamic(12.));
    REQUIRE(get_field(map, "b") == dynamic(false));

    // Try a missing field.
    try
    {
        get_field(map, "c");
        FAIL("no exception thrown");
    }
    catch (missing_field& e)
    {
        REQUIRE(get_required_error_info<field_name_info>(e) == "c");
    }

    // Try the non-throwing form.
    dynamic const* v;
    REQUIRE(get_field(&v, map, "a"));
    REQUIRE(*v == dynamic(12.));
    REQUIRE(!get_field(&v, map, "c"));
}

TEST_CASE("dynamic path info", "[core][dynamic]")
{
    missing_field e;
    add_dynamic_path_element(e, dynamic("b"));
    add_dynamic_path_element(e, dynamic(integer(0)));
    add_dynamic_path_element(e, dynamic("a"));

    auto const& path = get_required_error_info<dynamic_value_path_info>(e);
    REQUIRE(
        path
        == std::list<dynamic>(
            {dynamic("a"), dynamic(integer(0)), dynamic("b")}));
}

TEST_CASE("dynamic value strings", "[core][dynamic]")
{
    REQUIRE(to_value_string(dynamic(nil)) == "");
    REQUIRE(to_value_string(dynamic(true)) == "true");
    REQUIRE(to_value_string(dynamic(false)) == "false");
    REQUIRE(to_value_string(dynamic(integer(-12))) == "-12");
    REQUIRE(to_value_string(dynamic(1.5)) == "1.5");
    REQUIRE(to_value_string(dynamic("2024-01-05")) == "2024-01-05");
    REQUIRE_THROWS_AS(
        to_value_string(dynamic{1., 2.}), dynamic_type_mismatch);
}

TEST_CASE("dynamic operators", "[core][dynamic]")
{
    dynamic a;
    dynamic b(integer(0));
    dynamic c(integer(1));

    REQUIRE(a == a);
    REQUIRE(b == b);
    REQUIRE(c == c);

    REQUIRE(a != b);
    REQUIRE(b != c);
    REQUIRE(a != c);

    REQUIRE(a < b);
    REQUIRE(b < c);
    REQUIRE(a < c);

    // Values of different types are never equal.
    REQUIRE(dynamic(integer(1)) != dynamic(1.));
}
