#include <clinpatch/encodings/json.hpp>

#include <algorithm>
#include <cctype>

#include <clinpatch/core/testing.hpp>
#include <clinpatch/core/utilities.hpp>

using namespace clinpatch;

static string
strip_whitespace(string s)
{
    s.erase(
        std::remove_if(
            s.begin(),
            s.end(),
            [](char c) { return std::isspace(static_cast<unsigned char>(c)); }),
        s.end());
    return s;
}

TEST_CASE("JSON scalar parsing", "[encodings][json]")
{
    REQUIRE(parse_json_value("null") == dynamic(nil));
    REQUIRE(parse_json_value("true") == dynamic(true));
    REQUIRE(parse_json_value("-1") == dynamic(integer(-1)));
    REQUIRE(parse_json_value("10737418240") == dynamic(integer(10737418240)));
    REQUIRE(parse_json_value("1.25") == dynamic(1.25));
    REQUIRE(parse_json_value(R"("hi")") == dynamic("hi"));
}

TEST_CASE("JSON structure parsing", "[encodings][json]")
{
    auto value = parse_json_value(R"(
        {
            "resourceType": "Patient",
            "name": [ { "given": ["Jim", "Bob"] } ],
            "active": false
        }
    )");
    REQUIRE(
        value
        == dynamic(
            {{"resourceType", "Patient"},
             {"name",
              dynamic_array{dynamic({{"given", dynamic{"Jim", "Bob"}}})}},
             {"active", false}}));
}

TEST_CASE("JSON writing", "[encodings][json]")
{
    dynamic value({{"happy", true}, {"n", 4.125}, {"list", dynamic{1, 2}}});
    REQUIRE(
        strip_whitespace(value_to_json(value))
        == R"({"happy":true,"list":[1,2],"n":4.125})");

    // Negative indentation gives compact output.
    REQUIRE(value_to_json(dynamic{1, 2}, -1) == "[1,2]");

    // Non-string map keys are written as their string forms.
    REQUIRE(
        value_to_json(dynamic(dynamic_map{{dynamic(integer(1)), dynamic("a")}}), -1)
        == R"({"1":"a"})");
}

TEST_CASE("malformed JSON", "[encodings][json]")
{
    try
    {
        parse_json_value("{ \"a\": ");
        FAIL("no exception thrown");
    }
    catch (parsing_error& e)
    {
        REQUIRE(get_required_error_info<expected_format_info>(e) == "JSON");
        REQUIRE(get_required_error_info<parsed_text_info>(e) == "{ \"a\": ");
    }
}
