#include <clinpatch/model/codec.hpp>

#include <clinpatch/core/testing.hpp>
#include <clinpatch/core/utilities.hpp>

#include <testing_schema.hpp>

using namespace clinpatch;

TEST_CASE("document reading", "[model][codec]")
{
    auto patient = make_testing_patient();
    REQUIRE(patient.type == "Patient");
    REQUIRE(get_single_item(patient, "id")->type == "id");
    REQUIRE(get_single_item(patient, "id")->value == dynamic("example"));
    REQUIRE(get_single_item(patient, "active")->value == dynamic(true));
    REQUIRE(count_field_items(patient, "telecom") == 3);

    auto const& name = get_field_items(patient, "name").at(0);
    REQUIRE(name.type == "HumanName");
    REQUIRE(get_field_items(name, "given").at(0).type == "string");
    REQUIRE(get_single_item(name, "use")->type == "code");
}

TEST_CASE("document writing", "[model][codec]")
{
    auto patient = make_testing_patient();
    REQUIRE(
        write_testing_document(patient)
        == parse_json_value(testing_patient_json));
}

TEST_CASE("choice fields", "[model][codec]")
{
    auto patient = parse_testing_document(R"(
        {
            "resourceType": "Patient",
            "extension": [
                { "url": "http://example.org/a", "valueCode": "M" },
                { "url": "http://example.org/b", "valueHumanName": { "family": "Smith" } },
                { "url": "http://example.org/c", "valueDecimal": 2 }
            ]
        }
    )");
    auto const& extensions = get_field_items(patient, "extension");
    REQUIRE(extensions.size() == 3);
    REQUIRE(get_single_item(extensions[0], "value")->type == "code");
    REQUIRE(get_single_item(extensions[1], "value")->type == "HumanName");
    // Integers are widened where decimals are expected.
    REQUIRE(get_single_item(extensions[2], "value")->value == dynamic(2.));

    auto written = cast<dynamic_map>(write_testing_document(patient));
    auto const& written_extensions
        = cast<dynamic_array>(written.at(dynamic("extension")));
    REQUIRE(
        written_extensions[0]
        == dynamic{{"url", "http://example.org/a"}, {"valueCode", "M"}});
    REQUIRE(
        cast<dynamic_map>(written_extensions[1]).count(dynamic("valueHumanName"))
        == 1);
}

TEST_CASE("document format errors", "[model][codec]")
{
    REQUIRE_THROWS_AS(
        parse_testing_document(R"({ "id": "x" })"), document_format_error);
    REQUIRE_THROWS_AS(
        parse_testing_document(R"({ "resourceType": "Observation" })"),
        unknown_schema_type);
    REQUIRE_THROWS_AS(
        parse_testing_document(R"({ "resourceType": "code" })"),
        document_format_error);

    try
    {
        parse_testing_document(R"(
            {
                "resourceType": "Patient",
                "name": [ { "given": ["Jim"] }, { "nickname": "J" } ]
            }
        )");
        FAIL("no exception thrown");
    }
    catch (document_format_error& e)
    {
        REQUIRE(
            get_required_error_info<document_problem_info>(e)
            == "unknown field: nickname");
        REQUIRE(
            get_required_error_info<dynamic_value_path_info>(e)
            == std::list<dynamic>(
                {dynamic("name"), dynamic(integer(1)), dynamic("nickname")}));
    }

    // A choice field needs its type suffix.
    REQUIRE_THROWS_AS(
        parse_testing_document(R"(
            { "resourceType": "Patient", "extension": [ { "value": "M" } ] }
        )"),
        document_format_error);

    // The suffix has to name an allowed type.
    REQUIRE_THROWS_AS(
        parse_testing_document(R"(
            { "resourceType": "Patient", "extension": [ { "valueMeta": {} } ] }
        )"),
        document_format_error);

    // Scalars have to match their declared types.
    REQUIRE_THROWS_AS(
        parse_testing_document(R"(
            { "resourceType": "Patient", "active": "yes" }
        )"),
        dynamic_type_mismatch);
}
