#include <clinpatch/service/patch_service.hpp>

#include <clinpatch/core/testing.hpp>
#include <clinpatch/patch/errors.hpp>
#include <clinpatch/patch/path.hpp>

#include <testing_schema.hpp>

using namespace clinpatch;

static raw_operation
make_replace(string const& path, string const& value)
{
    raw_operation op;
    op.kind = string("replace");
    op.path = path;
    op.value = make_primitive_payload(dynamic(value));
    return op;
}

TEST_CASE("entity tags", "[service][patch_service]")
{
    REQUIRE(parse_entity_tag("W/\"3\"") == "3");
    REQUIRE(parse_entity_tag("\"3\"") == "3");
    REQUIRE(parse_entity_tag("3") == "3");
    REQUIRE(parse_entity_tag("W/3") == "3");
    REQUIRE(parse_entity_tag("\"") == "\"");
}

TEST_CASE("patch service", "[service][patch_service]")
{
    auto const& schema = get_testing_schema();
    memory_document_store store(schema);
    store.save_document(make_testing_patient(), none);
    resource_key key{"Patient", "example", none};
    patch_service service(store, schema);

    auto patched = service.patch(key, {make_replace("gender", "female")});
    REQUIRE(get_document_version(schema, patched) == some(string("2")));
    REQUIRE(
        evaluate_scalar_path(patched, schema, "gender")
        == some(dynamic("female")));
    REQUIRE(store.load_document(key) == patched);

    patched = service.patch(
        key, {make_replace("gender", "other")}, some(string("W/\"2\"")));
    REQUIRE(get_document_version(schema, patched) == some(string("3")));

    SECTION("stale If-Match")
    {
        try
        {
            service.patch(
                key, {make_replace("gender", "male")}, some(string("\"2\"")));
            FAIL("no exception thrown");
        }
        catch (precondition_failed& e)
        {
            REQUIRE(get_required_error_info<expected_version_info>(e) == "2");
            REQUIRE(get_required_error_info<current_version_info>(e) == "3");
        }
        REQUIRE(store.load_document(key) == patched);
    }

    SECTION("version-specific keys")
    {
        REQUIRE_THROWS_AS(
            service.patch(
                resource_key{"Patient", "example", some(string("3"))},
                {make_replace("gender", "male")}),
            version_specific_patch);
    }

    SECTION("unknown resources")
    {
        REQUIRE_THROWS_AS(
            service.patch(
                resource_key{"Patient", "nobody", none},
                {make_replace("gender", "male")}),
            resource_not_found);
    }

    SECTION("failed patches")
    {
        // The first operation succeeds, but nothing is saved.
        raw_operation bad;
        bad.kind = string("move");
        bad.path = string("telecom");
        bad.source = integer(0);
        bad.destination = integer(9);
        REQUIRE_THROWS_AS(
            service.patch(key, {make_replace("gender", "male"), bad}),
            invalid_patch);
        REQUIRE(store.load_document(key) == patched);

        REQUIRE_THROWS_AS(
            service.patch(key, {make_replace("id", "someone-else")}),
            protected_field_violation);
        REQUIRE(store.load_document(key) == patched);
    }
}
