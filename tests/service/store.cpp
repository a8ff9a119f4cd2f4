#include <clinpatch/service/store.hpp>

#include <clinpatch/core/testing.hpp>
#include <clinpatch/core/utilities.hpp>
#include <clinpatch/patch/path.hpp>

#include <testing_schema.hpp>

using namespace clinpatch;

static optional<dynamic>
get_scalar(element const& document, string const& path)
{
    return evaluate_scalar_path(document, get_testing_schema(), path);
}

TEST_CASE("resource keys", "[service][store]")
{
    REQUIRE(
        lexical_cast<string>(resource_key{"Patient", "example", none})
        == "Patient/example");
    REQUIRE(
        lexical_cast<string>(
            resource_key{"Patient", "example", some(string("2"))})
        == "Patient/example/_history/2");
}

TEST_CASE("current instants", "[service][store]")
{
    auto instant = get_current_instant();
    // e.g., 2024-01-05T10:00:00.123456Z
    REQUIRE(instant.length() > 20);
    REQUIRE(instant[4] == '-');
    REQUIRE(instant[10] == 'T');
    REQUIRE(instant.back() == 'Z');
}

TEST_CASE("memory document store", "[service][store]")
{
    auto const& schema = get_testing_schema();
    memory_document_store store(schema);
    resource_key key{"Patient", "example", none};

    REQUIRE_THROWS_AS(store.load_document(key), resource_not_found);

    auto saved = store.save_document(make_testing_patient(), none);
    REQUIRE(get_document_version(schema, saved) == some(string("1")));
    auto stamp = get_scalar(saved, "meta.lastUpdated");
    REQUIRE(stamp);
    REQUIRE(*stamp != dynamic("2024-01-05T10:00:00Z"));
    REQUIRE(get_single_item(
                get_field_items(saved, "meta").at(0), "lastUpdated")
                ->type
            == "instant");

    auto loaded = store.load_document(key);
    REQUIRE(loaded == saved);

    {
        set_field_items(
            loaded,
            "gender",
            {make_primitive_element("code", dynamic("female"))});
        auto resaved = store.save_document(loaded, some(string("1")));
        REQUIRE(get_document_version(schema, resaved) == some(string("2")));
        REQUIRE(
            get_scalar(store.load_document(key), "gender")
            == some(dynamic("female")));
    }

    try
    {
        store.save_document(loaded, some(string("1")));
        FAIL("no exception thrown");
    }
    catch (concurrency_conflict& e)
    {
        REQUIRE(get_required_error_info<expected_version_info>(e) == "1");
        REQUIRE(get_required_error_info<current_version_info>(e) == "2");
    }
    REQUIRE(
        get_document_version(schema, store.load_document(key))
        == some(string("2")));

    // A token for a document that doesn't exist yet can't match.
    auto other = parse_testing_document(
        R"({ "resourceType": "Patient", "id": "other" })");
    REQUIRE_THROWS_AS(
        store.save_document(other, some(string("1"))), concurrency_conflict);
    REQUIRE_THROWS_AS(
        store.load_document(resource_key{"Patient", "other", none}),
        resource_not_found);

    // Documents without meta get one.
    saved = store.save_document(other, none);
    REQUIRE(get_document_version(schema, saved) == some(string("1")));
    REQUIRE(get_scalar(saved, "meta.lastUpdated"));

    REQUIRE_THROWS_AS(
        store.save_document(
            parse_testing_document(R"({ "resourceType": "Patient" })"), none),
        missing_resource_id);
}
