#include <clinpatch/patch/normalizer.hpp>

#include <clinpatch/core/testing.hpp>
#include <clinpatch/encodings/json.hpp>
#include <clinpatch/patch/errors.hpp>

using namespace clinpatch;

static raw_operation
make_raw_operation(string const& kind, string const& path)
{
    raw_operation raw;
    raw.kind = kind;
    raw.path = path;
    return raw;
}

TEST_CASE("operation normalization", "[patch][normalizer]")
{
    auto add = make_raw_operation("add", "Patient");
    add.name = string("gender");
    add.value = make_primitive_payload(dynamic("male"));
    auto op = normalize_operation(add);
    REQUIRE(op.kind == patch_operation_kind::ADD);
    REQUIRE(op.path == "Patient");
    REQUIRE(op.name == some(string("gender")));
    REQUIRE(op.value == some(make_primitive_payload(dynamic("male"))));

    auto move = make_raw_operation("move", "telecom");
    move.source = integer(2);
    move.destination = integer(0);
    op = normalize_operation(move);
    REQUIRE(op.kind == patch_operation_kind::MOVE);
    REQUIRE(op.source == some(integer(2)));
    REQUIRE(op.destination == some(integer(0)));

    // Delete needs nothing but a path.
    op = normalize_operation(make_raw_operation("delete", "gender"));
    REQUIRE(op.kind == patch_operation_kind::DELETE);
}

TEST_CASE("invalid operations", "[patch][normalizer]")
{
    auto require_missing = [](raw_operation const& raw, string const& missing) {
        try
        {
            normalize_operation(raw);
            FAIL("no exception thrown");
        }
        catch (validation_error& e)
        {
            REQUIRE(get_required_error_info<missing_parameter_info>(e) == missing);
        }
    };

    require_missing(raw_operation(), "type");
    require_missing(make_raw_operation("add", ""), "path");
    {
        raw_operation raw;
        raw.kind = string("delete");
        require_missing(raw, "path");
    }
    require_missing(make_raw_operation("add", "Patient"), "name");
    {
        auto raw = make_raw_operation("add", "Patient");
        raw.name = string("gender");
        require_missing(raw, "value");
    }
    {
        auto raw = make_raw_operation("insert", "telecom");
        raw.index = integer(0);
        require_missing(raw, "value");
    }
    {
        auto raw = make_raw_operation("insert", "telecom");
        raw.value = make_primitive_payload(dynamic("x"));
        require_missing(raw, "index");
    }
    require_missing(make_raw_operation("replace", "gender"), "value");
    {
        auto raw = make_raw_operation("move", "telecom");
        raw.destination = integer(0);
        require_missing(raw, "source");
    }
    {
        auto raw = make_raw_operation("move", "telecom");
        raw.source = integer(0);
        require_missing(raw, "destination");
    }

    try
    {
        normalize_operation(make_raw_operation("copy", "gender"));
        FAIL("no exception thrown");
    }
    catch (validation_error& e)
    {
        REQUIRE(
            get_required_error_info<operation_problem_info>(e)
            == "unknown operation type: copy");
    }

    // Index ranges depend on the target list, so they aren't checked here.
    {
        auto raw = make_raw_operation("insert", "telecom");
        raw.value = make_primitive_payload(dynamic("x"));
        raw.index = integer(-1);
        REQUIRE(normalize_operation(raw).index == some(integer(-1)));
    }
    {
        auto raw = make_raw_operation("move", "telecom");
        raw.source = integer(0);
        raw.destination = integer(-2);
        REQUIRE(normalize_operation(raw).destination == some(integer(-2)));
    }

    // Errors are located within the list.
    try
    {
        normalize_operations(
            {make_raw_operation("delete", "gender"),
             make_raw_operation("delete", "active"),
             make_raw_operation("replace", "active")});
        FAIL("no exception thrown");
    }
    catch (validation_error& e)
    {
        REQUIRE(get_required_error_info<operation_index_info>(e) == size_t(2));
    }
}

TEST_CASE("pending operation checks", "[patch][normalizer]")
{
    check_pending_operation(make_delete_operation("gender"));
    check_pending_operation(make_move_operation("telecom", 0, 1));

    auto op = make_insert_operation(
        "telecom", make_primitive_payload(dynamic("x")), 0);
    op.index = none;
    REQUIRE_THROWS_AS(check_pending_operation(op), validation_error);

    op = make_add_operation(
        "Patient", "gender", make_primitive_payload(dynamic("male")));
    op.name = none;
    REQUIRE_THROWS_AS(check_pending_operation(op), validation_error);
}

TEST_CASE("Parameters decoding", "[patch][normalizer]")
{
    auto ops = parse_patch_parameters(parse_json_value(R"(
        {
            "resourceType": "Parameters",
            "parameter": [
                {
                    "name": "operation",
                    "part": [
                        { "name": "type", "valueCode": "add" },
                        { "name": "path", "valueString": "Patient" },
                        { "name": "name", "valueString": "gender" },
                        { "name": "value", "valueCode": "male" }
                    ]
                },
                {
                    "name": "operation",
                    "part": [
                        { "name": "type", "valueCode": "insert" },
                        { "name": "path", "valueString": "Patient.identifier" },
                        { "name": "index", "valueInteger": 0 },
                        {
                            "name": "value",
                            "valueIdentifier": {
                                "system": "http://example.org/mrn",
                                "value": "12345"
                            }
                        }
                    ]
                },
                {
                    "name": "operation",
                    "part": [
                        { "name": "type", "valueCode": "add" },
                        { "name": "path", "valueString": "Patient" },
                        { "name": "name", "valueString": "extension" },
                        {
                            "name": "value",
                            "part": [
                                { "name": "url", "valueUri": "http://example.org/a" },
                                { "name": "value", "valueBoolean": true }
                            ]
                        }
                    ]
                },
                {
                    "name": "operation",
                    "part": [
                        { "name": "type", "valueCode": "move" },
                        { "name": "path", "valueString": "Patient.telecom" },
                        { "name": "source", "valueInteger": 2 },
                        { "name": "destination", "valueInteger": 0 }
                    ]
                }
            ]
        }
    )"));
    REQUIRE(ops.size() == 4);

    REQUIRE(ops[0].kind == some(string("add")));
    REQUIRE(ops[0].path == some(string("Patient")));
    REQUIRE(ops[0].name == some(string("gender")));
    REQUIRE(
        ops[0].value
        == some(make_primitive_payload(dynamic("male"), some(string("code")))));

    REQUIRE(ops[1].index == some(integer(0)));
    REQUIRE(ops[1].value);
    REQUIRE(ops[1].value->kind == value_payload_kind::COMPOSITE);
    REQUIRE(ops[1].value->type_hint == some(string("Identifier")));
    REQUIRE(ops[1].value->parts.size() == 2);

    REQUIRE(
        ops[2].value
        == some(make_composite_payload(
            {payload_part{
                 "url",
                 make_primitive_payload(
                     dynamic("http://example.org/a"), some(string("uri")))},
             payload_part{
                 "value",
                 make_primitive_payload(
                     dynamic(true), some(string("boolean")))}})));

    REQUIRE(ops[3].source == some(integer(2)));
    REQUIRE(ops[3].destination == some(integer(0)));

    auto normalized = normalize_operations(ops);
    REQUIRE(normalized[3].kind == patch_operation_kind::MOVE);
}

TEST_CASE("JSON values in Parameters", "[patch][normalizer]")
{
    // Repeating fields inside a JSON object become repeated parts.
    auto ops = parse_patch_parameters(parse_json_value(R"(
        {
            "parameter": [
                {
                    "name": "operation",
                    "part": [
                        { "name": "value", "valueHumanName": { "given": ["A", "B"] } }
                    ]
                }
            ]
        }
    )"));
    REQUIRE(ops.size() == 1);
    REQUIRE(!ops[0].kind);
    REQUIRE(
        ops[0].value
        == some(make_composite_payload(
            {payload_part{"given", make_primitive_payload(dynamic("A"))},
             payload_part{"given", make_primitive_payload(dynamic("B"))}},
            some(string("HumanName")))));

    // A plain 'value' carries no hint.
    ops = parse_patch_parameters(parse_json_value(R"(
        {
            "parameter": [
                { "name": "operation", "part": [ { "name": "value", "value": 1 } ] }
            ]
        }
    )"));
    REQUIRE(ops[0].value == some(make_primitive_payload(dynamic(integer(1)))));

    REQUIRE(
        parse_patch_parameters(
            parse_json_value(R"({ "resourceType": "Parameters" })"))
            .empty());
}

TEST_CASE("malformed Parameters", "[patch][normalizer]")
{
    auto parse = [](char const* json) {
        return parse_patch_parameters(parse_json_value(json));
    };

    REQUIRE_THROWS_AS(
        parse(R"({ "resourceType": "Patient", "parameter": [] })"),
        validation_error);
    REQUIRE_THROWS_AS(
        parse(R"({ "parameter": [ { "name": "patch", "part": [] } ] })"),
        validation_error);
    REQUIRE_THROWS_AS(
        parse(R"({ "parameter": [ { "name": "operation" } ] })"),
        validation_error);
    REQUIRE_THROWS_AS(
        parse(R"({ "parameter": [ { "part": [] } ] })"), missing_field);
    REQUIRE_THROWS_AS(
        parse(R"({ "parameter": {} })"), dynamic_type_mismatch);

    try
    {
        parse(R"(
            {
                "parameter": [
                    { "name": "operation", "part": [] },
                    {
                        "name": "operation",
                        "part": [
                            { "name": "type", "valueCode": "delete" },
                            { "name": "index", "valueString": "one" }
                        ]
                    }
                ]
            }
        )");
        FAIL("no exception thrown");
    }
    catch (validation_error& e)
    {
        REQUIRE(
            get_required_error_info<dynamic_value_path_info>(e)
            == std::list<dynamic>(
                {dynamic("parameter"),
                 dynamic(integer(1)),
                 dynamic("part"),
                 dynamic(integer(1))}));
    }

    // unknown part names
    REQUIRE_THROWS_AS(
        parse(R"(
            {
                "parameter": [
                    {
                        "name": "operation",
                        "part": [ { "name": "from", "valueInteger": 1 } ]
                    }
                ]
            }
        )"),
        validation_error);

    // parts without values
    REQUIRE_THROWS_AS(
        parse(R"(
            {
                "parameter": [
                    { "name": "operation", "part": [ { "name": "path" } ] }
                ]
            }
        )"),
        validation_error);

    // arrays as values
    REQUIRE_THROWS_AS(
        parse(R"(
            {
                "parameter": [
                    {
                        "name": "operation",
                        "part": [ { "name": "value", "valueString": ["a"] } ]
                    }
                ]
            }
        )"),
        validation_error);
}
