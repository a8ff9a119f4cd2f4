#ifndef CLINPATCH_PATCH_TYPES_HPP
#define CLINPATCH_PATCH_TYPES_HPP

#include <ostream>
#include <vector>

#include <clinpatch/core/dynamic.hpp>

namespace clinpatch {

enum class patch_operation_kind
{
    // add a field to an element (appending if the field repeats)
    ADD,
    // insert an item into a list at a given index
    INSERT,
    // replace an existing element
    REPLACE,
    // delete an element (or a whole field)
    DELETE,
    // move an item within a list
    MOVE
};

std::ostream&
operator<<(std::ostream& s, patch_operation_kind kind);

// Get the kind named by a wire-level string ('add', 'insert', ...).
// Returns none if the string isn't a known kind.
optional<patch_operation_kind>
parse_patch_operation_kind(string const& s);

// VALUE PAYLOADS - the loosely-typed value supplied with an operation, before
// it's bound to a schema type.

enum class value_payload_kind
{
    PRIMITIVE,
    COMPOSITE
};

struct payload_part;

struct value_payload
{
    value_payload_kind kind = value_payload_kind::PRIMITIVE;

    // the declared subtype of the value (e.g., 'code' or 'HumanName'), if the
    // sender supplied one
    optional<string> type_hint;

    // the scalar value of a primitive payload
    dynamic scalar;

    // the named parts of a composite payload, in the order they were given
    std::vector<payload_part> parts;
};

struct payload_part
{
    string name;
    value_payload value;
};

value_payload
make_primitive_payload(dynamic scalar, optional<string> type_hint = none);

value_payload
make_composite_payload(
    std::vector<payload_part> parts, optional<string> type_hint = none);

bool
operator==(value_payload const& a, value_payload const& b);
bool
operator!=(value_payload const& a, value_payload const& b);
bool
operator==(payload_part const& a, payload_part const& b);
bool
operator!=(payload_part const& a, payload_part const& b);

std::ostream&
operator<<(std::ostream& s, value_payload const& v);

// OPERATIONS

// raw_operation is an operation as it arrives on the wire. Nothing about it
// has been checked.
struct raw_operation
{
    optional<string> kind;
    optional<string> path;
    optional<string> name;
    optional<value_payload> value;
    optional<integer> index;
    optional<integer> source;
    optional<integer> destination;
};

// pending_operation is a normalized operation, ready to be applied.
// The fields that are required for its kind are guaranteed to be present:
// - ADD: name, value
// - INSERT: value, index
// - REPLACE: value
// - MOVE: source, destination
struct pending_operation
{
    patch_operation_kind kind = patch_operation_kind::ADD;
    string path;
    optional<string> name;
    optional<value_payload> value;
    optional<integer> index;
    optional<integer> source;
    optional<integer> destination;
};

pending_operation
make_add_operation(string path, string name, value_payload value);

pending_operation
make_insert_operation(string path, value_payload value, integer index);

pending_operation
make_replace_operation(string path, value_payload value);

pending_operation
make_delete_operation(string path);

pending_operation
make_move_operation(string path, integer source, integer destination);

std::ostream&
operator<<(std::ostream& s, pending_operation const& op);

} // namespace clinpatch

#endif
