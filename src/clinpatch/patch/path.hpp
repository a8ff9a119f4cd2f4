#ifndef CLINPATCH_PATCH_PATH_HPP
#define CLINPATCH_PATCH_PATH_HPP

#include <vector>

#include <clinpatch/model/element.hpp>
#include <clinpatch/patch/types.hpp>
#include <clinpatch/schema/types.hpp>

namespace clinpatch {

// PATH EXPRESSIONS
//
// A path is a dot-separated list of field names, each optionally followed by
// an indexer: 'name[0].given'. The first segment may name the document's
// resource type (or simply 'Resource'), in which case it refers to the root
// itself: 'Patient.name[0].given'.

struct path_segment
{
    string name;
    optional<integer> index;
};

bool
operator==(path_segment const& a, path_segment const& b);

// Parse a path expression into its segments.
// Throws validation_error if the expression is malformed.
std::vector<path_segment>
parse_path_expression(string const& path);

// LOCATIONS

// A location is a resolved target: a field of a parent element, optionally
// narrowed to one item in the field. It refers directly into the document,
// so it's only valid until the document is next modified.
struct location
{
    // the element holding the target field
    // This is null if some element along the path doesn't exist (which is
    // only allowed for replace and delete).
    element* parent = nullptr;

    // schema information about the target field
    field_info field;

    // the index of the targeted item within the field, if the path ends with
    // an indexer
    optional<integer> index;
};

// Resolve a path against a document.
//
// For ADD, :path names the element to add to and :add_field_name names the
// field; the resulting location is that field of that element. For all other
// kinds, :path names the target field (possibly with an indexer).
//
// Throws path_not_found if a segment names a field that the schema doesn't
// declare, or if an element along the path doesn't exist and :kind requires
// it to; ambiguous_path if the path passes through a list with more than one
// item without an indexer; and type_mismatch if an indexer is applied to a
// field that doesn't repeat. A malformed path is a validation_error.
location
resolve_location(
    element& root,
    schema_provider_interface const& schema,
    string const& path,
    patch_operation_kind kind,
    optional<string> const& add_field_name = none);

// Look up a field by the name used in a path. Names are matched without
// regard to case, and a '<name>Element' field (the wrapper form of a
// primitive field) is preferred over '<name>' when both exist.
optional<field_info>
find_path_field(
    schema_provider_interface const& schema,
    string const& parent_type,
    string const& name);

// Evaluate a path to the single scalar value it refers to, without changing
// the document. The result is none if nothing is there. (If the path
// refers to a list, its first item is used.)
optional<dynamic>
evaluate_scalar_path(
    element const& root,
    schema_provider_interface const& schema,
    string const& path);

} // namespace clinpatch

#endif
