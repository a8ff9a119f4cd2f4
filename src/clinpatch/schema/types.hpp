#ifndef CLINPATCH_SCHEMA_TYPES_HPP
#define CLINPATCH_SCHEMA_TYPES_HPP

#include <vector>

#include <clinpatch/core/dynamic.hpp>

namespace clinpatch {

// SCHEMA TYPES - The description of a document's structure. The engine never
// hardcodes field names or cardinalities; it asks a schema provider.

enum class schema_type_kind
{
    // a scalar type (string, code, boolean, ...)
    PRIMITIVE,
    // a type with named fields (HumanName, Patient, ...)
    COMPOSITE,
    // a placeholder type for choice fields (e.g., Extension.value) that must
    // be substituted by a concrete type
    ABSTRACT
};

std::ostream&
operator<<(std::ostream& s, schema_type_kind kind);

struct schema_field
{
    string name;
    // the name of the field's declared type
    string type;
    // Can the field hold more than one item?
    bool repeating = false;
};

struct schema_type
{
    string name;

    schema_type_kind kind = schema_type_kind::COMPOSITE;

    // for primitives, the kind of scalar that values of this type hold
    value_type value_kind = value_type::STRING;

    // for composites, the declared fields (in document order)
    std::vector<schema_field> fields;

    // for abstract types, the concrete types that may stand in for it
    // (If this is empty, any concrete type is allowed.)
    std::vector<string> choices;
};

// field_info is what the schema provider reports about a field of a type.
struct field_info
{
    // the field's name as declared by the schema
    string name;
    // the declared type of the field
    string declared_type;
    // Is the field repeating (a list) rather than singular?
    bool repeating = false;
    // Is the declared type composite?
    bool composite = false;
    // Is the declared type abstract (i.e., is this a choice field)?
    bool choice = false;
};

// The schema provider is an external collaborator as far as the patch engine
// is concerned. This is the interface through which it's consulted.
struct schema_provider_interface
{
    virtual ~schema_provider_interface() {}

    // Look up a type by name.
    // The result is null if the schema doesn't define the type.
    virtual schema_type const*
    find_type(string const& name) const = 0;

    // Look up a field of :parent_type.
    // Field names are matched without regard to case.
    // The result is none if the type doesn't declare such a field.
    virtual optional<field_info>
    get_field_info(string const& parent_type, string const& field_name) const
        = 0;
};

// Get a type from a schema, throwing unknown_schema_type if it's not there.
schema_type const&
get_schema_type(schema_provider_interface const& schema, string const& name);

// Can :concrete stand in for the abstract type :abstract?
bool
is_allowed_choice(schema_type const& abstract, schema_type const& concrete);

// In JSON, a choice field is keyed by its name plus the concrete type
// ('valueCode', 'valueHumanName').
struct choice_key_match
{
    field_info field;
    // the part of the key after the field name, as written ('Code')
    string type_suffix;
};

// Find the choice field of :parent that :key extends.
// The result is none if :key doesn't extend any choice field.
optional<choice_key_match>
match_choice_key(
    schema_provider_interface const& schema,
    schema_type const& parent,
    string const& key);

CLINPATCH_DEFINE_EXCEPTION(unknown_schema_type)
CLINPATCH_DEFINE_ERROR_INFO(string, schema_type_name)

// If a schema description is inconsistent (e.g., a field refers to a type that
// isn't defined), this is thrown when the schema is loaded.
CLINPATCH_DEFINE_EXCEPTION(invalid_schema)
CLINPATCH_DEFINE_ERROR_INFO(string, schema_problem)

} // namespace clinpatch

#endif
