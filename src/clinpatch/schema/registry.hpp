#ifndef CLINPATCH_SCHEMA_REGISTRY_HPP
#define CLINPATCH_SCHEMA_REGISTRY_HPP

#include <map>

#include <clinpatch/schema/types.hpp>

namespace clinpatch {

// schema_registry is an in-memory schema provider. Types are registered
// individually or loaded in bulk from a schema description (see below).
struct schema_registry : schema_provider_interface
{
    // Add a type to the registry, replacing any existing type with the same
    // name.
    void
    add_type(schema_type type);

    // Check that every type referenced by a field or a choice list is
    // registered and that choices only name concrete types.
    // Throws invalid_schema if a problem is found.
    void
    validate() const;

    size_t
    type_count() const
    {
        return types_.size();
    }

    schema_type const*
    find_type(string const& name) const override;

    // Field names are matched case-insensitively. An exact match wins over a
    // case-insensitive one.
    optional<field_info>
    get_field_info(
        string const& parent_type, string const& field_name) const override;

 private:
    std::map<string, schema_type> types_;
};

// Load a registry from a schema description, which has this form (shown in
// YAML):
//
//   types:
//     code: { primitive: string }
//     boolean: { primitive: boolean }
//     DataType: { abstract: [string, code, boolean] }
//     HumanName:
//       fields:
//         - { name: family, type: string }
//         - { name: given, type: string, repeating: true }
//
// Primitive value kinds are 'string', 'boolean', 'integer' and 'float'.
// An empty abstract list allows any concrete type. The loaded registry is
// validated before it's returned.
schema_registry
load_schema(dynamic const& description);

// Same as above, but parses the description from YAML text first.
schema_registry
load_schema_from_yaml(string const& yaml);

} // namespace clinpatch

#endif
