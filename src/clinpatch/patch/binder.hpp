#ifndef CLINPATCH_PATCH_BINDER_HPP
#define CLINPATCH_PATCH_BINDER_HPP

#include <clinpatch/model/element.hpp>
#include <clinpatch/patch/types.hpp>
#include <clinpatch/schema/types.hpp>

namespace clinpatch {

// Bind a loosely-typed payload to a schema type, producing a new element of
// that type.
//
// If :target_type is abstract (i.e., the target is a choice field), the
// concrete type is taken from the payload's type hint.
//
// Throws unbound_value if the payload can't be reconciled with the type.
element
bind_value(
    schema_provider_interface const& schema,
    value_payload const& payload,
    string const& target_type);

// Work out the concrete type that a payload should be bound as when it's
// assigned to a field of the abstract type :abstract.
string
resolve_choice_type(
    schema_provider_interface const& schema,
    schema_type const& abstract,
    value_payload const& payload);

} // namespace clinpatch

#endif
