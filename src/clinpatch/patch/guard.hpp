#ifndef CLINPATCH_PATCH_GUARD_HPP
#define CLINPATCH_PATCH_GUARD_HPP

#include <utility>
#include <vector>

#include <clinpatch/model/element.hpp>
#include <clinpatch/schema/types.hpp>

namespace clinpatch {

// IMMUTABILITY GUARD - Some fields of a resource are maintained by the server
// and may never be changed by a patch.

// the paths of the protected fields, in the order they're checked
std::vector<string> const&
get_protected_paths();

// the serialized value of each protected path (none if absent)
typedef std::vector<std::pair<string, optional<string>>> protected_snapshot;

protected_snapshot
take_protected_snapshot(
    element const& document, schema_provider_interface const& schema);

// Check that none of the protected fields of :document differ from
// :original. Throws protected_field_violation for the first one that does.
void
check_protected_fields_unchanged(
    element const& document,
    schema_provider_interface const& schema,
    protected_snapshot const& original);

} // namespace clinpatch

#endif
