#ifndef CLINPATCH_PATCH_NORMALIZER_HPP
#define CLINPATCH_PATCH_NORMALIZER_HPP

#include <vector>

#include <clinpatch/core/dynamic.hpp>
#include <clinpatch/patch/types.hpp>

namespace clinpatch {

// Check a raw operation and convert it to a pending one.
// Throws validation_error if the kind is missing or unknown, or if a field
// that the kind requires is missing. Index ranges are checked against the
// target list when the operation is applied.
pending_operation
normalize_operation(raw_operation const& raw);

// Normalize a whole list of operations. If any of them is invalid, the
// resulting validation_error carries its position (operation_index_info).
std::vector<pending_operation>
normalize_operations(std::vector<raw_operation> const& raw);

// Check that a pending operation has all the fields that its kind requires.
// (Operations constructed directly don't pass through the normalizer.)
void
check_pending_operation(pending_operation const& op);

// Decode the operations in a FHIR Parameters resource (as parsed from
// JSON). Each parameter must be named 'operation' and its parts supply the
// fields of one raw operation.
//
// Throws validation_error if the structure isn't recognizable (or
// missing_field or dynamic_type_mismatch if the JSON itself is malformed).
// Errors carry dynamic_value_path_info locating the problem.
std::vector<raw_operation>
parse_patch_parameters(dynamic const& parameters);

} // namespace clinpatch

#endif
