#ifndef CLINPATCH_PATCH_ERRORS_HPP
#define CLINPATCH_PATCH_ERRORS_HPP

#include <clinpatch/core/exception.hpp>
#include <clinpatch/patch/types.hpp>

namespace clinpatch {

// All errors that are caused by the contents of a patch derive from
// invalid_patch, so they can be reported to the caller as one class of
// client error. (protected_field_violation is deliberately separate.)
CLINPATCH_DEFINE_EXCEPTION(invalid_patch)

// An operation is malformed (unknown kind, a field that its kind requires is
// missing, or a path that can't be parsed).
CLINPATCH_DEFINE_DERIVED_EXCEPTION(validation_error, invalid_patch)
CLINPATCH_DEFINE_ERROR_INFO(string, operation_problem)
CLINPATCH_DEFINE_ERROR_INFO(string, missing_parameter)

// A path names something that the schema doesn't declare, or an element that
// the operation needs doesn't exist.
CLINPATCH_DEFINE_DERIVED_EXCEPTION(path_not_found, invalid_patch)

// A path passes through a list with more than one item without saying which.
CLINPATCH_DEFINE_DERIVED_EXCEPTION(ambiguous_path, invalid_patch)
CLINPATCH_DEFINE_ERROR_INFO(size_t, candidate_count)

// An indexer was applied to a field that doesn't repeat.
CLINPATCH_DEFINE_DERIVED_EXCEPTION(type_mismatch, invalid_patch)

// The payload of an operation can't be bound to the type at its target.
CLINPATCH_DEFINE_DERIVED_EXCEPTION(unbound_value, invalid_patch)
CLINPATCH_DEFINE_ERROR_INFO(string, target_type)
CLINPATCH_DEFINE_ERROR_INFO(string, payload_type_hint)
CLINPATCH_DEFINE_ERROR_INFO(string, binding_problem)

// The operation doesn't make sense for its target (e.g., adding to a
// singular field that already has a value).
CLINPATCH_DEFINE_DERIVED_EXCEPTION(invalid_operation, invalid_patch)

// An insert or move index is outside the bounds of the target list.
CLINPATCH_DEFINE_DERIVED_EXCEPTION(index_out_of_bounds, invalid_patch)
CLINPATCH_DEFINE_ERROR_INFO(string, index_label)
CLINPATCH_DEFINE_ERROR_INFO(integer, index_value)
CLINPATCH_DEFINE_ERROR_INFO(size_t, index_upper_bound)

// The patch changed one of the protected fields.
CLINPATCH_DEFINE_EXCEPTION(protected_field_violation)
CLINPATCH_DEFINE_ERROR_INFO(string, protected_path)
CLINPATCH_DEFINE_ERROR_INFO(string, original_value)
CLINPATCH_DEFINE_ERROR_INFO(string, patched_value)

// context that's attached to errors as they pass through the orchestrator
CLINPATCH_DEFINE_ERROR_INFO(size_t, operation_index)
CLINPATCH_DEFINE_ERROR_INFO(patch_operation_kind, operation_kind)
CLINPATCH_DEFINE_ERROR_INFO(string, patch_path)
CLINPATCH_DEFINE_ERROR_INFO(string, path_segment)

} // namespace clinpatch

#endif
