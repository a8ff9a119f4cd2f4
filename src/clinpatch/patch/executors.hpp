#ifndef CLINPATCH_PATCH_EXECUTORS_HPP
#define CLINPATCH_PATCH_EXECUTORS_HPP

#include <clinpatch/model/element.hpp>
#include <clinpatch/patch/types.hpp>
#include <clinpatch/schema/types.hpp>

namespace clinpatch {

// OPERATION EXECUTORS
//
// Each executor resolves its path against the live document, binds its value
// (if any) and mutates the document in place. When an executor throws, the
// document may already have been changed by earlier operations, but the
// failing operation itself leaves it untouched.

// Add a value to the field :name of the element at :path.
// If the field repeats, the value is appended. Otherwise, the field must be
// empty (or invalid_operation is thrown).
void
apply_add(
    element& document,
    schema_provider_interface const& schema,
    string const& path,
    string const& name,
    value_payload const& value);

// Insert a value into the list at :path, before the item at :index.
// :index must be in [0, length] (or index_out_of_bounds is thrown). The target
// must be a whole list, not an item in one (or invalid_operation is thrown).
void
apply_insert(
    element& document,
    schema_provider_interface const& schema,
    string const& path,
    value_payload const& value,
    integer index);

// Replace the element at :path with a value.
// If there's no element there, this does nothing.
void
apply_replace(
    element& document,
    schema_provider_interface const& schema,
    string const& path,
    value_payload const& value);

// Delete the element at :path. If the path names a whole singular field, the
// field is cleared. If there's nothing there, this does nothing.
void
apply_delete(
    element& document,
    schema_provider_interface const& schema,
    string const& path);

// Move an item within the list at :path.
// The item is removed from :source and then reinserted at
// max(0, destination - 1) in the shortened list. Both indices must be in
// [0, length).
void
apply_move(
    element& document,
    schema_provider_interface const& schema,
    string const& path,
    integer source,
    integer destination);

// Apply a normalized operation by dispatching to the executor for its kind.
// Throws validation_error if :op lacks a field that its kind requires.
void
apply_operation(
    element& document,
    schema_provider_interface const& schema,
    pending_operation const& op);

} // namespace clinpatch

#endif
