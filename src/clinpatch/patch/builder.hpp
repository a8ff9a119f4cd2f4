#ifndef CLINPATCH_PATCH_BUILDER_HPP
#define CLINPATCH_PATCH_BUILDER_HPP

#include <vector>

#include <clinpatch/model/element.hpp>
#include <clinpatch/patch/types.hpp>
#include <clinpatch/schema/types.hpp>

namespace clinpatch {

// patch_builder collects the operations of a patch and then applies them, in
// order, to a document.
//
// The document is mutated in place. If apply() throws, the document may have
// been partially patched and should be discarded.
struct patch_builder
{
    patch_builder(element& document, schema_provider_interface const& schema);

    // Queue an operation. Throws validation_error if it lacks a field that
    // its kind requires.
    patch_builder&
    add(pending_operation op);

    patch_builder&
    add(string path, string name, value_payload value);

    patch_builder&
    insert(string path, value_payload value, integer index);

    patch_builder&
    replace(string path, value_payload value);

    patch_builder&
    remove(string path);

    patch_builder&
    move(string path, integer source, integer destination);

    // Normalize and queue a list of raw operations.
    patch_builder&
    build(std::vector<raw_operation> const& raw);

    std::vector<pending_operation> const&
    operations() const
    {
        return operations_;
    }

    // Apply the queued operations and check that no protected field changed.
    // Errors from an operation carry its position, kind and path.
    element&
    apply();

 private:
    element& document_;
    schema_provider_interface const& schema_;
    std::vector<pending_operation> operations_;
};

// Normalize :raw and apply it to :document.
element&
normalize_and_apply(
    element& document,
    schema_provider_interface const& schema,
    std::vector<raw_operation> const& raw);

// Apply operations that have already been normalized.
element&
apply_built(
    element& document,
    schema_provider_interface const& schema,
    std::vector<pending_operation> const& operations);

} // namespace clinpatch

#endif
