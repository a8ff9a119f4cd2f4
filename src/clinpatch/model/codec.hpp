#ifndef CLINPATCH_MODEL_CODEC_HPP
#define CLINPATCH_MODEL_CODEC_HPP

#include <clinpatch/model/element.hpp>
#include <clinpatch/schema/types.hpp>

namespace clinpatch {

// DOCUMENT CODEC - conversion between the JSON form of a document (as a
// dynamic value) and its typed element tree.
//
// The JSON form follows the usual conventions for clinical resources:
// - The root object names its type in 'resourceType'.
// - Repeating fields are arrays; singular fields are plain values.
// - A choice field is written as the field name followed by the
//   (capitalized) name of the concrete type, e.g., 'valueCode' or
//   'valueHumanName'.

// Read a document. Throws document_format_error if the value doesn't match
// the schema (or dynamic_type_mismatch if a value has the wrong JSON shape).
// Either way, the error carries dynamic_value_path_info locating the problem.
element
read_document(schema_provider_interface const& schema, dynamic const& json);

// Read a single (non-root) element of the given type.
element
read_element(
    schema_provider_interface const& schema,
    string const& type,
    dynamic const& json);

// Write a document (whose root type names the resource type).
dynamic
write_document(schema_provider_interface const& schema, element const& root);

// Write a single element without a 'resourceType' tag.
dynamic
write_element(schema_provider_interface const& schema, element const& e);

CLINPATCH_DEFINE_EXCEPTION(document_format_error)
CLINPATCH_DEFINE_ERROR_INFO(string, document_problem)

} // namespace clinpatch

#endif
