#ifndef CLINPATCH_ENCODINGS_YAML_HPP
#define CLINPATCH_ENCODINGS_YAML_HPP

#include <clinpatch/core/type_definitions.hpp>

// YAML - conversion from YAML strings and diagnostic output

namespace clinpatch {

// Parse some YAML text into a dynamic value.
dynamic
parse_yaml_value(char const* yaml, size_t length);

// Same as above, but accepts a string.
dynamic
parse_yaml_value(string const& yaml);

// Write a value to a diagnostic string in YAML format.
// This won't necessarily capture the entire contents of the value. In
// particular, it will omit the contents of very large arrays and maps.
string
value_to_diagnostic_yaml(dynamic const& v);

} // namespace clinpatch

#endif
