#ifndef CLINPATCH_ENCODINGS_JSON_HPP
#define CLINPATCH_ENCODINGS_JSON_HPP

#include <clinpatch/core/dynamic.hpp>

// JSON - conversion to and from JSON strings

namespace clinpatch {

// Parse some JSON text into a dynamic value.
dynamic
parse_json_value(char const* json, size_t length);

// Same as above, but accepts a string.
inline dynamic
parse_json_value(string const& json)
{
    return parse_json_value(json.c_str(), json.length());
}

// Write a value to a string in JSON format.
// If :indent is negative, the output is compact.
string
value_to_json(dynamic const& v, int indent = 4);

} // namespace clinpatch

#endif
