#ifndef CLINPATCH_CORE_UTILITIES_HPP
#define CLINPATCH_CORE_UTILITIES_HPP

#include <clinpatch/core/exception.hpp>

#include <boost/lexical_cast.hpp>

namespace clinpatch {

using boost::lexical_cast;

// invalid_enum_value is thrown when an enum's raw (integer) value is invalid.
CLINPATCH_DEFINE_EXCEPTION(invalid_enum_value)
CLINPATCH_DEFINE_ERROR_INFO(string, enum_id)
CLINPATCH_DEFINE_ERROR_INFO(int, enum_value)

// invalid_enum_string is thrown when attempting to convert a string value to
// an enum and the string doesn't match any of the enum's cases.
CLINPATCH_DEFINE_EXCEPTION(invalid_enum_string)
// Note that this also uses the enum_id info declared above.
CLINPATCH_DEFINE_ERROR_INFO(string, enum_string)

// If a simple parsing operation fails, this exception can be thrown.
CLINPATCH_DEFINE_EXCEPTION(parsing_error)
CLINPATCH_DEFINE_ERROR_INFO(string, expected_format)
CLINPATCH_DEFINE_ERROR_INFO(string, parsed_text)
CLINPATCH_DEFINE_ERROR_INFO(string, parsing_error)

// If an error occurs internally within library that provides its own
// error messages, this is used to convey that message.
CLINPATCH_DEFINE_ERROR_INFO(string, internal_error_message)

// Compare two strings without regard to ASCII case.
bool
iequals(string const& a, string const& b);

// Convert the first character of :s to upper (or lower) case.
string
capitalize(string s);
string
uncapitalize(string s);

} // namespace clinpatch

#endif
