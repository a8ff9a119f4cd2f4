#include <clinpatch/core/utilities.hpp>

#include <cctype>

namespace clinpatch {

static char
lower_ascii(char c)
{
    return char(std::tolower(static_cast<unsigned char>(c)));
}

bool
iequals(string const& a, string const& b)
{
    if (a.length() != b.length())
        return false;
    for (size_t i = 0; i != a.length(); ++i)
    {
        if (lower_ascii(a[i]) != lower_ascii(b[i]))
            return false;
    }
    return true;
}

string
capitalize(string s)
{
    if (!s.empty())
        s[0] = char(std::toupper(static_cast<unsigned char>(s[0])));
    return s;
}

string
uncapitalize(string s)
{
    if (!s.empty())
        s[0] = lower_ascii(s[0]);
    return s;
}

} // namespace clinpatch
