#include <clinpatch/schema/types.hpp>

#include <algorithm>

#include <clinpatch/core/utilities.hpp>

namespace clinpatch {

std::ostream&
operator<<(std::ostream& s, schema_type_kind kind)
{
    switch (kind)
    {
        case schema_type_kind::PRIMITIVE:
            s << "primitive";
            break;
        case schema_type_kind::COMPOSITE:
            s << "composite";
            break;
        case schema_type_kind::ABSTRACT:
            s << "abstract";
            break;
        default:
            CLINPATCH_THROW(
                invalid_enum_value() << enum_id_info("schema_type_kind")
                                     << enum_value_info(int(kind)));
    }
    return s;
}

schema_type const&
get_schema_type(schema_provider_interface const& schema, string const& name)
{
    auto const* type = schema.find_type(name);
    if (!type)
    {
        CLINPATCH_THROW(unknown_schema_type() << schema_type_name_info(name));
    }
    return *type;
}

bool
is_allowed_choice(schema_type const& abstract, schema_type const& concrete)
{
    if (concrete.kind == schema_type_kind::ABSTRACT)
        return false;
    return abstract.choices.empty()
           || std::find(
                  abstract.choices.begin(),
                  abstract.choices.end(),
                  concrete.name)
                  != abstract.choices.end();
}

optional<choice_key_match>
match_choice_key(
    schema_provider_interface const& schema,
    schema_type const& parent,
    string const& key)
{
    for (auto const& field : parent.fields)
    {
        if (key.length() <= field.name.length()
            || key.compare(0, field.name.length(), field.name) != 0)
        {
            continue;
        }
        auto info = schema.get_field_info(parent.name, field.name);
        if (info && info->choice)
            return choice_key_match{*info, key.substr(field.name.length())};
    }
    return none;
}

} // namespace clinpatch
