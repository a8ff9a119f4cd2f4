#include <clinpatch/schema/registry.hpp>

#include <clinpatch/core/utilities.hpp>
#include <clinpatch/encodings/yaml.hpp>

namespace clinpatch {

void
schema_registry::add_type(schema_type type)
{
    auto name = type.name;
    types_[name] = std::move(type);
}

static void
check_type_reference(
    std::map<string, schema_type> const& types,
    string const& referrer,
    string const& referenced)
{
    if (types.find(referenced) == types.end())
    {
        CLINPATCH_THROW(
            invalid_schema()
            << schema_type_name_info(referrer)
            << schema_problem_info("undefined type: " + referenced));
    }
}

void
schema_registry::validate() const
{
    for (auto const& entry : types_)
    {
        auto const& type = entry.second;
        for (auto const& field : type.fields)
        {
            check_type_reference(types_, type.name, field.type);
        }
        for (auto const& choice : type.choices)
        {
            check_type_reference(types_, type.name, choice);
            if (types_.at(choice).kind == schema_type_kind::ABSTRACT)
            {
                CLINPATCH_THROW(
                    invalid_schema()
                    << schema_type_name_info(type.name)
                    << schema_problem_info("abstract choice: " + choice));
            }
        }
    }
}

schema_type const*
schema_registry::find_type(string const& name) const
{
    auto i = types_.find(name);
    return i != types_.end() ? &i->second : nullptr;
}

static field_info
make_field_info(
    std::map<string, schema_type> const& types, schema_field const& field)
{
    field_info info;
    info.name = field.name;
    info.declared_type = field.type;
    info.repeating = field.repeating;
    auto type = types.find(field.type);
    if (type != types.end())
    {
        info.composite = type->second.kind == schema_type_kind::COMPOSITE;
        info.choice = type->second.kind == schema_type_kind::ABSTRACT;
    }
    return info;
}

optional<field_info>
schema_registry::get_field_info(
    string const& parent_type, string const& field_name) const
{
    auto parent = find_type(parent_type);
    if (!parent)
        return none;
    schema_field const* match = nullptr;
    for (auto const& field : parent->fields)
    {
        if (field.name == field_name)
            return make_field_info(types_, field);
        if (!match && iequals(field.name, field_name))
            match = &field;
    }
    if (match)
        return make_field_info(types_, *match);
    return none;
}

// LOADING

static value_type
parse_primitive_value_kind(string const& kind)
{
    if (kind == "string")
        return value_type::STRING;
    if (kind == "boolean")
        return value_type::BOOLEAN;
    if (kind == "integer")
        return value_type::INTEGER;
    if (kind == "float")
        return value_type::FLOAT;
    CLINPATCH_THROW(
        invalid_enum_string() << enum_id_info("primitive value kind")
                              << enum_string_info(kind));
}

static schema_field
read_schema_field(dynamic const& description)
{
    auto const& map = cast<dynamic_map>(description);
    schema_field field;
    field.name = cast<string>(get_field(map, "name"));
    field.type = cast<string>(get_field(map, "type"));
    dynamic const* repeating;
    if (get_field(&repeating, map, "repeating"))
        field.repeating = cast<bool>(*repeating);
    return field;
}

static schema_type
read_schema_type(string const& name, dynamic const& description)
{
    schema_type type;
    type.name = name;

    // A type with no description at all is an empty composite.
    if (description.type() == value_type::NIL)
        return type;

    auto const& map = cast<dynamic_map>(description);
    dynamic const* entry;
    if (get_field(&entry, map, "primitive"))
    {
        type.kind = schema_type_kind::PRIMITIVE;
        type.value_kind = parse_primitive_value_kind(cast<string>(*entry));
    }
    else if (get_field(&entry, map, "abstract"))
    {
        type.kind = schema_type_kind::ABSTRACT;
        if (entry->type() != value_type::NIL)
        {
            for (auto const& choice : cast<dynamic_array>(*entry))
                type.choices.push_back(cast<string>(choice));
        }
    }
    else
    {
        type.kind = schema_type_kind::COMPOSITE;
        if (get_field(&entry, map, "fields"))
        {
            integer index = 0;
            for (auto const& field : cast<dynamic_array>(*entry))
            {
                try
                {
                    type.fields.push_back(read_schema_field(field));
                }
                catch (boost::exception& e)
                {
                    add_dynamic_path_element(e, index);
                    add_dynamic_path_element(e, "fields");
                    throw;
                }
                ++index;
            }
        }
    }
    return type;
}

schema_registry
load_schema(dynamic const& description)
{
    schema_registry registry;
    auto const& types
        = cast<dynamic_map>(get_field(cast<dynamic_map>(description), "types"));
    for (auto const& entry : types)
    {
        auto const& name = cast<string>(entry.first);
        try
        {
            registry.add_type(read_schema_type(name, entry.second));
        }
        catch (boost::exception& e)
        {
            add_dynamic_path_element(e, name);
            add_dynamic_path_element(e, "types");
            throw;
        }
    }
    registry.validate();
    return registry;
}

schema_registry
load_schema_from_yaml(string const& yaml)
{
    return load_schema(parse_yaml_value(yaml));
}

} // namespace clinpatch
