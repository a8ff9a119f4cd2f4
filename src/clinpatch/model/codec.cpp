#include <clinpatch/model/codec.hpp>

#include <clinpatch/core/utilities.hpp>

namespace clinpatch {

static char const* const resource_type_key = "resourceType";

[[noreturn]] static void
throw_format_error(string const& problem)
{
    CLINPATCH_THROW(document_format_error() << document_problem_info(problem));
}

struct resolved_json_field
{
    field_info info;
    // the type that items in the JSON value should be read as
    string item_type;
};

// Work out which schema field a JSON key refers to.
static resolved_json_field
resolve_json_field(
    schema_provider_interface const& schema,
    schema_type const& parent,
    string const& key)
{
    // A key naming a field directly must name a field with a concrete type.
    // (Choice fields always carry a type suffix.)
    for (auto const& field : parent.fields)
    {
        if (field.name == key)
        {
            auto info = schema.get_field_info(parent.name, field.name);
            if (info->choice)
            {
                throw_format_error(
                    "choice field without a type suffix: " + key);
            }
            return resolved_json_field{*info, info->declared_type};
        }
    }

    // Otherwise, look for a choice field that the key extends.
    auto match = match_choice_key(schema, parent, key);
    if (match)
    {
        auto const& abstract
            = get_schema_type(schema, match->field.declared_type);
        auto const& suffix = match->type_suffix;
        // Composite types are capitalized, primitives aren't.
        for (auto const& candidate : {suffix, uncapitalize(suffix)})
        {
            auto const* concrete = schema.find_type(candidate);
            if (concrete && is_allowed_choice(abstract, *concrete))
                return resolved_json_field{match->field, concrete->name};
        }
        throw_format_error("invalid choice type: " + key);
    }

    throw_format_error("unknown field: " + key);
}

static void
read_fields(
    schema_provider_interface const& schema,
    schema_type const& type,
    element& e,
    dynamic_map const& json,
    bool is_root)
{
    for (auto const& entry : json)
    {
        auto const& key = cast<string>(entry.first);
        if (is_root && key == resource_type_key)
            continue;
        try
        {
            auto field = resolve_json_field(schema, type, key);
            std::vector<element> items;
            if (field.info.repeating)
            {
                integer index = 0;
                for (auto const& item : cast<dynamic_array>(entry.second))
                {
                    try
                    {
                        items.push_back(
                            read_element(schema, field.item_type, item));
                    }
                    catch (boost::exception& ex)
                    {
                        add_dynamic_path_element(ex, index);
                        throw;
                    }
                    ++index;
                }
            }
            else
            {
                items.push_back(
                    read_element(schema, field.item_type, entry.second));
            }
            if (find_element_field(e, field.info.name))
                throw_format_error("field given more than once: " + key);
            set_field_items(e, field.info.name, std::move(items));
        }
        catch (boost::exception& ex)
        {
            add_dynamic_path_element(ex, key);
            throw;
        }
    }
}

static dynamic
read_primitive_value(schema_type const& type, dynamic const& json)
{
    // Integers are acceptable wherever decimals are expected.
    if (type.value_kind == value_type::FLOAT
        && json.type() == value_type::INTEGER)
    {
        return dynamic(double(cast<integer>(json)));
    }
    check_type(type.value_kind, json.type());
    return json;
}

element
read_element(
    schema_provider_interface const& schema,
    string const& type_name,
    dynamic const& json)
{
    auto const& type = get_schema_type(schema, type_name);
    switch (type.kind)
    {
        case schema_type_kind::PRIMITIVE:
            return make_primitive_element(
                type.name, read_primitive_value(type, json));
        case schema_type_kind::COMPOSITE: {
            auto e = make_composite_element(type.name);
            read_fields(schema, type, e, cast<dynamic_map>(json), false);
            return e;
        }
        case schema_type_kind::ABSTRACT:
        default:
            throw_format_error("value of abstract type: " + type_name);
    }
}

element
read_document(schema_provider_interface const& schema, dynamic const& json)
{
    auto const& map = cast<dynamic_map>(json);
    dynamic const* resource_type;
    if (!get_field(&resource_type, map, resource_type_key))
        throw_format_error("missing resourceType");
    auto const& type = get_schema_type(schema, cast<string>(*resource_type));
    if (type.kind != schema_type_kind::COMPOSITE)
        throw_format_error("resourceType isn't a composite type");
    auto root = make_composite_element(type.name);
    read_fields(schema, type, root, map, true);
    return root;
}

static dynamic_map
write_fields(schema_provider_interface const& schema, element const& e)
{
    dynamic_map map;
    for (auto const& field : e.fields)
    {
        if (field.items.empty())
            continue;
        auto info = schema.get_field_info(e.type, field.name);
        if (!info)
        {
            CLINPATCH_THROW(
                document_format_error()
                << schema_type_name_info(e.type)
                << document_problem_info("unknown field: " + field.name));
        }
        auto key = field.name;
        if (info->choice)
            key += capitalize(field.items.front().type);
        if (info->repeating)
        {
            dynamic_array items;
            for (auto const& item : field.items)
                items.push_back(write_element(schema, item));
            map[dynamic(key)] = dynamic(std::move(items));
        }
        else
        {
            map[dynamic(key)] = write_element(schema, field.items.front());
        }
    }
    return map;
}

dynamic
write_element(schema_provider_interface const& schema, element const& e)
{
    if (get_schema_type(schema, e.type).kind == schema_type_kind::PRIMITIVE)
        return e.value;
    return dynamic(write_fields(schema, e));
}

dynamic
write_document(schema_provider_interface const& schema, element const& root)
{
    auto map = write_fields(schema, root);
    map[dynamic(resource_type_key)] = dynamic(root.type);
    return dynamic(std::move(map));
}

} // namespace clinpatch
