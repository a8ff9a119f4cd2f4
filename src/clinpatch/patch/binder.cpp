#include <clinpatch/patch/binder.hpp>

#include <algorithm>
#include <sstream>

#include <clinpatch/core/utilities.hpp>
#include <clinpatch/patch/errors.hpp>
#include <clinpatch/patch/path.hpp>

namespace clinpatch {

[[noreturn]] static void
throw_unbound(
    string const& target_type,
    value_payload const& payload,
    string const& problem)
{
    auto e = unbound_value() << target_type_info(target_type)
                             << binding_problem_info(problem);
    if (payload.type_hint)
        e << payload_type_hint_info(*payload.type_hint);
    CLINPATCH_THROW(e);
}

string
resolve_choice_type(
    schema_provider_interface const& schema,
    schema_type const& abstract,
    value_payload const& payload)
{
    if (!payload.type_hint)
    {
        throw_unbound(
            abstract.name, payload, "choice value without a type hint");
    }
    auto const& hint = *payload.type_hint;
    // Hints may arrive capitalized (as in 'valueCode').
    for (auto const& candidate : {hint, uncapitalize(hint), capitalize(hint)})
    {
        auto const* concrete = schema.find_type(candidate);
        if (!concrete)
            continue;
        if (!is_allowed_choice(abstract, *concrete))
        {
            throw_unbound(
                abstract.name,
                payload,
                "type not allowed for choice: " + concrete->name);
        }
        return concrete->name;
    }
    throw_unbound(abstract.name, payload, "unknown type hint: " + hint);
}

static element
bind_primitive(schema_type const& type, value_payload const& payload)
{
    if (payload.kind != value_payload_kind::PRIMITIVE)
        throw_unbound(type.name, payload, "composite value for primitive type");

    auto const& scalar = payload.scalar;
    if (type.value_kind == value_type::FLOAT
        && scalar.type() == value_type::INTEGER)
    {
        return make_primitive_element(
            type.name, dynamic(double(cast<integer>(scalar))));
    }
    if (scalar.type() != type.value_kind)
    {
        std::ostringstream problem;
        problem << "expected " << type.value_kind << " value, got "
                << scalar.type();
        throw_unbound(type.name, payload, problem.str());
    }
    return make_primitive_element(type.name, scalar);
}

// A group of payload parts that are bound to the same field.
struct part_group
{
    field_info field;
    std::vector<value_payload> values;
};

// Find the field that a part names. A part may name a choice field with the
// concrete type appended ('valueCode'), in which case the type becomes the
// value's hint.
static field_info
resolve_part_field(
    schema_provider_interface const& schema,
    schema_type const& type,
    payload_part const& part,
    value_payload& value)
{
    auto info = find_path_field(schema, type.name, part.name);
    if (info)
        return *info;
    auto match = match_choice_key(schema, type, part.name);
    if (match)
    {
        if (!value.type_hint)
            value.type_hint = match->type_suffix;
        return match->field;
    }
    CLINPATCH_THROW(
        unbound_value() << target_type_info(type.name)
                        << field_name_info(part.name)
                        << binding_problem_info("no such field: " + part.name));
}

static std::vector<part_group>
group_parts(
    schema_provider_interface const& schema,
    schema_type const& type,
    std::vector<payload_part> const& parts)
{
    std::vector<part_group> groups;
    for (auto const& part : parts)
    {
        auto value = part.value;
        auto field = resolve_part_field(schema, type, part, value);
        auto group = std::find_if(
            groups.begin(), groups.end(), [&](part_group const& g) {
                return g.field.name == field.name;
            });
        if (group == groups.end())
        {
            groups.push_back(part_group{field, {}});
            group = groups.end() - 1;
        }
        group->values.push_back(std::move(value));
    }
    return groups;
}

static element
bind_composite(
    schema_provider_interface const& schema,
    schema_type const& type,
    value_payload const& payload)
{
    if (payload.kind != value_payload_kind::COMPOSITE)
        throw_unbound(type.name, payload, "primitive value for composite type");

    auto result = make_composite_element(type.name);
    for (auto const& group : group_parts(schema, type, payload.parts))
    {
        auto const& info = group.field;
        if (!info.repeating && group.values.size() != 1)
        {
            CLINPATCH_THROW(
                unbound_value()
                << target_type_info(type.name) << field_name_info(info.name)
                << binding_problem_info(
                       "multiple values for singular field: " + info.name));
        }
        std::vector<element> staged;
        staged.reserve(group.values.size());
        for (auto const& value : group.values)
            staged.push_back(bind_value(schema, value, info.declared_type));
        set_field_items(result, info.name, std::move(staged));
    }
    return result;
}

element
bind_value(
    schema_provider_interface const& schema,
    value_payload const& payload,
    string const& target_type)
{
    auto const* type = schema.find_type(target_type);
    if (!type)
        throw_unbound(target_type, payload, "unknown type: " + target_type);

    switch (type->kind)
    {
        case schema_type_kind::PRIMITIVE:
            return bind_primitive(*type, payload);
        case schema_type_kind::COMPOSITE:
            return bind_composite(schema, *type, payload);
        case schema_type_kind::ABSTRACT:
            return bind_value(
                schema, payload, resolve_choice_type(schema, *type, payload));
        default:
            CLINPATCH_THROW(
                invalid_enum_value() << enum_id_info("schema_type_kind")
                                     << enum_value_info(int(type->kind)));
    }
}

} // namespace clinpatch
