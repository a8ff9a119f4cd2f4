#include <clinpatch/patch/normalizer.hpp>

#include <clinpatch/core/utilities.hpp>
#include <clinpatch/patch/errors.hpp>

namespace clinpatch {

[[noreturn]] static void
throw_missing_parameter(patch_operation_kind kind, char const* parameter)
{
    CLINPATCH_THROW(
        validation_error() << operation_kind_info(kind)
                           << missing_parameter_info(parameter));
}

void
check_pending_operation(pending_operation const& op)
{
    switch (op.kind)
    {
        case patch_operation_kind::ADD:
            if (!op.name)
                throw_missing_parameter(op.kind, "name");
            if (!op.value)
                throw_missing_parameter(op.kind, "value");
            break;
        case patch_operation_kind::INSERT:
            if (!op.value)
                throw_missing_parameter(op.kind, "value");
            if (!op.index)
                throw_missing_parameter(op.kind, "index");
            break;
        case patch_operation_kind::REPLACE:
            if (!op.value)
                throw_missing_parameter(op.kind, "value");
            break;
        case patch_operation_kind::DELETE:
            break;
        case patch_operation_kind::MOVE:
            if (!op.source)
                throw_missing_parameter(op.kind, "source");
            if (!op.destination)
                throw_missing_parameter(op.kind, "destination");
            break;
        default:
            CLINPATCH_THROW(
                invalid_enum_value() << enum_id_info("patch_operation_kind")
                                     << enum_value_info(int(op.kind)));
    }
}

pending_operation
normalize_operation(raw_operation const& raw)
{
    if (!raw.kind)
    {
        CLINPATCH_THROW(
            validation_error() << missing_parameter_info("type"));
    }
    auto kind = parse_patch_operation_kind(*raw.kind);
    if (!kind)
    {
        CLINPATCH_THROW(
            validation_error()
            << operation_problem_info("unknown operation type: " + *raw.kind));
    }
    if (!raw.path || raw.path->empty())
        throw_missing_parameter(*kind, "path");

    pending_operation op;
    op.kind = *kind;
    op.path = *raw.path;
    op.name = raw.name;
    op.value = raw.value;
    op.index = raw.index;
    op.source = raw.source;
    op.destination = raw.destination;
    check_pending_operation(op);
    return op;
}

std::vector<pending_operation>
normalize_operations(std::vector<raw_operation> const& raw)
{
    std::vector<pending_operation> ops;
    ops.reserve(raw.size());
    for (size_t i = 0; i != raw.size(); ++i)
    {
        try
        {
            ops.push_back(normalize_operation(raw[i]));
        }
        catch (boost::exception& e)
        {
            e << operation_index_info(i);
            throw;
        }
    }
    return ops;
}

// PARAMETERS DECODING

static string const value_prefix = "value";

[[noreturn]] static void
throw_parameters_error(string const& problem)
{
    CLINPATCH_THROW(validation_error() << operation_problem_info(problem));
}

static value_payload
json_to_payload(dynamic const& json, optional<string> type_hint);

// Convert the fields of a JSON object to payload parts. Arrays produce one
// part per item. Typed keys ('valueCode') are kept as written and resolved
// against the schema when the value is bound.
static std::vector<payload_part>
json_object_to_parts(dynamic_map const& object)
{
    std::vector<payload_part> parts;
    for (auto const& field : object)
    {
        auto const& name = cast<string>(field.first);
        if (field.second.type() == value_type::ARRAY)
        {
            for (auto const& item : cast<dynamic_array>(field.second))
                parts.push_back(payload_part{name, json_to_payload(item, none)});
        }
        else
        {
            parts.push_back(
                payload_part{name, json_to_payload(field.second, none)});
        }
    }
    return parts;
}

static value_payload
json_to_payload(dynamic const& json, optional<string> type_hint)
{
    switch (json.type())
    {
        case value_type::MAP:
            return make_composite_payload(
                json_object_to_parts(cast<dynamic_map>(json)),
                std::move(type_hint));
        case value_type::ARRAY:
            throw_parameters_error("unexpected array in value");
        default:
            return make_primitive_payload(json, std::move(type_hint));
    }
}

static std::vector<payload_part>
decode_parts(dynamic const& parts);

// Decode the value carried by a parameter (or part). This is either a
// 'value<Type>' field or a nested 'part' list. The result is none if
// there's neither.
static optional<value_payload>
decode_carried_value(dynamic_map const& parameter)
{
    for (auto const& field : parameter)
    {
        auto const& key = cast<string>(field.first);
        if (key.compare(0, value_prefix.length(), value_prefix) != 0)
            continue;
        try
        {
            if (key.length() == value_prefix.length())
                return json_to_payload(field.second, none);
            auto type = key.substr(value_prefix.length());
            // Composite types keep their capitalization; primitive type
            // names start with a lowercase letter.
            auto hint = field.second.type() == value_type::MAP
                            ? type
                            : uncapitalize(type);
            return json_to_payload(field.second, hint);
        }
        catch (boost::exception& e)
        {
            add_dynamic_path_element(e, field.first);
            throw;
        }
    }

    dynamic const* parts;
    if (get_field(&parts, parameter, "part"))
    {
        try
        {
            return make_composite_payload(decode_parts(*parts));
        }
        catch (boost::exception& e)
        {
            add_dynamic_path_element(e, dynamic("part"));
            throw;
        }
    }
    return none;
}

static std::vector<payload_part>
decode_parts(dynamic const& parts)
{
    std::vector<payload_part> decoded;
    auto const& list = cast<dynamic_array>(parts);
    for (size_t i = 0; i != list.size(); ++i)
    {
        try
        {
            auto const& part = cast<dynamic_map>(list[i]);
            auto value = decode_carried_value(part);
            if (!value)
            {
                throw_parameters_error(
                    "part without a value: "
                    + cast<string>(get_field(part, "name")));
            }
            decoded.push_back(
                payload_part{cast<string>(get_field(part, "name")), *value});
        }
        catch (boost::exception& e)
        {
            add_dynamic_path_element(e, dynamic(integer(i)));
            throw;
        }
    }
    return decoded;
}

static string
get_string_part(value_payload const& value, string const& name)
{
    if (value.kind != value_payload_kind::PRIMITIVE
        || value.scalar.type() != value_type::STRING)
    {
        throw_parameters_error("expected a string for " + name);
    }
    return cast<string>(value.scalar);
}

static integer
get_integer_part(value_payload const& value, string const& name)
{
    if (value.kind != value_payload_kind::PRIMITIVE
        || value.scalar.type() != value_type::INTEGER)
    {
        throw_parameters_error("expected an integer for " + name);
    }
    return cast<integer>(value.scalar);
}

static raw_operation
decode_operation(dynamic_array const& parts)
{
    raw_operation op;
    for (size_t i = 0; i != parts.size(); ++i)
    {
        try
        {
            auto const& part = cast<dynamic_map>(parts[i]);
            auto name = cast<string>(get_field(part, "name"));
            auto value = decode_carried_value(part);
            if (!value)
                throw_parameters_error("part without a value: " + name);
            if (name == "type")
                op.kind = get_string_part(*value, name);
            else if (name == "path")
                op.path = get_string_part(*value, name);
            else if (name == "name")
                op.name = get_string_part(*value, name);
            else if (name == "value")
                op.value = *value;
            else if (name == "index")
                op.index = get_integer_part(*value, name);
            else if (name == "source")
                op.source = get_integer_part(*value, name);
            else if (name == "destination")
                op.destination = get_integer_part(*value, name);
            else
                throw_parameters_error("unknown operation part: " + name);
        }
        catch (boost::exception& e)
        {
            add_dynamic_path_element(e, dynamic(integer(i)));
            throw;
        }
    }
    return op;
}

std::vector<raw_operation>
parse_patch_parameters(dynamic const& parameters)
{
    auto const& map = cast<dynamic_map>(parameters);

    dynamic const* resource_type;
    if (get_field(&resource_type, map, "resourceType")
        && cast<string>(*resource_type) != "Parameters")
    {
        throw_parameters_error(
            "not a Parameters resource: " + cast<string>(*resource_type));
    }

    std::vector<raw_operation> ops;
    dynamic const* list;
    if (!get_field(&list, map, "parameter"))
        return ops;
    auto const& items = cast<dynamic_array>(*list);
    for (size_t i = 0; i != items.size(); ++i)
    {
        try
        {
            auto const& parameter = cast<dynamic_map>(items[i]);
            auto name = cast<string>(get_field(parameter, "name"));
            if (name != "operation")
                throw_parameters_error("unexpected parameter: " + name);
            dynamic const* parts;
            if (!get_field(&parts, parameter, "part"))
                throw_parameters_error("operation without parts");
            try
            {
                ops.push_back(decode_operation(cast<dynamic_array>(*parts)));
            }
            catch (boost::exception& e)
            {
                add_dynamic_path_element(e, dynamic("part"));
                throw;
            }
        }
        catch (boost::exception& e)
        {
            add_dynamic_path_element(e, dynamic(integer(i)));
            add_dynamic_path_element(e, dynamic("parameter"));
            throw;
        }
    }
    return ops;
}

} // namespace clinpatch
