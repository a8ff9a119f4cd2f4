#include <clinpatch/patch/types.hpp>

#include <clinpatch/core/utilities.hpp>

namespace clinpatch {

std::ostream&
operator<<(std::ostream& s, patch_operation_kind kind)
{
    switch (kind)
    {
        case patch_operation_kind::ADD:
            s << "add";
            break;
        case patch_operation_kind::INSERT:
            s << "insert";
            break;
        case patch_operation_kind::REPLACE:
            s << "replace";
            break;
        case patch_operation_kind::DELETE:
            s << "delete";
            break;
        case patch_operation_kind::MOVE:
            s << "move";
            break;
        default:
            CLINPATCH_THROW(
                invalid_enum_value() << enum_id_info("patch_operation_kind")
                                     << enum_value_info(int(kind)));
    }
    return s;
}

optional<patch_operation_kind>
parse_patch_operation_kind(string const& s)
{
    if (s == "add")
        return patch_operation_kind::ADD;
    if (s == "insert")
        return patch_operation_kind::INSERT;
    if (s == "replace")
        return patch_operation_kind::REPLACE;
    if (s == "delete")
        return patch_operation_kind::DELETE;
    if (s == "move")
        return patch_operation_kind::MOVE;
    return none;
}

value_payload
make_primitive_payload(dynamic scalar, optional<string> type_hint)
{
    value_payload payload;
    payload.kind = value_payload_kind::PRIMITIVE;
    payload.type_hint = std::move(type_hint);
    payload.scalar = std::move(scalar);
    return payload;
}

value_payload
make_composite_payload(
    std::vector<payload_part> parts, optional<string> type_hint)
{
    value_payload payload;
    payload.kind = value_payload_kind::COMPOSITE;
    payload.type_hint = std::move(type_hint);
    payload.parts = std::move(parts);
    return payload;
}

bool
operator==(value_payload const& a, value_payload const& b)
{
    return a.kind == b.kind && a.type_hint == b.type_hint
           && a.scalar == b.scalar && a.parts == b.parts;
}
bool
operator!=(value_payload const& a, value_payload const& b)
{
    return !(a == b);
}

bool
operator==(payload_part const& a, payload_part const& b)
{
    return a.name == b.name && a.value == b.value;
}
bool
operator!=(payload_part const& a, payload_part const& b)
{
    return !(a == b);
}

static dynamic
payload_to_diagnostic_dynamic(value_payload const& v)
{
    dynamic_map map;
    if (v.type_hint)
        map[dynamic("type")] = dynamic(*v.type_hint);
    if (v.kind == value_payload_kind::PRIMITIVE)
    {
        map[dynamic("value")] = v.scalar;
    }
    else
    {
        dynamic_array parts;
        for (auto const& part : v.parts)
        {
            parts.push_back(dynamic(dynamic_map{
                {dynamic(part.name),
                 payload_to_diagnostic_dynamic(part.value)}}));
        }
        map[dynamic("parts")] = dynamic(std::move(parts));
    }
    return dynamic(std::move(map));
}

std::ostream&
operator<<(std::ostream& s, value_payload const& v)
{
    s << payload_to_diagnostic_dynamic(v);
    return s;
}

pending_operation
make_add_operation(string path, string name, value_payload value)
{
    pending_operation op;
    op.kind = patch_operation_kind::ADD;
    op.path = std::move(path);
    op.name = std::move(name);
    op.value = std::move(value);
    return op;
}

pending_operation
make_insert_operation(string path, value_payload value, integer index)
{
    pending_operation op;
    op.kind = patch_operation_kind::INSERT;
    op.path = std::move(path);
    op.value = std::move(value);
    op.index = index;
    return op;
}

pending_operation
make_replace_operation(string path, value_payload value)
{
    pending_operation op;
    op.kind = patch_operation_kind::REPLACE;
    op.path = std::move(path);
    op.value = std::move(value);
    return op;
}

pending_operation
make_delete_operation(string path)
{
    pending_operation op;
    op.kind = patch_operation_kind::DELETE;
    op.path = std::move(path);
    return op;
}

pending_operation
make_move_operation(string path, integer source, integer destination)
{
    pending_operation op;
    op.kind = patch_operation_kind::MOVE;
    op.path = std::move(path);
    op.source = source;
    op.destination = destination;
    return op;
}

std::ostream&
operator<<(std::ostream& s, pending_operation const& op)
{
    s << op.kind << " " << op.path;
    if (op.name)
        s << " name=" << *op.name;
    if (op.index)
        s << " index=" << *op.index;
    if (op.source)
        s << " source=" << *op.source;
    if (op.destination)
        s << " destination=" << *op.destination;
    return s;
}

} // namespace clinpatch
