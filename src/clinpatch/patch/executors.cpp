#include <clinpatch/patch/executors.hpp>

#include <algorithm>

#include <clinpatch/core/logging.hpp>
#include <clinpatch/core/utilities.hpp>
#include <clinpatch/patch/binder.hpp>
#include <clinpatch/patch/errors.hpp>
#include <clinpatch/patch/normalizer.hpp>
#include <clinpatch/patch/path.hpp>

namespace clinpatch {

static void
log_no_op(patch_operation_kind kind, string const& path)
{
    get_logger()->debug(
        "{} {}: nothing at target", lexical_cast<string>(kind), path);
}

static void
check_list_index(
    string const& label, integer index, size_t upper_bound, bool inclusive)
{
    if (index < 0
        || (inclusive ? size_t(index) > upper_bound
                      : size_t(index) >= upper_bound))
    {
        CLINPATCH_THROW(
            index_out_of_bounds() << index_label_info(label)
                                  << index_value_info(index)
                                  << index_upper_bound_info(upper_bound));
    }
}

// Check that a resolved location names a whole list, as insert and move
// require.
static void
check_list_target(
    location const& target, patch_operation_kind kind, string const& path)
{
    if (!target.field.repeating || target.index)
    {
        CLINPATCH_THROW(
            invalid_operation() << operation_kind_info(kind)
                                << patch_path_info(path)
                                << field_name_info(target.field.name));
    }
}

void
apply_add(
    element& document,
    schema_provider_interface const& schema,
    string const& path,
    string const& name,
    value_payload const& value)
{
    auto target = resolve_location(
        document, schema, path, patch_operation_kind::ADD, name);
    auto& parent = *target.parent;
    auto const& field = target.field;

    if (!field.repeating && count_field_items(parent, field.name) != 0)
    {
        CLINPATCH_THROW(
            invalid_operation() << operation_kind_info(patch_operation_kind::ADD)
                                << patch_path_info(path)
                                << field_name_info(field.name));
    }

    auto bound = bind_value(schema, value, field.declared_type);
    touch_field_items(parent, field.name).push_back(std::move(bound));
}

void
apply_insert(
    element& document,
    schema_provider_interface const& schema,
    string const& path,
    value_payload const& value,
    integer index)
{
    auto target = resolve_location(
        document, schema, path, patch_operation_kind::INSERT);
    check_list_target(target, patch_operation_kind::INSERT, path);
    auto& parent = *target.parent;
    auto const& field = target.field;

    check_list_index(
        "index", index, count_field_items(parent, field.name), true);

    auto bound = bind_value(schema, value, field.declared_type);
    auto& items = touch_field_items(parent, field.name);
    items.insert(items.begin() + index, std::move(bound));
}

// Get the type that a replacement value should be bound as, given the
// element it replaces.
static string
get_replacement_type(
    location const& target, element const& existing, value_payload const& value)
{
    // A choice value without a hint keeps its current type.
    if (target.field.choice && !value.type_hint)
        return existing.type;
    return target.field.declared_type;
}

void
apply_replace(
    element& document,
    schema_provider_interface const& schema,
    string const& path,
    value_payload const& value)
{
    auto target = resolve_location(
        document, schema, path, patch_operation_kind::REPLACE);
    if (!target.parent)
    {
        log_no_op(patch_operation_kind::REPLACE, path);
        return;
    }
    auto* field = find_element_field(*target.parent, target.field.name);
    if (!field)
    {
        log_no_op(patch_operation_kind::REPLACE, path);
        return;
    }

    auto& items = field->items;
    size_t index;
    if (target.index)
    {
        if (size_t(*target.index) >= items.size())
        {
            log_no_op(patch_operation_kind::REPLACE, path);
            return;
        }
        index = size_t(*target.index);
    }
    else
    {
        if (items.size() > 1)
        {
            CLINPATCH_THROW(
                ambiguous_path()
                << operation_kind_info(patch_operation_kind::REPLACE)
                << patch_path_info(path)
                << candidate_count_info(items.size()));
        }
        index = 0;
    }

    items[index] = bind_value(
        schema, value, get_replacement_type(target, items[index], value));
}

void
apply_delete(
    element& document,
    schema_provider_interface const& schema,
    string const& path)
{
    auto target = resolve_location(
        document, schema, path, patch_operation_kind::DELETE);
    if (!target.parent)
    {
        log_no_op(patch_operation_kind::DELETE, path);
        return;
    }
    auto& parent = *target.parent;
    auto const& name = target.field.name;
    auto* field = find_element_field(parent, name);
    if (!field)
    {
        log_no_op(patch_operation_kind::DELETE, path);
        return;
    }

    auto& items = field->items;
    if (target.index)
    {
        if (size_t(*target.index) >= items.size())
        {
            log_no_op(patch_operation_kind::DELETE, path);
            return;
        }
        items.erase(items.begin() + *target.index);
        prune_field(parent, name);
    }
    else
    {
        if (items.size() > 1)
        {
            CLINPATCH_THROW(
                ambiguous_path()
                << operation_kind_info(patch_operation_kind::DELETE)
                << patch_path_info(path)
                << candidate_count_info(items.size()));
        }
        clear_field(parent, name);
    }
}

void
apply_move(
    element& document,
    schema_provider_interface const& schema,
    string const& path,
    integer source,
    integer destination)
{
    auto target = resolve_location(
        document, schema, path, patch_operation_kind::MOVE);
    check_list_target(target, patch_operation_kind::MOVE, path);
    auto& parent = *target.parent;
    auto const& name = target.field.name;

    auto length = count_field_items(parent, name);
    check_list_index("source", source, length, false);
    check_list_index("destination", destination, length, false);

    auto& items = touch_field_items(parent, name);
    auto moved = std::move(items[size_t(source)]);
    items.erase(items.begin() + source);
    items.insert(
        items.begin() + std::max(integer(0), destination - 1),
        std::move(moved));
}

void
apply_operation(
    element& document,
    schema_provider_interface const& schema,
    pending_operation const& op)
{
    check_pending_operation(op);
    switch (op.kind)
    {
        case patch_operation_kind::ADD:
            apply_add(document, schema, op.path, *op.name, *op.value);
            break;
        case patch_operation_kind::INSERT:
            apply_insert(document, schema, op.path, *op.value, *op.index);
            break;
        case patch_operation_kind::REPLACE:
            apply_replace(document, schema, op.path, *op.value);
            break;
        case patch_operation_kind::DELETE:
            apply_delete(document, schema, op.path);
            break;
        case patch_operation_kind::MOVE:
            apply_move(
                document, schema, op.path, *op.source, *op.destination);
            break;
        default:
            CLINPATCH_THROW(
                invalid_enum_value() << enum_id_info("patch_operation_kind")
                                     << enum_value_info(int(op.kind)));
    }
}

} // namespace clinpatch
