#include <clinpatch/patch/path.hpp>

#include <cctype>

#include <clinpatch/core/utilities.hpp>
#include <clinpatch/patch/errors.hpp>

namespace clinpatch {

bool
operator==(path_segment const& a, path_segment const& b)
{
    return a.name == b.name && a.index == b.index;
}

[[noreturn]] static void
throw_path_syntax_error(string const& path, string const& problem)
{
    CLINPATCH_THROW(
        validation_error() << expected_format_info("path expression")
                           << parsed_text_info(path)
                           << parsing_error_info(problem));
}

static bool
is_name_start(char c)
{
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
}

static bool
is_name_char(char c)
{
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

static bool
is_digit(char c)
{
    return std::isdigit(static_cast<unsigned char>(c));
}

std::vector<path_segment>
parse_path_expression(string const& path)
{
    std::vector<path_segment> segments;
    size_t i = 0, n = path.length();
    while (true)
    {
        if (i == n || !is_name_start(path[i]))
            throw_path_syntax_error(path, "expected a field name");
        path_segment segment;
        size_t start = i;
        while (i != n && is_name_char(path[i]))
            ++i;
        segment.name = path.substr(start, i - start);

        if (i != n && path[i] == '[')
        {
            ++i;
            size_t digits_start = i;
            while (i != n && is_digit(path[i]))
                ++i;
            if (i == digits_start || i == n || path[i] != ']')
                throw_path_syntax_error(path, "expected a list index");
            integer index;
            if (!boost::conversion::try_lexical_convert(
                    path.substr(digits_start, i - digits_start), index))
            {
                throw_path_syntax_error(path, "list index is too large");
            }
            segment.index = index;
            ++i;
        }

        segments.push_back(std::move(segment));

        if (i == n)
            break;
        if (path[i] != '.')
            throw_path_syntax_error(path, "expected '.'");
        ++i;
    }
    return segments;
}

optional<field_info>
find_path_field(
    schema_provider_interface const& schema,
    string const& parent_type,
    string const& name)
{
    auto wrapper = schema.get_field_info(parent_type, name + "Element");
    if (wrapper)
        return wrapper;
    return schema.get_field_info(parent_type, name);
}

static field_info
get_path_field(
    schema_provider_interface const& schema,
    string const& parent_type,
    path_segment const& segment)
{
    auto info = find_path_field(schema, parent_type, segment.name);
    if (!info)
    {
        CLINPATCH_THROW(
            path_not_found() << schema_type_name_info(parent_type)
                             << path_segment_info(segment.name));
    }
    if (segment.index && !info->repeating)
    {
        CLINPATCH_THROW(
            type_mismatch() << schema_type_name_info(parent_type)
                            << path_segment_info(segment.name)
                            << index_value_info(*segment.index));
    }
    return *info;
}

// Drop a leading segment that names the root itself.
static void
strip_root_segment(
    std::vector<path_segment>& segments,
    schema_provider_interface const& schema,
    element const& root)
{
    if (segments.empty() || segments.front().index)
        return;
    auto const& first = segments.front().name;
    if ((first == "Resource" || iequals(first, root.type))
        && !find_path_field(schema, root.type, first))
    {
        segments.erase(segments.begin());
    }
}

// Select the item that a segment refers to within the items of a field.
// The result is null if there's no such item.
static element*
select_item(
    std::vector<element>& items,
    path_segment const& segment,
    patch_operation_kind kind)
{
    if (segment.index)
    {
        auto index = *segment.index;
        return index < integer(items.size()) ? &items[size_t(index)] : nullptr;
    }
    switch (items.size())
    {
        case 0:
            return nullptr;
        case 1:
            return &items.front();
        default:
            CLINPATCH_THROW(
                ambiguous_path() << path_segment_info(segment.name)
                                 << candidate_count_info(items.size())
                                 << operation_kind_info(kind));
    }
}

// Follow the declared types of the segments in [begin, end) without any data,
// starting from the field described by :start. The result is the info for the last
// segment.
static field_info
check_detached_segments(
    schema_provider_interface const& schema,
    field_info const& start,
    std::vector<path_segment> const& segments,
    size_t begin,
    size_t end)
{
    field_info info = start;
    for (size_t i = begin; i != end; ++i)
    {
        // Only composite types have fields to descend into.
        if (!info.composite)
        {
            CLINPATCH_THROW(
                path_not_found() << schema_type_name_info(info.declared_type)
                                 << path_segment_info(segments[i].name));
        }
        info = get_path_field(schema, info.declared_type, segments[i]);
    }
    return info;
}

static bool
requires_existing_parent(patch_operation_kind kind)
{
    return kind != patch_operation_kind::REPLACE
           && kind != patch_operation_kind::DELETE;
}

location
resolve_location(
    element& root,
    schema_provider_interface const& schema,
    string const& path,
    patch_operation_kind kind,
    optional<string> const& add_field_name)
{
    auto segments = parse_path_expression(path);
    strip_root_segment(segments, schema, root);

    bool const is_add = kind == patch_operation_kind::ADD;
    if (!is_add && segments.empty())
    {
        CLINPATCH_THROW(
            invalid_operation() << patch_path_info(path)
                                << operation_kind_info(kind));
    }

    // For ADD, every segment leads to the parent; otherwise, the last segment
    // names the target field.
    size_t const parent_depth = is_add ? segments.size() : segments.size() - 1;

    location target;
    element* current = &root;
    for (size_t i = 0; i != parent_depth; ++i)
    {
        auto const& segment = segments[i];
        auto info = get_path_field(schema, current->type, segment);
        auto* field = find_element_field(*current, info.name);
        element* next = nullptr;
        if (field)
            next = select_item(field->items, segment, kind);
        if (!next)
        {
            if (requires_existing_parent(kind))
            {
                CLINPATCH_THROW(
                    path_not_found() << patch_path_info(path)
                                     << path_segment_info(segment.name));
            }
            // Keep checking the rest of the path against the schema.
            target.parent = nullptr;
            target.field = check_detached_segments(
                schema, info, segments, i + 1, segments.size());
            target.index = segments.back().index;
            return target;
        }
        current = next;
    }

    target.parent = current;
    if (is_add)
    {
        auto info = add_field_name ? find_path_field(
                        schema, current->type, *add_field_name)
                                   : none;
        if (!info)
        {
            CLINPATCH_THROW(
                path_not_found()
                << patch_path_info(path)
                << schema_type_name_info(current->type)
                << field_name_info(add_field_name ? *add_field_name : ""));
        }
        target.field = *info;
    }
    else
    {
        target.field = get_path_field(schema, current->type, segments.back());
        target.index = segments.back().index;
    }
    return target;
}

optional<dynamic>
evaluate_scalar_path(
    element const& root,
    schema_provider_interface const& schema,
    string const& path)
{
    auto segments = parse_path_expression(path);
    strip_root_segment(segments, schema, root);

    element const* current = &root;
    for (auto const& segment : segments)
    {
        auto info = find_path_field(schema, current->type, segment.name);
        if (!info)
            return none;
        auto const& items = get_field_items(*current, info->name);
        size_t index = segment.index ? size_t(*segment.index) : 0;
        if (index >= items.size())
            return none;
        current = &items[index];
    }
    if (current->value.type() == value_type::NIL)
        return none;
    return current->value;
}

} // namespace clinpatch
