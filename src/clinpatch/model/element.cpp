#include <clinpatch/model/element.hpp>

#include <algorithm>

#include <clinpatch/encodings/yaml.hpp>

namespace clinpatch {

element
make_primitive_element(string type, dynamic value)
{
    element e;
    e.type = std::move(type);
    e.value = std::move(value);
    return e;
}

element
make_composite_element(string type)
{
    element e;
    e.type = std::move(type);
    return e;
}

element_field*
find_element_field(element& parent, string const& name)
{
    for (auto& field : parent.fields)
    {
        if (field.name == name)
            return &field;
    }
    return nullptr;
}

element_field const*
find_element_field(element const& parent, string const& name)
{
    for (auto const& field : parent.fields)
    {
        if (field.name == name)
            return &field;
    }
    return nullptr;
}

std::vector<element> const&
get_field_items(element const& parent, string const& name)
{
    static std::vector<element> const no_items;
    auto const* field = find_element_field(parent, name);
    return field ? field->items : no_items;
}

size_t
count_field_items(element const& parent, string const& name)
{
    auto const* field = find_element_field(parent, name);
    return field ? field->items.size() : 0;
}

std::vector<element>&
touch_field_items(element& parent, string const& name)
{
    auto* field = find_element_field(parent, name);
    if (field)
        return field->items;
    parent.fields.push_back(element_field{name, {}});
    return parent.fields.back().items;
}

void
set_field_items(element& parent, string const& name, std::vector<element> items)
{
    if (items.empty())
    {
        clear_field(parent, name);
        return;
    }
    touch_field_items(parent, name) = std::move(items);
}

void
clear_field(element& parent, string const& name)
{
    parent.fields.erase(
        std::remove_if(
            parent.fields.begin(),
            parent.fields.end(),
            [&](element_field const& field) { return field.name == name; }),
        parent.fields.end());
}

void
prune_field(element& parent, string const& name)
{
    auto const* field = find_element_field(parent, name);
    if (field && field->items.empty())
        clear_field(parent, name);
}

element const*
get_single_item(element const& parent, string const& name)
{
    auto const& items = get_field_items(parent, name);
    return items.size() == 1 ? &items.front() : nullptr;
}

dynamic
to_diagnostic_dynamic(element const& e)
{
    dynamic_map map;
    map[dynamic("type")] = dynamic(e.type);
    if (e.value.type() != value_type::NIL)
        map[dynamic("value")] = e.value;
    if (!e.fields.empty())
    {
        dynamic_map fields;
        for (auto const& field : e.fields)
        {
            dynamic_array items;
            for (auto const& item : field.items)
                items.push_back(to_diagnostic_dynamic(item));
            fields[dynamic(field.name)] = dynamic(std::move(items));
        }
        map[dynamic("fields")] = dynamic(std::move(fields));
    }
    return dynamic(std::move(map));
}

// Fields are compared by name, so the order in which they were set doesn't
// matter. Items within a field are compared in order.
bool
operator==(element const& a, element const& b)
{
    if (a.type != b.type || a.value != b.value
        || a.fields.size() != b.fields.size())
    {
        return false;
    }
    for (auto const& field : a.fields)
    {
        auto const* other = find_element_field(b, field.name);
        if (!other || other->items != field.items)
            return false;
    }
    return true;
}

bool
operator!=(element const& a, element const& b)
{
    return !(a == b);
}

std::ostream&
operator<<(std::ostream& s, element const& e)
{
    s << value_to_diagnostic_yaml(to_diagnostic_dynamic(e));
    return s;
}

} // namespace clinpatch
