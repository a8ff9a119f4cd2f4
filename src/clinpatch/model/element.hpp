#ifndef CLINPATCH_MODEL_ELEMENT_HPP
#define CLINPATCH_MODEL_ELEMENT_HPP

#include <ostream>
#include <vector>

#include <clinpatch/core/dynamic.hpp>

namespace clinpatch {

// ELEMENTS - the typed document tree that patches operate on.
//
// Every element carries its concrete type. For elements that sit in a choice
// field, this differs from the type the schema declares for the field (e.g.,
// an Extension.value declared as DataType holding a 'code').
//
// A primitive element holds a scalar value. A composite element holds a list
// of populated fields, each of which holds an ordered list of items. Singular
// fields hold exactly one item. A field with no items is never stored; an
// absent field is simply missing from the list.

struct element;

struct element_field
{
    string name;
    std::vector<element> items;
};

struct element
{
    // the concrete type of this element
    string type;
    // the scalar value of a primitive element (nil for composites)
    dynamic value;
    // the populated fields of a composite element, in the order they were
    // first set
    std::vector<element_field> fields;
};

element
make_primitive_element(string type, dynamic value);

element
make_composite_element(string type);

// Find a populated field of :parent by its exact name.
// The result is null if the field isn't populated.
element_field*
find_element_field(element& parent, string const& name);
element_field const*
find_element_field(element const& parent, string const& name);

// Get the items in the named field of :parent.
// If the field isn't populated, this is an empty list.
std::vector<element> const&
get_field_items(element const& parent, string const& name);

// Get the number of items in the named field of :parent.
size_t
count_field_items(element const& parent, string const& name);

// Get a mutable reference to the item list of the named field of :parent,
// creating the field (with no items) if necessary.
// Callers that might leave the field empty should call prune_field()
// afterwards.
std::vector<element>&
touch_field_items(element& parent, string const& name);

// Replace the contents of the named field with :items.
// If :items is empty, the field is removed.
void
set_field_items(element& parent, string const& name, std::vector<element> items);

// Remove the named field entirely.
void
clear_field(element& parent, string const& name);

// If the named field has no items, remove it.
void
prune_field(element& parent, string const& name);

// Get the single item in the named field of :parent, or null if there isn't
// exactly one.
element const*
get_single_item(element const& parent, string const& name);

// Convert an element to a schema-free dynamic value for diagnostics.
// Primitives become { type, value } and composites become { type, fields }.
dynamic
to_diagnostic_dynamic(element const& e);

bool
operator==(element const& a, element const& b);
bool
operator!=(element const& a, element const& b);

std::ostream&
operator<<(std::ostream& s, element const& e);

} // namespace clinpatch

#endif
