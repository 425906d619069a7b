/*
    Copyright 2014 Adobe
    Distributed under the Boost Software License, Version 1.0.
    (See accompanying file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
*/
/****************************************************************************************************/

// identity
#include <binlayout/record.hpp>

// stdc++
#include <algorithm>
#include <cstring>
#include <stdexcept>

// application
#include <binlayout/common.hpp>
#include <binlayout/error.hpp>
#include <binlayout/registry.hpp>

/****************************************************************************************************/

namespace {

/****************************************************************************************************/

CONSTANT_KEY(append);
CONSTANT_KEY(assign);
CONSTANT_KEY(clear);
CONSTANT_KEY(clone);
CONSTANT_KEY(environment);
CONSTANT_KEY(field);
CONSTANT_KEY(field_names);
CONSTANT_KEY(find_field);
CONSTANT_KEY(read);
CONSTANT_KEY(write);

// sorted; searched with binary_search
const adobe::name_t reserved_table[] =
{
    key_append,
    key_array,
    key_assign,
    key_clear,
    key_clone,
    key_debug_name,
    key_element,
    key_environment,
    key_field,
    key_field_names,
    key_find_field,
    key_index,
    key_is_clear,
    key_length,
    key_num_bytes,
    key_offset,
    key_offset_of,
    key_parent,
    key_read,
    key_selection,
    key_snapshot,
    key_value,
    key_write,
};

inline bool name_less(adobe::name_t x, adobe::name_t y)
{
    return std::strcmp(x.c_str(), y.c_str()) < 0;
}

/****************************************************************************************************/

inline bool contains(const std::vector<adobe::name_t>& names, adobe::name_t name)
{
    return std::find(names.begin(), names.end(), name) != names.end();
}

/****************************************************************************************************/

const adobe::dictionary_t& declaration_at(const adobe::array_t& declarations, std::size_t index)
{
    const adobe::any_regular_t& declaration(declarations[index]);

    if (declaration.type_info() != typeid(adobe::dictionary_t))
        throw invalid_parameter_error_t(make_string("field declaration ",
                                                    index,
                                                    " is not a dictionary (got ",
                                                    describe(declaration),
                                                    ")"));

    return declaration.cast<adobe::dictionary_t>();
}

/****************************************************************************************************/

adobe::name_t declared_name(const adobe::dictionary_t& declaration)
{
    adobe::dictionary_t::const_iterator found(declaration.find(key_field_name));

    return found == declaration.end() ? adobe::name_t() : found->second.cast<adobe::name_t>();
}

/****************************************************************************************************/

void collect_field_names(const adobe::array_t&                    declarations,
                         std::vector<adobe::name_t>&              names,
                         std::vector<const record_definition_t*>& expanding)
{
    static const adobe::dictionary_t empty_s;

    for (std::size_t i(0), count(declarations.size()); i != count; ++i)
    {
        const adobe::dictionary_t& declaration(declaration_at(declarations, i));
        adobe::name_t              name(declared_name(declaration));

        if (name != adobe::name_t())
        {
            names.push_back(name);

            continue;
        }

        const adobe::dictionary_t&          params(value_for<adobe::dictionary_t>(declaration, key_field_parameters, empty_s));
        adobe::dictionary_t::const_iterator fields(params.find(key_fields));

        if (fields != params.end() && fields->second.type_info() == typeid(adobe::array_t))
        {
            collect_field_names(fields->second.cast<adobe::array_t>(), names, expanding);

            continue;
        }

        object_type_ptr_t type(type_registry().lookup(value_for<adobe::name_t>(declaration, key_field_type)));

        if (!type || !type->definition_m)
            continue;

        const record_definition_t* definition(type->definition_m.get());

        if (std::find(expanding.begin(), expanding.end(), definition) != expanding.end())
            continue;

        expanding.push_back(definition);

        collect_field_names(definition->fields_m, names, expanding);

        expanding.pop_back();
    }
}

/****************************************************************************************************/

std::vector<adobe::name_t> hidden_names(const adobe::dictionary_t& params)
{
    std::vector<adobe::name_t>          result;
    adobe::dictionary_t::const_iterator found(params.find(key_hide));

    if (found == params.end())
        return result;

    const adobe::array_t& hide(found->second.cast<adobe::array_t>());

    for (adobe::array_t::const_iterator iter(hide.begin()), last(hide.end()); iter != last; ++iter)
    {
        if (iter->type_info() == typeid(std::string))
            result.push_back(adobe::name_t(iter->cast<std::string>().c_str()));
        else
            result.push_back(iter->cast<adobe::name_t>());
    }

    return result;
}

/****************************************************************************************************/

void sanitize_record(sanitizer_t& sanitizer, adobe::dictionary_t& params)
{
    const adobe::array_t                declarations(value_for<adobe::array_t>(params, key_fields));
    ambient_endian_t                    order(sanitizer.endian());
    adobe::dictionary_t::const_iterator endian_param(params.find(key_endian));

    if (endian_param != params.end())
        order = endian_from_value(endian_param->second);

    std::vector<adobe::name_t> hidden(hidden_names(params));

    check_field_declarations(declarations);

    sanitized_list_t::vector_type fields;

    sanitizer.with_endian(order, [&]()
    {
        for (std::size_t i(0), count(declarations.size()); i != count; ++i)
        {
            sanitized_field_t field(sanitizer.sanitize(declaration_at(declarations, i)));

            if (field.name_m != adobe::name_t() && contains(hidden, field.name_m))
                field.hidden_m = true;

            fields.push_back(field);
        }
    });

    params[key_fields] = adobe::any_regular_t(sanitized_list_t(std::move(fields)));
}

/****************************************************************************************************/

parameter_contract_t record_contract()
{
    parameter_contract_t result(base_contract());

    result.optional(key_endian)
          .optional(key_hide);

    return result;
}

/****************************************************************************************************/

} // namespace

/****************************************************************************************************/

record_t::record_t(object_type_ptr_t   type,
                   parameter_set_t     parameters,
                   lazy_environment_t* parent) :
    data_object_t(std::move(type), std::move(parameters), parent),
    fields_m(value_for<sanitized_list_t>(parameters_m.accepted_m, key_fields)),
    children_m(fields_m.size())
{ }

/****************************************************************************************************/

data_object_t& record_t::child(std::size_t index)
{
    if (index >= children_m.size())
        throw std::range_error(make_string("field index ",
                                           index,
                                           " out of range [ 0 .. ",
                                           children_m.size(),
                                           " ) in ",
                                           debug_name()));

    data_object_ptr_t& result(children_m[index]);

    if (!result)
        result = instantiate(fields_m[index], &environment_m);

    return *result;
}

/****************************************************************************************************/

bool record_t::has_named_fields()
{
    return true;
}

/****************************************************************************************************/

std::vector<adobe::name_t> record_t::field_names()
{
    std::vector<adobe::name_t> result;

    for (std::size_t i(0), count(fields_m.size()); i != count; ++i)
    {
        const sanitized_field_t& field(fields_m[i]);

        if (field.hidden_m)
            continue;

        if (field.name_m != adobe::name_t())
        {
            result.push_back(field.name_m);

            continue;
        }

        data_object_t& unnamed(child(i));

        if (!unnamed.has_named_fields())
            continue;

        std::vector<adobe::name_t> flattened(unnamed.field_names());

        result.insert(result.end(), flattened.begin(), flattened.end());
    }

    return result;
}

/****************************************************************************************************/

data_object_t* record_t::find_field(adobe::name_t name)
{
    if (name == adobe::name_t())
        return 0;

    for (std::size_t i(0), count(fields_m.size()); i != count; ++i)
        if (fields_m[i].name_m == name)
            return &child(i);

    for (std::size_t i(0), count(fields_m.size()); i != count; ++i)
    {
        if (fields_m[i].name_m != adobe::name_t())
            continue;

        data_object_t& unnamed(child(i));

        if (!unnamed.has_named_fields())
            continue;

        if (data_object_t* result = unnamed.find_field(name))
            return result;
    }

    return 0;
}

/****************************************************************************************************/

boost::uint64_t record_t::offset_of(adobe::name_t name)
{
    boost::uint64_t result(0);

    for (std::size_t i(0), count(fields_m.size()); i != count; ++i)
    {
        const sanitized_field_t& field(fields_m[i]);
        data_object_t&           current(child(i));

        if (field.name_m == name)
            return result;

        if (field.name_m == adobe::name_t() && current.has_named_fields() && current.find_field(name))
            return result + current.offset_of(name);

        result += current.num_bytes();
    }

    throw no_such_name_error_t(make_string("no field '", name, "' in ", debug_name()));
}

/****************************************************************************************************/

std::string record_t::debug_name_of(const data_object_t& child)
{
    for (std::size_t i(0), count(children_m.size()); i != count; ++i)
    {
        if (children_m[i].get() != &child)
            continue;

        if (fields_m[i].name_m == adobe::name_t())
            return debug_name();

        return make_string(debug_name(), ".", fields_m[i].name_m);
    }

    return debug_name();
}

/****************************************************************************************************/

void record_t::assign(const adobe::any_regular_t& value)
{
    if (value.type_info() != typeid(adobe::dictionary_t))
        throw invalid_parameter_error_t(make_string("expected a dictionary but got ",
                                                    describe(value),
                                                    " in ",
                                                    debug_name()));

    const adobe::dictionary_t& entries(value.cast<adobe::dictionary_t>());

    for (adobe::dictionary_t::const_iterator iter(entries.begin()), last(entries.end()); iter != last; ++iter)
        field(iter->first).assign(iter->second);
}

/****************************************************************************************************/

void record_t::do_read(stream_t& input)
{
    for (std::size_t i(0), count(fields_m.size()); i != count; ++i)
        child(i).read(input);
}

/****************************************************************************************************/

void record_t::do_write(stream_t& output)
{
    for (std::size_t i(0), count(fields_m.size()); i != count; ++i)
        child(i).write(output);
}

/****************************************************************************************************/

boost::uint64_t record_t::do_num_bytes()
{
    boost::uint64_t result(0);

    for (std::size_t i(0), count(fields_m.size()); i != count; ++i)
        result += child(i).num_bytes();

    return result;
}

/****************************************************************************************************/

adobe::any_regular_t record_t::do_snapshot()
{
    adobe::dictionary_t result;

    for (std::size_t i(0), count(fields_m.size()); i != count; ++i)
    {
        const sanitized_field_t& field(fields_m[i]);

        if (field.hidden_m)
            continue;

        data_object_t&       current(child(i));
        adobe::any_regular_t snapshot;

        if (field.name_m != adobe::name_t())
        {
            snapshot = current.snapshot();

            if (!is_nil(snapshot))
                result[field.name_m] = snapshot;

            continue;
        }

        if (!current.has_named_fields())
            continue;

        snapshot = current.snapshot();

        if (snapshot.type_info() != typeid(adobe::dictionary_t))
            continue;

        const adobe::dictionary_t& flattened(snapshot.cast<adobe::dictionary_t>());

        for (adobe::dictionary_t::const_iterator iter(flattened.begin()), last(flattened.end()); iter != last; ++iter)
            result[iter->first] = iter->second;
    }

    return adobe::any_regular_t(result);
}

/****************************************************************************************************/

void record_t::do_clear()
{
    for (std::vector<data_object_ptr_t>::iterator iter(children_m.begin()), last(children_m.end()); iter != last; ++iter)
        if (*iter)
            (*iter)->clear();
}

/****************************************************************************************************/

bool record_t::do_is_clear()
{
    for (std::vector<data_object_ptr_t>::iterator iter(children_m.begin()), last(children_m.end()); iter != last; ++iter)
        if (*iter && !(*iter)->is_clear())
            return false;

    return true;
}

/****************************************************************************************************/

void record_t::copy_state(data_object_t& source)
{
    record_t& other(static_cast<record_t&>(source));

    for (std::size_t i(0), count(other.children_m.size()); i != count; ++i)
        if (other.children_m[i])
            child(i).assign_state(*other.children_m[i]);
}

/****************************************************************************************************/
#if 0
#pragma mark -
#endif
/****************************************************************************************************/

object_type_ptr_t make_record_type()
{
    std::shared_ptr<object_type_t> result(std::make_shared<object_type_t>());

    result->name_m = value_record;
    result->contract_m = record_contract();
    result->contract_m.mandatory(key_fields);
    result->sanitize_m = &sanitize_record;
    result->construct_m = &construct_object<record_t>;

    return result;
}

/****************************************************************************************************/

object_type_ptr_t make_record_type(adobe::name_t name, std::shared_ptr<const record_definition_t> definition)
{
    require(definition);

    std::shared_ptr<object_type_t> result(std::make_shared<object_type_t>());

    result->name_m = name;
    result->contract_m = record_contract();
    result->contract_m.optional(key_fields);
    result->possibly_recursive_m = true;
    result->definition_m = definition;
    result->sanitize_m = [definition](sanitizer_t& sanitizer, adobe::dictionary_t& params)
    {
        if (params.count(key_fields) == 0)
            params[key_fields] = adobe::any_regular_t(definition->fields_m);

        // the type's own byte order wins over whatever was inherited
        if (!is_nil(definition->endian_m))
            params[key_endian] = definition->endian_m;

        if (!definition->hide_m.empty() && params.count(key_hide) == 0)
            params[key_hide] = adobe::any_regular_t(definition->hide_m);

        sanitize_record(sanitizer, params);
    };
    result->construct_m = &construct_object<record_t>;

    return result;
}

/****************************************************************************************************/

bool is_reserved_name(adobe::name_t name)
{
    return std::binary_search(std::begin(reserved_table), std::end(reserved_table), name, &name_less);
}

/****************************************************************************************************/

void check_field_declarations(const adobe::array_t& declarations)
{
    std::vector<adobe::name_t>              names;
    std::vector<const record_definition_t*> expanding;

    collect_field_names(declarations, names, expanding);

    for (std::vector<adobe::name_t>::iterator iter(names.begin()), last(names.end()); iter != last; ++iter)
    {
        if (is_reserved_name(*iter))
            throw reserved_field_name_error_t(make_string("field '", *iter, "' is a reserved name"));

        if (std::find(names.begin(), iter, *iter) != iter)
            throw duplicate_field_name_error_t(make_string("field '", *iter, "' is already defined"));
    }
}

/****************************************************************************************************/

void check_record_definition(const record_definition_t& definition)
{
    ambient_endian_t order;

    if (!is_nil(definition.endian_m))
        order = endian_from_value(definition.endian_m);

    check_field_declarations(definition.fields_m);

    const type_registry_t& registry(type_registry());

    for (std::size_t i(0), count(definition.fields_m.size()); i != count; ++i)
    {
        adobe::name_t type_name(value_for<adobe::name_t>(declaration_at(definition.fields_m, i), key_field_type));

        // without a byte order of its own the record may still be nested in one that has it
        bool found(order ?
                       static_cast<bool>(registry.lookup(type_name, order)) :
                       registry.lookup(type_name) || registry.lookup(type_name, endian::little));

        if (!found)
            throw unknown_type_error_t(make_string("unknown type '", type_name, "'"));
    }
}

/****************************************************************************************************/
