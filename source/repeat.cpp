/*
    Copyright 2014 Adobe
    Distributed under the Boost Software License, Version 1.0.
    (See accompanying file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
*/
/****************************************************************************************************/

// identity
#include <binlayout/repeat.hpp>

// stdc++
#include <stdexcept>
#include <typeinfo>

// application
#include <binlayout/common.hpp>
#include <binlayout/error.hpp>
#include <binlayout/expression.hpp>

/****************************************************************************************************/

namespace {

/****************************************************************************************************/

void sanitize_repeat(sanitizer_t& sanitizer, adobe::dictionary_t& params)
{
    static const adobe::dictionary_t empty_s;

    const adobe::any_regular_t          element_type(params[key_type]);
    ambient_endian_t                    order(sanitizer.endian());
    adobe::dictionary_t::const_iterator endian_param(params.find(key_endian));

    if (endian_param != params.end())
        order = endian_from_value(endian_param->second);

    sanitized_list_t::vector_type entry;

    sanitizer.with_endian(order, [&]()
    {
        if (element_type.type_info() == typeid(adobe::name_t))
        {
            entry.push_back(sanitizer.sanitize(element_type.cast<adobe::name_t>(), adobe::name_t(), empty_s));
        }
        else if (element_type.type_info() == typeid(adobe::dictionary_t))
        {
            const adobe::dictionary_t& declaration(element_type.cast<adobe::dictionary_t>());

            entry.push_back(sanitizer.sanitize(value_for<adobe::name_t>(declaration, key_field_type),
                                               adobe::name_t(),
                                               value_for<adobe::dictionary_t>(declaration, key_field_parameters, empty_s)));
        }
        else
        {
            throw invalid_parameter_error_t(make_string("array element type must be a type name or a type declaration, got ",
                                                        describe(element_type)));
        }
    });

    params[key_type] = adobe::any_regular_t(sanitized_list_t(std::move(entry)));
}

/****************************************************************************************************/

} // namespace

/****************************************************************************************************/

repeat_t::repeat_t(object_type_ptr_t   type,
                   parameter_set_t     parameters,
                   lazy_environment_t* parent) :
    data_object_t(std::move(type), std::move(parameters), parent),
    element_type_m(value_for<sanitized_list_t>(parameters_m.accepted_m, key_type)),
    materialized_m(false)
{
    require(element_type_m.size() == 1);
}

/****************************************************************************************************/

void repeat_t::materialize()
{
    if (materialized_m)
        return;

    materialized_m = true;

    if (!has_parameter(key_initial_length))
        return;

    boost::uint64_t count(count_of(evaluate_parameter(key_initial_length), "initial_length"));

    while (elements_m.size() < count)
        push_element();
}

/****************************************************************************************************/

data_object_t& repeat_t::push_element()
{
    data_object_ptr_t result(instantiate(element_type_m[0], &environment_m));

    result->environment().add_variable(key_index, adobe::any_regular_t(static_cast<double>(elements_m.size())));

    elements_m.push_back(std::move(result));

    return *elements_m.back();
}

/****************************************************************************************************/

data_object_t& repeat_t::element(std::size_t index)
{
    materialize();

    if (index >= elements_m.size())
        throw std::range_error(make_string("index ",
                                           index,
                                           " out of range [ 0 .. ",
                                           elements_m.size(),
                                           " ) in ",
                                           debug_name()));

    return *elements_m[index];
}

/****************************************************************************************************/

std::size_t repeat_t::length()
{
    materialize();

    return elements_m.size();
}

/****************************************************************************************************/

data_object_t& repeat_t::append()
{
    materialize();

    return push_element();
}

/****************************************************************************************************/

void repeat_t::assign(const adobe::any_regular_t& value)
{
    if (value.type_info() != typeid(adobe::array_t))
        throw invalid_parameter_error_t(make_string("expected an array but got ",
                                                    describe(value),
                                                    " in ",
                                                    debug_name()));

    // the value may be a snapshot of this very array
    const adobe::array_t values(value.cast<adobe::array_t>());

    elements_m.clear();
    materialized_m = true;

    for (adobe::array_t::const_iterator iter(values.begin()), last(values.end()); iter != last; ++iter)
        push_element().assign(*iter);
}

/****************************************************************************************************/

std::string repeat_t::debug_name_of(const data_object_t& child)
{
    for (std::size_t i(0), count(elements_m.size()); i != count; ++i)
        if (elements_m[i].get() == &child)
            return make_string(debug_name(), "[", i, "]");

    return debug_name();
}

/****************************************************************************************************/

boost::optional<adobe::any_regular_t> repeat_t::invoke_operation(adobe::name_t name)
{
    if (name == key_length)
        return adobe::any_regular_t(static_cast<double>(length()));

    return data_object_t::invoke_operation(name);
}

/****************************************************************************************************/

void repeat_t::do_read(stream_t& input)
{
    if (!has_parameter(key_read_until))
    {
        materialize();

        for (std::size_t i(0), count(elements_m.size()); i != count; ++i)
            elements_m[i]->read(input);

        return;
    }

    materialized_m = true;

    while (true)
    {
        data_object_t& current(push_element());

        current.read(input);

        adobe::any_regular_t done(evaluate_parameter(key_read_until,
                                                     make_dictionary(key_element, finalize_lookup(current),
                                                                     key_index, static_cast<double>(elements_m.size() - 1),
                                                                     key_array, object_ref_t(this))));

        if (truthy(done))
            break;
    }
}

/****************************************************************************************************/

void repeat_t::do_write(stream_t& output)
{
    materialize();

    for (std::size_t i(0), count(elements_m.size()); i != count; ++i)
        elements_m[i]->write(output);
}

/****************************************************************************************************/

boost::uint64_t repeat_t::do_num_bytes()
{
    materialize();

    boost::uint64_t result(0);

    for (std::size_t i(0), count(elements_m.size()); i != count; ++i)
        result += elements_m[i]->num_bytes();

    return result;
}

/****************************************************************************************************/

adobe::any_regular_t repeat_t::do_snapshot()
{
    materialize();

    adobe::array_t result;

    for (std::size_t i(0), count(elements_m.size()); i != count; ++i)
        result.push_back(elements_m[i]->snapshot());

    return adobe::any_regular_t(result);
}

/****************************************************************************************************/

void repeat_t::do_clear()
{
    elements_m.clear();
    materialized_m = false;
}

/****************************************************************************************************/

bool repeat_t::do_is_clear()
{
    for (std::size_t i(0), count(elements_m.size()); i != count; ++i)
        if (!elements_m[i]->is_clear())
            return false;

    return true;
}

/****************************************************************************************************/

void repeat_t::copy_state(data_object_t& source)
{
    repeat_t& other(static_cast<repeat_t&>(source));

    elements_m.clear();
    materialized_m = other.materialized_m;

    for (std::size_t i(0), count(other.elements_m.size()); i != count; ++i)
        push_element().assign_state(*other.elements_m[i]);
}

/****************************************************************************************************/
#if 0
#pragma mark -
#endif
/****************************************************************************************************/

object_type_ptr_t make_repeat_type()
{
    std::shared_ptr<object_type_t> result(std::make_shared<object_type_t>());

    result->name_m = value_array;
    result->contract_m = base_contract();
    result->contract_m.mandatory(key_type)
                      .optional(key_initial_length)
                      .optional(key_read_until)
                      .optional(key_endian)
                      .exclusive(key_initial_length, key_read_until);
    result->sanitize_m = &sanitize_repeat;
    result->construct_m = &construct_object<repeat_t>;

    return result;
}

/****************************************************************************************************/
