/*
    Copyright 2014 Adobe
    Distributed under the Boost Software License, Version 1.0.
    (See accompanying file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
*/
/****************************************************************************************************/

// identity
#include <binlayout/choice.hpp>

// stdc++
#include <cmath>
#include <typeinfo>
#include <utility>

// application
#include <binlayout/common.hpp>
#include <binlayout/error.hpp>

/****************************************************************************************************/

namespace {

/****************************************************************************************************/
/*
    Alternatives are either a type name or a make_type() dictionary. Their
    types are resolved now, under the choice's byte order, so an unknown type
    fails at declaration; their parameters wait for first selection.
*/
void sanitize_choice(sanitizer_t& sanitizer, adobe::dictionary_t& params)
{
    static const adobe::dictionary_t empty_s;

    const adobe::array_t alternatives(value_for<adobe::array_t>(params, key_choices));

    if (alternatives.empty())
        throw invalid_parameter_error_t("choices must not be empty");

    ambient_endian_t                    order(sanitizer.endian());
    adobe::dictionary_t::const_iterator endian_param(params.find(key_endian));

    if (endian_param != params.end())
        order = endian_from_value(endian_param->second);

    sanitized_list_t::vector_type entries;

    sanitizer.with_endian(order, [&]()
    {
        for (adobe::array_t::const_iterator iter(alternatives.begin()), last(alternatives.end()); iter != last; ++iter)
        {
            const std::type_info& type(iter->type_info());

            if (type == typeid(adobe::name_t))
            {
                entries.push_back(sanitizer.defer(iter->cast<adobe::name_t>(), adobe::name_t(), empty_s));
            }
            else if (type == typeid(adobe::dictionary_t))
            {
                const adobe::dictionary_t& alternative(iter->cast<adobe::dictionary_t>());

                entries.push_back(sanitizer.defer(value_for<adobe::name_t>(alternative, key_field_type),
                                                  adobe::name_t(),
                                                  value_for<adobe::dictionary_t>(alternative, key_field_parameters, empty_s)));
            }
            else
            {
                throw invalid_parameter_error_t(make_string("choice alternative must be a type name or a type declaration, got ",
                                                            describe(*iter)));
            }
        }
    });

    params[key_choices] = adobe::any_regular_t(sanitized_list_t(std::move(entries)));
}

/****************************************************************************************************/

} // namespace

/****************************************************************************************************/

choice_t::choice_t(object_type_ptr_t   type,
                   parameter_set_t     parameters,
                   lazy_environment_t* parent) :
    data_object_t(std::move(type), std::move(parameters), parent),
    choices_m(value_for<sanitized_list_t>(parameters_m.accepted_m, key_choices)),
    selecting_m(false)
{ }

/****************************************************************************************************/

std::size_t choice_t::selection()
{
    adobe::any_regular_t selected;

    {
    temp_assignment<bool> selecting(selecting_m, true);

    selected = evaluate_parameter(key_selection);
    }

    if (selected.type_info() != typeid(double))
        throw invalid_selection_error_t(make_string("selection ",
                                                    describe(selected),
                                                    " is not an index in ",
                                                    debug_name()));

    double index(selected.cast<double>());

    if (index < 0 || index >= static_cast<double>(choices_m.size()) || std::floor(index) != index)
        throw invalid_selection_error_t(make_string("selection ",
                                                    index,
                                                    " out of range [ 0 .. ",
                                                    choices_m.size(),
                                                    " ) in ",
                                                    debug_name()));

    return static_cast<std::size_t>(index);
}

/****************************************************************************************************/

data_object_t& choice_t::current()
{
    return alternative(selection());
}

/****************************************************************************************************/

data_object_t& choice_t::alternative(std::size_t index)
{
    cache_t::iterator found(cache_m.find(index));

    if (found != cache_m.end())
        return *found->second;

    // an alternative whose parameters fail to sanitize stays unbuilt
    data_object_ptr_t result(instantiate(choices_m[index], &environment_m));

    return *cache_m.emplace(index, std::move(result)).first->second;
}

/****************************************************************************************************/

bool choice_t::single_value()
{
    return current().single_value();
}

/****************************************************************************************************/

adobe::any_regular_t choice_t::value()
{
    return current().value();
}

/****************************************************************************************************/

void choice_t::assign(const adobe::any_regular_t& value)
{
    current().assign(value);
}

/****************************************************************************************************/

bool choice_t::has_named_fields()
{
    return true;
}

/****************************************************************************************************/

std::vector<adobe::name_t> choice_t::field_names()
{
    data_object_t& selected(current());

    return selected.has_named_fields() ? selected.field_names() : std::vector<adobe::name_t>();
}

/****************************************************************************************************/

data_object_t* choice_t::find_field(adobe::name_t name)
{
    // a name looked up while the selection itself is being evaluated
    if (selecting_m)
        return 0;

    data_object_t& selected(current());

    return selected.has_named_fields() ? selected.find_field(name) : 0;
}

/****************************************************************************************************/

boost::uint64_t choice_t::offset_of(adobe::name_t name)
{
    return current().offset_of(name);
}

/****************************************************************************************************/

std::string choice_t::debug_name_of(const data_object_t&)
{
    return debug_name();
}

/****************************************************************************************************/

data_object_t& choice_t::element(std::size_t index)
{
    return current().element(index);
}

/****************************************************************************************************/

std::size_t choice_t::length()
{
    return current().length();
}

/****************************************************************************************************/

boost::optional<adobe::any_regular_t> choice_t::invoke_operation(adobe::name_t name)
{
    if (name == key_selection && !selecting_m)
        return adobe::any_regular_t(static_cast<double>(selection()));

    return data_object_t::invoke_operation(name);
}

/****************************************************************************************************/

void choice_t::do_read(stream_t& input)
{
    current().read(input);
}

/****************************************************************************************************/

void choice_t::do_write(stream_t& output)
{
    current().write(output);
}

/****************************************************************************************************/

boost::uint64_t choice_t::do_num_bytes()
{
    return current().num_bytes();
}

/****************************************************************************************************/

adobe::any_regular_t choice_t::do_snapshot()
{
    return current().snapshot();
}

/****************************************************************************************************/

void choice_t::do_clear()
{
    current().clear();
}

/****************************************************************************************************/

bool choice_t::do_is_clear()
{
    return current().is_clear();
}

/****************************************************************************************************/

void choice_t::copy_state(data_object_t& source)
{
    choice_t& other(static_cast<choice_t&>(source));

    for (cache_t::iterator iter(other.cache_m.begin()), last(other.cache_m.end()); iter != last; ++iter)
        alternative(iter->first).assign_state(*iter->second);
}

/****************************************************************************************************/
#if 0
#pragma mark -
#endif
/****************************************************************************************************/

object_type_ptr_t make_choice_type()
{
    std::shared_ptr<object_type_t> result(std::make_shared<object_type_t>());

    result->name_m = value_choice;
    result->contract_m = base_contract();
    result->contract_m.mandatory(key_choices)
                      .mandatory(key_selection)
                      .optional(key_endian);
    result->sanitize_m = &sanitize_choice;
    result->construct_m = &construct_object<choice_t>;

    return result;
}

/****************************************************************************************************/
