/*
    Copyright 2014 Adobe
    Distributed under the Boost Software License, Version 1.0.
    (See accompanying file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
*/
/****************************************************************************************************/

// identity
#include <binlayout/environment.hpp>

// stdc++
#include <functional>
#include <stdexcept>
#include <string>

// asl
#include <adobe/array.hpp>
#include <adobe/virtual_machine.hpp>

// application
#include <binlayout/common.hpp>
#include <binlayout/data_object.hpp>
#include <binlayout/error.hpp>
#include <binlayout/expression.hpp>

/****************************************************************************************************/

namespace {

/****************************************************************************************************/

struct contextual_evaluation_engine_t
{
    contextual_evaluation_engine_t(const adobe::array_t& expression,
                                   lazy_environment_t&   environment);

    adobe::any_regular_t evaluate();

private:
    // evaluation vm custom callbacks
    adobe::any_regular_t named_index_lookup(const adobe::any_regular_t& value,
                                            adobe::name_t               name);
    adobe::any_regular_t numeric_index_lookup(const adobe::any_regular_t& value,
                                              std::size_t                 index);
    adobe::any_regular_t stack_variable_lookup(adobe::name_t name);
    adobe::any_regular_t array_function_lookup(adobe::name_t         name,
                                               const adobe::array_t& parameter_set);

    // helpers
    data_object_t& regular_to_object(const adobe::any_regular_t& name_or_ref);

    const adobe::array_t& expression_m;
    lazy_environment_t&   environment_m;
};

/****************************************************************************************************/

contextual_evaluation_engine_t::contextual_evaluation_engine_t(const adobe::array_t& expression,
                                                               lazy_environment_t&   environment) :
    expression_m(expression),
    environment_m(environment)
{ }

/****************************************************************************************************/

adobe::any_regular_t contextual_evaluation_engine_t::evaluate()
try
{
    adobe::virtual_machine_t vm;

    vm.set_variable_lookup(std::bind(&contextual_evaluation_engine_t::stack_variable_lookup,
                                     std::ref(*this),
                                     std::placeholders::_1));
    vm.set_named_index_lookup(std::bind(&contextual_evaluation_engine_t::named_index_lookup,
                                        std::ref(*this),
                                        std::placeholders::_1,
                                        std::placeholders::_2));
    vm.set_numeric_index_lookup(std::bind(&contextual_evaluation_engine_t::numeric_index_lookup,
                                          std::ref(*this),
                                          std::placeholders::_1,
                                          std::placeholders::_2));
    vm.set_array_function_lookup(std::bind(&contextual_evaluation_engine_t::array_function_lookup,
                                           std::ref(*this),
                                           std::placeholders::_1,
                                           std::placeholders::_2));

    vm.evaluate(expression_m);

    adobe::any_regular_t result(vm.back());

    vm.pop_back();

    return result;
}
catch (const binlayout_error_t&)
{
    // Already carries its context (an inner evaluation may have decorated it). Pass it up.

    throw;
}
catch (const std::range_error&)
{
    // element index out of range; reported as is.

    throw;
}
catch (const std::exception& error)
{
    std::string details(error.what());

    if (dynamic_cast<const std::bad_cast*>(&error) != NULL)
        details += " -- operand of the wrong type?";

    details += "\nin field: " + environment_m.owner().debug_name();

    throw evaluation_error_t(details);
}

/****************************************************************************************************/

adobe::any_regular_t contextual_evaluation_engine_t::named_index_lookup(const adobe::any_regular_t& value,
                                                                        adobe::name_t               name)
{
    const std::type_info& type(value.type_info());

    if (type == typeid(object_ref_t))
        return finalize_lookup(value.cast<object_ref_t>().object_m->field(name));
    else if (type == typeid(scope_ref_t))
        return value.cast<scope_ref_t>().environment_m->resolve(name);
    else if (type == typeid(adobe::dictionary_t))
    {
        const adobe::dictionary_t&          dictionary(value.cast<adobe::dictionary_t>());
        adobe::dictionary_t::const_iterator found(dictionary.find(name));

        if (found == dictionary.end())
            throw no_such_name_error_t(make_string("Subfield '", name, "' not found."));

        return found->second;
    }

    throw std::runtime_error(make_string("Cannot look up '", name, "' in ", describe(value)));
}

/****************************************************************************************************/

adobe::any_regular_t contextual_evaluation_engine_t::numeric_index_lookup(const adobe::any_regular_t& value,
                                                                          std::size_t                 index)
{
    const std::type_info& type(value.type_info());

    if (type == typeid(object_ref_t))
        return finalize_lookup(value.cast<object_ref_t>().object_m->element(index));

    if (type == typeid(adobe::array_t))
    {
        const adobe::array_t& array(value.cast<adobe::array_t>());

        if (index >= array.size())
            throw std::range_error(make_string("Array index ",
                                               index,
                                               " out of range [ 0 .. ",
                                               array.size(),
                                               " )"));

        return array[index];
    }

    throw std::runtime_error(make_string("Cannot index ", describe(value)));
}

/****************************************************************************************************/

adobe::any_regular_t contextual_evaluation_engine_t::stack_variable_lookup(adobe::name_t name)
{
    return environment_m.resolve(name);
}

/****************************************************************************************************/

data_object_t& contextual_evaluation_engine_t::regular_to_object(const adobe::any_regular_t& name_or_ref)
{
    const std::type_info& type(name_or_ref.type_info());

    if (type == typeid(object_ref_t))
        return *name_or_ref.cast<object_ref_t>().object_m;

    if (type == typeid(adobe::name_t))
    {
        // the nearest enclosing object with a field of that name
        adobe::name_t name(name_or_ref.cast<adobe::name_t>());

        for (lazy_environment_t* scope(environment_m.parent()); scope; scope = scope->parent())
        {
            data_object_t& owner(scope->owner());

            if (!owner.has_named_fields())
                continue;

            if (data_object_t* field = owner.find_field(name))
                return *field;
        }

        throw no_such_name_error_t(make_string("Field '",
                                               name,
                                               "' not found at or above ",
                                               environment_m.owner().debug_name()));
    }

    throw std::runtime_error(make_string("Expected a field or @field_name, but was passed ",
                                         describe(name_or_ref)));
}

/****************************************************************************************************/

adobe::any_regular_t contextual_evaluation_engine_t::array_function_lookup(adobe::name_t         name,
                                                                           const adobe::array_t& parameter_set)
{
    if (name == key_offset_of)
    {
        if (parameter_set.size() != 1 || parameter_set[0].type_info() != typeid(adobe::name_t))
            throw std::runtime_error("offset_of(): @field_name expected");

        boost::optional<boost::uint64_t> offset(environment_m.offset_of(parameter_set[0].cast<adobe::name_t>()));

        return offset ? adobe::any_regular_t(static_cast<double>(*offset)) : adobe::any_regular_t();
    }
    else if (name == key_num_bytes)
    {
        if (parameter_set.size() != 1)
            throw std::runtime_error("num_bytes(): takes one argument");

        return adobe::any_regular_t(static_cast<double>(regular_to_object(parameter_set[0]).num_bytes()));
    }
    else if (name == key_length)
    {
        if (parameter_set.size() != 1)
            throw std::runtime_error("length(): takes one argument");

        const adobe::any_regular_t& argument(parameter_set[0]);
        const std::type_info&       type(argument.type_info());

        if (type == typeid(adobe::array_t))
            return adobe::any_regular_t(static_cast<double>(argument.cast<adobe::array_t>().size()));
        else if (type == typeid(std::string))
            return adobe::any_regular_t(static_cast<double>(argument.cast<std::string>().size()));

        return adobe::any_regular_t(static_cast<double>(regular_to_object(argument).length()));
    }

    throw std::runtime_error(make_string("Unknown function '", name, "'"));
}

/****************************************************************************************************/

} // namespace

/****************************************************************************************************/

lazy_environment_t::lazy_environment_t(lazy_environment_t*        parent,
                                       data_object_t&             owner,
                                       const adobe::dictionary_t& extra) :
    parent_m(parent),
    owner_m(owner),
    extra_m(extra),
    overrides_m(0)
{ }

/****************************************************************************************************/

void lazy_environment_t::add_variable(adobe::name_t name, const adobe::any_regular_t& value)
{
    variables_m[name] = value;
}

/****************************************************************************************************/

adobe::any_regular_t lazy_environment_t::evaluate(const adobe::any_regular_t& expression,
                                                  const adobe::dictionary_t&  overrides)
{
    temp_assignment<const adobe::dictionary_t*> scope(overrides_m,
                                                      overrides.empty() ? 0 : &overrides);

    const std::type_info& type(expression.type_info());

    if (type == typeid(adobe::name_t))
        return resolve(expression.cast<adobe::name_t>());
    else if (type == typeid(expression_t))
        return contextual_evaluation_engine_t(expression.cast<expression_t>().compiled_m, *this).evaluate();

    return expression;
}

/****************************************************************************************************/

adobe::any_regular_t lazy_environment_t::resolve(adobe::name_t name)
{
    if (name == key_parent)
    {
        if (!parent_m)
            throw no_such_name_error_t(make_string("'parent' used at the root in ", owner_m.debug_name()));

        return adobe::any_regular_t(scope_ref_t(parent_m));
    }

    if (overrides_m)
    {
        adobe::dictionary_t::const_iterator found(overrides_m->find(name));

        if (found != overrides_m->end())
            return found->second;
    }

    adobe::dictionary_t::const_iterator variable(variables_m.find(name));

    if (variable != variables_m.end())
        return variable->second;

    if (!parent_m)
        throw no_such_name_error_t(make_string("no such name '", name, "' at or above ", owner_m.debug_name()));

    adobe::dictionary_t::const_iterator extra(parent_m->extra_m.find(name));

    if (extra != parent_m->extra_m.end())
        return parent_m->evaluate(extra->second);

    data_object_t& parent_object(parent_m->owner());

    if (parent_object.has_named_fields())
        if (data_object_t* field = parent_object.find_field(name))
            return finalize_lookup(*field);

    boost::optional<adobe::any_regular_t> operation(parent_object.invoke_operation(name));

    if (operation)
        return *operation;

    return parent_m->resolve(name);
}

/****************************************************************************************************/

boost::optional<boost::uint64_t> lazy_environment_t::offset_of(adobe::name_t name)
try
{
    if (!parent_m)
        return boost::none;

    return parent_m->owner().offset_of(name);
}
catch (const std::exception&)
{
    // offsets are asked for speculatively; unknown is an answer.

    return boost::none;
}

/****************************************************************************************************/

adobe::any_regular_t finalize_lookup(data_object_t& object)
{
    if (object.single_value())
        return object.value();

    return adobe::any_regular_t(object_ref_t(&object));
}

/****************************************************************************************************/
