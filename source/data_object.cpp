/*
    Copyright 2014 Adobe
    Distributed under the Boost Software License, Version 1.0.
    (See accompanying file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
*/
/****************************************************************************************************/

// identity
#include <binlayout/data_object.hpp>

// stdc++
#include <limits>
#include <stdexcept>

// application
#include <binlayout/common.hpp>
#include <binlayout/diagnostics.hpp>
#include <binlayout/error.hpp>

/****************************************************************************************************/

parameter_contract_t base_contract()
{
    parameter_contract_t result;

    result.optional(key_onlyif)
          .optional(key_check_offset)
          .optional(key_adjust_offset)
          .default_value(key_readwrite, adobe::any_regular_t(true))
          .exclusive(key_check_offset, key_adjust_offset);

    return result;
}

/****************************************************************************************************/

data_object_t::data_object_t(object_type_ptr_t   type,
                             parameter_set_t     parameters,
                             lazy_environment_t* parent) :
    type_m(std::move(type)),
    parameters_m(std::move(parameters)),
    environment_m(parent, *this, parameters_m.extra_m),
    reading_m(false)
{
    require(type_m);
}

/****************************************************************************************************/

data_object_t::~data_object_t()
{ }

/****************************************************************************************************/

void data_object_t::read(stream_t& input)
{
    if (!is_active())
        return;

    temp_assignment<bool> read_scope(root().reading_m, true);

    check_offset(input);

    clear();

    if (readwrite())
        do_read(input);

    done_read();
}

/****************************************************************************************************/

void data_object_t::write(stream_t& output)
{
    if (!is_active() || !readwrite())
        return;

    do_write(output);

    output.flush();
}

/****************************************************************************************************/

boost::uint64_t data_object_t::num_bytes()
{
    if (!is_active() || !readwrite())
        return 0;

    return do_num_bytes();
}

/****************************************************************************************************/

boost::uint64_t data_object_t::num_bytes(adobe::name_t name)
{
    require_named_fields("num_bytes");

    return field(name).num_bytes();
}

/****************************************************************************************************/

adobe::any_regular_t data_object_t::snapshot()
{
    if (!is_active())
        return adobe::any_regular_t();

    return do_snapshot();
}

/****************************************************************************************************/

void data_object_t::clear()
{
    do_clear();
}

/****************************************************************************************************/

void data_object_t::clear(adobe::name_t name)
{
    require_named_fields("clear");

    field(name).clear();
}

/****************************************************************************************************/

bool data_object_t::is_clear()
{
    return do_is_clear();
}

/****************************************************************************************************/

bool data_object_t::is_clear(adobe::name_t name)
{
    require_named_fields("is_clear");

    return field(name).is_clear();
}

/****************************************************************************************************/

boost::uint64_t data_object_t::offset_of(adobe::name_t)
{
    require_named_fields("offset_of");

    throw no_such_operation_error_t(make_string("offset_of is not supported by ", debug_name()));
}

/****************************************************************************************************/

std::string data_object_t::debug_name()
{
    data_object_t* parent_object(parent());

    return parent_object ? parent_object->debug_name_of(*this) : std::string("obj");
}

/****************************************************************************************************/

std::string data_object_t::debug_name_of(const data_object_t&)
{
    return debug_name();
}

/****************************************************************************************************/

bool data_object_t::is_active()
{
    return !has_parameter(key_onlyif) || truthy(evaluate_parameter(key_onlyif));
}

/****************************************************************************************************/

bool data_object_t::reading()
{
    return root().reading_m;
}

/****************************************************************************************************/

data_object_t& data_object_t::root()
{
    data_object_t* result(this);

    while (data_object_t* parent_object = result->parent())
        result = parent_object;

    return *result;
}

/****************************************************************************************************/

bool data_object_t::single_value()
{
    return false;
}

/****************************************************************************************************/

adobe::any_regular_t data_object_t::value()
{
    throw no_such_operation_error_t(make_string(debug_name(), " has no single value"));
}

/****************************************************************************************************/

void data_object_t::assign(const adobe::any_regular_t&)
{
    throw no_such_operation_error_t(make_string(debug_name(), " cannot be assigned"));
}

/****************************************************************************************************/

bool data_object_t::has_named_fields()
{
    return false;
}

/****************************************************************************************************/

std::vector<adobe::name_t> data_object_t::field_names()
{
    require_named_fields("field_names");

    return std::vector<adobe::name_t>();
}

/****************************************************************************************************/

data_object_t* data_object_t::find_field(adobe::name_t)
{
    return 0;
}

/****************************************************************************************************/

data_object_t& data_object_t::field(adobe::name_t name)
{
    require_named_fields("field");

    data_object_t* result(find_field(name));

    if (!result)
        throw no_such_name_error_t(make_string("no field '", name, "' in ", debug_name()));

    return *result;
}

/****************************************************************************************************/

data_object_t& data_object_t::element(std::size_t)
{
    throw no_such_operation_error_t(make_string(debug_name(), " has no elements"));
}

/****************************************************************************************************/

std::size_t data_object_t::length()
{
    throw no_such_operation_error_t(make_string(debug_name(), " has no length"));
}

/****************************************************************************************************/

boost::optional<adobe::any_regular_t> data_object_t::invoke_operation(adobe::name_t name)
{
    if (name == key_num_bytes)
        return adobe::any_regular_t(static_cast<double>(num_bytes()));
    else if (name == key_snapshot)
        return snapshot();
    else if (name == key_debug_name)
        return adobe::any_regular_t(debug_name());
    else if (name == key_is_clear)
        return adobe::any_regular_t(is_clear());

    return boost::none;
}

/****************************************************************************************************/

data_object_t* data_object_t::parent()
{
    lazy_environment_t* scope(environment_m.parent());

    return scope ? &scope->owner() : 0;
}

/****************************************************************************************************/

bool data_object_t::has_parameter(adobe::name_t name) const
{
    return parameters_m.has(name);
}

/****************************************************************************************************/

adobe::any_regular_t data_object_t::evaluate_parameter(adobe::name_t              name,
                                                       const adobe::dictionary_t& overrides)
{
    return environment_m.evaluate(parameters_m.get(name), overrides);
}

/****************************************************************************************************/

data_object_ptr_t data_object_t::clone()
{
    data_object_ptr_t result(type_m->construct_m(type_m, parameters_m, 0));

    result->assign_state(*this);

    return result;
}

/****************************************************************************************************/

void data_object_t::assign_state(data_object_t& source)
{
    const adobe::dictionary_t& variables(source.environment_m.variables());

    for (adobe::dictionary_t::const_iterator iter(variables.begin()), last(variables.end()); iter != last; ++iter)
        environment_m.add_variable(iter->first, iter->second);

    copy_state(source);
}

/****************************************************************************************************/

void data_object_t::done_read()
{ }

/****************************************************************************************************/

void data_object_t::require_named_fields(const char* operation)
{
    if (!has_named_fields())
        throw no_such_operation_error_t(make_string(operation,
                                                    "(name) is not supported by ",
                                                    debug_name()));
}

/****************************************************************************************************/

void data_object_t::check_offset(stream_t& input)
{
    if (has_parameter(key_check_offset))
    {
        boost::uint64_t      actual(input.offset());
        adobe::any_regular_t expected(evaluate_parameter(key_check_offset,
                                                         make_dictionary(key_offset,
                                                                         static_cast<double>(actual))));

        if (expected.type_info() == typeid(bool))
        {
            if (!expected.cast<bool>())
                throw offset_mismatch_error_t(make_string("offset not as expected in ", debug_name()));
        }
        else if (expected != adobe::any_regular_t(static_cast<double>(actual)))
        {
            throw offset_mismatch_error_t(make_string("offset is '",
                                                      actual,
                                                      "' but expected ",
                                                      describe(expected),
                                                      " in ",
                                                      debug_name()));
        }
    }
    else if (has_parameter(key_adjust_offset))
    {
        boost::uint64_t actual(input.offset());
        boost::uint64_t expected(count_of(evaluate_parameter(key_adjust_offset), "adjust_offset"));

        if (expected == actual)
            return;

        boost::uint64_t distance(expected > actual ? expected - actual : actual - expected);

        if (distance > static_cast<boost::uint64_t>(std::numeric_limits<boost::int64_t>::max()))
            throw offset_mismatch_error_t(make_string("offset is '",
                                                      actual,
                                                      "' and expected '",
                                                      expected,
                                                      "' is out of reach in ",
                                                      debug_name()));

        boost::int64_t delta(expected > actual ?
                                 static_cast<boost::int64_t>(distance) :
                                 -static_cast<boost::int64_t>(distance));

        try
        {
            input.seek(delta);
        }
        catch (const std::runtime_error& error)
        {
            throw offset_mismatch_error_t(make_string("offset is '",
                                                      actual,
                                                      "' but couldn't seek to expected '",
                                                      expected,
                                                      "' in ",
                                                      debug_name(),
                                                      ": ",
                                                      error.what()));
        }

        warning() << "adjusting stream position by " << delta << " bytes";
    }
}

/****************************************************************************************************/

bool data_object_t::readwrite()
{
    return truthy(evaluate_parameter(key_readwrite));
}

/****************************************************************************************************/
