/*
    Copyright 2014 Adobe
    Distributed under the Boost Software License, Version 1.0.
    (See accompanying file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
*/
/****************************************************************************************************/

// identity
#include <binlayout/common.hpp>

// stdc++
#include <cmath>

// boost
#include <boost/lexical_cast.hpp>

// application
#include <binlayout/error.hpp>

/****************************************************************************************************/

bool truthy(const adobe::any_regular_t& value)
{
    const std::type_info& type(value.type_info());

    if (type == typeid(bool))
        return value.cast<bool>();
    else if (type == typeid(double))
        return value.cast<double>() != 0;

    return !is_nil(value);
}

/****************************************************************************************************/

double number_of(const adobe::any_regular_t& value, const std::string& what)
{
    if (value.type_info() != typeid(double))
        throw invalid_parameter_error_t(make_string(what, ": expected a number but got ", describe(value)));

    return value.cast<double>();
}

/****************************************************************************************************/

boost::uint64_t count_of(const adobe::any_regular_t& value, const std::string& what)
{
    double number(number_of(value, what));

    // also rejects NaN and anything too large for a 64-bit count
    if (!(number >= 0 && number < 18446744073709551616.0) || std::floor(number) != number)
        throw invalid_parameter_error_t(make_string(what, ": expected a non-negative integer but got ", number));

    return static_cast<boost::uint64_t>(number);
}

/****************************************************************************************************/

std::string describe(const adobe::any_regular_t& value)
{
    const std::type_info& type(value.type_info());

    if (type == typeid(double))
        return boost::lexical_cast<std::string>(value.cast<double>());
    else if (type == typeid(bool))
        return value.cast<bool>() ? "true" : "false";
    else if (type == typeid(std::string))
        return "'" + value.cast<std::string>() + "'";
    else if (type == typeid(adobe::name_t))
        return make_string("@", value.cast<adobe::name_t>());
    else if (is_nil(value))
        return "nil";

    return type.name();
}

/****************************************************************************************************/
