/*
    Copyright 2014 Adobe
    Distributed under the Boost Software License, Version 1.0.
    (See accompanying file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
*/
/****************************************************************************************************/

// identity
#include <binlayout/endian.hpp>

// application
#include <binlayout/common.hpp>
#include <binlayout/error.hpp>

/****************************************************************************************************/

adobe::name_t name_of(endian order)
{
    return order == endian::big ? adobe::name_t(value_big) : adobe::name_t(value_little);
}

/****************************************************************************************************/

endian endian_from_value(const adobe::any_regular_t& value)
{
    const std::type_info& type(value.type_info());
    std::string           name;

    if (type == typeid(adobe::name_t))
        name = value.cast<adobe::name_t>().c_str();
    else if (type == typeid(std::string))
        name = value.cast<std::string>();

    if (name == value_little.c_str())
        return endian::little;
    else if (name == value_big.c_str())
        return endian::big;

    throw invalid_parameter_error_t(make_string("unknown endian ", describe(value),
                                                " (expected little or big)"));
}

/****************************************************************************************************/
