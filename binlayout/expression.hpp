/*
    Copyright 2014 Adobe
    Distributed under the Boost Software License, Version 1.0.
    (See accompanying file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
*/
/****************************************************************************************************/

#ifndef BINLAYOUT_EXPRESSION_HPP
#define BINLAYOUT_EXPRESSION_HPP

// stdc++
#include <ostream>
#include <string>

// boost
#include <boost/operators.hpp>

// asl
#include <adobe/array.hpp>

/****************************************************************************************************/

class data_object_t;
class lazy_environment_t;

/****************************************************************************************************/
/*
    A computed parameter: the source text and its compiled form, ready for
    adobe::virtual_machine_t. Free identifiers are resolved by the environment the
    expression is evaluated in.
*/
struct expression_t : boost::equality_comparable<expression_t>
{
    expression_t()
    { }

    expression_t(const std::string& source, const adobe::array_t& compiled) :
        source_m(source),
        compiled_m(compiled)
    { }

    friend bool operator==(const expression_t& x, const expression_t& y)
    {
        return x.source_m == y.source_m;
    }

    friend std::ostream& operator<<(std::ostream& s, const expression_t& x)
    {
        return s << x.source_m;
    }

    std::string    source_m;
    adobe::array_t compiled_m;
};

// Throws an invalid_parameter_error_t when the source does not parse.
expression_t make_expression(const std::string& source);

/****************************************************************************************************/
// Non-owning handle to a composite object, produced while evaluating an expression.
struct object_ref_t : boost::equality_comparable<object_ref_t>
{
    explicit object_ref_t(data_object_t* object = 0) :
        object_m(object)
    { }

    friend bool operator==(const object_ref_t& x, const object_ref_t& y)
    {
        return x.object_m == y.object_m;
    }

    friend std::ostream& operator<<(std::ostream& s, const object_ref_t& x)
    {
        return s << "object_ref(" << static_cast<const void*>(x.object_m) << ")";
    }

    data_object_t* object_m;
};

/****************************************************************************************************/
// What the identifier `parent` evaluates to: a scope that further names resolve in.
struct scope_ref_t : boost::equality_comparable<scope_ref_t>
{
    explicit scope_ref_t(lazy_environment_t* environment = 0) :
        environment_m(environment)
    { }

    friend bool operator==(const scope_ref_t& x, const scope_ref_t& y)
    {
        return x.environment_m == y.environment_m;
    }

    friend std::ostream& operator<<(std::ostream& s, const scope_ref_t& x)
    {
        return s << "scope_ref(" << static_cast<const void*>(x.environment_m) << ")";
    }

    lazy_environment_t* environment_m;
};

/****************************************************************************************************/
// BINLAYOUT_EXPRESSION_HPP
#endif

/****************************************************************************************************/
