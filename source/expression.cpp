/*
    Copyright 2014 Adobe
    Distributed under the Boost Software License, Version 1.0.
    (See accompanying file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
*/
/****************************************************************************************************/

// identity
#include <binlayout/expression.hpp>

// stdc++
#include <sstream>
#include <stdexcept>

// asl
#include <adobe/implementation/expression_parser.hpp>

// application
#include <binlayout/error.hpp>
#include <binlayout/string.hpp>

/****************************************************************************************************/

expression_t make_expression(const std::string& source)
try
{
    std::stringstream      input(source);
    adobe::line_position_t position(__FILE__, __LINE__);
    adobe::array_t         compiled;

    adobe::expression_parser(input, position).require_expression(compiled);

    return expression_t(source, compiled);
}
catch (const std::logic_error& error)
{
    // adobe::stream_error_t reports parse failures
    throw invalid_parameter_error_t(make_string("bad expression '", source, "': ", error.what()));
}

/****************************************************************************************************/
