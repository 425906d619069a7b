/*
    Copyright 2014 Adobe
    Distributed under the Boost Software License, Version 1.0.
    (See accompanying file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
*/
/****************************************************************************************************/

#ifndef BINLAYOUT_ERROR_HPP
#define BINLAYOUT_ERROR_HPP

// stdc++
#include <stdexcept>
#include <string>

/****************************************************************************************************/

#define require(cond)                        \
    do {                                     \
        if (!(cond))                         \
            throw std::logic_error(#cond);   \
    } while (false);

/****************************************************************************************************/

class binlayout_error_t : public std::runtime_error
{
public:
    explicit binlayout_error_t(const std::string& error) :
        std::runtime_error(error)
    { }
};

/****************************************************************************************************/

#define BINLAYOUT_DECLARE_ERROR(name)                 \
class name : public binlayout_error_t                 \
{                                                     \
public:                                               \
    explicit name(const std::string& error) :         \
        binlayout_error_t(error)                      \
    { }                                               \
}

/****************************************************************************************************/
// declaration time
BINLAYOUT_DECLARE_ERROR(unknown_type_error_t);
BINLAYOUT_DECLARE_ERROR(duplicate_field_name_error_t);
BINLAYOUT_DECLARE_ERROR(reserved_field_name_error_t);
BINLAYOUT_DECLARE_ERROR(mandatory_parameter_missing_error_t);
BINLAYOUT_DECLARE_ERROR(mutually_exclusive_parameters_error_t);
BINLAYOUT_DECLARE_ERROR(nil_parameter_value_error_t);
BINLAYOUT_DECLARE_ERROR(invalid_parameter_error_t);

// run time
BINLAYOUT_DECLARE_ERROR(no_such_name_error_t);
BINLAYOUT_DECLARE_ERROR(no_such_operation_error_t);
BINLAYOUT_DECLARE_ERROR(invalid_selection_error_t);
BINLAYOUT_DECLARE_ERROR(offset_mismatch_error_t);
BINLAYOUT_DECLARE_ERROR(validity_error_t);
BINLAYOUT_DECLARE_ERROR(end_of_stream_error_t);
BINLAYOUT_DECLARE_ERROR(evaluation_error_t);

/****************************************************************************************************/
// BINLAYOUT_ERROR_HPP
#endif

/****************************************************************************************************/
