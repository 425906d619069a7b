/*
    Copyright 2014 Adobe
    Distributed under the Boost Software License, Version 1.0.
    (See accompanying file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
*/
/****************************************************************************************************/

// #ifndef BINLAYOUT_CONSTANT_NAMES_HPP
// #define BINLAYOUT_CONSTANT_NAMES_HPP

/****************************************************************************************************/
// field declarations
CONSTANT_KEY(field_hidden);
CONSTANT_KEY(field_name);
CONSTANT_KEY(field_parameters);
CONSTANT_KEY(field_type);

// parameters
CONSTANT_KEY(adjust_offset);
CONSTANT_KEY(check_offset);
CONSTANT_KEY(check_value);
CONSTANT_KEY(choices);
CONSTANT_KEY(endian);
CONSTANT_KEY(fields);
CONSTANT_KEY(hide);
CONSTANT_KEY(initial_length);
CONSTANT_KEY(initial_value);
CONSTANT_KEY(length);
CONSTANT_KEY(onlyif);
CONSTANT_KEY(pad_char);
CONSTANT_KEY(read_length);
CONSTANT_KEY(read_until);
CONSTANT_KEY(readwrite);
CONSTANT_KEY(selection);
CONSTANT_KEY(trim_padding);
CONSTANT_KEY(type);
CONSTANT_KEY(value);

// expression variables
CONSTANT_KEY(array);
CONSTANT_KEY(element);
CONSTANT_KEY(index);
CONSTANT_KEY(offset);
CONSTANT_KEY(parent);

// expression functions and operations
CONSTANT_KEY(debug_name);
CONSTANT_KEY(is_clear);
CONSTANT_KEY(num_bytes);
CONSTANT_KEY(offset_of);
CONSTANT_KEY(snapshot);

// type names
CONSTANT_VALUE(array);
CONSTANT_VALUE(choice);
CONSTANT_VALUE(record);
CONSTANT_VALUE(string);

CONSTANT_VALUE(big);
CONSTANT_VALUE(little);

/****************************************************************************************************/
// BINLAYOUT_CONSTANT_NAMES_HPP
// #endif

/****************************************************************************************************/
