/*
    Copyright 2014 Adobe
    Distributed under the Boost Software License, Version 1.0.
    (See accompanying file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
*/
/****************************************************************************************************/

#ifndef BINLAYOUT_DECLARATION_HPP
#define BINLAYOUT_DECLARATION_HPP

// asl
#include <adobe/array.hpp>
#include <adobe/dictionary.hpp>
#include <adobe/name.hpp>

// application
#include <binlayout/data_object.hpp>
#include <binlayout/stream.hpp>

/****************************************************************************************************/

adobe::dictionary_t make_field(adobe::name_t              type,
                               adobe::name_t              name,
                               const adobe::dictionary_t& params = adobe::dictionary_t(),
                               bool                       hidden = false);

// A nameless declaration: a choice alternative or an array element type.
adobe::dictionary_t make_type(adobe::name_t type, const adobe::dictionary_t& params = adobe::dictionary_t());

/****************************************************************************************************/
/*
    Sanitizes a root declaration and builds it. Errors in the declaration
    (unknown types, bad parameters, field name collisions) are reported here;
    errors in the data are reported by the operations on the result.
*/
data_object_ptr_t make_object(adobe::name_t type, const adobe::dictionary_t& params = adobe::dictionary_t());

/*
    Registers `name` as a record type with the given field declarations.
    `params` may hold `endian` and `hide`. The definition is checked with the
    type already registered, so it may refer to itself; a definition that
    fails the check is unregistered again.
*/
object_type_ptr_t register_record_type(adobe::name_t              name,
                                       const adobe::array_t&      fields,
                                       const adobe::dictionary_t& params = adobe::dictionary_t());

/****************************************************************************************************/

rawbytes_t to_bytes(data_object_t& object);

void from_bytes(data_object_t& object, const rawbytes_t& bytes);

/****************************************************************************************************/
// BINLAYOUT_DECLARATION_HPP
#endif

/****************************************************************************************************/
