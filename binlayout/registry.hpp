/*
    Copyright 2014 Adobe
    Distributed under the Boost Software License, Version 1.0.
    (See accompanying file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
*/
/****************************************************************************************************/

#ifndef BINLAYOUT_REGISTRY_HPP
#define BINLAYOUT_REGISTRY_HPP

// stdc++
#include <map>

// asl
#include <adobe/name.hpp>

// application
#include <binlayout/endian.hpp>
#include <binlayout/type.hpp>

/****************************************************************************************************/

class type_registry_t
{
public:
    // Binding a name a second time to a different type is an invalid_parameter_error_t.
    void register_type(object_type_ptr_t type);

    void unregister_type(adobe::name_t name);

    /*
        Exact match first. Failing that, with an ambient byte order, an unsuffixed
        integer name (`int16`, `uint32`) retries as `int16le`/`uint32be` and `float`
        or `double` retries as `float_le`/`double_be`. Returns null when nothing matches.
    */
    object_type_ptr_t lookup(adobe::name_t name, ambient_endian_t endian = ambient_endian_t()) const;

private:
    struct less_name_t
    {
        bool operator()(adobe::name_t x, adobe::name_t y) const;
    };

    typedef std::map<adobe::name_t, object_type_ptr_t, less_name_t> type_map_t;

    type_map_t types_m;
};

/****************************************************************************************************/
// The process-wide registry; the built-in types are registered on first use.
type_registry_t& type_registry();

/****************************************************************************************************/
// BINLAYOUT_REGISTRY_HPP
#endif

/****************************************************************************************************/
