/*
    Copyright 2014 Adobe
    Distributed under the Boost Software License, Version 1.0.
    (See accompanying file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
*/
/****************************************************************************************************/

#ifndef BINLAYOUT_SANITIZER_HPP
#define BINLAYOUT_SANITIZER_HPP

// stdc++
#include <vector>

// asl
#include <adobe/dictionary.hpp>
#include <adobe/name.hpp>

// application
#include <binlayout/common.hpp>
#include <binlayout/endian.hpp>
#include <binlayout/type.hpp>

/****************************************************************************************************/
/*
    Turns raw declarations into sanitized ones. One sanitizer walks one
    declaration tree: it carries the ambient byte order down the tree and the
    set of recursive types whose nested declarations are being sanitized
    further up the walk. An occurrence of a type already in that set is not
    expanded; it becomes a deferred entry (see sanitized_field_t) that still
    receives the ambient byte order.
*/
class sanitizer_t
{
public:
    explicit sanitizer_t(ambient_endian_t endian = ambient_endian_t()) :
        endian_m(endian)
    { }

    ambient_endian_t endian() const { return endian_m; }

    // Resolves a type name against the registry with the ambient byte order.
    object_type_ptr_t resolve(adobe::name_t type_name) const;

    // `declaration` holds field_type and optionally field_name, field_parameters and field_hidden.
    sanitized_field_t sanitize(const adobe::dictionary_t& declaration);

    sanitized_field_t sanitize(adobe::name_t              type_name,
                               adobe::name_t              field_name,
                               const adobe::dictionary_t& params,
                               bool                       hidden = false);

    sanitized_field_t sanitize(object_type_ptr_t          type,
                               adobe::name_t              field_name,
                               const adobe::dictionary_t& params,
                               bool                       hidden = false);

    // Resolves the type now but leaves the parameters for instantiation time.
    sanitized_field_t defer(adobe::name_t              type_name,
                            adobe::name_t              field_name,
                            const adobe::dictionary_t& params);

    // Validates, sanitizes nested declarations, and partitions into accepted and extra.
    parameter_set_t sanitize_parameters(const object_type_t& type, adobe::dictionary_t params);

    // Runs `f` with `endian` as the ambient byte order; none leaves the current one in place.
    template <typename F>
    void with_endian(ambient_endian_t endian, F f)
    {
        if (!endian)
        {
            f();

            return;
        }

        temp_assignment<ambient_endian_t> scope(endian_m, endian);

        f();
    }

private:
    sanitized_field_t deferred_entry(object_type_ptr_t          type,
                                     adobe::name_t              field_name,
                                     const adobe::dictionary_t& params) const;

    std::vector<const object_type_t*> seen_m;
    ambient_endian_t                  endian_m;
};

/****************************************************************************************************/
// BINLAYOUT_SANITIZER_HPP
#endif

/****************************************************************************************************/
