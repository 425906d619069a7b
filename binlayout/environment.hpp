/*
    Copyright 2014 Adobe
    Distributed under the Boost Software License, Version 1.0.
    (See accompanying file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
*/
/****************************************************************************************************/

#ifndef BINLAYOUT_ENVIRONMENT_HPP
#define BINLAYOUT_ENVIRONMENT_HPP

// boost
#include <boost/cstdint.hpp>
#include <boost/optional.hpp>

// asl
#include <adobe/any_regular.hpp>
#include <adobe/dictionary.hpp>
#include <adobe/name.hpp>

/****************************************************************************************************/

class data_object_t;

/****************************************************************************************************/
/*
    The scope of one data object. Parameter expressions of the object are
    evaluated here; identifiers they do not bind locally are resolved through
    the parent scope, its owner's extra parameters and fields, and so on up to
    the root.
*/
class lazy_environment_t
{
public:
    lazy_environment_t(lazy_environment_t*        parent,
                       data_object_t&             owner,
                       const adobe::dictionary_t& extra);

    lazy_environment_t* parent() const { return parent_m; }
    data_object_t&      owner() const { return owner_m; }

    const adobe::dictionary_t& extra() const { return extra_m; }
    const adobe::dictionary_t& variables() const { return variables_m; }

    void add_variable(adobe::name_t name, const adobe::any_regular_t& value);

    /*
        A name_t is a symbolic reference and is resolved; an expression_t is run
        through the virtual machine; anything else is returned as is. The
        overrides are visible to identifiers for the duration of this call only.
    */
    adobe::any_regular_t evaluate(const adobe::any_regular_t& expression,
                                  const adobe::dictionary_t&  overrides = adobe::dictionary_t());

    // Throws no_such_name_error_t once the chain of scopes is exhausted.
    adobe::any_regular_t resolve(adobe::name_t name);

    // Byte offset of `name` within the parent object; none when it cannot be computed.
    boost::optional<boost::uint64_t> offset_of(adobe::name_t name);

private:
    lazy_environment_t(const lazy_environment_t&);
    lazy_environment_t& operator=(const lazy_environment_t&);

    lazy_environment_t*        parent_m;
    data_object_t&             owner_m;
    adobe::dictionary_t        extra_m;
    adobe::dictionary_t        variables_m;
    const adobe::dictionary_t* overrides_m;
};

/****************************************************************************************************/
// A single value is returned as its value, anything else as an object_ref_t.
adobe::any_regular_t finalize_lookup(data_object_t& object);

/****************************************************************************************************/
// BINLAYOUT_ENVIRONMENT_HPP
#endif

/****************************************************************************************************/
