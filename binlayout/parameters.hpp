/*
    Copyright 2014 Adobe
    Distributed under the Boost Software License, Version 1.0.
    (See accompanying file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
*/
/****************************************************************************************************/

#ifndef BINLAYOUT_PARAMETERS_HPP
#define BINLAYOUT_PARAMETERS_HPP

// stdc++
#include <string>
#include <utility>
#include <vector>

// asl
#include <adobe/any_regular.hpp>
#include <adobe/dictionary.hpp>
#include <adobe/name.hpp>

/****************************************************************************************************/
/*
    The parameters a type recognizes. Anything a declaration passes that is not
    mandatory, optional or defaulted is an extra parameter: it is kept aside,
    unresolved, for descendants' expressions to look up by name.
*/
struct parameter_contract_t
{
    typedef std::pair<adobe::name_t, adobe::name_t> exclusive_pair_t;

    parameter_contract_t& mandatory(adobe::name_t name);
    parameter_contract_t& optional(adobe::name_t name);
    parameter_contract_t& default_value(adobe::name_t name, const adobe::any_regular_t& value);
    parameter_contract_t& exclusive(adobe::name_t first, adobe::name_t second);

    bool accepts(adobe::name_t name) const;

    /*
        Normalizes `params` in place: rejects nil values, fills in defaults,
        then checks mandatory presence and mutual exclusion, in that order.
        `type_name` only decorates the error messages.
    */
    void validate(adobe::dictionary_t& params, adobe::name_t type_name) const;

    std::vector<adobe::name_t>    mandatory_m;
    std::vector<adobe::name_t>    optional_m;
    adobe::dictionary_t           defaults_m;
    std::vector<exclusive_pair_t> exclusive_m;
};

/****************************************************************************************************/

struct parameter_set_t
{
    bool has(adobe::name_t name) const
    {
        return accepted_m.count(name) != 0;
    }

    const adobe::any_regular_t& get(adobe::name_t name) const;

    adobe::dictionary_t accepted_m;
    adobe::dictionary_t extra_m;
};

// Splits validated parameters into the ones `contract` accepts and the extra ones.
parameter_set_t partition(const adobe::dictionary_t&  params,
                          const parameter_contract_t& contract);

/****************************************************************************************************/
// BINLAYOUT_PARAMETERS_HPP
#endif

/****************************************************************************************************/
