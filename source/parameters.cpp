/*
    Copyright 2014 Adobe
    Distributed under the Boost Software License, Version 1.0.
    (See accompanying file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
*/
/****************************************************************************************************/

// identity
#include <binlayout/parameters.hpp>

// stdc++
#include <algorithm>

// application
#include <binlayout/common.hpp>
#include <binlayout/error.hpp>

/****************************************************************************************************/

namespace {

/****************************************************************************************************/

inline bool contains(const std::vector<adobe::name_t>& names, adobe::name_t name)
{
    return std::find(names.begin(), names.end(), name) != names.end();
}

/****************************************************************************************************/

inline void append_unique(std::vector<adobe::name_t>& names, adobe::name_t name)
{
    if (!contains(names, name))
        names.push_back(name);
}

/****************************************************************************************************/

} // namespace

/****************************************************************************************************/

parameter_contract_t& parameter_contract_t::mandatory(adobe::name_t name)
{
    append_unique(mandatory_m, name);

    return *this;
}

/****************************************************************************************************/

parameter_contract_t& parameter_contract_t::optional(adobe::name_t name)
{
    append_unique(optional_m, name);

    return *this;
}

/****************************************************************************************************/

parameter_contract_t& parameter_contract_t::default_value(adobe::name_t               name,
                                                          const adobe::any_regular_t& value)
{
    defaults_m[name] = value;

    return *this;
}

/****************************************************************************************************/

parameter_contract_t& parameter_contract_t::exclusive(adobe::name_t first, adobe::name_t second)
{
    exclusive_m.push_back(exclusive_pair_t(first, second));

    return *this;
}

/****************************************************************************************************/

bool parameter_contract_t::accepts(adobe::name_t name) const
{
    return contains(mandatory_m, name) ||
           contains(optional_m, name) ||
           defaults_m.count(name) != 0;
}

/****************************************************************************************************/

void parameter_contract_t::validate(adobe::dictionary_t& params, adobe::name_t type_name) const
{
    for (adobe::dictionary_t::const_iterator iter(params.begin()), last(params.end()); iter != last; ++iter)
        if (is_nil(iter->second))
            throw nil_parameter_value_error_t(make_string("parameter '",
                                                          iter->first,
                                                          "' has nil value in ",
                                                          type_name));

    for (adobe::dictionary_t::const_iterator iter(defaults_m.begin()), last(defaults_m.end()); iter != last; ++iter)
        if (params.count(iter->first) == 0)
            params[iter->first] = iter->second;

    for (std::vector<adobe::name_t>::const_iterator iter(mandatory_m.begin()), last(mandatory_m.end()); iter != last; ++iter)
        if (params.count(*iter) == 0)
            throw mandatory_parameter_missing_error_t(make_string("parameter '",
                                                                  *iter,
                                                                  "' must be specified in ",
                                                                  type_name));

    for (std::vector<exclusive_pair_t>::const_iterator iter(exclusive_m.begin()), last(exclusive_m.end()); iter != last; ++iter)
        if (params.count(iter->first) != 0 && params.count(iter->second) != 0)
            throw mutually_exclusive_parameters_error_t(make_string("parameters '",
                                                                    iter->first,
                                                                    "' and '",
                                                                    iter->second,
                                                                    "' are mutually exclusive in ",
                                                                    type_name));
}

/****************************************************************************************************/

const adobe::any_regular_t& parameter_set_t::get(adobe::name_t name) const
{
    adobe::dictionary_t::const_iterator found(accepted_m.find(name));

    if (found == accepted_m.end())
        throw std::runtime_error(make_string("parameter '", name, "' not present"));

    return found->second;
}

/****************************************************************************************************/

parameter_set_t partition(const adobe::dictionary_t&  params,
                          const parameter_contract_t& contract)
{
    parameter_set_t result;

    for (adobe::dictionary_t::const_iterator iter(params.begin()), last(params.end()); iter != last; ++iter)
    {
        if (contract.accepts(iter->first))
            result.accepted_m[iter->first] = iter->second;
        else
            result.extra_m[iter->first] = iter->second;
    }

    return result;
}

/****************************************************************************************************/
