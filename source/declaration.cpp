/*
    Copyright 2014 Adobe
    Distributed under the Boost Software License, Version 1.0.
    (See accompanying file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
*/
/****************************************************************************************************/

// identity
#include <binlayout/declaration.hpp>

// stdc++
#include <sstream>

// application
#include <binlayout/common.hpp>
#include <binlayout/error.hpp>
#include <binlayout/record.hpp>
#include <binlayout/registry.hpp>
#include <binlayout/sanitizer.hpp>

/****************************************************************************************************/

adobe::dictionary_t make_field(adobe::name_t              type,
                               adobe::name_t              name,
                               const adobe::dictionary_t& params,
                               bool                       hidden)
{
    adobe::dictionary_t result(make_type(type, params));

    if (name != adobe::name_t())
        result[key_field_name] = adobe::any_regular_t(name);

    if (hidden)
        result[key_field_hidden] = adobe::any_regular_t(true);

    return result;
}

/****************************************************************************************************/

adobe::dictionary_t make_type(adobe::name_t type, const adobe::dictionary_t& params)
{
    return make_dictionary(key_field_type, type,
                           key_field_parameters, params);
}

/****************************************************************************************************/

data_object_ptr_t make_object(adobe::name_t type, const adobe::dictionary_t& params)
{
    sanitizer_t sanitizer;

    return instantiate(sanitizer.sanitize(type, adobe::name_t(), params), 0);
}

/****************************************************************************************************/

object_type_ptr_t register_record_type(adobe::name_t              name,
                                       const adobe::array_t&      fields,
                                       const adobe::dictionary_t& params)
{
    std::shared_ptr<record_definition_t> definition(std::make_shared<record_definition_t>());

    definition->fields_m = fields;

    adobe::dictionary_t::const_iterator endian(params.find(key_endian));

    if (endian != params.end())
        definition->endian_m = endian->second;

    definition->hide_m = value_for<adobe::array_t>(params, key_hide, adobe::array_t());

    for (adobe::dictionary_t::const_iterator iter(params.begin()), last(params.end()); iter != last; ++iter)
        if (iter->first != key_endian && iter->first != key_hide)
            throw invalid_parameter_error_t(make_string("unexpected parameter '",
                                                        iter->first,
                                                        "' for record type '",
                                                        name,
                                                        "'"));

    object_type_ptr_t result(make_record_type(name, definition));

    type_registry().register_type(result);

    try
    {
        check_record_definition(*definition);
    }
    catch (...)
    {
        type_registry().unregister_type(name);

        throw;
    }

    return result;
}

/****************************************************************************************************/

rawbytes_t to_bytes(data_object_t& object)
{
    std::ostringstream output(std::ios_base::binary);
    stream_t           stream(output);

    object.write(stream);

    std::string result(output.str());

    return rawbytes_t(result.begin(), result.end());
}

/****************************************************************************************************/

void from_bytes(data_object_t& object, const rawbytes_t& bytes)
{
    std::istringstream input(std::string(bytes.begin(), bytes.end()), std::ios_base::binary);
    stream_t           stream(input);

    object.read(stream);
}

/****************************************************************************************************/
