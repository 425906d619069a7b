/*
    Copyright 2014 Adobe
    Distributed under the Boost Software License, Version 1.0.
    (See accompanying file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
*/
/****************************************************************************************************/

// identity
#include <binlayout/sanitizer.hpp>

// stdc++
#include <algorithm>

// application
#include <binlayout/data_object.hpp>
#include <binlayout/diagnostics.hpp>
#include <binlayout/error.hpp>
#include <binlayout/registry.hpp>

/****************************************************************************************************/

namespace {

/****************************************************************************************************/
// Keeps a type in the cycle guard for the lifetime of the guard.
struct seen_guard_t
{
    seen_guard_t(std::vector<const object_type_t*>& seen, const object_type_t& type) :
        seen_m(seen),
        pushed_m(type.possibly_recursive_m)
    {
        if (pushed_m)
            seen_m.push_back(&type);
    }

    ~seen_guard_t()
    {
        if (pushed_m)
            seen_m.pop_back();
    }

private:
    std::vector<const object_type_t*>& seen_m;
    bool                               pushed_m;
};

/****************************************************************************************************/

} // namespace

/****************************************************************************************************/

object_type_ptr_t sanitizer_t::resolve(adobe::name_t type_name) const
{
    object_type_ptr_t result(type_registry().lookup(type_name, endian_m));

    if (!result)
        throw unknown_type_error_t(make_string("unknown type '", type_name, "'"));

    return result;
}

/****************************************************************************************************/

sanitized_field_t sanitizer_t::sanitize(const adobe::dictionary_t& declaration)
{
    static const adobe::dictionary_t empty_s;

    adobe::dictionary_t::const_iterator name(declaration.find(key_field_name));

    return sanitize(value_for<adobe::name_t>(declaration, key_field_type),
                    name == declaration.end() ? adobe::name_t() : name->second.cast<adobe::name_t>(),
                    value_for<adobe::dictionary_t>(declaration, key_field_parameters, empty_s),
                    value_for<bool>(declaration, key_field_hidden, false));
}

/****************************************************************************************************/

sanitized_field_t sanitizer_t::sanitize(adobe::name_t              type_name,
                                        adobe::name_t              field_name,
                                        const adobe::dictionary_t& params,
                                        bool                       hidden)
{
    return sanitize(resolve(type_name), field_name, params, hidden);
}

/****************************************************************************************************/

sanitized_field_t sanitizer_t::sanitize(object_type_ptr_t          type,
                                        adobe::name_t              field_name,
                                        const adobe::dictionary_t& params,
                                        bool                       hidden)
{
    require(type);

    if (std::find(seen_m.begin(), seen_m.end(), type.get()) != seen_m.end())
    {
        // A recursive occurrence: expanding it now would never terminate.
        warning() << "deferring sanitization of recursive type '"
                  << type->name_m << "' for field '" << field_name << "'";

        sanitized_field_t result(deferred_entry(type, field_name, params));

        result.hidden_m = hidden;

        return result;
    }

    sanitized_field_t result;

    result.name_m = field_name;
    result.hidden_m = hidden;
    result.type_m = type;
    result.parameters_m = sanitize_parameters(*type, params);

    return result;
}

/****************************************************************************************************/

sanitized_field_t sanitizer_t::defer(adobe::name_t              type_name,
                                     adobe::name_t              field_name,
                                     const adobe::dictionary_t& params)
{
    return deferred_entry(resolve(type_name), field_name, params);
}

/****************************************************************************************************/

sanitized_field_t sanitizer_t::deferred_entry(object_type_ptr_t          type,
                                              adobe::name_t              field_name,
                                              const adobe::dictionary_t& params) const
{
    sanitized_field_t result;

    result.name_m = field_name;
    result.type_m = type;
    result.deferred_m = true;
    result.raw_parameters_m = params;

    if (endian_m && type->contract_m.accepts(key_endian) && params.count(key_endian) == 0)
        result.raw_parameters_m[key_endian] = adobe::any_regular_t(name_of(*endian_m));

    return result;
}

/****************************************************************************************************/

parameter_set_t sanitizer_t::sanitize_parameters(const object_type_t& type, adobe::dictionary_t params)
{
    type.contract_m.validate(params, type.name_m);

    if (type.sanitize_m)
    {
        seen_guard_t guard(seen_m, type);

        type.sanitize_m(*this, params);
    }

    return partition(params, type.contract_m);
}

/****************************************************************************************************/

data_object_ptr_t instantiate(const sanitized_field_t& field, lazy_environment_t* parent)
{
    require(field.type_m);

    const object_type_t& type(*field.type_m);

    if (!field.deferred_m)
        return type.construct_m(field.type_m, field.parameters_m, parent);

    adobe::dictionary_t::const_iterator order(field.raw_parameters_m.find(key_endian));
    ambient_endian_t                    endian;

    if (order != field.raw_parameters_m.end() && !is_nil(order->second))
        endian = endian_from_value(order->second);

    sanitizer_t sanitizer(endian);

    return type.construct_m(field.type_m,
                            sanitizer.sanitize_parameters(type, field.raw_parameters_m),
                            parent);
}

/****************************************************************************************************/
