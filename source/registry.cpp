/*
    Copyright 2014 Adobe
    Distributed under the Boost Software License, Version 1.0.
    (See accompanying file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
*/
/****************************************************************************************************/

// identity
#include <binlayout/registry.hpp>

// stdc++
#include <cctype>
#include <cstring>
#include <string>

// application
#include <binlayout/choice.hpp>
#include <binlayout/common.hpp>
#include <binlayout/error.hpp>
#include <binlayout/primitive.hpp>
#include <binlayout/record.hpp>
#include <binlayout/repeat.hpp>

/****************************************************************************************************/

namespace {

/****************************************************************************************************/
// matches u?int[0-9]{1,3}
bool is_unsuffixed_integer(const std::string& name)
{
    std::size_t prefix(0);

    if (name.compare(0, 4, "uint") == 0)
        prefix = 4;
    else if (name.compare(0, 3, "int") == 0)
        prefix = 3;
    else
        return false;

    std::size_t digits(name.size() - prefix);

    if (digits < 1 || digits > 3)
        return false;

    for (std::size_t i(prefix); i < name.size(); ++i)
        if (!std::isdigit(static_cast<unsigned char>(name[i])))
            return false;

    return true;
}

/****************************************************************************************************/

void register_atom_pair(type_registry_t&  registry,
                        const std::string& base_name,
                        const std::string& separator,
                        atom_base_type_t   base_type,
                        std::size_t        bit_count)
{
    std::string little(base_name + separator + "le");
    std::string big(base_name + separator + "be");

    registry.register_type(make_atom_type(adobe::name_t(little.c_str()), base_type, bit_count, endian::little));
    registry.register_type(make_atom_type(adobe::name_t(big.c_str()), base_type, bit_count, endian::big));
}

/****************************************************************************************************/

void register_builtin_types(type_registry_t& registry)
{
    registry.register_type(make_atom_type("int8"_name, atom_signed_k, 8, endian_k));
    registry.register_type(make_atom_type("uint8"_name, atom_unsigned_k, 8, endian_k));

    register_atom_pair(registry, "int16", "", atom_signed_k, 16);
    register_atom_pair(registry, "uint16", "", atom_unsigned_k, 16);
    register_atom_pair(registry, "int32", "", atom_signed_k, 32);
    register_atom_pair(registry, "uint32", "", atom_unsigned_k, 32);
    register_atom_pair(registry, "int64", "", atom_signed_k, 64);
    register_atom_pair(registry, "uint64", "", atom_unsigned_k, 64);
    register_atom_pair(registry, "float", "_", atom_float_k, 32);
    register_atom_pair(registry, "double", "_", atom_float_k, 64);

    registry.register_type(make_string_type());
    registry.register_type(make_record_type());
    registry.register_type(make_choice_type());
    registry.register_type(make_repeat_type());
}

/****************************************************************************************************/

} // namespace

/****************************************************************************************************/

bool type_registry_t::less_name_t::operator()(adobe::name_t x, adobe::name_t y) const
{
    return std::strcmp(x.c_str(), y.c_str()) < 0;
}

/****************************************************************************************************/

void type_registry_t::register_type(object_type_ptr_t type)
{
    require(type);

    type_map_t::iterator found(types_m.find(type->name_m));

    if (found != types_m.end())
    {
        if (found->second == type)
            return;

        throw invalid_parameter_error_t(make_string("type '",
                                                    type->name_m,
                                                    "' is already registered"));
    }

    types_m[type->name_m] = type;
}

/****************************************************************************************************/

void type_registry_t::unregister_type(adobe::name_t name)
{
    types_m.erase(name);
}

/****************************************************************************************************/

object_type_ptr_t type_registry_t::lookup(adobe::name_t name, ambient_endian_t endian) const
{
    type_map_t::const_iterator found(types_m.find(name));

    if (found != types_m.end())
        return found->second;

    if (!endian)
        return object_type_ptr_t();

    std::string fallback(name.c_str());
    bool        little(*endian == endian::little);

    if (is_unsuffixed_integer(fallback))
        fallback += little ? "le" : "be";
    else if (fallback == "float" || fallback == "double")
        fallback += little ? "_le" : "_be";
    else
        return object_type_ptr_t();

    found = types_m.find(adobe::name_t(fallback.c_str()));

    return found == types_m.end() ? object_type_ptr_t() : found->second;
}

/****************************************************************************************************/

type_registry_t& type_registry()
{
    static type_registry_t registry_s;
    static bool            inited_s = false;

    if (!inited_s)
    {
        inited_s = true;

        register_builtin_types(registry_s);
    }

    return registry_s;
}

/****************************************************************************************************/
