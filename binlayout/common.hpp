/*
    Copyright 2014 Adobe
    Distributed under the Boost Software License, Version 1.0.
    (See accompanying file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
*/
/****************************************************************************************************/

#ifndef BINLAYOUT_COMMON_HPP
#define BINLAYOUT_COMMON_HPP

// stdc++
#include <stdexcept>
#include <string>

// boost
#include <boost/cstdint.hpp>

// asl
#include <adobe/any_regular.hpp>
#include <adobe/array.hpp>
#include <adobe/dictionary.hpp>
#include <adobe/name.hpp>

// application
#include <binlayout/string.hpp>

/****************************************************************************************************/

using namespace adobe::literals; // for the _name user-defined literal.

/****************************************************************************************************/

#define CONSTANT_KEY(x) \
static const adobe::static_name_t key_##x = #x##_name

#define CONSTANT_VALUE(x) \
static const adobe::static_name_t value_##x = #x##_name

#include <binlayout/constant_names.hpp>

/****************************************************************************************************/

template <typename T>
const T& value_for(const adobe::dictionary_t& dict, adobe::name_t key)
{
    adobe::dictionary_t::const_iterator found(dict.find(key));

    if (found == dict.end())
        throw std::runtime_error(make_string("Key ", key, " not found"));

    return found->second.cast<T>();
}

/****************************************************************************************************/

template <typename T>
const T& value_for(const adobe::dictionary_t& dict, adobe::name_t key, const T& default_value)
{
    adobe::dictionary_t::const_iterator found(dict.find(key));

    return found == dict.end() ? default_value : found->second.cast<T>();
}

/****************************************************************************************************/

inline bool is_nil(const adobe::any_regular_t& value)
{
    return value == adobe::any_regular_t();
}

// bool is itself, a number is true when nonzero, nil is false, anything else is true.
bool truthy(const adobe::any_regular_t& value);

// Numbers are carried as double; anything else is an invalid_parameter_error_t naming `what`.
double number_of(const adobe::any_regular_t& value, const std::string& what);

// Integral, non-negative number; anything else is an invalid_parameter_error_t naming `what`.
boost::uint64_t count_of(const adobe::any_regular_t& value, const std::string& what);

// Short printable form of a value for error messages and diagnostics.
std::string describe(const adobe::any_regular_t& value);

/****************************************************************************************************/

namespace detail {

inline void make_dictionary_append(adobe::dictionary_t&)
{ }

template <typename T, typename... Args>
void make_dictionary_append(adobe::dictionary_t& result,
                            adobe::name_t        key,
                            const T&             value,
                            const Args&...       args)
{
    result[key] = adobe::any_regular_t(value);

    make_dictionary_append(result, args...);
}

inline void make_array_append(adobe::array_t&)
{ }

template <typename T, typename... Args>
void make_array_append(adobe::array_t& result, const T& value, const Args&... args)
{
    result.push_back(adobe::any_regular_t(value));

    make_array_append(result, args...);
}

} // namespace detail

/****************************************************************************************************/
// make_dictionary(key_a, 1, key_b, "b"_name) builds a dictionary from key/value pairs.
template <typename... Args>
adobe::dictionary_t make_dictionary(const Args&... args)
{
    adobe::dictionary_t result;

    detail::make_dictionary_append(result, args...);

    return result;
}

template <typename... Args>
adobe::array_t make_array(const Args&... args)
{
    adobe::array_t result;

    detail::make_array_append(result, args...);

    return result;
}

/****************************************************************************************************/

template <typename T>
struct save_restore
{
    save_restore(T& variable) :
        variable_m(variable),
        old_value_m(variable)
    { }

    virtual ~save_restore()
    {
        variable_m = old_value_m;
    }

protected:
    T& variable_m;

private:
    T  old_value_m;
};

/****************************************************************************************************/

template <typename T>
struct temp_assignment : public save_restore<T>
{
    temp_assignment(T& variable, const T& value) :
        save_restore<T>(variable)
    {
        this->variable_m = value;
    }
};

/****************************************************************************************************/
// BINLAYOUT_COMMON_HPP
#endif

/****************************************************************************************************/
