/*
    Copyright 2014 Adobe
    Distributed under the Boost Software License, Version 1.0.
    (See accompanying file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
*/
/**************************************************************************************************/

#ifndef BINLAYOUT_STRING_HPP
#define BINLAYOUT_STRING_HPP

// stdc++
#include <cstring>
#include <string>

// boost
#include <boost/cstdint.hpp>
#include <boost/lexical_cast.hpp>

// asl
#include <adobe/name.hpp>

/**************************************************************************************************/

namespace detail {

/**************************************************************************************************/

inline std::string make_string_piece(const char* value)
{
    return std::string(value);
}

inline std::string make_string_piece(const std::string& value)
{
    return value;
}

inline std::string make_string_piece(adobe::name_t value)
{
    return value ? std::string(value.c_str()) : std::string("<unnamed>");
}

inline std::string make_string_piece(int value)
{
    return boost::lexical_cast<std::string>(value);
}

inline std::string make_string_piece(boost::uint64_t value)
{
    return boost::lexical_cast<std::string>(value);
}

inline std::string make_string_piece(boost::int64_t value)
{
    return boost::lexical_cast<std::string>(value);
}

inline std::string make_string_piece(double value)
{
    return boost::lexical_cast<std::string>(value);
}

/**************************************************************************************************/

template <typename T>
inline void make_string_append(std::string& result, const T& value)
{
    result += make_string_piece(value);
}

template <typename T, typename... Args>
inline void make_string_append(std::string& result, const T& first, const Args&... args)
{
    make_string_append(result, first);

    make_string_append(result, args...);
}

/**************************************************************************************************/

} // namespace detail

/**************************************************************************************************/

template <typename T, typename... Args>
inline std::string make_string(const T& first, const Args&... args)
{
    std::string result;

    result.reserve(64);

    detail::make_string_append(result, first, args...);

    return result;
}

/**************************************************************************************************/
// BINLAYOUT_STRING_HPP
#endif

/**************************************************************************************************/
