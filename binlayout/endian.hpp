/*
    Copyright 2014 Adobe
    Distributed under the Boost Software License, Version 1.0.
    (See accompanying file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
*/
/****************************************************************************************************/

#ifndef BINLAYOUT_ENDIAN_HPP
#define BINLAYOUT_ENDIAN_HPP

// stdc++
#include <algorithm>

// boost
#include <boost/endian.hpp>
#include <boost/optional.hpp>

// asl
#include <adobe/any_regular.hpp>
#include <adobe/name.hpp>

/****************************************************************************************************/

enum class endian { little, big };

#if defined(BOOST_ENDIAN_LITTLE_BYTE)
    constexpr endian endian_k{endian::little};
#elif defined(BOOST_ENDIAN_BIG_BYTE)
    constexpr endian endian_k{endian::big};
#else
    #error Endianness not detected.
#endif

typedef boost::optional<endian> ambient_endian_t;

/****************************************************************************************************/
// Reorders host-ordered bytes into the requested order, or back again.
template <typename C>
void host_to_endian(C& c, endian order) {
    if (order != endian_k)
        std::reverse(std::begin(c), std::end(c));
}

/****************************************************************************************************/

adobe::name_t name_of(endian order);

// Accepts a name or a string of "little" or "big"; anything else is an invalid_parameter_error_t.
endian endian_from_value(const adobe::any_regular_t& value);

/****************************************************************************************************/
// BINLAYOUT_ENDIAN_HPP
#endif

/****************************************************************************************************/
