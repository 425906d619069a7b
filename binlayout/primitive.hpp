/*
    Copyright 2014 Adobe
    Distributed under the Boost Software License, Version 1.0.
    (See accompanying file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
*/
/****************************************************************************************************/

#ifndef BINLAYOUT_PRIMITIVE_HPP
#define BINLAYOUT_PRIMITIVE_HPP

// stdc++
#include <string>

// boost
#include <boost/optional.hpp>

// application
#include <binlayout/data_object.hpp>
#include <binlayout/endian.hpp>

/****************************************************************************************************/

enum atom_base_type_t
{
    atom_unknown_k = 0,
    atom_signed_k,
    atom_unsigned_k,
    atom_float_k
};

/****************************************************************************************************/
/*
    A leaf holding one scalar. Its value is, in order of precedence: the
    `value` parameter (computed on every access), the value last read or
    assigned, the `initial_value` parameter, the type's default.

    The one exception: until the read of the whole tree completes, a computed
    field that has been read yields the value read, so later fields of the
    same read (lengths, selections) see what is in the stream.
*/
class primitive_t : public data_object_t
{
public:
    primitive_t(object_type_ptr_t   type,
                parameter_set_t     parameters,
                lazy_environment_t* parent);

    bool                 single_value();
    adobe::any_regular_t value();
    void                 assign(const adobe::any_regular_t& value);

protected:
    adobe::any_regular_t do_snapshot();
    void                 do_clear();
    bool                 do_is_clear();
    void                 done_read();
    void                 copy_state(data_object_t& source);

    adobe::any_regular_t raw_value();

    // converts an assigned value to the stored representation, or throws
    virtual adobe::any_regular_t coerce(const adobe::any_regular_t& value) = 0;
    virtual adobe::any_regular_t default_value() = 0;

    boost::optional<adobe::any_regular_t> stored_m;
};

/****************************************************************************************************/
// Fixed width integer or floating point number in a fixed byte order.
class atom_t : public primitive_t
{
public:
    atom_t(object_type_ptr_t   type,
           parameter_set_t     parameters,
           lazy_environment_t* parent,
           atom_base_type_t    base_type,
           std::size_t         bit_count,
           endian              order);

protected:
    void                 do_read(stream_t& input);
    void                 do_write(stream_t& output);
    boost::uint64_t      do_num_bytes();
    adobe::any_regular_t coerce(const adobe::any_regular_t& value);
    adobe::any_regular_t default_value();

private:
    atom_base_type_t base_type_m;
    std::size_t      bit_count_m;
    endian           order_m;
};

/****************************************************************************************************/
/*
    Byte string. With `length` the value is padded with `pad_char` or truncated
    to that many bytes; `read_length` only bounds what read consumes. With
    `trim_padding` trailing pad characters are dropped from the value.
*/
class string_t : public primitive_t
{
public:
    string_t(object_type_ptr_t   type,
             parameter_set_t     parameters,
             lazy_environment_t* parent);

    adobe::any_regular_t value();

protected:
    void                 do_read(stream_t& input);
    void                 do_write(stream_t& output);
    boost::uint64_t      do_num_bytes();
    adobe::any_regular_t coerce(const adobe::any_regular_t& value);
    adobe::any_regular_t default_value();

private:
    std::string padded();
    char        pad_char();
};

/****************************************************************************************************/

object_type_ptr_t make_atom_type(adobe::name_t    name,
                                 atom_base_type_t base_type,
                                 std::size_t      bit_count,
                                 endian           order);

object_type_ptr_t make_string_type();

/****************************************************************************************************/

rawbytes_t           encode_atom(const adobe::any_regular_t& value,
                                 std::size_t                 bit_count,
                                 atom_base_type_t            base_type,
                                 endian                      order);
adobe::any_regular_t decode_atom(const rawbytes_t& raw,
                                 std::size_t       bit_count,
                                 atom_base_type_t  base_type,
                                 endian            order);

/****************************************************************************************************/
// BINLAYOUT_PRIMITIVE_HPP
#endif

/****************************************************************************************************/
