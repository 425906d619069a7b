/*
    Copyright 2014 Adobe
    Distributed under the Boost Software License, Version 1.0.
    (See accompanying file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
*/
/****************************************************************************************************/

// identity
#include <binlayout/primitive.hpp>

// stdc++
#include <cmath>
#include <cstring>
#include <limits>
#include <memory>
#include <stdexcept>

// boost
#include <boost/cstdint.hpp>
#include <boost/static_assert.hpp>

// application
#include <binlayout/common.hpp>
#include <binlayout/error.hpp>

/****************************************************************************************************/

namespace {

/****************************************************************************************************/

template <typename T>
inline adobe::any_regular_t convert_raw(const rawbytes_t& raw)
{
    T value;

    std::memcpy(&value, &raw[0], sizeof(T));

    return adobe::any_regular_t(static_cast<double>(value));
}

inline adobe::any_regular_t convert_raw(const rawbytes_t& raw,
                                        std::size_t       bit_count,
                                        atom_base_type_t  base_type)
{
    if (base_type == atom_unknown_k)
    {
        throw std::runtime_error("convert_raw: unknown atom base type");
    }
    else if (base_type == atom_float_k)
    {
        BOOST_STATIC_ASSERT((sizeof(float) == 4));
        BOOST_STATIC_ASSERT((sizeof(double) == 8));

        if (bit_count == 32)
            return convert_raw<float>(raw);
        else if (bit_count == 64)
            return convert_raw<double>(raw);
        else
            throw std::runtime_error("convert_raw: float atom of specified bit count not supported.");
    }
    else if (bit_count == 8)
    {
        if (base_type == atom_signed_k)
            return convert_raw<boost::int8_t>(raw);
        else if (base_type == atom_unsigned_k)
            return convert_raw<boost::uint8_t>(raw);
    }
    else if (bit_count == 16)
    {
        if (base_type == atom_signed_k)
            return convert_raw<boost::int16_t>(raw);
        else if (base_type == atom_unsigned_k)
            return convert_raw<boost::uint16_t>(raw);
    }
    else if (bit_count == 32)
    {
        if (base_type == atom_signed_k)
            return convert_raw<boost::int32_t>(raw);
        else if (base_type == atom_unsigned_k)
            return convert_raw<boost::uint32_t>(raw);
    }
    else if (bit_count == 64)
    {
        if (base_type == atom_signed_k)
            return convert_raw<boost::int64_t>(raw);
        else if (base_type == atom_unsigned_k)
            return convert_raw<boost::uint64_t>(raw);
    }

    throw std::runtime_error("convert_raw: invalid bit count");
}

/****************************************************************************************************/

template <typename T>
inline rawbytes_t raw_from(T value)
{
    rawbytes_t result(sizeof(T), 0);

    std::memcpy(&result[0], &value, sizeof(T));

    return result;
}

const double two_to_32_k(4294967296.0);
const double two_to_63_k(9223372036854775808.0);
const double two_to_64_k(18446744073709551616.0);

// Finite values beyond float's range become infinities, the way an IEEE store overflows.
inline float narrow_to_float(double value)
{
    if (value > std::numeric_limits<float>::max())
        return std::numeric_limits<float>::infinity();
    else if (value < -std::numeric_limits<float>::max())
        return -std::numeric_limits<float>::infinity();

    return static_cast<float>(value);
}

/*
    Integers of up to 32 bits wrap modulo 2^bit_count. A double cannot carry
    every 64-bit integer, so 64-bit atoms saturate at the limits of their
    type instead; the largest values decode and encode back unchanged.
*/
inline boost::uint64_t integer_bits(double value, std::size_t bit_count, atom_base_type_t base_type)
{
    if (!std::isfinite(value))
        throw invalid_parameter_error_t(make_string("cannot encode ", value, " as an integer"));

    value = std::trunc(value);

    if (bit_count != 64)
        return static_cast<boost::uint64_t>(static_cast<boost::int64_t>(std::fmod(value, two_to_32_k)));

    if (value < -two_to_63_k)
        return static_cast<boost::uint64_t>(std::numeric_limits<boost::int64_t>::min());

    if (value < 0)
        return static_cast<boost::uint64_t>(static_cast<boost::int64_t>(value));

    if (base_type == atom_signed_k)
        return value >= two_to_63_k ?
                   static_cast<boost::uint64_t>(std::numeric_limits<boost::int64_t>::max()) :
                   static_cast<boost::uint64_t>(value);

    return value >= two_to_64_k ? std::numeric_limits<boost::uint64_t>::max() : static_cast<boost::uint64_t>(value);
}

inline rawbytes_t convert_value(double value, std::size_t bit_count, atom_base_type_t base_type)
{
    if (base_type == atom_float_k)
    {
        if (bit_count == 32)
            return raw_from(narrow_to_float(value));
        else if (bit_count == 64)
            return raw_from(value);

        throw std::runtime_error("convert_value: float atom of specified bit count not supported.");
    }

    boost::uint64_t bits(integer_bits(value, bit_count, base_type));

    if (bit_count == 8)
        return raw_from(static_cast<boost::uint8_t>(bits));
    else if (bit_count == 16)
        return raw_from(static_cast<boost::uint16_t>(bits));
    else if (bit_count == 32)
        return raw_from(static_cast<boost::uint32_t>(bits));
    else if (bit_count == 64)
        return raw_from(bits);

    throw std::runtime_error("convert_value: invalid bit count");
}

/****************************************************************************************************/

parameter_contract_t primitive_contract()
{
    parameter_contract_t result(base_contract());

    result.optional(key_value)
          .optional(key_initial_value)
          .optional(key_check_value)
          .exclusive(key_value, key_initial_value);

    return result;
}

/****************************************************************************************************/

} // namespace

/****************************************************************************************************/

rawbytes_t encode_atom(const adobe::any_regular_t& value,
                       std::size_t                 bit_count,
                       atom_base_type_t            base_type,
                       endian                      order)
{
    rawbytes_t result(convert_value(number_of(value, "atom value"), bit_count, base_type));

    host_to_endian(result, order);

    return result;
}

/****************************************************************************************************/

adobe::any_regular_t decode_atom(const rawbytes_t& raw,
                                 std::size_t       bit_count,
                                 atom_base_type_t  base_type,
                                 endian            order)
{
    rawbytes_t byte_set(raw);

    if (byte_set.size() * 8 != bit_count)
        throw std::runtime_error("decode_atom: byte count does not match bit count");

    host_to_endian(byte_set, order);

    return convert_raw(byte_set, bit_count, base_type);
}

/****************************************************************************************************/
#if 0
#pragma mark -
#endif
/****************************************************************************************************/

primitive_t::primitive_t(object_type_ptr_t   type,
                         parameter_set_t     parameters,
                         lazy_environment_t* parent) :
    data_object_t(std::move(type), std::move(parameters), parent)
{ }

/****************************************************************************************************/

bool primitive_t::single_value()
{
    return true;
}

/****************************************************************************************************/

adobe::any_regular_t primitive_t::value()
{
    return raw_value();
}

/****************************************************************************************************/

adobe::any_regular_t primitive_t::raw_value()
{
    // while the tree is being read, a computed field yields what was read
    if (has_parameter(key_value) && !(stored_m && reading()))
        return coerce(evaluate_parameter(key_value));

    if (stored_m)
        return *stored_m;

    if (has_parameter(key_initial_value))
        return coerce(evaluate_parameter(key_initial_value));

    return default_value();
}

/****************************************************************************************************/

void primitive_t::assign(const adobe::any_regular_t& value)
{
    stored_m = coerce(value);
}

/****************************************************************************************************/

adobe::any_regular_t primitive_t::do_snapshot()
{
    return value();
}

/****************************************************************************************************/

void primitive_t::do_clear()
{
    stored_m.reset();
}

/****************************************************************************************************/

bool primitive_t::do_is_clear()
{
    return !stored_m;
}

/****************************************************************************************************/

void primitive_t::done_read()
{
    if (!has_parameter(key_check_value))
        return;

    adobe::any_regular_t current(value());
    adobe::any_regular_t expected(evaluate_parameter(key_check_value, make_dictionary(key_value, current)));

    if (expected.type_info() == typeid(bool))
    {
        if (!expected.cast<bool>())
            throw validity_error_t(make_string("value ", describe(current), " not as expected in ", debug_name()));
    }
    else if (expected != current)
    {
        throw validity_error_t(make_string("value is ",
                                           describe(current),
                                           " but expected ",
                                           describe(expected),
                                           " in ",
                                           debug_name()));
    }
}

/****************************************************************************************************/

void primitive_t::copy_state(data_object_t& source)
{
    stored_m = static_cast<primitive_t&>(source).stored_m;
}

/****************************************************************************************************/
#if 0
#pragma mark -
#endif
/****************************************************************************************************/

atom_t::atom_t(object_type_ptr_t   type,
               parameter_set_t     parameters,
               lazy_environment_t* parent,
               atom_base_type_t    base_type,
               std::size_t         bit_count,
               endian              order) :
    primitive_t(std::move(type), std::move(parameters), parent),
    base_type_m(base_type),
    bit_count_m(bit_count),
    order_m(order)
{ }

/****************************************************************************************************/

void atom_t::do_read(stream_t& input)
{
    stored_m = decode_atom(input.read(bit_count_m / 8), bit_count_m, base_type_m, order_m);
}

/****************************************************************************************************/

void atom_t::do_write(stream_t& output)
{
    output.write(encode_atom(value(), bit_count_m, base_type_m, order_m));
}

/****************************************************************************************************/

boost::uint64_t atom_t::do_num_bytes()
{
    return bit_count_m / 8;
}

/****************************************************************************************************/

adobe::any_regular_t atom_t::coerce(const adobe::any_regular_t& value)
{
    if (value.type_info() == typeid(bool))
        return adobe::any_regular_t(value.cast<bool>() ? 1.0 : 0.0);

    return adobe::any_regular_t(number_of(value, debug_name()));
}

/****************************************************************************************************/

adobe::any_regular_t atom_t::default_value()
{
    return adobe::any_regular_t(0.0);
}

/****************************************************************************************************/
#if 0
#pragma mark -
#endif
/****************************************************************************************************/

string_t::string_t(object_type_ptr_t   type,
                   parameter_set_t     parameters,
                   lazy_environment_t* parent) :
    primitive_t(std::move(type), std::move(parameters), parent)
{ }

/****************************************************************************************************/

adobe::any_regular_t string_t::value()
{
    std::string result(padded());

    if (truthy(evaluate_parameter(key_trim_padding)))
    {
        std::string::size_type end(result.find_last_not_of(pad_char()));

        result.erase(end == std::string::npos ? 0 : end + 1);
    }

    return adobe::any_regular_t(result);
}

/****************************************************************************************************/

std::string string_t::padded()
{
    std::string result(raw_value().cast<std::string>());

    if (has_parameter(key_length))
        result.resize(count_of(evaluate_parameter(key_length), debug_name() + " length"), pad_char());

    return result;
}

/****************************************************************************************************/

char string_t::pad_char()
{
    adobe::any_regular_t pad(evaluate_parameter(key_pad_char));

    if (pad.type_info() == typeid(std::string))
    {
        const std::string& text(pad.cast<std::string>());

        if (text.size() != 1)
            throw invalid_parameter_error_t(make_string("pad_char must be a single character in ", debug_name()));

        return text[0];
    }

    return static_cast<char>(count_of(pad, debug_name() + " pad_char"));
}

/****************************************************************************************************/

void string_t::do_read(stream_t& input)
{
    boost::uint64_t length(0);

    if (has_parameter(key_read_length))
        length = count_of(evaluate_parameter(key_read_length), debug_name() + " read_length");
    else
        length = padded().size();

    rawbytes_t raw(input.read(length));

    stored_m = adobe::any_regular_t(std::string(raw.begin(), raw.end()));
}

/****************************************************************************************************/

void string_t::do_write(stream_t& output)
{
    std::string bytes(padded());

    output.write(rawbytes_t(bytes.begin(), bytes.end()));
}

/****************************************************************************************************/

boost::uint64_t string_t::do_num_bytes()
{
    return padded().size();
}

/****************************************************************************************************/

adobe::any_regular_t string_t::coerce(const adobe::any_regular_t& value)
{
    if (value.type_info() != typeid(std::string))
        throw invalid_parameter_error_t(make_string("expected a string but got ",
                                                    describe(value),
                                                    " in ",
                                                    debug_name()));

    return value;
}

/****************************************************************************************************/

adobe::any_regular_t string_t::default_value()
{
    return adobe::any_regular_t(std::string());
}

/****************************************************************************************************/
#if 0
#pragma mark -
#endif
/****************************************************************************************************/

object_type_ptr_t make_atom_type(adobe::name_t    name,
                                 atom_base_type_t base_type,
                                 std::size_t      bit_count,
                                 endian           order)
{
    std::shared_ptr<object_type_t> result(std::make_shared<object_type_t>());

    result->name_m = name;
    result->contract_m = primitive_contract();
    result->construct_m = [base_type, bit_count, order](object_type_ptr_t   type,
                                                        parameter_set_t     parameters,
                                                        lazy_environment_t* parent)
    {
        return data_object_ptr_t(new atom_t(std::move(type),
                                            std::move(parameters),
                                            parent,
                                            base_type,
                                            bit_count,
                                            order));
    };

    return result;
}

/****************************************************************************************************/

object_type_ptr_t make_string_type()
{
    std::shared_ptr<object_type_t> result(std::make_shared<object_type_t>());

    result->name_m = value_string;
    result->contract_m = primitive_contract();
    result->contract_m.optional(key_length)
                      .optional(key_read_length)
                      .default_value(key_pad_char, adobe::any_regular_t(0.0))
                      .default_value(key_trim_padding, adobe::any_regular_t(false))
                      .exclusive(key_length, key_read_length);
    result->construct_m = &construct_object<string_t>;

    return result;
}

/****************************************************************************************************/
