/*
    Copyright 2014 Adobe
    Distributed under the Boost Software License, Version 1.0.
    (See accompanying file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
*/
/****************************************************************************************************/

// stdc++
#include <limits>

// gtest
#include <gtest/gtest.h>

// application
#include "test_helpers.hpp"

/****************************************************************************************************/

TEST(primitive, default_value_is_zero_and_clear)
{
    data_object_ptr_t object(make_object("int32le"_name));

    EXPECT_EQ(number(*object), 0.0);
    EXPECT_TRUE(object->is_clear());
    EXPECT_EQ(object->num_bytes(), 4u);
    EXPECT_TRUE(object->single_value());
}

/****************************************************************************************************/

TEST(primitive, byte_order_of_integers)
{
    data_object_ptr_t little(make_object("uint32le"_name));
    data_object_ptr_t big(make_object("uint32be"_name));

    little->assign(adobe::any_regular_t(0x01020304));
    big->assign(adobe::any_regular_t(0x01020304));

    EXPECT_EQ(to_bytes(*little), (rawbytes_t{ 0x04, 0x03, 0x02, 0x01 }));
    EXPECT_EQ(to_bytes(*big), (rawbytes_t{ 0x01, 0x02, 0x03, 0x04 }));
}

/****************************************************************************************************/

TEST(primitive, decodes_signed_and_unsigned)
{
    data_object_ptr_t signed_value(make_object("int16be"_name));
    data_object_ptr_t unsigned_value(make_object("uint16be"_name));

    from_bytes(*signed_value, rawbytes_t{ 0xff, 0xfe });
    from_bytes(*unsigned_value, rawbytes_t{ 0xff, 0xfe });

    EXPECT_EQ(number(*signed_value), -2.0);
    EXPECT_EQ(number(*unsigned_value), 65534.0);
    EXPECT_FALSE(signed_value->is_clear());
}

/****************************************************************************************************/

TEST(primitive, floating_point_round_trip)
{
    data_object_ptr_t single(make_object("float_le"_name));
    data_object_ptr_t twice(make_object("double_be"_name));

    single->assign(adobe::any_regular_t(2.0));
    twice->assign(adobe::any_regular_t(-0.5));

    EXPECT_EQ(to_bytes(*single), (rawbytes_t{ 0x00, 0x00, 0x00, 0x40 }));
    EXPECT_EQ(to_bytes(*twice), (rawbytes_t{ 0xbf, 0xe0, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00 }));

    data_object_ptr_t decoded(make_object("double_be"_name));

    from_bytes(*decoded, to_bytes(*twice));

    EXPECT_EQ(number(*decoded), -0.5);
}

/****************************************************************************************************/

TEST(primitive, encoding_wraps_modulo_width)
{
    data_object_ptr_t byte(make_object("uint8"_name));

    byte->assign(adobe::any_regular_t(261.0));

    EXPECT_EQ(to_bytes(*byte), rawbytes_t{ 0x05 });

    byte->assign(adobe::any_regular_t(-1.0));

    EXPECT_EQ(to_bytes(*byte), rawbytes_t{ 0xff });
}

/****************************************************************************************************/

TEST(primitive, sixty_four_bit_limits_round_trip)
{
    const rawbytes_t unsigned_max{ 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff };
    const rawbytes_t signed_min{ 0x80, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00 };
    const rawbytes_t signed_max{ 0x7f, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff };

    data_object_ptr_t unsigned_value(make_object("uint64le"_name));
    data_object_ptr_t signed_value(make_object("int64be"_name));

    from_bytes(*unsigned_value, unsigned_max);

    EXPECT_EQ(to_bytes(*unsigned_value), unsigned_max);

    from_bytes(*signed_value, signed_min);

    EXPECT_EQ(number(*signed_value), -9223372036854775808.0);
    EXPECT_EQ(to_bytes(*signed_value), signed_min);

    from_bytes(*signed_value, signed_max);

    EXPECT_EQ(to_bytes(*signed_value), signed_max);

    signed_value->assign(adobe::any_regular_t(-1.0e30));

    EXPECT_EQ(to_bytes(*signed_value), signed_min);
}

/****************************************************************************************************/

TEST(primitive, non_finite_integers_are_rejected)
{
    data_object_ptr_t value(make_object("uint32le"_name));

    value->assign(adobe::any_regular_t(std::numeric_limits<double>::infinity()));

    EXPECT_THROW(to_bytes(*value), invalid_parameter_error_t);

    value->assign(adobe::any_regular_t(std::numeric_limits<double>::quiet_NaN()));

    EXPECT_THROW(to_bytes(*value), invalid_parameter_error_t);

    data_object_ptr_t single(make_object("float_be"_name));

    single->assign(adobe::any_regular_t(1.0e300));

    EXPECT_EQ(to_bytes(*single), (rawbytes_t{ 0x7f, 0x80, 0x00, 0x00 }));
}

/****************************************************************************************************/

TEST(primitive, initial_value_until_assigned_or_read)
{
    data_object_ptr_t object(make_object("int8"_name, make_dictionary("initial_value"_name, 6.0)));

    EXPECT_EQ(number(*object), 6.0);
    EXPECT_TRUE(object->is_clear());

    object->assign(adobe::any_regular_t(9.0));

    EXPECT_EQ(number(*object), 9.0);

    object->clear();

    EXPECT_EQ(number(*object), 6.0);

    from_bytes(*object, rawbytes_t{ 0x02 });

    EXPECT_EQ(number(*object), 2.0);
}

/****************************************************************************************************/

TEST(primitive, booleans_are_stored_as_numbers)
{
    data_object_ptr_t object(make_object("uint8"_name));

    object->assign(adobe::any_regular_t(true));

    EXPECT_EQ(number(*object), 1.0);
}

/****************************************************************************************************/

TEST(primitive, non_numbers_are_rejected)
{
    data_object_ptr_t object(make_object("uint8"_name));

    EXPECT_THROW(object->assign(adobe::any_regular_t(std::string("abc"))), invalid_parameter_error_t);
}

/****************************************************************************************************/

TEST(primitive, short_read_fails)
{
    data_object_ptr_t object(make_object("uint32le"_name));

    EXPECT_THROW(from_bytes(*object, rawbytes_t{ 0x01, 0x02 }), end_of_stream_error_t);
}

/****************************************************************************************************/

TEST(primitive, check_value_accepts_equal_and_true_results)
{
    data_object_ptr_t equal(make_object("uint8"_name, make_dictionary("check_value"_name, 7.0)));

    EXPECT_NO_THROW(from_bytes(*equal, rawbytes_t{ 0x07 }));
    EXPECT_THROW(from_bytes(*equal, rawbytes_t{ 0x08 }), validity_error_t);

    data_object_ptr_t predicate(make_object("uint8"_name,
                                            make_dictionary("check_value"_name, make_expression("value > 3"))));

    EXPECT_NO_THROW(from_bytes(*predicate, rawbytes_t{ 0x04 }));
    EXPECT_THROW(from_bytes(*predicate, rawbytes_t{ 0x03 }), validity_error_t);
}

/****************************************************************************************************/

TEST(primitive, inactive_objects_do_nothing)
{
    data_object_ptr_t object(make_object("uint16le"_name, make_dictionary("onlyif"_name, false)));

    object->assign(adobe::any_regular_t(3.0));

    EXPECT_EQ(object->num_bytes(), 0u);
    EXPECT_TRUE(to_bytes(*object).empty());
    EXPECT_TRUE(is_nil(object->snapshot()));

    from_bytes(*object, rawbytes_t{ 0x01, 0x00 });

    EXPECT_EQ(number(*object), 3.0);
}

/****************************************************************************************************/

TEST(primitive, readwrite_false_skips_io_but_keeps_the_value)
{
    data_object_ptr_t object(make_object("uint16le"_name,
                                         make_dictionary("readwrite"_name, false, "initial_value"_name, 4.0)));

    EXPECT_EQ(object->num_bytes(), 0u);
    EXPECT_TRUE(to_bytes(*object).empty());
    EXPECT_EQ(object->snapshot().cast<double>(), 4.0);
}

/****************************************************************************************************/

TEST(primitive, named_operations_are_not_supported)
{
    data_object_ptr_t object(make_object("int8"_name));

    EXPECT_THROW(object->num_bytes("a"_name), no_such_operation_error_t);
    EXPECT_THROW(object->clear("a"_name), no_such_operation_error_t);
    EXPECT_THROW(object->field_names(), no_such_operation_error_t);
    EXPECT_THROW(object->offset_of("a"_name), no_such_operation_error_t);
    EXPECT_THROW(object->element(0), no_such_operation_error_t);
}

/****************************************************************************************************/
#if 0
#pragma mark -
#endif
/****************************************************************************************************/

TEST(string, padded_to_length)
{
    data_object_ptr_t object(make_object("string"_name, make_dictionary("length"_name, 5.0)));

    object->assign(adobe::any_regular_t(std::string("abc")));

    EXPECT_EQ(object->num_bytes(), 5u);
    EXPECT_EQ(to_bytes(*object), (rawbytes_t{ 'a', 'b', 'c', 0, 0 }));
}

/****************************************************************************************************/

TEST(string, truncated_to_length)
{
    data_object_ptr_t object(make_object("string"_name, make_dictionary("length"_name, 2.0)));

    object->assign(adobe::any_regular_t(std::string("abc")));

    EXPECT_EQ(object->value().cast<std::string>(), "ab");
}

/****************************************************************************************************/

TEST(string, pad_char_and_trim_padding)
{
    data_object_ptr_t object(make_object("string"_name, make_dictionary("length"_name, 6.0,
                                                                        "pad_char"_name, std::string(" "),
                                                                        "trim_padding"_name, true)));

    from_bytes(*object, rawbytes_t{ 'a', 'b', ' ', ' ', ' ', ' ' });

    EXPECT_EQ(object->value().cast<std::string>(), "ab");

    object->assign(adobe::any_regular_t(std::string("xyz")));

    EXPECT_EQ(to_bytes(*object), (rawbytes_t{ 'x', 'y', 'z', ' ', ' ', ' ' }));
}

/****************************************************************************************************/

TEST(string, read_length_bounds_the_read)
{
    data_object_ptr_t object(make_object("string"_name, make_dictionary("read_length"_name, 3.0)));

    from_bytes(*object, rawbytes_t{ 'a', 'b', 'c', 'd' });

    EXPECT_EQ(object->value().cast<std::string>(), "abc");
}

/****************************************************************************************************/

TEST(string, bad_pad_char)
{
    data_object_ptr_t object(make_object("string"_name, make_dictionary("length"_name, 3.0,
                                                                        "pad_char"_name, std::string("ab"))));

    EXPECT_THROW(object->value(), invalid_parameter_error_t);
}

/****************************************************************************************************/
