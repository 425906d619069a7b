/*
    Copyright 2014 Adobe
    Distributed under the Boost Software License, Version 1.0.
    (See accompanying file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
*/
/****************************************************************************************************/

// gtest
#include <gtest/gtest.h>

// application
#include "test_helpers.hpp"

/****************************************************************************************************/

namespace {

/****************************************************************************************************/

class two_fields : public ::testing::Test
{
protected:
    void SetUp()
    {
        object_m = make_record(make_array(make_field("int8"_name, "a"_name),
                                          make_field("int8"_name, "b"_name)));

        set(*object_m, "a"_name, 1);
        set(*object_m, "b"_name, 2);
    }

    data_object_ptr_t object_m;
};

/****************************************************************************************************/

} // namespace

/****************************************************************************************************/

TEST_F(two_fields, num_bytes)
{
    EXPECT_EQ(object_m->num_bytes("a"_name), 1u);
    EXPECT_EQ(object_m->num_bytes("b"_name), 1u);
    EXPECT_EQ(object_m->num_bytes(), 2u);
}

/****************************************************************************************************/

TEST_F(two_fields, clear)
{
    set(*object_m, "a"_name, 6);

    object_m->clear();

    EXPECT_TRUE(object_m->is_clear());
    EXPECT_EQ(number(*object_m, "a"_name), 0.0);
}

/****************************************************************************************************/

TEST_F(two_fields, clear_individual_fields)
{
    set(*object_m, "a"_name, 6);
    set(*object_m, "b"_name, 7);

    object_m->clear("a"_name);

    EXPECT_TRUE(object_m->is_clear("a"_name));
    EXPECT_FALSE(object_m->is_clear("b"_name));
    EXPECT_FALSE(object_m->is_clear());
}

/****************************************************************************************************/

TEST_F(two_fields, write_in_declaration_order)
{
    EXPECT_EQ(to_bytes(*object_m), (rawbytes_t{ 0x01, 0x02 }));
}

/****************************************************************************************************/

TEST_F(two_fields, read_in_declaration_order)
{
    from_bytes(*object_m, rawbytes_t{ 0x03, 0x04 });

    EXPECT_EQ(number(*object_m, "a"_name), 3.0);
    EXPECT_EQ(number(*object_m, "b"_name), 4.0);
}

/****************************************************************************************************/

TEST_F(two_fields, snapshot)
{
    EXPECT_TRUE(object_m->snapshot() == adobe::any_regular_t(make_dictionary("a"_name, 1.0, "b"_name, 2.0)));
}

/****************************************************************************************************/

TEST_F(two_fields, field_names)
{
    EXPECT_EQ(object_m->field_names(), names("a"_name, "b"_name));
}

/****************************************************************************************************/

TEST_F(two_fields, unknown_field)
{
    EXPECT_EQ(object_m->find_field("does_not_exist"_name), static_cast<data_object_t*>(0));
    EXPECT_THROW(object_m->field("does_not_exist"_name), no_such_name_error_t);
    EXPECT_THROW(object_m->num_bytes("does_not_exist"_name), no_such_name_error_t);
}

/****************************************************************************************************/

TEST_F(two_fields, record_has_no_single_value)
{
    EXPECT_FALSE(object_m->single_value());
    EXPECT_THROW(object_m->value(), no_such_operation_error_t);
    EXPECT_THROW(object_m->element(0), no_such_operation_error_t);
}

/****************************************************************************************************/

TEST_F(two_fields, assign_a_dictionary)
{
    object_m->assign(adobe::any_regular_t(make_dictionary("b"_name, 9.0)));

    EXPECT_EQ(number(*object_m, "a"_name), 1.0);
    EXPECT_EQ(number(*object_m, "b"_name), 9.0);

    EXPECT_THROW(object_m->assign(adobe::any_regular_t(make_dictionary("c"_name, 9.0))), no_such_name_error_t);
    EXPECT_THROW(object_m->assign(adobe::any_regular_t(3.0)), invalid_parameter_error_t);
}

/****************************************************************************************************/

TEST_F(two_fields, clone_is_independent)
{
    data_object_ptr_t copy(object_m->clone());

    EXPECT_TRUE(copy->snapshot() == object_m->snapshot());

    set(*copy, "a"_name, 5);

    EXPECT_EQ(number(*copy, "a"_name), 5.0);
    EXPECT_EQ(number(*object_m, "a"_name), 1.0);
    EXPECT_EQ(copy->parent(), static_cast<data_object_t*>(0));
}

/****************************************************************************************************/

TEST_F(two_fields, debug_names)
{
    EXPECT_EQ(object_m->debug_name(), "obj");
    EXPECT_EQ(object_m->field("b"_name).debug_name(), "obj.b");
}

/****************************************************************************************************/
#if 0
#pragma mark -
#endif
/****************************************************************************************************/

namespace {

/****************************************************************************************************/

class hidden_fields : public ::testing::Test
{
protected:
    void SetUp()
    {
        object_m = make_record(make_array(make_field("int8"_name, "a"_name),
                                          make_field("int8"_name, "b"_name, make_dictionary("initial_value"_name, 10.0)),
                                          make_field("int8"_name, "c"_name),
                                          make_field("int8"_name, "d"_name, make_dictionary("value"_name, "b"_name))),
                               make_dictionary("hide"_name, make_array("b"_name, std::string("c"))));
    }

    data_object_ptr_t object_m;
};

/****************************************************************************************************/

} // namespace

/****************************************************************************************************/

TEST_F(hidden_fields, only_visible_names_are_listed)
{
    EXPECT_EQ(object_m->field_names(), names("a"_name, "d"_name));
}

/****************************************************************************************************/

TEST_F(hidden_fields, hidden_fields_stay_accessible)
{
    EXPECT_EQ(number(*object_m, "b"_name), 10.0);

    set(*object_m, "c"_name, 15);

    EXPECT_EQ(number(*object_m, "c"_name), 15.0);
}

/****************************************************************************************************/

TEST_F(hidden_fields, snapshot_leaves_hidden_fields_out)
{
    set(*object_m, "b"_name, 5);

    EXPECT_TRUE(object_m->snapshot() == adobe::any_regular_t(make_dictionary("a"_name, 0.0, "d"_name, 5.0)));
}

/****************************************************************************************************/

TEST_F(hidden_fields, hidden_fields_are_still_written)
{
    set(*object_m, "c"_name, 3);

    EXPECT_EQ(to_bytes(*object_m), (rawbytes_t{ 0x00, 0x0a, 0x03, 0x0a }));
}

/****************************************************************************************************/
#if 0
#pragma mark -
#endif
/****************************************************************************************************/

namespace {

/****************************************************************************************************/
// a, b { w, x = a by way of an extra parameter }, and an unnamed { y = parent.b.w, z }
data_object_ptr_t make_nested()
{
    adobe::dictionary_t inner1(record_type(make_array(make_field("int8"_name, "w"_name, make_dictionary("initial_value"_name, 3.0)),
                                                      make_field("int8"_name, "x"_name, make_dictionary("value"_name, "the_val"_name)))));

    inner1["the_val"_name] = adobe::any_regular_t("a"_name);

    adobe::dictionary_t inner2(record_type(make_array(make_field("int8"_name, "y"_name, make_dictionary("value"_name, make_expression("parent.b.w"))),
                                                      make_field("int8"_name, "z"_name))));

    return make_record(make_array(make_field("int8"_name, "a"_name, make_dictionary("initial_value"_name, 6.0)),
                                  make_field("record"_name, "b"_name, inner1),
                                  make_field("record"_name, adobe::name_t(), inner2)));
}

/****************************************************************************************************/

} // namespace

/****************************************************************************************************/

TEST(nested_record, field_names_include_unnamed_records)
{
    data_object_ptr_t object(make_nested());

    EXPECT_EQ(object->field_names(), names("a"_name, "b"_name, "y"_name, "z"_name));
}

/****************************************************************************************************/

TEST(nested_record, nested_fields)
{
    data_object_ptr_t object(make_nested());

    EXPECT_EQ(number(*object, "a"_name), 6.0);
    EXPECT_EQ(number(object->field("b"_name), "w"_name), 3.0);
    EXPECT_EQ(number(object->field("b"_name), "x"_name), 6.0);
    EXPECT_EQ(number(*object, "y"_name), 3.0);
}

/****************************************************************************************************/

TEST(nested_record, offsets)
{
    data_object_ptr_t object(make_nested());

    EXPECT_EQ(object->offset_of("a"_name), 0u);
    EXPECT_EQ(object->offset_of("b"_name), 1u);
    EXPECT_EQ(object->offset_of("y"_name), 3u);
    EXPECT_EQ(object->offset_of("z"_name), 4u);
    EXPECT_THROW(object->offset_of("does_not_exist"_name), no_such_name_error_t);
}

/****************************************************************************************************/

TEST(nested_record, unnamed_record_merges_into_snapshot)
{
    data_object_ptr_t object(make_nested());

    adobe::dictionary_t expected(make_dictionary("a"_name, 6.0,
                                                 "b"_name, make_dictionary("w"_name, 3.0, "x"_name, 6.0),
                                                 "y"_name, 3.0,
                                                 "z"_name, 0.0));

    EXPECT_TRUE(object->snapshot() == adobe::any_regular_t(expected));
}

/****************************************************************************************************/

TEST(nested_record, computed_fields_follow_their_source)
{
    data_object_ptr_t object(make_nested());

    set(*object, "a"_name, 9);
    set(object->field("b"_name), "w"_name, 4);

    EXPECT_EQ(number(object->field("b"_name), "x"_name), 9.0);
    EXPECT_EQ(number(*object, "y"_name), 4.0);
}

/****************************************************************************************************/
#if 0
#pragma mark -
#endif
/****************************************************************************************************/

TEST(record_endian, byte_order_is_carried_down)
{
    data_object_ptr_t object(make_record(
        make_array(make_field("uint16"_name, "a"_name),
                   make_field("float"_name, "b"_name),
                   make_field("array"_name, "c"_name, make_dictionary("type"_name, "int8"_name,
                                                                      "initial_length"_name, 2.0)),
                   make_field("choice"_name, "d"_name, make_dictionary("choices"_name, make_array(make_type("uint16"_name),
                                                                                                 "uint32"_name),
                                                                       "selection"_name, 1.0)),
                   make_field("record"_name, "e"_name, record_type(make_array(make_field("uint16"_name, "f"_name),
                                                                              make_field("uint32be"_name, "g"_name)))),
                   make_field("record"_name, "h"_name, record_type(make_array(make_field("record"_name, "i"_name,
                                                                                         record_type(make_array(make_field("uint16"_name, "j"_name)))))))),
        make_dictionary("endian"_name, "little"_name)));

    set(*object, "a"_name, 1);
    set(*object, "b"_name, 2.0);
    object->field("c"_name).element(0).assign(adobe::any_regular_t(3.0));
    object->field("c"_name).element(1).assign(adobe::any_regular_t(4.0));
    set(*object, "d"_name, 5);
    set(object->field("e"_name), "f"_name, 6);
    set(object->field("e"_name), "g"_name, 7);
    set(object->field("h"_name).field("i"_name), "j"_name, 8);

    rawbytes_t expected{ 0x01, 0x00,
                         0x00, 0x00, 0x00, 0x40,
                         0x03, 0x04,
                         0x05, 0x00, 0x00, 0x00,
                         0x06, 0x00,
                         0x00, 0x00, 0x00, 0x07,
                         0x08, 0x00 };

    EXPECT_EQ(to_bytes(*object), expected);
    EXPECT_EQ(object->num_bytes(), expected.size());
}

/****************************************************************************************************/

TEST(record_endian, record_endian_overrides_the_ambient_one)
{
    data_object_ptr_t object(make_record(
        make_array(make_field("uint16"_name, "a"_name),
                   make_field("record"_name, "b"_name, record_type(make_array(make_field("uint16"_name, "c"_name)),
                                                                   make_dictionary("endian"_name, std::string("big"))))),
        make_dictionary("endian"_name, "little"_name)));

    set(*object, "a"_name, 1);
    set(object->field("b"_name), "c"_name, 1);

    EXPECT_EQ(to_bytes(*object), (rawbytes_t{ 0x01, 0x00, 0x00, 0x01 }));
}

/****************************************************************************************************/

TEST(record_endian, unknown_endian)
{
    EXPECT_THROW(make_record(make_array(make_field("int8"_name, "a"_name)),
                             make_dictionary("endian"_name, std::string("a bad value"))),
                 invalid_parameter_error_t);
}

/****************************************************************************************************/
#if 0
#pragma mark -
#endif
/****************************************************************************************************/

TEST(record_declaration, duplicate_names)
{
    EXPECT_THROW(make_record(make_array(make_field("int8"_name, "a"_name),
                                        make_field("int8"_name, "b"_name),
                                        make_field("int8"_name, "a"_name))),
                 duplicate_field_name_error_t);
}

/****************************************************************************************************/

TEST(record_declaration, duplicate_names_through_unnamed_records)
{
    EXPECT_THROW(make_record(make_array(make_field("int8"_name, "a"_name),
                                        make_field("record"_name, adobe::name_t(),
                                                   record_type(make_array(make_field("int8"_name, "a"_name)))))),
                 duplicate_field_name_error_t);
}

/****************************************************************************************************/

TEST(record_declaration, reserved_names)
{
    const char* reserved[] = { "value", "snapshot", "num_bytes", "length", "parent", "index", "clear" };

    for (std::size_t i(0); i != sizeof(reserved) / sizeof(reserved[0]); ++i)
        EXPECT_THROW(make_record(make_array(make_field("int8"_name, "a"_name),
                                            make_field("int8"_name, adobe::name_t(reserved[i])))),
                     reserved_field_name_error_t) << reserved[i];
}

/****************************************************************************************************/

TEST(record_declaration, fields_must_be_declarations)
{
    EXPECT_THROW(make_record(make_array(3.0)), invalid_parameter_error_t);
}

/****************************************************************************************************/
