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

TEST(environment, literals_are_returned_as_is)
{
    data_object_ptr_t object(make_object("int8"_name));

    EXPECT_EQ(object->environment().evaluate(adobe::any_regular_t(4.0)).cast<double>(), 4.0);
    EXPECT_EQ(object->environment().evaluate(adobe::any_regular_t(std::string("x"))).cast<std::string>(), "x");
}

/****************************************************************************************************/

TEST(environment, overrides_last_for_one_evaluation)
{
    data_object_ptr_t object(make_object("int8"_name));
    lazy_environment_t& environment(object->environment());

    EXPECT_EQ(environment.evaluate(adobe::any_regular_t(make_expression("x * 2")), make_dictionary("x"_name, 4.0)).cast<double>(), 8.0);
    EXPECT_THROW(environment.evaluate(adobe::any_regular_t(make_expression("x * 2"))), no_such_name_error_t);
}

/****************************************************************************************************/

TEST(environment, overrides_shadow_variables)
{
    data_object_ptr_t object(make_object("int8"_name));
    lazy_environment_t& environment(object->environment());

    environment.add_variable("x"_name, adobe::any_regular_t(1.0));

    EXPECT_EQ(environment.evaluate(adobe::any_regular_t("x"_name)).cast<double>(), 1.0);
    EXPECT_EQ(environment.evaluate(adobe::any_regular_t("x"_name), make_dictionary("x"_name, 2.0)).cast<double>(), 2.0);
}

/****************************************************************************************************/

TEST(environment, names_resolve_through_every_ancestor)
{
    // the innermost field refers to a field of its grandparent's sibling
    data_object_ptr_t object(make_record(
        make_array(make_field("uint8"_name, "top"_name, make_dictionary("initial_value"_name, 11.0)),
                   make_field("record"_name, "outer"_name,
                              record_type(make_array(make_field("record"_name, "inner"_name,
                                                                record_type(make_array(make_field("uint8"_name, "leaf"_name,
                                                                                                  make_dictionary("value"_name, make_expression("top + 1"))))))))))));

    EXPECT_EQ(number(object->field("outer"_name).field("inner"_name), "leaf"_name), 12.0);
}

/****************************************************************************************************/

TEST(environment, extra_parameters_are_evaluated_in_the_declaring_scope)
{
    adobe::dictionary_t inner(record_type(make_array(make_field("uint8"_name, "x"_name,
                                                                make_dictionary("value"_name, "factor"_name)))));

    inner["factor"_name] = adobe::any_regular_t(make_expression("a * 3"));

    data_object_ptr_t object(make_record(make_array(make_field("uint8"_name, "a"_name, make_dictionary("initial_value"_name, 2.0)),
                                                    make_field("record"_name, "b"_name, inner))));

    EXPECT_EQ(number(object->field("b"_name), "x"_name), 6.0);
}

/****************************************************************************************************/

TEST(environment, parent_skips_a_scope)
{
    data_object_ptr_t object(make_record(
        make_array(make_field("uint8"_name, "a"_name, make_dictionary("initial_value"_name, 1.0)),
                   make_field("record"_name, "b"_name,
                              record_type(make_array(make_field("uint8"_name, "a"_name, make_dictionary("initial_value"_name, 2.0)),
                                                     make_field("uint8"_name, "near"_name, make_dictionary("value"_name, "a"_name)),
                                                     make_field("uint8"_name, "far"_name, make_dictionary("value"_name, make_expression("parent.a")))))))));

    data_object_t& b(object->field("b"_name));

    EXPECT_EQ(number(b, "near"_name), 2.0);
    EXPECT_EQ(number(b, "far"_name), 1.0);
}

/****************************************************************************************************/

TEST(environment, operations_of_the_parent)
{
    data_object_ptr_t object(make_record(make_array(make_field("uint16le"_name, "a"_name),
                                                    make_field("uint8"_name, "size"_name,
                                                               make_dictionary("value"_name, make_expression("num_bytes"))))));

    EXPECT_EQ(number(*object, "size"_name), 3.0);
}

/****************************************************************************************************/

TEST(environment, unresolved_names)
{
    data_object_ptr_t object(make_record(make_array(make_field("uint8"_name, "a"_name,
                                                               make_dictionary("value"_name, "nope"_name)))));

    EXPECT_THROW(object->field("a"_name).value(), no_such_name_error_t);
    EXPECT_THROW(make_object("int8"_name)->environment().resolve("parent"_name), no_such_name_error_t);
}

/****************************************************************************************************/

TEST(environment, offset_of_is_speculative)
{
    data_object_ptr_t object(make_record(make_array(make_field("uint16le"_name, "a"_name),
                                                    make_field("uint8"_name, "b"_name),
                                                    make_field("uint8"_name, "c"_name,
                                                               make_dictionary("value"_name, make_expression("offset_of(@b)"))))));

    EXPECT_EQ(number(*object, "c"_name), 2.0);

    lazy_environment_t& environment(object->field("c"_name).environment());

    EXPECT_TRUE(environment.offset_of("b"_name) == boost::optional<boost::uint64_t>(2));
    EXPECT_FALSE(environment.offset_of("does_not_exist"_name));
    EXPECT_FALSE(object->environment().offset_of("a"_name));
}

/****************************************************************************************************/

TEST(environment, functions_on_objects)
{
    data_object_ptr_t object(make_record(make_array(make_field("record"_name, "header"_name,
                                                               record_type(make_array(make_field("uint32le"_name, "magic"_name),
                                                                                      make_field("uint8"_name, "flags"_name)))),
                                                    make_field("uint8"_name, "size"_name,
                                                               make_dictionary("value"_name, make_expression("num_bytes(header) + num_bytes(@size)"))))));

    EXPECT_EQ(number(*object, "size"_name), 6.0);
}

/****************************************************************************************************/

TEST(environment, dotted_access_into_objects)
{
    data_object_ptr_t object(make_record(make_array(make_field("record"_name, "header"_name,
                                                               record_type(make_array(make_field("uint8"_name, "kind"_name,
                                                                                                 make_dictionary("initial_value"_name, 4.0))))),
                                                    make_field("uint8"_name, "copy"_name,
                                                               make_dictionary("value"_name, make_expression("header.kind"))))));

    EXPECT_EQ(number(*object, "copy"_name), 4.0);
}

/****************************************************************************************************/

TEST(environment, failures_name_the_field)
{
    data_object_ptr_t object(make_record(make_array(make_field("uint8"_name, "a"_name,
                                                               make_dictionary("value"_name, make_expression("length(5)"))))));

    try
    {
        object->field("a"_name).value();

        FAIL() << "expected an evaluation error";
    }
    catch (const evaluation_error_t& error)
    {
        EXPECT_NE(std::string(error.what()).find("obj.a"), std::string::npos);
    }
}

/****************************************************************************************************/

TEST(environment, malformed_expressions)
{
    EXPECT_THROW(make_expression("a +"), invalid_parameter_error_t);
}

/****************************************************************************************************/
