/*
    Copyright 2014 Adobe
    Distributed under the Boost Software License, Version 1.0.
    (See accompanying file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
*/
/****************************************************************************************************/

#ifndef BINLAYOUT_REPEAT_HPP
#define BINLAYOUT_REPEAT_HPP

// stdc++
#include <vector>

// application
#include <binlayout/data_object.hpp>
#include <binlayout/sanitizer.hpp>

/****************************************************************************************************/
/*
    A homogeneous sequence. Until it is read or assigned, the sequence holds
    `initial_length` elements (none without it), built on first access. Each
    element's environment holds its position as the variable `index`.

    Reading with `read_until` appends and reads elements until the expression
    is true for the element just read; it sees `element`, `index` and `array`.
*/
class repeat_t : public data_object_t
{
public:
    repeat_t(object_type_ptr_t   type,
             parameter_set_t     parameters,
             lazy_environment_t* parent);

    data_object_t& element(std::size_t index);
    std::size_t    length();
    data_object_t& append();

    // Replaces the elements with one per entry of an array.
    void assign(const adobe::any_regular_t& value);

    std::string debug_name_of(const data_object_t& child);

    boost::optional<adobe::any_regular_t> invoke_operation(adobe::name_t name);

protected:
    void                 do_read(stream_t& input);
    void                 do_write(stream_t& output);
    boost::uint64_t      do_num_bytes();
    adobe::any_regular_t do_snapshot();
    void                 do_clear();
    bool                 do_is_clear();
    void                 copy_state(data_object_t& source);

private:
    void           materialize();
    data_object_t& push_element();

    sanitized_list_t               element_type_m;
    std::vector<data_object_ptr_t> elements_m;
    bool                           materialized_m;
};

/****************************************************************************************************/
// The built-in `array` type: mandatory `type`, optional `initial_length` or `read_until`, `endian`.
object_type_ptr_t make_repeat_type();

/****************************************************************************************************/
// BINLAYOUT_REPEAT_HPP
#endif

/****************************************************************************************************/
