/*
    Copyright 2014 Adobe
    Distributed under the Boost Software License, Version 1.0.
    (See accompanying file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
*/
/****************************************************************************************************/

#ifndef BINLAYOUT_CHOICE_HPP
#define BINLAYOUT_CHOICE_HPP

// stdc++
#include <map>

// application
#include <binlayout/data_object.hpp>
#include <binlayout/sanitizer.hpp>

/****************************************************************************************************/
/*
    A tagged union. `selection` is evaluated on every operation and must be an
    integer in [0, choices); the alternative it names is built the first time
    it is selected and kept from then on, so switching back to an earlier
    selection finds that alternative's state untouched.

    Every operation goes to the selected alternative. clear() resets the
    selected alternative only.
*/
class choice_t : public data_object_t
{
public:
    choice_t(object_type_ptr_t   type,
             parameter_set_t     parameters,
             lazy_environment_t* parent);

    // Throws invalid_selection_error_t when out of range; nothing is built in that case.
    std::size_t    selection();
    data_object_t& current();

    std::size_t choice_count() const { return choices_m.size(); }
    bool        is_built(std::size_t index) const { return cache_m.count(index) != 0; }

    bool                 single_value();
    adobe::any_regular_t value();
    void                 assign(const adobe::any_regular_t& value);

    bool                       has_named_fields();
    std::vector<adobe::name_t> field_names();
    data_object_t*             find_field(adobe::name_t name);
    boost::uint64_t            offset_of(adobe::name_t name);
    std::string                debug_name_of(const data_object_t& child);

    data_object_t& element(std::size_t index);
    std::size_t    length();

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
    data_object_t& alternative(std::size_t index);

    typedef std::map<std::size_t, data_object_ptr_t> cache_t;

    sanitized_list_t choices_m;
    cache_t          cache_m;
    bool             selecting_m;
};

/****************************************************************************************************/
// The built-in `choice` type: mandatory `choices` and `selection`, optional `endian`.
object_type_ptr_t make_choice_type();

/****************************************************************************************************/
// BINLAYOUT_CHOICE_HPP
#endif

/****************************************************************************************************/
