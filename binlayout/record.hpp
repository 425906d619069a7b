/*
    Copyright 2014 Adobe
    Distributed under the Boost Software License, Version 1.0.
    (See accompanying file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
*/
/****************************************************************************************************/

#ifndef BINLAYOUT_RECORD_HPP
#define BINLAYOUT_RECORD_HPP

// stdc++
#include <memory>
#include <vector>

// application
#include <binlayout/data_object.hpp>
#include <binlayout/sanitizer.hpp>

/****************************************************************************************************/
/*
    Ordered named fields, read and written in declaration order. Children are
    built on first access, so a recursive record type only grows as far as the
    data it describes.

    The names of an unnamed composite field are flattened into the record:
    they are listed, found, offset and snapshotted as if declared here.
    Hidden fields are left out of field_names() and snapshot() only.
*/
class record_t : public data_object_t
{
public:
    record_t(object_type_ptr_t   type,
             parameter_set_t     parameters,
             lazy_environment_t* parent);

    bool                       has_named_fields();
    std::vector<adobe::name_t> field_names();
    data_object_t*             find_field(adobe::name_t name);
    boost::uint64_t            offset_of(adobe::name_t name);
    std::string                debug_name_of(const data_object_t& child);

    // Assigns each entry of a dictionary to the field of that name.
    void assign(const adobe::any_regular_t& value);

    std::size_t    field_count() const { return fields_m.size(); }
    data_object_t& child(std::size_t index);

protected:
    void                 do_read(stream_t& input);
    void                 do_write(stream_t& output);
    boost::uint64_t      do_num_bytes();
    adobe::any_regular_t do_snapshot();
    void                 do_clear();
    bool                 do_is_clear();
    void                 copy_state(data_object_t& source);

private:
    sanitized_list_t               fields_m;
    std::vector<data_object_ptr_t> children_m;
};

/****************************************************************************************************/
// The built-in `record` type: mandatory `fields`, optional `endian` and `hide`.
object_type_ptr_t make_record_type();

// A named record type; its definition supplies the fields, and its own endian when it has one.
object_type_ptr_t make_record_type(adobe::name_t name, std::shared_ptr<const record_definition_t> definition);

bool is_reserved_name(adobe::name_t name);

/*
    Declaration time checks on a raw field list: duplicate names and reserved
    names, counting the names flattened in from unnamed records.
*/
void check_field_declarations(const adobe::array_t& declarations);

// The checks above plus a valid endian and resolvable field types.
void check_record_definition(const record_definition_t& definition);

/****************************************************************************************************/
// BINLAYOUT_RECORD_HPP
#endif

/****************************************************************************************************/
