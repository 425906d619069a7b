/*
    Copyright 2014 Adobe
    Distributed under the Boost Software License, Version 1.0.
    (See accompanying file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
*/
/****************************************************************************************************/

#ifndef BINLAYOUT_DATA_OBJECT_HPP
#define BINLAYOUT_DATA_OBJECT_HPP

// stdc++
#include <string>
#include <utility>
#include <vector>

// boost
#include <boost/cstdint.hpp>
#include <boost/noncopyable.hpp>
#include <boost/optional.hpp>

// asl
#include <adobe/any_regular.hpp>
#include <adobe/dictionary.hpp>
#include <adobe/name.hpp>

// application
#include <binlayout/environment.hpp>
#include <binlayout/parameters.hpp>
#include <binlayout/stream.hpp>
#include <binlayout/type.hpp>

/****************************************************************************************************/
/*
    A node of a declared binary layout. Every operation is gated by the object
    being active (the `onlyif` parameter): an inactive object reads and writes
    nothing, is zero bytes long and snapshots to nil.

    Operations that make no sense for a kind (named access on a primitive, a
    scalar value of a record) throw no_such_operation_error_t.
*/
class data_object_t : boost::noncopyable
{
public:
    data_object_t(object_type_ptr_t   type,
                  parameter_set_t     parameters,
                  lazy_environment_t* parent);

    virtual ~data_object_t();

    void read(stream_t& input);
    void write(stream_t& output);

    boost::uint64_t num_bytes();
    boost::uint64_t num_bytes(adobe::name_t name);

    // nil when inactive
    adobe::any_regular_t snapshot();

    void clear();
    void clear(adobe::name_t name);
    bool is_clear();
    bool is_clear(adobe::name_t name);

    virtual boost::uint64_t offset_of(adobe::name_t name);

    std::string         debug_name();
    virtual std::string debug_name_of(const data_object_t& child);

    bool is_active();

    // True while a read of the tree this object belongs to is in progress.
    bool reading();

    virtual bool                 single_value();
    virtual adobe::any_regular_t value();
    virtual void                 assign(const adobe::any_regular_t& value);

    virtual bool                       has_named_fields();
    virtual std::vector<adobe::name_t> field_names();
    virtual data_object_t*             find_field(adobe::name_t name); // null when absent

    // find_field that throws no_such_name_error_t
    data_object_t& field(adobe::name_t name);

    virtual data_object_t& element(std::size_t index);
    virtual std::size_t    length();

    // The operations a child's expressions may name; none when `name` is not one of them.
    virtual boost::optional<adobe::any_regular_t> invoke_operation(adobe::name_t name);

    lazy_environment_t& environment() { return environment_m; }
    data_object_t*      parent();

    const object_type_t&   type() const { return *type_m; }
    const parameter_set_t& parameters() const { return parameters_m; }

    bool                 has_parameter(adobe::name_t name) const;
    adobe::any_regular_t evaluate_parameter(adobe::name_t              name,
                                            const adobe::dictionary_t& overrides = adobe::dictionary_t());

    // An independent root holding a deep copy of this object's state.
    data_object_ptr_t clone();

    // Deep copies the state and environment variables of `source`, an object of the same type.
    void assign_state(data_object_t& source);

protected:
    virtual void                 do_read(stream_t& input) = 0;
    virtual void                 do_write(stream_t& output) = 0;
    virtual boost::uint64_t      do_num_bytes() = 0;
    virtual adobe::any_regular_t do_snapshot() = 0;
    virtual void                 do_clear() = 0;
    virtual bool                 do_is_clear() = 0;
    virtual void                 done_read();

    // `source` is of the same kind and was built from the same parameters.
    virtual void copy_state(data_object_t& source) = 0;

    void require_named_fields(const char* operation);

    object_type_ptr_t  type_m;
    parameter_set_t    parameters_m;
    lazy_environment_t environment_m;

private:
    void check_offset(stream_t& input);
    bool readwrite();

    data_object_t& root();

    bool reading_m;
};

/****************************************************************************************************/
// onlyif, check_offset and adjust_offset (mutually exclusive), readwrite (default true).
parameter_contract_t base_contract();

/****************************************************************************************************/

template <typename T>
data_object_ptr_t construct_object(object_type_ptr_t   type,
                                   parameter_set_t     parameters,
                                   lazy_environment_t* parent)
{
    return data_object_ptr_t(new T(std::move(type), std::move(parameters), parent));
}

/****************************************************************************************************/
// BINLAYOUT_DATA_OBJECT_HPP
#endif

/****************************************************************************************************/
