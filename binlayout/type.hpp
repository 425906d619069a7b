/*
    Copyright 2014 Adobe
    Distributed under the Boost Software License, Version 1.0.
    (See accompanying file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
*/
/****************************************************************************************************/

#ifndef BINLAYOUT_TYPE_HPP
#define BINLAYOUT_TYPE_HPP

// stdc++
#include <functional>
#include <memory>
#include <ostream>
#include <utility>
#include <vector>

// boost
#include <boost/operators.hpp>

// asl
#include <adobe/any_regular.hpp>
#include <adobe/array.hpp>
#include <adobe/dictionary.hpp>
#include <adobe/name.hpp>

// application
#include <binlayout/parameters.hpp>

/****************************************************************************************************/

class data_object_t;
class lazy_environment_t;
class sanitizer_t;
struct object_type_t;

typedef std::unique_ptr<data_object_t>       data_object_ptr_t;
typedef std::shared_ptr<const object_type_t> object_type_ptr_t;

/****************************************************************************************************/
// The body of a named record type, as handed to register_record_type.
struct record_definition_t
{
    adobe::array_t       fields_m;
    adobe::any_regular_t endian_m; // nil when the type does not fix its byte order
    adobe::array_t       hide_m;
};

/****************************************************************************************************/
/*
    A registered type: its parameter contract, the hook that sanitizes the
    declarations nested in its parameters, and the factory for its instances.
*/
struct object_type_t
{
    typedef std::function<void (sanitizer_t&, adobe::dictionary_t&)> sanitize_proc_t;
    typedef std::function<data_object_ptr_t (object_type_ptr_t,
                                              parameter_set_t,
                                              lazy_environment_t*)>  construct_proc_t;

    object_type_t() :
        possibly_recursive_m(false)
    { }

    adobe::name_t                              name_m;
    parameter_contract_t                       contract_m;
    bool                                       possibly_recursive_m; // carried in the sanitizer's cycle guard
    sanitize_proc_t                            sanitize_m;           // may be empty
    construct_proc_t                           construct_m;
    std::shared_ptr<const record_definition_t> definition_m;         // named record types only
};

/****************************************************************************************************/
/*
    One sanitized declaration. A deferred entry (a recursive occurrence, or a
    choice alternative) keeps its raw parameters; they are sanitized when the
    entry is first instantiated.
*/
struct sanitized_field_t
{
    sanitized_field_t() :
        hidden_m(false),
        deferred_m(false)
    { }

    adobe::name_t       name_m;
    bool                hidden_m;
    object_type_ptr_t   type_m;
    parameter_set_t     parameters_m;
    bool                deferred_m;
    adobe::dictionary_t raw_parameters_m;
};

/****************************************************************************************************/
// An immutable, shareable list of sanitized declarations, storable in a parameter dictionary.
struct sanitized_list_t : boost::equality_comparable<sanitized_list_t>
{
    typedef std::vector<sanitized_field_t> vector_type;

    sanitized_list_t() :
        fields_m(std::make_shared<vector_type>())
    { }

    explicit sanitized_list_t(vector_type fields) :
        fields_m(std::make_shared<vector_type>(std::move(fields)))
    { }

    const vector_type& fields() const { return *fields_m; }

    std::size_t size() const { return fields_m->size(); }

    const sanitized_field_t& operator[](std::size_t index) const { return (*fields_m)[index]; }

    friend bool operator==(const sanitized_list_t& x, const sanitized_list_t& y)
    {
        return x.fields_m == y.fields_m;
    }

    friend std::ostream& operator<<(std::ostream& s, const sanitized_list_t& x)
    {
        return s << "sanitized_list(" << x.size() << ")";
    }

private:
    std::shared_ptr<const vector_type> fields_m;
};

/****************************************************************************************************/
// Builds the object a sanitized entry describes, sanitizing deferred parameters first.
data_object_ptr_t instantiate(const sanitized_field_t& field, lazy_environment_t* parent);

/****************************************************************************************************/
// BINLAYOUT_TYPE_HPP
#endif

/****************************************************************************************************/
