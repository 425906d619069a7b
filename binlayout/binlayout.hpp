/*
    Copyright 2014 Adobe
    Distributed under the Boost Software License, Version 1.0.
    (See accompanying file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
*/
/****************************************************************************************************/

#ifndef BINLAYOUT_BINLAYOUT_HPP
#define BINLAYOUT_BINLAYOUT_HPP

// application
#include <binlayout/choice.hpp>
#include <binlayout/common.hpp>
#include <binlayout/declaration.hpp>
#include <binlayout/diagnostics.hpp>
#include <binlayout/endian.hpp>
#include <binlayout/environment.hpp>
#include <binlayout/error.hpp>
#include <binlayout/expression.hpp>
#include <binlayout/primitive.hpp>
#include <binlayout/record.hpp>
#include <binlayout/registry.hpp>
#include <binlayout/repeat.hpp>
#include <binlayout/sanitizer.hpp>
#include <binlayout/stream.hpp>

/****************************************************************************************************/
// BINLAYOUT_BINLAYOUT_HPP
#endif

/****************************************************************************************************/
