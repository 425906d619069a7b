/*
    Copyright 2014 Adobe
    Distributed under the Boost Software License, Version 1.0.
    (See accompanying file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
*/
/****************************************************************************************************/

// identity
#include <binlayout/diagnostics.hpp>

// stdc++
#include <atomic>
#include <iostream>

// stlab
#include <stlab/scope.hpp>

/****************************************************************************************************/

namespace {

/****************************************************************************************************/

std::atomic<bool> verbose_s(false);

tsos& diagnostic_sink()
{
    static tsos sink_s(std::cerr);

    return sink_s;
}

/****************************************************************************************************/

} // namespace

/****************************************************************************************************/

void tsos::redirect(std::ostream& stream)
{
    stlab::scope<std::lock_guard<std::mutex>>(_m, [&] { _ostream = &stream; });
}

/****************************************************************************************************/

void tsos::commit(std::string s)
{
    stlab::scope<std::lock_guard<std::mutex>>(_m, [&] { *_ostream << std::move(s) << '\n'; });
}

/****************************************************************************************************/

void set_verbose(bool verbose)
{
    verbose_s = verbose;
}

/****************************************************************************************************/

bool verbose()
{
    return verbose_s;
}

/****************************************************************************************************/

void set_diagnostic_stream(std::ostream& stream)
{
    diagnostic_sink().redirect(stream);
}

/****************************************************************************************************/

detail::helper warning()
{
    if (!verbose())
        return detail::helper(std::function<void(std::string)>());

    return diagnostic_sink() << "WARNING: ";
}

/****************************************************************************************************/
