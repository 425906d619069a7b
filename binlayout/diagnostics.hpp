/*
    Copyright 2014 Adobe
    Distributed under the Boost Software License, Version 1.0.
    (See accompanying file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
*/
/****************************************************************************************************/

#ifndef BINLAYOUT_DIAGNOSTICS_HPP
#define BINLAYOUT_DIAGNOSTICS_HPP

// stdc++
#include <functional>
#include <iosfwd>
#include <mutex>
#include <sstream>
#include <string>
#include <utility>

/****************************************************************************************************/

namespace detail {

/****************************************************************************************************/
// Collects one line of output and hands it to the commit callback when the
// last temporary of the << chain goes away.
struct helper {
    template <typename F>
    explicit helper(F&& f) : _commit(std::forward<F>(f)) {}

    helper(helper&&) = default;

    ~helper() {
        if (_commit)
            _commit(_ss.str());
    }

    template <typename U>
    void append(U&& x) {
        _ss << std::forward<U>(x);
    }

    std::stringstream                _ss;
    std::function<void(std::string)> _commit;
};

/****************************************************************************************************/

template <typename U>
// coverity[pass_by_value]
helper operator<<(helper s, U&& x) {
    s.append(std::forward<U>(x));
    return s;
}

/****************************************************************************************************/

} // namespace detail

/****************************************************************************************************/
// tsos = thread safe ostream; here it fronts a replaceable std::ostream.

class tsos {
    std::ostream* _ostream;
    std::mutex    _m;

public:
    explicit tsos(std::ostream& stream) : _ostream(&stream) {}

    void redirect(std::ostream& stream);

    void commit(std::string s);
};

/****************************************************************************************************/

template <typename U>
detail::helper operator<<(tsos& s, U&& x) {
    return detail::helper([&_s = s](std::string str) { _s.commit(std::move(str)); })
           << std::forward<U>(x);
}

/****************************************************************************************************/

// The diagnostic sink defaults to std::cerr and is quiet unless verbose.
void set_verbose(bool verbose);
bool verbose();

void set_diagnostic_stream(std::ostream& stream);

// Returns a line builder prefixed with "WARNING: ". The line is emitted only when verbose.
detail::helper warning();

/****************************************************************************************************/
// BINLAYOUT_DIAGNOSTICS_HPP
#endif

/****************************************************************************************************/
