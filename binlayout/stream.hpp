/*
    Copyright 2014 Adobe
    Distributed under the Boost Software License, Version 1.0.
    (See accompanying file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
*/
/****************************************************************************************************/

#ifndef BINLAYOUT_STREAM_HPP
#define BINLAYOUT_STREAM_HPP

// stdc++
#include <iosfwd>
#include <vector>

// boost
#include <boost/cstdint.hpp>

/****************************************************************************************************/

typedef std::vector<boost::uint8_t> rawbytes_t;

/****************************************************************************************************/

class stream_t
{
public:
    explicit stream_t(std::istream& input);
    explicit stream_t(std::ostream& output);
    explicit stream_t(std::iostream& stream);

    // A short read throws an end_of_stream_error_t; the bytes that were available are consumed.
    rawbytes_t read(boost::uint64_t bytes);

    void write(const rawbytes_t& bytes);

    // Byte offset relative to where the stream was when this wrapper was created.
    boost::uint64_t offset() const { return offset_m; }

    // Relative seek; a seek the underlying stream refuses (or one before the
    // starting point) throws std::runtime_error and leaves the offset alone.
    void seek(boost::int64_t delta);

    void flush();

private:
    std::istream*   input_m;
    std::ostream*   output_m;
    boost::uint64_t offset_m;
};

/****************************************************************************************************/
// BINLAYOUT_STREAM_HPP
#endif

/****************************************************************************************************/
