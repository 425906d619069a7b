/*
    Copyright 2014 Adobe
    Distributed under the Boost Software License, Version 1.0.
    (See accompanying file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
*/
/****************************************************************************************************/

// identity
#include <binlayout/stream.hpp>

// stdc++
#include <algorithm>
#include <iostream>
#include <stdexcept>

// application
#include <binlayout/error.hpp>
#include <binlayout/string.hpp>

/****************************************************************************************************/

stream_t::stream_t(std::istream& input) :
    input_m(&input),
    output_m(0),
    offset_m(0)
{ }

/****************************************************************************************************/

stream_t::stream_t(std::ostream& output) :
    input_m(0),
    output_m(&output),
    offset_m(0)
{ }

/****************************************************************************************************/

stream_t::stream_t(std::iostream& stream) :
    input_m(&stream),
    output_m(&stream),
    offset_m(0)
{ }

/****************************************************************************************************/

rawbytes_t stream_t::read(boost::uint64_t bytes)
{
    if (!input_m)
        throw std::runtime_error("stream_t::read: stream is not readable");

    // the request may come from the data itself; grow with what the stream actually holds
    static const boost::uint64_t chunk_size_k(64 * 1024);

    rawbytes_t      result;
    boost::uint64_t count(0);

    while (count != bytes)
    {
        boost::uint64_t wanted(std::min(bytes - count, chunk_size_k));

        result.resize(static_cast<std::size_t>(count + wanted));

        input_m->read(reinterpret_cast<char*>(&result[static_cast<std::size_t>(count)]),
                      static_cast<std::streamsize>(wanted));

        boost::uint64_t got(input_m->gcount());

        count += got;
        offset_m += got;

        if (got != wanted)
        {
            input_m->clear();

            throw end_of_stream_error_t(make_string("stream_t::read: end of stream at offset ",
                                                    offset_m,
                                                    " (wanted ",
                                                    bytes,
                                                    " bytes, got ",
                                                    count,
                                                    ")"));
        }
    }

    return result;
}

/****************************************************************************************************/

void stream_t::write(const rawbytes_t& bytes)
{
    if (!output_m)
        throw std::runtime_error("stream_t::write: stream is not writable");

    if (bytes.empty())
        return;

    output_m->write(reinterpret_cast<const char*>(&bytes[0]), bytes.size());

    if (output_m->fail())
        throw std::runtime_error("stream_t::write: write failed");

    offset_m += bytes.size();
}

/****************************************************************************************************/

void stream_t::seek(boost::int64_t delta)
{
    if (delta == 0)
        return;

    if (delta < 0 && static_cast<boost::uint64_t>(-delta) > offset_m)
        throw std::runtime_error(make_string("stream_t::seek: cannot seek ",
                                             delta,
                                             " bytes from offset ",
                                             offset_m));

    if (input_m)
    {
        input_m->clear();
        input_m->seekg(delta, std::ios::cur);

        if (input_m->fail())
        {
            input_m->clear();

            throw std::runtime_error(make_string("stream_t::seek: input refused a seek of ", delta, " bytes"));
        }
    }
    else
    {
        output_m->seekp(delta, std::ios::cur);

        if (output_m->fail())
        {
            output_m->clear();

            throw std::runtime_error(make_string("stream_t::seek: output refused a seek of ", delta, " bytes"));
        }
    }

    offset_m += delta;
}

/****************************************************************************************************/

void stream_t::flush()
{
    if (output_m)
        output_m->flush();
}

/****************************************************************************************************/
