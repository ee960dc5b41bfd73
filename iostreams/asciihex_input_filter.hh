// -*- mode: c++; -*-
// Copyright 2020- Thinkoid, LLC

#ifndef PDFREAD_IOSTREAMS_ASCIIHEX_INPUT_FILTER_HH
#define PDFREAD_IOSTREAMS_ASCIIHEX_INPUT_FILTER_HH

#include <cctype>
#include <boost/iostreams/concepts.hpp>
#include <boost/iostreams/operations.hpp>

namespace pdfread {
namespace iostreams {

//
// Decoder for /ASCIIHexDecode: whitespace is ignored, `>' ends the data and an
// odd final digit is completed with a zero:
//
struct asciihex_input_filter_t : public boost::iostreams::input_filter
{
    template< typename Source >
    int get(Source &src)
    {
        if (eof_)
            return EOF;

        int hi = -1;

        for (int c; ;) {
            c = boost::iostreams::get(src);

            if (c == EOF || c == '>') {
                eof_ = true;
                return hi < 0 ? EOF : (hi << 4);
            }

            if (c == boost::iostreams::WOULD_BLOCK)
                return c;

            if (std::isspace(c))
                continue;

            const int n = value(c);

            if (n < 0)
                continue;

            if (hi < 0)
                hi = n;
            else
                return (hi << 4) + n;
        }
    }

    template< typename Source >
    void close(Source &)
    {
        eof_ = false;
    }

private:
    static int value(int c) {
        if (c >= '0' && c <= '9')
            return c - '0';
        else if (c >= 'A' && c <= 'F')
            return c - 'A' + 10;
        else if (c >= 'a' && c <= 'f')
            return c - 'a' + 10;

        return -1;
    }

private:
    bool eof_ = false;
};

} // namespace iostreams
} // namespace pdfread

#endif // PDFREAD_IOSTREAMS_ASCIIHEX_INPUT_FILTER_HH
