// -*- mode: c++; -*-
// Copyright 2020- Thinkoid, LLC

#ifndef PDFREAD_IOSTREAMS_VIEW_SOURCE_HH
#define PDFREAD_IOSTREAMS_VIEW_SOURCE_HH

#include <defs.hh>

#include <algorithm>
#include <string_view>

#include <boost/iostreams/concepts.hpp>

namespace pdfread {
namespace iostreams {

//
// Source over borrowed bytes; the viewed buffer must outlive the source:
//
struct view_source_t : public boost::iostreams::source
{
    explicit view_source_t(std::string_view buf)
        : buf_(buf), pos_()
    { }

    std::streamsize read(char* s, std::streamsize n) {
        PDFREAD_ASSERT(n >= 0);
        std::streamsize dist = buf_.size() - pos_;

        if (0 == (n = (std::min)(n, dist)))
            return -1;

        std::copy(buf_.data() + pos_, buf_.data() + pos_ + n, s);
        pos_ += n;

        return n;
    }

private:
    std::string_view buf_;
    std::string_view::size_type pos_;
};

} // namespace iostreams
} // namespace pdfread

#endif // PDFREAD_IOSTREAMS_VIEW_SOURCE_HH
