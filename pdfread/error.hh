// -*- mode: c++; -*-
// Copyright 1996-2003 Glyph & Cog, LLC
// Copyright 2020- Thinkoid, LLC

#ifndef PDFREAD_PDFREAD_ERROR_HH
#define PDFREAD_PDFREAD_ERROR_HH

#include <defs.hh>

#include <sys/types.h>

#include <functional>
#include <string>

#include <fmt/format.h>

namespace pdfread {

enum error_category_t {
    errSyntaxWarning,   // PDF syntax error which can be worked around;
                        //   output will probably be correct
    errSyntaxError,     // PDF syntax error which cannot be worked around;
                        //   output will probably be incorrect
    errIO,              // error in reading the input
    errUnimplemented,   // feature which has not been implemented
    errInternal         // internal error - malfunction within the library
};

using error_callback_t = std::function<
    void (error_category_t, off_t, const std::string&) >;

//
// Replace the sink which receives all diagnostics. An empty callback restores
// the default sink (standard error):
//
void set_error_callback (error_callback_t);

//
// Suppress all diagnostics:
//
void set_error_quiet (bool);

const char* to_string (error_category_t);

namespace detail {

void report (error_category_t, off_t, const std::string&);

bool quiet ();

} // namespace detail

//
// Report a recoverable irregularity at a byte offset (or -1 when there is
// none). The message is a {fmt} format string:
//
template< typename ... Args >
inline void
error (error_category_t category, off_t pos, const char* s,
       const Args& ... args) {
    if (detail::quiet ()) {
        return;
    }

    detail::report (
        category, pos, fmt::vformat (s, fmt::make_format_args (args...)));
}

} // namespace pdfread

#endif // PDFREAD_PDFREAD_ERROR_HH
