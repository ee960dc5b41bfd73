// -*- mode: c++; -*-
// Copyright 2020- Thinkoid, LLC

#ifndef PDFREAD_PDFREAD_FILTERS_HH
#define PDFREAD_PDFREAD_FILTERS_HH

#include <defs.hh>

#include <string>
#include <string_view>
#include <vector>

#include <pdfread/ast.hh>

namespace pdfread {

//
// Result of running a stream's filter chain. Decoding stops at the first
// filter that is not supported; the data is then left as it is at that point
// and the filters not applied are listed in `pending':
//
struct decoded_t {
    std::string data;
    std::vector< std::string > pending;

    bool complete () const { return pending.empty (); }
};

//
// The filter names of a stream dictionary, in decoding order. The abbreviated
// keys and filter names are recognized in inline image dictionaries only:
//
std::vector< std::string >
filter_names (const ast::dict_t&, bool inline_image = false);

decoded_t
decode (std::string_view, const ast::dict_t&, bool inline_image = false);

//
// Individual decoders, exposed for testing:
//
bool flate_decode (std::string_view, std::string&);
bool asciihex_decode (std::string_view, std::string&);

bool undo_predictor (std::string&, const ast::dict_t& params);

} // namespace pdfread

#endif // PDFREAD_PDFREAD_FILTERS_HH
