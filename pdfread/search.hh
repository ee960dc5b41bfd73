// -*- mode: c++; -*-
// Copyright 2020- Thinkoid, LLC

#ifndef PDFREAD_PDFREAD_SEARCH_HH
#define PDFREAD_PDFREAD_SEARCH_HH

#include <defs.hh>

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include <pdfread/text.hh>

namespace pdfread {

struct match_t {
    size_t page = 0;

    // The matched text as it appears on the page.
    std::string text;

    // Estimated bounds, page space with a top-left origin.
    double x = 0, y = 0, width = 0, height = 0;

    // Text of the line the match is in.
    std::string context;
};

//
// Non-overlapping occurrences of the needle in the line texts, left to right
// and top to bottom. An empty needle matches nothing:
//
std::vector< match_t >
search_lines (const std::vector< text_line_t >&, size_t page,
              std::string_view needle, bool ignore_case = false);

} // namespace pdfread

#endif // PDFREAD_PDFREAD_SEARCH_HH
