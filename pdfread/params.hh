// -*- mode: c++; -*-
// Copyright 2020- Thinkoid, LLC

#ifndef PDFREAD_PDFREAD_PARAMS_HH
#define PDFREAD_PDFREAD_PARAMS_HH

#include <defs.hh>

#include <array>
#include <cstddef>

namespace pdfread {

//
// Per-document tunables. Every limit defends against adversarial input; the
// defaults come from config.hh:
//
struct params_t {
    size_t max_page_tree_depth = PDFREAD_PAGE_TREE_DEPTH;
    size_t max_reference_depth = PDFREAD_REFERENCE_DEPTH;
    size_t  max_object_nesting = PDFREAD_OBJECT_NESTING;
    size_t      max_form_depth = PDFREAD_FORM_DEPTH;
    size_t content_error_limit = PDFREAD_CONTENT_ERROR_LIMIT;

    std::array< double, 4 > default_media_box{
        0., 0., PDFREAD_PAPER_WIDTH, PDFREAD_PAPER_HEIGHT };

    double default_glyph_width = PDFREAD_DEFAULT_GLYPH_WIDTH;
    double      line_tolerance = PDFREAD_LINE_TOLERANCE;
};

} // namespace pdfread

#endif // PDFREAD_PDFREAD_PARAMS_HH
