// -*- mode: c++; -*-
// Copyright 2020- Thinkoid, LLC

#ifndef PDFREAD_PDFREAD_TEXT_HH
#define PDFREAD_PDFREAD_TEXT_HH

#include <defs.hh>

#include <cstddef>
#include <string>
#include <vector>

#include <pdfread/font.hh>
#include <pdfread/gfx.hh>
#include <pdfread/page_tree.hh>
#include <pdfread/resolver.hh>

namespace pdfread {

//
// A piece of text shown on a page. Positions are in page space with a top-left
// origin:
//
struct text_item_t {
    std::string text;
    double x = 0, y = 0;

    // Base font name, or the resource name.
    std::string font_name;
    double font_size = 0;

    // Advance of the text.
    double width = 0;
};

//
// Items sharing a baseline, left to right:
//
struct text_line_t {
    std::string text;
    double x = 0, y = 0, font_size = 0;

    std::vector< text_item_t > items;

    // Byte offset of each item in the text.
    std::vector< size_t > offsets;
};

//
// Consecutive lines set in one paragraph, with their bounding box:
//
struct text_block_t {
    std::string text;
    double x = 0, y = 0, width = 0, height = 0;

    std::vector< text_line_t > lines;
};

//------------------------------------------------------------------------
// text_output_dev_t
//------------------------------------------------------------------------

struct text_output_dev_t : output_dev_t {
    void show_text (const gfx_state_t&, const text_run_t&) override;

    std::vector< text_item_t > items;
};

//
// The text items of a page, in the order the content shows them:
//
std::vector< text_item_t >
extract_text (const resolver_t&, const font_cache_t&, const page_t&);

//
// Group items whose vertical positions are within the tolerance, lines top to
// bottom:
//
std::vector< text_line_t >
make_lines (std::vector< text_item_t >, double tolerance);

//
// Split items at whitespace; word positions are estimated from an even
// distribution of the item advance over its characters:
//
std::vector< text_item_t > make_words (const std::vector< text_item_t >&);

//
// Group lines, top to bottom, into blocks. A line joins the block above it
// when it follows the last line closely, in a similar font size, and starts
// at the same left edge:
//
std::vector< text_block_t > make_blocks (std::vector< text_line_t >);

//
// Line texts separated by newlines:
//
std::string make_plain_text (const std::vector< text_line_t >&);

} // namespace pdfread

#endif // PDFREAD_PDFREAD_TEXT_HH
