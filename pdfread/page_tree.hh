// -*- mode: c++; -*-
// Copyright 1996-2003 Glyph & Cog, LLC
// Copyright 2020- Thinkoid, LLC

#ifndef PDFREAD_PDFREAD_PAGE_TREE_HH
#define PDFREAD_PDFREAD_PAGE_TREE_HH

#include <defs.hh>

#include <array>
#include <cstddef>
#include <map>
#include <string>
#include <vector>

#include <pdfread/ast.hh>
#include <pdfread/resolver.hh>

namespace pdfread {

//
// Lower-left and upper-right corners, x1 <= x2, y1 <= y2:
//
using box_t = std::array< double, 4 >;

//
// Resource names visible to a page, mapped to the object numbers of the
// fonts and the external objects:
//
struct resource_map_t {
    std::map< std::string, int > fonts, xobjects;
};

struct page_t {
    // 0-based position in reading order, and the page object number.
    size_t index = 0;
    int num = 0;

    box_t media_box{ }, crop_box{ };

    // One of 0, 90, 180, 270.
    int rotate = 0;

    resource_map_t resources;

    // Content stream objects, in drawing order.
    std::vector< int > contents;

    double width () const { return media_box [2] - media_box [0]; }
    double height () const { return media_box [3] - media_box [1]; }
};

//
// Merge the /Font and /XObject entries of a resource dictionary (possibly an
// indirect reference) over the inherited ones:
//
resource_map_t read_resources (
    const resolver_t&, const ast::obj_t&, resource_map_t = { });

//
// Flatten the page tree of the document catalog into pages in reading order:
//
std::vector< page_t > build_page_list (const resolver_t&);

} // namespace pdfread

#endif // PDFREAD_PDFREAD_PAGE_TREE_HH
