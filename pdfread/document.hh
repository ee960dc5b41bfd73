// -*- mode: c++; -*-
// Copyright 1996-2003 Glyph & Cog, LLC
// Copyright 2020- Thinkoid, LLC

#ifndef PDFREAD_PDFREAD_DOCUMENT_HH
#define PDFREAD_PDFREAD_DOCUMENT_HH

#include <defs.hh>

#include <cstddef>
#include <istream>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <pdfread/ast.hh>
#include <pdfread/font.hh>
#include <pdfread/image.hh>
#include <pdfread/object_store.hh>
#include <pdfread/page_tree.hh>
#include <pdfread/params.hh>
#include <pdfread/search.hh>
#include <pdfread/text.hh>

namespace pdfread {

//
// A font in the resources of a page:
//
struct page_font_t {
    std::string name;
    font_info_t font;
};

struct stats_t {
    size_t pages = 0, objects = 0;

    // Objects by kind.
    size_t fonts = 0, images = 0, contents = 0;

    load_strategy_t strategy = load_strategy_t::indexed;
};

//------------------------------------------------------------------------
// document_t
//------------------------------------------------------------------------

//
// A loaded document. The object table, the page list and the font cache are
// built by the constructor and never modified; every query replays the page
// content with its own interpreter, so a document may be queried from several
// threads at once. Copies share the loaded state:
//
struct document_t {
    //
    // Load a whole document from memory or from a stream. Throws load_error
    // when no catalog is found:
    //
    explicit document_t (std::string_view, const params_t& = params_t{ });
    explicit document_t (std::istream&, const params_t& = params_t{ });

    size_t page_count () const;

    // Throws page_error for an index out of range.
    const page_t& page (size_t) const;

    const std::vector< page_t >& pages () const;

    //
    // Per-page queries throw page_error for an index out of range. The
    // whole-document forms map page indices to the results, omit pages with
    // no results, and throw page_error for a document without pages:
    //
    std::vector< text_item_t > text (size_t) const;
    std::map< size_t, std::vector< text_item_t > > text () const;

    std::vector< image_t > images (size_t) const;
    std::map< size_t, std::vector< image_t > > images () const;

    std::vector< page_font_t > fonts (size_t) const;
    std::map< size_t, std::vector< page_font_t > > fonts () const;

    std::vector< text_line_t > lines (size_t) const;
    std::vector< text_block_t > text_blocks (size_t) const;
    std::vector< text_item_t > words (size_t) const;
    std::string plain_text (size_t) const;

    std::vector< match_t >
    search (size_t, std::string_view, bool ignore_case = false) const;

    std::vector< match_t >
    search (std::string_view, bool ignore_case = false) const;

    // Width and height of each page.
    std::vector< std::pair< double, double > > page_sizes () const;

    //
    // Inspection of the object graph:
    //
    const raw_object_t* object (int) const;

    // Source text of a value in the dictionary of an object.
    std::optional< std::string > dict_key (int, std::string_view) const;

    // An attribute of a page, looked up along the /Parent chain.
    ast::obj_t page_attribute (size_t, std::string_view) const;

    ast::dict_t catalog () const;
    const ast::dict_t& trailer () const;

    // The %PDF- header version, empty when missing.
    const std::string& version () const;

    stats_t stats () const;

    const params_t& params () const;

private:
    struct impl_t;
    std::shared_ptr< const impl_t > pimpl_;
};

} // namespace pdfread

#endif // PDFREAD_PDFREAD_DOCUMENT_HH
