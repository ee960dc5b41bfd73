// -*- mode: c++; -*-
// Copyright 1996-2003 Glyph & Cog, LLC
// Copyright 2020- Thinkoid, LLC

#ifndef PDFREAD_PDFREAD_FONT_HH
#define PDFREAD_PDFREAD_FONT_HH

#include <defs.hh>

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <pdfread/ast.hh>
#include <pdfread/resolver.hh>

namespace pdfread {

enum struct encoding_mode_t { simple, cid_identity };

//
// Character code to Unicode, from a /ToUnicode CMap:
//
using to_unicode_t = std::map< unsigned, std::u32string >;

//
// Parse the bfchar and bfrange sections of a CMap program. Sections may
// repeat, later mappings of a code override earlier ones:
//
to_unicode_t parse_to_unicode (std::string_view);

struct font_info_t {
    // Object number of the font dictionary.
    int num = 0;

    std::string base_font, subtype, encoding;
    encoding_mode_t mode = encoding_mode_t::simple;

    std::optional< to_unicode_t > to_unicode;

    //
    // Glyph widths in thousandths of a text space unit, /FirstChar and
    // /Widths for simple fonts, /W and /DW of the descendant for composite
    // fonts:
    //
    int first_char = 0;
    std::vector< double > widths;
    std::optional< double > missing_width;

    std::map< unsigned, double > cid_widths;
    double default_width = 1000;

    // Font program from /FontFile, /FontFile2 or /FontFile3.
    bool embedded = false;
    std::optional< std::string > program;

    bool is_cid () const { return mode == encoding_mode_t::cid_identity; }

    //
    // The character codes of a string, one or two bytes each:
    //
    std::vector< unsigned > codes (std::string_view) const;

    //
    // Width of the glyph for a code, empty if the font does not say:
    //
    std::optional< double > width (unsigned) const;
};

//
// Fonts by object number:
//
using font_cache_t = std::map< int, font_info_t >;

font_info_t read_font (const resolver_t&, int num);

//
// The text of a string shown with a font (or without, when the font is
// unknown), in UTF-8:
//
std::string decode (const ast::string_t&, const font_info_t*);

//
// The base font name, or the resource name when there is none:
//
std::string display_name (const font_info_t*, const std::string&);

} // namespace pdfread

#endif // PDFREAD_PDFREAD_FONT_HH
