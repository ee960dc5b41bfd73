// -*- mode: c++; -*-
// Copyright 1996-2003 Glyph & Cog, LLC
// Copyright 2020- Thinkoid, LLC

#ifndef PDFREAD_PDFREAD_PARSER_HH
#define PDFREAD_PDFREAD_PARSER_HH

#include <defs.hh>

#include <cstddef>
#include <string_view>

#include <pdfread/ast.hh>
#include <pdfread/lexer.hh>

namespace pdfread {

//
// Object parser over the lexer, with two tokens of lookahead for the
// `num gen R' reference form. Parsing stops in front of the `stream' keyword,
// the caller extracts the stream data:
//
struct parser_t {
    explicit parser_t (
        std::string_view buf, size_t pos = 0,
        size_t max_nesting = PDFREAD_OBJECT_NESTING);

    // Parse the next object; null on malformed input.
    ast::obj_t next ();

    // The token in front of the parser.
    const token_t& peek () const { return buf1_; }

    // Offsets of the beginning and the end of the token in front.
    size_t pos () const { return pos1_; }
    size_t end () const { return end1_; }

    void shift ();

    std::string_view buffer () const { return lexer_.buffer (); }

private:
    ast::obj_t do_next (size_t);

    bool at_terminator () const;

private:
    lexer_t lexer_;
    token_t buf1_, buf2_;
    size_t pos1_ = 0, end1_ = 0, pos2_ = 0, end2_ = 0;
    size_t max_nesting_;
};

//
// Parse the object at the offset, null when there is none:
//
ast::obj_t parse_object (
    std::string_view, size_t = 0, size_t = PDFREAD_OBJECT_NESTING);

} // namespace pdfread

#endif // PDFREAD_PDFREAD_PARSER_HH
