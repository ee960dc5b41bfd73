// -*- mode: c++; -*-
// Copyright 1996-2003 Glyph & Cog, LLC
// Copyright 2019-2020 Thinkoid, LLC.

#ifndef PDFREAD_PDFREAD_LEXER_HH
#define PDFREAD_PDFREAD_LEXER_HH

#include <defs.hh>

#include <cstddef>
#include <string>
#include <string_view>

//------------------------------------------------------------------------
// lexer_t
//------------------------------------------------------------------------

namespace pdfread {

struct token_t {
    enum type_t {
        EOF_,
        NUMBER_,
        STRING_,
        HEX_STRING_,
        NAME_,
        ARRAY_BEGIN_,
        ARRAY_END_,
        DICT_BEGIN_,
        DICT_END_,
        KEYWORD_
    } type = EOF_;

    //
    // Decoded bytes of strings, name without the slash, keyword or number
    // text:
    //
    std::string s;
    double num = 0;

    bool is_int () const {
        return type == NUMBER_ && s.find ('.') == std::string::npos;
    }

    bool is_keyword (std::string_view arg) const {
        return type == KEYWORD_ && s == arg;
    }
};

//
// Tokenizer for both the object syntax and the content-stream syntax. Never
// reads past the end of the buffer; unterminated constructs are truncated to
// the available bytes:
//
struct lexer_t {
    explicit lexer_t (std::string_view buf, size_t pos = 0)
        : buf_ (buf), pos_ (pos < buf.size () ? pos : buf.size ())
    { }

    // Get the next token from the input.
    token_t next ();

    // Skip to the beginning of the next line in the input.
    void skip_to_next_line ();

    // Skip whitespace and comments.
    void skip_space ();

    size_t pos () const { return pos_; }

    void pos (size_t n) {
        pos_ = n < buf_.size () ? n : buf_.size ();
    }

    bool eof () const { return pos_ >= buf_.size (); }

    std::string_view buffer () const { return buf_; }

    // Returns true if <c> is a whitespace character.
    static bool is_space (int c);

    // Returns true if <c> is a whitespace or a delimiter character.
    static bool is_special (int c);

private:
    int get_char () {
        return pos_ < buf_.size () ? (unsigned char)buf_ [pos_++] : EOF;
    }

    int look_char () const {
        return pos_ < buf_.size () ? (unsigned char)buf_ [pos_] : EOF;
    }

    token_t next_number (int);
    token_t next_string ();
    token_t next_hex_string ();

private:
    std::string_view buf_;
    size_t pos_;
};

} // namespace pdfread

#endif // PDFREAD_PDFREAD_LEXER_HH
