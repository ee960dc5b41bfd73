// -*- mode: c++; -*-
// Copyright 2001-2003 Glyph & Cog, LLC
// Copyright 2020- Thinkoid, LLC

#ifndef PDFREAD_PDFREAD_UNICODE_HH
#define PDFREAD_PDFREAD_UNICODE_HH

#include <defs.hh>

#include <string>
#include <string_view>

namespace pdfread {

//
// Append the UTF-8 encoding of a scalar value; values outside the Unicode
// range and surrogates are replaced with U+FFFD:
//
void append_utf8 (std::string&, char32_t);

std::string to_utf8 (std::u32string_view);

//
// Decode big-endian UTF-16 code units, an odd trailing byte is padded with a
// zero and unpaired surrogates become U+FFFD:
//
std::u32string from_utf16be (std::string_view);

//
// Each byte is a Latin-1 code point:
//
std::u32string from_latin1 (std::string_view);

std::u32string from_utf8 (std::string_view);

//
// Simple case folding, sufficient for case-insensitive matching of Latin,
// Greek and Cyrillic text:
//
char32_t fold_case (char32_t);

std::u32string fold_case (std::u32string);

} // namespace pdfread

#endif // PDFREAD_PDFREAD_UNICODE_HH
