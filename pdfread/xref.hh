// -*- mode: c++; -*-
// Copyright 1996-2003 Glyph & Cog, LLC
// Copyright 2020- Thinkoid, LLC

#ifndef PDFREAD_PDFREAD_XREF_HH
#define PDFREAD_PDFREAD_XREF_HH

#include <defs.hh>

#include <cstddef>
#include <map>
#include <optional>
#include <string_view>

#include <pdfread/ast.hh>

namespace pdfread {

struct xref_entry_t {
    enum type_t { free_, uncompressed_, compressed_ } type;

    // Byte offset of the object, or number of the containing object stream.
    size_t offset;

    // Generation number, or index inside the containing object stream.
    int gen;
};

//
// The merged cross-reference sections of a document and its newest trailer:
//
struct xref_t {
    std::map< int, xref_entry_t > entries;
    ast::dict_t trailer;
};

//
// Offset named by the last `startxref' in the final bytes of the buffer:
//
std::optional< size_t > find_startxref (std::string_view);

//
// Read the cross-reference table or stream at `startxref' and the sections
// it chains to with /Prev. Entries of newer sections win. Empty when the
// first section cannot be read:
//
std::optional< xref_t >
read_xref (std::string_view, size_t max_nesting = PDFREAD_OBJECT_NESTING);

} // namespace pdfread

#endif // PDFREAD_PDFREAD_XREF_HH
