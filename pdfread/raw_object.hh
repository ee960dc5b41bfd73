// -*- mode: c++; -*-
// Copyright 2020- Thinkoid, LLC

#ifndef PDFREAD_PDFREAD_RAW_OBJECT_HH
#define PDFREAD_PDFREAD_RAW_OBJECT_HH

#include <defs.hh>

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <pdfread/ast.hh>

namespace pdfread {

//
// An indirect object as found in the file: the unparsed source text of its
// value and, for streams, the data after running the filter chain. The text
// is parsed on demand and the result is not cached:
//
struct raw_object_t {
    int num = 0, gen = 0;

    // Source text of the value, a dictionary for streams.
    std::string dict_text;

    // Stream data, decoded as far as the supported filters go.
    std::optional< std::string > stream;

    // Filters left unapplied to the stream data.
    std::vector< std::string > pending;

    // Byte offset of the object header (or of the containing object stream),
    // and of the first byte after the object.
    size_t offset = 0, end = 0;

    // Number of the object stream this object was unpacked from, or 0.
    int container = 0;

    // Nesting ceiling applied when the value is parsed.
    size_t max_nesting = PDFREAD_OBJECT_NESTING;

    ast::obj_t value () const;

    // The value if it is a dictionary, an empty dictionary otherwise.
    ast::dict_t dict () const;

    bool is_stream () const { return bool (stream); }
};

//
// Resolves an indirect stream /Length, empty when it cannot be resolved:
//
using length_resolver_t = std::function<
    std::optional< long > (const ast::ref_t&) >;

//
// Read the `num gen obj ... endobj' construct at the offset. The stream length
// comes from /Length when that is consistent with an `endstream' keyword at
// the end of the data, otherwise from a forward search for `endstream':
//
std::optional< raw_object_t >
read_object (std::string_view, size_t, const length_resolver_t& = { },
             size_t = PDFREAD_OBJECT_NESTING);

//
// Unpack the objects stored in a /Type /ObjStm stream, with the nesting
// ceiling of the container:
//
std::vector< raw_object_t > unpack_object_stream (const raw_object_t&);

} // namespace pdfread

#endif // PDFREAD_PDFREAD_RAW_OBJECT_HH
