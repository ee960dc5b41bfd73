// -*- mode: c++; -*-
// Copyright 1996-2003 Glyph & Cog, LLC
// Copyright 2020- Thinkoid, LLC

#ifndef PDFREAD_PDFREAD_OBJECT_STORE_HH
#define PDFREAD_PDFREAD_OBJECT_STORE_HH

#include <defs.hh>

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <string_view>

#include <pdfread/ast.hh>
#include <pdfread/params.hh>
#include <pdfread/raw_object.hh>

namespace pdfread {

enum struct load_strategy_t { indexed, recovery };

const char* to_string (load_strategy_t);

//
// The table of the indirect objects of a document. Built once, read-only
// afterwards. The cross-reference structure is tried first; when it is
// missing or inconsistent with the objects it points to, the whole buffer is
// scanned for object headers instead:
//
struct object_store_t {
    using table_type = std::map< int, raw_object_t >;

    //
    // Throws load_error when no catalog can be found by either strategy. Only
    // the object nesting ceiling is taken from the parameters:
    //
    explicit object_store_t (std::string_view, const params_t& = params_t{ });

    const raw_object_t* find (int num) const {
        auto iter = objects_.find (num);
        return iter == objects_.end () ? 0 : &iter->second;
    }

    const table_type& objects () const { return objects_; }

    size_t size () const { return objects_.size (); }

    const ast::dict_t& trailer () const { return trailer_; }

    const ast::ref_t& root () const { return root_; }

    // Header version, e.g. "1.7", empty if the header is missing.
    const std::string& version () const { return version_; }

    load_strategy_t strategy () const { return strategy_; }

private:
    bool load_indexed (std::string_view);
    bool load_recovered (std::string_view);

    void unpack_object_streams ();

    bool is_catalog (int) const;

private:
    size_t max_nesting_;

    table_type objects_;

    ast::dict_t trailer_;
    ast::ref_t root_{ -1, 0 };

    std::string version_;
    load_strategy_t strategy_ = load_strategy_t::indexed;
};

//
// The byte offset where the object header ending in the `obj' keyword at the
// given offset begins, if the keyword is preceded by `num gen':
//
std::optional< size_t > object_header (std::string_view, size_t);

} // namespace pdfread

#endif // PDFREAD_PDFREAD_OBJECT_STORE_HH
