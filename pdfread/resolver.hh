// -*- mode: c++; -*-
// Copyright 2020- Thinkoid, LLC

#ifndef PDFREAD_PDFREAD_RESOLVER_HH
#define PDFREAD_PDFREAD_RESOLVER_HH

#include <defs.hh>

#include <string_view>

#include <pdfread/ast.hh>
#include <pdfread/object_store.hh>
#include <pdfread/params.hh>

namespace pdfread {

//
// Resolution of indirect references against an object store. Reference
// chains and parent walks are bounded and cycle-checked; an unresolvable
// reference yields null:
//
struct resolver_t {
    resolver_t (const object_store_t& store, const params_t& params)
        : store_ (store), params_ (params)
    { }

    // The value of object `num', null if there is no such object.
    ast::obj_t lookup (int num) const;

    // The direct value behind a value, following reference chains.
    ast::obj_t resolve (const ast::obj_t&) const;

    // The raw object a value refers to, following reference chains.
    const raw_object_t* resolve_object (const ast::obj_t&) const;

    //
    // Typed resolution, null pointers if the resolved value is of another
    // type:
    //
    ast::dict_pointer  resolve_dict  (const ast::obj_t&) const;
    ast::array_pointer resolve_array (const ast::obj_t&) const;

    ast::dict_pointer  lookup_dict  (int num) const {
        return resolve_dict (ast::ref_t{ num, 0 });
    }

    //
    // The value of `key' in the dictionary of object `num' or in the nearest
    // ancestor along its /Parent chain that defines it, `def' if none does:
    //
    ast::obj_t resolve_inherited (
        int num, std::string_view key, ast::obj_t def = ast::null_t{ }) const;

    const object_store_t& store () const { return store_; }
    const params_t& params () const { return params_; }

private:
    const object_store_t& store_;
    const params_t& params_;
};

} // namespace pdfread

#endif // PDFREAD_PDFREAD_RESOLVER_HH
