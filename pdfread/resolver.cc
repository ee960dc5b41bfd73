// -*- mode: c++; -*-
// Copyright 2020- Thinkoid, LLC

#include <defs.hh>

#include <set>

#include <pdfread/error.hh>
#include <pdfread/resolver.hh>

namespace pdfread {

ast::obj_t resolver_t::lookup (int num) const {
    auto p = store_.find (num);
    return p ? p->value () : ast::obj_t (ast::null_t{ });
}

const raw_object_t* resolver_t::resolve_object (const ast::obj_t& obj) const {
    auto pref = std::get_if< ast::ref_t > (&obj);

    if (0 == pref) {
        return 0;
    }

    ast::ref_t ref = *pref;
    std::set< int > visited;

    for (size_t depth = 0; depth < params_.max_reference_depth; ++depth) {
        if (!visited.insert (ref.num).second) {
            error (errSyntaxError, -1,
                   "Reference cycle at object {0:d}", ref.num);
            return 0;
        }

        auto p = store_.find (ref.num);

        if (0 == p || p->is_stream ()) {
            return p;
        }

        //
        // An object whose value is itself a reference is followed:
        //
        auto value = p->value ();
        auto next = std::get_if< ast::ref_t > (&value);

        if (0 == next) {
            return p;
        }

        ref = *next;
    }

    error (errSyntaxError, -1, "Reference chain too long at object {0:d}",
           ref.num);

    return 0;
}

ast::obj_t resolver_t::resolve (const ast::obj_t& obj) const {
    if (!std::holds_alternative< ast::ref_t > (obj)) {
        return obj;
    }

    auto p = resolve_object (obj);

    if (0 == p) {
        return ast::null_t{ };
    }

    return p->value ();
}

ast::dict_pointer resolver_t::resolve_dict (const ast::obj_t& obj) const {
    auto value = resolve (obj);

    if (auto p = std::get_if< ast::dict_pointer > (&value)) {
        return *p;
    }

    return { };
}

ast::array_pointer resolver_t::resolve_array (const ast::obj_t& obj) const {
    auto value = resolve (obj);

    if (auto p = std::get_if< ast::array_pointer > (&value)) {
        return *p;
    }

    return { };
}

ast::obj_t resolver_t::resolve_inherited (
    int num, std::string_view key, ast::obj_t def) const {
    std::set< int > visited;

    for (size_t depth = 0; depth < params_.max_reference_depth; ++depth) {
        if (!visited.insert (num).second) {
            error (errSyntaxError, -1,
                   "Loop in the /Parent chain at object {0:d}", num);
            return def;
        }

        auto dict = lookup_dict (num);

        if (0 == dict) {
            return def;
        }

        if (auto p = ast::find (*dict, key)) {
            auto value = resolve (*p);

            if (!ast::is_null (value)) {
                return value;
            }
        }

        auto parent = ast::get_if< ast::ref_t > (ast::find (*dict, "Parent"));

        if (0 == parent) {
            return def;
        }

        num = parent->num;
    }

    error (errSyntaxError, -1, "/Parent chain too long");
    return def;
}

} // namespace pdfread
