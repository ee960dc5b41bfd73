// -*- mode: c++; -*-
// Copyright 1996-2003 Glyph & Cog, LLC
// Copyright 2020- Thinkoid, LLC

#include <defs.hh>

#include <algorithm>
#include <cctype>
#include <iterator>
#include <vector>

#include <pdfread/error.hh>
#include <pdfread/exception.hh>
#include <pdfread/lexer.hh>
#include <pdfread/object_store.hh>
#include <pdfread/parser.hh>
#include <pdfread/xref.hh>

namespace pdfread {
namespace {

//
// Bounds on the backward walk over an object header:
//
const size_t max_header_space = 32, max_header_digits = 10;

std::string read_version (std::string_view buf) {
    const auto head = buf.substr (0, PDFREAD_XREF_SEARCH_SIZE);
    const auto i = head.find ("%PDF-");

    if (i == std::string_view::npos) {
        error (errSyntaxWarning, -1, "May not be a PDF file (missing header)");
        return { };
    }

    std::string s;

    for (size_t j = i + 5; j < head.size (); ++j) {
        const int c = (unsigned char)head [j];

        if (!isdigit (c) && c != '.') {
            break;
        }

        s.append (1, char (c));
    }

    return s;
}

const ast::ref_t* root_of (const ast::dict_t& dict) {
    return ast::get_if< ast::ref_t > (ast::find (dict, "Root"));
}

//
// A place where the document root is declared, a trailer or a
// cross-reference stream:
//
struct root_decl_t {
    size_t pos;
    ast::ref_t ref;
    ast::dict_t trailer;
};

} // anonymous namespace

const char* to_string (load_strategy_t strategy) {
    switch (strategy) {
    case load_strategy_t::indexed:  return "indexed";
    case load_strategy_t::recovery: return "recovery";
    }

    return "unknown";
}

std::optional< size_t > object_header (std::string_view buf, size_t pos) {
    if (pos + 3 < buf.size () &&
        !lexer_t::is_special ((unsigned char)buf [pos + 3])) {
        return { };
    }

    size_t i = pos;

    auto skip = [&](auto pred, size_t limit) {
        size_t n = 0;

        for (; i > 0 && n < limit && pred ((unsigned char)buf [i - 1]); ++n) {
            --i;
        }

        return n;
    };

    auto space = [](int c) { return lexer_t::is_space (c); };
    auto digit = [](int c) { return 0 != isdigit (c); };

    if (!skip (space, max_header_space) ||
        !skip (digit, max_header_digits) ||
        !skip (space, max_header_space) ||
        !skip (digit, max_header_digits)) {
        return { };
    }

    if (i > 0 && !lexer_t::is_special ((unsigned char)buf [i - 1])) {
        return { };
    }

    return i;
}

object_store_t::object_store_t (std::string_view buf, const params_t& params)
    : max_nesting_ (params.max_object_nesting), version_ (read_version (buf)) {
    if (load_indexed (buf)) {
        strategy_ = load_strategy_t::indexed;
        return;
    }

    error (errSyntaxWarning, -1,
           "Cross-reference structure is damaged, scanning the document");

    objects_.clear ();
    trailer_.clear ();
    root_ = { -1, 0 };

    if (load_recovered (buf)) {
        strategy_ = load_strategy_t::recovery;
        return;
    }

    throw load_error ("cannot find the document catalog");
}

bool object_store_t::is_catalog (int num) const {
    auto p = find (num);

    if (0 == p) {
        return false;
    }

    const auto dict = p->dict ();
    return 0 != ast::find (dict, "Pages");
}

bool object_store_t::load_indexed (std::string_view buf) {
    auto xref = read_xref (buf, max_nesting_);

    if (!xref) {
        return false;
    }

    auto resolve_length = [&](const ast::ref_t& ref) -> std::optional< long > {
        if (auto p = find (ref.num)) {
            return ast::as_int (p->value ());
        }

        auto iter = xref->entries.find (ref.num);

        if (iter != xref->entries.end () &&
            iter->second.type == xref_entry_t::uncompressed_) {
            auto obj = read_object (buf, iter->second.offset, { }, max_nesting_);

            if (obj && obj->num == ref.num && !obj->is_stream ()) {
                return ast::as_int (obj->value ());
            }
        }

        return { };
    };

    size_t failed = 0;

    for (const auto& [num, entry] : xref->entries) {
        if (entry.type != xref_entry_t::uncompressed_) {
            continue;
        }

        auto obj = read_object (buf, entry.offset, resolve_length, max_nesting_);

        if (!obj || obj->num != num) {
            error (errSyntaxError, off_t (entry.offset),
                   "Cross-reference entry for object {0:d} does not point "
                   "to its definition", num);
            ++failed;
            continue;
        }

        objects_.insert_or_assign (num, std::move (*obj));
    }

    //
    // Compressed objects, after their containers are loaded:
    //
    std::map< int, std::vector< raw_object_t > > containers;

    for (const auto& item : xref->entries) {
        const int num = item.first;
        const auto& entry = item.second;

        if (entry.type != xref_entry_t::compressed_) {
            continue;
        }

        const int container = int (entry.offset);

        auto iter = containers.find (container);

        if (iter == containers.end ()) {
            auto p = find (container);

            iter = containers.emplace (
                container, p
                ? unpack_object_stream (*p)
                : std::vector< raw_object_t > ()).first;
        }

        const auto& xs = iter->second;

        const raw_object_t* p = 0;

        if (entry.gen >= 0 && size_t (entry.gen) < xs.size () &&
            xs [entry.gen].num == num) {
            p = &xs [entry.gen];
        }
        else {
            auto iter = std::find_if (xs.begin (), xs.end (), [&](auto& x) {
                return x.num == num;
            });

            if (iter != xs.end ()) {
                p = &*iter;
            }
        }

        if (0 == p) {
            error (errSyntaxError, -1,
                   "Object {0:d} missing from object stream {1:d}",
                   num, container);
            ++failed;
            continue;
        }

        objects_.insert_or_assign (num, *p);
    }

    trailer_ = std::move (xref->trailer);

    if (auto p = root_of (trailer_)) {
        root_ = *p;
    }

    if (failed) {
        error (errSyntaxWarning, -1,
               "{0:d} cross-reference entries are broken", failed);
        return false;
    }

    if (!is_catalog (root_.num)) {
        error (errSyntaxError, -1, "Invalid document catalog");
        return false;
    }

    return true;
}

bool object_store_t::load_recovered (std::string_view buf) {
    std::vector< root_decl_t > decls;

    auto resolve_length = [&](const ast::ref_t& ref) -> std::optional< long > {
        if (auto p = find (ref.num)) {
            if (!p->is_stream ()) {
                return ast::as_int (p->value ());
            }
        }

        return { };
    };

    //
    // Object headers. Scanning resumes after the end of each object read,
    // stream data is not searched:
    //
    for (size_t pos = 0, i; (i = buf.find ("obj", pos)) != std::string_view::npos; ) {
        pos = i + 3;

        auto start = object_header (buf, i);

        if (!start) {
            continue;
        }

        auto obj = read_object (buf, *start, resolve_length, max_nesting_);

        if (!obj) {
            continue;
        }

        pos = (std::max) (pos, obj->end);

        if (obj->is_stream ()) {
            auto dict = obj->dict ();

            if (ast::is_name (ast::find (dict, "Type"), "XRef")) {
                if (auto p = root_of (dict)) {
                    decls.push_back ({ *start, *p, std::move (dict) });
                }
            }
        }

        //
        // Later definitions supersede earlier ones:
        //
        objects_.insert_or_assign (obj->num, std::move (*obj));
    }

    for (size_t i = buf.find ("trailer"); i != std::string_view::npos;
         i = buf.find ("trailer", i + 7)) {
        auto obj = parse_object (buf, i + 7, max_nesting_);

        if (auto p = std::get_if< ast::dict_pointer > (&obj)) {
            if (*p) {
                if (auto ref = root_of (**p)) {
                    decls.push_back ({ i, *ref, std::move (**p) });
                }
            }
        }
    }

    unpack_object_streams ();

    std::sort (decls.begin (), decls.end (), [](auto& lhs, auto& rhs) {
        return lhs.pos < rhs.pos;
    });

    for (auto iter = decls.rbegin (); iter != decls.rend (); ++iter) {
        if (is_catalog (iter->ref.num)) {
            root_ = iter->ref;
            trailer_ = std::move (iter->trailer);

            break;
        }
    }

    if (root_.num < 0) {
        //
        // No usable trailer; take the last catalog in the file:
        //
        const raw_object_t* catalog = 0;

        for (const auto& [num, obj] : objects_) {
            const auto dict = obj.dict ();

            if (ast::is_name (ast::find (dict, "Type"), "Catalog") &&
                (0 == catalog || obj.offset >= catalog->offset)) {
                catalog = &obj;
            }
        }

        if (0 == catalog) {
            error (errSyntaxError, -1, "Couldn't find trailer dictionary");
            return false;
        }

        root_ = { catalog->num, catalog->gen };

        trailer_.clear ();
        trailer_.emplace_back (ast::name_t ("Root"), root_);
    }

    return true;
}

void object_store_t::unpack_object_streams () {
    std::vector< const raw_object_t* > containers;

    for (const auto& [num, obj] : objects_) {
        if (obj.is_stream () && 0 == obj.container) {
            const auto dict = obj.dict ();

            if (ast::is_name (ast::find (dict, "Type"), "ObjStm")) {
                containers.push_back (&obj);
            }
        }
    }

    std::sort (containers.begin (), containers.end (), [](auto lhs, auto rhs) {
        return lhs->offset < rhs->offset;
    });

    std::vector< raw_object_t > packed;

    for (auto p : containers) {
        auto xs = unpack_object_stream (*p);
        std::move (xs.begin (), xs.end (), std::back_inserter (packed));
    }

    //
    // A direct definition wins over a packed one; among packed ones the one
    // in the later object stream wins:
    //
    for (auto& obj : packed) {
        auto iter = objects_.find (obj.num);

        if (iter == objects_.end ()) {
            objects_.emplace (obj.num, std::move (obj));
        }
        else if (iter->second.container) {
            iter->second = std::move (obj);
        }
    }
}

} // namespace pdfread
