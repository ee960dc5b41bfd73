// -*- mode: c++; -*-
// Copyright 1996-2003 Glyph & Cog, LLC
// Copyright 2020- Thinkoid, LLC

#include <defs.hh>

#include <optional>
#include <set>
#include <utility>

#include <pdfread/error.hh>
#include <pdfread/page_tree.hh>

namespace pdfread {
namespace {

//
// Attributes inherited down the page tree:
//
struct page_attrs_t {
    box_t media_box;
    std::optional< box_t > crop_box;
    int rotate = 0;
    resource_map_t resources;
};

bool read_box (const resolver_t& resolver, const ast::dict_t& dict,
               const char* key, box_t& box) {
    auto p = ast::find (dict, key);

    if (0 == p) {
        return false;
    }

    auto arr = resolver.resolve_array (*p);

    if (0 == arr || arr->size () != 4) {
        error (errSyntaxError, -1, "Bad /{0:s} entry", key);
        return false;
    }

    box_t tmp;

    for (size_t i = 0; i < 4; ++i) {
        auto n = ast::as_number (resolver.resolve ((*arr) [i]));

        if (!n) {
            error (errSyntaxError, -1, "Bad /{0:s} entry", key);
            return false;
        }

        tmp [i] = *n;
    }

    if (tmp [0] > tmp [2]) {
        std::swap (tmp [0], tmp [2]);
    }

    if (tmp [1] > tmp [3]) {
        std::swap (tmp [1], tmp [3]);
    }

    return box = tmp, true;
}

void merge_attrs (const resolver_t& resolver, const ast::dict_t& dict,
                  page_attrs_t& attrs) {
    read_box (resolver, dict, "MediaBox", attrs.media_box);

    box_t box;

    if (read_box (resolver, dict, "CropBox", box)) {
        attrs.crop_box = box;
    }

    if (auto p = ast::find (dict, "Rotate")) {
        if (auto n = ast::as_int (resolver.resolve (*p))) {
            int rotate = *n % 360;

            if (rotate < 0) {
                rotate += 360;
            }

            attrs.rotate = rotate - rotate % 90;
        }
    }

    if (auto p = ast::find (dict, "Resources")) {
        attrs.resources = read_resources (
            resolver, *p, std::move (attrs.resources));
    }
}

void read_named_refs (const resolver_t& resolver, const ast::dict_t& dict,
                      const char* key, std::map< std::string, int >& xs) {
    auto p = ast::find (dict, key);

    if (0 == p) {
        return;
    }

    auto names = resolver.resolve_dict (*p);

    if (0 == names) {
        error (errSyntaxError, -1, "Bad /{0:s} resource dictionary", key);
        return;
    }

    for (const auto& [name, value] : *names) {
        if (auto ref = std::get_if< ast::ref_t > (&value)) {
            xs [name] = ref->num;
        }
        else {
            error (errSyntaxWarning, -1,
                   "Direct /{0:s} resource '{1:s}' ignored", key, name.c_str ());
        }
    }
}

std::vector< int > read_contents (const resolver_t& resolver, const ast::obj_t& obj) {
    std::vector< int > xs;

    auto add = [&](const ast::obj_t& x) {
        if (auto ref = std::get_if< ast::ref_t > (&x)) {
            if (auto p = resolver.resolve_object (x); p && p->is_stream ()) {
                xs.push_back (p->num);
            }
            else {
                error (errSyntaxError, -1,
                       "Content object {0:d} is not a stream", ref->num);
            }
        }
        else {
            error (errSyntaxError, -1, "Direct content object ignored");
        }
    };

    if (std::holds_alternative< ast::ref_t > (obj)) {
        auto p = resolver.resolve_object (obj);

        if (p && p->is_stream ()) {
            xs.push_back (p->num);
        }
        else if (auto arr = resolver.resolve_array (obj)) {
            for (const auto& x : *arr) {
                add (x);
            }
        }
    }
    else if (auto arr = std::get_if< ast::array_pointer > (&obj)) {
        if (*arr) {
            for (const auto& x : **arr) {
                add (x);
            }
        }
    }

    return xs;
}

struct walker_t {
    const resolver_t& resolver;

    std::set< int > visited;
    std::vector< page_t > pages;

    void walk (int num, page_attrs_t attrs, size_t depth);
};

void walker_t::walk (int num, page_attrs_t attrs, size_t depth) {
    if (depth >= resolver.params ().max_page_tree_depth) {
        error (errSyntaxError, -1,
               "Page tree too deep at object {0:d}, subtree ignored", num);
        return;
    }

    if (!visited.insert (num).second) {
        error (errSyntaxError, -1, "Loop in Pages tree at object {0:d}", num);
        return;
    }

    auto dict = resolver.lookup_dict (num);

    if (0 == dict) {
        error (errSyntaxError, -1,
               "Page tree node {0:d} is not a dictionary", num);
        return;
    }

    merge_attrs (resolver, *dict, attrs);

    auto pkids = ast::find (*dict, "Kids");
    auto ptype = ast::find (*dict, "Type");

    if (ast::is_name (ptype, "Page") || (0 == ptype && 0 == pkids)) {
        page_t page;

        page.index = pages.size ();
        page.num = num;
        page.media_box = attrs.media_box;
        page.crop_box = attrs.crop_box ? *attrs.crop_box : attrs.media_box;
        page.rotate = attrs.rotate;
        page.resources = std::move (attrs.resources);

        if (auto p = ast::find (*dict, "Contents")) {
            page.contents = read_contents (resolver, *p);
        }

        pages.push_back (std::move (page));
        return;
    }

    auto kids = pkids ? resolver.resolve_array (*pkids) : ast::array_pointer ();

    if (0 == kids) {
        error (errSyntaxError, -1,
               "Page tree node {0:d} without /Kids", num);
        return;
    }

    for (const auto& kid : *kids) {
        if (auto ref = std::get_if< ast::ref_t > (&kid)) {
            walk (ref->num, attrs, depth + 1);
        }
        else {
            error (errSyntaxError, -1,
                   "Kid of page tree node {0:d} is not a reference", num);
        }
    }
}

} // anonymous namespace

resource_map_t
read_resources (const resolver_t& resolver, const ast::obj_t& obj,
                resource_map_t xs) {
    auto dict = resolver.resolve_dict (obj);

    if (0 == dict) {
        if (!ast::is_null (obj)) {
            error (errSyntaxError, -1, "Bad /Resources entry");
        }

        return xs;
    }

    read_named_refs (resolver, *dict, "Font", xs.fonts);
    read_named_refs (resolver, *dict, "XObject", xs.xobjects);

    return xs;
}

std::vector< page_t > build_page_list (const resolver_t& resolver) {
    walker_t walker{ resolver };

    auto catalog = resolver.lookup_dict (resolver.store ().root ().num);

    if (0 == catalog) {
        error (errSyntaxError, -1, "Catalog object is not a dictionary");
        return { };
    }

    auto ppages = ast::get_if< ast::ref_t > (ast::find (*catalog, "Pages"));

    if (0 == ppages) {
        error (errSyntaxError, -1, "Catalog without a /Pages reference");
        return { };
    }

    const auto& params = resolver.params ();

    page_attrs_t attrs;
    attrs.media_box = params.default_media_box;

    walker.walk (ppages->num, std::move (attrs), 0);

    return std::move (walker.pages);
}

} // namespace pdfread
