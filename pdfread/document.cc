// -*- mode: c++; -*-
// Copyright 1996-2003 Glyph & Cog, LLC
// Copyright 2020- Thinkoid, LLC

#include <defs.hh>

#include <iterator>
#include <set>

#include <pdfread/document.hh>
#include <pdfread/error.hh>
#include <pdfread/exception.hh>
#include <pdfread/parser.hh>
#include <pdfread/resolver.hh>

#include <range/v3/algorithm/count_if.hpp>
#include <range/v3/view/map.hpp>
using namespace ranges;

namespace pdfread {

struct document_t::impl_t {
    impl_t (std::string_view buf, const params_t& arg)
        : params (arg), store (buf, params), resolver (store, params)
    {
        pages = build_page_list (resolver);

        for (const auto& page : pages) {
            for (const auto& [name, num] : page.resources.fonts) {
                if (0 == fonts.count (num)) {
                    fonts.emplace (num, read_font (resolver, num));
                }
            }
        }
    }

    const page_t& page (size_t n) const {
        if (n >= pages.size ()) {
            throw page_error (n, pages.size ());
        }

        return pages [n];
    }

    void check_not_empty () const {
        if (pages.empty ()) {
            throw page_error (0, 0);
        }
    }

    params_t params;
    object_store_t store;
    resolver_t resolver;

    std::vector< page_t > pages;
    font_cache_t fonts;
};

namespace {

std::string read_all (std::istream& stream) {
    std::string buf (
        (std::istreambuf_iterator< char > (stream)),
        std::istreambuf_iterator< char > ());

    if (stream.bad ()) {
        error (errIO, -1, "Error reading the document stream");
        throw load_error ("cannot read the document");
    }

    return buf;
}

template< typename T, typename F >
std::map< size_t, std::vector< T > > for_each_page (size_t n, F f) {
    std::map< size_t, std::vector< T > > xs;

    for (size_t i = 0; i < n; ++i) {
        auto x = f (i);

        if (!x.empty ()) {
            xs.emplace (i, std::move (x));
        }
    }

    return xs;
}

bool is_type (const raw_object_t& obj, const char* key, const char* name) {
    const auto dict = obj.dict ();
    return ast::is_name (ast::find (dict, key), name);
}

} // anonymous namespace

document_t::document_t (std::string_view buf, const params_t& params)
    : pimpl_ (std::make_shared< impl_t > (buf, params))
{ }

document_t::document_t (std::istream& stream, const params_t& params)
    : pimpl_ (std::make_shared< impl_t > (read_all (stream), params))
{ }

size_t document_t::page_count () const {
    return pimpl_->pages.size ();
}

const page_t& document_t::page (size_t n) const {
    return pimpl_->page (n);
}

const std::vector< page_t >& document_t::pages () const {
    return pimpl_->pages;
}

std::vector< text_item_t > document_t::text (size_t n) const {
    const auto& p = *pimpl_;
    return extract_text (p.resolver, p.fonts, p.page (n));
}

std::map< size_t, std::vector< text_item_t > > document_t::text () const {
    pimpl_->check_not_empty ();

    return for_each_page< text_item_t > (
        page_count (), [this](size_t i) { return text (i); });
}

std::vector< image_t > document_t::images (size_t n) const {
    const auto& p = *pimpl_;
    return extract_images (p.resolver, p.fonts, p.page (n));
}

std::map< size_t, std::vector< image_t > > document_t::images () const {
    pimpl_->check_not_empty ();

    return for_each_page< image_t > (
        page_count (), [this](size_t i) { return images (i); });
}

std::vector< page_font_t > document_t::fonts (size_t n) const {
    const auto& p = *pimpl_;

    std::vector< page_font_t > xs;

    for (const auto& [name, num] : p.page (n).resources.fonts) {
        auto iter = p.fonts.find (num);
        PDFREAD_ASSERT (iter != p.fonts.end ());

        xs.push_back (page_font_t{ name, iter->second });
    }

    return xs;
}

std::map< size_t, std::vector< page_font_t > > document_t::fonts () const {
    pimpl_->check_not_empty ();

    return for_each_page< page_font_t > (
        page_count (), [this](size_t i) { return fonts (i); });
}

std::vector< text_line_t > document_t::lines (size_t n) const {
    return make_lines (text (n), pimpl_->params.line_tolerance);
}

std::vector< text_block_t > document_t::text_blocks (size_t n) const {
    return make_blocks (lines (n));
}

std::vector< text_item_t > document_t::words (size_t n) const {
    return make_words (text (n));
}

std::string document_t::plain_text (size_t n) const {
    return make_plain_text (lines (n));
}

std::vector< match_t >
document_t::search (size_t n, std::string_view needle, bool ignore_case) const {
    return search_lines (lines (n), n, needle, ignore_case);
}

std::vector< match_t >
document_t::search (std::string_view needle, bool ignore_case) const {
    std::vector< match_t > xs;

    for (size_t i = 0; i < page_count (); ++i) {
        auto ys = search (i, needle, ignore_case);
        xs.insert (xs.end (),
                   std::make_move_iterator (ys.begin ()),
                   std::make_move_iterator (ys.end ()));
    }

    return xs;
}

std::vector< std::pair< double, double > > document_t::page_sizes () const {
    std::vector< std::pair< double, double > > xs;

    for (const auto& page : pimpl_->pages) {
        xs.emplace_back (page.width (), page.height ());
    }

    return xs;
}

const raw_object_t* document_t::object (int num) const {
    return pimpl_->store.find (num);
}

std::optional< std::string >
document_t::dict_key (int num, std::string_view key) const {
    auto obj = object (num);

    if (0 == obj) {
        return { };
    }

    const std::string_view text = obj->dict_text;

    parser_t parser (text, 0, pimpl_->params.max_object_nesting);

    if (parser.peek ().type != token_t::DICT_BEGIN_) {
        return { };
    }

    for (parser.shift (); parser.peek ().type != token_t::DICT_END_ &&
             parser.peek ().type != token_t::EOF_; ) {
        if (parser.peek ().type != token_t::NAME_) {
            error (errSyntaxWarning, parser.pos (),
                   "Dictionary key is not a name");
            parser.next ();
            continue;
        }

        const bool found = parser.peek ().s == key;
        parser.shift ();

        const size_t first = parser.pos ();
        parser.next ();

        if (found) {
            auto s = text.substr (first, parser.pos () - first);

            while (!s.empty () && lexer_t::is_space ((unsigned char)s.back ())) {
                s.remove_suffix (1);
            }

            return std::string (s);
        }
    }

    return { };
}

ast::obj_t document_t::page_attribute (size_t n, std::string_view key) const {
    const auto& p = *pimpl_;
    return p.resolver.resolve (p.resolver.resolve_inherited (p.page (n).num, key));
}

ast::dict_t document_t::catalog () const {
    const auto& p = *pimpl_;

    auto dict = p.resolver.lookup_dict (p.store.root ().num);
    return dict ? *dict : ast::dict_t{ };
}

const ast::dict_t& document_t::trailer () const {
    return pimpl_->store.trailer ();
}

const std::string& document_t::version () const {
    return pimpl_->store.version ();
}

stats_t document_t::stats () const {
    const auto& p = *pimpl_;

    stats_t x;

    x.pages = p.pages.size ();
    x.objects = p.store.size ();

    const auto objects = p.store.objects () | views::values;

    x.fonts = ranges::count_if (objects, [](const auto& obj) {
        return is_type (obj, "Type", "Font");
    });

    x.images = ranges::count_if (objects, [](const auto& obj) {
        return obj.is_stream () && is_type (obj, "Subtype", "Image");
    });

    std::set< int > contents;

    for (const auto& page : p.pages) {
        contents.insert (page.contents.begin (), page.contents.end ());
    }

    x.contents = contents.size ();
    x.strategy = p.store.strategy ();

    return x;
}

const params_t& document_t::params () const {
    return pimpl_->params;
}

} // namespace pdfread
