// -*- mode: c++; -*-
// Copyright 1996-2003 Glyph & Cog, LLC
// Copyright 2020- Thinkoid, LLC

#include <defs.hh>

#include <pdfread/error.hh>
#include <pdfread/font.hh>
#include <pdfread/lexer.hh>
#include <pdfread/unicode.hh>

namespace pdfread {
namespace {

//
// Bound on the number of codes in a single bfrange:
//
const unsigned max_range_size = 0x10000;

unsigned code_of (const std::string& s) {
    unsigned code = 0;

    for (size_t i = 0; i < s.size () && i < 4; ++i) {
        code = (code << 8) | (unsigned char)s [i];
    }

    return code;
}

void parse_bfchar (lexer_t& lexer, to_unicode_t& xs) {
    for (;;) {
        auto src = lexer.next ();

        if (src.type != token_t::HEX_STRING_) {
            if (!src.is_keyword ("endbfchar")) {
                error (errSyntaxError, -1, "Invalid bfchar in ToUnicode CMap");
            }

            break;
        }

        auto dst = lexer.next ();

        if (dst.type == token_t::HEX_STRING_) {
            xs [code_of (src.s)] = from_utf16be (dst.s);
        }
        else if (dst.type != token_t::NAME_) {
            error (errSyntaxError, -1, "Invalid bfchar in ToUnicode CMap");
            break;
        }
    }
}

void parse_bfrange (lexer_t& lexer, to_unicode_t& xs) {
    for (;;) {
        auto lo = lexer.next ();

        if (lo.type != token_t::HEX_STRING_) {
            if (!lo.is_keyword ("endbfrange")) {
                error (errSyntaxError, -1, "Invalid bfrange in ToUnicode CMap");
            }

            break;
        }

        auto hi = lexer.next ();
        auto dst = lexer.next ();

        if (hi.type != token_t::HEX_STRING_) {
            error (errSyntaxError, -1, "Invalid bfrange in ToUnicode CMap");
            break;
        }

        const unsigned first = code_of (lo.s), last = code_of (hi.s);

        if (last < first || last - first >= max_range_size) {
            error (errSyntaxError, -1,
                   "Invalid bfrange <{0:x}> <{1:x}> in ToUnicode CMap",
                   first, last);

            if (dst.type == token_t::ARRAY_BEGIN_) {
                for (; lexer.next ().type != token_t::ARRAY_END_ && !lexer.eof (); ) ;
            }

            continue;
        }

        if (dst.type == token_t::HEX_STRING_) {
            auto s = from_utf16be (dst.s);

            if (s.empty ()) {
                continue;
            }

            for (unsigned code = first; code <= last; ++code) {
                xs [code] = s;
                ++s.back ();
            }
        }
        else if (dst.type == token_t::ARRAY_BEGIN_) {
            unsigned code = first;

            for (auto tok = lexer.next ();
                 tok.type != token_t::ARRAY_END_ && tok.type != token_t::EOF_;
                 tok = lexer.next ()) {
                if (tok.type == token_t::HEX_STRING_ && code <= last) {
                    xs [code++] = from_utf16be (tok.s);
                }
            }
        }
        else {
            error (errSyntaxError, -1, "Invalid bfrange in ToUnicode CMap");
            break;
        }
    }
}

std::string name_of (const resolver_t& resolver, const ast::dict_t& dict,
                     std::string_view key) {
    if (auto p = ast::find (dict, key)) {
        auto value = resolver.resolve (*p);

        if (auto name = std::get_if< ast::name_t > (&value)) {
            return *name;
        }
    }

    return { };
}

void read_simple_widths (const resolver_t& resolver, const ast::dict_t& dict,
                         font_info_t& font) {
    if (auto p = ast::find (dict, "FirstChar")) {
        if (auto n = ast::as_int (resolver.resolve (*p))) {
            font.first_char = *n;
        }
    }

    if (auto p = ast::find (dict, "Widths")) {
        if (auto arr = resolver.resolve_array (*p)) {
            for (const auto& x : *arr) {
                auto n = ast::as_number (resolver.resolve (x));
                font.widths.push_back (n ? *n : 0.);
            }
        }
    }
}

void read_cid_widths (const resolver_t& resolver, const ast::dict_t& dict,
                      font_info_t& font) {
    if (auto p = ast::find (dict, "DW")) {
        if (auto n = ast::as_number (resolver.resolve (*p))) {
            font.default_width = *n;
        }
    }

    auto p = ast::find (dict, "W");

    if (0 == p) {
        return;
    }

    auto arr = resolver.resolve_array (*p);

    if (0 == arr) {
        return;
    }

    //
    // Entries are either `c [w1 w2 ...]' or `first last w':
    //
    const auto& xs = *arr;

    for (size_t i = 0; i < xs.size (); ) {
        auto first = ast::as_int (xs [i]);

        if (!first || *first < 0 || i + 1 >= xs.size ()) {
            error (errSyntaxError, -1, "Bad /W array in font {0:d}", font.num);
            break;
        }

        if (auto ws = resolver.resolve_array (xs [i + 1])) {
            unsigned code = *first;

            for (const auto& w : *ws) {
                if (auto n = ast::as_number (w)) {
                    font.cid_widths [code] = *n;
                }

                ++code;
            }

            i += 2;
        }
        else {
            auto last = ast::as_int (xs [i + 1]);
            auto w = i + 2 < xs.size () ? ast::as_number (xs [i + 2]) : std::nullopt;

            if (!last || !w || *last < *first ||
                unsigned (*last - *first) >= max_range_size) {
                error (errSyntaxError, -1,
                       "Bad /W array in font {0:d}", font.num);
                break;
            }

            for (int code = *first; code <= *last; ++code) {
                font.cid_widths [code] = *w;
            }

            i += 3;
        }
    }
}

void read_descriptor (const resolver_t& resolver, const ast::dict_t& dict,
                      font_info_t& font) {
    auto p = ast::find (dict, "FontDescriptor");

    if (0 == p) {
        return;
    }

    auto desc = resolver.resolve_dict (*p);

    if (0 == desc) {
        return;
    }

    if (auto pwidth = ast::find (*desc, "MissingWidth")) {
        font.missing_width = ast::as_number (resolver.resolve (*pwidth));
    }

    for (const char* key : { "FontFile", "FontFile2", "FontFile3" }) {
        auto pfile = ast::find (*desc, key);

        if (0 == pfile) {
            continue;
        }

        font.embedded = true;

        if (auto obj = resolver.resolve_object (*pfile); obj && obj->is_stream ()) {
            font.program = *obj->stream;
        }

        break;
    }
}

} // anonymous namespace

to_unicode_t parse_to_unicode (std::string_view buf) {
    to_unicode_t xs;

    lexer_t lexer (buf);

    for (auto tok = lexer.next (); tok.type != token_t::EOF_; tok = lexer.next ()) {
        if (tok.is_keyword ("beginbfchar")) {
            parse_bfchar (lexer, xs);
        }
        else if (tok.is_keyword ("beginbfrange")) {
            parse_bfrange (lexer, xs);
        }
    }

    return xs;
}

std::vector< unsigned > font_info_t::codes (std::string_view s) const {
    std::vector< unsigned > xs;

    if (is_cid ()) {
        for (size_t i = 0; i < s.size (); i += 2) {
            unsigned code = (unsigned char)s [i] << 8;

            if (i + 1 < s.size ()) {
                code |= (unsigned char)s [i + 1];
            }

            xs.push_back (code);
        }
    }
    else {
        for (auto c : s) {
            xs.push_back ((unsigned char)c);
        }
    }

    return xs;
}

std::optional< double > font_info_t::width (unsigned code) const {
    if (is_cid ()) {
        auto iter = cid_widths.find (code);
        return iter == cid_widths.end () ? default_width : iter->second;
    }

    const long i = long (code) - first_char;

    if (i >= 0 && size_t (i) < widths.size ()) {
        return widths [i];
    }

    return missing_width;
}

font_info_t read_font (const resolver_t& resolver, int num) {
    font_info_t font;
    font.num = num;

    auto dict = resolver.lookup_dict (num);

    if (0 == dict) {
        error (errSyntaxError, -1, "Font object {0:d} is not a dictionary", num);
        return font;
    }

    font.base_font = name_of (resolver, *dict, "BaseFont");
    font.subtype = name_of (resolver, *dict, "Subtype");

    if (auto p = ast::find (*dict, "Encoding")) {
        auto value = resolver.resolve (*p);

        if (auto name = std::get_if< ast::name_t > (&value)) {
            font.encoding = *name;
        }
        else if (auto pdict = std::get_if< ast::dict_pointer > (&value)) {
            if (*pdict) {
                font.encoding = name_of (resolver, **pdict, "BaseEncoding");
            }
        }
    }

    if (font.subtype == "Type0" ||
        font.encoding == "Identity-H" || font.encoding == "Identity-V") {
        font.mode = encoding_mode_t::cid_identity;
    }

    if (auto p = ast::find (*dict, "ToUnicode")) {
        auto obj = resolver.resolve_object (*p);

        if (obj && obj->is_stream ()) {
            font.to_unicode = parse_to_unicode (*obj->stream);
        }
        else if (!ast::is_name (p, "Identity")) {
            error (errSyntaxWarning, -1,
                   "Bad /ToUnicode entry in font {0:d}", num);
        }
    }

    if (font.subtype == "Type0") {
        ast::dict_pointer desc;

        if (auto p = ast::find (*dict, "DescendantFonts")) {
            if (auto arr = resolver.resolve_array (*p); arr && !arr->empty ()) {
                desc = resolver.resolve_dict (arr->front ());
            }
        }

        if (desc) {
            read_cid_widths (resolver, *desc, font);
            read_descriptor (resolver, *desc, font);
        }
        else {
            error (errSyntaxError, -1,
                   "Composite font {0:d} without a descendant font", num);
        }
    }
    else {
        read_simple_widths (resolver, *dict, font);
        read_descriptor (resolver, *dict, font);
    }

    return font;
}

std::string decode (const ast::string_t& str, const font_info_t* font) {
    std::u32string s;

    auto mapped = [&](unsigned code) {
        if (font && font->to_unicode) {
            auto iter = font->to_unicode->find (code);

            if (iter != font->to_unicode->end ()) {
                return s.append (iter->second), true;
            }
        }

        return false;
    };

    if (str.hex) {
        if (font && font->to_unicode) {
            if (str.size () % 2 == 0 && font->is_cid ()) {
                for (size_t i = 0; i + 1 < str.size (); i += 2) {
                    const unsigned code =
                        ((unsigned char)str [i] << 8) | (unsigned char)str [i + 1];

                    if (!mapped (code) && code) {
                        s.append (1, char32_t (code));
                    }
                }
            }
            else {
                for (auto c : str) {
                    const unsigned code = (unsigned char)c;

                    if (!mapped (code)) {
                        s.append (1, char32_t (code));
                    }
                }
            }
        }
        else if (font && font->is_cid () && str.size () % 2 == 0) {
            s = from_utf16be (str);
        }
        else {
            s = from_latin1 (str);
        }
    }
    else {
        if (str.size () >= 2 &&
            (unsigned char)str [0] == 0xfe && (unsigned char)str [1] == 0xff) {
            s = from_utf16be (std::string_view (str).substr (2));
        }
        else if (font && font->to_unicode) {
            for (auto c : str) {
                const unsigned code = (unsigned char)c;

                if (!mapped (code)) {
                    s.append (1, char32_t (code));
                }
            }
        }
        else {
            s = from_latin1 (str);
        }
    }

    return to_utf8 (s);
}

std::string display_name (const font_info_t* font, const std::string& name) {
    return font && !font->base_font.empty () ? font->base_font : name;
}

} // namespace pdfread
