// -*- mode: c++; -*-
// Copyright 1996-2003 Glyph & Cog, LLC
// Copyright 2020- Thinkoid, LLC

#include <defs.hh>

#include <algorithm>
#include <climits>
#include <set>
#include <utility>
#include <vector>

#include <pdfread/error.hh>
#include <pdfread/lexer.hh>
#include <pdfread/parser.hh>
#include <pdfread/raw_object.hh>
#include <pdfread/xref.hh>

namespace pdfread {
namespace {

bool is_count (const token_t& tok) {
    return tok.is_int () && tok.num >= 0 && tok.num <= INT_MAX;
}

std::optional< size_t > as_offset (const ast::obj_t* p) {
    if (auto n = ast::get_if< int > (p)) {
        if (*n >= 0) {
            return size_t (*n);
        }
    }
    else if (auto n = ast::get_if< double > (p)) {
        if (*n >= 0 && *n <= double (LONG_MAX)) {
            return size_t (*n);
        }
    }
    else if (auto ref = ast::get_if< ast::ref_t > (p)) {
        //
        // Certain buggy PDF generators generate "/Prev NNN 0 R" instead
        // of "/Prev NNN":
        //
        if (ref->num >= 0) {
            return size_t (ref->num);
        }
    }

    return { };
}

struct reader_t {
    reader_t (std::string_view buf, size_t max_nesting)
        : buf_ (buf), max_nesting_ (max_nesting) { }

    //
    // Read one section at the offset, return the /Prev offset, if any:
    //
    bool read (size_t, std::optional< size_t >&);

    bool read_table (lexer_t&, std::optional< size_t >&);
    bool read_stream (const raw_object_t&, std::optional< size_t >&);

    void insert (int num, const xref_entry_t& entry) {
        //
        // Entries of newer sections are read first:
        //
        result.entries.emplace (num, entry);
    }

    //
    // Table entries of a hybrid section; a used entry replaces a free entry
    // the section's own cross-reference stream made for the same object:
    //
    void insert (int num, const xref_entry_t& entry, const std::set< int >& own) {
        auto iter = result.entries.find (num);

        if (iter == result.entries.end ()) {
            result.entries.emplace (num, entry);
        }
        else if (own.count (num) && iter->second.type == xref_entry_t::free_ &&
                 entry.type != xref_entry_t::free_) {
            iter->second = entry;
        }
    }

    void set_trailer (ast::dict_t dict) {
        if (!have_trailer_) {
            result.trailer = std::move (dict);
            have_trailer_ = true;
        }
    }

    std::string_view buf_;
    size_t max_nesting_;

    std::set< size_t > visited_;
    bool have_trailer_ = false;

    xref_t result;
};

bool reader_t::read (size_t pos, std::optional< size_t >& prev) {
    prev.reset ();

    if (pos >= buf_.size ()) {
        error (errSyntaxError, -1, "Cross-reference offset {0:d} out of range",
               pos);
        return false;
    }

    if (!visited_.insert (pos).second) {
        error (errSyntaxWarning, off_t (pos), "Infinite loop in xref table");
        return false;
    }

    lexer_t lexer (buf_, pos);
    lexer.skip_space ();

    const size_t start = lexer.pos ();
    auto tok = lexer.next ();

    if (tok.is_keyword ("xref")) {
        return read_table (lexer, prev);
    }
    else if (tok.is_int ()) {
        auto obj = read_object (buf_, start, { }, max_nesting_);

        if (!obj || !obj->is_stream ()) {
            error (errSyntaxError, off_t (start),
                   "Invalid cross-reference stream");
            return false;
        }

        return read_stream (*obj, prev);
    }

    error (errSyntaxError, off_t (start), "Invalid cross-reference section");
    return false;
}

bool reader_t::read_table (lexer_t& lexer, std::optional< size_t >& prev) {
    std::vector< std::pair< int, xref_entry_t > > entries;

    for (;;) {
        const size_t pos = lexer.pos ();
        auto tok = lexer.next ();

        if (tok.is_keyword ("trailer")) {
            break;
        }

        auto count = lexer.next ();

        if (!is_count (tok) || !is_count (count) ||
            tok.num + count.num > INT_MAX) {
            error (errSyntaxError, off_t (pos),
                   "Invalid cross-reference subsection header");
            return false;
        }

        const int first = int (tok.num), n = int (count.num);

        for (int i = first; i < first + n; ++i) {
            auto off = lexer.next ();
            auto gen = lexer.next ();
            auto type = lexer.next ();

            if (!off.is_int () || off.num < 0 || off.num > double (LONG_MAX) ||
                !is_count (gen) ||
                (!type.is_keyword ("n") && !type.is_keyword ("f"))) {
                error (errSyntaxError, off_t (lexer.pos ()),
                       "Invalid cross-reference entry for object {0:d}", i);
                return false;
            }

            if (type.s [0] == 'n') {
                entries.emplace_back (i, xref_entry_t{
                        xref_entry_t::uncompressed_,
                        size_t (off.num), int (gen.num) });
            }
            else {
                entries.emplace_back (
                    i, xref_entry_t{ xref_entry_t::free_, 0, int (gen.num) });
            }
        }
    }

    parser_t parser (lexer.buffer (), lexer.pos (), max_nesting_);
    auto obj = parser.next ();

    auto pdict = std::get_if< ast::dict_pointer > (&obj);

    if (0 == pdict || 0 == *pdict) {
        error (errSyntaxError, off_t (lexer.pos ()), "Invalid trailer");
        return false;
    }

    const auto& dict = **pdict;

    prev = as_offset (ast::find (dict, "Prev"));
    set_trailer (dict);

    //
    // Hybrid files carry the compressed objects in a separate stream, whose
    // entries take precedence over the free entries of the table:
    //
    std::set< int > own;

    if (auto stm = as_offset (ast::find (dict, "XRefStm"))) {
        std::set< int > before;

        for (const auto& item : result.entries) {
            before.insert (item.first);
        }

        std::optional< size_t > ignore;
        read (*stm, ignore);

        for (const auto& item : result.entries) {
            if (0 == before.count (item.first)) {
                own.insert (item.first);
            }
        }
    }

    for (const auto& [num, entry] : entries) {
        insert (num, entry, own);
    }

    return true;
}

bool reader_t::read_stream (const raw_object_t& obj, std::optional< size_t >& prev) {
    const auto dict = obj.dict ();

    if (!ast::is_name (ast::find (dict, "Type"), "XRef")) {
        error (errSyntaxWarning, off_t (obj.offset),
               "Cross-reference stream without /Type /XRef");
    }

    if (!obj.pending.empty ()) {
        error (errSyntaxError, off_t (obj.offset),
               "Undecodable cross-reference stream");
        return false;
    }

    auto size = ast::as_int (ast::find (dict, "Size"));

    if (!size || *size < 0) {
        error (errSyntaxError, off_t (obj.offset),
               "Invalid /Size in cross-reference stream");
        return false;
    }

    int w [3] = { 0 };

    auto pw = ast::get_if< ast::array_pointer > (ast::find (dict, "W"));

    if (0 == pw || 0 == *pw || (*pw)->size () < 3) {
        error (errSyntaxError, off_t (obj.offset),
               "Invalid /W in cross-reference stream");
        return false;
    }

    for (int i = 0; i < 3; ++i) {
        auto n = ast::as_int ((**pw) [i]);

        if (!n) {
            error (errSyntaxError, off_t (obj.offset),
                   "Invalid /W in cross-reference stream");
            return false;
        }

        w [i] = *n;
    }

    if (w [0] < 0 || w [0] > 4 || w [1] < 0 || w [1] > 8 ||
        w [2] < 0 || w [2] > 4) {
        error (errSyntaxError, off_t (obj.offset),
               "Invalid /W in cross-reference stream");
        return false;
    }

    std::vector< std::pair< int, int > > sections;

    auto pindex = ast::get_if< ast::array_pointer > (ast::find (dict, "Index"));

    if (pindex && *pindex) {
        const auto& index = **pindex;

        for (size_t i = 0; i + 1 < index.size (); i += 2) {
            auto first = ast::as_int (index [i]), n = ast::as_int (index [i + 1]);

            if (!first || !n || *first < 0 || *n < 0 || *first > INT_MAX - *n) {
                error (errSyntaxError, off_t (obj.offset),
                       "Invalid /Index in cross-reference stream");
                return false;
            }

            sections.emplace_back (*first, *n);
        }
    }
    else {
        sections.emplace_back (0, *size);
    }

    const auto& data = *obj.stream;
    size_t pos = 0;

    auto field = [&](int width, unsigned long long& value) {
        for (value = 0; width > 0; --width) {
            if (pos >= data.size ()) {
                return false;
            }

            value = (value << 8) + (unsigned char)data [pos++];
        }

        return true;
    };

    for (const auto& [first, n] : sections) {
        for (int i = first; i < first + n; ++i) {
            unsigned long long type = 1, offset, gen;

            if ((w [0] && !field (w [0], type)) ||
                !field (w [1], offset) || !field (w [2], gen)) {
                error (errSyntaxError, off_t (obj.offset),
                       "Truncated cross-reference stream");
                goto done;
            }

            switch (type) {
            case 0:
                insert (i, { xref_entry_t::free_, 0, int (gen) });
                break;

            case 1:
                insert (i, {
                        xref_entry_t::uncompressed_,
                        size_t (offset), int (gen) });
                break;

            case 2:
                insert (i, {
                        xref_entry_t::compressed_,
                        size_t (offset), int (gen) });
                break;

            default:
                //
                // Unknown types are null references:
                //
                break;
            }
        }
    }

done:
    prev = as_offset (ast::find (dict, "Prev"));
    set_trailer (dict);

    return true;
}

} // anonymous namespace

std::optional< size_t > find_startxref (std::string_view buf) {
    const size_t n = (std::min) (buf.size (), size_t (PDFREAD_XREF_SEARCH_SIZE));
    const auto tail = buf.substr (buf.size () - n);

    const auto i = tail.rfind ("startxref");

    if (i == std::string_view::npos) {
        return { };
    }

    lexer_t lexer (buf, buf.size () - n + i + 9);
    auto tok = lexer.next ();

    if (!tok.is_int () || tok.num < 0) {
        return { };
    }

    return size_t (tok.num);
}

std::optional< xref_t >
read_xref (std::string_view buf, size_t max_nesting) {
    auto pos = find_startxref (buf);

    if (!pos) {
        error (errSyntaxError, -1, "Missing startxref");
        return { };
    }

    reader_t reader (buf, max_nesting);
    std::optional< size_t > prev;

    if (!reader.read (*pos, prev)) {
        return { };
    }

    for (; prev; ) {
        if (!reader.read (*prev, prev)) {
            error (errSyntaxWarning, -1,
                   "Ignoring broken older cross-reference sections");
            break;
        }
    }

    return std::move (reader.result);
}

} // namespace pdfread
