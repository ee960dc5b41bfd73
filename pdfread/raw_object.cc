// -*- mode: c++; -*-
// Copyright 2020- Thinkoid, LLC

#include <defs.hh>

#include <climits>

#include <pdfread/error.hh>
#include <pdfread/filters.hh>
#include <pdfread/lexer.hh>
#include <pdfread/parser.hh>
#include <pdfread/raw_object.hh>

namespace pdfread {
namespace {

std::string_view trim (std::string_view s) {
    for (; !s.empty () && lexer_t::is_space (s.front ()); s.remove_prefix (1)) ;
    for (; !s.empty () && lexer_t::is_space (s.back ()); s.remove_suffix (1)) ;

    return s;
}

bool is_object_number (const token_t& tok) {
    return tok.is_int () && tok.num >= 0 && tok.num <= INT_MAX;
}

//
// Whether the `endstream' keyword follows, possibly after whitespace:
//
bool at_endstream (std::string_view buf, size_t pos) {
    lexer_t lexer (buf, pos);
    lexer.skip_space ();

    return buf.substr (lexer.pos (), 9) == "endstream";
}

//
// The end of the stream data when the length is unknown:
//
size_t find_stream_end (std::string_view buf, size_t pos) {
    auto end = buf.find ("endstream", pos);

    if (end == std::string_view::npos) {
        end = buf.find ("endobj", pos);
    }

    if (end == std::string_view::npos) {
        error (errSyntaxError, off_t (pos), "Unterminated stream");
        return buf.size ();
    }

    if (end > pos && buf [end - 1] == '\n') {
        --end;
    }

    if (end > pos && buf [end - 1] == '\r') {
        --end;
    }

    return end;
}

} // anonymous namespace

ast::obj_t raw_object_t::value () const {
    return parse_object (dict_text, 0, max_nesting);
}

ast::dict_t raw_object_t::dict () const {
    auto obj = value ();

    if (auto p = std::get_if< ast::dict_pointer > (&obj)) {
        if (*p) {
            return std::move (**p);
        }
    }

    return { };
}

std::optional< raw_object_t >
read_object (std::string_view buf, size_t offset,
             const length_resolver_t& resolve_length, size_t max_nesting) {
    lexer_t lexer (buf, offset);

    auto num = lexer.next ();
    auto gen = lexer.next ();

    if (!is_object_number (num) || !is_object_number (gen) ||
        !lexer.next ().is_keyword ("obj")) {
        return { };
    }

    raw_object_t obj;

    obj.num = int (num.num);
    obj.gen = int (gen.num);
    obj.offset = offset;
    obj.max_nesting = max_nesting;

    const size_t body = lexer.pos ();

    parser_t parser (buf, body, max_nesting);
    auto value = parser.next ();

    obj.dict_text = trim (buf.substr (body, parser.pos () - body));

    if (!parser.peek ().is_keyword ("stream")) {
        if (parser.peek ().is_keyword ("endobj")) {
            obj.end = parser.end ();
        }
        else {
            error (errSyntaxWarning, off_t (parser.pos ()),
                   "Missing 'endobj' for object {0:d}", obj.num);
            obj.end = parser.pos ();
        }

        return obj;
    }

    auto pdict = std::get_if< ast::dict_pointer > (&value);

    if (0 == pdict || 0 == *pdict) {
        error (errSyntaxError, off_t (offset),
               "Stream of object {0:d} without a dictionary", obj.num);
        return { };
    }

    const auto& dict = **pdict;

    //
    // The data begins after the EOL following the `stream' keyword:
    //
    size_t first = parser.end ();

    if (first < buf.size () && buf [first] == '\r') {
        ++first;
    }

    if (first < buf.size () && buf [first] == '\n') {
        ++first;
    }

    std::optional< long > length;
    auto plength = ast::find (dict, "Length");

    if (auto p = ast::get_if< ast::ref_t > (plength)) {
        if (resolve_length) {
            length = resolve_length (*p);
        }
    }
    else {
        auto n = ast::as_int (plength);

        if (n) {
            length = *n;
        }
    }

    size_t last;

    if (length && *length >= 0 && size_t (*length) <= buf.size () - first &&
        at_endstream (buf, first + size_t (*length))) {
        last = first + size_t (*length);
    }
    else {
        if (length) {
            error (errSyntaxWarning, off_t (offset),
                   "Bad length ({0:d}) for stream object {1:d}",
                   *length, obj.num);
        }

        last = find_stream_end (buf, first);
    }

    auto decoded = decode (buf.substr (first, last - first), dict);

    obj.stream = std::move (decoded.data);
    obj.pending = std::move (decoded.pending);

    lexer.pos (last);
    obj.end = last;

    if (lexer.next ().is_keyword ("endstream")) {
        obj.end = lexer.pos ();

        if (lexer.next ().is_keyword ("endobj")) {
            obj.end = lexer.pos ();
        }
    }

    return obj;
}

std::vector< raw_object_t >
unpack_object_stream (const raw_object_t& container) {
    std::vector< raw_object_t > objs;

    if (!container.stream) {
        return objs;
    }

    const std::string_view data = *container.stream;
    const auto dict = container.dict ();

    auto n = ast::as_int (ast::find (dict, "N"));
    auto first = ast::as_int (ast::find (dict, "First"));

    if (!n || !first || *n < 0 || *first < 0 || size_t (*first) > data.size ()) {
        error (errSyntaxError, off_t (container.offset),
               "Invalid object stream {0:d}", container.num);
        return objs;
    }

    lexer_t lexer (data);

    for (int i = 0; i < *n; ++i) {
        auto num = lexer.next ();
        auto off = lexer.next ();

        if (!is_object_number (num) || !is_object_number (off) ||
            lexer.pos () > size_t (*first)) {
            error (errSyntaxError, off_t (container.offset),
                   "Invalid object stream {0:d} header", container.num);
            break;
        }

        const size_t pos = size_t (*first) + size_t (off.num);

        if (pos >= data.size ()) {
            error (errSyntaxError, off_t (container.offset),
                   "Object {0:d} outside object stream {1:d}",
                   int (num.num), container.num);
            continue;
        }

        parser_t parser (data, pos, container.max_nesting);
        parser.next ();

        raw_object_t obj;

        obj.num = int (num.num);
        obj.dict_text = trim (data.substr (pos, parser.pos () - pos));
        obj.offset = container.offset;
        obj.end = container.end;
        obj.container = container.num;
        obj.max_nesting = container.max_nesting;

        objs.push_back (std::move (obj));
    }

    return objs;
}

} // namespace pdfread
