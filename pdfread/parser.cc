// -*- mode: c++; -*-
// Copyright 1996-2003 Glyph & Cog, LLC
// Copyright 2020- Thinkoid, LLC

#include <defs.hh>

#include <cerrno>
#include <climits>
#include <cstdlib>

#include <pdfread/error.hh>
#include <pdfread/parser.hh>

namespace pdfread {
namespace {

inline bool is_keyword (const token_t& tok, const char* s) {
    return tok.type == token_t::KEYWORD_ && tok.s == s;
}

inline bool is_eof (const token_t& tok) {
    return tok.type == token_t::EOF_;
}

inline bool is_int (const token_t& tok) {
    return tok.is_int ();
}

ast::obj_t make_number (const token_t& tok) {
    if (is_int (tok)) {
        errno = 0;
        const long n = std::strtol (tok.s.c_str (), 0, 10);

        if (errno == 0 && n >= INT_MIN && n <= INT_MAX) {
            return int (n);
        }
    }

    return tok.num;
}

} // anonymous namespace

parser_t::parser_t (std::string_view buf, size_t pos, size_t max_nesting)
    : lexer_ (buf, pos), max_nesting_ (max_nesting) {
    shift ();
    shift ();
}

void parser_t::shift () {
    buf1_ = std::move (buf2_);
    pos1_ = pos2_;
    end1_ = end2_;

    lexer_.skip_space ();
    pos2_ = lexer_.pos ();

    buf2_ = lexer_.next ();
    end2_ = lexer_.pos ();
}

bool parser_t::at_terminator () const {
    return is_eof (buf1_)
        || is_keyword (buf1_, "endobj")
        || is_keyword (buf1_, "stream")
        || is_keyword (buf1_, "endstream")
        || is_keyword (buf1_, "obj")
        || is_keyword (buf1_, "xref")
        || is_keyword (buf1_, "trailer")
        || is_keyword (buf1_, "startxref");
}

ast::obj_t parser_t::next () {
    return do_next (0);
}

ast::obj_t parser_t::do_next (size_t depth) {
    switch (buf1_.type) {
    case token_t::ARRAY_BEGIN_: {
        if (depth >= max_nesting_) {
            error (errSyntaxError, off_t (pos1_), "Object nesting too deep");
            shift ();
            return ast::null_t{ };
        }

        shift ();

        auto arr = std::make_shared< ast::array_t > ();

        while (buf1_.type != token_t::ARRAY_END_ && !at_terminator ()) {
            if (buf1_.type == token_t::DICT_END_) {
                error (errSyntaxError, off_t (pos1_), "Unexpected '>>' in array");
                shift ();
                continue;
            }

            arr->push_back (do_next (depth + 1));
        }

        if (buf1_.type == token_t::ARRAY_END_) {
            shift ();
        }
        else {
            error (errSyntaxError, off_t (pos1_), "End of input inside array");
        }

        return arr;
    }

    case token_t::DICT_BEGIN_: {
        if (depth >= max_nesting_) {
            error (errSyntaxError, off_t (pos1_), "Object nesting too deep");
            shift ();
            return ast::null_t{ };
        }

        shift ();

        auto dict = std::make_shared< ast::dict_t > ();

        while (buf1_.type != token_t::DICT_END_ && !at_terminator ()) {
            if (buf1_.type != token_t::NAME_) {
                error (errSyntaxError, off_t (pos1_),
                       "Dictionary key must be a name object");
                shift ();
                continue;
            }

            ast::name_t key (std::move (buf1_.s));
            shift ();

            if (buf1_.type == token_t::DICT_END_ || at_terminator ()) {
                error (errSyntaxError, off_t (pos1_),
                       "Missing value for key '{0:s}'", key.c_str ());
                break;
            }

            dict->emplace_back (std::move (key), do_next (depth + 1));
        }

        if (buf1_.type == token_t::DICT_END_) {
            shift ();
        }
        else {
            error (errSyntaxError, off_t (pos1_),
                   "End of input inside dictionary");
        }

        return dict;
    }

    case token_t::NUMBER_: {
        //
        // Indirect reference or number:
        //
        if (is_int (buf1_) && is_int (buf2_)) {
            auto num = make_number (buf1_), gen = make_number (buf2_);

            shift ();

            if (is_keyword (buf2_, "R")
                && std::holds_alternative< int > (num)
                && std::holds_alternative< int > (gen)) {
                shift ();
                shift ();

                return ast::ref_t{ std::get< int > (num), std::get< int > (gen) };
            }

            return num;
        }

        auto num = make_number (buf1_);
        shift ();

        return num;
    }

    case token_t::STRING_:
    case token_t::HEX_STRING_: {
        ast::string_t str (
            std::move (buf1_.s), buf1_.type == token_t::HEX_STRING_);

        shift ();
        return str;
    }

    case token_t::NAME_: {
        ast::name_t name (std::move (buf1_.s));
        shift ();

        return name;
    }

    case token_t::KEYWORD_:
        if (buf1_.s == "true" || buf1_.s == "false") {
            const bool b = buf1_.s [0] == 't';
            shift ();

            return b;
        }
        else if (buf1_.s == "null") {
            shift ();
            return ast::null_t{ };
        }
        else if (!at_terminator ()) {
            error (errSyntaxError, off_t (pos1_),
                   "Unexpected keyword '{0:s}'", buf1_.s);
            shift ();
        }

        return ast::null_t{ };

    case token_t::ARRAY_END_:
    case token_t::DICT_END_:
        error (errSyntaxError, off_t (pos1_),
               "Unexpected '{0:s}'", buf1_.s);
        shift ();
        return ast::null_t{ };

    case token_t::EOF_:
    default:
        break;
    }

    return ast::null_t{ };
}

ast::obj_t
parse_object (std::string_view buf, size_t pos, size_t max_nesting) {
    return parser_t (buf, pos, max_nesting).next ();
}

} // namespace pdfread
