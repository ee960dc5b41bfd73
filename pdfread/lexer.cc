// -*- mode: c++; -*-
// Copyright 1996-2003 Glyph & Cog, LLC
// Copyright 2019-2020 Thinkoid, LLC.

#include <defs.hh>

#include <cctype>
#include <cstdio>
#include <cstdlib>

#include <pdfread/error.hh>
#include <pdfread/lexer.hh>

//
// 1 - whitespace, 2 - delimiter:
//
static const char specialChars [256] = {
    1, 0, 0, 0, 0, 0, 0, 0, 0, 1, 1, 0, 1, 1, 0, 0, // 0x
    0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, // 1x
    1, 0, 0, 0, 0, 2, 0, 0, 2, 2, 0, 0, 0, 0, 0, 2, // 2x
    0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 2, 0, 2, 0, // 3x
    0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, // 4x
    0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 2, 0, 2, 0, 0, // 5x
    0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, // 6x
    0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 2, 0, 2, 0, 0, // 7x
    0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, // 8x
    0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, // 9x
    0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, // ax
    0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, // bx
    0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, // cx
    0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, // dx
    0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, // ex
    0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0  // fx
};

namespace pdfread {

static int hex_value (int c) {
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    else if (c >= 'A' && c <= 'F') {
        return c - 'A' + 10;
    }
    else if (c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
    }

    return -1;
}

void lexer_t::skip_space () {
    bool comment = false;

    for (int c; (c = look_char ()) != EOF; get_char ()) {
        if (comment) {
            if (c == '\r' || c == '\n') {
                comment = false;
            }
        }
        else if (c == '%') {
            comment = true;
        }
        else if (specialChars [c] != 1) {
            break;
        }
    }
}

token_t lexer_t::next () {
    for (;;) {
        skip_space ();

        int c = get_char ();

        switch (c) {
        case EOF:
            return { token_t::EOF_, { } };

        case '0': case '1': case '2': case '3': case '4':
        case '5': case '6': case '7': case '8': case '9':
        case '-': case '+': case '.':
            return next_number (c);

        case '(':
            return next_string ();

        case '/': {
            //
            // Name, #xx escapes are kept verbatim:
            //
            std::string s;

            while ((c = look_char ()) != EOF && !specialChars [c]) {
                s.append (1, char (get_char ()));
            }

            return { token_t::NAME_, std::move (s) };
        }

        case '[':
            return { token_t::ARRAY_BEGIN_, "[" };

        case ']':
            return { token_t::ARRAY_END_, "]" };

        case '<':
            if (look_char () == '<') {
                get_char ();
                return { token_t::DICT_BEGIN_, "<<" };
            }

            return next_hex_string ();

        case '>':
            if (look_char () == '>') {
                get_char ();
                return { token_t::DICT_END_, ">>" };
            }

            error (errSyntaxError, off_t (pos_ - 1), "Illegal character '>'");
            break;

        case ')': case '{': case '}':
            error (errSyntaxError, off_t (pos_ - 1),
                   "Illegal character '{0:c}'", char (c));
            break;

        default: {
            //
            // Keywords, including true, false and null:
            //
            std::string s (1UL, char (c));

            while ((c = look_char ()) != EOF && !specialChars [c]) {
                s.append (1, char (get_char ()));
            }

            return { token_t::KEYWORD_, std::move (s) };
        }
        }
    }
}

token_t lexer_t::next_number (int c) {
    std::string s (1UL, char (c));
    bool real = c == '.';

    for (;;) {
        c = look_char ();

        if (isdigit (c)) {
            s.append (1, char (get_char ()));
        }
        else if (c == '.' && !real) {
            s.append (1, char (get_char ()));
            real = true;
        }
        else if (c == '-' && real) {
            // Ignore, just like Adobe(?):
            get_char ();
        }
        else {
            break;
        }
    }

    return { token_t::NUMBER_, s, std::strtod (s.c_str (), 0) };
}

token_t lexer_t::next_string () {
    int nesting = 1;
    std::string s;

    for (bool done = false; !done; ) {
        int c, c2 = EOF;

        switch (c = get_char ()) {
        case EOF:
            error (errSyntaxError, off_t (pos_), "Unterminated string");
            done = true;
            break;

        case '(':
            ++nesting;
            c2 = c;
            break;

        case ')':
            if (--nesting == 0) {
                done = true;
            }
            else {
                c2 = c;
            }

            break;

        case '\\':
            switch (c = get_char ()) {
            case 'n': c2 = '\n'; break;
            case 'r': c2 = '\r'; break;
            case 't': c2 = '\t'; break;
            case 'b': c2 = '\b'; break;
            case 'f': c2 = '\f'; break;
            case '\\': case '(': case ')': c2 = c; break;
            case '0': case '1': case '2': case '3': case '4':
            case '5': case '6': case '7':
                c2 = c - '0';
                c = look_char ();
                if (c >= '0' && c <= '7') {
                    get_char ();
                    c2 = (c2 << 3) + (c - '0');
                    c = look_char ();
                    if (c >= '0' && c <= '7') {
                        get_char ();
                        c2 = (c2 << 3) + (c - '0');
                    }
                }
                c2 &= 0xff;
                break;

            case '\r':
                if (look_char () == '\n') {
                    get_char ();
                }
                break;

            case '\n':
                break;

            case EOF:
                error (errSyntaxError, off_t (pos_), "Unterminated string");
                done = true;
                break;

            default:
                c2 = c;
                break;
            }
            break;

        default:
            c2 = c;
            break;
        }

        if (c2 != EOF) {
            s.append (1, char (c2));
        }
    }

    return { token_t::STRING_, std::move (s) };
}

token_t lexer_t::next_hex_string () {
    int c2 = 0, m = 0;
    std::string s;

    for (int c;;) {
        c = get_char ();

        if (c == '>') {
            break;
        }
        else if (c == EOF) {
            error (errSyntaxError, off_t (pos_), "Unterminated hex string");
            break;
        }
        else if (specialChars [c] != 1) {
            const int n = hex_value (c);

            if (n < 0) {
                error (errSyntaxError, off_t (pos_ - 1),
                       "Illegal character <{0:02x}> in hex string", c);
                continue;
            }

            c2 = (c2 << 4) + n;

            if (++m == 2) {
                s.append (1, char (c2));
                c2 = m = 0;
            }
        }
    }

    if (m == 1) {
        s.append (1, char (c2 << 4));
    }

    return { token_t::HEX_STRING_, std::move (s) };
}

void lexer_t::skip_to_next_line () {
    for (int c;;) {
        c = get_char ();

        if (c == EOF || c == '\n') {
            return;
        }

        if (c == '\r') {
            if (look_char () == '\n') {
                get_char ();
            }

            return;
        }
    }
}

bool lexer_t::is_space (int c) {
    return c >= 0 && c <= 0xff && specialChars [c] == 1;
}

bool lexer_t::is_special (int c) {
    return c >= 0 && c <= 0xff && specialChars [c];
}

} // namespace pdfread
