// -*- mode: c++; -*-
// Copyright 2001-2003 Glyph & Cog, LLC
// Copyright 2020- Thinkoid, LLC

#include <defs.hh>

#include <pdfread/unicode.hh>

namespace pdfread {

void append_utf8 (std::string& s, char32_t c) {
    if (c > 0x10ffff || (c >= 0xd800 && c <= 0xdfff)) {
        c = 0xfffd;
    }

    if (c <= 0x0000007f) {
        s.append (1, char (c));
    }
    else if (c <= 0x000007ff) {
        s.append (1, char (0xc0 + (c >> 6)));
        s.append (1, char (0x80 + (c & 0x3f)));
    }
    else if (c <= 0x0000ffff) {
        s.append (1, char (0xe0 + (c >> 12)));
        s.append (1, char (0x80 + ((c >> 6) & 0x3f)));
        s.append (1, char (0x80 + (c & 0x3f)));
    }
    else {
        s.append (1, char (0xf0 +  (c >> 18)));
        s.append (1, char (0x80 + ((c >> 12) & 0x3f)));
        s.append (1, char (0x80 + ((c >>  6) & 0x3f)));
        s.append (1, char (0x80 +  (c        & 0x3f)));
    }
}

std::string to_utf8 (std::u32string_view xs) {
    std::string s;
    s.reserve (xs.size ());

    for (auto c : xs) {
        append_utf8 (s, c);
    }

    return s;
}

std::u32string from_utf16be (std::string_view buf) {
    std::u32string s;

    auto unit = [&](size_t i) -> char32_t {
        const char32_t hi = (unsigned char)buf [i];
        const char32_t lo = i + 1 < buf.size () ? (unsigned char)buf [i + 1] : 0;

        return (hi << 8) | lo;
    };

    for (size_t i = 0; i < buf.size (); i += 2) {
        const char32_t c = unit (i);

        if (c >= 0xd800 && c <= 0xdbff && i + 3 < buf.size ()) {
            const char32_t c2 = unit (i + 2);

            if (c2 >= 0xdc00 && c2 <= 0xdfff) {
                s.append (1, 0x10000 + ((c - 0xd800) << 10) + (c2 - 0xdc00));
                i += 2;
                continue;
            }
        }

        if (c >= 0xd800 && c <= 0xdfff) {
            s.append (1, 0xfffd);
        }
        else {
            s.append (1, c);
        }
    }

    return s;
}

std::u32string from_latin1 (std::string_view buf) {
    std::u32string s;
    s.reserve (buf.size ());

    for (auto c : buf) {
        s.append (1, char32_t ((unsigned char)c));
    }

    return s;
}

std::u32string from_utf8 (std::string_view buf) {
    std::u32string s;

    for (size_t i = 0; i < buf.size (); ) {
        const unsigned char c = buf [i];

        size_t n;
        char32_t x;

        if (c < 0x80) {
            n = 1, x = c;
        }
        else if ((c & 0xe0) == 0xc0) {
            n = 2, x = c & 0x1f;
        }
        else if ((c & 0xf0) == 0xe0) {
            n = 3, x = c & 0x0f;
        }
        else if ((c & 0xf8) == 0xf0) {
            n = 4, x = c & 0x07;
        }
        else {
            s.append (1, 0xfffd);
            ++i;
            continue;
        }

        if (i + n > buf.size ()) {
            s.append (1, 0xfffd);
            break;
        }

        size_t j = 1;

        for (; j < n && ((unsigned char)buf [i + j] & 0xc0) == 0x80; ++j) {
            x = (x << 6) | ((unsigned char)buf [i + j] & 0x3f);
        }

        s.append (1, j == n ? x : char32_t (0xfffd));
        i += j;
    }

    return s;
}

char32_t fold_case (char32_t c) {
    if (c >= 'A' && c <= 'Z') {
        return c + 32;
    }

    if (c < 0xc0) {
        return c;
    }

    // Latin-1 Supplement, except the multiplication sign:
    if (c <= 0xde) {
        return c == 0xd7 ? c : c + 32;
    }

    // Latin Extended-A, in pairs:
    if (c >= 0x100 && c <= 0x137) {
        return c | 1;
    }

    if (c >= 0x139 && c <= 0x148) {
        return c & 1 ? c + 1 : c;
    }

    if (c >= 0x14a && c <= 0x177) {
        return c | 1;
    }

    // Greek:
    if ((c >= 0x391 && c <= 0x3a1) || (c >= 0x3a3 && c <= 0x3ab)) {
        return c + 32;
    }

    if (c == 0x3c2) {
        return 0x3c3;
    }

    // Cyrillic:
    if (c >= 0x400 && c <= 0x40f) {
        return c + 80;
    }

    if (c >= 0x410 && c <= 0x42f) {
        return c + 32;
    }

    if (c >= 0x460 && c <= 0x4ff && !(c >= 0x482 && c <= 0x489)) {
        return c | 1;
    }

    return c;
}

std::u32string fold_case (std::u32string s) {
    for (auto& c : s) {
        c = fold_case (c);
    }

    return s;
}

} // namespace pdfread
