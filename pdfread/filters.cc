// -*- mode: c++; -*-
// Copyright 2020- Thinkoid, LLC

#include <defs.hh>

#include <algorithm>
#include <cstdlib>

#include <boost/iostreams/filter/zlib.hpp>
#include <boost/iostreams/filtering_stream.hpp>
namespace io = boost::iostreams;

#include <iostreams/asciihex_input_filter.hh>
#include <iostreams/view_source.hh>

#include <pdfread/error.hh>
#include <pdfread/filters.hh>

namespace pdfread {
namespace {

//
// Drain a filtering stream; a failing filter leaves the output decoded so far:
//
bool drain (io::filtering_istream& str, std::string& result) {
    char buf [4096];

    for (; str; ) {
        str.read (buf, sizeof buf);
        result.append (buf, size_t (str.gcount ()));
    }

    return !str.bad ();
}

bool is_image_filter (const std::string& s, bool inline_image) {
    return s == "DCTDecode"
        || s == "JPXDecode"
        || s == "CCITTFaxDecode"
        || s == "JBIG2Decode"
        || (inline_image && (s == "DCT" || s == "CCF"));
}

const ast::dict_t*
decode_parms (const ast::dict_t& dict, size_t i, bool inline_image) {
    auto p = ast::find (dict, "DecodeParms");

    if (0 == p && inline_image) {
        p = ast::find (dict, "DP");
    }

    if (auto pdict = ast::get_if< ast::dict_pointer > (p)) {
        return i == 0 ? pdict->get () : 0;
    }
    else if (auto parr = ast::get_if< ast::array_pointer > (p)) {
        if (*parr && i < (*parr)->size ()) {
            if (auto pdict = std::get_if< ast::dict_pointer > (&(**parr) [i])) {
                return pdict->get ();
            }
        }
    }

    return 0;
}

int param (const ast::dict_t& params, const char* key, int def) {
    auto n = ast::as_int (ast::find (params, key));
    return n ? *n : def;
}

unsigned char paeth (int a, int b, int c) {
    const int p = a + b - c;
    const int pa = std::abs (p - a), pb = std::abs (p - b), pc = std::abs (p - c);

    if (pa <= pb && pa <= pc) {
        return a;
    }
    else if (pb <= pc) {
        return b;
    }

    return c;
}

} // anonymous namespace

std::vector< std::string >
filter_names (const ast::dict_t& dict, bool inline_image) {
    std::vector< std::string > xs;

    auto p = ast::find (dict, "Filter");

    //
    // In a stream dictionary /F names an external file:
    //
    if (0 == p && inline_image) {
        p = ast::find (dict, "F");
    }

    if (auto pname = ast::get_if< ast::name_t > (p)) {
        xs.push_back (*pname);
    }
    else if (auto parr = ast::get_if< ast::array_pointer > (p)) {
        if (*parr) {
            for (const auto& obj : **parr) {
                if (auto pname = std::get_if< ast::name_t > (&obj)) {
                    xs.push_back (*pname);
                }
                else {
                    xs.push_back (std::string ());
                }
            }
        }
    }

    return xs;
}

bool flate_decode (std::string_view src, std::string& result) {
    io::filtering_istream str;

    str.push (io::zlib_decompressor ());
    str.push (iostreams::view_source_t (src));

    return drain (str, result);
}

bool asciihex_decode (std::string_view src, std::string& result) {
    io::filtering_istream str;

    str.push (iostreams::asciihex_input_filter_t ());
    str.push (iostreams::view_source_t (src));

    return drain (str, result);
}

bool undo_predictor (std::string& buf, const ast::dict_t& params) {
    const int predictor = param (params, "Predictor", 1);

    if (predictor < 2) {
        return true;
    }

    const int colors = param (params, "Colors", 1);
    const int bpc = param (params, "BitsPerComponent", 8);
    const int columns = param (params, "Columns", 1);

    if (colors < 1 || colors > 32 || columns < 1 || columns > (1 << 24) ||
        (bpc != 1 && bpc != 2 && bpc != 4 && bpc != 8 && bpc != 16)) {
        error (errSyntaxError, -1, "Invalid predictor parameters");
        return false;
    }

    const size_t bpp = (std::max) (1, colors * bpc / 8);
    const size_t row = (size_t (colors) * bpc * columns + 7) / 8;

    if (predictor == 2) {
        if (bpc != 8) {
            error (errUnimplemented, -1,
                   "TIFF predictor with {0:d} bits per component", bpc);
            return false;
        }

        for (size_t off = 0; off < buf.size (); off += row) {
            const size_t n = (std::min) (row, buf.size () - off);

            for (size_t i = bpp; i < n; ++i) {
                buf [off + i] = char (buf [off + i] + buf [off + i - bpp]);
            }
        }

        return true;
    }

    if (predictor < 10 || predictor > 15) {
        error (errUnimplemented, -1, "Unknown predictor {0:d}", predictor);
        return false;
    }

    //
    // PNG predictors, every row is preceded by its filter type:
    //
    std::string result;
    result.reserve (buf.size ());

    std::string prev (row, '\0'), cur (row, '\0');

    for (size_t off = 0; off + 1 < buf.size (); off += row + 1) {
        const int type = (unsigned char)buf [off];
        const size_t n = (std::min) (row, buf.size () - off - 1);

        std::fill (cur.begin (), cur.end (), '\0');
        std::copy (buf.begin () + off + 1, buf.begin () + off + 1 + n, cur.begin ());

        for (size_t i = 0; i < row; ++i) {
            const int a = i >= bpp ? (unsigned char)cur [i - bpp] : 0;
            const int b = (unsigned char)prev [i];
            const int c = i >= bpp ? (unsigned char)prev [i - bpp] : 0;

            int x = (unsigned char)cur [i];

            switch (type) {
            case 0: break;
            case 1: x += a; break;
            case 2: x += b; break;
            case 3: x += (a + b) / 2; break;
            case 4: x += paeth (a, b, c); break;

            default:
                error (errSyntaxError, -1,
                       "Unknown PNG row filter type {0:d}", type);
                return false;
            }

            cur [i] = char (x & 0xff);
        }

        result.append (cur, 0, n);
        prev.swap (cur);
    }

    buf = std::move (result);
    return true;
}

decoded_t
decode (std::string_view src, const ast::dict_t& dict, bool inline_image) {
    decoded_t result{ std::string (src), filter_names (dict, inline_image) };

    for (size_t i = 0; !result.pending.empty (); ++i) {
        const auto& name = result.pending.front ();

        std::string buf;

        if (name == "FlateDecode" || (inline_image && name == "Fl")) {
            if (!flate_decode (result.data, buf)) {
                if (buf.empty ()) {
                    error (errSyntaxError, -1, "Corrupt Flate stream");
                    break;
                }

                error (errSyntaxWarning, -1,
                       "Truncated Flate stream, {0:d} bytes recovered",
                       buf.size ());
            }

            if (auto params = decode_parms (dict, i, inline_image)) {
                if (!undo_predictor (buf, *params)) {
                    break;
                }
            }
        }
        else if (name == "ASCIIHexDecode" || (inline_image && name == "AHx")) {
            if (!asciihex_decode (result.data, buf)) {
                error (errSyntaxError, -1, "Corrupt ASCIIHex stream");
                break;
            }
        }
        else {
            if (!is_image_filter (name, inline_image)) {
                error (errUnimplemented, -1,
                       "Unsupported filter '{0:s}'", name);
            }

            break;
        }

        result.data = std::move (buf);
        result.pending.erase (result.pending.begin ());
    }

    return result;
}

} // namespace pdfread
