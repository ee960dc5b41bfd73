// -*- mode: c++; -*-
// Copyright 2020- Thinkoid, LLC

#include <defs.hh>

#include <algorithm>
#include <iterator>

#include <pdfread/search.hh>
#include <pdfread/unicode.hh>

namespace pdfread {
namespace {

//
// The item a code point offset into the line falls in:
//
size_t item_at (const std::vector< size_t >& starts, size_t off) {
    auto iter = std::upper_bound (starts.begin (), starts.end (), off);
    return iter == starts.begin () ? 0 : std::distance (starts.begin (), iter) - 1;
}

} // anonymous namespace

std::vector< match_t >
search_lines (const std::vector< text_line_t >& lines, size_t page,
              std::string_view needle, bool ignore_case) {
    std::vector< match_t > xs;

    auto pattern = from_utf8 (needle);

    if (pattern.empty ()) {
        return xs;
    }

    if (ignore_case) {
        pattern = fold_case (std::move (pattern));
    }

    for (const auto& line : lines) {
        const auto text = from_utf8 (line.text);
        const auto haystack = ignore_case ? fold_case (text) : text;

        //
        // Code point offsets of the items in the line text:
        //
        std::vector< size_t > starts;

        for (auto off : line.offsets) {
            starts.push_back (
                from_utf8 (std::string_view (line.text).substr (0, off)).size ());
        }

        for (size_t pos = haystack.find (pattern); pos != std::u32string::npos;
             pos = haystack.find (pattern, pos + pattern.size ())) {
            match_t match;

            match.page = page;
            match.text = to_utf8 (std::u32string_view (text).substr (pos, pattern.size ()));
            match.context = line.text;

            if (line.items.empty ()) {
                xs.push_back (std::move (match));
                continue;
            }

            const auto i = item_at (starts, pos);
            const auto& item = line.items [i];

            const size_t len = from_utf8 (item.text).size ();
            const double cw = len ? item.width / len : 0;

            match.x = item.x + (pos - starts [i]) * cw;
            match.y = item.y;
            match.width = item.font_size * pattern.size () * 0.5;
            match.height = item.font_size;

            xs.push_back (std::move (match));
        }
    }

    return xs;
}

} // namespace pdfread
