// -*- mode: c++; -*-
// Copyright 2020- Thinkoid, LLC

#include <defs.hh>

#include <cmath>

#include <algorithm>
#include <functional>
#include <utility>

#include <pdfread/text.hh>

#include <range/v3/algorithm/stable_sort.hpp>
using namespace ranges;

namespace pdfread {
namespace {

inline bool is_blank (char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f';
}

//
// Number of code points in UTF-8 text:
//
inline size_t length_of (const std::string& s) {
    return std::count_if (s.begin (), s.end (), [](char c) {
        return (c & 0xC0) != 0x80;
    });
}

void append_item (text_line_t& line, const text_item_t& item) {
    if (line.items.empty ()) {
        line.x = item.x;
        line.y = item.y;
    }
    else {
        const auto& prev = line.items.back ();

        //
        // A gap of a fifth of the font size separates words:
        //
        const double gap = item.x - (prev.x + prev.width);
        const double size = (std::max) (prev.font_size, item.font_size);

        if (gap > 0.2 * size &&
            !line.text.empty () && !is_blank (line.text.back ()) &&
            !item.text.empty () && !is_blank (item.text.front ())) {
            line.text += ' ';
        }
    }

    line.font_size = (std::max) (line.font_size, item.font_size);

    line.offsets.push_back (line.text.size ());
    line.text += item.text;

    line.items.push_back (item);
}

//
// Right edge of the last item of a line:
//
inline double right_of (const text_line_t& line) {
    if (line.items.empty ()) {
        return line.x;
    }

    const auto& last = line.items.back ();
    return last.x + last.width;
}

bool continues (const text_block_t& block, const text_line_t& line) {
    const auto& prev = block.lines.back ();
    const double size = prev.font_size;

    if (std::fabs (size - line.font_size) > PDFREAD_BLOCK_FONT_SIZE_DELTA) {
        return false;
    }

    const double spacing = line.y - prev.y;

    if (spacing <= 0 || spacing > PDFREAD_BLOCK_SPACING * size) {
        return false;
    }

    const double indent = prev.x - line.x;

    if (block.lines.size () == 1 && indent > 0) {
        return indent <= PDFREAD_BLOCK_FIRST_INDENT * size;
    }

    return std::fabs (indent) <= PDFREAD_BLOCK_INDENT * size;
}

void close_block (text_block_t& block) {
    double left = block.lines.front ().x, right = left;

    for (const auto& line : block.lines) {
        left = (std::min) (left, line.x);
        right = (std::max) (right, right_of (line));
    }

    const auto& first = block.lines.front ();
    const auto& last = block.lines.back ();

    block.x = left;
    block.y = first.y;
    block.width = right - left;
    block.height = last.y - first.y + last.font_size;

    block.text = make_plain_text (block.lines);
}

} // anonymous namespace

//------------------------------------------------------------------------
// text_output_dev_t
//------------------------------------------------------------------------

void text_output_dev_t::show_text (const gfx_state_t&, const text_run_t& run) {
    text_item_t item;

    item.text = run.text;
    item.x = run.x;
    item.y = run.y;
    item.font_name = display_name (run.font_info, run.font);
    item.font_size = run.font_size;
    item.width = run.width;

    items.push_back (std::move (item));
}

std::vector< text_item_t >
extract_text (const resolver_t& resolver, const font_cache_t& fonts,
              const page_t& page) {
    text_output_dev_t out;

    gfx_t gfx (resolver, fonts, out);
    gfx.run (page);

    return std::move (out.items);
}

std::vector< text_line_t >
make_lines (std::vector< text_item_t > items, double tolerance) {
    ranges::stable_sort (items, std::less<>{ }, &text_item_t::y);

    std::vector< text_line_t > lines;
    std::vector< text_item_t > line;

    auto flush = [&]() {
        if (line.empty ()) {
            return;
        }

        ranges::stable_sort (line, std::less<>{ }, &text_item_t::x);

        text_line_t xs;

        for (const auto& item : line) {
            append_item (xs, item);
        }

        lines.push_back (std::move (xs));
        line.clear ();
    };

    for (auto& item : items) {
        if (!line.empty () && std::fabs (item.y - line.front ().y) >= tolerance) {
            flush ();
        }

        line.push_back (std::move (item));
    }

    flush ();

    return lines;
}

std::vector< text_item_t >
make_words (const std::vector< text_item_t >& items) {
    std::vector< text_item_t > words;

    for (const auto& item : items) {
        const size_t n = length_of (item.text);
        const double cw = n ? item.width / n : 0;

        size_t cp = 0, first = 0;
        std::string word;

        auto flush = [&]() {
            if (word.empty ()) {
                return;
            }

            text_item_t x = item;

            x.x = item.x + first * cw;
            x.width = length_of (word) * cw;
            x.text = std::move (word);

            words.push_back (std::move (x));
            word.clear ();
        };

        for (char c : item.text) {
            if (is_blank (c)) {
                flush ();
            }
            else {
                if (word.empty ()) {
                    first = cp;
                }

                word += c;
            }

            if ((c & 0xC0) != 0x80) {
                ++cp;
            }
        }

        flush ();
    }

    return words;
}

std::vector< text_block_t > make_blocks (std::vector< text_line_t > lines) {
    std::vector< text_block_t > blocks;

    for (auto& line : lines) {
        if (blocks.empty () || !continues (blocks.back (), line)) {
            if (!blocks.empty ()) {
                close_block (blocks.back ());
            }

            blocks.emplace_back ();
        }

        blocks.back ().lines.push_back (std::move (line));
    }

    if (!blocks.empty ()) {
        close_block (blocks.back ());
    }

    return blocks;
}

std::string make_plain_text (const std::vector< text_line_t >& lines) {
    std::string s;

    for (const auto& line : lines) {
        if (!s.empty ()) {
            s += '\n';
        }

        s += line.text;
    }

    return s;
}

} // namespace pdfread
