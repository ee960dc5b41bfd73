// -*- mode: c++; -*-
// Copyright 1996-2003 Glyph & Cog, LLC
// Copyright 2020- Thinkoid, LLC

#include <defs.hh>

#include <cmath>
#include <cstring>

#include <algorithm>
#include <utility>

#include <pdfread/error.hh>
#include <pdfread/gfx.hh>

namespace pdfread {

// Max number of operands on the stack.
#define maxArgs 33

//------------------------------------------------------------------------
// Operator table
//------------------------------------------------------------------------

//
// Sorted by name for the binary search in find_op. A negative operand count
// disables the operand check, a null handler ignores the operator:
//
/* static */ const gfx_t::operator_t gfx_t::op_table [] = {
    { "\"",  2, check_string, &gfx_t::op_move_set_show_text },
    { "'",   0, check_string, &gfx_t::op_move_show_text },
    { "B",  -1, check_none,   0 },
    { "B*", -1, check_none,   0 },
    { "BDC",-1, check_none,   0 },
    { "BI", -1, check_none,   0 },
    { "BMC",-1, check_none,   0 },
    { "BT",  0, check_none,   &gfx_t::op_begin_text },
    { "BX",  0, check_none,   &gfx_t::op_begin_ignore_undef },
    { "CS", -1, check_none,   0 },
    { "DP", -1, check_none,   0 },
    { "Do",  0, check_name,   &gfx_t::op_xobject },
    { "EI", -1, check_none,   0 },
    { "EMC",-1, check_none,   0 },
    { "ET",  0, check_none,   &gfx_t::op_end_text },
    { "EX",  0, check_none,   &gfx_t::op_end_ignore_undef },
    { "F",  -1, check_none,   0 },
    { "G",  -1, check_none,   0 },
    { "ID", -1, check_none,   0 },
    { "J",  -1, check_none,   0 },
    { "K",  -1, check_none,   0 },
    { "M",  -1, check_none,   0 },
    { "MP", -1, check_none,   0 },
    { "Q",   0, check_none,   &gfx_t::op_restore },
    { "RG", -1, check_none,   0 },
    { "S",  -1, check_none,   0 },
    { "SC", -1, check_none,   0 },
    { "SCN",-1, check_none,   0 },
    { "T*",  0, check_none,   &gfx_t::op_text_next_line },
    { "TD",  2, check_none,   &gfx_t::op_text_move_set },
    { "TJ",  0, check_array,  &gfx_t::op_show_space_text },
    { "TL",  1, check_none,   &gfx_t::op_set_text_leading },
    { "Tc",  1, check_none,   &gfx_t::op_set_char_spacing },
    { "Td",  2, check_none,   &gfx_t::op_text_move },
    { "Tf",  1, check_name,   &gfx_t::op_set_font },
    { "Tj",  0, check_string, &gfx_t::op_show_text },
    { "Tm",  6, check_none,   &gfx_t::op_set_text_matrix },
    { "Tr", -1, check_none,   0 },
    { "Ts",  1, check_none,   &gfx_t::op_set_rise },
    { "Tw",  1, check_none,   &gfx_t::op_set_word_spacing },
    { "Tz",  1, check_none,   &gfx_t::op_set_horiz_scaling },
    { "W",  -1, check_none,   0 },
    { "W*", -1, check_none,   0 },
    { "b",  -1, check_none,   0 },
    { "b*", -1, check_none,   0 },
    { "c",  -1, check_none,   0 },
    { "cm",  6, check_none,   &gfx_t::op_concat },
    { "cs", -1, check_none,   0 },
    { "d",  -1, check_none,   0 },
    { "d0", -1, check_none,   0 },
    { "d1", -1, check_none,   0 },
    { "f",  -1, check_none,   0 },
    { "f*", -1, check_none,   0 },
    { "g",  -1, check_none,   0 },
    { "gs", -1, check_none,   0 },
    { "h",  -1, check_none,   0 },
    { "i",  -1, check_none,   0 },
    { "j",  -1, check_none,   0 },
    { "k",  -1, check_none,   0 },
    { "l",  -1, check_none,   0 },
    { "m",  -1, check_none,   0 },
    { "n",  -1, check_none,   0 },
    { "q",   0, check_none,   &gfx_t::op_save },
    { "re", -1, check_none,   0 },
    { "rg", -1, check_none,   0 },
    { "ri", -1, check_none,   0 },
    { "s",  -1, check_none,   0 },
    { "sc", -1, check_none,   0 },
    { "scn",-1, check_none,   0 },
    { "sh", -1, check_none,   0 },
    { "v",  -1, check_none,   0 },
    { "w",  -1, check_none,   0 },
    { "y",  -1, check_none,   0 },
};

#define numOps (sizeof (op_table) / sizeof (operator_t))

//------------------------------------------------------------------------
// gfx_t
//------------------------------------------------------------------------

gfx_t::gfx_t (
    const resolver_t& resolver, const font_cache_t& fonts, output_dev_t& out)
    : resolver_ (resolver), fonts_ (fonts), out_ (out)
{ }

void gfx_t::run (const page_t& page) {
    const auto& store = resolver_.store ();

    std::string content;

    for (auto num : page.contents) {
        auto p = store.find (num);

        if (0 == p || !p->is_stream ()) {
            error (errSyntaxError, -1,
                   "Content object {0:d} is not a stream", num);
            continue;
        }

        if (!p->pending.empty ()) {
            error (errUnimplemented, -1,
                   "Content stream {0:d} cannot be decoded ({1:s})",
                   num, p->pending.front ());
            continue;
        }

        content += *p->stream;
        content += '\n';
    }

    run (content, page.resources, page.media_box);
}

void gfx_t::run (std::string_view content, const resource_map_t& resources,
                 const box_t& media_box) {
    state_ = gfx_state_t{ };
    saved_.clear ();
    save_floor_ = 0;

    res_ = &resources;
    media_box_ = media_box;

    in_text_ = false;
    ignore_undef_ = 0;

    forms_.clear ();

    go (content);

    res_ = 0;
}

void gfx_t::go (std::string_view content) {
    lexer_t lexer (content);

    args_t args;
    std::swap (args, args_);

    size_t err_count = 0, depth = 0;

    for (auto tok = lexer.next (); tok.type != token_t::EOF_;
         tok = lexer.next ()) {
        switch (tok.type) {
        case token_t::NUMBER_:
            if (depth) {
                args_.arr->emplace_back (tok.num);
            }
            else if (args_.nums.size () < maxArgs) {
                args_.nums.push_back (tok.num);
            }
            else {
                error (errSyntaxError, lexer.pos (),
                       "Too many args in content stream");
            }
            break;

        case token_t::STRING_:
        case token_t::HEX_STRING_: {
            ast::string_t s (
                std::move (tok.s), tok.type == token_t::HEX_STRING_);

            if (depth) {
                args_.arr->emplace_back (s);
            }

            args_.str = std::move (s);
        }
            break;

        case token_t::NAME_:
            if (0 == depth) {
                args_.name = std::move (tok.s);
                args_.str.reset ();
                args_.arr.reset ();
            }
            break;

        case token_t::ARRAY_BEGIN_:
            if (0 == depth++) {
                args_.arr.emplace ();
            }
            break;

        case token_t::ARRAY_END_:
            if (depth) {
                --depth;
            }
            break;

        case token_t::DICT_BEGIN_:
        case token_t::DICT_END_:
            args_.name.reset ();
            args_.str.reset ();
            args_.arr.reset ();
            depth = 0;
            break;

        case token_t::KEYWORD_:
            if (tok.s == "true" || tok.s == "false" || tok.s == "null") {
                args_.name.reset ();
                args_.str.reset ();
                break;
            }

            if (tok.s == "BI") {
                skip_inline_image (lexer);
            }
            else if (!exec_op (tok.s, lexer.pos ())) {
                ++err_count;
                ++errors_;
            }

            args_.clear ();
            depth = 0;

            if (err_count > resolver_.params ().content_error_limit) {
                error (errSyntaxError, -1,
                       "Too many errors - giving up on this content stream");
                std::swap (args, args_);
                return;
            }
            break;

        default:
            break;
        }
    }

    if (!args_.nums.empty ()) {
        error (errSyntaxError, lexer.pos (), "Leftover args in content stream");
    }

    std::swap (args, args_);
}

// Returns true if successful, false on error.
bool gfx_t::exec_op (const std::string& name, off_t pos) {
    auto op = find_op (name);

    if (0 == op) {
        if (ignore_undef_ > 0) {
            return true;
        }

        error (errSyntaxError, pos, "Unknown operator '{0:s}'", name);
        return false;
    }

    if (op->num_args >= 0) {
        const size_t num_args = size_t (op->num_args);

        if (args_.nums.size () < num_args) {
            error (errSyntaxError, pos,
                   "Too few ({0:d}) args to '{1:s}' operator",
                   args_.nums.size (), name);
            return false;
        }

        base_ = args_.nums.size () - num_args;
    }

    switch (op->check) {
    case check_name:
        if (!args_.name) {
            error (errSyntaxError, pos,
                   "Missing name operand to '{0:s}' operator", name);
            return false;
        }
        break;

    case check_string:
        if (!args_.str) {
            error (errSyntaxError, pos,
                   "Missing string operand to '{0:s}' operator", name);
            return false;
        }
        break;

    case check_array:
        if (!args_.arr) {
            error (errSyntaxError, pos,
                   "Missing array operand to '{0:s}' operator", name);
            return false;
        }
        break;

    default:
        break;
    }

    if (op->func) {
        (this->*op->func) ();
    }

    return true;
}

const gfx_t::operator_t* gfx_t::find_op (const std::string& name) const {
    int a = -1, b = numOps, cmp = 0;

    // invariant: op_table[a] < name < op_table[b]
    while (b - a > 1) {
        const int m = (a + b) / 2;

        cmp = strcmp (op_table [m].name, name.c_str ());

        if (cmp < 0)
            a = m;
        else if (cmp > 0)
            b = m;
        else
            a = b = m;
    }

    return cmp ? 0 : &op_table [a];
}

//
// Skip the dictionary and the data of an inline image, up to and including
// the EI keyword:
//
void gfx_t::skip_inline_image (lexer_t& lexer) {
    auto tok = lexer.next ();

    for (; tok.type != token_t::EOF_ && !tok.is_keyword ("ID");
         tok = lexer.next ())
        ;

    if (tok.type == token_t::EOF_) {
        error (errSyntaxError, lexer.pos (), "Inline image without data");
        return;
    }

    const auto buf = lexer.buffer ();
    size_t pos = lexer.pos ();

    if (pos < buf.size () && lexer_t::is_space (buf [pos])) {
        ++pos;
    }

    for (;;) {
        const auto i = buf.find ("EI", pos);

        if (i == std::string_view::npos) {
            error (errSyntaxError, pos, "Inline image data without EI");
            lexer.pos (buf.size ());
            return;
        }

        const bool before = i > pos && lexer_t::is_space (buf [i - 1]);
        const bool after = i + 2 >= buf.size () ||
            lexer_t::is_special ((unsigned char)buf [i + 2]);

        if ((before || i == pos) && after) {
            lexer.pos (i + 2);
            return;
        }

        pos = i + 1;
    }
}

const font_info_t* gfx_t::find_font (const std::string& name) {
    auto iter = res_->fonts.find (name);

    if (iter == res_->fonts.end ()) {
        error (errSyntaxError, -1, "Unknown font tag '{0:s}'", name);
        return 0;
    }

    const int num = iter->second;

    if (auto p = fonts_.find (num); p != fonts_.end ()) {
        return &p->second;
    }

    auto p = local_fonts_.find (num);

    if (p == local_fonts_.end ()) {
        p = local_fonts_.emplace (num, read_font (resolver_, num)).first;
    }

    return &p->second;
}

//------------------------------------------------------------------------
// graphics state operators
//------------------------------------------------------------------------

void gfx_t::op_save () {
    saved_.push_back (state_);
}

void gfx_t::op_restore () {
    if (saved_.size () <= save_floor_) {
        error (errSyntaxError, -1, "Restore without matching save");
        ++errors_;
        return;
    }

    //
    // The text matrices are not part of the saved graphics state:
    //
    auto tm = state_.tm, tlm = state_.tlm;

    state_ = std::move (saved_.back ());
    saved_.pop_back ();

    state_.tm = tm;
    state_.tlm = tlm;

    out_.update_ctm (state_);
}

void gfx_t::op_concat () {
    state_.ctm = matrix_arg () * state_.ctm;
    out_.update_ctm (state_);
}

//------------------------------------------------------------------------
// text object operators
//------------------------------------------------------------------------

void gfx_t::op_begin_text () {
    if (in_text_) {
        error (errSyntaxWarning, -1, "Nested BT operator");
    }

    state_.tm = state_.tlm = matrix_t{ };
    in_text_ = true;
}

void gfx_t::op_end_text () {
    in_text_ = false;
}

//------------------------------------------------------------------------
// text state operators
//------------------------------------------------------------------------

void gfx_t::op_set_char_spacing () {
    state_.char_space = num (0);
}

void gfx_t::op_set_font () {
    state_.font = *args_.name;
    state_.font_info = find_font (state_.font);
    state_.font_size = num (0);

    ++state_.font_changes;
}

void gfx_t::op_set_text_leading () {
    state_.leading = num (0);
}

void gfx_t::op_set_rise () {
    state_.rise = num (0);
}

void gfx_t::op_set_word_spacing () {
    state_.word_space = num (0);
}

void gfx_t::op_set_horiz_scaling () {
    state_.horiz_scale = num (0) / 100;
}

//------------------------------------------------------------------------
// text positioning operators
//------------------------------------------------------------------------

void gfx_t::op_text_move () {
    state_.tlm = matrix_t::translation (num (0), num (1)) * state_.tlm;
    state_.tm = state_.tlm;
}

void gfx_t::op_text_move_set () {
    state_.leading = -num (1);
    op_text_move ();
}

void gfx_t::op_set_text_matrix () {
    state_.tm = state_.tlm = matrix_arg ();
}

void gfx_t::op_text_next_line () {
    state_.tlm = matrix_t::translation (0, -state_.leading) * state_.tlm;
    state_.tm = state_.tlm;
}

//------------------------------------------------------------------------
// text string operators
//------------------------------------------------------------------------

void gfx_t::op_show_text () {
    if (!in_text_) {
        error (errSyntaxWarning, -1, "Text shown outside of a text object");
        return;
    }

    show ({ *args_.str });
}

void gfx_t::op_move_show_text () {
    if (!in_text_) {
        error (errSyntaxWarning, -1, "Text shown outside of a text object");
        return;
    }

    op_text_next_line ();
    show ({ *args_.str });
}

void gfx_t::op_move_set_show_text () {
    if (!in_text_) {
        error (errSyntaxWarning, -1, "Text shown outside of a text object");
        return;
    }

    state_.word_space = num (0);
    state_.char_space = num (1);

    op_text_next_line ();
    show ({ *args_.str });
}

void gfx_t::op_show_space_text () {
    if (!in_text_) {
        error (errSyntaxWarning, -1, "Text shown outside of a text object");
        return;
    }

    show (*args_.arr);
}

//
// Decode the strings, advance the text matrix over the glyphs and the
// adjustments and emit the whole thing as one run:
//
void gfx_t::show (const std::vector< array_item_type >& items) {
    const auto* font = state_.font_info;

    const double fs = state_.font_size, th = state_.horiz_scale;
    const double default_width = resolver_.params ().default_glyph_width;

    const auto trm = state_.tm * state_.ctm;
    const auto start = trm (0, state_.rise);

    text_run_t run;

    for (const auto& item : items) {
        if (auto s = std::get_if< ast::string_t > (&item)) {
            run.text += decode (*s, font);

            const bool cid = font && font->is_cid ();
            const auto codes = font
                ? font->codes (*s) : std::vector< unsigned > (s->begin (), s->end ());

            for (auto code : codes) {
                if (!font) {
                    code &= 0xff;
                }

                auto w = font ? font->width (code) : std::optional< double >{ };

                double tx = (w ? *w : default_width) / 1000 * fs;
                tx += state_.char_space;

                if (!cid && code == 32) {
                    tx += state_.word_space;
                }

                state_.tm = matrix_t::translation (tx * th, 0) * state_.tm;
            }
        }
        else {
            const double tx = -std::get< double > (item) / 1000 * fs * th;
            state_.tm = matrix_t::translation (tx, 0) * state_.tm;
        }
    }

    if (run.text.empty ()) {
        return;
    }

    const auto end = (state_.tm * state_.ctm) (0, state_.rise);

    run.x = start.x - media_box_ [0];
    run.y = media_box_ [3] - start.y;

    run.font_size = fs * trm.vertical_scale ();
    run.width = std::hypot (end.x - start.x, end.y - start.y);

    run.font = state_.font;
    run.font_info = font;

    out_.show_text (state_, run);
}

//------------------------------------------------------------------------
// external objects
//------------------------------------------------------------------------

void gfx_t::op_xobject () {
    const auto& name = *args_.name;

    auto iter = res_->xobjects.find (name);

    if (iter == res_->xobjects.end ()) {
        error (errSyntaxError, -1, "XObject '{0:s}' is unknown", name);
        return;
    }

    auto p = resolver_.resolve_object (ast::ref_t{ iter->second, 0 });

    if (0 == p || !p->is_stream ()) {
        error (errSyntaxError, -1, "XObject '{0:s}' is wrong type", name);
        return;
    }

    if (ast::is_name (ast::find (p->dict (), "Subtype"), "Form")) {
        do_form (*p);
    }
    else {
        out_.draw_xobject (state_, name, p->num);
    }
}

void gfx_t::do_form (const raw_object_t& form) {
    const auto& params = resolver_.params ();

    if (forms_.size () >= params.max_form_depth) {
        error (errSyntaxError, -1,
               "Form {0:d} nested too deeply, ignored", form.num);
        return;
    }

    if (forms_.end () != std::find (forms_.begin (), forms_.end (), form.num)) {
        error (errSyntaxError, -1, "Form {0:d} invokes itself", form.num);
        return;
    }

    if (!form.pending.empty ()) {
        error (errUnimplemented, -1,
               "Form {0:d} cannot be decoded ({1:s})",
               form.num, form.pending.front ());
        return;
    }

    const auto dict = form.dict ();

    matrix_t m;

    if (auto p = ast::find (dict, "Matrix")) {
        auto arr = resolver_.resolve_array (*p);

        std::vector< double > xs;

        if (arr && arr->size () == 6) {
            for (const auto& x : *arr) {
                if (auto n = ast::as_number (resolver_.resolve (x))) {
                    xs.push_back (*n);
                }
            }
        }

        if (xs.size () == 6) {
            m = { xs [0], xs [1], xs [2], xs [3], xs [4], xs [5] };
        }
        else {
            error (errSyntaxError, -1, "Bad form /Matrix");
        }
    }

    auto resources = *res_;

    if (auto p = ast::find (dict, "Resources")) {
        resources = read_resources (resolver_, *p, std::move (resources));
    }

    forms_.push_back (form.num);

    saved_.push_back (state_);

    const auto floor = std::exchange (save_floor_, saved_.size ());
    const auto prev_res = std::exchange (res_, &resources);
    const auto prev_text = std::exchange (in_text_, false);

    state_.ctm = m * state_.ctm;
    out_.update_ctm (state_);

    go (*form.stream);

    //
    // Discard the saves left unbalanced by the form:
    //
    saved_.resize (save_floor_);

    state_ = std::move (saved_.back ());
    saved_.pop_back ();

    save_floor_ = floor;
    res_ = prev_res;
    in_text_ = prev_text;

    forms_.pop_back ();

    out_.update_ctm (state_);
}

//------------------------------------------------------------------------
// compatibility operators
//------------------------------------------------------------------------

void gfx_t::op_begin_ignore_undef () {
    ++ignore_undef_;
}

void gfx_t::op_end_ignore_undef () {
    if (ignore_undef_ > 0) {
        --ignore_undef_;
    }
}

} // namespace pdfread
