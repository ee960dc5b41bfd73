// -*- mode: c++; -*-
// Copyright 1996-2003 Glyph & Cog, LLC
// Copyright 2020- Thinkoid, LLC

#ifndef PDFREAD_PDFREAD_GFX_HH
#define PDFREAD_PDFREAD_GFX_HH

#include <defs.hh>

#include <sys/types.h>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <boost/noncopyable.hpp>

#include <pdfread/ast.hh>
#include <pdfread/font.hh>
#include <pdfread/lexer.hh>
#include <pdfread/matrix.hh>
#include <pdfread/page_tree.hh>
#include <pdfread/raw_object.hh>
#include <pdfread/resolver.hh>

namespace pdfread {

//------------------------------------------------------------------------
// gfx_state_t
//------------------------------------------------------------------------

//
// The part of the graphics state that text and image placement depend on:
//
struct gfx_state_t {
    matrix_t ctm, tm, tlm;

    double leading = 0, char_space = 0, word_space = 0, horiz_scale = 1;
    double rise = 0;

    // Font resource name and size from the last Tf.
    std::string font;
    const font_info_t* font_info = 0;
    double font_size = 0;

    // Number of Tf operators executed so far.
    size_t font_changes = 0;
};

//
// One show-text event, a Tj, ', " or a whole TJ:
//
struct text_run_t {
    // Decoded text, UTF-8.
    std::string text;

    // Origin of the first glyph, page space with a top-left origin.
    double x = 0, y = 0;

    // Font size scaled by the text and transformation matrices.
    double font_size = 0;

    // Distance the text advanced, page space.
    double width = 0;

    // Font resource name.
    std::string font;
    const font_info_t* font_info = 0;
};

//------------------------------------------------------------------------
// output_dev_t
//------------------------------------------------------------------------

struct output_dev_t {
    virtual ~output_dev_t () = default;

    virtual void show_text (const gfx_state_t&, const text_run_t&) { }

    //
    // A non-form external object was invoked; forms are replayed:
    //
    virtual void draw_xobject (const gfx_state_t&, const std::string&, int) { }

    virtual void update_ctm (const gfx_state_t&) { }
};

//------------------------------------------------------------------------
// gfx_t
//------------------------------------------------------------------------

//
// Content stream interpreter. Numeric operands go on a stack; the last name,
// string and array are kept in registers which are cleared by the operator
// that consumes them. Malformed operators are reported and skipped:
//
struct gfx_t : boost::noncopyable {
    using array_item_type = std::variant< ast::string_t, double >;

    gfx_t (const resolver_t&, const font_cache_t&, output_dev_t&);

    // Replay the content streams of a page.
    void run (const page_t&);

    // Replay a content stream with the given resources and page bounds.
    void run (std::string_view, const resource_map_t&, const box_t&);

    // Malformed operators seen so far.
    size_t errors () const { return errors_; }

    const gfx_state_t& state () const { return state_; }

private:
    enum arg_check_t {
        check_none,
        check_name,
        check_string,
        check_array
    };

    struct operator_t {
        char name [4];
        int num_args;
        arg_check_t check;
        void (gfx_t::*func) ();
    };

    static const operator_t op_table [];

    struct args_t {
        std::vector< double > nums;

        std::optional< std::string > name;
        std::optional< ast::string_t > str;
        std::optional< std::vector< array_item_type > > arr;

        void clear () {
            nums.clear ();
            name.reset ();
            str.reset ();
            arr.reset ();
        }
    };

    void go (std::string_view);

    bool exec_op (const std::string&, off_t);
    const operator_t* find_op (const std::string&) const;

    void skip_inline_image (lexer_t&);

    double num (size_t i) const { return args_.nums [base_ + i]; }

    matrix_t matrix_arg () const {
        return { num (0), num (1), num (2), num (3), num (4), num (5) };
    }

    const font_info_t* find_font (const std::string&);

    void show (const std::vector< array_item_type >&);
    void do_form (const raw_object_t&);

    // graphics state operators
    void op_save ();
    void op_restore ();
    void op_concat ();

    // text object operators
    void op_begin_text ();
    void op_end_text ();

    // text state operators
    void op_set_char_spacing ();
    void op_set_font ();
    void op_set_text_leading ();
    void op_set_rise ();
    void op_set_word_spacing ();
    void op_set_horiz_scaling ();

    // text positioning operators
    void op_text_move ();
    void op_text_move_set ();
    void op_set_text_matrix ();
    void op_text_next_line ();

    // text string operators
    void op_show_text ();
    void op_move_show_text ();
    void op_move_set_show_text ();
    void op_show_space_text ();

    // external objects
    void op_xobject ();

    // compatibility operators
    void op_begin_ignore_undef ();
    void op_end_ignore_undef ();

private:
    const resolver_t& resolver_;
    const font_cache_t& fonts_;
    output_dev_t& out_;

    // Fonts not in the shared cache, read on first use.
    font_cache_t local_fonts_;

    gfx_state_t state_;
    std::vector< gfx_state_t > saved_;
    size_t save_floor_ = 0;

    const resource_map_t* res_ = 0;
    box_t media_box_{ };

    args_t args_;
    size_t base_ = 0;

    bool in_text_ = false;
    int ignore_undef_ = 0;

    // Forms being replayed, innermost last.
    std::vector< int > forms_;

    size_t errors_ = 0;
};

} // namespace pdfread

#endif // PDFREAD_PDFREAD_GFX_HH
