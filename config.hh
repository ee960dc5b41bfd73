// -*- mode: c++; -*-
// Copyright 2019-2020 Thinkoid, LLC.

#ifndef PDFREAD_CONFIG_HH
#define PDFREAD_CONFIG_HH

// Autoconf-like macros
#define PACKAGE "pdfread"
#define PACKAGE_NAME "pdfread"
#define PACKAGE_STRING "pdfread 0.1.0"
#define PACKAGE_TARNAME "pdfread"
#define PACKAGE_VERSION "0.1.0"
#define VERSION "0.1.0"

//------------------------------------------------------------------------
// paper size
//------------------------------------------------------------------------

// default media box (in points) for pages that do not inherit one
#ifdef A4_PAPER
#define PDFREAD_PAPER_WIDTH 595 // ISO A4 (210x297 mm)
#define PDFREAD_PAPER_HEIGHT 842
#else
#define PDFREAD_PAPER_WIDTH 612 // American letter (8.5x11")
#define PDFREAD_PAPER_HEIGHT 792
#endif

//------------------------------------------------------------------------
// limits
//------------------------------------------------------------------------

// Page tree recursion ceiling
#define PDFREAD_PAGE_TREE_DEPTH 64

// Reference chasing and /Parent walks
#define PDFREAD_REFERENCE_DEPTH 32

// Nested arrays and dictionaries in one object
#define PDFREAD_OBJECT_NESTING 256

// Nested form XObjects replayed from one page
#define PDFREAD_FORM_DEPTH 8

// Max errors (undefined operator, wrong number of args) allowed before
// giving up on a content stream.
#define PDFREAD_CONTENT_ERROR_LIMIT 500

// Glyph advance, in 1/1000 text space units, when a font has no metrics
#define PDFREAD_DEFAULT_GLYPH_WIDTH 500

// Vertical distance, in points, within which text items share a line
#define PDFREAD_LINE_TOLERANCE 2.0

// Lines of a block are at most this many font sizes apart, their left edges
// within this many font sizes of each other; the first line may be indented
// up to PDFREAD_BLOCK_FIRST_INDENT font sizes
#define PDFREAD_BLOCK_SPACING 1.5
#define PDFREAD_BLOCK_INDENT 0.5
#define PDFREAD_BLOCK_FIRST_INDENT 4.0

// Font sizes, in points, that still belong to the same block
#define PDFREAD_BLOCK_FONT_SIZE_DELTA 1.0

// Bytes searched backwards from the end of file for 'startxref'
#define PDFREAD_XREF_SEARCH_SIZE 1024

#endif // PDFREAD_CONFIG_HH
