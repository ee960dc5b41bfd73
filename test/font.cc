// -*- mode: c++; -*-
// Copyright 2020- Thinkoid, LLC

#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MODULE font

#include <string>
#include <vector>

#include <boost/test/unit_test.hpp>
namespace utf = boost::unit_test;

#include <pdfread/error.hh>
#include <pdfread/font.hh>
#include <pdfread/object_store.hh>
#include <pdfread/resolver.hh>
#include <pdfread/unicode.hh>

#include "pdf_builder.hh"

using namespace pdfread;
using namespace std::string_literals;

struct quiet_t {
    quiet_t() { set_error_quiet(true); }
    ~quiet_t() { set_error_quiet(false); }
};

BOOST_TEST_GLOBAL_FIXTURE(quiet_t);

static const char* cmap =
    "/CIDInit /ProcSet findresource begin\n"
    "12 dict begin\n"
    "begincmap\n"
    "1 begincodespacerange <0000> <FFFF> endcodespacerange\n"
    "2 beginbfchar\n"
    "<0003> <0020>\n"
    "<0024> <0041>\n"
    "endbfchar\n"
    "1 beginbfrange\n"
    "<0044> <0046> <0061>\n"
    "endbfrange\n"
    "1 beginbfrange\n"
    "<0050> <0051> [<0078> <D83DDE00>]\n"
    "endbfrange\n"
    "1 beginbfchar\n"
    "<0024> <0042>\n"
    "endbfchar\n"
    "endcmap\n";

static font_info_t
simple_font(bool with_map)
{
    font_info_t font;

    if (with_map) {
        font.to_unicode = to_unicode_t{ { 0x41, U"Z" } };
    }

    return font;
}

static font_info_t
cid_font(bool with_map)
{
    font_info_t font;

    font.subtype = "Type0";
    font.encoding = "Identity-H";
    font.mode = encoding_mode_t::cid_identity;

    if (with_map) {
        font.to_unicode = parse_to_unicode(cmap);
    }

    return font;
}

BOOST_AUTO_TEST_SUITE(to_unicode)

BOOST_AUTO_TEST_CASE(sections)
{
    auto xs = parse_to_unicode(cmap);

    BOOST_TEST(xs.size() == 7U);

    BOOST_TEST((xs.at(0x03) == U" "));
    BOOST_TEST((xs.at(0x44) == U"a"));
    BOOST_TEST((xs.at(0x45) == U"b"));
    BOOST_TEST((xs.at(0x46) == U"c"));
    BOOST_TEST((xs.at(0x50) == U"x"));
    BOOST_TEST((xs.at(0x51) == U"\U0001F600"));

    // later sections override earlier ones
    BOOST_TEST((xs.at(0x24) == U"B"));
}

BOOST_AUTO_TEST_CASE(malformed)
{
    auto xs = parse_to_unicode(
        "beginbfrange <0010> <0001> <0041> <0001> <0002> <0041> endbfrange");

    BOOST_TEST(xs.size() == 2U);
    BOOST_TEST((xs.at(1) == U"A"));

    BOOST_TEST(parse_to_unicode("beginbfchar <01>").empty());
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(decoding)

BOOST_AUTO_TEST_CASE(cid_without_map)
{
    auto font = cid_font(false);

    BOOST_TEST(decode(ast::string_t("\0A\0B\0C\0D"s, true), &font) == "ABCD");

    // odd byte count falls back to Latin-1
    BOOST_TEST(decode(ast::string_t("\xE9"s, true), &font) == "\xC3\xA9");
}

BOOST_AUTO_TEST_CASE(cid_with_map)
{
    auto font = cid_font(true);

    BOOST_TEST(decode(ast::string_t("\0\x24\0\x03\0\x45"s, true), &font) == "B b");

    // unmapped codes are taken as code points, code 0 is dropped
    BOOST_TEST(decode(ast::string_t("\x00\x43\x00\x00"s, true), &font) == "C");
}

BOOST_AUTO_TEST_CASE(simple_hex)
{
    auto font = simple_font(false);
    BOOST_TEST(decode(ast::string_t("AB\xE9"s, true), &font) == "AB\xC3\xA9");

    auto mapped = simple_font(true);
    BOOST_TEST(decode(ast::string_t("AB"s, true), &mapped) == "ZB");
}

BOOST_AUTO_TEST_CASE(literal)
{
    auto font = simple_font(false);

    BOOST_TEST(decode(ast::string_t("Hello"s), &font) == "Hello");
    BOOST_TEST(decode(ast::string_t("Hello"s), nullptr) == "Hello");

    // byte order mark
    BOOST_TEST(decode(ast::string_t("\xFE\xFF\0H\0i"s), &font) == "Hi");
    BOOST_TEST(decode(ast::string_t("\xFE\xFF\x04\x10"s), &font) == "\xD0\x90");

    auto mapped = simple_font(true);
    BOOST_TEST(decode(ast::string_t("AAB"s), &mapped) == "ZZB");
}

BOOST_AUTO_TEST_CASE(names)
{
    font_info_t font;

    BOOST_TEST(display_name(&font, "F1") == "F1");
    BOOST_TEST(display_name(nullptr, "F1") == "F1");

    font.base_font = "Helvetica";
    BOOST_TEST(display_name(&font, "F1") == "Helvetica");
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(metrics)

BOOST_AUTO_TEST_CASE(codes)
{
    auto simple = simple_font(false);
    BOOST_TEST(simple.codes("AB") == (std::vector< unsigned >{ 0x41, 0x42 }),
               boost::test_tools::per_element());

    auto cid = cid_font(false);
    BOOST_TEST(cid.codes("\x01\x02\x03"s) == (std::vector< unsigned >{ 0x102, 0x300 }),
               boost::test_tools::per_element());
}

BOOST_AUTO_TEST_CASE(widths)
{
    font_info_t font;

    font.first_char = 32;
    font.widths = { 250, 333 };

    BOOST_TEST(*font.width(32) == 250.);
    BOOST_TEST(*font.width(33) == 333.);
    BOOST_TEST(!font.width(34).has_value());

    font.missing_width = 100;
    BOOST_TEST(*font.width(31) == 100.);

    auto cid = cid_font(false);

    cid.default_width = 900;
    cid.cid_widths[5] = 600;

    BOOST_TEST(*cid.width(5) == 600.);
    BOOST_TEST(*cid.width(6) == 900.);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(reading)

//
// 1 catalog, 2 pages, 3 Type0 font, 4 descendant, 5 descriptor, 6 ToUnicode,
// 7 font program, 8 simple font with a /Differences encoding
//
static std::string
make_buffer()
{
    test::pdf_builder_t builder;

    builder.add("<< /Type /Catalog /Pages 2 0 R >>");
    builder.add("<< /Type /Pages /Kids [] /Count 0 >>");
    builder.add("<< /Type /Font /Subtype /Type0 /BaseFont /ABCDEF+Gothic "
                "/Encoding /Identity-H /DescendantFonts [4 0 R] "
                "/ToUnicode 6 0 R >>");
    builder.add("<< /Type /Font /Subtype /CIDFontType2 /DW 1000 "
                "/W [1 [500 600] 10 12 250] /FontDescriptor 5 0 R >>");
    builder.add("<< /Type /FontDescriptor /FontFile2 7 0 R >>");
    builder.add(test::stream_object("", cmap));
    builder.add(test::stream_object("", "TRUETYPE"));
    builder.add("<< /Type /Font /Subtype /Type1 /BaseFont /Times-Roman "
                "/Encoding << /BaseEncoding /WinAnsiEncoding "
                "/Differences [32 /space] >> /FirstChar 32 /Widths [250] >>");

    return builder.classic(1);
}

BOOST_AUTO_TEST_CASE(composite)
{
    const auto buf = make_buffer();

    object_store_t store(buf);
    params_t params;
    resolver_t resolver(store, params);

    auto font = read_font(resolver, 3);

    BOOST_TEST(font.num == 3);
    BOOST_TEST(font.base_font == "ABCDEF+Gothic");
    BOOST_TEST(font.subtype == "Type0");
    BOOST_TEST(font.encoding == "Identity-H");
    BOOST_TEST(font.is_cid());
    BOOST_TEST(font.to_unicode.has_value());
    BOOST_TEST(font.embedded);
    BOOST_TEST(*font.program == "TRUETYPE");

    BOOST_TEST(*font.width(1) == 500.);
    BOOST_TEST(*font.width(2) == 600.);
    BOOST_TEST(*font.width(11) == 250.);
    BOOST_TEST(*font.width(3) == 1000.);
}

BOOST_AUTO_TEST_CASE(simple)
{
    const auto buf = make_buffer();

    object_store_t store(buf);
    params_t params;
    resolver_t resolver(store, params);

    auto font = read_font(resolver, 8);

    BOOST_TEST(font.base_font == "Times-Roman");
    BOOST_TEST(font.encoding == "WinAnsiEncoding");
    BOOST_TEST(!font.is_cid());
    BOOST_TEST(!font.embedded);
    BOOST_TEST(!font.program.has_value());
    BOOST_TEST(*font.width(32) == 250.);

    auto missing = read_font(resolver, 42);
    BOOST_TEST(missing.base_font.empty());
}

BOOST_AUTO_TEST_SUITE_END()
