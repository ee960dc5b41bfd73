// -*- mode: c++; -*-
// Copyright 2020- Thinkoid, LLC

#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MODULE filters

#include <string>
#include <tuple>
#include <vector>

#include <boost/test/unit_test.hpp>
namespace utf = boost::unit_test;

#include <boost/test/data/test_case.hpp>
#include <boost/test/data/monomorphic.hpp>
namespace data = boost::unit_test::data;

#include <pdfread/error.hh>
#include <pdfread/filters.hh>
#include <pdfread/parser.hh>

#include "pdf_builder.hh"

using namespace pdfread;

struct quiet_t {
    quiet_t() { set_error_quiet(true); }
    ~quiet_t() { set_error_quiet(false); }
};

BOOST_TEST_GLOBAL_FIXTURE(quiet_t);

static ast::dict_t
make_dict(const std::string& s)
{
    auto obj = parse_object(s);
    return *std::get< ast::dict_pointer >(obj);
}

static std::string
to_hex(const std::string& s)
{
    static const char digits[] = "0123456789abcdef";

    std::string hex;

    for (unsigned char c : s) {
        hex += digits[c >> 4];
        hex += digits[c & 15];
    }

    return hex + ">";
}

BOOST_TEST_DONT_PRINT_LOG_VALUE(std::vector< std::string >)

BOOST_AUTO_TEST_SUITE(filters)

static const std::vector< std::tuple< std::string, bool, std::vector< std::string > > >
names_dataset = {
    { "<< >>",                                         false, { } },
    { "<< /Filter /FlateDecode >>",                    false, { "FlateDecode" } },
    { "<< /F /AHx >>",                                 true,  { "AHx" } },
    { "<< /F /FlateDecode >>",                         false, { } },
    { "<< /F (data.bin) /Filter /AHx >>",              false, { "AHx" } },
    { "<< /Filter [/ASCIIHexDecode /FlateDecode] >>",  false, { "ASCIIHexDecode", "FlateDecode" } },
};

BOOST_DATA_TEST_CASE(
    names, data::make(names_dataset), input, inline_image, result)
{
    BOOST_TEST(filter_names(make_dict(input), inline_image) == result,
               boost::test_tools::per_element());
}

BOOST_AUTO_TEST_CASE(flate)
{
    const std::string text = "BT /F1 12 Tf (Hello) Tj ET";

    std::string buf;

    BOOST_TEST(flate_decode(test::deflate(text), buf));
    BOOST_TEST(buf == text);
}

BOOST_AUTO_TEST_CASE(flate_corrupt)
{
    std::string buf;
    BOOST_TEST(!flate_decode("not a zlib stream", buf));
}

BOOST_AUTO_TEST_CASE(chain)
{
    const std::string text = "some text, twice: some text";

    auto result = decode(
        to_hex(test::deflate(text)),
        make_dict("<< /Filter [/ASCIIHexDecode /FlateDecode] >>"));

    BOOST_TEST(result.complete());
    BOOST_TEST(result.data == text);
}

BOOST_AUTO_TEST_CASE(abbreviations)
{
    const std::string text = "some text, twice: some text";
    const std::string hex = to_hex(test::deflate(text));

    const auto dict = make_dict("<< /F [/AHx /Fl] /DP [null << /Predictor 1 >>] >>");

    // inline image dictionaries
    auto result = decode(hex, dict, true);

    BOOST_TEST(result.complete());
    BOOST_TEST(result.data == text);

    // a stream dictionary naming an external file
    result = decode(hex, dict);

    BOOST_TEST(result.complete());
    BOOST_TEST(result.data == hex);

    // abbreviated names under /Filter
    result = decode(hex, make_dict("<< /Filter [/AHx /Fl] >>"));

    BOOST_TEST(result.pending.size() == 2U);
    BOOST_TEST(result.data == hex);
}

BOOST_AUTO_TEST_CASE(image_filters_stop)
{
    const std::string jpeg = "\xFF\xD8\xFF\xE0 fake jpeg";

    auto result = decode(jpeg, make_dict("<< /Filter /DCTDecode >>"));

    BOOST_TEST(!result.complete());
    BOOST_TEST(result.pending.size() == 1U);
    BOOST_TEST(result.pending[0] == "DCTDecode");
    BOOST_TEST(result.data == jpeg);
}

BOOST_AUTO_TEST_CASE(partial_chain)
{
    auto result = decode(
        "4142>", make_dict("<< /Filter [/ASCIIHexDecode /LZWDecode] >>"));

    BOOST_TEST(result.data == "AB");
    BOOST_TEST(result.pending.size() == 1U);
    BOOST_TEST(result.pending[0] == "LZWDecode");
}

BOOST_AUTO_TEST_CASE(png_predictor)
{
    //
    // Two rows of three bytes, the first with the Sub filter, the second with
    // the Up filter:
    //
    std::string buf = std::string("\x01\x01\x01\x01\x02\x01\x01\x01", 8);

    BOOST_TEST(undo_predictor(
        buf, make_dict("<< /Predictor 12 /Columns 3 >>")));

    BOOST_TEST(buf == std::string("\x01\x02\x03\x02\x03\x04", 6));
}

BOOST_AUTO_TEST_CASE(png_predictor_in_chain)
{
    const std::string rows = std::string("\x02\x05\x06\x02\x01\x01", 6);

    auto result = decode(
        test::deflate(rows),
        make_dict("<< /Filter /FlateDecode "
                  "/DecodeParms << /Predictor 12 /Columns 2 >> >>"));

    BOOST_TEST(result.complete());
    BOOST_TEST(result.data == std::string("\x05\x06\x06\x07", 4));
}

BOOST_AUTO_TEST_CASE(tiff_predictor)
{
    std::string buf = std::string("\x01\x01\x01\x05\x01\x01", 6);

    BOOST_TEST(undo_predictor(
        buf, make_dict("<< /Predictor 2 /Columns 3 >>")));

    BOOST_TEST(buf == std::string("\x01\x02\x03\x05\x06\x07", 6));
}

BOOST_AUTO_TEST_CASE(bad_predictor)
{
    std::string buf = "abc";

    BOOST_TEST(!undo_predictor(
        buf, make_dict("<< /Predictor 12 /Colors 0 >>")));
    BOOST_TEST(undo_predictor(buf, make_dict("<< /Predictor 1 >>")));
    BOOST_TEST(buf == "abc");
}

BOOST_AUTO_TEST_SUITE_END()
