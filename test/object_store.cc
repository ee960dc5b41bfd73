// -*- mode: c++; -*-
// Copyright 2020- Thinkoid, LLC

#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MODULE object_store

#include <string>
#include <tuple>
#include <vector>

#include <boost/test/unit_test.hpp>
namespace utf = boost::unit_test;

#include <boost/test/data/test_case.hpp>
#include <boost/test/data/monomorphic.hpp>
namespace data = boost::unit_test::data;

#include <pdfread/error.hh>
#include <pdfread/exception.hh>
#include <pdfread/object_store.hh>
#include <pdfread/page_tree.hh>
#include <pdfread/raw_object.hh>
#include <pdfread/resolver.hh>
#include <pdfread/xref.hh>

#include "pdf_builder.hh"

using namespace pdfread;

struct quiet_t {
    quiet_t() { set_error_quiet(true); }
    ~quiet_t() { set_error_quiet(false); }
};

BOOST_TEST_GLOBAL_FIXTURE(quiet_t);

static size_t
count_pages(const object_store_t& store)
{
    params_t params;
    resolver_t resolver(store, params);

    return build_page_list(resolver).size();
}

static const std::vector< std::string > three_pages = {
    "BT /F1 12 Tf 72 720 Td (one) Tj ET",
    "BT /F1 12 Tf 72 720 Td (two) Tj ET",
    "BT /F1 12 Tf 72 720 Td (three) Tj ET"
};

BOOST_AUTO_TEST_SUITE(raw_objects)

BOOST_AUTO_TEST_CASE(plain_object)
{
    const std::string buf = "junk 12 0 obj\n<< /A 1 >>\nendobj\n";

    auto obj = read_object(buf, 5);

    BOOST_TEST_REQUIRE(obj.has_value());
    BOOST_TEST(obj->num == 12);
    BOOST_TEST(obj->gen == 0);
    BOOST_TEST(obj->dict_text == "<< /A 1 >>");
    BOOST_TEST(!obj->is_stream());
    BOOST_TEST(obj->end == buf.find("endobj") + 6);

    BOOST_TEST(!read_object(buf, 0).has_value());
}

BOOST_AUTO_TEST_CASE(stream_with_bad_length)
{
    const std::string buf =
        "7 0 obj\n<< /Length 99 >>\nstream\r\nDATA\r\nendstream\nendobj\n";

    auto obj = read_object(buf, 0);

    BOOST_TEST_REQUIRE(obj.has_value());
    BOOST_TEST_REQUIRE(obj->is_stream());
    BOOST_TEST(*obj->stream == "DATA");
    BOOST_TEST(obj->end == buf.size() - 1);
}

BOOST_AUTO_TEST_CASE(stream_with_indirect_length)
{
    const std::string buf =
        "7 0 obj\n<< /Length 8 0 R >>\nstream\nDA\nendstream TA\nendstream\nendobj\n";

    auto obj = read_object(buf, 0, [](const ast::ref_t& ref) {
        return ref.num == 8 ? std::optional< long >(15) : std::nullopt;
    });

    BOOST_TEST_REQUIRE(obj.has_value());
    BOOST_TEST(*obj->stream == "DA\nendstream TA");
}

BOOST_AUTO_TEST_CASE(stream_with_huge_length)
{
    const std::string buf =
        "7 0 obj\n<< /Length 99999999999 >>\nstream\nDATA\nendstream\nendobj\n";

    auto obj = read_object(buf, 0);

    BOOST_TEST_REQUIRE(obj.has_value());
    BOOST_TEST_REQUIRE(obj->is_stream());
    BOOST_TEST(*obj->stream == "DATA");
}

BOOST_AUTO_TEST_CASE(object_nesting)
{
    const std::string buf = "3 0 obj\n[[[[[1]]]]]\nendobj\n";

    auto depth_of = [](ast::obj_t obj) {
        size_t depth = 0;

        for (auto p = std::get_if< ast::array_pointer >(&obj); p && *p;) {
            ++depth;

            if ((*p)->empty())
                break;

            obj = (**p)[0];
            p = std::get_if< ast::array_pointer >(&obj);
        }

        return depth;
    };

    auto obj = read_object(buf, 0);
    BOOST_TEST_REQUIRE(obj.has_value());
    BOOST_TEST(depth_of(obj->value()) == 5U);

    obj = read_object(buf, 0, { }, 3);
    BOOST_TEST_REQUIRE(obj.has_value());
    BOOST_TEST(obj->max_nesting == 3U);
    BOOST_TEST(depth_of(obj->value()) == 3U);
}

BOOST_AUTO_TEST_CASE(headers)
{
    const std::string buf = "%x\n12 0 obj\nendobj 3 0 xobj 4  1\n obj";

    BOOST_TEST(*object_header(buf, buf.find("obj")) == 3U);
    BOOST_TEST(!object_header(buf, buf.find("obj", 12)).has_value());
    BOOST_TEST(!object_header(buf, buf.find("xobj") + 1).has_value());
    BOOST_TEST(*object_header(buf, buf.rfind("obj")) == buf.find("4  1"));
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(indexed)

BOOST_AUTO_TEST_CASE(classic_table)
{
    auto builder = test::make_document(three_pages);
    const auto buf = builder.classic(1);

    object_store_t store(buf);

    BOOST_TEST((store.strategy() == load_strategy_t::indexed));
    BOOST_TEST(store.size() == 9U);
    BOOST_TEST(store.root().num == 1);
    BOOST_TEST(store.version() == "1.7");
    BOOST_TEST((ast::find(store.trailer(), "Size") != nullptr));
    BOOST_TEST(count_pages(store) == 3U);

    auto content = store.find(5);
    BOOST_TEST_REQUIRE(content);
    BOOST_TEST(*content->stream == three_pages[0]);
}

BOOST_AUTO_TEST_CASE(startxref)
{
    auto builder = test::make_document(three_pages);
    const auto buf = builder.classic(1);

    BOOST_TEST(*find_startxref(buf) == buf.find("xref\n0 "));
    BOOST_TEST(!find_startxref("no trailer here").has_value());
}

BOOST_AUTO_TEST_CASE(xref_stream)
{
    auto builder = test::make_document(three_pages);
    const auto buf = builder.xref_stream(1, { 2, 3 });

    object_store_t store(buf);

    BOOST_TEST((store.strategy() == load_strategy_t::indexed));
    BOOST_TEST(count_pages(store) == 3U);

    auto font = store.find(3);
    BOOST_TEST_REQUIRE(font);
    BOOST_TEST(font->container == 10);
    BOOST_TEST(font->dict_text ==
               "<< /Type /Font /Subtype /Type1 /BaseFont /Helvetica >>");

    auto xref = read_xref(buf);
    BOOST_TEST_REQUIRE(xref.has_value());
    BOOST_TEST(xref->entries.at(2).type == xref_entry_t::compressed_);
    BOOST_TEST(xref->entries.at(3).gen == 1);
}

BOOST_AUTO_TEST_CASE(incremental_update)
{
    auto builder = test::make_document(three_pages);
    const auto buf = test::update(
        builder.classic(1),
        { { 5, test::stream_object("", "BT (updated) Tj ET") } }, 1, 10);

    object_store_t store(buf);

    BOOST_TEST((store.strategy() == load_strategy_t::indexed));
    BOOST_TEST(*store.find(5)->stream == "BT (updated) Tj ET");
    BOOST_TEST(*store.find(7)->stream == three_pages[1]);
    BOOST_TEST(*ast::as_int(ast::find(store.trailer(), "Size")) == 10);
}

BOOST_AUTO_TEST_CASE(hybrid)
{
    auto builder = test::make_document(three_pages);
    const auto buf = builder.hybrid(1, { 2, 3 });

    object_store_t store(buf);

    BOOST_TEST((store.strategy() == load_strategy_t::indexed));
    BOOST_TEST(store.root().num == 1);
    BOOST_TEST((ast::find(store.trailer(), "Root") != nullptr));
    BOOST_TEST((ast::find(store.trailer(), "XRefStm") != nullptr));
    BOOST_TEST(count_pages(store) == 3U);

    // free in the table, packed according to the stream
    auto font = store.find(3);
    BOOST_TEST_REQUIRE(font);
    BOOST_TEST(font->container == 10);

    auto xref = read_xref(buf);
    BOOST_TEST_REQUIRE(xref.has_value());
    BOOST_TEST(xref->entries.at(2).type == xref_entry_t::compressed_);
    BOOST_TEST(xref->entries.at(2).offset == 10U);
    BOOST_TEST(xref->entries.at(5).type == xref_entry_t::uncompressed_);
    BOOST_TEST(xref->entries.at(11).type == xref_entry_t::uncompressed_);
}

BOOST_AUTO_TEST_CASE(object_nesting)
{
    auto builder = test::make_document(three_pages);
    const int deep = builder.add("[[[[[1]]]]]");

    const auto buf = builder.classic(1);

    params_t params;
    params.max_object_nesting = 3;

    object_store_t store(buf, params);

    BOOST_TEST((store.strategy() == load_strategy_t::indexed));
    BOOST_TEST(count_pages(store) == 3U);

    auto value = store.find(deep)->value();

    for (int i = 0; i < 3; ++i) {
        auto p = std::get_if< ast::array_pointer >(&value);
        BOOST_TEST_REQUIRE(p);
        BOOST_TEST_REQUIRE(!(*p)->empty());
        value = (**p)[0];
    }

    BOOST_TEST(ast::is_null(value));
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(recovery)

//
// Cross-reference streams with /W entries that cannot be used:
//
static const std::vector< std::string > bad_widths = {
    "/W [1 99999999999 2]", "/W [1 4 99999999999]", "/W [1 -4 2]",
    "/W [1 4]", "/W [9 4 2]"
};

BOOST_DATA_TEST_CASE(
    wrong_widths, data::make(bad_widths), widths)
{
    auto builder = test::make_document(three_pages);
    auto buf = builder.xref_stream(1);

    const auto i = buf.rfind("/W [1 4 2]");
    BOOST_TEST_REQUIRE(i != std::string::npos);

    buf.replace(i, 10, widths);

    BOOST_TEST(!read_xref(buf).has_value());

    object_store_t store(buf);

    BOOST_TEST((store.strategy() == load_strategy_t::recovery));
    BOOST_TEST(store.root().num == 1);
    BOOST_TEST(count_pages(store) == 3U);
}

static const std::vector< long > shifts = { 1, 5, -3, 1000 };

BOOST_DATA_TEST_CASE(
    wrong_offsets, data::make(shifts), shift)
{
    auto builder = test::make_document(three_pages);

    object_store_t good(builder.classic(1));
    object_store_t bad(builder.classic(1, shift));

    BOOST_TEST((bad.strategy() == load_strategy_t::recovery));
    BOOST_TEST(bad.root().num == 1);
    BOOST_TEST(bad.size() == good.size());
    BOOST_TEST(count_pages(bad) == count_pages(good));
}

BOOST_AUTO_TEST_CASE(missing_xref)
{
    auto builder = test::make_document(three_pages);

    std::string buf = builder.header();
    builder.write_objects(buf);

    object_store_t store(buf);

    BOOST_TEST((store.strategy() == load_strategy_t::recovery));
    BOOST_TEST(store.root().num == 1);
    BOOST_TEST((ast::find(store.trailer(), "Root") != nullptr));
    BOOST_TEST(count_pages(store) == 3U);
}

BOOST_AUTO_TEST_CASE(last_definition_wins)
{
    auto builder = test::make_document(three_pages);

    std::string buf = builder.header();
    builder.write_objects(buf);

    buf += "5 0 obj\n" + test::stream_object("", "BT (again) Tj ET") +
        "\nendobj\n";

    object_store_t store(buf);

    BOOST_TEST(*store.find(5)->stream == "BT (again) Tj ET");
}

BOOST_AUTO_TEST_CASE(binary_data_with_obj)
{
    auto builder = test::make_document(three_pages);

    builder.set(5, test::stream_object(
                    "", std::string("\x00 1 0 obj 9 9 obj \xFF", 19)));

    std::string buf = builder.header();
    builder.write_objects(buf);

    object_store_t store(buf);

    BOOST_TEST(store.size() == 9U);
    BOOST_TEST(store.find(5)->stream->size() == 19U);
    BOOST_TEST(store.find(1)->dict_text == "<< /Type /Catalog /Pages 2 0 R >>");
}

BOOST_AUTO_TEST_CASE(packed_objects)
{
    auto builder = test::make_document(three_pages);

    auto buf = builder.xref_stream(1, { 2, 3 });
    buf.erase(buf.rfind("startxref"));

    object_store_t store(buf);

    BOOST_TEST((store.strategy() == load_strategy_t::recovery));
    BOOST_TEST(store.find(3)->container == 10);
    BOOST_TEST(count_pages(store) == 3U);
}

BOOST_AUTO_TEST_CASE(no_catalog)
{
    const std::string buf = "%PDF-1.4\n1 0 obj\n<< /A 1 >>\nendobj\n";

    BOOST_CHECK_THROW(object_store_t store(buf), load_error);
    BOOST_CHECK_THROW(object_store_t store(""), load_error);
}

BOOST_AUTO_TEST_SUITE_END()
