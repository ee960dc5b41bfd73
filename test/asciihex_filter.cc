// -*- mode: c++; -*-
// Copyright 2020- Thinkoid, LLC

#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MODULE iostreams

#include <iostream>

#include <boost/test/unit_test.hpp>
namespace utf = boost::unit_test;

#include <boost/test/data/test_case.hpp>
#include <boost/test/data/monomorphic.hpp>
namespace data = boost::unit_test::data;

#include <boost/iostreams/filtering_stream.hpp>
namespace io = boost::iostreams;

#include <iostreams/view_source.hh>
#include <iostreams/asciihex_input_filter.hh>

#include <pdfread/filters.hh>

BOOST_AUTO_TEST_SUITE(asciihex_filter)

static const std::vector< std::tuple< std::string, std::string > >
input_dataset = {
    {         ">",                         "" },
    {        " >",                         "" },
    {        "  ",                         "" },
    {        "0>",     std::string(  "\0", 1) },
    {       "00>",     std::string(  "\0", 1) },
    {      "000>",     std::string("\0\0", 2) },
    {        "A>", std::string(    "\xA0", 1) },
    {       "AA>", std::string(    "\xAA", 1) },
    {      "AAA>", std::string("\xAA\xA0", 2) },
    {     "aa bb", std::string("\xAA\xBB", 2) },
    {  "4 1\n42>", "AB" },
    {  "41zz42>",  "AB" },
    {  "41>42",    "A" },
};

BOOST_DATA_TEST_CASE(
    input, data::make(input_dataset), input, result)
{
    io::filtering_istream str;

    str.push(pdfread::iostreams::asciihex_input_filter_t());
    str.push(pdfread::iostreams::view_source_t(input));

    std::string buf;

    for (int c; str && EOF != (c = str.get());)
        buf.append(1, c);

    BOOST_TEST(result == buf);

    BOOST_TEST(str.eof());
    BOOST_TEST(!str.bad());
}

BOOST_DATA_TEST_CASE(
    decode, data::make(input_dataset), input, result)
{
    std::string buf;

    BOOST_TEST(pdfread::asciihex_decode(input, buf));
    BOOST_TEST(result == buf);
}

BOOST_AUTO_TEST_SUITE_END()
