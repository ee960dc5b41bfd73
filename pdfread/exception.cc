// -*- mode: c++; -*-
// Copyright 2020- Thinkoid, LLC

#include <defs.hh>

#include <pdfread/exception.hh>

#include <fmt/format.h>

namespace pdfread {

page_error::page_error (size_t index, size_t count)
    : std::out_of_range (
          count
          ? fmt::format ("page index {} out of range [0, {})", index, count)
          : std::string ("document has no pages")),
      index_ (index), count_ (count)
{ }

} // namespace pdfread
