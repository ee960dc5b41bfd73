// -*- mode: c++; -*-
// Copyright 2020- Thinkoid, LLC

#ifndef PDFREAD_PDFREAD_EXCEPTION_HH
#define PDFREAD_PDFREAD_EXCEPTION_HH

#include <defs.hh>

#include <cstddef>
#include <stdexcept>
#include <string>

namespace pdfread {

//
// Neither the cross-reference index nor the recovery scan located a catalog:
//
struct load_error : std::runtime_error {
    using std::runtime_error::runtime_error;
};

//
// A page index outside [0, count), or a whole-document query on a document
// without pages:
//
struct page_error : std::out_of_range {
    page_error (size_t index, size_t count);

    size_t index () const { return index_; }
    size_t count () const { return count_; }

private:
    size_t index_, count_;
};

} // namespace pdfread

#endif // PDFREAD_PDFREAD_EXCEPTION_HH
