// -*- mode: c++; -*-
// Copyright 2019-2020 Thinkoid, LLC.

#ifndef PDFREAD_DEFS_HH
#define PDFREAD_DEFS_HH

#include <config.hh>

#include <boost/assert.hpp>

#define PDFREAD_ASSERT BOOST_ASSERT

#endif // PDFREAD_DEFS_HH
