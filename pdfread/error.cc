// -*- mode: c++; -*-
// Copyright 1996-2003 Glyph & Cog, LLC
// Copyright 2020- Thinkoid, LLC

#include <defs.hh>

#include <atomic>
#include <iostream>
#include <mutex>

#include <pdfread/error.hh>

namespace pdfread {
namespace {

std::mutex mutex_;

error_callback_t callback_;
std::atomic< bool > quiet_{ false };

void default_sink (error_category_t category, off_t pos, const std::string& s) {
    if (pos >= 0) {
        std::cerr << to_string (category) << " (" << pos << "): " << s << '\n';
    }
    else {
        std::cerr << to_string (category) << ": " << s << '\n';
    }
}

} // anonymous namespace

const char* to_string (error_category_t category) {
    switch (category) {
    case errSyntaxWarning: return "Syntax Warning";
    case errSyntaxError:   return "Syntax Error";
    case errIO:            return "I/O Error";
    case errUnimplemented: return "Unimplemented Feature";
    case errInternal:      return "Internal Error";
    }

    return "Error";
}

void set_error_callback (error_callback_t f) {
    std::lock_guard< std::mutex > lock (mutex_);
    callback_ = std::move (f);
}

void set_error_quiet (bool b) {
    quiet_ = b;
}

namespace detail {

bool quiet () {
    return quiet_;
}

void report (error_category_t category, off_t pos, const std::string& s) {
    std::lock_guard< std::mutex > lock (mutex_);

    if (callback_) {
        callback_ (category, pos, s);
    }
    else {
        default_sink (category, pos, s);
    }
}

} // namespace detail
} // namespace pdfread
