// -*- mode: c++; -*-
// Copyright 2020- Thinkoid, LLC

#ifndef PDFREAD_PDFREAD_MATRIX_HH
#define PDFREAD_PDFREAD_MATRIX_HH

#include <defs.hh>

#include <cmath>

namespace pdfread {

template< typename T >
struct point_t {
    using value_type = T;
    value_type x, y;
};

//
// Affine transform [a b 0; c d 0; e f 1], applied to row vectors [x y 1]:
//
template< typename T >
struct basic_matrix_t {
    using value_type = T;
    value_type a = 1, b = 0, c = 0, d = 1, e = 0, f = 0;

    static basic_matrix_t translation (value_type x, value_type y) {
        return { 1, 0, 0, 1, x, y };
    }

    point_t< T > operator() (value_type x, value_type y) const {
        return { a * x + c * y + e, b * x + d * y + f };
    }

    //
    // Lengths of the images of the unit vectors:
    //
    value_type horizontal_scale () const { return std::hypot (a, b); }
    value_type   vertical_scale () const { return std::hypot (c, d); }
};

//
// The transform that applies lhs first, then rhs:
//
template< typename T >
inline basic_matrix_t< T >
operator* (const basic_matrix_t< T >& lhs, const basic_matrix_t< T >& rhs) {
    return {
        lhs.a * rhs.a + lhs.b * rhs.c,
        lhs.a * rhs.b + lhs.b * rhs.d,
        lhs.c * rhs.a + lhs.d * rhs.c,
        lhs.c * rhs.b + lhs.d * rhs.d,
        lhs.e * rhs.a + lhs.f * rhs.c + rhs.e,
        lhs.e * rhs.b + lhs.f * rhs.d + rhs.f
    };
}

template< typename T >
inline bool
operator== (const basic_matrix_t< T >& lhs, const basic_matrix_t< T >& rhs) {
    return lhs.a == rhs.a && lhs.b == rhs.b && lhs.c == rhs.c &&
        lhs.d == rhs.d && lhs.e == rhs.e && lhs.f == rhs.f;
}

using matrix_t = basic_matrix_t< double >;

} // namespace pdfread

#endif // PDFREAD_PDFREAD_MATRIX_HH
