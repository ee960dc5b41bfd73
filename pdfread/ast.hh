// -*- mode: c++; -*-
// Copyright 2020- Thinkoid, LLC

#ifndef PDFREAD_PDFREAD_AST_HH
#define PDFREAD_PDFREAD_AST_HH

#include <defs.hh>

#include <limits>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>
#include <variant>
#include <vector>

namespace pdfread::ast {

struct null_t { };

struct name_t : std::string {
    using base_type = std::string;
    using base_type::base_type;
    using base_type::operator=;

    name_t () = default;
    name_t (const base_type& arg) : base_type (arg) { }
    name_t (base_type&& arg) : base_type (std::move (arg)) { }
};

//
// The hex flag records the written form of the string; text decoding depends
// on it:
//
struct string_t : std::string {
    using base_type = std::string;
    using base_type::base_type;
    using base_type::operator=;

    string_t () = default;

    string_t (const base_type& arg, bool b = false)
        : base_type (arg), hex (b) { }

    string_t (base_type&& arg, bool b = false)
        : base_type (std::move (arg)), hex (b) { }

    bool hex = false;
};

struct ref_t {
    int num, gen;
};

inline bool operator== (const ref_t& lhs, const ref_t& rhs) {
    return lhs.num == rhs.num && lhs.gen == rhs.gen;
}

struct array_t;
struct  dict_t;

using array_pointer = std::shared_ptr< array_t >;
using  dict_pointer = std::shared_ptr<  dict_t >;

using obj_t = std::variant<
    null_t, bool, int, double, name_t, string_t, ref_t,
    array_pointer, dict_pointer
    >;

#define PDFREAD_AST_DEF(type, ...)                              \
struct type : __VA_ARGS__ {                                     \
    using base_type = __VA_ARGS__;                              \
                                                                \
    using base_type::base_type;                                 \
    using base_type::operator=;                                 \
                                                                \
    type () = default;                                          \
    type (const base_type& arg) : base_type (arg) { }           \
    type (base_type&& arg) : base_type (std::move (arg)) { }    \
}

PDFREAD_AST_DEF (array_t, std::vector< obj_t >);
PDFREAD_AST_DEF ( dict_t, std::vector< std::tuple< name_t, obj_t > >);

#undef PDFREAD_AST_DEF

//
// Dictionary lookup, key without the leading slash. The first definition of a
// duplicated key wins:
//
inline const obj_t* find (const dict_t& dict, std::string_view key) {
    for (const auto& [name, value] : dict) {
        if (name == key) {
            return &value;
        }
    }

    return 0;
}

inline const obj_t* find (const dict_pointer& p, std::string_view key) {
    return p ? find (*p, key) : 0;
}

template< typename T >
inline const T* get_if (const obj_t* p) {
    return p ? std::get_if< T > (p) : 0;
}

inline std::optional< double > as_number (const obj_t& obj) {
    if (auto p = std::get_if< int > (&obj)) {
        return double (*p);
    }
    else if (auto p = std::get_if< double > (&obj)) {
        return *p;
    }

    return { };
}

inline std::optional< double > as_number (const obj_t* p) {
    return p ? as_number (*p) : std::optional< double >{ };
}

inline std::optional< int > as_int (const obj_t& obj) {
    if (auto p = std::get_if< int > (&obj)) {
        return *p;
    }
    else if (auto p = std::get_if< double > (&obj)) {
        //
        // Integers too large for an int are lexed as reals:
        //
        if (*p >= double ((std::numeric_limits< int >::min) ()) &&
            *p <= double ((std::numeric_limits< int >::max) ())) {
            return int (*p);
        }
    }

    return { };
}

inline std::optional< int > as_int (const obj_t* p) {
    return p ? as_int (*p) : std::optional< int >{ };
}

inline bool is_name (const obj_t* p, std::string_view s) {
    auto name = get_if< name_t > (p);
    return name && *name == s;
}

inline bool is_null (const obj_t& obj) {
    return std::holds_alternative< null_t > (obj);
}

} // namespace pdfread::ast

#endif // PDFREAD_PDFREAD_AST_HH
