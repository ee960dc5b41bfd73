// -*- mode: c++; -*-
// Copyright 2020- Thinkoid, LLC

#ifndef PDFREAD_TEST_PDF_BUILDER_HH
#define PDFREAD_TEST_PDF_BUILDER_HH

#include <cstddef>
#include <map>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include <boost/iostreams/device/back_inserter.hpp>
#include <boost/iostreams/filter/zlib.hpp>
#include <boost/iostreams/filtering_stream.hpp>

#include <fmt/format.h>

namespace pdfread::test {

inline std::string deflate (std::string_view src) {
    namespace io = boost::iostreams;

    std::string result;

    {
        io::filtering_ostream str;

        str.push (io::zlib_compressor ());
        str.push (io::back_inserter (result));

        str.write (src.data (), src.size ());
        str.reset ();
    }

    return result;
}

//
// A stream object body with a direct /Length:
//
inline std::string
stream_object (const std::string& entries, const std::string& data) {
    return fmt::format (
        "<< {} /Length {} >>\nstream\n{}\nendstream", entries, data.size (), data);
}

//
// Lays out objects and writes the cross-reference structures with exact
// offsets:
//
struct pdf_builder_t {
    std::string version = "1.7";

    // Object bodies by number.
    std::map< int, std::string > objects;

    int add (std::string body) {
        const int num = objects.empty () ? 1 : objects.rbegin ()->first + 1;
        objects [num] = std::move (body);
        return num;
    }

    void set (int num, std::string body) {
        objects [num] = std::move (body);
    }

    int last () const {
        return objects.empty () ? 0 : objects.rbegin ()->first;
    }

    std::string header () const {
        return "%PDF-" + version + "\n%\xE2\xE3\xCF\xD3\n";
    }

    std::map< int, size_t >
    write_objects (std::string& buf, const std::set< int >& skip = { }) const {
        std::map< int, size_t > offsets;

        for (const auto& [num, body] : objects) {
            if (skip.count (num)) {
                continue;
            }

            offsets [num] = buf.size ();
            buf += fmt::format ("{} 0 obj\n{}\nendobj\n", num, body);
        }

        return offsets;
    }

    //
    // A file indexed by a classic table. A non-zero shift moves every
    // recorded offset away from its object:
    //
    std::string classic (int root, long shift = 0) const {
        std::string buf = header ();

        const auto offsets = write_objects (buf);
        const size_t xref = buf.size ();

        buf += fmt::format ("xref\n0 {}\n", last () + 1);
        buf += "0000000000 65535 f \n";

        for (int i = 1; i <= last (); ++i) {
            auto iter = offsets.find (i);

            if (iter == offsets.end ()) {
                buf += "0000000000 00001 f \n";
            }
            else {
                buf += fmt::format ("{:010d} 00000 n \n", long (iter->second) + shift);
            }
        }

        buf += fmt::format (
            "trailer\n<< /Size {} /Root {} 0 R >>\nstartxref\n{}\n%%EOF\n",
            last () + 1, root, xref);

        return buf;
    }

    //
    // Write the objects in `packed' into a compressed object stream numbered
    // `objstm', return their indices in the stream:
    //
    std::map< int, int >
    write_object_stream (std::string& buf, int objstm,
                         const std::set< int >& packed) const {
        std::map< int, int > index;
        std::string pairs, body;

        for (auto num : packed) {
            index [num] = int (index.size ());

            pairs += fmt::format ("{} {} ", num, body.size ());
            body += objects.at (num) + "\n";
        }

        pairs += "\n";

        buf += fmt::format ("{} 0 obj\n", objstm);
        buf += stream_object (
            fmt::format ("/Type /ObjStm /N {} /First {} /Filter /FlateDecode",
                         packed.size (), pairs.size ()),
            deflate (pairs + body));
        buf += "\nendobj\n";

        return index;
    }

    //
    // Big-endian cross-reference stream fields, widths [1 4 2]:
    //
    static void
    put_entry (std::string& data, int type, unsigned long field, int gen) {
        auto put = [&](unsigned long value, int width) {
            for (int i = width - 1; i >= 0; --i) {
                data += char ((value >> (8 * i)) & 0xff);
            }
        };

        put (type, 1);
        put (field, 4);
        put (gen, 2);
    }

    //
    // A file indexed by a cross-reference stream. The objects in `packed' are
    // stored in a compressed object stream:
    //
    std::string xref_stream (int root, const std::set< int >& packed = { }) const {
        std::string buf = header ();

        auto offsets = write_objects (buf, packed);

        const int objstm = packed.empty () ? 0 : last () + 1;
        const int self = (packed.empty () ? last () : objstm) + 1;

        std::map< int, int > index;

        if (objstm) {
            offsets [objstm] = buf.size ();
            index = write_object_stream (buf, objstm, packed);
        }

        offsets [self] = buf.size ();

        std::string data;

        for (int i = 0; i <= self; ++i) {
            auto packed_iter = index.find (i);
            auto offset_iter = offsets.find (i);

            if (packed_iter != index.end ()) {
                put_entry (data, 2, objstm, packed_iter->second);
            }
            else if (offset_iter != offsets.end ()) {
                put_entry (data, 1, offset_iter->second, 0);
            }
            else {
                put_entry (data, 0, 0, i ? 1 : 65535);
            }
        }

        buf += fmt::format ("{} 0 obj\n", self);
        buf += stream_object (
            fmt::format ("/Type /XRef /Size {} /W [1 4 2] /Root {} 0 R",
                         self + 1, root),
            data);
        buf += "\nendobj\n";

        buf += fmt::format ("startxref\n{}\n%%EOF\n", offsets [self]);

        return buf;
    }

    //
    // A hybrid file: a classic table in which the objects in `packed' are
    // free, and a cross-reference stream named by /XRefStm in the trailer
    // that places them in a compressed object stream:
    //
    std::string hybrid (int root, const std::set< int >& packed) const {
        std::string buf = header ();

        auto offsets = write_objects (buf, packed);

        const int objstm = last () + 1, stm = objstm + 1;

        offsets [objstm] = buf.size ();
        const auto index = write_object_stream (buf, objstm, packed);

        std::string data, sections;

        for (const auto& [num, i] : index) {
            put_entry (data, 2, objstm, i);
            sections += fmt::format ("{} 1 ", num);
        }

        offsets [stm] = buf.size ();

        buf += fmt::format ("{} 0 obj\n", stm);
        buf += stream_object (
            fmt::format ("/Type /XRef /Size {} /W [1 4 2] /Index [ {}]",
                         stm + 1, sections),
            data);
        buf += "\nendobj\n";

        const size_t xref = buf.size ();

        buf += fmt::format ("xref\n0 {}\n", stm + 1);
        buf += "0000000000 65535 f \n";

        for (int i = 1; i <= stm; ++i) {
            auto iter = offsets.find (i);

            if (iter == offsets.end ()) {
                buf += "0000000000 00001 f \n";
            }
            else {
                buf += fmt::format ("{:010d} 00000 n \n", iter->second);
            }
        }

        buf += fmt::format (
            "trailer\n<< /Size {} /Root {} 0 R /XRefStm {} >>\n"
            "startxref\n{}\n%%EOF\n", stm + 1, root, offsets [stm], xref);

        return buf;
    }
};

//
// Append an incremental update redefining some objects:
//
inline std::string
update (std::string buf, const std::map< int, std::string >& changes,
        int root, int size) {
    const auto i = buf.rfind ("startxref");
    const auto prev = std::stol (buf.substr (i + 9));

    std::map< int, size_t > offsets;

    for (const auto& [num, body] : changes) {
        offsets [num] = buf.size ();
        buf += fmt::format ("{} 0 obj\n{}\nendobj\n", num, body);
    }

    const size_t xref = buf.size ();

    buf += "xref\n";

    for (const auto& [num, off] : offsets) {
        buf += fmt::format ("{} 1\n{:010d} 00000 n \n", num, off);
    }

    buf += fmt::format (
        "trailer\n<< /Size {} /Root {} 0 R /Prev {} >>\nstartxref\n{}\n%%EOF\n",
        size, root, prev, xref);

    return buf;
}

//
// A document of one page per content string, all pages showing text with the
// font resource /F1 (object 3):
//
inline pdf_builder_t make_document (const std::vector< std::string >& contents) {
    pdf_builder_t builder;

    std::string kids;

    for (size_t i = 0; i < contents.size (); ++i) {
        kids += fmt::format ("{} 0 R ", 4 + 2 * i);
    }

    builder.add ("<< /Type /Catalog /Pages 2 0 R >>");
    builder.add (fmt::format (
        "<< /Type /Pages /Kids [ {}] /Count {} >>", kids, contents.size ()));
    builder.add ("<< /Type /Font /Subtype /Type1 /BaseFont /Helvetica >>");

    for (size_t i = 0; i < contents.size (); ++i) {
        builder.add (fmt::format (
            "<< /Type /Page /Parent 2 0 R /MediaBox [0 0 612 792] "
            "/Resources << /Font << /F1 3 0 R >> >> /Contents {} 0 R >>",
            5 + 2 * i));
        builder.add (stream_object ("", contents [i]));
    }

    return builder;
}

} // namespace pdfread::test

#endif // PDFREAD_TEST_PDF_BUILDER_HH
