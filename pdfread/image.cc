// -*- mode: c++; -*-
// Copyright 2020- Thinkoid, LLC

#include <defs.hh>

#include <algorithm>
#include <set>
#include <utility>

#include <pdfread/error.hh>
#include <pdfread/filters.hh>
#include <pdfread/image.hh>

namespace pdfread {
namespace {

unsigned read_unsigned (const resolver_t& resolver, const ast::dict_t& dict,
                        const char* key, const char* abbrev) {
    auto p = ast::find (dict, key);

    if (0 == p) {
        p = ast::find (dict, abbrev);
    }

    if (0 == p) {
        return 0;
    }

    auto n = ast::as_int (resolver.resolve (*p));
    return n && *n > 0 ? unsigned (*n) : 0;
}

//
// The family name of a color space: the name itself or the first element of
// an array, e.g. /ICCBased or /Indexed:
//
std::string read_colorspace (const resolver_t& resolver, const ast::dict_t& dict) {
    auto p = ast::find (dict, "ColorSpace");

    if (0 == p) {
        p = ast::find (dict, "CS");
    }

    if (0 == p) {
        return { };
    }

    auto obj = resolver.resolve (*p);

    if (auto name = std::get_if< ast::name_t > (&obj)) {
        return *name;
    }

    if (auto arr = std::get_if< ast::array_pointer > (&obj); arr && *arr) {
        if (!(*arr)->empty ()) {
            if (auto name = std::get_if< ast::name_t > (&(*arr)->front ())) {
                return *name;
            }
        }
    }

    error (errSyntaxWarning, -1, "Bad image color space");
    return { };
}

} // anonymous namespace

const char* image_format (std::string_view filter) {
    if (filter == "DCTDecode") {
        return "jpeg";
    }
    else if (filter == "JPXDecode") {
        return "jp2";
    }
    else if (filter == "CCITTFaxDecode") {
        return "tiff";
    }
    else if (filter.empty () || filter == "FlateDecode") {
        return "png";
    }

    return "raw";
}

image_t read_image (const resolver_t& resolver, const std::string& name, int num) {
    image_t image;

    image.name = name;
    image.num = num;

    auto p = resolver.store ().find (num);

    if (0 == p) {
        return image;
    }

    const auto dict = p->dict ();

    image.width = read_unsigned (resolver, dict, "Width", "W");
    image.height = read_unsigned (resolver, dict, "Height", "H");
    image.bpc = read_unsigned (resolver, dict, "BitsPerComponent", "BPC");

    image.colorspace = read_colorspace (resolver, dict);

    const auto filters = filter_names (dict);

    if (!filters.empty ()) {
        image.filter = filters.back ();
    }

    image.format = image_format (image.filter);

    if (p->stream) {
        image.data = *p->stream;
    }

    return image;
}

//------------------------------------------------------------------------
// image_output_dev_t
//------------------------------------------------------------------------

void image_output_dev_t::draw_xobject (
    const gfx_state_t& state, const std::string& name, int num) {
    auto p = resolver_.store ().find (num);

    if (0 == p || !ast::is_name (ast::find (p->dict (), "Subtype"), "Image")) {
        error (errSyntaxWarning, -1,
               "XObject '{0:s}' is not an image, ignored", name);
        return;
    }

    auto image = read_image (resolver_, name, num);

    const auto& ctm = state.ctm;

    const point_t< double > xs [] = {
        ctm (0, 0), ctm (1, 0), ctm (0, 1), ctm (1, 1)
    };

    auto [xmin, xmax] = std::minmax ({ xs [0].x, xs [1].x, xs [2].x, xs [3].x });
    auto [ymin, ymax] = std::minmax ({ xs [0].y, xs [1].y, xs [2].y, xs [3].y });

    image.x = xmin - media_box_ [0];
    image.y = media_box_ [3] - ymax;

    image.display_width = xmax - xmin;
    image.display_height = ymax - ymin;

    images.push_back (std::move (image));
}

std::vector< image_t >
extract_images (const resolver_t& resolver, const font_cache_t& fonts,
                const page_t& page) {
    image_output_dev_t out (resolver, page.media_box);

    gfx_t gfx (resolver, fonts, out);
    gfx.run (page);

    std::set< std::string > drawn;

    for (const auto& image : out.images) {
        drawn.insert (image.name);
    }

    for (const auto& [name, num] : page.resources.xobjects) {
        if (drawn.count (name)) {
            continue;
        }

        auto p = resolver.store ().find (num);

        if (p && ast::is_name (ast::find (p->dict (), "Subtype"), "Image")) {
            out.images.push_back (read_image (resolver, name, num));
        }
    }

    return std::move (out.images);
}

} // namespace pdfread
