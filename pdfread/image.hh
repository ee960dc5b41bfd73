// -*- mode: c++; -*-
// Copyright 2020- Thinkoid, LLC

#ifndef PDFREAD_PDFREAD_IMAGE_HH
#define PDFREAD_PDFREAD_IMAGE_HH

#include <defs.hh>

#include <string>
#include <string_view>
#include <vector>

#include <pdfread/font.hh>
#include <pdfread/gfx.hh>
#include <pdfread/page_tree.hh>
#include <pdfread/resolver.hh>

namespace pdfread {

struct image_t {
    // Resource name and object number of the image XObject.
    std::string name;
    int num = 0;

    unsigned width = 0, height = 0, bpc = 0;
    std::string colorspace;

    // Last filter of the chain, and the file format that filter implies.
    std::string filter, format;

    // Stream data, decoded as far as the supported filters go.
    std::string data;

    //
    // Bounds of the unit square under the transformation in effect at the
    // invocation, page space with a top-left origin. Zero for images which are
    // never drawn:
    //
    double x = 0, y = 0, display_width = 0, display_height = 0;
};

//
// One of jpeg, jp2, tiff, png or raw:
//
const char* image_format (std::string_view filter);

//
// The dictionary attributes and the data of an image XObject:
//
image_t read_image (const resolver_t&, const std::string& name, int num);

//------------------------------------------------------------------------
// image_output_dev_t
//------------------------------------------------------------------------

struct image_output_dev_t : output_dev_t {
    image_output_dev_t (const resolver_t& resolver, const box_t& media_box)
        : resolver_ (resolver), media_box_ (media_box)
    { }

    void draw_xobject (const gfx_state_t&, const std::string&, int) override;

    std::vector< image_t > images;

private:
    const resolver_t& resolver_;
    box_t media_box_;
};

//
// One image per invocation, in content order, followed by the image
// resources of the page which are never drawn, by name:
//
std::vector< image_t >
extract_images (const resolver_t&, const font_cache_t&, const page_t&);

} // namespace pdfread

#endif // PDFREAD_PDFREAD_IMAGE_HH
