#include "fallback_decoder.hpp"

#include <string>
#include <vector>

#include <tiff.h>

#include "errors.hpp"

Pixel_buffer read_rgba_image(TIFF * tiff, std::uint64_t file_size)
{
    check_data_size(tiff, file_size);

    std::uint32_t w = 0, h = 0;
    TIFFGetField(tiff, TIFFTAG_IMAGEWIDTH, &w);
    TIFFGetField(tiff, TIFFTAG_IMAGELENGTH, &h);

    char msg[1024] = {};
    if(!TIFFRGBAImageOK(tiff, msg))
        throw Decode_failure{std::string{"libtiff can't convert to RGBA: "} + msg};

    std::vector<std::uint32_t> raster(std::size_t{w} * h);
    if(!TIFFReadRGBAImageOriented(tiff, w, h, std::data(raster), ORIENTATION_TOPLEFT, 0))
        throw Decode_failure{"libtiff: error reading RGBA image"};

    Pixel_buffer image{{h, w, 4}, Sample_type::uint8};
    auto out = image.values<std::uint8_t>();
    for(auto pix: raster)
    {
        *out++ = TIFFGetR(pix);
        *out++ = TIFFGetG(pix);
        *out++ = TIFFGetB(pix);
        *out++ = TIFFGetA(pix);
    }
    return image;
}

Fallback_decoder::Fallback_decoder(const Tag_table & table, const Logger & log):
    table_{table},
    log_{log}
{}

std::size_t Fallback_decoder::open(std::istream & input)
{
    close();

    auto io = std::make_unique<Tiff_io>(read_input_to_memory(input));
    auto handle = open_tiff_reader(*io);

    io_ = std::move(io);
    handle_ = std::move(handle);

    log_.debug("libtiff RGBA reader: opened " + std::to_string(std::size(io_->data)) + " bytes");
    return 1;
}

void Fallback_decoder::check_frame(std::size_t index) const
{
    if(!handle_)
        throw Unsupported_operation{"libtiff RGBA reader is not open"};
    if(index != 0)
        throw Unsupported_operation{"libtiff RGBA reader only provides frame 0, not " + std::to_string(index)};
}

Tag_dictionary Fallback_decoder::get_header(std::size_t index) const
{
    check_frame(index);
    return extract_header(handle_.get(), table_, log_);
}

Pixel_buffer Fallback_decoder::get_data(std::size_t index) const
{
    check_frame(index);
    return read_rgba_image(handle_.get(), std::size(io_->data));
}

void Fallback_decoder::close() noexcept
{
    handle_.reset();
    io_.reset();
}
