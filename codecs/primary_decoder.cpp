#include "primary_decoder.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <vector>

#include <cstring>

#include <tiff.h>

#include "errors.hpp"

namespace
{
    // Copy a rows x cols block read from the file into image at (y0, x0).
    // A block from a separate plane holds one sample per pixel, which goes
    // to channel sample
    void copy_block(Pixel_buffer & image, const unsigned char * src, std::size_t src_row_bytes,
                    std::size_t y0, std::size_t x0, std::size_t rows, std::size_t cols,
                    std::size_t sample, std::size_t src_spp)
    {
        const auto ss = sample_size(image.type());
        const auto spp = image.channels();
        auto dst = std::data(image.bytes());

        for(std::size_t r = 0; r < rows; ++r)
        {
            auto src_row = src + r * src_row_bytes;
            auto dst_row = dst + ((y0 + r) * image.width() + x0) * spp * ss;
            if(src_spp == spp)
            {
                std::memcpy(dst_row, src_row, cols * spp * ss);
            }
            else
            {
                for(std::size_t c = 0; c < cols; ++c)
                    std::memcpy(dst_row + (c * spp + sample) * ss, src_row + c * ss, ss);
            }
        }
    }
}

Pixel_buffer read_native_image(TIFF * tiff, std::uint64_t file_size)
{
    std::uint16_t spp = 1, bits = 1, format = SAMPLEFORMAT_UINT, planar = PLANARCONFIG_CONTIG, photometric = PHOTOMETRIC_MINISBLACK;
    TIFFGetFieldDefaulted(tiff, TIFFTAG_SAMPLESPERPIXEL, &spp);
    TIFFGetFieldDefaulted(tiff, TIFFTAG_BITSPERSAMPLE, &bits);
    TIFFGetFieldDefaulted(tiff, TIFFTAG_SAMPLEFORMAT, &format);
    TIFFGetFieldDefaulted(tiff, TIFFTAG_PLANARCONFIG, &planar);
    TIFFGetField(tiff, TIFFTAG_PHOTOMETRIC, &photometric);

    auto type = native_sample_type(bits, format);
    if(!type)
        throw Decode_failure{std::to_string(bits) + " bit samples in sample format " + std::to_string(format) + " have no native type"};
    if(photometric == PHOTOMETRIC_YCBCR)
        throw Decode_failure{"YCbCr data needs color conversion"};
    if(spp == 0)
        throw Decode_failure{"no samples per pixel"};

    check_data_size(tiff, file_size);

    std::uint32_t w = 0, h = 0;
    TIFFGetField(tiff, TIFFTAG_IMAGEWIDTH, &w);
    TIFFGetField(tiff, TIFFTAG_IMAGELENGTH, &h);

    Pixel_buffer image{spp == 1 ? std::vector<std::size_t>{h, w} : std::vector<std::size_t>{h, w, spp}, *type};

    const auto ss = sample_size(*type);
    const bool separate = planar == PLANARCONFIG_SEPARATE && spp > 1;
    const std::uint16_t planes = separate ? spp : 1;
    const std::size_t plane_spp = separate ? 1 : spp;

    if(TIFFIsTiled(tiff))
    {
        std::uint32_t tw = 0, th = 0;
        if(!TIFFGetField(tiff, TIFFTAG_TILEWIDTH, &tw) || !TIFFGetField(tiff, TIFFTAG_TILELENGTH, &th) || tw == 0 || th == 0)
            throw Decode_failure{"missing tile dimensions"};

        const std::size_t tile_row_bytes = std::size_t{tw} * plane_spp * ss;
        const auto tile_size = TIFFTileSize(tiff);
        if(tile_size <= 0 || static_cast<std::size_t>(tile_size) < tile_row_bytes * th)
            throw Decode_failure{"unexpected tile size"};

        std::vector<unsigned char> tile(tile_size);
        for(std::uint16_t plane = 0; plane < planes; ++plane)
        {
            for(std::uint32_t y = 0; y < h; y += th)
            {
                for(std::uint32_t x = 0; x < w; x += tw)
                {
                    if(TIFFReadTile(tiff, std::data(tile), x, y, 0, plane) < 0)
                        throw Decode_failure{"error reading tile at " + std::to_string(x) + "," + std::to_string(y)};

                    copy_block(image, std::data(tile), tile_row_bytes, y, x, std::min(th, h - y), std::min(tw, w - x), plane, plane_spp);
                }
            }
        }
    }
    else
    {
        const std::size_t row_bytes = std::size_t{w} * plane_spp * ss;
        if(static_cast<std::size_t>(TIFFScanlineSize(tiff)) != row_bytes)
            throw Decode_failure{"unexpected scanline size"};

        std::vector<unsigned char> row(row_bytes);
        for(std::uint16_t plane = 0; plane < planes; ++plane)
        {
            for(std::uint32_t y = 0; y < h; ++y)
            {
                if(TIFFReadScanline(tiff, std::data(row), y, plane) < 0)
                    throw Decode_failure{"error reading row " + std::to_string(y)};

                copy_block(image, std::data(row), row_bytes, y, 0, 1, w, plane, plane_spp);
            }
        }
    }

    return image;
}

Primary_decoder::Primary_decoder(const Tag_table & table, const Logger & log):
    table_{table},
    log_{log}
{}

std::size_t Primary_decoder::open(std::istream & input)
{
    close();

    // libtiff seeks backwards, which a pipe doesn't allow
    auto io = std::make_unique<Tiff_io>(read_input_to_memory(input));
    log_.debug("TIFF reader: " + std::to_string(std::size(io->data)) + " bytes");

    auto handle = open_tiff_reader(*io);
    num_frames_ = TIFFNumberOfDirectories(handle.get());

    io_ = std::move(io);
    handle_ = std::move(handle);

    log_.debug("TIFF reader: " + std::to_string(num_frames_) + " directories");
    return num_frames_;
}

TIFF * Primary_decoder::select(std::size_t index) const
{
    if(!handle_)
        throw Unsupported_operation{"TIFF reader is not open"};
    if(index >= num_frames_)
        throw std::out_of_range{"Frame " + std::to_string(index) + " out of range (" + std::to_string(num_frames_) + " frames)"};

    if(!TIFFSetDirectory(handle_.get(), static_cast<tdir_t>(index)))
        throw Decode_failure{"Unable to read directory " + std::to_string(index)};

    return handle_.get();
}

Tag_dictionary Primary_decoder::get_header(std::size_t index) const
{
    return extract_header(select(index), table_, log_);
}

Pixel_buffer Primary_decoder::get_data(std::size_t index) const
{
    auto tiff = select(index);
    return read_native_image(tiff, std::size(io_->data));
}

void Primary_decoder::close() noexcept
{
    handle_.reset();
    io_.reset();
    num_frames_ = 0;
}
