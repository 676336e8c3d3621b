#include "tiff_writer.hpp"

#include <algorithm>
#include <array>
#include <ctime>
#include <iomanip>
#include <limits>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <variant>

#include <cstdint>

#include <tiff.h>

#include "errors.hpp"
#include "tiff_io.hpp"

namespace
{
    // ASCII tags copied over from the header when present there as strings
    constexpr std::array descriptive_tags
    {
        tiff_tag::document_name,
        tiff_tag::image_description,
        tiff_tag::make,
        tiff_tag::model,
        tiff_tag::page_name,
        tiff_tag::artist,
        tiff_tag::host_computer,
        tiff_tag::copyright
    };

    const Tag_value * find_tag(const Tag_dictionary & header, const Tag_table & table, std::uint16_t id)
    {
        auto name = table.name(id);
        if(!name)
            return nullptr;
        auto tag = header.find(public_tag_name(*name));
        return tag == std::end(header) ? nullptr : &tag->second;
    }

    std::optional<double> number(Tag_value value)
    {
        value = collapse(std::move(value));
        if(auto d = std::get_if<double>(&value))
            return *d;
        if(auto i = std::get_if<std::int64_t>(&value))
            return static_cast<double>(*i);
        return std::nullopt;
    }
}

std::string tiff_timestamp(std::chrono::system_clock::time_point when)
{
    auto t = std::chrono::system_clock::to_time_t(when);
    auto local = std::localtime(&t);
    if(!local)
        throw std::runtime_error{"Unable to convert timestamp to local time"};

    std::ostringstream os;
    os<<std::put_time(local, "%Y:%m:%d %H:%M:%S");
    return os.str();
}

std::vector<unsigned char> encode_tiff(const Pixel_buffer & data, const Tag_dictionary & header, const Tag_table & table,
                                       std::string_view software, std::string_view date_time)
{
    if(data.empty())
        throw std::invalid_argument{"Can't write an empty image"};
    if(data.rank() != 2 && data.rank() != 3)
        throw std::invalid_argument{"Can't write a rank " + std::to_string(data.rank()) + " array as TIFF: shape " + data.shape_string()};

    const auto width = data.width();
    const auto height = data.height();
    const auto channels = data.channels();
    const auto type = data.type();

    if(width > std::numeric_limits<std::uint32_t>::max() || height > std::numeric_limits<std::uint32_t>::max() || channels > std::numeric_limits<std::uint16_t>::max())
        throw std::invalid_argument{"Image " + data.shape_string() + " too large for TIFF"};

    const bool rgb = (channels == 3 || channels == 4) && (type == Sample_type::uint8 || type == Sample_type::uint16);
    const int sample_format = is_float(type) ? SAMPLEFORMAT_IEEEFP : is_signed(type) ? SAMPLEFORMAT_INT : SAMPLEFORMAT_UINT;

    Tiff_io tiff_writer;
    auto tiff = open_tiff_writer(tiff_writer);

    TIFFSetField(tiff.get(), TIFFTAG_IMAGEWIDTH, static_cast<std::uint32_t>(width));
    TIFFSetField(tiff.get(), TIFFTAG_IMAGELENGTH, static_cast<std::uint32_t>(height));
    TIFFSetField(tiff.get(), TIFFTAG_SAMPLESPERPIXEL, static_cast<int>(channels));
    TIFFSetField(tiff.get(), TIFFTAG_BITSPERSAMPLE, static_cast<int>(sample_size(type) * 8));
    TIFFSetField(tiff.get(), TIFFTAG_SAMPLEFORMAT, sample_format);
    TIFFSetField(tiff.get(), TIFFTAG_COMPRESSION, COMPRESSION_NONE);
    TIFFSetField(tiff.get(), TIFFTAG_PHOTOMETRIC, rgb ? PHOTOMETRIC_RGB : PHOTOMETRIC_MINISBLACK);
    TIFFSetField(tiff.get(), TIFFTAG_PLANARCONFIG, PLANARCONFIG_CONTIG);
    TIFFSetField(tiff.get(), TIFFTAG_ROWSPERSTRIP, static_cast<std::uint32_t>(height));
    TIFFSetField(tiff.get(), TIFFTAG_SOFTWARE, std::string{software}.c_str());
    TIFFSetField(tiff.get(), TIFFTAG_DATETIME, std::string{date_time}.c_str());

    if(auto color_channels = rgb ? std::size_t{3} : std::size_t{1}; channels > color_channels)
    {
        std::vector<std::uint16_t> extra(channels - color_channels, EXTRASAMPLE_UNSPECIFIED);
        if(rgb)
            extra.front() = EXTRASAMPLE_UNASSALPHA;
        TIFFSetField(tiff.get(), TIFFTAG_EXTRASAMPLES, static_cast<int>(std::size(extra)), std::data(extra));
    }

    for(auto id: descriptive_tags)
    {
        if(auto tag = find_tag(header, table, id))
        {
            if(auto str = std::get_if<std::string>(tag))
                TIFFSetField(tiff.get(), id, str->c_str());
        }
    }

    for(auto id: {tiff_tag::x_resolution, tiff_tag::y_resolution})
    {
        if(auto tag = find_tag(header, table, id); tag && number(*tag))
            TIFFSetField(tiff.get(), id, *number(*tag));
    }
    if(auto tag = find_tag(header, table, tiff_tag::resolution_unit); tag && number(*tag))
        TIFFSetField(tiff.get(), TIFFTAG_RESOLUTIONUNIT, static_cast<int>(*number(*tag)));

    const auto row_bytes = width * channels * sample_size(type);
    if(static_cast<std::size_t>(TIFFScanlineSize(tiff.get())) != row_bytes)
        throw Io_error{"TIFF scanline size incorrect"};

    std::vector<unsigned char> rowbuf(row_bytes);
    for(std::size_t row = 0; row < height; ++row)
    {
        std::copy_n(std::begin(data.bytes()) + row * row_bytes, row_bytes, std::begin(rowbuf));
        if(TIFFWriteScanline(tiff.get(), std::data(rowbuf), static_cast<std::uint32_t>(row), 0) < 0)
            throw Io_error{"Error writing TIFF data"};
    }

    if(!TIFFFlush(tiff.get()))
        throw Io_error{"Error writing TIFF data"};
    tiff.reset();

    return std::move(tiff_writer.data);
}

Tiff_write_session::Tiff_write_session(std::unique_ptr<std::ostream> out, std::string name):
    out_{std::move(out)},
    name_{std::move(name)}
{
    if(!out_ || !*out_)
        throw Io_error{"Could not open " + name_ + " for writing"};
}

Tiff_write_session::~Tiff_write_session() = default;

void Tiff_write_session::write_image(const Pixel_buffer & data, const Tag_dictionary & header, const Tag_table & table,
                                     std::string_view software, std::string_view date_time)
{
    if(!out_)
        throw Io_error{"Write session for " + name_ + " is already closed"};

    auto file = encode_tiff(data, header, table, software, date_time);

    out_->write(reinterpret_cast<const char *>(std::data(file)), std::size(file));
    if(!*out_)
        throw Io_error{"Error writing " + name_};
}

void Tiff_write_session::close()
{
    if(!out_)
        return;

    out_->flush();
    auto ok = static_cast<bool>(*out_);
    out_.reset();

    if(!ok)
        throw Io_error{"Error writing " + name_};
}
