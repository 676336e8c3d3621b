#include "tiff_io.hpp"

#include <algorithm>
#include <cmath>
#include <string>

#include <cstdio>
#include <cstring>

#include <tiff.h>

#include "errors.hpp"

namespace
{
    // zero filled deflate, LZMA or ZSTD strips go well past 1000:1
    constexpr double max_compression_ratio = 65536.0;

    tsize_t tiff_read(thandle_t hnd, tdata_t data, tsize_t size)
    {
        auto io = reinterpret_cast<Tiff_io*>(hnd);
        if(io->pos >= std::size(io->data))
            return 0;
        auto read_size = std::min(static_cast<std::size_t>(size), std::size(io->data) - io->pos);
        std::memcpy(data, std::data(io->data) + io->pos, read_size);
        io->pos += read_size;
        return read_size;
    }

    tsize_t tiff_write(thandle_t hnd, tdata_t data, tsize_t size)
    {
        auto io = reinterpret_cast<Tiff_io*>(hnd);

        if(io->pos + size > std::size(io->data))
            io->data.resize(io->pos + size);

        std::memcpy(std::data(io->data) + io->pos, data, size);
        io->pos += size;

        return size;
    }

    toff_t tiff_seek(thandle_t hnd, toff_t off, int whence)
    {
        auto io = reinterpret_cast<Tiff_io*>(hnd);
        switch(whence)
        {
            case SEEK_SET:
                io->pos = off;
                break;
            case SEEK_CUR:
                io->pos += off;
                break;
            case SEEK_END:
                io->pos = std::size(io->data) + off;
        }
        return io->pos;
    }

    toff_t tiff_size(thandle_t hnd)
    {
        auto io = reinterpret_cast<Tiff_io*>(hnd);
        return std::size(io->data);
    }

    // errors come back through return codes. the default handlers print to stderr
    void silence_libtiff()
    {
        TIFFSetWarningHandler(nullptr);
        TIFFSetErrorHandler(nullptr);
    }

    template <typename T>
    std::vector<std::int64_t> int_array(const void * data, std::size_t count)
    {
        auto values = reinterpret_cast<const T *>(data);
        return std::vector<std::int64_t>(values, values + count);
    }

    template <typename T>
    std::vector<double> real_array(const void * data, std::size_t count)
    {
        auto values = reinterpret_cast<const T *>(data);
        return std::vector<double>(values, values + count);
    }

    std::optional<Tag_value> convert_array(TIFFDataType type, const void * data, std::size_t count)
    {
        switch(type)
        {
        case TIFF_BYTE:
        case TIFF_UNDEFINED: return int_array<std::uint8_t>(data, count);
        case TIFF_SBYTE:     return int_array<std::int8_t>(data, count);
        case TIFF_SHORT:     return int_array<std::uint16_t>(data, count);
        case TIFF_SSHORT:    return int_array<std::int16_t>(data, count);
        case TIFF_LONG:
        case TIFF_IFD:       return int_array<std::uint32_t>(data, count);
        case TIFF_SLONG:     return int_array<std::int32_t>(data, count);
        case TIFF_SLONG8:    return int_array<std::int64_t>(data, count);
        case TIFF_FLOAT:     return real_array<float>(data, count);
        case TIFF_DOUBLE:    return real_array<double>(data, count);
        default:             return std::nullopt;
        }
    }

    // tags libtiff doesn't handle specially: only counted arrays and ASCII
    // have a calling convention that doesn't depend on libtiff internals
    std::optional<Tag_value> read_generic_tag(TIFF * tiff, std::uint16_t id)
    {
        auto field = TIFFFieldWithTag(tiff, id);
        if(!field)
            return std::nullopt;

        auto type = TIFFFieldDataType(field);
        if(type == TIFF_ASCII)
        {
            char * str = nullptr;
            if(TIFFGetField(tiff, id, &str) && str)
                return std::string{str};
            return std::nullopt;
        }

        if(!TIFFFieldPassCount(field))
            return std::nullopt;

        void * data = nullptr;
        std::size_t count = 0;
        if(TIFFFieldReadCount(field) == TIFF_VARIABLE2)
        {
            std::uint32_t c = 0;
            if(!TIFFGetField(tiff, id, &c, &data))
                return std::nullopt;
            count = c;
        }
        else
        {
            std::uint16_t c = 0;
            if(!TIFFGetField(tiff, id, &c, &data))
                return std::nullopt;
            count = c;
        }
        if(!data)
            return std::nullopt;

        return convert_array(type, data, count);
    }

    std::optional<Tag_value> read_tag(TIFF * tiff, std::uint16_t id)
    {
        switch(id)
        {
        case TIFFTAG_SUBFILETYPE:
        case TIFFTAG_IMAGEWIDTH:
        case TIFFTAG_IMAGELENGTH:
        case TIFFTAG_ROWSPERSTRIP:
        case TIFFTAG_TILEWIDTH:
        case TIFFTAG_TILELENGTH:
        {
            std::uint32_t v = 0;
            if(!TIFFGetField(tiff, id, &v))
                return std::nullopt;
            return std::vector<std::int64_t>{v};
        }
        case TIFFTAG_BITSPERSAMPLE:
        case TIFFTAG_SAMPLEFORMAT:
        {
            // stored once by libtiff, but once per sample in the file
            std::uint16_t v = 0, spp = 1;
            if(!TIFFGetField(tiff, id, &v))
                return std::nullopt;
            TIFFGetFieldDefaulted(tiff, TIFFTAG_SAMPLESPERPIXEL, &spp);
            return std::vector<std::int64_t>(spp, v);
        }
        case TIFFTAG_COMPRESSION:
        case TIFFTAG_PHOTOMETRIC:
        case TIFFTAG_ORIENTATION:
        case TIFFTAG_SAMPLESPERPIXEL:
        case TIFFTAG_PLANARCONFIG:
        case TIFFTAG_RESOLUTIONUNIT:
        case TIFFTAG_PREDICTOR:
        {
            std::uint16_t v = 0;
            if(!TIFFGetField(tiff, id, &v))
                return std::nullopt;
            return std::vector<std::int64_t>{v};
        }
        case TIFFTAG_XRESOLUTION:
        case TIFFTAG_YRESOLUTION:
        {
            float v = 0.0f;
            if(!TIFFGetField(tiff, id, &v))
                return std::nullopt;
            return std::vector<double>{v};
        }
        case TIFFTAG_DOCUMENTNAME:
        case TIFFTAG_IMAGEDESCRIPTION:
        case TIFFTAG_MAKE:
        case TIFFTAG_MODEL:
        case TIFFTAG_PAGENAME:
        case TIFFTAG_SOFTWARE:
        case TIFFTAG_DATETIME:
        case TIFFTAG_ARTIST:
        case TIFFTAG_HOSTCOMPUTER:
        case TIFFTAG_COPYRIGHT:
        {
            char * str = nullptr;
            if(!TIFFGetField(tiff, id, &str) || !str)
                return std::nullopt;
            return std::string{str};
        }
        case TIFFTAG_STRIPOFFSETS:
        case TIFFTAG_STRIPBYTECOUNTS:
        case TIFFTAG_TILEOFFSETS:
        case TIFFTAG_TILEBYTECOUNTS:
        {
            std::uint64_t * values = nullptr;
            if(!TIFFGetField(tiff, id, &values) || !values)
                return std::nullopt;
            auto tiled = id == TIFFTAG_TILEOFFSETS || id == TIFFTAG_TILEBYTECOUNTS;
            auto count = tiled ? TIFFNumberOfTiles(tiff) : TIFFNumberOfStrips(tiff);
            return std::vector<std::int64_t>(values, values + count);
        }
        case TIFFTAG_PAGENUMBER:
        {
            std::uint16_t page = 0, total = 0;
            if(!TIFFGetField(tiff, id, &page, &total))
                return std::nullopt;
            return std::vector<std::int64_t>{page, total};
        }
        case TIFFTAG_COLORMAP:
        {
            std::uint16_t * r = nullptr, * g = nullptr, * b = nullptr;
            std::uint16_t bits = 8;
            if(!TIFFGetField(tiff, id, &r, &g, &b) || !r || !g || !b)
                return std::nullopt;
            TIFFGetFieldDefaulted(tiff, TIFFTAG_BITSPERSAMPLE, &bits);

            // stored as all reds, then all greens, then all blues
            auto n = std::size_t{1} << bits;
            std::vector<std::int64_t> map;
            map.reserve(3 * n);
            for(auto channel: {r, g, b})
                map.insert(std::end(map), channel, channel + n);
            return map;
        }
        case TIFFTAG_EXTRASAMPLES:
        {
            std::uint16_t count = 0;
            std::uint16_t * values = nullptr;
            if(!TIFFGetField(tiff, id, &count, &values) || !values)
                return std::nullopt;
            return std::vector<std::int64_t>(values, values + count);
        }
        default:
            return read_generic_tag(tiff, id);
        }
    }
}

Tiff_handle open_tiff_reader(Tiff_io & io)
{
    silence_libtiff();

    Tiff_handle tiff{TIFFClientOpen("TIFF", "r", &io, tiff_read, [](auto,auto,auto){return tsize_t{0};}, tiff_seek, [](auto){return 0;}, tiff_size, [](auto,auto,auto){return 0;}, [](auto,auto,auto){})};
    if(!tiff)
        throw Decode_failure{"libtiff could not open the data"};
    return tiff;
}

Tiff_handle open_tiff_writer(Tiff_io & io)
{
    silence_libtiff();

    Tiff_handle tiff{TIFFClientOpen("TIFF", "w", &io, [](auto,auto,auto){return tsize_t{0};}, tiff_write, tiff_seek, [](auto){return 0;}, tiff_size, [](auto,auto,auto){return 0;}, [](auto,auto,auto){})};
    if(!tiff)
        throw Io_error{"Error setting up TIFF writer"};
    return tiff;
}

Tag_dictionary extract_header(TIFF * tiff, const Tag_table & table, const Logger & log)
{
    Native_tag_map native;
    for(auto && entry: table.entries())
    {
        auto id = entry.first;
        if(auto value = read_tag(tiff, id))
            native.emplace(id, std::move(*value));
    }
    log.debug("libtiff: directory " + std::to_string(TIFFCurrentDirectory(tiff)) + ", " + std::to_string(std::size(native)) + " of " +
        std::to_string(std::size(table.entries())) + " known tags present");
    return translate_tags(native, table);
}

void check_data_size(TIFF * tiff, std::uint64_t file_size)
{
    std::uint32_t w = 0, h = 0;
    if(!TIFFGetField(tiff, TIFFTAG_IMAGEWIDTH, &w) || !TIFFGetField(tiff, TIFFTAG_IMAGELENGTH, &h) || w == 0 || h == 0)
        throw Decode_failure{"missing image dimensions"};

    std::uint16_t spp = 1, bits = 1, compression = COMPRESSION_NONE;
    TIFFGetFieldDefaulted(tiff, TIFFTAG_SAMPLESPERPIXEL, &spp);
    TIFFGetFieldDefaulted(tiff, TIFFTAG_BITSPERSAMPLE, &bits);
    TIFFGetFieldDefaulted(tiff, TIFFTAG_COMPRESSION, &compression);

    const bool tiled = TIFFIsTiled(tiff);
    const std::string chunk_name = tiled ? "tile" : "strip";
    const auto chunks = tiled ? TIFFNumberOfTiles(tiff) : TIFFNumberOfStrips(tiff);

    std::uint64_t * offsets = nullptr, * counts = nullptr;
    if(!TIFFGetField(tiff, tiled ? TIFFTAG_TILEOFFSETS : TIFFTAG_STRIPOFFSETS, &offsets) ||
       !TIFFGetField(tiff, tiled ? TIFFTAG_TILEBYTECOUNTS : TIFFTAG_STRIPBYTECOUNTS, &counts) ||
       !offsets || !counts || chunks == 0)
        throw Decode_failure{"no " + chunk_name + " locations"};

    std::uint64_t stored = 0;
    for(std::uint32_t i = 0; i < chunks; ++i)
    {
        if(offsets[i] > file_size || counts[i] > file_size - offsets[i])
            throw Decode_failure{chunk_name + " " + std::to_string(i) + " lies outside the file"};
        stored += counts[i];
    }

    // in floating point: the product can pass 64 bits
    const auto needed = std::ceil(static_cast<double>(w) * spp * bits / 8.0) * h;
    const auto limit = compression == COMPRESSION_NONE ? static_cast<double>(stored) : static_cast<double>(stored) * max_compression_ratio;
    if(needed > limit)
        throw Decode_failure{std::to_string(w) + "x" + std::to_string(h) + " image with " + std::to_string(spp) + "x" + std::to_string(bits) +
            " bit samples can't come from " + std::to_string(stored) + " stored bytes"};
}

std::optional<Sample_type> native_sample_type(std::uint16_t bits, std::uint16_t format)
{
    switch(format)
    {
    case SAMPLEFORMAT_UINT:
        if(bits == 8)  return Sample_type::uint8;
        if(bits == 16) return Sample_type::uint16;
        if(bits == 32) return Sample_type::uint32;
        break;
    case SAMPLEFORMAT_INT:
        if(bits == 8)  return Sample_type::int8;
        if(bits == 16) return Sample_type::int16;
        if(bits == 32) return Sample_type::int32;
        break;
    case SAMPLEFORMAT_IEEEFP:
        if(bits == 32) return Sample_type::float32;
        if(bits == 64) return Sample_type::float64;
        break;
    }
    return std::nullopt;
}
